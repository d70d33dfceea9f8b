/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriExtractorRegistry.h
 * Contains the interface of the TriExtractorRegistry class.
 */

#ifndef _TRI_EXTRACTORREGISTRY_H
#define _TRI_EXTRACTORREGISTRY_H

#include "TriExtractor.h"

#include <vector>

/**
 * The fixed set of artifact extractors.  The registry owns its extractors;
 * they live as long as the registry does.
 */
class TRI_FRAMEWORK_API TriExtractorRegistry
{
public:
    /// Creates the browser, registry, recycle bin, event log, user activity and filesystem extractors.
    TriExtractorRegistry();
    ~TriExtractorRegistry();

    /// All extractors in the order they should run.
    const std::vector<TriExtractor *> &getExtractors() const { return m_extractors; }

    /**
     * The extractor producing the given artifact type.
     * @returns NULL if no extractor produces the type.
     */
    TriExtractor *findByType(TRI_ARTIFACT_TYPE type) const;

    /**
     * The extractor with the given name.
     * @returns NULL if there is none.
     */
    TriExtractor *findByName(const std::string &name) const;

private:
    std::vector<TriExtractor *> m_extractors;

    // Prohibit copying.
    TriExtractorRegistry(const TriExtractorRegistry&);
    TriExtractorRegistry& operator=(const TriExtractorRegistry&);
};

#endif
