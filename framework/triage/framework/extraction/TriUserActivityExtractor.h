/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriUserActivityExtractor.h
 * Contains the interface of the TriUserActivityExtractor class.
 */

#ifndef _TRI_USERACTIVITYEXTRACTOR_H
#define _TRI_USERACTIVITYEXTRACTOR_H

#include "TriExtractor.h"

/**
 * Extracts the UserAssist execution counters of every user profile.
 */
class TRI_FRAMEWORK_API TriUserActivityExtractor : public TriExtractor
{
public:
    virtual std::string getName() const { return "useractivity"; }
    virtual std::vector<TRI_ARTIFACT_TYPE> getArtifactTypes() const;
    virtual Status extract(TriFilesystemWalker &walker, const std::string &caseId, TriArtifactSink &sink);

    /// UserAssist entries of one NTUSER.DAT hive.
    void extractUserAssist(const TriRegistryHive &hive, const std::string &profile, const std::string &caseId,
        const std::string &source, TriArtifactSink &sink) const;
};

#endif
