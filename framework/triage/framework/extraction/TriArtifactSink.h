/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifactSink.h
 * Contains the interface of the TriArtifactSink class.
 */

#ifndef _TRI_ARTIFACTSINK_H
#define _TRI_ARTIFACTSINK_H

#include "triage/framework/artifacts/TriArtifact.h"

#include <string>
#include <vector>

/**
 * Receives the artifacts an extractor produces, one at a time and in
 * production order, together with any warnings about damaged structures.
 */
class TRI_FRAMEWORK_API TriArtifactSink
{
public:
    virtual ~TriArtifactSink() {}

    virtual void add(const TriArtifact &artifact) = 0;

    /// A recoverable problem, e.g. a corrupt hive that was skipped.
    virtual void warn(const std::string &warning) = 0;
};

/**
 * Sink that keeps everything in memory.
 */
class TRI_FRAMEWORK_API TriArtifactCollector : public TriArtifactSink
{
public:
    virtual void add(const TriArtifact &artifact) { m_artifacts.push_back(artifact); }
    virtual void warn(const std::string &warning) { m_warnings.push_back(warning); }

    const std::vector<TriArtifact> &getArtifacts() const { return m_artifacts; }
    const std::vector<std::string> &getWarnings() const { return m_warnings; }

private:
    std::vector<TriArtifact> m_artifacts;
    std::vector<std::string> m_warnings;
};

#endif
