/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifactStore.cpp
 * Contains the implementation of the TriArtifactStore helpers.
 */

#include "TriArtifactStore.h"

namespace
{
    class CollectingVisitor : public TriArtifactVisitor
    {
    public:
        explicit CollectingVisitor(std::vector<TriArtifact> &artifacts) : m_artifacts(artifacts) {}

        virtual bool visit(const TriArtifact &artifact)
        {
            m_artifacts.push_back(artifact);
            return true;
        }

    private:
        std::vector<TriArtifact> &m_artifacts;
    };
}

TriArtifactFilter::TriArtifactFilter()
    : hasStartTime(false), startTime(0), hasEndTime(false), endTime(0), timestampedOnly(false), offset(0), limit(0)
{
}

void TriArtifactFilter::setTimeRange(int64_t start, int64_t end)
{
    hasStartTime = true;
    startTime = start;
    hasEndTime = true;
    endTime = end;
}

std::vector<TriArtifact> TriArtifactStore::getArtifacts(const std::string &caseId, TRI_ARTIFACT_TYPE type,
    const TriArtifactFilter &filter) const
{
    std::vector<TriArtifact> artifacts;
    CollectingVisitor visitor(artifacts);
    query(caseId, type, filter, visitor);
    return artifacts;
}

uint64_t TriArtifactStore::countArtifacts(const std::string &caseId) const
{
    std::map<TRI_ARTIFACT_TYPE, uint64_t> counts = countByType(caseId);
    uint64_t total = 0;
    for (std::map<TRI_ARTIFACT_TYPE, uint64_t>::const_iterator it = counts.begin(); it != counts.end(); ++it)
        total += it->second;
    return total;
}
