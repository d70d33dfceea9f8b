/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriTimelineBuilder.h
 * Contains the interface of the TriTimelineBuilder class.
 */

#ifndef _TRI_TIMELINEBUILDER_H
#define _TRI_TIMELINEBUILDER_H

#include "triage/framework/artifacts/TriTimelineEvent.h"
#include "triage/framework/services/TriArtifactStore.h"

#include <iosfwd>
#include <vector>

/**
 * Selection of the events returned by TriTimelineBuilder::build().
 */
struct TRI_FRAMEWORK_API TriTimelineFilter
{
    TriTimelineFilter();

    bool hasStartTime;
    int64_t startTime;      ///< inclusive
    bool hasEndTime;
    int64_t endTime;        ///< inclusive
    std::vector<TRI_ARTIFACT_TYPE> types;   ///< empty for all types
    uint64_t offset;
    uint64_t limit;         ///< 0 for no limit
};

/**
 * Derives the case timeline from the artifact store.  The timeline is not
 * stored; every call reads the timestamped artifacts again, so events only
 * accumulate as the store grows.  Events are ordered by timestamp, then
 * artifact type name, then natural key.
 */
class TRI_FRAMEWORK_API TriTimelineBuilder
{
public:
    explicit TriTimelineBuilder(const TriArtifactStore &store);

    std::vector<TriTimelineEvent> build(const std::string &caseId,
        const TriTimelineFilter &filter = TriTimelineFilter()) const;

    /// Number of events of the unfiltered timeline.
    uint64_t countEvents(const std::string &caseId) const;

    /// Timeline projection of a timestamped artifact.
    static TriTimelineEvent toEvent(const TriArtifact &artifact);

    /// The timeline order.
    static bool eventLess(const TriTimelineEvent &a, const TriTimelineEvent &b);

    /**
     * Write events one per line as
     * "YYYY-MM-DD HH:MM:SS|type|description|natural key".
     * Backslashes, line breaks and '|' in the description are escaped with
     * a backslash.  The natural key is the last field and runs to the end
     * of the line; its own parts are joined with '|'.
     */
    static void write(std::ostream &out, const std::vector<TriTimelineEvent> &events);

private:
    const TriArtifactStore &m_store;
};

#endif
