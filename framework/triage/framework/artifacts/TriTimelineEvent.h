/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _TRI_TIMELINEEVENT_H
#define _TRI_TIMELINEEVENT_H

#include <string>
#include <stdint.h>
#include "TriArtifactTypes.h"

/**
 * Projection of one timestamped artifact onto the case timeline.
 * Timeline events are derived from the artifact store and never stored.
 */
struct TriTimelineEvent
{
    std::string caseId;
    int64_t timestamp;
    TRI_ARTIFACT_TYPE type;
    std::string typeName;
    std::string description;
    std::string naturalKey;
    uint64_t artifactId;    ///< Id of the originating artifact in the store
};

#endif
