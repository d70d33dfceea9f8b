/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriExtractionJob.h"

TriExtractionJob::TriExtractionJob()
    : jobId(0), state(TRI_JOB_QUEUED), artifactsExtracted(0), artifactsStored(0), artifactsMerged(0),
      timelineEvents(0), queuedTime(0), startTime(0), endTime(0)
{
}

std::string TriExtractionJob::stateName(TRI_JOB_STATE state)
{
    switch (state) {
    case TRI_JOB_QUEUED:
        return "queued";
    case TRI_JOB_RUNNING:
        return "running";
    case TRI_JOB_COMPLETED:
        return "completed";
    case TRI_JOB_FAILED:
        return "failed";
    default:
        return "unknown";
    }
}
