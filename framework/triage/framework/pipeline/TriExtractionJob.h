/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriExtractionJob.h
 * Contains the definition of the TriExtractionJob class.
 */

#ifndef _TRI_EXTRACTIONJOB_H
#define _TRI_EXTRACTIONJOB_H

#include "triage/framework/framework_i.h"

#include <string>
#include <vector>
#include <stdint.h>

/**
 * Job states.  A job moves from queued to running and ends in completed or
 * failed.
 */
enum TRI_JOB_STATE {
    TRI_JOB_QUEUED = 0,
    TRI_JOB_RUNNING,
    TRI_JOB_COMPLETED,
    TRI_JOB_FAILED
};

/**
 * Point in time view of one extraction run of a case.
 */
class TRI_FRAMEWORK_API TriExtractionJob
{
public:
    TriExtractionJob();

    uint64_t jobId;
    std::string caseId;
    std::string imagePath;
    TRI_JOB_STATE state;
    uint64_t artifactsExtracted;    ///< artifacts produced so far, never decreases
    uint64_t artifactsStored;       ///< artifacts that were new to the store
    uint64_t artifactsMerged;       ///< duplicates that widened a stored seen range
    uint64_t timelineEvents;        ///< size of the case timeline after the run
    std::vector<std::string> warnings;
    std::string errorMessage;       ///< only set when failed
    int64_t queuedTime;
    int64_t startTime;              ///< 0 until running
    int64_t endTime;                ///< 0 until finished

    bool isActive() const { return state == TRI_JOB_QUEUED || state == TRI_JOB_RUNNING; }
    bool isFinished() const { return state == TRI_JOB_COMPLETED || state == TRI_JOB_FAILED; }

    /// "queued", "running", "completed" or "failed".
    static std::string stateName(TRI_JOB_STATE state);
};

#endif
