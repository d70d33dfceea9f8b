/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriJobController.h
 * Contains the interface of the TriJobController class.
 */

#ifndef _TRI_JOBCONTROLLER_H
#define _TRI_JOBCONTROLLER_H

#include "TriExtractionJob.h"
#include "TriEvidenceOpener.h"
#include "triage/framework/extraction/TriExtractorRegistry.h"
#include "triage/framework/services/TriArtifactStore.h"

#include "Poco/Condition.h"
#include "Poco/Mutex.h"
#include "Poco/Runnable.h"
#include "Poco/ThreadPool.h"

#include <deque>
#include <map>

/**
 * Runs extraction jobs in the background.  A job opens the image, runs
 * every extractor into the artifact store and finally derives the
 * timeline.  At most one job per case is queued or running at any time;
 * jobs of different cases run concurrently up to the configured limit.
 *
 * Cancellation and the wall clock budget are checked between extractors.
 * Either one ends the job as failed; artifacts stored up to that point
 * stay in the store.
 */
class TRI_FRAMEWORK_API TriJobController
{
public:
    /**
     * @param store Store receiving the artifacts.
     * @param opener Opens the images.
     * @param extractors Extractors run by every job.
     * @param maxConcurrentJobs Number of worker threads.
     * @param timeoutSeconds Wall clock budget of a job, 0 for none.
     */
    TriJobController(TriArtifactStore &store, TriEvidenceOpener &opener, const TriExtractorRegistry &extractors,
        int maxConcurrentJobs, int64_t timeoutSeconds);

    /// Waits for the running jobs.  Queued jobs are failed as cancelled.
    ~TriJobController();

    /**
     * Queue an extraction of the image for the case.
     * @returns the job id.
     * @throws TriJobConflictException if a job of the case is queued or running.
     */
    uint64_t submit(const std::string &caseId, const std::string &imagePath);

    /**
     * The most recent job of the case.
     * @returns false if the case never had a job.
     */
    bool getStatus(const std::string &caseId, TriExtractionJob &job) const;

    /// @returns false if there is no job with the id.
    bool getJob(uint64_t jobId, TriExtractionJob &job) const;

    /**
     * Ask the active job of the case to stop.  A queued job fails at once; a
     * running job fails at the next extractor boundary.
     * @returns false if the case has no active job.
     */
    bool cancel(const std::string &caseId);

    /**
     * Block until the most recent job of the case has finished.
     * @param timeoutMs Maximum wait in milliseconds, 0 to wait indefinitely.
     * @returns true if the job finished (or the case has no job).
     */
    bool waitForCompletion(const std::string &caseId, long timeoutMs = 0) const;

    /**
     * Analysis needs a stable store: it is allowed when the most recent job
     * of the case completed, or when the case never had a job.
     */
    bool isAnalysisAllowed(const std::string &caseId) const;

private:
    /// Worker body, shared by all pool threads.
    class Worker : public Poco::Runnable
    {
    public:
        explicit Worker(TriJobController &controller) : m_controller(controller) {}
        virtual void run() { m_controller.workerLoop(); }

    private:
        TriJobController &m_controller;
    };

    struct JobRecord
    {
        JobRecord() : cancelRequested(false) {}
        TriExtractionJob job;
        bool cancelRequested;
    };

    void workerLoop();
    void runJob(uint64_t jobId);
    bool checkContinue(uint64_t jobId, int64_t started, std::string &reason);
    void finishJob(uint64_t jobId, TRI_JOB_STATE state, const std::string &errorMessage);
    void addWarning(uint64_t jobId, const std::string &warning);

    TriArtifactStore &m_store;
    TriEvidenceOpener &m_opener;
    const TriExtractorRegistry &m_extractors;
    int m_maxConcurrentJobs;
    int64_t m_timeoutSeconds;

    mutable Poco::FastMutex m_mutex;
    mutable Poco::Condition m_finished;
    std::map<uint64_t, JobRecord> m_jobs;
    std::map<std::string, uint64_t> m_latestJob;
    std::deque<uint64_t> m_pending;
    uint64_t m_nextJobId;
    int m_workers;
    Worker m_worker;
    Poco::ThreadPool m_pool;

    // Prohibit copying.
    TriJobController(const TriJobController&);
    TriJobController& operator=(const TriJobController&);
};

#endif
