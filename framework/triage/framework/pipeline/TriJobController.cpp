/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriJobController.cpp
 * Contains the implementation of the TriJobController class.
 */

#include "TriJobController.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/timeline/TriTimelineBuilder.h"
#include "triage/framework/utilities/TriException.h"

#include "Poco/Timestamp.h"

#include <sstream>

namespace
{
    const char * const CANCELLED_MESSAGE = "Extraction cancelled";

    int64_t now()
    {
        return (int64_t)Poco::Timestamp().epochTime();
    }

    /**
     * Stores what an extractor produces and counts the outcomes.  A store
     * failure is remembered so that an extractor catching exceptions on
     * its own cannot hide it.
     */
    class StoreSink : public TriArtifactSink
    {
    public:
        explicit StoreSink(TriArtifactStore &store)
            : m_store(store), m_extracted(0), m_stored(0), m_merged(0), m_storeFailed(false)
        {
        }

        virtual void add(const TriArtifact &artifact)
        {
            m_extracted++;
            try {
                switch (m_store.upsert(artifact)) {
                case TriArtifactStore::STORED:
                    m_stored++;
                    break;
                case TriArtifactStore::MERGED:
                    m_merged++;
                    break;
                default:
                    break;
                }
            }
            catch (TriStoreException &ex) {
                m_storeFailed = true;
                m_storeError = ex.message();
                throw;
            }
        }

        virtual void warn(const std::string &warning) { m_warnings.push_back(warning); }

        uint64_t extracted() const { return m_extracted; }
        uint64_t stored() const { return m_stored; }
        uint64_t merged() const { return m_merged; }
        bool storeFailed() const { return m_storeFailed; }
        const std::string &storeError() const { return m_storeError; }
        const std::vector<std::string> &warnings() const { return m_warnings; }

    private:
        TriArtifactStore &m_store;
        uint64_t m_extracted;
        uint64_t m_stored;
        uint64_t m_merged;
        bool m_storeFailed;
        std::string m_storeError;
        std::vector<std::string> m_warnings;
    };
}

TriJobController::TriJobController(TriArtifactStore &store, TriEvidenceOpener &opener,
    const TriExtractorRegistry &extractors, int maxConcurrentJobs, int64_t timeoutSeconds)
    : m_store(store), m_opener(opener), m_extractors(extractors),
      m_maxConcurrentJobs(maxConcurrentJobs > 0 ? maxConcurrentJobs : 1), m_timeoutSeconds(timeoutSeconds),
      m_nextJobId(1), m_workers(0), m_worker(*this),
      // a worker that gave up its slot may still be returning from run()
      m_pool(1, 2 * (maxConcurrentJobs > 0 ? maxConcurrentJobs : 1))
{
}

TriJobController::~TriJobController()
{
    {
        Poco::FastMutex::ScopedLock lock(m_mutex);
        for (std::map<uint64_t, JobRecord>::iterator it = m_jobs.begin(); it != m_jobs.end(); ++it) {
            if (it->second.job.state == TRI_JOB_QUEUED) {
                it->second.job.state = TRI_JOB_FAILED;
                it->second.job.errorMessage = CANCELLED_MESSAGE;
                it->second.job.endTime = now();
            }
            it->second.cancelRequested = true;
        }
        m_pending.clear();
    }
    m_pool.joinAll();
}

uint64_t TriJobController::submit(const std::string &caseId, const std::string &imagePath)
{
    Poco::FastMutex::ScopedLock lock(m_mutex);

    std::map<std::string, uint64_t>::const_iterator latest = m_latestJob.find(caseId);
    if (latest != m_latestJob.end() && m_jobs[latest->second].job.isActive()) {
        std::stringstream msg;
        msg << "Case " << caseId << " already has job " << latest->second << " in state "
            << TriExtractionJob::stateName(m_jobs[latest->second].job.state);
        LOGWARN("TriJobController::submit - " + msg.str());
        throw TriJobConflictException(msg.str());
    }

    uint64_t jobId = m_nextJobId++;
    JobRecord &record = m_jobs[jobId];
    record.job.jobId = jobId;
    record.job.caseId = caseId;
    record.job.imagePath = imagePath;
    record.job.state = TRI_JOB_QUEUED;
    record.job.queuedTime = now();
    m_latestJob[caseId] = jobId;
    m_pending.push_back(jobId);

    std::stringstream msg;
    msg << "TriJobController::submit - job " << jobId << " queued for case " << caseId << " (" << imagePath << ")";
    LOGINFO(msg.str());

    if (m_workers < m_maxConcurrentJobs) {
        m_workers++;
        m_pool.start(m_worker);
    }
    return jobId;
}

void TriJobController::workerLoop()
{
    for (;;) {
        uint64_t jobId;
        {
            Poco::FastMutex::ScopedLock lock(m_mutex);
            if (m_pending.empty()) {
                m_workers--;
                return;
            }
            jobId = m_pending.front();
            m_pending.pop_front();
            if (m_jobs[jobId].job.state != TRI_JOB_QUEUED)
                continue;
            m_jobs[jobId].job.state = TRI_JOB_RUNNING;
            m_jobs[jobId].job.startTime = now();
        }

        try {
            runJob(jobId);
        }
        catch (std::exception &ex) {
            finishJob(jobId, TRI_JOB_FAILED, std::string("Unexpected error: ") + ex.what());
        }
    }
}

bool TriJobController::checkContinue(uint64_t jobId, int64_t started, std::string &reason)
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    if (m_jobs[jobId].cancelRequested) {
        reason = CANCELLED_MESSAGE;
        return false;
    }
    if (m_timeoutSeconds > 0 && now() - started > m_timeoutSeconds) {
        std::stringstream msg;
        msg << "Extraction timed out after " << m_timeoutSeconds << " seconds";
        reason = msg.str();
        return false;
    }
    return true;
}

void TriJobController::addWarning(uint64_t jobId, const std::string &warning)
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    m_jobs[jobId].job.warnings.push_back(warning);
}

void TriJobController::finishJob(uint64_t jobId, TRI_JOB_STATE state, const std::string &errorMessage)
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    TriExtractionJob &job = m_jobs[jobId].job;
    job.state = state;
    job.errorMessage = errorMessage;
    job.endTime = now();

    std::stringstream msg;
    msg << "TriJobController - job " << jobId << " of case " << job.caseId << " " << TriExtractionJob::stateName(state)
        << ": " << job.artifactsExtracted << " artifacts extracted, " << job.artifactsStored << " new, "
        << job.warnings.size() << " warning(s)";
    if (state == TRI_JOB_FAILED) {
        msg << ". " << errorMessage;
        LOGERROR(msg.str());
    }
    else {
        LOGINFO(msg.str());
    }
    m_finished.broadcast();
}

void TriJobController::runJob(uint64_t jobId)
{
    std::string caseId;
    std::string imagePath;
    int64_t started;
    {
        Poco::FastMutex::ScopedLock lock(m_mutex);
        caseId = m_jobs[jobId].job.caseId;
        imagePath = m_jobs[jobId].job.imagePath;
        started = m_jobs[jobId].job.startTime;
    }

    std::unique_ptr<TriFilesystemWalker> walker;
    TriImageSummary summary;
    try {
        walker = m_opener.open(imagePath, summary);
    }
    catch (TriException &ex) {
        finishJob(jobId, TRI_JOB_FAILED, ex.message());
        return;
    }

    try {
        m_store.saveImageSummary(caseId, summary);

        const std::vector<TriExtractor *> &extractors = m_extractors.getExtractors();
        size_t failedExtractors = 0;

        for (std::vector<TriExtractor *>::const_iterator it = extractors.begin(); it != extractors.end(); ++it) {
            std::string reason;
            if (!checkContinue(jobId, started, reason)) {
                finishJob(jobId, TRI_JOB_FAILED, reason);
                return;
            }

            StoreSink sink(m_store);
            bool failed = false;
            std::string failure;
            try {
                if ((*it)->extract(*walker, caseId, sink) != TriExtractor::OK) {
                    failed = true;
                    failure = "extractor reported failure";
                }
            }
            catch (TriStoreException &) {
                throw;
            }
            catch (TriException &ex) {
                failed = true;
                failure = ex.message();
            }
            catch (std::exception &ex) {
                failed = true;
                failure = ex.what();
            }

            if (sink.storeFailed())
                throw TriStoreException(sink.storeError());

            // damaged subtrees met by the walker during this extractor
            std::vector<std::string> walkWarnings = walker->takeWarnings();
            {
                Poco::FastMutex::ScopedLock lock(m_mutex);
                TriExtractionJob &job = m_jobs[jobId].job;
                job.warnings.insert(job.warnings.end(), walkWarnings.begin(), walkWarnings.end());
                job.warnings.insert(job.warnings.end(), sink.warnings().begin(), sink.warnings().end());
                job.artifactsExtracted += sink.extracted();
                job.artifactsStored += sink.stored();
                job.artifactsMerged += sink.merged();
            }

            if (failed) {
                failedExtractors++;
                addWarning(jobId, (*it)->getName() + ": " + failure);
            }
        }

        // a cancel or timeout during the last extractor still fails the job
        std::string reason;
        if (!checkContinue(jobId, started, reason)) {
            finishJob(jobId, TRI_JOB_FAILED, reason);
            return;
        }

        if (!extractors.empty() && failedExtractors == extractors.size()) {
            finishJob(jobId, TRI_JOB_FAILED, "All extractors failed");
            return;
        }

        // the timeline is read back only after every artifact is stored
        uint64_t events = TriTimelineBuilder(m_store).countEvents(caseId);
        {
            Poco::FastMutex::ScopedLock lock(m_mutex);
            m_jobs[jobId].job.timelineEvents = events;
        }
        finishJob(jobId, TRI_JOB_COMPLETED, "");
    }
    catch (TriStoreException &ex) {
        finishJob(jobId, TRI_JOB_FAILED, "Artifact store error: " + ex.message());
    }
}

bool TriJobController::getStatus(const std::string &caseId, TriExtractionJob &job) const
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    std::map<std::string, uint64_t>::const_iterator latest = m_latestJob.find(caseId);
    if (latest == m_latestJob.end())
        return false;
    job = m_jobs.find(latest->second)->second.job;
    return true;
}

bool TriJobController::getJob(uint64_t jobId, TriExtractionJob &job) const
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    std::map<uint64_t, JobRecord>::const_iterator it = m_jobs.find(jobId);
    if (it == m_jobs.end())
        return false;
    job = it->second.job;
    return true;
}

bool TriJobController::cancel(const std::string &caseId)
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    std::map<std::string, uint64_t>::const_iterator latest = m_latestJob.find(caseId);
    if (latest == m_latestJob.end())
        return false;

    JobRecord &record = m_jobs[latest->second];
    if (!record.job.isActive())
        return false;

    record.cancelRequested = true;
    if (record.job.state == TRI_JOB_QUEUED) {
        record.job.state = TRI_JOB_FAILED;
        record.job.errorMessage = CANCELLED_MESSAGE;
        record.job.endTime = now();
        m_finished.broadcast();
    }
    LOGINFO("TriJobController::cancel - cancellation requested for case " + caseId);
    return true;
}

bool TriJobController::waitForCompletion(const std::string &caseId, long timeoutMs) const
{
    Poco::Timestamp waitStart;
    Poco::FastMutex::ScopedLock lock(m_mutex);

    std::map<std::string, uint64_t>::const_iterator latest = m_latestJob.find(caseId);
    if (latest == m_latestJob.end())
        return true;
    const TriExtractionJob &job = m_jobs.find(latest->second)->second.job;

    while (job.isActive()) {
        if (timeoutMs <= 0) {
            m_finished.wait(m_mutex);
            continue;
        }
        long remaining = timeoutMs - (long)(waitStart.elapsed() / 1000);
        if (remaining <= 0 || !m_finished.tryWait(m_mutex, remaining))
            return !job.isActive();
    }
    return true;
}

bool TriJobController::isAnalysisAllowed(const std::string &caseId) const
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    std::map<std::string, uint64_t>::const_iterator latest = m_latestJob.find(caseId);
    if (latest == m_latestJob.end())
        return true;
    return m_jobs.find(latest->second)->second.job.state == TRI_JOB_COMPLETED;
}
