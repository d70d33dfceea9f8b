/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifactStore.h
 * Contains the interface of the TriArtifactStore class.
 */

#ifndef _TRI_ARTIFACTSTORE_H
#define _TRI_ARTIFACTSTORE_H

#include "triage/framework/framework_i.h"
#include "triage/framework/artifacts/TriArtifact.h"
#include "triage/framework/img/TriImageSummary.h"
#include "triage/framework/analysis/TriAnomalyReport.h"

#include <map>
#include <string>
#include <vector>
#include <stdint.h>

/**
 * Selection of the artifacts returned by TriArtifactStore::query().
 */
struct TRI_FRAMEWORK_API TriArtifactFilter
{
    TriArtifactFilter();

    bool hasStartTime;
    int64_t startTime;      ///< inclusive
    bool hasEndTime;
    int64_t endTime;        ///< inclusive
    bool timestampedOnly;   ///< skip artifacts without a timestamp
    std::string text;       ///< substring of the natural key, description or an attribute value
    uint64_t offset;
    uint64_t limit;         ///< 0 for no limit

    void setTimeRange(int64_t start, int64_t end);
};

/**
 * Receives the artifacts of a query one at a time.
 */
class TRI_FRAMEWORK_API TriArtifactVisitor
{
public:
    virtual ~TriArtifactVisitor() {}

    /**
     * @returns false to stop the query early.
     */
    virtual bool visit(const TriArtifact &artifact) = 0;
};

/**
 * Case scoped persistence of artifacts, image summaries and anomaly
 * reports.  Artifacts are identified by (case id, type, natural key);
 * storing the same artifact twice keeps one copy, which makes repeated
 * extraction of an image safe.  Implementations are safe to use from
 * several extraction jobs at once.  Errors are reported with
 * TriStoreException.
 */
class TRI_FRAMEWORK_API TriArtifactStore
{
public:
    /// Outcome of upsert().
    enum UpsertResult
    {
        STORED = 0,         ///< A new artifact was added.
        DUPLICATE_IGNORED,  ///< The artifact was already stored, nothing changed.
        MERGED              ///< The artifact was stored before and its seen range was widened.
    };

    virtual ~TriArtifactStore() {}

    /**
     * Store an artifact unless one with the same identity exists.  When it
     * does and the new artifact carries a first-seen / last-seen range the
     * stored range is widened to cover both.  The stored timestamp,
     * description and attributes never change.
     */
    virtual UpsertResult upsert(const TriArtifact &artifact) = 0;

    /**
     * Pass the matching artifacts of one type to the visitor in the order
     * they were stored.
     */
    virtual void query(const std::string &caseId, TRI_ARTIFACT_TYPE type, const TriArtifactFilter &filter,
        TriArtifactVisitor &visitor) const = 0;

    /// Number of artifacts of each type; types without artifacts are omitted.
    virtual std::map<TRI_ARTIFACT_TYPE, uint64_t> countByType(const std::string &caseId) const = 0;

    /**
     * Remove everything stored for the case: artifacts of every type,
     * image summary and reports.
     * @returns the number of artifacts removed.
     */
    virtual uint64_t deleteCase(const std::string &caseId) = 0;

    virtual void saveImageSummary(const std::string &caseId, const TriImageSummary &summary) = 0;
    /// @returns false if no summary was saved for the case.
    virtual bool getImageSummary(const std::string &caseId, TriImageSummary &summary) const = 0;

    /**
     * Append a report.
     * @returns the id assigned to the report.
     */
    virtual uint64_t addReport(const TriAnomalyReport &report) = 0;
    /// @returns false if the case has no report.
    virtual bool getLatestReport(const std::string &caseId, TriAnomalyReport &report) const = 0;

    /// query() collected into a vector.
    std::vector<TriArtifact> getArtifacts(const std::string &caseId, TRI_ARTIFACT_TYPE type,
        const TriArtifactFilter &filter = TriArtifactFilter()) const;

    /// Total number of artifacts of the case.
    uint64_t countArtifacts(const std::string &caseId) const;
};

#endif
