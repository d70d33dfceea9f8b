/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriAnomalyEngine.h
 * Contains the interface of the TriAnomalyEngine class.
 */

#ifndef _TRI_ANOMALYENGINE_H
#define _TRI_ANOMALYENGINE_H

#include "triage/framework/framework_i.h"
#include "triage/framework/services/TriArtifactStore.h"
#include "TriAnomalyReport.h"
#include "TriAnomalyScorer.h"
#include "TriAnomalySettings.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

class TriJobController;

/**
 * Builds the activity graph of a case, scores it and aggregates the
 * scores into a stored TriAnomalyReport.
 *
 * Aggregation:
 * - a node is anomalous when its score is at least the severity threshold
 * - overall score = 100 * (w * mean of the top-k scores + (1 - w) * share
 *   of anomalous nodes), clamped to [0, 100]
 * - risk level from the bands: CRITICAL at or above bandCritical, HIGH at
 *   or above bandHigh, MEDIUM at or above bandMedium, LOW below
 * - one critical indicator per category with anomalous nodes
 * - recommendations from the risk level and the fired categories
 * - model accuracy is the scorer's confidence, unchanged
 */
class TRI_FRAMEWORK_API TriAnomalyEngine
{
public:
    /**
     * @param store Source of the artifacts and destination of the reports.
     * @param settings Scoring and aggregation settings.
     * @param controller If given, analysis of a case is refused until its
     * latest extraction job has completed.
     */
    TriAnomalyEngine(TriArtifactStore &store, const TriAnomalySettings &settings,
        const TriJobController *controller = NULL);

    /// Replace the scorer selected by the settings.
    void setScorer(std::unique_ptr<TriAnomalyScorer> scorer);
    const TriAnomalyScorer &getScorer() const { return *m_scorer; }

    /**
     * Analyze the timestamped activity of a case and store the report.
     * @throws TriJobConflictException if an extraction of the case is
     * queued, running or has failed.
     * @throws TriInsufficientDataException if the case has no timestamped
     * artifacts.
     */
    TriAnomalyReport analyze(const std::string &caseId);

    /// Risk level of an overall score under the given bands.
    static TRI_RISK_LEVEL riskLevelFor(double overallScore, const TriAnomalySettings &settings);

    /// Indicator text of a category ("Suspicious file deletion activity").
    static std::string indicatorText(const std::string &category);

    /// Recommendations for a risk level and the counts of fired categories.
    static std::vector<std::string> recommendationsFor(TRI_RISK_LEVEL level,
        const std::map<std::string, uint64_t> &firedCategories);

    /// Scorer named by settings.scorer.
    static std::unique_ptr<TriAnomalyScorer> createScorer(const TriAnomalySettings &settings);

private:
    // Prohibit copying
    TriAnomalyEngine(const TriAnomalyEngine&);
    TriAnomalyEngine& operator=(const TriAnomalyEngine&);

    std::vector<TriArtifact> loadActivities(const std::string &caseId) const;

    TriArtifactStore &m_store;
    TriAnomalySettings m_settings;
    const TriJobController *m_controller;
    std::unique_ptr<TriAnomalyScorer> m_scorer;
};

#endif
