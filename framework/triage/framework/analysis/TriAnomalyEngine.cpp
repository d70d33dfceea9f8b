/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriAnomalyEngine.cpp
 * Contains the implementation of the TriAnomalyEngine class.
 */

#include "TriAnomalyEngine.h"
#include "TriActivityGraph.h"
#include "TriGraphConvScorer.h"
#include "TriRuleScorer.h"
#include "triage/framework/pipeline/TriJobController.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"

#include "Poco/Timestamp.h"

#include <algorithm>
#include <functional>
#include <sstream>
#include <utility>

namespace
{
    struct Indicator
    {
        const char *category;
        const char *text;
        const char *recommendation;
    };

    // Report order of the categories.
    const Indicator INDICATORS[] =
    {
        { "usb_connection", "Unauthorized USB device connections detected",
          "Investigate USB device usage - potential data exfiltration" },
        { "file_deletion", "Suspicious file deletion activity",
          "Recover and review deleted files - potential evidence destruction" },
        { "log_cleared", "Audit log cleared",
          "Review audit log clearing - potential anti-forensic activity" },
        { "failed_logon", "Repeated failed logon attempts",
          "Review failed logon attempts - potential credential attack" },
        { "persistence", "Autostart persistence entries",
          "Review autostart entries for unauthorized programs" },
        { "other", "Unusual activity cluster", NULL }
    };

    const size_t NUM_INDICATORS = sizeof(INDICATORS) / sizeof(INDICATORS[0]);
}

TriAnomalyEngine::TriAnomalyEngine(TriArtifactStore &store, const TriAnomalySettings &settings,
    const TriJobController *controller)
    : m_store(store), m_settings(settings), m_controller(controller), m_scorer(createScorer(settings))
{
}

void TriAnomalyEngine::setScorer(std::unique_ptr<TriAnomalyScorer> scorer)
{
    if (!scorer.get())
        throw TriException("TriAnomalyEngine::setScorer: NULL scorer");
    m_scorer = std::move(scorer);
}

std::unique_ptr<TriAnomalyScorer> TriAnomalyEngine::createScorer(const TriAnomalySettings &settings)
{
    if (settings.scorer == "rule")
        return std::unique_ptr<TriAnomalyScorer>(new TriRuleScorer(settings.ruleConfidence));
    if (settings.scorer == "graph")
        return std::unique_ptr<TriAnomalyScorer>(new TriGraphConvScorer());
    throw TriSystemPropertiesException("TriAnomalyEngine: unknown anomaly scorer '" + settings.scorer + "'");
}

TRI_RISK_LEVEL TriAnomalyEngine::riskLevelFor(double overallScore, const TriAnomalySettings &settings)
{
    if (overallScore >= settings.bandCritical)
        return TRI_RISK_CRITICAL;
    if (overallScore >= settings.bandHigh)
        return TRI_RISK_HIGH;
    if (overallScore >= settings.bandMedium)
        return TRI_RISK_MEDIUM;
    return TRI_RISK_LOW;
}

std::string TriAnomalyEngine::indicatorText(const std::string &category)
{
    for (size_t i = 0; i < NUM_INDICATORS; ++i) {
        if (category == INDICATORS[i].category)
            return INDICATORS[i].text;
    }
    return INDICATORS[NUM_INDICATORS - 1].text;
}

std::vector<std::string> TriAnomalyEngine::recommendationsFor(TRI_RISK_LEVEL level,
    const std::map<std::string, uint64_t> &firedCategories)
{
    std::vector<std::string> recommendations;
    if (level == TRI_RISK_CRITICAL || level == TRI_RISK_HIGH) {
        recommendations.push_back("Immediate investigation required - potential security incident");
        recommendations.push_back("Review all flagged activities with security team");
    }

    for (size_t i = 0; i < NUM_INDICATORS; ++i) {
        if (INDICATORS[i].recommendation != NULL && firedCategories.count(INDICATORS[i].category) > 0)
            recommendations.push_back(INDICATORS[i].recommendation);
    }

    if (recommendations.empty())
        recommendations.push_back("Continue monitoring - no immediate action required");
    return recommendations;
}

std::vector<TriArtifact> TriAnomalyEngine::loadActivities(const std::string &caseId) const
{
    TriArtifactFilter filter;
    filter.timestampedOnly = true;

    std::vector<TriArtifact> activities;
    std::vector<TRI_ARTIFACT_TYPE> types = TriArtifactTypes::all();
    for (std::vector<TRI_ARTIFACT_TYPE>::const_iterator type = types.begin(); type != types.end(); ++type) {
        std::vector<TriArtifact> artifacts = m_store.getArtifacts(caseId, *type, filter);
        activities.insert(activities.end(), artifacts.begin(), artifacts.end());
    }
    return activities;
}

TriAnomalyReport TriAnomalyEngine::analyze(const std::string &caseId)
{
    if (m_controller != NULL && !m_controller->isAnalysisAllowed(caseId)) {
        std::stringstream msg;
        msg << "TriAnomalyEngine::analyze - extraction of case " << caseId << " has not completed";
        LOGWARN(msg.str());
        throw TriJobConflictException(msg.str());
    }

    TriActivityGraph graph(loadActivities(caseId), m_settings);
    if (graph.size() == 0) {
        std::stringstream msg;
        msg << "TriAnomalyEngine::analyze - case " << caseId << " has no timestamped activity to analyze";
        LOGWARN(msg.str());
        throw TriInsufficientDataException(msg.str());
    }

    std::stringstream msg;
    msg << "TriAnomalyEngine::analyze - scoring " << graph.size() << " activities ("
        << graph.edgeCount() << " relations) of case " << caseId << " with the " << m_scorer->getName() << " scorer";
    LOGINFO(msg.str());

    TriScoringResult result = m_scorer->score(graph);
    if (result.scores.size() != graph.size()) {
        std::stringstream err;
        err << "TriAnomalyEngine::analyze - scorer " << m_scorer->getName() << " returned "
            << result.scores.size() << " scores for " << graph.size() << " activities";
        throw TriException(err.str());
    }

    std::map<std::string, uint64_t> fired;
    uint64_t anomalies = 0;
    std::vector<double> sorted;
    sorted.reserve(result.scores.size());
    for (size_t i = 0; i < result.scores.size(); ++i) {
        double score = std::min(1.0, std::max(0.0, result.scores[i]));
        sorted.push_back(score);
        if (score >= m_settings.severityThreshold) {
            ++anomalies;
            ++fired[TriRuleScorer::classify(graph.getNode(i))];
        }
    }

    std::sort(sorted.begin(), sorted.end(), std::greater<double>());
    size_t k = std::min<size_t>(m_settings.topK, sorted.size());
    double topMean = 0.0;
    for (size_t i = 0; i < k; ++i)
        topMean += sorted[i];
    topMean /= (double)k;

    double density = (double)anomalies / (double)graph.size();
    double overall = 100.0 * (m_settings.topKWeight * topMean + (1.0 - m_settings.topKWeight) * density);
    overall = std::min(100.0, std::max(0.0, overall));

    TriAnomalyReport report;
    report.caseId = caseId;
    report.anomaliesDetected = anomalies;
    report.totalActivities = graph.size();
    report.modelAccuracy = result.confidence;
    report.overallRiskScore = overall;
    report.riskLevel = riskLevelFor(overall, m_settings);
    report.generatedAt = (int64_t)Poco::Timestamp().epochTime();
    report.scorerName = m_scorer->getName();

    for (size_t i = 0; i < NUM_INDICATORS; ++i) {
        std::map<std::string, uint64_t>::const_iterator it = fired.find(INDICATORS[i].category);
        if (it == fired.end())
            continue;
        std::stringstream indicator;
        indicator << INDICATORS[i].text << " (" << it->second << ")";
        report.criticalIndicators.push_back(indicator.str());
    }
    report.recommendations = recommendationsFor(report.riskLevel, fired);

    report.id = m_store.addReport(report);

    std::stringstream done;
    done << "TriAnomalyEngine::analyze - case " << caseId << ": " << anomalies << " of " << graph.size()
         << " activities anomalous, risk " << TriAnomalyReport::riskLevelName(report.riskLevel)
         << " (" << overall << ")";
    LOGINFO(done.str());
    return report;
}
