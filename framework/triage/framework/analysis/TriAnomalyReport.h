/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriAnomalyReport.h
 * Contains the definition of the TriAnomalyReport class.
 */

#ifndef _TRI_ANOMALYREPORT_H
#define _TRI_ANOMALYREPORT_H

#include "triage/framework/framework_i.h"

#include <string>
#include <vector>
#include <stdint.h>

/**
 * Ordered risk levels of a report.
 */
enum TRI_RISK_LEVEL {
    TRI_RISK_LOW = 0,
    TRI_RISK_MEDIUM,
    TRI_RISK_HIGH,
    TRI_RISK_CRITICAL
};

/**
 * Result of one analysis run over the artifacts of a case.  A report is a
 * snapshot: a later analysis produces a new report.
 */
class TRI_FRAMEWORK_API TriAnomalyReport
{
public:
    TriAnomalyReport();

    uint64_t id;                ///< Store id, zero until stored
    std::string caseId;
    uint64_t anomaliesDetected;
    uint64_t totalActivities;
    double modelAccuracy;       ///< Confidence reported by the scorer
    TRI_RISK_LEVEL riskLevel;
    double overallRiskScore;    ///< 0 to 100
    std::vector<std::string> criticalIndicators;
    std::vector<std::string> recommendations;
    int64_t generatedAt;        ///< seconds since the Unix epoch
    std::string scorerName;

    /// "LOW", "MEDIUM", "HIGH" or "CRITICAL".
    static std::string riskLevelName(TRI_RISK_LEVEL level);
    /// Inverse of riskLevelName(), LOW for unknown names.
    static TRI_RISK_LEVEL riskLevelFromName(const std::string &name);
};

#endif
