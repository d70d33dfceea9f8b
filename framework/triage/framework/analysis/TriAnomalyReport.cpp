/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriAnomalyReport.h"

TriAnomalyReport::TriAnomalyReport()
    : id(0), anomaliesDetected(0), totalActivities(0), modelAccuracy(0.0), riskLevel(TRI_RISK_LOW),
      overallRiskScore(0.0), generatedAt(0)
{
}

std::string TriAnomalyReport::riskLevelName(TRI_RISK_LEVEL level)
{
    switch (level) {
    case TRI_RISK_MEDIUM:
        return "MEDIUM";
    case TRI_RISK_HIGH:
        return "HIGH";
    case TRI_RISK_CRITICAL:
        return "CRITICAL";
    default:
        return "LOW";
    }
}

TRI_RISK_LEVEL TriAnomalyReport::riskLevelFromName(const std::string &name)
{
    if (name == "CRITICAL")
        return TRI_RISK_CRITICAL;
    if (name == "HIGH")
        return TRI_RISK_HIGH;
    if (name == "MEDIUM")
        return TRI_RISK_MEDIUM;
    return TRI_RISK_LOW;
}
