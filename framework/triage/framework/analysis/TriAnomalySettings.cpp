/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriAnomalySettings.h"
#include "triage/framework/services/TriSystemProperties.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include <sstream>

TriAnomalySettings::TriAnomalySettings()
    : temporalAdjacencySeconds(300), sessionWindowSeconds(1800), maxTemporalNeighbors(5), severityThreshold(0.7),
      topK(5), topKWeight(0.7), bandMedium(40.0), bandHigh(70.0), bandCritical(90.0), ruleConfidence(0.85),
      scorer("graph")
{
}

TriAnomalySettings TriAnomalySettings::fromSystemProperties(const TriSystemProperties &props)
{
    TriAnomalySettings settings;
    settings.temporalAdjacencySeconds = props.getInt(TriSystemProperties::TEMPORAL_ADJACENCY_SECONDS);
    settings.sessionWindowSeconds = props.getInt(TriSystemProperties::SESSION_WINDOW_SECONDS);
    settings.maxTemporalNeighbors = (unsigned int)props.getInt(TriSystemProperties::MAX_TEMPORAL_NEIGHBORS);
    settings.severityThreshold = props.getDouble(TriSystemProperties::SEVERITY_THRESHOLD);
    settings.topK = (unsigned int)props.getInt(TriSystemProperties::RISK_TOP_K);
    settings.topKWeight = props.getDouble(TriSystemProperties::RISK_TOP_K_WEIGHT);
    settings.bandMedium = props.getDouble(TriSystemProperties::RISK_BAND_MEDIUM);
    settings.bandHigh = props.getDouble(TriSystemProperties::RISK_BAND_HIGH);
    settings.bandCritical = props.getDouble(TriSystemProperties::RISK_BAND_CRITICAL);
    settings.scorer = TriUtilities::toLower(props.get(TriSystemProperties::ANOMALY_SCORER));
    settings.ruleConfidence = props.getDouble(TriSystemProperties::RULE_SCORER_CONFIDENCE);
    settings.validate();
    return settings;
}

void TriAnomalySettings::validate() const
{
    std::stringstream msg;
    if (!(bandMedium <= bandHigh && bandHigh <= bandCritical))
        msg << "risk bands must be ascending (" << bandMedium << ", " << bandHigh << ", " << bandCritical << ")";
    else if (severityThreshold < 0.0 || severityThreshold > 1.0)
        msg << "severity threshold " << severityThreshold << " is outside [0, 1]";
    else if (topKWeight < 0.0 || topKWeight > 1.0)
        msg << "top-k weight " << topKWeight << " is outside [0, 1]";
    else if (ruleConfidence < 0.0 || ruleConfidence > 1.0)
        msg << "rule scorer confidence " << ruleConfidence << " is outside [0, 1]";
    else if (topK == 0)
        msg << "top-k must be at least 1";
    else if (scorer != "rule" && scorer != "graph")
        msg << "unknown anomaly scorer '" << scorer << "'";
    else
        return;

    throw TriSystemPropertiesException("TriAnomalySettings: " + msg.str());
}
