/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriAnomalySettings.h
 * Contains the definition of the TriAnomalySettings class.
 */

#ifndef _TRI_ANOMALYSETTINGS_H
#define _TRI_ANOMALYSETTINGS_H

#include "triage/framework/framework_i.h"

#include <string>
#include <stdint.h>

class TriSystemProperties;

/**
 * Tunables of graph construction, scoring and report aggregation.  The
 * defaults match the predefined system property defaults.
 */
class TRI_FRAMEWORK_API TriAnomalySettings
{
public:
    TriAnomalySettings();

    int64_t temporalAdjacencySeconds;
    int64_t sessionWindowSeconds;
    unsigned int maxTemporalNeighbors;
    double severityThreshold;       ///< node score at or above which a node is anomalous
    unsigned int topK;
    double topKWeight;              ///< weight of the top-k mean, the density gets the rest
    double bandMedium;
    double bandHigh;
    double bandCritical;
    double ruleConfidence;          ///< confidence reported by the rule scorer
    std::string scorer;             ///< "rule" or "graph"

    /**
     * Read the settings from the system properties.
     * @throws TriSystemPropertiesException for malformed or inconsistent values.
     */
    static TriAnomalySettings fromSystemProperties(const TriSystemProperties &props);

    /**
     * @throws TriSystemPropertiesException if the bands are not ascending
     * or a weight or threshold is outside [0, 1].
     */
    void validate() const;
};

#endif
