/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriAnomalyScorer.h
 * Contains the interface of the TriAnomalyScorer class.
 */

#ifndef _TRI_ANOMALYSCORER_H
#define _TRI_ANOMALYSCORER_H

#include "triage/framework/framework_i.h"
#include "TriActivityGraph.h"

#include <string>
#include <vector>

/**
 * Output of TriAnomalyScorer::score().
 */
struct TRI_FRAMEWORK_API TriScoringResult
{
    TriScoringResult() : confidence(0.0) {}

    std::vector<double> scores;     ///< one score in [0, 1] per graph node
    double confidence;              ///< the scorer's confidence in its scores, [0, 1]
};

/**
 * Interface of node anomaly scorers.  Graph construction and report
 * aggregation do not depend on how a scorer arrives at its numbers.
 */
class TRI_FRAMEWORK_API TriAnomalyScorer
{
public:
    virtual ~TriAnomalyScorer() {}

    /// Short name recorded in the report ("rule", "graph").
    virtual std::string getName() const = 0;

    /**
     * Score every node of the graph.
     * @returns a result with exactly graph.size() scores.
     */
    virtual TriScoringResult score(const TriActivityGraph &graph) const = 0;
};

#endif
