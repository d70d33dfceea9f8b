/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriGraphConvScorer.h
 * Contains the definition of the TriGraphConvScorer class.
 */

#ifndef _TRI_GRAPHCONVSCORER_H
#define _TRI_GRAPHCONVSCORER_H

#include "TriAnomalyScorer.h"

/**
 * Propagates the rule scores over the activity graph.
 *
 * Two rounds of h' = D^-1/2 (A + I) D^-1/2 h are applied to the rule
 * scores, where A is the unweighted adjacency and D its degree matrix with
 * self loops.  A node's score is max(prior, (prior + h) / 2), so a node is
 * raised by suspicious neighbours but never lowered below its own rule
 * score.  Propagated values are clamped to [0, 1], so a node can rise at
 * most halfway from its prior to 1.0: routine activity (prior 0.1) tops
 * out at 0.55 and stays under the default severity threshold of 0.7.
 * The confidence is one minus the mean absolute difference between
 * the propagated scores and the priors.
 */
class TRI_FRAMEWORK_API TriGraphConvScorer : public TriAnomalyScorer
{
public:
    TriGraphConvScorer();

    virtual std::string getName() const { return "graph"; }
    virtual TriScoringResult score(const TriActivityGraph &graph) const;

private:
    std::vector<double> propagate(const TriActivityGraph &graph, const std::vector<double> &h) const;
};

#endif
