/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriGraphConvScorer.h"
#include "TriRuleScorer.h"

#include <algorithm>
#include <cmath>

namespace
{
    const int ROUNDS = 2;
}

TriGraphConvScorer::TriGraphConvScorer()
{
}

std::vector<double> TriGraphConvScorer::propagate(const TriActivityGraph &graph, const std::vector<double> &h) const
{
    const size_t n = graph.size();

    std::vector<double> invSqrtDegree(n);
    for (size_t i = 0; i < n; ++i)
        invSqrtDegree[i] = 1.0 / std::sqrt((double)(graph.getNeighbors(i).size() + 1));

    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        double sum = invSqrtDegree[i] * h[i];
        const TriActivityGraph::Neighbors &neighbors = graph.getNeighbors(i);
        for (TriActivityGraph::Neighbors::const_iterator it = neighbors.begin(); it != neighbors.end(); ++it)
            sum += invSqrtDegree[it->first] * h[it->first];
        out[i] = std::min(1.0, std::max(0.0, invSqrtDegree[i] * sum));
    }
    return out;
}

TriScoringResult TriGraphConvScorer::score(const TriActivityGraph &graph) const
{
    TriScoringResult result;
    const size_t n = graph.size();
    if (n == 0) {
        result.confidence = 1.0;
        return result;
    }

    std::vector<double> prior(n);
    for (size_t i = 0; i < n; ++i)
        prior[i] = TriRuleScorer::categoryScore(TriRuleScorer::classify(graph.getNode(i)));

    std::vector<double> h = prior;
    for (int round = 0; round < ROUNDS; ++round)
        h = propagate(graph, h);

    double disagreement = 0.0;
    result.scores.resize(n);
    for (size_t i = 0; i < n; ++i) {
        result.scores[i] = std::max(prior[i], 0.5 * prior[i] + 0.5 * h[i]);
        disagreement += std::fabs(h[i] - prior[i]);
    }
    result.confidence = std::max(0.0, 1.0 - disagreement / (double)n);
    return result;
}
