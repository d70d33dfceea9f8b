/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriRuleScorer.h"

namespace
{
    struct CategoryScore
    {
        const char *category;
        double score;
    };

    const CategoryScore CATEGORY_SCORES[] =
    {
        { "usb_connection", 0.9 },
        { "log_cleared", 0.85 },
        { "file_deletion", 0.8 },
        { "failed_logon", 0.75 },
        { "persistence", 0.4 },
        { "other", 0.1 }
    };
}

TriRuleScorer::TriRuleScorer(double confidence)
    : m_confidence(confidence)
{
}

std::string TriRuleScorer::classify(const TriArtifact &artifact)
{
    switch (artifact.getType()) {
    case TRI_USB_DEVICE:
        return "usb_connection";
    case TRI_DELETED_FILE:
        return "file_deletion";
    case TRI_RUN_KEY:
        return "persistence";
    case TRI_EVENT_LOG: {
        std::string category = artifact.getString("category");
        if (category == "log_cleared" || category == "failed_logon")
            return category;
        break;
    }
    default:
        break;
    }
    return "other";
}

double TriRuleScorer::categoryScore(const std::string &category)
{
    for (size_t i = 0; i < sizeof(CATEGORY_SCORES) / sizeof(CATEGORY_SCORES[0]); ++i) {
        if (category == CATEGORY_SCORES[i].category)
            return CATEGORY_SCORES[i].score;
    }
    return 0.1;
}

TriScoringResult TriRuleScorer::score(const TriActivityGraph &graph) const
{
    TriScoringResult result;
    result.scores.reserve(graph.size());
    for (size_t i = 0; i < graph.size(); ++i)
        result.scores.push_back(categoryScore(classify(graph.getNode(i))));
    result.confidence = m_confidence;
    return result;
}
