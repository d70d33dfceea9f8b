/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRuleScorer.h
 * Contains the definition of the TriRuleScorer class.
 */

#ifndef _TRI_RULESCORER_H
#define _TRI_RULESCORER_H

#include "TriAnomalyScorer.h"

/**
 * Scores each node from its indicator category alone.
 *
 * Categories and scores:
 * - usb_connection (USB device artifacts): 0.9
 * - log_cleared (audit log cleared events): 0.85
 * - file_deletion (deleted file artifacts): 0.8
 * - failed_logon (failed logon events): 0.75
 * - persistence (autostart run keys): 0.4
 * - other: 0.1
 */
class TRI_FRAMEWORK_API TriRuleScorer : public TriAnomalyScorer
{
public:
    explicit TriRuleScorer(double confidence = 0.85);

    virtual std::string getName() const { return "rule"; }
    virtual TriScoringResult score(const TriActivityGraph &graph) const;

    /// Indicator category of an artifact.
    static std::string classify(const TriArtifact &artifact);
    /// Score of a category, 0.1 for unknown categories.
    static double categoryScore(const std::string &category);

private:
    double m_confidence;
};

#endif
