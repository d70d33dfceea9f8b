/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "catch2/catch.hpp"
#include "test/runner.h"

#include "triage/framework/analysis/TriAnomalyEngine.h"
#include "triage/framework/analysis/TriActivityGraph.h"
#include "triage/framework/analysis/TriGraphConvScorer.h"
#include "triage/framework/analysis/TriRuleScorer.h"
#include "triage/framework/pipeline/TriJobController.h"
#include "triage/framework/services/TriArtifactStoreSqlite.h"
#include "triage/framework/utilities/TriException.h"

namespace {
    TriArtifact activity(TRI_ARTIFACT_TYPE type, const std::string &key, int64_t when) {
        TriArtifact artifact(type, "c1");
        artifact.setNaturalKey(key);
        artifact.setTimestamp(when);
        artifact.setDescription(key);
        return artifact;
    }

    /* Gives the first `hot` nodes a score of 1 and the rest 0. */
    class FixedScorer : public TriAnomalyScorer {
    public:
        FixedScorer(size_t hot, bool wrongCount = false) : m_hot(hot), m_wrongCount(wrongCount) {}

        virtual std::string getName() const { return "fixed"; }

        virtual TriScoringResult score(const TriActivityGraph &graph) const {
            TriScoringResult result;
            for (size_t i = 0; i < graph.size(); ++i)
                result.scores.push_back(i < m_hot ? 1.0 : 0.0);
            if (m_wrongCount)
                result.scores.pop_back();
            result.confidence = 0.5;
            return result;
        }

    private:
        size_t m_hot;
        bool m_wrongCount;
    };

    class FailingOpener : public TriEvidenceOpener {
    public:
        virtual std::unique_ptr<TriFilesystemWalker> open(const std::string &imagePath, TriImageSummary &) {
            throw TriImageFormatException("Unrecognized image format: " + imagePath);
        }
    };

    struct AnalysisFixture {
        AnalysisFixture() : dir("anomaly"), store(dir.file("triage.db")) {
            store.open();
        }

        /* 88 ordinary activities, 6 USB connections and 6 deletions, spread an hour apart. */
        void populate() {
            int64_t t = 1600000000;
            for (int i = 0; i < 88; ++i) {
                TriArtifact visit = activity(TRI_BROWSER_HISTORY, "visit" + std::to_string(i), t += 3600);
                visit.addAttribute("profile", std::string("bob"));
                store.upsert(visit);
            }
            for (int i = 0; i < 6; ++i) {
                TriArtifact usb = activity(TRI_USB_DEVICE, "usb" + std::to_string(i), t += 3600);
                usb.addAttribute("serial", "SERIAL" + std::to_string(i));
                store.upsert(usb);
                store.upsert(activity(TRI_DELETED_FILE, "deleted" + std::to_string(i), t += 3600));
            }
            // no timestamp, not an activity
            TriArtifact program(TRI_INSTALLED_PROGRAM, "c1");
            program.setNaturalKey("7-Zip");
            store.upsert(program);
        }

        runner::temp_dir dir;
        TriArtifactStoreSqlite store;
    };
}

TEST_CASE("activity graph relations", "[anomaly]") {
    std::vector<TriArtifact> artifacts;
    TriArtifact a1 = activity(TRI_BROWSER_HISTORY, "a1", 1000);
    a1.setSource("vol0:/Users/bob/History");
    a1.addAttribute("profile", std::string("bob"));
    artifacts.push_back(a1);
    TriArtifact a2 = activity(TRI_BROWSER_HISTORY, "a2", 1100);
    a2.setSource("vol0:/Users/bob/History");
    a2.addAttribute("profile", std::string("bob"));
    artifacts.push_back(a2);
    TriArtifact usb1 = activity(TRI_USB_DEVICE, "usb1", 5000);
    usb1.addAttribute("serial", std::string("X123"));
    artifacts.push_back(usb1);
    TriArtifact usb2 = activity(TRI_USB_DEVICE, "usb2", 90000);
    usb2.addAttribute("serial", std::string("x123"));
    artifacts.push_back(usb2);
    // same user, but outside the session window
    TriArtifact late = activity(TRI_BROWSER_HISTORY, "late", 3100);
    late.setSource("vol0:/Users/bob/places.sqlite");
    late.addAttribute("profile", std::string("BOB"));
    artifacts.push_back(late);
    TriArtifact untimed(TRI_INSTALLED_PROGRAM, "c1");
    untimed.setNaturalKey("untimed");
    artifacts.push_back(untimed);

    TriActivityGraph graph(artifacts, TriAnomalySettings());
    REQUIRE(graph.size() == 5);
    REQUIRE(graph.getNode(0).getNaturalKey() == "a1");
    REQUIRE(graph.getNode(2).getNaturalKey() == "late");
    REQUIRE(graph.getNode(4).getNaturalKey() == "usb2");

    REQUIRE(graph.edgeCount() == 2);
    REQUIRE(graph.edgeCount(TRI_EDGE_SAME_SOURCE) == 1);
    REQUIRE(graph.edgeCount(TRI_EDGE_SAME_SESSION) == 1);
    REQUIRE(graph.edgeCount(TRI_EDGE_SAME_IDENTITY) == 1);
    REQUIRE(graph.edgeCount(TRI_EDGE_TEMPORAL) == 1);

    const TriActivityGraph::Neighbors &first = graph.getNeighbors(0);
    REQUIRE(first.size() == 1);
    REQUIRE(first.at(1) == (unsigned int)(TRI_EDGE_SAME_SOURCE | TRI_EDGE_SAME_SESSION | TRI_EDGE_TEMPORAL));
    REQUIRE(graph.getNeighbors(2).empty());
    REQUIRE(graph.getNeighbors(3).at(4) == (unsigned int)TRI_EDGE_SAME_IDENTITY);

    REQUIRE_THROWS_AS(graph.getNode(5), TriOutOfRangeException);
    REQUIRE_THROWS_AS(graph.getNeighbors(5), TriOutOfRangeException);

    REQUIRE(TriActivityGraph::sessionOwner(late) == "bob");
    REQUIRE(TriActivityGraph::identity(usb1) == "serial:x123");
    REQUIRE(TriActivityGraph::identity(a1).empty());
}

TEST_CASE("temporal links are limited per node", "[anomaly]") {
    std::vector<TriArtifact> artifacts;
    for (int i = 0; i < 10; ++i)
        artifacts.push_back(activity(TRI_BROWSER_HISTORY, "v" + std::to_string(i), 1000 + i));

    TriAnomalySettings settings;
    settings.maxTemporalNeighbors = 2;
    TriActivityGraph graph(artifacts, settings);
    // each node links forward to at most two later nodes
    REQUIRE(graph.edgeCount(TRI_EDGE_TEMPORAL) == 17);
}

TEST_CASE("rule scorer categories", "[anomaly]") {
    TriArtifact cleared = activity(TRI_EVENT_LOG, "e1", 1000);
    cleared.addAttribute("category", std::string("log_cleared"));
    TriArtifact failed = activity(TRI_EVENT_LOG, "e2", 1000);
    failed.addAttribute("category", std::string("failed_logon"));
    TriArtifact logon = activity(TRI_EVENT_LOG, "e3", 1000);
    logon.addAttribute("category", std::string("logon"));

    REQUIRE(TriRuleScorer::classify(activity(TRI_USB_DEVICE, "u", 1)) == "usb_connection");
    REQUIRE(TriRuleScorer::classify(activity(TRI_DELETED_FILE, "d", 1)) == "file_deletion");
    REQUIRE(TriRuleScorer::classify(activity(TRI_RUN_KEY, "r", 1)) == "persistence");
    REQUIRE(TriRuleScorer::classify(cleared) == "log_cleared");
    REQUIRE(TriRuleScorer::classify(failed) == "failed_logon");
    REQUIRE(TriRuleScorer::classify(logon) == "other");
    REQUIRE(TriRuleScorer::classify(activity(TRI_PREFETCH, "p", 1)) == "other");

    REQUIRE(TriRuleScorer::categoryScore("usb_connection") == Approx(0.9));
    REQUIRE(TriRuleScorer::categoryScore("persistence") == Approx(0.4));
    REQUIRE(TriRuleScorer::categoryScore("no such category") == Approx(0.1));

    std::vector<TriArtifact> artifacts;
    artifacts.push_back(cleared);
    artifacts.push_back(logon);
    TriActivityGraph graph(artifacts, TriAnomalySettings());
    TriRuleScorer scorer(0.85);
    TriScoringResult result = scorer.score(graph);
    REQUIRE(result.scores.size() == 2);
    REQUIRE(result.confidence == Approx(0.85));
}

TEST_CASE("graph scorer raises neighbours without lowering priors", "[anomaly]") {
    std::vector<TriArtifact> artifacts;
    artifacts.push_back(activity(TRI_BROWSER_HISTORY, "visit", 1000));
    for (int i = 0; i < 3; ++i)
        artifacts.push_back(activity(TRI_USB_DEVICE, "usb" + std::to_string(i), 1010 + i));

    TriActivityGraph graph(artifacts, TriAnomalySettings());
    REQUIRE(graph.edgeCount() == 6);

    TriGraphConvScorer scorer;
    TriScoringResult result = scorer.score(graph);
    REQUIRE(result.scores.size() == 4);
    // every node sees the mean of the complete graph, 0.7
    REQUIRE(result.scores[0] == Approx(0.4));
    REQUIRE(result.scores[1] == Approx(0.9));
    REQUIRE(result.confidence == Approx(0.7));

    TriActivityGraph empty(std::vector<TriArtifact>(), TriAnomalySettings());
    REQUIRE(scorer.score(empty).scores.empty());
}

TEST_CASE("graph scorer never flags routine activity on its neighbours alone", "[anomaly]") {
    std::vector<TriArtifact> artifacts;
    artifacts.push_back(activity(TRI_PREFETCH, "run", 1000));
    for (int i = 0; i < 12; ++i)
        artifacts.push_back(activity(TRI_USB_DEVICE, "usb" + std::to_string(i), 1001 + i));

    TriAnomalySettings settings;
    TriActivityGraph graph(artifacts, settings);
    TriScoringResult result = TriGraphConvScorer().score(graph);
    REQUIRE(result.scores.size() == 13);

    // (0.1 + 1.0) / 2 is the most a neighbourhood can lift an "other" node
    REQUIRE(result.scores[0] > 0.1);
    REQUIRE(result.scores[0] <= 0.55 + 1e-9);
    REQUIRE(result.scores[0] < settings.severityThreshold);
    for (size_t i = 1; i < result.scores.size(); ++i)
        REQUIRE(result.scores[i] >= 0.9 - 1e-9);
}

TEST_CASE("risk bands and recommendations", "[anomaly]") {
    TriAnomalySettings settings;
    REQUIRE(TriAnomalyEngine::riskLevelFor(0.0, settings) == TRI_RISK_LOW);
    REQUIRE(TriAnomalyEngine::riskLevelFor(39.99, settings) == TRI_RISK_LOW);
    REQUIRE(TriAnomalyEngine::riskLevelFor(40.0, settings) == TRI_RISK_MEDIUM);
    REQUIRE(TriAnomalyEngine::riskLevelFor(70.0, settings) == TRI_RISK_HIGH);
    REQUIRE(TriAnomalyEngine::riskLevelFor(90.0, settings) == TRI_RISK_CRITICAL);
    REQUIRE(TriAnomalyEngine::riskLevelFor(100.0, settings) == TRI_RISK_CRITICAL);

    REQUIRE(TriAnomalyEngine::indicatorText("file_deletion") == "Suspicious file deletion activity");
    REQUIRE(TriAnomalyEngine::indicatorText("nonsense") == "Unusual activity cluster");

    std::map<std::string, uint64_t> none;
    std::vector<std::string> calm = TriAnomalyEngine::recommendationsFor(TRI_RISK_LOW, none);
    REQUIRE(calm.size() == 1);
    REQUIRE(calm[0] == "Continue monitoring - no immediate action required");

    std::map<std::string, uint64_t> fired;
    fired["usb_connection"] = 2;
    fired["other"] = 1;
    std::vector<std::string> urgent = TriAnomalyEngine::recommendationsFor(TRI_RISK_HIGH, fired);
    REQUIRE(urgent.size() == 3);
    REQUIRE(urgent[0] == "Immediate investigation required - potential security incident");
    REQUIRE(urgent[2] == "Investigate USB device usage - potential data exfiltration");

    REQUIRE(TriAnomalyReport::riskLevelName(TRI_RISK_CRITICAL) == "CRITICAL");
    REQUIRE(TriAnomalyReport::riskLevelFromName("HIGH") == TRI_RISK_HIGH);
    REQUIRE(TriAnomalyReport::riskLevelFromName("bogus") == TRI_RISK_LOW);
}

TEST_CASE("scorer selection", "[anomaly]") {
    TriAnomalySettings settings;
    REQUIRE(TriAnomalyEngine::createScorer(settings)->getName() == "graph");
    settings.scorer = "rule";
    REQUIRE(TriAnomalyEngine::createScorer(settings)->getName() == "rule");
    settings.scorer = "oracle";
    REQUIRE_THROWS_AS(TriAnomalyEngine::createScorer(settings), TriSystemPropertiesException);
}

TEST_CASE_METHOD(AnalysisFixture, "rule analysis of a case with twelve anomalies", "[anomaly]") {
    populate();
    TriAnomalySettings settings;
    settings.scorer = "rule";
    TriAnomalyEngine engine(store, settings);

    TriAnomalyReport report = engine.analyze("c1");
    REQUIRE(report.totalActivities == 100);
    REQUIRE(report.anomaliesDetected == 12);
    REQUIRE(report.scorerName == "rule");
    REQUIRE(report.modelAccuracy == Approx(0.85));
    // 100 * (0.7 * 0.9 + 0.3 * 0.12)
    REQUIRE(report.overallRiskScore == Approx(66.6));
    REQUIRE(report.riskLevel == TRI_RISK_MEDIUM);

    REQUIRE(report.criticalIndicators.size() == 2);
    REQUIRE(report.criticalIndicators[0] == "Unauthorized USB device connections detected (6)");
    REQUIRE(report.criticalIndicators[1] == "Suspicious file deletion activity (6)");
    REQUIRE(report.recommendations.size() == 2);

    TriAnomalyReport stored;
    REQUIRE(store.getLatestReport("c1", stored));
    REQUIRE(stored.id == report.id);
    REQUIRE(stored.anomaliesDetected == 12);
    REQUIRE(stored.riskLevel == TRI_RISK_MEDIUM);
}

TEST_CASE_METHOD(AnalysisFixture, "graph analysis keeps the anomaly count", "[anomaly]") {
    populate();
    TriAnomalyEngine engine(store, TriAnomalySettings());
    REQUIRE(engine.getScorer().getName() == "graph");

    TriAnomalyReport report = engine.analyze("c1");
    REQUIRE(report.totalActivities == 100);
    REQUIRE(report.anomaliesDetected == 12);
    REQUIRE(report.overallRiskScore >= 66.6 - 1e-9);
    REQUIRE(report.overallRiskScore <= 73.6 + 1e-9);
    REQUIRE(report.riskLevel == TriAnomalyEngine::riskLevelFor(report.overallRiskScore, TriAnomalySettings()));
    REQUIRE(report.modelAccuracy >= 0.0);
    REQUIRE(report.modelAccuracy <= 1.0);

    // a second analysis is a new report
    TriAnomalyReport again = engine.analyze("c1");
    REQUIRE(again.id > report.id);
}

TEST_CASE_METHOD(AnalysisFixture, "aggregation of custom scores", "[anomaly]") {
    for (int i = 0; i < 10; ++i)
        store.upsert(activity(TRI_BROWSER_HISTORY, "v" + std::to_string(i), 1600000000 + i * 3600));

    TriAnomalyEngine engine(store, TriAnomalySettings());
    engine.setScorer(std::unique_ptr<TriAnomalyScorer>(new FixedScorer(2)));

    TriAnomalyReport report = engine.analyze("c1");
    REQUIRE(report.anomaliesDetected == 2);
    // 100 * (0.7 * 2/5 + 0.3 * 2/10)
    REQUIRE(report.overallRiskScore == Approx(34.0));
    REQUIRE(report.riskLevel == TRI_RISK_LOW);
    REQUIRE(report.modelAccuracy == Approx(0.5));
    REQUIRE(report.criticalIndicators.size() == 1);
    REQUIRE(report.criticalIndicators[0] == "Unusual activity cluster (2)");
    REQUIRE(report.recommendations.size() == 1);

    engine.setScorer(std::unique_ptr<TriAnomalyScorer>(new FixedScorer(10)));
    report = engine.analyze("c1");
    REQUIRE(report.overallRiskScore == Approx(100.0));
    REQUIRE(report.riskLevel == TRI_RISK_CRITICAL);

    engine.setScorer(std::unique_ptr<TriAnomalyScorer>(new FixedScorer(0, true)));
    REQUIRE_THROWS_AS(engine.analyze("c1"), TriException);
    REQUIRE_THROWS_AS(engine.setScorer(std::unique_ptr<TriAnomalyScorer>()), TriException);
}

TEST_CASE_METHOD(AnalysisFixture, "analysis needs timestamped activity", "[anomaly]") {
    TriAnomalyEngine engine(store, TriAnomalySettings());
    REQUIRE_THROWS_AS(engine.analyze("c1"), TriInsufficientDataException);

    TriArtifact program(TRI_INSTALLED_PROGRAM, "c1");
    program.setNaturalKey("7-Zip");
    store.upsert(program);
    REQUIRE_THROWS_AS(engine.analyze("c1"), TriInsufficientDataException);

    TriAnomalyReport report;
    REQUIRE_FALSE(store.getLatestReport("c1", report));
}

TEST_CASE_METHOD(AnalysisFixture, "analysis waits for a successful extraction", "[anomaly]") {
    populate();
    TriExtractorRegistry extractors;
    FailingOpener opener;
    TriJobController controller(store, opener, extractors, 1, 0);
    TriAnomalyEngine engine(store, TriAnomalySettings(), &controller);

    // no job yet: the stored artifacts can be analyzed
    REQUIRE(engine.analyze("c1").anomaliesDetected == 12);

    controller.submit("c1", "/evidence/broken.E01");
    REQUIRE(controller.waitForCompletion("c1", 10000));
    REQUIRE_THROWS_AS(engine.analyze("c1"), TriJobConflictException);
}
