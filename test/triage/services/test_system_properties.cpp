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

#include "triage/framework/services/TriSystemPropertiesImpl.h"
#include "triage/framework/analysis/TriAnomalySettings.h"
#include "triage/framework/utilities/TriException.h"

#include <fstream>

TEST_CASE("predefined properties have defaults", "[properties]") {
    TriSystemPropertiesImpl props;
    props.initialize();

    REQUIRE(props.getInt(TriSystemProperties::TEMPORAL_ADJACENCY_SECONDS) == 300);
    REQUIRE(props.getInt(TriSystemProperties::SESSION_WINDOW_SECONDS) == 1800);
    REQUIRE(props.getInt(TriSystemProperties::MAX_TEMPORAL_NEIGHBORS) == 5);
    REQUIRE(props.getDouble(TriSystemProperties::SEVERITY_THRESHOLD) == Approx(0.7));
    REQUIRE(props.getInt(TriSystemProperties::RISK_TOP_K) == 5);
    REQUIRE(props.getDouble(TriSystemProperties::RISK_BAND_CRITICAL) == Approx(90.0));
    REQUIRE(props.get(TriSystemProperties::ANOMALY_SCORER) == "graph");
    REQUIRE(props.getDouble(TriSystemProperties::RULE_SCORER_CONFIDENCE) == Approx(0.85));
    REQUIRE(props.getInt(TriSystemProperties::JOB_TIMEOUT_SECONDS) == 3600);
    REQUIRE(props.getInt(TriSystemProperties::MAX_FILE_READ_BYTES) == 268435456);
}

TEST_CASE("OUT_DIR is required and expands into derived paths", "[properties]") {
    TriSystemPropertiesImpl props;
    props.initialize();

    REQUIRE_THROWS_AS(props.get(TriSystemProperties::OUT_DIR), TriSystemPropertiesException);
    REQUIRE_THROWS_AS(props.get(TriSystemProperties::STORE_FILE), TriSystemPropertiesException);
    REQUIRE_FALSE(props.isConfigured());

    props.set(TriSystemProperties::OUT_DIR, "/cases/c1");
    REQUIRE(props.isConfigured());
    REQUIRE(props.get(TriSystemProperties::SYSTEM_OUT_DIR) == "/cases/c1/SystemOutput");
    REQUIRE(props.get(TriSystemProperties::LOG_DIR) == "/cases/c1/SystemOutput/Logs");
    REQUIRE(props.get(TriSystemProperties::STORE_FILE) == "/cases/c1/SystemOutput/triage.db");
    REQUIRE(props.expandMacros("#OUT_DIR#/report.txt") == "/cases/c1/report.txt");
}

TEST_CASE("numeric properties reject text", "[properties]") {
    TriSystemPropertiesImpl props;
    props.initialize();
    props.set(TriSystemProperties::RISK_TOP_K, "many");
    props.set(TriSystemProperties::SEVERITY_THRESHOLD, "high");

    REQUIRE_THROWS_AS(props.getInt(TriSystemProperties::RISK_TOP_K), TriSystemPropertiesException);
    REQUIRE_THROWS_AS(props.getDouble(TriSystemProperties::SEVERITY_THRESHOLD), TriSystemPropertiesException);
    REQUIRE_THROWS_AS(TriAnomalySettings::fromSystemProperties(props), TriSystemPropertiesException);
}

TEST_CASE("properties load from an XML configuration file", "[properties]") {
    runner::temp_dir dir("properties");
    std::string config = dir.file("framework_config.xml");
    {
        std::ofstream out(config.c_str());
        out << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
            << "<TRI_FRAMEWORK_CONFIG>\n"
            << "  <RISK_TOP_K>3</RISK_TOP_K>\n"
            << "  <ANOMALY_SCORER>Rule</ANOMALY_SCORER>\n"
            << "  <RULE_SCORER_CONFIDENCE>0.6</RULE_SCORER_CONFIDENCE>\n"
            << "  <STORE_FILE>#OUT_DIR#/store.db</STORE_FILE>\n"
            << "</TRI_FRAMEWORK_CONFIG>\n";
    }

    TriSystemPropertiesImpl props;
    props.initialize(config);
    props.set(TriSystemProperties::OUT_DIR, "/out");

    REQUIRE(props.getInt(TriSystemProperties::RISK_TOP_K) == 3);
    REQUIRE(props.get(TriSystemProperties::STORE_FILE) == "/out/store.db");
    REQUIRE(props.getInt(TriSystemProperties::RISK_BAND_HIGH) == 70);

    TriAnomalySettings settings = TriAnomalySettings::fromSystemProperties(props);
    REQUIRE(settings.topK == 3);
    REQUIRE(settings.scorer == "rule");
    REQUIRE(settings.ruleConfidence == Approx(0.6));
}

TEST_CASE("a missing configuration file is reported", "[properties]") {
    TriSystemPropertiesImpl props;
    REQUIRE_THROWS_AS(props.initialize("/nonexistent/framework_config.xml"), TriFileNotFoundException);
}

TEST_CASE("anomaly settings are validated", "[properties]") {
    TriAnomalySettings settings;
    REQUIRE_NOTHROW(settings.validate());

    SECTION("bands must ascend") {
        settings.bandHigh = 95;
        REQUIRE_THROWS_AS(settings.validate(), TriSystemPropertiesException);
    }
    SECTION("threshold is a probability") {
        settings.severityThreshold = 1.5;
        REQUIRE_THROWS_AS(settings.validate(), TriSystemPropertiesException);
    }
    SECTION("top-k is positive") {
        settings.topK = 0;
        REQUIRE_THROWS_AS(settings.validate(), TriSystemPropertiesException);
    }
    SECTION("rule confidence is a probability") {
        settings.ruleConfidence = 1.2;
        REQUIRE_THROWS_AS(settings.validate(), TriSystemPropertiesException);
    }
    SECTION("scorer must be known") {
        settings.scorer = "neural";
        REQUIRE_THROWS_AS(settings.validate(), TriSystemPropertiesException);
    }
}
