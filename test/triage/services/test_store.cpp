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

#include "triage/framework/services/TriArtifactStoreSqlite.h"
#include "triage/framework/utilities/TriException.h"

namespace {
    TriArtifact makeVisit(const std::string &caseId, const std::string &url, int64_t when) {
        TriArtifact artifact(TRI_BROWSER_HISTORY, caseId);
        artifact.setSource("vol0:/Users/bob/History");
        artifact.setTimestamp(when);
        std::vector<std::string> key;
        key.push_back(url);
        key.push_back(std::to_string(when));
        artifact.setNaturalKey(TriArtifact::makeKey(key));
        artifact.setDescription("chrome visit to " + url);
        artifact.addAttribute("url", url);
        artifact.addAttribute("visit_count", (int64_t)2);
        return artifact;
    }

    TriArtifact makeDevice(const std::string &caseId, int64_t firstSeen, int64_t lastSeen) {
        TriArtifact artifact(TRI_USB_DEVICE, caseId);
        artifact.setSource("vol0:/Windows/System32/config/SYSTEM");
        artifact.setTimestamp(firstSeen);
        artifact.setSeenRange(firstSeen, lastSeen);
        artifact.setNaturalKey("0019E06B9C85F9A0C9E1");
        artifact.setDescription("USB device Kingston DataTraveler");
        artifact.addAttribute("serial", std::string("0019E06B9C85F9A0C9E1"));
        return artifact;
    }

    struct StoreFixture {
        StoreFixture() : dir("store"), store(dir.file("triage.db")) {
            store.open();
        }
        runner::temp_dir dir;
        TriArtifactStoreSqlite store;
    };
}

TEST_CASE_METHOD(StoreFixture, "store keeps one copy of a repeated artifact", "[store]") {
    TriArtifact visit = makeVisit("c1", "https://example.com/", 1600000000);
    REQUIRE(store.upsert(visit) == TriArtifactStore::STORED);
    REQUIRE(store.upsert(visit) == TriArtifactStore::DUPLICATE_IGNORED);

    std::vector<TriArtifact> stored = store.getArtifacts("c1", TRI_BROWSER_HISTORY);
    REQUIRE(stored.size() == 1);
    REQUIRE(stored[0].getId() != 0);
    REQUIRE(stored[0].getTimestamp() == 1600000000);
    REQUIRE(stored[0].getSourcePath() == "vol0:/Users/bob/History");
    REQUIRE(stored[0].getString("url") == "https://example.com/");
    REQUIRE(stored[0].getLong("visit_count") == 2);
    REQUIRE(stored[0].getAttributes().size() == 2);

    // the same key in another case is a different artifact
    REQUIRE(store.upsert(makeVisit("c2", "https://example.com/", 1600000000)) == TriArtifactStore::STORED);
    REQUIRE(store.countArtifacts("c1") == 1);
    REQUIRE(store.countArtifacts("c2") == 1);
}

TEST_CASE_METHOD(StoreFixture, "store widens the seen range of a device seen again", "[store]") {
    REQUIRE(store.upsert(makeDevice("c1", 1600000000, 1600000500)) == TriArtifactStore::STORED);
    REQUIRE(store.upsert(makeDevice("c1", 1600000100, 1600000400)) == TriArtifactStore::DUPLICATE_IGNORED);
    REQUIRE(store.upsert(makeDevice("c1", 1600000100, 1600009000)) == TriArtifactStore::MERGED);
    REQUIRE(store.upsert(makeDevice("c1", 1599990000, 1600000000)) == TriArtifactStore::MERGED);

    std::vector<TriArtifact> devices = store.getArtifacts("c1", TRI_USB_DEVICE);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].hasSeenRange());
    REQUIRE(devices[0].getFirstSeen() == 1599990000);
    REQUIRE(devices[0].getLastSeen() == 1600009000);
    // the device moves to its earliest sighting, the rest stays as first stored
    REQUIRE(devices[0].getTimestamp() == 1599990000);
    REQUIRE(devices[0].getDescription() == "USB device Kingston DataTraveler");
    REQUIRE(devices[0].getAttributes().size() == 1);
}

TEST_CASE_METHOD(StoreFixture, "an undated device becomes timestamped once a range is seen", "[store]") {
    TriArtifact undated(TRI_USB_DEVICE, "c1");
    undated.setNaturalKey("0019E06B9C85F9A0C9E1");
    undated.setDescription("USB device Kingston DataTraveler");
    REQUIRE(store.upsert(undated) == TriArtifactStore::STORED);

    TriArtifactFilter timed;
    timed.timestampedOnly = true;
    REQUIRE(store.getArtifacts("c1", TRI_USB_DEVICE, timed).empty());

    REQUIRE(store.upsert(makeDevice("c1", 1600000000, 1600000500)) == TriArtifactStore::MERGED);
    std::vector<TriArtifact> devices = store.getArtifacts("c1", TRI_USB_DEVICE, timed);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].getTimestamp() == 1600000000);
    REQUIRE(devices[0].getFirstSeen() == 1600000000);
    REQUIRE(devices[0].getLastSeen() == 1600000500);
}

TEST_CASE_METHOD(StoreFixture, "store filters by time range, text and page", "[store]") {
    for (int i = 0; i < 10; i++)
        store.upsert(makeVisit("c1", "https://site" + std::to_string(i) + ".example/", 1600000000 + i * 100));

    TriArtifact undated(TRI_BROWSER_HISTORY, "c1");
    undated.setNaturalKey("undated");
    undated.setDescription("visit without a time");
    REQUIRE(store.upsert(undated) == TriArtifactStore::STORED);

    TriArtifactFilter all;
    REQUIRE(store.getArtifacts("c1", TRI_BROWSER_HISTORY, all).size() == 11);

    TriArtifactFilter timed;
    timed.timestampedOnly = true;
    REQUIRE(store.getArtifacts("c1", TRI_BROWSER_HISTORY, timed).size() == 10);

    TriArtifactFilter range;
    range.setTimeRange(1600000200, 1600000400);
    std::vector<TriArtifact> inRange = store.getArtifacts("c1", TRI_BROWSER_HISTORY, range);
    REQUIRE(inRange.size() == 3);
    REQUIRE(inRange[0].getTimestamp() == 1600000200);
    REQUIRE(inRange[2].getTimestamp() == 1600000400);

    TriArtifactFilter text;
    text.text = "site7";
    std::vector<TriArtifact> matched = store.getArtifacts("c1", TRI_BROWSER_HISTORY, text);
    REQUIRE(matched.size() == 1);
    REQUIRE(matched[0].getString("url") == "https://site7.example/");

    // LIKE wildcards in the text are literal
    TriArtifactFilter wildcard;
    wildcard.text = "site_";
    REQUIRE(store.getArtifacts("c1", TRI_BROWSER_HISTORY, wildcard).empty());

    TriArtifactFilter page;
    page.offset = 4;
    page.limit = 3;
    std::vector<TriArtifact> paged = store.getArtifacts("c1", TRI_BROWSER_HISTORY, page);
    REQUIRE(paged.size() == 3);
    REQUIRE(paged[0].getTimestamp() == 1600000400);
}

TEST_CASE_METHOD(StoreFixture, "store counts and deletes per case", "[store]") {
    store.upsert(makeVisit("c1", "https://a.example/", 1600000000));
    store.upsert(makeVisit("c1", "https://b.example/", 1600000001));
    store.upsert(makeDevice("c1", 1600000000, 1600000000));
    store.upsert(makeVisit("other", "https://a.example/", 1600000000));

    std::map<TRI_ARTIFACT_TYPE, uint64_t> counts = store.countByType("c1");
    REQUIRE(counts.size() == 2);
    REQUIRE(counts[TRI_BROWSER_HISTORY] == 2);
    REQUIRE(counts[TRI_USB_DEVICE] == 1);

    TriImageSummary summary;
    summary.format = "raw";
    store.saveImageSummary("c1", summary);
    TriAnomalyReport report;
    report.caseId = "c1";
    store.addReport(report);

    REQUIRE(store.deleteCase("c1") == 3);
    REQUIRE(store.countArtifacts("c1") == 0);
    REQUIRE(store.countByType("c1").empty());
    REQUIRE_FALSE(store.getImageSummary("c1", summary));
    REQUIRE_FALSE(store.getLatestReport("c1", report));
    REQUIRE(store.countArtifacts("other") == 1);
}

TEST_CASE_METHOD(StoreFixture, "store saves the image summary", "[store]") {
    TriImageSummary summary;
    summary.format = "raw-split";
    summary.size = 20000000;
    summary.sectorSize = 512;
    summary.segmentCount = 2;
    summary.allocatedBytes = 19000000;
    summary.unallocatedBytes = 1000000;
    summary.md5 = "d41d8cd98f00b204e9800998ecf8427e";
    TriPartitionInfo part;
    part.index = 0;
    part.description = "NTFS / exFAT (0x07)";
    part.startOffset = 1048576;
    part.size = 17951424;
    part.allocated = true;
    summary.partitions.push_back(part);

    TriImageSummary loaded;
    REQUIRE_FALSE(store.getImageSummary("c1", loaded));
    store.saveImageSummary("c1", summary);
    // saving again replaces
    store.saveImageSummary("c1", summary);

    REQUIRE(store.getImageSummary("c1", loaded));
    REQUIRE(loaded.format == "raw-split");
    REQUIRE(loaded.size == 20000000);
    REQUIRE(loaded.segmentCount == 2);
    REQUIRE(loaded.md5 == summary.md5);
    REQUIRE(loaded.sha1.empty());
    REQUIRE(loaded.partitions.size() == 1);
    REQUIRE(loaded.partitions[0].description == "NTFS / exFAT (0x07)");
    REQUIRE(loaded.partitions[0].startOffset == 1048576);
}

TEST_CASE_METHOD(StoreFixture, "store returns the latest report", "[store]") {
    TriAnomalyReport first;
    first.caseId = "c1";
    first.riskLevel = TRI_RISK_LOW;
    first.overallRiskScore = 12.5;
    first.generatedAt = 1600000000;
    uint64_t firstId = store.addReport(first);

    TriAnomalyReport second;
    second.caseId = "c1";
    second.anomaliesDetected = 3;
    second.totalActivities = 40;
    second.riskLevel = TRI_RISK_HIGH;
    second.overallRiskScore = 77.25;
    second.modelAccuracy = 0.85;
    second.generatedAt = 1600000100;
    second.scorerName = "rule";
    second.criticalIndicators.push_back("3 USB device connection(s)");
    second.recommendations.push_back("Review removable media usage");
    second.recommendations.push_back("Preserve the event logs");
    uint64_t secondId = store.addReport(second);
    REQUIRE(secondId > firstId);

    TriAnomalyReport latest;
    REQUIRE(store.getLatestReport("c1", latest));
    REQUIRE(latest.id == secondId);
    REQUIRE(latest.riskLevel == TRI_RISK_HIGH);
    REQUIRE(latest.overallRiskScore == Approx(77.25));
    REQUIRE(latest.anomaliesDetected == 3);
    REQUIRE(latest.totalActivities == 40);
    REQUIRE(latest.scorerName == "rule");
    REQUIRE(latest.criticalIndicators.size() == 1);
    REQUIRE(latest.recommendations.size() == 2);
    REQUIRE(latest.recommendations[1] == "Preserve the event logs");
}

TEST_CASE("store rejects use before open and artifacts without identity", "[store]") {
    runner::temp_dir dir("store_errors");
    TriArtifactStoreSqlite store(dir.file("triage.db"));
    REQUIRE_THROWS_AS(store.countArtifacts("c1"), TriStoreException);

    store.open();
    TriArtifact keyless(TRI_RUN_KEY, "c1");
    REQUIRE_THROWS_AS(store.upsert(keyless), TriStoreException);

    TriArtifact untyped;
    untyped.setNaturalKey("k");
    REQUIRE_THROWS_AS(store.upsert(untyped), TriStoreException);
}

TEST_CASE("store contents survive reopening", "[store]") {
    runner::temp_dir dir("store_reopen");
    {
        TriArtifactStoreSqlite store(dir.file("triage.db"));
        store.open();
        store.upsert(makeVisit("c1", "https://example.com/", 1600000000));
    }
    TriArtifactStoreSqlite store(dir.file("triage.db"));
    store.open();
    REQUIRE(store.countArtifacts("c1") == 1);
    REQUIRE(store.upsert(makeVisit("c1", "https://example.com/", 1600000000)) == TriArtifactStore::DUPLICATE_IGNORED);
}
