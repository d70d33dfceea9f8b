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

#include "triage/framework/timeline/TriTimelineBuilder.h"
#include "triage/framework/services/TriArtifactStoreSqlite.h"

#include <sstream>

namespace {
    TriArtifact make(TRI_ARTIFACT_TYPE type, const std::string &key, int64_t when, const std::string &description) {
        TriArtifact artifact(type, "c1");
        artifact.setNaturalKey(key);
        artifact.setTimestamp(when);
        artifact.setDescription(description);
        return artifact;
    }
}

TEST_CASE("timeline orders events by time, type and key", "[timeline]") {
    runner::temp_dir dir("timeline");
    TriArtifactStoreSqlite store(dir.file("triage.db"));
    store.open();

    store.upsert(make(TRI_USB_DEVICE, "serial-1", 1600000300, "USB device"));
    store.upsert(make(TRI_BROWSER_HISTORY, "b", 1600000100, "visit b"));
    store.upsert(make(TRI_BROWSER_HISTORY, "a", 1600000100, "visit a"));
    store.upsert(make(TRI_DELETED_FILE, "x.docx", 1600000100, "Deleted x.docx"));
    store.upsert(make(TRI_RUN_KEY, "run", 1600000000, "Run key"));
    // artifacts without a time stay off the timeline
    TriArtifact program(TRI_INSTALLED_PROGRAM, "c1");
    program.setNaturalKey("7-Zip");
    store.upsert(program);
    TriArtifact otherCase(TRI_RUN_KEY, "c2");
    otherCase.setNaturalKey("run");
    otherCase.setTimestamp(1600000000);
    store.upsert(otherCase);

    TriTimelineBuilder builder(store);
    std::vector<TriTimelineEvent> events = builder.build("c1");
    REQUIRE(events.size() == 5);
    REQUIRE(builder.countEvents("c1") == 5);
    REQUIRE(builder.countEvents("c2") == 1);
    REQUIRE(builder.countEvents("c3") == 0);

    REQUIRE(events[0].naturalKey == "run");
    REQUIRE(events[1].typeName == "browser_history");
    REQUIRE(events[1].naturalKey == "a");
    REQUIRE(events[2].naturalKey == "b");
    REQUIRE(events[3].typeName == "deleted_file");
    REQUIRE(events[4].type == TRI_USB_DEVICE);
    REQUIRE(events[4].artifactId != 0);

    for (size_t i = 1; i < events.size(); i++)
        REQUIRE_FALSE(TriTimelineBuilder::eventLess(events[i], events[i - 1]));
}

TEST_CASE("timeline filters and pages", "[timeline]") {
    runner::temp_dir dir("timeline_filter");
    TriArtifactStoreSqlite store(dir.file("triage.db"));
    store.open();
    for (int i = 0; i < 6; i++) {
        store.upsert(make(TRI_PREFETCH, "pf" + std::to_string(i), 1600000000 + i * 60, "prefetch"));
        store.upsert(make(TRI_SHORTCUT, "lnk" + std::to_string(i), 1600000030 + i * 60, "shortcut"));
    }

    TriTimelineBuilder builder(store);

    TriTimelineFilter types;
    types.types.push_back(TRI_SHORTCUT);
    REQUIRE(builder.build("c1", types).size() == 6);

    TriTimelineFilter range;
    range.hasStartTime = true;
    range.startTime = 1600000060;
    range.hasEndTime = true;
    range.endTime = 1600000120;
    std::vector<TriTimelineEvent> inRange = builder.build("c1", range);
    REQUIRE(inRange.size() == 3);
    REQUIRE(inRange[0].naturalKey == "pf1");
    REQUIRE(inRange[1].naturalKey == "lnk1");
    REQUIRE(inRange[2].naturalKey == "pf2");

    TriTimelineFilter page;
    page.offset = 10;
    page.limit = 5;
    std::vector<TriTimelineEvent> tail = builder.build("c1", page);
    REQUIRE(tail.size() == 2);
    REQUIRE(tail[1].naturalKey == "lnk5");

    page.offset = 12;
    REQUIRE(builder.build("c1", page).empty());
}

TEST_CASE("timeline lines", "[timeline]") {
    TriArtifact artifact = make(TRI_PREFETCH, "prefetch|calc.exe|1234567890", 1234567890, "CALC.EXE executed 5 time(s)");
    artifact.setId(7);
    TriTimelineEvent event = TriTimelineBuilder::toEvent(artifact);
    REQUIRE(event.caseId == "c1");
    REQUIRE(event.artifactId == 7);

    std::ostringstream out;
    TriTimelineBuilder::write(out, std::vector<TriTimelineEvent>(1, event));
    REQUIRE(out.str() == "2009-02-13 23:31:30|prefetch|CALC.EXE executed 5 time(s)|prefetch|calc.exe|1234567890\n");
}

TEST_CASE("timeline lines keep four fields when the description has separators", "[timeline]") {
    TriArtifact artifact = make(TRI_BROWSER_HISTORY, "browser|chrome|https://example.com/a|b|1234567890", 1234567890,
        "Visited Search | Results\nC:\\Temp");
    std::ostringstream out;
    TriTimelineBuilder::write(out, std::vector<TriTimelineEvent>(1, TriTimelineBuilder::toEvent(artifact)));

    std::string line = out.str();
    REQUIRE(line == "2009-02-13 23:31:30|browser_history|Visited Search \\| Results\\nC:\\\\Temp|"
        "browser|chrome|https://example.com/a|b|1234567890\n");

    // splitting on the first three unescaped separators recovers the natural key
    std::vector<std::string::size_type> separators;
    for (std::string::size_type i = 0; i < line.size() && separators.size() < 3; ++i) {
        if (line[i] == '\\')
            ++i;
        else if (line[i] == '|')
            separators.push_back(i);
    }
    REQUIRE(separators.size() == 3);
    REQUIRE(line.substr(separators[2] + 1, line.size() - separators[2] - 2) == artifact.getNaturalKey());
}
