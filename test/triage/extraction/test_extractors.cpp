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
#include "test/HiveBuilder.h"
#include "test/MemoryWalker.h"

#include "triage/framework/extraction/TriExtractorRegistry.h"
#include "triage/framework/extraction/TriBrowserExtractor.h"
#include "triage/framework/extraction/TriRecycleBinExtractor.h"
#include "triage/framework/extraction/TriEventLogExtractor.h"
#include "triage/framework/extraction/TriUserActivityExtractor.h"
#include "triage/framework/extraction/TriFileSystemExtractor.h"
#include "triage/framework/extraction/TriArtifactSink.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "sqlite3.h"

#include <sstream>

namespace {
    // WebKit timestamps are microseconds since 1601
    int64_t webkit(int64_t unixTime) {
        return (unixTime + 11644473600LL) * 1000000LL;
    }

    std::vector<uint8_t> makeSqlite(const runner::temp_dir &dir, const std::string &name, const std::string &sql) {
        std::string path = dir.file(name);
        sqlite3 *db = NULL;
        REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
        char *error = NULL;
        int rc = sqlite3_exec(db, sql.c_str(), NULL, NULL, &error);
        std::string message = error ? error : "";
        sqlite3_free(error);
        sqlite3_close(db);
        INFO(message);
        REQUIRE(rc == SQLITE_OK);
        std::string content = runner::file_contents(path);
        return std::vector<uint8_t>(content.begin(), content.end());
    }

    std::vector<TriArtifact> ofType(const TriArtifactCollector &sink, TRI_ARTIFACT_TYPE type) {
        std::vector<TriArtifact> result;
        for (size_t i = 0; i < sink.getArtifacts().size(); i++) {
            if (sink.getArtifacts()[i].getType() == type)
                result.push_back(sink.getArtifacts()[i]);
        }
        return result;
    }

    const TriArtifact *byKey(const TriArtifactCollector &sink, const std::string &key) {
        for (size_t i = 0; i < sink.getArtifacts().size(); i++) {
            if (sink.getArtifacts()[i].getNaturalKey() == key)
                return &sink.getArtifacts()[i];
        }
        return NULL;
    }

    std::vector<uint8_t> utf16z(const std::string &str) {
        std::vector<uint8_t> out = runner::utf16(str);
        out.push_back(0);
        out.push_back(0);
        return out;
    }

    void align4(std::vector<uint8_t> &buf) {
        while (buf.size() % 4)
            buf.push_back(0);
    }

    std::vector<uint8_t> evtRecord(uint32_t recordNumber, uint32_t time, uint32_t eventId, uint16_t type,
        const std::string &source, const std::string &computer, const std::vector<std::string> &strings) {
        std::vector<uint8_t> rec(0x38, 0);
        runner::put_ascii(rec, 4, "LfLe");
        runner::put_u32(rec, 8, recordNumber);
        runner::put_u32(rec, 12, time);
        runner::put_u32(rec, 16, time);
        runner::put_u32(rec, 20, eventId);
        runner::put_u16(rec, 24, type);
        runner::put_u16(rec, 26, (uint16_t)strings.size());
        runner::put_bytes(rec, rec.size(), utf16z(source));
        runner::put_bytes(rec, rec.size(), utf16z(computer));
        align4(rec);
        runner::put_u32(rec, 36, (uint32_t)rec.size());
        for (size_t i = 0; i < strings.size(); i++)
            runner::put_bytes(rec, rec.size(), utf16z(strings[i]));
        align4(rec);
        uint32_t length = (uint32_t)rec.size() + 4;
        runner::put_u32(rec, rec.size(), length);
        runner::put_u32(rec, 0, length);
        return rec;
    }
}

TEST_CASE("extractor registry holds every extractor once", "[extractors]") {
    TriExtractorRegistry registry;
    REQUIRE(registry.getExtractors().size() == 6);
    REQUIRE(registry.findByName("registry") != NULL);
    REQUIRE(registry.findByName("nonexistent") == NULL);
    REQUIRE(registry.findByType(TRI_BROWSER_COOKIE)->getName() == "browser");
    REQUIRE(registry.findByType(TRI_DELETED_FILE)->getName() == "recyclebin");
    REQUIRE(registry.findByType(TRI_EVENT_LOG)->getName() == "eventlog");
    REQUIRE(registry.findByType(TRI_USER_ASSIST)->getName() == "useractivity");
    REQUIRE(registry.findByType(TRI_JUMP_LIST)->getName() == "filesystem");
    REQUIRE(registry.findByType(TRI_USB_DEVICE)->getName() == "registry");
}

TEST_CASE("browser extractor reads chromium, firefox and index.dat history", "[extractors][browser]") {
    runner::temp_dir dir("browser");
    std::stringstream chrome;
    chrome << "CREATE TABLE urls(id INTEGER PRIMARY KEY, url TEXT, title TEXT, visit_count INTEGER, "
           << "typed_count INTEGER, last_visit_time INTEGER);"
           << "INSERT INTO urls VALUES(1, 'https://example.com/', 'Example', 3, 1, " << webkit(1600000000) << ");"
           << "INSERT INTO urls VALUES(2, 'https://mail.example.com/', 'Mail', 1, 0, " << webkit(1600000100) << ");"
           << "CREATE TABLE downloads(id INTEGER PRIMARY KEY, url TEXT, target_path TEXT, start_time INTEGER, "
           << "end_time INTEGER, received_bytes INTEGER, total_bytes INTEGER, state INTEGER, danger_type INTEGER);"
           << "INSERT INTO downloads VALUES(1, 'https://example.com/tool.exe', 'C:\\Users\\bob\\Downloads\\tool.exe', "
           << webkit(1600000150) << ", " << webkit(1600000160) << ", 1024, 1024, 1, 0);";
    std::stringstream cookies;
    cookies << "CREATE TABLE cookies(host_key TEXT, name TEXT, path TEXT, creation_utc INTEGER, "
            << "last_access_utc INTEGER, expires_utc INTEGER, is_secure INTEGER);"
            << "INSERT INTO cookies VALUES('.example.com', 'sid', '/', " << webkit(1600000000) << ", "
            << webkit(1600000100) << ", " << webkit(1700000000) << ", 1);";
    std::stringstream firefox;
    firefox << "CREATE TABLE moz_places(id INTEGER PRIMARY KEY, url TEXT, title TEXT, visit_count INTEGER, "
            << "last_visit_date INTEGER);"
            << "INSERT INTO moz_places VALUES(1, 'https://news.example.org/', 'News', 2, " << 1600000200LL * 1000000LL << ");"
            << "INSERT INTO moz_places VALUES(2, 'place:sort=8', NULL, 0, NULL);";

    std::vector<uint8_t> indexDat(0x100, 0);
    runner::put_ascii(indexDat, 0, "Client UrlCache MMF Ver 5.2");
    runner::put_ascii(indexDat, 0x80, "URL ");
    runner::put_u32(indexDat, 0x84, 1);
    runner::put_u64(indexDat, 0x88, runner::to_filetime(1600000250));
    runner::put_u64(indexDat, 0x90, runner::to_filetime(1600000300));
    runner::put_u32(indexDat, 0x80 + 0x34, 0x68);
    runner::put_ascii(indexDat, 0x80 + 0x68, "http://intranet/");

    MemoryWalker walker;
    const std::string userData = "/Users/bob/AppData/Local/Google/Chrome/User Data";
    walker.addFile(userData + "/Default/History", makeSqlite(dir, "History", chrome.str()));
    walker.addFile(userData + "/Default/Network/Cookies", makeSqlite(dir, "Cookies", cookies.str()));
    walker.addFile(userData + "/Profile 1/History", "this is not a database");
    walker.addFile(userData + "/Crashpad/History", "ignored");
    walker.addFile("/Users/bob/AppData/Roaming/Mozilla/Firefox/Profiles/x1y2.default/places.sqlite",
        makeSqlite(dir, "places.sqlite", firefox.str()));
    walker.addFile("/Users/bob/AppData/Local/Microsoft/Windows/History/History.IE5/index.dat", indexDat);

    TriBrowserExtractor extractor;
    TriArtifactCollector sink;
    REQUIRE(extractor.extract(walker, "case1", sink) == TriExtractor::OK);

    REQUIRE(sink.getWarnings().size() == 1);
    REQUIRE(runner::contains(sink.getWarnings()[0], "Profile 1/History"));

    REQUIRE(ofType(sink, TRI_BROWSER_HISTORY).size() == 4);

    const TriArtifact *visit = byKey(sink, "https://example.com/|1600000000");
    REQUIRE(visit != NULL);
    REQUIRE(visit->getType() == TRI_BROWSER_HISTORY);
    REQUIRE(visit->getString("browser") == "chrome");
    REQUIRE(visit->getString("title") == "Example");
    REQUIRE(visit->getString("profile") == "bob");
    REQUIRE(visit->getLong("visit_count") == 3);
    REQUIRE(visit->getLong("typed_count") == 1);
    REQUIRE(visit->getSourcePath() == "vol0:" + userData + "/Default/History");

    std::vector<TriArtifact> downloads = ofType(sink, TRI_BROWSER_DOWNLOAD);
    REQUIRE(downloads.size() == 1);
    REQUIRE(downloads[0].getString("target_path") == "C:\\Users\\bob\\Downloads\\tool.exe");
    REQUIRE(downloads[0].getTimestamp() == 1600000150);
    REQUIRE(downloads[0].getLong("received_bytes") == 1024);

    std::vector<TriArtifact> cookieArtifacts = ofType(sink, TRI_BROWSER_COOKIE);
    REQUIRE(cookieArtifacts.size() == 1);
    REQUIRE(cookieArtifacts[0].getNaturalKey() == ".example.com|sid|/|1600000000");
    REQUIRE(cookieArtifacts[0].getLong("secure") == 1);
    REQUIRE(cookieArtifacts[0].getLong("expiry") == 1700000000);

    const TriArtifact *ff = byKey(sink, "https://news.example.org/|1600000200");
    REQUIRE(ff != NULL);
    REQUIRE(ff->getString("browser") == "firefox");

    const TriArtifact *ie = byKey(sink, "http://intranet/|1600000300");
    REQUIRE(ie != NULL);
    REQUIRE(ie->getString("browser") == "internet_explorer");
    REQUIRE(ie->getSourceOffset() == 0x80);
    REQUIRE(ie->getLong("last_modified") == 1600000250);
}

TEST_CASE("recycle bin extractor reads $I, INFO2 and unlinked entries", "[extractors][recyclebin]") {
    const std::string sidDir = "/$Recycle.Bin/S-1-5-21-1000";

    std::string v2Name = "C:\\Users\\bob\\secret.docx";
    std::vector<uint8_t> v2;
    runner::put_u64(v2, 0, 2);
    runner::put_u64(v2, 8, 2048);
    runner::put_u64(v2, 16, runner::to_filetime(1600000400));
    runner::put_u32(v2, 24, (uint32_t)v2Name.size() + 1);
    runner::put_bytes(v2, 28, utf16z(v2Name));

    std::vector<uint8_t> v1(24 + 520, 0);
    runner::put_u64(v1, 0, 1);
    runner::put_u64(v1, 8, 10);
    runner::put_u64(v1, 16, runner::to_filetime(1600000450));
    runner::put_bytes(v1, 24, runner::utf16("C:\\temp\\x.txt"));

    std::vector<uint8_t> badVersion(64, 0);
    runner::put_u64(badVersion, 0, 9);

    std::vector<uint8_t> info2(20 + 800, 0);
    runner::put_u32(info2, 12, 800);
    runner::put_ascii(info2, 20, "C:\\old\\plan.txt");
    runner::put_u32(info2, 20 + 260, 3);
    runner::put_u32(info2, 20 + 264, 2);
    runner::put_u64(info2, 20 + 268, runner::to_filetime(1600000500));
    runner::put_u32(info2, 20 + 276, 512);

    MemoryWalker walker;
    walker.addFile(sidDir + "/$IABC123.docx", v2);
    walker.addFile(sidDir + "/$RABC123.docx", "content");
    walker.addFile(sidDir + "/$IXYZ.txt", v1);
    walker.addFile(sidDir + "/$IBAD.bin", badVersion);
    walker.addFile(sidDir + "/desktop.ini", "[.ShellClassInfo]");
    walker.addFile("/RECYCLER/S-1-5-21-1000/INFO2", info2);

    TriDeletedEntry unlinked;
    unlinked.path = "/Users/bob/Documents/leak.zip";
    unlinked.name = "leak.zip";
    unlinked.isDirectory = false;
    unlinked.size = 4096;
    unlinked.metaAddress = 1234;
    unlinked.mtime = 1600000000;
    unlinked.ctime = 1600000600;
    unlinked.crtime = 0;
    walker.addDeleted(unlinked);
    TriDeletedEntry directory = unlinked;
    directory.path = "/Users/bob/OldFolder";
    directory.isDirectory = true;
    walker.addDeleted(directory);

    TriRecycleBinExtractor extractor;
    TriArtifactCollector sink;
    REQUIRE(extractor.extract(walker, "case1", sink) == TriExtractor::OK);

    REQUIRE(sink.getArtifacts().size() == 4);
    REQUIRE(sink.getWarnings().size() == 1);
    REQUIRE(runner::contains(sink.getWarnings()[0], "$IBAD.bin"));

    const TriArtifact *modern = byKey(sink, v2Name + "|1600000400");
    REQUIRE(modern != NULL);
    REQUIRE(modern->getString("original_path") == v2Name);
    REQUIRE(modern->getLong("file_size") == 2048);
    REQUIRE(modern->getString("user_sid") == "S-1-5-21-1000");
    REQUIRE(modern->getLong("content_present") == 1);
    REQUIRE(modern->getLong("format_version") == 2);
    REQUIRE(modern->getString("origin") == "$I");

    const TriArtifact *vista = byKey(sink, "C:\\temp\\x.txt|1600000450");
    REQUIRE(vista != NULL);
    REQUIRE(vista->getLong("content_present") == 0);
    REQUIRE(vista->getLong("format_version") == 1);

    const TriArtifact *xp = byKey(sink, "C:\\old\\plan.txt|1600000500");
    REQUIRE(xp != NULL);
    REQUIRE(xp->getString("origin") == "INFO2");
    REQUIRE(xp->getString("drive_letter") == "C");
    REQUIRE(xp->getString("recycle_name") == "Dc3");
    REQUIRE(xp->getLong("file_size") == 512);
    REQUIRE(xp->getSourceOffset() == 20);

    const TriArtifact *fs = byKey(sink, "/Users/bob/Documents/leak.zip|1600000600");
    REQUIRE(fs != NULL);
    REQUIRE(fs->getString("origin") == "filesystem");
    REQUIRE(fs->getLong("meta_address") == 1234);
}

TEST_CASE("event log extractor decodes EVT records and inventories EVTX files", "[extractors][eventlog]") {
    std::vector<uint8_t> evt(0x30, 0);
    runner::put_u32(evt, 0, 0x30);
    runner::put_ascii(evt, 4, "LfLe");

    std::vector<std::string> logonStrings;
    logonStrings.push_back("mallory");
    logonStrings.push_back("CORP");
    runner::put_bytes(evt, evt.size(), evtRecord(1, 1600000700, 4625, 16, "Security", "WKSTN-07", logonStrings));
    runner::put_bytes(evt, evt.size(), evtRecord(2, 1600000800, 1102, 4, "Security", "WKSTN-07",
        std::vector<std::string>()));

    // a record whose trailing length does not match
    std::vector<uint8_t> damaged(0x38, 0);
    runner::put_u32(damaged, 0, 0x38);
    runner::put_ascii(damaged, 4, "LfLe");
    runner::put_u32(damaged, 0x34, 0x99);
    runner::put_bytes(evt, evt.size(), damaged);

    std::vector<uint8_t> evtx(0x1000, 0);
    runner::put_ascii(evtx, 0, "ElfFile");
    runner::put_u64(evtx, 0x18, 42);
    runner::put_u16(evtx, 0x2A, 3);

    MemoryWalker walker;
    walker.addFile("/Windows/System32/config/SecEvent.Evt", evt);
    walker.addFile("/Windows/System32/config/SYSTEM", "not an event log");
    walker.addFile("/Windows/System32/winevt/Logs/System.evtx", evtx, 1600000900);

    TriEventLogExtractor extractor;
    TriArtifactCollector sink;
    REQUIRE(extractor.extract(walker, "case1", sink) == TriExtractor::OK);

    std::vector<TriArtifact> events = ofType(sink, TRI_EVENT_LOG);
    REQUIRE(events.size() == 3);
    REQUIRE(sink.getWarnings().size() == 1);
    REQUIRE(runner::contains(sink.getWarnings()[0], "1 damaged record(s) skipped"));

    const TriArtifact *failed = byKey(sink, "4625|1600000700|Security");
    REQUIRE(failed != NULL);
    REQUIRE(failed->getString("category") == "failed_logon");
    REQUIRE(failed->getString("user_name") == "mallory");
    REQUIRE(failed->getString("domain") == "CORP");
    REQUIRE(failed->getString("event_type") == "Failure Audit");
    REQUIRE(failed->getString("computer_name") == "WKSTN-07");
    REQUIRE(failed->getSourceOffset() == 0x30);

    const TriArtifact *cleared = byKey(sink, "1102|1600000800|Security");
    REQUIRE(cleared != NULL);
    REQUIRE(cleared->getString("category") == "log_cleared");
    REQUIRE(cleared->findAttribute("user_name") == NULL);

    const TriArtifact *inventory = byKey(sink, "evtx|/Windows/System32/winevt/Logs/System.evtx");
    REQUIRE(inventory != NULL);
    REQUIRE(inventory->getString("category") == "log_file");
    REQUIRE(inventory->getLong("valid_header") == 1);
    REQUIRE(inventory->getLong("next_record_id") == 42);
    REQUIRE(inventory->getLong("chunk_count") == 3);
    REQUIRE(inventory->getTimestamp() == 1600000900);
}

TEST_CASE("event categories", "[extractors][eventlog]") {
    REQUIRE(TriEventLogExtractor::eventCategory(4624) == "logon");
    REQUIRE(TriEventLogExtractor::eventCategory(538) == "logoff");
    REQUIRE(TriEventLogExtractor::eventCategory(529) == "failed_logon");
    REQUIRE(TriEventLogExtractor::eventCategory(539) == "failed_logon");
    REQUIRE(TriEventLogExtractor::eventCategory(517) == "log_cleared");
    REQUIRE(TriEventLogExtractor::eventCategory(7036) == "system");
    REQUIRE(TriEventLogExtractor::eventCategory(12345) == "other");
}

TEST_CASE("user activity extractor decodes UserAssist entries", "[extractors][useractivity]") {
    const std::string base = "Software\\Microsoft\\Windows\\CurrentVersion\\Explorer\\UserAssist\\";

    std::vector<uint8_t> win7(72, 0);
    runner::put_u32(win7, 4, 4);
    runner::put_u32(win7, 8, 2);
    runner::put_u64(win7, 60, runner::to_filetime(1600001100));

    std::vector<uint8_t> xp(16, 0);
    runner::put_u32(xp, 4, 7);
    runner::put_u64(xp, 8, runner::to_filetime(1600001200));

    HiveBuilder hive;
    hive.path(base + "{CEBFF5CD-ACE2-4F4F-9178-9926F41749EA}\\Count")
        .setValue(TriUtilities::rot13("C:\\Tools\\mimikatz.exe"), HiveBuilder::REG_BINARY, win7)
        .setValue(TriUtilities::rot13("UEME_CTLSESSION"), HiveBuilder::REG_BINARY, win7);
    hive.path(base + "{75048700-EF1F-11D0-9888-006097DEACF9}\\Count")
        .setValue(TriUtilities::rot13("UEME_RUNPATH:C:\\WINDOWS\\notepad.exe"), HiveBuilder::REG_BINARY, xp)
        .setValue(TriUtilities::rot13("short"), HiveBuilder::REG_BINARY, std::vector<uint8_t>(8, 0));

    MemoryWalker walker;
    walker.addFile("/Users/bob/NTUSER.DAT", hive.build());
    walker.addFile("/Users/eve/NTUSER.DAT", "regf but not really");

    TriUserActivityExtractor extractor;
    TriArtifactCollector sink;
    REQUIRE(extractor.extract(walker, "case1", sink) == TriExtractor::OK);

    REQUIRE(sink.getArtifacts().size() == 2);
    REQUIRE(sink.getWarnings().size() == 1);

    const TriArtifact *modern = byKey(sink, "C:\\Tools\\mimikatz.exe|bob");
    REQUIRE(modern != NULL);
    REQUIRE(modern->getType() == TRI_USER_ASSIST);
    REQUIRE(modern->getLong("run_count") == 4);
    REQUIRE(modern->getLong("focus_count") == 2);
    REQUIRE(modern->getTimestamp() == 1600001100);
    REQUIRE(modern->getString("format") == "win7");

    const TriArtifact *legacy = byKey(sink, "UEME_RUNPATH:C:\\WINDOWS\\notepad.exe|bob");
    REQUIRE(legacy != NULL);
    REQUIRE(legacy->getLong("run_count") == 2);
    REQUIRE(legacy->getTimestamp() == 1600001200);
    REQUIRE(legacy->getString("format") == "xp");
}

TEST_CASE("filesystem extractor reads prefetch, shortcuts and jump lists", "[extractors][filesystem]") {
    std::vector<uint8_t> v23(0x9C, 0);
    runner::put_u32(v23, 0, 23);
    runner::put_ascii(v23, 4, "SCCA");
    runner::put_bytes(v23, 0x10, runner::utf16("CALC.EXE"));
    runner::put_u64(v23, 0x80, runner::to_filetime(1600001300));
    runner::put_u32(v23, 0x98, 5);

    std::vector<uint8_t> v30(0xD4, 0);
    runner::put_u32(v30, 0, 30);
    runner::put_ascii(v30, 4, "SCCA");
    runner::put_bytes(v30, 0x10, runner::utf16("POWERSHELL.EXE"));
    runner::put_u64(v30, 0x80, runner::to_filetime(1600001500));
    runner::put_u64(v30, 0x88, runner::to_filetime(1600001400));
    runner::put_u32(v30, 0xD0, 9);

    std::vector<uint8_t> mam(16, 0);
    runner::put_ascii(mam, 0, "MAM\x04");

    // shell link with a LinkInfo local base path
    const std::string target = "C:\\Users\\bob\\secret.docx";
    std::vector<uint8_t> lnk(0x4C, 0);
    const uint8_t clsid[16] = {
        0x01, 0x14, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46
    };
    runner::put_u32(lnk, 0, 0x4C);
    runner::put_bytes(lnk, 4, std::vector<uint8_t>(clsid, clsid + 16));
    runner::put_u32(lnk, 0x14, 0x02 | 0x80);
    runner::put_u32(lnk, 0x18, 0x20);
    runner::put_u64(lnk, 0x2C, runner::to_filetime(1600001700));
    runner::put_u32(lnk, 0x34, 2048);
    uint32_t linkInfoSize = 0x1C + (uint32_t)target.size() + 2;
    std::vector<uint8_t> linkInfo(linkInfoSize, 0);
    runner::put_u32(linkInfo, 0, linkInfoSize);
    runner::put_u32(linkInfo, 4, 0x1C);
    runner::put_u32(linkInfo, 8, 1);
    runner::put_u32(linkInfo, 16, 0x1C);
    runner::put_u32(linkInfo, 24, 0x1C + (uint32_t)target.size() + 1);
    runner::put_ascii(linkInfo, 0x1C, target);
    runner::put_bytes(lnk, lnk.size(), linkInfo);

    std::vector<uint8_t> bareLnk(0x4C, 0);
    runner::put_u32(bareLnk, 0, 0x4C);
    runner::put_bytes(bareLnk, 4, std::vector<uint8_t>(clsid, clsid + 16));

    const std::string recent = "/Users/bob/AppData/Roaming/Microsoft/Windows/Recent";
    MemoryWalker walker;
    walker.addFile("/Windows/Prefetch/CALC.EXE-77E2A3C4.pf", v23);
    walker.addFile("/Windows/Prefetch/POWERSHELL.EXE-12345678.pf", v30);
    walker.addFile("/Windows/Prefetch/SVCHOST.EXE-11111111.pf", mam, 1600001600);
    walker.addFile("/Windows/Prefetch/BAD.EXE-00000000.pf", std::vector<uint8_t>(200, 0x55));
    walker.addFile("/Windows/Prefetch/Layout.ini", "ignored");
    walker.addFile(recent + "/secret.docx.lnk", lnk);
    walker.addFile(recent + "/notes.txt.lnk", bareLnk, 1600001800);
    walker.addFile(recent + "/AutomaticDestinations/5d696d521de238c3.automaticDestinations-ms",
        std::vector<uint8_t>(512, 0), 1600001900);
    walker.addFile(recent + "/CustomDestinations/0123456789abcdef.customDestinations-ms",
        std::vector<uint8_t>(64, 0), 1600002000);

    TriFileSystemExtractor extractor;
    TriArtifactCollector sink;
    REQUIRE(extractor.extract(walker, "case1", sink) == TriExtractor::OK);

    REQUIRE(sink.getWarnings().size() == 1);
    REQUIRE(runner::contains(sink.getWarnings()[0], "BAD.EXE-00000000.pf"));
    REQUIRE(ofType(sink, TRI_PREFETCH).size() == 3);
    REQUIRE(ofType(sink, TRI_SHORTCUT).size() == 2);
    REQUIRE(ofType(sink, TRI_JUMP_LIST).size() == 2);

    const TriArtifact *calc = byKey(sink, "prefetch|calc.exe|1600001300");
    REQUIRE(calc != NULL);
    REQUIRE(calc->getString("executable") == "CALC.EXE");
    REQUIRE(calc->getLong("run_count") == 5);
    REQUIRE(calc->getString("prefetch_hash") == "77E2A3C4");

    const TriArtifact *ps = byKey(sink, "prefetch|powershell.exe|1600001500");
    REQUIRE(ps != NULL);
    REQUIRE(ps->getLong("run_count") == 9);
    REQUIRE(ps->getString("previous_runs") == TriUtilities::formatTime(1600001400));

    const TriArtifact *compressed = byKey(sink, "prefetch|svchost.exe|1600001600");
    REQUIRE(compressed != NULL);
    REQUIRE(compressed->getLong("compressed") == 1);

    const TriArtifact *shortcut = byKey(sink, "shortcut|c:\\users\\bob\\secret.docx|1600001700");
    REQUIRE(shortcut != NULL);
    REQUIRE(shortcut->getString("target_path") == target);
    REQUIRE(shortcut->getLong("target_size") == 2048);
    REQUIRE(shortcut->getString("profile") == "bob");

    const TriArtifact *bare = byKey(sink, "shortcut|notes.txt|1600001800");
    REQUIRE(bare != NULL);
    REQUIRE(bare->getString("target_path") == "notes.txt");

    std::vector<TriArtifact> jumpLists = ofType(sink, TRI_JUMP_LIST);
    const TriArtifact *chrome = NULL;
    for (size_t i = 0; i < jumpLists.size(); i++) {
        if (jumpLists[i].getString("app_id") == "5d696d521de238c3")
            chrome = &jumpLists[i];
    }
    REQUIRE(chrome != NULL);
    REQUIRE(chrome->getString("application") == "Google Chrome");
    REQUIRE(chrome->getString("kind") == "automatic");
    REQUIRE(chrome->getTimestamp() == 1600001900);
}
