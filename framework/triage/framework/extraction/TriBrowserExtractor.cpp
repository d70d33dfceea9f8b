/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriBrowserExtractor.cpp
 * Browser history, cookie and download extraction.
 */

#include "TriBrowserExtractor.h"
#include "TriEvidenceDatabase.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "Poco/NumberFormatter.h"

#include <sstream>

namespace
{
    const char * const FIREFOX_PROFILES = "AppData/Roaming/Mozilla/Firefox/Profiles";

    struct ChromiumBrowser
    {
        const char *name;
        const char *userDataDir;
    };

    const ChromiumBrowser CHROMIUM_BROWSERS[] = {
        { "chrome", "AppData/Local/Google/Chrome/User Data" },
        { "edge", "AppData/Local/Microsoft/Edge/User Data" }
    };

    // index.dat locations relative to the profile; directories are searched one level deep
    const char * const IE_INDEX_LOCATIONS[] = {
        "Local Settings/History/History.IE5",
        "Local Settings/Temporary Internet Files/Content.IE5",
        "Cookies",
        "AppData/Local/Microsoft/Windows/History/History.IE5",
        "AppData/Roaming/Microsoft/Windows/Cookies"
    };

    const size_t IE_BLOCK_SIZE = 0x80;
    const uint32_t IE_MAX_RECORD_BLOCKS = 64;
    const size_t IE_URL_OFFSET_OFFSET = 0x34;

    TriArtifact makeHistory(const std::string &caseId, const std::string &browser, const std::string &url,
        const std::string &title, int64_t visitTime, int64_t visitCount, const std::string &source,
        const std::string &profile)
    {
        TriArtifact artifact(TRI_BROWSER_HISTORY, caseId);
        artifact.setSource(source);
        artifact.setTimestamp(visitTime);

        std::vector<std::string> key;
        key.push_back(url);
        key.push_back(Poco::NumberFormatter::format(visitTime));
        artifact.setNaturalKey(TriArtifact::makeKey(key));

        artifact.setDescription(browser + " visit to " + url);
        artifact.addAttribute("browser", browser);
        artifact.addAttribute("url", url);
        if (!title.empty())
            artifact.addAttribute("title", title);
        artifact.addAttribute("visit_count", visitCount);
        artifact.addAttribute("profile", profile);
        return artifact;
    }

    TriArtifact makeDownload(const std::string &caseId, const std::string &browser, const std::string &url,
        const std::string &target, int64_t startTime, const std::string &source, const std::string &profile)
    {
        TriArtifact artifact(TRI_BROWSER_DOWNLOAD, caseId);
        artifact.setSource(source);
        artifact.setTimestamp(startTime);

        std::vector<std::string> key;
        key.push_back(url);
        key.push_back(Poco::NumberFormatter::format(startTime));
        artifact.setNaturalKey(TriArtifact::makeKey(key));

        artifact.setDescription(browser + " download of " + (target.empty() ? url : target));
        artifact.addAttribute("browser", browser);
        artifact.addAttribute("url", url);
        if (!target.empty())
            artifact.addAttribute("target_path", target);
        artifact.addAttribute("profile", profile);
        return artifact;
    }

    TriArtifact makeCookie(const std::string &caseId, const std::string &browser, const std::string &host,
        const std::string &name, const std::string &path, int64_t created, const std::string &source,
        const std::string &profile)
    {
        TriArtifact artifact(TRI_BROWSER_COOKIE, caseId);
        artifact.setSource(source);
        artifact.setTimestamp(created);

        std::vector<std::string> key;
        key.push_back(host);
        key.push_back(name);
        key.push_back(path);
        key.push_back(Poco::NumberFormatter::format(created));
        artifact.setNaturalKey(TriArtifact::makeKey(key));

        artifact.setDescription(browser + " cookie " + name + " for " + host);
        artifact.addAttribute("browser", browser);
        artifact.addAttribute("host", host);
        artifact.addAttribute("name", name);
        artifact.addAttribute("path", path);
        artifact.addAttribute("profile", profile);
        return artifact;
    }
}

std::vector<TRI_ARTIFACT_TYPE> TriBrowserExtractor::getArtifactTypes() const
{
    std::vector<TRI_ARTIFACT_TYPE> types;
    types.push_back(TRI_BROWSER_HISTORY);
    types.push_back(TRI_BROWSER_COOKIE);
    types.push_back(TRI_BROWSER_DOWNLOAD);
    return types;
}

TriExtractor::Status TriBrowserExtractor::extract(TriFilesystemWalker &walker, const std::string &caseId,
    TriArtifactSink &sink)
{
    std::vector<TriVolume> volumes = walker.listVolumes();
    for (std::vector<TriVolume>::const_iterator vol = volumes.begin(); vol != volumes.end(); ++vol) {
        std::vector<TriUserProfile> profiles = walker.listUserProfiles(vol->index);
        for (std::vector<TriUserProfile>::const_iterator profile = profiles.begin(); profile != profiles.end(); ++profile) {
            extractFirefox(walker, vol->index, profile->path, profile->name, caseId, sink);
            for (size_t i = 0; i < sizeof(CHROMIUM_BROWSERS) / sizeof(CHROMIUM_BROWSERS[0]); i++) {
                extractChromium(walker, vol->index,
                    TriFilesystemWalker::joinPath(profile->path, CHROMIUM_BROWSERS[i].userDataDir),
                    CHROMIUM_BROWSERS[i].name, profile->name, caseId, sink);
            }
            extractInternetExplorer(walker, vol->index, profile->path, profile->name, caseId, sink);
        }
    }
    return OK;
}

void TriBrowserExtractor::extractFirefox(TriFilesystemWalker &walker, unsigned int volume, const std::string &profile,
    const std::string &profileName, const std::string &caseId, TriArtifactSink &sink)
{
    std::vector<TriDirEntry> ffProfiles = walker.listDirectory(volume, TriFilesystemWalker::joinPath(profile, FIREFOX_PROFILES));
    for (std::vector<TriDirEntry>::const_iterator it = ffProfiles.begin(); it != ffProfiles.end(); ++it) {
        if (!it->isDirectory)
            continue;

        std::vector<uint8_t> data;
        std::string places = TriFilesystemWalker::joinPath(it->path, "places.sqlite");
        if (readOptionalFile(walker, volume, places, data, sink)) {
            std::string source = sourcePath(volume, places);
            try {
                TriEvidenceDatabase db(data, source);
                firefoxHistory(db, caseId, source, profileName, sink);
                firefoxDownloads(db, caseId, source, profileName, sink);
            }
            catch (TriException &ex) {
                warn(sink, source, ex.message());
            }
        }

        std::string cookies = TriFilesystemWalker::joinPath(it->path, "cookies.sqlite");
        if (readOptionalFile(walker, volume, cookies, data, sink)) {
            std::string source = sourcePath(volume, cookies);
            try {
                TriEvidenceDatabase db(data, source);
                firefoxCookies(db, caseId, source, profileName, sink);
            }
            catch (TriException &ex) {
                warn(sink, source, ex.message());
            }
        }
    }
}

void TriBrowserExtractor::firefoxHistory(TriEvidenceDatabase &db, const std::string &caseId, const std::string &source,
    const std::string &profile, TriArtifactSink &sink) const
{
    // PRTime: microseconds since the Unix epoch
    TriEvidenceDatabase::Statement stmt(db.handle(),
        "SELECT url, title, visit_count, last_visit_date FROM moz_places "
        "WHERE last_visit_date IS NOT NULL ORDER BY last_visit_date");
    while (stmt.step()) {
        sink.add(makeHistory(caseId, "firefox", stmt.getText(0), stmt.getText(1),
            TriUtilities::prTimeToUnix(stmt.getInt64(3)), stmt.getInt64(2), source, profile));
    }
}

void TriBrowserExtractor::firefoxDownloads(TriEvidenceDatabase &db, const std::string &caseId, const std::string &source,
    const std::string &profile, TriArtifactSink &sink) const
{
    if (!db.hasTable("moz_annos") || !db.hasTable("moz_anno_attributes"))
        return;

    TriEvidenceDatabase::Statement stmt(db.handle(),
        "SELECT p.url, a.content, a.dateAdded FROM moz_places p "
        "JOIN moz_annos a ON p.id = a.place_id "
        "JOIN moz_anno_attributes aa ON a.anno_attribute_id = aa.id "
        "WHERE aa.name = 'downloads/destinationFileURI' ORDER BY a.dateAdded");
    while (stmt.step()) {
        sink.add(makeDownload(caseId, "firefox", stmt.getText(0), stmt.getText(1),
            TriUtilities::prTimeToUnix(stmt.getInt64(2)), source, profile));
    }
}

void TriBrowserExtractor::firefoxCookies(TriEvidenceDatabase &db, const std::string &caseId, const std::string &source,
    const std::string &profile, TriArtifactSink &sink) const
{
    TriEvidenceDatabase::Statement stmt(db.handle(),
        "SELECT host, name, path, creationTime, lastAccessed, expiry, isSecure FROM moz_cookies ORDER BY creationTime");
    while (stmt.step()) {
        TriArtifact artifact = makeCookie(caseId, "firefox", stmt.getText(0), stmt.getText(1), stmt.getText(2),
            TriUtilities::prTimeToUnix(stmt.getInt64(3)), source, profile);
        artifact.addAttribute("last_accessed", TriUtilities::prTimeToUnix(stmt.getInt64(4)));
        // expiry is already in seconds
        artifact.addAttribute("expiry", stmt.getInt64(5));
        artifact.addAttribute("secure", stmt.getInt64(6));
        sink.add(artifact);
    }
}

void TriBrowserExtractor::extractChromium(TriFilesystemWalker &walker, unsigned int volume, const std::string &userDataDir,
    const std::string &browser, const std::string &profileName, const std::string &caseId, TriArtifactSink &sink)
{
    std::vector<TriDirEntry> dirs = walker.listDirectory(volume, userDataDir);
    for (std::vector<TriDirEntry>::const_iterator it = dirs.begin(); it != dirs.end(); ++it) {
        if (!it->isDirectory)
            continue;
        if (!TriUtilities::iequals(it->name, "Default") && TriUtilities::toLower(it->name).find("profile ") != 0)
            continue;

        std::vector<uint8_t> data;
        std::string history = TriFilesystemWalker::joinPath(it->path, "History");
        if (readOptionalFile(walker, volume, history, data, sink)) {
            std::string source = sourcePath(volume, history);
            try {
                TriEvidenceDatabase db(data, source);
                chromiumHistory(db, browser, caseId, source, profileName, sink);
                chromiumDownloads(db, browser, caseId, source, profileName, sink);
            }
            catch (TriException &ex) {
                warn(sink, source, ex.message());
            }
        }

        // newer releases keep cookies under Network/
        const char * const cookieFiles[] = { "Network/Cookies", "Cookies" };
        for (size_t c = 0; c < 2; c++) {
            std::string cookies = TriFilesystemWalker::joinPath(it->path, cookieFiles[c]);
            if (!readOptionalFile(walker, volume, cookies, data, sink))
                continue;
            std::string source = sourcePath(volume, cookies);
            try {
                TriEvidenceDatabase db(data, source);
                chromiumCookies(db, browser, caseId, source, profileName, sink);
            }
            catch (TriException &ex) {
                warn(sink, source, ex.message());
            }
            break;
        }
    }
}

void TriBrowserExtractor::chromiumHistory(TriEvidenceDatabase &db, const std::string &browser, const std::string &caseId,
    const std::string &source, const std::string &profile, TriArtifactSink &sink) const
{
    // WebKit time: microseconds since 1601-01-01
    TriEvidenceDatabase::Statement stmt(db.handle(),
        "SELECT url, title, visit_count, last_visit_time, typed_count FROM urls ORDER BY last_visit_time");
    while (stmt.step()) {
        TriArtifact artifact = makeHistory(caseId, browser, stmt.getText(0), stmt.getText(1),
            TriUtilities::webkitTimeToUnix(stmt.getInt64(3)), stmt.getInt64(2), source, profile);
        artifact.addAttribute("typed_count", stmt.getInt64(4));
        sink.add(artifact);
    }
}

void TriBrowserExtractor::chromiumDownloads(TriEvidenceDatabase &db, const std::string &browser, const std::string &caseId,
    const std::string &source, const std::string &profile, TriArtifactSink &sink) const
{
    if (!db.hasTable("downloads"))
        return;

    std::string urlColumn = db.hasTable("downloads_url_chains")
        ? "(SELECT c.url FROM downloads_url_chains c WHERE c.id = d.id ORDER BY c.chain_index DESC LIMIT 1)"
        : "d.url";

    TriEvidenceDatabase::Statement stmt(db.handle(),
        "SELECT " + urlColumn + ", d.target_path, d.start_time, d.end_time, d.received_bytes, "
        "d.total_bytes, d.state, d.danger_type FROM downloads d ORDER BY d.start_time");
    while (stmt.step()) {
        TriArtifact artifact = makeDownload(caseId, browser, stmt.getText(0), stmt.getText(1),
            TriUtilities::webkitTimeToUnix(stmt.getInt64(2)), source, profile);
        artifact.addAttribute("end_time", TriUtilities::webkitTimeToUnix(stmt.getInt64(3)));
        artifact.addAttribute("received_bytes", stmt.getInt64(4));
        artifact.addAttribute("total_bytes", stmt.getInt64(5));
        artifact.addAttribute("state", stmt.getInt64(6));
        artifact.addAttribute("danger_type", stmt.getInt64(7));
        sink.add(artifact);
    }
}

void TriBrowserExtractor::chromiumCookies(TriEvidenceDatabase &db, const std::string &browser, const std::string &caseId,
    const std::string &source, const std::string &profile, TriArtifactSink &sink) const
{
    TriEvidenceDatabase::Statement stmt(db.handle(),
        "SELECT host_key, name, path, creation_utc, last_access_utc, expires_utc, is_secure FROM cookies "
        "ORDER BY creation_utc");
    while (stmt.step()) {
        TriArtifact artifact = makeCookie(caseId, browser, stmt.getText(0), stmt.getText(1), stmt.getText(2),
            TriUtilities::webkitTimeToUnix(stmt.getInt64(3)), source, profile);
        artifact.addAttribute("last_accessed", TriUtilities::webkitTimeToUnix(stmt.getInt64(4)));
        artifact.addAttribute("expiry", TriUtilities::webkitTimeToUnix(stmt.getInt64(5)));
        artifact.addAttribute("secure", stmt.getInt64(6));
        sink.add(artifact);
    }
}

void TriBrowserExtractor::extractInternetExplorer(TriFilesystemWalker &walker, unsigned int volume, const std::string &profile,
    const std::string &profileName, const std::string &caseId, TriArtifactSink &sink)
{
    for (size_t i = 0; i < sizeof(IE_INDEX_LOCATIONS) / sizeof(IE_INDEX_LOCATIONS[0]); i++) {
        std::string dir = TriFilesystemWalker::joinPath(profile, IE_INDEX_LOCATIONS[i]);

        std::vector<std::string> candidates;
        candidates.push_back(TriFilesystemWalker::joinPath(dir, "index.dat"));
        std::vector<TriDirEntry> entries = walker.listDirectory(volume, dir);
        for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
            if (it->isDirectory)
                candidates.push_back(TriFilesystemWalker::joinPath(it->path, "index.dat"));
        }

        for (std::vector<std::string>::const_iterator path = candidates.begin(); path != candidates.end(); ++path) {
            std::vector<uint8_t> data;
            if (readOptionalFile(walker, volume, *path, data, sink))
                parseIndexDat(data, caseId, sourcePath(volume, *path), profileName, sink);
        }
    }
}

void TriBrowserExtractor::parseIndexDat(const std::vector<uint8_t> &data, const std::string &caseId,
    const std::string &source, const std::string &profile, TriArtifactSink &sink) const
{
    const std::string signature = "Client UrlCache MMF";
    if (data.size() < signature.size() || std::string((const char *)&data[0], signature.size()) != signature) {
        warn(sink, source, "missing index.dat signature");
        return;
    }

    // records start on block boundaries
    size_t offset = IE_BLOCK_SIZE;
    while (offset + IE_BLOCK_SIZE <= data.size()) {
        if (std::string((const char *)&data[offset], 4) != "URL ") {
            offset += IE_BLOCK_SIZE;
            continue;
        }

        uint32_t blocks = TriUtilities::getU32LE(data, offset + 4);
        if (blocks == 0 || blocks > IE_MAX_RECORD_BLOCKS || offset + blocks * IE_BLOCK_SIZE > data.size()) {
            offset += IE_BLOCK_SIZE;
            continue;
        }
        size_t recordSize = blocks * IE_BLOCK_SIZE;

        int64_t lastModified = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, offset + 8));
        int64_t lastAccessed = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, offset + 16));
        uint32_t urlOffset = TriUtilities::getU32LE(data, offset + IE_URL_OFFSET_OFFSET);

        std::string url;
        if (urlOffset > 0 && urlOffset < recordSize)
            url = TriUtilities::asciiString(data, offset + urlOffset, recordSize - urlOffset);

        if (url.size() > 1) {
            TriArtifact artifact = makeHistory(caseId, "internet_explorer", url, "", lastAccessed, 0, source, profile);
            artifact.setSource(source, offset);
            artifact.addAttribute("last_modified", lastModified);
            sink.add(artifact);
        }
        offset += recordSize;
    }
}
