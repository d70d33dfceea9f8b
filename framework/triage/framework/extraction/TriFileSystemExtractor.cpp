/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriFileSystemExtractor.cpp
 * Prefetch, shell link and jump list extraction.
 */

#include "TriFileSystemExtractor.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "Poco/NumberFormatter.h"

#include <cstring>
#include <sstream>

namespace
{
    // Prefetch header
    const char SCCA_SIGNATURE[] = "SCCA";
    const char MAM_SIGNATURE[] = "MAM";
    const size_t PF_SIGNATURE_OFFSET = 4;
    const size_t PF_EXE_NAME_OFFSET = 0x10;
    const size_t PF_EXE_NAME_SIZE = 60;
    const size_t PF_HASH_OFFSET = 0x4C;
    const size_t PF_LAST_RUN_V17 = 0x78;
    const size_t PF_RUN_COUNT_V17 = 0x90;
    const size_t PF_LAST_RUN_V23 = 0x80;
    const size_t PF_RUN_COUNT_V23 = 0x98;
    const size_t PF_RUN_COUNT_V26 = 0xD0;
    const size_t PF_RUN_TIMES_V26 = 8;

    // Shell link header
    const size_t LNK_HEADER_SIZE = 0x4C;
    const uint8_t LNK_CLSID[16] = {
        0x01, 0x14, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46
    };
    const size_t LNK_FLAGS_OFFSET = 0x14;
    const size_t LNK_ATTRIBUTES_OFFSET = 0x18;
    const size_t LNK_CREATED_OFFSET = 0x1C;
    const size_t LNK_ACCESSED_OFFSET = 0x24;
    const size_t LNK_WRITTEN_OFFSET = 0x2C;
    const size_t LNK_SIZE_OFFSET = 0x34;

    const uint32_t HAS_ID_LIST = 0x01;
    const uint32_t HAS_LINK_INFO = 0x02;
    const uint32_t HAS_NAME = 0x04;
    const uint32_t HAS_RELATIVE_PATH = 0x08;
    const uint32_t HAS_WORKING_DIR = 0x10;
    const uint32_t HAS_ARGUMENTS = 0x20;
    const uint32_t HAS_ICON_LOCATION = 0x40;
    const uint32_t IS_UNICODE = 0x80;

    const uint32_t LINKINFO_LOCAL_PATH = 0x01;
    const uint32_t LINKINFO_NETWORK_PATH = 0x02;

    const char * const RECENT_FOLDERS[] = {
        "AppData/Roaming/Microsoft/Windows/Recent",
        "Recent"
    };

    struct KnownAppId
    {
        const char *appId;
        const char *application;
    };

    const KnownAppId KNOWN_APP_IDS[] = {
        { "1b4dd67f29cb1962", "Windows Explorer" },
        { "5f7b5f1e01b83767", "Windows Explorer Quick Access" },
        { "5d696d521de238c3", "Google Chrome" },
        { "9b9cdc69c1c24e2b", "Notepad (64-bit)" }
    };

    std::string knownApplication(const std::string &appId)
    {
        for (size_t i = 0; i < sizeof(KNOWN_APP_IDS) / sizeof(KNOWN_APP_IDS[0]); i++) {
            if (TriUtilities::iequals(appId, KNOWN_APP_IDS[i].appId))
                return KNOWN_APP_IDS[i].application;
        }
        return std::string();
    }

    /**
     * A counted StringData entry of a shell link.  Advances pos.
     * @throws TriCorruptStructureException if the string runs past the end.
     */
    std::string readLinkString(const std::vector<uint8_t> &data, size_t &pos, bool unicode)
    {
        uint16_t chars = TriUtilities::getU16LE(data, pos);
        pos += 2;
        size_t bytes = unicode ? (size_t)chars * 2 : chars;
        if (pos + bytes > data.size())
            throw TriCorruptStructureException("shell link string runs past the end of the file");
        std::string str = unicode ? TriUtilities::utf16leToUTF8(data, pos, bytes, false)
            : TriUtilities::asciiString(data, pos, bytes);
        pos += bytes;
        return str;
    }

    std::string linkInfoString(const std::vector<uint8_t> &data, size_t linkInfo, size_t linkInfoSize,
        size_t fieldOffset)
    {
        uint32_t offset = TriUtilities::getU32LE(data, linkInfo + fieldOffset);
        if (offset == 0 || offset >= linkInfoSize)
            return std::string();
        return TriUtilities::asciiString(data, linkInfo + offset, linkInfoSize - offset);
    }
}

std::vector<TRI_ARTIFACT_TYPE> TriFileSystemExtractor::getArtifactTypes() const
{
    std::vector<TRI_ARTIFACT_TYPE> types;
    types.push_back(TRI_PREFETCH);
    types.push_back(TRI_SHORTCUT);
    types.push_back(TRI_JUMP_LIST);
    return types;
}

std::string TriFileSystemExtractor::makeKey(TRI_ARTIFACT_TYPE type, const std::string &target, int64_t referenced)
{
    std::vector<std::string> key;
    key.push_back(TriArtifactTypes::getName(type));
    key.push_back(TriUtilities::toLower(target));
    key.push_back(Poco::NumberFormatter::format(referenced));
    return TriArtifact::makeKey(key);
}

TriExtractor::Status TriFileSystemExtractor::extract(TriFilesystemWalker &walker, const std::string &caseId,
    TriArtifactSink &sink)
{
    std::vector<TriVolume> volumes = walker.listVolumes();
    for (std::vector<TriVolume>::const_iterator vol = volumes.begin(); vol != volumes.end(); ++vol) {
        prefetchFiles(walker, vol->index, caseId, sink);

        std::vector<TriUserProfile> profiles = walker.listUserProfiles(vol->index);
        for (std::vector<TriUserProfile>::const_iterator profile = profiles.begin(); profile != profiles.end(); ++profile) {
            for (size_t i = 0; i < sizeof(RECENT_FOLDERS) / sizeof(RECENT_FOLDERS[0]); i++) {
                recentFolder(walker, vol->index, TriFilesystemWalker::joinPath(profile->path, RECENT_FOLDERS[i]),
                    profile->name, caseId, sink);
            }
        }
    }
    return OK;
}

void TriFileSystemExtractor::prefetchFiles(TriFilesystemWalker &walker, unsigned int volume,
    const std::string &caseId, TriArtifactSink &sink) const
{
    std::vector<std::string> roots = systemRoots(walker, volume);
    for (std::vector<std::string>::const_iterator root = roots.begin(); root != roots.end(); ++root) {
        std::vector<TriDirEntry> entries = walker.listDirectory(volume, *root + "/Prefetch");
        for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
            if (it->isDirectory || !TriUtilities::endsWithNoCase(it->name, ".pf"))
                continue;

            std::vector<uint8_t> data;
            if (!readOptionalFile(walker, volume, it->path, data, sink))
                continue;
            try {
                parsePrefetch(data, *it, caseId, sourcePath(volume, it->path), sink);
            }
            catch (TriCorruptStructureException &ex) {
                warn(sink, sourcePath(volume, it->path), ex.message());
            }
        }
    }
}

void TriFileSystemExtractor::recentFolder(TriFilesystemWalker &walker, unsigned int volume,
    const std::string &recent, const std::string &profile, const std::string &caseId, TriArtifactSink &sink) const
{
    std::vector<TriDirEntry> entries = walker.listDirectory(volume, recent);
    for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
        if (it->isDirectory) {
            if (TriUtilities::iequals(it->name, "AutomaticDestinations")
                || TriUtilities::iequals(it->name, "CustomDestinations")) {
                std::vector<TriDirEntry> lists = walker.listDirectory(volume, it->path);
                for (std::vector<TriDirEntry>::const_iterator jl = lists.begin(); jl != lists.end(); ++jl) {
                    if (!jl->isDirectory && (TriUtilities::endsWithNoCase(jl->name, ".automaticDestinations-ms")
                        || TriUtilities::endsWithNoCase(jl->name, ".customDestinations-ms"))) {
                        inventoryJumpList(*jl, profile, caseId, sourcePath(volume, jl->path), sink);
                    }
                }
            }
            continue;
        }

        if (!TriUtilities::endsWithNoCase(it->name, ".lnk"))
            continue;

        std::vector<uint8_t> data;
        if (!readOptionalFile(walker, volume, it->path, data, sink))
            continue;
        try {
            parseShortcut(data, *it, profile, caseId, sourcePath(volume, it->path), sink);
        }
        catch (TriCorruptStructureException &ex) {
            warn(sink, sourcePath(volume, it->path), ex.message());
        }
    }
}

void TriFileSystemExtractor::parsePrefetch(const std::vector<uint8_t> &data, const TriDirEntry &entry,
    const std::string &caseId, const std::string &source, TriArtifactSink &sink) const
{
    TriArtifact artifact(TRI_PREFETCH, caseId);
    artifact.setSource(source);
    artifact.addAttribute("prefetch_file", entry.name);

    std::string hash;
    std::string::size_type dash = entry.name.rfind('-');
    std::string::size_type dot = entry.name.rfind('.');
    if (dash != std::string::npos && dot != std::string::npos && dot > dash)
        hash = entry.name.substr(dash + 1, dot - dash - 1);

    if (data.size() >= 4 && memcmp(&data[0], MAM_SIGNATURE, 3) == 0) {
        // Windows 10 compressed prefetch, only the file itself can be described
        std::string executable = dash != std::string::npos ? entry.name.substr(0, dash) : entry.name;
        artifact.setTimestamp(entry.mtime);
        artifact.setNaturalKey(makeKey(TRI_PREFETCH, executable, entry.mtime));
        artifact.setDescription("Prefetch (compressed) for " + executable);
        artifact.addAttribute("executable", executable);
        artifact.addAttribute("prefetch_hash", hash);
        artifact.addAttribute("compressed", (int64_t)1);
        sink.add(artifact);
        return;
    }

    if (data.size() < PF_EXE_NAME_OFFSET + PF_EXE_NAME_SIZE
        || memcmp(&data[PF_SIGNATURE_OFFSET], SCCA_SIGNATURE, 4) != 0) {
        throw TriCorruptStructureException("missing SCCA signature");
    }

    uint32_t version = TriUtilities::getU32LE(data, 0);
    std::string executable = TriUtilities::utf16leToUTF8(data, PF_EXE_NAME_OFFSET, PF_EXE_NAME_SIZE);
    if (hash.empty())
        hash = Poco::NumberFormatter::formatHex(TriUtilities::getU32LE(data, PF_HASH_OFFSET), 8);

    std::vector<int64_t> runTimes;
    uint32_t runCount;
    switch (version) {
    case 17:
        runTimes.push_back(TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, PF_LAST_RUN_V17)));
        runCount = TriUtilities::getU32LE(data, PF_RUN_COUNT_V17);
        break;
    case 23:
        runTimes.push_back(TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, PF_LAST_RUN_V23)));
        runCount = TriUtilities::getU32LE(data, PF_RUN_COUNT_V23);
        break;
    case 26:
    case 30:
        for (size_t i = 0; i < PF_RUN_TIMES_V26; i++) {
            int64_t t = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, PF_LAST_RUN_V23 + i * 8));
            if (t > 0)
                runTimes.push_back(t);
        }
        runCount = TriUtilities::getU32LE(data, PF_RUN_COUNT_V26);
        break;
    default:
        throw TriCorruptStructureException("unsupported prefetch version " + Poco::NumberFormatter::format(version));
    }

    int64_t lastRun = runTimes.empty() ? 0 : runTimes[0];
    artifact.setTimestamp(lastRun > 0 ? lastRun : entry.mtime);
    artifact.setNaturalKey(makeKey(TRI_PREFETCH, executable, artifact.getTimestamp()));

    std::stringstream description;
    description << executable << " executed " << runCount << " time(s)";
    artifact.setDescription(description.str());

    artifact.addAttribute("executable", executable);
    artifact.addAttribute("prefetch_hash", hash);
    artifact.addAttribute("version", (int64_t)version);
    artifact.addAttribute("run_count", (int64_t)runCount);

    if (runTimes.size() > 1) {
        std::string previous;
        for (size_t i = 1; i < runTimes.size(); i++) {
            if (i > 1)
                previous += "; ";
            previous += TriUtilities::formatTime(runTimes[i]);
        }
        artifact.addAttribute("previous_runs", previous);
    }
    sink.add(artifact);
}

void TriFileSystemExtractor::parseShortcut(const std::vector<uint8_t> &data, const TriDirEntry &entry,
    const std::string &profile, const std::string &caseId, const std::string &source, TriArtifactSink &sink) const
{
    if (data.size() < LNK_HEADER_SIZE || TriUtilities::getU32LE(data, 0) != LNK_HEADER_SIZE
        || memcmp(&data[4], LNK_CLSID, sizeof(LNK_CLSID)) != 0) {
        throw TriCorruptStructureException("not a shell link file");
    }

    uint32_t flags = TriUtilities::getU32LE(data, LNK_FLAGS_OFFSET);
    int64_t created = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, LNK_CREATED_OFFSET));
    int64_t accessed = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, LNK_ACCESSED_OFFSET));
    int64_t written = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, LNK_WRITTEN_OFFSET));

    size_t pos = LNK_HEADER_SIZE;
    if (flags & HAS_ID_LIST)
        pos += 2 + TriUtilities::getU16LE(data, pos);

    std::string localPath;
    std::string networkPath;
    if (flags & HAS_LINK_INFO) {
        uint32_t linkInfoSize = TriUtilities::getU32LE(data, pos);
        if (linkInfoSize < 0x1C || pos + linkInfoSize > data.size())
            throw TriCorruptStructureException("damaged LinkInfo structure");
        uint32_t linkInfoFlags = TriUtilities::getU32LE(data, pos + 8);
        if (linkInfoFlags & LINKINFO_LOCAL_PATH) {
            localPath = linkInfoString(data, pos, linkInfoSize, 16);
            localPath += linkInfoString(data, pos, linkInfoSize, 24);
        }
        if (linkInfoFlags & LINKINFO_NETWORK_PATH) {
            uint32_t network = TriUtilities::getU32LE(data, pos + 20);
            // the share name follows the 20 byte CommonNetworkRelativeLink header
            if (network != 0 && network + 20 < linkInfoSize) {
                uint32_t netNameOffset = TriUtilities::getU32LE(data, pos + network + 8);
                if (netNameOffset != 0 && network + netNameOffset < linkInfoSize) {
                    networkPath = TriUtilities::asciiString(data, pos + network + netNameOffset,
                        linkInfoSize - network - netNameOffset);
                    std::string suffix = linkInfoString(data, pos, linkInfoSize, 24);
                    if (!suffix.empty())
                        networkPath += "\\" + suffix;
                }
            }
        }
        pos += linkInfoSize;
    }

    bool unicode = (flags & IS_UNICODE) != 0;
    std::string name, relativePath, workingDir, arguments, iconLocation;
    if (flags & HAS_NAME)
        name = readLinkString(data, pos, unicode);
    if (flags & HAS_RELATIVE_PATH)
        relativePath = readLinkString(data, pos, unicode);
    if (flags & HAS_WORKING_DIR)
        workingDir = readLinkString(data, pos, unicode);
    if (flags & HAS_ARGUMENTS)
        arguments = readLinkString(data, pos, unicode);
    if (flags & HAS_ICON_LOCATION)
        iconLocation = readLinkString(data, pos, unicode);

    std::string target = localPath;
    if (target.empty())
        target = networkPath;
    if (target.empty())
        target = relativePath;
    if (target.empty())
        target = entry.name.substr(0, entry.name.size() - 4);

    int64_t referenced = written > 0 ? written : entry.mtime;

    TriArtifact artifact(TRI_SHORTCUT, caseId);
    artifact.setSource(source);
    artifact.setTimestamp(referenced);
    artifact.setNaturalKey(makeKey(TRI_SHORTCUT, target, referenced));
    artifact.setDescription("Shortcut to " + target + " opened by " + profile);

    artifact.addAttribute("target_path", target);
    artifact.addAttribute("link_file", entry.name);
    artifact.addAttribute("profile", profile);
    artifact.addAttribute("target_size", (int64_t)TriUtilities::getU32LE(data, LNK_SIZE_OFFSET));
    artifact.addAttribute("target_attributes", (int64_t)TriUtilities::getU32LE(data, LNK_ATTRIBUTES_OFFSET));
    artifact.addAttribute("target_created", created);
    artifact.addAttribute("target_accessed", accessed);
    artifact.addAttribute("target_modified", written);
    artifact.addAttribute("link_created", entry.crtime);
    artifact.addAttribute("link_modified", entry.mtime);
    if (!networkPath.empty())
        artifact.addAttribute("network_path", networkPath);
    if (!name.empty())
        artifact.addAttribute("name", name);
    if (!relativePath.empty())
        artifact.addAttribute("relative_path", relativePath);
    if (!workingDir.empty())
        artifact.addAttribute("working_directory", workingDir);
    if (!arguments.empty())
        artifact.addAttribute("arguments", arguments);
    if (!iconLocation.empty())
        artifact.addAttribute("icon_location", iconLocation);
    sink.add(artifact);
}

void TriFileSystemExtractor::inventoryJumpList(const TriDirEntry &entry, const std::string &profile,
    const std::string &caseId, const std::string &source, TriArtifactSink &sink) const
{
    std::string appId = entry.name.substr(0, entry.name.find('.'));
    bool automatic = TriUtilities::endsWithNoCase(entry.name, ".automaticDestinations-ms");

    TriArtifact artifact(TRI_JUMP_LIST, caseId);
    artifact.setSource(source);
    artifact.setTimestamp(entry.mtime);
    artifact.setNaturalKey(makeKey(TRI_JUMP_LIST, entry.path, entry.mtime));

    std::string application = knownApplication(appId);
    std::stringstream description;
    description << "Jump list of " << (application.empty() ? "AppID " + appId : application) << " for " << profile;
    artifact.setDescription(description.str());

    artifact.addAttribute("app_id", appId);
    if (!application.empty())
        artifact.addAttribute("application", application);
    artifact.addAttribute("kind", std::string(automatic ? "automatic" : "custom"));
    artifact.addAttribute("profile", profile);
    artifact.addAttribute("file_size", (int64_t)entry.size);
    artifact.addAttribute("created", entry.crtime);
    sink.add(artifact);
}
