/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriUserActivityExtractor.cpp
 * UserAssist extraction.
 */

#include "TriUserActivityExtractor.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include <sstream>

namespace
{
    const char * const USERASSIST_KEY = "Software\\Microsoft\\Windows\\CurrentVersion\\Explorer\\UserAssist";

    // Windows 7 and later: 72 byte entries
    const size_t WIN7_ENTRY_SIZE = 72;
    const size_t WIN7_RUN_COUNT_OFFSET = 4;
    const size_t WIN7_FOCUS_COUNT_OFFSET = 8;
    const size_t WIN7_FOCUS_TIME_OFFSET = 12;
    const size_t WIN7_LAST_RUN_OFFSET = 60;

    // Windows XP: 16 byte entries, counts start at 5
    const size_t XP_ENTRY_SIZE = 16;
    const size_t XP_RUN_COUNT_OFFSET = 4;
    const size_t XP_LAST_RUN_OFFSET = 8;
    const uint32_t XP_RUN_COUNT_BASE = 5;
}

std::vector<TRI_ARTIFACT_TYPE> TriUserActivityExtractor::getArtifactTypes() const
{
    return std::vector<TRI_ARTIFACT_TYPE>(1, TRI_USER_ASSIST);
}

TriExtractor::Status TriUserActivityExtractor::extract(TriFilesystemWalker &walker, const std::string &caseId,
    TriArtifactSink &sink)
{
    std::vector<TriVolume> volumes = walker.listVolumes();
    for (std::vector<TriVolume>::const_iterator vol = volumes.begin(); vol != volumes.end(); ++vol) {
        std::vector<TriUserProfile> profiles = walker.listUserProfiles(vol->index);
        for (std::vector<TriUserProfile>::const_iterator profile = profiles.begin(); profile != profiles.end(); ++profile) {
            std::string ntuserPath = TriFilesystemWalker::joinPath(profile->path, "NTUSER.DAT");
            std::unique_ptr<TriRegistryHive> ntuser = loadHive(walker, vol->index, ntuserPath, sink);
            if (ntuser.get() == NULL)
                continue;
            try {
                extractUserAssist(*ntuser, profile->name, caseId, sourcePath(vol->index, ntuserPath), sink);
            }
            catch (TriCorruptStructureException &ex) {
                warn(sink, sourcePath(vol->index, ntuserPath), ex.message());
            }
        }
    }
    return OK;
}

void TriUserActivityExtractor::extractUserAssist(const TriRegistryHive &hive, const std::string &profile,
    const std::string &caseId, const std::string &source, TriArtifactSink &sink) const
{
    TriRegistryKey userAssist;
    if (!hive.findKey(USERASSIST_KEY, userAssist))
        return;

    TriRegistryKey::KeyList guids = userAssist.getSubkeyList();
    for (TriRegistryKey::KeyList::const_iterator guid = guids.begin(); guid != guids.end(); ++guid) {
        TriRegistryKey count;
        if (!guid->getSubkey("Count", count))
            continue;

        TriRegistryKey::ValueList values = count.getValueList();
        for (TriRegistryKey::ValueList::const_iterator value = values.begin(); value != values.end(); ++value) {
            const std::vector<uint8_t> &data = value->getData();
            if (data.size() < XP_ENTRY_SIZE)
                continue;

            std::string program = TriUtilities::rot13(value->getName());
            // session and version markers, not programs
            if (program.compare(0, 5, "UEME_") == 0 && program.find(':') == std::string::npos)
                continue;

            TriArtifact artifact(TRI_USER_ASSIST, caseId);
            artifact.setSource(source);

            int64_t lastRun;
            uint32_t runCount;
            if (data.size() >= WIN7_ENTRY_SIZE) {
                runCount = TriUtilities::getU32LE(data, WIN7_RUN_COUNT_OFFSET);
                lastRun = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, WIN7_LAST_RUN_OFFSET));
                artifact.addAttribute("focus_count", (int64_t)TriUtilities::getU32LE(data, WIN7_FOCUS_COUNT_OFFSET));
                artifact.addAttribute("focus_time_ms", (int64_t)TriUtilities::getU32LE(data, WIN7_FOCUS_TIME_OFFSET));
                artifact.addAttribute("format", std::string("win7"));
            }
            else {
                runCount = TriUtilities::getU32LE(data, XP_RUN_COUNT_OFFSET);
                if (runCount >= XP_RUN_COUNT_BASE)
                    runCount -= XP_RUN_COUNT_BASE;
                lastRun = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, XP_LAST_RUN_OFFSET));
                artifact.addAttribute("format", std::string("xp"));
            }
            artifact.setTimestamp(lastRun);

            std::vector<std::string> key;
            key.push_back(program);
            key.push_back(profile);
            artifact.setNaturalKey(TriArtifact::makeKey(key));

            std::stringstream description;
            description << program << " run " << runCount << " time(s) by " << profile;
            artifact.setDescription(description.str());

            artifact.addAttribute("program", program);
            artifact.addAttribute("profile", profile);
            artifact.addAttribute("run_count", (int64_t)runCount);
            artifact.addAttribute("guid", guid->getName());
            sink.add(artifact);
        }
    }
}
