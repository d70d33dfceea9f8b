/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriEventLogExtractor.cpp
 * Windows event log extraction.
 */

#include "TriEventLogExtractor.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "Poco/NumberFormatter.h"

#include <cstring>
#include <sstream>

namespace
{
    const char EVT_SIGNATURE[] = "LfLe";
    const size_t EVT_HEADER_SIZE = 0x30;
    const size_t EVT_RECORD_MIN_SIZE = 0x38;
    const size_t EVT_MAX_STRINGS = 64;

    const char EVTX_SIGNATURE[] = "ElfFile";

    struct EventName
    {
        uint32_t id;
        const char *description;
    };

    const EventName EVENT_NAMES[] = {
        { 517, "The audit log was cleared" },
        { 528, "Successful Logon" },
        { 529, "Logon Failure - Unknown user name or bad password" },
        { 530, "Logon Failure - Account logon time restriction violation" },
        { 531, "Logon Failure - Account currently disabled" },
        { 532, "Logon Failure - The specified user account has expired" },
        { 533, "Logon Failure - User not allowed to logon at this computer" },
        { 534, "Logon Failure - The user has not been granted the requested logon type" },
        { 535, "Logon Failure - The specified account's password has expired" },
        { 536, "Logon Failure - The NetLogon service is not active" },
        { 537, "Logon Failure - Unknown reason" },
        { 538, "User Logoff" },
        { 539, "Logon Failure - Account locked out" },
        { 540, "Successful Network Logon" },
        { 1074, "System shutdown initiated by user" },
        { 1076, "System shutdown reason" },
        { 1102, "The audit log was cleared" },
        { 4624, "An account was successfully logged on" },
        { 4625, "An account failed to log on" },
        { 4634, "An account was logged off" },
        { 4647, "User initiated logoff" },
        { 4648, "A logon was attempted using explicit credentials" },
        { 6005, "The Event log service was started" },
        { 6006, "The Event log service was stopped" },
        { 6008, "Unexpected system shutdown" },
        { 6009, "System startup" },
        { 6013, "System uptime" },
        { 7034, "Service crashed unexpectedly" },
        { 7035, "Service sent a control" },
        { 7036, "Service started or stopped" },
        { 7040, "Service start type changed" }
    };

    /// UTF-16LE string ending at a null code unit; advances pos past the terminator.
    std::string readUtf16z(const std::vector<uint8_t> &data, size_t &pos, size_t end)
    {
        size_t start = pos;
        while (pos + 1 < end && (data[pos] != 0 || data[pos + 1] != 0))
            pos += 2;
        std::string str = pos > start ? TriUtilities::utf16leToUTF8(&data[start], pos - start, false) : "";
        pos += 2;
        return str;
    }
}

std::vector<TRI_ARTIFACT_TYPE> TriEventLogExtractor::getArtifactTypes() const
{
    return std::vector<TRI_ARTIFACT_TYPE>(1, TRI_EVENT_LOG);
}

std::string TriEventLogExtractor::eventTypeName(uint16_t type)
{
    switch (type) {
    case 0:
    case 4:
        return "Information";
    case 1:
        return "Error";
    case 2:
        return "Warning";
    case 8:
        return "Success Audit";
    case 16:
        return "Failure Audit";
    default:
        return "Unknown(" + Poco::NumberFormatter::format((unsigned)type) + ")";
    }
}

std::string TriEventLogExtractor::eventCategory(uint32_t eventId)
{
    switch (eventId) {
    case 528:
    case 540:
    case 4624:
    case 4648:
        return "logon";
    case 538:
    case 4634:
    case 4647:
        return "logoff";
    case 529:
    case 530:
    case 531:
    case 532:
    case 533:
    case 534:
    case 535:
    case 536:
    case 537:
    case 539:
    case 4625:
        return "failed_logon";
    case 517:
    case 1102:
        return "log_cleared";
    case 1074:
    case 1076:
    case 6005:
    case 6006:
    case 6008:
    case 6009:
    case 6013:
    case 7034:
    case 7035:
    case 7036:
    case 7040:
        return "system";
    default:
        return "other";
    }
}

std::string TriEventLogExtractor::eventDescription(uint32_t eventId)
{
    for (size_t i = 0; i < sizeof(EVENT_NAMES) / sizeof(EVENT_NAMES[0]); i++) {
        if (EVENT_NAMES[i].id == eventId)
            return EVENT_NAMES[i].description;
    }
    return std::string();
}

TriExtractor::Status TriEventLogExtractor::extract(TriFilesystemWalker &walker, const std::string &caseId,
    TriArtifactSink &sink)
{
    std::vector<TriVolume> volumes = walker.listVolumes();

    for (std::vector<TriVolume>::const_iterator vol = volumes.begin(); vol != volumes.end(); ++vol) {
        std::vector<std::string> roots = systemRoots(walker, vol->index);
        for (std::vector<std::string>::const_iterator root = roots.begin(); root != roots.end(); ++root) {
            std::vector<std::string> dirs;
            dirs.push_back(*root + "/System32/config");
            dirs.push_back(*root + "/System32/winevt/Logs");

            for (std::vector<std::string>::const_iterator dir = dirs.begin(); dir != dirs.end(); ++dir) {
                std::vector<TriDirEntry> entries = walker.listDirectory(vol->index, *dir);
                for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
                    if (it->isDirectory)
                        continue;

                    bool evt = TriUtilities::endsWithNoCase(it->name, ".evt");
                    bool evtx = TriUtilities::endsWithNoCase(it->name, ".evtx");
                    if (!evt && !evtx)
                        continue;

                    std::vector<uint8_t> data;
                    if (!readOptionalFile(walker, vol->index, it->path, data, sink))
                        continue;
                    std::string source = sourcePath(vol->index, it->path);

                    if (evtx) {
                        inventoryEvtx(*it, data, caseId, source, sink);
                        continue;
                    }

                    try {
                        unsigned int skipped = parseEvt(data, caseId, source, it->name, sink);
                        if (skipped) {
                            std::stringstream msg;
                            msg << skipped << " damaged record(s) skipped";
                            warn(sink, source, msg.str());
                        }
                    }
                    catch (TriCorruptStructureException &ex) {
                        warn(sink, source, ex.message());
                    }
                }
            }
        }
    }
    return OK;
}

unsigned int TriEventLogExtractor::parseEvt(const std::vector<uint8_t> &data, const std::string &caseId,
    const std::string &source, const std::string &logName, TriArtifactSink &sink) const
{
    if (data.size() < EVT_HEADER_SIZE || memcmp(&data[4], EVT_SIGNATURE, 4) != 0) {
        throw TriCorruptStructureException("missing LfLe header signature");
    }

    unsigned int skipped = 0;

    // the log is circular; records are found by their signature at 4 byte alignment
    size_t offset = EVT_HEADER_SIZE;
    while (offset + EVT_RECORD_MIN_SIZE <= data.size()) {
        if (memcmp(&data[offset + 4], EVT_SIGNATURE, 4) != 0) {
            offset += 4;
            continue;
        }

        uint32_t length = TriUtilities::getU32LE(data, offset);
        if (length < EVT_RECORD_MIN_SIZE || offset + length > data.size()
            || TriUtilities::getU32LE(data, offset + length - 4) != length) {
            skipped++;
            offset += 4;
            continue;
        }

        if (!parseEvtRecord(data, offset, length, caseId, source, logName, sink))
            skipped++;
        offset += (length + 3) & ~3u;
    }
    return skipped;
}

bool TriEventLogExtractor::parseEvtRecord(const std::vector<uint8_t> &data, size_t offset, uint32_t length,
    const std::string &caseId, const std::string &source, const std::string &logName, TriArtifactSink &sink) const
{
    size_t end = offset + length;

    uint32_t recordNumber = TriUtilities::getU32LE(data, offset + 8);
    int64_t generated = TriUtilities::getU32LE(data, offset + 12);
    int64_t written = TriUtilities::getU32LE(data, offset + 16);
    // the upper bits carry severity and facility
    uint32_t eventId = TriUtilities::getU32LE(data, offset + 20) & 0xFFFF;
    uint16_t eventType = TriUtilities::getU16LE(data, offset + 24);
    uint16_t numStrings = TriUtilities::getU16LE(data, offset + 26);
    uint16_t category = TriUtilities::getU16LE(data, offset + 28);
    uint32_t stringOffset = TriUtilities::getU32LE(data, offset + 36);

    size_t pos = offset + EVT_RECORD_MIN_SIZE;
    std::string sourceName = readUtf16z(data, pos, end);
    std::string computer = readUtf16z(data, pos, end);

    std::vector<std::string> strings;
    if (numStrings > 0) {
        if (stringOffset < EVT_RECORD_MIN_SIZE || stringOffset >= length)
            return false;
        size_t spos = offset + stringOffset;
        for (uint16_t i = 0; i < numStrings && i < EVT_MAX_STRINGS && spos < end; i++)
            strings.push_back(readUtf16z(data, spos, end));
    }

    int64_t timestamp = generated > 0 ? generated : written;

    TriArtifact artifact(TRI_EVENT_LOG, caseId);
    artifact.setSource(source, offset);
    artifact.setTimestamp(timestamp);

    std::vector<std::string> key;
    key.push_back(Poco::NumberFormatter::format(eventId));
    key.push_back(Poco::NumberFormatter::format(timestamp));
    key.push_back(sourceName);
    artifact.setNaturalKey(TriArtifact::makeKey(key));

    std::string known = eventDescription(eventId);
    std::stringstream description;
    description << "Event " << eventId << " from " << sourceName;
    if (!known.empty())
        description << ": " << known;
    artifact.setDescription(description.str());

    std::string eventCat = eventCategory(eventId);
    artifact.addAttribute("event_id", (int64_t)eventId);
    artifact.addAttribute("event_type", eventTypeName(eventType));
    artifact.addAttribute("event_category", (int64_t)category);
    artifact.addAttribute("category", eventCat);
    artifact.addAttribute("record_number", (int64_t)recordNumber);
    artifact.addAttribute("time_written", written);
    artifact.addAttribute("source_name", sourceName);
    artifact.addAttribute("computer_name", computer);
    artifact.addAttribute("log_name", logName);

    if ((eventCat == "logon" || eventCat == "failed_logon" || eventCat == "logoff") && strings.size() >= 2) {
        artifact.addAttribute("user_name", strings[0]);
        artifact.addAttribute("domain", strings[1]);
    }
    else if (eventId >= 7034 && eventId <= 7040 && !strings.empty()) {
        artifact.addAttribute("service_name", strings[0]);
        if (eventId == 7036 && strings.size() > 1)
            artifact.addAttribute("service_state", strings[1]);
    }

    std::string joined;
    for (size_t i = 0; i < strings.size(); i++) {
        if (i)
            joined += "; ";
        joined += strings[i];
    }
    if (!joined.empty())
        artifact.addAttribute("strings", joined);

    sink.add(artifact);
    return true;
}

void TriEventLogExtractor::inventoryEvtx(const TriDirEntry &entry, const std::vector<uint8_t> &header,
    const std::string &caseId, const std::string &source, TriArtifactSink &sink) const
{
    TriArtifact artifact(TRI_EVENT_LOG, caseId);
    artifact.setSource(source);
    artifact.setTimestamp(entry.mtime);

    std::vector<std::string> key;
    key.push_back("evtx");
    key.push_back(entry.path);
    artifact.setNaturalKey(TriArtifact::makeKey(key));

    artifact.setDescription("Event log file " + entry.name + " (records not decoded)");
    artifact.addAttribute("category", std::string("log_file"));
    artifact.addAttribute("log_name", entry.name);
    artifact.addAttribute("file_size", (int64_t)entry.size);

    bool valid = header.size() >= 0x2C && memcmp(&header[0], EVTX_SIGNATURE, sizeof(EVTX_SIGNATURE)) == 0;
    artifact.addAttribute("valid_header", (int64_t)(valid ? 1 : 0));
    if (valid) {
        artifact.addAttribute("next_record_id", (int64_t)TriUtilities::getU64LE(header, 0x18));
        artifact.addAttribute("chunk_count", (int64_t)TriUtilities::getU16LE(header, 0x2A));
    }
    else {
        warn(sink, source, "missing ElfFile header signature");
    }

    sink.add(artifact);
}
