/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRecycleBinExtractor.cpp
 * Recycle bin and deleted file extraction.
 */

#include "TriRecycleBinExtractor.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "Poco/NumberFormatter.h"

#include <map>
#include <sstream>

namespace
{
    const char * const RECYCLER_DIRS[] = { "/RECYCLER", "/RECYCLED" };
    const char * const RECYCLE_BIN_DIR = "/$Recycle.Bin";

    // INFO2 layout
    const size_t INFO2_HEADER_SIZE = 20;
    const size_t INFO2_RECORD_SIZE_OFFSET = 12;
    const size_t INFO2_DEFAULT_RECORD_SIZE = 800;
    const size_t INFO2_ANSI_NAME_SIZE = 260;
    const size_t INFO2_RECORD_NUMBER_OFFSET = 260;
    const size_t INFO2_DRIVE_OFFSET = 264;
    const size_t INFO2_DELETION_TIME_OFFSET = 268;
    const size_t INFO2_SIZE_OFFSET = 276;
    const size_t INFO2_UNICODE_NAME_OFFSET = 280;

    // $I layout
    const size_t DOLLAR_I_SIZE_OFFSET = 8;
    const size_t DOLLAR_I_TIME_OFFSET = 16;
    const size_t DOLLAR_I_V1_NAME_OFFSET = 24;
    const size_t DOLLAR_I_V1_NAME_BYTES = 520;
    const size_t DOLLAR_I_V2_LENGTH_OFFSET = 24;
    const size_t DOLLAR_I_V2_NAME_OFFSET = 28;

    TriArtifact makeDeleted(const std::string &caseId, const std::string &originalPath, int64_t deleted,
        uint64_t size, const std::string &origin, const std::string &source, uint64_t offset)
    {
        TriArtifact artifact(TRI_DELETED_FILE, caseId);
        artifact.setSource(source, offset);
        artifact.setTimestamp(deleted);

        std::vector<std::string> key;
        key.push_back(originalPath);
        key.push_back(Poco::NumberFormatter::format(deleted));
        artifact.setNaturalKey(TriArtifact::makeKey(key));

        artifact.setDescription("Deleted " + originalPath);
        artifact.addAttribute("original_path", originalPath);
        artifact.addAttribute("file_size", (int64_t)size);
        artifact.addAttribute("origin", origin);
        return artifact;
    }
}

std::vector<TRI_ARTIFACT_TYPE> TriRecycleBinExtractor::getArtifactTypes() const
{
    return std::vector<TRI_ARTIFACT_TYPE>(1, TRI_DELETED_FILE);
}

TriExtractor::Status TriRecycleBinExtractor::extract(TriFilesystemWalker &walker, const std::string &caseId,
    TriArtifactSink &sink)
{
    std::vector<TriVolume> volumes = walker.listVolumes();
    for (std::vector<TriVolume>::const_iterator vol = volumes.begin(); vol != volumes.end(); ++vol) {
        for (size_t i = 0; i < sizeof(RECYCLER_DIRS) / sizeof(RECYCLER_DIRS[0]); i++)
            extractRecycler(walker, vol->index, RECYCLER_DIRS[i], caseId, sink);
        extractRecycleBin(walker, vol->index, RECYCLE_BIN_DIR, caseId, sink);
        extractUnlinked(walker, vol->index, caseId, sink);
    }
    return OK;
}

void TriRecycleBinExtractor::extractRecycler(TriFilesystemWalker &walker, unsigned int volume, const std::string &dir,
    const std::string &caseId, TriArtifactSink &sink)
{
    // INFO2 lives in a per user SID directory, or directly in RECYCLED on FAT
    std::vector<std::string> candidates;
    candidates.push_back(TriFilesystemWalker::joinPath(dir, "INFO2"));
    std::vector<TriDirEntry> entries = walker.listDirectory(volume, dir);
    for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
        if (it->isDirectory)
            candidates.push_back(TriFilesystemWalker::joinPath(it->path, "INFO2"));
    }

    for (std::vector<std::string>::const_iterator path = candidates.begin(); path != candidates.end(); ++path) {
        std::vector<uint8_t> data;
        if (!readOptionalFile(walker, volume, *path, data, sink))
            continue;
        try {
            parseInfo2(data, caseId, sourcePath(volume, *path), sink);
        }
        catch (TriCorruptStructureException &ex) {
            warn(sink, sourcePath(volume, *path), ex.message());
        }
    }
}

void TriRecycleBinExtractor::parseInfo2(const std::vector<uint8_t> &data, const std::string &caseId,
    const std::string &source, TriArtifactSink &sink) const
{
    if (data.size() < INFO2_HEADER_SIZE) {
        throw TriCorruptStructureException("INFO2 header is truncated");
    }

    size_t recordSize = TriUtilities::getU32LE(data, INFO2_RECORD_SIZE_OFFSET);
    if (recordSize == 0)
        recordSize = INFO2_DEFAULT_RECORD_SIZE;
    if (recordSize < INFO2_UNICODE_NAME_OFFSET) {
        std::stringstream msg;
        msg << "INFO2 record size " << recordSize << " is too small";
        throw TriCorruptStructureException(msg.str());
    }

    for (size_t offset = INFO2_HEADER_SIZE; offset + recordSize <= data.size(); offset += recordSize) {
        std::string name;
        if (recordSize >= INFO2_UNICODE_NAME_OFFSET + 2)
            name = TriUtilities::utf16leToUTF8(data, offset + INFO2_UNICODE_NAME_OFFSET,
                recordSize - INFO2_UNICODE_NAME_OFFSET);
        if (name.empty())
            name = TriUtilities::asciiString(data, offset, INFO2_ANSI_NAME_SIZE);
        if (name.empty())
            continue;

        uint32_t recordNumber = TriUtilities::getU32LE(data, offset + INFO2_RECORD_NUMBER_OFFSET);
        uint32_t drive = TriUtilities::getU32LE(data, offset + INFO2_DRIVE_OFFSET);
        int64_t deleted = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, offset + INFO2_DELETION_TIME_OFFSET));
        uint32_t size = TriUtilities::getU32LE(data, offset + INFO2_SIZE_OFFSET);

        std::string driveLetter = drive < 26 ? std::string(1, (char)('A' + drive)) : "?";
        // a purged entry keeps its record with the first name character cleared
        bool purged = data[offset] == 0;

        TriArtifact artifact = makeDeleted(caseId, name, deleted, size, "INFO2", source, offset);
        artifact.addAttribute("record_number", (int64_t)recordNumber);
        artifact.addAttribute("drive_letter", driveLetter);
        artifact.addAttribute("recycle_name", "D" + TriUtilities::toLower(driveLetter)
            + Poco::NumberFormatter::format(recordNumber));
        artifact.addAttribute("purged", (int64_t)(purged ? 1 : 0));
        sink.add(artifact);
    }
}

void TriRecycleBinExtractor::extractRecycleBin(TriFilesystemWalker &walker, unsigned int volume, const std::string &dir,
    const std::string &caseId, TriArtifactSink &sink)
{
    std::vector<TriDirEntry> sids = walker.listDirectory(volume, dir);
    for (std::vector<TriDirEntry>::const_iterator sid = sids.begin(); sid != sids.end(); ++sid) {
        if (!sid->isDirectory)
            continue;

        // pair $I records with their $R content by identifier
        std::map<std::string, TriDirEntry> infoFiles;
        std::map<std::string, TriDirEntry> dataFiles;
        std::vector<TriDirEntry> entries = walker.listDirectory(volume, sid->path);
        for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
            if (it->name.size() < 3 || it->name[0] != '$')
                continue;
            std::string id = TriUtilities::toLower(it->name.substr(2));
            if (it->name[1] == 'I' || it->name[1] == 'i')
                infoFiles[id] = *it;
            else if (it->name[1] == 'R' || it->name[1] == 'r')
                dataFiles[id] = *it;
        }

        for (std::map<std::string, TriDirEntry>::const_iterator info = infoFiles.begin(); info != infoFiles.end(); ++info) {
            std::vector<uint8_t> data;
            if (!readOptionalFile(walker, volume, info->second.path, data, sink))
                continue;

            std::string source = sourcePath(volume, info->second.path);
            try {
                TriArtifact artifact = parseDollarI(data, caseId, source);
                artifact.addAttribute("user_sid", sid->name);
                std::map<std::string, TriDirEntry>::const_iterator content = dataFiles.find(info->first);
                artifact.addAttribute("content_present", (int64_t)(content != dataFiles.end() ? 1 : 0));
                if (content != dataFiles.end())
                    artifact.addAttribute("content_path", content->second.path);
                sink.add(artifact);
            }
            catch (TriCorruptStructureException &ex) {
                warn(sink, source, ex.message());
            }
        }
    }
}

TriArtifact TriRecycleBinExtractor::parseDollarI(const std::vector<uint8_t> &data, const std::string &caseId,
    const std::string &source) const
{
    uint64_t version = TriUtilities::getU64LE(data, 0);
    uint64_t size = TriUtilities::getU64LE(data, DOLLAR_I_SIZE_OFFSET);
    int64_t deleted = TriUtilities::filetimeToUnix(TriUtilities::getU64LE(data, DOLLAR_I_TIME_OFFSET));

    std::string name;
    if (version == 1) {
        if (data.size() <= DOLLAR_I_V1_NAME_OFFSET)
            throw TriCorruptStructureException("$I record has no file name");
        size_t bytes = data.size() - DOLLAR_I_V1_NAME_OFFSET;
        if (bytes > DOLLAR_I_V1_NAME_BYTES)
            bytes = DOLLAR_I_V1_NAME_BYTES;
        name = TriUtilities::utf16leToUTF8(data, DOLLAR_I_V1_NAME_OFFSET, bytes);
    }
    else if (version == 2) {
        uint32_t chars = TriUtilities::getU32LE(data, DOLLAR_I_V2_LENGTH_OFFSET);
        if (DOLLAR_I_V2_NAME_OFFSET + (uint64_t)chars * 2 > data.size())
            throw TriCorruptStructureException("$I file name runs past the end of the record");
        name = TriUtilities::utf16leToUTF8(data, DOLLAR_I_V2_NAME_OFFSET, chars * 2);
    }
    else {
        std::stringstream msg;
        msg << "unsupported $I version " << version;
        throw TriCorruptStructureException(msg.str());
    }

    if (name.empty())
        throw TriCorruptStructureException("$I record has an empty file name");

    TriArtifact artifact = makeDeleted(caseId, name, deleted, size, "$I", source, 0);
    artifact.addAttribute("format_version", (int64_t)version);
    return artifact;
}

void TriRecycleBinExtractor::extractUnlinked(TriFilesystemWalker &walker, unsigned int volume, const std::string &caseId,
    TriArtifactSink &sink)
{
    std::vector<TriDeletedEntry> entries = walker.enumerateDeleted(volume);
    for (std::vector<TriDeletedEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
        if (it->isDirectory)
            continue;

        // the metadata change time is the closest record of the unlink
        int64_t deleted = it->ctime > 0 ? it->ctime : it->mtime;

        TriArtifact artifact = makeDeleted(caseId, it->path, deleted, it->size, "filesystem",
            sourcePath(volume, it->path), 0);
        artifact.addAttribute("meta_address", (int64_t)it->metaAddress);
        if (it->mtime > 0)
            artifact.addAttribute("modified", it->mtime);
        if (it->crtime > 0)
            artifact.addAttribute("created", it->crtime);
        sink.add(artifact);
    }
}
