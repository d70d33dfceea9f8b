/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriFileSystemExtractor.h
 * Contains the interface of the TriFileSystemExtractor class.
 */

#ifndef _TRI_FILESYSTEMEXTRACTOR_H
#define _TRI_FILESYSTEMEXTRACTOR_H

#include "TriExtractor.h"

/**
 * Extracts program execution and file access traces kept by Windows in
 * ordinary files: prefetch files, shell link (.lnk) files of the users'
 * Recent folders and jump lists.
 */
class TRI_FRAMEWORK_API TriFileSystemExtractor : public TriExtractor
{
public:
    virtual std::string getName() const { return "filesystem"; }
    virtual std::vector<TRI_ARTIFACT_TYPE> getArtifactTypes() const;
    virtual Status extract(TriFilesystemWalker &walker, const std::string &caseId, TriArtifactSink &sink);

    /**
     * Decode one prefetch file.  Compressed (MAM) files are inventoried
     * using the name and times of the file itself.
     * @throws TriCorruptStructureException if the file is not a prefetch file.
     */
    void parsePrefetch(const std::vector<uint8_t> &data, const TriDirEntry &entry, const std::string &caseId,
        const std::string &source, TriArtifactSink &sink) const;

    /**
     * Decode one shell link file.
     * @throws TriCorruptStructureException if the file is not a shell link.
     */
    void parseShortcut(const std::vector<uint8_t> &data, const TriDirEntry &entry, const std::string &profile,
        const std::string &caseId, const std::string &source, TriArtifactSink &sink) const;

    /// Record one jump list file.
    void inventoryJumpList(const TriDirEntry &entry, const std::string &profile, const std::string &caseId,
        const std::string &source, TriArtifactSink &sink) const;

private:
    void prefetchFiles(TriFilesystemWalker &walker, unsigned int volume, const std::string &caseId,
        TriArtifactSink &sink) const;
    void recentFolder(TriFilesystemWalker &walker, unsigned int volume, const std::string &recent,
        const std::string &profile, const std::string &caseId, TriArtifactSink &sink) const;

    static std::string makeKey(TRI_ARTIFACT_TYPE type, const std::string &target, int64_t referenced);
};

#endif
