/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriFilesystemWalker.h
 * Contains the interface of the TriFilesystemWalker class.
 */

#ifndef _TRI_FILESYSTEMWALKER_H
#define _TRI_FILESYSTEMWALKER_H

#include "triage/framework/framework_i.h"
#include "Poco/Mutex.h"

#include <string>
#include <vector>
#include <stdint.h>

/**
 * A mounted volume (a partition holding a recognized filesystem).
 */
struct TriVolume
{
    unsigned int index;     ///< position in listVolumes(), used to address the volume
    uint64_t offset;        ///< byte offset of the filesystem in the image
    uint64_t size;          ///< size of the filesystem in bytes
    std::string fsType;     ///< e.g. "ntfs", "fat32"
};

/**
 * One entry of a directory listing.
 */
struct TriDirEntry
{
    std::string name;
    std::string path;       ///< absolute path within the volume, '/' separated
    bool isDirectory;
    uint64_t size;
    int64_t mtime;          ///< seconds since the Unix epoch, 0 if unknown
    int64_t atime;
    int64_t ctime;          ///< metadata change time
    int64_t crtime;         ///< creation time
};

/**
 * A filesystem entry that is no longer linked into the directory tree but
 * whose metadata can still be recovered.
 */
struct TriDeletedEntry
{
    std::string path;       ///< last known absolute path
    std::string name;
    bool isDirectory;
    uint64_t size;
    uint64_t metaAddress;   ///< metadata address (MFT entry, inode), 0 if unknown
    int64_t mtime;
    int64_t ctime;
    int64_t crtime;
};

/**
 * A Windows user profile root.
 */
struct TriUserProfile
{
    std::string name;       ///< e.g. "alice"
    std::string path;       ///< e.g. "/Users/alice"
};

/**
 * Interprets an image as one or more volumes and gives the extractors
 * path based access to their content.  All paths are absolute, use '/'
 * as separator and are matched case-insensitively, as on NTFS.
 *
 * Traversal is tolerant of damaged structures: a directory that cannot be
 * read produces a warning (see takeWarnings()) and an empty listing, never
 * an exception.  A directory that does not exist produces an empty listing
 * without a warning.
 */
class TRI_FRAMEWORK_API TriFilesystemWalker
{
public:
    TriFilesystemWalker();
    virtual ~TriFilesystemWalker();

    virtual std::vector<TriVolume> listVolumes() const = 0;

    virtual std::vector<TriDirEntry> listDirectory(unsigned int volume, const std::string &path) = 0;

    virtual bool exists(unsigned int volume, const std::string &path) = 0;

    /**
     * Read the whole content of a file.
     * @throws TriFileNotFoundException if the path does not name a file.
     * @throws TriFileException if the file cannot be read.
     */
    virtual std::vector<uint8_t> readFile(unsigned int volume, const std::string &path) = 0;

    /**
     * Entries recoverable from filesystem metadata although they are no
     * longer linked into the tree.
     */
    virtual std::vector<TriDeletedEntry> enumerateDeleted(unsigned int volume) = 0;

    /**
     * Read sectors directly from the image, below file granularity.
     * @throws TriOutOfRangeException if the range is outside the image.
     */
    virtual std::vector<uint8_t> readRawSectors(uint64_t startSector, uint64_t count) = 0;

    /**
     * User profile roots: the subdirectories of /Users and
     * /Documents and Settings, without the system profiles.
     */
    std::vector<TriUserProfile> listUserProfiles(unsigned int volume);

    /**
     * Return and clear the warnings collected during traversal.
     */
    std::vector<std::string> takeWarnings();

    /// Join a directory path and an entry name.
    static std::string joinPath(const std::string &dir, const std::string &name);

protected:
    void addWarning(const std::string &warning);

private:
    // Prohibit copying.
    TriFilesystemWalker(const TriFilesystemWalker&);
    TriFilesystemWalker& operator=(const TriFilesystemWalker&);

    Poco::FastMutex m_warningsMutex;
    std::vector<std::string> m_warnings;
};

#endif
