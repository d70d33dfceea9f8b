/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriFilesystemWalkerTsk.h
 * Contains the Sleuth Kit implementation of the TriFilesystemWalker interface.
 */

#ifndef _TRI_FILESYSTEMWALKERTSK_H
#define _TRI_FILESYSTEMWALKERTSK_H

#include "TriFilesystemWalker.h"
#include "triage/framework/img/TriImageFileTsk.h"
#include "tsk/libtsk.h"

#include <memory>

/**
 * Walks the filesystems of a TriImageFileTsk with libtsk.  The volume
 * system (if any) is scanned for allocated partitions; when no volume
 * system is found the image is treated as a single filesystem.
 */
class TRI_FRAMEWORK_API TriFilesystemWalkerTsk : public TriFilesystemWalker
{
public:
    /**
     * @param image An open image.  The walker takes ownership.
     * @param maxFileReadBytes Upper bound for readFile().
     */
    TriFilesystemWalkerTsk(std::unique_ptr<TriImageFileTsk> image, uint64_t maxFileReadBytes);
    virtual ~TriFilesystemWalkerTsk();

    /**
     * Find and open the filesystems of the image.
     * @throws TriFilesystemException if no filesystem is recognized.
     */
    void mount();

    virtual std::vector<TriVolume> listVolumes() const;
    virtual std::vector<TriDirEntry> listDirectory(unsigned int volume, const std::string &path);
    virtual bool exists(unsigned int volume, const std::string &path);
    virtual std::vector<uint8_t> readFile(unsigned int volume, const std::string &path);
    virtual std::vector<TriDeletedEntry> enumerateDeleted(unsigned int volume);
    virtual std::vector<uint8_t> readRawSectors(uint64_t startSector, uint64_t count);

    const TriImageFileTsk &getImage() const { return *m_image; }

private:
    TSK_FS_INFO *getFs(unsigned int volume) const;
    void closeAll();

    std::unique_ptr<TriImageFileTsk> m_image;
    uint64_t m_maxFileReadBytes;
    std::vector<TriVolume> m_volumes;
    std::vector<TSK_FS_INFO *> m_fsInfos;
};

#endif
