/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriFilesystemWalkerTsk.cpp
 * Contains the Sleuth Kit implementation of the TriFilesystemWalker interface.
 */

#include "TriFilesystemWalkerTsk.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"

#include <sstream>
#include <set>
#include <cstring>

namespace
{
    /**
     * Records the offsets of the filesystems libtsk recognizes in an image
     * without processing their files.
     */
    class TriVolumeFinder : public TskAuto
    {
    public:
        TriVolumeFinder() : m_vsSeen(false) {}

        virtual TSK_FILTER_ENUM filterVol(const TSK_VS_PART_INFO * a_vsPart)
        {
            m_vsSeen = true;

            std::stringstream msg;
            msg << "TriVolumeFinder::filterVol - Discovered " << a_vsPart->desc
                << " partition (sectors " << a_vsPart->start << "-"
                << ((a_vsPart->start + a_vsPart->len) - 1) << ")";
            LOGINFO(msg.str());

            // we only want the allocated volumes
            if ((a_vsPart->flags & TSK_VS_PART_FLAG_ALLOC) == 0)
                return TSK_FILTER_SKIP;

            return TSK_FILTER_CONT;
        }

        virtual TSK_FILTER_ENUM filterFs(TSK_FS_INFO * a_fsInfo)
        {
            TriVolume vol;
            vol.index = (unsigned int)m_volumes.size();
            vol.offset = (uint64_t)a_fsInfo->offset;
            vol.size = (uint64_t)a_fsInfo->block_count * a_fsInfo->block_size;
            vol.fsType = tsk_fs_type_toname(a_fsInfo->ftype);
            m_volumes.push_back(vol);

            std::stringstream msg;
            msg << "TriVolumeFinder::filterFs - Discovered " << vol.fsType
                << " file system at offset " << vol.offset;
            LOGINFO(msg.str());

            // files are read on demand, not during the scan
            return TSK_FILTER_SKIP;
        }

        virtual TSK_RETVAL_ENUM processFile(TSK_FS_FILE *, const char *)
        {
            return TSK_OK;
        }

        virtual uint8_t handleError()
        {
            const char * tskMsg = tsk_error_get();
            if (tskMsg != NULL) {
                std::stringstream msg;
                msg << "TriVolumeFinder::handleError " << tskMsg;
                LOGWARN(msg.str());
            }
            tsk_error_reset();
            return 0;
        }

        bool m_vsSeen;
        std::vector<TriVolume> m_volumes;
    };

    int64_t toTime(time_t t)
    {
        return t > 0 ? (int64_t)t : 0;
    }

    bool isDotEntry(const char *name)
    {
        return name == NULL || strcmp(name, ".") == 0 || strcmp(name, "..") == 0;
    }

    bool isDirectoryFile(const TSK_FS_FILE *fsFile)
    {
        if (fsFile->meta != NULL)
            return TSK_FS_IS_DIR_META(fsFile->meta->type);
        if (fsFile->name != NULL)
            return TSK_FS_IS_DIR_NAME(fsFile->name->type);
        return false;
    }

    struct DeletedWalkContext
    {
        std::vector<TriDeletedEntry> entries;
        std::set<std::pair<std::string, uint64_t> > seen;
    };

    TSK_WALK_RET_ENUM deletedWalkCallback(TSK_FS_FILE *fsFile, const char *path, void *ptr)
    {
        DeletedWalkContext *ctx = static_cast<DeletedWalkContext *>(ptr);

        if (fsFile->name == NULL || isDotEntry(fsFile->name->name))
            return TSK_WALK_CONT;
        if ((fsFile->name->flags & TSK_FS_NAME_FLAG_UNALLOC) == 0)
            return TSK_WALK_CONT;

        TriDeletedEntry entry;
        entry.name = fsFile->name->name;
        entry.path = "/" + std::string(path ? path : "") + entry.name;
        entry.metaAddress = (uint64_t)fsFile->name->meta_addr;
        entry.isDirectory = isDirectoryFile(fsFile);
        entry.size = 0;
        entry.mtime = entry.ctime = entry.crtime = 0;

        if (fsFile->meta != NULL) {
            entry.size = fsFile->meta->size > 0 ? (uint64_t)fsFile->meta->size : 0;
            entry.mtime = toTime(fsFile->meta->mtime);
            entry.ctime = toTime(fsFile->meta->ctime);
            entry.crtime = toTime(fsFile->meta->crtime);
        }

        if (ctx->seen.insert(std::make_pair(entry.path, entry.metaAddress)).second)
            ctx->entries.push_back(entry);

        return TSK_WALK_CONT;
    }
}

TriFilesystemWalkerTsk::TriFilesystemWalkerTsk(std::unique_ptr<TriImageFileTsk> image, uint64_t maxFileReadBytes)
    : m_image(std::move(image)), m_maxFileReadBytes(maxFileReadBytes)
{
    if (!m_image || m_image->getTskImgInfo() == NULL)
        throw TriFilesystemException("TriFilesystemWalkerTsk - Image is not open");
}

TriFilesystemWalkerTsk::~TriFilesystemWalkerTsk()
{
    closeAll();
}

void TriFilesystemWalkerTsk::closeAll()
{
    for (size_t i = 0; i < m_fsInfos.size(); i++) {
        tsk_fs_close(m_fsInfos[i]);
    }
    m_fsInfos.clear();
    m_volumes.clear();
}

void TriFilesystemWalkerTsk::mount()
{
    closeAll();

    TSK_IMG_INFO *img = m_image->getTskImgInfo();

    TriVolumeFinder finder;
    if (finder.openImageHandle(img)) {
        std::stringstream msg;
        msg << "TriFilesystemWalkerTsk::mount - Error opening image handle: " << tsk_error_get();
        tsk_error_reset();
        throw TriFilesystemException(msg.str());
    }
    // errors were reported through handleError; a partial scan is still usable
    finder.findFilesInImg();

    for (size_t i = 0; i < finder.m_volumes.size(); i++) {
        TSK_FS_INFO *fs = tsk_fs_open_img(img, (TSK_OFF_T)finder.m_volumes[i].offset, TSK_FS_TYPE_DETECT);
        if (fs == NULL) {
            std::stringstream msg;
            msg << "TriFilesystemWalkerTsk::mount - Error opening file system at offset "
                << finder.m_volumes[i].offset << ": " << tsk_error_get();
            tsk_error_reset();
            addWarning(msg.str());
            continue;
        }

        TriVolume vol = finder.m_volumes[i];
        vol.index = (unsigned int)m_volumes.size();
        m_volumes.push_back(vol);
        m_fsInfos.push_back(fs);
    }

    if (m_volumes.empty()) {
        std::stringstream msg;
        msg << "TriFilesystemWalkerTsk::mount - No recognizable file system in "
            << m_image->getFileNames().front();
        LOGERROR(msg.str());
        throw TriFilesystemException(msg.str());
    }
}

TSK_FS_INFO *TriFilesystemWalkerTsk::getFs(unsigned int volume) const
{
    if (volume >= m_fsInfos.size()) {
        std::stringstream msg;
        msg << "TriFilesystemWalkerTsk - No volume with index " << volume;
        throw TriFilesystemException(msg.str());
    }
    return m_fsInfos[volume];
}

std::vector<TriVolume> TriFilesystemWalkerTsk::listVolumes() const
{
    return m_volumes;
}

std::vector<TriDirEntry> TriFilesystemWalkerTsk::listDirectory(unsigned int volume, const std::string &path)
{
    std::vector<TriDirEntry> entries;
    TSK_FS_INFO *fs = getFs(volume);

    TSK_FS_DIR *dir = tsk_fs_dir_open(fs, path.c_str());
    if (dir == NULL) {
        std::string tskMsg = tsk_error_get() ? tsk_error_get() : "";
        tsk_error_reset();

        TSK_INUM_T inum;
        int8_t found = tsk_fs_path2inum(fs, path.c_str(), &inum, NULL);
        tsk_error_reset();
        if (found == 1) {
            // missing directories are normal on a triage target
            return entries;
        }

        std::stringstream msg;
        msg << "TriFilesystemWalkerTsk::listDirectory - Unable to read directory " << path
            << " on volume " << volume << ": " << tskMsg;
        addWarning(msg.str());
        return entries;
    }

    size_t count = tsk_fs_dir_getsize(dir);
    for (size_t i = 0; i < count; i++) {
        TSK_FS_FILE *fsFile = tsk_fs_dir_get(dir, i);
        if (fsFile == NULL) {
            tsk_error_reset();
            continue;
        }

        if (fsFile->name != NULL && !isDotEntry(fsFile->name->name)
            && (fsFile->name->flags & TSK_FS_NAME_FLAG_ALLOC)) {
            TriDirEntry entry;
            entry.name = fsFile->name->name;
            entry.path = joinPath(path, entry.name);
            entry.isDirectory = isDirectoryFile(fsFile);
            entry.size = 0;
            entry.mtime = entry.atime = entry.ctime = entry.crtime = 0;
            if (fsFile->meta != NULL) {
                entry.size = fsFile->meta->size > 0 ? (uint64_t)fsFile->meta->size : 0;
                entry.mtime = toTime(fsFile->meta->mtime);
                entry.atime = toTime(fsFile->meta->atime);
                entry.ctime = toTime(fsFile->meta->ctime);
                entry.crtime = toTime(fsFile->meta->crtime);
            }
            entries.push_back(entry);
        }
        tsk_fs_file_close(fsFile);
    }
    tsk_fs_dir_close(dir);

    return entries;
}

bool TriFilesystemWalkerTsk::exists(unsigned int volume, const std::string &path)
{
    TSK_INUM_T inum;
    int8_t found = tsk_fs_path2inum(getFs(volume), path.c_str(), &inum, NULL);
    tsk_error_reset();
    return found == 0;
}

std::vector<uint8_t> TriFilesystemWalkerTsk::readFile(unsigned int volume, const std::string &path)
{
    TSK_FS_FILE *fsFile = tsk_fs_file_open(getFs(volume), NULL, path.c_str());
    if (fsFile == NULL || fsFile->meta == NULL) {
        if (fsFile)
            tsk_fs_file_close(fsFile);
        tsk_error_reset();
        throw TriFileNotFoundException("TriFilesystemWalkerTsk::readFile - File not found: " + path);
    }

    if (TSK_FS_IS_DIR_META(fsFile->meta->type)) {
        tsk_fs_file_close(fsFile);
        throw TriFileNotFoundException("TriFilesystemWalkerTsk::readFile - Path is a directory: " + path);
    }

    TSK_OFF_T size = fsFile->meta->size;
    if (size < 0 || (uint64_t)size > m_maxFileReadBytes) {
        tsk_fs_file_close(fsFile);
        std::stringstream msg;
        msg << "TriFilesystemWalkerTsk::readFile - " << path << " is " << size
            << " bytes, larger than the limit of " << m_maxFileReadBytes;
        throw TriFileException(msg.str());
    }

    std::vector<uint8_t> buf((size_t)size);
    TSK_OFF_T offset = 0;
    while (offset < size) {
        ssize_t cnt = tsk_fs_file_read(fsFile, offset, (char *)&buf[(size_t)offset],
            (size_t)(size - offset), TSK_FS_FILE_READ_FLAG_NONE);
        if (cnt <= 0) {
            std::stringstream msg;
            msg << "TriFilesystemWalkerTsk::readFile - Error reading " << path
                << " at offset " << offset << ": " << tsk_error_get();
            tsk_error_reset();
            tsk_fs_file_close(fsFile);
            throw TriFileException(msg.str());
        }
        offset += cnt;
    }

    tsk_fs_file_close(fsFile);
    return buf;
}

std::vector<TriDeletedEntry> TriFilesystemWalkerTsk::enumerateDeleted(unsigned int volume)
{
    TSK_FS_INFO *fs = getFs(volume);
    DeletedWalkContext ctx;

    int flags = TSK_FS_DIR_WALK_FLAG_UNALLOC | TSK_FS_DIR_WALK_FLAG_RECURSE;
    if (tsk_fs_dir_walk(fs, fs->root_inum, (TSK_FS_DIR_WALK_FLAG_ENUM)flags, deletedWalkCallback, &ctx)) {
        std::stringstream msg;
        msg << "TriFilesystemWalkerTsk::enumerateDeleted - Directory walk on volume " << volume
            << " ended early: " << tsk_error_get();
        tsk_error_reset();
        addWarning(msg.str());
    }

    return ctx.entries;
}

std::vector<uint8_t> TriFilesystemWalkerTsk::readRawSectors(uint64_t startSector, uint64_t count)
{
    uint64_t sectorSize = m_image->getSectorSize();
    uint64_t sectors = sectorSize ? m_image->getSize() / sectorSize : 0;
    // checked in sectors so that the byte products below cannot wrap
    if (startSector > sectors || count > sectors - startSector) {
        std::stringstream msg;
        msg << "TriFilesystemWalkerTsk::readRawSectors - sectors " << startSector << " (+" << count
            << ") are outside the image (" << sectors << " sectors)";
        throw TriOutOfRangeException(msg.str());
    }
    return m_image->readAt(startSector * sectorSize, (size_t)(count * sectorSize));
}
