/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriImageFileTsk.h
 * Contains the Sleuth Kit implementation of the TriImageFile interface.
 */

#ifndef _TRI_IMAGEFILETSK_H
#define _TRI_IMAGEFILETSK_H

#include "TriImageFile.h"
#include "tsk/libtsk.h"

#include <vector>
#include <string>

/// A Sleuth Kit implementation of the TriImageFile interface. 
/**
 * The container format is detected by libtsk from the image content
 * (TSK_IMG_TYPE_DETECT); split raw segments and EWF segments are found
 * from the first segment name.
 */
class TRI_FRAMEWORK_API TriImageFileTsk : public TriImageFile
{
public:
    TriImageFileTsk();

    virtual ~TriImageFileTsk();

    virtual void open(const std::string &path);
    virtual void close();

    virtual std::vector<std::string> getFileNames() const;
    virtual Format getFormat() const;
    virtual uint64_t getSize() const;
    virtual unsigned int getSectorSize() const;
    virtual std::vector<uint8_t> readAt(uint64_t offset, size_t length) const;

    /**
     * The underlying libtsk handle, used to open volume and file systems.
     * @returns NULL if the image is not open.
     */
    TSK_IMG_INFO *getTskImgInfo() const { return m_img_info; }

private:
    TSK_IMG_INFO *m_img_info;
    std::string m_path;
};

#endif
