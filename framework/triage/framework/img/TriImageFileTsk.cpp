/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriImageFileTsk.cpp
 * Contains the Sleuth Kit implementation of the TriImageFile interface.
 */

#include "TriImageFileTsk.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"

#include "Poco/File.h"

#include <sstream>

TriImageFileTsk::TriImageFileTsk() : m_img_info(NULL)
{
}

TriImageFileTsk::~TriImageFileTsk()
{
    close();
}

void TriImageFileTsk::open(const std::string &path)
{
    if (m_img_info != NULL) {
        close();
    }

    if (!Poco::File(path).exists()) {
        throw TriImageFormatException("TriImageFileTsk::open - Image file does not exist: " + path);
    }

    m_img_info = tsk_img_open_utf8_sing(path.c_str(), TSK_IMG_TYPE_DETECT, 0);
    if (m_img_info == NULL) 
    {
        std::stringstream msg;
        msg << "TriImageFileTsk::open - Error with tsk_img_open for " << path << ": " << tsk_error_get();
        LOGERROR(msg.str());
        tsk_error_reset();
        throw TriImageFormatException(msg.str());
    }

    if (m_img_info->size <= 0) {
        tsk_img_close(m_img_info);
        m_img_info = NULL;
        throw TriImageFormatException("TriImageFileTsk::open - Image has no addressable content: " + path);
    }

    m_path = path;

    std::stringstream msg;
    msg << "TriImageFileTsk::open - Opened " << path << " (" << formatName(getFormat())
        << ", " << m_img_info->num_img << " segment(s), " << m_img_info->size << " bytes)";
    LOGINFO(msg.str());
}

void TriImageFileTsk::close()
{
    if (m_img_info) {
        tsk_img_close(m_img_info);
        m_img_info = NULL;
    }
    m_path.clear();
}

std::vector<std::string> TriImageFileTsk::getFileNames() const
{
    std::vector<std::string> names;
    if (m_img_info == NULL)
        return names;

    for (int i = 0; i < m_img_info->num_img; i++) {
        names.push_back(std::string(m_img_info->images[i]));
    }
    if (names.empty())
        names.push_back(m_path);
    return names;
}

TriImageFile::Format TriImageFileTsk::getFormat() const
{
    if (m_img_info == NULL)
        return FORMAT_UNKNOWN;

    if (TSK_IMG_TYPE_ISRAW(m_img_info->itype))
        return m_img_info->num_img > 1 ? FORMAT_RAW_SPLIT : FORMAT_RAW;
    if (TSK_IMG_TYPE_ISEWF(m_img_info->itype))
        return FORMAT_EWF;
    return FORMAT_UNKNOWN;
}

uint64_t TriImageFileTsk::getSize() const
{
    return m_img_info ? (uint64_t)m_img_info->size : 0;
}

unsigned int TriImageFileTsk::getSectorSize() const
{
    return m_img_info ? m_img_info->sector_size : 512;
}

std::vector<uint8_t> TriImageFileTsk::readAt(uint64_t offset, size_t length) const
{
    if (m_img_info == NULL) {
        throw TriImageFormatException("TriImageFileTsk::readAt - Image is not open");
    }

    uint64_t size = getSize();
    if (offset > size || length > size - offset) {
        std::stringstream msg;
        msg << "TriImageFileTsk::readAt - range [" << offset << ", " << offset + length
            << ") is outside the image (" << size << " bytes)";
        throw TriOutOfRangeException(msg.str());
    }

    std::vector<uint8_t> buf(length);
    size_t done = 0;
    while (done < length) {
        ssize_t cnt = tsk_img_read(m_img_info, (TSK_OFF_T)(offset + done), (char *)&buf[done], length - done);
        if (cnt <= 0) {
            std::stringstream msg;
            msg << "TriImageFileTsk::readAt - tsk_img_read -- start: " << offset + done
                << " -- len: " << length - done << " (" << tsk_error_get() << ")";
            LOGERROR(msg.str());
            tsk_error_reset();
            throw TriImageFormatException(msg.str());
        }
        done += (size_t)cnt;
    }

    return buf;
}
