/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriImageFile.h
 * Contains the interface of the TriImageFile class.
 */

#ifndef _TRI_IMAGEFILE_H
#define _TRI_IMAGEFILE_H

#include "triage/framework/framework_i.h"
#include <vector>
#include <string>
#include <stdint.h>

/**
 * An interface to a class that exposes an evidence container (a raw
 * image, a split raw image or a segmented EWF image) as one randomly
 * addressable byte stream.  Segmentation and container metadata are
 * hidden from callers.  You must call open() before using any of the
 * other methods in the interface.
 */
class TRI_FRAMEWORK_API TriImageFile
{
public:
    /// Container formats recognized from the image content.
    enum Format {
        FORMAT_UNKNOWN,
        FORMAT_RAW,         ///< single raw/dd file
        FORMAT_RAW_SPLIT,   ///< raw image split into .001, .002, ... segments
        FORMAT_EWF          ///< Expert Witness Format (.E01, .E02, ...)
    };

    TriImageFile();
    virtual ~TriImageFile();

    /**
     * Open the container. Sibling segments of split and EWF images are
     * discovered from the first segment.
     * @param path Path of the image or of its first segment.
     * @throws TriImageFormatException if the container cannot be opened
     * or its header is not recognized.
     */
    virtual void open(const std::string &path) = 0;

    /// Close the disk image.
    virtual void close() = 0;

    /// Return the file name(s) that make up the image.
    virtual std::vector<std::string> getFileNames() const = 0;

    virtual Format getFormat() const = 0;

    /// Total addressable size in bytes.
    virtual uint64_t getSize() const = 0;

    virtual unsigned int getSectorSize() const = 0;

    /**
     * Read length bytes starting at offset.
     * @returns exactly length bytes.
     * @throws TriOutOfRangeException if the range extends past the end of the
     * image; no partial data is returned.
     * @throws TriImageFormatException if the container cannot deliver the data.
     */
    virtual std::vector<uint8_t> readAt(uint64_t offset, size_t length) const = 0;

    /// Human readable name of a format.
    static std::string formatName(Format format);

private:
    // Prohibit copying.
    TriImageFile(const TriImageFile&);
    TriImageFile& operator=(const TriImageFile&);
};

#endif
