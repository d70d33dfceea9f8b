/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriImageSummary.h
 * Partition layout, space accounting and content hashes of an image.
 */

#ifndef _TRI_IMAGESUMMARY_H
#define _TRI_IMAGESUMMARY_H

#include "triage/framework/framework_i.h"
#include <string>
#include <vector>
#include <stdint.h>

class TriImageFileTsk;

/**
 * One entry of the image's partition table.
 */
struct TriPartitionInfo
{
    unsigned int index;
    std::string description;
    uint64_t startOffset;   ///< byte offset from the start of the image
    uint64_t size;          ///< size in bytes
    bool allocated;
};

/**
 * Basic information about an evidence container.
 */
class TRI_FRAMEWORK_API TriImageSummary
{
public:
    TriImageSummary();

    std::string format;
    uint64_t size;
    unsigned int sectorSize;
    unsigned int segmentCount;
    std::vector<TriPartitionInfo> partitions;
    uint64_t allocatedBytes;
    uint64_t unallocatedBytes;
    std::string md5;    ///< empty if hashes were not computed
    std::string sha1;   ///< empty if hashes were not computed

    /**
     * Collect the summary of an open image. Images without a partition
     * table report their whole size as allocated.
     * @param image An open image.
     * @param computeHashes Stream the whole image through MD5 and SHA-1.
     */
    static TriImageSummary compute(const TriImageFileTsk &image, bool computeHashes);
};

#endif
