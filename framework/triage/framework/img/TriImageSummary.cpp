/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriImageSummary.h"
#include "TriImageFileTsk.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"

#include <sstream>
#include <iomanip>
#include <algorithm>

namespace
{
    const size_t HASH_CHUNK_SIZE = 1024 * 1024;

    std::string toHex(const unsigned char *digest, size_t len)
    {
        std::stringstream ss;
        for (size_t i = 0; i < len; i++)
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
        return ss.str();
    }
}

TriImageSummary::TriImageSummary()
    : size(0), sectorSize(512), segmentCount(0), allocatedBytes(0), unallocatedBytes(0)
{
}

TriImageSummary TriImageSummary::compute(const TriImageFileTsk &image, bool computeHashes)
{
    TriImageSummary summary;
    TSK_IMG_INFO *img_info = image.getTskImgInfo();
    if (img_info == NULL) {
        throw TriImageFormatException("TriImageSummary::compute - Image is not open");
    }

    summary.format = TriImageFile::formatName(image.getFormat());
    summary.size = image.getSize();
    summary.sectorSize = image.getSectorSize();
    summary.segmentCount = (unsigned int)image.getFileNames().size();

    TSK_VS_INFO *vs_info = tsk_vs_open(img_info, 0, TSK_VS_TYPE_DETECT);
    if (vs_info == NULL) {
        tsk_error_reset();
        summary.allocatedBytes = summary.size;
    }
    else {
        for (TSK_PNUM_T i = 0; i < vs_info->part_count; i++) {
            const TSK_VS_PART_INFO *part = tsk_vs_part_get(vs_info, i);
            if (part == NULL)
                continue;

            TriPartitionInfo info;
            info.index = (unsigned int)part->addr;
            info.description = part->desc ? part->desc : "";
            info.startOffset = (uint64_t)part->start * vs_info->block_size;
            info.size = (uint64_t)part->len * vs_info->block_size;
            info.allocated = (part->flags & TSK_VS_PART_FLAG_ALLOC) != 0;

            // Partition table entries describe the layout, not space.
            if ((part->flags & TSK_VS_PART_FLAG_META) == 0) {
                if (info.allocated)
                    summary.allocatedBytes += info.size;
                else
                    summary.unallocatedBytes += info.size;
            }
            summary.partitions.push_back(info);
        }
        tsk_vs_close(vs_info);
    }

    if (computeHashes) {
        TSK_MD5_CTX md5;
        TSK_SHA_CTX sha;
        TSK_MD5_Init(&md5);
        TSK_SHA_Init(&sha);

        uint64_t offset = 0;
        while (offset < summary.size) {
            size_t len = (size_t)std::min<uint64_t>(HASH_CHUNK_SIZE, summary.size - offset);
            std::vector<uint8_t> chunk = image.readAt(offset, len);
            TSK_MD5_Update(&md5, &chunk[0], (unsigned int)len);
            TSK_SHA_Update(&sha, &chunk[0], (int)len);
            offset += len;
        }

        unsigned char md5Digest[TSK_MD5_DIGEST_LENGTH];
        unsigned char shaDigest[TSK_SHA_DIGEST_LENGTH];
        TSK_MD5_Final(md5Digest, &md5);
        TSK_SHA_Final(shaDigest, &sha);
        summary.md5 = toHex(md5Digest, 16);
        summary.sha1 = toHex(shaDigest, 20);
    }

    std::stringstream msg;
    msg << "TriImageSummary::compute - " << summary.partitions.size() << " partition(s), "
        << summary.allocatedBytes << " bytes allocated";
    LOGINFO(msg.str());

    return summary;
}
