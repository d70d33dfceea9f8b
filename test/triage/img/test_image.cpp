/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "catch2/catch.hpp"
#include "test/runner.h"

#include "triage/framework/img/TriImageFileTsk.h"
#include "triage/framework/img/TriImageSummary.h"
#include "triage/framework/filesystem/TriFilesystemWalkerTsk.h"
#include "triage/framework/pipeline/TriEvidenceOpener.h"
#include "triage/framework/utilities/TriException.h"

#include "Poco/DigestEngine.h"
#include "Poco/MD5Engine.h"
#include "Poco/SHA1Engine.h"

#include <memory>

namespace {
    const size_t SEGMENT_SIZE = 4 * 1024 * 1024;

    uint8_t patternAt(uint64_t offset) {
        return (uint8_t)(offset % 251);
    }

    std::vector<uint8_t> segment(uint64_t start, size_t size) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; i++)
            data[i] = patternAt(start + i);
        return data;
    }
}

TEST_CASE("split raw images read as one stream", "[image]") {
    runner::temp_dir dir("image_split");
    runner::write_file(dir.file("image.001"), segment(0, SEGMENT_SIZE));
    runner::write_file(dir.file("image.002"), segment(SEGMENT_SIZE, SEGMENT_SIZE));

    TriImageFileTsk image;
    REQUIRE(image.getFormat() == TriImageFile::FORMAT_UNKNOWN);
    image.open(dir.file("image.001"));

    REQUIRE(image.getFormat() == TriImageFile::FORMAT_RAW_SPLIT);
    REQUIRE(image.getFileNames().size() == 2);
    REQUIRE(image.getSize() == 2 * SEGMENT_SIZE);
    REQUIRE(image.getSectorSize() == 512);

    // across the segment boundary
    std::vector<uint8_t> data = image.readAt(SEGMENT_SIZE - 10, 20);
    REQUIRE(data.size() == 20);
    for (size_t i = 0; i < data.size(); i++)
        REQUIRE(data[i] == patternAt(SEGMENT_SIZE - 10 + i));

    REQUIRE(image.readAt(2 * SEGMENT_SIZE - 4, 4).size() == 4);
    REQUIRE(image.readAt(2 * SEGMENT_SIZE, 0).empty());
    REQUIRE_THROWS_AS(image.readAt(2 * SEGMENT_SIZE - 10, 20), TriOutOfRangeException);
    REQUIRE_THROWS_AS(image.readAt(3 * SEGMENT_SIZE, 1), TriOutOfRangeException);

    image.close();
    REQUIRE(image.getTskImgInfo() == NULL);
    REQUIRE_THROWS_AS(image.readAt(0, 1), TriImageFormatException);
}

TEST_CASE("a read across an unaligned segment seam matches the whole image", "[image]") {
    // segments that end in the middle of a sector
    const size_t segmentSize = 10000000;
    runner::temp_dir dir("image_seam");
    runner::write_file(dir.file("evidence.001"), segment(0, segmentSize));
    runner::write_file(dir.file("evidence.002"), segment(segmentSize, segmentSize));
    runner::write_file(dir.file("whole.dd"), segment(0, 2 * segmentSize));

    TriImageFileTsk split;
    split.open(dir.file("evidence.001"));
    REQUIRE(split.getFormat() == TriImageFile::FORMAT_RAW_SPLIT);
    REQUIRE(split.getSize() == 2 * segmentSize);

    TriImageFileTsk whole;
    whole.open(dir.file("whole.dd"));
    REQUIRE(whole.getFormat() == TriImageFile::FORMAT_RAW);

    std::vector<uint8_t> seam = split.readAt(9999990, 20);
    REQUIRE(seam.size() == 20);
    REQUIRE(seam == whole.readAt(9999990, 20));
    for (size_t i = 0; i < seam.size(); i++)
        REQUIRE(seam[i] == patternAt(9999990 + i));

    // the sector holding the seam, and the last bytes of the image
    REQUIRE(split.readAt(9999872, 512) == whole.readAt(9999872, 512));
    REQUIRE(split.readAt(2 * segmentSize - 7, 7) == whole.readAt(2 * segmentSize - 7, 7));
}

TEST_CASE("raw sector reads stay inside the image", "[image][filesystem]") {
    runner::temp_dir dir("image_sectors");
    runner::write_file(dir.file("disk.dd"), segment(0, SEGMENT_SIZE));

    std::unique_ptr<TriImageFileTsk> image(new TriImageFileTsk());
    image->open(dir.file("disk.dd"));
    TriFilesystemWalkerTsk walker(std::move(image), 64 * 1024 * 1024);
    const uint64_t sectors = SEGMENT_SIZE / 512;

    std::vector<uint8_t> data = walker.readRawSectors(1, 2);
    REQUIRE(data.size() == 1024);
    for (size_t i = 0; i < data.size(); i++)
        REQUIRE(data[i] == patternAt(512 + i));

    REQUIRE(walker.readRawSectors(sectors - 1, 1).size() == 512);
    REQUIRE(walker.readRawSectors(sectors, 0).empty());
    REQUIRE_THROWS_AS(walker.readRawSectors(sectors - 1, 2), TriOutOfRangeException);
    REQUIRE_THROWS_AS(walker.readRawSectors(sectors + 1, 0), TriOutOfRangeException);

    // start * 512 wraps to 0 in 64 bits
    REQUIRE_THROWS_AS(walker.readRawSectors(1ULL << 55, 1), TriOutOfRangeException);
    // count * 512 wraps to 512
    REQUIRE_THROWS_AS(walker.readRawSectors(0, (1ULL << 55) + 1), TriOutOfRangeException);
}

TEST_CASE("image summary of an unpartitioned image", "[image]") {
    runner::temp_dir dir("image_summary");
    std::vector<uint8_t> content = segment(0, SEGMENT_SIZE);
    runner::write_file(dir.file("disk.dd"), content);

    TriImageFileTsk image;
    image.open(dir.file("disk.dd"));
    REQUIRE(image.getFormat() == TriImageFile::FORMAT_RAW);
    REQUIRE(image.getFileNames().size() == 1);

    TriImageSummary summary = TriImageSummary::compute(image, true);
    REQUIRE(summary.format == "raw");
    REQUIRE(summary.size == SEGMENT_SIZE);
    REQUIRE(summary.segmentCount == 1);
    REQUIRE(summary.partitions.empty());
    REQUIRE(summary.allocatedBytes == SEGMENT_SIZE);
    REQUIRE(summary.unallocatedBytes == 0);

    Poco::MD5Engine md5;
    md5.update(&content[0], (unsigned)content.size());
    Poco::SHA1Engine sha1;
    sha1.update(&content[0], (unsigned)content.size());
    REQUIRE(summary.md5 == Poco::DigestEngine::digestToHex(md5.digest()));
    REQUIRE(summary.sha1 == Poco::DigestEngine::digestToHex(sha1.digest()));

    TriImageSummary quick = TriImageSummary::compute(image, false);
    REQUIRE(quick.md5.empty());
    REQUIRE(quick.sha1.empty());
}

TEST_CASE("images that cannot be opened", "[image]") {
    runner::temp_dir dir("image_errors");
    TriImageFileTsk image;
    REQUIRE_THROWS_AS(image.open(dir.file("missing.E01")), TriImageFormatException);
    REQUIRE(image.getSize() == 0);

    TriImageSummary summary;
    REQUIRE_THROWS_AS(TriImageSummary::compute(image, false), TriImageFormatException);
}

TEST_CASE("an image without a file system does not mount", "[image]") {
    runner::temp_dir dir("image_mount");
    runner::write_file(dir.file("zeros.dd"), std::vector<uint8_t>(SEGMENT_SIZE, 0));

    TriEvidenceOpenerTsk opener(64 * 1024 * 1024, false);
    TriImageSummary summary;
    REQUIRE_THROWS_AS(opener.open(dir.file("zeros.dd"), summary), TriFilesystemException);
    REQUIRE_THROWS_AS(opener.open(dir.file("absent.dd"), summary), TriImageFormatException);
}
