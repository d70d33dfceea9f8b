/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriEvidenceOpener.cpp
 * Contains the implementation of the TriEvidenceOpenerTsk class.
 */

#include "TriEvidenceOpener.h"
#include "triage/framework/filesystem/TriFilesystemWalkerTsk.h"
#include "triage/framework/img/TriImageFileTsk.h"
#include "triage/framework/services/TriServices.h"

#include <sstream>

TriEvidenceOpenerTsk::TriEvidenceOpenerTsk(uint64_t maxFileReadBytes, bool computeHashes)
    : m_maxFileReadBytes(maxFileReadBytes), m_computeHashes(computeHashes)
{
}

std::unique_ptr<TriFilesystemWalker> TriEvidenceOpenerTsk::open(const std::string &imagePath, TriImageSummary &summary)
{
    std::unique_ptr<TriImageFileTsk> image(new TriImageFileTsk());
    image->open(imagePath);

    summary = TriImageSummary::compute(*image, m_computeHashes);

    std::stringstream msg;
    msg << "TriEvidenceOpenerTsk::open - " << imagePath << ": " << summary.format << ", " << summary.size
        << " bytes in " << summary.segmentCount << " segment(s)";
    LOGINFO(msg.str());

    std::unique_ptr<TriFilesystemWalkerTsk> walker(new TriFilesystemWalkerTsk(std::move(image), m_maxFileReadBytes));
    walker->mount();
    return std::unique_ptr<TriFilesystemWalker>(walker.release());
}
