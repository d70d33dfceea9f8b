/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriEvidenceOpener.h
 * Contains the interface of the TriEvidenceOpener and TriEvidenceOpenerTsk classes.
 */

#ifndef _TRI_EVIDENCEOPENER_H
#define _TRI_EVIDENCEOPENER_H

#include "triage/framework/filesystem/TriFilesystemWalker.h"
#include "triage/framework/img/TriImageSummary.h"

#include <memory>
#include <string>

/**
 * Turns an image path into a mounted filesystem walker.  The job
 * controller uses one opener for all of its jobs, so implementations must
 * allow concurrent calls.
 */
class TRI_FRAMEWORK_API TriEvidenceOpener
{
public:
    virtual ~TriEvidenceOpener() {}

    /**
     * Open the container and mount its volumes.
     * @param imagePath Image or first segment.
     * @param summary Receives the basic image information.
     * @throws TriImageFormatException if the container cannot be opened.
     * @throws TriFilesystemException if no volume can be mounted.
     */
    virtual std::unique_ptr<TriFilesystemWalker> open(const std::string &imagePath, TriImageSummary &summary) = 0;
};

/**
 * Opens images with libtsk.
 */
class TRI_FRAMEWORK_API TriEvidenceOpenerTsk : public TriEvidenceOpener
{
public:
    /**
     * @param maxFileReadBytes Largest file the walker will read.
     * @param computeHashes Hash the whole image for the summary.
     */
    TriEvidenceOpenerTsk(uint64_t maxFileReadBytes, bool computeHashes);

    virtual std::unique_ptr<TriFilesystemWalker> open(const std::string &imagePath, TriImageSummary &summary);

private:
    uint64_t m_maxFileReadBytes;
    bool m_computeHashes;
};

#endif
