/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRecycleBinExtractor.h
 * Contains the interface of the TriRecycleBinExtractor class.
 */

#ifndef _TRI_RECYCLEBINEXTRACTOR_H
#define _TRI_RECYCLEBINEXTRACTOR_H

#include "TriExtractor.h"

/**
 * Produces deleted file artifacts from the recycle bin index records
 * (INFO2 on Windows XP and older, $I files on Vista and later) and from
 * entries the filesystem still describes although they are unlinked.  A
 * deletion is reported from the metadata alone, whether or not the file
 * content survives.
 */
class TRI_FRAMEWORK_API TriRecycleBinExtractor : public TriExtractor
{
public:
    virtual std::string getName() const { return "recyclebin"; }
    virtual std::vector<TRI_ARTIFACT_TYPE> getArtifactTypes() const;
    virtual Status extract(TriFilesystemWalker &walker, const std::string &caseId, TriArtifactSink &sink);

    /**
     * Decode an INFO2 file.
     * @throws TriCorruptStructureException if the header is invalid.
     */
    void parseInfo2(const std::vector<uint8_t> &data, const std::string &caseId, const std::string &source,
        TriArtifactSink &sink) const;

    /**
     * Decode a $I file (format version 1 or 2).
     * @throws TriCorruptStructureException if the record is invalid.
     */
    TriArtifact parseDollarI(const std::vector<uint8_t> &data, const std::string &caseId,
        const std::string &source) const;

private:
    void extractRecycler(TriFilesystemWalker &walker, unsigned int volume, const std::string &dir,
        const std::string &caseId, TriArtifactSink &sink);
    void extractRecycleBin(TriFilesystemWalker &walker, unsigned int volume, const std::string &dir,
        const std::string &caseId, TriArtifactSink &sink);
    void extractUnlinked(TriFilesystemWalker &walker, unsigned int volume, const std::string &caseId,
        TriArtifactSink &sink);
};

#endif
