/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriExtractor.h
 * Contains the interface of the TriExtractor class.
 */

#ifndef _TRI_EXTRACTOR_H
#define _TRI_EXTRACTOR_H

#include "TriArtifactSink.h"
#include "triage/framework/filesystem/TriFilesystemWalker.h"
#include "triage/framework/registry/TriRegistryHive.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Interface for the artifact decoders.  An extractor reads what it needs
 * through a TriFilesystemWalker and pushes the artifacts it decodes to a
 * TriArtifactSink.  Extraction only reads from the walker, so running
 * extract() again on the same image produces the same artifacts from the
 * beginning.
 *
 * Extractors are independent of each other.  A structure that is absent
 * from the image yields no artifacts and is not an error; a structure that
 * is present but damaged is reported with TriArtifactSink::warn() and the
 * extractor carries on with the rest of the image.
 */
class TRI_FRAMEWORK_API TriExtractor
{
public:
    /// Standard values that extract() can return.
    enum Status
    {
        OK = 0, ///< The extractor ran over the whole image, possibly with warnings.
        FAIL    ///< The extractor could not do its work at all.
    };

    TriExtractor();
    virtual ~TriExtractor();

    /// Short unique name, e.g. "registry".
    virtual std::string getName() const = 0;

    /// The artifact types this extractor produces.
    virtual std::vector<TRI_ARTIFACT_TYPE> getArtifactTypes() const = 0;

    virtual Status extract(TriFilesystemWalker &walker, const std::string &caseId, TriArtifactSink &sink) = 0;

protected:
    /**
     * Read a file that may legitimately be absent.
     * @returns false if the file does not exist or could not be read; a
     * read failure is reported to the sink.
     */
    bool readOptionalFile(TriFilesystemWalker &walker, unsigned int volume, const std::string &path,
        std::vector<uint8_t> &data, TriArtifactSink &sink) const;

    /**
     * Load a registry hive that may legitimately be absent.
     * @returns NULL if the hive does not exist or is damaged; damage is
     * reported to the sink.
     */
    std::unique_ptr<TriRegistryHive> loadHive(TriFilesystemWalker &walker, unsigned int volume,
        const std::string &path, TriArtifactSink &sink) const;

    /// The Windows system directories ("/Windows", "/WINNT") present on a volume.
    static std::vector<std::string> systemRoots(TriFilesystemWalker &walker, unsigned int volume);

    /**
     * Provenance string of a file, "vol<N>:<path>".
     */
    static std::string sourcePath(unsigned int volume, const std::string &path);

    /**
     * Report a damaged structure to the sink and the log.
     */
    void warn(TriArtifactSink &sink, const std::string &path, const std::string &problem) const;

private:
    // Prohibit copying.
    TriExtractor(const TriExtractor&);
    TriExtractor& operator=(const TriExtractor&);
};

#endif
