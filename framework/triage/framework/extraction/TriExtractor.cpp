/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriExtractor.cpp
 * Contains the implementation of the TriExtractor helpers.
 */

#include "TriExtractor.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include <sstream>

TriExtractor::TriExtractor()
{
}

TriExtractor::~TriExtractor()
{
}

bool TriExtractor::readOptionalFile(TriFilesystemWalker &walker, unsigned int volume, const std::string &path,
    std::vector<uint8_t> &data, TriArtifactSink &sink) const
{
    try {
        data = walker.readFile(volume, path);
        return true;
    }
    catch (TriFileNotFoundException &) {
        return false;
    }
    catch (TriException &ex) {
        warn(sink, sourcePath(volume, path), ex.message());
        return false;
    }
}

std::unique_ptr<TriRegistryHive> TriExtractor::loadHive(TriFilesystemWalker &walker, unsigned int volume,
    const std::string &path, TriArtifactSink &sink) const
{
    std::vector<uint8_t> data;
    if (!readOptionalFile(walker, volume, path, data, sink))
        return std::unique_ptr<TriRegistryHive>();

    try {
        return std::unique_ptr<TriRegistryHive>(new TriRegistryHive(data));
    }
    catch (TriCorruptStructureException &ex) {
        warn(sink, sourcePath(volume, path), ex.message());
        return std::unique_ptr<TriRegistryHive>();
    }
}

std::vector<std::string> TriExtractor::systemRoots(TriFilesystemWalker &walker, unsigned int volume)
{
    // taken from the listing so that a case insensitive filesystem
    // does not report the same directory under both names
    std::vector<std::string> roots;
    std::vector<TriDirEntry> entries = walker.listDirectory(volume, "/");
    for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
        if (it->isDirectory && (TriUtilities::iequals(it->name, "Windows") || TriUtilities::iequals(it->name, "WINNT")))
            roots.push_back(it->path);
    }
    return roots;
}

std::string TriExtractor::sourcePath(unsigned int volume, const std::string &path)
{
    std::stringstream source;
    source << "vol" << volume << ":" << path;
    return source.str();
}

void TriExtractor::warn(TriArtifactSink &sink, const std::string &path, const std::string &problem) const
{
    std::stringstream msg;
    msg << getName() << ": " << path << ": " << problem;
    LOGWARN(msg.str());
    sink.warn(msg.str());
}
