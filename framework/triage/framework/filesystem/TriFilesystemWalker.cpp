/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriFilesystemWalker.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriUtilities.h"

namespace
{
    const char * const PROFILE_ROOTS[] = { "/Users", "/Documents and Settings" };

    const char * const SYSTEM_PROFILES[] = { ".", "..", "All Users", "Default", "Default User", "Public" };

    bool isSystemProfile(const std::string &name)
    {
        for (size_t i = 0; i < sizeof(SYSTEM_PROFILES) / sizeof(SYSTEM_PROFILES[0]); i++) {
            if (TriUtilities::iequals(name, SYSTEM_PROFILES[i]))
                return true;
        }
        return false;
    }
}

TriFilesystemWalker::TriFilesystemWalker()
{
}

TriFilesystemWalker::~TriFilesystemWalker()
{
}

std::vector<TriUserProfile> TriFilesystemWalker::listUserProfiles(unsigned int volume)
{
    std::vector<TriUserProfile> profiles;

    for (size_t r = 0; r < sizeof(PROFILE_ROOTS) / sizeof(PROFILE_ROOTS[0]); r++) {
        std::vector<TriDirEntry> entries = listDirectory(volume, PROFILE_ROOTS[r]);
        for (std::vector<TriDirEntry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
            if (!it->isDirectory || isSystemProfile(it->name))
                continue;

            TriUserProfile profile;
            profile.name = it->name;
            profile.path = it->path;
            profiles.push_back(profile);
        }
    }

    return profiles;
}

std::vector<std::string> TriFilesystemWalker::takeWarnings()
{
    Poco::FastMutex::ScopedLock lock(m_warningsMutex);
    std::vector<std::string> warnings;
    warnings.swap(m_warnings);
    return warnings;
}

void TriFilesystemWalker::addWarning(const std::string &warning)
{
    LOGWARN(warning);
    Poco::FastMutex::ScopedLock lock(m_warningsMutex);
    m_warnings.push_back(warning);
}

std::string TriFilesystemWalker::joinPath(const std::string &dir, const std::string &name)
{
    if (dir.empty() || dir == "/")
        return "/" + name;
    if (dir[dir.size() - 1] == '/')
        return dir + name;
    return dir + "/" + name;
}
