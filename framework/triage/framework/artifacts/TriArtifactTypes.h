/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifactTypes.h
 * Contains the artifact type enumeration and its name table.
 */

#ifndef _TRI_ARTIFACTTYPES_H
#define _TRI_ARTIFACTTYPES_H

#include <string>
#include <vector>
#include "triage/framework/framework_i.h"

/**
 * Built in artifact types. The numeric values are persisted in the
 * artifact store and must not be renumbered.
 */
enum TRI_ARTIFACT_TYPE {
    TRI_ART_UNKNOWN = 0,        ///< Not a valid artifact type
    TRI_BROWSER_HISTORY = 1,    ///< A visited URL
    TRI_BROWSER_COOKIE = 2,     ///< A browser cookie
    TRI_BROWSER_DOWNLOAD = 3,   ///< A downloaded file
    TRI_USB_DEVICE = 4,         ///< A USB storage device seen by the system
    TRI_INSTALLED_PROGRAM = 5,  ///< An Uninstall registry entry
    TRI_RUN_KEY = 6,            ///< An autostart registry value
    TRI_SYSTEM_INFO = 7,        ///< Host configuration (user, time zone, network)
    TRI_DELETED_FILE = 8,       ///< A recycle bin record or unlinked filesystem entry
    TRI_EVENT_LOG = 9,          ///< A Windows event log record
    TRI_USER_ASSIST = 10,       ///< A UserAssist execution counter
    TRI_PREFETCH = 11,          ///< A prefetch execution record
    TRI_SHORTCUT = 12,          ///< A shell link (.lnk) file
    TRI_JUMP_LIST = 13,         ///< A jump list file
    TRI_ART_END = 14
};

/**
 * Name lookups for TRI_ARTIFACT_TYPE.
 */
class TRI_FRAMEWORK_API TriArtifactTypes
{
public:
    /// Short name, also used as the name of the store table ("browser_history").
    static std::string getName(TRI_ARTIFACT_TYPE type);
    /// Human readable name ("Browser History").
    static std::string getDisplayName(TRI_ARTIFACT_TYPE type);
    /// Inverse of getName(). Returns TRI_ART_UNKNOWN for unknown names.
    static TRI_ARTIFACT_TYPE fromName(const std::string &name);
    /// All valid artifact types in numeric order.
    static std::vector<TRI_ARTIFACT_TYPE> all();
};

#endif
