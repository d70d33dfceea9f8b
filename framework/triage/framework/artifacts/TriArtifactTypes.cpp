/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriArtifactTypes.h"

namespace
{
    struct TypeName
    {
        TRI_ARTIFACT_TYPE type;
        const char *name;
        const char *displayName;
    };

    const TypeName typeNames[] =
    {
        { TRI_BROWSER_HISTORY, "browser_history", "Browser History" },
        { TRI_BROWSER_COOKIE, "browser_cookie", "Browser Cookie" },
        { TRI_BROWSER_DOWNLOAD, "browser_download", "Browser Download" },
        { TRI_USB_DEVICE, "usb_device", "USB Device" },
        { TRI_INSTALLED_PROGRAM, "installed_program", "Installed Program" },
        { TRI_RUN_KEY, "run_key", "Run Key" },
        { TRI_SYSTEM_INFO, "system_info", "System Information" },
        { TRI_DELETED_FILE, "deleted_file", "Deleted File" },
        { TRI_EVENT_LOG, "event_log", "Event Log" },
        { TRI_USER_ASSIST, "user_assist", "UserAssist" },
        { TRI_PREFETCH, "prefetch", "Prefetch" },
        { TRI_SHORTCUT, "shortcut", "Shortcut" },
        { TRI_JUMP_LIST, "jump_list", "Jump List" }
    };

    const size_t NUM_TYPES = sizeof(typeNames) / sizeof(typeNames[0]);
}

std::string TriArtifactTypes::getName(TRI_ARTIFACT_TYPE type)
{
    for (size_t i = 0; i < NUM_TYPES; i++) {
        if (typeNames[i].type == type)
            return typeNames[i].name;
    }
    return "unknown";
}

std::string TriArtifactTypes::getDisplayName(TRI_ARTIFACT_TYPE type)
{
    for (size_t i = 0; i < NUM_TYPES; i++) {
        if (typeNames[i].type == type)
            return typeNames[i].displayName;
    }
    return "Unknown";
}

TRI_ARTIFACT_TYPE TriArtifactTypes::fromName(const std::string &name)
{
    for (size_t i = 0; i < NUM_TYPES; i++) {
        if (name == typeNames[i].name)
            return typeNames[i].type;
    }
    return TRI_ART_UNKNOWN;
}

std::vector<TRI_ARTIFACT_TYPE> TriArtifactTypes::all()
{
    std::vector<TRI_ARTIFACT_TYPE> types;
    for (size_t i = 0; i < NUM_TYPES; i++)
        types.push_back(typeNames[i].type);
    return types;
}
