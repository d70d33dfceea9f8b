/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRegistryExtractor.cpp
 * Registry artifact extraction.
 */

#include "TriRegistryExtractor.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "Poco/DateTime.h"
#include "Poco/DateTimeParser.h"
#include "Poco/NumberFormatter.h"

#include <algorithm>
#include <sstream>

namespace
{
    const char * const SYSTEM_RUN_KEYS[] = {
        "Microsoft\\Windows\\CurrentVersion\\Run",
        "Microsoft\\Windows\\CurrentVersion\\RunOnce",
        "Microsoft\\Windows\\CurrentVersion\\RunServices",
        "Microsoft\\Windows\\CurrentVersion\\RunServicesOnce",
        "Wow6432Node\\Microsoft\\Windows\\CurrentVersion\\Run",
        "Wow6432Node\\Microsoft\\Windows\\CurrentVersion\\RunOnce"
    };

    const char * const USER_RUN_KEYS[] = {
        "Software\\Microsoft\\Windows\\CurrentVersion\\Run",
        "Software\\Microsoft\\Windows\\CurrentVersion\\RunOnce"
    };

    const char * const UNINSTALL_KEYS[] = {
        "Microsoft\\Windows\\CurrentVersion\\Uninstall",
        "Wow6432Node\\Microsoft\\Windows\\CurrentVersion\\Uninstall"
    };

    const char * const PROGRAM_VALUES[] = {
        "DisplayVersion", "Publisher", "InstallDate", "InstallLocation", "UninstallString", "EstimatedSize"
    };

    const char * const WINLOGON_VALUES[] = { "DefaultUserName", "DefaultDomainName", "LastUsedUsername" };
    const char * const TIMEZONE_VALUES[] = {
        "TimeZoneKeyName", "StandardName", "DaylightName", "Bias", "StandardBias", "DaylightBias"
    };
    const char * const TCPIP_VALUES[] = { "Hostname", "Domain", "DhcpDomain", "SearchList" };
    const char * const COMPUTERNAME_VALUES[] = { "ComputerName" };
    const char * const ADAPTER_VALUES[] = { "DriverDesc", "DriverVersion", "DriverDate", "NetCfgInstanceId" };

    const char * const NETWORK_ADAPTER_CLASS = "Control\\Class\\{4D36E972-E325-11CE-BFC1-08002BE10318}";

    // device property set holding install / arrival / removal times
    const char * const DEVICE_TIMES_KEY = "{83da6326-97a6-4088-9453-a1923f573b29}";
    const char * const DEVICE_TIME_PROPS[] = { "0064", "0065", "0066", "0067" };

    template <size_t N>
    size_t countOf(const char * const (&)[N]) { return N; }

    /**
     * FILETIME stored in a device property key, either directly as its
     * default value (Windows 8 and later) or one level below (Windows 7).
     */
    int64_t devicePropertyTime(const TriRegistryKey &times, const std::string &prop)
    {
        TriRegistryKey propKey;
        if (!times.getSubkey(prop, propKey) && !times.getSubkey("0000" + prop, propKey))
            return 0;

        std::vector<TriRegistryKey> candidates;
        candidates.push_back(propKey);
        TriRegistryKey::KeyList subkeys = propKey.getSubkeyList();
        candidates.insert(candidates.end(), subkeys.begin(), subkeys.end());

        for (size_t i = 0; i < candidates.size(); i++) {
            TriRegistryKey::ValueList values = candidates[i].getValueList();
            for (size_t v = 0; v < values.size(); v++) {
                if (values[v].getData().size() >= 8)
                    return TriUtilities::filetimeToUnix(TriUtilities::getU64LE(values[v].getData(), 0));
            }
        }
        return 0;
    }

    std::string valueString(const TriRegistryKey &key, const std::string &name)
    {
        TriRegistryValue value;
        if (!key.getValue(name, value))
            return std::string();
        return value.toString();
    }
}

std::vector<TRI_ARTIFACT_TYPE> TriRegistryExtractor::getArtifactTypes() const
{
    std::vector<TRI_ARTIFACT_TYPE> types;
    types.push_back(TRI_USB_DEVICE);
    types.push_back(TRI_INSTALLED_PROGRAM);
    types.push_back(TRI_RUN_KEY);
    types.push_back(TRI_SYSTEM_INFO);
    return types;
}

TriExtractor::Status TriRegistryExtractor::extract(TriFilesystemWalker &walker, const std::string &caseId,
    TriArtifactSink &sink)
{
    std::vector<TriVolume> volumes = walker.listVolumes();

    for (std::vector<TriVolume>::const_iterator vol = volumes.begin(); vol != volumes.end(); ++vol) {
        std::vector<std::string> roots = systemRoots(walker, vol->index);
        for (std::vector<std::string>::const_iterator root = roots.begin(); root != roots.end(); ++root) {
            std::string config = *root + "/System32/config";

            std::string systemPath = config + "/SYSTEM";
            std::unique_ptr<TriRegistryHive> system = loadHive(walker, vol->index, systemPath, sink);
            if (system.get()) {
                try {
                    extractSystemHive(*system, caseId, sourcePath(vol->index, systemPath), sink);
                }
                catch (TriCorruptStructureException &ex) {
                    warn(sink, sourcePath(vol->index, systemPath), ex.message());
                }
            }

            std::string softwarePath = config + "/SOFTWARE";
            std::unique_ptr<TriRegistryHive> software = loadHive(walker, vol->index, softwarePath, sink);
            if (software.get()) {
                try {
                    extractSoftwareHive(*software, caseId, sourcePath(vol->index, softwarePath), sink);
                }
                catch (TriCorruptStructureException &ex) {
                    warn(sink, sourcePath(vol->index, softwarePath), ex.message());
                }
            }
        }

        std::vector<TriUserProfile> profiles = walker.listUserProfiles(vol->index);
        for (std::vector<TriUserProfile>::const_iterator profile = profiles.begin(); profile != profiles.end(); ++profile) {
            std::string ntuserPath = TriFilesystemWalker::joinPath(profile->path, "NTUSER.DAT");
            std::unique_ptr<TriRegistryHive> ntuser = loadHive(walker, vol->index, ntuserPath, sink);
            if (ntuser.get() == NULL)
                continue;
            try {
                extractUserHive(*ntuser, profile->name, caseId, sourcePath(vol->index, ntuserPath), sink);
            }
            catch (TriCorruptStructureException &ex) {
                warn(sink, sourcePath(vol->index, ntuserPath), ex.message());
            }
        }
    }
    return OK;
}

std::string TriRegistryExtractor::currentControlSet(const TriRegistryHive &hive)
{
    TriRegistryKey select;
    TriRegistryValue current;
    if (hive.findKey("Select", select) && select.getValue("Current", current)) {
        try {
            uint64_t num = current.getAsNumber();
            std::string name = "ControlSet" + Poco::NumberFormatter::format0((int)num, 3);
            TriRegistryKey controlSet;
            if (hive.findKey(name, controlSet))
                return name;
        }
        catch (TriCorruptStructureException &) {
            // not a number, use the fallback
        }
    }
    return "ControlSet001";
}

std::string TriRegistryExtractor::serialFromInstanceId(const std::string &instanceId)
{
    if (instanceId.size() > 1 && instanceId[1] == '&')
        return instanceId;

    std::string::size_type amp = instanceId.rfind('&');
    if (amp != std::string::npos && amp + 1 < instanceId.size()) {
        std::string suffix = instanceId.substr(amp + 1);
        if (suffix.find_first_not_of("0123456789") == std::string::npos)
            return instanceId.substr(0, amp);
    }
    return instanceId;
}

void TriRegistryExtractor::extractSystemHive(const TriRegistryHive &hive, const std::string &caseId,
    const std::string &source, TriArtifactSink &sink) const
{
    std::string controlSet = currentControlSet(hive);

    usbDevices(hive, controlSet, "USBSTOR", caseId, source, sink);
    usbDevices(hive, controlSet, "USB", caseId, source, sink);

    systemInfo(hive, controlSet + "\\Control\\TimeZoneInformation", TIMEZONE_VALUES, countOf(TIMEZONE_VALUES),
        "timezone", caseId, source, sink);
    systemInfo(hive, controlSet + "\\Services\\Tcpip\\Parameters", TCPIP_VALUES, countOf(TCPIP_VALUES),
        "tcpip", caseId, source, sink);
    systemInfo(hive, controlSet + "\\Control\\ComputerName\\ComputerName", COMPUTERNAME_VALUES,
        countOf(COMPUTERNAME_VALUES), "computer_name", caseId, source, sink);

    TriRegistryKey adapters;
    if (hive.findKey(controlSet + "\\" + NETWORK_ADAPTER_CLASS, adapters)) {
        TriRegistryKey::KeyList keys = adapters.getSubkeyList();
        for (TriRegistryKey::KeyList::const_iterator it = keys.begin(); it != keys.end(); ++it) {
            std::string name = it->getName();
            if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos)
                continue;
            systemInfo(hive, controlSet + "\\" + NETWORK_ADAPTER_CLASS + "\\" + name, ADAPTER_VALUES,
                countOf(ADAPTER_VALUES), "network_adapter_" + name, caseId, source, sink);
        }
    }
}

void TriRegistryExtractor::usbDevices(const TriRegistryHive &hive, const std::string &controlSet,
    const std::string &enumClass, const std::string &caseId, const std::string &source, TriArtifactSink &sink) const
{
    TriRegistryKey enumKey;
    if (!hive.findKey(controlSet + "\\Enum\\" + enumClass, enumKey))
        return;

    TriRegistryKey::KeyList devices = enumKey.getSubkeyList();
    for (TriRegistryKey::KeyList::const_iterator device = devices.begin(); device != devices.end(); ++device) {
        std::string deviceName = device->getName();
        TriRegistryKey::KeyList instances = device->getSubkeyList();
        for (TriRegistryKey::KeyList::const_iterator instance = instances.begin(); instance != instances.end(); ++instance) {
            std::string instanceId = instance->getName();
            std::string serial = serialFromInstanceId(instanceId);
            std::string friendlyName = valueString(*instance, "FriendlyName");

            // seen range from the device property times, else the key write time
            std::vector<int64_t> times;
            TriRegistryKey properties;
            TriRegistryKey timesKey;
            if (instance->getSubkey("Properties", properties) && properties.getSubkey(DEVICE_TIMES_KEY, timesKey)) {
                for (size_t i = 0; i < countOf(DEVICE_TIME_PROPS); i++) {
                    int64_t t = devicePropertyTime(timesKey, DEVICE_TIME_PROPS[i]);
                    if (t > 0)
                        times.push_back(t);
                }
            }
            int64_t written = instance->getLastWriteTime();
            if (written > 0)
                times.push_back(written);

            TriArtifact artifact(TRI_USB_DEVICE, caseId);
            artifact.setSource(source);
            artifact.setNaturalKey(serial);
            if (!times.empty()) {
                int64_t first = *std::min_element(times.begin(), times.end());
                int64_t last = *std::max_element(times.begin(), times.end());
                artifact.setSeenRange(first, last);
                artifact.setTimestamp(first);
            }

            std::string label = friendlyName.empty() ? deviceName : friendlyName;
            artifact.setDescription("USB device " + label + " (serial " + serial + ") connected");
            artifact.addAttribute("device_class", enumClass);
            artifact.addAttribute("device_name", deviceName);
            artifact.addAttribute("instance_id", instanceId);
            artifact.addAttribute("serial", serial);
            if (!friendlyName.empty())
                artifact.addAttribute("friendly_name", friendlyName);
            sink.add(artifact);
        }
    }
}

void TriRegistryExtractor::extractSoftwareHive(const TriRegistryHive &hive, const std::string &caseId,
    const std::string &source, TriArtifactSink &sink) const
{
    for (size_t u = 0; u < countOf(UNINSTALL_KEYS); u++) {
        TriRegistryKey uninstall;
        if (!hive.findKey(UNINSTALL_KEYS[u], uninstall))
            continue;

        TriRegistryKey::KeyList programs = uninstall.getSubkeyList();
        for (TriRegistryKey::KeyList::const_iterator program = programs.begin(); program != programs.end(); ++program) {
            std::string displayName = valueString(*program, "DisplayName");
            if (displayName.empty())
                continue;

            std::string keyPath = std::string("HKLM\\SOFTWARE\\") + UNINSTALL_KEYS[u] + "\\" + program->getName();

            TriArtifact artifact(TRI_INSTALLED_PROGRAM, caseId);
            artifact.setSource(source);
            artifact.setNaturalKey(keyPath);
            artifact.setDescription("Installed program " + displayName);
            artifact.addAttribute("display_name", displayName);
            artifact.addAttribute("registry_key", keyPath);

            for (size_t v = 0; v < countOf(PROGRAM_VALUES); v++) {
                std::string value = valueString(*program, PROGRAM_VALUES[v]);
                if (!value.empty())
                    artifact.addAttribute(TriUtilities::toLower(PROGRAM_VALUES[v]), value);
            }

            // InstallDate is YYYYMMDD when present
            int64_t installed = 0;
            Poco::DateTime date;
            int tzd;
            std::string installDate = valueString(*program, "InstallDate");
            if (installDate.size() == 8 && Poco::DateTimeParser::tryParse("%Y%m%d", installDate, date, tzd))
                installed = (int64_t)date.timestamp().epochTime();
            artifact.setTimestamp(installed > 0 ? installed : program->getLastWriteTime());
            sink.add(artifact);
        }
    }

    runKeys(hive, "HKLM\\SOFTWARE", SYSTEM_RUN_KEYS, countOf(SYSTEM_RUN_KEYS), caseId, source, sink);

    systemInfo(hive, "Microsoft\\Windows NT\\CurrentVersion\\Winlogon", WINLOGON_VALUES, countOf(WINLOGON_VALUES),
        "last_logon", caseId, source, sink);
}

void TriRegistryExtractor::extractUserHive(const TriRegistryHive &hive, const std::string &user,
    const std::string &caseId, const std::string &source, TriArtifactSink &sink) const
{
    runKeys(hive, "HKU\\" + user, USER_RUN_KEYS, countOf(USER_RUN_KEYS), caseId, source, sink);
}

void TriRegistryExtractor::runKeys(const TriRegistryHive &hive, const std::string &hiveLabel,
    const char * const paths[], size_t count, const std::string &caseId, const std::string &source,
    TriArtifactSink &sink) const
{
    for (size_t p = 0; p < count; p++) {
        TriRegistryKey runKey;
        if (!hive.findKey(paths[p], runKey))
            continue;

        int64_t written = runKey.getLastWriteTime();
        TriRegistryKey::ValueList values = runKey.getValueList();
        for (TriRegistryKey::ValueList::const_iterator value = values.begin(); value != values.end(); ++value) {
            std::string keyPath = hiveLabel + "\\" + paths[p] + "\\" + value->getName();
            std::string command = value->toString();

            TriArtifact artifact(TRI_RUN_KEY, caseId);
            artifact.setSource(source);
            artifact.setNaturalKey(keyPath);
            artifact.setTimestamp(written);
            artifact.setDescription("Autostart entry " + value->getName() + ": " + command);
            artifact.addAttribute("hive", hiveLabel);
            artifact.addAttribute("key_path", paths[p]);
            artifact.addAttribute("name", value->getName());
            artifact.addAttribute("command", command);
            sink.add(artifact);
        }
    }
}

void TriRegistryExtractor::systemInfo(const TriRegistryHive &hive, const std::string &keyPath,
    const char * const names[], size_t count, const std::string &category, const std::string &caseId,
    const std::string &source, TriArtifactSink &sink) const
{
    TriRegistryKey key;
    if (!hive.findKey(keyPath, key))
        return;

    TriArtifact artifact(TRI_SYSTEM_INFO, caseId);
    artifact.setSource(source);
    artifact.setNaturalKey(category);

    std::stringstream description;
    description << category << ":";
    for (size_t i = 0; i < count; i++) {
        std::string value = valueString(key, names[i]);
        if (value.empty())
            continue;
        artifact.addAttribute(TriUtilities::toLower(names[i]), value);
        description << " " << names[i] << "=" << value;
    }

    if (artifact.getAttributes().empty())
        return;

    artifact.addAttribute("category", category);
    artifact.setDescription(description.str());
    sink.add(artifact);
}
