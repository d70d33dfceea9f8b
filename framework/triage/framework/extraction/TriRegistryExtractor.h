/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRegistryExtractor.h
 * Contains the interface of the TriRegistryExtractor class.
 */

#ifndef _TRI_REGISTRYEXTRACTOR_H
#define _TRI_REGISTRYEXTRACTOR_H

#include "TriExtractor.h"

/**
 * Extracts USB device history, installed programs, autostart (run key)
 * entries and host information from the SYSTEM, SOFTWARE and NTUSER.DAT
 * hives.
 */
class TRI_FRAMEWORK_API TriRegistryExtractor : public TriExtractor
{
public:
    virtual std::string getName() const { return "registry"; }
    virtual std::vector<TRI_ARTIFACT_TYPE> getArtifactTypes() const;
    virtual Status extract(TriFilesystemWalker &walker, const std::string &caseId, TriArtifactSink &sink);

    /// Artifacts decoded from a SYSTEM hive.
    void extractSystemHive(const TriRegistryHive &hive, const std::string &caseId,
        const std::string &source, TriArtifactSink &sink) const;

    /// Artifacts decoded from a SOFTWARE hive.
    void extractSoftwareHive(const TriRegistryHive &hive, const std::string &caseId,
        const std::string &source, TriArtifactSink &sink) const;

    /// Artifacts decoded from a user's NTUSER.DAT hive.
    void extractUserHive(const TriRegistryHive &hive, const std::string &user, const std::string &caseId,
        const std::string &source, TriArtifactSink &sink) const;

    /**
     * Name of the control set the system booted with, from Select\\Current.
     * Falls back to ControlSet001.
     */
    static std::string currentControlSet(const TriRegistryHive &hive);

    /**
     * Serial number of a USB device from its instance id.  Instance ids
     * generated by Windows (second character '&') are returned unchanged;
     * the "&N" port suffix of real serials is removed.
     */
    static std::string serialFromInstanceId(const std::string &instanceId);

private:
    void usbDevices(const TriRegistryHive &hive, const std::string &controlSet, const std::string &enumClass,
        const std::string &caseId, const std::string &source, TriArtifactSink &sink) const;
    void runKeys(const TriRegistryHive &hive, const std::string &hiveLabel, const char * const paths[], size_t count,
        const std::string &caseId, const std::string &source, TriArtifactSink &sink) const;
    void systemInfo(const TriRegistryHive &hive, const std::string &keyPath, const char * const names[], size_t count,
        const std::string &category, const std::string &caseId, const std::string &source, TriArtifactSink &sink) const;
};

#endif
