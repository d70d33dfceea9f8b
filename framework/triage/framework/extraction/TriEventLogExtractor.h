/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriEventLogExtractor.h
 * Contains the interface of the TriEventLogExtractor class.
 */

#ifndef _TRI_EVENTLOGEXTRACTOR_H
#define _TRI_EVENTLOGEXTRACTOR_H

#include "TriExtractor.h"

/**
 * Extracts the records of legacy (.evt) Windows event logs and inventories
 * the Vista and later (.evtx) log files.
 */
class TRI_FRAMEWORK_API TriEventLogExtractor : public TriExtractor
{
public:
    virtual std::string getName() const { return "eventlog"; }
    virtual std::vector<TRI_ARTIFACT_TYPE> getArtifactTypes() const;
    virtual Status extract(TriFilesystemWalker &walker, const std::string &caseId, TriArtifactSink &sink);

    /**
     * Decode the records of an .evt file.  Records that fail to decode are
     * skipped; the number of skipped records is returned.
     * @throws TriCorruptStructureException if the file header is invalid.
     */
    unsigned int parseEvt(const std::vector<uint8_t> &data, const std::string &caseId, const std::string &source,
        const std::string &logName, TriArtifactSink &sink) const;

    /// "Error", "Warning", "Information", "Success Audit", "Failure Audit".
    static std::string eventTypeName(uint16_t type);

    /// "logon", "logoff", "failed_logon", "log_cleared", "system" or "other".
    static std::string eventCategory(uint32_t eventId);

    /// Short description of well known event ids, empty when unknown.
    static std::string eventDescription(uint32_t eventId);

private:
    bool parseEvtRecord(const std::vector<uint8_t> &data, size_t offset, uint32_t length, const std::string &caseId,
        const std::string &source, const std::string &logName, TriArtifactSink &sink) const;
    void inventoryEvtx(const TriDirEntry &entry, const std::vector<uint8_t> &header, const std::string &caseId,
        const std::string &source, TriArtifactSink &sink) const;
};

#endif
