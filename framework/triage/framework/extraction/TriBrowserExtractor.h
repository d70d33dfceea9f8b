/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriBrowserExtractor.h
 * Contains the interface of the TriBrowserExtractor class.
 */

#ifndef _TRI_BROWSEREXTRACTOR_H
#define _TRI_BROWSEREXTRACTOR_H

#include "TriExtractor.h"

class TriEvidenceDatabase;

/**
 * Extracts history, cookies and downloads of Firefox, Chrome, Edge and
 * Internet Explorer from every user profile.
 */
class TRI_FRAMEWORK_API TriBrowserExtractor : public TriExtractor
{
public:
    virtual std::string getName() const { return "browser"; }
    virtual std::vector<TRI_ARTIFACT_TYPE> getArtifactTypes() const;
    virtual Status extract(TriFilesystemWalker &walker, const std::string &caseId, TriArtifactSink &sink);

    /**
     * Decode the URL records of an Internet Explorer index.dat file.
     */
    void parseIndexDat(const std::vector<uint8_t> &data, const std::string &caseId,
        const std::string &source, const std::string &profile, TriArtifactSink &sink) const;

private:
    void extractFirefox(TriFilesystemWalker &walker, unsigned int volume, const std::string &profile,
        const std::string &profileName, const std::string &caseId, TriArtifactSink &sink);
    void extractChromium(TriFilesystemWalker &walker, unsigned int volume, const std::string &userDataDir,
        const std::string &browser, const std::string &profileName, const std::string &caseId, TriArtifactSink &sink);
    void extractInternetExplorer(TriFilesystemWalker &walker, unsigned int volume, const std::string &profile,
        const std::string &profileName, const std::string &caseId, TriArtifactSink &sink);

    void firefoxHistory(TriEvidenceDatabase &db, const std::string &caseId, const std::string &source,
        const std::string &profile, TriArtifactSink &sink) const;
    void firefoxDownloads(TriEvidenceDatabase &db, const std::string &caseId, const std::string &source,
        const std::string &profile, TriArtifactSink &sink) const;
    void firefoxCookies(TriEvidenceDatabase &db, const std::string &caseId, const std::string &source,
        const std::string &profile, TriArtifactSink &sink) const;
    void chromiumHistory(TriEvidenceDatabase &db, const std::string &browser, const std::string &caseId,
        const std::string &source, const std::string &profile, TriArtifactSink &sink) const;
    void chromiumDownloads(TriEvidenceDatabase &db, const std::string &browser, const std::string &caseId,
        const std::string &source, const std::string &profile, TriArtifactSink &sink) const;
    void chromiumCookies(TriEvidenceDatabase &db, const std::string &browser, const std::string &caseId,
        const std::string &source, const std::string &profile, TriArtifactSink &sink) const;
};

#endif
