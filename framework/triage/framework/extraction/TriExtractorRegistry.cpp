/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriExtractorRegistry.cpp
 * Contains the implementation for the TriExtractorRegistry class.
 */

#include "TriExtractorRegistry.h"
#include "TriBrowserExtractor.h"
#include "TriRegistryExtractor.h"
#include "TriRecycleBinExtractor.h"
#include "TriEventLogExtractor.h"
#include "TriUserActivityExtractor.h"
#include "TriFileSystemExtractor.h"

#include <algorithm>

TriExtractorRegistry::TriExtractorRegistry()
{
    m_extractors.push_back(new TriBrowserExtractor());
    m_extractors.push_back(new TriRegistryExtractor());
    m_extractors.push_back(new TriRecycleBinExtractor());
    m_extractors.push_back(new TriEventLogExtractor());
    m_extractors.push_back(new TriUserActivityExtractor());
    m_extractors.push_back(new TriFileSystemExtractor());
}

TriExtractorRegistry::~TriExtractorRegistry()
{
    for (std::vector<TriExtractor *>::iterator it = m_extractors.begin(); it < m_extractors.end(); it++)
        delete *it;
}

TriExtractor *TriExtractorRegistry::findByType(TRI_ARTIFACT_TYPE type) const
{
    for (std::vector<TriExtractor *>::const_iterator it = m_extractors.begin(); it != m_extractors.end(); ++it) {
        std::vector<TRI_ARTIFACT_TYPE> types = (*it)->getArtifactTypes();
        if (std::find(types.begin(), types.end(), type) != types.end())
            return *it;
    }
    return NULL;
}

TriExtractor *TriExtractorRegistry::findByName(const std::string &name) const
{
    for (std::vector<TriExtractor *>::const_iterator it = m_extractors.begin(); it != m_extractors.end(); ++it) {
        if ((*it)->getName() == name)
            return *it;
    }
    return NULL;
}
