/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifact.cpp
 * Contains the implementation of the TriArtifact and TriArtifactAttribute classes.
 */

#include "TriArtifact.h"
#include <sstream>

TriArtifactAttribute::TriArtifactAttribute(const std::string &name, const std::string &value)
    : m_name(name), m_valueType(TRI_STRING), m_valueString(value), m_valueLong(0), m_valueDouble(0.0)
{
}

TriArtifactAttribute::TriArtifactAttribute(const std::string &name, int64_t value)
    : m_name(name), m_valueType(TRI_LONG), m_valueLong(value), m_valueDouble(0.0)
{
}

TriArtifactAttribute::TriArtifactAttribute(const std::string &name, double value)
    : m_name(name), m_valueType(TRI_DOUBLE), m_valueLong(0), m_valueDouble(value)
{
}

std::string TriArtifactAttribute::toString() const
{
    std::stringstream ss;
    switch (m_valueType) {
    case TRI_STRING:
        return m_valueString;
    case TRI_LONG:
        ss << m_valueLong;
        break;
    case TRI_DOUBLE:
        ss << m_valueDouble;
        break;
    }
    return ss.str();
}

bool TriArtifactAttribute::operator==(const TriArtifactAttribute &other) const
{
    return m_name == other.m_name && m_valueType == other.m_valueType &&
        m_valueString == other.m_valueString && m_valueLong == other.m_valueLong &&
        m_valueDouble == other.m_valueDouble;
}

TriArtifact::TriArtifact()
    : m_id(0), m_type(TRI_ART_UNKNOWN), m_sourceOffset(0), m_hasTimestamp(false), m_timestamp(0),
    m_hasSeenRange(false), m_firstSeen(0), m_lastSeen(0)
{
}

TriArtifact::TriArtifact(TRI_ARTIFACT_TYPE type, const std::string &caseId)
    : m_id(0), m_type(type), m_caseId(caseId), m_sourceOffset(0), m_hasTimestamp(false), m_timestamp(0),
    m_hasSeenRange(false), m_firstSeen(0), m_lastSeen(0)
{
}

void TriArtifact::setSource(const std::string &path, uint64_t offset)
{
    m_sourcePath = path;
    m_sourceOffset = offset;
}

void TriArtifact::setTimestamp(int64_t timestamp)
{
    m_hasTimestamp = timestamp > 0;
    m_timestamp = m_hasTimestamp ? timestamp : 0;
}

void TriArtifact::setSeenRange(int64_t firstSeen, int64_t lastSeen)
{
    if (firstSeen > lastSeen) {
        int64_t tmp = firstSeen;
        firstSeen = lastSeen;
        lastSeen = tmp;
    }
    m_hasSeenRange = true;
    m_firstSeen = firstSeen;
    m_lastSeen = lastSeen;
}

void TriArtifact::addAttribute(const std::string &name, const std::string &value)
{
    m_attributes.push_back(TriArtifactAttribute(name, value));
}

void TriArtifact::addAttribute(const std::string &name, int64_t value)
{
    m_attributes.push_back(TriArtifactAttribute(name, value));
}

void TriArtifact::addAttribute(const std::string &name, double value)
{
    m_attributes.push_back(TriArtifactAttribute(name, value));
}

void TriArtifact::addAttribute(const TriArtifactAttribute &attribute)
{
    m_attributes.push_back(attribute);
}

const TriArtifactAttribute *TriArtifact::findAttribute(const std::string &name) const
{
    for (std::vector<TriArtifactAttribute>::const_iterator it = m_attributes.begin(); it != m_attributes.end(); ++it) {
        if (it->getName() == name)
            return &(*it);
    }
    return NULL;
}

std::string TriArtifact::getString(const std::string &name) const
{
    const TriArtifactAttribute *attr = findAttribute(name);
    return attr ? attr->toString() : std::string();
}

int64_t TriArtifact::getLong(const std::string &name, int64_t defaultValue) const
{
    const TriArtifactAttribute *attr = findAttribute(name);
    if (attr == NULL || attr->getValueType() != TRI_LONG)
        return defaultValue;
    return attr->getValueLong();
}

std::string TriArtifact::makeKey(const std::vector<std::string> &parts)
{
    std::string key;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0)
            key += '|';
        key += parts[i];
    }
    return key;
}
