/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifact.h
 * Contains the definition of the TriArtifact and TriArtifactAttribute classes.
 */

#ifndef _TRI_ARTIFACT_H
#define _TRI_ARTIFACT_H

#include <string>
#include <vector>
#include <stdint.h>

#include "triage/framework/framework_i.h"
#include "TriArtifactTypes.h"

/**
 * Value type enum, should always correspond to the stored value in an 
 * attribute
 */
enum TRI_ATTRIBUTE_VALUE_TYPE {
    TRI_STRING = 0,     ///< string
    TRI_LONG = 1,       ///< 64 bit integer
    TRI_DOUBLE = 2      ///< double
};

/**
 * One named, typed value of an artifact's payload.
 */
class TRI_FRAMEWORK_API TriArtifactAttribute
{
public:
    TriArtifactAttribute(const std::string &name, const std::string &value);
    TriArtifactAttribute(const std::string &name, int64_t value);
    TriArtifactAttribute(const std::string &name, double value);

    const std::string &getName() const { return m_name; }
    TRI_ATTRIBUTE_VALUE_TYPE getValueType() const { return m_valueType; }
    const std::string &getValueString() const { return m_valueString; }
    int64_t getValueLong() const { return m_valueLong; }
    double getValueDouble() const { return m_valueDouble; }

    /// The value rendered as text regardless of its type.
    std::string toString() const;

    bool operator==(const TriArtifactAttribute &other) const;

private:
    std::string m_name;
    TRI_ATTRIBUTE_VALUE_TYPE m_valueType;
    std::string m_valueString;
    int64_t m_valueLong;
    double m_valueDouble;
};

/**
 * One structured record of forensic interest extracted from an image.
 *
 * Every artifact belongs to exactly one case and carries its provenance
 * (source path and offset inside that file), an optional event timestamp,
 * an optional first-seen / last-seen range and a type specific natural key.
 * The store identifies duplicates by (case id, type, natural key).
 * Timestamps are seconds since the Unix epoch, UTC.
 */
class TRI_FRAMEWORK_API TriArtifact
{
public:
    TriArtifact();
    TriArtifact(TRI_ARTIFACT_TYPE type, const std::string &caseId);

    /// Store row id, zero until the artifact has been stored.
    uint64_t getId() const { return m_id; }
    void setId(uint64_t id) { m_id = id; }

    TRI_ARTIFACT_TYPE getType() const { return m_type; }
    const std::string &getCaseId() const { return m_caseId; }

    const std::string &getSourcePath() const { return m_sourcePath; }
    uint64_t getSourceOffset() const { return m_sourceOffset; }
    void setSource(const std::string &path, uint64_t offset = 0);

    bool hasTimestamp() const { return m_hasTimestamp; }
    int64_t getTimestamp() const { return m_timestamp; }
    /// Sets the event time. A value of zero or less leaves the artifact untimestamped.
    void setTimestamp(int64_t timestamp);

    bool hasSeenRange() const { return m_hasSeenRange; }
    int64_t getFirstSeen() const { return m_firstSeen; }
    int64_t getLastSeen() const { return m_lastSeen; }
    void setSeenRange(int64_t firstSeen, int64_t lastSeen);

    const std::string &getNaturalKey() const { return m_naturalKey; }
    void setNaturalKey(const std::string &key) { m_naturalKey = key; }

    const std::string &getDescription() const { return m_description; }
    void setDescription(const std::string &description) { m_description = description; }

    void addAttribute(const std::string &name, const std::string &value);
    void addAttribute(const std::string &name, int64_t value);
    void addAttribute(const std::string &name, double value);
    void addAttribute(const TriArtifactAttribute &attribute);
    const std::vector<TriArtifactAttribute> &getAttributes() const { return m_attributes; }

    /// @returns the attribute with the given name or NULL.
    const TriArtifactAttribute *findAttribute(const std::string &name) const;
    /// @returns the attribute rendered as text or an empty string if absent.
    std::string getString(const std::string &name) const;
    /// @returns the integer attribute or defaultValue if absent or not an integer.
    int64_t getLong(const std::string &name, int64_t defaultValue = 0) const;

    /**
     * Builds a natural key from its component fields.
     */
    static std::string makeKey(const std::vector<std::string> &parts);

private:
    uint64_t m_id;
    TRI_ARTIFACT_TYPE m_type;
    std::string m_caseId;
    std::string m_sourcePath;
    uint64_t m_sourceOffset;
    bool m_hasTimestamp;
    int64_t m_timestamp;
    bool m_hasSeenRange;
    int64_t m_firstSeen;
    int64_t m_lastSeen;
    std::string m_naturalKey;
    std::string m_description;
    std::vector<TriArtifactAttribute> m_attributes;
};

#endif
