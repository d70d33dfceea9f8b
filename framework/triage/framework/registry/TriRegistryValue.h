/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRegistryValue.h
 * Contains the interface of the TriRegistryValue class.
 */

#ifndef _TRI_REGISTRYVALUE_H
#define _TRI_REGISTRYVALUE_H

#include "triage/framework/framework_i.h"

#include <string>
#include <vector>
#include <stdint.h>

/**
 * A value read from a registry key.  The data is copied out of the hive,
 * so a value stays usable after the hive is gone.
 */
class TRI_FRAMEWORK_API TriRegistryValue
{
public:
    enum VALUE_TYPES {
        VALTYPE_NONE = 0,
        VALTYPE_SZ,
        VALTYPE_EXPAND_SZ,
        VALTYPE_BIN,
        VALTYPE_DWORD,
        VALTYPE_BIG_ENDIAN,
        VALTYPE_LINK,
        VALTYPE_MULTI_SZ,
        VALTYPE_RESOURCE_LIST,
        VALTYPE_FULL_RESOURCE_DESCRIPTOR,
        VALTYPE_RESOURCE_REQUIREMENTS_LIST,
        VALTYPE_QWORD
    };

    /// Map the value type enum to a string.
    static std::string getValueTypeName(VALUE_TYPES type);

    TriRegistryValue();
    TriRegistryValue(const std::string &name, uint32_t type, const std::vector<uint8_t> &data);

    /// Value name; the default value has an empty name.
    const std::string &getName() const { return m_name; }
    VALUE_TYPES getValueType() const { return (VALUE_TYPES)m_type; }
    const std::vector<uint8_t> &getData() const { return m_data; }

    /**
     * Get the data as a string.  REG_SZ, REG_EXPAND_SZ and REG_LINK are
     * decoded as UTF-16LE; REG_MULTI_SZ returns the first string.
     * @throws TriCorruptStructureException for other types.
     */
    std::string getAsString() const;

    /**
     * Get the data as a list of strings.
     * @throws TriCorruptStructureException for non string types.
     */
    std::vector<std::string> getAsStringList() const;

    /**
     * Get the data as a number (REG_DWORD, REG_DWORD_BIG_ENDIAN, REG_QWORD).
     * @throws TriCorruptStructureException for other types or short data.
     */
    uint64_t getAsNumber() const;

    /**
     * Render any value as text: strings as is, lists joined with "; ",
     * numbers in decimal and everything else as hex.
     */
    std::string toString() const;

private:
    std::string m_name;
    uint32_t m_type;
    std::vector<uint8_t> m_data;
};

#endif
