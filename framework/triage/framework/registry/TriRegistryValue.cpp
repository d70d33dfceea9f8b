/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriRegistryValue.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "Poco/NumberFormatter.h"

TriRegistryValue::TriRegistryValue() : m_type(VALTYPE_NONE)
{
}

TriRegistryValue::TriRegistryValue(const std::string &name, uint32_t type, const std::vector<uint8_t> &data)
    : m_name(name), m_type(type), m_data(data)
{
}

std::string TriRegistryValue::getAsString() const
{
    switch (m_type) {
    case VALTYPE_SZ:
    case VALTYPE_EXPAND_SZ:
    case VALTYPE_LINK:
        return TriUtilities::utf16leToUTF8(m_data, 0, m_data.size());
    case VALTYPE_MULTI_SZ:
        {
            std::vector<std::string> list = getAsStringList();
            return list.empty() ? std::string() : list.front();
        }
    default:
        throw TriCorruptStructureException("TriRegistryValue::getAsString - Cannot get string data for "
            + getValueTypeName(getValueType()) + " value " + m_name);
    }
}

std::vector<std::string> TriRegistryValue::getAsStringList() const
{
    std::vector<std::string> list;
    switch (m_type) {
    case VALTYPE_SZ:
    case VALTYPE_EXPAND_SZ:
    case VALTYPE_LINK:
        list.push_back(getAsString());
        break;
    case VALTYPE_MULTI_SZ:
        {
            // sequence of null terminated UTF-16LE strings, ended by an empty one
            size_t start = 0;
            bool ended = false;
            for (size_t i = 0; i + 1 < m_data.size(); i += 2) {
                if (m_data[i] == 0 && m_data[i + 1] == 0) {
                    if (i == start) {
                        ended = true;
                        break;
                    }
                    list.push_back(TriUtilities::utf16leToUTF8(&m_data[start], i - start, false));
                    start = i + 2;
                }
            }
            // tolerate a final string without terminator
            if (!ended && start + 1 < m_data.size())
                list.push_back(TriUtilities::utf16leToUTF8(&m_data[start], m_data.size() - start));
        }
        break;
    default:
        throw TriCorruptStructureException("TriRegistryValue::getAsStringList - Cannot get string data for "
            + getValueTypeName(getValueType()) + " value " + m_name);
    }
    return list;
}

uint64_t TriRegistryValue::getAsNumber() const
{
    switch (m_type) {
    case VALTYPE_DWORD:
        return TriUtilities::getU32LE(m_data, 0);
    case VALTYPE_QWORD:
        return TriUtilities::getU64LE(m_data, 0);
    case VALTYPE_BIG_ENDIAN:
        {
            uint32_t le = TriUtilities::getU32LE(m_data, 0);
            return ((le & 0xFF) << 24) | ((le & 0xFF00) << 8) | ((le >> 8) & 0xFF00) | (le >> 24);
        }
    default:
        throw TriCorruptStructureException("TriRegistryValue::getAsNumber - Cannot get numeric data for "
            + getValueTypeName(getValueType()) + " value " + m_name);
    }
}

std::string TriRegistryValue::toString() const
{
    switch (m_type) {
    case VALTYPE_SZ:
    case VALTYPE_EXPAND_SZ:
    case VALTYPE_LINK:
        return getAsString();
    case VALTYPE_MULTI_SZ:
        {
            std::vector<std::string> list = getAsStringList();
            std::string joined;
            for (size_t i = 0; i < list.size(); i++) {
                if (i)
                    joined += "; ";
                joined += list[i];
            }
            return joined;
        }
    case VALTYPE_DWORD:
    case VALTYPE_QWORD:
    case VALTYPE_BIG_ENDIAN:
        if (m_data.size() >= (m_type == VALTYPE_QWORD ? 8u : 4u))
            return Poco::NumberFormatter::format(getAsNumber());
        break;
    default:
        break;
    }

    static const size_t MAX_HEX_BYTES = 64;
    std::string hex;
    for (size_t i = 0; i < m_data.size() && i < MAX_HEX_BYTES; i++)
        hex += Poco::NumberFormatter::formatHex((unsigned)m_data[i], 2);
    if (m_data.size() > MAX_HEX_BYTES)
        hex += "...";
    return hex;
}

std::string TriRegistryValue::getValueTypeName(VALUE_TYPES type)
{
    switch (type) {
    case VALTYPE_SZ:
        return "REG_SZ";
    case VALTYPE_EXPAND_SZ:
        return "REG_EXPAND_SZ";
    case VALTYPE_MULTI_SZ:
        return "REG_MULTI_SZ";
    case VALTYPE_BIG_ENDIAN:
        return "REG_BIG_ENDIAN";
    case VALTYPE_BIN:
        return "REG_BIN";
    case VALTYPE_DWORD:
        return "REG_DWORD";
    case VALTYPE_QWORD:
        return "REG_QWORD";
    case VALTYPE_LINK:
        return "REG_LINK";
    case VALTYPE_NONE:
        return "REG_NONE";
    case VALTYPE_RESOURCE_LIST:
        return "REG_RESOURCE_LIST";
    case VALTYPE_FULL_RESOURCE_DESCRIPTOR:
        return "REG_FULL_RESOURCE_DESCRIPTOR";
    case VALTYPE_RESOURCE_REQUIREMENTS_LIST:
        return "REG_RESOURCE_REQUIREMENTS_LIST";
    default:
        return "Unrecognized type";
    }
}
