/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriRegistryKey.h"
#include "TriRegistryHive.h"
#include "triage/framework/services/TriServices.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include <sstream>

namespace
{
    // "vk" record layout
    const uint16_t VK_NAME_LENGTH_OFFSET = 0x02;
    const uint16_t VK_DATA_LENGTH_OFFSET = 0x04;
    const uint16_t VK_DATA_OFFSET_OFFSET = 0x08;
    const uint16_t VK_VALUE_TYPE_OFFSET = 0x0C;
    const uint16_t VK_NAME_FLAGS_OFFSET = 0x10;
    const uint16_t VK_NAME_OFFSET = 0x14;

    const uint32_t LARGE_DATA_SIZE = 0x80000000;
    const uint32_t DB_DATA_SIZE = 0x3FD8;
    // largest value we accept, bounded by what a "db" list can address
    const uint32_t MAX_DATA_SIZE = 0xFFFF * DB_DATA_SIZE;

    // nesting of "ri" index lists
    const int MAX_LIST_DEPTH = 8;
}

TriRegistryKey::TriRegistryKey() : m_hive(NULL), m_offset(0)
{
}

TriRegistryKey::TriRegistryKey(const TriRegistryHive *hive, uint32_t recordOffset)
    : m_hive(hive), m_offset(recordOffset)
{
    if (m_hive == NULL || m_hive->getMagic(m_offset) != "nk") {
        std::stringstream msg;
        msg << "TriRegistryKey - NK magic value not found at 0x" << std::hex << recordOffset;
        throw TriCorruptStructureException(msg.str());
    }
}

std::string TriRegistryKey::getName() const
{
    uint16_t length = m_hive->getU16(m_offset + NAME_LENGTH_OFFSET);
    bool compressed = (m_hive->getU16(m_offset + FLAGS_OFFSET) & 0x0020) == 0x0020;
    return m_hive->getName(m_offset + NAME_OFFSET, length, compressed);
}

uint64_t TriRegistryKey::getTimestamp() const
{
    return m_hive->getU64(m_offset + TIMESTAMP_OFFSET);
}

int64_t TriRegistryKey::getLastWriteTime() const
{
    return TriUtilities::filetimeToUnix(getTimestamp());
}

TriRegistryKey::KeyList TriRegistryKey::getSubkeyList() const
{
    KeyList keys;
    uint32_t count = m_hive->getU32(m_offset + SUBKEY_NUMBER_OFFSET);
    if (count == 0 || count == 0xFFFFFFFF)
        return keys;

    uint32_t listOffset = m_hive->recordOffset(m_hive->getU32(m_offset + SUBKEY_LIST_OFFSET_OFFSET));
    collectSubkeys(listOffset, keys, 0);
    return keys;
}

void TriRegistryKey::collectSubkeys(uint32_t listOffset, KeyList &keys, int depth) const
{
    if (depth > MAX_LIST_DEPTH) {
        throw TriCorruptStructureException("TriRegistryKey - Subkey index lists nested too deeply");
    }

    std::string magic = m_hive->getMagic(listOffset);
    uint16_t count = m_hive->getU16(listOffset + 2);

    if (magic == "lf" || magic == "lh") {
        // entries are (offset, hash) pairs
        for (uint16_t i = 0; i < count; i++) {
            uint32_t rel = m_hive->getU32(listOffset + 4 + i * 8);
            keys.push_back(TriRegistryKey(m_hive, m_hive->recordOffset(rel)));
        }
    }
    else if (magic == "li") {
        for (uint16_t i = 0; i < count; i++) {
            uint32_t rel = m_hive->getU32(listOffset + 4 + i * 4);
            keys.push_back(TriRegistryKey(m_hive, m_hive->recordOffset(rel)));
        }
    }
    else if (magic == "ri") {
        for (uint16_t i = 0; i < count; i++) {
            uint32_t rel = m_hive->getU32(listOffset + 4 + i * 4);
            collectSubkeys(m_hive->recordOffset(rel), keys, depth + 1);
        }
    }
    else {
        std::stringstream msg;
        msg << "TriRegistryKey - Unknown subkey list type at 0x" << std::hex << listOffset;
        throw TriCorruptStructureException(msg.str());
    }
}

bool TriRegistryKey::getSubkey(const std::string &name, TriRegistryKey &subkey) const
{
    KeyList keys = getSubkeyList();
    for (KeyList::const_iterator it = keys.begin(); it != keys.end(); ++it) {
        if (TriUtilities::iequals(it->getName(), name)) {
            subkey = *it;
            return true;
        }
    }
    return false;
}

TriRegistryKey::ValueList TriRegistryKey::getValueList() const
{
    ValueList values;
    uint32_t count = m_hive->getU32(m_offset + VALUES_NUMBER_OFFSET);
    if (count == 0 || count == 0xFFFFFFFF)
        return values;

    uint32_t listOffset = m_hive->recordOffset(m_hive->getU32(m_offset + VALUE_LIST_OFFSET_OFFSET));
    for (uint32_t i = 0; i < count; i++) {
        try {
            uint32_t vkOffset = m_hive->recordOffset(m_hive->getU32(listOffset + i * 4));
            values.push_back(readValue(vkOffset));
        }
        catch (TriCorruptStructureException &ex) {
            std::stringstream msg;
            msg << "TriRegistryKey::getValueList - Skipping value " << i << " of key "
                << getName() << ": " << ex.message();
            LOGWARN(msg.str());
        }
    }
    return values;
}

bool TriRegistryKey::getValue(const std::string &name, TriRegistryValue &value) const
{
    ValueList values = getValueList();
    for (ValueList::const_iterator it = values.begin(); it != values.end(); ++it) {
        if (TriUtilities::iequals(it->getName(), name)) {
            value = *it;
            return true;
        }
    }
    return false;
}

TriRegistryValue TriRegistryKey::readValue(uint32_t vkOffset) const
{
    if (m_hive->getMagic(vkOffset) != "vk") {
        throw TriCorruptStructureException("TriRegistryKey - VK magic value not found");
    }

    uint16_t nameLength = m_hive->getU16(vkOffset + VK_NAME_LENGTH_OFFSET);
    bool compressed = (m_hive->getU16(vkOffset + VK_NAME_FLAGS_OFFSET) & 0x0001) == 0x0001;
    std::string name = nameLength ? m_hive->getName(vkOffset + VK_NAME_OFFSET, nameLength, compressed) : "";

    uint32_t type = m_hive->getU32(vkOffset + VK_VALUE_TYPE_OFFSET);
    uint32_t rawLength = m_hive->getU32(vkOffset + VK_DATA_LENGTH_OFFSET);

    std::vector<uint8_t> data;
    if (rawLength >= LARGE_DATA_SIZE) {
        // resident data, stored in the data offset field
        uint32_t length = rawLength - LARGE_DATA_SIZE;
        if (length > 4)
            length = 4;
        data = m_hive->getBytes(vkOffset + VK_DATA_OFFSET_OFFSET, length);
    }
    else if (rawLength > 0) {
        if (rawLength > MAX_DATA_SIZE) {
            throw TriCorruptStructureException("TriRegistryKey - Value size too large");
        }
        uint32_t dataOffset = m_hive->recordOffset(m_hive->getU32(vkOffset + VK_DATA_OFFSET_OFFSET));
        if (rawLength > DB_DATA_SIZE && m_hive->getMagic(dataOffset) == "db")
            data = readBigData(dataOffset, rawLength);
        else
            data = m_hive->getBytes(dataOffset, rawLength);
    }

    return TriRegistryValue(name, type, data);
}

std::vector<uint8_t> TriRegistryKey::readBigData(uint32_t dbOffset, uint32_t length) const
{
    uint16_t segments = m_hive->getU16(dbOffset + 2);
    uint32_t listOffset = m_hive->recordOffset(m_hive->getU32(dbOffset + 4));

    std::vector<uint8_t> data;
    data.reserve(length);
    for (uint16_t i = 0; i < segments && data.size() < length; i++) {
        uint32_t segmentOffset = m_hive->recordOffset(m_hive->getU32(listOffset + i * 4));
        uint32_t chunk = length - (uint32_t)data.size();
        if (chunk > DB_DATA_SIZE)
            chunk = DB_DATA_SIZE;
        std::vector<uint8_t> bytes = m_hive->getBytes(segmentOffset, chunk);
        data.insert(data.end(), bytes.begin(), bytes.end());
    }

    if (data.size() < length) {
        throw TriCorruptStructureException("TriRegistryKey - Big data record is truncated");
    }
    return data;
}
