/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriRegistryHive.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include "Poco/StringTokenizer.h"

#include <sstream>

TriRegistryHive::TriRegistryHive(const std::vector<uint8_t> &buffer) : m_buffer(buffer), m_rootOffset(0)
{
    if (m_buffer.size() < FIRST_HBIN_OFFSET + 0x20 || getU32(0) != REGF_MAGIC) {
        throw TriCorruptStructureException("TriRegistryHive - REGF magic value not found");
    }
    if (getU32(FIRST_HBIN_OFFSET) != HBIN_MAGIC) {
        throw TriCorruptStructureException("TriRegistryHive - HBIN magic value not found");
    }

    m_rootOffset = recordOffset(getU32(ROOT_KEY_OFFSET_OFFSET));
    // validates the root record
    TriRegistryKey root(this, m_rootOffset);
}

TriRegistryKey TriRegistryHive::getRoot() const
{
    return TriRegistryKey(this, m_rootOffset);
}

bool TriRegistryHive::findKey(const std::string &path, TriRegistryKey &key) const
{
    TriRegistryKey current = getRoot();

    Poco::StringTokenizer tokenizer(path, "\\/", Poco::StringTokenizer::TOK_IGNORE_EMPTY | Poco::StringTokenizer::TOK_TRIM);
    for (Poco::StringTokenizer::Iterator it = tokenizer.begin(); it != tokenizer.end(); ++it) {
        TriRegistryKey next;
        if (!current.getSubkey(*it, next))
            return false;
        current = next;
    }

    key = current;
    return true;
}

uint32_t TriRegistryHive::recordOffset(uint32_t relativeCellOffset) const
{
    uint64_t offset = (uint64_t)FIRST_HBIN_OFFSET + relativeCellOffset + 4;
    if (relativeCellOffset == 0xFFFFFFFF || offset >= m_buffer.size()) {
        std::stringstream msg;
        msg << "TriRegistryHive - Cell offset 0x" << std::hex << relativeCellOffset << " is outside the hive";
        throw TriCorruptStructureException(msg.str());
    }
    return (uint32_t)offset;
}

uint16_t TriRegistryHive::getU16(uint32_t offset) const
{
    return TriUtilities::getU16LE(m_buffer, offset);
}

uint32_t TriRegistryHive::getU32(uint32_t offset) const
{
    return TriUtilities::getU32LE(m_buffer, offset);
}

uint64_t TriRegistryHive::getU64(uint32_t offset) const
{
    return TriUtilities::getU64LE(m_buffer, offset);
}

std::string TriRegistryHive::getMagic(uint32_t offset) const
{
    if ((uint64_t)offset + 2 > m_buffer.size())
        return std::string();
    return std::string((const char *)&m_buffer[offset], 2);
}

std::vector<uint8_t> TriRegistryHive::getBytes(uint32_t offset, uint32_t length) const
{
    if ((uint64_t)offset + length > m_buffer.size()) {
        std::stringstream msg;
        msg << "TriRegistryHive - Read of " << length << " bytes at 0x" << std::hex << offset
            << " is outside the hive";
        throw TriCorruptStructureException(msg.str());
    }
    return std::vector<uint8_t>(m_buffer.begin() + offset, m_buffer.begin() + offset + length);
}

std::string TriRegistryHive::getName(uint32_t offset, uint16_t length, bool compressed) const
{
    std::vector<uint8_t> raw = getBytes(offset, length);
    if (!compressed)
        return TriUtilities::utf16leToUTF8(raw, 0, raw.size(), false);

    // Latin-1 to UTF-8
    std::string name;
    name.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        uint8_t c = raw[i];
        if (c < 0x80) {
            name.push_back((char)c);
        }
        else {
            name.push_back((char)(0xC0 | (c >> 6)));
            name.push_back((char)(0x80 | (c & 0x3F)));
        }
    }
    return name;
}

