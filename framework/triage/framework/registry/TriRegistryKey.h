/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRegistryKey.h
 * Contains the interface of the TriRegistryKey class.
 */

#ifndef _TRI_REGISTRYKEY_H
#define _TRI_REGISTRYKEY_H

#include "TriRegistryValue.h"

#include <string>
#include <vector>
#include <stdint.h>

class TriRegistryHive;

/**
 * A key ("nk" record) of a TriRegistryHive.  A key is a light handle into
 * the hive and is only valid while the hive exists.
 */
class TRI_FRAMEWORK_API TriRegistryKey
{
public:
    typedef std::vector<TriRegistryKey> KeyList;
    typedef std::vector<TriRegistryValue> ValueList;

    TriRegistryKey();

    /**
     * @throws TriCorruptStructureException if there is no "nk" record at the offset.
     */
    TriRegistryKey(const TriRegistryHive *hive, uint32_t recordOffset);

    std::string getName() const;

    /// Last write time as a Windows FILETIME.
    uint64_t getTimestamp() const;

    /// Last write time in seconds since the Unix epoch.
    int64_t getLastWriteTime() const;

    /**
     * Get all subkeys.
     * @throws TriCorruptStructureException on a damaged subkey list.
     */
    KeyList getSubkeyList() const;

    /**
     * Find a subkey by name, case-insensitively.
     * @returns true if found.
     */
    bool getSubkey(const std::string &name, TriRegistryKey &subkey) const;

    /**
     * Get all values.  Damaged value records are skipped.
     */
    ValueList getValueList() const;

    /**
     * Find a value by name, case-insensitively.  The default value has an
     * empty name.
     * @returns true if found.
     */
    bool getValue(const std::string &name, TriRegistryValue &value) const;

    bool isValid() const { return m_hive != NULL; }

private:
    static const uint16_t FLAGS_OFFSET = 0x02;
    static const uint16_t TIMESTAMP_OFFSET = 0x04;
    static const uint16_t SUBKEY_NUMBER_OFFSET = 0x14;
    static const uint16_t SUBKEY_LIST_OFFSET_OFFSET = 0x1C;
    static const uint16_t VALUES_NUMBER_OFFSET = 0x24;
    static const uint16_t VALUE_LIST_OFFSET_OFFSET = 0x28;
    static const uint16_t NAME_LENGTH_OFFSET = 0x48;
    static const uint16_t NAME_OFFSET = 0x4C;

    void collectSubkeys(uint32_t listOffset, KeyList &keys, int depth) const;
    TriRegistryValue readValue(uint32_t vkOffset) const;
    std::vector<uint8_t> readBigData(uint32_t dbOffset, uint32_t length) const;

    const TriRegistryHive *m_hive;
    uint32_t m_offset;
};

#endif
