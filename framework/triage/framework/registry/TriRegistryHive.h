/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriRegistryHive.h
 * Contains the interface of the TriRegistryHive class.
 */

#ifndef _TRI_REGISTRYHIVE_H
#define _TRI_REGISTRYHIVE_H

#include "TriRegistryKey.h"

#include <string>
#include <vector>
#include <stdint.h>

/**
 * A Windows registry hive (REGF format) held in memory.
 *
 * All structure offsets stored in the hive are relative to the first hbin
 * block at FIRST_HBIN_OFFSET.  Cells start with a signed 32 bit size that
 * is negative for allocated cells; records start right after it.  Every
 * read is bounds checked and a violation throws
 * TriCorruptStructureException.
 */
class TRI_FRAMEWORK_API TriRegistryHive
{
public:
    static const uint32_t REGF_MAGIC = 0x66676572;
    static const uint32_t HBIN_MAGIC = 0x6E696268;
    static const uint32_t FIRST_HBIN_OFFSET = 0x1000;
    static const uint32_t ROOT_KEY_OFFSET_OFFSET = 0x24;

    /**
     * @param buffer The complete hive file.
     * @throws TriCorruptStructureException if the base block is not valid.
     */
    explicit TriRegistryHive(const std::vector<uint8_t> &buffer);

    TriRegistryKey getRoot() const;

    /**
     * Find a key by path below the root, e.g. "Microsoft\\Windows\\CurrentVersion\\Run".
     * Path components are matched case-insensitively.  A leading root key
     * name is not part of the path.
     * @returns true if the key exists.
     */
    bool findKey(const std::string &path, TriRegistryKey &key) const;

    /// Absolute offset of the record in the cell at a hive relative offset.
    uint32_t recordOffset(uint32_t relativeCellOffset) const;

    uint16_t getU16(uint32_t offset) const;
    uint32_t getU32(uint32_t offset) const;
    uint64_t getU64(uint32_t offset) const;
    std::string getMagic(uint32_t offset) const;
    std::vector<uint8_t> getBytes(uint32_t offset, uint32_t length) const;

    /// Decode a key or value name stored either as Latin-1 or UTF-16LE.
    std::string getName(uint32_t offset, uint16_t length, bool compressed) const;

private:
    std::vector<uint8_t> m_buffer;
    uint32_t m_rootOffset;
};

#endif
