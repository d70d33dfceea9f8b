/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriUtilities.h
 * Contains common utility methods.
 */

#ifndef _TRI_UTILITIES_H
#define _TRI_UTILITIES_H

#include <string>
#include <vector>
#include <stdint.h>

#include "triage/framework/framework_i.h"

/**
 * Contains commonly needed utility methods.  Refer to the poco library
 * for other commonly needed methods.
 *
 * The little-endian readers throw TriCorruptStructureException when the
 * requested field lies outside the buffer, which lets the binary parsers
 * treat a truncated structure as corruption instead of reading garbage.
 */
class TRI_FRAMEWORK_API TriUtilities
{
public:
    /**
     * Decode little-endian UTF-16 bytes to UTF-8.
     * @param data Start of the UTF-16 data.
     * @param numBytes Number of bytes available.
     * @param stopAtNull Stop at the first NUL character.
     */
    static std::string utf16leToUTF8(const uint8_t *data, size_t numBytes, bool stopAtNull = true);
    static std::string utf16leToUTF8(const std::vector<uint8_t> &buf, size_t offset, size_t numBytes, bool stopAtNull = true);

    /// Extract a NUL terminated single byte string, replacing non-printable bytes.
    static std::string asciiString(const std::vector<uint8_t> &buf, size_t offset, size_t maxBytes);

    static uint16_t getU16LE(const std::vector<uint8_t> &buf, size_t offset);
    static uint32_t getU32LE(const std::vector<uint8_t> &buf, size_t offset);
    static uint64_t getU64LE(const std::vector<uint8_t> &buf, size_t offset);

    /// Windows FILETIME (100ns ticks since 1601) to seconds since the Unix epoch.
    static int64_t filetimeToUnix(uint64_t filetime);
    /// WebKit/Chrome time (microseconds since 1601) to seconds since the Unix epoch.
    static int64_t webkitTimeToUnix(int64_t micros);
    /// PRTime (microseconds since 1970) to seconds since the Unix epoch.
    static int64_t prTimeToUnix(int64_t micros);

    /// Format seconds since the Unix epoch as "YYYY-MM-DD HH:MM:SS" (UTC).
    static std::string formatTime(int64_t unixTime);

    static std::string toLower(const std::string &str);
    static bool iequals(const std::string &a, const std::string &b);
    static bool endsWithNoCase(const std::string &str, const std::string &suffix);
    static std::string rot13(const std::string &str);
    static std::string getProgDir();
};

#endif
