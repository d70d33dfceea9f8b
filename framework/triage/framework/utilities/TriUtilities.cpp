/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriUtilities.cpp
 * Contains common utility methods.
 */

#include "TriUtilities.h"
#include "TriException.h"

// Poco Includes
#include "Poco/UnicodeConverter.h"
#include "Poco/UTFString.h"
#include "Poco/Path.h"
#include "Poco/Timestamp.h"
#include "Poco/DateTimeFormatter.h"
#include "Poco/String.h"

// C/C++ library includes
#include <sstream>
#include <unistd.h>

namespace
{
    // Seconds between 1601-01-01 and 1970-01-01.
    const int64_t EPOCH_DIFF_SECONDS = 11644473600LL;

    void checkRange(const std::vector<uint8_t> &buf, size_t offset, size_t len)
    {
        if (offset > buf.size() || len > buf.size() - offset)
        {
            std::stringstream msg;
            msg << "Field at offset " << offset << " (length " << len
                << ") is outside a " << buf.size() << " byte structure";
            throw TriCorruptStructureException(msg.str());
        }
    }
}

std::string TriUtilities::utf16leToUTF8(const uint8_t *data, size_t numBytes, bool stopAtNull)
{
    Poco::UTF16String units;
    units.reserve(numBytes / 2);
    for (size_t i = 0; i + 1 < numBytes; i += 2)
    {
        Poco::UTF16Char ch = (Poco::UTF16Char)(data[i] | (data[i + 1] << 8));
        if (ch == 0 && stopAtNull)
            break;
        units.push_back(ch);
    }

    std::string utf8Str;
    Poco::UnicodeConverter::toUTF8(units, utf8Str);
    return utf8Str;
}

std::string TriUtilities::utf16leToUTF8(const std::vector<uint8_t> &buf, size_t offset, size_t numBytes, bool stopAtNull)
{
    if (offset >= buf.size())
        return "";
    if (numBytes > buf.size() - offset)
        numBytes = buf.size() - offset;
    return utf16leToUTF8(&buf[offset], numBytes, stopAtNull);
}

std::string TriUtilities::asciiString(const std::vector<uint8_t> &buf, size_t offset, size_t maxBytes)
{
    std::string str;
    for (size_t i = offset; i < buf.size() && i - offset < maxBytes; i++)
    {
        if (buf[i] == 0)
            break;
        str.push_back((buf[i] >= 0x20 && buf[i] < 0x7F) ? (char)buf[i] : '^');
    }
    return str;
}

uint16_t TriUtilities::getU16LE(const std::vector<uint8_t> &buf, size_t offset)
{
    checkRange(buf, offset, 2);
    return (uint16_t)(buf[offset] | (buf[offset + 1] << 8));
}

uint32_t TriUtilities::getU32LE(const std::vector<uint8_t> &buf, size_t offset)
{
    checkRange(buf, offset, 4);
    return (uint32_t)buf[offset] | ((uint32_t)buf[offset + 1] << 8) |
        ((uint32_t)buf[offset + 2] << 16) | ((uint32_t)buf[offset + 3] << 24);
}

uint64_t TriUtilities::getU64LE(const std::vector<uint8_t> &buf, size_t offset)
{
    checkRange(buf, offset, 8);
    return (uint64_t)getU32LE(buf, offset) | ((uint64_t)getU32LE(buf, offset + 4) << 32);
}

int64_t TriUtilities::filetimeToUnix(uint64_t filetime)
{
    if (filetime == 0)
        return 0;
    return (int64_t)(filetime / 10000000ULL) - EPOCH_DIFF_SECONDS;
}

int64_t TriUtilities::webkitTimeToUnix(int64_t micros)
{
    if (micros <= 0)
        return 0;
    return micros / 1000000LL - EPOCH_DIFF_SECONDS;
}

int64_t TriUtilities::prTimeToUnix(int64_t micros)
{
    if (micros <= 0)
        return 0;
    return micros / 1000000LL;
}

std::string TriUtilities::formatTime(int64_t unixTime)
{
    Poco::Timestamp ts = Poco::Timestamp::fromEpochTime((std::time_t)unixTime);
    return Poco::DateTimeFormatter::format(ts, "%Y-%m-%d %H:%M:%S");
}

std::string TriUtilities::toLower(const std::string &str)
{
    return Poco::toLower(str);
}

bool TriUtilities::iequals(const std::string &a, const std::string &b)
{
    return Poco::icompare(a, b) == 0;
}

bool TriUtilities::endsWithNoCase(const std::string &str, const std::string &suffix)
{
    if (suffix.size() > str.size())
        return false;
    return Poco::icompare(str.substr(str.size() - suffix.size()), suffix) == 0;
}

std::string TriUtilities::rot13(const std::string &str)
{
    std::string out(str);
    for (std::string::iterator it = out.begin(); it != out.end(); ++it)
    {
        char c = *it;
        if (c >= 'a' && c <= 'z')
            *it = (char)('a' + (c - 'a' + 13) % 26);
        else if (c >= 'A' && c <= 'Z')
            *it = (char)('A' + (c - 'A' + 13) % 26);
    }
    return out;
}

/** Get the path of the directory where the currently executing program is 
 * installed.  
 *
 * @returns The path of the program directory.
 */
std::string TriUtilities::getProgDir()
{
    int size = 256;
    std::vector<char> buf;
 
    while (true) {
        buf.resize(size);
        ssize_t ret = readlink("/proc/self/exe", &buf[0], size);
        if (ret < 0) {
            return std::string("");
        }
        if (ret < size) {
            std::string s(&buf[0], ret);
            Poco::Path path(s);
            return path.makeParent().toString();
        }
        size *= 2;
    }
}
