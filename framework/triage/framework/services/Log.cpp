/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "Log.h"
#include <iostream>
#include <sstream>
#include "Poco/LineEndingConverter.h"
#include "Poco/LocalDateTime.h"
#include "Poco/DateTimeFormatter.h"
#include "Poco/Path.h"

const unsigned int Log::REPEAT_THRESHOLD = 500;

Log::Log()
: m_repeatCount(0)
{
}

Log::~Log()
{
    close();
}

std::string Log::channelTag(Channel a_channel)
{
    switch (a_channel) {
    case Error:
        return "[ERROR]";
    case Warn:
        return "[WARN]";
    case Info:
    default:
        return "[INFO]";
    }
}

int Log::openInDirectory(const std::string &a_outDir)
{
    Poco::Path logPath(a_outDir);
    logPath.makeDirectory();
    logPath.setFileName("triage_" + Poco::DateTimeFormatter::format(Poco::LocalDateTime(), "%Y-%m-%d-%H-%M-%S") + ".log");
    return open(logPath.toString());
}

int Log::open(const std::string &a_logFileFullPath)
{
    close();

    Poco::FastMutex::ScopedLock lock(m_mutex);
    m_outStream.clear();
    m_outStream.open(a_logFileFullPath.c_str(), std::ios::app);
    if (!m_outStream.is_open()) {
        std::cerr << "Log file '" << a_logFileFullPath << "' cannot be opened." << std::endl;
        return 1;
    }
    m_filePath = a_logFileFullPath;
    return 0;
}

int Log::close()
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    flushRepeats();
    m_previousMessage.clear();
    if (!m_outStream.is_open())
        return 0;

    m_outStream.close();
    m_filePath.clear();
    if (m_outStream.fail()) {
        std::cerr << "Log file was not closed cleanly." << std::endl;
        return 1;
    }
    return 0;
}

void Log::log(Channel a_channel, const std::string &a_msg)
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    if (a_msg == m_previousMessage && m_repeatCount < REPEAT_THRESHOLD) {
        ++m_repeatCount;
        return;
    }
    flushRepeats();
    m_previousMessage = a_msg;
    logMessage(channelTag(a_channel), a_msg);
}

void Log::flushRepeats()
{
    if (m_repeatCount == 0)
        return;
    std::stringstream msg;
    msg << "The previous message was repeated " << m_repeatCount << " times.";
    m_repeatCount = 0;
    logMessage(channelTag(Info), msg.str());
}

void Log::logMessage(const std::string &tag, const std::string &msg)
{
    std::ostream &out = m_outStream.is_open() && m_outStream.good()
        ? static_cast<std::ostream &>(m_outStream) : std::cerr;

    out << Poco::DateTimeFormatter::format(Poco::LocalDateTime(), "%m/%d/%y %H:%M:%S")
        << " " << tag << " " << msg << Poco::LineEnding::NEWLINE_DEFAULT;
    out.flush();
}
