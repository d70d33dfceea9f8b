/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _TRI_LOG_H
#define _TRI_LOG_H

#include "triage/framework/framework_i.h"
#include "Poco/Mutex.h"
#include <string>
#include <fstream>

/**
 * \file Log.h
 * Log service shared by the extraction jobs, the analysis engine and the
 * command line tools.
 */

/**
 * Writes an error message through the registered log service.
 * @param msg Message to log
 */
#define LOGERROR(msg) TriServices::Instance().getLog().log(Log::Error, msg)

/**
 * Writes a warning message through the registered log service.
 * @param msg Message to log
 */
#define LOGWARN(msg) TriServices::Instance().getLog().log(Log::Warn, msg)

/**
 * Writes an informational message through the registered log service.
 * @param msg Message to log
 */
#define LOGINFO(msg) TriServices::Instance().getLog().log(Log::Info, msg)


/**
 * Default log. Messages go to the file opened with open() or
 * openInDirectory(), or to stderr while no file is open. A run of
 * identical messages is written once, followed by a line with the
 * repeat count when the run ends. Subclass it to send messages elsewhere
 * as well; the command line tool echoes errors to stderr this way.
 *
 * Jobs for different cases log from pool threads, so every write is
 * serialized.
 */
class TRI_FRAMEWORK_API Log
{
public:
    enum Channel {
        Error, ///< Failure that ends a job or a request
        Warn,  ///< Recoverable problem, e.g. a corrupt structure inside one extractor
        Info   ///< Progress of jobs and analyses
    };

    Log();
    virtual ~Log();

    /**
     * Record a message on a channel.
     * @param a_channel Channel of the message
     * @param a_msg Message to record
     */
    virtual void log(Channel a_channel, const std::string &a_msg);

    /**
     * Open a file named after the current local time inside a_outDir.
     * @returns 1 on error and 0 on success.
     */
    int openInDirectory(const std::string &a_outDir);

    /**
     * Open (append to) the log file at the given path. Any file already
     * open is closed first.
     * @returns 1 on error and 0 on success.
     */
    int open(const std::string &a_logFileFullPath);

    /**
     * Write any pending repeat count and close the file. Later messages
     * go to stderr.
     * @returns 1 if the file could not be closed cleanly, otherwise 0.
     */
    int close();

    const std::string &getLogPath() const { return m_filePath; }

    /// "[ERROR]", "[WARN]" or "[INFO]"
    static std::string channelTag(Channel a_channel);

protected:
    /// Writes one formatted line; called with the log mutex held.
    virtual void logMessage(const std::string &tag, const std::string &msg);

    std::string m_filePath;
    std::ofstream m_outStream;

private:
    // A repeat run longer than this is reported and a new run started.
    static const unsigned int REPEAT_THRESHOLD;

    void flushRepeats();

    std::string m_previousMessage;
    unsigned int m_repeatCount;
    Poco::FastMutex m_mutex;

    // No copying
    Log(const Log &);
    Log &operator=(const Log &);
};
#endif
