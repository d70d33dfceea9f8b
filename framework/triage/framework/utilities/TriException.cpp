/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriException.cpp
 * Contains definition of Framework exception classes.
 * Based on techniques used in the Poco Exception class.
 */

#include "TriException.h"
#include <typeinfo>

TriException::TriException(int code) : m_code(code)
{
}

TriException::TriException(const std::string &msg, int code) : m_msg(msg), m_code(code)
{
}

TriException::TriException(const TriException &e) : std::exception(e), m_msg(e.m_msg), m_code(e.m_code)
{
}

TriException::~TriException() throw()
{
}

TriException& TriException::operator =(const TriException &e)
{
    if (&e != this)
    {
        m_msg = e.m_msg;
        m_code = e.m_code;
    }

    return *this;
}

const char * TriException::name() const throw()
{
    return "TriException";
}

const char * TriException::className() const throw()
{
    return typeid(*this).name();
}

const char * TriException::what() const throw()
{
    return m_msg.empty() ? name() : m_msg.c_str();
}

TRI_IMPLEMENT_EXCEPTION(TriFileException, TriException, "File access error")
TRI_IMPLEMENT_EXCEPTION(TriFileNotFoundException, TriFileException, "File not found")
TRI_IMPLEMENT_EXCEPTION(TriSystemPropertiesException, TriException, "System property not found")
TRI_IMPLEMENT_EXCEPTION(TriImageFormatException, TriException, "Image format error")
TRI_IMPLEMENT_EXCEPTION(TriOutOfRangeException, TriException, "Read out of range")
TRI_IMPLEMENT_EXCEPTION(TriFilesystemException, TriException, "Filesystem error")
TRI_IMPLEMENT_EXCEPTION(TriCorruptStructureException, TriException, "Corrupt structure")
TRI_IMPLEMENT_EXCEPTION(TriJobConflictException, TriException, "Job conflict")
TRI_IMPLEMENT_EXCEPTION(TriInsufficientDataException, TriException, "Insufficient data")
TRI_IMPLEMENT_EXCEPTION(TriStoreException, TriException, "Artifact store error")
