/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriException.h
 * Contains definition of Framework exception classes.
 * Based on techniques used in the Poco Exception class.
 */

#ifndef _TRI_EXCEPTION_H
#define _TRI_EXCEPTION_H

#include <stdexcept>
#include <string>

#include "triage/framework/framework_i.h"

/**
 * Framework exception class
 */
class TRI_FRAMEWORK_API TriException : public std::exception
{
public:
    /// Create an exception using the supplied message.
    TriException(const std::string& msg, int code = 0);

    /// Copy Constructor
    TriException(const TriException& e);

    /// Destructor
    ~TriException() throw ();

    /// Assignment operator
    TriException& operator= (const TriException& e);

    /// Returns a static string describing the exception.
    virtual const char * name() const throw();

    /// Returns the name of the exception class.
    virtual const char * className() const throw();

    /// Returns the message text, for compatibility with std::exception.
    virtual const char * what() const throw();

    /// Returns the message text.
    const std::string& message() const;

    /// Returns the exception code.
    int code() const;

protected:
    /// Default constructor.
    TriException(int code = 0);

    /// Sets the message for the exception.
    void message(const std::string& msg);

private:
    std::string m_msg;
    int m_code;
};

inline const std::string& TriException::message() const
{
    return m_msg;
}

inline void TriException::message(const std::string &msg)
{
    m_msg = msg;
}

inline int TriException::code() const
{
    return m_code;
}

//
// Declare and implement an exception class deriving from BASE. NAME is
// the static string returned by name(); string literals cannot be
// template arguments, so these stay macros.
//
#define TRI_DECLARE_EXCEPTION(CLS, BASE) \
	class TRI_FRAMEWORK_API CLS: public BASE									    \
	{																				\
	public:																			\
		CLS(int code = 0);															\
		CLS(const std::string& msg, int code = 0);									\
		CLS(const CLS& exc);														\
		~CLS() throw();																\
		CLS& operator = (const CLS& exc);											\
		const char* name() const throw();											\
		const char* className() const throw();										\
	};


#define TRI_IMPLEMENT_EXCEPTION(CLS, BASE, NAME)													\
	CLS::CLS(int code): BASE(code)																	\
	{																								\
	}																								\
	CLS::CLS(const std::string& msg, int code): BASE(msg, code)										\
	{																								\
	}																								\
	CLS::CLS(const CLS& exc): BASE(exc)																\
	{																								\
	}																								\
	CLS::~CLS() throw()																				\
	{																								\
	}																								\
	CLS& CLS::operator = (const CLS& exc)															\
	{																								\
		BASE::operator = (exc);																		\
		return *this;																				\
	}																								\
	const char* CLS::name() const throw()	           												\
	{																								\
		return NAME;																				\
	}																								\
	const char* CLS::className() const throw()			    										\
	{																								\
		return typeid(*this).name();																\
	}																								\

/// A file inside the evidence could not be read.
TRI_DECLARE_EXCEPTION(TriFileException, TriException)
TRI_DECLARE_EXCEPTION(TriFileNotFoundException, TriFileException)
TRI_DECLARE_EXCEPTION(TriSystemPropertiesException, TriException)

/// The evidence container could not be opened or its header is not recognized.
TRI_DECLARE_EXCEPTION(TriImageFormatException, TriException)
/// A read was requested outside the addressable range of the image.
TRI_DECLARE_EXCEPTION(TriOutOfRangeException, TriException)
/// No supported volume or filesystem could be mounted.
TRI_DECLARE_EXCEPTION(TriFilesystemException, TriException)
/// A structure was present but could not be parsed.
TRI_DECLARE_EXCEPTION(TriCorruptStructureException, TriException)
/// Another extraction job for the same case is queued or running.
TRI_DECLARE_EXCEPTION(TriJobConflictException, TriException)
/// There is not enough stored evidence to run an analysis.
TRI_DECLARE_EXCEPTION(TriInsufficientDataException, TriException)
/// The artifact store rejected or failed an operation.
TRI_DECLARE_EXCEPTION(TriStoreException, TriException)

#endif
