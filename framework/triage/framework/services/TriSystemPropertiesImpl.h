/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriSystemPropertiesImpl.h
 * Contains the interface of the TriSystemPropertiesImpl class.
 */

#ifndef _TRI_SYSTEMPROPERTIESIMPL_H
#define _TRI_SYSTEMPROPERTIESIMPL_H

#include "triage/framework/framework_i.h"
#include "TriSystemProperties.h"
#include "Poco/AutoPtr.h"
#include "Poco/Util/AbstractConfiguration.h"
#include <string>

/**
 * An implementation of TriSystemProperties that uses Poco
 * AbstractConfiguration class to set and retrieve name/value
 * pairs from an XML file. Allows system property values to refer 
 * to other system property values (see the TriSystemProperties class 
 * description for more details).
 * 
 * The XML schema for this is that the name of the value is the tag and
 * the value is stored in the tag.  Here is an example:
 * 
 * \verbatim
 <?xml version="1.0" encoding="utf-8"?>
 <TRI_FRAMEWORK_CONFIG>
   <OUT_DIR>/cases/out</OUT_DIR>
   <SEVERITY_THRESHOLD>0.7</SEVERITY_THRESHOLD>
 </TRI_FRAMEWORK_CONFIG>
 * \endverbatim
 */
class TRI_FRAMEWORK_API TriSystemPropertiesImpl : public TriSystemProperties
{
public:
    /**
     * Default constructor. The object must then be initialized with a call
     * to one of the initialize() member functions before it can be used.
     */ 
    TriSystemPropertiesImpl() : m_abstractConfig(static_cast<Poco::Util::AbstractConfiguration*>(NULL)) {}

    /**
     * Initialize using a configuration file.
     *
     * @param configfile Path to the XML file to be used to initialize the
     * system properties.
     * @throws TriFileNotFoundException if the file does not exist.
     */
    void initialize(const std::string &configfile);

    /**
     * Initialize with no initial system property settings.
     */
    void initialize();

private:
    // Prohibit copying by declaring copy control functions without implementations. 
    TriSystemPropertiesImpl(const TriSystemPropertiesImpl&);
    TriSystemPropertiesImpl& operator=(const TriSystemPropertiesImpl&);

    virtual void setProperty(const std::string &name, const std::string &value);
    virtual std::string getProperty(const std::string &name) const;

    /**
     * Manages a pointer to a Poco::Util::XMLConfiguration or
     * Poco::Util::MapConfiguration object that maps names to values. 
     */ 
    Poco::AutoPtr<Poco::Util::AbstractConfiguration> m_abstractConfig;
};

#endif
