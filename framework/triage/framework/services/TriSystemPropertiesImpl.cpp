/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriSystemPropertiesImpl.cpp
 * Contains the implementation of the TriSystemPropertiesImpl class.
 */

// Include the class definition first to ensure it does not depend on subsequent includes in this file.
#include "TriSystemPropertiesImpl.h"

#include "triage/framework/utilities/TriException.h"
#include "Poco/Util/XMLConfiguration.h"
#include "Poco/Util/MapConfiguration.h"
#include "Poco/Exception.h"
#include "Poco/SAX/SAXException.h"

void TriSystemPropertiesImpl::initialize(const std::string &configfile) 
{
    try {
        m_abstractConfig = new Poco::Util::XMLConfiguration(configfile);
    }
    catch (Poco::FileNotFoundException& )
    {
        throw TriFileNotFoundException("Configuration file not found : " + configfile);
    }
    catch (Poco::XML::SAXParseException& ex)
    {
        throw TriSystemPropertiesException("Configuration file is not valid XML : " + configfile + " : " + ex.message());
    }
}

void TriSystemPropertiesImpl::initialize()
{
    m_abstractConfig = new Poco::Util::MapConfiguration();
}

void TriSystemPropertiesImpl::setProperty(const std::string &name, const std::string &value)
{
    if (!m_abstractConfig) 
    {
        throw TriException("TriSystemPropertiesImpl::set - Configuration not initialized.");
    } 

    m_abstractConfig->setString(name, value);
}

std::string TriSystemPropertiesImpl::getProperty(const std::string &name) const
{
    if (!m_abstractConfig) 
    {
        throw TriException("TriSystemPropertiesImpl::get - Configuration not initialized.");
    }

    try 
    {
        return m_abstractConfig->getString(name);
    } 
    catch (Poco::NotFoundException &) 
    {
        // Return empty string per documentation of base class interface.
        return "";
    }
}
