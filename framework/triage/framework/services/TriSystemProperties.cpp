/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriSystemProperties.cpp
 * Contains the implementation of the TriSystemProperties class.
 */

// Include the class definition first to ensure it does not depend on subsequent includes in this file.
#include "TriSystemProperties.h"

// Triage Framework includes
#include "triage/framework/services/TriServices.h"
#include "triage/framework/services/Log.h"
#include "triage/framework/utilities/TriUtilities.h"
#include "triage/framework/utilities/TriException.h"

// Poco includes
#include "Poco/Path.h"
#include "Poco/StringTokenizer.h"
#include "Poco/LocalDateTime.h"
#include "Poco/DateTimeFormatter.h"
#include "Poco/NumberParser.h"
#include "Poco/Exception.h"

// C/C++ library includes
#include <sstream>

namespace
{
    const std::string DEFAULT_CONFIG_DIR = std::string("#PROG_DIR#") + Poco::Path::separator() + std::string("Config");
    const std::string DEFAULT_SYSTEM_OUT_DIR = std::string("#OUT_DIR#") + Poco::Path::separator() + std::string("SystemOutput");
    const std::string DEFAULT_LOG_DIR = std::string("#SYSTEM_OUT_DIR#") + Poco::Path::separator() + std::string("Logs");
    const std::string DEFAULT_STORE_FILE = std::string("#SYSTEM_OUT_DIR#") + Poco::Path::separator() + std::string("triage.db");

    struct PredefProp
    {
        PredefProp(TriSystemProperties::PredefinedProperty propId, const std::string &macroToken, bool propRequired, const std::string &propDefaultValue) :
            id(propId), token(macroToken), required(propRequired), defaultValue(propDefaultValue) {}
        TriSystemProperties::PredefinedProperty id;
        std::string token;
        bool required;
        std::string defaultValue;
    };

    const PredefProp predefinedProperties[] =
    {
        PredefProp(TriSystemProperties::PROG_DIR, "PROG_DIR", false, ""),
        PredefProp(TriSystemProperties::CONFIG_DIR, "CONFIG_DIR", false, DEFAULT_CONFIG_DIR),
        PredefProp(TriSystemProperties::OUT_DIR, "OUT_DIR", true, ""),
        PredefProp(TriSystemProperties::SYSTEM_OUT_DIR, "SYSTEM_OUT_DIR", false, DEFAULT_SYSTEM_OUT_DIR),
        PredefProp(TriSystemProperties::LOG_DIR, "LOG_DIR", false, DEFAULT_LOG_DIR),
        PredefProp(TriSystemProperties::STORE_FILE, "STORE_FILE", false, DEFAULT_STORE_FILE),
        PredefProp(TriSystemProperties::TEMPORAL_ADJACENCY_SECONDS, "TEMPORAL_ADJACENCY_SECONDS", false, "300"),
        PredefProp(TriSystemProperties::SESSION_WINDOW_SECONDS, "SESSION_WINDOW_SECONDS", false, "1800"),
        PredefProp(TriSystemProperties::MAX_TEMPORAL_NEIGHBORS, "MAX_TEMPORAL_NEIGHBORS", false, "5"),
        PredefProp(TriSystemProperties::SEVERITY_THRESHOLD, "SEVERITY_THRESHOLD", false, "0.7"),
        PredefProp(TriSystemProperties::RISK_TOP_K, "RISK_TOP_K", false, "5"),
        PredefProp(TriSystemProperties::RISK_TOP_K_WEIGHT, "RISK_TOP_K_WEIGHT", false, "0.7"),
        PredefProp(TriSystemProperties::RISK_BAND_MEDIUM, "RISK_BAND_MEDIUM", false, "40"),
        PredefProp(TriSystemProperties::RISK_BAND_HIGH, "RISK_BAND_HIGH", false, "70"),
        PredefProp(TriSystemProperties::RISK_BAND_CRITICAL, "RISK_BAND_CRITICAL", false, "90"),
        PredefProp(TriSystemProperties::ANOMALY_SCORER, "ANOMALY_SCORER", false, "graph"),
        PredefProp(TriSystemProperties::RULE_SCORER_CONFIDENCE, "RULE_SCORER_CONFIDENCE", false, "0.85"),
        PredefProp(TriSystemProperties::JOB_TIMEOUT_SECONDS, "JOB_TIMEOUT_SECONDS", false, "3600"),
        PredefProp(TriSystemProperties::MAX_FILE_READ_BYTES, "MAX_FILE_READ_BYTES", false, "268435456"),
        PredefProp(TriSystemProperties::START_TIME, "START_TIME", false, ""),
        PredefProp(TriSystemProperties::CURRENT_TIME, "CURRENT_TIME", false, "")
    };

    const std::size_t MAX_RECURSION_DEPTH = 10;
}

TriSystemProperties::TriSystemProperties()
{
    // Populate the lookup data structures. 
    for (std::size_t i = 0; i < END_PROPS; ++i)
    {
        predefProps[predefinedProperties[i].token] = predefinedProperties[i].id;
        predefPropNames[predefinedProperties[i].id] = predefinedProperties[i].token;
        predefPropTokens.insert(predefinedProperties[i].token);

        if (predefinedProperties[i].required)
        {
            requiredProps.insert(predefinedProperties[i].id);
        }

        predefPropDefaults[predefinedProperties[i].id] = predefinedProperties[i].defaultValue; 
    }
}

bool TriSystemProperties::isConfigured() const
{
    // Check whether all of the required predefined system properties are set.
    for (std::set<PredefinedProperty>::const_iterator prop = requiredProps.begin(); prop != requiredProps.end(); ++prop)
    {
        std::string value = getProperty(predefPropNames.at(*prop));
        if (value.empty())
        {
            return false;
        }
    }

    return true;
}

void TriSystemProperties::set(PredefinedProperty prop, const std::string &value)
{
    if (prop < PROG_DIR || prop >= END_PROPS)
    {
        throw TriException("TriSystemProperties::set : passed out of range prop argument");
    }

    set(predefPropNames[prop], value);
}

void TriSystemProperties::set(const std::string &name, const std::string &value)
{
    if (name.empty())
    {
        throw TriException("TriSystemProperties::set : passed empty name argument");
    }

    if (name == "CURRENT_TIME")
    {
        LOGWARN("TriSystemProperties::set : attempt to set read-only CURRENT_TIME system property");
        return;
    }

    setProperty(name, value);
}

std::string TriSystemProperties::get(PredefinedProperty prop) const
{
    if (prop < PROG_DIR || prop >= END_PROPS)
    {
        throw TriException("TriSystemProperties::get : passed out of range prop argument");
    }

    if (prop == CURRENT_TIME)
    {
        // CURRENT_TIME is always computed upon request.
        return Poco::DateTimeFormatter::format(Poco::LocalDateTime(), "%Y_%m_%d_%H_%M_%S");
    }

    std::string value = getProperty(predefPropNames.at(prop));
        
    if (value.empty())
    {
        if (prop == PROG_DIR)
        {            
            // If PROG_DIR has not been set, set it to the location of the currently executing program.
            value = TriUtilities::getProgDir();
            const_cast<TriSystemProperties*>(this)->set(prop, value);
        }
        else
        {
            // Perhaps there is a default value.
            value = predefPropDefaults.at(prop);
        }
    }

    if (value.empty() && requiredProps.count(prop) != 0)
    {
        // The empty property is an unset required property.
        std::stringstream msg;
        msg << "TriSystemProperties::get : required predefined system property '" << predefPropNames.at(prop) << "' is not set";
        throw TriSystemPropertiesException(msg.str());
    }

    return expandMacros(value);
}

std::string TriSystemProperties::get(const std::string &name) const
{
    std::map<std::string, PredefinedProperty>::const_iterator it = predefProps.find(name);
    if (it != predefProps.end())
    {
        return get(it->second);
    }

    return expandMacros(getProperty(name));
}

int64_t TriSystemProperties::getInt(PredefinedProperty prop) const
{
    std::string value = get(prop);
    try
    {
        return Poco::NumberParser::parse64(value);
    }
    catch (Poco::SyntaxException &)
    {
        std::stringstream msg;
        msg << "TriSystemProperties::getInt : '" << predefPropNames.at(prop) << "' is not an integer: " << value;
        throw TriSystemPropertiesException(msg.str());
    }
}

double TriSystemProperties::getDouble(PredefinedProperty prop) const
{
    std::string value = get(prop);
    try
    {
        return Poco::NumberParser::parseFloat(value);
    }
    catch (Poco::SyntaxException &)
    {
        std::stringstream msg;
        msg << "TriSystemProperties::getDouble : '" << predefPropNames.at(prop) << "' is not a number: " << value;
        throw TriSystemPropertiesException(msg.str());
    }
}

std::string TriSystemProperties::expandMacros(const std::string &inputStr) const
{
    std::string outputStr;
    expandMacros(inputStr, outputStr, 1);
    return outputStr;
}

void TriSystemProperties::expandMacros(const std::string &inputStr, std::string &outputStr, std::size_t depth) const
{
    if (depth > MAX_RECURSION_DEPTH)
    {
        std::stringstream msg;
        msg << "TriSystemProperties::expandMacros : reached maximum depth (" << MAX_RECURSION_DEPTH << ") of recursion, cannot complete expansion of " << inputStr;
        LOGERROR(msg.str());
        return;
    }

    Poco::StringTokenizer tokenizer(inputStr, "#", Poco::StringTokenizer::TOK_IGNORE_EMPTY);
    for (Poco::StringTokenizer::Iterator token = tokenizer.begin(); token != tokenizer.end(); ++token)
    {
        if (predefPropTokens.count(*token) != 0)
        {
            expandMacros(get(*token), outputStr, depth + 1);
        }
        else
        {
            outputStr += *token;
        }
    }
}
