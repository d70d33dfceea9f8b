/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriSystemProperties.h
 * Contains the interface of the TriSystemProperties class.
 */

#ifndef _TRI_SYSTEMPROPERTIES_H
#define _TRI_SYSTEMPROPERTIES_H

// Triage Framework includes
#include "triage/framework/framework_i.h"

// C/C++ library includes
#include <string>
#include <map>
#include <set>

/**
 * A base class for setting and retrieving system-wide name/value pairs.
 * Typically used to store system settings so that all classes can access
 * the settings. Can be registered with and retrieved from TriServices.
 *
 * The class defines several standard 'names' in the PredefinedProperty
 * enum.  Any 'name' can be used though.
 *
 * Values can refer to other 'names' in the SystemProperties.  When the
 * values are retrieved via one of the get() methods, the value is searched
 * for words between two '#' characters.  If the word is a defined system 
 * property, then its value will be replaced. For example, \#OUT_DIR\# would 
 * be replaced by the OUT_DIR system property value in "#OUT_DIR#/store". 
 * 
 * The class is abstract; derived classes supply property storage options and 
 * implement the private virtual functions setProperty and getProperty (the 
 * class design makes use of Herb Sutter's Non-Virtual Interface [NVI] idiom).
 */
class TRI_FRAMEWORK_API TriSystemProperties
{
public:
    /**
     * The framework predefines a set of system properties. Most of them
     * have default values; OUT_DIR must be supplied by either the executing
     * program or the framework configuration file.
     */
    enum PredefinedProperty
    {
        /** 
         * Program root directory. Defaults to the directory where the 
         * executing program is installed. 
         */
        PROG_DIR,

        /** 
         * Directory where configuration files can be found. 
         * Defaults to \#PROG_DIR#/Config. 
         */
        CONFIG_DIR,

        /** 
         * Root output directory. It is a required system property.
         */
        OUT_DIR,

        /** 
         * The output directory for the executing program. Defaults to 
         * \#OUT_DIR#/SystemOutput.
         */
        SYSTEM_OUT_DIR,

        /** 
         * Directory where system logs are written. Defaults to 
         * \#SYSTEM_OUT_DIR#/Logs. 
         */
        LOG_DIR,

        /**
         * Path of the SQLite artifact store. Defaults to
         * \#SYSTEM_OUT_DIR#/triage.db.
         */
        STORE_FILE,

        /**
         * Two activities closer than this many seconds are linked in the
         * activity graph. Defaults to 300.
         */
        TEMPORAL_ADJACENCY_SECONDS,

        /**
         * Activities of one user profile within this many seconds belong to
         * the same session. Defaults to 1800.
         */
        SESSION_WINDOW_SECONDS,

        /**
         * Upper bound on temporal-adjacency edges per node. Defaults to 5.
         */
        MAX_TEMPORAL_NEIGHBORS,

        /**
         * Node score at or above which an activity counts as anomalous.
         * Defaults to 0.7.
         */
        SEVERITY_THRESHOLD,

        /** Number of top node scores blended into the risk score. Defaults to 5. */
        RISK_TOP_K,

        /** Weight of the top-k mean in the risk score. Defaults to 0.7. */
        RISK_TOP_K_WEIGHT,

        /** Lowest risk score reported as MEDIUM. Defaults to 40. */
        RISK_BAND_MEDIUM,

        /** Lowest risk score reported as HIGH. Defaults to 70. */
        RISK_BAND_HIGH,

        /** Lowest risk score reported as CRITICAL. Defaults to 90. */
        RISK_BAND_CRITICAL,

        /**
         * Node scorer used by the anomaly engine, "rule" or "graph".
         * Defaults to graph.
         */
        ANOMALY_SCORER,

        /**
         * Confidence the rule scorer reports as the model accuracy of its
         * reports. Defaults to 0.85.
         */
        RULE_SCORER_CONFIDENCE,

        /**
         * Wall-clock budget of one extraction job in seconds. Zero disables
         * the timeout. Defaults to 3600.
         */
        JOB_TIMEOUT_SECONDS,

        /**
         * Largest file, in bytes, the filesystem walker reads into memory.
         * Defaults to 268435456.
         */
        MAX_FILE_READ_BYTES,

        /** 
         * The time the process running the program began executing. 
         */
        START_TIME,

        /** 
         * Current system time. Read only. 
         */
        CURRENT_TIME,

		END_PROPS
    };

    /** 
     * Default constructor. 
     */
    TriSystemProperties();

    /** 
     * Destructor, virtual since this is an abstract base class. 
     */
    virtual ~TriSystemProperties() {}

    /**
     * Determines whether or not all required predefined system properties are
     * currently set.
     *
     * @return True if all required properties are set, false otherwise.
     */
    bool isConfigured() const;

    /** 
     * Associates a string value with a name.
     *
     * @param prop An element of the PredefinedProperty enum.
     * @param value The value to associate with the name corresponding to the
     * PredefinedProperty enum element.
     * @return Throws TriException if prop is out of range.
     */
    void set(PredefinedProperty prop, const std::string &value);

    /** 
     * Associates a string value with an unofficial name.
     *
     * @param name The name with which to associate the value.
     * @param value The value to associate with the name.
     * @return Throws TriException if name is empty.
     */
    void set(const std::string &name, const std::string &value);

    /** 
     * Retrieves the string value associated with a name.
     *
     * @param prop An element of the PredefinedProperty enum.
     * @returns String value corresponding to prop. Throws
     * TriException if the requested value is for a required predefined 
     * property that is not set.
     */
    std::string get(PredefinedProperty prop) const;
    
    /** 
     * Retrieves the string value associated with a name.
     *
     * @param name Name of value to retrieve.
     * @returns String value or empty string if name was not found. 
     */
    std::string get(const std::string &name) const;

    /**
     * Retrieves a predefined property as an integer.
     * @throws TriSystemPropertiesException if the value is not a number.
     */
    int64_t getInt(PredefinedProperty prop) const;

    /**
     * Retrieves a predefined property as a floating point number.
     * @throws TriSystemPropertiesException if the value is not a number.
     */
    double getDouble(PredefinedProperty prop) const;

    /**
     * Expands any system property macros in a given string.
     *
     * @param inputStr The input string.
     * @return A copy of the input string with all system property macros
     * expanded.
     */
    std::string expandMacros(const std::string &inputStr) const;

private:
    virtual void setProperty(const std::string &name, const std::string &value) = 0;
    virtual std::string getProperty(const std::string &name) const = 0;

    void expandMacros(const std::string &inputStr, std::string &outputStr, std::size_t depth) const;

    // Lookup tables built once from the predefined property table.
    std::map<std::string, PredefinedProperty> predefProps;
    std::map<PredefinedProperty, std::string> predefPropNames;
    std::set<std::string> predefPropTokens;
    std::set<PredefinedProperty> requiredProps;
    std::map<PredefinedProperty, std::string> predefPropDefaults;
};

#endif
