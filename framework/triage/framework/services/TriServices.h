/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriServices.h
 * Contains the interface of the TriServices class.
 */

#ifndef _TRI_SERVICES_H
#define _TRI_SERVICES_H

#include "triage/framework/framework_i.h"
#include "Log.h"
#include "TriSystemProperties.h"

class TriArtifactStore;
class TriJobController;

/**
 * Provides singleton access to the framework services.  This is used
 * to register and access the classes that implement the services. 
 *
 * The registry deliberately holds no notion of a current case; every
 * operation on case data takes the case identifier as a parameter.
 */
class TRI_FRAMEWORK_API TriServices
{
public:
    static TriServices &Instance(); 

    Log& getLog();
    void setLog(Log &log);

    void setSystemProperties(TriSystemProperties& systemProperties);
    TriSystemProperties& getSystemProperties();

    /**
     * Set the artifact store service.
     * The standard framework implementation class is TriArtifactStoreSqlite.
     * @param store An artifact store implementation.
     * @throws TriException if one has already been set.
     */
    void setArtifactStore(TriArtifactStore& store);
    /**
     * Return the artifact store service.
     * @returns Artifact store reference.
     * @throws TriException if the store has not been set.
     */
    TriArtifactStore& getArtifactStore();

    /**
     * Set the extraction job controller.
     * @throws TriException if one has already been set.
     */
    void setJobController(TriJobController& controller);
    /**
     * @throws TriException if the controller has not been set.
     */
    TriJobController& getJobController();

private:
    // Private constructor, copy constructor and assignment operator
    // to prevent creation of multiple instances.
    TriServices() {};
    TriServices(TriServices const&);
    TriServices& operator=(TriServices const&);

    // Private destructor to prevent deletion of our instance.
    ~TriServices() {};

    // Default log instance that is used until TriServices::setLog() is called.
    Log m_defaultLog;

    static TriServices *m_pInstance;
    Log *m_log;
    TriSystemProperties * m_systemProperties;
    TriArtifactStore * m_artifactStore;
    TriJobController * m_jobController;
};

/** 
 * Retrieves the string value associated with the given name.
 *
 * @param prop An element of the /ref PredefinedProperty enum.
 * @returns String value corresponding to prop. Throws
 * /ref TriException if the requested value is for a required predefined 
 * property that is not set.
 */
inline std::string GetSystemProperty(TriSystemProperties::PredefinedProperty prop)
{
    return TriServices::Instance().getSystemProperties().get(prop);
}

/** 
 * Associates a string value with a name.
 *
 * @param prop An element of the /ref PredefinedProperty enum.
 * @param value The value to associate with the name.
 */
inline void SetSystemProperty(TriSystemProperties::PredefinedProperty prop, const std::string &value)
{
    TriServices::Instance().getSystemProperties().set(prop, value);
}

#endif
