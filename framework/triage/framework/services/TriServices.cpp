/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriServices.cpp
 * Contains the implementation of the TriServices class.
 */

#include "TriServices.h"
#include "triage/framework/utilities/TriException.h"

TriServices *TriServices::m_pInstance = NULL;

/**
 * Singleton interface to return the TriServices instance.
 */
TriServices &TriServices::Instance()
{
    if (!m_pInstance) {
        m_pInstance = new TriServices;
        m_pInstance->m_log = NULL;
        m_pInstance->m_systemProperties = NULL;
        m_pInstance->m_artifactStore = NULL;
        m_pInstance->m_jobController = NULL;
    }
    return *m_pInstance;
}

/** 
 * Return the system log service.  If no log was setup, the default log
 * that sends messages to stderr is returned.
 * @returns log reference. 
 */
Log& TriServices::getLog()
{
    if (!m_log) {
        return m_defaultLog;
    }
    return *m_log;
}

/**
 * Set the log service. 
 * Throws an exception if one has already been set. 
 */
void TriServices::setLog(Log &log)
{
    if (m_log) {
        LOGERROR("TriServices::setLog - Log has already been initialized.");
        throw TriException("Log already initialized.");
    } else {
        m_log = &log;
    }
}

/**
 * Set the system properties service. 
 * Throws an exception if one has already been set. 
 */
void TriServices::setSystemProperties(TriSystemProperties& systemProperties)
{
    if (m_systemProperties) {
        LOGERROR("TriServices::setSystemProperties - SystemProperties has already been initialized.");
        throw TriException("SystemProperties already initialized.");
    } else {
        m_systemProperties = &systemProperties;
    }
}

/** 
 * Return the system properties service.  If no service was setup, an exception
 * is thrown.
 * @returns system properties reference. 
 */
TriSystemProperties& TriServices::getSystemProperties()
{
    if (m_systemProperties == NULL)
    {
        LOGERROR("TriServices::getSystemProperties - SystemProperties has not been initialized.");
        throw TriException("SystemProperties not initialized.");
    }
    return *m_systemProperties;
}

void TriServices::setArtifactStore(TriArtifactStore& store)
{
    if (m_artifactStore) {
        LOGERROR("TriServices::setArtifactStore - ArtifactStore has already been initialized.");
        throw TriException("ArtifactStore already initialized.");
    } else {
        m_artifactStore = &store;
    }
}

TriArtifactStore& TriServices::getArtifactStore()
{
    if (m_artifactStore == NULL)
    {
        LOGERROR("TriServices::getArtifactStore - ArtifactStore has not been initialized.");
        throw TriException("ArtifactStore not initialized.");
    }
    return *m_artifactStore;
}

void TriServices::setJobController(TriJobController& controller)
{
    if (m_jobController) {
        LOGERROR("TriServices::setJobController - JobController has already been initialized.");
        throw TriException("JobController already initialized.");
    } else {
        m_jobController = &controller;
    }
}

TriJobController& TriServices::getJobController()
{
    if (m_jobController == NULL)
    {
        LOGERROR("TriServices::getJobController - JobController has not been initialized.");
        throw TriException("JobController not initialized.");
    }
    return *m_jobController;
}
