/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _TRI_FRAMEWORK_I_H
#define _TRI_FRAMEWORK_I_H

#include <stdlib.h>
#include <stdio.h>
#include <tsk/libtsk.h>

#define MAX_BUFF_LENGTH 1024


#if defined(TSK_WIN32) 
#if defined(TRI_EXPORTS)
    #define TRI_FRAMEWORK_API __declspec(dllexport)
#else
    #define TRI_FRAMEWORK_API __declspec(dllimport)
#endif
// non-win32
#else
    #define TRI_FRAMEWORK_API 
#endif

#if defined(_MSC_VER)
#pragma warning(disable:4251) // ... needs to have dll-interface warning
#endif

#endif
