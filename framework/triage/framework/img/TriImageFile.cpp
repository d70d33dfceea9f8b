/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriImageFile.h"

TriImageFile::TriImageFile()
{
}

TriImageFile::~TriImageFile()
{
}

std::string TriImageFile::formatName(Format format)
{
    switch (format) {
    case FORMAT_RAW:
        return "raw";
    case FORMAT_RAW_SPLIT:
        return "raw-split";
    case FORMAT_EWF:
        return "ewf";
    default:
        return "unknown";
    }
}
