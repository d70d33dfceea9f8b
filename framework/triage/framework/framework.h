/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _TRI_FRAMEWORK_H
#define _TRI_FRAMEWORK_H

/**
 * Include this file when incorporating the framework into an
 * application.
 */

#include "triage/framework/framework_i.h"

#include "triage/framework/services/TriServices.h"
#include "triage/framework/services/Log.h"
#include "triage/framework/services/TriSystemProperties.h"
#include "triage/framework/services/TriSystemPropertiesImpl.h"
#include "triage/framework/services/TriArtifactStore.h"
#include "triage/framework/services/TriArtifactStoreSqlite.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"
#include "triage/framework/artifacts/TriArtifact.h"
#include "triage/framework/artifacts/TriArtifactTypes.h"
#include "triage/framework/artifacts/TriTimelineEvent.h"
#include "triage/framework/img/TriImageFile.h"
#include "triage/framework/img/TriImageFileTsk.h"
#include "triage/framework/img/TriImageSummary.h"
#include "triage/framework/filesystem/TriFilesystemWalker.h"
#include "triage/framework/filesystem/TriFilesystemWalkerTsk.h"
#include "triage/framework/registry/TriRegistryHive.h"
#include "triage/framework/extraction/TriExtractor.h"
#include "triage/framework/extraction/TriExtractorRegistry.h"
#include "triage/framework/timeline/TriTimelineBuilder.h"
#include "triage/framework/pipeline/TriExtractionJob.h"
#include "triage/framework/pipeline/TriEvidenceOpener.h"
#include "triage/framework/pipeline/TriJobController.h"
#include "triage/framework/analysis/TriAnomalyReport.h"
#include "triage/framework/analysis/TriAnomalySettings.h"
#include "triage/framework/analysis/TriAnomalyEngine.h"

#endif
