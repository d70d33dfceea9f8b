/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <sstream>
#include <memory>
#include <unistd.h>

#include "triage/framework/framework.h"

#include "Poco/Path.h"
#include "Poco/File.h"
#include "Poco/Exception.h"

static uint8_t
makeDir(const std::string &dir)
{
    try {
        Poco::File(dir).createDirectories();
    } catch (const Poco::Exception &ex) {
        std::stringstream msg;
        msg << "Error creating directory: " << dir << " Poco exception: " << ex.displayText();
        fprintf(stderr, "%s\n", msg.str().c_str());
        return 1;
    }
    return 0;
}

/**
 * Logs all messages to a log file and prints
 * error messages to STDERR
 */
class StderrLog : public Log
{
public:
    StderrLog() : Log() {
    }

    void log(Channel a_channel, const std::string &a_msg)
    {
        Log::log(a_channel, a_msg);
        if (a_channel != Error) {
            return;
        }
        fprintf(stderr, "%s\n", a_msg.c_str());
    }
};

void
usage(const char *program)
{
    fprintf(stderr, "%s [-c framework_config_file] [-d outdir] [-C case_id] [-a] [-t] [-s] [-r] [-D] [-L] [image_name]\n", program);
    fprintf(stderr, "\t-c framework_config_file: Path to XML framework config file\n");
    fprintf(stderr, "\t-d outdir: Path to output directory\n");
    fprintf(stderr, "\t-C case_id: Case to work on (default: image file name without extension)\n");
    fprintf(stderr, "\t-a: Run anomaly analysis after extraction\n");
    fprintf(stderr, "\t-t: Print the case timeline\n");
    fprintf(stderr, "\t-s: Print the image summary of the case\n");
    fprintf(stderr, "\t-r: Print the latest anomaly report of the case\n");
    fprintf(stderr, "\t-D: Delete everything stored for the case and exit\n");
    fprintf(stderr, "\t-L: Print no error messages to STDERR -- only log them\n");
    fprintf(stderr, "Without image_name no extraction is done and -C and -d are required.\n");
    exit(1);
}

static void
printSummary(const std::string &caseId, const TriImageSummary &summary)
{
    std::cout << "Case:          " << caseId << std::endl;
    std::cout << "Format:        " << summary.format << std::endl;
    std::cout << "Size:          " << summary.size << " bytes" << std::endl;
    std::cout << "Sector size:   " << summary.sectorSize << std::endl;
    std::cout << "Segments:      " << summary.segmentCount << std::endl;
    std::cout << "Allocated:     " << summary.allocatedBytes << " bytes" << std::endl;
    std::cout << "Unallocated:   " << summary.unallocatedBytes << " bytes" << std::endl;
    if (!summary.md5.empty()) {
        std::cout << "MD5:           " << summary.md5 << std::endl;
        std::cout << "SHA-1:         " << summary.sha1 << std::endl;
    }
    for (std::vector<TriPartitionInfo>::const_iterator it = summary.partitions.begin();
        it != summary.partitions.end(); ++it) {
        std::cout << "  " << it->index << ": " << it->description
                  << " offset " << it->startOffset << " size " << it->size
                  << (it->allocated ? "" : " (unallocated)") << std::endl;
    }
}

static void
printReport(const TriAnomalyReport &report)
{
    std::cout << "Case:               " << report.caseId << std::endl;
    std::cout << "Generated:          " << TriUtilities::formatTime(report.generatedAt) << std::endl;
    std::cout << "Scorer:             " << report.scorerName << std::endl;
    std::cout << "Risk level:         " << TriAnomalyReport::riskLevelName(report.riskLevel) << std::endl;
    std::cout << "Overall risk score: " << report.overallRiskScore << std::endl;
    std::cout << "Anomalies:          " << report.anomaliesDetected << " of " << report.totalActivities << std::endl;
    std::cout << "Model accuracy:     " << report.modelAccuracy << std::endl;
    std::cout << "Critical indicators:" << std::endl;
    for (std::vector<std::string>::const_iterator it = report.criticalIndicators.begin();
        it != report.criticalIndicators.end(); ++it)
        std::cout << "  - " << *it << std::endl;
    std::cout << "Recommendations:" << std::endl;
    for (std::vector<std::string>::const_iterator it = report.recommendations.begin();
        it != report.recommendations.end(); ++it)
        std::cout << "  - " << *it << std::endl;
}

static void
printJob(const TriExtractionJob &job)
{
    std::cout << "Job " << job.jobId << " for case " << job.caseId << ": "
              << TriExtractionJob::stateName(job.state) << std::endl;
    std::cout << "  artifacts extracted: " << job.artifactsExtracted
              << " (new " << job.artifactsStored << ", merged " << job.artifactsMerged << ")" << std::endl;
    std::cout << "  timeline events:     " << job.timelineEvents << std::endl;
    for (std::vector<std::string>::const_iterator it = job.warnings.begin(); it != job.warnings.end(); ++it)
        std::cout << "  warning: " << *it << std::endl;
    if (!job.errorMessage.empty())
        std::cout << "  error: " << job.errorMessage << std::endl;
}

int main(int argc, char **argv)
{
    int ch;
    std::string framework_config;
    std::string outDirPath;
    std::string caseId;
    bool suppressSTDERR = false;
    bool doAnalysis = false;
    bool printTimeline = false;
    bool doPrintSummary = false;
    bool doPrintReport = false;
    bool deleteCase = false;

    while ((ch = getopt(argc, argv, "c:d:C:atsrDL")) > 0) {
        switch (ch) {
        case 'c':
            framework_config.assign(optarg);
            break;
        case 'd':
            outDirPath.assign(optarg);
            break;
        case 'C':
            caseId.assign(optarg);
            break;
        case 'a':
            doAnalysis = true;
            break;
        case 't':
            printTimeline = true;
            break;
        case 's':
            doPrintSummary = true;
            break;
        case 'r':
            doPrintReport = true;
            break;
        case 'D':
            deleteCase = true;
            break;
        case 'L':
            suppressSTDERR = true;
            break;
        case '?':
        default:
            usage(argv[0]);
        }
    }

    std::string imagePath;
    if (optind < argc)
        imagePath = argv[optind];

    if (imagePath.empty() && (caseId.empty() || outDirPath.empty())) {
        fprintf(stderr, "Missing image name\n");
        usage(argv[0]);
    }

    if (!imagePath.empty() && !Poco::File(imagePath).exists()) {
        fprintf(stderr, "Image file not found: %s\n", imagePath.c_str());
        return 1;
    }

    if (caseId.empty())
        caseId = Poco::Path(imagePath).getBaseName();

    // Load the framework config if they specified it
    std::unique_ptr<TriSystemPropertiesImpl> systemProperties(new TriSystemPropertiesImpl());
    try
    {
        // try the one specified on the command line
        if (framework_config.size()) {
            systemProperties->initialize(framework_config);
        }
        // try the one in the current directory
        else if (Poco::File("framework_config.xml").exists()) {
            systemProperties->initialize("framework_config.xml");
        }
        // fall back to the built in defaults
        else {
            systemProperties->initialize();
        }
        TriServices::Instance().setSystemProperties(*systemProperties);
    }
    catch (TriException& ex)
    {
        fprintf(stderr, "Loading framework config file: %s\n", ex.message().c_str());
        return 1;
    }

    // if they didn't specify the output directory, make one
    if (outDirPath == "") {
        outDirPath.assign(imagePath);
        outDirPath.append("_triage_out");
    }
    SetSystemProperty(TriSystemProperties::OUT_DIR, outDirPath);

    // make the output dirs, makeDir() reports the error.
    if (makeDir(outDirPath))
        return 1;
    if (makeDir(GetSystemProperty(TriSystemProperties::SYSTEM_OUT_DIR)))
        return 1;
    std::string logDir = GetSystemProperty(TriSystemProperties::LOG_DIR);
    if (makeDir(logDir))
        return 1;

    std::unique_ptr<Log> log;
    if (suppressSTDERR)
        log.reset(new Log());
    else
        log.reset(new StderrLog());
    if (log->openInDirectory(logDir))
        return 1;
    TriServices::Instance().setLog(*log);

    try
    {
        TriArtifactStoreSqlite store(GetSystemProperty(TriSystemProperties::STORE_FILE));
        store.open();
        TriServices::Instance().setArtifactStore(store);

        if (deleteCase) {
            uint64_t removed = store.deleteCase(caseId);
            std::cout << "Deleted case " << caseId << " (" << removed << " artifacts)" << std::endl;
            return 0;
        }

        const TriSystemProperties &props = TriServices::Instance().getSystemProperties();
        TriExtractorRegistry extractors;
        TriEvidenceOpenerTsk opener((uint64_t)props.getInt(TriSystemProperties::MAX_FILE_READ_BYTES), true);
        TriJobController controller(store, opener, extractors, 1, props.getInt(TriSystemProperties::JOB_TIMEOUT_SECONDS));
        TriServices::Instance().setJobController(controller);

        if (!imagePath.empty()) {
            controller.submit(caseId, imagePath);
            controller.waitForCompletion(caseId);

            TriExtractionJob job;
            if (controller.getStatus(caseId, job))
                printJob(job);
            if (job.state != TRI_JOB_COMPLETED)
                return 1;
        }

        TriArtifactStore &artifacts = TriServices::Instance().getArtifactStore();

        if (doPrintSummary) {
            TriImageSummary summary;
            if (artifacts.getImageSummary(caseId, summary))
                printSummary(caseId, summary);
            else
                std::cout << "No image summary stored for case " << caseId << std::endl;
        }

        if (printTimeline) {
            TriTimelineBuilder timeline(artifacts);
            TriTimelineBuilder::write(std::cout, timeline.build(caseId));
        }

        if (doAnalysis) {
            TriAnomalyEngine engine(artifacts, TriAnomalySettings::fromSystemProperties(props),
                &TriServices::Instance().getJobController());
            printReport(engine.analyze(caseId));
        }
        else if (doPrintReport) {
            TriAnomalyReport report;
            if (artifacts.getLatestReport(caseId, report))
                printReport(report);
            else
                std::cout << "No anomaly report stored for case " << caseId << std::endl;
        }
    }
    catch (const TriException &ex)
    {
        std::stringstream msg;
        msg << ex.name() << ": " << ex.message();
        LOGERROR(msg.str());
        return 1;
    }
    catch (const Poco::Exception &ex)
    {
        LOGERROR("Poco exception: " + ex.displayText());
        return 1;
    }

    std::stringstream msg;
    msg << "case " << caseId << " complete";
    LOGINFO(msg.str());
    std::cout << "Results saved to " << outDirPath << std::endl;
    return 0;
}
