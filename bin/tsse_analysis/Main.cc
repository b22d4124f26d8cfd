/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */
//! \brief
//! Run one analysis job over a sensor dataset.
//!
//! DESCRIPTION:\n
//! Loads the sensor registry and samples from a JSON dataset file, reads
//! a job request of the form
//! {"job_type": ..., "params": {...}, "job_key": ..., "dedupe": ...}
//! from a file or STDIN, runs the job on the analysis engine and sends
//! {"job": ..., "result": ..., "events": [...]} to STDOUT.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Standalone program.
//!
#include <core/CBoostJsonParser.h>
#include <core/CLogger.h>

#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>

#include <api/CAnalysisJobEngine.h>
#include <api/CDatasetJsonReader.h>
#include <api/CJobParamsReader.h>
#include <api/JobTypes.h>

#include "CCmdLineParser.h"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace {
const std::uint64_t POLL_INTERVAL_MS{1000};

bool readRequest(std::istream& input,
                 tsse::api::CAnalysisJobEngine::SCreateRequest& request,
                 std::string& error) {
    tsse::json::value document;
    if (tsse::core::CBoostJsonParser::parse(input, document, error) == false) {
        return false;
    }

    tsse::api::CJobParamsReader reader;
    reader.addParameter("job_type", tsse::api::CJobParamsReader::E_RequiredParameter);
    reader.addParameter("params", tsse::api::CJobParamsReader::E_OptionalParameter);
    reader.addParameter("job_key", tsse::api::CJobParamsReader::E_OptionalParameter);
    reader.addParameter("dedupe", tsse::api::CJobParamsReader::E_OptionalParameter);

    tsse::api::CJobParamsReader::TStrVec errors;
    tsse::api::CJobParameters parameters{reader.read(document, errors)};
    request.s_JobType = parameters["job_type"].fallback(std::string{});
    request.s_JobKey = parameters["job_key"].fallback(std::string{});
    request.s_Dedupe = parameters["dedupe"].fallback(false);
    const tsse::json::value* params{parameters["params"].jsonObject()};
    request.s_Params = params != nullptr ? *params : tsse::json::object{};

    if (errors.empty() == false) {
        error.clear();
        for (const auto& error_ : errors) {
            error += (error.empty() ? "" : "; ") + error_;
        }
        return false;
    }
    return true;
}
}

int main(int argc, char** argv) {
    // Read command line options
    std::string logProperties;
    std::string datasetFileName;
    std::string requestFileName;
    std::string outputFileName;
    std::size_t threads{2};
    std::size_t maxConcurrentJobs{2};
    std::uint64_t timeoutMs{0};
    if (tsse::analysis::CCmdLineParser::parse(argc, argv, logProperties, datasetFileName,
                                              requestFileName, outputFileName, threads,
                                              maxConcurrentJobs, timeoutMs) == false) {
        return EXIT_FAILURE;
    }

    if (tsse::core::CLogger::instance().reconfigure(logProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }

    tsse::analytics::CSensorRegistry registry;
    tsse::analytics::CInMemorySampleStore store;
    {
        std::ifstream datasetStrm{datasetFileName};
        if (datasetStrm.is_open() == false) {
            LOG_FATAL(<< "Unable to open dataset file '" << datasetFileName << "'");
            return EXIT_FAILURE;
        }
        std::string error;
        tsse::api::CDatasetJsonReader datasetReader{registry, store};
        if (datasetReader.read(datasetStrm, error) == false) {
            LOG_FATAL(<< "Failed to load dataset '" << datasetFileName << "': " << error);
            return EXIT_FAILURE;
        }
    }

    tsse::api::CAnalysisJobEngine::SCreateRequest request;
    {
        std::string error;
        bool ok{false};
        if (requestFileName.empty()) {
            ok = readRequest(std::cin, request, error);
        } else {
            std::ifstream requestStrm{requestFileName};
            if (requestStrm.is_open() == false) {
                LOG_FATAL(<< "Unable to open request file '" << requestFileName << "'");
                return EXIT_FAILURE;
            }
            ok = readRequest(requestStrm, request, error);
        }
        if (ok == false) {
            LOG_FATAL(<< "Invalid job request: " << error);
            return EXIT_FAILURE;
        }
    }

    tsse::api::CAnalysisJobEngine::SConfig config;
    config.s_Threads = threads;
    config.s_MaxConcurrentJobs = maxConcurrentJobs;
    tsse::api::CAnalysisJobEngine engine{registry, store, config};

    bool created{false};
    tsse::api::SJobError createError;
    auto job = engine.createJob(request, created, createError);
    if (job == std::nullopt) {
        tsse::json::object output;
        output["error"] = tsse::json::object{{"code", createError.s_Code},
                                             {"message", createError.s_Message}};
        std::cout << tsse::json::serialize(output) << std::endl;
        LOG_ERROR(<< "Job not created: " << createError.s_Message);
        return EXIT_FAILURE;
    }
    LOG_INFO(<< "Running " << job->s_Id << " (" << request.s_JobType << ")");

    if (timeoutMs > 0) {
        if (engine.waitForTerminal(job->s_Id, timeoutMs) == false) {
            LOG_WARN(<< "Timed out after " << timeoutMs << "ms, canceling " << job->s_Id);
            engine.requestCancel(job->s_Id);
        }
    }
    while (engine.waitForTerminal(job->s_Id, POLL_INTERVAL_MS) == false) {
        job = engine.job(job->s_Id);
        LOG_DEBUG(<< job->s_Id << " " << job->s_Progress.s_Phase << " "
                  << job->s_Progress.s_Completed << "/"
                  << job->s_Progress.s_Total.value_or(0));
    }
    job = engine.job(job->s_Id);

    tsse::json::object output;
    output["job"] = tsse::api::toJson(*job);
    auto result = engine.result(job->s_Id);
    output["result"] = result != std::nullopt ? *result : tsse::json::value{};
    tsse::json::array events;
    for (const auto& event : engine.events(job->s_Id, 0, 0)) {
        events.push_back(tsse::api::toJson(event));
    }
    output["events"] = std::move(events);

    if (outputFileName.empty()) {
        std::cout << tsse::json::serialize(output) << std::endl;
    } else {
        std::ofstream outputStrm{outputFileName};
        if (outputStrm.is_open() == false) {
            LOG_FATAL(<< "Unable to open output file '" << outputFileName << "'");
            return EXIT_FAILURE;
        }
        outputStrm << tsse::json::serialize(output) << std::endl;
    }

    // This message makes it easier to spot process crashes in a log file - if
    // this isn't present in the log for a given PID and there's no other log
    // message indicating early exit then the process has probably core dumped
    LOG_DEBUG(<< "tsse_analysis exiting");

    return job->s_Status == tsse::api_t::E_Completed ? EXIT_SUCCESS : EXIT_FAILURE;
}
