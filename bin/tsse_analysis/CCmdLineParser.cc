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
#include "CCmdLineParser.h"

#include <boost/program_options.hpp>

#include <iostream>

namespace tsse {
namespace analysis {

const std::string CCmdLineParser::DESCRIPTION = "Usage: tsse_analysis [options]\n"
                                                "Options:";

bool CCmdLineParser::parse(int argc,
                           const char* const* argv,
                           std::string& logProperties,
                           std::string& datasetFileName,
                           std::string& requestFileName,
                           std::string& outputFileName,
                           std::size_t& threads,
                           std::size_t& maxConcurrentJobs,
                           std::uint64_t& timeoutMs) {
    try {
        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("logProperties", boost::program_options::value<std::string>(),
                        "Optional logger properties file")
            ("dataset", boost::program_options::value<std::string>(),
                        "JSON file containing the sensor registry and samples")
            ("request", boost::program_options::value<std::string>(),
                        "Optional file to read the job request from - not present means read from STDIN")
            ("output", boost::program_options::value<std::string>(),
                        "Optional file to write output to - not present means write to STDOUT")
            ("threads", boost::program_options::value<std::size_t>(),
                        "Optional number of worker threads - default is 2")
            ("maxConcurrentJobs", boost::program_options::value<std::size_t>(),
                        "Optional limit on the number of jobs running at once - default is 2")
            ("timeout", boost::program_options::value<std::uint64_t>(),
                        "Optional time (in milliseconds) after which the job is canceled - default is no limit")
        ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc),
                                      vm);
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("logProperties") > 0) {
            logProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("dataset") > 0) {
            datasetFileName = vm["dataset"].as<std::string>();
        } else {
            std::cerr << "A dataset file must be specified" << std::endl;
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("request") > 0) {
            requestFileName = vm["request"].as<std::string>();
        }
        if (vm.count("output") > 0) {
            outputFileName = vm["output"].as<std::string>();
        }
        if (vm.count("threads") > 0) {
            threads = vm["threads"].as<std::size_t>();
        }
        if (vm.count("maxConcurrentJobs") > 0) {
            maxConcurrentJobs = vm["maxConcurrentJobs"].as<std::size_t>();
        }
        if (vm.count("timeout") > 0) {
            timeoutMs = vm["timeout"].as<std::uint64_t>();
        }
        if (threads == 0 || maxConcurrentJobs == 0) {
            std::cerr << "threads and maxConcurrentJobs must be positive" << std::endl;
            return false;
        }
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    return true;
}
}
}
