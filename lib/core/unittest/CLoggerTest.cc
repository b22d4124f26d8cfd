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
#include <core/CLogger.h>

#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

BOOST_AUTO_TEST_SUITE(CLoggerTest)

using namespace tsse;

namespace {
class CResetLogger {
public:
    ~CResetLogger() { core::CLogger::instance().reset(); }
};
}

BOOST_AUTO_TEST_CASE(testLevels) {
    CResetLogger reset;
    core::CLogger& logger{core::CLogger::instance()};

    BOOST_REQUIRE_EQUAL("TRACE", core::CLogger::levelToString(core::CLogger::E_Trace));
    BOOST_REQUIRE_EQUAL("WARN", core::CLogger::levelToString(core::CLogger::E_Warn));
    BOOST_REQUIRE_EQUAL("FATAL", core::CLogger::levelToString(core::CLogger::E_Fatal));
    BOOST_REQUIRE_EQUAL("UNKNOWN", core::CLogger::levelToString(
                                       static_cast<core::CLogger::ELevel>(7)));

    BOOST_REQUIRE(logger.setLoggingLevel(core::CLogger::E_Warn));
    BOOST_REQUIRE_EQUAL(core::CLogger::E_Warn, logger.loggingLevel());
    BOOST_REQUIRE(logger.setLoggingLevel(static_cast<core::CLogger::ELevel>(7)) == false);
    BOOST_REQUIRE_EQUAL(core::CLogger::E_Warn, logger.loggingLevel());

    LOG_TRACE(<< "Not shown");
    LOG_WARN(<< "Shown");

    core::CLogger::ELevel level{core::CLogger::E_Trace};
    std::istringstream input{"error"};
    input >> level;
    BOOST_REQUIRE(input.fail() == false);
    BOOST_REQUIRE_EQUAL(core::CLogger::E_Error, level);

    std::istringstream bad{"loud"};
    bad >> level;
    BOOST_REQUIRE(bad.fail());
    BOOST_REQUIRE_EQUAL(core::CLogger::E_Error, level);
}

BOOST_AUTO_TEST_CASE(testReconfigureFromSettings) {
    CResetLogger reset;
    core::CLogger& logger{core::CLogger::instance()};

    const std::string logFile{"tsse_logger_test.log"};
    std::remove(logFile.c_str());

    std::istringstream settings{"[Core]\n"
                                "Filter=\"%Severity% >= INFO\"\n"
                                "[Sinks.File]\n"
                                "Destination=TextFile\n"
                                "FileName=\"" +
                                logFile +
                                "\"\n"
                                "AutoFlush=true\n"
                                "Format=\"%Severity% %Message%\"\n"};
    BOOST_REQUIRE(logger.reconfigureFromSettings(settings));
    BOOST_REQUIRE(logger.hasBeenReconfigured());

    LOG_DEBUG(<< "debug message");
    LOG_INFO(<< "info message");
    LOG_ERROR(<< "error message");

    // Closes the file sink.
    logger.reset();
    BOOST_REQUIRE(logger.hasBeenReconfigured() == false);

    std::ifstream strm{logFile};
    BOOST_REQUIRE(strm.is_open());
    std::string contents{std::istreambuf_iterator<char>{strm}, std::istreambuf_iterator<char>{}};
    strm.close();
    std::remove(logFile.c_str());

    LOG_DEBUG(<< "Log contents: " << contents);
    BOOST_TEST_REQUIRE(contents.find("INFO info message") != std::string::npos);
    BOOST_TEST_REQUIRE(contents.find("ERROR error message") != std::string::npos);
    BOOST_TEST_REQUIRE(contents.find("debug message") == std::string::npos);

    std::istringstream invalid{"[Sinks.Broken]\nDestination=Carrier Pigeon\n"};
    BOOST_REQUIRE(logger.reconfigureFromSettings(invalid) == false);
    BOOST_REQUIRE(logger.hasBeenReconfigured() == false);
    BOOST_REQUIRE(logger.reconfigure("") == true);
    BOOST_REQUIRE(logger.reconfigure("/nonexistent/tsse/log.properties") == false);
}

BOOST_AUTO_TEST_CASE(testFatalErrorHandler) {
    CResetLogger reset;
    std::string received;
    {
        core::CLogger::CScopeSetFatalErrorHandler scope{
            [&received](std::string message) { received = std::move(message); }};
        core::CLogger::instance().handleFatal("disk on fire");
    }
    BOOST_REQUIRE_EQUAL("disk on fire", received);
    BOOST_REQUIRE_THROW(core::CLogger::fatal(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
