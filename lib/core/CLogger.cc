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

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tsse {
namespace core {
namespace {
const std::string FILE_ATTRIBUTE{"File"};
const std::string LINE_ATTRIBUTE{"Line"};
const std::string FUNCTION_ATTRIBUTE{"Function"};
const std::string SEVERITY_ATTRIBUTE{"Severity"};

BOOST_LOG_ATTRIBUTE_KEYWORD(severityKeyword, "Severity", CLogger::ELevel)

using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

const char* baseName(const char* path) {
    const char* slash{std::strrchr(path, '/')};
    return slash == nullptr ? path : slash + 1;
}

//! Format is "<ISO time> <LEVEL> [<file>@<line>] <message>".
void formatRecord(const boost::log::record_view& record,
                  boost::log::formatting_ostream& strm) {
    auto timeStamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", record);
    if (timeStamp) {
        strm << boost::posix_time::to_iso_extended_string(*timeStamp) << ' ';
    }
    auto level = boost::log::extract<CLogger::ELevel>(SEVERITY_ATTRIBUTE, record);
    if (level) {
        strm << CLogger::levelToString(*level) << ' ';
    }
    auto file = boost::log::extract<const char*>(FILE_ATTRIBUTE, record);
    if (file && *file != nullptr) {
        strm << '[' << baseName(*file);
        auto line = boost::log::extract<int>(LINE_ATTRIBUTE, record);
        if (line) {
            strm << '@' << *line;
        }
        strm << "] ";
    }
    auto message = boost::log::extract<std::string>("Message", record);
    if (message) {
        strm << *message;
    }
}
}

CLogger::CLogger()
    : m_Reconfigured{false}, m_Level{E_Debug}, m_FileAttributeName{FILE_ATTRIBUTE},
      m_LineAttributeName{LINE_ATTRIBUTE}, m_FunctionAttributeName{FUNCTION_ATTRIBUTE},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
    boost::log::register_simple_filter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
    this->setLoggingLevel(E_Debug);
    this->addDefaultSink();
}

CLogger::~CLogger() {
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

void CLogger::reset() {
    boost::log::core::get()->remove_all_sinks();
    m_Reconfigured = false;
    this->setLoggingLevel(E_Debug);
    this->addDefaultSink();
    m_FatalErrorHandler = defaultFatalErrorHandler;
}

void CLogger::addDefaultSink() {
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);
    auto sink = boost::make_shared<TTextSink>(backend);
    sink->set_formatter(&formatRecord);
    boost::log::core::get()->add_sink(sink);
}

bool CLogger::reconfigure(const std::string& propertiesFile) {
    if (propertiesFile.empty()) {
        LOG_DEBUG(<< "Logger is logging to stderr");
        return true;
    }
    return this->reconfigureFromFile(propertiesFile);
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm{propertiesFile};
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to open logger properties file " << propertiesFile);
        return false;
    }
    if (this->reconfigureFromSettings(strm) == false) {
        LOG_ERROR(<< "Failed to reconfigure logger from " << propertiesFile);
        return false;
    }
    LOG_DEBUG(<< "Logger re-initialised using properties file " << propertiesFile);
    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    boost::log::core::get()->remove_all_sinks();
    try {
        boost::log::init_from_stream(settingsStrm);
    } catch (const std::exception& e) {
        this->addDefaultSink();
        LOG_ERROR(<< "Invalid logger settings: " << e.what());
        return false;
    }
    m_Reconfigured = true;
    return true;
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    m_Level = level;
    boost::log::core::get()->set_filter(severityKeyword >= level);
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level;
}

const std::string& CLogger::levelToString(ELevel level) {
    static const std::string NAMES[]{"TRACE", "DEBUG", "INFO",
                                     "WARN",  "ERROR", "FATAL"};
    static const std::string UNKNOWN{"UNKNOWN"};
    if (level < E_Trace || level > E_Fatal) {
        return UNKNOWN;
    }
    return NAMES[level];
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error{"tsse fatal exception"};
}

void CLogger::fatalErrorHandler(const TFatalErrorHandler& handler) {
    m_FatalErrorHandler = handler;
}

const CLogger::TFatalErrorHandler& CLogger::fatalErrorHandler() const {
    return m_FatalErrorHandler;
}

void CLogger::handleFatal(std::string message) {
    m_FatalErrorHandler(std::move(message));
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    std::cerr << message << std::endl;
    std::exit(EXIT_FAILURE);
}

CLogger::CScopeSetFatalErrorHandler::CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler)
    : m_OriginalFatalErrorHandler{CLogger::instance().fatalErrorHandler()} {
    CLogger::instance().fatalErrorHandler(handler);
}

CLogger::CScopeSetFatalErrorHandler::~CScopeSetFatalErrorHandler() {
    CLogger::instance().fatalErrorHandler(m_OriginalFatalErrorHandler);
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    strm >> name;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (int i = CLogger::E_Trace; i <= CLogger::E_Fatal; ++i) {
        if (CLogger::levelToString(static_cast<CLogger::ELevel>(i)) == name) {
            level = static_cast<CLogger::ELevel>(i);
            return strm;
        }
    }
    strm.setstate(std::ios_base::failbit);
    return strm;
}
}
}
