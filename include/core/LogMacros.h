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

// There are deliberately no include guards in this file so that individual
// source files can redefine the logging macros

#include <boost/current_function.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <sstream>

#ifdef LOG_LOCATION_INFO
#undef LOG_LOCATION_INFO
#endif
#define LOG_LOCATION_INFO                                                                   \
    << boost::log::add_value(tsse::core::CLogger::instance().lineAttributeName(), __LINE__) \
    << boost::log::add_value(tsse::core::CLogger::instance().fileAttributeName(),           \
                             static_cast<const char*>(__FILE__))                            \
    << boost::log::add_value(tsse::core::CLogger::instance().functionAttributeName(),       \
                             static_cast<const char*>(BOOST_CURRENT_FUNCTION))

#ifdef TSSE_LOG_AT
#undef TSSE_LOG_AT
#endif
#define TSSE_LOG_AT(level, message)                                            \
    BOOST_LOG_STREAM_SEV(tsse::core::CLogger::instance().logger(), level)      \
    LOG_LOCATION_INFO                                                          \
    message

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef EXCLUDE_TRACE_LOGGING
// Trace logging expands to code the optimiser can remove entirely
#define LOG_TRACE(message)                                                     \
    static_cast<void>([&]() { std::ostringstream() << "" message; })
#else
#define LOG_TRACE(message) TSSE_LOG_AT(tsse::core::CLogger::E_Trace, message)
#endif

#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#define LOG_DEBUG(message) TSSE_LOG_AT(tsse::core::CLogger::E_Debug, message)

#ifdef LOG_INFO
#undef LOG_INFO
#endif
#define LOG_INFO(message) TSSE_LOG_AT(tsse::core::CLogger::E_Info, message)

#ifdef LOG_WARN
#undef LOG_WARN
#endif
#define LOG_WARN(message) TSSE_LOG_AT(tsse::core::CLogger::E_Warn, message)

#ifdef LOG_ERROR
#undef LOG_ERROR
#endif
#define LOG_ERROR(message) TSSE_LOG_AT(tsse::core::CLogger::E_Error, message)

#ifdef LOG_FATAL
#undef LOG_FATAL
#endif
#define LOG_FATAL(message) TSSE_LOG_AT(tsse::core::CLogger::E_Fatal, message)

#ifdef LOG_ABORT
#undef LOG_ABORT
#endif
#define LOG_ABORT(message)                                                     \
    TSSE_LOG_AT(tsse::core::CLogger::E_Fatal, message);                        \
    tsse::core::CLogger::fatal()

// Log at a level only known at runtime, for example
// LOG_AT_LEVEL(tsse::core::CLogger::E_Warn, << "Sensor " << id << " skipped")
#ifdef LOG_AT_LEVEL
#undef LOG_AT_LEVEL
#endif
#define LOG_AT_LEVEL(level, message) TSSE_LOG_AT(level, message)
