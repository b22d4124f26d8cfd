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
#ifndef INCLUDED_tsse_core_CBoostJsonParser_h
#define INCLUDED_tsse_core_CBoostJsonParser_h

#include <core/CLogger.h>

#include <boost/json.hpp>

#include <istream>
#include <string>

namespace json = boost::json;

namespace tsse {
namespace core {

//! \brief
//! Simple wrapper around the boost::json::parse function
//!
//! DESCRIPTION:\n
//! Parses job requests, datasets and job parameters.  Errors are logged and
//! reported through the return value so callers can turn them into their
//! own error codes.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Makes use of small monotonic stack buffer similar to example:
//! https://www.boost.org/doc/libs/1_83_0/libs/json/doc/html/json/allocators/storage_ptr.html
//! The parsed value is copied into default storage on assignment so it
//! never refers to the stack buffer.
//!
class CBoostJsonParser {
public:
    static constexpr std::size_t JSON_PARSE_BUFFER_SIZE{8192};

public:
    CBoostJsonParser() = delete;

    //! Parse \p jsonString into \p doc, returning false and filling in
    //! \p error if it isn't valid JSON.
    static bool parse(const std::string& jsonString, json::value& doc, std::string& error) {
        unsigned char buffer[JSON_PARSE_BUFFER_SIZE]; // Small stack buffer to avoid most allocations during parse
        json::monotonic_resource mr(buffer); // This resource will use our local buffer first
        json::error_code ec;
        json::value parsed{json::parse(jsonString, ec, &mr)};
        if (ec) {
            error = ec.message();
            LOG_ERROR(<< "An error occurred while parsing JSON: " << error);
            return false;
        }
        doc = json::value(parsed, json::storage_ptr{});
        return true;
    }

    //! Parse the whole of \p istream into \p doc.
    static bool parse(std::istream& istream, json::value& doc, std::string& error) {
        json::stream_parser p;
        json::error_code ec;
        std::string line;
        while (std::getline(istream, line)) {
            LOG_TRACE(<< "write_some: " << line);
            p.write_some(line, ec);
            if (ec) {
                break;
            }
        }
        if (!ec) {
            p.finish(ec);
        }
        if (ec) {
            error = ec.message();
            LOG_ERROR(<< "An error occurred while parsing JSON stream: " << error);
            return false;
        }
        doc = p.release();
        return true;
    }
};
}
}

#endif // INCLUDED_tsse_core_CBoostJsonParser_h
