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
#include <core/CTimeUtils.h>

#include <core/CLogger.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cctype>
#include <chrono>
#include <exception>

namespace tsse {
namespace core {
namespace {
const boost::posix_time::ptime EPOCH{boost::gregorian::date{1970, 1, 1}};
}

core_t::TTime CTimeUtils::now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::int64_t CTimeUtils::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string CTimeUtils::toIso8601(core_t::TTime t) {
    boost::posix_time::ptime time{EPOCH + boost::posix_time::seconds(t)};
    return boost::posix_time::to_iso_extended_string(time) + "Z";
}

bool CTimeUtils::fromString(const std::string& value, core_t::TTime& result) {
    if (value.empty()) {
        return false;
    }

    bool numeric{true};
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c{value[i]};
        if (std::isdigit(static_cast<unsigned char>(c)) == 0 && (i > 0 || c != '-')) {
            numeric = false;
            break;
        }
    }
    if (numeric) {
        try {
            result = std::stoll(value);
        } catch (const std::exception& e) {
            LOG_DEBUG(<< "Invalid epoch time '" << value << "': " << e.what());
            return false;
        }
        return true;
    }

    std::string text{value};
    if (text.back() == 'Z' || text.back() == 'z') {
        text.pop_back();
    }
    for (auto& c : text) {
        if (c == 'T' || c == 't') {
            c = ' ';
        }
    }
    try {
        boost::posix_time::ptime time{boost::posix_time::time_from_string(text)};
        if (time.is_not_a_date_time()) {
            return false;
        }
        result = (time - EPOCH).total_seconds();
    } catch (const std::exception& e) {
        LOG_DEBUG(<< "Invalid ISO 8601 time '" << value << "': " << e.what());
        return false;
    }
    return true;
}

core_t::TTime CTimeUtils::floorToInterval(core_t::TTime t, core_t::TTime interval) {
    if (interval <= 0) {
        return t;
    }
    core_t::TTime remainder{t % interval};
    return remainder < 0 ? t - remainder - interval : t - remainder;
}

core_t::TTime CTimeUtils::ceilToInterval(core_t::TTime t, core_t::TTime interval) {
    core_t::TTime floor{floorToInterval(t, interval)};
    return floor == t ? t : floor + interval;
}
}
}
