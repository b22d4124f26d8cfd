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
#ifndef INCLUDED_tsse_core_CTimeUtils_h
#define INCLUDED_tsse_core_CTimeUtils_h

#include <core/CoreTypes.h>

#include <string>

namespace tsse {
namespace core {

//! \brief
//! A holder of time utility methods.
//!
//! DESCRIPTION:\n
//! All methods are static; an object of this class should never be
//! created.
//!
class CTimeUtils {
public:
    CTimeUtils() = delete;

    //! Current time in seconds since the epoch.
    static core_t::TTime now();

    //! Current time in milliseconds since the epoch.
    static std::int64_t nowMs();

    //! Format \p t as "YYYY-MM-DDTHH:MM:SSZ".
    static std::string toIso8601(core_t::TTime t);

    //! Parse either a decimal count of seconds since the epoch or an
    //! ISO 8601 UTC time of the form "YYYY-MM-DDTHH:MM:SS[.fff]Z".
    static bool fromString(const std::string& value, core_t::TTime& result);

    //! Floor \p t to a multiple of \p interval.
    static core_t::TTime floorToInterval(core_t::TTime t, core_t::TTime interval);

    //! Ceiling of \p t to a multiple of \p interval.
    static core_t::TTime ceilToInterval(core_t::TTime t, core_t::TTime interval);
};
}
}

#endif // INCLUDED_tsse_core_CTimeUtils_h
