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
#ifndef INCLUDED_tsse_analytics_CSensorSemantics_h
#define INCLUDED_tsse_analytics_CSensorSemantics_h

#include <analytics/AnalyticsTypes.h>

#include <string>

namespace tsse {
namespace analytics {

//! \brief Infers how a sensor's samples should be bucketed and differenced
//! from its type and unit.
//!
//! DESCRIPTION:\n
//! State-like sensors take the last value in a bucket, cumulative totals
//! take the last value and difference with reset suppression, pulse and
//! tip accumulators are summed and everything else is averaged.  Direction
//! sensors are circular: they are averaged on the unit circle and their
//! deltas take the shortest signed angle.
class CSensorSemantics {
public:
    //! \brief The bucketing and differencing rules for a sensor.
    struct SSemantics {
        analytics_t::EAggregation s_Aggregation = analytics_t::E_Avg;
        analytics_t::EDeltaMode s_DeltaMode = analytics_t::E_Linear;
        bool s_Circular = false;
    };

public:
    CSensorSemantics() = delete;

    //! Infer the semantics from \p type and \p unit.
    static SSemantics infer(const std::string& type, const std::string& unit);

    //! Is this a direction sensor measured in degrees?
    static bool isDirection(const std::string& type, const std::string& unit);

    //! Does \p type measure a slowly varying level, such as a water depth,
    //! whose bucket deltas carry the relationship signal?
    static bool isLevelLike(const std::string& type);

    //! The difference curr - prev under \p mode.
    static double delta(double prev, double curr, analytics_t::EDeltaMode mode);

private:
    static std::string normalise(const std::string& value);
};
}
}

#endif // INCLUDED_tsse_analytics_CSensorSemantics_h
