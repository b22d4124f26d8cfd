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
#include <analytics/AnalyticsTypes.h>

#include <cmath>
#include <limits>

namespace tsse {
namespace analytics_t {

std::string print(EAggregation aggregation) {
    switch (aggregation) {
    case E_Avg:
        return "avg";
    case E_Last:
        return "last";
    case E_Sum:
        return "sum";
    case E_Min:
        return "min";
    case E_Max:
        return "max";
    case E_Auto:
        return "auto";
    }
    return "-";
}

bool parse(const std::string& value, EAggregation& aggregation) {
    for (auto candidate : {E_Avg, E_Last, E_Sum, E_Min, E_Max, E_Auto}) {
        if (value == print(candidate)) {
            aggregation = candidate;
            return true;
        }
    }
    return false;
}

std::string print(EQuality quality) {
    switch (quality) {
    case E_Good:
        return "good";
    case E_Bad:
        return "bad";
    }
    return "-";
}

bool parse(const std::string& value, EQualityPolicy& policy) {
    if (value == "good_only") {
        policy = E_GoodOnly;
        return true;
    }
    if (value == "all") {
        policy = E_All;
        return true;
    }
    return false;
}

std::string print(EDeltaMode mode) {
    switch (mode) {
    case E_Linear:
        return "linear";
    case E_NonNegativeReset:
        return "non_negative_reset";
    case E_CircularDegrees:
        return "circular_degrees";
    }
    return "-";
}

std::string print(EDirection direction) {
    switch (direction) {
    case E_Up:
        return "up";
    case E_Down:
        return "down";
    }
    return "-";
}

std::string print(EConfidence confidence) {
    switch (confidence) {
    case E_High:
        return "high";
    case E_Medium:
        return "medium";
    case E_Low:
        return "low";
    }
    return "-";
}

std::string print(ESkipReason reason) {
    switch (reason) {
    case E_SensorNotFound:
        return "sensor_not_found";
    case E_UnsupportedSensorSource:
        return "unsupported_sensor_source";
    case E_DerivedDepthExceeded:
        return "derived_depth_exceeded";
    case E_DerivedCycle:
        return "derived_cycle";
    case E_InsufficientOverlap:
        return "insufficient_overlap";
    case E_NoHistory:
        return "no_history";
    case E_BelowThreshold:
        return "below_threshold";
    case E_TruncatedByLimit:
        return "truncated_by_limit";
    case E_Filtered:
        return "filtered";
    case E_DerivedFromFocus:
        return "derived_from_focus";
    }
    return "-";
}
}

namespace analytics {

std::size_t SSeries::numberValues() const {
    std::size_t result{0};
    for (const auto& bucket : s_Buckets) {
        if (bucket.s_Value != std::nullopt) {
            ++result;
        }
    }
    return result;
}

std::vector<std::pair<core_t::TTime, double>> SSeries::points() const {
    std::vector<std::pair<core_t::TTime, double>> result;
    result.reserve(s_Buckets.size());
    for (const auto& bucket : s_Buckets) {
        if (bucket.s_Value != std::nullopt && std::isfinite(*bucket.s_Value)) {
            result.emplace_back(bucket.s_Time, *bucket.s_Value);
        }
    }
    return result;
}

TDoubleVec SSeries::valuesWithGaps() const {
    TDoubleVec result;
    result.reserve(s_Buckets.size());
    for (const auto& bucket : s_Buckets) {
        result.push_back(bucket.s_Value != std::nullopt
                             ? *bucket.s_Value
                             : std::numeric_limits<double>::quiet_NaN());
    }
    return result;
}
}
}
