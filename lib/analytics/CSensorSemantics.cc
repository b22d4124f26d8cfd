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
#include <analytics/CSensorSemantics.h>

#include <core/CStringUtils.h>

#include <algorithm>
#include <cmath>

namespace tsse {
namespace analytics {
namespace {
const double PERIOD_DEGREES{360.0};

bool contains(const std::string& value, const char* keyword) {
    return value.find(keyword) != std::string::npos;
}
}

CSensorSemantics::SSemantics CSensorSemantics::infer(const std::string& type,
                                                     const std::string& unit) {
    std::string normalised{normalise(type)};
    SSemantics result;
    if (normalised.empty()) {
        return result;
    }

    if (isDirection(type, unit)) {
        result.s_DeltaMode = analytics_t::E_CircularDegrees;
        result.s_Circular = true;
        return result;
    }

    // Rates are averaged.
    if (contains(normalised, "_rate") || contains(normalised, "rainrate")) {
        return result;
    }

    bool precipitation{contains(normalised, "rain") || contains(normalised, "precip")};
    if (contains(normalised, "pulse") || contains(normalised, "flow") ||
        contains(normalised, "accumulator") ||
        (precipitation && (contains(normalised, "gauge") || contains(normalised, "tip")))) {
        result.s_Aggregation = analytics_t::E_Sum;
        return result;
    }

    // Summing a counter across a reset would create a spurious spike.
    if (normalised == "rain" || contains(normalised, "counter") ||
        contains(normalised, "cumulative") || contains(normalised, "total") ||
        contains(normalised, "daily") || contains(normalised, "energy_meter") ||
        contains(normalised, "odometer")) {
        result.s_Aggregation = analytics_t::E_Last;
        result.s_DeltaMode = analytics_t::E_NonNegativeReset;
        return result;
    }

    if (contains(normalised, "state") || contains(normalised, "status") ||
        contains(normalised, "bool") || contains(normalised, "switch") ||
        contains(normalised, "contact") || contains(normalised, "mode")) {
        result.s_Aggregation = analytics_t::E_Last;
        return result;
    }

    if (precipitation) {
        result.s_Aggregation = analytics_t::E_Sum;
    }
    return result;
}

bool CSensorSemantics::isDirection(const std::string& type, const std::string& unit) {
    std::string normalisedType{normalise(type)};
    std::string normalisedUnit{normalise(unit)};
    bool degrees{normalisedUnit == "deg" || normalisedUnit == "degrees" ||
                 normalisedUnit == "\xC2\xB0"};
    bool direction{contains(normalisedType, "direction") || contains(normalisedType, "heading") ||
                   contains(normalisedType, "bearing")};
    return direction && (degrees || normalisedUnit.empty() || contains(normalisedType, "wind"));
}

bool CSensorSemantics::isLevelLike(const std::string& type) {
    std::string normalised{normalise(type)};
    return contains(normalised, "water_level") || contains(normalised, "depth");
}

double CSensorSemantics::delta(double prev, double curr, analytics_t::EDeltaMode mode) {
    double result{curr - prev};
    switch (mode) {
    case analytics_t::E_Linear:
        break;
    case analytics_t::E_NonNegativeReset:
        result = std::max(result, 0.0);
        break;
    case analytics_t::E_CircularDegrees:
        if (std::isfinite(result)) {
            result = std::fmod(result, PERIOD_DEGREES);
            if (result < 0.0) {
                result += PERIOD_DEGREES;
            }
            if (result > 0.5 * PERIOD_DEGREES) {
                result -= PERIOD_DEGREES;
            }
        }
        break;
    }
    return result;
}

std::string CSensorSemantics::normalise(const std::string& value) {
    std::string result{value};
    core::CStringUtils::trimWhitespace(result);
    result = core::CStringUtils::toLower(result);
    std::replace(result.begin(), result.end(), ' ', '_');
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}
}
}
