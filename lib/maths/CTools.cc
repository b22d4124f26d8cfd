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
#include <maths/CTools.h>

#include <core/CLogger.h>

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <boost/math/policies/policy.hpp>

#include <cmath>
#include <exception>
#include <limits>
#include <typeinfo>

namespace tsse {
namespace maths {
namespace {
namespace math_policy {
using namespace boost::math::policies;
using AllowOverflow = policy<overflow_error<ignore_error>>;
}

boost::math::normal_distribution<double, math_policy::AllowOverflow>
allowOverflow(const boost::math::normal_distribution<>& normal) {
    return boost::math::normal_distribution<double, math_policy::AllowOverflow>(
        normal.mean(), normal.standard_deviation());
}

boost::math::students_t_distribution<double, math_policy::AllowOverflow>
allowOverflow(const boost::math::students_t_distribution<>& students) {
    return boost::math::students_t_distribution<double, math_policy::AllowOverflow>(
        students.degrees_of_freedom());
}

template<typename Distribution>
double continuousSafeCdf(const Distribution& distribution, double x) {
    if (std::isnan(x)) {
        LOG_ERROR(<< "x = NaN, distribution = " << typeid(Distribution).name());
        return 0.0;
    }
    if (x == -std::numeric_limits<double>::infinity()) {
        return 0.0;
    }
    if (x == std::numeric_limits<double>::infinity()) {
        return 1.0;
    }
    try {
        return boost::math::cdf(distribution, x);
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to compute c.d.f. at " << x << ": " << e.what());
    }
    return x > 0.0 ? 1.0 : 0.0;
}

template<typename Distribution>
double continuousSafeCdfComplement(const Distribution& distribution, double x) {
    if (std::isnan(x)) {
        LOG_ERROR(<< "x = NaN, distribution = " << typeid(Distribution).name());
        return 0.0;
    }
    if (x == -std::numeric_limits<double>::infinity()) {
        return 1.0;
    }
    if (x == std::numeric_limits<double>::infinity()) {
        return 0.0;
    }
    try {
        return boost::math::cdf(boost::math::complement(distribution, x));
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to compute c.d.f. complement at " << x << ": " << e.what());
    }
    return x > 0.0 ? 0.0 : 1.0;
}
}

double CTools::safeCdfComplement(const normal& normal_, double x) {
    return continuousSafeCdfComplement(allowOverflow(normal_), x);
}

double CTools::safeCdf(const students_t& students, double x) {
    return continuousSafeCdf(allowOverflow(students), x);
}

double CTools::safeQuantile(const normal& normal_, double p) {
    if ((p > 0.0 && p < 1.0) == false) {
        LOG_ERROR(<< "Bad probability " << p << " for normal quantile");
        return p <= 0.0 ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    try {
        return boost::math::quantile(allowOverflow(normal_), p);
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to compute normal quantile at " << p << ": " << e.what());
    }
    return normal_.mean();
}

bool CTools::isFinite(double x) {
    return std::isfinite(x);
}
}
}
