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
#include <maths/CBasicStatistics.h>

#include <cmath>

namespace tsse {
namespace maths {

void CBasicStatistics::CMeanVarAccumulator::add(double x) {
    if (std::isfinite(x) == false) {
        return;
    }
    ++m_Count;
    double delta{x - m_Mean};
    m_Mean += delta / static_cast<double>(m_Count);
    m_M2 += delta * (x - m_Mean);
}

double CBasicStatistics::CMeanVarAccumulator::variance() const {
    return m_Count < 2 ? 0.0 : m_M2 / static_cast<double>(m_Count);
}

double CBasicStatistics::mean(const TDoubleVec& values) {
    CMeanVarAccumulator accumulator;
    for (auto value : values) {
        accumulator.add(value);
    }
    return accumulator.mean();
}

double CBasicStatistics::populationStandardDeviation(const TDoubleVec& values) {
    CMeanVarAccumulator accumulator;
    for (auto value : values) {
        accumulator.add(value);
    }
    return std::sqrt(accumulator.variance());
}
}
}
