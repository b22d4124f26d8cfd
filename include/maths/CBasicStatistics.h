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
#ifndef INCLUDED_tsse_maths_CBasicStatistics_h
#define INCLUDED_tsse_maths_CBasicStatistics_h

#include <cstddef>
#include <vector>

namespace tsse {
namespace maths {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Utilities for computing the mean and variance of a collection of
//! values.  Non-finite values are skipped.
class CBasicStatistics {
public:
    using TDoubleVec = std::vector<double>;

    //! \brief Accumulates the count, mean and population variance of a
    //! sample using Welford's update.
    class CMeanVarAccumulator {
    public:
        void add(double x);

        std::size_t count() const { return m_Count; }
        double mean() const { return m_Mean; }
        //! The population variance, or zero for fewer than two values.
        double variance() const;

    private:
        std::size_t m_Count = 0;
        double m_Mean = 0.0;
        double m_M2 = 0.0;
    };

public:
    CBasicStatistics() = delete;

    //! The mean of the finite values in \p values, or zero if there are none.
    static double mean(const TDoubleVec& values);

    //! The population standard deviation of the finite values in \p values.
    static double populationStandardDeviation(const TDoubleVec& values);
};
}
}

#endif // INCLUDED_tsse_maths_CBasicStatistics_h
