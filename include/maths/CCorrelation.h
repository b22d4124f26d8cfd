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
#ifndef INCLUDED_tsse_maths_CCorrelation_h
#define INCLUDED_tsse_maths_CCorrelation_h

#include <core/CoreTypes.h>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace tsse {
namespace maths {

//! \brief Pairwise correlation and its approximate significance.
//!
//! DESCRIPTION:\n
//! Pearson correlation from one-pass sums, Spearman correlation as the
//! Pearson correlation of average-tie ranks, alignment of two timestamped
//! series at a lag, and the significance machinery used by correlation
//! matrices: Fisher z p-values and confidence intervals, Student's t
//! p-values for Spearman, a lag-1 effective sample size and Benjamini
//! Hochberg q-values.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The p-values are asymptotic and assume independent samples.  Bucketed
//! telemetry is autocorrelated, so callers should pass the effective
//! sample size and treat the result as a ranking aid rather than an exact
//! test.
class CCorrelation {
public:
    using TDoubleVec = std::vector<double>;
    using TOptionalDouble = std::optional<double>;
    using TDoubleDoublePr = std::pair<double, double>;
    using TOptionalDoubleDoublePr = std::optional<TDoubleDoublePr>;
    using TTimeDoublePr = std::pair<core_t::TTime, double>;
    using TTimeDoublePrVec = std::vector<TTimeDoublePr>;

    enum EMethod { E_Pearson, E_Spearman };

    //! \brief The correlation of two series at one lag.
    struct SLaggedCorrelation {
        //! None if fewer than the minimum overlap or a series is constant.
        TOptionalDouble s_R;
        //! The number of aligned finite pairs.
        std::size_t s_N = 0;
        core_t::TTime s_LagSeconds = 0;
    };

    //! \brief Accumulates the sums needed for a one-pass Pearson correlation.
    class CPearsonAccumulator {
    public:
        void add(double x, double y);
        std::size_t count() const { return m_N; }
        //! The correlation clamped to [-1, 1], or none if either variance
        //! is zero.
        TOptionalDouble correlation() const;

    private:
        std::size_t m_N = 0;
        double m_SumX = 0.0;
        double m_SumY = 0.0;
        double m_SumXX = 0.0;
        double m_SumYY = 0.0;
        double m_SumXY = 0.0;
    };

public:
    //! Clamp applied to correlations before Fisher transforms.
    static constexpr double MAX_ABS_R{0.9999999};

public:
    CCorrelation() = delete;

    //! Pearson correlation of paired values skipping non-finite pairs.
    static TOptionalDouble pearson(const TDoubleVec& x, const TDoubleVec& y);

    //! Spearman correlation of paired values.
    static TOptionalDouble spearman(const TDoubleVec& x, const TDoubleVec& y);

    //! Correlate the points of \p a and \p b with \p a's timestamp equal to
    //! \p b's timestamp minus \p lagSeconds.  Both series must be sorted by
    //! time.  Positive lag means \p b happens later.
    static SLaggedCorrelation atLag(const TTimeDoublePrVec& a,
                                    const TTimeDoublePrVec& b,
                                    core_t::TTime lagSeconds,
                                    EMethod method,
                                    std::size_t minOverlap);

    //! Search lags in [-maxLagBuckets, maxLagBuckets] buckets and return the
    //! lag with largest |r|.  Ties prefer more pairs, then smaller |lag|,
    //! then the smaller lag.
    static SLaggedCorrelation bestWithinLag(const TTimeDoublePrVec& a,
                                            const TTimeDoublePrVec& b,
                                            EMethod method,
                                            std::size_t minOverlap,
                                            core_t::TTime interval,
                                            std::size_t maxLagBuckets);

    //! Lag-1 autocorrelation treating \p values as evenly spaced.
    static TOptionalDouble lag1Autocorrelation(const TDoubleVec& values);

    //! The effective sample size n / max(1, 1 + 2 rho_x rho_y) bounded to [3, n].
    static std::size_t effectiveSampleSize(std::size_t n,
                                           const TOptionalDouble& rhoX,
                                           const TOptionalDouble& rhoY);

    //! Two sided p-value for \p r under the Fisher z normal approximation.
    static TOptionalDouble pearsonPValue(double r, std::size_t n);

    //! Two sided p-value for \p r under the Student's t approximation.
    static TOptionalDouble spearmanPValue(double r, std::size_t n);

    //! Dispatch to the p-value for \p method.
    static TOptionalDouble pValue(double r, std::size_t n, EMethod method);

    //! The Fisher z confidence interval tanh(atanh(r) +/- z / sqrt(n - 3)).
    static TOptionalDoubleDoublePr fisherZInterval(double r, std::size_t n, double zValue);

    //! The standard normal quantile 1 - alpha / 2.
    static TOptionalDouble zValueForAlpha(double alpha);

    //! Benjamini Hochberg q-values for \p pValues in the input order.
    static TDoubleVec benjaminiHochberg(const TDoubleVec& pValues);

    //! Is a cell significant: q at most alpha and |r| at least the effect
    //! size floor?
    static bool isSignificant(double qValue, double r, double alpha, double minAbsR);
};
}
}

#endif // INCLUDED_tsse_maths_CCorrelation_h
