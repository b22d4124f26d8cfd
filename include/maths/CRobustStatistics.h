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
#ifndef INCLUDED_tsse_maths_CRobustStatistics_h
#define INCLUDED_tsse_maths_CRobustStatistics_h

#include <cstddef>
#include <optional>
#include <vector>

namespace tsse {
namespace maths {

//! \brief Robust location and scale estimation.
//!
//! DESCRIPTION:\n
//! Median, quantiles, MAD and IQR based scale, robust z-scores and
//! average-tie ranks.  Every function ignores non-finite inputs, so
//! callers can pass series which contain gaps encoded as NaN.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The scale is the MAD scaled by 1.4826, so it estimates the standard
//! deviation for normal data.  Quantized and step-like sensors often have
//! MAD equal to zero, in which case we fall back to IQR / 1.349 and then
//! to 1.0.  This floor stops a near-zero denominator manufacturing huge
//! z-scores.
//!
//! All functions are pure and stateless.
class CRobustStatistics {
public:
    using TDoubleVec = std::vector<double>;
    using TOptionalDouble = std::optional<double>;

    //! \brief A robust centre and scale.
    struct SLocationScale {
        double s_Center;
        double s_Scale;
    };
    using TOptionalLocationScale = std::optional<SLocationScale>;

public:
    //! Converts a MAD to a standard deviation for normal data.
    static constexpr double MAD_TO_SIGMA{1.4826};
    //! Converts an IQR to a standard deviation for normal data.
    static constexpr double IQR_TO_SIGMA{1.349};
    //! Scales at or below this are treated as degenerate.
    static constexpr double DEGENERATE_SCALE{1e-9};

public:
    CRobustStatistics() = delete;

    //! The finite values of \p values sorted ascending.
    static TDoubleVec sortedFinite(const TDoubleVec& values);

    //! The median of the finite values.
    static TOptionalDouble median(const TDoubleVec& values);

    //! The \p q quantile by linear interpolation at position q * (n - 1).
    static TOptionalDouble quantile(const TDoubleVec& values, double q);

    //! As quantile but for values which are already sorted and finite.
    static TOptionalDouble quantileSorted(const TDoubleVec& sorted, double q);

    //! The (unscaled) median absolute deviation about \p center.
    static TOptionalDouble mad(const TDoubleVec& values, double center);

    //! The inter-quartile range.
    static TOptionalDouble iqr(const TDoubleVec& values);

    //! The robust centre and scale of \p values.  This needs at least three
    //! values and the scale is always positive.
    static TOptionalLocationScale robustScale(const TDoubleVec& values);

    //! Compute (x - center) / scale for every value clipped to [-clip, clip].
    //! Non-finite values map to NaN.  A non-positive \p clip disables clipping.
    static TDoubleVec zScores(const TDoubleVec& values, double center, double scale, double clip);

    //! Robust z-scores of \p values or none if the scale can't be estimated.
    static std::optional<TDoubleVec> robustZScores(const TDoubleVec& values, double clip);

    //! The 1-based ranks of \p values with ties assigned their average rank.
    static TDoubleVec averageRanks(const TDoubleVec& values);
};
}
}

#endif // INCLUDED_tsse_maths_CRobustStatistics_h
