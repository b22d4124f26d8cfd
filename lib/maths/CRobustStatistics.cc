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
#include <maths/CRobustStatistics.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace tsse {
namespace maths {
namespace {
double medianOfSorted(const CRobustStatistics::TDoubleVec& sorted) {
    std::size_t mid{sorted.size() / 2};
    return sorted.size() % 2 == 1 ? sorted[mid] : 0.5 * (sorted[mid - 1] + sorted[mid]);
}
}

CRobustStatistics::TDoubleVec CRobustStatistics::sortedFinite(const TDoubleVec& values) {
    TDoubleVec result;
    result.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(result),
                 [](double x) { return std::isfinite(x); });
    std::sort(result.begin(), result.end());
    return result;
}

CRobustStatistics::TOptionalDouble CRobustStatistics::median(const TDoubleVec& values) {
    TDoubleVec sorted{sortedFinite(values)};
    if (sorted.empty()) {
        return std::nullopt;
    }
    return medianOfSorted(sorted);
}

CRobustStatistics::TOptionalDouble CRobustStatistics::quantile(const TDoubleVec& values, double q) {
    return quantileSorted(sortedFinite(values), q);
}

CRobustStatistics::TOptionalDouble
CRobustStatistics::quantileSorted(const TDoubleVec& sorted, double q) {
    if (q < 0.0 || q > 1.0 || sorted.empty()) {
        return std::nullopt;
    }
    if (sorted.size() == 1) {
        return sorted[0];
    }
    double position{q * static_cast<double>(sorted.size() - 1)};
    std::size_t index{static_cast<std::size_t>(std::floor(position))};
    double fraction{position - static_cast<double>(index)};
    double a{sorted[index]};
    double b{sorted[std::min(index + 1, sorted.size() - 1)]};
    return a + (b - a) * fraction;
}

CRobustStatistics::TOptionalDouble CRobustStatistics::mad(const TDoubleVec& values, double center) {
    TDoubleVec deviations;
    deviations.reserve(values.size());
    for (auto value : values) {
        if (std::isfinite(value)) {
            deviations.push_back(std::fabs(value - center));
        }
    }
    if (deviations.empty()) {
        return std::nullopt;
    }
    std::sort(deviations.begin(), deviations.end());
    return medianOfSorted(deviations);
}

CRobustStatistics::TOptionalDouble CRobustStatistics::iqr(const TDoubleVec& values) {
    TDoubleVec sorted{sortedFinite(values)};
    auto p25 = quantileSorted(sorted, 0.25);
    auto p75 = quantileSorted(sorted, 0.75);
    if (p25 == std::nullopt || p75 == std::nullopt) {
        return std::nullopt;
    }
    return std::fabs(*p75 - *p25);
}

CRobustStatistics::TOptionalLocationScale
CRobustStatistics::robustScale(const TDoubleVec& values) {
    if (values.size() < 3) {
        return std::nullopt;
    }
    auto center = median(values);
    if (center == std::nullopt) {
        return std::nullopt;
    }
    auto mad_ = mad(values, *center);
    if (mad_ == std::nullopt) {
        return std::nullopt;
    }
    if (*mad_ > DEGENERATE_SCALE) {
        return SLocationScale{*center, *mad_ * MAD_TO_SIGMA};
    }
    auto iqr_ = iqr(values);
    if (iqr_ != std::nullopt && *iqr_ > DEGENERATE_SCALE) {
        return SLocationScale{*center, *iqr_ / IQR_TO_SIGMA};
    }
    return SLocationScale{*center, 1.0};
}

CRobustStatistics::TDoubleVec
CRobustStatistics::zScores(const TDoubleVec& values, double center, double scale, double clip) {
    if (std::isfinite(scale) == false || scale <= 0.0) {
        scale = 1.0;
    }
    bool clipping{std::isfinite(clip) && clip > 0.0};
    TDoubleVec result;
    result.reserve(values.size());
    for (auto value : values) {
        double z{(value - center) / scale};
        if (std::isfinite(z) == false) {
            result.push_back(std::nan(""));
            continue;
        }
        if (clipping) {
            z = std::max(-clip, std::min(z, clip));
        }
        result.push_back(z);
    }
    return result;
}

std::optional<CRobustStatistics::TDoubleVec>
CRobustStatistics::robustZScores(const TDoubleVec& values, double clip) {
    auto locationScale = robustScale(values);
    if (locationScale == std::nullopt) {
        return std::nullopt;
    }
    return zScores(values, locationScale->s_Center, locationScale->s_Scale, clip);
}

CRobustStatistics::TDoubleVec CRobustStatistics::averageRanks(const TDoubleVec& values) {
    std::vector<std::size_t> indices(values.size());
    std::iota(indices.begin(), indices.end(), 0);
    std::stable_sort(indices.begin(), indices.end(), [&values](std::size_t lhs, std::size_t rhs) {
        return values[lhs] < values[rhs];
    });

    TDoubleVec ranks(values.size(), 0.0);
    for (std::size_t i = 0; i < indices.size();) {
        std::size_t start{i};
        double value{values[indices[i]]};
        for (++i; i < indices.size() && values[indices[i]] == value; ++i) {
        }
        double rank{static_cast<double>(start + i - 1) / 2.0 + 1.0};
        for (std::size_t j = start; j < i; ++j) {
            ranks[indices[j]] = rank;
        }
    }
    return ranks;
}
}
}
