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
#include <analytics/CSeriesEmbedding.h>

#include <maths/CBasicStatistics.h>
#include <maths/CRobustStatistics.h>

#include <algorithm>
#include <cmath>

namespace tsse {
namespace analytics {

CSeriesEmbedding::TOptionalDoubleVec CSeriesEmbedding::compute(const SSeries& series) {
    auto points = series.points();
    if (points.size() < 3) {
        return std::nullopt;
    }

    TDoubleVec values;
    TDoubleVec deltas;
    values.reserve(points.size());
    deltas.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        values.push_back(points[i].second);
        if (i > 0) {
            double dt{static_cast<double>(std::max(points[i].first - points[i - 1].first,
                                                   core_t::TTime{1}))};
            deltas.push_back((points[i].second - points[i - 1].second) / dt);
        }
    }

    TDoubleVec result;
    result.reserve(DIMENSION);
    for (const auto& features : {robustFeatures(values), robustFeatures(deltas),
                                 spikeFeatures(values), spikeFeatures(deltas)}) {
        result.insert(result.end(), features.begin(), features.end());
    }

    double norm{0.0};
    for (auto feature : result) {
        norm += feature * feature;
    }
    norm = std::sqrt(norm);
    if (std::isfinite(norm) && norm > 0.0) {
        for (auto& feature : result) {
            feature /= norm;
        }
    }
    return result;
}

double CSeriesEmbedding::cosineSimilarity(const TDoubleVec& lhs, const TDoubleVec& rhs) {
    std::size_t n{std::min(lhs.size(), rhs.size())};
    double dot{0.0};
    double lhsNorm{0.0};
    double rhsNorm{0.0};
    for (std::size_t i = 0; i < n; ++i) {
        dot += lhs[i] * rhs[i];
        lhsNorm += lhs[i] * lhs[i];
        rhsNorm += rhs[i] * rhs[i];
    }
    double denom{std::sqrt(lhsNorm * rhsNorm)};
    return denom > 0.0 ? dot / denom : 0.0;
}

CSeriesEmbedding::TStrDoublePrVec
CSeriesEmbedding::shortlist(const TDoubleVec& focus, const TStrDoubleVecPrVec& candidates, std::size_t k) {
    TStrDoublePrVec result;
    result.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        result.emplace_back(candidate.first, cosineSimilarity(focus, candidate.second));
    }
    std::sort(result.begin(), result.end(), [](const TStrDoublePr& lhs, const TStrDoublePr& rhs) {
        if (lhs.second != rhs.second) {
            return lhs.second > rhs.second;
        }
        return lhs.first < rhs.first;
    });
    if (result.size() > k) {
        result.resize(k);
    }
    return result;
}

TDoubleVec CSeriesEmbedding::robustFeatures(const TDoubleVec& values) {
    TDoubleVec result(NUMBER_ROBUST_FEATURES, 0.0);
    if (values.size() < 3) {
        return result;
    }

    using TRobust = maths::CRobustStatistics;
    TDoubleVec sorted{TRobust::sortedFinite(values)};
    double median{TRobust::quantileSorted(sorted, 0.5).value_or(0.0)};
    double mad{TRobust::mad(values, median).value_or(0.0)};
    double p05{TRobust::quantileSorted(sorted, 0.05).value_or(0.0)};
    double p95{TRobust::quantileSorted(sorted, 0.95).value_or(0.0)};
    double iqr{TRobust::iqr(values).value_or(0.0)};

    TDoubleVec absZ;
    auto z = TRobust::robustZScores(values, Z_CLIP);
    if (z != std::nullopt) {
        for (auto zi : *z) {
            if (std::isfinite(zi)) {
                absZ.push_back(std::fabs(zi));
            }
        }
    }

    result[0] = median;
    result[1] = mad;
    result[2] = p05;
    result[3] = median;
    result[4] = p95;
    result[5] = std::fabs(iqr);
    result[6] = maths::CBasicStatistics::mean(values);
    result[7] = maths::CBasicStatistics::populationStandardDeviation(values);
    result[8] = maths::CBasicStatistics::mean(absZ);
    result[9] = TRobust::quantile(absZ, 0.95).value_or(0.0);
    return result;
}

TDoubleVec CSeriesEmbedding::spikeFeatures(const TDoubleVec& values) {
    TDoubleVec result(NUMBER_SPIKE_FEATURES, 0.0);
    if (values.size() < 3) {
        return result;
    }
    auto z = maths::CRobustStatistics::robustZScores(values, Z_CLIP);
    if (z == std::nullopt) {
        return result;
    }

    TDoubleVec absZ;
    double spikes{0.0};
    double highSpikes{0.0};
    double maxAbsZ{0.0};
    for (auto zi : *z) {
        if (std::isfinite(zi) == false) {
            continue;
        }
        double a{std::fabs(zi)};
        absZ.push_back(a);
        spikes += a >= SPIKE_Z ? 1.0 : 0.0;
        highSpikes += a >= HIGH_SPIKE_Z ? 1.0 : 0.0;
        maxAbsZ = std::max(maxAbsZ, a);
    }
    if (absZ.empty()) {
        return result;
    }
    double n{static_cast<double>(absZ.size())};
    result[0] = spikes / n;
    result[1] = highSpikes / n;
    result[2] = maxAbsZ;
    result[3] = maths::CRobustStatistics::quantile(absZ, 0.95).value_or(0.0);
    return result;
}
}
}
