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
#include <analytics/CMatrixProfile.h>

#include <core/CLogger.h>
#include <core/CLoopProgress.h>
#include <core/CStopWatch.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CBucketReader.h>
#include <analytics/CSensorRegistry.h>

#include <Eigen/Core>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tsse {
namespace analytics {
namespace {
using TDenseMatrix = Eigen::MatrixXd;
using TBoolVec = std::vector<bool>;

const std::string LOAD_SERIES{"load_series"};
const std::string COMPUTE_PROFILE{"compute_profile"};

std::size_t ceilDiv(std::size_t n, std::size_t d) {
    return (n + d - 1) / d;
}

//! Z-normalise every window of \p values into the columns of \p windows
//! and flag the constant ones.
void normaliseWindows(const TDoubleVec& values, std::size_t window, TDenseMatrix& windows, TBoolVec& constant) {
    std::size_t n{values.size()};
    std::size_t k{n - window + 1};

    TDoubleVec sum(n + 1, 0.0);
    TDoubleVec sumSquares(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        sum[i + 1] = sum[i] + values[i];
        sumSquares[i + 1] = sumSquares[i] + values[i] * values[i];
    }

    windows.setZero(static_cast<Eigen::Index>(window), static_cast<Eigen::Index>(k));
    constant.assign(k, false);
    double w{static_cast<double>(window)};
    for (std::size_t i = 0; i < k; ++i) {
        double mean{(sum[i + window] - sum[i]) / w};
        double variance{(sumSquares[i + window] - sumSquares[i]) / w - mean * mean};
        double sd{std::sqrt(std::max(variance, 0.0))};
        if (sd <= CMatrixProfile::CONSTANT_WINDOW_STD) {
            constant[i] = true;
            continue;
        }
        for (std::size_t j = 0; j < window; ++j) {
            windows(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i)) =
                (values[i + j] - mean) / sd;
        }
    }
}

CMatrixProfile::SWindow summarise(const CMatrixProfile::SResult& result, std::size_t index) {
    std::size_t w{result.s_Window};
    CMatrixProfile::SWindow summary;
    summary.s_WindowIndex = index;
    summary.s_StartTime = result.s_Times[index];
    summary.s_EndTime = result.s_Times[index + w - 1] + result.s_Interval;
    summary.s_Distance = result.s_Profile.s_Distances[index];
    std::int64_t match{result.s_Profile.s_Indices[index]};
    if (match >= 0) {
        auto j = static_cast<std::size_t>(match);
        summary.s_MatchIndex = j;
        summary.s_MatchStartTime = result.s_Times[j];
        summary.s_MatchEndTime = result.s_Times[j + w - 1] + result.s_Interval;
    }
    return summary;
}
}

CMatrixProfile::CMatrixProfile(const CSensorRegistry& registry, const CBucketReader& reader)
    : m_Registry{registry}, m_Reader{reader} {
}

CMatrixProfile::SResult CMatrixProfile::compute(const SParams& params_,
                                                const CAnalysisContext& context) const {
    core::CStopWatch total{true};

    SResult result;
    SParams params{params_};
    clamp(params);
    result.s_SensorId = params.s_SensorId;
    result.s_Interval = params.s_Interval;
    if (const SSensorInfo* info = m_Registry.sensor(params.s_SensorId)) {
        result.s_SensorName = info->s_Name;
        result.s_Unit = info->s_Unit;
    }

    context.progress(LOAD_SERIES, 0, 1, "Loading bucketed series");
    context.throwIfCanceled();

    core::CStopWatch load{true};
    CBucketReader::SRequest request;
    request.s_SensorIds = {params.s_SensorId};
    request.s_Start = params.s_Start;
    request.s_End = params.s_End;
    request.s_Interval = params.s_Interval;
    request.s_Aggregation = params.s_Aggregation;
    CBucketReader::SResult read{m_Reader.read(request)};
    std::uint64_t loadMs{load.stop()};
    context.phaseTiming(LOAD_SERIES, loadMs);
    context.progress(LOAD_SERIES, 1, 1);

    std::vector<std::pair<core_t::TTime, double>> points;
    if (const SSeries* series = read.series(params.s_SensorId)) {
        points = series->points();
    }
    for (const auto& skipped : read.s_Skipped) {
        result.s_Warnings.push_back(skipped.s_SensorId + ": " + analytics_t::print(skipped.s_Reason));
    }

    result.s_SourcePoints = points.size();
    result.s_ParamsUsed = params;
    result.s_Timings.push_back({"load_ms", loadMs});

    auto finish = [&](std::uint64_t computeMs) {
        result.s_Timings.push_back({"compute_ms", computeMs});
        result.s_Timings.push_back({"compute_budget_ms", params.s_MaxComputeMs});
        result.s_Timings.push_back({"job_total_ms", total.stop()});
    };

    if (points.size() < MIN_WINDOW) {
        result.s_Warnings.push_back("Not enough points to compute a matrix profile (" +
                                    std::to_string(points.size()) + ").");
        for (const auto& point : points) {
            result.s_Times.push_back(point.first);
            result.s_Values.push_back(point.second);
        }
        result.s_SampledPoints = points.size();
        finish(0);
        return result;
    }

    std::size_t n{points.size()};
    if (n > params.s_MaxPoints) {
        result.s_Step = ceilDiv(n, params.s_MaxPoints);
        for (std::size_t i = 0; i < n; i += result.s_Step) {
            result.s_Times.push_back(points[i].first);
            result.s_Values.push_back(points[i].second);
        }
        if (result.s_Times.back() != points.back().first) {
            result.s_Times.push_back(points.back().first);
            result.s_Values.push_back(points.back().second);
        }
        result.s_Warnings.push_back("Downsampled from " + std::to_string(n) + " to " +
                                    std::to_string(result.s_Times.size()) +
                                    " points (step " + std::to_string(result.s_Step) + ").");
        n = result.s_Times.size();
    } else {
        for (const auto& point : points) {
            result.s_Times.push_back(point.first);
            result.s_Values.push_back(point.second);
        }
    }
    result.s_SampledPoints = n;

    std::size_t window{std::min(std::max(params.s_Window, MIN_WINDOW), n)};
    if (window >= n) {
        window = std::max(n - 1, MIN_WINDOW);
    }
    std::size_t exclusion{std::min(params.s_ExclusionZone.value_or(window / 2), window)};
    result.s_Window = window;
    result.s_ExclusionZone = exclusion;
    if (window >= n) {
        result.s_Warnings.push_back("Not enough points for a window of " +
                                    std::to_string(window) + ".");
        finish(0);
        return result;
    }

    std::size_t k{n - window + 1};
    if (k > params.s_MaxWindows) {
        result.s_WindowStep = ceilDiv(k, params.s_MaxWindows);
        result.s_Warnings.push_back("Comparing every " + std::to_string(result.s_WindowStep) +
                                    "th of " + std::to_string(k) + " windows.");
    }
    for (std::size_t i = 0; i < k; ++i) {
        result.s_WindowStartTimes.push_back(result.s_Times[i]);
    }
    LOG_DEBUG(<< "Matrix profile of " << params.s_SensorId << ": points = " << n
              << ", window = " << window << ", exclusion = " << exclusion
              << ", window step = " << result.s_WindowStep);

    core::CStopWatch computeWatch{true};
    result.s_Profile = profile(result.s_Values, window, exclusion, result.s_WindowStep,
                               params.s_MaxComputeMs, context);
    std::uint64_t computeMs{computeWatch.stop()};
    context.phaseTiming(COMPUTE_PROFILE, computeMs);
    if (result.s_Profile.s_EarlyStopped) {
        result.s_Warnings.push_back("Stopped early after " + std::to_string(params.s_MaxComputeMs) +
                                    "ms; the profile is partial.");
        LOG_WARN(<< "Matrix profile of " << params.s_SensorId << " exceeded its "
                 << params.s_MaxComputeMs << "ms budget");
    }

    for (auto index : select(result.s_Profile.s_Distances, params.s_TopK, exclusion, true)) {
        result.s_Motifs.push_back(summarise(result, index));
    }
    for (auto index : select(result.s_Profile.s_Distances, params.s_TopK, exclusion, false)) {
        result.s_Anomalies.push_back(summarise(result, index));
    }

    finish(computeMs);
    return result;
}

CMatrixProfile::SProfile CMatrixProfile::profile(const TDoubleVec& values,
                                                 std::size_t window,
                                                 std::size_t exclusionZone,
                                                 std::size_t windowStep,
                                                 std::uint64_t budgetMs,
                                                 const CAnalysisContext& context) {
    SProfile result;
    if (window < 2 || values.size() <= window) {
        return result;
    }
    windowStep = std::max(windowStep, std::size_t{1});

    TDenseMatrix windows;
    TBoolVec constant;
    normaliseWindows(values, window, windows, constant);

    std::size_t k{values.size() - window + 1};
    double w{static_cast<double>(window)};
    double constantDistance{std::sqrt(w)};
    result.s_Distances.assign(k, std::numeric_limits<double>::infinity());
    result.s_Indices.assign(k, -1);

    core::CStopWatch watch{true};
    std::size_t total{ceilDiv(k, windowStep)};
    core::CLoopProgress progress{context.loopProgress(
        COMPUTE_PROFILE, total, "Comparing " + std::to_string(total) + " windows")};

    std::size_t iterations{0};
    for (std::size_t i = 0; i < k; ++i) {
        if (i % windowStep != 0) {
            continue;
        }
        context.throwIfCanceled();
        if (watch.lap() >= budgetMs) {
            result.s_EarlyStopped = true;
            break;
        }
        for (std::size_t j = i + 1; j < k; ++j) {
            if (++iterations % CHECK_EVERY == 0) {
                context.throwIfCanceled();
                if (watch.lap() >= budgetMs) {
                    result.s_EarlyStopped = true;
                    break;
                }
            }
            if (j % windowStep != 0 || j - i <= exclusionZone) {
                continue;
            }
            double distance{0.0};
            if (constant[i] && constant[j]) {
                distance = 0.0;
            } else if (constant[i] || constant[j]) {
                distance = constantDistance;
            } else {
                double correlation{windows.col(static_cast<Eigen::Index>(i))
                                       .dot(windows.col(static_cast<Eigen::Index>(j))) /
                                   w};
                distance = std::sqrt(std::max(0.0, 2.0 * w * (1.0 - correlation)));
            }
            if (distance < result.s_Distances[i]) {
                result.s_Distances[i] = distance;
                result.s_Indices[i] = static_cast<std::int64_t>(j);
            }
            if (distance < result.s_Distances[j]) {
                result.s_Distances[j] = distance;
                result.s_Indices[j] = static_cast<std::int64_t>(i);
            }
        }
        if (result.s_EarlyStopped) {
            break;
        }
        ++result.s_WindowsComputed;
        progress.increment();
    }

    return result;
}

CMatrixProfile::TSizeVec CMatrixProfile::select(const TDoubleVec& distances,
                                                std::size_t k,
                                                std::size_t separation,
                                                bool smallest) {
    TSizeVec candidates;
    for (std::size_t i = 0; i < distances.size(); ++i) {
        if (std::isfinite(distances[i])) {
            candidates.push_back(i);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(), [&](std::size_t lhs, std::size_t rhs) {
        return smallest ? distances[lhs] < distances[rhs] : distances[lhs] > distances[rhs];
    });

    TSizeVec result;
    for (auto candidate : candidates) {
        if (result.size() >= k) {
            break;
        }
        bool overlaps{std::any_of(result.begin(), result.end(), [&](std::size_t selected) {
            std::size_t gap{candidate > selected ? candidate - selected : selected - candidate};
            return gap <= separation;
        })};
        if (overlaps == false) {
            result.push_back(candidate);
        }
    }
    return result;
}

void CMatrixProfile::clamp(SParams& params) {
    params.s_MaxPoints = std::min(std::max(params.s_MaxPoints, MIN_POINTS), MAX_POINTS);
    params.s_MaxWindows = std::min(std::max(params.s_MaxWindows, MIN_WINDOWS), MAX_WINDOWS);
    params.s_Window = std::max(params.s_Window, MIN_WINDOW);
    params.s_TopK = std::min(std::max(params.s_TopK, std::size_t{1}), MAX_TOP_K);
    params.s_MaxComputeMs = std::min(std::max(params.s_MaxComputeMs, std::uint64_t{1}), MAX_COMPUTE_MS);
    params.s_Interval = std::max(params.s_Interval, core_t::TTime{1});
}
}
}
