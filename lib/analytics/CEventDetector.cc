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
#include <analytics/CEventDetector.h>

#include <core/CLogger.h>

#include <analytics/CSensorSemantics.h>

#include <maths/CRobustStatistics.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <utility>

namespace tsse {
namespace analytics {
namespace {
using TTimeDoublePr = std::pair<core_t::TTime, double>;
using TTimeDoublePrVec = std::vector<TTimeDoublePr>;

const core_t::TTime SECONDS_PER_DAY{86400};
const core_t::TTime SECONDS_PER_HOUR{3600};

std::size_t hourOfDay(core_t::TTime time) {
    core_t::TTime secondOfDay{((time % SECONDS_PER_DAY) + SECONDS_PER_DAY) % SECONDS_PER_DAY};
    return static_cast<std::size_t>(secondOfDay / SECONDS_PER_HOUR);
}

bool byTime(const SEvent& lhs, const SEvent& rhs) {
    return lhs.s_Time < rhs.s_Time;
}

bool byAbsZDescending(const SEvent& lhs, const SEvent& rhs) {
    return std::fabs(lhs.s_Z) > std::fabs(rhs.s_Z);
}

//! Extract the points the detector scores for \p mode.
TTimeDoublePrVec detectorPoints(const TTimeDoublePrVec& values,
                                CEventDetector::EDetectorMode mode,
                                analytics_t::EDeltaMode deltaMode,
                                core_t::TTime gapThreshold,
                                std::size_t& gapSkippedDeltas) {
    TTimeDoublePrVec result;
    switch (mode) {
    case CEventDetector::E_Deltas:
        for (std::size_t i = 1; i < values.size(); ++i) {
            if (values[i].first - values[i - 1].first > gapThreshold) {
                ++gapSkippedDeltas;
                continue;
            }
            double delta{CSensorSemantics::delta(values[i - 1].second, values[i].second, deltaMode)};
            if (std::isfinite(delta)) {
                result.emplace_back(values[i].first, delta);
            }
        }
        break;
    case CEventDetector::E_SecondDeltas:
        for (std::size_t i = 2; i < values.size(); ++i) {
            if (values[i - 1].first - values[i - 2].first > gapThreshold ||
                values[i].first - values[i - 1].first > gapThreshold) {
                ++gapSkippedDeltas;
                continue;
            }
            double current{CSensorSemantics::delta(values[i - 1].second, values[i].second, deltaMode)};
            double previous{CSensorSemantics::delta(values[i - 2].second,
                                                    values[i - 1].second, deltaMode)};
            double delta2{current - previous};
            if (std::isfinite(delta2)) {
                result.emplace_back(values[i].first, delta2);
            }
        }
        break;
    case CEventDetector::E_Levels:
        result = values;
        break;
    }
    return result;
}
}

CEventDetector::CEventDetector(const SOptions& options) : m_Options{options} {
}

CEventDetector::SResult CEventDetector::detect(const SSeries& series,
                                               analytics_t::EDeltaMode deltaMode) const {
    SSeries input;
    bool deseasoned{false};
    bool deseasoningSkipped{false};
    const SSeries* source{&series};
    if (m_Options.s_Deseasoning == E_HourOfDayMean) {
        if (deseasons(m_Options, series)) {
            input = deseasonHourOfDay(series);
            source = &input;
            deseasoned = true;
        } else {
            deseasoningSkipped = true;
        }
    }

    std::size_t gapSkippedDeltas{0};
    SResult result{this->detect(*source, m_Options, deltaMode, gapSkippedDeltas)};

    if (result.s_Events.empty() && m_Options.s_SparseFallback &&
        m_Options.s_DetectorMode != E_Levels) {
        SOptions fallback{m_Options};
        fallback.s_DetectorMode = E_Levels;
        result = this->detect(*source, fallback, deltaMode, gapSkippedDeltas);
        result.s_UsedSparseFallback = true;
    }

    result.s_GapSkippedDeltas = gapSkippedDeltas;
    result.s_DeseasoningApplied = deseasoned;
    result.s_DeseasoningSkippedInsufficientWindow = deseasoningSkipped;
    result.s_Entropy = timeOfDayEntropy(result.s_Events);
    return result;
}

const CEventDetector::SOptions& CEventDetector::options() const {
    return m_Options;
}

CEventDetector::SResult CEventDetector::detect(const SSeries& series,
                                               const SOptions& options,
                                               analytics_t::EDeltaMode deltaMode,
                                               std::size_t& gapSkippedDeltas) const {
    SResult result;
    result.s_ZThresholdUsed = std::fabs(options.s_ZThreshold);

    TTimeDoublePrVec values{series.points()};
    if (values.size() < 3) {
        return result;
    }

    core_t::TTime interval{std::max(options.s_Interval, core_t::TTime{1})};
    core_t::TTime gapThreshold{options.s_GapMaxBuckets > 0
                                   ? static_cast<core_t::TTime>(options.s_GapMaxBuckets) * interval
                                   : std::numeric_limits<core_t::TTime>::max()};
    core_t::TTime startTime{values.front().first};
    core_t::TTime endTime{values.back().first};

    double fixedThreshold{std::fabs(options.s_ZThreshold)};
    if (std::isfinite(fixedThreshold) == false || fixedThreshold <= 0.0) {
        LOG_ERROR(<< "Invalid z threshold " << options.s_ZThreshold);
        return result;
    }

    bool adaptive{options.s_ThresholdMode == E_Adaptive};
    double threshold{fixedThreshold};
    if (adaptive && options.s_AdaptiveMinZ != std::nullopt &&
        std::isfinite(*options.s_AdaptiveMinZ) && std::fabs(*options.s_AdaptiveMinZ) > 0.0) {
        threshold = std::fabs(*options.s_AdaptiveMinZ);
    }

    std::optional<std::size_t> targetMin;
    std::optional<std::size_t> targetMax;
    if (options.s_TargetMinEvents != std::nullopt && *options.s_TargetMinEvents > 0) {
        targetMin = options.s_TargetMinEvents;
    }
    if (options.s_TargetMaxEvents != std::nullopt && *options.s_TargetMaxEvents > 0) {
        targetMax = options.s_TargetMaxEvents;
    }
    std::optional<std::size_t> desired;
    if (targetMin != std::nullopt && targetMax != std::nullopt) {
        desired = std::max(std::min(std::max((*targetMin + *targetMax) / 2, *targetMin), *targetMax),
                           std::size_t{1});
    } else if (targetMin != std::nullopt) {
        desired = targetMin;
    } else if (targetMax != std::nullopt) {
        desired = targetMax;
    }

    TTimeDoublePrVec points{detectorPoints(values, options.s_DetectorMode, deltaMode,
                                           gapThreshold, gapSkippedDeltas)};
    result.s_PointsTotal = points.size();
    if (points.size() < 3) {
        return result;
    }

    TDoubleVec scored;
    scored.reserve(points.size());
    for (const auto& point : points) {
        scored.push_back(point.second);
    }
    auto location = maths::CRobustStatistics::robustScale(scored);
    if (location == std::nullopt) {
        return result;
    }
    double center{location->s_Center};
    double scale{location->s_Scale > 0.0 && std::isfinite(location->s_Scale) ? location->s_Scale : 1.0};

    if (options.s_DetectorMode != E_Levels) {
        TDoubleVec absNonZero;
        for (auto value : scored) {
            if (std::isfinite(value) && value != 0.0) {
                absNonZero.push_back(std::fabs(value));
            }
        }
        if (absNonZero.size() >= MIN_COUNT_FOR_SCALE_FLOOR) {
            auto step = maths::CRobustStatistics::median(absNonZero);
            if (step != std::nullopt && *step > scale) {
                scale = *step;
            }
        }
    }

    if (adaptive && desired != std::nullopt) {
        TDoubleVec absZ;
        for (auto value : scored) {
            double z{std::fabs((value - center) / scale)};
            if (std::isfinite(z)) {
                absZ.push_back(z);
            }
        }
        std::sort(absZ.begin(), absZ.end(), std::greater<double>());
        if (absZ.size() >= *desired) {
            double picked{absZ[*desired - 1]};
            if (picked > 0.0) {
                threshold = std::max(threshold, picked);
            }
        }
    }
    result.s_ZThresholdUsed = threshold;

    TEventVec events;
    double peakAbsZ{0.0};
    bool hasPeak{false};
    for (const auto& point : points) {
        double z{(point.second - center) / scale};
        if (std::isfinite(z) == false) {
            continue;
        }
        double absZ{std::fabs(z)};
        if (hasPeak == false || absZ > peakAbsZ) {
            peakAbsZ = absZ;
            hasPeak = true;
        }
        if (absZ < threshold) {
            continue;
        }

        analytics_t::EDirection direction{z >= 0.0 ? analytics_t::E_Up : analytics_t::E_Down};
        if ((options.s_Polarity == E_UpOnly && direction != analytics_t::E_Up) ||
            (options.s_Polarity == E_DownOnly && direction != analytics_t::E_Down)) {
            continue;
        }

        bool boundary{std::abs(point.first - startTime) <= interval ||
                      std::abs(endTime - point.first) <= interval};
        if (options.s_ExcludeBoundaryEvents && boundary) {
            continue;
        }

        SEvent event;
        event.s_Time = point.first;
        event.s_Z = z;
        event.s_Direction = direction;
        event.s_Delta = options.s_DetectorMode == E_Levels ? point.second - center : point.second;
        event.s_IsBoundary = boundary;
        events.push_back(event);
    }
    if (hasPeak) {
        result.s_PeakAbsZ = peakAbsZ;
    }
    if (events.empty()) {
        return result;
    }

    core_t::TTime window{static_cast<core_t::TTime>(options.s_MinSeparationBuckets) * interval};
    events = options.s_Suppression == E_Greedy ? suppressGreedy(std::move(events), window)
                                               : suppressNms(std::move(events), window);

    if (adaptive && targetMax != std::nullopt && events.size() > *targetMax) {
        std::stable_sort(events.begin(), events.end(), byAbsZDescending);
        events.resize(*targetMax);
        double cutoff{std::fabs(events.back().s_Z)};
        std::stable_sort(events.begin(), events.end(), byTime);
        result.s_ZThresholdUsed = std::max(result.s_ZThresholdUsed, cutoff);
    }
    if (options.s_MaxEvents > 0 && events.size() > options.s_MaxEvents) {
        std::stable_sort(events.begin(), events.end(), byAbsZDescending);
        events.resize(options.s_MaxEvents);
        std::stable_sort(events.begin(), events.end(), byTime);
    }

    for (const auto& event : events) {
        ++(event.s_Direction == analytics_t::E_Up ? result.s_UpEvents : result.s_DownEvents);
        if (event.s_IsBoundary) {
            ++result.s_BoundaryEvents;
        }
    }
    result.s_Events = std::move(events);
    return result;
}

bool CEventDetector::deseasons(const SOptions& options, const SSeries& series) {
    if (options.s_Deseasoning != E_HourOfDayMean || series.s_Buckets.empty()) {
        return false;
    }
    core_t::TTime span{series.s_Buckets.back().s_Time - series.s_Buckets.front().s_Time +
                       series.s_Interval};
    return span >= MIN_DESEASONING_SPAN;
}

SSeries CEventDetector::deseasonHourOfDay(const SSeries& series) {
    std::array<double, 24> sums{};
    std::array<std::size_t, 24> counts{};
    double overallSum{0.0};
    std::size_t overallCount{0};
    for (const auto& bucket : series.s_Buckets) {
        if (bucket.s_Value == std::nullopt || std::isfinite(*bucket.s_Value) == false) {
            continue;
        }
        std::size_t hour{hourOfDay(bucket.s_Time)};
        sums[hour] += *bucket.s_Value;
        ++counts[hour];
        overallSum += *bucket.s_Value;
        ++overallCount;
    }

    double overallMean{overallCount > 0 ? overallSum / static_cast<double>(overallCount) : 0.0};
    std::array<double, 24> means;
    for (std::size_t hour = 0; hour < 24; ++hour) {
        means[hour] = counts[hour] > 0 ? sums[hour] / static_cast<double>(counts[hour]) : overallMean;
    }

    SSeries result{series};
    for (auto& bucket : result.s_Buckets) {
        if (bucket.s_Value != std::nullopt && std::isfinite(*bucket.s_Value)) {
            bucket.s_Value = *bucket.s_Value - means[hourOfDay(bucket.s_Time)];
        }
    }
    return result;
}

CEventDetector::TOptionalEntropy CEventDetector::timeOfDayEntropy(const TEventVec& events) {
    if (events.empty()) {
        return std::nullopt;
    }
    std::array<std::size_t, 24> counts{};
    for (const auto& event : events) {
        ++counts[hourOfDay(event.s_Time)];
    }
    double total{static_cast<double>(events.size())};
    double h{0.0};
    for (auto count : counts) {
        if (count > 0) {
            double p{static_cast<double>(count) / total};
            h -= p * std::log(p);
        }
    }
    SEntropy result;
    result.s_HNorm = std::min(std::max(h / std::log(24.0), 0.0), 1.0);
    result.s_Weight = std::min(std::max(result.s_HNorm, 0.25), 1.0);
    return result;
}

TEventVec CEventDetector::suppressNms(TEventVec events, core_t::TTime windowSeconds) {
    std::stable_sort(events.begin(), events.end(), byTime);
    if (events.empty() || windowSeconds <= 0) {
        return events;
    }

    std::vector<std::size_t> order(events.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&events](std::size_t lhs, std::size_t rhs) {
        double lz{std::fabs(events[lhs].s_Z)};
        double rz{std::fabs(events[rhs].s_Z)};
        if (lz != rz) {
            return lz > rz;
        }
        return events[lhs].s_Time < events[rhs].s_Time;
    });

    std::vector<bool> suppressed(events.size(), false);
    TEventVec result;
    for (auto i : order) {
        if (suppressed[i]) {
            continue;
        }
        result.push_back(events[i]);
        for (std::size_t j = 0; j < events.size(); ++j) {
            if (std::abs(events[j].s_Time - events[i].s_Time) <= windowSeconds) {
                suppressed[j] = true;
            }
        }
    }
    std::stable_sort(result.begin(), result.end(), byTime);
    return result;
}

TEventVec CEventDetector::suppressGreedy(TEventVec events, core_t::TTime minSeparationSeconds) {
    std::stable_sort(events.begin(), events.end(), byTime);
    if (events.empty() || minSeparationSeconds <= 0) {
        return events;
    }
    TEventVec result;
    for (const auto& event : events) {
        if (result.empty() == false && event.s_Time - result.back().s_Time <= minSeparationSeconds) {
            if (std::fabs(event.s_Z) > std::fabs(result.back().s_Z)) {
                result.back() = event;
            }
            continue;
        }
        result.push_back(event);
    }
    return result;
}

bool CEventDetector::parse(const std::string& value, EPolarity& polarity) {
    if (value == "both") {
        polarity = E_Both;
    } else if (value == "up") {
        polarity = E_UpOnly;
    } else if (value == "down") {
        polarity = E_DownOnly;
    } else {
        return false;
    }
    return true;
}

bool CEventDetector::parse(const std::string& value, ESuppression& suppression) {
    if (value == "nms") {
        suppression = E_Nms;
    } else if (value == "greedy") {
        suppression = E_Greedy;
    } else {
        return false;
    }
    return true;
}

bool CEventDetector::parse(const std::string& value, EThresholdMode& mode) {
    if (value == "fixed") {
        mode = E_Fixed;
    } else if (value == "adaptive") {
        mode = E_Adaptive;
    } else {
        return false;
    }
    return true;
}

bool CEventDetector::parse(const std::string& value, EDetectorMode& mode) {
    if (value == "deltas") {
        mode = E_Deltas;
    } else if (value == "second_deltas") {
        mode = E_SecondDeltas;
    } else if (value == "levels") {
        mode = E_Levels;
    } else {
        return false;
    }
    return true;
}

bool CEventDetector::parse(const std::string& value, EDeseasoning& deseasoning) {
    if (value == "none") {
        deseasoning = E_NoDeseasoning;
    } else if (value == "hour_of_day_mean") {
        deseasoning = E_HourOfDayMean;
    } else {
        return false;
    }
    return true;
}
}
}
