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
#include <analytics/CBucketReader.h>

#include <core/CLogger.h>
#include <core/CTimeUtils.h>

#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>
#include <analytics/CSensorSemantics.h>

#include <boost/math/constants/constants.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tsse {
namespace analytics {
namespace {
const double DEGREES_TO_RADIANS{boost::math::double_constants::pi / 180.0};

bool hasSuffix(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

//! Combine the samples of one bucket.
TOptionalDouble combine(const TDoubleVec& values, analytics_t::EAggregation aggregation, bool circular) {
    if (values.empty()) {
        return std::nullopt;
    }
    switch (aggregation) {
    case analytics_t::E_Auto:
    case analytics_t::E_Avg: {
        if (circular) {
            double sumSin{0.0};
            double sumCos{0.0};
            for (auto value : values) {
                sumSin += std::sin(value * DEGREES_TO_RADIANS);
                sumCos += std::cos(value * DEGREES_TO_RADIANS);
            }
            if (std::fabs(sumSin) < 1e-12 && std::fabs(sumCos) < 1e-12) {
                return std::nullopt;
            }
            double mean{std::atan2(sumSin, sumCos) / DEGREES_TO_RADIANS};
            return mean < 0.0 ? mean + 360.0 : mean;
        }
        double sum{0.0};
        for (auto value : values) {
            sum += value;
        }
        return sum / static_cast<double>(values.size());
    }
    case analytics_t::E_Last:
        return values.back();
    case analytics_t::E_Sum: {
        double sum{0.0};
        for (auto value : values) {
            sum += value;
        }
        return sum;
    }
    case analytics_t::E_Min:
        return *std::min_element(values.begin(), values.end());
    case analytics_t::E_Max:
        return *std::max_element(values.begin(), values.end());
    }
    return std::nullopt;
}
}

const std::string CBucketReader::SIN_SUFFIX{"#sin"};
const std::string CBucketReader::COS_SUFFIX{"#cos"};

const SSeries* CBucketReader::SResult::series(const std::string& sensorId) const {
    for (const auto& series : s_Series) {
        if (series.s_SensorId == sensorId) {
            return &series;
        }
    }
    return nullptr;
}

CBucketReader::CBucketReader(const CSensorRegistry& registry, const CSampleStore& store)
    : m_Registry{registry}, m_Store{store} {
}

CBucketReader::SResult CBucketReader::read(const SRequest& request) const {
    SResult result;
    if (request.s_Interval <= 0 || request.s_End <= request.s_Start) {
        LOG_ERROR(<< "Invalid bucket read [" << request.s_Start << ", " << request.s_End
                  << ") at interval " << request.s_Interval);
        return result;
    }

    core_t::TTime gridStart{core::CTimeUtils::floorToInterval(request.s_Start, request.s_Interval)};
    core_t::TTime gridEnd{request.s_End};

    for (const auto& sensorId : request.s_SensorIds) {
        SContext context;
        context.s_Request = &request;
        TStrSet visiting;
        TOptionalBucketVec buckets{this->readSensor(sensorId, gridStart, gridEnd, 0, visiting, context)};
        if (buckets == std::nullopt) {
            SSkipped skipped{context.s_Failure != std::nullopt
                                 ? *context.s_Failure
                                 : SSkipped{sensorId, analytics_t::E_NoHistory, ""}};
            // Report against the requested sensor but keep the detail of the
            // input which failed.
            if (skipped.s_SensorId != sensorId) {
                skipped.s_Detail = skipped.s_SensorId +
                                   (skipped.s_Detail.empty() ? "" : ": " + skipped.s_Detail);
                skipped.s_SensorId = sensorId;
            }
            LOG_DEBUG(<< "Skipping sensor '" << sensorId << "': "
                      << analytics_t::print(skipped.s_Reason) << " " << skipped.s_Detail);
            result.s_Skipped.push_back(std::move(skipped));
            continue;
        }
        SSeries series;
        series.s_SensorId = sensorId;
        series.s_Interval = request.s_Interval;
        series.s_Buckets = std::move(*buckets);
        result.s_Series.push_back(std::move(series));
    }
    return result;
}

TBucketVec CBucketReader::aggregate(const TSampleVec& samples,
                                    core_t::TTime gridStart,
                                    core_t::TTime gridEnd,
                                    core_t::TTime interval,
                                    analytics_t::EAggregation aggregation,
                                    analytics_t::EQualityPolicy policy,
                                    std::size_t minSamplesPerBucket,
                                    bool circular) {
    std::size_t n{numberBuckets(gridStart, gridEnd, interval)};
    TBucketVec result(n);
    std::vector<TDoubleVec> values(n);
    for (std::size_t i = 0; i < n; ++i) {
        result[i].s_Time = gridStart + static_cast<core_t::TTime>(i) * interval;
    }

    for (const auto& sample : samples) {
        if (sample.s_Time < gridStart || sample.s_Time >= gridEnd ||
            std::isfinite(sample.s_Value) == false) {
            continue;
        }
        if (sample.s_Quality == analytics_t::E_Bad && policy == analytics_t::E_GoodOnly) {
            continue;
        }
        auto i = static_cast<std::size_t>((sample.s_Time - gridStart) / interval);
        if (i >= n) {
            continue;
        }
        values[i].push_back(sample.s_Value);
        if (sample.s_Quality == analytics_t::E_Bad) {
            result[i].s_Quality = analytics_t::E_Bad;
        }
    }

    minSamplesPerBucket = std::max(minSamplesPerBucket, std::size_t{1});
    for (std::size_t i = 0; i < n; ++i) {
        result[i].s_SampleCount = static_cast<std::uint32_t>(values[i].size());
        if (values[i].size() >= minSamplesPerBucket) {
            result[i].s_Value = combine(values[i], aggregation, circular);
        }
    }
    return result;
}

std::size_t CBucketReader::numberBuckets(core_t::TTime start, core_t::TTime end, core_t::TTime interval) {
    if (interval <= 0 || end <= start) {
        return 0;
    }
    return static_cast<std::size_t>((end - start + interval - 1) / interval);
}

CBucketReader::TOptionalBucketVec CBucketReader::readSensor(const std::string& sensorId,
                                                            core_t::TTime gridStart,
                                                            core_t::TTime gridEnd,
                                                            std::size_t depth,
                                                            TStrSet& visiting,
                                                            SContext& context) const {
    if (hasSuffix(sensorId, SIN_SUFFIX)) {
        return this->readComponent(sensorId.substr(0, sensorId.size() - SIN_SUFFIX.size()),
                                   true, gridStart, gridEnd, context);
    }
    if (hasSuffix(sensorId, COS_SUFFIX)) {
        return this->readComponent(sensorId.substr(0, sensorId.size() - COS_SUFFIX.size()),
                                   false, gridStart, gridEnd, context);
    }

    const SSensorInfo* sensor{m_Registry.sensor(sensorId)};
    if (sensor == nullptr) {
        context.s_Failure = SSkipped{sensorId, analytics_t::E_SensorNotFound, ""};
        return std::nullopt;
    }
    if (sensor->s_Source == SSensorInfo::E_ForecastPoints) {
        context.s_Failure = SSkipped{sensorId, analytics_t::E_UnsupportedSensorSource,
                                     "provider sensors have no bucketed history"};
        return std::nullopt;
    }
    if (sensor->isDerived()) {
        return this->readDerived(*sensor, gridStart, gridEnd, depth, visiting, context);
    }
    return this->readRaw(*sensor, gridStart, gridEnd, context);
}

CBucketReader::TOptionalBucketVec CBucketReader::readRaw(const SSensorInfo& sensor,
                                                         core_t::TTime gridStart,
                                                         core_t::TTime gridEnd,
                                                         SContext& context) const {
    const SRequest& request{*context.s_Request};
    // Only lagged derived inputs are read off the requested grid.
    core_t::TTime sampleStart{gridStart};
    if (gridStart == core::CTimeUtils::floorToInterval(request.s_Start, request.s_Interval)) {
        sampleStart = request.s_Start;
    }

    TSampleVec samples;
    if (m_Store.readSamples(sensor.s_Id, sampleStart, gridEnd, samples) == false) {
        context.s_Failure = SSkipped{sensor.s_Id, analytics_t::E_NoHistory, ""};
        return std::nullopt;
    }
    bool circular{CSensorSemantics::isDirection(sensor.s_Type, sensor.s_Unit)};
    return aggregate(samples, gridStart, gridEnd, request.s_Interval,
                     this->resolveAggregation(sensor, request), request.s_QualityPolicy,
                     request.s_MinSamplesPerBucket, circular);
}

CBucketReader::TOptionalBucketVec CBucketReader::readDerived(const SSensorInfo& sensor,
                                                             core_t::TTime gridStart,
                                                             core_t::TTime gridEnd,
                                                             std::size_t depth,
                                                             TStrSet& visiting,
                                                             SContext& context) const {
    if (depth >= MAX_DERIVED_DEPTH) {
        context.s_Failure = SSkipped{sensor.s_Id, analytics_t::E_DerivedDepthExceeded,
                                     "depth limit " + std::to_string(MAX_DERIVED_DEPTH)};
        return std::nullopt;
    }
    if (visiting.insert(sensor.s_Id).second == false) {
        context.s_Failure = SSkipped{sensor.s_Id, analytics_t::E_DerivedCycle, ""};
        return std::nullopt;
    }

    core_t::TTime interval{context.s_Request->s_Interval};
    std::size_t n{numberBuckets(gridStart, gridEnd, interval)};
    TBucketVec result(n);
    for (std::size_t i = 0; i < n; ++i) {
        result[i].s_Time = gridStart + static_cast<core_t::TTime>(i) * interval;
        result[i].s_Value = sensor.s_Derived->s_Offset;
        result[i].s_SampleCount = std::numeric_limits<std::uint32_t>::max();
    }
    if (sensor.s_Derived->s_Inputs.empty()) {
        for (auto& bucket : result) {
            bucket.s_SampleCount = 1;
        }
    }

    for (const auto& input : sensor.s_Derived->s_Inputs) {
        core_t::TTime inputStart{
            core::CTimeUtils::floorToInterval(gridStart - input.s_LagSeconds, interval)};
        core_t::TTime inputEnd{inputStart + static_cast<core_t::TTime>(n + 1) * interval};
        TOptionalBucketVec inputBuckets{
            this->readSensor(input.s_SensorId, inputStart, inputEnd, depth + 1, visiting, context)};
        if (inputBuckets == std::nullopt) {
            visiting.erase(sensor.s_Id);
            return std::nullopt;
        }
        for (std::size_t i = 0; i < n; ++i) {
            SBucket& bucket{result[i]};
            core_t::TTime time{core::CTimeUtils::floorToInterval(bucket.s_Time - input.s_LagSeconds, interval)};
            auto j = static_cast<std::size_t>((time - inputStart) / interval);
            if (j >= inputBuckets->size() || (*inputBuckets)[j].s_Value == std::nullopt ||
                bucket.s_Value == std::nullopt) {
                bucket.s_Value = std::nullopt;
                continue;
            }
            const SBucket& source{(*inputBuckets)[j]};
            bucket.s_Value = *bucket.s_Value + input.s_Coefficient * *source.s_Value;
            bucket.s_SampleCount = std::min(bucket.s_SampleCount, source.s_SampleCount);
            if (source.s_Quality == analytics_t::E_Bad) {
                bucket.s_Quality = analytics_t::E_Bad;
            }
        }
    }

    for (auto& bucket : result) {
        if (bucket.s_Value == std::nullopt || std::isfinite(*bucket.s_Value) == false) {
            bucket.s_Value = std::nullopt;
            bucket.s_SampleCount = 0;
        }
    }

    visiting.erase(sensor.s_Id);
    return result;
}

CBucketReader::TOptionalBucketVec CBucketReader::readComponent(const std::string& baseId,
                                                               bool sine,
                                                               core_t::TTime gridStart,
                                                               core_t::TTime gridEnd,
                                                               SContext& context) const {
    const SSensorInfo* sensor{m_Registry.sensor(baseId)};
    if (sensor == nullptr) {
        context.s_Failure = SSkipped{baseId, analytics_t::E_SensorNotFound, ""};
        return std::nullopt;
    }
    if (sensor->s_Source == SSensorInfo::E_ForecastPoints || sensor->isDerived()) {
        context.s_Failure = SSkipped{baseId, analytics_t::E_UnsupportedSensorSource,
                                     "only raw direction sensors can be decomposed"};
        return std::nullopt;
    }

    const SRequest& request{*context.s_Request};
    TSampleVec samples;
    if (m_Store.readSamples(baseId, std::max(gridStart, request.s_Start), gridEnd, samples) == false) {
        context.s_Failure = SSkipped{baseId, analytics_t::E_NoHistory, ""};
        return std::nullopt;
    }
    for (auto& sample : samples) {
        double angle{sample.s_Value * DEGREES_TO_RADIANS};
        sample.s_Value = sine ? std::sin(angle) : std::cos(angle);
    }
    analytics_t::EAggregation aggregation{request.s_Aggregation == analytics_t::E_Auto
                                              ? analytics_t::E_Avg
                                              : request.s_Aggregation};
    return aggregate(samples, gridStart, gridEnd, request.s_Interval, aggregation,
                     request.s_QualityPolicy, request.s_MinSamplesPerBucket, false);
}

analytics_t::EAggregation CBucketReader::resolveAggregation(const SSensorInfo& sensor,
                                                            const SRequest& request) const {
    if (request.s_Aggregation != analytics_t::E_Auto) {
        return request.s_Aggregation;
    }
    return CSensorSemantics::infer(sensor.s_Type, sensor.s_Unit).s_Aggregation;
}
}
}
