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
#include <analytics/CCooccurrenceScorer.h>

#include <core/CLogger.h>
#include <core/CStopWatch.h>
#include <core/CStringUtils.h>

#include <maths/CTools.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CBucketReader.h>
#include <analytics/CCorrelationMatrix.h>
#include <analytics/CSensorRegistry.h>
#include <analytics/CSensorSemantics.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>

namespace tsse {
namespace analytics {
namespace {
const std::string LOAD_SERIES{"load_series"};
const std::string DETECT_EVENTS{"detect_events"};
const std::string SCORE_BUCKETS{"score_buckets"};

using TStrEventMap = std::map<std::string, SEvent>;
using TTimeStrEventMapMap = std::map<core_t::TTime, TStrEventMap>;

double cappedAbs(double z, double zCap) {
    return std::min(std::fabs(z), zCap);
}

double entropyWeight(const CCooccurrenceScorer::TStrDoubleMap& weights, const std::string& id) {
    auto i = weights.find(id);
    return i != weights.end() ? i->second : 1.0;
}

//! Floor division so negative times map to the bucket containing them.
core_t::TTime bucketIndex(core_t::TTime time, core_t::TTime interval) {
    core_t::TTime index{time / interval};
    return (time % interval != 0 && time < 0) ? index - 1 : index;
}

std::optional<CCooccurrenceScorer::SScoredBucket>
buildBucket(core_t::TTime index,
            const TStrEventMap& entry,
            std::size_t totalSensors,
            const CCooccurrenceScorer::SScoringOptions& options) {
    CCooccurrenceScorer::SScoredBucket result;
    for (const auto& participant : entry) {
        const SEvent& event{participant.second};
        result.s_Sensors.push_back({participant.first, event.s_Time, event.s_Z,
                                    event.s_Direction, event.s_Delta});
        result.s_SeveritySum += cappedAbs(event.s_Z, options.s_ZCap) *
                                entropyWeight(options.s_EntropyWeights, participant.first);
    }
    std::stable_sort(result.s_Sensors.begin(), result.s_Sensors.end(),
                     [](const CCooccurrenceScorer::SParticipant& lhs,
                        const CCooccurrenceScorer::SParticipant& rhs) {
                         return std::fabs(lhs.s_Z) > std::fabs(rhs.s_Z);
                     });
    result.s_GroupSize = result.s_Sensors.size();

    auto score = CCooccurrenceScorer::bucketScore(options.s_Preference, result.s_SeveritySum,
                                                  result.s_GroupSize, totalSensors);
    if (score == std::nullopt || score->s_Score <= 0.0) {
        return std::nullopt;
    }
    result.s_PairWeight = score->s_PairWeight;
    result.s_Idf = score->s_Idf;
    result.s_Score = score->s_Score;
    result.s_Time = index * options.s_Interval;
    return result;
}
}

CCooccurrenceScorer::CCooccurrenceScorer(const CSensorRegistry& registry,
                                         const CBucketReader& reader)
    : m_Registry{registry}, m_Reader{reader} {
}

CCooccurrenceScorer::SResult CCooccurrenceScorer::compute(const SParams& params_,
                                                          const CAnalysisContext& context) const {
    core::CStopWatch total{true};

    SResult result;
    SParams params{params_};
    params.s_SensorIds = core::CStringUtils::normaliseIds(params.s_SensorIds);
    if (params.s_FocusSensorId != std::nullopt) {
        core::CStringUtils::trimWhitespace(*params.s_FocusSensorId);
        if (params.s_FocusSensorId->empty()) {
            params.s_FocusSensorId.reset();
        }
    }
    params.s_MaxSensors = std::min(std::max(params.s_MaxSensors, MIN_SENSORS), MAX_SENSORS);
    if (params.s_SensorIds.size() > params.s_MaxSensors) {
        result.s_TruncatedSensorIds.assign(params.s_SensorIds.begin() + params.s_MaxSensors,
                                           params.s_SensorIds.end());
        params.s_SensorIds.resize(params.s_MaxSensors);
    }
    clamp(params);

    params.s_Interval = CCorrelationMatrix::widenInterval(params.s_Start, params.s_End,
                                                          params.s_Interval, params.s_MaxBuckets);
    params.s_Detector.s_Interval = params.s_Interval;
    result.s_Interval = params.s_Interval;
    result.s_BucketCount = CBucketReader::numberBuckets(params.s_Start, params.s_End, params.s_Interval);
    if (params.s_FocusSensorId != std::nullopt &&
        std::binary_search(params.s_SensorIds.begin(), params.s_SensorIds.end(),
                           *params.s_FocusSensorId) == false) {
        result.s_Warnings.push_back("focus sensor " + *params.s_FocusSensorId +
                                    " is not one of the scored sensors");
    }
    LOG_DEBUG(<< "Scoring co-occurrence of " << params.s_SensorIds.size()
              << " sensors at interval " << params.s_Interval);

    context.progress(LOAD_SERIES, 0, params.s_SensorIds.size(), "Loading bucketed series");
    context.throwIfCanceled();

    core::CStopWatch load{true};
    CBucketReader::SRequest request;
    request.s_SensorIds = params.s_SensorIds;
    request.s_Start = params.s_Start;
    request.s_End = params.s_End;
    request.s_Interval = params.s_Interval;
    CBucketReader::SResult read{m_Reader.read(request)};
    std::uint64_t loadMs{load.stop()};
    context.phaseTiming(LOAD_SERIES, loadMs);
    result.s_Skipped = read.s_Skipped;

    core::CStopWatch detect{true};
    context.progress(DETECT_EVENTS, 0, params.s_SensorIds.size(), "Detecting events");
    CEventDetector detector{params.s_Detector};
    TStrEventVecMap events;
    SScoringOptions options;
    for (std::size_t i = 0; i < params.s_SensorIds.size(); ++i) {
        context.throwIfCanceled();
        const std::string& id{params.s_SensorIds[i]};
        const SSeries* series{read.series(id)};
        if (series == nullptr) {
            continue;
        }
        const SSensorInfo* info{m_Registry.sensor(id)};
        analytics_t::EDeltaMode mode{
            info != nullptr ? CSensorSemantics::infer(info->s_Type, info->s_Unit).s_DeltaMode
                            : analytics_t::E_Linear};
        CEventDetector::SResult detected{detector.detect(*series, mode)};
        if (params.s_PeriodicPenalty) {
            auto entropy = CEventDetector::timeOfDayEntropy(detected.s_Events);
            if (entropy != std::nullopt) {
                options.s_EntropyWeights[id] = entropy->s_Weight;
            }
        }
        result.s_DeseasoningApplied += detected.s_DeseasoningApplied ? 1 : 0;
        result.s_DeseasoningSkippedInsufficientWindow +=
            detected.s_DeseasoningSkippedInsufficientWindow ? 1 : 0;
        result.s_GapSkippedDeltas[id] = detected.s_GapSkippedDeltas;
        events[id] = std::move(detected.s_Events);
        context.progress(DETECT_EVENTS, i + 1, params.s_SensorIds.size());
    }
    std::uint64_t detectMs{detect.stop()};
    context.phaseTiming(DETECT_EVENTS, detectMs);

    core::CStopWatch scoring{true};
    context.progress(SCORE_BUCKETS, 0, 1, "Scoring co-occurrence buckets");
    options.s_Interval = params.s_Interval;
    options.s_ToleranceBuckets = params.s_ToleranceBuckets;
    options.s_MinSensors = params.s_MinSensors;
    options.s_MaxResults = params.s_MaxResults;
    options.s_ZCap = params.s_ZCap;
    options.s_Preference = params.s_Preference;
    options.s_FocusSensorId = params.s_FocusSensorId;
    result.s_Buckets = score(events, params.s_SensorIds.size(), options, context);

    for (const auto& id : params.s_SensorIds) {
        auto i = events.find(id);
        result.s_EventCount += i != events.end() ? i->second.size() : 0;
        result.s_SensorStats[id] = i != events.end() ? sensorStats(i->second, params.s_ZCap)
                                                     : SSensorStats{};
    }
    std::uint64_t scoringMs{scoring.stop()};
    context.phaseTiming(SCORE_BUCKETS, scoringMs);
    LOG_DEBUG(<< "Selected " << result.s_Buckets.size() << " buckets from "
              << result.s_EventCount << " events in " << scoringMs << "ms");

    result.s_ParamsUsed = params;
    result.s_Timings.push_back({"load_ms", loadMs});
    result.s_Timings.push_back({"detect_events_ms", detectMs});
    result.s_Timings.push_back({"scoring_ms", scoringMs});
    result.s_Timings.push_back({"job_total_ms", total.stop()});
    return result;
}

CCooccurrenceScorer::TScoredBucketVec
CCooccurrenceScorer::score(const TStrEventVecMap& events,
                           std::size_t totalSensors,
                           const SScoringOptions& options,
                           const CAnalysisContext& context) {
    core_t::TTime interval{std::max(options.s_Interval, core_t::TTime{1})};
    auto tolerance = static_cast<core_t::TTime>(options.s_ToleranceBuckets);
    std::size_t minSensors{std::max(options.s_MinSensors, MIN_SENSORS)};
    totalSensors = std::max(totalSensors, std::size_t{1});

    TTimeStrEventMapMap buckets;
    std::size_t n{0};
    for (const auto& sensor : events) {
        for (const auto& event : sensor.second) {
            context.throwIfCanceled(n++, 1024);
            core_t::TTime index{bucketIndex(event.s_Time, interval)};
            for (core_t::TTime offset = -tolerance; offset <= tolerance; ++offset) {
                TStrEventMap& entry{buckets[index + offset]};
                auto existing = entry.find(sensor.first);
                if (existing == entry.end() ||
                    std::fabs(event.s_Z) > std::fabs(existing->second.s_Z)) {
                    entry[sensor.first] = event;
                }
            }
        }
    }

    // (focus strength, bucket) pairs in selection order.
    std::vector<std::pair<double, SScoredBucket>> candidates;
    if (options.s_FocusSensorId != std::nullopt) {
        const std::string& focus{*options.s_FocusSensorId};
        std::map<core_t::TTime, double> strengths;
        auto focusEvents = events.find(focus);
        if (focusEvents != events.end()) {
            double weight{entropyWeight(options.s_EntropyWeights, focus)};
            for (const auto& event : focusEvents->second) {
                double strength{cappedAbs(event.s_Z, options.s_ZCap) * weight};
                double& entry{strengths[bucketIndex(event.s_Time, interval)]};
                entry = std::max(entry, strength);
            }
        }
        for (const auto& strength : strengths) {
            auto entry = buckets.find(strength.first);
            if (entry == buckets.end() || entry->second.size() < minSensors ||
                entry->second.count(focus) == 0) {
                continue;
            }
            auto bucket = buildBucket(strength.first, entry->second, totalSensors, options);
            if (bucket != std::nullopt) {
                bucket->s_FocusStrength = strength.second;
                candidates.emplace_back(strength.second, std::move(*bucket));
            }
        }
    } else {
        for (const auto& entry : buckets) {
            if (entry.second.size() < minSensors) {
                continue;
            }
            auto bucket = buildBucket(entry.first, entry.second, totalSensors, options);
            if (bucket != std::nullopt) {
                candidates.emplace_back(0.0, std::move(*bucket));
            }
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
        return std::make_tuple(-lhs.first, -lhs.second.s_Score, lhs.second.s_GroupSize,
                               -lhs.second.s_Time) <
               std::make_tuple(-rhs.first, -rhs.second.s_Score, rhs.second.s_GroupSize,
                               -rhs.second.s_Time);
    });

    TScoredBucketVec result;
    std::set<core_t::TTime> blocked;
    for (auto& candidate : candidates) {
        if (result.size() >= options.s_MaxResults) {
            break;
        }
        core_t::TTime index{bucketIndex(candidate.second.s_Time, interval)};
        if (blocked.count(index) > 0) {
            continue;
        }
        for (core_t::TTime i = index - tolerance; i <= index + tolerance; ++i) {
            blocked.insert(i);
        }
        result.push_back(std::move(candidate.second));
    }
    return result;
}

CCooccurrenceScorer::TOptionalBucketScore
CCooccurrenceScorer::bucketScore(EBucketPreference preference,
                                 double severitySum,
                                 std::size_t groupSize,
                                 std::size_t totalSensors) {
    if (std::isfinite(severitySum) == false || severitySum <= 0.0) {
        return std::nullopt;
    }
    auto n = static_cast<double>(std::max(totalSensors, std::size_t{1}));
    auto g = static_cast<double>(std::max(groupSize, std::size_t{1}));

    SBucketScore result;
    switch (preference) {
    case E_PreferSpecific: {
        result.s_PairWeight = 1.0 / std::log(2.0 + g);
        result.s_Idf = std::log((n + 1.0) / (g + 1.0));
        result.s_Score = severitySum / g * result.s_PairWeight * *result.s_Idf;
        if (std::isfinite(result.s_PairWeight) == false ||
            std::isfinite(*result.s_Idf) == false || std::isfinite(result.s_Score) == false) {
            return std::nullopt;
        }
        break;
    }
    case E_PreferSystemWide:
        result.s_Score = severitySum;
        break;
    }
    return result;
}

CCooccurrenceScorer::SSensorStats CCooccurrenceScorer::sensorStats(const TEventVec& events,
                                                                   double zCap) {
    SSensorStats result;
    result.s_NumberEvents = events.size();
    if (events.empty()) {
        return result;
    }
    double sum{0.0};
    for (const auto& event : events) {
        double z{cappedAbs(event.s_Z, zCap)};
        if (std::isfinite(z) && z > 0.0) {
            sum += z;
        }
    }
    result.s_MeanAbsZ = sum / static_cast<double>(events.size());
    return result;
}

void CCooccurrenceScorer::clamp(SParams& params) {
    params.s_Interval = std::max(params.s_Interval, core_t::TTime{1});
    params.s_MaxBuckets = std::min(std::max(params.s_MaxBuckets, MIN_BUCKETS), MAX_BUCKETS);
    params.s_ToleranceBuckets = std::min(params.s_ToleranceBuckets, MAX_TOLERANCE_BUCKETS);
    params.s_MinSensors = std::min(std::max(params.s_MinSensors, MIN_SENSORS),
                                   std::max(params.s_SensorIds.size(), MIN_SENSORS));
    params.s_MaxResults = std::min(std::max(params.s_MaxResults, std::size_t{1}), MAX_RESULTS);
    params.s_ZCap = maths::CTools::truncate(params.s_ZCap, 1.0, 1000.0);
    params.s_Detector.s_MaxEvents = std::min(std::max(params.s_Detector.s_MaxEvents,
                                                      CEventDetector::MIN_MAX_EVENTS),
                                             CEventDetector::MAX_MAX_EVENTS);
    params.s_Detector.s_ZThreshold = std::max(params.s_Detector.s_ZThreshold, 0.1);
}

std::string CCooccurrenceScorer::print(EBucketPreference preference) {
    switch (preference) {
    case E_PreferSpecific:
        return "prefer_specific_matches";
    case E_PreferSystemWide:
        return "prefer_system_wide_matches";
    }
    return "prefer_specific_matches";
}

bool CCooccurrenceScorer::parse(const std::string& value, EBucketPreference& preference) {
    if (value == "prefer_specific_matches" || value == "specific") {
        preference = E_PreferSpecific;
        return true;
    }
    if (value == "prefer_system_wide_matches" || value == "system_wide") {
        preference = E_PreferSystemWide;
        return true;
    }
    return false;
}
}
}
