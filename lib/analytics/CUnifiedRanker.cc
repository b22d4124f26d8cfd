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
#include <analytics/CUnifiedRanker.h>

#include <core/CHashing.h>
#include <core/CLogger.h>
#include <core/CStopWatch.h>
#include <core/CStringUtils.h>

#include <maths/CTools.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CBucketReader.h>
#include <analytics/CCorrelationMatrix.h>
#include <analytics/CSensorSemantics.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <deque>
#include <exception>
#include <functional>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace tsse {
namespace analytics {
namespace {
const std::string UNIFIED_PREPARE{"unified_prepare"};
const std::string EVENTS{"events"};
const std::string COOCCURRENCE{"cooccurrence"};
const std::string MERGE{"merge"};
const std::size_t NUMBER_PHASES{3};
const std::size_t NUMBER_EVIDENCE_STAGES{2};
const std::string BULLET{" \xE2\x80\xA2 "};

using TStrSet = std::set<std::string>;

//! \brief The co-occurrence of one sensor with the focus.
struct SCooccurrenceAggregate {
    double s_ScoreSum = 0.0;
    std::size_t s_Count = 0;
    double s_MaxZ = 0.0;
    TTimeVec s_Times;
};
using TStrCooccurrenceAggregateMap = std::map<std::string, SCooccurrenceAggregate>;

//! \brief The evidence collected for one sensor while merging.
struct SAccumulator {
    const CEventMatcher::SCandidate* s_Events = nullptr;
    const SCooccurrenceAggregate* s_Cooccurrence = nullptr;
    TOptionalDouble s_CooccurrenceAvg;
    TOptionalDouble s_CooccurrenceSurprise;
};

double weightOf(const CCooccurrenceScorer::TStrDoubleMap& weights, const std::string& id) {
    auto i = weights.find(id);
    return i != weights.end() ? i->second : 1.0;
}

TStrCooccurrenceAggregateMap
aggregateCooccurrence(const CCooccurrenceScorer::TScoredBucketVec& buckets,
                      const std::string& focus,
                      const CCooccurrenceScorer::TStrDoubleMap& entropyWeights,
                      double zCap) {
    TStrCooccurrenceAggregateMap result;
    for (const auto& bucket : buckets) {
        auto focusParticipant = std::find_if(
            bucket.s_Sensors.begin(), bucket.s_Sensors.end(),
            [&focus](const CCooccurrenceScorer::SParticipant& participant) {
                return participant.s_SensorId == focus;
            });
        if (focusParticipant == bucket.s_Sensors.end()) {
            continue;
        }
        double focusZ{std::min(std::fabs(focusParticipant->s_Z), zCap)};
        for (const auto& participant : bucket.s_Sensors) {
            if (participant.s_SensorId == focus) {
                continue;
            }
            SCooccurrenceAggregate& aggregate{result[participant.s_SensorId]};
            double z{std::min(std::fabs(participant.s_Z), zCap)};
            aggregate.s_ScoreSum += focusZ * z * weightOf(entropyWeights, participant.s_SensorId);
            ++aggregate.s_Count;
            aggregate.s_MaxZ = std::max(aggregate.s_MaxZ, z);
            aggregate.s_Times.push_back(bucket.s_Time);
        }
    }
    for (auto& aggregate : result) {
        TTimeVec& times{aggregate.second.s_Times};
        std::sort(times.begin(), times.end(), std::greater<core_t::TTime>());
        if (times.size() > CUnifiedRanker::MAX_TOP_BUCKET_TIMES) {
            times.resize(CUnifiedRanker::MAX_TOP_BUCKET_TIMES);
        }
    }
    return result;
}

double normaliseComponent(const TOptionalDouble& value, double max) {
    if (value == std::nullopt || std::isfinite(*value) == false || *value <= 0.0 ||
        std::isfinite(max) == false || max <= 0.0) {
        return 0.0;
    }
    return maths::CTools::truncate(*value / max, 0.0, 1.0);
}

int confidenceWeight(analytics_t::EConfidence confidence) {
    switch (confidence) {
    case analytics_t::E_High:
        return 3;
    case analytics_t::E_Medium:
        return 2;
    case analytics_t::E_Low:
        return 1;
    }
    return 1;
}

std::string fixed2(double value) {
    std::ostringstream result;
    result << std::fixed << std::setprecision(2) << value;
    return result.str();
}

std::string joinPath(const TStrVec& path) {
    std::string result;
    for (const auto& id : path) {
        result += (result.empty() ? "" : " -> ") + id;
    }
    return result;
}

TOptionalDouble effectiveEventScore(const CEventMatcher::SCandidate& candidate) {
    if (candidate.s_Score == std::nullopt) {
        return std::nullopt;
    }
    core_t::TTime lag{candidate.s_BestLag ? candidate.s_BestLag->s_LagSeconds : 0};
    return CUnifiedRanker::isDiurnalLag(lag) ? *candidate.s_Score * CUnifiedRanker::DIURNAL_LAG_PENALTY
                                             : *candidate.s_Score;
}
}

CUnifiedRanker::CUnifiedRanker(const CSensorRegistry& registry, const CBucketReader& reader)
    : m_Registry{registry}, m_Reader{reader} {
}

CUnifiedRanker::SResult CUnifiedRanker::compute(const SParams& params_,
                                                const CAnalysisContext& context) const {
    core::CStopWatch total{true};

    SResult result;
    SParams params{params_};
    core::CStringUtils::trimWhitespace(params.s_FocusSensorId);
    const std::string& focus{params.s_FocusSensorId};
    result.s_FocusSensorId = focus;
    bool advanced{params.s_Mode == E_Advanced};
    bool quick{params.s_QuickSuggest};

    std::size_t maxResults{std::min(std::max(params.s_MaxResults.value_or(quick ? 20 : 60),
                                             MIN_MAX_RESULTS),
                                    MAX_MAX_RESULTS)};
    std::size_t maxBuckets{quick ? std::size_t{8000} : std::size_t{16000}};
    params.s_Interval = CCorrelationMatrix::widenInterval(
        params.s_Start, params.s_End, std::max(params.s_Interval, core_t::TTime{1}), maxBuckets);
    result.s_Interval = params.s_Interval;
    result.s_BucketCount = CBucketReader::numberBuckets(params.s_Start, params.s_End, params.s_Interval);

    context.progress(UNIFIED_PREPARE, 0, NUMBER_PHASES, "Preparing candidate pool");
    context.throwIfCanceled();
    core::CStopWatch prepare{true};

    SSensorInfo focusFallback;
    focusFallback.s_Id = focus;
    const SSensorInfo* focusInfo{m_Registry.sensor(focus)};
    if (focusInfo == nullptr) {
        result.s_Warnings.push_back("focus sensor " + focus + " is not registered");
        focusInfo = &focusFallback;
    }

    auto hasHistory = [this, &result](const std::string& id) {
        const SSensorInfo* info{m_Registry.sensor(id)};
        if (info == nullptr) {
            result.s_Skipped.push_back({id, analytics_t::E_SensorNotFound, ""});
            return false;
        }
        if (info->s_Source == SSensorInfo::E_ForecastPoints) {
            result.s_Skipped.push_back({id, analytics_t::E_NoHistory, "forecast points provider"});
            return false;
        }
        return true;
    };

    TStrVec pins;
    for (const auto& id : core::CStringUtils::normaliseIds(params.s_PinnedSensorIds)) {
        if (id != focus && hasHistory(id)) {
            pins.push_back(id);
        }
    }

    TStrVec allowed{m_Registry.candidates(*focusInfo, params.s_Filters)};
    TStrVec pool;
    TStrVec explicitIds{core::CStringUtils::normaliseIds(params.s_CandidateSensorIds)};
    if (explicitIds.empty()) {
        pool = allowed;
    } else {
        for (const auto& id : explicitIds) {
            if (id == focus) {
                continue;
            }
            if (m_Registry.contains(id) &&
                std::binary_search(allowed.begin(), allowed.end(), id) == false) {
                result.s_Skipped.push_back({id, analytics_t::E_Filtered, "excluded by candidate filters"});
                continue;
            }
            pool.push_back(id);
        }
    }
    std::size_t candidatePool{pool.size()};
    TStrVec candidates;
    for (const auto& id : pool) {
        if (std::binary_search(pins.begin(), pins.end(), id) == false && hasHistory(id)) {
            candidates.push_back(id);
        }
    }

    std::size_t eligible{candidates.size() + pins.size()};
    std::size_t limit{candidateLimit(params, pins.size(), eligible)};
    std::size_t maxSensorsUsed{std::min(std::max(limit + 1, std::size_t{2}), MAX_SENSORS_USED)};
    result.s_Limits.s_CandidateLimitUsed = limit;
    result.s_Limits.s_MaxResultsUsed = maxResults;
    result.s_Limits.s_MaxSensorsUsed = maxSensorsUsed;

    std::uint64_t seed{orderSeed(focus, params.s_JobKey)};
    TStrVec orderedPins{orderCandidates(*focusInfo, pins, seed)};
    TStrVec pinnedTruncated;
    if (orderedPins.size() > limit) {
        pinnedTruncated.assign(orderedPins.begin() + limit, orderedPins.end());
        orderedPins.resize(limit);
    }
    TStrVec measure{focus};
    measure.insert(measure.end(), orderedPins.begin(), orderedPins.end());
    SPrefilter filtered{prefilter(orderCandidates(*focusInfo, candidates, seed),
                                  limit - orderedPins.size(), measure, params, context)};

    TStrVec evaluated{orderedPins};
    evaluated.insert(evaluated.end(), filtered.s_Accepted.begin(), filtered.s_Accepted.end());
    result.s_PrefilteredSensorIds = filtered.s_Prefiltered;
    result.s_TruncatedSensorIds = pinnedTruncated;
    result.s_TruncatedSensorIds.insert(result.s_TruncatedSensorIds.end(),
                                       filtered.s_Truncated.begin(), filtered.s_Truncated.end());
    for (const auto& id : result.s_PrefilteredSensorIds) {
        result.s_Skipped.push_back({id, analytics_t::E_InsufficientOverlap,
                                    "too few buckets or deltas in the window"});
    }
    for (const auto& id : result.s_TruncatedSensorIds) {
        result.s_Skipped.push_back({id, analytics_t::E_TruncatedByLimit, ""});
    }

    for (const auto& id : evaluated) {
        auto path = derivedDependencyPath(id, focus);
        if (path != std::nullopt) {
            result.s_DerivedDependencyPaths[id] = std::move(*path);
        }
    }
    std::uint64_t prefilterMs{prepare.stop()};
    context.phaseTiming(UNIFIED_PREPARE, prefilterMs);
    LOG_DEBUG(<< "Evaluating " << evaluated.size() << " of " << eligible
              << " eligible candidates for " << focus << " (limit " << limit << ")");

    bool deseason{params.s_Detector.s_Deseasoning == CEventDetector::E_HourOfDayMean};
    bool deseasoningApplied{deseason && params.s_End - params.s_Start >= CEventDetector::MIN_DESEASONING_SPAN};

    auto& counts = result.s_Counts;
    counts["candidate_pool"] = candidatePool;
    counts["eligible_count"] = eligible;
    counts["evaluated_count"] = evaluated.size();
    counts["evaluate_all_eligible_effective"] = params.s_EvaluateAllEligible ? 1 : 0;
    counts["pinned_requested"] = pins.size();
    counts["pinned_included"] = orderedPins.size();
    counts["pinned_truncated"] = pinnedTruncated.size();
    counts["candidate_prefiltered"] = result.s_PrefilteredSensorIds.size();
    counts["candidate_truncated"] = result.s_TruncatedSensorIds.size();
    counts["deseasoning_applied"] = deseasoningApplied ? 1 : 0;
    counts["deseasoning_skipped_insufficient_window"] = deseason && deseasoningApplied == false ? 1 : 0;

    // Resolve the defaults which depend on the mode.
    params.s_ZThreshold = params.s_ZThreshold.value_or(quick ? 3.5 : 3.0);
    params.s_MaxLagBuckets = params.s_MaxLagBuckets.value_or(quick ? 8 : 12);
    params.s_MaxEvents = params.s_MaxEvents.value_or(quick ? 1200 : 2000);
    params.s_MaxEpisodes = params.s_MaxEpisodes.value_or(quick ? 12 : 24);
    params.s_ToleranceBuckets = params.s_ToleranceBuckets.value_or(quick ? 1 : 2);
    params.s_EpisodeGapBuckets = std::max(params.s_EpisodeGapBuckets, std::size_t{1});
    params.s_MinSensors = std::max(params.s_MinSensors, std::size_t{2});
    params.s_ZCap = maths::CTools::truncate(params.s_ZCap, CEventMatcher::MIN_Z_CAP,
                                            CEventMatcher::MAX_Z_CAP);
    if (params.s_IncludeDeltaCorrelation == std::nullopt) {
        params.s_IncludeDeltaCorrelation = advanced ? false
                                                    : CSensorSemantics::isLevelLike(focusInfo->s_Type);
    }
    params.s_Weights = normaliseWeights(params.s_Weights, *params.s_IncludeDeltaCorrelation);
    params.s_PeriodicPenalty = params.s_PeriodicPenalty.value_or(deseason == false);
    params.s_IncludeLowConfidence = params.s_IncludeLowConfidence.value_or(advanced);
    params.s_CandidateLimit = limit;
    params.s_MaxResults = maxResults;
    result.s_ParamsUsed = params;
    result.s_EvidenceSource = E_DeltaZ;
    if (params.s_Weights->s_Events > 0.0 && params.s_FocusEvents.empty() == false) {
        result.s_EvidenceSource = params.s_Weights->s_Cooccurrence > 0.0 ? E_Blend : E_Pattern;
    }

    if (evaluated.empty()) {
        result.s_Warnings.push_back("No candidates evaluated");
        if (params.s_StabilityEnabled) {
            SStability skipped;
            skipped.s_Reason = "No candidates evaluated";
            result.s_Stability = skipped;
        }
        counts["ranked"] = 0;
        result.s_Timings.push_back({"prefilter_ms", prefilterMs});
        result.s_Timings.push_back({"job_total_ms", total.stop()});
        return result;
    }

    SRunSettings settings;
    CEventMatcher::SParams& events{settings.s_Events};
    events.s_FocusSensorId = focus;
    events.s_CandidateSensorIds = evaluated;
    events.s_Start = params.s_Start;
    events.s_End = params.s_End;
    events.s_Interval = params.s_Interval;
    events.s_MaxBuckets = maxBuckets;
    events.s_Detector = params.s_Detector;
    events.s_Detector.s_ZThreshold = *params.s_ZThreshold;
    events.s_Detector.s_MaxEvents = *params.s_MaxEvents;
    events.s_MaxLagBuckets = *params.s_MaxLagBuckets;
    events.s_TopKLags = advanced ? 3 : 0;
    events.s_ToleranceBuckets = *params.s_ToleranceBuckets;
    events.s_MaxEpisodes = *params.s_MaxEpisodes;
    events.s_EpisodeGapBuckets = params.s_EpisodeGapBuckets;
    events.s_CandidateLimit = limit;
    events.s_ZCap = params.s_ZCap;
    events.s_PeriodicPenalty = *params.s_PeriodicPenalty;
    events.s_FocusEvents = params.s_FocusEvents;

    CCooccurrenceScorer::SParams& cooccurrence{settings.s_Cooccurrence};
    cooccurrence.s_SensorIds.push_back(focus);
    cooccurrence.s_SensorIds.insert(cooccurrence.s_SensorIds.end(), evaluated.begin(),
                                    evaluated.begin() + std::min(evaluated.size(), maxSensorsUsed - 1));
    cooccurrence.s_Start = params.s_Start;
    cooccurrence.s_End = params.s_End;
    cooccurrence.s_Interval = params.s_Interval;
    cooccurrence.s_MaxSensors = maxSensorsUsed;
    cooccurrence.s_MaxBuckets = maxBuckets;
    cooccurrence.s_ToleranceBuckets = *params.s_ToleranceBuckets;
    cooccurrence.s_MinSensors = params.s_MinSensors;
    cooccurrence.s_MaxResults = std::min(maxResults * 4, CCooccurrenceScorer::MAX_RESULTS);
    cooccurrence.s_ZCap = params.s_ZCap;
    cooccurrence.s_Detector = events.s_Detector;
    cooccurrence.s_PeriodicPenalty = *params.s_PeriodicPenalty;
    cooccurrence.s_Preference = params.s_BucketPreference;
    cooccurrence.s_FocusSensorId = focus;

    SMergeOptions& merging{settings.s_Merge};
    merging.s_FocusSensorId = focus;
    merging.s_Weights = *params.s_Weights;
    merging.s_Metric = params.s_CooccurrenceMetric;
    merging.s_IncludeLow = *params.s_IncludeLowConfidence;
    merging.s_MaxResults = maxResults;
    merging.s_ZCap = params.s_ZCap;
    merging.s_DerivedPaths = result.s_DerivedDependencyPaths;
    merging.s_ExcludeDerived = advanced == false;
    settings.s_ExcludeSystemWideBuckets = params.s_ExcludeSystemWideBuckets;

    // Each evidence stage may fail independently.  The ranking carries on
    // with the evidence which is available and the failure becomes a warning.
    TStrVec failures;
    auto runStage = [&failures](const std::string& stage, const std::function<void()>& body) {
        try {
            body();
        } catch (const core::CCanceledException&) {
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Stage " << stage << " failed: " << e.what());
            failures.push_back(stage + " stage failed: " + e.what());
        }
    };

    context.progress(EVENTS, 1, NUMBER_PHASES, "Matching events");
    core::CStopWatch eventsWatch{true};
    CEventMatcher::SResult eventResult;
    runStage(EVENTS, [&] {
        eventResult = CEventMatcher{m_Registry, m_Reader}.compute(events, context);
    });
    std::uint64_t eventsMs{eventsWatch.stop()};
    context.phaseTiming(EVENTS, eventsMs);

    context.progress(COOCCURRENCE, 2, NUMBER_PHASES, "Scoring co-occurrence");
    core::CStopWatch cooccurrenceWatch{true};
    CCooccurrenceScorer::SResult cooccurrenceResult;
    runStage(COOCCURRENCE, [&] {
        cooccurrenceResult = CCooccurrenceScorer{m_Registry, m_Reader}.compute(cooccurrence, context);
    });
    std::uint64_t cooccurrenceMs{cooccurrenceWatch.stop()};
    context.phaseTiming(COOCCURRENCE, cooccurrenceMs);

    if (failures.size() == NUMBER_EVIDENCE_STAGES) {
        std::string message{failures[0]};
        for (std::size_t i = 1; i < failures.size(); ++i) {
            message += "; " + failures[i];
        }
        throw std::runtime_error{"No relationship evidence could be computed: " + message};
    }
    result.s_Warnings.insert(result.s_Warnings.end(), failures.begin(), failures.end());

    TTimeVec systemWide;
    result.s_SystemWideBuckets = systemWideBuckets(cooccurrenceResult, systemWide);
    if (params.s_ExcludeSystemWideBuckets) {
        removeBuckets(cooccurrenceResult, systemWide);
    }

    context.progress(MERGE, 3, NUMBER_PHASES, "Merging relationship evidence");
    context.throwIfCanceled();
    SMergeResult merged{merge(eventResult, cooccurrenceResult, merging)};

    auto coverage = [&](const std::string& id) -> TOptionalDouble {
        auto i = filtered.s_BucketsWithValues.find(id);
        if (i == filtered.s_BucketsWithValues.end() || result.s_BucketCount == 0) {
            return std::nullopt;
        }
        return 100.0 * static_cast<double>(i->second) / static_cast<double>(result.s_BucketCount);
    };
    TOptionalDouble focusCoverage{coverage(focus)};
    for (auto& candidate : merged.s_Candidates) {
        candidate.s_Evidence.s_FocusBucketCoveragePct = focusCoverage;
        candidate.s_Evidence.s_CandidateBucketCoveragePct = coverage(candidate.s_SensorId);
    }
    if (advanced == false) {
        for (const auto& path : result.s_DerivedDependencyPaths) {
            result.s_Skipped.push_back({path.first, analytics_t::E_DerivedFromFocus, joinPath(path.second)});
        }
    }
    result.s_Candidates = std::move(merged.s_Candidates);
    result.s_TruncatedResultSensorIds = std::move(merged.s_TruncatedSensorIds);

    TStrSet skippedIds;
    for (const auto& skipped : result.s_Skipped) {
        skippedIds.insert(skipped.s_SensorId);
    }
    for (const auto& skipped : eventResult.s_Skipped) {
        if (skippedIds.insert(skipped.s_SensorId).second) {
            result.s_Skipped.push_back(skipped);
        }
    }
    result.s_Monitoring = eventResult.s_Monitoring;
    result.s_GapSkippedDeltas = eventResult.s_GapSkippedDeltas;
    result.s_Warnings.insert(result.s_Warnings.end(), eventResult.s_Warnings.begin(),
                             eventResult.s_Warnings.end());
    result.s_Warnings.insert(result.s_Warnings.end(), cooccurrenceResult.s_Warnings.begin(),
                             cooccurrenceResult.s_Warnings.end());

    counts["ranked"] = result.s_Candidates.size();
    counts["event_candidates"] = eventResult.s_Candidates.size();
    counts["cooccurrence_sensors"] = merged.s_CooccurrenceSensors;
    counts["cooccurrence_total_sensors"] = cooccurrenceResult.s_ParamsUsed.s_SensorIds.size();

    if (params.s_StabilityEnabled) {
        TStrVec top;
        for (std::size_t i = 0; i < std::min(result.s_Candidates.size(), STABILITY_TOP_K); ++i) {
            top.push_back(result.s_Candidates[i].s_SensorId);
        }
        try {
            result.s_Stability = stability(settings, top, eligible, context);
        } catch (const core::CCanceledException&) {
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Stability check failed: " << e.what());
            SStability failed;
            failed.s_Reason = std::string{"Stability check failed: "} + e.what();
            result.s_Warnings.push_back(failed.s_Reason);
            result.s_Stability = std::move(failed);
        }
    }

    result.s_Timings.push_back({"prefilter_ms", prefilterMs});
    result.s_Timings.push_back({"events_ms", eventsMs});
    result.s_Timings.push_back({"cooccurrence_ms", cooccurrenceMs});
    result.s_Timings.push_back({"job_total_ms", total.stop()});
    LOG_DEBUG(<< "Ranked " << result.s_Candidates.size() << " candidates for " << focus);
    return result;
}

CUnifiedRanker::SMergeResult CUnifiedRanker::merge(const CEventMatcher::SResult& events,
                                                   const CCooccurrenceScorer::SResult& cooccurrence,
                                                   const SMergeOptions& options) {
    SMergeResult result;
    const std::string& focus{options.s_FocusSensorId};

    CCooccurrenceScorer::TStrDoubleMap entropyWeights;
    for (const auto& candidate : events.s_Candidates) {
        if (candidate.s_EntropyWeight != std::nullopt &&
            std::isfinite(*candidate.s_EntropyWeight) && *candidate.s_EntropyWeight > 0.0) {
            entropyWeights[candidate.s_SensorId] = *candidate.s_EntropyWeight;
        }
    }
    TStrCooccurrenceAggregateMap aggregates{
        aggregateCooccurrence(cooccurrence.s_Buckets, focus, entropyWeights, options.s_ZCap)};
    result.s_CooccurrenceSensors = aggregates.size();

    auto meanAbsZ = [&cooccurrence](const std::string& id) {
        auto i = cooccurrence.s_SensorStats.find(id);
        return i != cooccurrence.s_SensorStats.end() ? i->second.s_MeanAbsZ : 0.0;
    };
    double focusMeanAbsZ{meanAbsZ(focus)};

    double maxEventScore{0.0};
    std::map<std::string, SAccumulator> accumulators;
    for (const auto& candidate : events.s_Candidates) {
        TOptionalDouble score{effectiveEventScore(candidate)};
        if (score != std::nullopt && std::isfinite(*score) && *score > 0.0) {
            maxEventScore = std::max(maxEventScore, *score);
        }
        accumulators[candidate.s_SensorId].s_Events = &candidate;
    }
    for (const auto& aggregate : aggregates) {
        SAccumulator& accumulator{accumulators[aggregate.first]};
        accumulator.s_Cooccurrence = &aggregate.second;
        double avg{aggregate.second.s_Count > 0 ? aggregate.second.s_ScoreSum /
                                                      static_cast<double>(aggregate.second.s_Count)
                                                : 0.0};
        if (std::isfinite(avg) && avg > 0.0) {
            accumulator.s_CooccurrenceAvg = avg;
            accumulator.s_CooccurrenceSurprise =
                surpriseRatio(avg, focusMeanAbsZ, meanAbsZ(aggregate.first));
        }
    }

    auto metric = [&options](const SAccumulator& accumulator) -> TOptionalDouble {
        const TOptionalDouble& value{options.s_Metric == E_AvgProduct ? accumulator.s_CooccurrenceAvg
                                                                      : accumulator.s_CooccurrenceSurprise};
        if (value == std::nullopt) {
            return std::nullopt;
        }
        std::size_t numberFocus{accumulator.s_Events ? accumulator.s_Events->s_NumberFocus : 0};
        std::size_t numberCandidate{accumulator.s_Events ? accumulator.s_Events->s_NumberCandidate : 0};
        return *value * prevalencePenalty(numberFocus, numberCandidate);
    };
    double maxMetric{0.0};
    for (const auto& accumulator : accumulators) {
        TOptionalDouble value{metric(accumulator.second)};
        if (value != std::nullopt && std::isfinite(*value) && *value > 0.0) {
            maxMetric = std::max(maxMetric, *value);
        }
    }

    double deltaWeight{options.s_Weights.s_DeltaCorrelation.value_or(0.0)};
    for (const auto& entry : accumulators) {
        const std::string& id{entry.first};
        const SAccumulator& accumulator{entry.second};
        const CEventMatcher::SCandidate* matched{accumulator.s_Events};
        const SCooccurrenceAggregate* shared{accumulator.s_Cooccurrence};

        SCandidate candidate;
        candidate.s_SensorId = id;
        SEvidence& evidence{candidate.s_Evidence};
        TOptionalDouble cooccurrenceMetric{metric(accumulator)};
        double eventsNorm{normaliseComponent(matched ? effectiveEventScore(*matched) : TOptionalDouble{},
                                             maxEventScore)};
        double cooccurrenceNorm{normaliseComponent(cooccurrenceMetric, maxMetric)};
        double deltaAbs{matched && matched->s_DeltaCorrelation
                            ? maths::CTools::truncate(std::fabs(*matched->s_DeltaCorrelation), 0.0, 1.0)
                            : 0.0};
        double blended{options.s_Weights.s_Events * eventsNorm +
                       options.s_Weights.s_Cooccurrence * cooccurrenceNorm + deltaWeight * deltaAbs};
        if (std::isfinite(blended) == false || blended <= 0.0) {
            continue;
        }

        if (matched != nullptr) {
            core_t::TTime bestLag{matched->s_BestLag ? matched->s_BestLag->s_LagSeconds : 0};
            evidence.s_EventsScore = matched->s_Score;
            evidence.s_EventsOverlap = matched->s_Overlap;
            evidence.s_NumberFocus = matched->s_NumberFocus;
            evidence.s_NumberCandidate = matched->s_NumberCandidate;
            evidence.s_FocusUpEvents = matched->s_FocusUpEvents;
            evidence.s_FocusDownEvents = matched->s_FocusDownEvents;
            evidence.s_CandidateUpEvents = matched->s_CandidateUpEvents;
            evidence.s_CandidateDownEvents = matched->s_CandidateDownEvents;
            evidence.s_BestLagSeconds = bestLag;
            evidence.s_TopLags = matched->s_TopLags;
            evidence.s_Direction = matched->s_Direction;
            evidence.s_SignAgreement = matched->s_SignAgreement;
            evidence.s_DeltaCorrelation = matched->s_DeltaCorrelation;
            evidence.s_DirectionN = matched->s_DirectionN;
            evidence.s_EntropyNorm = matched->s_EntropyNorm;
            evidence.s_EntropyWeight = matched->s_EntropyWeight;
            evidence.s_DiurnalLag = isDiurnalLag(bestLag);
            candidate.s_Episodes = matched->s_Episodes;

            std::size_t strong{static_cast<std::size_t>(std::count_if(
                matched->s_Episodes.begin(), matched->s_Episodes.end(), [](const SEpisode& episode) {
                    return episode.s_NumPoints >= MULTI_EPISODE_MIN_POINTS;
                }))};
            if (evidence.s_DiurnalLag == false && strong >= 2) {
                blended = std::min(blended + MULTI_EPISODE_BONUS, 1.0);
                evidence.s_MultiEpisodeBonus = true;
            }
        }
        if (shared != nullptr) {
            evidence.s_CooccurrenceScore = shared->s_ScoreSum;
            evidence.s_CooccurrenceCount = shared->s_Count;
            evidence.s_CooccurrenceAvg = accumulator.s_CooccurrenceAvg;
            evidence.s_CooccurrenceSurprise = accumulator.s_CooccurrenceSurprise;
            candidate.s_TopBucketTimes = shared->s_Times;
        }
        if (cooccurrenceMetric != std::nullopt) {
            evidence.s_CooccurrenceStrength = cooccurrenceNorm;
        }

        candidate.s_BlendedScore = blended;
        candidate.s_Confidence = confidence(blended, evidence.s_EventsOverlap.value_or(0),
                                            evidence.s_CooccurrenceCount.value_or(0));

        auto path = options.s_DerivedPaths.find(id);
        if (path != options.s_DerivedPaths.end()) {
            candidate.s_DerivedFromFocus = true;
            candidate.s_DerivedDependencyPath = path->second;
            if (options.s_ExcludeDerived) {
                result.s_ExcludedDerived.push_back(std::move(candidate));
                continue;
            }
        }
        if (options.s_IncludeLow == false && candidate.s_Confidence == analytics_t::E_Low) {
            continue;
        }

        if (evidence.s_EventsScore != std::nullopt && std::isfinite(*evidence.s_EventsScore)) {
            evidence.s_Summary.push_back("Event match (F1) " + fixed2(*evidence.s_EventsScore) +
                                         BULLET + "matched: " +
                                         std::to_string(evidence.s_EventsOverlap.value_or(0)));
        }
        if (evidence.s_CooccurrenceCount.value_or(0) > 0) {
            evidence.s_Summary.push_back(
                "Shared buckets " + std::to_string(*evidence.s_CooccurrenceCount) + BULLET +
                (options.s_Metric == E_AvgProduct ? "Avg co-occ " : "Surprise ") +
                fixed2(cooccurrenceNorm));
        }
        if (evidence.s_BestLagSeconds.value_or(0) != 0) {
            evidence.s_Summary.push_back("Best lag " + std::to_string(*evidence.s_BestLagSeconds) + "s");
        }
        if (evidence.s_DiurnalLag) {
            evidence.s_Summary.push_back("Lag near a whole number of days");
        }
        result.s_Candidates.push_back(std::move(candidate));
    }

    std::sort(result.s_Candidates.begin(), result.s_Candidates.end(),
              [](const SCandidate& lhs, const SCandidate& rhs) {
                  return std::make_tuple(-lhs.s_BlendedScore, -confidenceWeight(lhs.s_Confidence),
                                         -static_cast<double>(lhs.s_Evidence.s_CooccurrenceCount.value_or(0)),
                                         -static_cast<double>(lhs.s_Evidence.s_EventsOverlap.value_or(0)),
                                         std::cref(lhs.s_SensorId)) <
                         std::make_tuple(-rhs.s_BlendedScore, -confidenceWeight(rhs.s_Confidence),
                                         -static_cast<double>(rhs.s_Evidence.s_CooccurrenceCount.value_or(0)),
                                         -static_cast<double>(rhs.s_Evidence.s_EventsOverlap.value_or(0)),
                                         std::cref(rhs.s_SensorId));
              });
    if (result.s_Candidates.size() > options.s_MaxResults) {
        for (std::size_t i = options.s_MaxResults; i < result.s_Candidates.size(); ++i) {
            result.s_TruncatedSensorIds.push_back(result.s_Candidates[i].s_SensorId);
        }
        result.s_Candidates.resize(options.s_MaxResults);
    }
    for (std::size_t i = 0; i < result.s_Candidates.size(); ++i) {
        result.s_Candidates[i].s_Rank = i + 1;
    }
    return result;
}

std::uint64_t CUnifiedRanker::orderSeed(const std::string& focusSensorId, const std::string& jobKey) {
    return core::CHashing::hashCombine(core::CHashing::hashString(jobKey),
                                       core::CHashing::hashString(focusSensorId));
}

TStrVec CUnifiedRanker::orderCandidates(const SSensorInfo& focus, TStrVec ids, std::uint64_t seed) const {
    auto group = [this, &focus](const std::string& id) {
        const SSensorInfo* info{m_Registry.sensor(id)};
        if (info == nullptr) {
            return 3;
        }
        if (focus.s_NodeId.empty() == false && info->s_NodeId == focus.s_NodeId) {
            return 0;
        }
        if (focus.s_Unit.empty() == false && info->s_Unit == focus.s_Unit) {
            return 1;
        }
        if (focus.s_Type.empty() == false && info->s_Type == focus.s_Type) {
            return 2;
        }
        return 3;
    };
    using TKey = std::tuple<int, std::uint64_t, std::string>;
    std::vector<TKey> keys;
    keys.reserve(ids.size());
    for (auto& id : ids) {
        keys.emplace_back(group(id), core::CHashing::hashString(id, seed), std::move(id));
    }
    std::sort(keys.begin(), keys.end());
    TStrVec result;
    result.reserve(keys.size());
    for (auto& key : keys) {
        result.push_back(std::move(std::get<2>(key)));
    }
    return result;
}

std::optional<TStrVec> CUnifiedRanker::derivedDependencyPath(const std::string& candidateId,
                                                             const std::string& focusId,
                                                             std::size_t maxDepth,
                                                             std::size_t maxVisited) const {
    if (maxDepth == 0 || candidateId.empty() || focusId.empty() || candidateId == focusId) {
        return std::nullopt;
    }

    TStrSet visited{candidateId};
    std::deque<TStrVec> queue{TStrVec{candidateId}};
    while (queue.empty() == false) {
        TStrVec path{std::move(queue.front())};
        queue.pop_front();
        if (path.size() - 1 >= maxDepth) {
            continue;
        }
        for (const auto& input : m_Registry.directInputs(path.back())) {
            if (input == focusId) {
                path.push_back(input);
                if (path.size() > MAX_DERIVED_PATH_LENGTH) {
                    path.erase(path.begin() + (MAX_DERIVED_PATH_LENGTH - 1), path.end() - 1);
                }
                return path;
            }
            if (visited.size() >= maxVisited || visited.insert(input).second == false) {
                continue;
            }
            TStrVec next{path};
            next.push_back(input);
            queue.push_back(std::move(next));
        }
    }
    return std::nullopt;
}

std::size_t CUnifiedRanker::candidateLimit(const SParams& params, std::size_t pinned, std::size_t eligible) {
    std::size_t requested{params.s_CandidateLimit.value_or(params.s_QuickSuggest ? 80 : 200)};
    requested = std::min(std::max(requested, MIN_CANDIDATE_LIMIT), MAX_CANDIDATE_LIMIT);
    if (params.s_Mode == E_Simple && params.s_QuickSuggest == false) {
        requested = std::min(requested, SIMPLE_CANDIDATE_LIMIT);
    }
    std::size_t result{std::min(std::max(std::max(requested, pinned), MIN_CANDIDATE_LIMIT),
                                MAX_CANDIDATE_LIMIT)};
    if (params.s_EvaluateAllEligible) {
        result = std::max(eligible, pinned);
    }
    return result;
}

CUnifiedRanker::SWeights CUnifiedRanker::normaliseWeights(const TOptionalWeights& weights,
                                                          bool includeDeltaCorrelation) {
    SWeights defaults;
    if (includeDeltaCorrelation) {
        defaults.s_DeltaCorrelation = 0.2;
    }
    if (weights == std::nullopt) {
        return defaults;
    }

    auto valid = [](double weight) { return std::isfinite(weight) && weight >= 0.0; };
    double events{valid(weights->s_Events) ? weights->s_Events : defaults.s_Events};
    double cooccurrence{valid(weights->s_Cooccurrence) ? weights->s_Cooccurrence
                                                       : defaults.s_Cooccurrence};
    double delta{0.0};
    if (includeDeltaCorrelation) {
        delta = weights->s_DeltaCorrelation.value_or(*defaults.s_DeltaCorrelation);
        if (valid(delta) == false) {
            delta = *defaults.s_DeltaCorrelation;
        }
    }
    double sum{events + cooccurrence + delta};
    if (std::isfinite(sum) == false || sum <= 0.0) {
        return defaults;
    }

    SWeights result;
    result.s_Events = events / sum;
    result.s_Cooccurrence = cooccurrence / sum;
    if (includeDeltaCorrelation) {
        result.s_DeltaCorrelation = delta / sum;
    }
    return result;
}

analytics_t::EConfidence CUnifiedRanker::confidence(double blended,
                                                    std::size_t overlap,
                                                    std::size_t cooccurrenceCount) {
    if (blended >= 0.75 && (overlap >= 2 || cooccurrenceCount >= 2)) {
        return analytics_t::E_High;
    }
    if (blended >= 0.35 && (overlap >= 1 || cooccurrenceCount >= 1)) {
        return analytics_t::E_Medium;
    }
    return analytics_t::E_Low;
}

double CUnifiedRanker::prevalencePenalty(std::size_t numberFocus, std::size_t numberCandidate) {
    if (numberFocus == 0 || numberCandidate <= numberFocus) {
        return 1.0;
    }
    return maths::CTools::truncate(
        std::sqrt(static_cast<double>(numberFocus) / static_cast<double>(numberCandidate)), 0.25, 1.0);
}

TOptionalDouble CUnifiedRanker::surpriseRatio(double avgProduct, double focusMeanAbsZ, double candidateMeanAbsZ) {
    if (std::isfinite(avgProduct) == false || avgProduct <= 0.0 ||
        std::isfinite(focusMeanAbsZ) == false || focusMeanAbsZ <= 0.0 ||
        std::isfinite(candidateMeanAbsZ) == false || candidateMeanAbsZ <= 0.0) {
        return std::nullopt;
    }
    double expected{focusMeanAbsZ * candidateMeanAbsZ};
    if (std::isfinite(expected) == false || expected <= 0.0) {
        return std::nullopt;
    }
    return maths::CTools::truncate(avgProduct / expected, 0.0, 10.0);
}

bool CUnifiedRanker::isDiurnalLag(core_t::TTime lag) {
    if (lag == 0) {
        return false;
    }
    core_t::TTime magnitude{std::abs(lag)};
    core_t::TTime multiple{(magnitude + DIURNAL_LAG_SECONDS / 2) / DIURNAL_LAG_SECONDS};
    if (multiple <= 0) {
        return false;
    }
    return std::abs(magnitude - multiple * DIURNAL_LAG_SECONDS) <= DIURNAL_LAG_TOLERANCE;
}

double CUnifiedRanker::overlapAtK(const TStrVec& lhs, const TStrVec& rhs, std::size_t k) {
    k = std::max(k, std::size_t{1});
    TStrSet top(rhs.begin(), rhs.begin() + std::min(rhs.size(), k));
    std::size_t hits{0};
    for (std::size_t i = 0; i < std::min(lhs.size(), k); ++i) {
        hits += top.count(lhs[i]);
    }
    return static_cast<double>(hits) / static_cast<double>(k);
}

CUnifiedRanker::SPrefilter CUnifiedRanker::prefilter(const TStrVec& ordered,
                                                     std::size_t slots,
                                                     const TStrVec& alsoMeasure,
                                                     const SParams& params,
                                                     const CAnalysisContext& context) const {
    SPrefilter result;
    CBucketReader::SRequest request;
    request.s_Start = params.s_Start;
    request.s_End = params.s_End;
    request.s_Interval = params.s_Interval;

    request.s_SensorIds = alsoMeasure;
    CBucketReader::SResult measured{m_Reader.read(request)};
    for (const auto& id : alsoMeasure) {
        const SSeries* series{measured.series(id)};
        result.s_BucketsWithValues[id] = series != nullptr ? series->numberValues() : 0;
    }

    std::size_t next{0};
    while (next < ordered.size() && result.s_Accepted.size() < slots) {
        context.throwIfCanceled();
        std::size_t end{std::min(next + PREFILTER_BATCH_SIZE, ordered.size())};
        request.s_SensorIds.assign(ordered.begin() + next, ordered.begin() + end);
        CBucketReader::SResult batch{m_Reader.read(request)};
        for (/**/; next < end && result.s_Accepted.size() < slots; ++next) {
            const std::string& id{ordered[next]};
            const SSeries* series{batch.series(id)};
            std::size_t values{series != nullptr ? series->numberValues() : 0};
            std::size_t deltas{series != nullptr
                                   ? CEventMatcher::gapAwareDeltas(*series, params.s_Detector.s_GapMaxBuckets,
                                                                   analytics_t::E_Linear)
                                         .size()
                                   : 0};
            result.s_BucketsWithValues[id] = values;
            if (values >= MIN_COVERAGE_BUCKETS && deltas >= MIN_COVERAGE_DELTAS) {
                result.s_Accepted.push_back(id);
            } else {
                result.s_Prefiltered.push_back(id);
            }
        }
    }
    result.s_Truncated.assign(ordered.begin() + next, ordered.end());
    return result;
}

CUnifiedRanker::SStability CUnifiedRanker::stability(const SRunSettings& settings,
                                                     const TStrVec& mainTop,
                                                     std::size_t eligible,
                                                     const CAnalysisContext& context) const {
    SStability result;
    if (eligible > STABILITY_MAX_ELIGIBLE) {
        result.s_Reason = "Eligible pool too large (" + std::to_string(eligible) + " > " +
                          std::to_string(STABILITY_MAX_ELIGIBLE) + ")";
        return result;
    }
    core_t::TTime start{settings.s_Events.s_Start};
    core_t::TTime span{settings.s_Events.s_End - start};
    if (span <= 0) {
        result.s_Reason = "Invalid time window";
        return result;
    }
    core_t::TTime third{span / static_cast<core_t::TTime>(STABILITY_WINDOWS)};
    if (third < settings.s_Events.s_Interval) {
        result.s_Reason = "Window too small for stability split";
        return result;
    }

    CEventMatcher matcher{m_Registry, m_Reader};
    CCooccurrenceScorer scorer{m_Registry, m_Reader};
    for (std::size_t i = 0; i < STABILITY_WINDOWS; ++i) {
        context.throwIfCanceled();
        core_t::TTime windowStart{start + static_cast<core_t::TTime>(i) * third};
        core_t::TTime windowEnd{i + 1 == STABILITY_WINDOWS ? settings.s_Events.s_End : windowStart + third};

        CEventMatcher::SParams events{settings.s_Events};
        events.s_Start = windowStart;
        events.s_End = windowEnd;
        CCooccurrenceScorer::SParams cooccurrence{settings.s_Cooccurrence};
        cooccurrence.s_Start = windowStart;
        cooccurrence.s_End = windowEnd;

        CEventMatcher::SResult eventResult{matcher.compute(events, context)};
        CCooccurrenceScorer::SResult cooccurrenceResult{scorer.compute(cooccurrence, context)};
        if (settings.s_ExcludeSystemWideBuckets) {
            TTimeVec systemWide;
            systemWideBuckets(cooccurrenceResult, systemWide);
            removeBuckets(cooccurrenceResult, systemWide);
        }
        SMergeResult merged{merge(eventResult, cooccurrenceResult, settings.s_Merge)};
        TStrVec top;
        for (std::size_t j = 0; j < std::min(merged.s_Candidates.size(), STABILITY_TOP_K); ++j) {
            top.push_back(merged.s_Candidates[j].s_SensorId);
        }
        result.s_Overlaps.push_back(overlapAtK(mainTop, top, STABILITY_TOP_K));
    }

    double score{0.0};
    for (auto overlap : result.s_Overlaps) {
        score += overlap;
    }
    score = maths::CTools::truncate(score / static_cast<double>(result.s_Overlaps.size()), 0.0, 1.0);
    result.s_Status = E_Computed;
    result.s_Score = score;
    result.s_Tier = score >= 0.8 ? analytics_t::E_High
                                 : (score >= 0.5 ? analytics_t::E_Medium : analytics_t::E_Low);
    return result;
}

CUnifiedRanker::TSystemWideBucketVec
CUnifiedRanker::systemWideBuckets(const CCooccurrenceScorer::SResult& cooccurrence, TTimeVec& times) {
    auto totalSensors = static_cast<double>(
        std::max(cooccurrence.s_ParamsUsed.s_SensorIds.size(), std::size_t{1}));
    TSystemWideBucketVec result;
    for (const auto& bucket : cooccurrence.s_Buckets) {
        if (std::isfinite(bucket.s_SeveritySum) == false || bucket.s_SeveritySum <= 0.0) {
            continue;
        }
        std::size_t group{std::max(bucket.s_GroupSize, std::size_t{1})};
        if (group >= SYSTEM_WIDE_MIN_GROUP ||
            static_cast<double>(group) / totalSensors >= SYSTEM_WIDE_MIN_FRACTION) {
            times.push_back(bucket.s_Time);
            result.push_back({bucket.s_Time, bucket.s_GroupSize, bucket.s_SeveritySum});
        }
    }
    std::sort(result.begin(), result.end(), [](const SSystemWideBucket& lhs, const SSystemWideBucket& rhs) {
        return std::make_tuple(-lhs.s_SeveritySum, -static_cast<double>(lhs.s_GroupSize), -lhs.s_Time) <
               std::make_tuple(-rhs.s_SeveritySum, -static_cast<double>(rhs.s_GroupSize), -rhs.s_Time);
    });
    if (result.size() > MAX_SYSTEM_WIDE_BUCKETS) {
        result.resize(MAX_SYSTEM_WIDE_BUCKETS);
    }
    return result;
}

void CUnifiedRanker::removeBuckets(CCooccurrenceScorer::SResult& cooccurrence, const TTimeVec& times) {
    if (times.empty()) {
        return;
    }
    std::set<core_t::TTime> remove(times.begin(), times.end());
    auto& buckets = cooccurrence.s_Buckets;
    buckets.erase(std::remove_if(buckets.begin(), buckets.end(),
                                 [&remove](const CCooccurrenceScorer::SScoredBucket& bucket) {
                                     return remove.count(bucket.s_Time) > 0;
                                 }),
                  buckets.end());
}

std::string CUnifiedRanker::print(EMode mode) {
    return mode == E_Advanced ? "advanced" : "simple";
}

std::string CUnifiedRanker::print(ECooccurrenceMetric metric) {
    return metric == E_Surprise ? "surprise" : "avg_product";
}

std::string CUnifiedRanker::print(EEvidenceSource source) {
    switch (source) {
    case E_DeltaZ:
        return "delta_z";
    case E_Pattern:
        return "pattern";
    case E_Blend:
        return "blend";
    }
    return "delta_z";
}

std::string CUnifiedRanker::print(EStabilityStatus status) {
    return status == E_Computed ? "computed" : "skipped";
}

bool CUnifiedRanker::parse(const std::string& value, EMode& mode) {
    if (value == "simple") {
        mode = E_Simple;
        return true;
    }
    if (value == "advanced") {
        mode = E_Advanced;
        return true;
    }
    return false;
}

bool CUnifiedRanker::parse(const std::string& value, ECooccurrenceMetric& metric) {
    if (value == "avg_product") {
        metric = E_AvgProduct;
        return true;
    }
    if (value == "surprise") {
        metric = E_Surprise;
        return true;
    }
    return false;
}
}
}
