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
#include <analytics/CEventMatcher.h>

#include <core/CLogger.h>
#include <core/CLoopProgress.h>
#include <core/CStopWatch.h>
#include <core/CStringUtils.h>

#include <maths/CCorrelation.h>
#include <maths/CRobustStatistics.h>
#include <maths/CTools.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CBucketReader.h>
#include <analytics/CCorrelationMatrix.h>
#include <analytics/CSensorSemantics.h>
#include <analytics/CSeriesEmbedding.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tsse {
namespace analytics {
namespace {
const std::string LOAD_SERIES{"load_series"};
const std::string DETECT_EVENTS{"detect_events"};
const std::string MATCH_CANDIDATES{"match_candidates"};

double sumWeights(const TEventVec& events, double zCap) {
    double result{0.0};
    for (const auto& event : events) {
        double weight{CEventMatcher::weight(event, zCap)};
        if (weight > 0.0) {
            result += weight;
        }
    }
    return result;
}

TOptionalDouble weightedF1(double overlapSum, double focusSum, double candidateSum) {
    bool focusOk{std::isfinite(focusSum) && focusSum > 0.0};
    bool candidateOk{std::isfinite(candidateSum) && candidateSum > 0.0};
    if (focusOk == false && candidateOk == false) {
        return std::nullopt;
    }
    if (focusOk == false || candidateOk == false || overlapSum <= 0.0) {
        return 0.0;
    }
    return maths::CTools::truncate(2.0 * overlapSum / (focusSum + candidateSum), 0.0, 1.0);
}

CEventMatcher::SEventSet toEventSet(const CEventDetector::SResult& detected,
                                    CEventMatcher::TTimeDoublePrVec deltas) {
    CEventMatcher::SEventSet result;
    result.s_Events = CEventMatcher::sortedUnique(detected.s_Events);
    result.s_Deltas = std::move(deltas);
    result.s_UpEvents = detected.s_UpEvents;
    result.s_DownEvents = detected.s_DownEvents;
    result.s_Entropy = detected.s_Entropy;
    return result;
}
}

CEventMatcher::CEventMatcher(const CSensorRegistry& registry, const CBucketReader& reader)
    : m_Registry{registry}, m_Reader{reader} {
}

CEventMatcher::SResult CEventMatcher::compute(const SParams& params_,
                                              const CAnalysisContext& context) const {
    core::CStopWatch total{true};

    SResult result;
    SParams params{params_};
    clamp(params);
    result.s_FocusSensorId = params.s_FocusSensorId;

    params.s_Interval = CCorrelationMatrix::widenInterval(params.s_Start, params.s_End,
                                                          params.s_Interval, params.s_MaxBuckets);
    params.s_Detector.s_Interval = params.s_Interval;
    result.s_Interval = params.s_Interval;
    result.s_BucketCount = CBucketReader::numberBuckets(params.s_Start, params.s_End, params.s_Interval);

    const SSensorInfo* focusInfo{m_Registry.sensor(params.s_FocusSensorId)};
    TStrVec candidateIds{core::CStringUtils::normaliseIds(params.s_CandidateSensorIds)};
    candidateIds.erase(std::remove(candidateIds.begin(), candidateIds.end(), params.s_FocusSensorId),
                       candidateIds.end());
    if (candidateIds.empty() && focusInfo != nullptr) {
        candidateIds = m_Registry.candidates(*focusInfo, params.s_Filters);
    }
    if (candidateIds.size() > params.s_CandidateLimit) {
        result.s_TruncatedSensorIds.assign(candidateIds.begin() + params.s_CandidateLimit,
                                           candidateIds.end());
        candidateIds.resize(params.s_CandidateLimit);
    }
    LOG_DEBUG(<< "Matching " << candidateIds.size() << " candidates against "
              << params.s_FocusSensorId << " at interval " << params.s_Interval);

    context.progress(LOAD_SERIES, 0, candidateIds.size() + 1, "Loading bucketed series");
    context.throwIfCanceled();

    core::CStopWatch load{true};
    CBucketReader::SRequest request;
    request.s_SensorIds.push_back(params.s_FocusSensorId);
    request.s_SensorIds.insert(request.s_SensorIds.end(), candidateIds.begin(), candidateIds.end());
    request.s_Start = params.s_Start;
    request.s_End = params.s_End;
    request.s_Interval = params.s_Interval;
    CBucketReader::SResult read{m_Reader.read(request)};
    std::uint64_t loadMs{load.stop()};
    context.phaseTiming(LOAD_SERIES, loadMs);
    result.s_Skipped = read.s_Skipped;

    auto deltaMode = [this](const std::string& id) {
        const SSensorInfo* info{m_Registry.sensor(id)};
        return info != nullptr ? CSensorSemantics::infer(info->s_Type, info->s_Unit).s_DeltaMode
                               : analytics_t::E_Linear;
    };

    CEventDetector detector{params.s_Detector};
    auto prepare = [&](const SSeries& series) {
        if (CEventDetector::deseasons(params.s_Detector, series)) {
            return CEventDetector::deseasonHourOfDay(series);
        }
        return series;
    };

    core::CStopWatch detect{true};
    context.progress(DETECT_EVENTS, 0, candidateIds.size() + 1, "Detecting events");

    SSeries emptyFocus;
    emptyFocus.s_SensorId = params.s_FocusSensorId;
    emptyFocus.s_Interval = params.s_Interval;
    const SSeries* focusSeries{read.series(params.s_FocusSensorId)};
    if (focusSeries == nullptr) {
        focusSeries = &emptyFocus;
        result.s_Warnings.push_back("focus sensor " + params.s_FocusSensorId + " has no data");
    }
    analytics_t::EDeltaMode focusDeltaMode{deltaMode(params.s_FocusSensorId)};
    CEventDetector::SResult focusDetected{detector.detect(*focusSeries, focusDeltaMode)};
    result.s_GapSkippedDeltas[params.s_FocusSensorId] = focusDetected.s_GapSkippedDeltas;
    SEventSet focus{toEventSet(focusDetected, gapAwareDeltas(prepare(*focusSeries),
                                                             params.s_Detector.s_GapMaxBuckets,
                                                             focusDeltaMode))};

    SMatchOptions options;
    options.s_Interval = params.s_Interval;
    options.s_MaxLagBuckets = params.s_MaxLagBuckets;
    options.s_TopKLags = params.s_TopKLags;
    options.s_ToleranceBuckets = params.s_ToleranceBuckets;
    options.s_MinOverlap = params.s_MinOverlap;
    options.s_MaxEpisodes = params.s_MaxEpisodes;
    options.s_EpisodeGapBuckets = params.s_EpisodeGapBuckets;
    options.s_ZCap = params.s_ZCap;
    if (params.s_FocusEvents.empty() == false) {
        TEventVec explicitEvents{explicitFocusEvents(params.s_FocusEvents, params.s_Start,
                                                     params.s_End, params.s_Detector.s_MaxEvents)};
        if (explicitEvents.empty() == false) {
            focus.s_Events = std::move(explicitEvents);
            options.s_FocusEventsExplicit = true;
        }
    }

    std::vector<std::pair<const SSeries*, SEventSet>> candidates;
    std::vector<CEventDetector::SResult> detections{focusDetected};
    for (std::size_t i = 0; i < candidateIds.size(); ++i) {
        context.throwIfCanceled();
        const SSeries* series{read.series(candidateIds[i])};
        if (series == nullptr) {
            continue;
        }
        analytics_t::EDeltaMode mode{deltaMode(candidateIds[i])};
        CEventDetector::SResult detected{detector.detect(*series, mode)};
        result.s_GapSkippedDeltas[candidateIds[i]] = detected.s_GapSkippedDeltas;
        candidates.emplace_back(series, toEventSet(detected, gapAwareDeltas(prepare(*series),
                                                                            params.s_Detector.s_GapMaxBuckets,
                                                                            mode)));
        detections.push_back(std::move(detected));
        context.progress(DETECT_EVENTS, i + 2, candidateIds.size() + 1);
    }
    std::uint64_t detectMs{detect.stop()};
    context.phaseTiming(DETECT_EVENTS, detectMs);

    SMonitoring& monitoring{result.s_Monitoring};
    monitoring.s_ZCap = params.s_ZCap;
    TDoubleVec peaks;
    for (const auto& detected : detections) {
        monitoring.s_DeltaPointsTotal += detected.s_PointsTotal;
        monitoring.s_GapSkippedDeltasTotal += detected.s_GapSkippedDeltas;
        monitoring.s_EventsTotal += detected.s_Events.size();
        for (const auto& event : detected.s_Events) {
            if (std::isfinite(event.s_Z) && std::fabs(event.s_Z) > params.s_ZCap) {
                ++monitoring.s_ZClippedEvents;
            }
        }
        if (detected.s_PeakAbsZ != std::nullopt && std::isfinite(*detected.s_PeakAbsZ)) {
            peaks.push_back(std::max(*detected.s_PeakAbsZ, 0.0));
        }
    }
    std::sort(peaks.begin(), peaks.end());
    monitoring.s_PeakAbsZP50 = maths::CRobustStatistics::quantileSorted(peaks, 0.50);
    monitoring.s_PeakAbsZP90 = maths::CRobustStatistics::quantileSorted(peaks, 0.90);
    monitoring.s_PeakAbsZP95 = maths::CRobustStatistics::quantileSorted(peaks, 0.95);
    monitoring.s_PeakAbsZP99 = maths::CRobustStatistics::quantileSorted(peaks, 0.99);
    monitoring.s_ZClippedFraction = static_cast<double>(monitoring.s_ZClippedEvents) /
                                    static_cast<double>(std::max(monitoring.s_EventsTotal, std::size_t{1}));
    monitoring.s_GapSkippedFraction =
        static_cast<double>(monitoring.s_GapSkippedDeltasTotal) /
        static_cast<double>(std::max(monitoring.s_DeltaPointsTotal + monitoring.s_GapSkippedDeltasTotal,
                                     std::size_t{1}));

    core::CStopWatch scoring{true};
    CSeriesEmbedding::TOptionalDoubleVec focusEmbedding{CSeriesEmbedding::compute(*focusSeries)};
    core::CLoopProgress progress{context.loopProgress(MATCH_CANDIDATES, candidates.size(),
                                                      "Scoring event matches")};
    for (auto& candidate : candidates) {
        context.throwIfCanceled();
        SCandidate scored{match(focus, candidate.second, options)};
        scored.s_SensorId = candidate.first->s_SensorId;
        if (focusEmbedding != std::nullopt) {
            auto embedding = CSeriesEmbedding::compute(*candidate.first);
            if (embedding != std::nullopt) {
                scored.s_EmbeddingCosine = CSeriesEmbedding::cosineSimilarity(*focusEmbedding, *embedding);
            }
        }
        if (params.s_PeriodicPenalty && candidate.second.s_Entropy != std::nullopt) {
            double weight{candidate.second.s_Entropy->s_Weight};
            scored.s_EntropyNorm = candidate.second.s_Entropy->s_HNorm;
            scored.s_EntropyWeight = weight;
            if (weight > 0.0 && weight < 1.0) {
                for (auto& episode : scored.s_Episodes) {
                    episode.s_ScoreMean *= weight;
                    episode.s_ScorePeak *= weight;
                }
            }
        }
        result.s_Candidates.push_back(std::move(scored));
        progress.increment();
    }

    std::sort(result.s_Candidates.begin(), result.s_Candidates.end(),
              [](const SCandidate& lhs, const SCandidate& rhs) {
                  double lscore{lhs.s_Score.value_or(0.0)};
                  double rscore{rhs.s_Score.value_or(0.0)};
                  if (lscore != rscore) {
                      return lscore > rscore;
                  }
                  if (lhs.s_Overlap != rhs.s_Overlap) {
                      return lhs.s_Overlap > rhs.s_Overlap;
                  }
                  return lhs.s_SensorId < rhs.s_SensorId;
              });
    for (std::size_t i = 0; i < result.s_Candidates.size(); ++i) {
        result.s_Candidates[i].s_Rank = i + 1;
    }
    std::uint64_t scoringMs{scoring.stop()};
    context.phaseTiming(MATCH_CANDIDATES, scoringMs);
    LOG_DEBUG(<< "Scored " << result.s_Candidates.size() << " candidates in " << scoringMs << "ms");

    result.s_ParamsUsed = params;
    result.s_Timings.push_back({"load_ms", loadMs});
    result.s_Timings.push_back({"detect_events_ms", detectMs});
    result.s_Timings.push_back({"scoring_ms", scoringMs});
    result.s_Timings.push_back({"job_total_ms", total.stop()});
    return result;
}

CEventMatcher::SCandidate CEventMatcher::match(const SEventSet& focus,
                                               const SEventSet& candidate,
                                               const SMatchOptions& options) {
    core_t::TTime interval{std::max(options.s_Interval, core_t::TTime{1})};
    core_t::TTime tolerance{static_cast<core_t::TTime>(options.s_ToleranceBuckets) * interval};
    auto maxLag = static_cast<core_t::TTime>(options.s_MaxLagBuckets);

    SCandidate result;
    result.s_NumberFocus = focus.s_Events.size();
    result.s_NumberCandidate = candidate.s_Events.size();
    if (options.s_FocusEventsExplicit == false) {
        result.s_FocusUpEvents = focus.s_UpEvents;
        result.s_FocusDownEvents = focus.s_DownEvents;
    }
    result.s_CandidateUpEvents = candidate.s_UpEvents;
    result.s_CandidateDownEvents = candidate.s_DownEvents;
    result.s_FocusWeightSum = sumWeights(focus.s_Events, options.s_ZCap);
    result.s_CandidateWeightSum = sumWeights(candidate.s_Events, options.s_ZCap);

    TLagScoreVec scores;
    for (core_t::TTime lag = -maxLag; lag <= maxLag; ++lag) {
        scores.push_back(scoreLag(focus.s_Events, candidate.s_Events, lag * interval,
                                  tolerance, options.s_ZCap, options.s_MinOverlap));
    }
    result.s_ZeroLag = scores[static_cast<std::size_t>(maxLag)];
    std::stable_sort(scores.begin(), scores.end(), betterLag);

    if (maxLag > 0) {
        if (scores.front().s_Valid) {
            result.s_BestLag = scores.front();
        }
    }
    for (std::size_t i = 0; i < std::min(options.s_TopKLags, scores.size()); ++i) {
        result.s_TopLags.push_back(scores[i]);
    }

    const SLagScore& chosen{result.s_BestLag ? *result.s_BestLag : result.s_ZeroLag};
    result.s_Score = chosen.s_Valid ? chosen.s_Score
                                    : (chosen.s_Score != std::nullopt ? TOptionalDouble{0.0}
                                                                      : std::nullopt);
    result.s_Overlap = chosen.s_Overlap;
    core_t::TTime bestLag{result.s_BestLag ? result.s_BestLag->s_LagSeconds : 0};

    TSizeSizePrVec pairs{matchedPairs(focus.s_Events, candidate.s_Events, bestLag, tolerance)};
    TEventVec matchedFocus;
    std::size_t same{0};
    for (const auto& pair : pairs) {
        const SEvent& f{focus.s_Events[pair.first]};
        const SEvent& c{candidate.s_Events[pair.second]};
        matchedFocus.push_back(f);
        if (f.s_Direction == c.s_Direction) {
            ++same;
        }
        double wf{weight(f, options.s_ZCap)};
        double wc{weight(c, options.s_ZCap)};
        if (wf > 0.0 && wc > 0.0) {
            result.s_OverlapWeightedSum += std::min(wf, wc);
        }
    }
    result.s_OverlapWeighted = pairs.size();
    result.s_DirectionN = pairs.size();
    if (options.s_FocusEventsExplicit == false && pairs.empty() == false) {
        result.s_SignAgreement = static_cast<double>(same) / static_cast<double>(pairs.size());
    }
    result.s_DeltaCorrelation = alignedDeltaCorrelation(focus.s_Deltas, candidate.s_Deltas,
                                                        bestLag, MIN_DELTA_PAIRS);
    result.s_Direction = directionLabel(pairs.size(), result.s_DeltaCorrelation,
                                        result.s_SignAgreement);
    result.s_Episodes = episodes(std::move(matchedFocus), bestLag, interval,
                                 options.s_EpisodeGapBuckets, options.s_MaxEpisodes,
                                 options.s_ZCap, result.s_NumberFocus);
    return result;
}

CEventMatcher::TSizeSizePrVec CEventMatcher::matchedPairs(const TEventVec& focus,
                                                          const TEventVec& candidate,
                                                          core_t::TTime lag,
                                                          core_t::TTime tolerance) {
    TSizeSizePrVec result;
    if (focus.empty() || candidate.empty()) {
        return result;
    }
    tolerance = std::max(tolerance, core_t::TTime{0});

    std::vector<bool> used(candidate.size(), false);
    auto earliest = candidate.begin();
    for (std::size_t i = 0; i < focus.size(); ++i) {
        core_t::TTime target{focus[i].s_Time + lag};
        earliest = std::lower_bound(earliest, candidate.end(), target - tolerance,
                                    [](const SEvent& event, core_t::TTime time) {
                                        return event.s_Time < time;
                                    });
        std::size_t best{candidate.size()};
        core_t::TTime bestOffset{std::numeric_limits<core_t::TTime>::max()};
        for (auto j = earliest; j != candidate.end() && j->s_Time <= target + tolerance; ++j) {
            auto index = static_cast<std::size_t>(j - candidate.begin());
            core_t::TTime offset{std::abs(j->s_Time - target)};
            if (used[index] == false && offset < bestOffset) {
                best = index;
                bestOffset = offset;
            }
        }
        if (best < candidate.size()) {
            used[best] = true;
            result.emplace_back(i, best);
        }
    }
    return result;
}

CEventMatcher::SLagScore CEventMatcher::scoreLag(const TEventVec& focus,
                                                 const TEventVec& candidate,
                                                 core_t::TTime lag,
                                                 core_t::TTime tolerance,
                                                 double zCap,
                                                 std::size_t minOverlap) {
    SLagScore result;
    result.s_LagSeconds = lag;
    result.s_NumberCandidate = candidate.size();

    double overlapSum{0.0};
    for (const auto& pair : matchedPairs(focus, candidate, lag, tolerance)) {
        const SEvent& f{focus[pair.first]};
        const SEvent& c{candidate[pair.second]};
        ++result.s_Overlap;
        result.s_AlignmentError += static_cast<double>(std::abs(c.s_Time - f.s_Time - lag));
        double wf{weight(f, zCap)};
        double wc{weight(c, zCap)};
        if (wf > 0.0 && wc > 0.0) {
            overlapSum += std::min(wf, wc);
        }
    }
    result.s_Score = weightedF1(overlapSum, sumWeights(focus, zCap), sumWeights(candidate, zCap));
    result.s_Valid = result.s_Overlap >= std::max(minOverlap, std::size_t{1});
    return result;
}

bool CEventMatcher::betterLag(const SLagScore& lhs, const SLagScore& rhs) {
    if (lhs.s_Valid != rhs.s_Valid) {
        return lhs.s_Valid;
    }
    double lscore{lhs.s_Score.value_or(-1.0)};
    double rscore{rhs.s_Score.value_or(-1.0)};
    if (lscore != rscore) {
        return lscore > rscore;
    }
    if (lhs.s_Overlap != rhs.s_Overlap) {
        return lhs.s_Overlap > rhs.s_Overlap;
    }
    if (lhs.s_AlignmentError != rhs.s_AlignmentError) {
        return lhs.s_AlignmentError < rhs.s_AlignmentError;
    }
    core_t::TTime lhsAbs{std::abs(lhs.s_LagSeconds)};
    core_t::TTime rhsAbs{std::abs(rhs.s_LagSeconds)};
    if (lhsAbs != rhsAbs) {
        return lhsAbs < rhsAbs;
    }
    return lhs.s_LagSeconds < rhs.s_LagSeconds;
}

TEpisodeVec CEventMatcher::episodes(TEventVec matchedFocus,
                                    core_t::TTime lag,
                                    core_t::TTime interval,
                                    std::size_t gapBuckets,
                                    std::size_t maxEpisodes,
                                    double zCap,
                                    std::size_t focusTotal) {
    TEpisodeVec result;
    if (matchedFocus.empty()) {
        return result;
    }
    interval = std::max(interval, core_t::TTime{1});
    core_t::TTime gap{static_cast<core_t::TTime>(std::max(gapBuckets, std::size_t{1})) * interval};
    std::stable_sort(matchedFocus.begin(), matchedFocus.end(),
                     [](const SEvent& lhs, const SEvent& rhs) {
                         return lhs.s_Time < rhs.s_Time;
                     });

    auto close = [&](core_t::TTime start, core_t::TTime end, std::size_t count,
                     double sum, double peak) {
        SEpisode episode;
        episode.s_StartTime = start;
        episode.s_EndTime = end > start ? end : start + interval;
        episode.s_LagSeconds = lag;
        episode.s_NumPoints = count;
        episode.s_ScoreMean = sum / static_cast<double>(count);
        episode.s_ScorePeak = peak;
        episode.s_Coverage = focusTotal > 0 ? static_cast<double>(count) /
                                                  static_cast<double>(focusTotal)
                                            : 0.0;
        result.push_back(episode);
    };

    core_t::TTime start{matchedFocus[0].s_Time};
    core_t::TTime end{start};
    double z{weight(matchedFocus[0], zCap)};
    double sum{z};
    double peak{z};
    std::size_t count{1};
    for (std::size_t i = 1; i < matchedFocus.size(); ++i) {
        z = weight(matchedFocus[i], zCap);
        if (matchedFocus[i].s_Time - end > gap) {
            close(start, end, count, sum, peak);
            start = end = matchedFocus[i].s_Time;
            sum = peak = z;
            count = 1;
        } else {
            end = matchedFocus[i].s_Time;
            sum += z;
            peak = std::max(peak, z);
            ++count;
        }
    }
    close(start, end, count, sum, peak);

    std::stable_sort(result.begin(), result.end(), [](const SEpisode& lhs, const SEpisode& rhs) {
        return lhs.s_ScorePeak > rhs.s_ScorePeak;
    });
    if (result.size() > maxEpisodes) {
        result.resize(maxEpisodes);
    }
    return result;
}

CEventMatcher::EDirectionLabel
CEventMatcher::directionLabel(std::size_t matchedPairs,
                              const TOptionalDouble& deltaCorrelation,
                              const TOptionalDouble& signAgreement) {
    if (matchedPairs < MIN_DIRECTION_PAIRS) {
        return E_Unknown;
    }
    if (deltaCorrelation != std::nullopt) {
        return *deltaCorrelation >= 0.0 ? E_Same : E_Opposite;
    }
    if (signAgreement != std::nullopt) {
        return *signAgreement >= 0.5 ? E_Same : E_Opposite;
    }
    return E_Unknown;
}

CEventMatcher::TTimeDoublePrVec CEventMatcher::gapAwareDeltas(const SSeries& series,
                                                              std::size_t gapMaxBuckets,
                                                              analytics_t::EDeltaMode mode) {
    TTimeDoublePrVec result;
    auto points = series.points();
    if (points.size() < 2) {
        return result;
    }
    core_t::TTime interval{std::max(series.s_Interval, core_t::TTime{1})};
    core_t::TTime gap{gapMaxBuckets > 0 ? static_cast<core_t::TTime>(gapMaxBuckets) * interval
                                        : std::numeric_limits<core_t::TTime>::max()};
    for (std::size_t i = 1; i < points.size(); ++i) {
        if (points[i].first - points[i - 1].first > gap) {
            continue;
        }
        double delta{CSensorSemantics::delta(points[i - 1].second, points[i].second, mode)};
        if (std::isfinite(delta)) {
            result.emplace_back(points[i].first, delta);
        }
    }
    return result;
}

TOptionalDouble CEventMatcher::alignedDeltaCorrelation(const TTimeDoublePrVec& focus,
                                                       const TTimeDoublePrVec& candidate,
                                                       core_t::TTime lag,
                                                       std::size_t minPairs) {
    TDoubleVec x;
    TDoubleVec y;
    std::size_t i{0};
    std::size_t j{0};
    while (i < focus.size() && j < candidate.size()) {
        core_t::TTime target{focus[i].first + lag};
        if (candidate[j].first < target) {
            ++j;
        } else if (candidate[j].first > target) {
            ++i;
        } else {
            x.push_back(focus[i++].second);
            y.push_back(candidate[j++].second);
        }
    }
    if (x.size() < minPairs) {
        return std::nullopt;
    }
    return maths::CCorrelation::pearson(x, y);
}

TEventVec CEventMatcher::explicitFocusEvents(const TFocusEventVec& events,
                                             core_t::TTime start,
                                             core_t::TTime end,
                                             std::size_t maxEvents) {
    TEventVec result;
    for (const auto& event : events) {
        if (event.s_Time < start || event.s_Time >= end) {
            continue;
        }
        double z{event.s_Severity ? std::fabs(*event.s_Severity) : 1.0};
        if (std::isfinite(z) == false || z <= 0.0) {
            z = 1.0;
        }
        SEvent point;
        point.s_Time = event.s_Time;
        point.s_Z = z;
        point.s_Direction = analytics_t::E_Up;
        result.push_back(point);
    }

    // Keep the most severe event at each time.
    std::sort(result.begin(), result.end(), [](const SEvent& lhs, const SEvent& rhs) {
        return lhs.s_Time != rhs.s_Time ? lhs.s_Time < rhs.s_Time : lhs.s_Z > rhs.s_Z;
    });
    result = sortedUnique(std::move(result));

    if (maxEvents > 0 && result.size() > maxEvents) {
        std::sort(result.begin(), result.end(), [](const SEvent& lhs, const SEvent& rhs) {
            return lhs.s_Z != rhs.s_Z ? lhs.s_Z > rhs.s_Z : lhs.s_Time < rhs.s_Time;
        });
        result.resize(maxEvents);
        std::sort(result.begin(), result.end(), [](const SEvent& lhs, const SEvent& rhs) {
            return lhs.s_Time < rhs.s_Time;
        });
    }
    return result;
}

double CEventMatcher::weight(const SEvent& event, double zCap) {
    if (std::isfinite(event.s_Z) == false) {
        return 0.0;
    }
    double z{std::fabs(event.s_Z)};
    return std::isfinite(zCap) && zCap > 0.0 ? std::min(z, zCap) : z;
}

TEventVec CEventMatcher::sortedUnique(TEventVec events) {
    std::stable_sort(events.begin(), events.end(), [](const SEvent& lhs, const SEvent& rhs) {
        return lhs.s_Time < rhs.s_Time;
    });
    events.erase(std::unique(events.begin(), events.end(),
                             [](const SEvent& lhs, const SEvent& rhs) {
                                 return lhs.s_Time == rhs.s_Time;
                             }),
                 events.end());
    return events;
}

void CEventMatcher::clamp(SParams& params) {
    params.s_Interval = std::max(params.s_Interval, core_t::TTime{1});
    params.s_MaxBuckets = std::min(std::max(params.s_MaxBuckets, MIN_BUCKETS), MAX_BUCKETS);
    params.s_MaxLagBuckets = std::min(params.s_MaxLagBuckets, MAX_LAG_BUCKETS);
    params.s_TopKLags = std::min(params.s_TopKLags, MAX_TOP_K_LAGS);
    params.s_MinOverlap = std::max(params.s_MinOverlap, std::size_t{1});
    params.s_MaxEpisodes = std::min(std::max(params.s_MaxEpisodes, std::size_t{1}), MAX_EPISODES);
    params.s_EpisodeGapBuckets = std::max(params.s_EpisodeGapBuckets, std::size_t{1});
    params.s_CandidateLimit = std::min(std::max(params.s_CandidateLimit, MIN_CANDIDATE_LIMIT),
                                       MAX_CANDIDATE_LIMIT);
    params.s_ZCap = maths::CTools::truncate(params.s_ZCap, MIN_Z_CAP, MAX_Z_CAP);
    params.s_Detector.s_MaxEvents = std::min(std::max(params.s_Detector.s_MaxEvents,
                                                      CEventDetector::MIN_MAX_EVENTS),
                                             CEventDetector::MAX_MAX_EVENTS);
    params.s_Detector.s_ZThreshold = std::max(params.s_Detector.s_ZThreshold, 0.1);
}

std::string CEventMatcher::print(EDirectionLabel label) {
    switch (label) {
    case E_Same:
        return "same";
    case E_Opposite:
        return "opposite";
    case E_Unknown:
        return "unknown";
    }
    return "unknown";
}
}
}
