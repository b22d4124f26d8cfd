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
#ifndef INCLUDED_tsse_analytics_CUnifiedRanker_h
#define INCLUDED_tsse_analytics_CUnifiedRanker_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>
#include <analytics/CCooccurrenceScorer.h>
#include <analytics/CEventDetector.h>
#include <analytics/CEventMatcher.h>
#include <analytics/CSensorRegistry.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsse {
namespace analytics {
class CAnalysisContext;
class CBucketReader;

//! \brief Ranks the sensors related to a focus sensor by blending event
//! alignment and co-occurrence evidence.
//!
//! DESCRIPTION:\n
//! A run builds a candidate pool, either from an explicit list or from the
//! registry filters, and orders it deterministically: by priority group
//! (same node, same unit, same type, other) then by a hash of the id seeded
//! from the job key and focus.  Ordering by hash rather than by id means a
//! truncated pool isn't biased against ids which sort late.  Pinned sensors
//! always come first and the limit is widened to fit them.  The remaining
//! slots are filled with candidates which pass a coverage prefilter and
//! everything else is disclosed as prefiltered or truncated.
//!
//! The event matcher and co-occurrence scorer are then run over the pool
//! and their evidence merged per candidate.  Each component is normalised
//! by its maximum over the pool and blended with weights which are
//! renormalised over the enabled components.  The blended score is relative
//! to the pool and is not a probability.  The confidence tier is a coarse
//! bucketing of it which additionally requires corroborating evidence.
//!
//! Candidates computed from the focus, directly or through other derived
//! sensors, are found by a bounded breadth first walk of the derivation
//! graph.  In simple mode they are removed from the ranking and reported
//! as skipped with their dependency path.  Advanced mode keeps them with a
//! label.
//!
//! IMPLEMENTATION DECISIONS:\n
//! A best lag within DIURNAL_LAG_TOLERANCE of a non-zero multiple of a day
//! usually reflects a shared daily cycle.  Such candidates have their event
//! score scaled by DIURNAL_LAG_PENALTY and never get the multi-episode
//! bonus.
class CUnifiedRanker {
public:
    enum EMode { E_Simple, E_Advanced };
    enum ECooccurrenceMetric { E_AvgProduct, E_Surprise };
    enum EEvidenceSource { E_DeltaZ, E_Pattern, E_Blend };
    enum EStabilityStatus { E_Computed, E_Skipped };

    using TStrStrVecMap = std::map<std::string, TStrVec>;
    using TStrSizeMap = std::map<std::string, std::size_t>;
    using TOptionalSize = std::optional<std::size_t>;
    using TOptionalBool = std::optional<bool>;

    //! \brief The weights of the blended score components.
    struct SWeights {
        double s_Events = 0.6;
        double s_Cooccurrence = 0.4;
        //! Only set if the delta correlation component is enabled.
        TOptionalDouble s_DeltaCorrelation;
    };
    using TOptionalWeights = std::optional<SWeights>;

    //! \brief The parameters of a run.  Unset optionals take defaults which
    //! depend on the mode and on quick suggest.
    struct SParams {
        std::string s_FocusSensorId;
        core_t::TTime s_Start = 0;
        core_t::TTime s_End = 0;
        core_t::TTime s_Interval = 60;
        std::string s_JobKey;
        EMode s_Mode = E_Simple;
        TStrVec s_CandidateSensorIds;
        TStrVec s_PinnedSensorIds;
        SCandidateFilters s_Filters;
        bool s_EvaluateAllEligible = false;
        TOptionalSize s_CandidateLimit;
        TOptionalSize s_MaxResults;
        TOptionalBool s_IncludeLowConfidence;
        bool s_QuickSuggest = false;
        bool s_StabilityEnabled = false;
        bool s_ExcludeSystemWideBuckets = false;
        TOptionalWeights s_Weights;
        //! The detector settings other than the threshold and event limit.
        CEventDetector::SOptions s_Detector;
        TOptionalDouble s_ZThreshold;
        TOptionalSize s_MaxEvents;
        TOptionalSize s_MaxLagBuckets;
        TOptionalSize s_MaxEpisodes;
        TOptionalSize s_ToleranceBuckets;
        std::size_t s_EpisodeGapBuckets = 6;
        std::size_t s_MinSensors = 2;
        double s_ZCap = 15.0;
        TOptionalBool s_IncludeDeltaCorrelation;
        TOptionalBool s_PeriodicPenalty;
        ECooccurrenceMetric s_CooccurrenceMetric = E_AvgProduct;
        CCooccurrenceScorer::EBucketPreference s_BucketPreference =
            CCooccurrenceScorer::E_PreferSpecific;
        CEventMatcher::TFocusEventVec s_FocusEvents;
    };

    //! \brief The evidence behind a ranked candidate.
    struct SEvidence {
        TOptionalDouble s_EventsScore;
        TOptionalDouble s_CooccurrenceScore;
        TOptionalDouble s_CooccurrenceAvg;
        TOptionalDouble s_CooccurrenceSurprise;
        TOptionalDouble s_CooccurrenceStrength;
        std::optional<std::size_t> s_EventsOverlap;
        std::optional<std::size_t> s_NumberFocus;
        std::optional<std::size_t> s_NumberCandidate;
        std::optional<std::size_t> s_FocusUpEvents;
        std::optional<std::size_t> s_FocusDownEvents;
        std::optional<std::size_t> s_CandidateUpEvents;
        std::optional<std::size_t> s_CandidateDownEvents;
        std::optional<std::size_t> s_CooccurrenceCount;
        TOptionalDouble s_FocusBucketCoveragePct;
        TOptionalDouble s_CandidateBucketCoveragePct;
        std::optional<core_t::TTime> s_BestLagSeconds;
        CEventMatcher::TLagScoreVec s_TopLags;
        std::optional<CEventMatcher::EDirectionLabel> s_Direction;
        TOptionalDouble s_SignAgreement;
        TOptionalDouble s_DeltaCorrelation;
        std::optional<std::size_t> s_DirectionN;
        TOptionalDouble s_EntropyNorm;
        TOptionalDouble s_EntropyWeight;
        bool s_DiurnalLag = false;
        bool s_MultiEpisodeBonus = false;
        TStrVec s_Summary;
    };

    //! \brief A ranked candidate.
    struct SCandidate {
        std::string s_SensorId;
        bool s_DerivedFromFocus = false;
        //! From the candidate to the focus, when derived from it.
        TStrVec s_DerivedDependencyPath;
        std::size_t s_Rank = 0;
        double s_BlendedScore = 0.0;
        analytics_t::EConfidence s_Confidence = analytics_t::E_Low;
        TEpisodeVec s_Episodes;
        //! The most recent shared co-occurrence buckets, newest first.
        TTimeVec s_TopBucketTimes;
        SEvidence s_Evidence;
    };
    using TCandidateVec = std::vector<SCandidate>;

    //! \brief The limits a run actually used.
    struct SLimits {
        std::size_t s_CandidateLimitUsed = 0;
        std::size_t s_MaxResultsUsed = 0;
        std::size_t s_MaxSensorsUsed = 0;
    };

    //! \brief A co-occurrence bucket involving a large part of the pool.
    struct SSystemWideBucket {
        core_t::TTime s_Time = 0;
        std::size_t s_GroupSize = 0;
        double s_SeveritySum = 0.0;
    };
    using TSystemWideBucketVec = std::vector<SSystemWideBucket>;

    //! \brief How stable the top of the ranking is across sub-windows.
    struct SStability {
        EStabilityStatus s_Status = E_Skipped;
        std::size_t s_K = STABILITY_TOP_K;
        std::size_t s_WindowCount = STABILITY_WINDOWS;
        TOptionalDouble s_Score;
        std::optional<analytics_t::EConfidence> s_Tier;
        TDoubleVec s_Overlaps;
        std::string s_Reason;
    };

    //! \brief The settings of merging the evidence.
    struct SMergeOptions {
        std::string s_FocusSensorId;
        SWeights s_Weights;
        ECooccurrenceMetric s_Metric = E_AvgProduct;
        bool s_IncludeLow = false;
        std::size_t s_MaxResults = 60;
        double s_ZCap = 15.0;
        TStrStrVecMap s_DerivedPaths;
        //! Remove candidates derived from the focus from the ranking.
        bool s_ExcludeDerived = true;
    };

    //! \brief The merged ranking.
    struct SMergeResult {
        TCandidateVec s_Candidates;
        TStrVec s_TruncatedSensorIds;
        //! The candidates derived from the focus which were removed.
        TCandidateVec s_ExcludedDerived;
        std::size_t s_CooccurrenceSensors = 0;
    };

    //! \brief The result of a run.
    struct SResult {
        std::string s_FocusSensorId;
        EEvidenceSource s_EvidenceSource = E_DeltaZ;
        core_t::TTime s_Interval = 0;
        std::size_t s_BucketCount = 0;
        SParams s_ParamsUsed;
        SLimits s_Limits;
        TCandidateVec s_Candidates;
        TSkippedVec s_Skipped;
        TSystemWideBucketVec s_SystemWideBuckets;
        TStrVec s_PrefilteredSensorIds;
        TStrVec s_TruncatedSensorIds;
        TStrVec s_TruncatedResultSensorIds;
        TStrStrVecMap s_DerivedDependencyPaths;
        TStrSizeMap s_Counts;
        TPhaseTimingVec s_Timings;
        std::optional<CEventMatcher::SMonitoring> s_Monitoring;
        std::optional<SStability> s_Stability;
        TStrSizeMap s_GapSkippedDeltas;
        TStrVec s_Warnings;
    };

public:
    static constexpr std::size_t MIN_CANDIDATE_LIMIT{10};
    static constexpr std::size_t MAX_CANDIDATE_LIMIT{1000};
    static constexpr std::size_t SIMPLE_CANDIDATE_LIMIT{300};
    static constexpr std::size_t MIN_MAX_RESULTS{5};
    static constexpr std::size_t MAX_MAX_RESULTS{300};
    static constexpr std::size_t MAX_SENSORS_USED{10000};
    static constexpr std::size_t MAX_DERIVED_DEPTH{10};
    static constexpr std::size_t MAX_DERIVED_PATH_LENGTH{8};
    static constexpr std::size_t MAX_DERIVED_VISITED{5000};
    static constexpr std::size_t MIN_COVERAGE_BUCKETS{3};
    static constexpr std::size_t MIN_COVERAGE_DELTAS{3};
    static constexpr std::size_t PREFILTER_BATCH_SIZE{250};
    static constexpr std::size_t STABILITY_TOP_K{10};
    static constexpr std::size_t STABILITY_WINDOWS{3};
    static constexpr std::size_t STABILITY_MAX_ELIGIBLE{120};
    static constexpr std::size_t SYSTEM_WIDE_MIN_GROUP{10};
    static constexpr double SYSTEM_WIDE_MIN_FRACTION{0.5};
    static constexpr std::size_t MAX_SYSTEM_WIDE_BUCKETS{24};
    static constexpr std::size_t MAX_TOP_BUCKET_TIMES{10};
    static constexpr core_t::TTime DIURNAL_LAG_SECONDS{86400};
    static constexpr core_t::TTime DIURNAL_LAG_TOLERANCE{1800};
    static constexpr double DIURNAL_LAG_PENALTY{0.35};
    static constexpr double MULTI_EPISODE_BONUS{0.02};
    //! The matched events an episode needs to count towards the bonus.
    static constexpr std::size_t MULTI_EPISODE_MIN_POINTS{2};

public:
    CUnifiedRanker(const CSensorRegistry& registry, const CBucketReader& reader);

    //! Rank the sensors related to the focus of \p params.
    //!
    //! \throws core::CCanceledException if \p context is canceled.
    SResult compute(const SParams& params, const CAnalysisContext& context) const;

    //! Merge the event and co-occurrence evidence into a ranking.
    static SMergeResult merge(const CEventMatcher::SResult& events,
                              const CCooccurrenceScorer::SResult& cooccurrence,
                              const SMergeOptions& options);

    //! The seed of the candidate order.
    static std::uint64_t orderSeed(const std::string& focusSensorId, const std::string& jobKey);

    //! Order \p ids by priority group relative to \p focus then by hash.
    TStrVec orderCandidates(const SSensorInfo& focus, TStrVec ids, std::uint64_t seed) const;

    //! Find the path from \p candidateId to \p focusId through the derived
    //! inputs.  Returns null if the candidate isn't computed from the focus
    //! within \p maxDepth steps or the walk visits more than \p maxVisited
    //! sensors.
    std::optional<TStrVec> derivedDependencyPath(const std::string& candidateId,
                                                 const std::string& focusId,
                                                 std::size_t maxDepth = MAX_DERIVED_DEPTH,
                                                 std::size_t maxVisited = MAX_DERIVED_VISITED) const;

    //! The number of candidates to evaluate.
    static std::size_t candidateLimit(const SParams& params,
                                      std::size_t pinned,
                                      std::size_t eligible);

    //! Normalise \p weights to sum to one over the enabled components.
    static SWeights normaliseWeights(const TOptionalWeights& weights, bool includeDeltaCorrelation);

    static analytics_t::EConfidence confidence(double blended,
                                               std::size_t overlap,
                                               std::size_t cooccurrenceCount);

    //! The penalty for a candidate with many more events than the focus.
    static double prevalencePenalty(std::size_t numberFocus, std::size_t numberCandidate);

    //! The average product of capped |z| relative to its expected value.
    static TOptionalDouble surpriseRatio(double avgProduct, double focusMeanAbsZ, double candidateMeanAbsZ);

    //! Is \p lag close to a non-zero whole number of days?
    static bool isDiurnalLag(core_t::TTime lag);

    //! The fraction of the first \p k of \p lhs which are in the first \p k
    //! of \p rhs.
    static double overlapAtK(const TStrVec& lhs, const TStrVec& rhs, std::size_t k);

    static std::string print(EMode mode);
    static std::string print(ECooccurrenceMetric metric);
    static std::string print(EEvidenceSource source);
    static std::string print(EStabilityStatus status);
    static bool parse(const std::string& value, EMode& mode);
    static bool parse(const std::string& value, ECooccurrenceMetric& metric);

private:
    //! \brief The sub-run settings shared by the main run and the stability
    //! windows.
    struct SRunSettings {
        CEventMatcher::SParams s_Events;
        CCooccurrenceScorer::SParams s_Cooccurrence;
        SMergeOptions s_Merge;
        bool s_ExcludeSystemWideBuckets = false;
    };

    //! \brief The outcome of the coverage prefilter.
    struct SPrefilter {
        TStrVec s_Accepted;
        TStrVec s_Prefiltered;
        TStrVec s_Truncated;
        TStrSizeMap s_BucketsWithValues;
    };

private:
    SPrefilter prefilter(const TStrVec& ordered,
                         std::size_t slots,
                         const TStrVec& alsoMeasure,
                         const SParams& params,
                         const CAnalysisContext& context) const;

    SStability stability(const SRunSettings& settings,
                         const TStrVec& mainTop,
                         std::size_t eligible,
                         const CAnalysisContext& context) const;

    static TSystemWideBucketVec systemWideBuckets(const CCooccurrenceScorer::SResult& cooccurrence,
                                                  TTimeVec& times);

    static void removeBuckets(CCooccurrenceScorer::SResult& cooccurrence, const TTimeVec& times);

private:
    const CSensorRegistry& m_Registry;
    const CBucketReader& m_Reader;
};
}
}

#endif // INCLUDED_tsse_analytics_CUnifiedRanker_h
