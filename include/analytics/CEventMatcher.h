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
#ifndef INCLUDED_tsse_analytics_CEventMatcher_h
#define INCLUDED_tsse_analytics_CEventMatcher_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>
#include <analytics/CEventDetector.h>
#include <analytics/CSensorRegistry.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tsse {
namespace analytics {
class CAnalysisContext;
class CBucketReader;

//! \brief Scores how well the change events of candidate sensors line up
//! with those of a focus sensor.
//!
//! DESCRIPTION:\n
//! For each lag in [-max lag, max lag] buckets the focus events, shifted by
//! the lag, are paired with candidate events at most the tolerance apart.
//! Pairing is one-to-one: each focus event takes the nearest candidate event
//! not already taken, so a burst of candidate events can't be counted more
//! than once.  A lag is scored with the weighted F1
//!   2 * sum min(w_f, w_c) / (sum w_f + sum w_c)
//! where the weight of an event is its |z| capped at z cap.  A positive lag
//! means the candidate fires later than the focus.
//!
//! Lags are ranked by score, then overlap, then the total alignment error
//! of the pairs, then by the smaller |lag|.  Lags with fewer pairs than the
//! minimum overlap are never chosen as the best lag.
//!
//! At the best lag the matched focus events are grouped into episodes and
//! the relative direction of the changes is labelled.  The label comes from
//! the correlation of the aligned bucket deltas when there are at least
//! MIN_DELTA_PAIRS of them and otherwise from the sign agreement of the
//! matched events.
class CEventMatcher {
public:
    using TTimeDoublePr = std::pair<core_t::TTime, double>;
    using TTimeDoublePrVec = std::vector<TTimeDoublePr>;
    using TSizeSizePr = std::pair<std::size_t, std::size_t>;
    using TSizeSizePrVec = std::vector<TSizeSizePr>;
    using TStrSizeMap = std::map<std::string, std::size_t>;

    enum EDirectionLabel { E_Same, E_Opposite, E_Unknown };

    //! \brief An externally supplied focus event.
    struct SFocusEvent {
        core_t::TTime s_Time = 0;
        TOptionalDouble s_Severity;
    };
    using TFocusEventVec = std::vector<SFocusEvent>;

    //! \brief The parameters of a run.
    struct SParams {
        std::string s_FocusSensorId;
        //! If empty candidates are chosen from the registry with s_Filters.
        TStrVec s_CandidateSensorIds;
        SCandidateFilters s_Filters;
        core_t::TTime s_Start = 0;
        core_t::TTime s_End = 0;
        core_t::TTime s_Interval = 60;
        std::size_t s_MaxBuckets = 12000;
        CEventDetector::SOptions s_Detector;
        std::size_t s_MaxLagBuckets = 12;
        std::size_t s_TopKLags = 0;
        std::size_t s_ToleranceBuckets = 0;
        std::size_t s_MinOverlap = 1;
        std::size_t s_MaxEpisodes = 24;
        std::size_t s_EpisodeGapBuckets = 6;
        std::size_t s_CandidateLimit = 50;
        double s_ZCap = 15.0;
        bool s_PeriodicPenalty = false;
        //! If non-empty these replace the detected focus events.
        TFocusEventVec s_FocusEvents;
    };

    //! \brief The settings used to match one focus candidate pair.
    struct SMatchOptions {
        core_t::TTime s_Interval = 60;
        std::size_t s_MaxLagBuckets = 12;
        std::size_t s_TopKLags = 0;
        std::size_t s_ToleranceBuckets = 0;
        std::size_t s_MinOverlap = 1;
        std::size_t s_MaxEpisodes = 24;
        std::size_t s_EpisodeGapBuckets = 6;
        double s_ZCap = 15.0;
        //! Sign agreement is meaningless for explicit focus events.
        bool s_FocusEventsExplicit = false;
    };

    //! \brief The events and gap aware deltas of one sensor.
    struct SEventSet {
        TEventVec s_Events;
        TTimeDoublePrVec s_Deltas;
        std::size_t s_UpEvents = 0;
        std::size_t s_DownEvents = 0;
        CEventDetector::TOptionalEntropy s_Entropy;
    };

    //! \brief The score of one lag.
    struct SLagScore {
        core_t::TTime s_LagSeconds = 0;
        TOptionalDouble s_Score;
        std::size_t s_Overlap = 0;
        //! The sum of |offset| over all pairs, in seconds.
        double s_AlignmentError = 0.0;
        std::size_t s_NumberCandidate = 0;
        bool s_Valid = false;
    };
    using TLagScoreVec = std::vector<SLagScore>;

    //! \brief The evidence for one candidate.
    struct SCandidate {
        std::string s_SensorId;
        std::size_t s_Rank = 0;
        TOptionalDouble s_Score;
        std::size_t s_Overlap = 0;
        std::size_t s_NumberFocus = 0;
        std::size_t s_NumberCandidate = 0;
        std::optional<std::size_t> s_FocusUpEvents;
        std::optional<std::size_t> s_FocusDownEvents;
        std::size_t s_CandidateUpEvents = 0;
        std::size_t s_CandidateDownEvents = 0;
        SLagScore s_ZeroLag;
        std::optional<SLagScore> s_BestLag;
        TLagScoreVec s_TopLags;
        EDirectionLabel s_Direction = E_Unknown;
        TOptionalDouble s_SignAgreement;
        TOptionalDouble s_DeltaCorrelation;
        std::size_t s_DirectionN = 0;
        TOptionalDouble s_EntropyNorm;
        TOptionalDouble s_EntropyWeight;
        TEpisodeVec s_Episodes;
        std::size_t s_OverlapWeighted = 0;
        double s_OverlapWeightedSum = 0.0;
        double s_FocusWeightSum = 0.0;
        double s_CandidateWeightSum = 0.0;
        //! The shape similarity of the two series, for information only.
        TOptionalDouble s_EmbeddingCosine;
    };
    using TCandidateVec = std::vector<SCandidate>;

    //! \brief Evidence quality counters over all sensors in a run.
    struct SMonitoring {
        TOptionalDouble s_PeakAbsZP50;
        TOptionalDouble s_PeakAbsZP90;
        TOptionalDouble s_PeakAbsZP95;
        TOptionalDouble s_PeakAbsZP99;
        double s_ZCap = 0.0;
        std::size_t s_EventsTotal = 0;
        std::size_t s_ZClippedEvents = 0;
        double s_ZClippedFraction = 0.0;
        std::size_t s_DeltaPointsTotal = 0;
        std::size_t s_GapSkippedDeltasTotal = 0;
        double s_GapSkippedFraction = 0.0;
    };

    //! \brief The result of a run.
    struct SResult {
        std::string s_FocusSensorId;
        core_t::TTime s_Interval = 0;
        std::size_t s_BucketCount = 0;
        TCandidateVec s_Candidates;
        TStrVec s_TruncatedSensorIds;
        TSkippedVec s_Skipped;
        TStrSizeMap s_GapSkippedDeltas;
        SMonitoring s_Monitoring;
        SParams s_ParamsUsed;
        TStrVec s_Warnings;
        TPhaseTimingVec s_Timings;
    };

public:
    static constexpr std::size_t MIN_BUCKETS{300};
    static constexpr std::size_t MAX_BUCKETS{50000};
    static constexpr std::size_t MAX_LAG_BUCKETS{360};
    static constexpr std::size_t MAX_TOP_K_LAGS{3};
    static constexpr std::size_t MAX_EPISODES{200};
    static constexpr std::size_t MIN_CANDIDATE_LIMIT{5};
    static constexpr std::size_t MAX_CANDIDATE_LIMIT{10000};
    static constexpr double MIN_Z_CAP{1.0};
    static constexpr double MAX_Z_CAP{1000.0};
    //! The aligned delta pairs needed before delta correlation decides the
    //! direction label.
    static constexpr std::size_t MIN_DELTA_PAIRS{10};
    //! The matched pairs needed for any direction label.
    static constexpr std::size_t MIN_DIRECTION_PAIRS{3};

public:
    CEventMatcher(const CSensorRegistry& registry, const CBucketReader& reader);

    //! Match the candidates described by \p params against the focus.
    //!
    //! \throws core::CCanceledException if \p context is canceled.
    SResult compute(const SParams& params, const CAnalysisContext& context) const;

    //! Score one candidate against the focus.
    static SCandidate match(const SEventSet& focus,
                            const SEventSet& candidate,
                            const SMatchOptions& options);

    //! Pair the focus events shifted by \p lag with candidate events at most
    //! \p tolerance apart.  Both inputs must be sorted by time.  Returns the
    //! (focus, candidate) index pairs.
    static TSizeSizePrVec matchedPairs(const TEventVec& focus,
                                       const TEventVec& candidate,
                                       core_t::TTime lag,
                                       core_t::TTime tolerance);

    //! Score \p lag.
    static SLagScore scoreLag(const TEventVec& focus,
                              const TEventVec& candidate,
                              core_t::TTime lag,
                              core_t::TTime tolerance,
                              double zCap,
                              std::size_t minOverlap);

    //! Check if \p lhs is a better lag than \p rhs.
    static bool betterLag(const SLagScore& lhs, const SLagScore& rhs);

    //! Group the matched focus events into episodes.
    static TEpisodeVec episodes(TEventVec matchedFocus,
                                core_t::TTime lag,
                                core_t::TTime interval,
                                std::size_t gapBuckets,
                                std::size_t maxEpisodes,
                                double zCap,
                                std::size_t focusTotal);

    //! Label the relative direction of two sensors' changes.
    static EDirectionLabel directionLabel(std::size_t matchedPairs,
                                          const TOptionalDouble& deltaCorrelation,
                                          const TOptionalDouble& signAgreement);

    //! The deltas of \p series skipping gaps wider than \p gapMaxBuckets
    //! intervals.  Zero means any gap is bridged.
    static TTimeDoublePrVec gapAwareDeltas(const SSeries& series,
                                           std::size_t gapMaxBuckets,
                                           analytics_t::EDeltaMode mode);

    //! The Pearson correlation of the deltas whose times differ by \p lag.
    static TOptionalDouble alignedDeltaCorrelation(const TTimeDoublePrVec& focus,
                                                   const TTimeDoublePrVec& candidate,
                                                   core_t::TTime lag,
                                                   std::size_t minPairs);

    //! Sort, deduplicate and bound explicit focus events.
    static TEventVec explicitFocusEvents(const TFocusEventVec& events,
                                         core_t::TTime start,
                                         core_t::TTime end,
                                         std::size_t maxEvents);

    //! The weight of \p event.
    static double weight(const SEvent& event, double zCap);

    //! Sort by time keeping one event per time.
    static TEventVec sortedUnique(TEventVec events);

    static void clamp(SParams& params);

    static std::string print(EDirectionLabel label);

private:
    const CSensorRegistry& m_Registry;
    const CBucketReader& m_Reader;
};
}
}

#endif // INCLUDED_tsse_analytics_CEventMatcher_h
