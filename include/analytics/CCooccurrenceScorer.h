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
#ifndef INCLUDED_tsse_analytics_CCooccurrenceScorer_h
#define INCLUDED_tsse_analytics_CCooccurrenceScorer_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>
#include <analytics/CEventDetector.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsse {
namespace analytics {
class CAnalysisContext;
class CBucketReader;
class CSensorRegistry;

//! \brief Finds the buckets in which the change events of several sensors
//! coincide.
//!
//! DESCRIPTION:\n
//! Every event is spread over the buckets within the tolerance of its own
//! bucket, keeping the largest |z| per sensor and bucket.  A bucket with at
//! least the minimum number of sensors is a candidate and its severity is
//! the sum of the participants' capped |z| (times their time of day entropy
//! weights when the periodicity penalty is on).
//!
//! When specific matches are preferred the score of a bucket with group
//! size g out of N sensors is
//!   (severity / g) / ln(2 + g) * ln((N + 1) / (g + 1))
//! so a bucket in which every sensor moved scores zero and is dropped.  A
//! system wide preference scores buckets by their severity.  Both are
//! reported alongside the score.
//!
//! With a focus sensor only buckets containing the focus are considered
//! and they are ordered by the focus' own strength in the bucket.  Buckets
//! are then selected greedily, each selection blocking the buckets within
//! the tolerance of it.
class CCooccurrenceScorer {
public:
    enum EBucketPreference { E_PreferSpecific, E_PreferSystemWide };

    using TStrDoubleMap = std::map<std::string, double>;
    using TStrSizeMap = std::map<std::string, std::size_t>;
    using TStrEventVecMap = std::map<std::string, TEventVec>;
    using TOptionalStr = std::optional<std::string>;

    //! \brief The parameters of a run.
    struct SParams {
        TStrVec s_SensorIds;
        core_t::TTime s_Start = 0;
        core_t::TTime s_End = 0;
        core_t::TTime s_Interval = 60;
        std::size_t s_MaxSensors = 20;
        std::size_t s_MaxBuckets = 12000;
        std::size_t s_ToleranceBuckets = 2;
        std::size_t s_MinSensors = 2;
        std::size_t s_MaxResults = 32;
        double s_ZCap = 15.0;
        CEventDetector::SOptions s_Detector;
        bool s_PeriodicPenalty = false;
        EBucketPreference s_Preference = E_PreferSpecific;
        TOptionalStr s_FocusSensorId;
    };

    //! \brief The settings of the bucket scoring.
    struct SScoringOptions {
        core_t::TTime s_Interval = 60;
        std::size_t s_ToleranceBuckets = 2;
        std::size_t s_MinSensors = 2;
        std::size_t s_MaxResults = 32;
        double s_ZCap = 15.0;
        EBucketPreference s_Preference = E_PreferSpecific;
        TOptionalStr s_FocusSensorId;
        //! Missing sensors have weight one.
        TStrDoubleMap s_EntropyWeights;
    };

    //! \brief The strongest event of one sensor in a bucket.
    struct SParticipant {
        std::string s_SensorId;
        core_t::TTime s_Time = 0;
        double s_Z = 0.0;
        analytics_t::EDirection s_Direction = analytics_t::E_Up;
        double s_Delta = 0.0;
    };
    using TParticipantVec = std::vector<SParticipant>;

    //! \brief The components of a bucket score.
    struct SBucketScore {
        double s_PairWeight = 1.0;
        TOptionalDouble s_Idf;
        double s_Score = 0.0;
    };
    using TOptionalBucketScore = std::optional<SBucketScore>;

    //! \brief A selected bucket.
    struct SScoredBucket {
        core_t::TTime s_Time = 0;
        //! Sorted by |z| descending.
        TParticipantVec s_Sensors;
        std::size_t s_GroupSize = 0;
        double s_SeveritySum = 0.0;
        double s_PairWeight = 1.0;
        TOptionalDouble s_Idf;
        double s_Score = 0.0;
        TOptionalDouble s_FocusStrength;
    };
    using TScoredBucketVec = std::vector<SScoredBucket>;

    //! \brief Event counts of one sensor.
    struct SSensorStats {
        std::size_t s_NumberEvents = 0;
        //! The mean capped |z| of the sensor's events.
        double s_MeanAbsZ = 0.0;
    };
    using TStrSensorStatsMap = std::map<std::string, SSensorStats>;

    //! \brief The result of a run.
    struct SResult {
        core_t::TTime s_Interval = 0;
        std::size_t s_BucketCount = 0;
        std::size_t s_EventCount = 0;
        TScoredBucketVec s_Buckets;
        TStrSensorStatsMap s_SensorStats;
        TStrVec s_TruncatedSensorIds;
        TSkippedVec s_Skipped;
        TStrSizeMap s_GapSkippedDeltas;
        std::size_t s_DeseasoningApplied = 0;
        std::size_t s_DeseasoningSkippedInsufficientWindow = 0;
        SParams s_ParamsUsed;
        TStrVec s_Warnings;
        TPhaseTimingVec s_Timings;
    };

public:
    static constexpr std::size_t MIN_SENSORS{2};
    static constexpr std::size_t MAX_SENSORS{10000};
    static constexpr std::size_t MIN_BUCKETS{300};
    static constexpr std::size_t MAX_BUCKETS{50000};
    static constexpr std::size_t MAX_TOLERANCE_BUCKETS{60};
    static constexpr std::size_t MAX_RESULTS{256};

public:
    CCooccurrenceScorer(const CSensorRegistry& registry, const CBucketReader& reader);

    //! Find the co-occurrence buckets of the sensors in \p params.
    //!
    //! \throws core::CCanceledException if \p context is canceled.
    SResult compute(const SParams& params, const CAnalysisContext& context) const;

    //! Select the best buckets of \p events.  \p totalSensors is the size of
    //! the sensor pool used for the idf.
    static TScoredBucketVec score(const TStrEventVecMap& events,
                                  std::size_t totalSensors,
                                  const SScoringOptions& options,
                                  const CAnalysisContext& context);

    //! Score a bucket with \p groupSize sensors and severity \p severitySum.
    //! Returns null if the score isn't defined.
    static TOptionalBucketScore bucketScore(EBucketPreference preference,
                                            double severitySum,
                                            std::size_t groupSize,
                                            std::size_t totalSensors);

    //! The per sensor event statistics.
    static SSensorStats sensorStats(const TEventVec& events, double zCap);

    //! Clamp \p params to their supported ranges.  The minimum group size
    //! depends on the sensor count so this must see the normalised ids.
    static void clamp(SParams& params);

    static std::string print(EBucketPreference preference);
    static bool parse(const std::string& value, EBucketPreference& preference);

private:
    const CSensorRegistry& m_Registry;
    const CBucketReader& m_Reader;
};
}
}

#endif // INCLUDED_tsse_analytics_CCooccurrenceScorer_h
