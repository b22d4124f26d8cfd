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
#ifndef INCLUDED_tsse_analytics_AnalyticsTypes_h
#define INCLUDED_tsse_analytics_AnalyticsTypes_h

#include <core/CoreTypes.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tsse {
namespace analytics_t {

//! The rule used to combine the raw samples falling in one bucket.
enum EAggregation { E_Avg, E_Last, E_Sum, E_Min, E_Max, E_Auto };

//! Get a string description of \p aggregation.
std::string print(EAggregation aggregation);

//! Parse \p value into \p aggregation, returning false if unrecognised.
bool parse(const std::string& value, EAggregation& aggregation);

enum EQuality { E_Good, E_Bad };

std::string print(EQuality quality);

//! Which raw samples contribute to buckets.
enum EQualityPolicy {
    E_GoodOnly, //!< Bad samples are discarded.
    E_All       //!< All samples contribute and taint the bucket quality.
};

bool parse(const std::string& value, EQualityPolicy& policy);

//! How consecutive bucket values are differenced.
enum EDeltaMode {
    E_Linear,
    E_NonNegativeReset, //!< Negative steps are counter resets and map to 0.
    E_CircularDegrees   //!< Shortest signed angle in degrees.
};

std::string print(EDeltaMode mode);

enum EDirection { E_Up, E_Down };

std::string print(EDirection direction);

//! The confidence tier of a ranked candidate.
enum EConfidence { E_High, E_Medium, E_Low };

std::string print(EConfidence confidence);

//! The reason a sensor or candidate was skipped.
enum ESkipReason {
    E_SensorNotFound,
    E_UnsupportedSensorSource,
    E_DerivedDepthExceeded,
    E_DerivedCycle,
    E_InsufficientOverlap,
    E_NoHistory,
    E_BelowThreshold,
    E_TruncatedByLimit,
    E_Filtered,
    E_DerivedFromFocus
};

std::string print(ESkipReason reason);
}

namespace analytics {

using TStrVec = std::vector<std::string>;
using TDoubleVec = std::vector<double>;
using TOptionalDouble = std::optional<double>;
using TTimeVec = std::vector<core_t::TTime>;

//! \brief One raw sample as held by the time-series store.
struct SSample {
    core_t::TTime s_Time = 0;
    double s_Value = 0.0;
    analytics_t::EQuality s_Quality = analytics_t::E_Good;
};
using TSampleVec = std::vector<SSample>;

//! \brief One fixed width bucket.  A bucket with no qualifying samples
//! has no value and is a gap.
struct SBucket {
    core_t::TTime s_Time = 0;
    TOptionalDouble s_Value;
    std::uint32_t s_SampleCount = 0;
    analytics_t::EQuality s_Quality = analytics_t::E_Good;
};
using TBucketVec = std::vector<SBucket>;

//! \brief The buckets of one sensor at one interval.
//!
//! Bucket start times are strictly increasing with stride s_Interval and
//! there is a bucket for every stride in the requested range.
struct SSeries {
    //! The number of buckets with a value.
    std::size_t numberValues() const;

    //! The (time, value) pairs of the buckets with a value.
    std::vector<std::pair<core_t::TTime, double>> points() const;

    //! The values including NaN for gaps.
    TDoubleVec valuesWithGaps() const;

    std::string s_SensorId;
    core_t::TTime s_Interval = 0;
    TBucketVec s_Buckets;
};
using TSeriesVec = std::vector<SSeries>;

//! \brief A significant change in a bucketed series.
struct SEvent {
    core_t::TTime s_Time = 0;
    double s_Z = 0.0;
    analytics_t::EDirection s_Direction = analytics_t::E_Up;
    double s_Delta = 0.0;
    bool s_IsBoundary = false;
};
using TEventVec = std::vector<SEvent>;

//! \brief A window in which two series' events align at a lag.
struct SEpisode {
    core_t::TTime s_StartTime = 0;
    core_t::TTime s_EndTime = 0;
    core_t::TTime s_LagSeconds = 0;
    double s_Coverage = 0.0;
    double s_ScoreMean = 0.0;
    double s_ScorePeak = 0.0;
    std::size_t s_NumPoints = 0;
};
using TEpisodeVec = std::vector<SEpisode>;

//! \brief A sensor which could not be used and why.
struct SSkipped {
    std::string s_SensorId;
    analytics_t::ESkipReason s_Reason;
    std::string s_Detail;
};
using TSkippedVec = std::vector<SSkipped>;

//! \brief Wall clock time spent in one named phase of a job.
struct SPhaseTiming {
    std::string s_Phase;
    std::uint64_t s_Milliseconds = 0;
};
using TPhaseTimingVec = std::vector<SPhaseTiming>;
}
}

#endif // INCLUDED_tsse_analytics_AnalyticsTypes_h
