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
#ifndef INCLUDED_tsse_analytics_CBucketReader_h
#define INCLUDED_tsse_analytics_CBucketReader_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>

#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace tsse {
namespace analytics {
class CSampleStore;
class CSensorRegistry;
struct SSensorInfo;

//! \brief Reads raw samples and aligns them to fixed width buckets.
//!
//! DESCRIPTION:\n
//! For every requested sensor this produces a series with one bucket per
//! stride in [start, end), bucket start times being multiples of the
//! interval.  Buckets with too few qualifying samples have no value: gaps
//! are preserved and never interpolated.
//!
//! The aggregation rule "auto" resolves per sensor from its type (see
//! CSensorSemantics).  Direction sensors are averaged on the unit circle
//! and can also be requested as their sine or cosine components using the
//! ids "<id>#sin" and "<id>#cos".
//!
//! Derived sensors are evaluated bucket by bucket from their inputs, which
//! may themselves be derived.  The expansion is depth limited and cycle
//! safe.  Problems with individual sensors never fail the read: they are
//! reported as skipped sensors with a reason.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Lagged derived inputs are read at the bucket containing t - lag, i.e.
//! lags which aren't multiples of the interval are floored to a bucket.
class CBucketReader {
public:
    //! \brief What to read.
    struct SRequest {
        TStrVec s_SensorIds;
        core_t::TTime s_Start = 0;
        core_t::TTime s_End = 0;
        core_t::TTime s_Interval = 60;
        analytics_t::EAggregation s_Aggregation = analytics_t::E_Auto;
        analytics_t::EQualityPolicy s_QualityPolicy = analytics_t::E_GoodOnly;
        std::size_t s_MinSamplesPerBucket = 1;
    };

    //! \brief The series read and the sensors which were skipped.
    struct SResult {
        //! Find the series for \p sensorId or null.
        const SSeries* series(const std::string& sensorId) const;

        TSeriesVec s_Series;
        TSkippedVec s_Skipped;
    };

public:
    //! The maximum derived expansion depth.
    static constexpr std::size_t MAX_DERIVED_DEPTH{10};
    static const std::string SIN_SUFFIX;
    static const std::string COS_SUFFIX;

public:
    CBucketReader(const CSensorRegistry& registry, const CSampleStore& store);

    //! Read the buckets described by \p request.
    SResult read(const SRequest& request) const;

    //! Aggregate time sorted \p samples into the buckets [\p gridStart,
    //! \p gridEnd) of width \p interval.
    static TBucketVec aggregate(const TSampleVec& samples,
                                core_t::TTime gridStart,
                                core_t::TTime gridEnd,
                                core_t::TTime interval,
                                analytics_t::EAggregation aggregation,
                                analytics_t::EQualityPolicy policy,
                                std::size_t minSamplesPerBucket,
                                bool circular);

    //! The number of buckets of width \p interval covering [\p start, \p end).
    static std::size_t numberBuckets(core_t::TTime start, core_t::TTime end, core_t::TTime interval);

private:
    using TStrSet = std::set<std::string>;
    using TOptionalBucketVec = std::optional<TBucketVec>;

    //! \brief The state of one read.
    struct SContext {
        const SRequest* s_Request = nullptr;
        std::optional<SSkipped> s_Failure;
    };

private:
    TOptionalBucketVec readSensor(const std::string& sensorId,
                                  core_t::TTime gridStart,
                                  core_t::TTime gridEnd,
                                  std::size_t depth,
                                  TStrSet& visiting,
                                  SContext& context) const;

    TOptionalBucketVec readRaw(const SSensorInfo& sensor,
                               core_t::TTime gridStart,
                               core_t::TTime gridEnd,
                               SContext& context) const;

    TOptionalBucketVec readDerived(const SSensorInfo& sensor,
                                   core_t::TTime gridStart,
                                   core_t::TTime gridEnd,
                                   std::size_t depth,
                                   TStrSet& visiting,
                                   SContext& context) const;

    TOptionalBucketVec readComponent(const std::string& baseId,
                                     bool sine,
                                     core_t::TTime gridStart,
                                     core_t::TTime gridEnd,
                                     SContext& context) const;

    analytics_t::EAggregation resolveAggregation(const SSensorInfo& sensor,
                                                 const SRequest& request) const;

private:
    const CSensorRegistry& m_Registry;
    const CSampleStore& m_Store;
};
}
}

#endif // INCLUDED_tsse_analytics_CBucketReader_h
