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
#ifndef INCLUDED_tsse_analytics_CCorrelationMatrix_h
#define INCLUDED_tsse_analytics_CCorrelationMatrix_h

#include <core/CoreTypes.h>

#include <maths/CCorrelation.h>

#include <analytics/AnalyticsTypes.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tsse {
namespace analytics {
class CAnalysisContext;
class CBucketReader;
class CSensorRegistry;

//! \brief Computes the pairwise correlation matrix of a set of sensors.
//!
//! DESCRIPTION:\n
//! Each pair of series is joined on common bucket times, optionally at the
//! lag in a bounded search with the largest |r|, and correlated by Pearson
//! or Spearman.  Significance uses an effective sample size shrunk by the
//! lag-1 autocorrelations of both series and Benjamini Hochberg q-values
//! over all cells of the run.  A cell is significant only when its q-value
//! is at most alpha and |r| is at least the effect size floor.
//!
//! The p-values are asymptotic approximations which assume independent
//! samples.  Even after the effective sample size correction they should
//! be read as a heuristic ranking aid and not as exact tests.  In best lag
//! mode the lag is selected on the same data so the significance is
//! optimistic.
class CCorrelationMatrix {
public:
    enum EValueMode { E_Levels, E_Deltas };
    enum ELagMode { E_Aligned, E_BestWithinMax };
    enum ECellStatus { E_Ok, E_NotSignificant, E_InsufficientOverlap, E_NotComputed };

    //! \brief The parameters of a run.
    struct SParams {
        TStrVec s_SensorIds;
        core_t::TTime s_Start = 0;
        core_t::TTime s_End = 0;
        core_t::TTime s_Interval = 60;
        maths::CCorrelation::EMethod s_Method = maths::CCorrelation::E_Pearson;
        EValueMode s_ValueMode = E_Levels;
        ELagMode s_LagMode = E_Aligned;
        analytics_t::EAggregation s_Aggregation = analytics_t::E_Auto;
        std::size_t s_MaxSensors = 20;
        std::size_t s_MaxBuckets = 10000;
        std::size_t s_MinOverlap = 3;
        std::size_t s_MinSignificantN = 10;
        double s_SignificanceAlpha = 0.05;
        double s_MinAbsR = 0.2;
        std::size_t s_MaxLagBuckets = 12;
    };

    //! \brief One cell of the matrix.
    struct SCell {
        TOptionalDouble s_R;
        TOptionalDouble s_RConfidenceLow;
        TOptionalDouble s_RConfidenceHigh;
        TOptionalDouble s_PValue;
        TOptionalDouble s_QValue;
        std::size_t s_N = 0;
        std::optional<std::size_t> s_NEff;
        std::optional<core_t::TTime> s_LagSeconds;
        ECellStatus s_Status = E_NotComputed;
    };
    using TCellVec = std::vector<SCell>;
    using TCellVecVec = std::vector<TCellVec>;

    //! \brief Descriptive metadata of a sensor in the matrix.
    struct SSensorSummary {
        std::string s_SensorId;
        std::string s_Name;
        std::string s_Unit;
        std::string s_NodeId;
        std::string s_Type;
        std::size_t s_Points = 0;
    };
    using TSensorSummaryVec = std::vector<SSensorSummary>;

    //! \brief The result of a run.
    struct SResult {
        TStrVec s_SensorIds;
        TSensorSummaryVec s_Sensors;
        TCellVecVec s_Matrix;
        core_t::TTime s_Interval = 0;
        std::size_t s_BucketCount = 0;
        TStrVec s_TruncatedSensorIds;
        TSkippedVec s_Skipped;
        SParams s_ParamsUsed;
        std::string s_CorrelationVersion;
        std::string s_FdrVersion;
        std::string s_NEffVersion;
        TPhaseTimingVec s_Timings;
        TStrVec s_Warnings;
    };

public:
    static constexpr std::size_t MIN_SENSORS{2};
    static constexpr std::size_t MAX_SENSORS{100};
    static constexpr std::size_t MIN_BUCKETS{100};
    static constexpr std::size_t MAX_BUCKETS{50000};
    static constexpr double MIN_ALPHA{0.0001};
    static constexpr double MAX_ALPHA{0.5};
    static constexpr std::size_t MAX_LAG_BUCKETS{360};
    //! Deltas across gaps wider than this many buckets are skipped.
    static constexpr core_t::TTime DELTA_GAP_BUCKETS{5};

public:
    CCorrelationMatrix(const CSensorRegistry& registry, const CBucketReader& reader);

    //! Compute the matrix described by \p params.
    //!
    //! \throws core::CCanceledException if \p context is canceled.
    SResult compute(const SParams& params, const CAnalysisContext& context) const;

    //! Widen \p interval so that [\p start, \p end) has at most
    //! \p maxBuckets buckets.
    static core_t::TTime widenInterval(core_t::TTime start,
                                       core_t::TTime end,
                                       core_t::TTime interval,
                                       std::size_t maxBuckets);

    //! Clamp all numeric parameters into their supported ranges.
    static void clamp(SParams& params);

    static std::string print(ECellStatus status);
    static bool parse(const std::string& value, EValueMode& mode);
    static bool parse(const std::string& value, ELagMode& mode);
    static std::string print(EValueMode mode);
    static std::string print(ELagMode mode);

private:
    const CSensorRegistry& m_Registry;
    const CBucketReader& m_Reader;
};
}
}

#endif // INCLUDED_tsse_analytics_CCorrelationMatrix_h
