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
#ifndef INCLUDED_tsse_analytics_CMatrixProfile_h
#define INCLUDED_tsse_analytics_CMatrixProfile_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsse {
namespace analytics {
class CAnalysisContext;
class CBucketReader;
class CSensorRegistry;

//! \brief Computes the self-join matrix profile of one series.
//!
//! DESCRIPTION:\n
//! Every window of the (possibly downsampled) series is z-normalised and
//! its distance to every other window outside the exclusion zone is
//!   sqrt(2 * window * (1 - corr))
//! where corr is the Pearson correlation of the two windows.  The profile
//! holds the smallest distance for each window and the profile index the
//! start of the window which achieves it, or -1 if none was compared.
//!
//! Motifs are the windows with the smallest distances and anomalies those
//! with the largest.  Both are chosen greedily so that no two selected
//! windows overlap by more than the exclusion zone.
//!
//! IMPLEMENTATION DECISIONS:\n
//! z-normalisation is undefined for constant windows.  Two constant windows
//! are at distance 0 and a constant window is at distance sqrt(window) from
//! any other, which is the distance of uncorrelated windows.
//!
//! Work is bounded by the maximum number of points and windows and by a
//! wall clock budget.  If the budget runs out the profile is partial and a
//! warning says so.
class CMatrixProfile {
public:
    using TSizeVec = std::vector<std::size_t>;
    using TInt64Vec = std::vector<std::int64_t>;

    //! \brief The parameters of a run.
    struct SParams {
        std::string s_SensorId;
        core_t::TTime s_Start = 0;
        core_t::TTime s_End = 0;
        core_t::TTime s_Interval = 60;
        analytics_t::EAggregation s_Aggregation = analytics_t::E_Auto;
        std::size_t s_MaxPoints = 512;
        std::size_t s_MaxWindows = 1024;
        std::size_t s_Window = 32;
        std::optional<std::size_t> s_ExclusionZone;
        std::size_t s_TopK = 5;
        std::uint64_t s_MaxComputeMs = 2000;
    };

    //! \brief A motif or anomaly window.
    struct SWindow {
        std::size_t s_WindowIndex = 0;
        core_t::TTime s_StartTime = 0;
        core_t::TTime s_EndTime = 0;
        double s_Distance = 0.0;
        std::optional<std::size_t> s_MatchIndex;
        std::optional<core_t::TTime> s_MatchStartTime;
        std::optional<core_t::TTime> s_MatchEndTime;
    };
    using TWindowVec = std::vector<SWindow>;

    //! \brief The raw profile.
    struct SProfile {
        TDoubleVec s_Distances;
        TInt64Vec s_Indices;
        bool s_EarlyStopped = false;
        std::size_t s_WindowsComputed = 0;
    };

    //! \brief The result of a run.
    struct SResult {
        std::string s_SensorId;
        std::string s_SensorName;
        std::string s_Unit;
        core_t::TTime s_Interval = 0;
        std::size_t s_Window = 0;
        std::size_t s_ExclusionZone = 0;
        std::size_t s_Step = 1;
        std::size_t s_WindowStep = 1;
        std::size_t s_SourcePoints = 0;
        std::size_t s_SampledPoints = 0;
        TTimeVec s_Times;
        TDoubleVec s_Values;
        TTimeVec s_WindowStartTimes;
        SProfile s_Profile;
        TWindowVec s_Motifs;
        TWindowVec s_Anomalies;
        SParams s_ParamsUsed;
        TStrVec s_Warnings;
        TPhaseTimingVec s_Timings;
    };

public:
    static constexpr std::size_t MIN_POINTS{64};
    static constexpr std::size_t MAX_POINTS{4096};
    static constexpr std::size_t MIN_WINDOWS{64};
    static constexpr std::size_t MAX_WINDOWS{4096};
    static constexpr std::size_t MIN_WINDOW{4};
    static constexpr std::size_t MAX_TOP_K{20};
    static constexpr std::uint64_t MAX_COMPUTE_MS{30000};
    //! Windows with standard deviation at or below this are constant.
    static constexpr double CONSTANT_WINDOW_STD{1e-12};
    //! Cancellation and budget are checked this often in the inner loop.
    static constexpr std::size_t CHECK_EVERY{256};

public:
    CMatrixProfile(const CSensorRegistry& registry, const CBucketReader& reader);

    //! Compute the matrix profile described by \p params.
    //!
    //! \throws core::CCanceledException if \p context is canceled.
    SResult compute(const SParams& params, const CAnalysisContext& context) const;

    //! Compute the profile of \p values, comparing only windows whose start
    //! is a multiple of \p windowStep.
    static SProfile profile(const TDoubleVec& values,
                            std::size_t window,
                            std::size_t exclusionZone,
                            std::size_t windowStep,
                            std::uint64_t budgetMs,
                            const CAnalysisContext& context);

    //! Select up to \p k windows by ascending distance, if \p smallest, or
    //! descending distance, skipping windows within \p separation of one
    //! already selected.
    static TSizeVec select(const TDoubleVec& distances,
                           std::size_t k,
                           std::size_t separation,
                           bool smallest);

    //! Clamp all numeric parameters into their supported ranges.
    static void clamp(SParams& params);

private:
    const CSensorRegistry& m_Registry;
    const CBucketReader& m_Reader;
};
}
}

#endif // INCLUDED_tsse_analytics_CMatrixProfile_h
