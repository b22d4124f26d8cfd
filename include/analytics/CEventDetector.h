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
#ifndef INCLUDED_tsse_analytics_CEventDetector_h
#define INCLUDED_tsse_analytics_CEventDetector_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>

#include <cstddef>
#include <optional>
#include <string>

namespace tsse {
namespace analytics {

//! \brief Turns a bucketed series into a sparse list of change events.
//!
//! DESCRIPTION:\n
//! The default detector differences consecutive buckets with values, never
//! across a time gap wider than the configured maximum, computes robust
//! z-scores of the differences and reports those whose magnitude exceeds a
//! threshold.  Adjacent detections are merged by non-maximum suppression
//! so that a single change which spans a bucket boundary counts once.
//!
//! The robust scale of the differences is floored by the median absolute
//! non-zero difference.  Quantized sensors have many zero differences and
//! their MAD can collapse which would otherwise produce huge z-scores for
//! a single quantization step.
//!
//! Optionally the series is deseasoned by subtracting its hour of day mean
//! before detection.  This is only done when the series spans at least two
//! days and the result records when it was skipped.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The threshold can adapt to the series: in adaptive mode it is raised to
//! the z-score of the target event count so that noisy sensors don't flood
//! downstream matching.
class CEventDetector {
public:
    enum EPolarity { E_Both, E_UpOnly, E_DownOnly };
    enum ESuppression { E_Nms, E_Greedy };
    enum EThresholdMode { E_Fixed, E_Adaptive };
    enum EDetectorMode { E_Deltas, E_SecondDeltas, E_Levels };
    enum EDeseasoning { E_NoDeseasoning, E_HourOfDayMean };

    //! \brief Detector settings.
    struct SOptions {
        core_t::TTime s_Interval = 60;
        double s_ZThreshold = 3.0;
        std::size_t s_MinSeparationBuckets = 2;
        //! Zero disables gap suppression.
        std::size_t s_GapMaxBuckets = 5;
        EPolarity s_Polarity = E_Both;
        //! Zero means unlimited.
        std::size_t s_MaxEvents = 2000;
        ESuppression s_Suppression = E_Nms;
        EThresholdMode s_ThresholdMode = E_Fixed;
        TOptionalDouble s_AdaptiveMinZ;
        std::optional<std::size_t> s_TargetMinEvents;
        std::optional<std::size_t> s_TargetMaxEvents;
        bool s_ExcludeBoundaryEvents = false;
        EDetectorMode s_DetectorMode = E_Deltas;
        //! Fall back to the levels detector if no change events are found.
        bool s_SparseFallback = false;
        EDeseasoning s_Deseasoning = E_NoDeseasoning;
    };

    //! \brief The time of day entropy of a set of events.
    struct SEntropy {
        //! The entropy of the hour of day histogram divided by ln(24).
        double s_HNorm = 0.0;
        //! s_HNorm clamped to [0.25, 1].
        double s_Weight = 1.0;
    };
    using TOptionalEntropy = std::optional<SEntropy>;

    //! \brief The events of one series and summary counts.
    struct SResult {
        TEventVec s_Events;
        std::size_t s_GapSkippedDeltas = 0;
        std::size_t s_PointsTotal = 0;
        TOptionalDouble s_PeakAbsZ;
        std::size_t s_UpEvents = 0;
        std::size_t s_DownEvents = 0;
        std::size_t s_BoundaryEvents = 0;
        double s_ZThresholdUsed = 0.0;
        bool s_DeseasoningApplied = false;
        bool s_DeseasoningSkippedInsufficientWindow = false;
        bool s_UsedSparseFallback = false;
        TOptionalEntropy s_Entropy;
    };

public:
    static constexpr std::size_t MIN_MAX_EVENTS{100};
    static constexpr std::size_t MAX_MAX_EVENTS{20000};
    //! The minimum span of a series which is deseasoned.
    static constexpr core_t::TTime MIN_DESEASONING_SPAN{2 * 86400};
    //! Minimum non-zero differences needed to apply the scale floor.
    static constexpr std::size_t MIN_COUNT_FOR_SCALE_FLOOR{5};

public:
    explicit CEventDetector(const SOptions& options);

    //! Detect the events of \p series differencing with \p deltaMode.
    SResult detect(const SSeries& series,
                   analytics_t::EDeltaMode deltaMode = analytics_t::E_Linear) const;

    const SOptions& options() const;

    //! Subtract the hour of day mean from every bucket value.
    static SSeries deseasonHourOfDay(const SSeries& series);

    //! Check if \p series is deseasoned when detecting with \p options.
    //!
    //! The span is measured from the first to the end of the last bucket
    //! of the series and not from the requested window.
    static bool deseasons(const SOptions& options, const SSeries& series);

    //! Compute the time of day entropy of \p events.
    static TOptionalEntropy timeOfDayEntropy(const TEventVec& events);

    //! Keep the largest |z| event in each cluster, suppressing every event
    //! within \p windowSeconds of a kept one.  Ties prefer earlier events.
    static TEventVec suppressNms(TEventVec events, core_t::TTime windowSeconds);

    //! Merge time ordered runs of events closer than \p minSeparationSeconds
    //! keeping the largest |z|.
    static TEventVec suppressGreedy(TEventVec events, core_t::TTime minSeparationSeconds);

    static bool parse(const std::string& value, EPolarity& polarity);
    static bool parse(const std::string& value, ESuppression& suppression);
    static bool parse(const std::string& value, EThresholdMode& mode);
    static bool parse(const std::string& value, EDetectorMode& mode);
    static bool parse(const std::string& value, EDeseasoning& deseasoning);

private:
    SResult detect(const SSeries& series,
                   const SOptions& options,
                   analytics_t::EDeltaMode deltaMode,
                   std::size_t& gapSkippedDeltas) const;

private:
    SOptions m_Options;
};
}
}

#endif // INCLUDED_tsse_analytics_CEventDetector_h
