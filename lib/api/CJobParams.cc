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
#include <api/CJobParams.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <maths/CCorrelation.h>

#include <api/CJobParamsReader.h>

#include <algorithm>
#include <cmath>

namespace tsse {
namespace api {
namespace {
using TStrVec = CJobParamsReader::TStrVec;
using TStrIntMap = CJobParamsReader::TStrIntMap;
using TDetectorOptions = analytics::CEventDetector::SOptions;

const std::string START{"start"};
const std::string END{"end"};
const std::string INTERVAL_SECONDS{"interval_seconds"};
const std::string SENSOR_IDS{"sensor_ids"};
const std::string FOCUS_SENSOR_ID{"focus_sensor_id"};
const std::string FOCUS_EVENTS{"focus_events"};
const std::string CANDIDATE_SENSOR_IDS{"candidate_sensor_ids"};
const std::string CANDIDATE_LIMIT{"candidate_limit"};
const std::string FILTERS{"filters"};
const std::string MAX_BUCKETS{"max_buckets"};
const std::string MAX_SENSORS{"max_sensors"};
const std::string MAX_LAG_BUCKETS{"max_lag_buckets"};
const std::string TOLERANCE_BUCKETS{"tolerance_buckets"};
const std::string MAX_EPISODES{"max_episodes"};
const std::string EPISODE_GAP_BUCKETS{"episode_gap_buckets"};
const std::string MIN_SENSORS{"min_sensors"};
const std::string MAX_RESULTS{"max_results"};
const std::string Z_CAP{"z_cap"};
const std::string Z_THRESHOLD{"z_threshold"};
const std::string MAX_EVENTS{"max_events"};
const std::string PERIODIC_PENALTY_ENABLED{"periodic_penalty_enabled"};
const std::string BUCKET_AGGREGATION_MODE{"bucket_aggregation_mode"};

const TStrIntMap AGGREGATIONS{{"avg", analytics_t::E_Avg}, {"last", analytics_t::E_Last},
                              {"sum", analytics_t::E_Sum}, {"min", analytics_t::E_Min},
                              {"max", analytics_t::E_Max}, {"auto", analytics_t::E_Auto}};
const TStrIntMap POLARITIES{{"both", analytics::CEventDetector::E_Both},
                            {"up", analytics::CEventDetector::E_UpOnly},
                            {"down", analytics::CEventDetector::E_DownOnly}};
const TStrIntMap THRESHOLD_MODES{{"fixed_z", analytics::CEventDetector::E_Fixed},
                                 {"adaptive_rate", analytics::CEventDetector::E_Adaptive}};
const TStrIntMap DETECTOR_MODES{{"bucket_deltas", analytics::CEventDetector::E_Deltas},
                                {"bucket_second_deltas", analytics::CEventDetector::E_SecondDeltas},
                                {"bucket_levels", analytics::CEventDetector::E_Levels}};
const TStrIntMap SUPPRESSION_MODES{{"greedy_min_separation", analytics::CEventDetector::E_Greedy},
                                   {"nms_window", analytics::CEventDetector::E_Nms}};
const TStrIntMap DESEASON_MODES{{"none", analytics::CEventDetector::E_NoDeseasoning},
                                {"hour_of_day_mean", analytics::CEventDetector::E_HourOfDayMean}};
const TStrIntMap BUCKET_PREFERENCES{
    {"prefer_specific_matches", analytics::CCooccurrenceScorer::E_PreferSpecific},
    {"prefer_system_wide_matches", analytics::CCooccurrenceScorer::E_PreferSystemWide}};

//! Register the event detector settings.
void addDetectorParameters(CJobParamsReader& reader) {
    reader.addParameter("threshold_mode", CJobParamsReader::E_OptionalParameter, THRESHOLD_MODES);
    reader.addParameter("adaptive_threshold", CJobParamsReader::E_OptionalParameter);
    reader.addParameter("detector_mode", CJobParamsReader::E_OptionalParameter, DETECTOR_MODES);
    reader.addParameter("suppression_mode", CJobParamsReader::E_OptionalParameter, SUPPRESSION_MODES);
    reader.addParameter("exclude_boundary_events", CJobParamsReader::E_OptionalParameter);
    reader.addParameter("sparse_point_events_enabled", CJobParamsReader::E_OptionalParameter);
    reader.addParameter("min_separation_buckets", CJobParamsReader::E_OptionalParameter);
    reader.addParameter("gap_max_buckets", CJobParamsReader::E_OptionalParameter);
    reader.addParameter("polarity", CJobParamsReader::E_OptionalParameter, POLARITIES);
    reader.addParameter("deseason_mode", CJobParamsReader::E_OptionalParameter, DESEASON_MODES);
    reader.addParameter(Z_THRESHOLD, CJobParamsReader::E_OptionalParameter);
    reader.addParameter(MAX_EVENTS, CJobParamsReader::E_OptionalParameter);
}

//! Register the time window settings.
void addWindowParameters(CJobParamsReader& reader) {
    reader.addParameter(START, CJobParamsReader::E_RequiredParameter);
    reader.addParameter(END, CJobParamsReader::E_RequiredParameter);
    reader.addParameter(INTERVAL_SECONDS, CJobParamsReader::E_OptionalParameter);
}

const CJobParamsReader& adaptiveThresholdReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("target_min_events", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("target_max_events", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("min_z", CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& filtersReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("same_node_only", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("same_unit_only", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("same_type_only", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(INTERVAL_SECONDS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("is_derived", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("is_public_provider", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("exclude_sensor_ids", CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& focusEventReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("ts", CJobParamsReader::E_RequiredParameter);
        theReader.addParameter("severity", CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& weightsReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("events", CJobParamsReader::E_RequiredParameter);
        theReader.addParameter("cooccurrence", CJobParamsReader::E_RequiredParameter);
        theReader.addParameter("delta_corr", CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& correlationMatrixReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter(SENSOR_IDS, CJobParamsReader::E_RequiredParameter);
        addWindowParameters(theReader);
        theReader.addParameter("method", CJobParamsReader::E_OptionalParameter,
                               {{"pearson", maths::CCorrelation::E_Pearson},
                                {"spearman", maths::CCorrelation::E_Spearman}});
        theReader.addParameter(MAX_SENSORS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("min_overlap", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("min_significant_n", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("significance_alpha", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("min_abs_r", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(BUCKET_AGGREGATION_MODE,
                               CJobParamsReader::E_OptionalParameter, AGGREGATIONS);
        theReader.addParameter("value_mode", CJobParamsReader::E_OptionalParameter,
                               {{"levels", analytics::CCorrelationMatrix::E_Levels},
                                {"deltas", analytics::CCorrelationMatrix::E_Deltas}});
        theReader.addParameter("lag_mode", CJobParamsReader::E_OptionalParameter,
                               {{"aligned", analytics::CCorrelationMatrix::E_Aligned},
                                {"best_within_max", analytics::CCorrelationMatrix::E_BestWithinMax}});
        theReader.addParameter(MAX_LAG_BUCKETS, CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& matrixProfileReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("sensor_id", CJobParamsReader::E_RequiredParameter);
        addWindowParameters(theReader);
        theReader.addParameter(BUCKET_AGGREGATION_MODE,
                               CJobParamsReader::E_OptionalParameter, AGGREGATIONS);
        theReader.addParameter("window_points", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("exclusion_zone", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("max_points", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("max_windows", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("top_k", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("max_compute_ms", CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& eventMatchReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter(FOCUS_SENSOR_ID, CJobParamsReader::E_RequiredParameter);
        addWindowParameters(theReader);
        theReader.addParameter(FOCUS_EVENTS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(CANDIDATE_SENSOR_IDS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(CANDIDATE_LIMIT, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(FILTERS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_LAG_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("top_k_lags", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(TOLERANCE_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("min_overlap", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_EPISODES, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(EPISODE_GAP_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(Z_CAP, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(PERIODIC_PENALTY_ENABLED, CJobParamsReader::E_OptionalParameter);
        addDetectorParameters(theReader);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& cooccurrenceReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter(SENSOR_IDS, CJobParamsReader::E_RequiredParameter);
        addWindowParameters(theReader);
        theReader.addParameter(FOCUS_SENSOR_ID, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_SENSORS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(TOLERANCE_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MIN_SENSORS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_RESULTS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(Z_CAP, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(PERIODIC_PENALTY_ENABLED, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("bucket_preference_mode",
                               CJobParamsReader::E_OptionalParameter, BUCKET_PREFERENCES);
        addDetectorParameters(theReader);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& relatedSensorsUnifiedReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter(FOCUS_SENSOR_ID, CJobParamsReader::E_RequiredParameter);
        addWindowParameters(theReader);
        theReader.addParameter(FOCUS_EVENTS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("mode", CJobParamsReader::E_OptionalParameter,
                               {{"simple", analytics::CUnifiedRanker::E_Simple},
                                {"advanced", analytics::CUnifiedRanker::E_Advanced}});
        theReader.addParameter(CANDIDATE_SENSOR_IDS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("pinned_sensor_ids", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("evaluate_all_eligible", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(CANDIDATE_LIMIT, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_RESULTS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("include_low_confidence", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("quick_suggest", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("stability_enabled", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("exclude_system_wide_buckets", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(FILTERS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("weights", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(Z_CAP, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_LAG_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MAX_EPISODES, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(EPISODE_GAP_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(TOLERANCE_BUCKETS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(MIN_SENSORS, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("include_delta_corr_signal", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(PERIODIC_PENALTY_ENABLED, CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("cooccurrence_score_mode", CJobParamsReader::E_OptionalParameter,
                               {{"avg_product", analytics::CUnifiedRanker::E_AvgProduct},
                                {"surprise", analytics::CUnifiedRanker::E_Surprise}});
        theReader.addParameter("cooccurrence_bucket_preference_mode",
                               CJobParamsReader::E_OptionalParameter, BUCKET_PREFERENCES);
        addDetectorParameters(theReader);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& noopReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("steps", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("step_ms", CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

void readTime(const CJobParameters& parameters,
              const std::string& name,
              core_t::TTime& result,
              TStrVec& errors) {
    const json::value* value{parameters[name].jsonValue()};
    if (value == nullptr) {
        return;
    }
    if (CJobParams::parseTime(*value, result) == false) {
        errors.push_back("Invalid " + name + " timestamp '" + json::serialize(*value) + "'");
    }
}

void readWindow(const CJobParameters& parameters,
                core_t::TTime& start,
                core_t::TTime& end,
                core_t::TTime& interval,
                TStrVec& errors) {
    std::size_t numberErrors{errors.size()};
    readTime(parameters, START, start, errors);
    readTime(parameters, END, end, errors);
    if (errors.size() == numberErrors) {
        if (end <= start) {
            errors.push_back("end must be after start");
        } else if (end - start > CJobParams::MAX_WINDOW_SECONDS) {
            errors.push_back("time window longer than " +
                             std::to_string(CJobParams::MAX_WINDOW_SECONDS / 86400) + " days");
        }
    }
    interval = parameters[INTERVAL_SECONDS].fallback(interval);
    if (interval <= 0) {
        errors.push_back("interval_seconds must be positive");
    }
}

void readIds(const CJobParameters& parameters, const std::string& name, TStrVec& result) {
    result = core::CStringUtils::normaliseIds(parameters[name].fallback(result));
}

void readDetector(const CJobParameters& parameters,
                  bool withThreshold,
                  TDetectorOptions& options,
                  TStrVec& errors) {
    options.s_ThresholdMode = parameters["threshold_mode"].fallback(options.s_ThresholdMode);
    if (const json::value* adaptive = parameters["adaptive_threshold"].jsonObject()) {
        CJobParameters config{adaptiveThresholdReader().read(*adaptive, errors)};
        options.s_TargetMinEvents = config["target_min_events"].optional<std::size_t>();
        options.s_TargetMaxEvents = config["target_max_events"].optional<std::size_t>();
        options.s_AdaptiveMinZ = config["min_z"].optional<double>();
    }
    options.s_DetectorMode = parameters["detector_mode"].fallback(options.s_DetectorMode);
    options.s_Suppression = parameters["suppression_mode"].fallback(options.s_Suppression);
    options.s_ExcludeBoundaryEvents =
        parameters["exclude_boundary_events"].fallback(options.s_ExcludeBoundaryEvents);
    options.s_SparseFallback =
        parameters["sparse_point_events_enabled"].fallback(options.s_SparseFallback);
    options.s_MinSeparationBuckets =
        parameters["min_separation_buckets"].fallback(options.s_MinSeparationBuckets);
    options.s_GapMaxBuckets = parameters["gap_max_buckets"].fallback(options.s_GapMaxBuckets);
    options.s_Polarity = parameters["polarity"].fallback(options.s_Polarity);
    options.s_Deseasoning = parameters["deseason_mode"].fallback(options.s_Deseasoning);
    if (withThreshold) {
        options.s_ZThreshold = parameters[Z_THRESHOLD].fallback(options.s_ZThreshold);
        options.s_MaxEvents = parameters[MAX_EVENTS].fallback(options.s_MaxEvents);
    }
}

void checkZThreshold(double threshold, TStrVec& errors) {
    if (std::isfinite(threshold) == false || threshold <= 0.0) {
        errors.push_back("z_threshold must be positive");
    }
}

void readFilters(const CJobParameters& parameters,
                 analytics::SCandidateFilters& filters,
                 TStrVec& errors) {
    const json::value* value{parameters[FILTERS].jsonObject()};
    if (value == nullptr) {
        return;
    }
    CJobParameters config{filtersReader().read(*value, errors)};
    filters.s_SameNodeOnly = config["same_node_only"].fallback(filters.s_SameNodeOnly);
    filters.s_SameUnitOnly = config["same_unit_only"].fallback(filters.s_SameUnitOnly);
    filters.s_SameTypeOnly = config["same_type_only"].fallback(filters.s_SameTypeOnly);
    filters.s_IntervalSeconds = config[INTERVAL_SECONDS].optional<std::int64_t>();
    filters.s_IsDerived = config["is_derived"].optional<bool>();
    filters.s_IsPublicProvider = config["is_public_provider"].optional<bool>();
    filters.s_ExcludeSensorIds = core::CStringUtils::normaliseIds(
        config["exclude_sensor_ids"].fallback(filters.s_ExcludeSensorIds));
}

void readFocusEvents(const CJobParameters& parameters,
                     analytics::CEventMatcher::TFocusEventVec& events,
                     TStrVec& errors) {
    const json::value* value{parameters[FOCUS_EVENTS].jsonValue()};
    if (value == nullptr) {
        return;
    }
    if (value->is_array() == false) {
        errors.push_back("focus_events must be an array");
        return;
    }
    for (const auto& element : value->as_array()) {
        CJobParameters event{focusEventReader().read(element, errors)};
        analytics::CEventMatcher::SFocusEvent focusEvent;
        readTime(event, "ts", focusEvent.s_Time, errors);
        focusEvent.s_Severity = event["severity"].optional<double>();
        events.push_back(focusEvent);
    }
}

std::string join(const TStrVec& errors) {
    std::string result;
    for (const auto& error : errors) {
        result += (result.empty() ? "" : "; ") + error;
    }
    return result;
}

using TParamsVariant = CJobParams::TVariant;

TParamsVariant readCorrelationMatrix(const json::value& json, TStrVec& errors) {
    analytics::CCorrelationMatrix::SParams params;
    CJobParameters parameters{correlationMatrixReader().read(json, errors)};
    readIds(parameters, SENSOR_IDS, params.s_SensorIds);
    if (parameters[SENSOR_IDS].present() && params.s_SensorIds.size() < 2) {
        errors.push_back("At least two sensor_ids are required");
    }
    readWindow(parameters, params.s_Start, params.s_End, params.s_Interval, errors);
    params.s_Method = parameters["method"].fallback(params.s_Method);
    params.s_MaxSensors = parameters[MAX_SENSORS].fallback(params.s_MaxSensors);
    params.s_MaxBuckets = parameters[MAX_BUCKETS].fallback(params.s_MaxBuckets);
    params.s_MinOverlap = parameters["min_overlap"].fallback(params.s_MinOverlap);
    params.s_MinSignificantN = parameters["min_significant_n"].fallback(params.s_MinSignificantN);
    params.s_SignificanceAlpha =
        parameters["significance_alpha"].fallback(params.s_SignificanceAlpha);
    params.s_MinAbsR = parameters["min_abs_r"].fallback(params.s_MinAbsR);
    params.s_Aggregation = parameters[BUCKET_AGGREGATION_MODE].fallback(params.s_Aggregation);
    params.s_ValueMode = parameters["value_mode"].fallback(params.s_ValueMode);
    params.s_LagMode = parameters["lag_mode"].fallback(params.s_LagMode);
    params.s_MaxLagBuckets = parameters[MAX_LAG_BUCKETS].fallback(params.s_MaxLagBuckets);
    analytics::CCorrelationMatrix::clamp(params);
    return params;
}

TParamsVariant readMatrixProfile(const json::value& json, TStrVec& errors) {
    analytics::CMatrixProfile::SParams params;
    CJobParameters parameters{matrixProfileReader().read(json, errors)};
    params.s_SensorId = parameters["sensor_id"].fallback(params.s_SensorId);
    core::CStringUtils::trimWhitespace(params.s_SensorId);
    if (parameters["sensor_id"].present() && params.s_SensorId.empty()) {
        errors.push_back("sensor_id must not be empty");
    }
    readWindow(parameters, params.s_Start, params.s_End, params.s_Interval, errors);
    params.s_Aggregation = parameters[BUCKET_AGGREGATION_MODE].fallback(params.s_Aggregation);
    params.s_Window = parameters["window_points"].fallback(params.s_Window);
    params.s_ExclusionZone = parameters["exclusion_zone"].optional<std::size_t>();
    params.s_MaxPoints = parameters["max_points"].fallback(params.s_MaxPoints);
    params.s_MaxWindows = parameters["max_windows"].fallback(params.s_MaxWindows);
    params.s_TopK = parameters["top_k"].fallback(params.s_TopK);
    params.s_MaxComputeMs = parameters["max_compute_ms"].fallback(std::size_t{params.s_MaxComputeMs});
    analytics::CMatrixProfile::clamp(params);
    return params;
}

TParamsVariant readEventMatch(const json::value& json, TStrVec& errors) {
    analytics::CEventMatcher::SParams params;
    CJobParameters parameters{eventMatchReader().read(json, errors)};
    params.s_FocusSensorId = parameters[FOCUS_SENSOR_ID].fallback(params.s_FocusSensorId);
    core::CStringUtils::trimWhitespace(params.s_FocusSensorId);
    if (parameters[FOCUS_SENSOR_ID].present() && params.s_FocusSensorId.empty()) {
        errors.push_back("focus_sensor_id must not be empty");
    }
    readWindow(parameters, params.s_Start, params.s_End, params.s_Interval, errors);
    readFocusEvents(parameters, params.s_FocusEvents, errors);
    readIds(parameters, CANDIDATE_SENSOR_IDS, params.s_CandidateSensorIds);
    params.s_CandidateLimit = parameters[CANDIDATE_LIMIT].fallback(params.s_CandidateLimit);
    readFilters(parameters, params.s_Filters, errors);
    params.s_MaxBuckets = parameters[MAX_BUCKETS].fallback(params.s_MaxBuckets);
    params.s_MaxLagBuckets = parameters[MAX_LAG_BUCKETS].fallback(params.s_MaxLagBuckets);
    params.s_TopKLags = parameters["top_k_lags"].fallback(params.s_TopKLags);
    params.s_ToleranceBuckets = parameters[TOLERANCE_BUCKETS].fallback(params.s_ToleranceBuckets);
    params.s_MinOverlap = parameters["min_overlap"].fallback(params.s_MinOverlap);
    params.s_MaxEpisodes = parameters[MAX_EPISODES].fallback(params.s_MaxEpisodes);
    params.s_EpisodeGapBuckets = parameters[EPISODE_GAP_BUCKETS].fallback(params.s_EpisodeGapBuckets);
    params.s_ZCap = parameters[Z_CAP].fallback(params.s_ZCap);
    params.s_PeriodicPenalty = parameters[PERIODIC_PENALTY_ENABLED].fallback(params.s_PeriodicPenalty);
    readDetector(parameters, true, params.s_Detector, errors);
    checkZThreshold(params.s_Detector.s_ZThreshold, errors);
    params.s_Detector.s_Interval = params.s_Interval;
    analytics::CEventMatcher::clamp(params);
    return params;
}

TParamsVariant readCooccurrence(const json::value& json, TStrVec& errors) {
    analytics::CCooccurrenceScorer::SParams params;
    CJobParameters parameters{cooccurrenceReader().read(json, errors)};
    readIds(parameters, SENSOR_IDS, params.s_SensorIds);
    if (parameters[SENSOR_IDS].present() && params.s_SensorIds.size() < 2) {
        errors.push_back("At least two sensor_ids are required");
    }
    readWindow(parameters, params.s_Start, params.s_End, params.s_Interval, errors);
    params.s_FocusSensorId = parameters[FOCUS_SENSOR_ID].optional<std::string>();
    params.s_MaxBuckets = parameters[MAX_BUCKETS].fallback(params.s_MaxBuckets);
    params.s_MaxSensors = parameters[MAX_SENSORS].fallback(params.s_MaxSensors);
    params.s_ToleranceBuckets = parameters[TOLERANCE_BUCKETS].fallback(params.s_ToleranceBuckets);
    params.s_MinSensors = parameters[MIN_SENSORS].fallback(params.s_MinSensors);
    params.s_MaxResults = parameters[MAX_RESULTS].fallback(params.s_MaxResults);
    params.s_ZCap = parameters[Z_CAP].fallback(params.s_ZCap);
    params.s_PeriodicPenalty = parameters[PERIODIC_PENALTY_ENABLED].fallback(params.s_PeriodicPenalty);
    params.s_Preference = parameters["bucket_preference_mode"].fallback(params.s_Preference);
    readDetector(parameters, true, params.s_Detector, errors);
    checkZThreshold(params.s_Detector.s_ZThreshold, errors);
    params.s_Detector.s_Interval = params.s_Interval;
    return params;
}

TParamsVariant readRelatedSensorsUnified(const json::value& json,
                                         const std::string& jobKey,
                                         TStrVec& errors) {
    analytics::CUnifiedRanker::SParams params;
    params.s_JobKey = jobKey;
    CJobParameters parameters{relatedSensorsUnifiedReader().read(json, errors)};
    params.s_FocusSensorId = parameters[FOCUS_SENSOR_ID].fallback(params.s_FocusSensorId);
    core::CStringUtils::trimWhitespace(params.s_FocusSensorId);
    if (parameters[FOCUS_SENSOR_ID].present() && params.s_FocusSensorId.empty()) {
        errors.push_back("focus_sensor_id must not be empty");
    }
    readWindow(parameters, params.s_Start, params.s_End, params.s_Interval, errors);
    readFocusEvents(parameters, params.s_FocusEvents, errors);
    params.s_Mode = parameters["mode"].fallback(params.s_Mode);
    readIds(parameters, CANDIDATE_SENSOR_IDS, params.s_CandidateSensorIds);
    readIds(parameters, "pinned_sensor_ids", params.s_PinnedSensorIds);
    params.s_EvaluateAllEligible =
        parameters["evaluate_all_eligible"].fallback(params.s_EvaluateAllEligible);
    params.s_CandidateLimit = parameters[CANDIDATE_LIMIT].optional<std::size_t>();
    params.s_MaxResults = parameters[MAX_RESULTS].optional<std::size_t>();
    params.s_IncludeLowConfidence = parameters["include_low_confidence"].optional<bool>();
    params.s_QuickSuggest = parameters["quick_suggest"].fallback(params.s_QuickSuggest);
    params.s_StabilityEnabled = parameters["stability_enabled"].fallback(params.s_StabilityEnabled);
    params.s_ExcludeSystemWideBuckets =
        parameters["exclude_system_wide_buckets"].fallback(params.s_ExcludeSystemWideBuckets);
    readFilters(parameters, params.s_Filters, errors);
    if (const json::value* value = parameters["weights"].jsonObject()) {
        CJobParameters weights{weightsReader().read(*value, errors)};
        analytics::CUnifiedRanker::SWeights weights_;
        weights_.s_Events = weights["events"].fallback(weights_.s_Events);
        weights_.s_Cooccurrence = weights["cooccurrence"].fallback(weights_.s_Cooccurrence);
        weights_.s_DeltaCorrelation = weights["delta_corr"].optional<double>();
        for (double weight : {weights_.s_Events, weights_.s_Cooccurrence,
                              weights_.s_DeltaCorrelation.value_or(0.0)}) {
            if (std::isfinite(weight) == false || weight < 0.0) {
                errors.push_back("weights must be non-negative");
                break;
            }
        }
        params.s_Weights = weights_;
    }
    params.s_ZThreshold = parameters[Z_THRESHOLD].optional<double>();
    if (params.s_ZThreshold != std::nullopt) {
        checkZThreshold(*params.s_ZThreshold, errors);
    }
    params.s_MaxEvents = parameters[MAX_EVENTS].optional<std::size_t>();
    params.s_ZCap = parameters[Z_CAP].fallback(params.s_ZCap);
    params.s_MaxLagBuckets = parameters[MAX_LAG_BUCKETS].optional<std::size_t>();
    params.s_MaxEpisodes = parameters[MAX_EPISODES].optional<std::size_t>();
    params.s_EpisodeGapBuckets = parameters[EPISODE_GAP_BUCKETS].fallback(params.s_EpisodeGapBuckets);
    params.s_ToleranceBuckets = parameters[TOLERANCE_BUCKETS].optional<std::size_t>();
    params.s_MinSensors = parameters[MIN_SENSORS].fallback(params.s_MinSensors);
    params.s_IncludeDeltaCorrelation = parameters["include_delta_corr_signal"].optional<bool>();
    params.s_PeriodicPenalty = parameters[PERIODIC_PENALTY_ENABLED].optional<bool>();
    params.s_CooccurrenceMetric =
        parameters["cooccurrence_score_mode"].fallback(params.s_CooccurrenceMetric);
    params.s_BucketPreference =
        parameters["cooccurrence_bucket_preference_mode"].fallback(params.s_BucketPreference);
    readDetector(parameters, false, params.s_Detector, errors);
    params.s_Detector.s_Interval = params.s_Interval;
    return params;
}

TParamsVariant readNoop(const json::value& json, TStrVec& errors) {
    SNoopParams params;
    CJobParameters parameters{noopReader().read(json, errors)};
    params.s_Steps = std::min(std::max(parameters["steps"].fallback(params.s_Steps), std::size_t{1}),
                              CJobParams::MAX_NOOP_STEPS);
    params.s_StepMs = std::min(parameters["step_ms"].fallback(std::size_t{params.s_StepMs}),
                               std::size_t{CJobParams::MAX_NOOP_STEP_MS});
    return params;
}
}

CJobParams::CJobParams(TVariant params) : m_Params{std::move(params)} {
}

api_t::EJobType CJobParams::type() const {
    return static_cast<api_t::EJobType>(m_Params.index());
}

const CJobParams::TVariant& CJobParams::value() const {
    return m_Params;
}

bool CJobParams::fromJson(api_t::EJobType type,
                          const json::value& json,
                          const std::string& jobKey,
                          CJobParams& result,
                          std::string& error) {
    TStrVec errors;
    TVariant params;
    switch (type) {
    case api_t::E_CorrelationMatrix:
        params = readCorrelationMatrix(json, errors);
        break;
    case api_t::E_MatrixProfile:
        params = readMatrixProfile(json, errors);
        break;
    case api_t::E_EventMatch:
        params = readEventMatch(json, errors);
        break;
    case api_t::E_Cooccurrence:
        params = readCooccurrence(json, errors);
        break;
    case api_t::E_RelatedSensorsUnified:
        params = readRelatedSensorsUnified(json, jobKey, errors);
        break;
    case api_t::E_Noop:
        params = readNoop(json.is_null() ? json::value(json::object{}) : json, errors);
        break;
    }
    if (errors.empty() == false) {
        error = join(errors);
        LOG_DEBUG(<< "Rejected " << api_t::print(type) << " parameters: " << error);
        return false;
    }
    result = CJobParams{std::move(params)};
    return true;
}

bool CJobParams::parseTime(const json::value& value, core_t::TTime& result) {
    if (value.is_int64()) {
        result = value.as_int64();
        return true;
    }
    if (value.is_uint64()) {
        return false;
    }
    if (value.is_string()) {
        std::string time{value.as_string()};
        core::CStringUtils::trimWhitespace(time);
        return core::CTimeUtils::fromString(time, result);
    }
    return false;
}
}
}
