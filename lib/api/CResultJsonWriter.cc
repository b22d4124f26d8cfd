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
#include <api/CResultJsonWriter.h>

#include <core/CLogger.h>
#include <core/CTimeUtils.h>

#include <api/CJobParams.h>
#include <api/JobTypes.h>

#include <cmath>
#include <exception>
#include <string>
#include <vector>

namespace tsse {
namespace api {
namespace {

// JSON field names
const std::string JOB_TYPE{"job_type"};
const std::string PARAMS{"params"};
const std::string START{"start"};
const std::string END{"end"};
const std::string INTERVAL_SECONDS{"interval_seconds"};
const std::string BUCKET_COUNT{"bucket_count"};
const std::string COMPUTED_THROUGH_TS{"computed_through_ts"};
const std::string SENSOR_ID{"sensor_id"};
const std::string SENSOR_IDS{"sensor_ids"};
const std::string FOCUS_SENSOR_ID{"focus_sensor_id"};
const std::string CANDIDATES{"candidates"};
const std::string TRUNCATED_SENSOR_IDS{"truncated_sensor_ids"};
const std::string SKIPPED_SENSORS{"skipped_sensors"};
const std::string GAP_SKIPPED_DELTAS{"gap_skipped_deltas"};
const std::string MONITORING{"monitoring"};
const std::string TIMINGS_MS{"timings_ms"};
const std::string VERSIONS{"versions"};
const std::string WARNINGS{"warnings"};
const std::string SCORE{"score"};
const std::string OVERLAP{"overlap"};
const std::string LAG_SEC{"lag_sec"};
const std::string EPISODES{"episodes"};
const std::string RANK{"rank"};
const std::string Z_CAP{"z_cap"};

const std::vector<std::string> CORRELATION_CAVEATS{
    "p_value, q_value and confidence intervals are asymptotic approximations "
    "which assume independent buckets; treat them as a heuristic ranking aid",
    "n_eff shrinks n for lag-1 autocorrelation but does not remove the bias "
    "of autocorrelated telemetry",
    "best lag selection is only partially corrected for the number of lags searched"};

std::string printPolarity(analytics::CEventDetector::EPolarity polarity) {
    switch (polarity) {
    case analytics::CEventDetector::E_Both:
        return "both";
    case analytics::CEventDetector::E_UpOnly:
        return "up";
    case analytics::CEventDetector::E_DownOnly:
        return "down";
    }
    return "both";
}

std::string printThresholdMode(analytics::CEventDetector::EThresholdMode mode) {
    return mode == analytics::CEventDetector::E_Fixed ? "fixed_z" : "adaptive_rate";
}

std::string printDetectorMode(analytics::CEventDetector::EDetectorMode mode) {
    switch (mode) {
    case analytics::CEventDetector::E_Deltas:
        return "bucket_deltas";
    case analytics::CEventDetector::E_SecondDeltas:
        return "bucket_second_deltas";
    case analytics::CEventDetector::E_Levels:
        return "bucket_levels";
    }
    return "bucket_deltas";
}

std::string printSuppression(analytics::CEventDetector::ESuppression suppression) {
    return suppression == analytics::CEventDetector::E_Nms ? "nms_window" : "greedy_min_separation";
}

std::string printDeseasoning(analytics::CEventDetector::EDeseasoning deseasoning) {
    return deseasoning == analytics::CEventDetector::E_NoDeseasoning ? "none" : "hour_of_day_mean";
}

std::string printMethod(maths::CCorrelation::EMethod method) {
    return method == maths::CCorrelation::E_Pearson ? "pearson" : "spearman";
}

std::string isoTime(core_t::TTime time) {
    return core::CTimeUtils::toIso8601(time);
}
}

template<typename F>
bool CResultJsonWriter::encode(const std::string& type, F f, json::value& document) const {
    try {
        document = f();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to encode " << type << " result: " << e.what());
    }
    return false;
}

template<typename T>
void CResultJsonWriter::addOptionalFieldToObj(const std::string& fieldName,
                                              const std::optional<T>& value,
                                              json::object& obj) const {
    if (value == std::nullopt) {
        obj[fieldName] = nullptr;
        return;
    }
    obj[fieldName] = *value;
}

bool CResultJsonWriter::write(const analytics::CCorrelationMatrix::SResult& result,
                              json::value& document) const {
    return this->encode(api_t::print(api_t::E_CorrelationMatrix),
                        [&] { return this->correlationMatrix(result); }, document);
}

bool CResultJsonWriter::write(const analytics::CMatrixProfile::SResult& result,
                              json::value& document) const {
    return this->encode(api_t::print(api_t::E_MatrixProfile),
                        [&] { return this->matrixProfile(result); }, document);
}

bool CResultJsonWriter::write(const analytics::CEventMatcher::SResult& result,
                              json::value& document) const {
    return this->encode(api_t::print(api_t::E_EventMatch),
                        [&] { return this->eventMatch(result); }, document);
}

bool CResultJsonWriter::write(const analytics::CCooccurrenceScorer::SResult& result,
                              json::value& document) const {
    return this->encode(api_t::print(api_t::E_Cooccurrence),
                        [&] { return this->cooccurrence(result); }, document);
}

bool CResultJsonWriter::write(const analytics::CUnifiedRanker::SResult& result,
                              json::value& document) const {
    return this->encode(api_t::print(api_t::E_RelatedSensorsUnified),
                        [&] { return this->relatedSensorsUnified(result); }, document);
}

bool CResultJsonWriter::write(const SNoopParams& params, json::value& document) const {
    return this->encode(api_t::print(api_t::E_Noop),
                        [&] {
                            json::object obj;
                            obj[JOB_TYPE] = api_t::print(api_t::E_Noop);
                            obj["status"] = api_t::print(api_t::E_Completed);
                            obj["steps"] = params.s_Steps;
                            obj["step_ms"] = params.s_StepMs;
                            return obj;
                        },
                        document);
}

json::object
CResultJsonWriter::correlationMatrix(const analytics::CCorrelationMatrix::SResult& result) const {
    using TMatrix = analytics::CCorrelationMatrix;

    const TMatrix::SParams& used{result.s_ParamsUsed};
    json::object params;
    this->addStringArrayFieldToObj(SENSOR_IDS, used.s_SensorIds, params);
    this->addTimeFieldToObj(START, used.s_Start, params);
    this->addTimeFieldToObj(END, used.s_End, params);
    params[INTERVAL_SECONDS] = used.s_Interval;
    params["method"] = printMethod(used.s_Method);
    params["max_sensors"] = used.s_MaxSensors;
    params["max_buckets"] = used.s_MaxBuckets;
    params["min_overlap"] = used.s_MinOverlap;
    params["min_significant_n"] = used.s_MinSignificantN;
    this->addDoubleFieldToObj("significance_alpha", used.s_SignificanceAlpha, params);
    this->addDoubleFieldToObj("min_abs_r", used.s_MinAbsR, params);
    params["bucket_aggregation_mode"] = analytics_t::print(used.s_Aggregation);
    params["value_mode"] = TMatrix::print(used.s_ValueMode);
    params["lag_mode"] = TMatrix::print(used.s_LagMode);
    params["max_lag_buckets"] = used.s_MaxLagBuckets;

    json::array sensors;
    for (const auto& sensor : result.s_Sensors) {
        sensors.push_back(json::object{{SENSOR_ID, sensor.s_SensorId},
                                       {"name", sensor.s_Name},
                                       {"unit", sensor.s_Unit},
                                       {"node_id", sensor.s_NodeId},
                                       {"sensor_type", sensor.s_Type},
                                       {"points", sensor.s_Points}});
    }

    json::array matrix;
    for (const auto& row : result.s_Matrix) {
        json::array cells;
        for (const auto& cell : row) {
            json::object obj;
            this->addOptionalDoubleFieldToObj("r", cell.s_R, obj);
            this->addOptionalDoubleFieldToObj("r_ci_low", cell.s_RConfidenceLow, obj);
            this->addOptionalDoubleFieldToObj("r_ci_high", cell.s_RConfidenceHigh, obj);
            this->addOptionalDoubleFieldToObj("p_value", cell.s_PValue, obj);
            this->addOptionalDoubleFieldToObj("q_value", cell.s_QValue, obj);
            obj["n"] = cell.s_N;
            this->addOptionalFieldToObj("n_eff", cell.s_NEff, obj);
            this->addOptionalFieldToObj(LAG_SEC, cell.s_LagSeconds, obj);
            obj["status"] = TMatrix::print(cell.s_Status);
            cells.push_back(std::move(obj));
        }
        matrix.push_back(std::move(cells));
    }

    json::object obj;
    obj[JOB_TYPE] = api_t::print(api_t::E_CorrelationMatrix);
    this->addTimeFieldToObj(COMPUTED_THROUGH_TS, used.s_End, obj);
    obj[PARAMS] = std::move(params);
    this->addStringArrayFieldToObj(SENSOR_IDS, result.s_SensorIds, obj);
    obj["sensors"] = std::move(sensors);
    obj["matrix"] = std::move(matrix);
    obj[INTERVAL_SECONDS] = result.s_Interval;
    obj[BUCKET_COUNT] = result.s_BucketCount;
    this->addStringArrayFieldToObj(TRUNCATED_SENSOR_IDS, result.s_TruncatedSensorIds, obj);
    obj[SKIPPED_SENSORS] = this->skipped(result.s_Skipped);
    obj[TIMINGS_MS] = this->timings(result.s_Timings);
    obj[VERSIONS] = json::object{{"correlation", result.s_CorrelationVersion},
                                 {"fdr", result.s_FdrVersion},
                                 {"n_eff", result.s_NEffVersion}};
    this->addStringArrayFieldToObj("caveats", CORRELATION_CAVEATS, obj);
    this->addStringArrayFieldToObj(WARNINGS, result.s_Warnings, obj);
    return obj;
}

json::object CResultJsonWriter::matrixProfile(const analytics::CMatrixProfile::SResult& result) const {
    const analytics::CMatrixProfile::SParams& used{result.s_ParamsUsed};
    json::object params;
    params[SENSOR_ID] = used.s_SensorId;
    this->addTimeFieldToObj(START, used.s_Start, params);
    this->addTimeFieldToObj(END, used.s_End, params);
    params[INTERVAL_SECONDS] = used.s_Interval;
    params["bucket_aggregation_mode"] = analytics_t::print(used.s_Aggregation);
    params["window_points"] = used.s_Window;
    this->addOptionalFieldToObj("exclusion_zone", used.s_ExclusionZone, params);
    params["max_points"] = used.s_MaxPoints;
    params["max_windows"] = used.s_MaxWindows;
    params["top_k"] = used.s_TopK;
    params["max_compute_ms"] = used.s_MaxComputeMs;

    json::array profileIndex;
    for (auto index : result.s_Profile.s_Indices) {
        profileIndex.push_back(index);
    }
    json::array motifs;
    for (const auto& motif : result.s_Motifs) {
        motifs.push_back(this->matrixProfileWindow(motif));
    }
    json::array anomalies;
    for (const auto& anomaly : result.s_Anomalies) {
        anomalies.push_back(this->matrixProfileWindow(anomaly));
    }

    json::object obj;
    obj[JOB_TYPE] = api_t::print(api_t::E_MatrixProfile);
    obj[SENSOR_ID] = result.s_SensorId;
    obj["sensor_label"] = result.s_SensorName;
    obj["unit"] = result.s_Unit;
    this->addTimeFieldToObj(COMPUTED_THROUGH_TS, used.s_End, obj);
    obj[PARAMS] = std::move(params);
    obj[INTERVAL_SECONDS] = result.s_Interval;
    obj["effective_interval_seconds"] =
        result.s_Interval * static_cast<core_t::TTime>(result.s_Step);
    obj["window_points"] = result.s_Window;
    obj["exclusion_zone"] = result.s_ExclusionZone;
    obj["step"] = result.s_Step;
    obj["window_step"] = result.s_WindowStep;
    this->addTimeArrayFieldToObj("timestamps", result.s_Times, obj);
    this->addDoubleArrayFieldToObj("values", result.s_Values, obj);
    this->addTimeArrayFieldToObj("window_start_ts", result.s_WindowStartTimes, obj);
    this->addDoubleArrayFieldToObj("profile", result.s_Profile.s_Distances, obj);
    obj["profile_index"] = std::move(profileIndex);
    obj["early_stopped"] = result.s_Profile.s_EarlyStopped;
    obj["windows_computed"] = result.s_Profile.s_WindowsComputed;
    obj["motifs"] = std::move(motifs);
    obj["anomalies"] = std::move(anomalies);
    obj["source_points"] = result.s_SourcePoints;
    obj["sampled_points"] = result.s_SampledPoints;
    this->addStringArrayFieldToObj(WARNINGS, result.s_Warnings, obj);
    obj[TIMINGS_MS] = this->timings(result.s_Timings);
    obj[VERSIONS] = json::object{{"matrix_profile", "self_join_znorm_v1"}};
    return obj;
}

json::object CResultJsonWriter::eventMatch(const analytics::CEventMatcher::SResult& result) const {
    const analytics::CEventMatcher::SParams& used{result.s_ParamsUsed};
    json::object params;
    params[FOCUS_SENSOR_ID] = used.s_FocusSensorId;
    this->addTimeFieldToObj(START, used.s_Start, params);
    this->addTimeFieldToObj(END, used.s_End, params);
    params[INTERVAL_SECONDS] = used.s_Interval;
    this->addStringArrayFieldToObj("candidate_sensor_ids", used.s_CandidateSensorIds, params);
    params["candidate_limit"] = used.s_CandidateLimit;
    params["filters"] = this->filters(used.s_Filters);
    params["max_buckets"] = used.s_MaxBuckets;
    params["max_lag_buckets"] = used.s_MaxLagBuckets;
    params["top_k_lags"] = used.s_TopKLags;
    params["tolerance_buckets"] = used.s_ToleranceBuckets;
    params["min_overlap"] = used.s_MinOverlap;
    params["max_episodes"] = used.s_MaxEpisodes;
    params["episode_gap_buckets"] = used.s_EpisodeGapBuckets;
    this->addDoubleFieldToObj(Z_CAP, used.s_ZCap, params);
    params["periodic_penalty_enabled"] = used.s_PeriodicPenalty;
    params["focus_events"] = used.s_FocusEvents.size();
    params["detector"] = this->detector(used.s_Detector);

    json::array candidates;
    for (const auto& candidate : result.s_Candidates) {
        json::object obj;
        obj[SENSOR_ID] = candidate.s_SensorId;
        obj[RANK] = candidate.s_Rank;
        this->addOptionalDoubleFieldToObj(SCORE, candidate.s_Score, obj);
        obj[OVERLAP] = candidate.s_Overlap;
        obj["n_focus"] = candidate.s_NumberFocus;
        obj["n_candidate"] = candidate.s_NumberCandidate;
        this->addOptionalFieldToObj("n_focus_up", candidate.s_FocusUpEvents, obj);
        this->addOptionalFieldToObj("n_focus_down", candidate.s_FocusDownEvents, obj);
        obj["n_candidate_up"] = candidate.s_CandidateUpEvents;
        obj["n_candidate_down"] = candidate.s_CandidateDownEvents;
        obj["zero_lag"] = this->lagScore(candidate.s_ZeroLag);
        if (candidate.s_BestLag != std::nullopt) {
            obj["best_lag"] = this->lagScore(*candidate.s_BestLag);
        } else {
            obj["best_lag"] = nullptr;
        }
        json::array topLags;
        for (const auto& lag : candidate.s_TopLags) {
            topLags.push_back(this->lagScore(lag));
        }
        obj["top_lags"] = std::move(topLags);
        obj["direction_label"] = analytics::CEventMatcher::print(candidate.s_Direction);
        this->addOptionalDoubleFieldToObj("sign_agreement", candidate.s_SignAgreement, obj);
        this->addOptionalDoubleFieldToObj("delta_corr", candidate.s_DeltaCorrelation, obj);
        obj["direction_n"] = candidate.s_DirectionN;
        this->addOptionalDoubleFieldToObj("time_of_day_entropy_norm", candidate.s_EntropyNorm, obj);
        this->addOptionalDoubleFieldToObj("time_of_day_entropy_weight",
                                          candidate.s_EntropyWeight, obj);
        json::array episodes;
        for (const auto& episode : candidate.s_Episodes) {
            episodes.push_back(this->episode(episode));
        }
        obj[EPISODES] = std::move(episodes);
        obj["overlap_weighted"] = candidate.s_OverlapWeighted;
        this->addDoubleFieldToObj("overlap_weighted_sum", candidate.s_OverlapWeightedSum, obj);
        this->addOptionalDoubleFieldToObj("embedding_cosine", candidate.s_EmbeddingCosine, obj);
        candidates.push_back(std::move(obj));
    }

    json::object obj;
    obj[JOB_TYPE] = api_t::print(api_t::E_EventMatch);
    obj[FOCUS_SENSOR_ID] = result.s_FocusSensorId;
    this->addTimeFieldToObj(COMPUTED_THROUGH_TS, used.s_End, obj);
    obj[INTERVAL_SECONDS] = result.s_Interval;
    obj[BUCKET_COUNT] = result.s_BucketCount;
    obj[PARAMS] = std::move(params);
    obj[CANDIDATES] = std::move(candidates);
    this->addStringArrayFieldToObj(TRUNCATED_SENSOR_IDS, result.s_TruncatedSensorIds, obj);
    obj[SKIPPED_SENSORS] = this->skipped(result.s_Skipped);
    obj[GAP_SKIPPED_DELTAS] = this->counts(result.s_GapSkippedDeltas);
    obj[MONITORING] = this->monitoring(result.s_Monitoring);
    obj[TIMINGS_MS] = this->timings(result.s_Timings);
    obj[VERSIONS] = json::object{{"event_match", "weighted_f1_v1"}};
    this->addStringArrayFieldToObj(WARNINGS, result.s_Warnings, obj);
    return obj;
}

json::object
CResultJsonWriter::cooccurrence(const analytics::CCooccurrenceScorer::SResult& result) const {
    const analytics::CCooccurrenceScorer::SParams& used{result.s_ParamsUsed};
    json::object params;
    this->addStringArrayFieldToObj(SENSOR_IDS, used.s_SensorIds, params);
    this->addTimeFieldToObj(START, used.s_Start, params);
    this->addTimeFieldToObj(END, used.s_End, params);
    params[INTERVAL_SECONDS] = used.s_Interval;
    this->addOptionalFieldToObj(FOCUS_SENSOR_ID, used.s_FocusSensorId, params);
    params["max_sensors"] = used.s_MaxSensors;
    params["max_buckets"] = used.s_MaxBuckets;
    params["tolerance_buckets"] = used.s_ToleranceBuckets;
    params["min_sensors"] = used.s_MinSensors;
    params["max_results"] = used.s_MaxResults;
    this->addDoubleFieldToObj(Z_CAP, used.s_ZCap, params);
    params["periodic_penalty_enabled"] = used.s_PeriodicPenalty;
    params["bucket_preference_mode"] = analytics::CCooccurrenceScorer::print(used.s_Preference);
    params["detector"] = this->detector(used.s_Detector);

    json::array buckets;
    for (const auto& bucket : result.s_Buckets) {
        json::array sensors;
        for (const auto& sensor : bucket.s_Sensors) {
            json::object participant;
            participant[SENSOR_ID] = sensor.s_SensorId;
            this->addTimeFieldToObj("ts", sensor.s_Time, participant);
            this->addDoubleFieldToObj("z", sensor.s_Z, participant);
            participant["direction"] = analytics_t::print(sensor.s_Direction);
            this->addDoubleFieldToObj("delta", sensor.s_Delta, participant);
            sensors.push_back(std::move(participant));
        }
        json::object obj;
        this->addTimeFieldToObj("ts", bucket.s_Time, obj);
        obj["sensors"] = std::move(sensors);
        obj["group_size"] = bucket.s_GroupSize;
        this->addDoubleFieldToObj("severity_sum", bucket.s_SeveritySum, obj);
        this->addDoubleFieldToObj("pair_weight", bucket.s_PairWeight, obj);
        this->addOptionalDoubleFieldToObj("idf", bucket.s_Idf, obj);
        this->addDoubleFieldToObj(SCORE, bucket.s_Score, obj);
        this->addOptionalDoubleFieldToObj("focus_strength", bucket.s_FocusStrength, obj);
        buckets.push_back(std::move(obj));
    }

    json::object sensorStats;
    for (const auto& stats : result.s_SensorStats) {
        json::object obj;
        obj["n_events"] = stats.second.s_NumberEvents;
        this->addDoubleFieldToObj("mean_abs_z", stats.second.s_MeanAbsZ, obj);
        sensorStats[stats.first] = std::move(obj);
    }

    json::object obj;
    obj[JOB_TYPE] = api_t::print(api_t::E_Cooccurrence);
    this->addTimeFieldToObj(COMPUTED_THROUGH_TS, used.s_End, obj);
    obj[INTERVAL_SECONDS] = result.s_Interval;
    obj[BUCKET_COUNT] = result.s_BucketCount;
    obj[PARAMS] = std::move(params);
    obj["buckets"] = std::move(buckets);
    this->addStringArrayFieldToObj(TRUNCATED_SENSOR_IDS, result.s_TruncatedSensorIds, obj);
    obj[SKIPPED_SENSORS] = this->skipped(result.s_Skipped);
    obj[GAP_SKIPPED_DELTAS] = this->counts(result.s_GapSkippedDeltas);
    obj[TIMINGS_MS] = this->timings(result.s_Timings);
    obj["counts"] = json::object{
        {"events", result.s_EventCount},
        {"deseason_applied", result.s_DeseasoningApplied},
        {"deseason_skipped_insufficient_window", result.s_DeseasoningSkippedInsufficientWindow}};
    obj["sensor_stats"] = std::move(sensorStats);
    obj[VERSIONS] = json::object{{"cooccurrence", "idf_v1"}};
    this->addStringArrayFieldToObj(WARNINGS, result.s_Warnings, obj);
    return obj;
}

json::object
CResultJsonWriter::relatedSensorsUnified(const analytics::CUnifiedRanker::SResult& result) const {
    using TRanker = analytics::CUnifiedRanker;

    const TRanker::SParams& used{result.s_ParamsUsed};
    json::object params;
    params[FOCUS_SENSOR_ID] = used.s_FocusSensorId;
    this->addTimeFieldToObj(START, used.s_Start, params);
    this->addTimeFieldToObj(END, used.s_End, params);
    params[INTERVAL_SECONDS] = used.s_Interval;
    params["mode"] = TRanker::print(used.s_Mode);
    this->addStringArrayFieldToObj("candidate_sensor_ids", used.s_CandidateSensorIds, params);
    this->addStringArrayFieldToObj("pinned_sensor_ids", used.s_PinnedSensorIds, params);
    params["evaluate_all_eligible"] = used.s_EvaluateAllEligible;
    this->addOptionalFieldToObj("candidate_limit", used.s_CandidateLimit, params);
    this->addOptionalFieldToObj("max_results", used.s_MaxResults, params);
    this->addOptionalFieldToObj("include_low_confidence", used.s_IncludeLowConfidence, params);
    params["quick_suggest"] = used.s_QuickSuggest;
    params["stability_enabled"] = used.s_StabilityEnabled;
    params["exclude_system_wide_buckets"] = used.s_ExcludeSystemWideBuckets;
    params["filters"] = this->filters(used.s_Filters);
    if (used.s_Weights != std::nullopt) {
        json::object weights;
        this->addDoubleFieldToObj("events", used.s_Weights->s_Events, weights);
        this->addDoubleFieldToObj("cooccurrence", used.s_Weights->s_Cooccurrence, weights);
        this->addOptionalDoubleFieldToObj("delta_corr", used.s_Weights->s_DeltaCorrelation, weights);
        params["weights"] = std::move(weights);
    } else {
        params["weights"] = nullptr;
    }
    this->addOptionalDoubleFieldToObj("z_threshold", used.s_ZThreshold, params);
    this->addOptionalFieldToObj("max_events", used.s_MaxEvents, params);
    this->addOptionalFieldToObj("max_lag_buckets", used.s_MaxLagBuckets, params);
    this->addOptionalFieldToObj("max_episodes", used.s_MaxEpisodes, params);
    this->addOptionalFieldToObj("tolerance_buckets", used.s_ToleranceBuckets, params);
    params["episode_gap_buckets"] = used.s_EpisodeGapBuckets;
    params["min_sensors"] = used.s_MinSensors;
    this->addDoubleFieldToObj(Z_CAP, used.s_ZCap, params);
    this->addOptionalFieldToObj("include_delta_corr_signal", used.s_IncludeDeltaCorrelation, params);
    this->addOptionalFieldToObj("periodic_penalty_enabled", used.s_PeriodicPenalty, params);
    params["cooccurrence_score_mode"] = TRanker::print(used.s_CooccurrenceMetric);
    params["cooccurrence_bucket_preference_mode"] =
        analytics::CCooccurrenceScorer::print(used.s_BucketPreference);
    params["focus_events"] = used.s_FocusEvents.size();
    params["detector"] = this->detector(used.s_Detector);

    json::array candidates;
    for (const auto& candidate : result.s_Candidates) {
        const TRanker::SEvidence& evidence{candidate.s_Evidence};
        json::object evidenceObj;
        this->addOptionalDoubleFieldToObj("events_score", evidence.s_EventsScore, evidenceObj);
        this->addOptionalDoubleFieldToObj("cooccurrence_score", evidence.s_CooccurrenceScore, evidenceObj);
        this->addOptionalDoubleFieldToObj("cooccurrence_avg", evidence.s_CooccurrenceAvg, evidenceObj);
        this->addOptionalDoubleFieldToObj("cooccurrence_surprise",
                                          evidence.s_CooccurrenceSurprise, evidenceObj);
        this->addOptionalDoubleFieldToObj("cooccurrence_strength",
                                          evidence.s_CooccurrenceStrength, evidenceObj);
        this->addOptionalFieldToObj("events_overlap", evidence.s_EventsOverlap, evidenceObj);
        this->addOptionalFieldToObj("n_focus", evidence.s_NumberFocus, evidenceObj);
        this->addOptionalFieldToObj("n_candidate", evidence.s_NumberCandidate, evidenceObj);
        this->addOptionalFieldToObj("n_focus_up", evidence.s_FocusUpEvents, evidenceObj);
        this->addOptionalFieldToObj("n_focus_down", evidence.s_FocusDownEvents, evidenceObj);
        this->addOptionalFieldToObj("n_candidate_up", evidence.s_CandidateUpEvents, evidenceObj);
        this->addOptionalFieldToObj("n_candidate_down", evidence.s_CandidateDownEvents, evidenceObj);
        this->addOptionalFieldToObj("cooccurrence_count", evidence.s_CooccurrenceCount, evidenceObj);
        this->addOptionalDoubleFieldToObj("focus_bucket_coverage_pct",
                                          evidence.s_FocusBucketCoveragePct, evidenceObj);
        this->addOptionalDoubleFieldToObj("candidate_bucket_coverage_pct",
                                          evidence.s_CandidateBucketCoveragePct, evidenceObj);
        this->addOptionalFieldToObj("best_lag_sec", evidence.s_BestLagSeconds, evidenceObj);
        json::array topLags;
        for (const auto& lag : evidence.s_TopLags) {
            topLags.push_back(this->lagScore(lag));
        }
        evidenceObj["top_lags"] = std::move(topLags);
        if (evidence.s_Direction != std::nullopt) {
            evidenceObj["direction_label"] = analytics::CEventMatcher::print(*evidence.s_Direction);
        } else {
            evidenceObj["direction_label"] = nullptr;
        }
        this->addOptionalDoubleFieldToObj("sign_agreement", evidence.s_SignAgreement, evidenceObj);
        this->addOptionalDoubleFieldToObj("delta_corr", evidence.s_DeltaCorrelation, evidenceObj);
        this->addOptionalFieldToObj("direction_n", evidence.s_DirectionN, evidenceObj);
        this->addOptionalDoubleFieldToObj("time_of_day_entropy_norm", evidence.s_EntropyNorm, evidenceObj);
        this->addOptionalDoubleFieldToObj("time_of_day_entropy_weight",
                                          evidence.s_EntropyWeight, evidenceObj);
        evidenceObj["diurnal_lag"] = evidence.s_DiurnalLag;
        evidenceObj["multi_episode_bonus"] = evidence.s_MultiEpisodeBonus;
        this->addStringArrayFieldToObj("summary", evidence.s_Summary, evidenceObj);

        json::array episodes;
        for (const auto& episode : candidate.s_Episodes) {
            episodes.push_back(this->episode(episode));
        }

        json::object obj;
        obj[SENSOR_ID] = candidate.s_SensorId;
        obj["derived_from_focus"] = candidate.s_DerivedFromFocus;
        this->addStringArrayFieldToObj("derived_dependency_path",
                                       candidate.s_DerivedDependencyPath, obj);
        obj[RANK] = candidate.s_Rank;
        this->addDoubleFieldToObj("blended_score", candidate.s_BlendedScore, obj);
        obj["confidence_tier"] = analytics_t::print(candidate.s_Confidence);
        obj[EPISODES] = std::move(episodes);
        this->addTimeArrayFieldToObj("top_bucket_timestamps", candidate.s_TopBucketTimes, obj);
        obj["evidence"] = std::move(evidenceObj);
        candidates.push_back(std::move(obj));
    }

    json::array systemWideBuckets;
    for (const auto& bucket : result.s_SystemWideBuckets) {
        json::object obj;
        this->addTimeFieldToObj("ts", bucket.s_Time, obj);
        obj["group_size"] = bucket.s_GroupSize;
        this->addDoubleFieldToObj("severity_sum", bucket.s_SeveritySum, obj);
        systemWideBuckets.push_back(std::move(obj));
    }

    json::object derivedPaths;
    for (const auto& path : result.s_DerivedDependencyPaths) {
        json::array ids;
        for (const auto& id : path.second) {
            ids.push_back(json::value(id));
        }
        derivedPaths[path.first] = std::move(ids);
    }

    json::object obj;
    obj[JOB_TYPE] = api_t::print(api_t::E_RelatedSensorsUnified);
    obj[FOCUS_SENSOR_ID] = result.s_FocusSensorId;
    this->addTimeFieldToObj(COMPUTED_THROUGH_TS, used.s_End, obj);
    obj["evidence_source"] = TRanker::print(result.s_EvidenceSource);
    obj[INTERVAL_SECONDS] = result.s_Interval;
    obj[BUCKET_COUNT] = result.s_BucketCount;
    obj[PARAMS] = std::move(params);
    obj["limits_used"] = json::object{{"candidate_limit_used", result.s_Limits.s_CandidateLimitUsed},
                                      {"max_results_used", result.s_Limits.s_MaxResultsUsed},
                                      {"max_sensors_used", result.s_Limits.s_MaxSensorsUsed}};
    obj[CANDIDATES] = std::move(candidates);
    obj["skipped_candidates"] = this->skipped(result.s_Skipped);
    obj["system_wide_buckets"] = std::move(systemWideBuckets);
    this->addStringArrayFieldToObj("prefiltered_candidate_sensor_ids",
                                   result.s_PrefilteredSensorIds, obj);
    this->addStringArrayFieldToObj("truncated_candidate_sensor_ids",
                                   result.s_TruncatedSensorIds, obj);
    this->addStringArrayFieldToObj("truncated_result_sensor_ids",
                                   result.s_TruncatedResultSensorIds, obj);
    obj["derived_dependency_paths"] = std::move(derivedPaths);
    obj["counts"] = this->counts(result.s_Counts);
    obj[TIMINGS_MS] = this->timings(result.s_Timings);
    if (result.s_Monitoring != std::nullopt) {
        obj[MONITORING] = this->monitoring(*result.s_Monitoring);
    } else {
        obj[MONITORING] = nullptr;
    }
    if (result.s_Stability != std::nullopt) {
        const TRanker::SStability& stability{*result.s_Stability};
        json::object stabilityObj;
        stabilityObj["status"] = TRanker::print(stability.s_Status);
        stabilityObj["k"] = stability.s_K;
        stabilityObj["window_count"] = stability.s_WindowCount;
        this->addOptionalDoubleFieldToObj(SCORE, stability.s_Score, stabilityObj);
        if (stability.s_Tier != std::nullopt) {
            stabilityObj["tier"] = analytics_t::print(*stability.s_Tier);
        } else {
            stabilityObj["tier"] = nullptr;
        }
        this->addDoubleArrayFieldToObj("overlaps", stability.s_Overlaps, stabilityObj);
        if (stability.s_Reason.empty() == false) {
            stabilityObj["reason"] = stability.s_Reason;
        }
        obj["stability"] = std::move(stabilityObj);
    } else {
        obj["stability"] = nullptr;
    }
    obj[GAP_SKIPPED_DELTAS] = this->counts(result.s_GapSkippedDeltas);
    // The blended score is only meaningful relative to the other candidates
    // of the same run.
    obj["rank_score_semantics"] = "pool_relative";
    obj[VERSIONS] = json::object{{"unified", "blend_v2"}};
    this->addStringArrayFieldToObj(WARNINGS, result.s_Warnings, obj);
    return obj;
}

json::object CResultJsonWriter::lagScore(const analytics::CEventMatcher::SLagScore& score) const {
    json::object obj;
    obj[LAG_SEC] = score.s_LagSeconds;
    this->addOptionalDoubleFieldToObj(SCORE, score.s_Score, obj);
    obj[OVERLAP] = score.s_Overlap;
    obj["n_candidate"] = score.s_NumberCandidate;
    this->addDoubleFieldToObj("alignment_error_sec", score.s_AlignmentError, obj);
    return obj;
}

json::object CResultJsonWriter::episode(const analytics::SEpisode& episode) const {
    json::object obj;
    this->addTimeFieldToObj("start_ts", episode.s_StartTime, obj);
    this->addTimeFieldToObj("end_ts", episode.s_EndTime, obj);
    obj["window_sec"] = episode.s_EndTime - episode.s_StartTime;
    obj[LAG_SEC] = episode.s_LagSeconds;
    this->addDoubleFieldToObj("score_mean", episode.s_ScoreMean, obj);
    this->addDoubleFieldToObj("score_peak", episode.s_ScorePeak, obj);
    this->addDoubleFieldToObj("coverage", episode.s_Coverage, obj);
    obj["num_points"] = episode.s_NumPoints;
    return obj;
}

json::object
CResultJsonWriter::monitoring(const analytics::CEventMatcher::SMonitoring& monitoring) const {
    json::object obj;
    this->addOptionalDoubleFieldToObj("peak_abs_z_p50", monitoring.s_PeakAbsZP50, obj);
    this->addOptionalDoubleFieldToObj("peak_abs_z_p90", monitoring.s_PeakAbsZP90, obj);
    this->addOptionalDoubleFieldToObj("peak_abs_z_p95", monitoring.s_PeakAbsZP95, obj);
    this->addOptionalDoubleFieldToObj("peak_abs_z_p99", monitoring.s_PeakAbsZP99, obj);
    this->addDoubleFieldToObj(Z_CAP, monitoring.s_ZCap, obj);
    obj["events_total"] = monitoring.s_EventsTotal;
    obj["z_clipped_events"] = monitoring.s_ZClippedEvents;
    this->addDoubleFieldToObj("z_clipped_pct", 100.0 * monitoring.s_ZClippedFraction, obj);
    obj["delta_points_total"] = monitoring.s_DeltaPointsTotal;
    obj["gap_skipped_deltas_total"] = monitoring.s_GapSkippedDeltasTotal;
    this->addDoubleFieldToObj("gap_skipped_pct", 100.0 * monitoring.s_GapSkippedFraction, obj);
    return obj;
}

json::object CResultJsonWriter::detector(const analytics::CEventDetector::SOptions& options) const {
    json::object obj;
    this->addDoubleFieldToObj("z_threshold", options.s_ZThreshold, obj);
    obj["threshold_mode"] = printThresholdMode(options.s_ThresholdMode);
    this->addOptionalDoubleFieldToObj("adaptive_min_z", options.s_AdaptiveMinZ, obj);
    this->addOptionalFieldToObj("target_min_events", options.s_TargetMinEvents, obj);
    this->addOptionalFieldToObj("target_max_events", options.s_TargetMaxEvents, obj);
    obj["detector_mode"] = printDetectorMode(options.s_DetectorMode);
    obj["suppression_mode"] = printSuppression(options.s_Suppression);
    obj["min_separation_buckets"] = options.s_MinSeparationBuckets;
    obj["gap_max_buckets"] = options.s_GapMaxBuckets;
    obj["polarity"] = printPolarity(options.s_Polarity);
    obj["max_events"] = options.s_MaxEvents;
    obj["exclude_boundary_events"] = options.s_ExcludeBoundaryEvents;
    obj["sparse_point_events_enabled"] = options.s_SparseFallback;
    obj["deseason_mode"] = printDeseasoning(options.s_Deseasoning);
    return obj;
}

json::object CResultJsonWriter::filters(const analytics::SCandidateFilters& filters) const {
    json::object obj;
    obj["same_node_only"] = filters.s_SameNodeOnly;
    obj["same_unit_only"] = filters.s_SameUnitOnly;
    obj["same_type_only"] = filters.s_SameTypeOnly;
    this->addOptionalFieldToObj(INTERVAL_SECONDS, filters.s_IntervalSeconds, obj);
    this->addOptionalFieldToObj("is_derived", filters.s_IsDerived, obj);
    this->addOptionalFieldToObj("is_public_provider", filters.s_IsPublicProvider, obj);
    this->addStringArrayFieldToObj("exclude_sensor_ids", filters.s_ExcludeSensorIds, obj);
    return obj;
}

json::object
CResultJsonWriter::matrixProfileWindow(const analytics::CMatrixProfile::SWindow& window) const {
    json::object obj;
    obj["window_index"] = window.s_WindowIndex;
    this->addTimeFieldToObj("start_ts", window.s_StartTime, obj);
    this->addTimeFieldToObj("end_ts", window.s_EndTime, obj);
    this->addDoubleFieldToObj("distance", window.s_Distance, obj);
    this->addOptionalFieldToObj("match_index", window.s_MatchIndex, obj);
    if (window.s_MatchStartTime != std::nullopt && window.s_MatchEndTime != std::nullopt) {
        this->addTimeFieldToObj("match_start_ts", *window.s_MatchStartTime, obj);
        this->addTimeFieldToObj("match_end_ts", *window.s_MatchEndTime, obj);
    } else {
        obj["match_start_ts"] = nullptr;
        obj["match_end_ts"] = nullptr;
    }
    return obj;
}

json::array CResultJsonWriter::skipped(const analytics::TSkippedVec& skipped) const {
    json::array result;
    for (const auto& sensor : skipped) {
        json::object obj;
        obj[SENSOR_ID] = sensor.s_SensorId;
        obj["reason"] = analytics_t::print(sensor.s_Reason);
        if (sensor.s_Detail.empty() == false) {
            obj["detail"] = sensor.s_Detail;
        }
        result.push_back(std::move(obj));
    }
    return result;
}

json::object CResultJsonWriter::timings(const analytics::TPhaseTimingVec& timings) const {
    json::object obj;
    for (const auto& timing : timings) {
        obj[timing.s_Phase] = timing.s_Milliseconds;
    }
    return obj;
}

json::object CResultJsonWriter::counts(const TStrSizeMap& counts) const {
    json::object obj;
    for (const auto& count : counts) {
        obj[count.first] = count.second;
    }
    return obj;
}

void CResultJsonWriter::addDoubleFieldToObj(const std::string& fieldName,
                                            double value,
                                            json::object& obj) const {
    if (std::isfinite(value) == false) {
        LOG_ERROR(<< "Adding " << value << " to the \"" << fieldName
                  << "\" field of a JSON document");
        obj[fieldName] = nullptr;
        return;
    }
    obj[fieldName] = value;
}

void CResultJsonWriter::addOptionalDoubleFieldToObj(const std::string& fieldName,
                                                    const analytics::TOptionalDouble& value,
                                                    json::object& obj) const {
    if (value == std::nullopt) {
        obj[fieldName] = nullptr;
        return;
    }
    this->addDoubleFieldToObj(fieldName, *value, obj);
}

void CResultJsonWriter::addTimeFieldToObj(const std::string& fieldName,
                                          core_t::TTime value,
                                          json::object& obj) const {
    obj[fieldName] = isoTime(value);
}

void CResultJsonWriter::addStringArrayFieldToObj(const std::string& fieldName,
                                                 const analytics::TStrVec& values,
                                                 json::object& obj) const {
    json::array array;
    array.reserve(values.size());
    for (const auto& value : values) {
        array.push_back(json::value(value));
    }
    obj[fieldName] = std::move(array);
}

void CResultJsonWriter::addDoubleArrayFieldToObj(const std::string& fieldName,
                                                 const analytics::TDoubleVec& values,
                                                 json::object& obj) const {
    json::array array;
    array.reserve(values.size());
    bool considerLogging{true};
    for (double value : values) {
        if (std::isfinite(value)) {
            array.push_back(value);
            continue;
        }
        if (considerLogging) {
            LOG_ERROR(<< "Adding " << value << " to the \"" << fieldName
                      << "\" array in a JSON document");
            considerLogging = false;
        }
        array.push_back(nullptr);
    }
    obj[fieldName] = std::move(array);
}

void CResultJsonWriter::addTimeArrayFieldToObj(const std::string& fieldName,
                                               const analytics::TTimeVec& values,
                                               json::object& obj) const {
    json::array array;
    array.reserve(values.size());
    for (auto value : values) {
        array.push_back(json::value(isoTime(value)));
    }
    obj[fieldName] = std::move(array);
}
}
}
