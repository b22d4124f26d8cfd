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
#include <analytics/CCorrelationMatrix.h>

#include <core/CLogger.h>
#include <core/CLoopProgress.h>
#include <core/CStopWatch.h>
#include <core/CStringUtils.h>

#include <maths/CTools.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CBucketReader.h>
#include <analytics/CSensorRegistry.h>
#include <analytics/CSensorSemantics.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace tsse {
namespace analytics {
namespace {
using TTimeDoublePrVec = maths::CCorrelation::TTimeDoublePrVec;

const std::string LOAD_SERIES{"load_series"};
const std::string CORRELATE{"correlate"};

TTimeDoublePrVec toDeltas(const TTimeDoublePrVec& values,
                          core_t::TTime interval,
                          analytics_t::EDeltaMode mode) {
    core_t::TTime gap{CCorrelationMatrix::DELTA_GAP_BUCKETS * std::max(interval, core_t::TTime{1})};
    TTimeDoublePrVec result;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i].first - values[i - 1].first > gap) {
            continue;
        }
        double delta{CSensorSemantics::delta(values[i - 1].second, values[i].second, mode)};
        if (std::isfinite(delta)) {
            result.emplace_back(values[i].first, delta);
        }
    }
    return result;
}
}

CCorrelationMatrix::CCorrelationMatrix(const CSensorRegistry& registry, const CBucketReader& reader)
    : m_Registry{registry}, m_Reader{reader} {
}

CCorrelationMatrix::SResult CCorrelationMatrix::compute(const SParams& params_,
                                                        const CAnalysisContext& context) const {
    core::CStopWatch total{true};

    SResult result;
    SParams params{params_};
    clamp(params);

    TStrVec sensorIds{core::CStringUtils::normaliseIds(params.s_SensorIds)};
    if (sensorIds.size() > params.s_MaxSensors) {
        result.s_TruncatedSensorIds.assign(sensorIds.begin() + params.s_MaxSensors, sensorIds.end());
        sensorIds.resize(params.s_MaxSensors);
        result.s_Warnings.push_back("sensor list truncated to " +
                                    std::to_string(params.s_MaxSensors));
    }

    params.s_Interval = widenInterval(params.s_Start, params.s_End, params.s_Interval,
                                      params.s_MaxBuckets);
    result.s_Interval = params.s_Interval;
    result.s_BucketCount = CBucketReader::numberBuckets(params.s_Start, params.s_End, params.s_Interval);
    LOG_DEBUG(<< "Correlating " << sensorIds.size() << " sensors at interval "
              << params.s_Interval << " over " << result.s_BucketCount << " buckets");

    context.progress(LOAD_SERIES, 0, sensorIds.size(), "Loading bucketed series");
    context.throwIfCanceled();

    core::CStopWatch load{true};
    CBucketReader::SRequest request;
    request.s_SensorIds = sensorIds;
    request.s_Start = params.s_Start;
    request.s_End = params.s_End;
    request.s_Interval = params.s_Interval;
    request.s_Aggregation = params.s_Aggregation;
    CBucketReader::SResult read{m_Reader.read(request)};
    std::uint64_t loadMs{load.stop()};
    context.phaseTiming(LOAD_SERIES, loadMs);
    context.progress(LOAD_SERIES, sensorIds.size(), sensorIds.size());
    result.s_Skipped = read.s_Skipped;

    std::vector<TTimeDoublePrVec> series;
    std::vector<maths::CCorrelation::TOptionalDouble> rho1;
    for (const auto& loaded : read.s_Series) {
        const SSensorInfo* info{m_Registry.sensor(loaded.s_SensorId)};
        TTimeDoublePrVec values{loaded.points()};
        if (params.s_ValueMode == E_Deltas) {
            analytics_t::EDeltaMode mode{
                info != nullptr ? CSensorSemantics::infer(info->s_Type, info->s_Unit).s_DeltaMode
                                : analytics_t::E_Linear};
            values = toDeltas(values, params.s_Interval, mode);
        }
        TDoubleVec raw;
        raw.reserve(values.size());
        for (const auto& value : values) {
            raw.push_back(value.second);
        }
        rho1.push_back(maths::CCorrelation::lag1Autocorrelation(raw));

        SSensorSummary summary;
        summary.s_SensorId = loaded.s_SensorId;
        if (info != nullptr) {
            summary.s_Name = info->s_Name;
            summary.s_Unit = info->s_Unit;
            summary.s_NodeId = info->s_NodeId;
            summary.s_Type = info->s_Type;
        }
        summary.s_Points = values.size();
        result.s_SensorIds.push_back(loaded.s_SensorId);
        result.s_Sensors.push_back(std::move(summary));
        series.push_back(std::move(values));
    }

    std::size_t n{series.size()};
    result.s_Matrix.assign(n, TCellVec(n));
    std::size_t pairs{n * (n + 1) / 2};
    core::CStopWatch correlate{true};
    core::CLoopProgress progress{context.loopProgress(
        CORRELATE, pairs, "Computing " + std::to_string(pairs) + " correlations")};

    // (row, column) of cells which take part in the FDR correction.
    std::vector<std::pair<std::size_t, std::size_t>> tested;
    TDoubleVec pValues;

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i; j < n; ++j) {
            context.throwIfCanceled();

            if (i == j) {
                SCell& cell{result.s_Matrix[i][i]};
                cell.s_R = 1.0;
                cell.s_N = series[i].size();
                cell.s_Status = E_NotComputed;
                progress.increment();
                continue;
            }

            maths::CCorrelation::SLaggedCorrelation correlation;
            SCell cell;
            if (params.s_LagMode == E_BestWithinMax) {
                correlation = maths::CCorrelation::bestWithinLag(
                    series[i], series[j], params.s_Method, params.s_MinOverlap,
                    params.s_Interval, params.s_MaxLagBuckets);
                if (correlation.s_R == std::nullopt) {
                    correlation = maths::CCorrelation::atLag(series[i], series[j], 0, params.s_Method,
                                                             params.s_MinOverlap);
                }
                cell.s_LagSeconds = correlation.s_LagSeconds;
            } else {
                correlation = maths::CCorrelation::atLag(series[i], series[j], 0,
                                                         params.s_Method, params.s_MinOverlap);
            }
            cell.s_N = correlation.s_N;

            if (correlation.s_R != std::nullopt) {
                double r{*correlation.s_R};
                cell.s_R = r;
                if (cell.s_N < params.s_MinSignificantN) {
                    cell.s_Status = E_InsufficientOverlap;
                } else {
                    std::size_t nEff{maths::CCorrelation::effectiveSampleSize(cell.s_N, rho1[i], rho1[j])};
                    cell.s_NEff = nEff;
                    if (nEff < params.s_MinSignificantN) {
                        cell.s_Status = E_InsufficientOverlap;
                    } else {
                        cell.s_PValue = maths::CCorrelation::pValue(r, nEff, params.s_Method);
                        if (cell.s_PValue != std::nullopt) {
                            tested.emplace_back(i, j);
                            pValues.push_back(*cell.s_PValue);
                        }
                        cell.s_Status = E_NotComputed;
                    }
                }
            } else if (cell.s_N < params.s_MinOverlap) {
                cell.s_Status = E_InsufficientOverlap;
            } else {
                cell.s_Status = E_NotComputed;
            }

            result.s_Matrix[i][j] = cell;
            progress.increment();
        }
    }

    TDoubleVec qValues{maths::CCorrelation::benjaminiHochberg(pValues)};
    auto zValue = maths::CCorrelation::zValueForAlpha(params.s_SignificanceAlpha);
    for (std::size_t k = 0; k < tested.size(); ++k) {
        SCell& cell{result.s_Matrix[tested[k].first][tested[k].second]};
        cell.s_QValue = qValues[k];
        double r{*cell.s_R};
        if (maths::CCorrelation::isSignificant(qValues[k], r, params.s_SignificanceAlpha,
                                               params.s_MinAbsR)) {
            cell.s_Status = E_Ok;
            if (zValue != std::nullopt) {
                auto interval = maths::CCorrelation::fisherZInterval(
                    r, cell.s_NEff.value_or(cell.s_N), *zValue);
                if (interval != std::nullopt) {
                    cell.s_RConfidenceLow = interval->first;
                    cell.s_RConfidenceHigh = interval->second;
                }
            }
        } else {
            cell.s_Status = E_NotSignificant;
        }
    }

    // Mirror the upper triangle.
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            SCell mirror{result.s_Matrix[i][j]};
            if (mirror.s_LagSeconds != std::nullopt) {
                mirror.s_LagSeconds = -*mirror.s_LagSeconds;
            }
            result.s_Matrix[j][i] = mirror;
        }
    }

    std::uint64_t correlateMs{correlate.stop()};
    context.phaseTiming(CORRELATE, correlateMs);
    LOG_DEBUG(<< "Computed " << pairs << " correlations in " << correlateMs << "ms");

    if (n < MIN_SENSORS) {
        result.s_Warnings.push_back("fewer than two sensors have data");
    }
    result.s_ParamsUsed = params;
    result.s_CorrelationVersion = params.s_Method == maths::CCorrelation::E_Pearson
                                      ? "pearson_v1"
                                      : "spearman_v1";
    result.s_FdrVersion = "bh_v1";
    result.s_NEffVersion = "lag1_v1";
    result.s_Timings.push_back({"load_ms", loadMs});
    result.s_Timings.push_back({"correlation_ms", correlateMs});
    result.s_Timings.push_back({"job_total_ms", total.stop()});
    return result;
}

core_t::TTime CCorrelationMatrix::widenInterval(core_t::TTime start,
                                                core_t::TTime end,
                                                core_t::TTime interval,
                                                std::size_t maxBuckets) {
    interval = std::max(interval, core_t::TTime{1});
    core_t::TTime horizon{std::max(end - start, core_t::TTime{1})};
    auto max = static_cast<core_t::TTime>(std::max(maxBuckets, std::size_t{1}));
    if ((horizon + interval - 1) / interval > max) {
        interval = (horizon + max - 1) / max;
    }
    return interval;
}

void CCorrelationMatrix::clamp(SParams& params) {
    params.s_MaxSensors = std::min(std::max(params.s_MaxSensors, MIN_SENSORS), MAX_SENSORS);
    params.s_MaxBuckets = std::min(std::max(params.s_MaxBuckets, MIN_BUCKETS), MAX_BUCKETS);
    params.s_MinOverlap = std::max(params.s_MinOverlap, std::size_t{2});
    params.s_MinSignificantN = std::max(params.s_MinSignificantN, std::size_t{3});
    params.s_SignificanceAlpha = maths::CTools::truncate(params.s_SignificanceAlpha, MIN_ALPHA, MAX_ALPHA);
    params.s_MinAbsR = maths::CTools::truncate(params.s_MinAbsR, 0.0, 1.0);
    params.s_MaxLagBuckets = std::min(params.s_MaxLagBuckets, MAX_LAG_BUCKETS);
    params.s_Interval = std::max(params.s_Interval, core_t::TTime{1});
}

std::string CCorrelationMatrix::print(ECellStatus status) {
    switch (status) {
    case E_Ok:
        return "ok";
    case E_NotSignificant:
        return "not_significant";
    case E_InsufficientOverlap:
        return "insufficient_overlap";
    case E_NotComputed:
        return "not_computed";
    }
    return "-";
}

bool CCorrelationMatrix::parse(const std::string& value, EValueMode& mode) {
    if (value == "levels") {
        mode = E_Levels;
    } else if (value == "deltas") {
        mode = E_Deltas;
    } else {
        return false;
    }
    return true;
}

bool CCorrelationMatrix::parse(const std::string& value, ELagMode& mode) {
    if (value == "aligned") {
        mode = E_Aligned;
    } else if (value == "best_within_max") {
        mode = E_BestWithinMax;
    } else {
        return false;
    }
    return true;
}

std::string CCorrelationMatrix::print(EValueMode mode) {
    return mode == E_Levels ? "levels" : "deltas";
}

std::string CCorrelationMatrix::print(ELagMode mode) {
    return mode == E_Aligned ? "aligned" : "best_within_max";
}
}
}
