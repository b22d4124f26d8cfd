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
#include <api/CJobExecutor.h>

#include <core/CLogger.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>

#include <api/CJobFailure.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

namespace tsse {
namespace api {
namespace {
const std::string NOOP_PHASE{"noop"};
}

template<typename RESULT>
json::value CJobExecutor::encode(const RESULT& result) const {
    json::value document;
    if (m_Writer.write(result, document) == false) {
        throw CJobFailure{CJobFailure::RESULT_ENCODE_FAILED, "Failed to encode the job result"};
    }
    return document;
}

CJobExecutor::CJobExecutor(const analytics::CSensorRegistry& registry,
                           const analytics::CSampleStore& store)
    : m_Registry{registry}, m_Reader{registry, store} {
}

bool CJobExecutor::validate(const CJobParams& params, std::string& error) const {
    auto requireSensor = [&](const std::string& id, const std::string& field) {
        if (m_Registry.contains(id) == false) {
            error = "Unknown sensor '" + id + "' for '" + field + "'";
            return false;
        }
        return true;
    };
    return std::visit(
        [&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, analytics::CMatrixProfile::SParams>) {
                return requireSensor(value.s_SensorId, "sensor_id");
            } else if constexpr (std::is_same_v<T, analytics::CEventMatcher::SParams> ||
                                 std::is_same_v<T, analytics::CUnifiedRanker::SParams>) {
                return requireSensor(value.s_FocusSensorId, "focus_sensor_id");
            } else {
                return true;
            }
        },
        params.value());
}

json::value CJobExecutor::execute(const CJobParams& params,
                                  const analytics::CAnalysisContext& context) const {
    LOG_DEBUG(<< "Executing " << api_t::print(params.type()) << " job");
    return std::visit([&](const auto& value) { return this->run(value, context); },
                      params.value());
}

json::value CJobExecutor::run(const analytics::CCorrelationMatrix::SParams& params,
                              const analytics::CAnalysisContext& context) const {
    analytics::CCorrelationMatrix matrix{m_Registry, m_Reader};
    auto result = matrix.compute(params, context);
    if (std::none_of(result.s_Sensors.begin(), result.s_Sensors.end(),
                     [](const auto& sensor) { return sensor.s_Points > 0; })) {
        throw CJobFailure{CJobFailure::NO_DATA,
                          "None of the requested sensors have data in the window"};
    }
    return this->encode(result);
}

json::value CJobExecutor::run(const analytics::CMatrixProfile::SParams& params,
                              const analytics::CAnalysisContext& context) const {
    analytics::CMatrixProfile profile{m_Registry, m_Reader};
    auto result = profile.compute(params, context);
    if (result.s_SourcePoints == 0) {
        throw CJobFailure{CJobFailure::NO_DATA,
                          "Sensor '" + params.s_SensorId + "' has no data in the window"};
    }
    return this->encode(result);
}

json::value CJobExecutor::run(const analytics::CEventMatcher::SParams& params,
                              const analytics::CAnalysisContext& context) const {
    analytics::CEventMatcher matcher{m_Registry, m_Reader};
    return this->encode(matcher.compute(params, context));
}

json::value CJobExecutor::run(const analytics::CCooccurrenceScorer::SParams& params,
                              const analytics::CAnalysisContext& context) const {
    analytics::CCooccurrenceScorer scorer{m_Registry, m_Reader};
    return this->encode(scorer.compute(params, context));
}

json::value CJobExecutor::run(const analytics::CUnifiedRanker::SParams& params,
                              const analytics::CAnalysisContext& context) const {
    analytics::CUnifiedRanker ranker{m_Registry, m_Reader};
    return this->encode(ranker.compute(params, context));
}

json::value CJobExecutor::run(const SNoopParams& params,
                              const analytics::CAnalysisContext& context) const {
    context.progress(NOOP_PHASE, 0, params.s_Steps, "Starting");
    for (std::size_t i = 0; i < params.s_Steps; ++i) {
        context.throwIfCanceled();
        context.progress(NOOP_PHASE, i + 1, params.s_Steps,
                         "Step " + std::to_string(i + 1) + " of " +
                             std::to_string(params.s_Steps));
        if (params.s_StepMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(params.s_StepMs));
        }
    }
    context.throwIfCanceled();
    context.progress(NOOP_PHASE, params.s_Steps, params.s_Steps, "Finishing");
    return this->encode(params);
}

}
}
