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
#include <analytics/CSensorRegistry.h>

#include <core/CLogger.h>

#include <algorithm>
#include <utility>

namespace tsse {
namespace analytics {

void CSensorRegistry::addSensor(SSensorInfo sensor) {
    if (sensor.s_Id.empty()) {
        LOG_WARN(<< "Ignoring sensor with empty id");
        return;
    }
    std::string id{sensor.s_Id};
    m_Sensors[id] = std::move(sensor);
}

const SSensorInfo* CSensorRegistry::sensor(const std::string& id) const {
    auto i = m_Sensors.find(id);
    return i == m_Sensors.end() ? nullptr : &i->second;
}

bool CSensorRegistry::contains(const std::string& id) const {
    return m_Sensors.find(id) != m_Sensors.end();
}

TStrVec CSensorRegistry::sensorIds() const {
    TStrVec result;
    result.reserve(m_Sensors.size());
    for (const auto& entry : m_Sensors) {
        result.push_back(entry.first);
    }
    return result;
}

TStrVec CSensorRegistry::directInputs(const std::string& id) const {
    TStrVec result;
    const SSensorInfo* info{this->sensor(id)};
    if (info == nullptr || info->isDerived() == false) {
        return result;
    }
    for (const auto& input : info->s_Derived->s_Inputs) {
        result.push_back(input.s_SensorId);
    }
    return result;
}
TStrVec CSensorRegistry::candidates(const SSensorInfo& focus, const SCandidateFilters& filters) const {
    TStrVec result;
    for (const auto& entry : m_Sensors) {
        const SSensorInfo& sensor{entry.second};
        if (sensor.s_Id == focus.s_Id) {
            continue;
        }
        if (filters.s_SameNodeOnly && sensor.s_NodeId != focus.s_NodeId) {
            continue;
        }
        if (filters.s_SameUnitOnly && sensor.s_Unit != focus.s_Unit) {
            continue;
        }
        if (filters.s_SameTypeOnly && sensor.s_Type != focus.s_Type) {
            continue;
        }
        if (filters.s_IntervalSeconds && sensor.s_IntervalSeconds != *filters.s_IntervalSeconds) {
            continue;
        }
        if (filters.s_IsDerived && sensor.isDerived() != *filters.s_IsDerived) {
            continue;
        }
        bool provider{sensor.s_IsPublicProvider || sensor.s_Source == SSensorInfo::E_ForecastPoints};
        if (filters.s_IsPublicProvider && provider != *filters.s_IsPublicProvider) {
            continue;
        }
        if (std::find(filters.s_ExcludeSensorIds.begin(), filters.s_ExcludeSensorIds.end(),
                      sensor.s_Id) != filters.s_ExcludeSensorIds.end()) {
            continue;
        }
        result.push_back(sensor.s_Id);
    }
    return result;
}
}
}
