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
#ifndef INCLUDED_tsse_analytics_CSensorRegistry_h
#define INCLUDED_tsse_analytics_CSensorRegistry_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsse {
namespace analytics {

//! \brief The metadata of one sensor.
struct SSensorInfo {
    //! Where the bucketed history of a sensor comes from.
    enum ESource {
        E_Local,         //!< Raw samples in the time-series store.
        E_ForecastPoints //!< An external provider with no bucketed history.
    };

    //! \brief One term of a derived expression.
    struct SDerivedInput {
        std::string s_SensorId;
        double s_Coefficient = 1.0;
        //! The input is read at t - s_LagSeconds.
        core_t::TTime s_LagSeconds = 0;
    };
    using TDerivedInputVec = std::vector<SDerivedInput>;

    //! \brief A sensor computed as offset + sum(coefficient * input(t - lag)).
    struct SDerivedSpec {
        double s_Offset = 0.0;
        TDerivedInputVec s_Inputs;
    };

    bool isDerived() const { return s_Derived != std::nullopt; }

    std::string s_Id;
    std::string s_Name;
    std::string s_Type;
    std::string s_Unit;
    std::string s_NodeId;
    core_t::TTime s_IntervalSeconds = 0;
    ESource s_Source = E_Local;
    bool s_IsPublicProvider = false;
    std::optional<SDerivedSpec> s_Derived;
};

//! \brief Restricts which registered sensors are candidates for a focus.
struct SCandidateFilters {
    bool s_SameNodeOnly = false;
    bool s_SameUnitOnly = false;
    bool s_SameTypeOnly = false;
    std::optional<core_t::TTime> s_IntervalSeconds;
    std::optional<bool> s_IsDerived;
    std::optional<bool> s_IsPublicProvider;
    TStrVec s_ExcludeSensorIds;
};

//! \brief The sensor metadata lookup.
//!
//! DESCRIPTION:\n
//! Holds the metadata used to choose aggregation rules and to walk the
//! derivation graph.  It is populated before jobs run and only read while
//! they run, so concurrent reads need no locking.
class CSensorRegistry {
public:
    using TSensorInfoVec = std::vector<SSensorInfo>;

public:
    //! Add or replace a sensor.
    void addSensor(SSensorInfo sensor);

    //! Get the sensor with \p id or null if it isn't registered.
    const SSensorInfo* sensor(const std::string& id) const;

    bool contains(const std::string& id) const;

    //! All registered ids in sorted order.
    TStrVec sensorIds() const;

    //! The ids of the direct inputs of \p id, empty if it isn't derived.
    TStrVec directInputs(const std::string& id) const;

    //! The sorted ids of the sensors other than \p focus which pass \p filters.
    TStrVec candidates(const SSensorInfo& focus, const SCandidateFilters& filters) const;

    std::size_t size() const { return m_Sensors.size(); }

private:
    using TStrSensorInfoMap = std::map<std::string, SSensorInfo>;

private:
    TStrSensorInfoMap m_Sensors;
};
}
}

#endif // INCLUDED_tsse_analytics_CSensorRegistry_h
