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
#include <api/CDatasetJsonReader.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>

#include <api/CJobParams.h>
#include <api/CJobParamsReader.h>

#include <algorithm>
#include <istream>
#include <map>
#include <vector>

namespace tsse {
namespace api {
namespace {
using TStrVec = CJobParamsReader::TStrVec;
using TSensorInfoVec = std::vector<analytics::SSensorInfo>;
using TStrSampleVecMap = std::map<std::string, analytics::TSampleVec>;

const std::string SENSORS{"sensors"};
const std::string SAMPLES{"samples"};
const std::string DERIVED{"derived"};
const std::string INPUTS{"inputs"};

const CJobParamsReader& datasetReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter(SENSORS, CJobParamsReader::E_RequiredParameter);
        theReader.addParameter(SAMPLES, CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& sensorReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("id", CJobParamsReader::E_RequiredParameter);
        theReader.addParameter("name", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("type", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("unit", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("node_id", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("interval_seconds", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("source", CJobParamsReader::E_OptionalParameter,
                               {{"local", analytics::SSensorInfo::E_Local},
                                {"forecast_points", analytics::SSensorInfo::E_ForecastPoints}});
        theReader.addParameter("is_public_provider", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(DERIVED, CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& derivedReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("offset", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter(INPUTS, CJobParamsReader::E_RequiredParameter);
        return theReader;
    }()};
    return reader;
}

const CJobParamsReader& derivedInputReader() {
    static const CJobParamsReader reader{[] {
        CJobParamsReader theReader;
        theReader.addParameter("sensor_id", CJobParamsReader::E_RequiredParameter);
        theReader.addParameter("coefficient", CJobParamsReader::E_OptionalParameter);
        theReader.addParameter("lag_seconds", CJobParamsReader::E_OptionalParameter);
        return theReader;
    }()};
    return reader;
}

void readDerived(const json::value& json, analytics::SSensorInfo& sensor, TStrVec& errors) {
    CJobParameters parameters{derivedReader().read(json, errors)};
    analytics::SSensorInfo::SDerivedSpec spec;
    spec.s_Offset = parameters["offset"].fallback(spec.s_Offset);
    const json::value* inputs{parameters[INPUTS].jsonValue()};
    if (inputs != nullptr) {
        if (inputs->is_array() == false || inputs->as_array().empty()) {
            errors.push_back("derived inputs of '" + sensor.s_Id + "' must be a non-empty array");
        } else {
            for (const auto& element : inputs->as_array()) {
                CJobParameters input{derivedInputReader().read(element, errors)};
                analytics::SSensorInfo::SDerivedInput term;
                term.s_SensorId = input["sensor_id"].fallback(std::string{});
                core::CStringUtils::trimWhitespace(term.s_SensorId);
                term.s_Coefficient = input["coefficient"].fallback(term.s_Coefficient);
                term.s_LagSeconds = input["lag_seconds"].fallback(term.s_LagSeconds);
                spec.s_Inputs.push_back(std::move(term));
            }
        }
    }
    sensor.s_Derived = std::move(spec);
}

void readSensors(const json::value& json, TSensorInfoVec& sensors, TStrVec& errors) {
    if (json.is_array() == false) {
        errors.push_back("'" + SENSORS + "' must be an array");
        return;
    }
    for (const auto& element : json.as_array()) {
        CJobParameters parameters{sensorReader().read(element, errors)};
        analytics::SSensorInfo sensor;
        sensor.s_Id = parameters["id"].fallback(std::string{});
        core::CStringUtils::trimWhitespace(sensor.s_Id);
        if (sensor.s_Id.empty()) {
            errors.push_back("sensor ids must be non-empty");
            continue;
        }
        sensor.s_Name = parameters["name"].fallback(sensor.s_Id);
        sensor.s_Type = parameters["type"].fallback(std::string{});
        sensor.s_Unit = parameters["unit"].fallback(std::string{});
        sensor.s_NodeId = parameters["node_id"].fallback(std::string{});
        sensor.s_IntervalSeconds = parameters["interval_seconds"].fallback(sensor.s_IntervalSeconds);
        sensor.s_Source = parameters["source"].fallback(sensor.s_Source);
        sensor.s_IsPublicProvider = parameters["is_public_provider"].fallback(sensor.s_IsPublicProvider);
        const json::value* derived{parameters[DERIVED].jsonObject()};
        if (derived != nullptr) {
            readDerived(*derived, sensor, errors);
        }
        sensors.push_back(std::move(sensor));
    }
}

bool readSample(const json::value& json, analytics::SSample& sample) {
    if (json.is_array() == false) {
        return false;
    }
    const json::array& fields{json.as_array()};
    if (fields.size() < 2 || fields.size() > 3 || fields[1].is_number() == false ||
        CJobParams::parseTime(fields[0], sample.s_Time) == false) {
        return false;
    }
    sample.s_Value = fields[1].to_number<double>();
    if (fields.size() == 3) {
        if (fields[2].is_string() == false) {
            return false;
        }
        std::string quality{core::CStringUtils::toLower(std::string{fields[2].as_string()})};
        if (quality == analytics_t::print(analytics_t::E_Good)) {
            sample.s_Quality = analytics_t::E_Good;
        } else if (quality == analytics_t::print(analytics_t::E_Bad)) {
            sample.s_Quality = analytics_t::E_Bad;
        } else {
            return false;
        }
    }
    return true;
}

void readSamples(const json::value& json,
                 const TSensorInfoVec& sensors,
                 TStrSampleVecMap& samples,
                 TStrVec& errors) {
    if (json.is_object() == false) {
        errors.push_back("'" + SAMPLES + "' must be an object");
        return;
    }
    for (const auto& series : json.as_object()) {
        std::string id{series.key()};
        bool known{std::any_of(sensors.begin(), sensors.end(),
                               [&](const auto& sensor) { return sensor.s_Id == id; })};
        if (known == false) {
            errors.push_back("samples for unknown sensor '" + id + "'");
            continue;
        }
        if (series.value().is_array() == false) {
            errors.push_back("samples of '" + id + "' must be an array");
            continue;
        }
        analytics::TSampleVec& result{samples[id]};
        result.reserve(series.value().as_array().size());
        for (const auto& element : series.value().as_array()) {
            analytics::SSample sample;
            if (readSample(element, sample) == false) {
                errors.push_back("bad sample " + json::serialize(element) + " of '" + id + "'");
                continue;
            }
            result.push_back(sample);
        }
    }
}
}

CDatasetJsonReader::CDatasetJsonReader(analytics::CSensorRegistry& registry,
                                       analytics::CInMemorySampleStore& store)
    : m_Registry{registry}, m_Store{store} {
}

bool CDatasetJsonReader::read(std::istream& input, std::string& error) {
    json::value document;
    if (core::CBoostJsonParser::parse(input, document, error) == false) {
        error = "Failed to parse dataset: " + error;
        return false;
    }
    return this->read(document, error);
}

bool CDatasetJsonReader::read(const json::value& document, std::string& error) {
    TStrVec errors;
    CJobParameters parameters{datasetReader().read(document, errors)};

    TSensorInfoVec sensors;
    TStrSampleVecMap samples;
    if (const json::value* value = parameters[SENSORS].jsonValue()) {
        readSensors(*value, sensors, errors);
    }
    if (const json::value* value = parameters[SAMPLES].jsonValue()) {
        readSamples(*value, sensors, samples, errors);
    }

    if (errors.empty() == false) {
        error.clear();
        for (const auto& error_ : errors) {
            error += (error.empty() ? "" : "; ") + error_;
        }
        LOG_ERROR(<< "Invalid dataset: " << error);
        return false;
    }

    std::size_t numberSamples{0};
    for (auto& sensor : sensors) {
        m_Registry.addSensor(std::move(sensor));
    }
    for (const auto& series : samples) {
        m_Store.addSamples(series.first, series.second);
        numberSamples += series.second.size();
    }
    LOG_INFO(<< "Loaded " << sensors.size() << " sensors and " << numberSamples << " samples");
    return true;
}
}
}
