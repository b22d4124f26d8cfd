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
#include <api/CJobParamsReader.h>

#include <core/CLogger.h>

#include <limits>

namespace tsse {
namespace api {
namespace {
std::string toString(const json::value& value) {
    return json::serialize(value);
}
}

void CJobParamsReader::addParameter(const std::string& name,
                                    ERequirement requirement,
                                    TStrIntMap permittedValues) {
    m_ParameterReaders.emplace_back(name, requirement, std::move(permittedValues));
}

CJobParameters CJobParamsReader::read(const json::value& json, TStrVec& errors) const {

    CJobParameters result{errors};

    if (json.is_object() == false) {
        errors.push_back("Input error: expected JSON object but input was '" +
                         toString(json) + "'");
        LOG_DEBUG(<< errors.back());
        return result;
    }

    const json::object& obj = json.as_object();

    for (const auto& reader : m_ParameterReaders) {
        if (obj.contains(reader.name())) {
            result.add(reader.readFrom(obj, errors));
            if (reader.required() && obj.at(reader.name()).is_null()) {
                errors.push_back("Input error: missing required parameter '" +
                                 reader.name() + "'");
            }
        } else if (reader.required()) {
            errors.push_back("Input error: missing required parameter '" +
                             reader.name() + "'");
        } else {
            result.add(CParameter{reader.name(), errors});
        }
    }

    // Check for any unrecognised fields: these might be typos.
    for (const auto& field : obj) {
        bool found{false};
        for (const auto& param : m_ParameterReaders) {
            if (field.key() == param.name()) {
                found = true;
                break;
            }
        }
        if (found == false) {
            errors.push_back("Input error: unexpected parameter '" +
                             std::string{field.key()} + "'");
        }
    }

    return result;
}

CJobParamsReader::CParameter::CParameter(const std::string& name,
                                         const json::value& value,
                                         const TStrIntMap& permittedValues,
                                         TStrVec& errors)
    : m_Name{name}, m_Value{&value}, m_PermittedValues{&permittedValues}, m_Errors{&errors} {
}

const json::value* CJobParamsReader::CParameter::jsonObject() const {
    if (this->present() == false) {
        return nullptr;
    }
    if (m_Value->is_object() == false) {
        this->handleError();
        return nullptr;
    }
    return m_Value;
}

bool CJobParamsReader::CParameter::fallback(bool fallback) const {
    if (this->present() == false) {
        return fallback;
    }
    if (m_Value->is_bool() == false) {
        this->handleError();
        return fallback;
    }
    return m_Value->as_bool();
}

std::size_t CJobParamsReader::CParameter::fallback(std::size_t fallback) const {
    if (this->present() == false) {
        return fallback;
    }
    if (m_Value->is_uint64()) {
        return static_cast<std::size_t>(m_Value->as_uint64());
    }
    if (m_Value->is_int64() == false || m_Value->as_int64() < 0) {
        this->handleError();
        return fallback;
    }
    return static_cast<std::size_t>(m_Value->as_int64());
}

std::int64_t CJobParamsReader::CParameter::fallback(std::int64_t fallback) const {
    if (this->present() == false) {
        return fallback;
    }
    if (m_Value->is_uint64()) {
        if (m_Value->as_uint64() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            this->handleError();
            return fallback;
        }
        return static_cast<std::int64_t>(m_Value->as_uint64());
    }
    if (m_Value->is_int64() == false) {
        this->handleError();
        return fallback;
    }
    return m_Value->as_int64();
}

double CJobParamsReader::CParameter::fallback(double fallback) const {
    if (this->present() == false) {
        return fallback;
    }
    if (m_Value->is_number() == false) {
        this->handleError();
        return fallback;
    }
    return m_Value->to_number<double>();
}

std::string CJobParamsReader::CParameter::fallback(const std::string& fallback) const {
    if (this->present() == false) {
        return fallback;
    }
    if (m_Value->is_string() == false) {
        this->handleError();
        return fallback;
    }
    return std::string(m_Value->as_string());
}

CJobParamsReader::CParameter::CParameter(const std::string& name, TStrVec& errors, SArrayElementTag)
    : m_Name{name}, m_Errors{&errors}, m_ArrayElement{true} {
}

void CJobParamsReader::CParameter::handleError() const {
    std::string value{m_Value != nullptr ? toString(*m_Value) : "null"};
    m_Errors->push_back("Input error: bad value '" + value + "' for " +
                        (m_ArrayElement ? "element of '" : "'") + m_Name + "'");
    LOG_DEBUG(<< m_Errors->back());
}

CJobParamsReader::CParameterReader::CParameterReader(const std::string& name,
                                                     ERequirement requirement,
                                                     TStrIntMap permittedValues)
    : m_Name{name}, m_Requirement{requirement}, m_PermittedValues{std::move(permittedValues)} {
}
}
}
