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
#ifndef INCLUDED_tsse_api_CJobParamsReader_h
#define INCLUDED_tsse_api_CJobParamsReader_h

#include <core/CBoostJsonParser.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace tsse {
namespace api {
class CJobParameters;

//! \brief Reads and validates the parameters of an analysis job.
//!
//! DESCRIPTION:\n
//! This wraps up extracting parameter values from a JSON object.  It supports
//! predefining a set of expected parameters.  It is expected that there will
//! be one static reader object per job type and per nested parameter object.
//!
//! The read method extracts all the parameters the JSON contains and returns
//! a collection to get them by name.
//!
//! Expected usage is:
//! \code
//! static const CJobParamsReader reader{[] {
//!     CJobParamsReader theReader;
//!     theReader.addParameter("foo", CJobParamsReader::E_OptionalParameter);
//!     theReader.addParameter("bar", CJobParamsReader::E_RequiredParameter);
//!     return theReader;
//! }()};
//!
//! TStrVec errors;
//! auto parameters = reader.read(json, errors);
//! bool foo{parameters["foo"].fallback(true)};
//! double bar{parameters["bar"].fallback(0.0)};
//! \endcode
//!
//! IMPLEMENTATION:\n
//! Not understanding a parameter is likely to result in the wrong analysis
//! being performed so unexpected parameters, missing required parameters and
//! values of the wrong type are all errors.  Errors are collected rather than
//! being fatal: a job request with any error is rejected before the job is
//! created.  A JSON null is treated as a missing value.
class CJobParamsReader {
public:
    using TStrVec = std::vector<std::string>;
    using TStrIntMap = std::map<std::string, int>;

    enum ERequirement { E_OptionalParameter, E_RequiredParameter };

    //! \brief A single parameter which has been read.
    class CParameter {
    public:
        CParameter(const std::string& name, TStrVec& errors)
            : m_Name{name}, m_Errors{&errors} {}
        CParameter(const std::string& name,
                   const json::value& value,
                   const TStrIntMap& permittedValues,
                   TStrVec& errors);

        //! Get the name of the parameter.
        const std::string& name() const { return m_Name; }
        //! Check if the parameter has a non-null value.
        bool present() const { return m_Value != nullptr && m_Value->is_null() == false; }
        //! Get the JSON object or null if the parameter is missing or isn't
        //! an object.
        const json::value* jsonObject() const;
        //! Get the JSON value or null if the parameter is missing.
        const json::value* jsonValue() const { return this->present() ? m_Value : nullptr; }
        //! Get a boolean parameter.
        bool fallback(bool value) const;
        //! Get a non-negative integer parameter.
        std::size_t fallback(std::size_t value) const;
        //! Get an integer parameter.
        std::int64_t fallback(std::int64_t value) const;
        //! Get a floating point parameter.
        double fallback(double value) const;
        //! Get a string parameter.
        std::string fallback(const std::string& value) const;
        //! Get an enum parameter.
        template<typename ENUM>
        ENUM fallback(ENUM value) const {
            static_assert(std::is_enum<ENUM>::value, "ENUM must be an enumeration");
            if (this->present() == false) {
                return value;
            }
            if (m_Value->is_string() == false) {
                this->handleError();
                return value;
            }
            auto pos = m_PermittedValues->find(std::string{m_Value->as_string()});
            if (pos == m_PermittedValues->end()) {
                this->handleError();
                return value;
            }
            return static_cast<ENUM>(pos->second);
        }
        //! Get an array of objects of type T.
        template<typename T>
        std::vector<T> fallback(const std::vector<T>& value) const {
            if (this->present() == false) {
                return value;
            }
            if (m_Value->is_array() == false) {
                this->handleError();
                return value;
            }
            const json::array& array{m_Value->as_array()};
            std::vector<T> result;
            result.reserve(array.size());
            CParameter element{m_Name, *m_Errors, SArrayElementTag{}};
            for (const auto& value_ : array) {
                element.m_Value = &value_;
                if (element.present() == false) {
                    element.handleError();
                    continue;
                }
                result.push_back(element.fallback(T{}));
            }
            return result;
        }
        //! Get an optional parameter of type T which is null if missing.
        template<typename T>
        std::optional<T> optional() const {
            if (this->present() == false) {
                return std::nullopt;
            }
            return this->fallback(T{});
        }

    private:
        struct SArrayElementTag {};

    private:
        CParameter(const std::string& name, TStrVec& errors, SArrayElementTag);
        void handleError() const;

    private:
        std::string m_Name;
        const json::value* m_Value = nullptr;
        const TStrIntMap* m_PermittedValues = nullptr;
        TStrVec* m_Errors = nullptr;
        bool m_ArrayElement = false;
    };

public:
    //! Register a parameter.
    //!
    //! \param[in] name The parameter name.
    //! \param[in] requirement Is the parameter required or optional.
    //! \param[in] permittedValues The permitted values for an enumeration.
    void addParameter(const std::string& name,
                      ERequirement requirement,
                      TStrIntMap permittedValues = TStrIntMap{});

    //! Extract the parameters from a JSON object appending any problems
    //! to \p errors.
    //!
    //! \note The returned parameters refer to \p json and \p errors, which
    //! must outlive them.
    CJobParameters read(const json::value& json, TStrVec& errors) const;

private:
    //! Reads a parameter from the JSON object.
    class CParameterReader {
    public:
        CParameterReader(const std::string& name, ERequirement requirement, TStrIntMap permittedValues);

        const std::string& name() const { return m_Name; }
        bool required() const { return m_Requirement == E_RequiredParameter; }
        CParameter readFrom(const json::object& json, TStrVec& errors) const {
            return {m_Name, json.at(m_Name), m_PermittedValues, errors};
        }

    private:
        std::string m_Name;
        ERequirement m_Requirement;
        TStrIntMap m_PermittedValues;
    };

private:
    std::vector<CParameterReader> m_ParameterReaders;
};

//! \brief A collection of all the job parameters which have been read.
class CJobParameters {
public:
    using TParameter = CJobParamsReader::CParameter;

public:
    explicit CJobParameters(CJobParamsReader::TStrVec& errors) : m_Errors{&errors} {}

    //! Add \p parameter.
    void add(const TParameter& parameter) { m_ParameterValues.push_back(parameter); }

    //! Get the parameter called \p name.
    TParameter operator[](const std::string& name) const {
        for (const auto& value : m_ParameterValues) {
            if (name == value.name()) {
                return value;
            }
        }
        return TParameter{name, *m_Errors};
    }

private:
    std::vector<TParameter> m_ParameterValues;
    CJobParamsReader::TStrVec* m_Errors;
};
}
}

#endif // INCLUDED_tsse_api_CJobParamsReader_h
