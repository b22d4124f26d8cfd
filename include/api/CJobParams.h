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
#ifndef INCLUDED_tsse_api_CJobParams_h
#define INCLUDED_tsse_api_CJobParams_h

#include <core/CBoostJsonParser.h>
#include <core/CoreTypes.h>

#include <analytics/CCooccurrenceScorer.h>
#include <analytics/CCorrelationMatrix.h>
#include <analytics/CEventMatcher.h>
#include <analytics/CMatrixProfile.h>
#include <analytics/CUnifiedRanker.h>

#include <api/JobTypes.h>

#include <cstddef>
#include <string>
#include <variant>

namespace tsse {
namespace api {

//! \brief The parameters of the diagnostic job which only reports progress.
struct SNoopParams {
    std::size_t s_Steps = 50;
    core_t::TMilliseconds s_StepMs = 0;
};

//! \brief The typed parameters of one analysis job.
//!
//! DESCRIPTION:\n
//! A closed set of parameter structures, one per job type.  The job type
//! is the index of the alternative held, so every consumer which visits
//! the parameters handles every job type.
//!
//! Parameters are read from JSON with the field names of the job API.
//! Timestamps are either seconds since the epoch, as a number or string,
//! or ISO 8601 UTC strings.  Numeric limits are clamped into their
//! supported ranges rather than rejected.  Wrong types, unknown fields,
//! missing required fields and an empty time window are errors.
class CJobParams {
public:
    //! The alternatives are in the order of api_t::EJobType.
    using TVariant = std::variant<analytics::CCorrelationMatrix::SParams,
                                  analytics::CMatrixProfile::SParams,
                                  analytics::CEventMatcher::SParams,
                                  analytics::CCooccurrenceScorer::SParams,
                                  analytics::CUnifiedRanker::SParams,
                                  SNoopParams>;

public:
    static constexpr std::size_t MAX_NOOP_STEPS{5000};
    static constexpr core_t::TMilliseconds MAX_NOOP_STEP_MS{10000};
    //! The longest time window a job may analyse.
    static constexpr core_t::TTime MAX_WINDOW_SECONDS{400 * 86400};

public:
    CJobParams() = default;
    explicit CJobParams(TVariant params);

    api_t::EJobType type() const;
    const TVariant& value() const;

    //! Read the parameters of a job of \p type from \p json.
    //!
    //! \param[in] type The job type.
    //! \param[in] json The parameters object.
    //! \param[in] jobKey The job key, which seeds the candidate order of
    //! the unified ranking.
    //! \param[out] result Filled in with the parameters if they are valid.
    //! \param[out] error Filled in with all the problems if they aren't.
    static bool fromJson(api_t::EJobType type,
                         const json::value& json,
                         const std::string& jobKey,
                         CJobParams& result,
                         std::string& error);

    //! Parse a timestamp which is a number of seconds or a string.
    static bool parseTime(const json::value& value, core_t::TTime& result);

private:
    TVariant m_Params;
};
}
}

#endif // INCLUDED_tsse_api_CJobParams_h
