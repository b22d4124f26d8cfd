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
#ifndef INCLUDED_tsse_api_JobTypes_h
#define INCLUDED_tsse_api_JobTypes_h

#include <core/CBoostJsonParser.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsse {
namespace api_t {

//! The kinds of analysis job.
enum EJobType {
    E_CorrelationMatrix,
    E_MatrixProfile,
    E_EventMatch,
    E_Cooccurrence,
    E_RelatedSensorsUnified,
    E_Noop
};

std::string print(EJobType type);

//! Parse \p value into \p type, returning false if unrecognised.
bool parse(const std::string& value, EJobType& type);

//! The life cycle of a job.  The last three are terminal.
enum EJobStatus { E_Pending, E_Running, E_Completed, E_Failed, E_Canceled };

std::string print(EJobStatus status);

bool isTerminal(EJobStatus status);
}

namespace api {

//! \brief How far a job has got.
struct SProgress {
    std::string s_Phase;
    std::uint64_t s_Completed = 0;
    std::optional<std::uint64_t> s_Total;
    std::string s_Message;
};

//! \brief Why a job failed or couldn't be created.
struct SJobError {
    std::string s_Code;
    std::string s_Message;
};

//! \brief The public record of a job.
//!
//! Times are milliseconds since the epoch.
struct SJob {
    std::string s_Id;
    api_t::EJobType s_Type = api_t::E_Noop;
    api_t::EJobStatus s_Status = api_t::E_Pending;
    std::string s_JobKey;
    std::int64_t s_CreatedAt = 0;
    std::int64_t s_UpdatedAt = 0;
    std::optional<std::int64_t> s_StartedAt;
    std::optional<std::int64_t> s_CompletedAt;
    std::optional<std::int64_t> s_CancelRequestedAt;
    std::optional<std::int64_t> s_CanceledAt;
    SProgress s_Progress;
    std::optional<SJobError> s_Error;
};
using TJobVec = std::vector<SJob>;

//! \brief One entry of a job's event log.
struct SJobEvent {
    //! Increasing within a job starting from one.
    std::int64_t s_Id = 0;
    std::int64_t s_CreatedAt = 0;
    std::string s_Kind;
    json::object s_Payload;
};
using TJobEventVec = std::vector<SJobEvent>;

//! Write \p job as a JSON object.
json::object toJson(const SJob& job);

//! Write \p event as a JSON object.
json::object toJson(const SJobEvent& event);
}
}

#endif // INCLUDED_tsse_api_JobTypes_h
