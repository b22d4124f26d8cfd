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
#include <api/JobTypes.h>

#include <core/CTimeUtils.h>

namespace tsse {
namespace api_t {

std::string print(EJobType type) {
    switch (type) {
    case E_CorrelationMatrix:
        return "correlation_matrix";
    case E_MatrixProfile:
        return "matrix_profile";
    case E_EventMatch:
        return "event_match";
    case E_Cooccurrence:
        return "cooccurrence";
    case E_RelatedSensorsUnified:
        return "related_sensors_unified";
    case E_Noop:
        return "noop";
    }
    return "-";
}

bool parse(const std::string& value, EJobType& type) {
    for (auto candidate : {E_CorrelationMatrix, E_MatrixProfile, E_EventMatch,
                           E_Cooccurrence, E_RelatedSensorsUnified, E_Noop}) {
        if (value == print(candidate)) {
            type = candidate;
            return true;
        }
    }
    return false;
}

std::string print(EJobStatus status) {
    switch (status) {
    case E_Pending:
        return "pending";
    case E_Running:
        return "running";
    case E_Completed:
        return "completed";
    case E_Failed:
        return "failed";
    case E_Canceled:
        return "canceled";
    }
    return "-";
}

bool isTerminal(EJobStatus status) {
    return status == E_Completed || status == E_Failed || status == E_Canceled;
}
}

namespace api {
namespace {
json::value isoTime(const std::optional<std::int64_t>& ms) {
    if (ms == std::nullopt) {
        return nullptr;
    }
    return json::value(core::CTimeUtils::toIso8601(*ms / 1000));
}
}

json::object toJson(const SJob& job) {
    json::object progress;
    progress["phase"] = job.s_Progress.s_Phase;
    progress["completed"] = job.s_Progress.s_Completed;
    if (job.s_Progress.s_Total != std::nullopt) {
        progress["total"] = *job.s_Progress.s_Total;
    } else {
        progress["total"] = nullptr;
    }
    if (job.s_Progress.s_Message.empty() == false) {
        progress["message"] = job.s_Progress.s_Message;
    }

    json::object result;
    result["id"] = job.s_Id;
    result["job_type"] = api_t::print(job.s_Type);
    result["status"] = api_t::print(job.s_Status);
    if (job.s_JobKey.empty()) {
        result["job_key"] = nullptr;
    } else {
        result["job_key"] = job.s_JobKey;
    }
    result["created_at"] = isoTime(job.s_CreatedAt);
    result["updated_at"] = isoTime(job.s_UpdatedAt);
    result["started_at"] = isoTime(job.s_StartedAt);
    result["completed_at"] = isoTime(job.s_CompletedAt);
    result["cancel_requested_at"] = isoTime(job.s_CancelRequestedAt);
    result["canceled_at"] = isoTime(job.s_CanceledAt);
    result["progress"] = std::move(progress);
    if (job.s_Error != std::nullopt) {
        result["error"] = json::object{{"code", job.s_Error->s_Code},
                                       {"message", job.s_Error->s_Message}};
    } else {
        result["error"] = nullptr;
    }
    return result;
}

json::object toJson(const SJobEvent& event) {
    json::object result;
    result["id"] = event.s_Id;
    result["created_at"] = core::CTimeUtils::toIso8601(event.s_CreatedAt / 1000);
    result["kind"] = event.s_Kind;
    result["payload"] = event.s_Payload;
    return result;
}
}
}
