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
#include <api/CAnalysisJobEngine.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <analytics/CAnalysisContext.h>

#include <api/CJobFailure.h>

#include <algorithm>
#include <chrono>
#include <exception>

namespace tsse {
namespace api {
namespace {
const std::string JOB_ID_PREFIX{"job-"};
const std::string QUEUED_PHASE{"queued"};
const std::string JOB_TOTAL_PHASE{"job_total"};

// Event kinds
const std::string CREATED{"created"};
const std::string STARTED{"started"};
const std::string PROGRESS{"progress"};
const std::string PHASE_TIMING{"phase_timing"};
const std::string COMPLETED{"completed"};
const std::string FAILED{"failed"};
const std::string CANCELED{"canceled"};
const std::string RUNNER_SUMMARY{"runner_summary"};
}

CAnalysisJobEngine::CAnalysisJobEngine(const analytics::CSensorRegistry& registry,
                                       const analytics::CSampleStore& store,
                                       const SConfig& config)
    : m_Config{config}, m_Executor{registry, store},
      m_Pool{std::max(config.s_Threads, std::size_t{1})} {
    m_Config.s_MaxConcurrentJobs = std::max(m_Config.s_MaxConcurrentJobs, std::size_t{1});
    LOG_DEBUG(<< "Started job engine with " << m_Pool.size() << " threads and at most "
              << m_Config.s_MaxConcurrentJobs << " concurrent jobs");
}

CAnalysisJobEngine::~CAnalysisJobEngine() {
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_ShuttingDown = true;
    for (auto& job : m_Jobs) {
        SJobRecord& record{*job.second};
        if (record.s_Job.s_Status == api_t::E_Pending) {
            this->cancelPending(record);
        } else if (record.s_Job.s_Status == api_t::E_Running) {
            record.s_Cancellation.cancel();
        }
    }
    m_Pending.clear();
    m_Condition.notify_all();
    // The pool is destroyed after this returns and waits for the running
    // jobs to observe cancellation.
}

CAnalysisJobEngine::TOptionalJob
CAnalysisJobEngine::createJob(const SCreateRequest& request, bool& created, SJobError& error) {
    created = false;

    api_t::EJobType type;
    if (api_t::parse(request.s_JobType, type) == false) {
        error = SJobError{CJobFailure::INVALID_PARAMS,
                          "Unknown job type '" + request.s_JobType + "'"};
        LOG_WARN(<< "Rejected job: " << error.s_Message);
        return std::nullopt;
    }

    std::string jobKey{request.s_JobKey};
    core::CStringUtils::trimWhitespace(jobKey);

    CJobParams params;
    std::string message;
    if (CJobParams::fromJson(type, request.s_Params, jobKey, params, message) == false ||
        m_Executor.validate(params, message) == false) {
        error = SJobError{CJobFailure::INVALID_PARAMS, message};
        LOG_WARN(<< "Rejected " << api_t::print(type) << " job: " << message);
        return std::nullopt;
    }

    TJobRecordPtrVec started;
    TOptionalJob result;
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        if (m_ShuttingDown) {
            error = SJobError{CJobFailure::INTERNAL_ERROR, "The job engine is shutting down"};
            return std::nullopt;
        }

        if (request.s_Dedupe && jobKey.empty() == false) {
            TJobRecordPtr duplicate{this->findDuplicate(type, jobKey)};
            if (duplicate != nullptr) {
                LOG_INFO(<< "Returning " << duplicate->s_Job.s_Id << " for duplicate "
                         << api_t::print(type) << " job with key '" << jobKey << "'");
                return duplicate->s_Job;
            }
        }

        std::int64_t now{core::CTimeUtils::nowMs()};
        SJob job;
        job.s_Id = JOB_ID_PREFIX + std::to_string(m_NextJobNumber++);
        job.s_Type = type;
        job.s_JobKey = jobKey;
        job.s_CreatedAt = now;
        job.s_UpdatedAt = now;
        job.s_Progress.s_Phase = QUEUED_PHASE;

        auto record = std::make_shared<SJobRecord>(std::move(job), std::move(params));
        json::object payload;
        payload["job_type"] = api_t::print(type);
        if (jobKey.empty()) {
            payload["job_key"] = nullptr;
        } else {
            payload["job_key"] = jobKey;
        }
        this->appendEvent(*record, CREATED, std::move(payload));

        const std::string& id{record->s_Job.s_Id};
        m_Jobs.emplace(id, record);
        m_Pending.push_back(id);
        created = true;
        LOG_INFO(<< "Created " << api_t::print(type) << " job " << id);

        started = this->startPendingJobs();
        result = record->s_Job;
    }

    this->schedule(started);
    return result;
}

CAnalysisJobEngine::TOptionalJob CAnalysisJobEngine::job(const std::string& id) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    const SJobRecord* record{this->find(id)};
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->s_Job;
}

CAnalysisJobEngine::TOptionalJsonValue CAnalysisJobEngine::result(const std::string& id) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    const SJobRecord* record{this->find(id)};
    if (record == nullptr || record->s_Job.s_Status != api_t::E_Completed) {
        return std::nullopt;
    }
    return record->s_Result;
}

CAnalysisJobEngine::TOptionalJob CAnalysisJobEngine::requestCancel(const std::string& id) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    SJobRecord* record{this->find(id)};
    if (record == nullptr) {
        return std::nullopt;
    }

    SJob& job{record->s_Job};
    switch (job.s_Status) {
    case api_t::E_Pending:
        this->cancelPending(*record);
        m_Pending.erase(std::remove(m_Pending.begin(), m_Pending.end(), id),
                        m_Pending.end());
        m_Condition.notify_all();
        break;
    case api_t::E_Running:
        if (job.s_CancelRequestedAt == std::nullopt) {
            job.s_CancelRequestedAt = core::CTimeUtils::nowMs();
            job.s_UpdatedAt = *job.s_CancelRequestedAt;
            record->s_Cancellation.cancel();
            LOG_INFO(<< "Requested cancellation of running job " << id);
        }
        break;
    case api_t::E_Completed:
    case api_t::E_Failed:
    case api_t::E_Canceled:
        LOG_DEBUG(<< "Ignoring cancellation of " << api_t::print(job.s_Status) << " job " << id);
        break;
    }
    return job;
}

TJobEventVec CAnalysisJobEngine::events(const std::string& id,
                                        std::int64_t afterId,
                                        std::size_t limit) const {
    TJobEventVec result;
    std::lock_guard<std::mutex> lock{m_Mutex};
    const SJobRecord* record{this->find(id)};
    if (record == nullptr) {
        return result;
    }
    for (const auto& event : record->s_Events) {
        if (event.s_Id <= afterId) {
            continue;
        }
        if (limit > 0 && result.size() == limit) {
            break;
        }
        result.push_back(event);
    }
    return result;
}

bool CAnalysisJobEngine::waitForTerminal(const std::string& id, std::uint64_t timeoutMs) const {
    std::unique_lock<std::mutex> lock{m_Mutex};
    auto isDone = [&] {
        const SJobRecord* record{this->find(id)};
        return record == nullptr || api_t::isTerminal(record->s_Job.s_Status);
    };
    m_Condition.wait_for(lock, std::chrono::milliseconds(timeoutMs), isDone);
    const SJobRecord* record{this->find(id)};
    return record != nullptr && api_t::isTerminal(record->s_Job.s_Status);
}

std::size_t CAnalysisJobEngine::numberJobs() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_Jobs.size();
}

CAnalysisJobEngine::TJobRecordPtr
CAnalysisJobEngine::findDuplicate(api_t::EJobType type, const std::string& jobKey) const {
    std::int64_t oldestCompleted{core::CTimeUtils::nowMs() -
                                 1000 * m_Config.s_DedupeCompletedSeconds};
    TJobRecordPtr result;
    for (const auto& job : m_Jobs) {
        const SJob& candidate{job.second->s_Job};
        if (candidate.s_Type != type || candidate.s_JobKey != jobKey) {
            continue;
        }
        bool live{candidate.s_Status == api_t::E_Pending ||
                  candidate.s_Status == api_t::E_Running ||
                  (candidate.s_Status == api_t::E_Completed &&
                   candidate.s_CompletedAt.value_or(0) >= oldestCompleted)};
        if (live && (result == nullptr || candidate.s_CreatedAt >= result->s_Job.s_CreatedAt)) {
            result = job.second;
        }
    }
    return result;
}

CAnalysisJobEngine::TJobRecordPtrVec CAnalysisJobEngine::startPendingJobs() {
    TJobRecordPtrVec result;
    while (m_ShuttingDown == false && m_Running < m_Config.s_MaxConcurrentJobs &&
           m_Pending.empty() == false) {
        std::string id{std::move(m_Pending.front())};
        m_Pending.pop_front();

        SJobRecord* record{this->find(id)};
        if (record == nullptr || record->s_Job.s_Status != api_t::E_Pending) {
            continue;
        }

        SJob& job{record->s_Job};
        std::int64_t now{core::CTimeUtils::nowMs()};
        job.s_Status = api_t::E_Running;
        job.s_StartedAt = now;
        job.s_UpdatedAt = now;
        job.s_Progress = SProgress{};
        job.s_Progress.s_Phase = api_t::print(job.s_Type);
        record->s_Watch.start();
        this->appendEvent(*record, STARTED, json::object{});
        ++m_Running;
        LOG_INFO(<< "Started " << api_t::print(job.s_Type) << " job " << id);

        result.push_back(m_Jobs[id]);
    }
    return result;
}

void CAnalysisJobEngine::schedule(const TJobRecordPtrVec& jobs) {
    for (const auto& job : jobs) {
        m_Pool.schedule([this, job] { this->run(job); });
    }
}

void CAnalysisJobEngine::run(const TJobRecordPtr& record) {
    SJobRecord* job{record.get()};
    analytics::CAnalysisContext context{
        job->s_Cancellation,
        [this, job](const std::string& phase, std::size_t completed,
                    std::size_t total, const std::string& message) {
            this->onProgress(*job, phase, completed, total, message);
        },
        [this, job](const std::string& phase, std::uint64_t milliseconds) {
            this->onPhaseTiming(*job, phase, milliseconds);
        }};

    api_t::EJobStatus status{api_t::E_Failed};
    TOptionalJsonValue result;
    std::optional<SJobError> error;
    try {
        context.throwIfCanceled();
        result = m_Executor.execute(job->s_Params, context);
        status = api_t::E_Completed;
    } catch (const core::CCanceledException&) {
        status = api_t::E_Canceled;
    } catch (const CJobFailure& e) {
        error = SJobError{e.code(), e.what()};
    } catch (const std::exception& e) {
        error = SJobError{CJobFailure::INTERNAL_ERROR, e.what()};
    }

    this->finish(record, status, std::move(result), std::move(error));
}

void CAnalysisJobEngine::finish(const TJobRecordPtr& record,
                                api_t::EJobStatus status,
                                TOptionalJsonValue result,
                                std::optional<SJobError> error) {
    TJobRecordPtrVec started;
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        SJob& job{record->s_Job};
        if (status == api_t::E_Completed && record->s_Cancellation.isCanceled()) {
            status = api_t::E_Canceled;
            result.reset();
        }

        std::int64_t now{core::CTimeUtils::nowMs()};
        std::uint64_t durationMs{record->s_Watch.stop()};
        job.s_Status = status;
        job.s_UpdatedAt = now;
        this->appendEvent(*record, PHASE_TIMING,
                          json::object{{"phase", JOB_TOTAL_PHASE}, {"duration_ms", durationMs}});

        switch (status) {
        case api_t::E_Completed:
            job.s_CompletedAt = now;
            record->s_Result = std::move(result);
            this->appendEvent(*record, COMPLETED, json::object{});
            LOG_INFO(<< "Completed " << api_t::print(job.s_Type) << " job " << job.s_Id
                     << " in " << durationMs << "ms");
            break;
        case api_t::E_Canceled:
            job.s_CanceledAt = now;
            if (job.s_CancelRequestedAt == std::nullopt) {
                job.s_CancelRequestedAt = now;
            }
            this->appendEvent(*record, CANCELED, json::object{});
            LOG_INFO(<< "Canceled " << api_t::print(job.s_Type) << " job " << job.s_Id
                     << " after " << durationMs << "ms");
            break;
        case api_t::E_Pending:
        case api_t::E_Running:
        case api_t::E_Failed: {
            job.s_Status = api_t::E_Failed;
            job.s_CompletedAt = now;
            job.s_Error = error.value_or(SJobError{CJobFailure::INTERNAL_ERROR,
                                                   "Job ended in an unexpected state"});
            this->appendEvent(*record, FAILED,
                              json::object{{"code", job.s_Error->s_Code},
                                           {"message", job.s_Error->s_Message}});
            LOG_ERROR(<< "Failed " << api_t::print(job.s_Type) << " job " << job.s_Id
                      << " with " << job.s_Error->s_Code << ": " << job.s_Error->s_Message);
            break;
        }
        }
        this->appendRunnerSummary(*record, durationMs);

        --m_Running;
        started = this->startPendingJobs();
        m_Condition.notify_all();
    }
    this->schedule(started);
}

void CAnalysisJobEngine::cancelPending(SJobRecord& record) {
    SJob& job{record.s_Job};
    std::int64_t now{core::CTimeUtils::nowMs()};
    job.s_Status = api_t::E_Canceled;
    job.s_CancelRequestedAt = now;
    job.s_CanceledAt = now;
    job.s_UpdatedAt = now;
    record.s_Cancellation.cancel();
    this->appendEvent(record, CANCELED, json::object{{"before_start", true}});
    this->appendRunnerSummary(record, 0);
    LOG_INFO(<< "Canceled pending " << api_t::print(job.s_Type) << " job " << job.s_Id);
}

void CAnalysisJobEngine::onProgress(SJobRecord& record,
                                    const std::string& phase,
                                    std::size_t completed,
                                    std::size_t total,
                                    const std::string& message) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    SJob& job{record.s_Job};
    job.s_Progress.s_Phase = phase;
    job.s_Progress.s_Completed = completed;
    job.s_Progress.s_Total = total;
    job.s_Progress.s_Message = message;
    job.s_UpdatedAt = core::CTimeUtils::nowMs();

    if (record.s_Events.size() >= m_Config.s_MaxEventsPerJob) {
        if (record.s_DroppedProgressEvents++ == 0) {
            LOG_DEBUG(<< "Event log of job " << job.s_Id << " is full, dropping progress events");
        }
        return;
    }
    json::object payload{{"phase", phase}, {"completed", completed}, {"total", total}};
    if (message.empty() == false) {
        payload["message"] = message;
    }
    this->appendEvent(record, PROGRESS, std::move(payload));
}

void CAnalysisJobEngine::onPhaseTiming(SJobRecord& record,
                                       const std::string& phase,
                                       std::uint64_t milliseconds) {
    LOG_DEBUG(<< "Job " << record.s_Job.s_Id << " phase " << phase << " took "
              << milliseconds << "ms");
    std::lock_guard<std::mutex> lock{m_Mutex};
    this->appendEvent(record, PHASE_TIMING,
                      json::object{{"phase", phase}, {"duration_ms", milliseconds}});
}

void CAnalysisJobEngine::appendEvent(SJobRecord& record, const std::string& kind, json::object payload) {
    SJobEvent event;
    event.s_Id = record.s_Events.empty() ? 1 : record.s_Events.back().s_Id + 1;
    event.s_CreatedAt = core::CTimeUtils::nowMs();
    event.s_Kind = kind;
    event.s_Payload = std::move(payload);
    record.s_Events.push_back(std::move(event));
}

void CAnalysisJobEngine::appendRunnerSummary(SJobRecord& record, std::uint64_t durationMs) {
    const SJob& job{record.s_Job};
    json::object payload;
    payload["status"] = api_t::print(job.s_Status);
    payload["duration_ms"] = durationMs;
    if (job.s_Error != std::nullopt) {
        payload["error_code"] = job.s_Error->s_Code;
    } else {
        payload["error_code"] = nullptr;
    }
    payload["dropped_progress_events"] = record.s_DroppedProgressEvents;
    this->appendEvent(record, RUNNER_SUMMARY, std::move(payload));
}

const CAnalysisJobEngine::SJobRecord* CAnalysisJobEngine::find(const std::string& id) const {
    auto i = m_Jobs.find(id);
    return i == m_Jobs.end() ? nullptr : i->second.get();
}

CAnalysisJobEngine::SJobRecord* CAnalysisJobEngine::find(const std::string& id) {
    auto i = m_Jobs.find(id);
    return i == m_Jobs.end() ? nullptr : i->second.get();
}
}
}
