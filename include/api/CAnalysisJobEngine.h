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
#ifndef INCLUDED_tsse_api_CAnalysisJobEngine_h
#define INCLUDED_tsse_api_CAnalysisJobEngine_h

#include <core/CBoostJsonParser.h>
#include <core/CCancellationToken.h>
#include <core/CNonCopyable.h>
#include <core/CStaticThreadPool.h>
#include <core/CStopWatch.h>
#include <core/CoreTypes.h>

#include <api/CJobExecutor.h>
#include <api/CJobParams.h>
#include <api/JobTypes.h>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tsse {
namespace analytics {
class CSampleStore;
class CSensorRegistry;
}
namespace api {

//! \brief Runs analysis jobs asynchronously and tracks their life cycle.
//!
//! DESCRIPTION:\n
//! Jobs are created from a type name and a JSON parameters object.  The
//! parameters are validated up front so a job which can't run is never
//! created.  Created jobs wait in a queue and at most a configured number
//! run at once on a fixed size thread pool.  Callers poll a job's status
//! and progress, read its event log, fetch the result of a completed job
//! and request cancellation.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The job registry is the only state shared between threads and a single
//! mutex protects all of it.  Running jobs touch it only to replace their
//! progress and append events.  Nothing in the registry is ever locked
//! while a job computes, and pool tasks are scheduled after the lock is
//! released.
//!
//! Cancellation is cooperative.  A pending job is canceled immediately.
//! A running job has its token canceled and stops at the next loop
//! boundary which checks it.  A job whose cancellation was requested never
//! completes, even if its computation finished first.
//!
//! Jobs are retained for the lifetime of the engine.
class CAnalysisJobEngine final : private core::CNonCopyable {
public:
    //! \brief The engine settings.
    struct SConfig {
        //! The number of worker threads.
        std::size_t s_Threads = 2;
        //! The maximum number of jobs running at once.
        std::size_t s_MaxConcurrentJobs = 2;
        //! Progress events beyond this many are dropped from a job's log.
        std::size_t s_MaxEventsPerJob = 500;
        //! How long a completed job satisfies a deduplicated request.
        core_t::TTime s_DedupeCompletedSeconds = 3600;
    };

    //! \brief A request to create a job.
    struct SCreateRequest {
        std::string s_JobType;
        json::value s_Params;
        std::string s_JobKey;
        bool s_Dedupe = false;
    };

    using TOptionalJob = std::optional<SJob>;
    using TOptionalJsonValue = std::optional<json::value>;

public:
    CAnalysisJobEngine(const analytics::CSensorRegistry& registry,
                       const analytics::CSampleStore& store,
                       const SConfig& config);

    //! Cancels every job which hasn't finished and waits for running jobs
    //! to stop.
    ~CAnalysisJobEngine();

    //! Create a job or, if \p request asks for deduplication, find a live
    //! job with the same type and key.
    //!
    //! \param[in] request The job type, parameters and key.
    //! \param[out] created Set to true if a new job was created.
    //! \param[out] error Filled in if the request is invalid.
    //! \return The new or existing job, or null if the request is invalid.
    TOptionalJob createJob(const SCreateRequest& request, bool& created, SJobError& error);

    //! Get the current state of job \p id.
    TOptionalJob job(const std::string& id) const;

    //! Get the result of job \p id if it completed.
    TOptionalJsonValue result(const std::string& id) const;

    //! Request cancellation of job \p id.  Returns null for an unknown job.
    TOptionalJob requestCancel(const std::string& id);

    //! Get up to \p limit events of job \p id with ids greater than
    //! \p afterId.  A zero \p limit returns all of them.
    TJobEventVec events(const std::string& id, std::int64_t afterId, std::size_t limit) const;

    //! Block until job \p id is terminal or \p timeoutMs elapses.
    //!
    //! \return True if the job is terminal.
    bool waitForTerminal(const std::string& id, std::uint64_t timeoutMs) const;

    //! The number of jobs created.
    std::size_t numberJobs() const;

private:
    //! \brief The engine's view of one job.
    struct SJobRecord {
        SJobRecord(SJob job, CJobParams params)
            : s_Job{std::move(job)}, s_Params{std::move(params)} {}

        SJob s_Job;
        CJobParams s_Params;
        core::CCancellationToken s_Cancellation;
        TOptionalJsonValue s_Result;
        TJobEventVec s_Events;
        std::size_t s_DroppedProgressEvents = 0;
        core::CStopWatch s_Watch;
    };
    using TJobRecordPtr = std::shared_ptr<SJobRecord>;
    using TStrJobRecordPtrMap = std::map<std::string, TJobRecordPtr>;
    using TStrDeque = std::deque<std::string>;
    using TJobRecordPtrVec = std::vector<TJobRecordPtr>;

private:
    //! Find a job which a deduplicated request for \p type and \p jobKey
    //! should return.  Must be called with the lock held.
    TJobRecordPtr findDuplicate(api_t::EJobType type, const std::string& jobKey) const;

    //! Move pending jobs to running while there is capacity.  Must be
    //! called with the lock held.  The returned jobs must be scheduled
    //! once the lock is released.
    TJobRecordPtrVec startPendingJobs();

    //! Schedule \p jobs on the thread pool.
    void schedule(const TJobRecordPtrVec& jobs);

    //! The body of the task which runs \p record.
    void run(const TJobRecordPtr& record);

    //! Record the outcome of running \p record.
    void finish(const TJobRecordPtr& record,
                api_t::EJobStatus status,
                TOptionalJsonValue result,
                std::optional<SJobError> error);

    //! Transition a job which never started to canceled.  Must be called
    //! with the lock held.
    void cancelPending(SJobRecord& record);

    void onProgress(SJobRecord& record,
                    const std::string& phase,
                    std::size_t completed,
                    std::size_t total,
                    const std::string& message);
    void onPhaseTiming(SJobRecord& record, const std::string& phase, std::uint64_t milliseconds);

    //! Append an event to \p record's log.  Must be called with the lock held.
    void appendEvent(SJobRecord& record, const std::string& kind, json::object payload);

    //! Append the summary written when a job becomes terminal.
    void appendRunnerSummary(SJobRecord& record, std::uint64_t durationMs);

    const SJobRecord* find(const std::string& id) const;
    SJobRecord* find(const std::string& id);

private:
    SConfig m_Config;
    CJobExecutor m_Executor;

    mutable std::mutex m_Mutex;
    mutable std::condition_variable m_Condition;
    TStrJobRecordPtrMap m_Jobs;
    TStrDeque m_Pending;
    std::size_t m_Running = 0;
    std::uint64_t m_NextJobNumber = 1;
    bool m_ShuttingDown = false;

    //! Declared last so queued tasks drain before the state they use goes.
    core::CStaticThreadPool m_Pool;
};
}
}

#endif // INCLUDED_tsse_api_CAnalysisJobEngine_h
