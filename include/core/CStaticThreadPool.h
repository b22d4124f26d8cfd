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
#ifndef INCLUDED_tsse_core_CStaticThreadPool_h
#define INCLUDED_tsse_core_CStaticThreadPool_h

#include <core/CConcurrentQueue.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace tsse {
namespace core {

//! \brief A minimal fixed size thread pool.
//!
//! DESCRIPTION:\n
//! Runs analysis jobs.  Each scheduled task is one job, so the pool size
//! bounds the number of jobs which compute at the same time.
//!
//! IMPLEMENTATION:\n
//! This purposely has a very limited interface.  Tasks are wrapped so an
//! exception escaping a task is logged and never terminates a worker.
//! Tasks scheduled before destruction are run to completion before the
//! workers are joined.
class CStaticThreadPool {
public:
    using TTask = std::function<void()>;

public:
    explicit CStaticThreadPool(std::size_t size);

    ~CStaticThreadPool();

    CStaticThreadPool(const CStaticThreadPool&) = delete;
    CStaticThreadPool(CStaticThreadPool&&) = delete;
    CStaticThreadPool& operator=(const CStaticThreadPool&) = delete;
    CStaticThreadPool& operator=(CStaticThreadPool&&) = delete;

    //! Get the number of worker threads.
    std::size_t size() const;

    //! Schedule a Callable type to be executed by a thread in the pool.
    //!
    //! \note This can block if the task queue is full, which exerts back
    //! pressure on the thread scheduling tasks.
    void schedule(TTask&& task);

private:
    class CWrappedTask {
    public:
        explicit CWrappedTask(TTask&& task);

        void operator()();

    private:
        TTask m_Task;
    };
    using TWrappedTaskQueue = CConcurrentQueue<CWrappedTask, 256>;
    using TThreadVec = std::vector<std::thread>;

private:
    void shutdown();
    void worker();

private:
    std::atomic_bool m_Done;
    TWrappedTaskQueue m_TaskQueue;
    TThreadVec m_Pool;
};
}
}

#endif // INCLUDED_tsse_core_CStaticThreadPool_h
