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
#include <core/CStaticThreadPool.h>

#include <core/CLogger.h>

#include <algorithm>

namespace tsse {
namespace core {
namespace {
std::size_t computeSize(std::size_t hint) {
    std::size_t bound{std::thread::hardware_concurrency()};
    std::size_t size{bound > 0 ? std::min(hint, bound) : hint};
    return std::max(size, std::size_t{1});
}
}

CStaticThreadPool::CStaticThreadPool(std::size_t size) : m_Done{false} {
    size = computeSize(size);
    m_Pool.reserve(size);
    for (std::size_t id = 0; id < size; ++id) {
        try {
            m_Pool.emplace_back([this] { this->worker(); });
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to start worker thread: " << e.what());
            this->shutdown();
            throw;
        }
    }
}

CStaticThreadPool::~CStaticThreadPool() {
    this->shutdown();
}

std::size_t CStaticThreadPool::size() const {
    return m_Pool.size();
}

void CStaticThreadPool::schedule(TTask&& task) {
    m_TaskQueue.push(CWrappedTask{std::move(task)});
}

void CStaticThreadPool::shutdown() {

    // The queue is FIFO so every task scheduled so far runs before any
    // worker sees one of these.
    for (std::size_t id = 0; id < m_Pool.size(); ++id) {
        m_TaskQueue.push(CWrappedTask{[this] { m_Done.store(true); }});
    }

    for (auto& thread : m_Pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    m_Pool.clear();
}

void CStaticThreadPool::worker() {
    while (m_Done.load() == false) {
        CWrappedTask task{m_TaskQueue.pop()};
        task();
    }
}

CStaticThreadPool::CWrappedTask::CWrappedTask(TTask&& task)
    : m_Task{std::move(task)} {
}

void CStaticThreadPool::CWrappedTask::operator()() {
    if (m_Task != nullptr) {
        try {
            m_Task();
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed executing task with error '" << e.what() << "'");
        }
    }
}
}
}
