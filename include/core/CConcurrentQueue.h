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
#ifndef INCLUDED_tsse_core_CConcurrentQueue_h
#define INCLUDED_tsse_core_CConcurrentQueue_h

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tsse {
namespace core {

//! \brief A thread safe multi-producer multi-consumer bounded queue.
//!
//! DESCRIPTION:\n
//! This blocks when pushing to a full queue and popping from an empty
//! queue.  The analysis tasks it carries are long relative to the cost
//! of taking the lock, so a single mutex is sufficient.
//!
//! The pushEmplace method forwards the constructor arguments and constructs
//! the object in-place. Example usage,
//! \code
//! CConcurrentQueue<std::pair<double, double>, 16> queue;
//! queue.pushEmplace(0.0, 1.0);
//! \endcode
//!
//! \tparam T the type of the objects of the queue.
//! \tparam CAPACITY the queue capacity.
template<typename T, std::size_t CAPACITY>
class CConcurrentQueue final {
public:
    CConcurrentQueue() = default;

    CConcurrentQueue(const CConcurrentQueue& other) = delete;
    CConcurrentQueue(CConcurrentQueue&& other) = delete;
    CConcurrentQueue& operator=(const CConcurrentQueue& other) = delete;
    CConcurrentQueue& operator=(CConcurrentQueue&& other) = delete;

    void push(T value) {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_ProducerCondition.wait(lock, [this] { return m_Queue.size() < CAPACITY; });
        m_Queue.push_back(std::move(value));
        lock.unlock();
        m_ConsumerCondition.notify_one();
    }

    template<typename... ARGS>
    void pushEmplace(ARGS&&... args) {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_ProducerCondition.wait(lock, [this] { return m_Queue.size() < CAPACITY; });
        m_Queue.emplace_back(std::forward<ARGS>(args)...);
        lock.unlock();
        m_ConsumerCondition.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_ConsumerCondition.wait(lock, [this] { return m_Queue.empty() == false; });
        T result{std::move(m_Queue.front())};
        m_Queue.pop_front();
        lock.unlock();
        m_ProducerCondition.notify_one();
        return result;
    }

    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock{m_Mutex};
        if (m_Queue.empty()) {
            return std::nullopt;
        }
        std::optional<T> result{std::move(m_Queue.front())};
        m_Queue.pop_front();
        lock.unlock();
        m_ProducerCondition.notify_one();
        return result;
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> lock{m_Mutex};
        return m_Queue.size();
    }

private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_ConsumerCondition;
    std::condition_variable m_ProducerCondition;
    std::deque<T> m_Queue;
};
}
}

#endif // INCLUDED_tsse_core_CConcurrentQueue_h
