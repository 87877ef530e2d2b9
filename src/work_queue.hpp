/**
 * @file work_queue.hpp
 * @brief Bounded blocking queue between the walker, the workers and the writer.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace FontGrep {

/**
 * @brief Thread-safe FIFO with a capacity limit.
 *
 * push() blocks while the queue is full, pop() blocks while it is empty.
 * After close(), push() refuses new items and pop() drains the remaining
 * ones before returning std::nullopt.
 *
 * @tparam T Item type (must be movable)
 */
template <typename T>
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @brief Append an item, waiting for space.
     * @return false if the queue was closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });
        if (m_closed) return false;
        m_items.push_back(std::move(item));
        lock.unlock();
        m_notEmpty.notify_one();
        return true;
    }

    /**
     * @brief Take the oldest item, waiting for one.
     * @return std::nullopt once the queue is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] { return m_closed || !m_items.empty(); });
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        lock.unlock();
        m_notFull.notify_one();
        return item;
    }

    /// Stop accepting items and wake every waiter
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::deque<T> m_items;
    bool m_closed = false;
};

} // namespace FontGrep
