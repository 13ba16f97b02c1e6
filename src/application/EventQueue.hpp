/**
 * @file EventQueue.hpp
 * @brief Thread-safe FIFO used to hand events from background tasks to the control thread.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace smartocr::application {

/**
 * @class EventQueue
 * @brief Multi-producer, single-consumer queue with blocking and non-blocking pops.
 */
template<typename T>
class EventQueue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push_back(std::move(item));
        }
        m_cv.notify_one();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop_front();
        return item;
    }

    /**
     * @brief Waits up to timeout for an item.
     * @return The item, or nullopt on timeout or after interrupt().
     */
    template<typename Rep, typename Period>
    std::optional<T> waitPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_interrupted; });
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop_front();
        return item;
    }

    /** @brief Wakes every waiter. Pending items stay queued. */
    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_interrupted = true;
        }
        m_cv.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

private:
    std::deque<T> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_interrupted = false;
};

} // namespace smartocr::application
