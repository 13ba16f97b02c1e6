/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation latch shared between a run and its controller.
 */

#pragma once
#include <atomic>

namespace smartocr::application {

/**
 * @class CancellationToken
 * @brief One-way boolean latch. Set from any thread, polled by the pipeline at its checkpoints.
 *
 * A token is never reset; every run gets a fresh one.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /** @brief Requests cancellation. Idempotent. */
    void cancel() { m_cancelled.store(true, std::memory_order_release); }

    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace smartocr::application
