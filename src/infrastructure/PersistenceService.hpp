/**
 * @file PersistenceService.hpp
 * @brief Atomic text file writes, synchronous or through a background queue.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace smartocr::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Writes UTF-8 text files via temp file + rename, so readers never see a half-written file.
 *
 * Asynchronous writes go through a single serialized queue drained by one worker
 * thread; writes to the same path are applied in submission order.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Writes content to filename now, overwriting any existing file.
     * @param error Receives a description when the write fails.
     * @return true on success.
     */
    static bool saveText(const std::string& filename, const std::string& content, std::string& error);

    /** @brief Queues a write; failures are logged. */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Processes pending tasks and stops the worker thread. */
    void stop();

private:
    void workerLoop();

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace smartocr::infrastructure
