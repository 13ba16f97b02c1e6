/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <iostream>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace smartocr::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    DocumentInfo,
    PagePreview,
    Conversion
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Conversion;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written by the task thread before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs work on background threads and keeps them joinable.
 *
 * Finished threads are reaped on the next submission; WaitAll() joins everything
 * and is called from the destructor, so no task outlives the manager.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() { WaitAll(); }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Submits a new task. The callable receives its TaskStatus as first argument.
     * Must be called from the owning thread, never from inside a task.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        ReapCompleted();

        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        std::thread worker([status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed: " << e.what() << std::endl;
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
                std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed with an unknown error." << std::endl;
            }
            status->isCompleted = true;
        }, std::forward<F>(f), std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_tasks.push_back(Entry{status, std::move(worker)});
        return status;
    }

    /** @brief Returns statuses of tasks that have not finished yet. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        std::vector<std::shared_ptr<TaskStatus>> active;
        for (const auto& entry : m_tasks) {
            if (!entry.status->isCompleted.load()) {
                active.push_back(entry.status);
            }
        }
        return active;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitAll() {
        std::list<Entry> pending;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            pending.swap(m_tasks);
        }
        for (auto& entry : pending) {
            if (entry.worker.joinable()) {
                entry.worker.join();
            }
        }
    }

private:
    struct Entry {
        std::shared_ptr<TaskStatus> status;
        std::thread worker;
    };

    void ReapCompleted() {
        std::list<Entry> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            for (auto it = m_tasks.begin(); it != m_tasks.end();) {
                if (it->status->isCompleted.load()) {
                    auto next = std::next(it);
                    finished.splice(finished.end(), m_tasks, it);
                    it = next;
                } else {
                    ++it;
                }
            }
        }
        for (auto& entry : finished) {
            if (entry.worker.joinable()) {
                entry.worker.join();
            }
        }
    }

    std::atomic<int> m_nextId{0};
    std::list<Entry> m_tasks;
    std::mutex m_tasksMutex;
};

} // namespace smartocr::application
