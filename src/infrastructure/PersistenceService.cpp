/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace smartocr::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(SaveTask{filename, content});
    }
    m_cv.notify_one();
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || !m_running; });

            if (!m_running && m_queue.empty()) {
                return;
            }
            task = std::move(m_queue.front());
            m_queue.pop();
        }

        std::string error;
        if (!saveText(task.filename, task.content, error)) {
            std::cerr << "[PersistenceService] " << error << std::endl;
        }
    }
}

bool PersistenceService::saveText(const std::string& filename, const std::string& content, std::string& error) {
    fs::path finalPath = filename;
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        error = "Error creating directories for " + filename + ": " + e.what();
        return false;
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            error = "Failed to open temp file: " + tempPath.string();
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "Write failed: " + tempPath.string();
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        error = "Could not save to " + filename + ": " + ec.message();
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace smartocr::infrastructure
