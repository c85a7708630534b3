/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace waypoint::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() {
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
    enqueue(FileTask{FileTask::Kind::Write, filename, content});
}

void PersistenceService::removeAsync(const std::string& filename) {
    enqueue(FileTask{FileTask::Kind::Remove, filename, {}});
}

void PersistenceService::enqueue(FileTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Dropping task for " << task.filename << " after stop()." << std::endl;
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return m_queue.empty() && !m_busy;
    });
}

void PersistenceService::workerLoop() {
    while (true) {
        FileTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (m_queue.empty()) {
                if (!m_running) {
                    m_idleCv.notify_all();
                    return;
                }
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        if (task.kind == FileTask::Kind::Write) {
            performAtomicWrite(task);
        } else {
            performRemove(task);
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void PersistenceService::performAtomicWrite(const FileTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            return;
        }
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
    }
}

void PersistenceService::performRemove(const FileTask& task) {
    std::error_code ec;
    fs::remove(task.filename, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Remove failed for " << task.filename << ": " << ec.message() << std::endl;
    }
}

} // namespace waypoint::infrastructure
