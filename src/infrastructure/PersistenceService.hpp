/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace waypoint::infrastructure {

/**
 * @struct FileTask
 * @brief A single queued write or delete.
 */
struct FileTask {
    enum class Kind { Write, Remove };

    Kind kind = Kind::Write;
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Background thread that applies file writes and deletes in submission order.
 *
 * Writes go to a temp file that is renamed over the target, so readers never
 * observe a half-written document.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues a text document to be written.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Queues deletion of a file, ordered after earlier writes to it. */
    void removeAsync(const std::string& filename);

    /** @brief Blocks until every task queued so far has been applied. */
    void flush();

    /**
     * @brief Stops the worker thread after the pending tasks are processed.
     */
    void stop();

private:
    void enqueue(FileTask task);
    void workerLoop();
    void performAtomicWrite(const FileTask& task);
    void performRemove(const FileTask& task);

    std::queue<FileTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    bool m_running = true;
};

} // namespace waypoint::infrastructure
