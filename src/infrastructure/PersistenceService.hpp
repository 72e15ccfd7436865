/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace agentdeck::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write or delete operation.
 */
struct SaveTask {
    enum class Kind { Write, Remove };

    Kind kind = Kind::Write;
    std::string filename;
    std::string content;
    bool ownerOnly = false; ///< Restrict the written file to mode 0600.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All writes and deletes pass through a single serialized queue, so a delete
 * queued after a write of the same file always wins.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     * @param ownerOnly Create the file with owner-only permissions.
     */
    void saveTextAsync(const std::string& filename, const std::string& content, bool ownerOnly = false);

    /**
     * @brief Asynchronously queues the deletion of a file. Missing files are ignored.
     */
    void removeAsync(const std::string& filename);

    /**
     * @brief Blocks until every task queued before the call has been processed.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /**
     * @brief Synchronous atomic write (temp -> rename), creating parent directories.
     * @throws std::runtime_error when the file cannot be written.
     */
    static void WriteFileAtomically(const std::string& filename, const std::string& content, bool ownerOnly);

private:
    void workerLoop();
    void perform(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace agentdeck::infrastructure
