/**
 * @file AsyncTaskManager.hpp
 * @brief Detached worker threads for blocking background work (telemetry, maintenance).
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agentdeck::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    UsagePoll,  ///< One telemetry cycle over all authenticated profiles.
    Maintenance ///< Housekeeping (snapshot purge and similar).
};

inline const char* ToString(TaskType type) {
    return type == TaskType::UsagePoll ? "usage-poll" : "maintenance";
}

/**
 * @struct TaskStatus
 * @brief Shared between the worker and observers; step counters are updated by the worker.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Maintenance;
    std::string description;
    std::chrono::steady_clock::time_point startedAt;
    std::atomic<int> stepsDone{0};
    std::atomic<int> stepsTotal{0};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written by the worker before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs each submitted job on its own thread and tracks the ones still running.
 *
 * Jobs never touch event-loop state directly; they post results back. Destruction
 * blocks until every job has returned.
 */
class AsyncTaskManager {
public:
    using Job = std::function<void(const std::shared_ptr<TaskStatus>&)>;

    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitForAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Starts @p job on a new thread. Exceptions are recorded on the status and logged. */
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, Job job) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;
        status->startedAt = std::chrono::steady_clock::now();

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            ++m_running;
        }

        std::thread([this, status, job = std::move(job)]() {
            try {
                job(status);
            } catch (const std::exception& e) {
                status->errorMessage = e.what();
                status->failed = true;
                std::cerr << "[AsyncTaskManager] " << ToString(status->type) << " task '" << status->description
                          << "' failed: " << e.what() << std::endl;
            }
            status->isCompleted = true;
            Finish(status->id);
        }).detach();

        return status;
    }

    /** @brief Tasks that have not returned yet. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    std::size_t CountActive(TaskType type) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return static_cast<std::size_t>(std::count_if(m_activeTasks.begin(), m_activeTasks.end(),
            [type](const std::shared_ptr<TaskStatus>& s) { return s->type == type; }));
    }

    /** @brief Blocks until no task is running. */
    void WaitForAll() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_running == 0; });
    }

private:
    void Finish(int id) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [id](const std::shared_ptr<TaskStatus>& s) { return s->id == id; }),
            m_activeTasks.end());
        --m_running;
        m_idle.notify_all();
    }

    std::atomic<int> m_nextId{1};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
    int m_running = 0;
};

} // namespace agentdeck::application
