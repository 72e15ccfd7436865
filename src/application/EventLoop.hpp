/**
 * @file EventLoop.hpp
 * @brief Single ordered event loop with cancellable one-shot timers.
 *
 * Every service of the core runs its handlers on this loop. Other threads
 * (PTY readers, telemetry workers) only hand results over through post().
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

namespace agentdeck::application {

class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    ~EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /** @brief Queues a task. Thread-safe; tasks run in posting order. */
    void post(Task task);

    /**
     * @brief Runs @p task once after @p delay. Thread-safe.
     * @return Id usable with cancel(). Never 0.
     */
    TimerId schedule(std::chrono::milliseconds delay, Task task);

    /**
     * @brief Cancels a pending timer.
     * @return False if the timer already ran or was cancelled.
     */
    bool cancel(TimerId id);

    /** @brief Processes tasks and timers until stop() is called. */
    void run();

    /** @brief Makes run() return after the current task. Thread-safe. */
    void stop();

    /**
     * @brief Processes events until @p predicate holds or @p timeout elapses.
     * @return The final value of the predicate.
     */
    bool runUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

    /** @brief Processes events for a fixed duration. */
    void runFor(std::chrono::milliseconds duration);

    /** @brief Runs everything that is ready now without waiting. */
    void drain();

    std::size_t pendingTimers() const;

private:
    struct Timer {
        Clock::time_point due;
        Task task;
    };

    /**
     * @brief Waits until work is ready or @p deadline passes, then runs it.
     * @return True if any task or timer ran.
     */
    bool runOnce(Clock::time_point deadline);

    bool popDueTimer(Task& out);
    void execute(const Task& task);

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Task> m_tasks;
    std::unordered_map<TimerId, Timer> m_timers;
    std::multimap<Clock::time_point, TimerId> m_timerQueue; ///< May hold ids of cancelled timers.
    TimerId m_nextTimerId = 1;
    bool m_stopRequested = false;
};

} // namespace agentdeck::application
