/**
 * @file EventLoop.cpp
 * @brief Implementation of EventLoop.
 */

#include "application/EventLoop.hpp"

#include <iostream>

namespace agentdeck::application {

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
}

EventLoop::TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextTimerId++;
        const auto due = Clock::now() + delay;
        m_timers.emplace(id, Timer{due, std::move(task)});
        m_timerQueue.emplace(due, id);
    }
    m_cv.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.erase(id) > 0;
}

void EventLoop::run() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopRequested) {
                m_stopRequested = false;
                return;
            }
        }
        runOnce(Clock::now() + std::chrono::seconds(1));
    }
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
}

bool EventLoop::runUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (!predicate()) {
        if (Clock::now() >= deadline) {
            return predicate();
        }
        runOnce(deadline);
    }
    return true;
}

void EventLoop::runFor(std::chrono::milliseconds duration) {
    const auto deadline = Clock::now() + duration;
    while (Clock::now() < deadline) {
        runOnce(deadline);
    }
}

void EventLoop::drain() {
    while (runOnce(Clock::now())) {
    }
}

std::size_t EventLoop::pendingTimers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

bool EventLoop::runOnce(Clock::time_point deadline) {
    std::deque<Task> batch;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (true) {
            // Forget queue entries whose timer was cancelled.
            while (!m_timerQueue.empty() && m_timers.count(m_timerQueue.begin()->second) == 0) {
                m_timerQueue.erase(m_timerQueue.begin());
            }

            const auto now = Clock::now();
            const bool timerDue = !m_timerQueue.empty() && m_timerQueue.begin()->first <= now;
            if (!m_tasks.empty() || timerDue || m_stopRequested || now >= deadline) {
                break;
            }

            auto wakeAt = deadline;
            if (!m_timerQueue.empty() && m_timerQueue.begin()->first < wakeAt) {
                wakeAt = m_timerQueue.begin()->first;
            }
            m_cv.wait_until(lock, wakeAt);
        }
        batch.swap(m_tasks);
    }

    bool ranSomething = !batch.empty();
    for (const auto& task : batch) {
        execute(task);
    }

    // Timers are popped one at a time so that a cancel() issued by an earlier
    // handler in this turn is still honoured.
    Task timerTask;
    while (popDueTimer(timerTask)) {
        ranSomething = true;
        execute(timerTask);
    }
    return ranSomething;
}

bool EventLoop::popDueTimer(Task& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = Clock::now();
    while (!m_timerQueue.empty()) {
        auto head = m_timerQueue.begin();
        if (head->first > now) {
            return false;
        }
        const TimerId id = head->second;
        m_timerQueue.erase(head);

        auto it = m_timers.find(id);
        if (it == m_timers.end()) {
            continue;
        }
        out = std::move(it->second.task);
        m_timers.erase(it);
        return true;
    }
    return false;
}

void EventLoop::execute(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[EventLoop] Handler failed: " << e.what() << std::endl;
    }
}

} // namespace agentdeck::application
