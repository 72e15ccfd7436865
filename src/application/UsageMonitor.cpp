/**
 * @file UsageMonitor.cpp
 * @brief Implementation of UsageMonitor.
 */

#include "application/UsageMonitor.hpp"

#include <future>
#include <iostream>
#include <utility>
#include <vector>

namespace agentdeck::application {

UsageMonitor::UsageMonitor(EventLoop& loop,
                           ProfileService& profiles,
                           std::shared_ptr<domain::UsageSource> source,
                           std::shared_ptr<AsyncTaskManager> taskManager)
    : m_loop(loop),
      m_profiles(profiles),
      m_source(std::move(source)),
      m_taskManager(std::move(taskManager)) {
    m_settingsSub = m_profiles.onAutoSwitchSettingsChanged.connect([this](const domain::AutoSwitchSettings&) {
        if (m_started) {
            scheduleNext();
        }
    });
}

UsageMonitor::~UsageMonitor() {
    stop();
}

void UsageMonitor::start() {
    m_started = true;
    if (m_profiles.autoSwitchSettings().pollIntervalMs <= 0) {
        std::cout << "[UsageMonitor] Polling disabled (interval 0)" << std::endl;
        return;
    }
    refresh();
    scheduleNext();
}

void UsageMonitor::stop() {
    m_started = false;
    if (m_pollTimer) {
        m_loop.cancel(*m_pollTimer);
        m_pollTimer.reset();
    }
}

void UsageMonitor::scheduleNext() {
    if (m_pollTimer) {
        m_loop.cancel(*m_pollTimer);
        m_pollTimer.reset();
    }
    const int interval = m_profiles.autoSwitchSettings().pollIntervalMs;
    if (interval <= 0) {
        return;
    }
    m_pollTimer = m_loop.schedule(std::chrono::milliseconds(interval), [this]() {
        m_pollTimer.reset();
        refresh();
        scheduleNext();
    });
}

bool UsageMonitor::refresh() {
    if (m_inFlight) {
        std::cout << "[UsageMonitor] Poll already in flight, skipping" << std::endl;
        return false;
    }
    if (!m_source || !m_taskManager) {
        return false;
    }

    std::vector<domain::Profile> targets;
    for (const auto& profile : m_profiles.list()) {
        if (domain::IsAuthenticated(profile)) {
            targets.push_back(profile);
        }
    }

    m_inFlight = true;
    std::weak_ptr<int> alive = m_lifetime;
    EventLoop* loop = &m_loop;
    std::shared_ptr<domain::UsageSource> source = m_source;

    m_taskManager->SubmitTask(TaskType::UsagePoll, "Usage poll",
        [this, alive, loop, source, targets](const std::shared_ptr<TaskStatus>& status) {
            status->stepsTotal = static_cast<int>(targets.size());
            std::vector<std::pair<std::string, std::future<std::optional<domain::UsageSnapshot>>>> pending;
            for (const auto& profile : targets) {
                pending.emplace_back(profile.id, std::async(std::launch::async, [source, profile]() {
                    return source->fetch(profile);
                }));
            }

            std::map<std::string, std::optional<domain::UsageSnapshot>> results;
            for (auto& [profileId, future] : pending) {
                try {
                    results[profileId] = future.get();
                } catch (const std::exception& e) {
                    std::cerr << "[UsageMonitor] Fetch failed for profile " << profileId << ": " << e.what() << std::endl;
                    results[profileId] = std::nullopt;
                }
                ++status->stepsDone;
            }

            loop->post([this, alive, results]() {
                if (alive.expired()) {
                    return;
                }
                applyResults(results);
            });
        });
    return true;
}

void UsageMonitor::applyResults(const std::map<std::string, std::optional<domain::UsageSnapshot>>& results) {
    m_inFlight = false;
    for (const auto& [profileId, snapshot] : results) {
        if (!snapshot) {
            std::cerr << "[UsageMonitor] No usage data for profile " << profileId << " this cycle" << std::endl;
            continue;
        }
        domain::UsageSnapshot stamped = *snapshot;
        stamped.profileId = profileId;
        publish(stamped);
    }
    onCycleCompleted.emit();
}

void UsageMonitor::publish(const domain::UsageSnapshot& snapshot) {
    m_latest[snapshot.profileId] = snapshot;
    onUsageUpdated.emit(snapshot.profileId, snapshot);
}

std::optional<domain::UsageSnapshot> UsageMonitor::latest(const std::string& profileId) const {
    auto it = m_latest.find(profileId);
    if (it == m_latest.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace agentdeck::application
