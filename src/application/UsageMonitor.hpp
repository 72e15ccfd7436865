/**
 * @file UsageMonitor.hpp
 * @brief Periodic per-profile usage polling.
 */

#pragma once

#include "application/AsyncTaskManager.hpp"
#include "application/EventLoop.hpp"
#include "application/ProfileService.hpp"
#include "application/Signal.hpp"
#include "domain/UsageSnapshot.hpp"
#include "domain/UsageSource.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace agentdeck::application {

/**
 * @class UsageMonitor
 * @brief Polls the telemetry source for every authenticated profile.
 *
 * Profiles of one cycle are fetched concurrently on a background task and
 * the results are published on the event loop. A profile whose fetch fails
 * keeps its previous snapshot and does not hold up the others.
 */
class UsageMonitor {
public:
    UsageMonitor(EventLoop& loop,
                 ProfileService& profiles,
                 std::shared_ptr<domain::UsageSource> source,
                 std::shared_ptr<AsyncTaskManager> taskManager);
    ~UsageMonitor();

    UsageMonitor(const UsageMonitor&) = delete;
    UsageMonitor& operator=(const UsageMonitor&) = delete;

    /** @brief Polls now and then every pollIntervalMs. Does nothing while the interval is 0. */
    void start();
    void stop();
    bool isPolling() const { return m_pollTimer.has_value(); }

    /**
     * @brief Requests an immediate poll.
     * @return False if a poll is already in flight (the request is dropped).
     */
    bool refresh();

    bool inFlight() const { return m_inFlight; }

    std::optional<domain::UsageSnapshot> latest(const std::string& profileId) const;
    std::map<std::string, domain::UsageSnapshot> all() const { return m_latest; }

    /** @brief Stores a snapshot as if it had been polled, and publishes it. */
    void publish(const domain::UsageSnapshot& snapshot);

    Signal<const std::string&, const domain::UsageSnapshot&> onUsageUpdated; ///< (profileId, snapshot)
    Signal<> onCycleCompleted;

private:
    void scheduleNext();
    void applyResults(const std::map<std::string, std::optional<domain::UsageSnapshot>>& results);

    EventLoop& m_loop;
    ProfileService& m_profiles;
    std::shared_ptr<domain::UsageSource> m_source;
    std::shared_ptr<AsyncTaskManager> m_taskManager;

    std::map<std::string, domain::UsageSnapshot> m_latest;
    std::optional<EventLoop::TimerId> m_pollTimer;
    bool m_started = false;
    bool m_inFlight = false;
    Subscription m_settingsSub;
    std::shared_ptr<int> m_lifetime = std::make_shared<int>(0);
};

} // namespace agentdeck::application
