/**
 * @file AutoSwitchController.hpp
 * @brief Proactive, reactive and manual switching of the active profile.
 */

#pragma once

#include "application/EventLoop.hpp"
#include "application/OutputScanner.hpp"
#include "application/ProfileService.hpp"
#include "application/SessionRegistry.hpp"
#include "application/Signal.hpp"
#include "application/UsageMonitor.hpp"
#include "domain/ScanEvents.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace agentdeck::application {

enum class SwitchReason {
    Proactive,
    Reactive,
    Manual
};

inline std::string ToString(SwitchReason reason) {
    switch (reason) {
        case SwitchReason::Proactive: return "proactive";
        case SwitchReason::Reactive: return "reactive";
        case SwitchReason::Manual: return "manual";
    }
    return "unknown";
}

/**
 * @enum SwitchOutcome
 * @brief Result of a switch request; only Switched changes the active profile.
 */
enum class SwitchOutcome {
    Switched,
    NoAlternative,  ///< Nothing eligible; a notification was emitted.
    Disabled,       ///< The relevant setting is off.
    BelowThreshold, ///< Active profile usage is fine (or unknown).
    Busy,           ///< Another switch is in flight; the trigger was dropped.
    Ignored         ///< Duplicate or stale event.
};

inline std::string ToString(SwitchOutcome outcome) {
    switch (outcome) {
        case SwitchOutcome::Switched: return "switched";
        case SwitchOutcome::NoAlternative: return "no-alternative";
        case SwitchOutcome::Disabled: return "disabled";
        case SwitchOutcome::BelowThreshold: return "below-threshold";
        case SwitchOutcome::Busy: return "busy";
        case SwitchOutcome::Ignored: return "ignored";
    }
    return "unknown";
}

struct AutoSwitchOptions {
    /** @brief Time the in-progress flag stays set after a switch before re-evaluating. */
    std::chrono::milliseconds settleDelay{2000};
};

/**
 * @class AutoSwitchController
 * @brief Chooses and applies a new active profile when the current one runs out of quota.
 *
 * A single in-progress flag serialises switches: a trigger arriving while it is
 * set is dropped, and the latest state is evaluated once the switch settles.
 */
class AutoSwitchController {
public:
    /** @brief Asks a session that ran on the previous profile to continue on @p profile. */
    using RetryHook = std::function<void(const std::string& sessionId, const domain::Profile& profile)>;

    AutoSwitchController(EventLoop& loop,
                         ProfileService& profiles,
                         UsageMonitor& usage,
                         OutputScanner& scanner,
                         SessionRegistry& registry,
                         AutoSwitchOptions options = {});
    ~AutoSwitchController();

    /** @brief Switches away from the active profile if it is over a threshold. */
    SwitchOutcome evaluateProactive();

    /** @brief Reacts to an exhausted session. */
    SwitchOutcome handleRateLimit(const domain::RateLimitDetected& event);

    /**
     * @brief Manual switch.
     * @throws domain::NotFoundError
     */
    SwitchOutcome switchTo(const std::string& profileId);

    /** @brief The profile a switch would pick right now. */
    std::optional<std::string> selectAlternative() const;

    bool switchInProgress() const { return m_switchInProgress; }

    void setRetryHook(RetryHook hook) { m_retryHook = std::move(hook); }

    /** @brief (reason, fromProfileId, toProfileId or nullopt when nothing was eligible). */
    Signal<SwitchReason, const std::string&, const std::optional<std::string>&> onNotified;

private:
    SwitchOutcome performSwitch(SwitchReason reason, const std::string& from);
    void apply(const std::string& from, const domain::Profile& to);
    void retrySession(const std::string& sessionId, const domain::Profile& profile);
    void beginSettle();
    bool isOverThreshold(const std::string& profileId, const domain::AutoSwitchSettings& settings) const;

    EventLoop& m_loop;
    ProfileService& m_profiles;
    UsageMonitor& m_usage;
    OutputScanner& m_scanner;
    SessionRegistry& m_registry;
    AutoSwitchOptions m_options;
    RetryHook m_retryHook;

    bool m_switchInProgress = false;
    std::optional<EventLoop::TimerId> m_settleTimer;
    std::map<std::string, std::string> m_lastResetBySession;

    Subscription m_usageSub;
    Subscription m_rateLimitSub;
};

} // namespace agentdeck::application
