/**
 * @file AutoSwitchController.cpp
 * @brief Implementation of AutoSwitchController.
 */

#include "application/AutoSwitchController.hpp"

#include "domain/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace agentdeck::application {

AutoSwitchController::AutoSwitchController(EventLoop& loop,
                                           ProfileService& profiles,
                                           UsageMonitor& usage,
                                           OutputScanner& scanner,
                                           SessionRegistry& registry,
                                           AutoSwitchOptions options)
    : m_loop(loop),
      m_profiles(profiles),
      m_usage(usage),
      m_scanner(scanner),
      m_registry(registry),
      m_options(options) {
    m_usageSub = m_usage.onUsageUpdated.connect([this](const std::string&, const domain::UsageSnapshot&) {
        evaluateProactive();
    });
    m_rateLimitSub = m_scanner.onRateLimitDetected.connect([this](const domain::RateLimitDetected& event) {
        handleRateLimit(event);
    });
}

AutoSwitchController::~AutoSwitchController() {
    if (m_settleTimer) {
        m_loop.cancel(*m_settleTimer);
    }
}

bool AutoSwitchController::isOverThreshold(const std::string& profileId,
                                           const domain::AutoSwitchSettings& settings) const {
    auto usage = m_usage.latest(profileId);
    return usage && domain::IsOverThreshold(*usage, settings);
}

SwitchOutcome AutoSwitchController::evaluateProactive() {
    const domain::AutoSwitchSettings settings = m_profiles.autoSwitchSettings();
    if (!settings.enabled || !settings.proactiveEnabled) {
        return SwitchOutcome::Disabled;
    }
    if (m_switchInProgress) {
        return SwitchOutcome::Busy;
    }
    const auto active = m_profiles.activeId();
    if (!active || !isOverThreshold(*active, settings)) {
        return SwitchOutcome::BelowThreshold;
    }

    std::cout << "[AutoSwitch] Profile " << *active << " is over its usage threshold" << std::endl;
    return performSwitch(SwitchReason::Proactive, *active);
}

SwitchOutcome AutoSwitchController::handleRateLimit(const domain::RateLimitDetected& event) {
    auto& lastReset = m_lastResetBySession[event.sessionId];
    if (lastReset == event.resetTime) {
        return SwitchOutcome::Ignored;
    }
    lastReset = event.resetTime;

    const auto active = m_profiles.activeId();
    const std::string limited = event.profileId.value_or(active.value_or(""));
    if (m_profiles.get(limited)) {
        m_profiles.recordRateLimit(limited, event.resetTime);
    }

    const domain::AutoSwitchSettings settings = m_profiles.autoSwitchSettings();
    if (!settings.enabled || !settings.reactiveEnabled) {
        return SwitchOutcome::Disabled;
    }
    if (m_switchInProgress) {
        std::cout << "[AutoSwitch] Switch in progress, dropping rate limit from session " << event.sessionId << std::endl;
        return SwitchOutcome::Busy;
    }
    if (!active) {
        return SwitchOutcome::Ignored;
    }

    if (limited != *active) {
        // The session still runs on a profile that is no longer active.
        if (auto current = m_profiles.active()) {
            std::cout << "[AutoSwitch] Session " << event.sessionId << " hit the limit of inactive profile "
                      << limited << ", moving it to " << current->id << std::endl;
            retrySession(event.sessionId, *current);
        }
        return SwitchOutcome::Ignored;
    }

    return performSwitch(SwitchReason::Reactive, *active);
}

SwitchOutcome AutoSwitchController::switchTo(const std::string& profileId) {
    if (m_switchInProgress) {
        return SwitchOutcome::Busy;
    }
    auto target = m_profiles.get(profileId);
    if (!target) {
        throw domain::NotFoundError("Profile not found: " + profileId);
    }
    const std::string from = m_profiles.activeId().value_or("");
    if (from == profileId) {
        return SwitchOutcome::Ignored;
    }

    m_switchInProgress = true;
    try {
        apply(from, *target);
    } catch (const std::exception&) {
        m_switchInProgress = false;
        throw;
    }
    m_switchInProgress = false;

    onNotified.emit(SwitchReason::Manual, from, std::optional<std::string>(profileId));
    return SwitchOutcome::Switched;
}

SwitchOutcome AutoSwitchController::performSwitch(SwitchReason reason, const std::string& from) {
    m_switchInProgress = true;

    const auto target = selectAlternative();
    if (!target) {
        m_switchInProgress = false;
        std::cerr << "[AutoSwitch] No alternative profile available (" << ToString(reason) << ")" << std::endl;
        onNotified.emit(reason, from, std::nullopt);
        return SwitchOutcome::NoAlternative;
    }

    const auto profile = m_profiles.get(*target);
    try {
        apply(from, *profile);
    } catch (const std::exception&) {
        m_switchInProgress = false;
        throw;
    }

    std::cout << "[AutoSwitch] Switched " << from << " -> " << *target << " (" << ToString(reason) << ")" << std::endl;
    onNotified.emit(reason, from, target);
    beginSettle();
    return SwitchOutcome::Switched;
}

void AutoSwitchController::apply(const std::string& from, const domain::Profile& to) {
    m_profiles.setActive(to.id);

    for (const auto& session : m_registry.list()) {
        if (session.purpose != domain::SessionPurpose::Agent ||
            session.status != domain::SessionStatus::Running) {
            continue;
        }
        if (!session.profileId || *session.profileId == from) {
            retrySession(session.id, to);
        }
    }
}

void AutoSwitchController::retrySession(const std::string& sessionId, const domain::Profile& profile) {
    m_registry.assignProfile(sessionId, profile.id);
    m_scanner.rearm(sessionId, domain::DetectorKind::RateLimit);
    m_lastResetBySession.erase(sessionId);
    if (m_retryHook) {
        m_retryHook(sessionId, profile);
    }
}

void AutoSwitchController::beginSettle() {
    if (m_settleTimer) {
        m_loop.cancel(*m_settleTimer);
    }
    m_settleTimer = m_loop.schedule(m_options.settleDelay, [this]() {
        m_settleTimer.reset();
        m_switchInProgress = false;
        // Triggers dropped during the switch are covered by looking at the latest state.
        evaluateProactive();
    });
}

std::optional<std::string> AutoSwitchController::selectAlternative() const {
    const domain::AutoSwitchSettings settings = m_profiles.autoSwitchSettings();
    const auto active = m_profiles.activeId();

    struct Candidate {
        domain::Profile profile;
        std::optional<double> sessionPercent;
    };
    std::vector<Candidate> candidates;
    for (const auto& profile : m_profiles.list()) {
        if (active && profile.id == *active) {
            continue;
        }
        if (!domain::IsAuthenticated(profile) || m_profiles.isRateLimited(profile.id) ||
            isOverThreshold(profile.id, settings)) {
            continue;
        }
        Candidate candidate{profile, std::nullopt};
        if (auto usage = m_usage.latest(profile.id)) {
            candidate.sessionPercent = usage->sessionPercent;
        }
        candidates.push_back(candidate);
    }
    if (candidates.empty()) {
        return std::nullopt;
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        // Profiles with known usage rank before unknown ones.
        if (a.sessionPercent.has_value() != b.sessionPercent.has_value()) {
            return a.sessionPercent.has_value();
        }
        if (a.sessionPercent && *a.sessionPercent != *b.sessionPercent) {
            return *a.sessionPercent < *b.sessionPercent;
        }
        if (a.profile.createdAt != b.profile.createdAt) {
            return a.profile.createdAt < b.profile.createdAt;
        }
        return a.profile.id < b.profile.id;
    });
    return candidates.front().profile.id;
}

} // namespace agentdeck::application
