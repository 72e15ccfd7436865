/**
 * @file UsageSnapshot.hpp
 * @brief Per-profile quota telemetry and the auto-switch policy knobs.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace agentdeck::domain {

/**
 * @struct UsageSnapshot
 * @brief Latest utilisation of a profile's quota windows, in percent (0-100).
 */
struct UsageSnapshot {
    std::string profileId;
    double sessionPercent = 0.0;  ///< 5-hour window.
    double weeklyPercent = 0.0;   ///< 7-day window.
    std::optional<std::string> sessionResetsAt;
    std::optional<std::string> weeklyResetsAt;
    std::chrono::system_clock::time_point measuredAt;
};

/**
 * @struct AutoSwitchSettings
 * @brief Policy read by the auto-switch controller on every evaluation.
 */
struct AutoSwitchSettings {
    bool enabled = false;
    bool proactiveEnabled = true;
    double sessionThreshold = 95.0;
    double weeklyThreshold = 99.0;
    bool reactiveEnabled = true;
    int pollIntervalMs = 300000; ///< 0 disables polling.
};

inline bool IsOverThreshold(const UsageSnapshot& usage, const AutoSwitchSettings& settings) {
    return usage.sessionPercent >= settings.sessionThreshold ||
           usage.weeklyPercent >= settings.weeklyThreshold;
}

} // namespace agentdeck::domain
