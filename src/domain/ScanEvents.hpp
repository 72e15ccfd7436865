/**
 * @file ScanEvents.hpp
 * @brief Typed events produced by scanning session output.
 */

#pragma once

#include "domain/Profile.hpp"

#include <optional>
#include <string>

namespace agentdeck::domain {

/** @brief Detector kinds; each fires at most once per session. */
enum class DetectorKind {
    Token,
    OnboardingComplete,
    RateLimit,
    AuthFailure
};

inline std::string ToString(DetectorKind kind) {
    switch (kind) {
        case DetectorKind::Token: return "token";
        case DetectorKind::OnboardingComplete: return "onboarding-complete";
        case DetectorKind::RateLimit: return "rate-limit";
        case DetectorKind::AuthFailure: return "auth-failure";
    }
    return "unknown";
}

struct TokenDetected {
    std::string sessionId;
    std::string profileId;
    std::string token;
    std::optional<std::string> email;
    bool needsOnboarding = false;
};

struct OnboardingCompleted {
    std::string sessionId;
    std::string profileId;
};

/** @brief profileId is empty when the session could not be attributed to a profile. */
struct RateLimitDetected {
    std::string sessionId;
    std::optional<std::string> profileId;
    std::string resetTime;
    RateLimitKind kind = RateLimitKind::Session;
};

struct AuthFailureDetected {
    std::string sessionId;
    std::string profileId;
    std::string message;
};

} // namespace agentdeck::domain
