/**
 * @file AuthState.hpp
 * @brief States and payloads of an embedded login flow.
 */

#pragma once

#include <optional>
#include <string>

namespace agentdeck::domain {

/**
 * @enum AuthState
 * @brief Login attempt state. Success and Error are terminal.
 */
enum class AuthState {
    Connecting,
    Ready,
    Onboarding,
    Success,
    Error
};

inline std::string ToString(AuthState state) {
    switch (state) {
        case AuthState::Connecting: return "connecting";
        case AuthState::Ready: return "ready";
        case AuthState::Onboarding: return "onboarding";
        case AuthState::Success: return "success";
        case AuthState::Error: return "error";
    }
    return "unknown";
}

inline bool IsTerminal(AuthState state) {
    return state == AuthState::Success || state == AuthState::Error;
}

/** @brief Data carried with an auth.stateChanged event. */
struct AuthPayload {
    std::string profileId;
    std::optional<std::string> sessionId;
    std::optional<std::string> email;
    std::optional<std::string> message; ///< Failure text for AuthState::Error.
};

/** @brief Explicit login-session to profile association. */
struct LoginSession {
    std::string sessionId;
    std::string profileId;
};

} // namespace agentdeck::domain
