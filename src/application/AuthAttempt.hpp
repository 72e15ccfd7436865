/**
 * @file AuthAttempt.hpp
 * @brief State machine driving one embedded login flow.
 */

#pragma once

#include "application/EventLoop.hpp"
#include "application/OutputScanner.hpp"
#include "application/ProfileService.hpp"
#include "application/SessionRegistry.hpp"
#include "application/Signal.hpp"
#include "domain/AuthState.hpp"
#include "domain/ScanEvents.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace agentdeck::application {

/**
 * @struct AuthAttemptOptions
 * @brief Timing and command of the login flow.
 */
struct AuthAttemptOptions {
    std::string loginCommand = "claude /login";  ///< Typed without a newline; the user confirms.
    std::chrono::milliseconds prefillDelay{500};
    std::chrono::milliseconds autoCloseDelay{1500};
    std::chrono::milliseconds readyTimeout{0};   ///< 0 waits forever in Ready.
};

/** @brief Caller notifications; each is invoked at most once per attempt. */
struct AuthCallbacks {
    std::function<void(const domain::AuthPayload&)> onSuccess;
    std::function<void(const domain::AuthPayload&)> onError;
};

/**
 * @class AuthAttempt
 * @brief One login flow: connecting -> ready -> [onboarding] -> success, or error.
 *
 * Success and error are guarded by a single completion latch so that racing
 * completion signals (process exit and onboarding banner) act exactly once.
 * Disposal cancels every pending timer.
 */
class AuthAttempt : public std::enable_shared_from_this<AuthAttempt> {
public:
    using StateHandler = std::function<void(const std::string& attemptId, domain::AuthState, const domain::AuthPayload&)>;
    using CloseRequest = std::function<void(const std::string& attemptId)>;

    AuthAttempt(std::string attemptId,
                std::string profileId,
                EventLoop& loop,
                SessionRegistry& registry,
                OutputScanner& scanner,
                ProfileService& profiles,
                AuthAttemptOptions options,
                AuthCallbacks callbacks,
                StateHandler onStateChanged,
                CloseRequest requestClose);
    ~AuthAttempt();

    AuthAttempt(const AuthAttempt&) = delete;
    AuthAttempt& operator=(const AuthAttempt&) = delete;

    /**
     * @brief Creates the login session and enters Ready, or Error if the spawn fails.
     * @return The login session id, or nullopt when no session was created.
     */
    std::optional<std::string> start(const domain::TerminalSize& dimensions);

    void handleToken(const domain::TokenDetected& event);
    void handleOnboardingCompleted(const domain::OnboardingCompleted& event);
    void handleAuthFailure(const domain::AuthFailureDetected& event);
    void handleSessionExit(int exitCode);

    /** @brief Cancels pending timers and stops observing output. Idempotent. */
    void dispose();

    const std::string& id() const { return m_id; }
    const std::string& profileId() const { return m_profileId; }
    domain::AuthState state() const { return m_state; }
    std::optional<domain::LoginSession> loginSession() const { return m_loginSession; }
    std::optional<std::string> capturedEmail() const { return m_capturedEmail; }
    bool prefillSent() const { return m_prefillSent; }
    bool disposed() const { return m_disposed; }

private:
    void enterReady();
    void sendPrefill();
    void succeed(bool autoClose);
    void fail(const std::string& message);
    void transition(domain::AuthState next, const std::optional<std::string>& message = std::nullopt);
    domain::AuthPayload payload(const std::optional<std::string>& message = std::nullopt) const;
    void cancelTimer(std::optional<EventLoop::TimerId>& timer);

    std::string m_id;
    std::string m_profileId;
    EventLoop& m_loop;
    SessionRegistry& m_registry;
    OutputScanner& m_scanner;
    ProfileService& m_profiles;
    AuthAttemptOptions m_options;
    AuthCallbacks m_callbacks;
    StateHandler m_onStateChanged;
    CloseRequest m_requestClose;

    domain::AuthState m_state = domain::AuthState::Connecting;
    std::optional<domain::LoginSession> m_loginSession;
    std::optional<std::string> m_capturedEmail;
    Subscription m_scan;

    bool m_prefillScheduled = false;
    bool m_prefillSent = false;
    std::atomic<bool> m_completed{false};
    bool m_disposed = false;

    std::optional<EventLoop::TimerId> m_prefillTimer;
    std::optional<EventLoop::TimerId> m_autoCloseTimer;
    std::optional<EventLoop::TimerId> m_readyTimeoutTimer;
};

} // namespace agentdeck::application
