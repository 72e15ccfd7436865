/**
 * @file AuthService.hpp
 * @brief Starts, routes events to and disposes login attempts.
 */

#pragma once

#include "application/AuthAttempt.hpp"
#include "application/EventLoop.hpp"
#include "application/OutputScanner.hpp"
#include "application/ProfileService.hpp"
#include "application/SessionRegistry.hpp"
#include "application/Signal.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentdeck::application {

class AuthService {
public:
    AuthService(EventLoop& loop,
                SessionRegistry& registry,
                OutputScanner& scanner,
                ProfileService& profiles,
                AuthAttemptOptions options);
    ~AuthService();

    /**
     * @brief Starts a login flow for a profile.
     *
     * A spawn failure does not throw: the attempt is reported in the error state.
     * @return The attempt id.
     * @throws domain::NotFoundError for an unknown profile.
     */
    std::string start(const std::string& profileId,
                      const domain::TerminalSize& dimensions = {},
                      AuthCallbacks callbacks = {});

    /**
     * @brief Dismisses an attempt in any state: timers are cancelled and the
     *        login session is destroyed.
     * @throws domain::NotFoundError
     */
    void cancel(const std::string& attemptId);

    std::optional<domain::AuthState> state(const std::string& attemptId) const;
    std::optional<domain::LoginSession> loginSession(const std::string& attemptId) const;
    std::vector<std::string> attempts() const;

    /** @brief (attemptId, state, payload) for every transition of every attempt. */
    Signal<const std::string&, domain::AuthState, const domain::AuthPayload&> onStateChanged;

private:
    std::shared_ptr<AuthAttempt> attemptForSession(const std::string& sessionId) const;

    EventLoop& m_loop;
    SessionRegistry& m_registry;
    OutputScanner& m_scanner;
    ProfileService& m_profiles;
    AuthAttemptOptions m_options;

    std::map<std::string, std::shared_ptr<AuthAttempt>> m_attempts;
    std::map<std::string, std::string> m_attemptBySession;

    Subscription m_tokenSub;
    Subscription m_onboardingSub;
    Subscription m_failureSub;
    Subscription m_exitSub;
};

} // namespace agentdeck::application
