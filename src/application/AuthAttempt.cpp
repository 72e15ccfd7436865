/**
 * @file AuthAttempt.cpp
 * @brief Implementation of AuthAttempt.
 */

#include "application/AuthAttempt.hpp"

#include "domain/Errors.hpp"

#include <iostream>

namespace agentdeck::application {

using domain::AuthState;

AuthAttempt::AuthAttempt(std::string attemptId,
                         std::string profileId,
                         EventLoop& loop,
                         SessionRegistry& registry,
                         OutputScanner& scanner,
                         ProfileService& profiles,
                         AuthAttemptOptions options,
                         AuthCallbacks callbacks,
                         StateHandler onStateChanged,
                         CloseRequest requestClose)
    : m_id(std::move(attemptId)),
      m_profileId(std::move(profileId)),
      m_loop(loop),
      m_registry(registry),
      m_scanner(scanner),
      m_profiles(profiles),
      m_options(std::move(options)),
      m_callbacks(std::move(callbacks)),
      m_onStateChanged(std::move(onStateChanged)),
      m_requestClose(std::move(requestClose)) {}

AuthAttempt::~AuthAttempt() {
    dispose();
}

std::optional<std::string> AuthAttempt::start(const domain::TerminalSize& dimensions) {
    auto profile = m_profiles.get(m_profileId);
    if (!profile) {
        throw domain::NotFoundError("Profile not found: " + m_profileId);
    }

    domain::SessionOptions options;
    options.profileId = m_profileId;
    options.dimensions = dimensions;
    options.purpose = domain::SessionPurpose::Login;
    options.persist = false;
    options.title = "Login: " + profile->name;
    if (!profile->isDefault) {
        options.credentialDirectory = profile->credentialDirectory;
    }

    domain::SessionInfo session;
    try {
        session = m_registry.create(options);
    } catch (const domain::SpawnError& e) {
        fail(std::string("Could not start login session: ") + e.what());
        return std::nullopt;
    }

    m_loginSession = domain::LoginSession{session.id, m_profileId};
    m_scan = m_scanner.attach(session.id, m_profileId);
    enterReady();
    return session.id;
}

void AuthAttempt::enterReady() {
    transition(AuthState::Ready);

    std::weak_ptr<AuthAttempt> weak = shared_from_this();
    if (!m_prefillScheduled) {
        m_prefillScheduled = true;
        m_prefillTimer = m_loop.schedule(m_options.prefillDelay, [weak]() {
            if (auto self = weak.lock()) {
                self->m_prefillTimer.reset();
                self->sendPrefill();
            }
        });
    }

    if (m_options.readyTimeout.count() > 0 && !m_readyTimeoutTimer) {
        m_readyTimeoutTimer = m_loop.schedule(m_options.readyTimeout, [weak]() {
            if (auto self = weak.lock()) {
                self->m_readyTimeoutTimer.reset();
                if (self->m_state == AuthState::Ready) {
                    self->fail("Timed out waiting for login to complete");
                }
            }
        });
    }
}

void AuthAttempt::sendPrefill() {
    if (m_prefillSent || m_disposed || m_state != AuthState::Ready || !m_loginSession) {
        return;
    }
    m_prefillSent = true;
    if (!m_registry.write(m_loginSession->sessionId, m_options.loginCommand)) {
        std::cerr << "[AuthAttempt] " << m_id << ": login session gone before prefill" << std::endl;
    }
}

void AuthAttempt::handleToken(const domain::TokenDetected& event) {
    auto self = shared_from_this();
    if (m_disposed || (m_state != AuthState::Ready && m_state != AuthState::Connecting)) {
        return;
    }

    if (event.email) {
        m_capturedEmail = event.email;
    }
    try {
        m_profiles.setToken(m_profileId, event.token, event.email);
    } catch (const std::exception& e) {
        fail(std::string("Could not store token: ") + e.what());
        return;
    }

    if (event.needsOnboarding) {
        cancelTimer(m_prefillTimer);
        cancelTimer(m_readyTimeoutTimer);
        transition(AuthState::Onboarding);
    } else {
        succeed(false);
    }
}

void AuthAttempt::handleOnboardingCompleted(const domain::OnboardingCompleted&) {
    auto self = shared_from_this();
    if (m_disposed || m_state != AuthState::Onboarding) {
        return;
    }
    succeed(true);
}

void AuthAttempt::handleAuthFailure(const domain::AuthFailureDetected& event) {
    auto self = shared_from_this();
    if (m_disposed || domain::IsTerminal(m_state)) {
        return;
    }
    fail(event.message);
}

void AuthAttempt::handleSessionExit(int exitCode) {
    auto self = shared_from_this();
    if (m_disposed || domain::IsTerminal(m_state)) {
        return;
    }
    if (m_state == AuthState::Onboarding && exitCode == 0) {
        // The user is looking at the finished session; no auto-close here.
        succeed(false);
        return;
    }
    fail("Login session exited with code " + std::to_string(exitCode));
}

void AuthAttempt::succeed(bool autoClose) {
    if (m_completed.exchange(true)) {
        return;
    }
    cancelTimer(m_prefillTimer);
    cancelTimer(m_readyTimeoutTimer);

    if (m_capturedEmail) {
        try {
            m_profiles.setEmail(m_profileId, *m_capturedEmail);
        } catch (const std::exception& e) {
            std::cerr << "[AuthAttempt] " << m_id << ": could not store email: " << e.what() << std::endl;
        }
    }

    transition(AuthState::Success);
    if (m_callbacks.onSuccess) {
        m_callbacks.onSuccess(payload());
    }

    if (autoClose && !m_disposed) {
        std::weak_ptr<AuthAttempt> weak = shared_from_this();
        m_autoCloseTimer = m_loop.schedule(m_options.autoCloseDelay, [weak]() {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            self->m_autoCloseTimer.reset();
            if (self->m_requestClose) {
                self->m_requestClose(self->m_id);
            }
        });
    }
}

void AuthAttempt::fail(const std::string& message) {
    if (m_completed.exchange(true)) {
        return;
    }
    cancelTimer(m_prefillTimer);
    cancelTimer(m_readyTimeoutTimer);

    std::cerr << "[AuthAttempt] " << m_id << " failed: " << message << std::endl;
    transition(AuthState::Error, message);
    if (m_callbacks.onError) {
        m_callbacks.onError(payload(message));
    }
}

void AuthAttempt::transition(AuthState next, const std::optional<std::string>& message) {
    m_state = next;
    std::cout << "[AuthAttempt] " << m_id << " (" << m_profileId << ") -> " << domain::ToString(next) << std::endl;
    if (m_onStateChanged) {
        m_onStateChanged(m_id, next, payload(message));
    }
}

domain::AuthPayload AuthAttempt::payload(const std::optional<std::string>& message) const {
    domain::AuthPayload result;
    result.profileId = m_profileId;
    if (m_loginSession) {
        result.sessionId = m_loginSession->sessionId;
    }
    result.email = m_capturedEmail;
    result.message = message;
    return result;
}

void AuthAttempt::cancelTimer(std::optional<EventLoop::TimerId>& timer) {
    if (timer) {
        m_loop.cancel(*timer);
        timer.reset();
    }
}

void AuthAttempt::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    cancelTimer(m_prefillTimer);
    cancelTimer(m_autoCloseTimer);
    cancelTimer(m_readyTimeoutTimer);
    m_scan.reset();
}

} // namespace agentdeck::application
