/**
 * @file AuthService.cpp
 * @brief Implementation of AuthService.
 */

#include "application/AuthService.hpp"

#include "domain/Errors.hpp"
#include "infrastructure/IdGenerator.hpp"

#include <iostream>

namespace agentdeck::application {

AuthService::AuthService(EventLoop& loop,
                         SessionRegistry& registry,
                         OutputScanner& scanner,
                         ProfileService& profiles,
                         AuthAttemptOptions options)
    : m_loop(loop),
      m_registry(registry),
      m_scanner(scanner),
      m_profiles(profiles),
      m_options(std::move(options)) {
    m_tokenSub = m_scanner.onTokenDetected.connect([this](const domain::TokenDetected& event) {
        if (auto attempt = attemptForSession(event.sessionId)) {
            attempt->handleToken(event);
        }
    });
    m_onboardingSub = m_scanner.onOnboardingCompleted.connect([this](const domain::OnboardingCompleted& event) {
        if (auto attempt = attemptForSession(event.sessionId)) {
            attempt->handleOnboardingCompleted(event);
        }
    });
    m_failureSub = m_scanner.onAuthFailure.connect([this](const domain::AuthFailureDetected& event) {
        if (auto attempt = attemptForSession(event.sessionId)) {
            attempt->handleAuthFailure(event);
        }
    });
    m_exitSub = m_registry.onExit.connect([this](const std::string& sessionId, int exitCode) {
        if (auto attempt = attemptForSession(sessionId)) {
            attempt->handleSessionExit(exitCode);
        }
    });
}

AuthService::~AuthService() {
    for (auto& [id, attempt] : m_attempts) {
        attempt->dispose();
    }
}

std::string AuthService::start(const std::string& profileId, const domain::TerminalSize& dimensions,
                               AuthCallbacks callbacks) {
    if (!m_profiles.get(profileId)) {
        throw domain::NotFoundError("Profile not found: " + profileId);
    }

    const std::string attemptId = infrastructure::IdGenerator::NewShortId("auth");
    auto attempt = std::make_shared<AuthAttempt>(
        attemptId, profileId, m_loop, m_registry, m_scanner, m_profiles, m_options, std::move(callbacks),
        [this](const std::string& id, domain::AuthState state, const domain::AuthPayload& payload) {
            onStateChanged.emit(id, state, payload);
        },
        [this](const std::string& id) {
            if (m_attempts.count(id)) {
                cancel(id);
            }
        });
    m_attempts[attemptId] = attempt;

    std::cout << "[AuthService] Starting login " << attemptId << " for profile " << profileId << std::endl;
    if (auto sessionId = attempt->start(dimensions)) {
        m_attemptBySession[*sessionId] = attemptId;
    }
    return attemptId;
}

void AuthService::cancel(const std::string& attemptId) {
    auto it = m_attempts.find(attemptId);
    if (it == m_attempts.end()) {
        throw domain::NotFoundError("Auth attempt not found: " + attemptId);
    }
    std::shared_ptr<AuthAttempt> attempt = it->second;
    m_attempts.erase(it);

    attempt->dispose();
    if (auto login = attempt->loginSession()) {
        m_attemptBySession.erase(login->sessionId);
        m_registry.destroy(login->sessionId);
    }
    std::cout << "[AuthService] Closed login " << attemptId << " in state " << domain::ToString(attempt->state())
              << std::endl;
}

std::optional<domain::AuthState> AuthService::state(const std::string& attemptId) const {
    auto it = m_attempts.find(attemptId);
    if (it == m_attempts.end()) {
        return std::nullopt;
    }
    return it->second->state();
}

std::optional<domain::LoginSession> AuthService::loginSession(const std::string& attemptId) const {
    auto it = m_attempts.find(attemptId);
    if (it == m_attempts.end()) {
        return std::nullopt;
    }
    return it->second->loginSession();
}

std::vector<std::string> AuthService::attempts() const {
    std::vector<std::string> ids;
    for (const auto& [id, attempt] : m_attempts) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<AuthAttempt> AuthService::attemptForSession(const std::string& sessionId) const {
    auto bySession = m_attemptBySession.find(sessionId);
    if (bySession == m_attemptBySession.end()) {
        return nullptr;
    }
    auto it = m_attempts.find(bySession->second);
    return it == m_attempts.end() ? nullptr : it->second;
}

} // namespace agentdeck::application
