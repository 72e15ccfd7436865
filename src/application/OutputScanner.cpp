/**
 * @file OutputScanner.cpp
 * @brief Implementation of OutputScanner.
 */

#include "application/OutputScanner.hpp"

#include "domain/OutputPatterns.hpp"

#include <iostream>

namespace agentdeck::application {

using domain::DetectorKind;
using domain::OutputPatterns;

OutputScanner::OutputScanner(SessionRegistry& registry, OnboardingProbe probe)
    : m_registry(registry), m_probe(std::move(probe)) {}

Subscription OutputScanner::attach(const std::string& sessionId, const std::optional<std::string>& loginProfileId) {
    auto attachment = std::make_shared<Attachment>();
    attachment->loginProfileId = loginProfileId;

    std::weak_ptr<int> alive = m_lifetime;
    attachment->output = m_registry.subscribeOutput(
        sessionId,
        [this, alive, sessionId](const std::string& chunk) {
            if (!alive.expired()) {
                scan(sessionId, chunk);
            }
        },
        false);

    m_attachments[sessionId] = attachment;

    Attachment* raw = attachment.get();
    return Subscription([this, alive, sessionId, raw]() {
        if (alive.expired()) {
            return;
        }
        auto it = m_attachments.find(sessionId);
        // A later attach() for the same id owns the slot now.
        if (it != m_attachments.end() && it->second.get() == raw) {
            m_attachments.erase(it);
        }
    });
}

bool OutputScanner::latch(const std::string& sessionId, DetectorKind kind) {
    return m_fired[sessionId].insert(kind).second;
}

bool OutputScanner::hasFired(const std::string& sessionId, DetectorKind kind) const {
    auto it = m_fired.find(sessionId);
    return it != m_fired.end() && it->second.count(kind) > 0;
}

void OutputScanner::rearm(const std::string& sessionId, DetectorKind kind) {
    auto it = m_fired.find(sessionId);
    if (it != m_fired.end()) {
        it->second.erase(kind);
    }
    // Output seen before the relaunch belongs to the previous occurrence.
    auto attachment = m_attachments.find(sessionId);
    if (attachment != m_attachments.end()) {
        attachment->second->window.clear();
    }
}

void OutputScanner::scan(const std::string& sessionId, const std::string& chunk) {
    auto it = m_attachments.find(sessionId);
    if (it == m_attachments.end()) {
        return;
    }
    std::shared_ptr<Attachment> attachment = it->second;

    attachment->window += chunk;
    if (attachment->window.size() > kWindowSize) {
        attachment->window.erase(0, attachment->window.size() - kWindowSize);
    }

    if (attachment->loginProfileId) {
        scanLogin(sessionId, *attachment);
    } else {
        scanRunning(sessionId, *attachment);
    }
}

void OutputScanner::scanLogin(const std::string& sessionId, Attachment& attachment) {
    const std::string profileId = *attachment.loginProfileId;

    if (!hasFired(sessionId, DetectorKind::Token)) {
        if (auto match = OutputPatterns::FindToken(attachment.window)) {
            latch(sessionId, DetectorKind::Token);

            domain::TokenDetected event;
            event.sessionId = sessionId;
            event.profileId = profileId;
            event.token = match->token;
            event.email = OutputPatterns::ExtractEmail(attachment.window);
            event.needsOnboarding = m_probe ? m_probe(profileId) : false;
            // Only output after the token can complete onboarding.
            attachment.window.erase(0, match->end);

            std::cout << "[OutputScanner] Token detected in session " << sessionId << " for profile " << profileId
                      << (event.needsOnboarding ? " (onboarding pending)" : "") << std::endl;
            onTokenDetected.emit(event);
        }
    }

    if (hasFired(sessionId, DetectorKind::Token) && !hasFired(sessionId, DetectorKind::OnboardingComplete) &&
        OutputPatterns::HasReadyBanner(attachment.window)) {
        latch(sessionId, DetectorKind::OnboardingComplete);

        std::cout << "[OutputScanner] Onboarding complete in session " << sessionId << std::endl;
        onOnboardingCompleted.emit(domain::OnboardingCompleted{sessionId, profileId});
    }

    // Failure text ends the flow whether or not a token was seen.
    if (!hasFired(sessionId, DetectorKind::AuthFailure)) {
        if (auto failure = OutputPatterns::ExtractAuthFailure(attachment.window)) {
            latch(sessionId, DetectorKind::AuthFailure);

            std::cerr << "[OutputScanner] Authentication failure in session " << sessionId << ": " << *failure << std::endl;
            onAuthFailure.emit(domain::AuthFailureDetected{sessionId, profileId, *failure});
        }
    }
}

void OutputScanner::scanRunning(const std::string& sessionId, Attachment& attachment) {
    if (hasFired(sessionId, DetectorKind::RateLimit)) {
        return;
    }
    auto reset = OutputPatterns::ExtractRateLimitReset(attachment.window);
    if (!reset) {
        return;
    }
    latch(sessionId, DetectorKind::RateLimit);
    attachment.window.clear();

    domain::RateLimitDetected event;
    event.sessionId = sessionId;
    event.resetTime = *reset;
    event.kind = OutputPatterns::ClassifyLimit(*reset);
    if (auto info = m_registry.get(sessionId)) {
        event.profileId = info->profileId;
    }

    std::cout << "[OutputScanner] Rate limit in session " << sessionId << ", resets " << *reset << std::endl;
    onRateLimitDetected.emit(event);
}

} // namespace agentdeck::application
