/**
 * @file OutputScanner.hpp
 * @brief Applies auth and usage detectors to session output.
 */

#pragma once

#include "application/SessionRegistry.hpp"
#include "application/Signal.hpp"
#include "domain/ScanEvents.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace agentdeck::application {

/**
 * @class OutputScanner
 * @brief Turns raw session output into typed auth and rate-limit events.
 *
 * Output is accumulated in a rolling window per session so that markers split
 * across writes are still recognised. Each detector fires at most once per
 * session id for the lifetime of the scanner.
 */
class OutputScanner {
public:
    /** @brief Returns true when a profile that just received a token still needs first-run setup. */
    using OnboardingProbe = std::function<bool(const std::string& profileId)>;

    static constexpr std::size_t kWindowSize = 8192;

    OutputScanner(SessionRegistry& registry, OnboardingProbe probe = {});

    /**
     * @brief Starts scanning a session.
     * @param loginProfileId Set for sessions running a login flow for that profile;
     *        only those report token, onboarding and failure events.
     * @return Handle that stops scanning when reset or destroyed.
     * @throws domain::NotFoundError for an unknown session.
     */
    Subscription attach(const std::string& sessionId,
                        const std::optional<std::string>& loginProfileId = std::nullopt);

    /** @brief Runs the detectors on one chunk of an attached session. Unattached ids are ignored. */
    void scan(const std::string& sessionId, const std::string& chunk);

    bool hasFired(const std::string& sessionId, domain::DetectorKind kind) const;

    /**
     * @brief Opens a new occurrence window for one detector of a session.
     *
     * Used when a running session is relaunched under another profile, so a
     * later exhaustion of the new profile is reported again.
     */
    void rearm(const std::string& sessionId, domain::DetectorKind kind);

    Signal<const domain::TokenDetected&> onTokenDetected;
    Signal<const domain::OnboardingCompleted&> onOnboardingCompleted;
    Signal<const domain::RateLimitDetected&> onRateLimitDetected;
    Signal<const domain::AuthFailureDetected&> onAuthFailure;

private:
    struct Attachment {
        std::optional<std::string> loginProfileId;
        std::string window;
        Subscription output;
    };

    /** @brief Check-and-set of the (session, detector) latch. */
    bool latch(const std::string& sessionId, domain::DetectorKind kind);

    void scanLogin(const std::string& sessionId, Attachment& attachment);
    void scanRunning(const std::string& sessionId, Attachment& attachment);

    SessionRegistry& m_registry;
    OnboardingProbe m_probe;
    std::map<std::string, std::shared_ptr<Attachment>> m_attachments;
    std::map<std::string, std::set<domain::DetectorKind>> m_fired;
    std::shared_ptr<int> m_lifetime = std::make_shared<int>(0);
};

} // namespace agentdeck::application
