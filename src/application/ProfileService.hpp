/**
 * @file ProfileService.hpp
 * @brief Owns credential profiles, the active-profile pointer and auto-switch settings.
 */

#pragma once

#include "application/Signal.hpp"
#include "domain/Profile.hpp"
#include "domain/ProfileRepository.hpp"
#include "domain/Session.hpp"
#include "domain/UsageSnapshot.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentdeck::application {

/**
 * @struct ProfileServiceOptions
 * @brief Filesystem and environment conventions for profiles.
 */
struct ProfileServiceOptions {
    std::string profilesRoot;               ///< Parent of derived credential directories.
    std::string defaultCredentialDirectory; ///< Ambient directory used by the default profile.
    std::string credentialEnvVar = "CLAUDE_CONFIG_DIR";
    std::string tokenEnvVar = "CLAUDE_CODE_OAUTH_TOKEN";
};

/**
 * @class ProfileService
 * @brief Profile store with an injectable persistence backend.
 *
 * Invariants: exactly one profile is the default, and the active pointer is
 * either empty or the id of an existing profile. Every mutation is validated
 * before anything changes and persisted before returning.
 */
class ProfileService {
public:
    ProfileService(std::shared_ptr<domain::ProfileRepository> repository, ProfileServiceOptions options);

    /**
     * @brief Creates or updates a profile.
     *
     * An empty id is derived from the name. A non-default profile's credential
     * directory is created when missing; the default profile's never is.
     * @throws domain::ValidationError on an empty name or derived id, or a second default.
     */
    domain::Profile save(domain::Profile profile);

    /** @throws domain::NotFoundError, domain::ConflictError for the active or default profile. */
    void remove(const std::string& id);

    /** @throws domain::NotFoundError, domain::ValidationError on an empty name. */
    void rename(const std::string& id, const std::string& newName);

    /** @throws domain::NotFoundError */
    void setActive(const std::string& id);

    /**
     * @brief Manual credential entry. Clears any stored rate-limit record.
     * @throws domain::NotFoundError, domain::ValidationError on an empty token.
     */
    void setToken(const std::string& id, const std::string& token,
                  const std::optional<std::string>& email = std::nullopt);

    /** @throws domain::NotFoundError */
    void setEmail(const std::string& id, const std::string& email);

    std::optional<domain::Profile> get(const std::string& id) const;
    std::vector<domain::Profile> list() const;
    std::optional<domain::Profile> active() const;
    std::optional<std::string> activeId() const;
    std::optional<domain::Profile> defaultProfile() const;

    /** @brief False for unknown ids. */
    bool isAuthenticated(const std::string& id) const;

    /**
     * @brief Environment a process needs to run as this profile.
     * @throws domain::NotFoundError
     */
    std::map<std::string, std::string> environmentFor(const std::string& id) const;

    /**
     * @brief Points @p options at the credentials of its profileId.
     *
     * A profile that no longer exists is dropped, leaving the ambient credentials.
     */
    void applyCredentials(domain::SessionOptions& options) const;

    domain::AutoSwitchSettings autoSwitchSettings() const;
    void updateAutoSwitchSettings(const domain::AutoSwitchSettings& settings);

    /**
     * @brief Stores a usage-exhaustion event; the window is classified from the reset text.
     * @throws domain::NotFoundError
     */
    void recordRateLimit(const std::string& id, const std::string& resetTime);

    /** @brief Whether a stored rate-limit record is still inside its window. */
    bool isRateLimited(const std::string& id,
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    Signal<const std::optional<std::string>&, const std::string&> onActiveChanged; ///< (previous, current)
    Signal<const domain::AutoSwitchSettings&> onAutoSwitchSettingsChanged;
    Signal<> onProfilesChanged;

private:
    void load();
    void persist();
    void ensureDefaultProfile();
    domain::Profile* find(const std::string& id);
    const domain::Profile* find(const std::string& id) const;
    domain::Profile& require(const std::string& id);
    std::string resolveDirectory(const domain::Profile& profile) const;

    std::shared_ptr<domain::ProfileRepository> m_repository;
    ProfileServiceOptions m_options;
    domain::ProfileStoreData m_data;
};

} // namespace agentdeck::application
