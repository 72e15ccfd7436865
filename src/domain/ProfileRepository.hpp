/**
 * @file ProfileRepository.hpp
 * @brief Interface for persisting profiles, the active pointer and auto-switch settings.
 */

#pragma once

#include "domain/Profile.hpp"
#include "domain/UsageSnapshot.hpp"

#include <optional>
#include <string>
#include <vector>

namespace agentdeck::domain {

/**
 * @struct ProfileStoreData
 * @brief Everything the profile store keeps durably, as one document.
 */
struct ProfileStoreData {
    std::vector<Profile> profiles;
    std::optional<std::string> activeProfileId;
    AutoSwitchSettings autoSwitch;
};

class ProfileRepository {
public:
    virtual ~ProfileRepository() = default;

    /** @brief Returns nullopt when nothing has been stored yet. */
    virtual std::optional<ProfileStoreData> load() = 0;

    /** @brief Replaces the stored document. Throws std::runtime_error on I/O failure. */
    virtual void save(const ProfileStoreData& data) = 0;
};

} // namespace agentdeck::domain
