/**
 * @file ProfileService.cpp
 * @brief Implementation of ProfileService.
 */

#include "application/ProfileService.hpp"

#include "domain/Errors.hpp"
#include "domain/OutputPatterns.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace agentdeck::application {

namespace fs = std::filesystem;

namespace {
constexpr const char* kDefaultProfileId = "default";
constexpr const char* kDefaultProfileName = "Default";
}

ProfileService::ProfileService(std::shared_ptr<domain::ProfileRepository> repository, ProfileServiceOptions options)
    : m_repository(std::move(repository)), m_options(std::move(options)) {
    load();
}

void ProfileService::load() {
    if (m_repository) {
        if (auto stored = m_repository->load()) {
            m_data = std::move(*stored);
        }
    }

    bool changed = false;
    const std::size_t defaults = std::count_if(m_data.profiles.begin(), m_data.profiles.end(),
                                               [](const domain::Profile& p) { return p.isDefault; });
    if (defaults > 1) {
        std::cerr << "[ProfileService] Stored data has " << defaults
                  << " default profiles; keeping the first." << std::endl;
        bool seen = false;
        for (auto& profile : m_data.profiles) {
            if (profile.isDefault) {
                profile.isDefault = !seen;
                seen = true;
            }
        }
        changed = true;
    }
    if (defaults == 0) {
        ensureDefaultProfile();
        changed = true;
    }

    if (!m_data.activeProfileId || !find(*m_data.activeProfileId)) {
        m_data.activeProfileId = defaultProfile()->id;
        changed = true;
    }

    if (changed) {
        persist();
    }
    std::cout << "[ProfileService] Loaded " << m_data.profiles.size() << " profile(s), active: "
              << *m_data.activeProfileId << std::endl;
}

void ProfileService::ensureDefaultProfile() {
    domain::Profile profile;
    profile.id = kDefaultProfileId;
    profile.name = kDefaultProfileName;
    profile.credentialDirectory = infrastructure::PathUtils::ExpandHome(m_options.defaultCredentialDirectory);
    profile.isDefault = true;
    profile.createdAt = std::chrono::system_clock::now();

    // An existing non-default "default" id would collide.
    if (domain::Profile* existing = find(profile.id)) {
        existing->isDefault = true;
        if (existing->credentialDirectory.empty()) {
            existing->credentialDirectory = profile.credentialDirectory;
        }
        return;
    }
    m_data.profiles.insert(m_data.profiles.begin(), profile);
}

void ProfileService::persist() {
    if (!m_repository) {
        return;
    }
    m_repository->save(m_data);
}

domain::Profile* ProfileService::find(const std::string& id) {
    auto it = std::find_if(m_data.profiles.begin(), m_data.profiles.end(),
                           [&id](const domain::Profile& p) { return p.id == id; });
    return it == m_data.profiles.end() ? nullptr : &*it;
}

const domain::Profile* ProfileService::find(const std::string& id) const {
    auto it = std::find_if(m_data.profiles.begin(), m_data.profiles.end(),
                           [&id](const domain::Profile& p) { return p.id == id; });
    return it == m_data.profiles.end() ? nullptr : &*it;
}

domain::Profile& ProfileService::require(const std::string& id) {
    domain::Profile* profile = find(id);
    if (!profile) {
        throw domain::NotFoundError("Profile not found: " + id);
    }
    return *profile;
}

std::string ProfileService::resolveDirectory(const domain::Profile& profile) const {
    if (!profile.credentialDirectory.empty()) {
        return infrastructure::PathUtils::ExpandHome(profile.credentialDirectory);
    }
    if (profile.isDefault) {
        return infrastructure::PathUtils::ExpandHome(m_options.defaultCredentialDirectory);
    }
    return (fs::path(infrastructure::PathUtils::ExpandHome(m_options.profilesRoot)) / profile.id).string();
}

domain::Profile ProfileService::save(domain::Profile profile) {
    if (profile.name.empty()) {
        throw domain::ValidationError("Profile name must not be empty");
    }
    if (profile.id.empty()) {
        profile.id = domain::MakeProfileId(profile.name);
        if (profile.id.empty()) {
            throw domain::ValidationError("Cannot derive a profile id from name: " + profile.name);
        }
    }

    domain::Profile* existing = find(profile.id);
    if (profile.isDefault && !(existing && existing->isDefault)) {
        throw domain::ValidationError("A default profile already exists");
    }
    if (existing) {
        // Identity fields are owned by the store.
        profile.isDefault = existing->isDefault;
        profile.createdAt = existing->createdAt;
        if (!profile.lastRateLimit) {
            profile.lastRateLimit = existing->lastRateLimit;
        }
    } else {
        profile.createdAt = std::chrono::system_clock::now();
    }
    profile.credentialDirectory = resolveDirectory(profile);

    if (!profile.isDefault) {
        std::error_code ec;
        if (!fs::exists(profile.credentialDirectory, ec)) {
            fs::create_directories(profile.credentialDirectory, ec);
            if (ec) {
                throw std::runtime_error("Failed to create credential directory " +
                                         profile.credentialDirectory + ": " + ec.message());
            }
            fs::permissions(profile.credentialDirectory, fs::perms::owner_all, fs::perm_options::replace, ec);
            std::cout << "[ProfileService] Created credential directory " << profile.credentialDirectory << std::endl;
        }
    }

    if (existing) {
        *existing = profile;
    } else {
        m_data.profiles.push_back(profile);
    }
    persist();
    onProfilesChanged.emit();
    return profile;
}

void ProfileService::remove(const std::string& id) {
    const domain::Profile& profile = require(id);
    if (profile.isDefault) {
        throw domain::ConflictError("Cannot delete the default profile");
    }
    if (m_data.activeProfileId && *m_data.activeProfileId == id) {
        throw domain::ConflictError("Cannot delete the active profile: " + id);
    }

    m_data.profiles.erase(std::remove_if(m_data.profiles.begin(), m_data.profiles.end(),
                                         [&id](const domain::Profile& p) { return p.id == id; }),
                          m_data.profiles.end());
    persist();
    std::cout << "[ProfileService] Deleted profile " << id << std::endl;
    onProfilesChanged.emit();
}

void ProfileService::rename(const std::string& id, const std::string& newName) {
    domain::Profile& profile = require(id);
    if (newName.empty()) {
        throw domain::ValidationError("Profile name must not be empty");
    }
    profile.name = newName;
    persist();
    onProfilesChanged.emit();
}

void ProfileService::setActive(const std::string& id) {
    domain::Profile& profile = require(id);
    const auto previous = m_data.activeProfileId;
    m_data.activeProfileId = id;
    profile.lastUsedAt = std::chrono::system_clock::now();
    persist();

    if (previous != m_data.activeProfileId) {
        std::cout << "[ProfileService] Active profile: " << id << std::endl;
        onActiveChanged.emit(previous, id);
    }
}

void ProfileService::setToken(const std::string& id, const std::string& token,
                              const std::optional<std::string>& email) {
    domain::Profile& profile = require(id);
    if (token.empty()) {
        throw domain::ValidationError("Token must not be empty");
    }
    profile.token = token;
    profile.tokenCreatedAt = std::chrono::system_clock::now();
    if (email && !email->empty()) {
        profile.email = email;
    }
    profile.lastRateLimit.reset();
    persist();

    std::cout << "[ProfileService] Stored token for profile " << id << " (" << token.size() << " chars)" << std::endl;
    onProfilesChanged.emit();
}

void ProfileService::setEmail(const std::string& id, const std::string& email) {
    domain::Profile& profile = require(id);
    profile.email = email;
    persist();
    onProfilesChanged.emit();
}

std::optional<domain::Profile> ProfileService::get(const std::string& id) const {
    if (const domain::Profile* profile = find(id)) {
        return *profile;
    }
    return std::nullopt;
}

std::vector<domain::Profile> ProfileService::list() const {
    return m_data.profiles;
}

std::optional<domain::Profile> ProfileService::active() const {
    if (!m_data.activeProfileId) {
        return std::nullopt;
    }
    return get(*m_data.activeProfileId);
}

std::optional<std::string> ProfileService::activeId() const {
    return m_data.activeProfileId;
}

std::optional<domain::Profile> ProfileService::defaultProfile() const {
    for (const auto& profile : m_data.profiles) {
        if (profile.isDefault) {
            return profile;
        }
    }
    return std::nullopt;
}

bool ProfileService::isAuthenticated(const std::string& id) const {
    const domain::Profile* profile = find(id);
    return profile && domain::IsAuthenticated(*profile);
}

std::map<std::string, std::string> ProfileService::environmentFor(const std::string& id) const {
    const domain::Profile* profile = find(id);
    if (!profile) {
        throw domain::NotFoundError("Profile not found: " + id);
    }

    std::map<std::string, std::string> env;
    if (profile->hasToken()) {
        env[m_options.tokenEnvVar] = *profile->token;
    } else if (!profile->isDefault) {
        env[m_options.credentialEnvVar] = profile->credentialDirectory;
    }
    return env;
}

void ProfileService::applyCredentials(domain::SessionOptions& options) const {
    if (!options.profileId) {
        return;
    }
    if (!find(*options.profileId)) {
        std::cerr << "[ProfileService] Profile " << *options.profileId << " no longer exists, using ambient credentials"
                  << std::endl;
        options.profileId.reset();
        return;
    }
    for (const auto& [key, value] : environmentFor(*options.profileId)) {
        options.env[key] = value;
    }
}

domain::AutoSwitchSettings ProfileService::autoSwitchSettings() const {
    return m_data.autoSwitch;
}

void ProfileService::updateAutoSwitchSettings(const domain::AutoSwitchSettings& settings) {
    if (settings.pollIntervalMs < 0) {
        throw domain::ValidationError("pollIntervalMs must not be negative");
    }
    m_data.autoSwitch = settings;
    persist();
    onAutoSwitchSettingsChanged.emit(m_data.autoSwitch);
}

void ProfileService::recordRateLimit(const std::string& id, const std::string& resetTime) {
    domain::Profile& profile = require(id);
    domain::RateLimitRecord record;
    record.kind = domain::OutputPatterns::ClassifyLimit(resetTime);
    record.resetTime = resetTime;
    record.detectedAt = std::chrono::system_clock::now();
    profile.lastRateLimit = record;
    persist();

    std::cout << "[ProfileService] Rate limit (" << domain::RateLimitKindToString(record.kind)
              << ") recorded for profile " << id << ", resets " << resetTime << std::endl;
}

bool ProfileService::isRateLimited(const std::string& id, std::chrono::system_clock::time_point now) const {
    const domain::Profile* profile = find(id);
    return profile && profile->lastRateLimit && domain::IsRateLimitActive(*profile->lastRateLimit, now);
}

} // namespace agentdeck::application
