/**
 * @file JsonProfileRepository.cpp
 * @brief Implementation of JsonProfileRepository.
 */

#include "infrastructure/JsonProfileRepository.hpp"

#include "infrastructure/EpochTime.hpp"
#include "infrastructure/PersistenceService.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace agentdeck::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json ProfileToJson(const domain::Profile& profile) {
    json j;
    j["id"] = profile.id;
    j["name"] = profile.name;
    j["credentialDirectory"] = profile.credentialDirectory;
    j["isDefault"] = profile.isDefault;
    j["createdAt"] = ToEpochMs(profile.createdAt);
    if (profile.token) j["token"] = *profile.token;
    if (profile.email) j["email"] = *profile.email;
    if (profile.description) j["description"] = *profile.description;
    if (profile.tokenCreatedAt) j["tokenCreatedAt"] = ToEpochMs(*profile.tokenCreatedAt);
    if (profile.lastUsedAt) j["lastUsedAt"] = ToEpochMs(*profile.lastUsedAt);
    if (profile.lastRateLimit) {
        j["lastRateLimit"] = {
            {"kind", domain::RateLimitKindToString(profile.lastRateLimit->kind)},
            {"resetTime", profile.lastRateLimit->resetTime},
            {"detectedAt", ToEpochMs(profile.lastRateLimit->detectedAt)}
        };
    }
    return j;
}

domain::Profile ProfileFromJson(const json& j) {
    domain::Profile profile;
    profile.id = j.at("id").get<std::string>();
    profile.name = j.value("name", profile.id);
    profile.credentialDirectory = j.value("credentialDirectory", std::string());
    profile.isDefault = j.value("isDefault", false);
    profile.createdAt = FromEpochMs(j.value("createdAt", 0LL));
    profile.token = OptionalString(j, "token");
    profile.email = OptionalString(j, "email");
    profile.description = OptionalString(j, "description");
    profile.tokenCreatedAt = OptionalTime(j, "tokenCreatedAt");
    profile.lastUsedAt = OptionalTime(j, "lastUsedAt");
    if (j.contains("lastRateLimit") && j["lastRateLimit"].is_object()) {
        const auto& r = j["lastRateLimit"];
        domain::RateLimitRecord record;
        record.kind = domain::RateLimitKindFromString(r.value("kind", std::string("session")));
        record.resetTime = r.value("resetTime", std::string());
        record.detectedAt = FromEpochMs(r.value("detectedAt", 0LL));
        profile.lastRateLimit = record;
    }
    return profile;
}

json SettingsToJson(const domain::AutoSwitchSettings& s) {
    return {
        {"enabled", s.enabled},
        {"proactiveSwapEnabled", s.proactiveEnabled},
        {"sessionThreshold", s.sessionThreshold},
        {"weeklyThreshold", s.weeklyThreshold},
        {"autoSwitchOnRateLimit", s.reactiveEnabled},
        {"usageCheckInterval", s.pollIntervalMs}
    };
}

domain::AutoSwitchSettings SettingsFromJson(const json& j) {
    domain::AutoSwitchSettings s;
    if (!j.is_object()) {
        return s;
    }
    s.enabled = j.value("enabled", s.enabled);
    s.proactiveEnabled = j.value("proactiveSwapEnabled", s.proactiveEnabled);
    s.sessionThreshold = j.value("sessionThreshold", s.sessionThreshold);
    s.weeklyThreshold = j.value("weeklyThreshold", s.weeklyThreshold);
    s.reactiveEnabled = j.value("autoSwitchOnRateLimit", s.reactiveEnabled);
    s.pollIntervalMs = j.value("usageCheckInterval", s.pollIntervalMs);
    return s;
}

} // namespace

JsonProfileRepository::JsonProfileRepository(std::string filePath) : m_filePath(std::move(filePath)) {}

std::optional<domain::ProfileStoreData> JsonProfileRepository::load() {
    if (!fs::exists(m_filePath)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(m_filePath);
        json j;
        f >> j;

        const int version = j.value("version", 1);
        if (version > kFormatVersion) {
            std::cerr << "[JsonProfileRepository] " << m_filePath << " has newer format version " << version
                      << ", reading known fields only" << std::endl;
        }

        domain::ProfileStoreData data;
        for (const auto& item : j.value("profiles", json::array())) {
            try {
                data.profiles.push_back(ProfileFromJson(item));
            } catch (const json::exception& e) {
                std::cerr << "[JsonProfileRepository] Skipping malformed profile entry: " << e.what() << std::endl;
            }
        }
        data.activeProfileId = OptionalString(j, "activeProfileId");
        if (j.contains("autoSwitch")) {
            data.autoSwitch = SettingsFromJson(j["autoSwitch"]);
        }
        return data;
    } catch (const json::exception& e) {
        // Keep the unreadable document for manual recovery; it may hold tokens.
        fs::path backup = m_filePath;
        backup += ".corrupt";
        std::error_code ec;
        fs::rename(m_filePath, backup, ec);
        std::cerr << "[JsonProfileRepository] Could not parse " << m_filePath << ": " << e.what()
                  << (ec ? "" : " (moved to " + backup.string() + ")") << std::endl;
        return std::nullopt;
    }
}

void JsonProfileRepository::save(const domain::ProfileStoreData& data) {
    json j;
    j["version"] = kFormatVersion;
    j["profiles"] = json::array();
    for (const auto& profile : data.profiles) {
        j["profiles"].push_back(ProfileToJson(profile));
    }
    j["activeProfileId"] = data.activeProfileId ? json(*data.activeProfileId) : json(nullptr);
    j["autoSwitch"] = SettingsToJson(data.autoSwitch);

    PersistenceService::WriteFileAtomically(m_filePath, j.dump(4), true);
}

} // namespace agentdeck::infrastructure
