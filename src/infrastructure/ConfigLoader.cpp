/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace agentdeck::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    try {
        target = j[key].get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

// Rejects negative values for counts and durations.
void ReadNonNegative(const json& j, const char* key, int& target) {
    int value = target;
    ReadKey(j, key, value);
    if (value < 0) {
        std::cerr << "[ConfigLoader] Ignoring negative '" << key << "'" << std::endl;
        return;
    }
    target = value;
}

json ToJson(const AppConfig& c) {
    return {
        {"shell", c.shell},
        {"shell_args", c.shellArgs},
        {"agent_command", c.agentCommand},
        {"login_command", c.loginCommand},
        {"credential_env_var", c.credentialEnvVar},
        {"token_env_var", c.tokenEnvVar},
        {"max_sessions", c.maxSessions},
        {"output_buffer_limit", c.outputBufferLimit},
        {"snapshot_interval_ms", c.snapshotIntervalMs},
        {"session_retention_days", c.sessionRetentionDays},
        {"prefill_delay_ms", c.prefillDelayMs},
        {"auto_close_delay_ms", c.autoCloseDelayMs},
        {"ready_timeout_ms", c.readyTimeoutMs},
        {"switch_settle_ms", c.switchSettleMs},
        {"usage_endpoint", c.usageEndpoint},
        {"usage_timeout_s", c.usageTimeoutSeconds},
        {"data_dir", c.dataDir},
        {"profiles_root", c.profilesRoot},
        {"default_credential_dir", c.defaultCredentialDir}
    };
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& configDir) {
    AppConfig config;
    std::filesystem::path configPath = std::filesystem::path(configDir) / kFileName;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json, using defaults: " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
        return config;
    }

    ReadKey(j, "shell", config.shell);
    ReadKey(j, "shell_args", config.shellArgs);
    ReadKey(j, "agent_command", config.agentCommand);
    ReadKey(j, "login_command", config.loginCommand);
    ReadKey(j, "credential_env_var", config.credentialEnvVar);
    ReadKey(j, "token_env_var", config.tokenEnvVar);
    ReadNonNegative(j, "max_sessions", config.maxSessions);
    ReadNonNegative(j, "output_buffer_limit", config.outputBufferLimit);
    ReadNonNegative(j, "snapshot_interval_ms", config.snapshotIntervalMs);
    ReadNonNegative(j, "session_retention_days", config.sessionRetentionDays);
    ReadNonNegative(j, "prefill_delay_ms", config.prefillDelayMs);
    ReadNonNegative(j, "auto_close_delay_ms", config.autoCloseDelayMs);
    ReadNonNegative(j, "ready_timeout_ms", config.readyTimeoutMs);
    ReadNonNegative(j, "switch_settle_ms", config.switchSettleMs);
    ReadKey(j, "usage_endpoint", config.usageEndpoint);
    ReadNonNegative(j, "usage_timeout_s", config.usageTimeoutSeconds);
    ReadKey(j, "data_dir", config.dataDir);
    ReadKey(j, "profiles_root", config.profilesRoot);
    ReadKey(j, "default_credential_dir", config.defaultCredentialDir);
    return config;
}

void ConfigLoader::Save(const std::string& configDir, const AppConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / kFileName;
    json j = json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = json::object();
        }
        if (!j.is_object()) {
            j = json::object();
        }
    }

    j.update(ToJson(config));
    PersistenceService::WriteFileAtomically(configPath.string(), j.dump(4), false);
}

} // namespace agentdeck::infrastructure
