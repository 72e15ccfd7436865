/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access configuration without scattering JSON
 * parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <vector>

namespace agentdeck::infrastructure {

/**
 * @struct AppConfig
 * @brief Every tunable of the host, with its default.
 */
struct AppConfig {
    std::string shell = "/bin/bash";
    std::vector<std::string> shellArgs{"-l"};
    std::string agentCommand = "claude";
    std::string loginCommand = "claude /login";
    std::string credentialEnvVar = "CLAUDE_CONFIG_DIR";
    std::string tokenEnvVar = "CLAUDE_CODE_OAUTH_TOKEN";
    int maxSessions = 12;
    int outputBufferLimit = 100000;     ///< Bytes of output kept per session.
    int snapshotIntervalMs = 30000;
    int sessionRetentionDays = 10;
    int prefillDelayMs = 500;
    int autoCloseDelayMs = 1500;
    int readyTimeoutMs = 0;             ///< 0 waits forever.
    int switchSettleMs = 2000;
    std::string usageEndpoint = "https://api.anthropic.com";
    int usageTimeoutSeconds = 10;
    std::string dataDir;                ///< Empty: $XDG_DATA_HOME/AgentDeck.
    std::string profilesRoot;           ///< Empty: <dataDir>/profiles.
    std::string defaultCredentialDir = "~/.claude";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from @p configDir.
     *
     * Missing file yields defaults. Keys with the wrong type are logged and
     * keep their default; unknown keys are ignored.
     */
    static AppConfig Load(const std::string& configDir);

    /**
     * @brief Writes @p config to settings.json, preserving keys this version does not know.
     * @throws std::runtime_error when the file cannot be written.
     */
    static void Save(const std::string& configDir, const AppConfig& config);

    static constexpr const char* kFileName = "settings.json";
};

} // namespace agentdeck::infrastructure
