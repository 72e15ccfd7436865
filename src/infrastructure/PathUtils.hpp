// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace agentdeck::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/AgentDeck, created on demand. */
    static std::filesystem::path GetAppDataDir();

    /** @brief $XDG_CONFIG_HOME/AgentDeck (not created). */
    static std::filesystem::path GetAppConfigDir();

    /** @brief Replaces a leading "~" or "~/" with $HOME. */
    static std::string ExpandHome(const std::string& path);
};

} // namespace agentdeck::infrastructure
