#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace agentdeck::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    fs::path base = GetDataHome() / "AgentDeck";
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        fs::create_directories(base, ec);
        if (ec) {
            std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
        }
    }
    return base;
}

fs::path PathUtils::GetAppConfigDir() {
    return GetConfigHome() / "AgentDeck";
}

std::string PathUtils::ExpandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path; // ~user is not supported
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

} // namespace agentdeck::infrastructure
