/**
 * @file CredentialInspector.cpp
 * @brief Implementation of CredentialInspector.
 */

#include "infrastructure/CredentialInspector.hpp"

#include "domain/AgentCommand.hpp"
#include "infrastructure/PathUtils.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace agentdeck::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::optional<json> ReadJson(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        std::cerr << "[CredentialInspector] Could not parse " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool HasCompletedOnboarding(const fs::path& path) {
    auto j = ReadJson(path);
    return j && j->is_object() && j->value("hasCompletedOnboarding", false);
}

} // namespace

bool CredentialInspector::NeedsOnboarding(const domain::Profile& profile) {
    if (!profile.credentialDirectory.empty() &&
        HasCompletedOnboarding(fs::path(PathUtils::ExpandHome(profile.credentialDirectory)) / ".claude.json")) {
        return false;
    }
    if (profile.isDefault) {
        const char* home = std::getenv("HOME");
        if (home && HasCompletedOnboarding(fs::path(home) / ".claude.json")) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> CredentialInspector::StoredAccessToken(const std::string& credentialDirectory) {
    auto j = ReadJson(fs::path(PathUtils::ExpandHome(credentialDirectory)) / ".credentials.json");
    if (!j || !j->is_object()) {
        return std::nullopt;
    }
    if (j->contains("claudeAiOauth") && (*j)["claudeAiOauth"].is_object()) {
        const auto& oauth = (*j)["claudeAiOauth"];
        if (oauth.contains("accessToken") && oauth["accessToken"].is_string()) {
            return oauth["accessToken"].get<std::string>();
        }
    }
    for (const char* key : {"accessToken", "token"}) {
        if (j->contains(key) && (*j)[key].is_string()) {
            return (*j)[key].get<std::string>();
        }
    }
    return std::nullopt;
}

std::string CredentialInspector::WriteTokenEnvFile(const std::string& envVar,
                                                   const std::string& token,
                                                   const std::string& directory) {
    std::string pattern = (fs::path(directory) / "agentdeck-token-XXXXXX").string();
    std::vector<char> path(pattern.begin(), pattern.end());
    path.push_back('\0');

    // mkstemp creates the file with mode 0600.
    const int fd = ::mkstemp(path.data());
    if (fd < 0) {
        throw std::runtime_error(std::string("Could not create token file: ") + std::strerror(errno));
    }

    const std::string content = "export " + envVar + "=" + domain::ShellQuote(token) + "\n";
    std::size_t offset = 0;
    while (offset < content.size()) {
        const ssize_t n = ::write(fd, content.data() + offset, content.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            ::close(fd);
            ::unlink(path.data());
            throw std::runtime_error(std::string("Could not write token file: ") + std::strerror(err));
        }
        offset += static_cast<std::size_t>(n);
    }
    ::close(fd);
    return std::string(path.data());
}

} // namespace agentdeck::infrastructure
