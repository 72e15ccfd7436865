/**
 * @file CredentialInspector.hpp
 * @brief Reads and writes the agent CLI's on-disk credential artifacts.
 */

#pragma once

#include "domain/Profile.hpp"

#include <optional>
#include <string>

namespace agentdeck::infrastructure {

class CredentialInspector {
public:
    /**
     * @brief Whether the CLI still has to run first-run setup for this profile.
     *
     * Looks for `hasCompletedOnboarding` in the profile's `.claude.json`. The
     * default profile keeps that file in $HOME when no credential directory is
     * exported, so both places are checked for it. Missing or unreadable files
     * count as "needs onboarding".
     */
    static bool NeedsOnboarding(const domain::Profile& profile);

    /**
     * @brief Access token the CLI stored in `<dir>/.credentials.json`, if any.
     */
    static std::optional<std::string> StoredAccessToken(const std::string& credentialDirectory);

    /**
     * @brief Writes `export VAR='token'` to a fresh owner-only file in @p directory.
     * @return Path of the file. The consumer is expected to source and delete it.
     * @throws std::runtime_error when the file cannot be created.
     */
    static std::string WriteTokenEnvFile(const std::string& envVar,
                                         const std::string& token,
                                         const std::string& directory = "/tmp");
};

} // namespace agentdeck::infrastructure
