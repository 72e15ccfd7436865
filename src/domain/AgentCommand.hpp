/**
 * @file AgentCommand.hpp
 * @brief Shell command lines typed into running sessions.
 */

#pragma once

#include <optional>
#include <string>

namespace agentdeck::domain {

/**
 * @struct RelaunchSpec
 * @brief How to restart the agent under a different identity inside an existing shell.
 */
struct RelaunchSpec {
    std::string agentCommand = "claude";
    std::string credentialEnvVar = "CLAUDE_CONFIG_DIR";
    std::optional<std::string> credentialDirectory; ///< Passed inline when no token file is used.
    std::optional<std::string> tokenEnvFile;        ///< Sourced then deleted by the command.
};

/** @brief Single-quotes a value for POSIX shells ("it's" -> 'it'\''s'). */
inline std::string ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

/**
 * @brief Builds the line that clears the screen and re-executes the agent.
 *
 * History is suppressed for the inner shell so secrets never reach a history file.
 * The result ends with '\r' so it runs immediately.
 */
inline std::string BuildRelaunchCommand(const RelaunchSpec& spec) {
    std::string line = "clear && HISTFILE= HISTCONTROL=ignorespace ";
    if (spec.tokenEnvFile) {
        const std::string file = ShellQuote(*spec.tokenEnvFile);
        line += "bash -c \"source " + file + " && rm -f " + file + " && exec " + spec.agentCommand + "\"";
    } else if (spec.credentialDirectory) {
        line += spec.credentialEnvVar + "=" + ShellQuote(*spec.credentialDirectory) +
                " bash -c \"exec " + spec.agentCommand + "\"";
    } else {
        line += "bash -c \"exec " + spec.agentCommand + "\"";
    }
    line += "\r";
    return line;
}

} // namespace agentdeck::domain
