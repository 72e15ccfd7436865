/**
 * @file OutputPatterns.hpp
 * @brief Pure pattern matchers for agent CLI terminal output.
 *
 * All functions take raw terminal text (possibly containing ANSI escape
 * sequences) and are free of side effects.
 */

#pragma once

#include "domain/Profile.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace agentdeck::domain {

struct TokenMatch {
    std::string token;
    std::size_t end = 0; ///< Offset in the scanned text just past the token's last character.
};

class OutputPatterns {
public:
    /** @brief Removes CSI escape sequences (ESC '[' params final-byte). */
    static std::string StripAnsi(const std::string& data);

    /**
     * @brief Finds an OAuth token ("sk-ant-oat01-" followed by 95 token characters).
     *
     * ANSI sequences and line breaks are removed first, since terminals wrap long tokens.
     */
    static std::optional<std::string> ExtractToken(const std::string& data);

    /** @brief Like ExtractToken, also locating the token in the unstripped input. */
    static std::optional<TokenMatch> FindToken(const std::string& data);

    /** @brief Finds an account email after "Authenticated as", "Logged in as" or "email:". */
    static std::optional<std::string> ExtractEmail(const std::string& data);

    /** @brief Returns the reset text of a "Limit reached · resets ..." line. */
    static std::optional<std::string> ExtractRateLimitReset(const std::string& data);

    /**
     * @brief Classifies a reset text. A calendar date ("Dec 17 at 6am") or the word
     *        "week" means the weekly window; a bare time means the session window.
     */
    static RateLimitKind ClassifyLimit(const std::string& resetTime);

    /** @brief Returns the matched failure line for explicit authentication errors. */
    static std::optional<std::string> ExtractAuthFailure(const std::string& data);

    /** @brief Whether the agent printed its interactive ready banner. */
    static bool HasReadyBanner(const std::string& data);
};

} // namespace agentdeck::domain
