/**
 * @file Profile.hpp
 * @brief Credential profile entity and its identity rules.
 */

#pragma once

#include <cctype>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace agentdeck::domain {

/**
 * @enum RateLimitKind
 * @brief Which quota window a rate-limit message refers to.
 */
enum class RateLimitKind {
    Session, ///< Rolling 5-hour window.
    Weekly   ///< 7-day window.
};

inline std::string RateLimitKindToString(RateLimitKind kind) {
    return kind == RateLimitKind::Weekly ? "weekly" : "session";
}

inline RateLimitKind RateLimitKindFromString(const std::string& value) {
    return value == "weekly" ? RateLimitKind::Weekly : RateLimitKind::Session;
}

/**
 * @struct RateLimitRecord
 * @brief Last observed usage-exhaustion event for a profile.
 */
struct RateLimitRecord {
    RateLimitKind kind = RateLimitKind::Session;
    std::string resetTime; ///< Reset text as printed by the agent ("Dec 17 at 6am (Europe/Oslo)").
    std::chrono::system_clock::time_point detectedAt;
};

/**
 * @struct Profile
 * @brief A named credential identity with an isolated credential directory.
 */
struct Profile {
    std::string id;                              ///< Stable slug, derived from name when empty.
    std::string name;                            ///< Display name.
    std::string credentialDirectory;             ///< Directory isolating this identity's stored credentials.
    std::optional<std::string> token;            ///< Opaque secret; never logged.
    std::optional<std::string> email;            ///< Display only.
    std::optional<std::string> description;
    bool isDefault = false;                      ///< Exactly one profile carries this flag.
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> tokenCreatedAt;
    std::optional<std::chrono::system_clock::time_point> lastUsedAt;
    std::optional<RateLimitRecord> lastRateLimit;

    bool hasToken() const { return token.has_value() && !token->empty(); }
};

/**
 * @brief Derives a profile id from a display name.
 *
 * Lower-cases, collapses every run of non-alphanumeric characters into a single '-'
 * and strips leading/trailing separators. "Work Account" -> "work-account".
 * Returns an empty string when the name has no alphanumeric characters.
 */
inline std::string MakeProfileId(const std::string& name) {
    std::string id;
    id.reserve(name.size());
    bool pendingSeparator = false;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            if (pendingSeparator && !id.empty()) {
                id += '-';
            }
            pendingSeparator = false;
            id += static_cast<char>(std::tolower(c));
        } else {
            pendingSeparator = true;
        }
    }
    return id;
}

/**
 * @brief A profile is authenticated if it has a token, or if it is the default
 *        profile and its ambient credential directory exists.
 */
inline bool IsAuthenticated(const Profile& profile) {
    if (profile.hasToken()) {
        return true;
    }
    if (profile.isDefault && !profile.credentialDirectory.empty()) {
        std::error_code ec;
        return std::filesystem::is_directory(profile.credentialDirectory, ec);
    }
    return false;
}

/**
 * @brief Whether a rate-limit record is still inside its quota window at @p now.
 */
inline bool IsRateLimitActive(const RateLimitRecord& record, std::chrono::system_clock::time_point now) {
    const auto window = record.kind == RateLimitKind::Weekly
        ? std::chrono::hours(24 * 7)
        : std::chrono::hours(5);
    return now - record.detectedAt < window;
}

} // namespace agentdeck::domain
