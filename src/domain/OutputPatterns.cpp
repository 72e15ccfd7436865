/**
 * @file OutputPatterns.cpp
 * @brief Implementation of OutputPatterns.
 */

#include "domain/OutputPatterns.hpp"

#include <cctype>
#include <regex>
#include <vector>

namespace agentdeck::domain {

namespace {

const std::regex& AnsiPattern() {
    static const std::regex pattern("\x1b\\[[0-9;?]*[a-zA-Z]");
    return pattern;
}

const std::regex& TokenPattern() {
    static const std::regex pattern("sk-ant-oat01-[A-Za-z0-9_-]{95}");
    return pattern;
}

const std::regex& EmailPattern() {
    static const std::regex pattern(
        "(?:Authenticated as|Logged in as|email[:\\s]+)\\s*([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,})",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

// Middle dot (U+00B7) or bullet (U+2022), matched as UTF-8 byte sequences.
const std::regex& RateLimitPattern() {
    static const std::regex pattern(
        std::string("Limit reached\\s*(?:") + "\xC2\xB7" + "|" + "\xE2\x80\xA2" + ")\\s*resets\\s+([^\\r\\n]+)");
    return pattern;
}

const std::regex& WeeklyResetPattern() {
    static const std::regex pattern("[A-Za-z]{3}\\s+\\d+|week", std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& AuthFailurePattern() {
    static const std::regex pattern(
        "authentication (?:failed|error)"
        "|invalid (?:credentials|token|api key)"
        "|oauth token (?:is )?(?:invalid|expired|has expired)"
        "|login failed"
        "|unauthorized",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

struct Flattened {
    std::string text;
    std::vector<std::size_t> offsets; ///< Input offset of each byte of text.
};

// Drops CSI sequences and line breaks, remembering where every kept byte came from.
Flattened Flatten(const std::string& data) {
    Flattened flat;
    flat.text.reserve(data.size());
    flat.offsets.reserve(data.size());
    std::size_t i = 0;
    while (i < data.size()) {
        if (data[i] == '\x1b' && i + 1 < data.size() && data[i + 1] == '[') {
            std::size_t j = i + 2;
            while (j < data.size() && (std::isdigit(static_cast<unsigned char>(data[j])) || data[j] == ';' || data[j] == '?')) {
                ++j;
            }
            if (j < data.size() && std::isalpha(static_cast<unsigned char>(data[j]))) {
                i = j + 1;
                continue;
            }
        }
        if (data[i] != '\r' && data[i] != '\n') {
            flat.text.push_back(data[i]);
            flat.offsets.push_back(i);
        }
        ++i;
    }
    return flat;
}

} // namespace

std::string OutputPatterns::StripAnsi(const std::string& data) {
    return std::regex_replace(data, AnsiPattern(), "");
}

std::optional<std::string> OutputPatterns::ExtractToken(const std::string& data) {
    if (auto match = FindToken(data)) {
        return match->token;
    }
    return std::nullopt;
}

std::optional<TokenMatch> OutputPatterns::FindToken(const std::string& data) {
    const Flattened flat = Flatten(data);
    std::smatch match;
    if (!std::regex_search(flat.text, match, TokenPattern())) {
        return std::nullopt;
    }
    TokenMatch result;
    result.token = match.str(0);
    const auto last = static_cast<std::size_t>(match.position(0) + match.length(0)) - 1;
    result.end = flat.offsets[last] + 1;
    return result;
}

std::optional<std::string> OutputPatterns::ExtractEmail(const std::string& data) {
    const std::string clean = StripAnsi(data);
    std::smatch match;
    if (std::regex_search(clean, match, EmailPattern())) {
        return match.str(1);
    }
    return std::nullopt;
}

std::optional<std::string> OutputPatterns::ExtractRateLimitReset(const std::string& data) {
    const std::string clean = StripAnsi(data);
    std::smatch match;
    if (std::regex_search(clean, match, RateLimitPattern())) {
        std::string reset = Trim(match.str(1));
        if (!reset.empty()) {
            return reset;
        }
    }
    return std::nullopt;
}

RateLimitKind OutputPatterns::ClassifyLimit(const std::string& resetTime) {
    return std::regex_search(resetTime, WeeklyResetPattern()) ? RateLimitKind::Weekly : RateLimitKind::Session;
}

std::optional<std::string> OutputPatterns::ExtractAuthFailure(const std::string& data) {
    const std::string clean = StripAnsi(data);
    std::smatch match;
    if (!std::regex_search(clean, match, AuthFailurePattern())) {
        return std::nullopt;
    }

    // Report the whole line the marker appeared on.
    const auto pos = static_cast<std::size_t>(match.position(0));
    const auto lineStart = clean.find_last_of("\r\n", pos);
    const auto begin = lineStart == std::string::npos ? 0 : lineStart + 1;
    const auto end = clean.find_first_of("\r\n", pos);
    return Trim(clean.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
}

bool OutputPatterns::HasReadyBanner(const std::string& data) {
    const std::string clean = StripAnsi(data);
    return clean.find("Welcome to Claude") != std::string::npos ||
           clean.find("? for shortcuts") != std::string::npos;
}

} // namespace agentdeck::domain
