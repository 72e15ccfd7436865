/**
 * @file IdGenerator.hpp
 * @brief Random identifiers for sessions and auth attempts (libuuid).
 */

#pragma once

#include <string>

namespace agentdeck::infrastructure {

class IdGenerator {
public:
    /** @brief Lower-case RFC 4122 version 4 UUID. */
    static std::string NewUuid();

    /** @brief "<prefix>-" followed by the first 8 hex digits of a new UUID. */
    static std::string NewShortId(const std::string& prefix);
};

} // namespace agentdeck::infrastructure
