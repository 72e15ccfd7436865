/**
 * @file IdGenerator.cpp
 * @brief Implementation of IdGenerator.
 */

#include "infrastructure/IdGenerator.hpp"

#include <uuid/uuid.h>

namespace agentdeck::infrastructure {

std::string IdGenerator::NewUuid() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

std::string IdGenerator::NewShortId(const std::string& prefix) {
    return prefix + "-" + NewUuid().substr(0, 8);
}

} // namespace agentdeck::infrastructure
