/**
 * @file Errors.hpp
 * @brief Typed exceptions raised by the orchestration core.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace agentdeck::domain {

/**
 * @class SpawnError
 * @brief The OS refused to launch a session process. No session record exists afterwards.
 */
class SpawnError : public std::runtime_error {
public:
    explicit SpawnError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class SessionLimitError
 * @brief The concurrent session cap was reached; the request is rejected, not queued.
 */
class SessionLimitError : public SpawnError {
public:
    explicit SessionLimitError(std::size_t limit)
        : SpawnError("Session limit reached (" + std::to_string(limit) + " concurrent sessions)"),
          m_limit(limit) {}

    std::size_t limit() const { return m_limit; }

private:
    std::size_t m_limit;
};

/** @brief Unknown profile, session or auth attempt id. */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Input rejected before any state was touched. */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

/** @brief Operation refused because of the current state (e.g. deleting the active profile). */
class ConflictError : public std::runtime_error {
public:
    explicit ConflictError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace agentdeck::domain
