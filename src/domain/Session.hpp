/**
 * @file Session.hpp
 * @brief Value types describing pseudo-terminal backed agent sessions.
 */

#pragma once

#include <chrono>
#include <ctime>
#include <map>
#include <optional>
#include <string>

namespace agentdeck::domain {

/**
 * @enum SessionStatus
 * @brief Lifecycle of a session process.
 */
enum class SessionStatus {
    Connecting, ///< Spawn requested, process not yet confirmed.
    Running,    ///< OS confirmed the process is alive.
    Exited      ///< Process terminated (voluntarily or via destroy).
};

inline std::string ToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Connecting: return "connecting";
        case SessionStatus::Running: return "running";
        case SessionStatus::Exited: return "exited";
    }
    return "unknown";
}

/** @brief Why a session exists. Login sessions are never relaunched or snapshotted. */
enum class SessionPurpose {
    Agent,
    Login
};

/** @brief Terminal dimensions in character cells. */
struct TerminalSize {
    int cols = 120;
    int rows = 32;
};

/**
 * @struct SessionOptions
 * @brief Parameters for SessionRegistry::create.
 */
struct SessionOptions {
    std::optional<std::string> id;                  ///< Reuse an id (restore); generated otherwise.
    std::optional<std::string> profileId;           ///< Identity the session runs under, if any.
    std::optional<std::string> credentialDirectory; ///< Exported through the credential env var.
    std::map<std::string, std::string> env;         ///< Extra variables (e.g. token) layered on top.
    TerminalSize dimensions;
    std::optional<std::string> projectScope;        ///< Working directory of the spawned shell.
    std::optional<std::string> title;
    std::optional<std::string> initialInput;        ///< Written once the process is running.
    std::optional<std::string> agentCommand;        ///< Set when the session runs the agent CLI.
    SessionPurpose purpose = SessionPurpose::Agent;
    bool persist = true;                            ///< Include in periodic snapshots.
};

/**
 * @struct SessionInfo
 * @brief Public metadata of a live session.
 */
struct SessionInfo {
    std::string id;
    std::optional<std::string> profileId;
    std::optional<std::string> projectScope;
    std::string title;
    std::optional<std::string> agentCommand; ///< Agent CLI the session was started with; resumed on restore.
    SessionStatus status = SessionStatus::Connecting;
    SessionPurpose purpose = SessionPurpose::Agent;
    int displayOrder = 0;
    std::chrono::system_clock::time_point createdAt;
    std::optional<int> exitCode;
};

/**
 * @struct SessionSnapshot
 * @brief Durable form of a session: metadata plus buffered output, keyed by creation date.
 */
struct SessionSnapshot {
    SessionInfo info;
    std::string outputBuffer;
    std::string date; ///< YYYY-MM-DD of info.createdAt (local time).
    std::chrono::system_clock::time_point lastActiveAt;
};

/** @brief Local calendar date (YYYY-MM-DD) used to key snapshots. */
inline std::string DateKey(std::chrono::system_clock::time_point time) {
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &local);
    return buffer;
}

/** @brief Number of snapshots stored for one calendar date. */
struct SnapshotDate {
    std::string date;
    std::size_t sessionCount = 0;
};

} // namespace agentdeck::domain
