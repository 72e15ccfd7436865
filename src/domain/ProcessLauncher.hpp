/**
 * @file ProcessLauncher.hpp
 * @brief Interface to the OS process boundary (pseudo-terminal processes).
 */

#pragma once

#include "domain/Session.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentdeck::domain {

/**
 * @struct SpawnRequest
 * @brief What to launch and with which environment.
 */
struct SpawnRequest {
    std::string command;                     ///< Executable, resolved through PATH.
    std::vector<std::string> args;           ///< argv[1..].
    std::map<std::string, std::string> env;  ///< Set on top of the inherited environment.
    std::vector<std::string> unsetEnv;       ///< Removed from the inherited environment.
    std::optional<std::string> workingDirectory;
    TerminalSize size;
};

/**
 * @struct ProcessCallbacks
 * @brief Output and exit notifications.
 *
 * Invoked from a launcher-owned thread, never concurrently for one process.
 * onExit is called exactly once, after the last onData.
 */
struct ProcessCallbacks {
    std::function<void(const std::string&)> onData;
    std::function<void(int)> onExit;
};

/**
 * @class PtyProcess
 * @brief Handle to a running process attached to a pseudo-terminal.
 */
class PtyProcess {
public:
    virtual ~PtyProcess() = default;

    /** @brief Writes raw bytes to the terminal. Returns false once the process is gone. */
    virtual bool write(const std::string& data) = 0;

    virtual bool resize(const TerminalSize& size) = 0;

    /** @brief Asks the process to terminate. Does not wait. Throws std::system_error on failure. */
    virtual void kill() = 0;

    virtual int pid() const = 0;
};

/**
 * @class ProcessLauncher
 * @brief Launches processes behind a pseudo-terminal interface.
 */
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /**
     * @brief Launches a process. Returns only once the OS has confirmed the exec.
     * @throws SpawnError if the process could not be launched.
     */
    virtual std::unique_ptr<PtyProcess> spawn(const SpawnRequest& request, ProcessCallbacks callbacks) = 0;
};

} // namespace agentdeck::domain
