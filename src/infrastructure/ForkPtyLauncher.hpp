/**
 * @file ForkPtyLauncher.hpp
 * @brief ProcessLauncher backed by forkpty(3).
 */

#pragma once

#include "domain/ProcessLauncher.hpp"

#include <chrono>
#include <memory>

namespace agentdeck::infrastructure {

/**
 * @class ForkPtyLauncher
 * @brief Spawns processes on a fresh pseudo-terminal with a dedicated reader thread each.
 *
 * spawn() only returns after exec succeeded: exec failures are reported back
 * through a close-on-exec pipe and raised as SpawnError. Terminated processes
 * get SIGHUP/SIGTERM first and SIGKILL after the grace period.
 */
class ForkPtyLauncher : public domain::ProcessLauncher {
public:
    explicit ForkPtyLauncher(std::chrono::milliseconds killGrace = std::chrono::milliseconds(3000));

    std::unique_ptr<domain::PtyProcess> spawn(const domain::SpawnRequest& request,
                                              domain::ProcessCallbacks callbacks) override;

private:
    std::chrono::milliseconds m_killGrace;
};

} // namespace agentdeck::infrastructure
