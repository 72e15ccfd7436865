/**
 * @file SessionRegistry.hpp
 * @brief Creates, destroys, persists and restores pseudo-terminal sessions.
 */

#pragma once

#include "application/EventLoop.hpp"
#include "application/Signal.hpp"
#include "domain/ProcessLauncher.hpp"
#include "domain/Session.hpp"
#include "domain/SessionSnapshotRepository.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentdeck::application {

/**
 * @struct SessionRegistryOptions
 * @brief Process and buffering parameters.
 */
struct SessionRegistryOptions {
    std::string shell = "/bin/bash";
    std::vector<std::string> shellArgs{"-l"};
    std::string credentialEnvVar = "CLAUDE_CONFIG_DIR";
    std::size_t maxSessions = 12;
    std::size_t outputBufferLimit = 100000;
    std::chrono::milliseconds snapshotInterval{30000}; ///< 0 disables periodic snapshots.
};

/**
 * @class SessionRegistry
 * @brief Owns every live session and its process handle.
 *
 * All methods must be called on the event loop thread. Process output is
 * handed to the loop by the launcher's reader threads and delivered to
 * subscribers in emission order per session.
 */
class SessionRegistry {
public:
    using OutputHandler = std::function<void(const std::string&)>;
    using RestoreHook = std::function<void(const domain::SessionSnapshot&, domain::SessionOptions&)>;

    SessionRegistry(EventLoop& loop,
                    std::shared_ptr<domain::ProcessLauncher> launcher,
                    std::shared_ptr<domain::SessionSnapshotRepository> snapshots,
                    SessionRegistryOptions options);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Spawns a session. On return the session is running.
     * @throws domain::SessionLimitError when the concurrent cap is reached.
     * @throws domain::SpawnError when the process could not be launched; nothing is recorded.
     * @throws domain::ConflictError when options.id is already in use.
     */
    domain::SessionInfo create(const domain::SessionOptions& options);

    /** @brief Best-effort termination. Unknown ids and kill failures are logged only. */
    void destroy(const std::string& id);

    /** @brief Returns false for unknown or exited sessions. */
    bool write(const std::string& id, const std::string& data);

    /** @brief Returns false for unknown or exited sessions. */
    bool resize(const std::string& id, const domain::TerminalSize& size);

    /**
     * @brief Subscribes to one session's output.
     * @param replayHistory Deliver the buffered output first (synchronously).
     * @throws domain::NotFoundError
     */
    Subscription subscribeOutput(const std::string& id, OutputHandler handler, bool replayHistory = true);

    std::optional<domain::SessionInfo> get(const std::string& id) const;

    /** @brief All sessions ordered by displayOrder. */
    std::vector<domain::SessionInfo> list() const;

    /** @brief Sessions that have not exited. */
    std::size_t activeCount() const;

    std::string outputBuffer(const std::string& id) const;

    /** @brief Assigns displayOrder 0..n-1 following @p ids; unknown ids are skipped. */
    void reorder(const std::vector<std::string>& ids);

    /** @brief Re-associates a session with a profile after a switch. */
    void assignProfile(const std::string& id, const std::string& profileId);

    /** @brief Queues a snapshot of every persistent session. */
    void snapshotAll();

    void startSnapshotTimer();
    void stopSnapshotTimer();

    /**
     * @brief Respawns the sessions saved for @p date, in displayOrder.
     *
     * Each restored session replays its saved output to new subscribers before
     * live output. Sessions that were running the agent start it again with
     * "--continue". @p prepare may adjust spawn options (e.g. profile environment).
     * @return The restored sessions in presentation order.
     */
    std::vector<domain::SessionInfo> restore(const std::string& date, const RestoreHook& prepare = {});

    std::vector<domain::SnapshotDate> availableDates();

    /** @brief Snapshots and terminates everything. Idempotent. */
    void shutdown();

    Signal<const std::string&, const std::string&> onOutput;           ///< (sessionId, chunk)
    Signal<const std::string&, int> onExit;                            ///< (sessionId, exitCode)
    Signal<const std::string&, domain::SessionStatus> onStatusChanged; ///< (sessionId, status)

private:
    struct Entry {
        std::uint64_t serial = 0;
        domain::SessionInfo info;
        std::unique_ptr<domain::PtyProcess> process;
        std::string buffer;
        bool persist = true;
        std::chrono::system_clock::time_point lastActiveAt;
        Signal<const std::string&> output;
    };

    domain::SessionInfo spawnEntry(const domain::SessionOptions& options, const std::string& history);
    domain::SpawnRequest buildRequest(const domain::SessionOptions& options) const;
    domain::ProcessCallbacks makeCallbacks(std::uint64_t serial);

    void handleData(std::uint64_t serial, const std::string& data);
    void handleExit(std::uint64_t serial, int exitCode);
    void appendToBuffer(Entry& entry, const std::string& data);
    Entry* findBySerial(std::uint64_t serial);
    domain::SessionSnapshot makeSnapshot(const Entry& entry) const;
    int nextDisplayOrder() const;
    void scheduleSnapshot();

    EventLoop& m_loop;
    std::shared_ptr<domain::ProcessLauncher> m_launcher;
    std::shared_ptr<domain::SessionSnapshotRepository> m_snapshots;
    SessionRegistryOptions m_options;

    std::map<std::string, std::unique_ptr<Entry>> m_sessions;
    std::map<std::uint64_t, std::unique_ptr<domain::PtyProcess>> m_retired; ///< Destroyed, awaiting exit.
    std::uint64_t m_nextSerial = 1;
    std::optional<EventLoop::TimerId> m_snapshotTimer;
    bool m_shutDown = false;
    std::shared_ptr<int> m_lifetime = std::make_shared<int>(0); ///< Guards callbacks posted from reader threads.
};

} // namespace agentdeck::application
