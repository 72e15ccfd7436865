/**
 * @file SessionRegistry.cpp
 * @brief Implementation of SessionRegistry.
 */

#include "application/SessionRegistry.hpp"

#include "domain/Errors.hpp"
#include "infrastructure/IdGenerator.hpp"

#include <algorithm>
#include <iostream>

namespace agentdeck::application {

SessionRegistry::SessionRegistry(EventLoop& loop,
                                 std::shared_ptr<domain::ProcessLauncher> launcher,
                                 std::shared_ptr<domain::SessionSnapshotRepository> snapshots,
                                 SessionRegistryOptions options)
    : m_loop(loop),
      m_launcher(std::move(launcher)),
      m_snapshots(std::move(snapshots)),
      m_options(std::move(options)) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

domain::SessionInfo SessionRegistry::create(const domain::SessionOptions& options) {
    return spawnEntry(options, "");
}

domain::SessionInfo SessionRegistry::spawnEntry(const domain::SessionOptions& options, const std::string& history) {
    if (m_shutDown) {
        throw domain::SpawnError("Session registry is shut down");
    }
    if (activeCount() >= m_options.maxSessions) {
        throw domain::SessionLimitError(m_options.maxSessions);
    }

    const std::string id = options.id.value_or(infrastructure::IdGenerator::NewUuid());
    if (m_sessions.count(id)) {
        throw domain::ConflictError("Session already exists: " + id);
    }

    auto entry = std::make_unique<Entry>();
    entry->serial = m_nextSerial++;
    entry->persist = options.persist && options.purpose == domain::SessionPurpose::Agent;
    entry->info.id = id;
    entry->info.profileId = options.profileId;
    entry->info.purpose = options.purpose;
    entry->info.projectScope = options.projectScope;
    entry->info.agentCommand = options.agentCommand;
    entry->info.createdAt = std::chrono::system_clock::now();
    entry->info.displayOrder = nextDisplayOrder();
    entry->info.title = options.title.value_or("Terminal " + std::to_string(entry->info.displayOrder + 1));
    entry->info.status = domain::SessionStatus::Connecting;

    const domain::SpawnRequest request = buildRequest(options);
    try {
        entry->process = m_launcher->spawn(request, makeCallbacks(entry->serial));
    } catch (const domain::SpawnError& e) {
        std::cerr << "[SessionRegistry] Spawn failed for session " << id << ": " << e.what() << std::endl;
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[SessionRegistry] Spawn failed for session " << id << ": " << e.what() << std::endl;
        throw domain::SpawnError(e.what());
    }
    if (!entry->process) {
        throw domain::SpawnError("Launcher returned no process for " + request.command);
    }

    entry->info.status = domain::SessionStatus::Running;
    entry->lastActiveAt = entry->info.createdAt;
    if (!history.empty()) {
        appendToBuffer(*entry, history);
    }
    const int pid = entry->process->pid();
    const domain::SessionInfo info = entry->info;
    m_sessions.emplace(id, std::move(entry));

    std::cout << "[SessionRegistry] Spawned session " << id << " (pid " << pid << ")" << std::endl;
    onStatusChanged.emit(id, domain::SessionStatus::Running);

    if (options.initialInput && !options.initialInput->empty()) {
        write(id, *options.initialInput);
    }
    return info;
}

domain::SpawnRequest SessionRegistry::buildRequest(const domain::SessionOptions& options) const {
    domain::SpawnRequest request;
    request.command = m_options.shell;
    request.args = m_options.shellArgs;
    request.size = options.dimensions;
    request.workingDirectory = options.projectScope;
    request.env = options.env;
    if (options.credentialDirectory && !options.credentialDirectory->empty()) {
        request.env[m_options.credentialEnvVar] = *options.credentialDirectory;
    }
    request.env["TERM"] = "xterm-256color";
    request.env["COLORTERM"] = "truecolor";
    // Keep the agent from picking up debug output or an API key meant for other tools.
    request.unsetEnv = {"DEBUG", "ANTHROPIC_API_KEY"};
    return request;
}

domain::ProcessCallbacks SessionRegistry::makeCallbacks(std::uint64_t serial) {
    domain::ProcessCallbacks callbacks;
    std::weak_ptr<int> alive = m_lifetime;
    EventLoop* loop = &m_loop;

    callbacks.onData = [this, loop, alive, serial](const std::string& data) {
        loop->post([this, alive, serial, data]() {
            if (alive.expired()) {
                return;
            }
            handleData(serial, data);
        });
    };
    callbacks.onExit = [this, loop, alive, serial](int exitCode) {
        loop->post([this, alive, serial, exitCode]() {
            if (alive.expired()) {
                return;
            }
            handleExit(serial, exitCode);
        });
    };
    return callbacks;
}

SessionRegistry::Entry* SessionRegistry::findBySerial(std::uint64_t serial) {
    for (auto& [id, entry] : m_sessions) {
        if (entry->serial == serial) {
            return entry.get();
        }
    }
    return nullptr;
}

void SessionRegistry::handleData(std::uint64_t serial, const std::string& data) {
    Entry* entry = findBySerial(serial);
    if (!entry) {
        return;
    }
    appendToBuffer(*entry, data);
    entry->lastActiveAt = std::chrono::system_clock::now();

    const std::string id = entry->info.id;
    entry->output.emit(data);
    onOutput.emit(id, data);
}

void SessionRegistry::handleExit(std::uint64_t serial, int exitCode) {
    // Process destroyed earlier: its reader has finished, release the handle.
    if (m_retired.erase(serial) > 0) {
        return;
    }

    Entry* entry = findBySerial(serial);
    if (!entry || entry->info.status == domain::SessionStatus::Exited) {
        return;
    }
    entry->info.status = domain::SessionStatus::Exited;
    entry->info.exitCode = exitCode;

    const std::string id = entry->info.id;
    std::cout << "[SessionRegistry] Session " << id << " exited with code " << exitCode << std::endl;
    onStatusChanged.emit(id, domain::SessionStatus::Exited);
    onExit.emit(id, exitCode);
}

void SessionRegistry::appendToBuffer(Entry& entry, const std::string& data) {
    entry.buffer += data;
    if (entry.buffer.size() > m_options.outputBufferLimit) {
        entry.buffer.erase(0, entry.buffer.size() - m_options.outputBufferLimit);
    }
}

void SessionRegistry::destroy(const std::string& id) {
    auto it = m_sessions.find(id);
    if (it == m_sessions.end()) {
        std::cerr << "[SessionRegistry] destroy: unknown session " << id << std::endl;
        return;
    }

    std::unique_ptr<Entry> entry = std::move(it->second);
    m_sessions.erase(it);

    const bool wasRunning = entry->info.status != domain::SessionStatus::Exited;
    if (wasRunning && entry->process) {
        try {
            entry->process->kill();
        } catch (const std::exception& e) {
            std::cerr << "[SessionRegistry] Failed to terminate session " << id << ": " << e.what() << std::endl;
        }
        // Keep the handle until its reader reports the exit.
        m_retired.emplace(entry->serial, std::move(entry->process));
    }

    if (entry->persist && m_snapshots) {
        try {
            m_snapshots->remove(domain::DateKey(entry->info.createdAt), id);
        } catch (const std::exception& e) {
            std::cerr << "[SessionRegistry] Failed to remove snapshot of " << id << ": " << e.what() << std::endl;
        }
    }

    std::cout << "[SessionRegistry] Destroyed session " << id << std::endl;
    if (wasRunning) {
        onStatusChanged.emit(id, domain::SessionStatus::Exited);
        onExit.emit(id, -1);
    }
}

bool SessionRegistry::write(const std::string& id, const std::string& data) {
    auto it = m_sessions.find(id);
    if (it == m_sessions.end() || it->second->info.status == domain::SessionStatus::Exited) {
        return false;
    }
    return it->second->process->write(data);
}

bool SessionRegistry::resize(const std::string& id, const domain::TerminalSize& size) {
    auto it = m_sessions.find(id);
    if (it == m_sessions.end() || it->second->info.status == domain::SessionStatus::Exited) {
        return false;
    }
    if (size.cols <= 0 || size.rows <= 0) {
        return false;
    }
    return it->second->process->resize(size);
}

Subscription SessionRegistry::subscribeOutput(const std::string& id, OutputHandler handler, bool replayHistory) {
    auto it = m_sessions.find(id);
    if (it == m_sessions.end()) {
        throw domain::NotFoundError("Session not found: " + id);
    }
    if (replayHistory && !it->second->buffer.empty()) {
        handler(it->second->buffer);
    }
    return it->second->output.connect(std::move(handler));
}

std::optional<domain::SessionInfo> SessionRegistry::get(const std::string& id) const {
    auto it = m_sessions.find(id);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return it->second->info;
}

std::vector<domain::SessionInfo> SessionRegistry::list() const {
    std::vector<domain::SessionInfo> result;
    result.reserve(m_sessions.size());
    for (const auto& [id, entry] : m_sessions) {
        result.push_back(entry->info);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const domain::SessionInfo& a, const domain::SessionInfo& b) {
                         if (a.displayOrder != b.displayOrder) {
                             return a.displayOrder < b.displayOrder;
                         }
                         return a.createdAt < b.createdAt;
                     });
    return result;
}

std::size_t SessionRegistry::activeCount() const {
    return static_cast<std::size_t>(std::count_if(m_sessions.begin(), m_sessions.end(), [](const auto& item) {
        return item.second->info.status != domain::SessionStatus::Exited;
    }));
}

std::string SessionRegistry::outputBuffer(const std::string& id) const {
    auto it = m_sessions.find(id);
    return it == m_sessions.end() ? std::string() : it->second->buffer;
}

int SessionRegistry::nextDisplayOrder() const {
    int next = 0;
    for (const auto& [id, entry] : m_sessions) {
        next = std::max(next, entry->info.displayOrder + 1);
    }
    return next;
}

void SessionRegistry::reorder(const std::vector<std::string>& ids) {
    int order = 0;
    for (const auto& id : ids) {
        auto it = m_sessions.find(id);
        if (it != m_sessions.end()) {
            it->second->info.displayOrder = order++;
        }
    }
    // Sessions missing from the list keep their relative order after the listed ones.
    for (const auto& info : list()) {
        if (std::find(ids.begin(), ids.end(), info.id) == ids.end()) {
            m_sessions[info.id]->info.displayOrder = order++;
        }
    }
}

void SessionRegistry::assignProfile(const std::string& id, const std::string& profileId) {
    auto it = m_sessions.find(id);
    if (it != m_sessions.end()) {
        it->second->info.profileId = profileId;
    }
}

domain::SessionSnapshot SessionRegistry::makeSnapshot(const Entry& entry) const {
    domain::SessionSnapshot snapshot;
    snapshot.info = entry.info;
    snapshot.outputBuffer = entry.buffer;
    snapshot.date = domain::DateKey(entry.info.createdAt);
    snapshot.lastActiveAt = entry.lastActiveAt;
    return snapshot;
}

void SessionRegistry::snapshotAll() {
    if (!m_snapshots) {
        return;
    }
    for (const auto& [id, entry] : m_sessions) {
        if (!entry->persist) {
            continue;
        }
        try {
            m_snapshots->save(makeSnapshot(*entry));
        } catch (const std::exception& e) {
            std::cerr << "[SessionRegistry] Snapshot of " << id << " failed: " << e.what() << std::endl;
        }
    }
}

void SessionRegistry::startSnapshotTimer() {
    if (m_snapshotTimer || m_options.snapshotInterval.count() <= 0 || !m_snapshots) {
        return;
    }
    scheduleSnapshot();
}

void SessionRegistry::scheduleSnapshot() {
    m_snapshotTimer = m_loop.schedule(m_options.snapshotInterval, [this]() {
        m_snapshotTimer.reset();
        snapshotAll();
        scheduleSnapshot();
    });
}

void SessionRegistry::stopSnapshotTimer() {
    if (m_snapshotTimer) {
        m_loop.cancel(*m_snapshotTimer);
        m_snapshotTimer.reset();
    }
}

std::vector<domain::SessionInfo> SessionRegistry::restore(const std::string& date, const RestoreHook& prepare) {
    std::vector<domain::SessionInfo> restored;
    if (!m_snapshots) {
        return restored;
    }

    std::vector<domain::SessionSnapshot> snapshots = m_snapshots->loadDate(date);
    std::stable_sort(snapshots.begin(), snapshots.end(),
                     [](const domain::SessionSnapshot& a, const domain::SessionSnapshot& b) {
                         return a.info.displayOrder < b.info.displayOrder;
                     });

    for (const auto& snapshot : snapshots) {
        if (m_sessions.count(snapshot.info.id)) {
            std::cout << "[SessionRegistry] Session " << snapshot.info.id << " is already live, not restoring" << std::endl;
            continue;
        }

        domain::SessionOptions options;
        options.id = snapshot.info.id;
        options.profileId = snapshot.info.profileId;
        options.projectScope = snapshot.info.projectScope;
        options.title = snapshot.info.title;
        options.agentCommand = snapshot.info.agentCommand;
        if (options.agentCommand && !options.agentCommand->empty()) {
            options.initialInput = *options.agentCommand + " --continue\r";
        }
        if (prepare) {
            prepare(snapshot, options);
        }

        try {
            domain::SessionInfo info = spawnEntry(options, snapshot.outputBuffer);
            // Keep the original creation time so the snapshot stays under its date.
            m_sessions[info.id]->info.createdAt = snapshot.info.createdAt;
            info.createdAt = snapshot.info.createdAt;
            restored.push_back(info);
        } catch (const domain::SessionLimitError& e) {
            std::cerr << "[SessionRegistry] Restore stopped: " << e.what() << std::endl;
            break;
        } catch (const domain::SpawnError& e) {
            std::cerr << "[SessionRegistry] Could not restore session " << snapshot.info.id << ": " << e.what() << std::endl;
        }
    }

    std::cout << "[SessionRegistry] Restored " << restored.size() << " of " << snapshots.size()
              << " session(s) from " << date << std::endl;
    return restored;
}

std::vector<domain::SnapshotDate> SessionRegistry::availableDates() {
    if (!m_snapshots) {
        return {};
    }
    return m_snapshots->availableDates();
}

void SessionRegistry::shutdown() {
    if (m_shutDown) {
        return;
    }
    stopSnapshotTimer();
    snapshotAll();
    m_shutDown = true;

    // Signal every process first so their termination overlaps.
    for (auto& [id, entry] : m_sessions) {
        if (entry->info.status == domain::SessionStatus::Exited || !entry->process) {
            continue;
        }
        try {
            entry->process->kill();
        } catch (const std::exception& e) {
            std::cerr << "[SessionRegistry] Failed to terminate session " << id << ": " << e.what() << std::endl;
        }
    }
    m_sessions.clear();
    m_retired.clear();

    if (m_snapshots) {
        m_snapshots->flush();
    }
    std::cout << "[SessionRegistry] Shut down" << std::endl;
}

} // namespace agentdeck::application
