/**
 * @file TestSupport.hpp
 * @brief In-memory fakes shared by the test executables.
 */

#pragma once

#include "domain/Errors.hpp"
#include "domain/ProcessLauncher.hpp"
#include "domain/ProfileRepository.hpp"
#include "domain/SessionSnapshotRepository.hpp"
#include "domain/UsageSource.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace agentdeck::test {

/**
 * @struct FakeProcessState
 * @brief What a fake process received, shared with the test after the handle is gone.
 */
struct FakeProcessState {
    domain::SpawnRequest request;
    domain::ProcessCallbacks callbacks;
    std::vector<std::string> writes;
    std::vector<domain::TerminalSize> resizes;
    int killCount = 0;
    bool exitOnKill = true;
    bool released = false; ///< The owning handle was destroyed.
    int pid = 0;

    /** @brief Delivers output the way a reader thread would (posted to the loop). */
    void emitData(const std::string& data) const {
        if (callbacks.onData) callbacks.onData(data);
    }

    void emitExit(int code) const {
        if (callbacks.onExit) callbacks.onExit(code);
    }

    std::string allWrites() const {
        std::string joined;
        for (const auto& w : writes) joined += w;
        return joined;
    }
};

class FakeProcess : public domain::PtyProcess {
public:
    explicit FakeProcess(std::shared_ptr<FakeProcessState> state) : m_state(std::move(state)) {}
    ~FakeProcess() override { m_state->released = true; }

    bool write(const std::string& data) override {
        m_state->writes.push_back(data);
        return true;
    }

    bool resize(const domain::TerminalSize& size) override {
        m_state->resizes.push_back(size);
        return true;
    }

    void kill() override {
        ++m_state->killCount;
        if (m_state->exitOnKill) {
            m_state->emitExit(143);
        }
    }

    int pid() const override { return m_state->pid; }

private:
    std::shared_ptr<FakeProcessState> m_state;
};

/**
 * @class FakeLauncher
 * @brief Records spawn requests and hands out FakeProcess handles.
 */
class FakeLauncher : public domain::ProcessLauncher {
public:
    std::unique_ptr<domain::PtyProcess> spawn(const domain::SpawnRequest& request,
                                              domain::ProcessCallbacks callbacks) override {
        if (failNext) {
            failNext = false;
            throw domain::SpawnError("simulated exec failure for " + request.command);
        }
        auto state = std::make_shared<FakeProcessState>();
        state->request = request;
        state->callbacks = std::move(callbacks);
        state->pid = 1000 + static_cast<int>(processes.size());
        processes.push_back(state);
        return std::make_unique<FakeProcess>(state);
    }

    std::shared_ptr<FakeProcessState> last() const {
        return processes.empty() ? nullptr : processes.back();
    }

    bool failNext = false;
    std::vector<std::shared_ptr<FakeProcessState>> processes;
};

/**
 * @class FakeUsageSource
 * @brief Serves canned usage per profile. Thread-safe: polled from worker threads.
 */
class FakeUsageSource : public domain::UsageSource {
public:
    std::optional<domain::UsageSnapshot> fetch(const domain::Profile& profile) override {
        ++calls;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fetched.insert(profile.id);
        if (m_failing.count(profile.id)) {
            throw std::runtime_error("simulated outage for " + profile.id);
        }
        auto it = m_usage.find(profile.id);
        if (it == m_usage.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& profileId, double sessionPercent, double weeklyPercent = 0.0) {
        domain::UsageSnapshot snapshot;
        snapshot.profileId = profileId;
        snapshot.sessionPercent = sessionPercent;
        snapshot.weeklyPercent = weeklyPercent;
        snapshot.measuredAt = std::chrono::system_clock::now();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_usage[profileId] = snapshot;
    }

    void fail(const std::string& profileId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(profileId);
    }

    std::set<std::string> fetched() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fetched;
    }

    std::atomic<int> calls{0};

private:
    std::mutex m_mutex;
    std::set<std::string> m_fetched;
    std::map<std::string, domain::UsageSnapshot> m_usage;
    std::set<std::string> m_failing;
};

class InMemoryProfileRepository : public domain::ProfileRepository {
public:
    std::optional<domain::ProfileStoreData> load() override { return stored; }

    void save(const domain::ProfileStoreData& data) override {
        stored = data;
        ++saveCount;
    }

    std::optional<domain::ProfileStoreData> stored;
    int saveCount = 0;
};

class InMemorySnapshotRepository : public domain::SessionSnapshotRepository {
public:
    void save(const domain::SessionSnapshot& snapshot) override {
        byDate[snapshot.date][snapshot.info.id] = snapshot;
    }

    void remove(const std::string& date, const std::string& sessionId) override {
        removed.push_back(sessionId);
        auto it = byDate.find(date);
        if (it != byDate.end()) {
            it->second.erase(sessionId);
        }
    }

    std::vector<domain::SessionSnapshot> loadDate(const std::string& date) override {
        std::vector<domain::SessionSnapshot> result;
        auto it = byDate.find(date);
        if (it != byDate.end()) {
            for (const auto& [id, snapshot] : it->second) {
                result.push_back(snapshot);
            }
        }
        return result;
    }

    std::vector<domain::SnapshotDate> availableDates() override {
        std::vector<domain::SnapshotDate> result;
        for (auto it = byDate.rbegin(); it != byDate.rend(); ++it) {
            if (!it->second.empty()) {
                result.push_back(domain::SnapshotDate{it->first, it->second.size()});
            }
        }
        return result;
    }

    void flush() override { ++flushCount; }

    std::map<std::string, std::map<std::string, domain::SessionSnapshot>> byDate;
    std::vector<std::string> removed;
    int flushCount = 0;
};

/**
 * @class ScratchDir
 * @brief Fresh directory under the system temp dir, removed on destruction.
 */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() /
                 ("agentdeck-" + name + "-" + std::to_string(::getpid()))) {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        std::filesystem::create_directories(m_path);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }
    std::string sub(const std::string& child) const { return (m_path / child).string(); }

private:
    std::filesystem::path m_path;
};

/** @brief A token of the shape the login flow prints. */
inline std::string SampleToken(char fill = 'A') {
    return "sk-ant-oat01-" + std::string(95, fill);
}

} // namespace agentdeck::test
