/**
 * @file SessionStoreFs.cpp
 * @brief Implementation of SessionStoreFs.
 */

#include "infrastructure/SessionStoreFs.hpp"

#include "domain/Errors.hpp"
#include "infrastructure/EpochTime.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>

#include <nlohmann/json.hpp>

namespace agentdeck::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr int kSnapshotVersion = 1;

bool IsDateKey(const std::string& value) {
    static const std::regex pattern(R"(\d{4}-\d{2}-\d{2})");
    return std::regex_match(value, pattern);
}

bool IsSafeComponent(const std::string& value) {
    return !value.empty() && value != "." && value != ".." && value.find('/') == std::string::npos;
}

json SnapshotToJson(const domain::SessionSnapshot& snapshot, std::size_t limit) {
    const auto& info = snapshot.info;
    json j;
    j["version"] = kSnapshotVersion;
    j["id"] = info.id;
    j["title"] = info.title;
    j["displayOrder"] = info.displayOrder;
    j["createdAt"] = ToEpochMs(info.createdAt);
    j["lastActiveAt"] = ToEpochMs(snapshot.lastActiveAt);
    j["profileId"] = info.profileId ? json(*info.profileId) : json(nullptr);
    j["projectScope"] = info.projectScope ? json(*info.projectScope) : json(nullptr);
    j["agentCommand"] = info.agentCommand ? json(*info.agentCommand) : json(nullptr);

    const std::string& buffer = snapshot.outputBuffer;
    j["outputBuffer"] = buffer.size() > limit ? buffer.substr(buffer.size() - limit) : buffer;
    return j;
}

domain::SessionSnapshot SnapshotFromJson(const json& j, const std::string& date) {
    domain::SessionSnapshot snapshot;
    snapshot.date = date;
    snapshot.info.id = j.at("id").get<std::string>();
    snapshot.info.title = j.value("title", std::string());
    snapshot.info.displayOrder = j.value("displayOrder", 0);
    snapshot.info.createdAt = FromEpochMs(j.value("createdAt", 0LL));
    snapshot.info.profileId = OptionalString(j, "profileId");
    snapshot.info.projectScope = OptionalString(j, "projectScope");
    snapshot.info.agentCommand = OptionalString(j, "agentCommand");
    snapshot.info.status = domain::SessionStatus::Exited;
    snapshot.lastActiveAt = FromEpochMs(j.value("lastActiveAt", 0LL));
    snapshot.outputBuffer = j.value("outputBuffer", std::string());
    return snapshot;
}

} // namespace

SessionStoreFs::SessionStoreFs(std::string rootDirectory,
                               std::shared_ptr<PersistenceService> persistence,
                               std::size_t outputBufferLimit)
    : m_root(std::move(rootDirectory)),
      m_persistence(std::move(persistence)),
      m_outputBufferLimit(outputBufferLimit) {}

std::string SessionStoreFs::snapshotPath(const std::string& date, const std::string& sessionId) const {
    if (!IsDateKey(date) || !IsSafeComponent(sessionId)) {
        throw domain::ValidationError("Invalid snapshot key: " + date + "/" + sessionId);
    }
    return (fs::path(m_root) / date / (sessionId + ".json")).string();
}

void SessionStoreFs::save(const domain::SessionSnapshot& snapshot) {
    const std::string path = snapshotPath(snapshot.date, snapshot.info.id);
    m_persistence->saveTextAsync(path, SnapshotToJson(snapshot, m_outputBufferLimit).dump());
}

void SessionStoreFs::remove(const std::string& date, const std::string& sessionId) {
    m_persistence->removeAsync(snapshotPath(date, sessionId));
}

std::vector<domain::SessionSnapshot> SessionStoreFs::loadDate(const std::string& date) {
    std::vector<domain::SessionSnapshot> results;
    if (!IsDateKey(date)) {
        return results;
    }
    flush();

    const fs::path dir = fs::path(m_root) / date;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return results;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        try {
            std::ifstream f(entry.path());
            json j;
            f >> j;
            results.push_back(SnapshotFromJson(j, date));
        } catch (const json::exception& e) {
            std::cerr << "[SessionStoreFs] Skipping unreadable snapshot " << entry.path() << ": " << e.what() << std::endl;
        }
    }
    return results;
}

std::vector<domain::SnapshotDate> SessionStoreFs::availableDates() {
    std::vector<domain::SnapshotDate> dates;
    flush();

    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        return dates;
    }

    for (const auto& dirEntry : fs::directory_iterator(m_root, ec)) {
        const std::string name = dirEntry.path().filename().string();
        if (!dirEntry.is_directory() || !IsDateKey(name)) {
            continue;
        }
        std::size_t count = 0;
        for (const auto& file : fs::directory_iterator(dirEntry.path(), ec)) {
            if (file.is_regular_file() && file.path().extension() == ".json") {
                ++count;
            }
        }
        if (count > 0) {
            dates.push_back(domain::SnapshotDate{name, count});
        }
    }

    std::sort(dates.begin(), dates.end(), [](const auto& a, const auto& b) { return a.date > b.date; });
    return dates;
}

void SessionStoreFs::flush() {
    m_persistence->flush();
}

std::size_t SessionStoreFs::purgeOlderThan(int days, std::chrono::system_clock::time_point now) {
    flush();
    const std::string cutoff = domain::DateKey(now - std::chrono::hours(24 * days));

    std::size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        return removed;
    }

    std::vector<fs::path> expired;
    for (const auto& dirEntry : fs::directory_iterator(m_root, ec)) {
        const std::string name = dirEntry.path().filename().string();
        if (dirEntry.is_directory() && IsDateKey(name) && name < cutoff) {
            expired.push_back(dirEntry.path());
        }
    }

    for (const auto& path : expired) {
        fs::remove_all(path, ec);
        if (ec) {
            std::cerr << "[SessionStoreFs] Failed to purge " << path << ": " << ec.message() << std::endl;
            continue;
        }
        ++removed;
    }
    if (removed > 0) {
        std::cout << "[SessionStoreFs] Purged " << removed << " snapshot day(s) older than " << cutoff << std::endl;
    }
    return removed;
}

} // namespace agentdeck::infrastructure
