/**
 * @file SessionStoreFs.hpp
 * @brief Filesystem-backed SessionSnapshotRepository.
 */

#pragma once

#include "domain/SessionSnapshotRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace agentdeck::infrastructure {

/**
 * @class SessionStoreFs
 * @brief One JSON file per session under <root>/<YYYY-MM-DD>/<sessionId>.json.
 *
 * Writes and deletes go through the shared PersistenceService queue; reads
 * flush the queue first so they observe every earlier save() and remove().
 */
class SessionStoreFs : public domain::SessionSnapshotRepository {
public:
    SessionStoreFs(std::string rootDirectory,
                   std::shared_ptr<PersistenceService> persistence,
                   std::size_t outputBufferLimit = 100000);

    void save(const domain::SessionSnapshot& snapshot) override;
    void remove(const std::string& date, const std::string& sessionId) override;
    std::vector<domain::SessionSnapshot> loadDate(const std::string& date) override;
    std::vector<domain::SnapshotDate> availableDates() override;
    void flush() override;

    /**
     * @brief Deletes every date directory older than @p days days before @p now.
     * @return Number of date directories removed.
     */
    std::size_t purgeOlderThan(int days,
                               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    std::string snapshotPath(const std::string& date, const std::string& sessionId) const;

    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;
    std::size_t m_outputBufferLimit;
};

} // namespace agentdeck::infrastructure
