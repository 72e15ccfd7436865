/**
 * @file SessionSnapshotRepository.hpp
 * @brief Interface for date-keyed session snapshot storage.
 */

#pragma once

#include "domain/Session.hpp"

#include <string>
#include <vector>

namespace agentdeck::domain {

class SessionSnapshotRepository {
public:
    virtual ~SessionSnapshotRepository() = default;

    /** @brief Stores or replaces the snapshot of one session under snapshot.date. */
    virtual void save(const SessionSnapshot& snapshot) = 0;

    /** @brief Removes a session's snapshot for the given date, if present. */
    virtual void remove(const std::string& date, const std::string& sessionId) = 0;

    /** @brief All snapshots stored for a date, in no particular order. */
    virtual std::vector<SessionSnapshot> loadDate(const std::string& date) = 0;

    /** @brief Dates with at least one snapshot, most recent first. */
    virtual std::vector<SnapshotDate> availableDates() = 0;

    /** @brief Blocks until previously queued writes have reached storage. */
    virtual void flush() = 0;
};

} // namespace agentdeck::domain
