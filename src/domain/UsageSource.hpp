/**
 * @file UsageSource.hpp
 * @brief Interface to the external usage telemetry service.
 */

#pragma once

#include "domain/Profile.hpp"
#include "domain/UsageSnapshot.hpp"

#include <optional>

namespace agentdeck::domain {

class UsageSource {
public:
    virtual ~UsageSource() = default;

    /**
     * @brief Fetches current usage for one profile. Blocking; called from worker threads.
     * @return nullopt when the profile has no usable credential or the source is unavailable.
     */
    virtual std::optional<UsageSnapshot> fetch(const Profile& profile) = 0;
};

} // namespace agentdeck::domain
