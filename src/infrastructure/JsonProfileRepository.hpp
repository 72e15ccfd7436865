/**
 * @file JsonProfileRepository.hpp
 * @brief ProfileRepository persisted as a single versioned JSON document.
 */

#pragma once

#include "domain/ProfileRepository.hpp"

#include <string>

namespace agentdeck::infrastructure {

/**
 * @class JsonProfileRepository
 * @brief Stores profiles, the active pointer and auto-switch settings in profiles.json.
 *
 * The document holds tokens, so every write is atomic and owner-only (0600).
 * A document that cannot be parsed is moved aside rather than overwritten.
 */
class JsonProfileRepository : public domain::ProfileRepository {
public:
    static constexpr int kFormatVersion = 3;

    explicit JsonProfileRepository(std::string filePath);

    std::optional<domain::ProfileStoreData> load() override;
    void save(const domain::ProfileStoreData& data) override;

    const std::string& filePath() const { return m_filePath; }

private:
    std::string m_filePath;
};

} // namespace agentdeck::infrastructure
