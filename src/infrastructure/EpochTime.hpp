/**
 * @file EpochTime.hpp
 * @brief Conversions between system_clock time points and the epoch milliseconds stored in JSON.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace agentdeck::infrastructure {

inline long long ToEpochMs(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point FromEpochMs(long long ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

/** @brief Reads an optional epoch-ms field; null or absent yields nullopt. */
inline std::optional<std::chrono::system_clock::time_point> OptionalTime(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        return std::nullopt;
    }
    return FromEpochMs(j[key].get<long long>());
}

/** @brief Reads an optional string field; null or absent yields nullopt. */
inline std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // namespace agentdeck::infrastructure
