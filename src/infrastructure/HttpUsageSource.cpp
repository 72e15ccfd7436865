#include "infrastructure/HttpUsageSource.hpp"

#include "infrastructure/CredentialInspector.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

namespace agentdeck::infrastructure {

using json = nlohmann::json;

namespace {
constexpr const char* kUsagePath = "/api/oauth/usage";
constexpr const char* kOAuthBeta = "oauth-2025-04-20";

// Reads {"utilization": <percent>, "resets_at": <string|null>}.
void ReadWindow(const json& body, const char* key, double& percent, std::optional<std::string>& resetsAt) {
    if (!body.contains(key) || !body[key].is_object()) {
        return;
    }
    const auto& window = body[key];
    if (window.contains("utilization") && window["utilization"].is_number()) {
        percent = window["utilization"].get<double>();
    }
    if (window.contains("resets_at") && window["resets_at"].is_string()) {
        resetsAt = window["resets_at"].get<std::string>();
    }
}
}

HttpUsageSource::HttpUsageSource(std::string endpoint, int timeoutSeconds)
    : m_endpoint(std::move(endpoint)), m_timeoutSeconds(timeoutSeconds) {}

std::optional<domain::UsageSnapshot> HttpUsageSource::fetch(const domain::Profile& profile) {
    std::optional<std::string> token = profile.token;
    if (!profile.hasToken() && !profile.credentialDirectory.empty()) {
        token = CredentialInspector::StoredAccessToken(profile.credentialDirectory);
    }
    if (!token || token->empty()) {
        std::cerr << "[HttpUsageSource] No credential available for profile " << profile.id << std::endl;
        return std::nullopt;
    }

    httplib::Client cli(m_endpoint);
    if (!cli.is_valid()) {
        std::cerr << "[HttpUsageSource] Unsupported endpoint: " << m_endpoint << std::endl;
        return std::nullopt;
    }
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Headers headers = {
        {"Authorization", "Bearer " + *token},
        {"anthropic-beta", kOAuthBeta},
        {"Accept", "application/json"}
    };

    auto res = cli.Get(kUsagePath, headers);
    if (!res) {
        std::cerr << "[HttpUsageSource] Connection failed for profile " << profile.id << ": "
                  << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        // The body may echo request details; only the status is logged.
        std::cerr << "[HttpUsageSource] HTTP Error " << res->status << " for profile " << profile.id << std::endl;
        return std::nullopt;
    }

    auto snapshot = ParseUsage(res->body);
    if (snapshot) {
        snapshot->profileId = profile.id;
    }
    return snapshot;
}

std::optional<domain::UsageSnapshot> HttpUsageSource::ParseUsage(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || (!j.contains("five_hour") && !j.contains("seven_day"))) {
            std::cerr << "[HttpUsageSource] Usage response has no quota windows" << std::endl;
            return std::nullopt;
        }
        domain::UsageSnapshot snapshot;
        ReadWindow(j, "five_hour", snapshot.sessionPercent, snapshot.sessionResetsAt);
        ReadWindow(j, "seven_day", snapshot.weeklyPercent, snapshot.weeklyResetsAt);
        snapshot.measuredAt = std::chrono::system_clock::now();
        return snapshot;
    } catch (const json::exception& e) {
        std::cerr << "[HttpUsageSource] JSON Parse Error: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace agentdeck::infrastructure
