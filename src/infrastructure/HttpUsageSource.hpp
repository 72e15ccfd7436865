/**
 * @file HttpUsageSource.hpp
 * @brief UsageSource backed by the OAuth usage endpoint (cpp-httplib).
 */

#pragma once

#include "domain/UsageSource.hpp"

#include <string>

namespace agentdeck::infrastructure {

class HttpUsageSource : public domain::UsageSource {
public:
    /**
     * @param endpoint Scheme, host and optional port, e.g. "https://api.anthropic.com".
     * @param timeoutSeconds Connection and read timeout per request.
     */
    explicit HttpUsageSource(std::string endpoint, int timeoutSeconds = 10);

    /**
     * @brief GET /api/oauth/usage with the profile's bearer token.
     *
     * Profiles without a stored token fall back to the access token the CLI
     * keeps in their credential directory. Returns nullopt (and logs) on any
     * transport, HTTP or parse failure.
     */
    std::optional<domain::UsageSnapshot> fetch(const domain::Profile& profile) override;

    /** @brief Parses a usage response body. Exposed for tests. */
    static std::optional<domain::UsageSnapshot> ParseUsage(const std::string& body);

private:
    std::string m_endpoint;
    int m_timeoutSeconds;
};

} // namespace agentdeck::infrastructure
