#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <httplib.h>
#include <unistd.h>

#include "infrastructure/CredentialInspector.hpp"
#include "infrastructure/HttpUsageSource.hpp"
#include "test/TestSupport.hpp"

using namespace agentdeck;
using infrastructure::CredentialInspector;
using infrastructure::HttpUsageSource;
namespace fs = std::filesystem;

namespace {

constexpr const char* kUsageBody = R"({
    "five_hour": {"utilization": 42.5, "resets_at": "2026-10-19T15:00:00Z"},
    "seven_day": {"utilization": 7, "resets_at": null},
    "seven_day_opus": null
})";

domain::Profile TokenProfile(const std::string& token) {
    domain::Profile profile;
    profile.id = "work";
    profile.name = "Work";
    profile.token = token;
    return profile;
}

} // namespace

int main() {
    std::cout << "[Test] Starting HttpUsageSource Test..." << std::endl;

    test::ScratchDir dir("usagehttp");

    // Response parsing.
    {
        auto usage = HttpUsageSource::ParseUsage(kUsageBody);
        assert(usage.has_value());
        assert(usage->sessionPercent == 42.5);
        assert(usage->weeklyPercent == 7);
        assert(usage->sessionResetsAt == std::optional<std::string>("2026-10-19T15:00:00Z"));
        assert(!usage->weeklyResetsAt.has_value());

        auto partial = HttpUsageSource::ParseUsage(R"({"seven_day": {"utilization": 99.9}})");
        assert(partial && partial->sessionPercent == 0 && partial->weeklyPercent == 99.9);

        assert(!HttpUsageSource::ParseUsage("").has_value());
        assert(!HttpUsageSource::ParseUsage("[1, 2]").has_value());
        assert(!HttpUsageSource::ParseUsage(R"({"error": "unauthorized"})").has_value());
        assert(!HttpUsageSource::ParseUsage("<html>").has_value());
        std::cout << "[PASS] ParseUsage" << std::endl;
    }

    // Against a local endpoint.
    {
        httplib::Server server;
        std::mutex seenMutex;
        std::string seenAuth;
        std::string seenBeta;
        server.Get("/api/oauth/usage", [&](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(seenMutex);
            seenAuth = req.get_header_value("Authorization");
            seenBeta = req.get_header_value("anthropic-beta");
            if (seenAuth == "Bearer " + test::SampleToken()) {
                res.set_content(kUsageBody, "application/json");
            } else {
                res.status = 401;
                res.set_content(R"({"error": "unauthorized"})", "application/json");
            }
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        assert(port > 0);
        std::thread serverThread([&server]() { server.listen_after_bind(); });
        for (int i = 0; i < 200 && !server.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        HttpUsageSource source("http://127.0.0.1:" + std::to_string(port), 2);
        auto usage = source.fetch(TokenProfile(test::SampleToken()));
        assert(usage.has_value());
        assert(usage->profileId == "work");
        assert(usage->sessionPercent == 42.5);
        {
            std::lock_guard<std::mutex> lock(seenMutex);
            assert(seenAuth == "Bearer " + test::SampleToken());
            assert(!seenBeta.empty());
        }

        // Rejected credentials.
        assert(!source.fetch(TokenProfile(test::SampleToken('Z'))).has_value());

        // No token of its own: falls back to the CLI's stored credential.
        fs::create_directories(dir.sub("ambient"));
        std::ofstream(dir.sub("ambient/.credentials.json"))
            << R"({"claudeAiOauth": {"accessToken": ")" << test::SampleToken() << R"(", "expiresAt": 1}})";
        domain::Profile ambient;
        ambient.id = "default";
        ambient.isDefault = true;
        ambient.credentialDirectory = dir.sub("ambient");
        auto fallback = source.fetch(ambient);
        assert(fallback.has_value() && fallback->profileId == "default");

        server.stop();
        serverThread.join();
        std::cout << "[PASS] fetch" << std::endl;
    }

    // Failures yield nothing rather than throwing.
    {
        domain::Profile noCredential;
        noCredential.id = "spare";
        noCredential.credentialDirectory = dir.sub("missing");
        HttpUsageSource source("http://127.0.0.1:1", 1);
        assert(!source.fetch(noCredential).has_value());
        assert(!source.fetch(TokenProfile(test::SampleToken())).has_value());
        std::cout << "[PASS] Unreachable endpoint" << std::endl;
    }

    // Onboarding marker and token env file.
    {
        domain::Profile profile;
        profile.id = "work";
        profile.credentialDirectory = dir.sub("work");
        fs::create_directories(profile.credentialDirectory);
        assert(CredentialInspector::NeedsOnboarding(profile));

        std::ofstream(dir.sub("work/.claude.json")) << R"({"hasCompletedOnboarding": false})";
        assert(CredentialInspector::NeedsOnboarding(profile));
        std::ofstream(dir.sub("work/.claude.json")) << R"({"hasCompletedOnboarding": true, "theme": "dark"})";
        assert(!CredentialInspector::NeedsOnboarding(profile));

        // The default profile may keep the marker in $HOME.
        ::setenv("HOME", dir.sub("home").c_str(), 1);
        fs::create_directories(dir.sub("home"));
        domain::Profile ambient;
        ambient.id = "default";
        ambient.isDefault = true;
        ambient.credentialDirectory = dir.sub("nowhere");
        assert(CredentialInspector::NeedsOnboarding(ambient));
        std::ofstream(dir.sub("home/.claude.json")) << R"({"hasCompletedOnboarding": true})";
        assert(!CredentialInspector::NeedsOnboarding(ambient));

        assert(!CredentialInspector::StoredAccessToken(dir.sub("work")).has_value());
        std::ofstream(dir.sub("work/.credentials.json")) << R"({"accessToken": "plain"})";
        assert(CredentialInspector::StoredAccessToken(dir.sub("work")) == std::optional<std::string>("plain"));

        const std::string envFile =
            CredentialInspector::WriteTokenEnvFile("CLAUDE_CODE_OAUTH_TOKEN", "it's", dir.str());
        std::ifstream in(envFile);
        std::stringstream content;
        content << in.rdbuf();
        assert(content.str() == "export CLAUDE_CODE_OAUTH_TOKEN='it'\\''s'\n");
        const auto perms = fs::status(envFile).permissions();
        assert((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
        fs::remove(envFile);
        std::cout << "[PASS] CredentialInspector" << std::endl;
    }

    std::cout << "[Test] HttpUsageSource Test Completed." << std::endl;
    return 0;
}
