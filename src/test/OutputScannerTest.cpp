#include <cassert>
#include <iostream>

#include "application/EventLoop.hpp"
#include "application/OutputScanner.hpp"
#include "application/SessionRegistry.hpp"
#include "test/TestSupport.hpp"

using namespace agentdeck;
using domain::DetectorKind;

namespace {

application::SessionRegistryOptions RegistryOptions() {
    application::SessionRegistryOptions options;
    options.shell = "/bin/sh";
    options.shellArgs = {};
    options.snapshotInterval = std::chrono::milliseconds(0);
    return options;
}

const std::string kLimitLine = std::string("Limit reached \xC2\xB7") + " resets 3pm (Europe/Oslo)\r\n";

} // namespace

int main() {
    std::cout << "[Test] Starting OutputScanner Test..." << std::endl;

    // Token split across writes, reported once with email and onboarding state.
    {
        application::EventLoop loop;
        auto launcher = std::make_shared<test::FakeLauncher>();
        application::SessionRegistry registry(loop, launcher, nullptr, RegistryOptions());
        std::vector<std::string> probed;
        application::OutputScanner scanner(registry, [&](const std::string& profileId) {
            probed.push_back(profileId);
            return true;
        });

        domain::SessionOptions login;
        login.purpose = domain::SessionPurpose::Login;
        auto session = registry.create(login);
        auto process = launcher->last();
        auto attachment = scanner.attach(session.id, std::string("work"));

        std::vector<domain::TokenDetected> tokens;
        auto tokenSub = scanner.onTokenDetected.connect([&](const domain::TokenDetected& e) { tokens.push_back(e); });
        int banners = 0;
        auto bannerSub = scanner.onOnboardingCompleted.connect([&](const domain::OnboardingCompleted& e) {
            assert(e.profileId == "work");
            ++banners;
        });

        // Banner before the token does not complete onboarding.
        process->emitData("Welcome to Claude Code\r\n");
        loop.drain();
        assert(banners == 0);

        const std::string token = test::SampleToken('q');
        process->emitData("Logged in as dev@example.com\r\nToken: " + token.substr(0, 30));
        loop.drain();
        assert(tokens.empty());
        process->emitData(token.substr(30) + "\r\n");
        loop.drain();
        assert(tokens.size() == 1);
        assert(tokens[0].token == token);
        assert(tokens[0].profileId == "work");
        assert(tokens[0].sessionId == session.id);
        assert(tokens[0].email == std::optional<std::string>("dev@example.com"));
        assert(tokens[0].needsOnboarding);
        assert(probed == std::vector<std::string>({"work"}));
        assert(scanner.hasFired(session.id, DetectorKind::Token));

        // The same token printed again is the same occurrence.
        process->emitData("Token: " + token + "\r\n");
        loop.drain();
        assert(tokens.size() == 1);

        // Banner straddling two writes.
        process->emitData("\x1b[1mWelcome to Cl");
        process->emitData("aude Code!\x1b[0m");
        loop.drain();
        assert(banners == 1);
        process->emitData("? for shortcuts");
        loop.drain();
        assert(banners == 1);

        // Login sessions never report rate limits.
        int limits = 0;
        auto limitSub = scanner.onRateLimitDetected.connect([&](const domain::RateLimitDetected&) { ++limits; });
        process->emitData(kLimitLine);
        loop.drain();
        assert(limits == 0);
        std::cout << "[PASS] Token and onboarding detectors" << std::endl;
    }

    // Failures are reported for login sessions.
    {
        application::EventLoop loop;
        auto launcher = std::make_shared<test::FakeLauncher>();
        application::SessionRegistry registry(loop, launcher, nullptr, RegistryOptions());
        application::OutputScanner scanner(registry);

        auto session = registry.create({});
        auto attachment = scanner.attach(session.id, std::string("personal"));
        std::vector<domain::AuthFailureDetected> failures;
        auto sub = scanner.onAuthFailure.connect([&](const domain::AuthFailureDetected& e) { failures.push_back(e); });

        launcher->last()->emitData("Error: Authentication failed\r\n");
        launcher->last()->emitData("Error: Authentication failed\r\n");
        loop.drain();
        assert(failures.size() == 1);
        assert(failures[0].profileId == "personal");
        assert(failures[0].message == "Error: Authentication failed");
        std::cout << "[PASS] Failure detector" << std::endl;
    }

    // A token and what follows it in the same write are both scanned; failures still count afterwards.
    {
        application::EventLoop loop;
        auto launcher = std::make_shared<test::FakeLauncher>();
        application::SessionRegistry registry(loop, launcher, nullptr, RegistryOptions());
        application::OutputScanner scanner(registry, [](const std::string&) { return true; });

        auto session = registry.create({});
        auto attachment = scanner.attach(session.id, std::string("work"));
        int tokens = 0;
        int banners = 0;
        std::vector<std::string> failures;
        auto tokenSub = scanner.onTokenDetected.connect([&](const domain::TokenDetected&) { ++tokens; });
        auto bannerSub = scanner.onOnboardingCompleted.connect([&](const domain::OnboardingCompleted&) {
            // The token is always reported first.
            assert(tokens == 1);
            ++banners;
        });
        auto failureSub = scanner.onAuthFailure.connect(
            [&](const domain::AuthFailureDetected& e) { failures.push_back(e.message); });

        launcher->last()->emitData("\x1b[32m" + test::SampleToken('w') + "\x1b[0m\r\n\x1b[1mWelcome to Claude Code!");
        loop.drain();
        assert(tokens == 1 && banners == 1);
        assert(scanner.hasFired(session.id, DetectorKind::OnboardingComplete));

        launcher->last()->emitData("\r\nOAuth token has expired\r\n");
        loop.drain();
        assert(failures == std::vector<std::string>({"OAuth token has expired"}));
        std::cout << "[PASS] Detectors share one write" << std::endl;
    }

    // Rate limits in running sessions: attributed, latched, re-armable.
    {
        application::EventLoop loop;
        auto launcher = std::make_shared<test::FakeLauncher>();
        application::SessionRegistry registry(loop, launcher, nullptr, RegistryOptions());
        application::OutputScanner scanner(registry);

        domain::SessionOptions options;
        options.profileId = "work";
        auto attributed = registry.create(options);
        auto attributedProcess = launcher->last();
        auto anonymous = registry.create({});
        auto anonymousProcess = launcher->last();

        auto a = scanner.attach(attributed.id);
        auto b = scanner.attach(anonymous.id);
        std::vector<domain::RateLimitDetected> limits;
        auto sub = scanner.onRateLimitDetected.connect([&](const domain::RateLimitDetected& e) { limits.push_back(e); });
        int tokens = 0;
        auto tokenSub = scanner.onTokenDetected.connect([&](const domain::TokenDetected&) { ++tokens; });

        attributedProcess->emitData("Limit reached ");
        attributedProcess->emitData(kLimitLine.substr(14));
        anonymousProcess->emitData(kLimitLine);
        anonymousProcess->emitData("Token: " + test::SampleToken() + "\r\n");
        loop.drain();

        assert(limits.size() == 2);
        assert(limits[0].sessionId == attributed.id);
        assert(limits[0].profileId == std::optional<std::string>("work"));
        assert(limits[0].resetTime == "3pm (Europe/Oslo)");
        assert(limits[0].kind == domain::RateLimitKind::Session);
        assert(limits[1].sessionId == anonymous.id);
        assert(!limits[1].profileId.has_value());
        assert(tokens == 0);

        // Repeats within the same occurrence window are suppressed.
        attributedProcess->emitData(kLimitLine);
        loop.drain();
        assert(limits.size() == 2);

        // After a relaunch the detector is armed again.
        scanner.rearm(attributed.id, DetectorKind::RateLimit);
        assert(!scanner.hasFired(attributed.id, DetectorKind::RateLimit));
        attributedProcess->emitData(std::string("Limit reached \xC2\xB7") + " resets Dec 17 at 6am\r\n");
        loop.drain();
        assert(limits.size() == 3);
        assert(limits[2].kind == domain::RateLimitKind::Weekly);

        // Detaching stops the scan.
        b.reset();
        scanner.rearm(anonymous.id, DetectorKind::RateLimit);
        anonymousProcess->emitData(kLimitLine);
        loop.drain();
        assert(limits.size() == 3);
        std::cout << "[PASS] Rate-limit detector" << std::endl;
    }

    // Only output after attach is scanned; unknown sessions are rejected.
    {
        application::EventLoop loop;
        auto launcher = std::make_shared<test::FakeLauncher>();
        application::SessionRegistry registry(loop, launcher, nullptr, RegistryOptions());
        application::OutputScanner scanner(registry);
        auto session = registry.create({});
        launcher->last()->emitData(kLimitLine);
        loop.drain();

        int limits = 0;
        auto sub = scanner.onRateLimitDetected.connect([&](const domain::RateLimitDetected&) { ++limits; });
        auto attachment = scanner.attach(session.id);
        assert(limits == 0);

        bool rejected = false;
        try {
            scanner.attach("no-such-session");
        } catch (const domain::NotFoundError&) {
            rejected = true;
        }
        assert(rejected);

        // The scanner may be destroyed before its attachments.
        {
            application::OutputScanner shortLived(registry);
            attachment = shortLived.attach(session.id);
        }
        attachment.reset();
        launcher->last()->emitData("more output");
        loop.drain();
        std::cout << "[PASS] Attach semantics" << std::endl;
    }

    std::cout << "[Test] OutputScanner Test Completed." << std::endl;
    return 0;
}
