#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "application/AuthService.hpp"
#include "application/EventLoop.hpp"
#include "application/OutputScanner.hpp"
#include "application/ProfileService.hpp"
#include "application/SessionRegistry.hpp"
#include "test/TestSupport.hpp"

using namespace agentdeck;
using domain::AuthState;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Wires a complete login pipeline over a fake launcher.
 */
struct Harness {
    explicit Harness(std::chrono::milliseconds readyTimeout = 0ms)
        : dir("auth"),
          launcher(std::make_shared<test::FakeLauncher>()),
          registry(loop, launcher, nullptr, RegistryOptions()),
          profiles(std::make_shared<test::InMemoryProfileRepository>(), ProfileOptions(dir)),
          scanner(registry, [this](const std::string&) { return needsOnboarding; }),
          auth(loop, registry, scanner, profiles, AttemptOptions(readyTimeout)) {
        domain::Profile work;
        work.name = "Work";
        profiles.save(work);
        stateSub = auth.onStateChanged.connect(
            [this](const std::string&, AuthState state, const domain::AuthPayload& payload) {
                states.push_back(state);
                lastPayload = payload;
            });
    }

    static application::SessionRegistryOptions RegistryOptions() {
        application::SessionRegistryOptions options;
        options.shell = "/bin/sh";
        options.shellArgs = {};
        options.snapshotInterval = 0ms;
        return options;
    }

    static application::ProfileServiceOptions ProfileOptions(const test::ScratchDir& scratch) {
        application::ProfileServiceOptions options;
        options.profilesRoot = scratch.sub("profiles");
        options.defaultCredentialDirectory = scratch.sub("ambient");
        return options;
    }

    static application::AuthAttemptOptions AttemptOptions(std::chrono::milliseconds readyTimeout) {
        application::AuthAttemptOptions options;
        options.prefillDelay = 20ms;
        options.autoCloseDelay = 30ms;
        options.readyTimeout = readyTimeout;
        return options;
    }

    application::AuthCallbacks Callbacks() {
        application::AuthCallbacks callbacks;
        callbacks.onSuccess = [this](const domain::AuthPayload&) { ++successes; };
        callbacks.onError = [this](const domain::AuthPayload& payload) {
            ++errors;
            errorMessage = payload.message.value_or("");
        };
        return callbacks;
    }

    std::shared_ptr<test::FakeProcessState> loginProcess() const { return launcher->last(); }

    int prefillCount() const {
        int count = 0;
        for (const auto& w : loginProcess()->writes) {
            if (w == "claude /login") ++count;
        }
        return count;
    }

    test::ScratchDir dir;
    application::EventLoop loop;
    std::shared_ptr<test::FakeLauncher> launcher;
    application::SessionRegistry registry;
    application::ProfileService profiles;
    bool needsOnboarding = false;
    application::OutputScanner scanner;
    application::AuthService auth;

    application::Subscription stateSub;
    std::vector<AuthState> states;
    domain::AuthPayload lastPayload;
    int successes = 0;
    int errors = 0;
    std::string errorMessage;
};

const std::string kBanner = "\x1b[1mWelcome to Claude Code!\x1b[0m\r\n";

} // namespace

int main() {
    std::cout << "[Test] Starting AuthAttempt Test..." << std::endl;

    // Plain login: ready, one prefill, token stored, success without auto-close.
    {
        Harness h;
        const std::string attemptId = h.auth.start("work", {100, 30}, h.Callbacks());
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Ready));
        auto login = h.auth.loginSession(attemptId);
        assert(login && login->profileId == "work");

        auto session = h.registry.get(login->sessionId);
        assert(session->purpose == domain::SessionPurpose::Login);
        assert(session->title == "Login: Work");
        assert(session->profileId == std::optional<std::string>("work"));
        const auto& request = h.loginProcess()->request;
        assert(request.env.at("CLAUDE_CONFIG_DIR") == h.profiles.get("work")->credentialDirectory);
        assert(request.size.cols == 100 && request.size.rows == 30);

        // Nothing typed before the delay.
        assert(h.prefillCount() == 0);
        h.loop.runFor(60ms);
        assert(h.prefillCount() == 1);
        h.loop.runFor(40ms);
        assert(h.prefillCount() == 1);

        h.loginProcess()->emitData("Logged in as dev@example.com\r\n" + test::SampleToken('k') + "\r\n");
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Success));
        assert(h.successes == 1 && h.errors == 0);
        assert(h.profiles.get("work")->token == std::optional<std::string>(test::SampleToken('k')));
        assert(h.profiles.get("work")->email == std::optional<std::string>("dev@example.com"));
        assert(h.lastPayload.email == std::optional<std::string>("dev@example.com"));
        assert(h.states == std::vector<AuthState>({AuthState::Ready, AuthState::Success}));

        // The user closes it.
        h.loop.runFor(50ms);
        assert(h.auth.attempts().size() == 1);
        h.auth.cancel(attemptId);
        assert(h.auth.attempts().empty());
        assert(!h.registry.get(login->sessionId).has_value());
        std::cout << "[PASS] Login without onboarding" << std::endl;
    }

    // Onboarding: banner wins the race, the later exit is ignored, auto-close follows.
    {
        Harness h;
        h.needsOnboarding = true;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        const std::string sessionId = h.auth.loginSession(attemptId)->sessionId;

        h.loginProcess()->emitData(test::SampleToken() + "\r\n");
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Onboarding));
        assert(h.successes == 0);
        assert(h.profiles.get("work")->hasToken());

        h.loginProcess()->emitData(kBanner);
        h.loginProcess()->emitExit(0);
        h.loop.drain();
        assert(h.successes == 1 && h.errors == 0);
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Success));

        h.loop.runUntil([&] { return h.auth.attempts().empty(); }, 500ms);
        assert(h.auth.attempts().empty());
        assert(!h.registry.get(sessionId).has_value());
        assert(h.successes == 1);
        assert(h.states == std::vector<AuthState>({AuthState::Ready, AuthState::Onboarding, AuthState::Success}));
        std::cout << "[PASS] Onboarding: banner then exit" << std::endl;
    }

    // Onboarding: exit wins the race, no auto-close, the later banner is ignored.
    {
        Harness h;
        h.needsOnboarding = true;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        h.loginProcess()->emitData(test::SampleToken() + "\r\n");
        h.loop.drain();

        h.loginProcess()->emitExit(0);
        h.loginProcess()->emitData(kBanner);
        h.loop.drain();
        assert(h.successes == 1 && h.errors == 0);
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Success));

        h.loop.runFor(80ms);
        assert(h.auth.attempts().size() == 1);
        std::cout << "[PASS] Onboarding: exit then banner" << std::endl;
    }

    // Onboarding: the banner arrives in the same write as the token, or split across it and the next.
    {
        Harness h;
        h.needsOnboarding = true;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        h.loginProcess()->emitData(test::SampleToken() + "\r\n" + kBanner);
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Success));
        assert(h.successes == 1);
        assert(h.states == std::vector<AuthState>({AuthState::Ready, AuthState::Onboarding, AuthState::Success}));
        h.loop.runUntil([&] { return h.auth.attempts().empty(); }, 500ms);
        assert(h.auth.attempts().empty());
        std::cout << "[PASS] Onboarding: token and banner in one write" << std::endl;
    }
    {
        Harness h;
        h.needsOnboarding = true;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        h.loginProcess()->emitData(test::SampleToken() + "\r\nWelcome to Cl");
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Onboarding));
        h.loginProcess()->emitData("aude Code!\r\n");
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Success));
        assert(h.successes == 1 && h.errors == 0);
        std::cout << "[PASS] Onboarding: banner split after the token" << std::endl;
    }

    // Failure text during onboarding ends the attempt; the stored token stays.
    {
        Harness h;
        h.needsOnboarding = true;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        h.loginProcess()->emitData(test::SampleToken() + "\r\n");
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Onboarding));
        h.loginProcess()->emitData("Login failed: please try again\r\n");
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Error));
        assert(h.errors == 1 && h.successes == 0);
        assert(h.errorMessage == "Login failed: please try again");
        assert(h.profiles.get("work")->hasToken());
        std::cout << "[PASS] Failure during onboarding" << std::endl;
    }

    // Failures: non-zero exit, failure text, spawn error, timeout.
    {
        Harness h;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        h.loginProcess()->emitExit(1);
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Error));
        assert(h.errors == 1);
        assert(h.errorMessage.find("code 1") != std::string::npos);
        h.loop.runFor(40ms);
        assert(h.prefillCount() == 0);
        std::cout << "[PASS] Exit before token" << std::endl;
    }
    {
        Harness h;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        h.loginProcess()->emitData("OAuth error: Invalid token provided\r\n");
        h.loginProcess()->emitExit(1);
        h.loop.drain();
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Error));
        assert(h.errors == 1);
        assert(h.errorMessage == "OAuth error: Invalid token provided");
        assert(!h.profiles.get("work")->hasToken());
        std::cout << "[PASS] Failure message" << std::endl;
    }
    {
        Harness h;
        h.launcher->failNext = true;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Error));
        assert(!h.auth.loginSession(attemptId).has_value());
        assert(h.errors == 1);
        assert(h.registry.list().empty());
        assert(h.loop.pendingTimers() == 0);
        h.auth.cancel(attemptId);
        std::cout << "[PASS] Spawn failure" << std::endl;
    }
    {
        Harness h(30ms);
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        h.loop.runUntil([&] { return h.errors > 0; }, 500ms);
        assert(h.auth.state(attemptId) == std::optional<AuthState>(AuthState::Error));
        assert(h.errorMessage.find("Timed out") != std::string::npos);

        // A token after the timeout changes nothing.
        h.loginProcess()->emitData(test::SampleToken() + "\r\n");
        h.loop.drain();
        assert(h.successes == 0 && h.errors == 1);
        assert(!h.profiles.get("work")->hasToken());
        std::cout << "[PASS] Ready timeout" << std::endl;
    }

    // Dismissal cancels every pending timer and destroys the login session.
    {
        Harness h;
        const std::string attemptId = h.auth.start("work", {}, h.Callbacks());
        const std::string sessionId = h.auth.loginSession(attemptId)->sessionId;
        auto process = h.loginProcess();
        assert(h.loop.pendingTimers() == 1);

        h.auth.cancel(attemptId);
        assert(h.loop.pendingTimers() == 0);
        assert(process->killCount == 1);
        assert(!h.registry.get(sessionId).has_value());
        h.loop.runFor(50ms);
        assert(process->writes.empty());
        assert(h.successes == 0 && h.errors == 0);

        bool notFound = false;
        try {
            h.auth.cancel(attemptId);
        } catch (const domain::NotFoundError&) {
            notFound = true;
        }
        assert(notFound);

        notFound = false;
        try {
            h.auth.start("ghost");
        } catch (const domain::NotFoundError&) {
            notFound = true;
        }
        assert(notFound);
        std::cout << "[PASS] Dismissal" << std::endl;
    }

    // Logging in the default profile keeps the ambient credential directory.
    {
        Harness h;
        const std::string attemptId = h.auth.start("default", {}, h.Callbacks());
        assert(h.loginProcess()->request.env.count("CLAUDE_CONFIG_DIR") == 0);
        assert(h.registry.get(h.auth.loginSession(attemptId)->sessionId)->title == "Login: Default");
        std::cout << "[PASS] Default profile login" << std::endl;
    }

    std::cout << "[Test] AuthAttempt Test Completed." << std::endl;
    return 0;
}
