#include <cassert>
#include <chrono>
#include <iostream>

#include "application/AsyncTaskManager.hpp"
#include "application/EventLoop.hpp"
#include "application/ProfileService.hpp"
#include "application/UsageMonitor.hpp"
#include "test/TestSupport.hpp"

using namespace agentdeck;
using namespace std::chrono_literals;

namespace {

application::ProfileServiceOptions ProfileOptions(const test::ScratchDir& dir) {
    application::ProfileServiceOptions options;
    options.profilesRoot = dir.sub("profiles");
    options.defaultCredentialDirectory = dir.sub("ambient");
    return options;
}

void SetInterval(application::ProfileService& profiles, int intervalMs) {
    auto settings = profiles.autoSwitchSettings();
    settings.pollIntervalMs = intervalMs;
    profiles.updateAutoSwitchSettings(settings);
}

} // namespace

int main() {
    std::cout << "[Test] Starting UsageMonitor Test..." << std::endl;

    test::ScratchDir dir("usage");
    application::EventLoop loop;
    auto taskManager = std::make_shared<application::AsyncTaskManager>();
    auto source = std::make_shared<test::FakeUsageSource>();
    application::ProfileService profiles(std::make_shared<test::InMemoryProfileRepository>(), ProfileOptions(dir));
    for (const auto& name : {"Work", "Personal", "Spare"}) {
        domain::Profile profile;
        profile.name = name;
        profiles.save(profile);
    }
    profiles.setToken("work", test::SampleToken());
    profiles.setToken("personal", test::SampleToken('B'));

    // Interval 0 disables polling entirely.
    {
        SetInterval(profiles, 0);
        application::UsageMonitor monitor(loop, profiles, source, taskManager);
        monitor.start();
        assert(!monitor.isPolling());
        assert(!monitor.inFlight());
        loop.runFor(30ms);
        assert(source->calls == 0);
        std::cout << "[PASS] Polling disabled" << std::endl;
    }

    // One cycle: authenticated profiles only, results published on the loop.
    {
        SetInterval(profiles, 40);
        source->set("work", 50, 10);
        source->set("personal", 20, 5);

        application::UsageMonitor monitor(loop, profiles, source, taskManager);
        std::map<std::string, double> updates;
        int cycles = 0;
        auto updateSub = monitor.onUsageUpdated.connect(
            [&](const std::string& id, const domain::UsageSnapshot& snapshot) { updates[id] = snapshot.sessionPercent; });
        auto cycleSub = monitor.onCycleCompleted.connect([&]() { ++cycles; });

        monitor.start();
        assert(monitor.isPolling());
        assert(monitor.inFlight());
        // Overlapping requests are dropped.
        assert(!monitor.refresh());

        assert(loop.runUntil([&] { return cycles >= 1; }, 2000ms));
        assert(!monitor.inFlight());
        assert(updates.size() == 2);
        assert(updates["work"] == 50);
        assert(monitor.latest("personal")->weeklyPercent == 5);
        assert(monitor.latest("personal")->profileId == "personal");
        assert(!monitor.latest("spare").has_value());
        assert(source->fetched() == std::set<std::string>({"work", "personal"}));

        // A failing profile keeps its last snapshot and does not hold up the rest.
        source->fail("personal");
        source->set("work", 70);
        assert(loop.runUntil([&] { return cycles >= 2; }, 2000ms));
        assert(monitor.latest("work")->sessionPercent == 70);
        assert(monitor.latest("personal")->sessionPercent == 20);
        assert(monitor.all().size() == 2);

        // The timer follows settings changes.
        SetInterval(profiles, 0);
        assert(!monitor.isPolling());
        loop.runUntil([&] { return !monitor.inFlight(); }, 2000ms);
        const int callsAfterStop = source->calls;
        loop.runFor(100ms);
        assert(source->calls == callsAfterStop);

        // Manual refresh still works while the timer is off.
        assert(monitor.refresh());
        assert(loop.runUntil([&] { return !monitor.inFlight(); }, 2000ms));
        assert(source->calls > callsAfterStop);

        SetInterval(profiles, 40);
        assert(monitor.isPolling());
        monitor.stop();
        assert(!monitor.isPolling());
        std::cout << "[PASS] Poll cycles" << std::endl;
    }

    // Results arriving after the monitor is gone are discarded.
    {
        SetInterval(profiles, 0);
        {
            application::UsageMonitor monitor(loop, profiles, source, taskManager);
            assert(monitor.refresh());
        }
        taskManager->WaitForAll();
        loop.drain();
        std::cout << "[PASS] Late results after destruction" << std::endl;
    }

    // Injected snapshots are published like polled ones.
    {
        application::UsageMonitor monitor(loop, profiles, source, taskManager);
        int updates = 0;
        auto sub = monitor.onUsageUpdated.connect([&](const std::string&, const domain::UsageSnapshot&) { ++updates; });
        domain::UsageSnapshot snapshot;
        snapshot.profileId = "spare";
        snapshot.sessionPercent = 12;
        monitor.publish(snapshot);
        assert(updates == 1);
        assert(monitor.latest("spare")->sessionPercent == 12);
        std::cout << "[PASS] publish" << std::endl;
    }

    taskManager->WaitForAll();
    std::cout << "[Test] UsageMonitor Test Completed." << std::endl;
    return 0;
}
