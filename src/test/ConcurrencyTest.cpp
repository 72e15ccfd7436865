#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include "application/EventLoop.hpp"
#include "application/AsyncTaskManager.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/TestSupport.hpp"

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Many reader threads posting into one loop: nothing lost, per-thread order kept.
    {
        agentdeck::application::EventLoop loop;
        const int NUM_THREADS = 8;
        const int POSTS_PER_THREAD = 500;
        std::map<int, std::vector<int>> received;
        std::vector<std::thread> threads;

        std::cout << "[Test] Spawning " << NUM_THREADS << " threads posting " << POSTS_PER_THREAD << " tasks each..." << std::endl;
        for (int t = 0; t < NUM_THREADS; ++t) {
            threads.emplace_back([&loop, &received, t]() {
                for (int i = 0; i < POSTS_PER_THREAD; ++i) {
                    // Handlers run on the loop thread only, so no lock is needed around `received`.
                    loop.post([&received, t, i]() { received[t].push_back(i); });
                    if (i % 50 == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            });
        }

        auto total = [&received]() {
            std::size_t n = 0;
            for (const auto& [t, items] : received) n += items.size();
            return n;
        };
        const bool complete = loop.runUntil([&]() { return total() == NUM_THREADS * POSTS_PER_THREAD; },
                                            std::chrono::milliseconds(10000));
        for (auto& th : threads) {
            if (th.joinable()) th.join();
        }
        loop.drain();

        assert(complete);
        for (const auto& [t, items] : received) {
            for (int i = 0; i < POSTS_PER_THREAD; ++i) {
                assert(items[i] == i);
            }
        }
        std::cout << "[PASS] " << total() << " tasks delivered in posting order." << std::endl;
    }

    // A loop stopped from another thread returns from run().
    {
        agentdeck::application::EventLoop loop;
        std::atomic<int> ticks{0};
        loop.post([&ticks]() { ++ticks; });
        std::thread stopper([&loop]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            loop.stop();
        });
        loop.run();
        stopper.join();
        assert(ticks == 1);
        std::cout << "[PASS] stop() from another thread." << std::endl;
    }

    // Background tasks report back through the loop.
    {
        agentdeck::application::EventLoop loop;
        agentdeck::application::AsyncTaskManager manager;
        std::atomic<int> finished{0};
        int reported = 0;
        for (int i = 0; i < 20; ++i) {
            manager.SubmitTask(agentdeck::application::TaskType::Maintenance, "task " + std::to_string(i),
                [&loop, &finished, &reported](const std::shared_ptr<agentdeck::application::TaskStatus>& status) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    ++status->stepsDone;
                    ++finished;
                    loop.post([&reported]() { ++reported; });
                });
        }
        auto failing = manager.SubmitTask(agentdeck::application::TaskType::UsagePoll, "failing",
            [](const std::shared_ptr<agentdeck::application::TaskStatus>&) {
                throw std::runtime_error("expected failure");
            });
        manager.WaitForAll();
        assert(failing->isCompleted && failing->failed);
        assert(failing->errorMessage == "expected failure");
        assert(manager.CountActive(agentdeck::application::TaskType::UsagePoll) == 0);
        loop.drain();
        assert(finished == 20);
        assert(reported == 20);
        assert(manager.GetActiveTasks().empty());
        std::cout << "[PASS] AsyncTaskManager completion." << std::endl;
    }

    // Persistence queue under concurrent writers: last write per file wins, deletes are ordered.
    {
        agentdeck::test::ScratchDir testRoot("concurrency");
        auto persistence = std::make_shared<agentdeck::infrastructure::PersistenceService>();
        const int NUM_WRITERS = 10;
        const int WRITES_PER_WRITER = 30;
        std::vector<std::thread> writers;

        for (int w = 0; w < NUM_WRITERS; ++w) {
            writers.emplace_back([&persistence, &testRoot, w]() {
                const std::string file = testRoot.sub("writer-" + std::to_string(w) + "/state.json");
                for (int i = 0; i < WRITES_PER_WRITER; ++i) {
                    persistence->saveTextAsync(file, std::to_string(i));
                }
            });
        }
        for (auto& th : writers) th.join();

        const std::string doomed = testRoot.sub("doomed.json");
        persistence->saveTextAsync(doomed, "{}", true);
        persistence->removeAsync(doomed);
        persistence->flush();

        for (int w = 0; w < NUM_WRITERS; ++w) {
            std::ifstream in(testRoot.sub("writer-" + std::to_string(w) + "/state.json"));
            std::string content;
            in >> content;
            assert(content == std::to_string(WRITES_PER_WRITER - 1));
        }
        assert(!std::filesystem::exists(doomed));

        // No temp files are left behind.
        for (const auto& entry : std::filesystem::recursive_directory_iterator(testRoot.path())) {
            assert(entry.path().extension() != ".tmp");
        }

        const std::string secret = testRoot.sub("secret.json");
        persistence->saveTextAsync(secret, "{\"token\":\"x\"}", true);
        persistence->stop();
        const auto perms = std::filesystem::status(secret).permissions();
        assert((perms & std::filesystem::perms::group_read) == std::filesystem::perms::none);
        assert((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);
        std::cout << "[PASS] Persistence queue ordering and permissions." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
