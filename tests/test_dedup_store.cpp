#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/chat/dedup_store.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using voice_bridge::chat::DedupStore;

namespace {

struct ManualClock {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} +
                                                std::chrono::hours(1);

    DedupStore::Clock fn() {
        return [this]() { return now; };
    }
};

}

TEST_CASE("a message id is claimed once within the ttl") {
    ManualClock clock;
    DedupStore store(std::chrono::minutes(5), clock.fn());
    REQUIRE(store.try_claim("m1"));
    clock.now += std::chrono::minutes(4);
    REQUIRE_FALSE(store.try_claim("m1"));
    REQUIRE(store.try_claim("m2"));
}

TEST_CASE("expired ids are evicted and can be claimed again") {
    ManualClock clock;
    DedupStore store(std::chrono::minutes(5), clock.fn());
    REQUIRE(store.try_claim("m1"));
    clock.now += std::chrono::minutes(5) + std::chrono::seconds(1);
    REQUIRE(store.try_claim("m1"));
    REQUIRE(store.size() == 1);
    REQUIRE_FALSE(store.try_claim("m1"));
}

TEST_CASE("claiming evicts stale entries first") {
    ManualClock clock;
    DedupStore store(std::chrono::seconds(10), clock.fn());
    REQUIRE(store.try_claim("a"));
    REQUIRE(store.try_claim("b"));
    clock.now += std::chrono::seconds(11);
    REQUIRE(store.try_claim("c"));
    REQUIRE(store.size() == 1);
}

TEST_CASE("concurrent claims of the same id succeed exactly once") {
    DedupStore store;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (store.try_claim("shared")) {
                ++winners;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(winners.load() == 1);
}
