// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace swaprelay::util;

// ============================================================================
// ThreadSafeMap Tests
// ============================================================================

TEST_CASE("ThreadSafeMap: Basic operations", "[util][threadsafe][map]") {
    ThreadSafeMap<int, std::string> map;

    SECTION("TryInsert and Read") {
        REQUIRE(map.TryInsert(1, "one"));
        std::string result;
        REQUIRE(map.Read(1, [&](const std::string& value) { result = value; }));
        REQUIRE(result == "one");
    }

    SECTION("TryInsert doesn't overwrite") {
        REQUIRE(map.TryInsert(1, "one"));
        REQUIRE(!map.TryInsert(1, "ONE"));
        REQUIRE(map.Get(1) == std::optional<std::string>("one"));
    }

    SECTION("Read and Get on missing key") {
        bool called = false;
        REQUIRE(!map.Read(42, [&](const std::string&) { called = true; }));
        REQUIRE(!called);
        REQUIRE(!map.Get(42).has_value());
        REQUIRE(!map.Contains(42));
    }

    SECTION("Modify in place") {
        map.TryInsert(1, "one");
        REQUIRE(map.Modify(1, [](std::string& value) { value += "!"; }));
        REQUIRE(map.Get(1) == std::optional<std::string>("one!"));
        REQUIRE(!map.Modify(2, [](std::string& value) { value.clear(); }));
    }

    SECTION("Erase") {
        map.TryInsert(1, "one");
        REQUIRE(map.Erase(1));
        REQUIRE(!map.Erase(1));
        REQUIRE(map.Empty());
    }

    SECTION("EraseIf honours the predicate") {
        map.TryInsert(1, "keep");
        REQUIRE(!map.EraseIf(1, [](const std::string& v) { return v == "drop"; }));
        REQUIRE(map.Contains(1));
        REQUIRE(map.EraseIf(1, [](const std::string& v) { return v == "keep"; }));
        REQUIRE(!map.Contains(1));
    }

    SECTION("Take removes and returns the value") {
        map.TryInsert(7, "seven");
        auto taken = map.Take(7);
        REQUIRE(taken.has_value());
        REQUIRE(*taken == "seven");
        REQUIRE(!map.Take(7).has_value());
        REQUIRE(map.Size() == 0);
    }
}

TEST_CASE("ThreadSafeMap: GetKeys snapshot", "[util][threadsafe][map]") {
    ThreadSafeMap<int, int, std::map> map;
    map.TryInsert(3, 30);
    map.TryInsert(1, 10);
    map.TryInsert(2, 20);

    auto keys = map.GetKeys();
    REQUIRE(keys == std::vector<int>{1, 2, 3});

    // Snapshot is detached from later changes
    map.Erase(2);
    REQUIRE(keys.size() == 3);
    REQUIRE(map.Size() == 2);
}

TEST_CASE("ThreadSafeMap: Concurrent access", "[util][threadsafe][map]") {
    ThreadSafeMap<int, int> map;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    SECTION("Concurrent inserts of disjoint keys") {
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&map, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    map.TryInsert(t * kPerThread + i, i);
                }
            });
        }
        for (auto& th : threads) th.join();
        REQUIRE(map.Size() == static_cast<size_t>(kThreads * kPerThread));
    }

    SECTION("Only one thread wins a contested insert") {
        std::atomic<int> winners{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&map, &winners, t]() {
                if (map.TryInsert(0, t)) {
                    winners.fetch_add(1);
                }
            });
        }
        for (auto& th : threads) th.join();
        REQUIRE(winners.load() == 1);
        REQUIRE(map.Size() == 1);
    }

    SECTION("Concurrent modifications are serialized") {
        map.TryInsert(0, 0);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&map]() {
                for (int i = 0; i < kPerThread; ++i) {
                    map.Modify(0, [](int& v) { ++v; });
                }
            });
        }
        for (auto& th : threads) th.join();
        REQUIRE(map.Get(0) == std::optional<int>(kThreads * kPerThread));
    }
}
