#include "sharded_map.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using int_map = xchain::sharded_map<int, std::string>;

TEST(sharded_map, try_insert_rejects_existing_key) {
    int_map map(4);

    EXPECT_TRUE(map.try_insert(1, "a"));
    EXPECT_FALSE(map.try_insert(1, "b"));
    EXPECT_EQ(map.get(1), std::optional<std::string>("a"));
    EXPECT_EQ(map.size(), 1u);
}

TEST(sharded_map, insert_at_epoch_fails_after_removal) {
    int_map map(1);
    map.try_insert(1, "gone");

    auto epoch = map.removal_epoch(2);
    EXPECT_TRUE(map.remove_if(1, [](const std::string&) { return true; }));
    EXPECT_EQ(map.removal_epoch(2), epoch + 1);

    EXPECT_FALSE(map.try_insert_at_epoch(2, "stale", epoch));
    EXPECT_FALSE(map.contains(2));

    EXPECT_TRUE(map.try_insert_at_epoch(2, "fresh", map.removal_epoch(2)));
    EXPECT_FALSE(map.try_insert_at_epoch(2, "again", map.removal_epoch(2)));
    EXPECT_EQ(map.get(2), std::optional<std::string>("fresh"));
}

TEST(sharded_map, failed_remove_keeps_epoch) {
    int_map map(4);
    map.try_insert(1, "keep");
    auto epoch = map.removal_epoch(1);

    EXPECT_FALSE(map.remove_if(1, [](const std::string&) { return false; }));
    EXPECT_FALSE(map.remove_if(9, [](const std::string&) { return true; }));
    EXPECT_EQ(map.removal_epoch(1), epoch);
}

TEST(sharded_map, alter_if_present_skips_missing) {
    int_map map(4);

    EXPECT_FALSE(map.alter_if_present(3, [](std::string& v) { v = "changed"; }));
    EXPECT_FALSE(map.contains(3));

    map.try_insert(3, "orig");
    EXPECT_TRUE(map.alter_if_present(3, [](std::string& v) { v = "changed"; }));
    EXPECT_EQ(map.get(3), std::optional<std::string>("changed"));
}

TEST(sharded_map, remove_if_checks_predicate) {
    int_map map(4);
    map.try_insert(1, "keep");

    EXPECT_FALSE(map.remove_if(1, [](const std::string& v) { return v == "other"; }));
    EXPECT_TRUE(map.contains(1));

    EXPECT_TRUE(map.remove_if(1, [](const std::string& v) { return v == "keep"; }));
    EXPECT_FALSE(map.contains(1));

    EXPECT_FALSE(map.remove_if(1, [](const std::string&) { return true; }));
}

TEST(sharded_map, snapshot_visits_every_entry) {
    int_map map(8);
    for (int i = 0; i < 100; ++i) map.try_insert(i, std::to_string(i));

    int visited = 0;
    int sum = 0;
    map.for_each_snapshot([&](int k, const std::string& v) {
        ++visited;
        sum += k;
        EXPECT_EQ(v, std::to_string(k));
    });

    EXPECT_EQ(visited, 100);
    EXPECT_EQ(sum, 99 * 100 / 2);
}

TEST(sharded_map, snapshot_callback_may_write_to_map) {
    int_map map(2);
    map.try_insert(1, "a");
    map.try_insert(2, "b");

    // fn runs unlocked, so mutating the map from it must not deadlock
    map.for_each_snapshot([&](int k, const std::string&) {
        map.alter_if_present(k, [](std::string& v) { v += "!"; });
    });

    EXPECT_EQ(map.get(1), std::optional<std::string>("a!"));
    EXPECT_EQ(map.get(2), std::optional<std::string>("b!"));
}

TEST(sharded_map, zero_shards_falls_back_to_one) {
    int_map map(0);
    EXPECT_EQ(map.shard_count(), 1u);
    EXPECT_TRUE(map.try_insert(1, "a"));
}

TEST(sharded_map, concurrent_updates_on_same_key_are_serialized) {
    xchain::sharded_map<int, int> map(16);
    constexpr int threads = 8;
    constexpr int per_thread = 1000;

    auto increment = [&](int key) {
        while (!map.alter_if_present(key, [](int& v) { ++v; })) {
            map.try_insert(key, 0);
        }
    };

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < per_thread; ++i) {
                increment(42);
                increment(i);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(map.get(42), std::optional<int>(threads * per_thread + threads));
    EXPECT_EQ(map.get(7), std::optional<int>(threads));
}
