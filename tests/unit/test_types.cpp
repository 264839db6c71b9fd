/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace fleet_usage;

TEST(SnapshotTest, CoreCountFollowsPerCoreReadings) {
    Snapshot snap;
    EXPECT_EQ(snap.core_count(), 0u);
    snap.per_core_percent = {1.0f, 2.0f, 3.0f};
    EXPECT_EQ(snap.core_count(), 3u);
}

TEST(ClusterSnapshotTest, CoreCountSumsEntries) {
    ClusterSnapshot cluster;
    cluster.entries.push_back({.identity = {.hostname = "a"},
                               .snapshot = {.per_core_percent = {0.0f, 0.0f}}});
    cluster.entries.push_back({.identity = {.hostname = "b"},
                               .snapshot = {.per_core_percent = {0.0f, 0.0f, 0.0f, 0.0f}}});
    EXPECT_EQ(cluster.core_count(), 6u);
}

TEST(ClusterSnapshotTest, TimeFromTimestamp) {
    ClusterSnapshot cluster;
    cluster.timestamp = 1700000000;
    EXPECT_EQ(std::chrono::system_clock::to_time_t(cluster.time()), 1700000000);
}

TEST(OwnerKindTest, ToString) {
    EXPECT_EQ(to_string(OwnerKind::Member), "member");
    EXPECT_EQ(to_string(OwnerKind::Student), "student");
    EXPECT_EQ(to_string(OwnerKind::Reserved), "reserved");
    EXPECT_EQ(to_string(OwnerKind::Unowned), "unowned");
}

TEST(SampleTest, Equality) {
    Sample a{"python", "ann", 55.0f};
    Sample b{"python", "ann", 55.0f};
    Sample c{"python", "bob", 55.0f};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
