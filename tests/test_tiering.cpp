#include <gtest/gtest.h>
#include <engram/memory/tiering.hpp>
#include <engram/memory/store.hpp>
#include "test_support.hpp"

using namespace engram;
using namespace engram::testing_support;

class TieringTest : public ::testing::Test {
protected:
    MemoryStore store;
    VectorIndex index;
    ManualClock clock;

    void SetUp() {
        ASSERT_TRUE(store.open(":memory:"));
        ASSERT_TRUE(store.ensure_schema());
    }

    void add(const std::string& id, int64_t created_at, MemoryTier tier) {
        Memory m = make_memory(id, "alice", vec(1, 0), created_at);
        m.tier = tier;
        ASSERT_TRUE(store.insert_memory(m));
        index.insert(m);
    }
};

TEST_F(TieringTest, ClassifyByAgeAndAccess) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    int64_t now = T0 + 100 * MS_PER_DAY;

    EXPECT_EQ(MemoryTier::HOT, tiering.classify(now - 30 * MS_PER_DAY, 0, now));
    EXPECT_EQ(MemoryTier::COLD, tiering.classify(now - 30 * MS_PER_DAY - 1, 0, now));
    EXPECT_EQ(MemoryTier::COLD, tiering.classify(T0, 4, now));
    EXPECT_EQ(MemoryTier::HOT, tiering.classify(T0, 5, now));
}

TEST_F(TieringTest, DisabledTieringKeepsEverythingHot) {
    TieringConfig config;
    config.enabled = false;
    TieringManager tiering(store, index, config, clock.fn());
    EXPECT_EQ(MemoryTier::HOT, tiering.classify(0, 0, T0));
}

TEST_F(TieringTest, AccessPromotesAtThreshold) {
    add("m", T0 - 40 * MS_PER_DAY, MemoryTier::COLD);
    TieringManager tiering(store, index, TieringConfig(), clock.fn());

    for (int i = 0; i < 4; ++i) {
        clock.advance_ms(10);
        ASSERT_TRUE(tiering.on_access("m"));
    }
    EXPECT_EQ(MemoryTier::COLD, index.find("m")->current_tier());

    clock.advance_ms(10);
    ASSERT_TRUE(tiering.on_access("m"));
    EXPECT_EQ(MemoryTier::HOT, index.find("m")->current_tier());
    EXPECT_EQ(5, index.find("m")->access_count.load());
    EXPECT_EQ(clock.now(), index.find("m")->last_accessed_at.load());

    Memory stored;
    ASSERT_TRUE(store.get_memory("m", stored));
    EXPECT_EQ(MemoryTier::HOT, stored.tier);
    EXPECT_EQ(5, stored.access_count);
    EXPECT_EQ(clock.now(), stored.last_accessed_at);
}

TEST_F(TieringTest, AccessToUnknownMemoryFails) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    EXPECT_FALSE(tiering.on_access("missing"));
}

TEST_F(TieringTest, RebalanceDemotesAgedMemories) {
    add("old", T0, MemoryTier::HOT);
    add("young", T0 + 35 * MS_PER_DAY, MemoryTier::HOT);
    TieringManager tiering(store, index, TieringConfig(), clock.fn());

    clock.advance_days(40);
    RebalanceReport report = tiering.rebalance();
    EXPECT_EQ(1, report.demoted);
    EXPECT_EQ(0, report.promoted);
    EXPECT_EQ(MemoryTier::COLD, index.find("old")->current_tier());
    EXPECT_EQ(MemoryTier::HOT, index.find("young")->current_tier());

    Memory stored;
    ASSERT_TRUE(store.get_memory("old", stored));
    EXPECT_EQ(MemoryTier::COLD, stored.tier);

    TierStats stats = tiering.tier_stats("alice");
    EXPECT_EQ(1, stats.hot);
    EXPECT_EQ(1, stats.cold);
    EXPECT_EQ(2, stats.total);
    EXPECT_DOUBLE_EQ(50.0, stats.hot_percent);

    EXPECT_EQ(0, tiering.rebalance().demoted);
}

TEST_F(TieringTest, RebalancePromotesFrequentlyAccessed) {
    Memory m = make_memory("m", "alice", vec(1, 0), T0 - 90 * MS_PER_DAY);
    m.tier = MemoryTier::COLD;
    m.access_count = 7;
    ASSERT_TRUE(store.insert_memory(m));
    index.insert(m);

    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    EXPECT_EQ(1, tiering.rebalance().promoted);
    EXPECT_EQ(MemoryTier::HOT, index.find("m")->current_tier());
}

TEST_F(TieringTest, StatsForUnknownOwnerAreEmpty) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    TierStats stats = tiering.tier_stats("nobody");
    EXPECT_EQ(0, stats.total);
    EXPECT_DOUBLE_EQ(0.0, stats.hot_percent);
}

TEST_F(TieringTest, SchedulerStopsPromptly) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RebalanceScheduler scheduler(tiering, 3600);
    EXPECT_FALSE(scheduler.is_running());

    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());
    scheduler.stop();
    EXPECT_FALSE(scheduler.is_running());
    EXPECT_EQ(0, scheduler.runs());
}
