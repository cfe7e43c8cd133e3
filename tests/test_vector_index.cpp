#include <gtest/gtest.h>
#include <engram/memory/vector_index.hpp>
#include "test_support.hpp"

using namespace engram;
using namespace engram::testing_support;

TEST(CosineTest, BasicValues) {
    EXPECT_NEAR(1.0, cosine_similarity(vec(1, 2, 3), vec(2, 4, 6)), 1e-6);
    EXPECT_NEAR(0.0, cosine_similarity(vec(1, 0), vec(0, 1)), 1e-6);
    EXPECT_NEAR(-1.0, cosine_similarity(vec(1, 0), vec(-1, 0)), 1e-6);
    EXPECT_NEAR(0.8, cosine_similarity(vec(1, 0), vec(0.8f, 0.6f)), 1e-6);
}

TEST(CosineTest, DegenerateInputsScoreZero) {
    EXPECT_EQ(0.0, cosine_similarity(vec(0, 0, 0, 0), vec(1, 0)));
    std::vector<float> shorter(2, 1.0f);
    EXPECT_EQ(0.0, cosine_similarity(vec(1, 1), shorter));
    EXPECT_EQ(0.0, cosine_similarity(std::vector<float>(), std::vector<float>()));
}

class VectorIndexTest : public ::testing::Test {
protected:
    VectorIndex index;

    void add(const std::string& id, const std::string& owner, const std::vector<float>& v,
             int64_t created, MemoryTier tier = MemoryTier::HOT) {
        Memory m = make_memory(id, owner, v, created);
        m.tier = tier;
        index.insert(m);
    }
};

TEST_F(VectorIndexTest, NearestIsSortedAndFloored) {
    add("exact", "alice", vec(1, 0), T0);
    add("close", "alice", vec(0.8f, 0.6f), T0);
    add("far", "alice", vec(0, 1), T0);
    add("other-owner", "bob", vec(1, 0), T0);

    std::vector<VectorHit> hits = index.partition("alice")->nearest(vec(1, 0), 10, 0.3, MemoryTier::HOT, EntryFilter());
    ASSERT_EQ(2u, hits.size());
    EXPECT_EQ("exact", hits[0].entry->id);
    EXPECT_EQ("close", hits[1].entry->id);
    EXPECT_NEAR(0.8, hits[1].similarity, 1e-6);
}

TEST_F(VectorIndexTest, TiesBreakTowardsNewer) {
    add("old", "alice", vec(1, 0), T0);
    add("new", "alice", vec(1, 0), T0 + 1000);

    std::vector<VectorHit> hits = index.partition("alice")->nearest(vec(1, 0), 1, 0.0, MemoryTier::HOT, EntryFilter());
    ASSERT_EQ(1u, hits.size());
    EXPECT_EQ("new", hits[0].entry->id);
}

TEST_F(VectorIndexTest, FilterAndTierAreRespected) {
    add("hot", "alice", vec(1, 0), T0);
    add("cold", "alice", vec(1, 0), T0, MemoryTier::COLD);

    OwnerPartitionPtr part = index.partition("alice");
    EXPECT_EQ(1u, part->count(MemoryTier::HOT));
    EXPECT_EQ(1u, part->count(MemoryTier::COLD));

    std::vector<VectorHit> cold = part->nearest(vec(1, 0), 10, 0.0, MemoryTier::COLD, EntryFilter());
    ASSERT_EQ(1u, cold.size());
    EXPECT_EQ("cold", cold[0].entry->id);

    EntryFilter none = [](const IndexEntry& e) { return e.id != "hot"; };
    EXPECT_TRUE(part->nearest(vec(1, 0), 10, 0.0, MemoryTier::HOT, none).empty());
}

TEST_F(VectorIndexTest, MoveBetweenTiers) {
    add("m", "alice", vec(1, 0), T0);
    EXPECT_FALSE(index.set_tier("m", MemoryTier::HOT));
    EXPECT_TRUE(index.set_tier("m", MemoryTier::COLD));
    EXPECT_EQ(MemoryTier::COLD, index.find("m")->current_tier());
    EXPECT_EQ(0u, index.partition("alice")->count(MemoryTier::HOT));
    EXPECT_FALSE(index.set_tier("missing", MemoryTier::COLD));
}

TEST_F(VectorIndexTest, EntryStateFlowsBackToMemory) {
    add("m", "alice", vec(1, 0), T0);
    IndexEntryPtr entry = index.find("m");
    ASSERT_TRUE(entry.get() != NULL);
    entry->access_count += 3;
    entry->is_latest = false;
    entry->version = 2;

    Memory m;
    entry->apply_to(m);
    EXPECT_EQ(3, m.access_count);
    EXPECT_FALSE(m.is_latest);
    EXPECT_EQ(2, m.version);
}

TEST_F(VectorIndexTest, DropOwner) {
    add("a", "alice", vec(1, 0), T0);
    add("b", "bob", vec(1, 0), T0);
    EXPECT_EQ(2u, index.size());

    index.drop_owner("alice");
    EXPECT_EQ(1u, index.size());
    EXPECT_TRUE(index.find("a").get() == NULL);
    EXPECT_TRUE(index.find_partition("alice").get() == NULL);
    ASSERT_EQ(1u, index.owners().size());
    EXPECT_EQ("bob", index.owners()[0]);
}
