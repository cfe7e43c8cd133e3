#include <gtest/gtest.h>
#include <engram/memory/ranking.hpp>
#include <engram/memory/store.hpp>
#include <engram/memory/tiering.hpp>
#include "test_support.hpp"
#include <cmath>

using namespace engram;
using namespace engram::testing_support;

TEST(RankingMathTest, DecayHalvesEveryHalfLifeScaled) {
    EXPECT_DOUBLE_EQ(1.0, time_decay(0.0, 90.0));
    EXPECT_NEAR(std::exp(-1.0), time_decay(90.0, 90.0), 1e-12);
    EXPECT_NEAR(0.108, 0.8 * time_decay(180.0, 90.0), 1e-3);
    EXPECT_DOUBLE_EQ(1.0, time_decay(-5.0, 90.0));
    EXPECT_DOUBLE_EQ(1.0, time_decay(10.0, 0.0));
}

TEST(RankingMathTest, Explanations) {
    EXPECT_EQ("High semantic similarity (0.91)", explain_score(0.91, 0.0, false, true));
    EXPECT_EQ("Good semantic match (0.70)", explain_score(0.70, 0.0, false, true));
    EXPECT_EQ("Moderate relevance (0.40); older version", explain_score(0.40, 0.0, false, false));
    EXPECT_EQ("High semantic similarity (0.90); keyword match (0.50)", explain_score(0.9, 0.5, true, true));
    EXPECT_EQ("Good semantic match (0.65)", explain_score(0.65, 0.0, true, true));
}

TEST(RankingMathTest, SortIsStableOnScoreThenNewest) {
    std::vector<ScoredMemory> results(3);
    results[0].score = 0.5;
    results[0].memory.id = "older";
    results[0].memory.created_at = T0;
    results[1].score = 0.9;
    results[1].memory.id = "best";
    results[2].score = 0.5;
    results[2].memory.id = "newer";
    results[2].memory.created_at = T0 + 1;

    sort_by_score(results);
    EXPECT_EQ("best", results[0].memory.id);
    EXPECT_EQ("newer", results[1].memory.id);
    EXPECT_EQ("older", results[2].memory.id);
}

class RankingTest : public ::testing::Test {
protected:
    MemoryStore store;
    VectorIndex index;
    ScriptedEmbeddingProvider embedder;
    ManualClock clock;

    RankingTest() : embedder(4) {}

    void SetUp() {
        ASSERT_TRUE(store.open(":memory:"));
        ASSERT_TRUE(store.ensure_schema());
        embedder.set("query", vec(1, 0));
    }

    void add(const Memory& m) {
        ASSERT_TRUE(store.insert_memory(m));
        index.insert(m);
    }
};

TEST_F(RankingTest, RecencyBreaksEqualSimilarity) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());

    SearchOptions options;
    int64_t now = T0 + 100 * MS_PER_DAY;
    ScoredMemory fresh = ranking.score(make_memory("a", "alice", vec(1), now - MS_PER_DAY), 0.8, options, now);
    ScoredMemory stale = ranking.score(make_memory("b", "alice", vec(1), now - 60 * MS_PER_DAY), 0.8, options, now);
    EXPECT_GT(fresh.score, stale.score);
    EXPECT_NEAR(0.8 * std::exp(-60.0 / 90.0), stale.score, 1e-9);
}

TEST_F(RankingTest, KeywordFilterBlendsScores) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());

    Memory m = make_memory("a", "alice", vec(1), T0);
    m.keywords.push_back("python");
    m.keywords.push_back("django");

    SearchOptions options;
    options.keyword_filter.push_back("Python");
    options.semantic_weight = 0.5;
    ScoredMemory s = ranking.score(m, 0.6, options, T0);
    EXPECT_DOUBLE_EQ(0.5, s.keyword_score);
    EXPECT_NEAR(0.55, s.score, 1e-12);
    EXPECT_EQ("Good semantic match (0.60); keyword match (0.50)", s.explanation);
}

TEST_F(RankingTest, SearchValidatesInput) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());
    SearchOptions options;

    EXPECT_EQ(ErrorCode::VALIDATION_FAILURE, ranking.search("", "query", options).code);
    EXPECT_EQ(ErrorCode::VALIDATION_FAILURE, ranking.search("alice", "   ", options).code);
    options.limit = 201;
    EXPECT_EQ(ErrorCode::VALIDATION_FAILURE, ranking.search("alice", "query", options).code);
    options.limit = -1;
    EXPECT_EQ(ErrorCode::VALIDATION_FAILURE, ranking.search("alice", "query", options).code);
}

TEST_F(RankingTest, UnknownOwnerHasNoResults) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());
    SearchResult r = ranking.search("nobody", "query", SearchOptions());
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.results.empty());
}

TEST_F(RankingTest, EmbeddingFailureIsReported) {
    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());
    embedder.fail_next(1, ErrorCode::EXTERNAL_FAILURE);
    SearchResult r = ranking.search("alice", "query", SearchOptions());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::EXTERNAL_FAILURE, r.code);
}

TEST_F(RankingTest, SearchFiltersAndCountsAccess) {
    add(make_memory("close", "alice", vec(0.9f, 0.1f), T0));
    Memory old = make_memory("superseded", "alice", vec(1, 0), T0);
    old.is_latest = false;
    add(old);
    add(make_memory("bob", "bob", vec(1, 0), T0));

    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());

    SearchResult latest = ranking.search("alice", "query", SearchOptions());
    ASSERT_TRUE(latest.success);
    ASSERT_EQ(1u, latest.results.size());
    EXPECT_EQ("close", latest.results[0].memory.id);
    EXPECT_EQ(1, latest.results[0].memory.access_count);
    EXPECT_EQ(1, index.find("close")->access_count.load());

    SearchOptions all;
    all.only_latest = false;
    SearchResult every = ranking.search("alice", "query", all);
    ASSERT_EQ(2u, every.results.size());
    EXPECT_EQ("superseded", every.results[0].memory.id);
    EXPECT_NE(std::string::npos, every.results[0].explanation.find("older version"));
}

TEST_F(RankingTest, HotOnlySkipsColdTier) {
    Memory cold = make_memory("cold", "alice", vec(1, 0), T0 - 60 * MS_PER_DAY);
    cold.tier = MemoryTier::COLD;
    add(cold);

    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());

    SearchOptions options;
    options.hot_only = true;
    EXPECT_TRUE(ranking.search("alice", "query", options).results.empty());

    options.hot_only = false;
    SearchResult r = ranking.search("alice", "query", options);
    ASSERT_EQ(1u, r.results.size());
    EXPECT_EQ("cold", r.results[0].memory.id);
}

TEST_F(RankingTest, TimelineIsOldestFirst) {
    Memory first = make_memory("first", "alice", vec(0.7f, 0.3f), T0);
    first.is_latest = false;
    add(first);
    add(make_memory("second", "alice", vec(1, 0), T0 + MS_PER_DAY));

    TieringManager tiering(store, index, TieringConfig(), clock.fn());
    RankingEngine ranking(store, index, embedder, tiering, SearchConfig(), clock.fn());
    clock.advance_days(2);

    SearchResult r = ranking.timeline("alice", "query");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(2u, r.results.size());
    EXPECT_EQ("first", r.results[0].memory.id);
    EXPECT_EQ("second", r.results[1].memory.id);
}
