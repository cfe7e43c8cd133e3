#include <gtest/gtest.h>
#include <engram/memory/classifier.hpp>
#include <engram/memory/store.hpp>
#include "test_support.hpp"

using namespace engram;
using namespace engram::testing_support;

namespace {

ClassificationSignals signals(double sim, double overlap = 0.0, int shared = 0, bool contradiction = false) {
    ClassificationSignals s;
    s.similarity = sim;
    s.keyword_overlap = overlap;
    s.shared_keywords = shared;
    s.contradiction = contradiction;
    return s;
}

} // anonymous namespace

// ============ decide_relationship ============

TEST(DecideRelationshipTest, ContradictionAboveUpdateThresholdUpdates) {
    RelationshipDecision d = decide_relationship(signals(0.8, 0.0, 0, true), ClassifierConfig());
    ASSERT_TRUE(d.has_edge);
    EXPECT_EQ(RelationshipKind::UPDATES, d.kind);
    EXPECT_DOUBLE_EQ(0.8, d.confidence);
    EXPECT_EQ("new information supersedes existing (similarity 0.80)", d.reason);
}

TEST(DecideRelationshipTest, ContradictionBelowUpdateThresholdExtends) {
    RelationshipDecision d = decide_relationship(signals(0.65, 0.0, 0, true), ClassifierConfig());
    ASSERT_TRUE(d.has_edge);
    EXPECT_EQ(RelationshipKind::EXTENDS, d.kind);
}

TEST(DecideRelationshipTest, HighSimilarityWithoutContradictionExtends) {
    RelationshipDecision d = decide_relationship(signals(0.9), ClassifierConfig());
    EXPECT_EQ(RelationshipKind::EXTENDS, d.kind);
    EXPECT_EQ("additional context for related topic (similarity 0.90)", d.reason);
}

TEST(DecideRelationshipTest, KeywordOverlapDerives) {
    RelationshipDecision d = decide_relationship(signals(0.4, 0.5, 3), ClassifierConfig());
    ASSERT_TRUE(d.has_edge);
    EXPECT_EQ(RelationshipKind::DERIVES, d.kind);
    EXPECT_DOUBLE_EQ(0.5, d.confidence);
    EXPECT_EQ("3 shared keywords (overlap 0.50)", d.reason);
}

TEST(DecideRelationshipTest, OverlapNeedsEnoughSharedKeywords) {
    RelationshipDecision d = decide_relationship(signals(0.4, 0.5, 1), ClassifierConfig());
    EXPECT_EQ(RelationshipKind::SIMILAR, d.kind);
    EXPECT_EQ("related content (similarity 0.40)", d.reason);
}

TEST(DecideRelationshipTest, BelowFloorHasNoEdge) {
    EXPECT_FALSE(decide_relationship(signals(0.29), ClassifierConfig()).has_edge);
    EXPECT_TRUE(decide_relationship(signals(0.30), ClassifierConfig()).has_edge);
}

TEST(DecideRelationshipTest, IdenticalContentIsSimilarNotUpdate) {
    ClassificationSignals s = signals(1.0, 1.0, 4, true);
    s.identical_content = true;
    RelationshipDecision d = decide_relationship(s, ClassifierConfig());
    EXPECT_EQ(RelationshipKind::SIMILAR, d.kind);
    EXPECT_EQ("identical content (similarity 1.00)", d.reason);
}

TEST(DecideRelationshipTest, ThresholdsComeFromConfig) {
    ClassifierConfig config;
    config.extend_threshold = 0.95;
    EXPECT_EQ(RelationshipKind::SIMILAR, decide_relationship(signals(0.9), config).kind);
}

// ============ Contradiction signals ============

TEST(ContradictionTest, CueWordsMatchWholeWords) {
    EXPECT_EQ("now", find_supersession_cue("I now work at Initech"));
    EXPECT_EQ("no longer", find_supersession_cue("She no longer lives there"));
    EXPECT_EQ("", find_supersession_cue("I know the answer"));
    EXPECT_EQ("", find_supersession_cue(""));
}

TEST(ContradictionTest, CueNeedsSharedContext) {
    std::vector<std::string> shared;
    EXPECT_FALSE(detect_contradiction("I now like tea", "The weather is nice", shared, false));
    EXPECT_TRUE(detect_contradiction("I now like tea", "I like coffee", shared, true));
    shared.push_back("like");
    EXPECT_TRUE(detect_contradiction("I now like tea", "I like coffee", shared, false));
}

TEST(ContradictionTest, DifferentNumbersContradict) {
    std::vector<std::string> shared;
    EXPECT_TRUE(detect_contradiction("The team has 12 people", "The team has 9 people", shared, false));
    EXPECT_FALSE(detect_contradiction("The team has 12 people", "Team size 12", shared, false));
    EXPECT_FALSE(detect_contradiction("The team has 12 people", "The team is large", shared, false));
}

TEST(ContradictionTest, ProgressWithNewCountDoesNotContradict) {
    std::vector<std::string> shared(1, "ai");
    EXPECT_FALSE(detect_contradiction("I completed 3 AI courses and built my first ML model",
                                      "I am learning AI and machine learning fundamentals", shared, false));
}

TEST(ContradictionTest, IdenticalTextNeverContradicts) {
    std::vector<std::string> shared(1, "work");
    EXPECT_FALSE(detect_contradiction("I now work at 3 places", "i now  work at 3 places", shared, true));
}

TEST(ContradictionTest, EntityOverlapIgnoresCase) {
    EntityMap a;
    EntityMap b;
    a[entity_category::ORGANIZATION].insert("TechCorp");
    b[entity_category::ORGANIZATION].insert("techcorp");
    EXPECT_TRUE(entities_overlap(a, b));

    EntityMap c;
    c[entity_category::PERSON].insert("TechCorp");
    EXPECT_FALSE(entities_overlap(a, c));
}

// ============ RelationshipClassifier ============

class ClassifierTest : public ::testing::Test {
protected:
    MemoryStore store;
    VectorIndex index;

    void SetUp() {
        ASSERT_TRUE(store.open(":memory:"));
        ASSERT_TRUE(store.ensure_schema());
    }

    void add(const Memory& m) {
        ASSERT_TRUE(store.insert_memory(m));
        index.insert(m);
    }
};

TEST_F(ClassifierTest, CandidatesSkipSelfSameDocumentAndOtherOwners) {
    Memory sibling = make_memory("sibling", "alice", vec(1, 0), T0);
    sibling.source_document_id = "doc-new";
    add(sibling);
    add(make_memory("near", "alice", vec(0.9f, 0.1f), T0));
    add(make_memory("cold", "alice", vec(0.8f, 0.6f), T0));
    ASSERT_TRUE(index.set_tier("cold", MemoryTier::COLD));
    add(make_memory("bob", "bob", vec(1, 0), T0));
    add(make_memory("unrelated", "alice", vec(0, 1), T0));

    Memory fresh = make_memory("new", "alice", vec(1, 0), T0 + 10);
    fresh.source_document_id = "doc-new";

    RelationshipClassifier classifier(store, index, ClassifierConfig());
    std::vector<VectorHit> hits = classifier.candidates(fresh);
    ASSERT_EQ(2u, hits.size());
    EXPECT_EQ("near", hits[0].entry->id);
    EXPECT_EQ("cold", hits[1].entry->id);
}

TEST_F(ClassifierTest, CandidateCountIsCapped) {
    for (int i = 0; i < 8; ++i) {
        add(make_memory("m" + std::to_string(i), "alice", vec(1, 0.1f * i), T0 + i));
    }
    ClassifierConfig config;
    config.max_candidates = 3;
    RelationshipClassifier classifier(store, index, config);
    EXPECT_EQ(3u, classifier.candidates(make_memory("new", "alice", vec(1, 0), T0 + 100)).size());
}

TEST_F(ClassifierTest, ClassifyBuildsDirectedEdges) {
    Memory old = make_memory("old", "alice", vec(1, 0), T0);
    old.content = "I work at TechCorp as an engineer";
    old.keywords.push_back("work");
    old.keywords.push_back("techcorp");
    old.keywords.push_back("engineer");
    add(old);

    Memory fresh = make_memory("new", "alice", vec(0.8f, 0.6f), T0 + 1000);
    fresh.content = "I now work at TechCorp as a manager";
    fresh.keywords.push_back("work");
    fresh.keywords.push_back("techcorp");
    fresh.keywords.push_back("manager");

    RelationshipClassifier classifier(store, index, ClassifierConfig());
    std::vector<Relationship> edges = classifier.classify(fresh);
    ASSERT_EQ(1u, edges.size());
    EXPECT_EQ("new", edges[0].from_id);
    EXPECT_EQ("old", edges[0].to_id);
    EXPECT_EQ("alice", edges[0].owner_id);
    EXPECT_EQ(RelationshipKind::UPDATES, edges[0].kind);
    EXPECT_NEAR(0.8, edges[0].confidence, 1e-6);
    EXPECT_EQ(T0 + 1000, edges[0].created_at);
    EXPECT_FALSE(edges[0].id.empty());
}

TEST_F(ClassifierTest, SignalsReportSharedKeywords) {
    Memory a = make_memory("a", "alice", vec(1), T0);
    Memory b = make_memory("b", "alice", vec(1), T0);
    a.keywords.push_back("rust");
    a.keywords.push_back("compiler");
    b.keywords.push_back("Rust");
    b.keywords.push_back("compiler");
    b.keywords.push_back("borrow");

    RelationshipClassifier classifier(store, index, ClassifierConfig());
    ClassificationSignals s = classifier.compute_signals(a, b, 0.5);
    EXPECT_EQ(2, s.shared_keywords);
    EXPECT_NEAR(2.0 / 3.0, s.keyword_overlap, 1e-9);
    EXPECT_FALSE(s.identical_content);
}
