#include <gtest/gtest.h>
#include <engram/memory/store.hpp>
#include "test_support.hpp"
#include <future>
#include <thread>

using namespace engram;
using namespace engram::testing_support;

class StoreTest : public ::testing::Test {
protected:
    MemoryStore store;

    void SetUp() {
        ASSERT_TRUE(store.open(":memory:"));
        ASSERT_TRUE(store.ensure_schema());
        ASSERT_TRUE(store.check_dimensions(4));
    }

    Relationship edge(const std::string& from, const std::string& to, RelationshipKind kind) {
        Relationship r;
        r.id = generate_uuid();
        r.owner_id = "alice";
        r.from_id = from;
        r.to_id = to;
        r.kind = kind;
        r.confidence = 0.8;
        r.similarity = 0.8;
        r.reason = "test";
        r.created_at = T0;
        return r;
    }
};

TEST_F(StoreTest, InsertAndGetMemory) {
    Memory m = make_memory("m1", "alice", vec(0.1f, 0.2f, 0.3f, 0.4f), T0);
    m.keywords.push_back("techcorp");
    m.keywords.push_back("engineer");
    m.entities[entity_category::ORGANIZATION].insert("TechCorp");
    m.chunk_index = 2;
    m.title = "notes";
    ASSERT_TRUE(store.insert_memory(m));

    Memory out;
    ASSERT_TRUE(store.get_memory("m1", out));
    EXPECT_EQ("alice", out.owner_id);
    EXPECT_EQ(m.content, out.content);
    EXPECT_EQ(m.embedding, out.embedding);
    EXPECT_EQ(m.keywords, out.keywords);
    EXPECT_EQ(1u, out.entities[entity_category::ORGANIZATION].count("TechCorp"));
    EXPECT_EQ(T0, out.created_at);
    EXPECT_TRUE(out.is_latest);
    EXPECT_EQ(MemoryTier::HOT, out.tier);
    EXPECT_EQ(2, out.chunk_index);
    EXPECT_EQ("notes", out.title);

    EXPECT_FALSE(store.get_memory("missing", out));
    EXPECT_EQ(1, store.count_memories("alice"));
    EXPECT_EQ(0, store.count_memories("bob"));
}

TEST_F(StoreTest, DimensionsAreFixedPerDatabase) {
    EXPECT_TRUE(store.check_dimensions(4));
    EXPECT_FALSE(store.check_dimensions(8));
    EXPECT_NE(std::string::npos, store.last_error().find("4-dimensional"));
}

TEST_F(StoreTest, EmbeddingBlobIsLittleEndianFloat32) {
    std::vector<float> v;
    v.push_back(1.0f);
    v.push_back(-2.5f);
    std::string blob = MemoryStore::encode_embedding(v);
    ASSERT_EQ(8u, blob.size());
    // 1.0f = 0x3F800000
    EXPECT_EQ(static_cast<char>(0x00), blob[0]);
    EXPECT_EQ(static_cast<char>(0x80), blob[2]);
    EXPECT_EQ(static_cast<char>(0x3F), blob[3]);

    std::vector<float> back;
    ASSERT_TRUE(MemoryStore::decode_embedding(blob.data(), static_cast<int>(blob.size()), back));
    EXPECT_EQ(v, back);
    EXPECT_FALSE(MemoryStore::decode_embedding(blob.data(), 7, back));
}

TEST_F(StoreTest, UndecodableRowsAreSkippedOnLoad) {
    ASSERT_TRUE(store.insert_memory(make_memory("good", "alice", vec(1, 0, 0, 0), T0)));
    Memory bad = make_memory("bad", "alice", vec(1, 0, 0, 0), T0);
    bad.embedding.push_back(1.0f);
    ASSERT_TRUE(store.insert_memory(bad));

    size_t skipped = 0;
    std::vector<Memory> all = store.load_all_memories(skipped);
    ASSERT_EQ(1u, all.size());
    EXPECT_EQ("good", all[0].id);
    EXPECT_EQ(1u, skipped);

    Memory out;
    EXPECT_FALSE(store.get_memory("bad", out));
}

TEST_F(StoreTest, AccessCountersNeverGoBackwards) {
    ASSERT_TRUE(store.insert_memory(make_memory("m1", "alice", vec(1), T0)));
    ASSERT_TRUE(store.update_access("m1", 5, T0 + 100));
    ASSERT_TRUE(store.update_access("m1", 3, T0 + 50));

    Memory out;
    ASSERT_TRUE(store.get_memory("m1", out));
    EXPECT_EQ(5, out.access_count);
    EXPECT_EQ(T0 + 100, out.last_accessed_at);

    ASSERT_TRUE(store.update_tier("m1", MemoryTier::COLD));
    ASSERT_TRUE(store.get_memory("m1", out));
    EXPECT_EQ(MemoryTier::COLD, out.tier);
}

TEST_F(StoreTest, OneEdgePerKindAndPair) {
    ASSERT_TRUE(store.insert_memory(make_memory("a", "alice", vec(1), T0)));
    ASSERT_TRUE(store.insert_memory(make_memory("b", "alice", vec(1), T0 + 1)));

    ASSERT_TRUE(store.insert_relationship(edge("b", "a", RelationshipKind::UPDATES)));
    EXPECT_FALSE(store.insert_relationship(edge("b", "a", RelationshipKind::UPDATES)));
    EXPECT_TRUE(store.insert_relationship(edge("b", "a", RelationshipKind::SIMILAR)));
    EXPECT_TRUE(store.insert_relationship(edge("a", "b", RelationshipKind::UPDATES)));

    EXPECT_TRUE(store.has_relationship("b", "a", RelationshipKind::UPDATES));
    EXPECT_FALSE(store.has_relationship("b", "a", RelationshipKind::EXTENDS));
    EXPECT_EQ(3u, store.relationships_for("a").size());

    std::map<std::string, int64_t> counts = store.relationship_kind_counts("alice");
    EXPECT_EQ(2, counts["updates"]);
    EXPECT_EQ(1, counts["similar"]);
}

TEST_F(StoreTest, SupersedeChecksVersion) {
    ASSERT_TRUE(store.insert_memory(make_memory("a", "alice", vec(1), T0)));

    EXPECT_EQ(ErrorCode::CONCURRENCY_CONFLICT, store.mark_superseded("a", 7));
    EXPECT_EQ(ErrorCode::NONE, store.mark_superseded("a", 0));

    int64_t version = -1;
    bool latest = true;
    ASSERT_TRUE(store.get_version("a", version, latest));
    EXPECT_EQ(1, version);
    EXPECT_FALSE(latest);

    EXPECT_EQ(ErrorCode::CONCURRENCY_CONFLICT, store.mark_superseded("a", 0));
    EXPECT_EQ(ErrorCode::NOT_FOUND, store.mark_superseded("nope", 0));
}

TEST_F(StoreTest, LastErrorIsKeptPerThread) {
    ASSERT_TRUE(store.insert_memory(make_memory("a", "alice", vec(1), T0)));

    std::promise<void> first_failed;
    std::promise<void> second_done;
    std::shared_future<void> second_done_future = second_done.get_future().share();
    std::string first_error;
    std::string second_error;

    std::thread first([&]() {
        if (!store.check_dimensions(8)) {
            first_failed.set_value();
            second_done_future.wait();
            first_error = store.last_error();
        } else {
            first_failed.set_value();
        }
    });
    first_failed.get_future().wait();

    std::thread second([&]() {
        if (store.mark_superseded("a", 7) == ErrorCode::CONCURRENCY_CONFLICT) {
            second_error = store.last_error();
        }
    });
    second.join();
    second_done.set_value();
    first.join();

    EXPECT_NE(std::string::npos, first_error.find("4-dimensional"));
    EXPECT_NE(std::string::npos, second_error.find("version conflict"));
}

TEST_F(StoreTest, TransactionRollsBackUnlessCommitted) {
    {
        StoreTransaction tx(store);
        ASSERT_TRUE(tx.active());
        ASSERT_TRUE(store.insert_memory(make_memory("a", "alice", vec(1), T0)));
    }
    Memory out;
    EXPECT_FALSE(store.get_memory("a", out));

    {
        StoreTransaction tx(store);
        ASSERT_TRUE(store.insert_memory(make_memory("a", "alice", vec(1), T0)));
        ASSERT_TRUE(tx.commit());
    }
    EXPECT_TRUE(store.get_memory("a", out));
}

TEST_F(StoreTest, DocumentsRoundTrip) {
    Document doc;
    doc.id = "d1";
    doc.owner_id = "alice";
    doc.title = "journal";
    doc.raw_content = "text";
    doc.created_at = T0;
    doc.updated_at = T0;
    ASSERT_TRUE(store.insert_document(doc));
    EXPECT_FALSE(store.insert_document(doc));

    doc.status = DocumentStatus::FAILED;
    doc.error_message = "embedding unavailable";
    doc.memory_ids.push_back("m1");
    doc.processed_at = T0 + 5;
    ASSERT_EQ(ErrorCode::NONE, store.update_document(doc));

    Document out;
    ASSERT_TRUE(store.get_document("d1", out));
    EXPECT_EQ(DocumentStatus::FAILED, out.status);
    EXPECT_EQ("embedding unavailable", out.error_message);
    ASSERT_EQ(1u, out.memory_ids.size());
    EXPECT_EQ("m1", out.memory_ids[0]);
    EXPECT_EQ(T0 + 5, out.processed_at);
    EXPECT_EQ(1u, store.list_documents("alice").size());
}

TEST_F(StoreTest, UpdateNeverRecreatesDeletedDocument) {
    Document doc;
    doc.id = "d1";
    doc.owner_id = "alice";
    doc.raw_content = "text";
    doc.created_at = T0;
    ASSERT_TRUE(store.insert_document(doc));

    ClearReport report;
    ASSERT_TRUE(store.delete_owner("alice", report));

    doc.status = DocumentStatus::EMBEDDING;
    EXPECT_EQ(ErrorCode::NOT_FOUND, store.update_document(doc));
    Document out;
    EXPECT_FALSE(store.get_document("d1", out));
    EXPECT_TRUE(store.list_documents("alice").empty());
}

TEST_F(StoreTest, UnfinishedDocumentsExcludeTerminalOnes) {
    const DocumentStatus statuses[] = {
        DocumentStatus::QUEUED, DocumentStatus::INDEXING, DocumentStatus::DONE, DocumentStatus::FAILED
    };
    for (int i = 0; i < 4; ++i) {
        Document doc;
        doc.id = "d" + std::to_string(i);
        doc.owner_id = i % 2 == 0 ? "alice" : "bob";
        doc.raw_content = "text";
        doc.status = statuses[i];
        doc.created_at = T0 + i;
        ASSERT_TRUE(store.insert_document(doc));
    }

    std::vector<Document> unfinished = store.list_unfinished_documents();
    ASSERT_EQ(2u, unfinished.size());
    EXPECT_EQ("d0", unfinished[0].id);
    EXPECT_EQ("d1", unfinished[1].id);
}

TEST_F(StoreTest, DeleteOwnerLeavesOthersAlone) {
    ASSERT_TRUE(store.insert_memory(make_memory("a", "alice", vec(1), T0)));
    ASSERT_TRUE(store.insert_memory(make_memory("b", "alice", vec(1), T0)));
    ASSERT_TRUE(store.insert_memory(make_memory("c", "bob", vec(1), T0)));
    ASSERT_TRUE(store.insert_relationship(edge("b", "a", RelationshipKind::EXTENDS)));

    ClearReport report;
    ASSERT_TRUE(store.delete_owner("alice", report));
    EXPECT_EQ(2, report.memories);
    EXPECT_EQ(1, report.relationships);
    EXPECT_EQ(0, store.count_memories("alice"));
    EXPECT_EQ(1, store.count_memories("bob"));
}
