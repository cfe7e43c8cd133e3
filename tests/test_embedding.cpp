#include <gtest/gtest.h>
#include <engram/providers/embedding.hpp>
#include <engram/providers/http_embedding.hpp>
#include <engram/memory/vector_index.hpp>
#include "test_support.hpp"
#include <cmath>

using namespace engram;
using namespace engram::testing_support;

TEST(HashingEmbeddingTest, DeterministicAndNormalised) {
    HashingEmbeddingProvider provider(64);
    EmbeddingResult a = provider.embed("I work as a Software Engineer at TechCorp");
    EmbeddingResult b = provider.embed("I work as a Software Engineer at TechCorp");

    ASSERT_TRUE(a.success);
    ASSERT_EQ(64u, a.embedding.size());
    EXPECT_EQ(a.embedding, b.embedding);
    EXPECT_NEAR(1.0, vector_norm(a.embedding), 1e-5);
}

TEST(HashingEmbeddingTest, SharedVocabularyIsCloser) {
    HashingEmbeddingProvider provider(384);
    std::vector<float> base = provider.embed("machine learning model training").embedding;
    std::vector<float> near = provider.embed("training a machine learning model").embedding;
    std::vector<float> far = provider.embed("grandmother's apple pie recipe").embedding;

    EXPECT_GT(cosine_similarity(base, near), 0.6);
    EXPECT_GT(cosine_similarity(base, near), cosine_similarity(base, far));
}

TEST(HashingEmbeddingTest, StopWordsOnlyGivesZeroVector) {
    HashingEmbeddingProvider provider(16);
    EmbeddingResult r = provider.embed("the and of");
    ASSERT_TRUE(r.success);
    EXPECT_FLOAT_EQ(0.0f, vector_norm(r.embedding));
}

TEST(CachingEmbeddingTest, HitsAfterFirstCall) {
    ScriptedEmbeddingProvider* inner = new ScriptedEmbeddingProvider(8);
    CachingEmbeddingProvider cache(std::unique_ptr<EmbeddingProvider>(inner), 10);

    EXPECT_TRUE(cache.embed("hello world").success);
    EXPECT_TRUE(cache.embed("hello world").success);
    EXPECT_EQ(1, inner->calls());
    EXPECT_EQ(1, cache.hits());
    EXPECT_EQ(1, cache.misses());
    EXPECT_EQ(8, cache.dimensions());
}

TEST(CachingEmbeddingTest, FailuresAreNotCached) {
    ScriptedEmbeddingProvider* inner = new ScriptedEmbeddingProvider(8);
    CachingEmbeddingProvider cache(std::unique_ptr<EmbeddingProvider>(inner), 10);

    inner->fail_next(1, ErrorCode::TRANSIENT_EXTERNAL_FAILURE);
    EmbeddingResult first = cache.embed("retry me");
    EXPECT_FALSE(first.success);
    EXPECT_EQ(ErrorCode::TRANSIENT_EXTERNAL_FAILURE, first.code);

    EXPECT_TRUE(cache.embed("retry me").success);
    EXPECT_EQ(1u, cache.size());
}

TEST(CachingEmbeddingTest, EvictsOldestEntry) {
    ScriptedEmbeddingProvider* inner = new ScriptedEmbeddingProvider(8);
    CachingEmbeddingProvider cache(std::unique_ptr<EmbeddingProvider>(inner), 2);

    cache.embed("one");
    cache.embed("two");
    cache.embed("three");
    EXPECT_EQ(2u, cache.size());

    cache.embed("one");
    EXPECT_EQ(4, inner->calls());
    cache.embed("three");
    EXPECT_EQ(4, inner->calls());
}

TEST(EmbeddingFactoryTest, BuildsConfiguredProvider) {
    EmbeddingConfig config;
    config.dimensions = 32;
    std::unique_ptr<EmbeddingProvider> p = create_embedding_provider(config);
    ASSERT_TRUE(p.get() != NULL);
    EXPECT_EQ("hashing+cache", p->provider_id());
    EXPECT_EQ(32, p->dimensions());

    config.cache = false;
    config.provider = "http";
    p = create_embedding_provider(config);
    ASSERT_TRUE(p.get() != NULL);
    EXPECT_EQ("http", p->provider_id());

    config.provider = "word2vec";
    EXPECT_TRUE(create_embedding_provider(config).get() == NULL);
}

TEST(HttpEmbeddingTest, EndpointFromBaseUrl) {
    EmbeddingConfig config;
    config.url = "http://localhost:8080/";
    EXPECT_EQ("http://localhost:8080/v1/embeddings", HttpEmbeddingProvider(config).endpoint());

    config.url = "https://api.example.com/v1/embeddings";
    EXPECT_EQ("https://api.example.com/v1/embeddings", HttpEmbeddingProvider(config).endpoint());
}

TEST(HttpEmbeddingTest, UnreachableServerIsTransient) {
    EmbeddingConfig config;
    config.url = "http://127.0.0.1:1";
    config.timeout_ms = 1000;
    EmbeddingResult r = HttpEmbeddingProvider(config).embed("hello");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::TRANSIENT_EXTERNAL_FAILURE, r.code);
    EXPECT_FALSE(r.error.empty());
}

TEST(HttpEmbeddingTest, ParsesResponseShapes) {
    EmbeddingResult openai = HttpEmbeddingProvider::parse_response(
        "{\"object\":\"list\",\"data\":[{\"index\":0,\"embedding\":[0.1,0.2,0.3]}]}", 3);
    ASSERT_TRUE(openai.success);
    EXPECT_FLOAT_EQ(0.2f, openai.embedding[1]);

    EmbeddingResult native = HttpEmbeddingProvider::parse_response("{\"embedding\":[1,0,0]}", 3);
    EXPECT_TRUE(native.success);

    EmbeddingResult llama = HttpEmbeddingProvider::parse_response(
        "[{\"index\":0,\"embedding\":[[0.5,0.5,0.0]]}]", 3);
    ASSERT_TRUE(llama.success);
    EXPECT_FLOAT_EQ(0.5f, llama.embedding[1]);
}

TEST(HttpEmbeddingTest, DimensionMismatchIsPermanent) {
    EmbeddingResult r = HttpEmbeddingProvider::parse_response("{\"embedding\":[1,0]}", 3);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::EXTERNAL_FAILURE, r.code);
    EXPECT_FALSE(is_retryable(r.code));

    r = HttpEmbeddingProvider::parse_response("<html>", 3);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::EXTERNAL_FAILURE, r.code);
}
