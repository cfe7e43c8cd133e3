/*
 * Engram C++11 - Embedding providers
 *
 * Turns text into a dense vector of fixed dimensionality. Implementations
 * must be deterministic for a given input and safe to call from several
 * ingestion workers at once.
 */
#ifndef ENGRAM_PROVIDERS_EMBEDDING_HPP
#define ENGRAM_PROVIDERS_EMBEDDING_HPP

#include <engram/core/errors.hpp>
#include <engram/memory/types.hpp>
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace engram {

struct EmbeddingResult {
    bool success;
    ErrorCode code;
    std::string error;
    std::vector<float> embedding;

    EmbeddingResult() : success(false), code(ErrorCode::NONE) {}

    static EmbeddingResult ok(const std::vector<float>& v) {
        EmbeddingResult r;
        r.success = true;
        r.embedding = v;
        return r;
    }

    static EmbeddingResult fail(ErrorCode code, const std::string& err) {
        EmbeddingResult r;
        r.code = code;
        r.error = err;
        return r;
    }
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() {}

    virtual std::string provider_id() const = 0;
    virtual int dimensions() const = 0;
    virtual EmbeddingResult embed(const std::string& text) = 0;
};

// Offline provider: signed feature hashing of word unigrams, word bigrams
// and character trigrams into `dimensions` buckets, L2-normalised. Texts
// sharing vocabulary land close together; unrelated texts near zero.
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(int dimensions = 384);

    std::string provider_id() const { return "hashing"; }
    int dimensions() const { return dimensions_; }
    EmbeddingResult embed(const std::string& text);

private:
    int dimensions_;

    void add_feature(std::vector<float>& v, const std::string& feature, float weight) const;
};

// Memoises another provider by SHA-256 of the input text. Evicts the oldest
// entry once max_entries is reached. Failures are never cached.
class CachingEmbeddingProvider : public EmbeddingProvider {
public:
    CachingEmbeddingProvider(std::unique_ptr<EmbeddingProvider> inner, size_t max_entries);

    std::string provider_id() const { return inner_->provider_id() + "+cache"; }
    int dimensions() const { return inner_->dimensions(); }
    EmbeddingResult embed(const std::string& text);

    int64_t hits() const { return hits_.load(); }
    int64_t misses() const { return misses_.load(); }
    size_t size() const;

private:
    std::unique_ptr<EmbeddingProvider> inner_;
    size_t max_entries_;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<float> > entries_;
    std::deque<std::string> order_;

    std::atomic<int64_t> hits_;
    std::atomic<int64_t> misses_;
};

// Builds the provider named by config.provider ("hashing" or "http"),
// wrapped in a cache when config.cache is set. NULL for unknown names.
std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config);

} // namespace engram

#endif // ENGRAM_PROVIDERS_EMBEDDING_HPP
