#include <engram/providers/embedding.hpp>
#include <engram/providers/http_embedding.hpp>
#include <engram/memory/text_analysis.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <cmath>
#include <utility>

namespace engram {

// ============ HashingEmbeddingProvider ============

HashingEmbeddingProvider::HashingEmbeddingProvider(int dimensions)
    : dimensions_(dimensions > 0 ? dimensions : 384)
{
}

void HashingEmbeddingProvider::add_feature(std::vector<float>& v, const std::string& feature,
                                           float weight) const {
    uint64_t h = fnv1a_64(feature);
    size_t bucket = static_cast<size_t>(h % static_cast<uint64_t>(dimensions_));
    float sign = ((h >> 40) & 1) ? 1.0f : -1.0f;
    v[bucket] += sign * weight;
}

EmbeddingResult HashingEmbeddingProvider::embed(const std::string& text) {
    std::vector<float> v(static_cast<size_t>(dimensions_), 0.0f);

    std::vector<Token> tokens = tokenize(text);
    std::vector<std::string> content;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!is_stop_word(tokens[i].lower)) {
            content.push_back(tokens[i].lower);
        }
    }

    for (size_t i = 0; i < content.size(); ++i) {
        const std::string& w = content[i];
        add_feature(v, "w:" + w, 1.0f);
        if (i + 1 < content.size()) {
            add_feature(v, "b:" + w + " " + content[i + 1], 0.5f);
        }
        std::string padded = "#" + w + "#";
        for (size_t j = 0; j + 3 <= padded.size(); ++j) {
            add_feature(v, "t:" + padded.substr(j, 3), 0.25f);
        }
    }

    double sum = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        sum += static_cast<double>(v[i]) * v[i];
    }
    if (sum > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(sum));
        for (size_t i = 0; i < v.size(); ++i) {
            v[i] *= inv;
        }
    }
    return EmbeddingResult::ok(v);
}

// ============ CachingEmbeddingProvider ============

CachingEmbeddingProvider::CachingEmbeddingProvider(std::unique_ptr<EmbeddingProvider> inner,
                                                   size_t max_entries)
    : inner_(std::move(inner))
    , max_entries_(max_entries > 0 ? max_entries : 1)
    , hits_(0)
    , misses_(0)
{
}

size_t CachingEmbeddingProvider::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

EmbeddingResult CachingEmbeddingProvider::embed(const std::string& text) {
    std::string key = sha256_hex(text);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::vector<float> >::const_iterator it = entries_.find(key);
        if (it != entries_.end()) {
            hits_.fetch_add(1);
            return EmbeddingResult::ok(it->second);
        }
    }

    misses_.fetch_add(1);
    EmbeddingResult result = inner_->embed(text);
    if (!result.success) {
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(key) == entries_.end()) {
        while (entries_.size() >= max_entries_ && !order_.empty()) {
            entries_.erase(order_.front());
            order_.pop_front();
        }
        entries_[key] = result.embedding;
        order_.push_back(key);
    }
    return result;
}

// ============ Factory ============

std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config) {
    std::unique_ptr<EmbeddingProvider> provider;
    if (config.provider == "hashing") {
        provider.reset(new HashingEmbeddingProvider(config.dimensions));
    } else if (config.provider == "http") {
        provider.reset(new HttpEmbeddingProvider(config));
    } else {
        LOG_ERROR("[Embedding] unknown provider '%s'", config.provider.c_str());
        return provider;
    }

    LOG_INFO("[Embedding] provider=%s dimensions=%d cache=%s",
             config.provider.c_str(), config.dimensions, config.cache ? "on" : "off");

    if (!config.cache) {
        return provider;
    }
    std::unique_ptr<EmbeddingProvider> cached(new CachingEmbeddingProvider(
        std::move(provider), static_cast<size_t>(config.cache_max_entries)));
    return cached;
}

} // namespace engram
