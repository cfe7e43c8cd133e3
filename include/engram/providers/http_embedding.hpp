/*
 * Engram C++11 - HTTP embedding provider
 *
 * Speaks the OpenAI-compatible /v1/embeddings protocol served by llama.cpp
 * (--embedding), OpenAI and most local inference servers.
 */
#ifndef ENGRAM_PROVIDERS_HTTP_EMBEDDING_HPP
#define ENGRAM_PROVIDERS_HTTP_EMBEDDING_HPP

#include "embedding.hpp"
#include <string>

namespace engram {

class HttpEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HttpEmbeddingProvider(const EmbeddingConfig& config);

    std::string provider_id() const { return "http"; }
    int dimensions() const { return dimensions_; }
    EmbeddingResult embed(const std::string& text);

    const std::string& endpoint() const { return endpoint_; }

    // Accepts {"data":[{"embedding":[...]}]} and llama.cpp's native
    // {"embedding":[...]}. A vector of the wrong length is a permanent error.
    static EmbeddingResult parse_response(const std::string& body, int dimensions);

private:
    std::string endpoint_;
    std::string model_;
    std::string api_key_;
    int dimensions_;
    int timeout_ms_;
};

} // namespace engram

#endif // ENGRAM_PROVIDERS_HTTP_EMBEDDING_HPP
