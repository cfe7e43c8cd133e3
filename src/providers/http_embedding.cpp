#include <engram/providers/http_embedding.hpp>
#include <engram/core/http_client.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <map>

namespace engram {

namespace {

bool read_vector(const Json& arr, std::vector<float>& out) {
    if (!arr.is_array()) return false;
    out.clear();
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_number()) return false;
        out.push_back(static_cast<float>(arr[i].as_number()));
    }
    return true;
}

} // anonymous namespace

HttpEmbeddingProvider::HttpEmbeddingProvider(const EmbeddingConfig& config)
    : model_(config.model)
    , api_key_(config.api_key)
    , dimensions_(config.dimensions)
    , timeout_ms_(config.timeout_ms > 0 ? config.timeout_ms : 10000)
{
    std::string base = config.url;
    while (!base.empty() && base[base.size() - 1] == '/') {
        base.erase(base.size() - 1);
    }
    // A full endpoint URL is used verbatim
    if (base.size() >= 11 && base.compare(base.size() - 11, 11, "/embeddings") == 0) {
        endpoint_ = base;
    } else {
        endpoint_ = base + "/v1/embeddings";
    }
    LOG_DEBUG("[Embedding] HTTP endpoint %s (model '%s', timeout %dms)",
              endpoint_.c_str(), model_.c_str(), timeout_ms_);
}

EmbeddingResult HttpEmbeddingProvider::embed(const std::string& text) {
    Json request = Json::object();
    request.set("input", text);
    if (!model_.empty()) {
        request.set("model", model_);
    }

    std::map<std::string, std::string> headers;
    if (!api_key_.empty()) {
        headers["Authorization"] = "Bearer " + api_key_;
    }

    HttpClient http;
    http.set_timeout(timeout_ms_);
    HttpResponse response = http.post_json(endpoint_, request, headers);

    if (response.status_code == 0) {
        LOG_WARN("[Embedding] request to %s failed: %s", endpoint_.c_str(), response.error.c_str());
        return EmbeddingResult::fail(ErrorCode::TRANSIENT_EXTERNAL_FAILURE,
                                     response.timed_out ? "embedding request timed out"
                                                        : "embedding request failed: " + response.error);
    }

    if (!response.ok()) {
        LOG_WARN("[Embedding] %s", response.error.c_str());
        return EmbeddingResult::fail(response.retryable() ? ErrorCode::TRANSIENT_EXTERNAL_FAILURE
                                                          : ErrorCode::EXTERNAL_FAILURE,
                                     "embedding provider error: " + response.error);
    }

    LOG_DEBUG("[Embedding] HTTP %ld (%zu bytes)", response.status_code, response.body.size());
    return parse_response(response.body, dimensions_);
}

EmbeddingResult HttpEmbeddingProvider::parse_response(const std::string& body, int dimensions) {
    Json resp;
    try {
        resp = Json::parse(body);
    } catch (const std::runtime_error& e) {
        return EmbeddingResult::fail(ErrorCode::EXTERNAL_FAILURE,
                                     std::string("malformed embedding response: ") + e.what());
    }

    std::vector<float> vec;
    bool found = false;
    if (resp.is_object() && resp["data"].is_array() && resp["data"].size() > 0) {
        found = read_vector(resp["data"][0]["embedding"], vec);
    } else if (resp.is_object() && resp.has("embedding")) {
        found = read_vector(resp["embedding"], vec);
    } else if (resp.is_array() && resp.size() > 0 && resp[0].is_object()) {
        // llama.cpp /embedding: [{"index":0,"embedding":[[...]]}]
        const Json& emb = resp[0]["embedding"];
        found = emb.is_array() && emb.size() > 0 && emb[0].is_array()
                    ? read_vector(emb[0], vec)
                    : read_vector(emb, vec);
    }

    if (!found) {
        return EmbeddingResult::fail(ErrorCode::EXTERNAL_FAILURE,
                                     "embedding response has no embedding vector");
    }
    if (static_cast<int>(vec.size()) != dimensions) {
        return EmbeddingResult::fail(ErrorCode::EXTERNAL_FAILURE,
                                     "embedding dimension mismatch: expected " + std::to_string(dimensions) +
                                     ", got " + std::to_string(vec.size()));
    }
    return EmbeddingResult::ok(vec);
}

} // namespace engram
