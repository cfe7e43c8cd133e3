/*
 * Engram C++11 - Ingestion pipeline
 *
 * Document lifecycle:
 *   Queued -> Extracting -> Chunking -> Embedding -> Indexing -> Done
 * Any stage may end in Failed. Chunks committed before a failure stay
 * committed and searchable.
 */
#ifndef ENGRAM_MEMORY_PIPELINE_HPP
#define ENGRAM_MEMORY_PIPELINE_HPP

#include "types.hpp"
#include "chunker.hpp"
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <map>
#include <string>
#include <vector>

namespace engram {

class MemoryStore;
class VectorIndex;
class EmbeddingProvider;
class EntityExtractor;
class RelationshipClassifier;
class TieringManager;

// Calls `call` until it succeeds, fails with a non-retryable code, or
// policy.max_attempts is reached. Sleeps policy.backoff_for(n) between tries.
template <typename Result, typename Call>
Result call_with_retry(const RetryPolicy& policy, const char* what, Call call) {
    int max_attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    for (int attempt = 1; ; ++attempt) {
        Result result = call();
        if (result.success || !is_retryable(result.code) || attempt >= max_attempts) {
            return result;
        }
        int64_t delay = policy.backoff_for(attempt);
        LOG_WARN("[Ingest] %s failed (attempt %d/%d): %s; retrying in %lldms",
                 what, attempt, max_attempts, result.error.c_str(), static_cast<long long>(delay));
        sleep_ms(delay);
    }
}

class IngestionPipeline {
public:
    IngestionPipeline(MemoryStore& store, VectorIndex& index, EmbeddingProvider& embedder,
                      EntityExtractor& extractor, RelationshipClassifier& classifier,
                      TieringManager& tiering, const ChunkingConfig& chunking,
                      const RetryPolicy& retry, ClockFn clock);

    // Empty owner or blank text. Nothing is written on failure.
    static bool validate(const std::string& owner_id, const std::string& text, std::string& error);

    // Validates and persists a Queued document
    DocumentResult create_document(const std::string& owner_id, const std::string& text,
                                   const std::string& title);

    // Runs a Queued document to Done or Failed. On failure the result carries
    // the code and the Failed document. A document deleted mid-run (clear)
    // fails with NOT_FOUND and is not written back.
    DocumentResult process(Document doc);

    DocumentResult ingest(const std::string& owner_id, const std::string& text,
                          const std::string& title);

private:
    MemoryStore& store_;
    VectorIndex& index_;
    EmbeddingProvider& embedder_;
    EntityExtractor& extractor_;
    RelationshipClassifier& classifier_;
    TieringManager& tiering_;
    TextChunker chunker_;
    RetryPolicy retry_;
    ClockFn clock_;

    ErrorCode set_status(Document& doc, DocumentStatus status);
    DocumentResult fail_document(Document& doc, ErrorCode code, const std::string& error);

    // Embeds and extracts one chunk into `out`
    ErrorCode prepare_chunk(const Document& doc, const std::string& text, int chunk_index,
                            Memory& out, std::string& error);

    // Classifies and commits one memory under the owner's write mutex, then
    // makes it searchable
    ErrorCode commit_chunk(Memory& memory, std::string& error);
    ErrorCode write_chunk(const Memory& memory, const std::vector<Relationship>& edges,
                          bool fresh_versions, std::map<std::string, int64_t>& superseded,
                          std::string& error);
};

} // namespace engram

#endif // ENGRAM_MEMORY_PIPELINE_HPP
