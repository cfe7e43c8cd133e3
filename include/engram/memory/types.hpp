/*
 * Engram C++11 - Memory Types
 *
 * Records of the memory graph (memories, relationships, documents), the
 * query/result shapes and the typed engine configuration.
 */
#ifndef ENGRAM_MEMORY_TYPES_HPP
#define ENGRAM_MEMORY_TYPES_HPP

#include <engram/core/errors.hpp>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <cstdint>
#include <functional>

namespace engram {

// Returns "now" in unix milliseconds. Injected so tests can drive time.
typedef std::function<int64_t()> ClockFn;

// category -> values. Categories: person, organization, location, email, url, phone
typedef std::map<std::string, std::set<std::string> > EntityMap;

namespace entity_category {
    static const char* const PERSON = "person";
    static const char* const ORGANIZATION = "organization";
    static const char* const LOCATION = "location";
    static const char* const EMAIL = "email";
    static const char* const URL = "url";
    static const char* const PHONE = "phone";
}

// ============ Enumerations ============

enum class MemoryTier {
    HOT,
    COLD
};

inline std::string memory_tier_to_string(MemoryTier t) {
    return t == MemoryTier::COLD ? "cold" : "hot";
}

inline MemoryTier string_to_memory_tier(const std::string& s) {
    return s == "cold" ? MemoryTier::COLD : MemoryTier::HOT;
}

enum class RelationshipKind {
    UPDATES,    // newer memory supersedes the older one
    EXTENDS,    // adds detail without contradiction
    DERIVES,    // inferred from shared keywords
    SIMILAR     // loosely related
};

inline std::string relationship_kind_to_string(RelationshipKind k) {
    switch (k) {
        case RelationshipKind::UPDATES: return "updates";
        case RelationshipKind::EXTENDS: return "extends";
        case RelationshipKind::DERIVES: return "derives";
        case RelationshipKind::SIMILAR: return "similar";
    }
    return "similar";
}

// Returns false for unknown names
inline bool string_to_relationship_kind(const std::string& s, RelationshipKind& out) {
    if (s == "updates") { out = RelationshipKind::UPDATES; return true; }
    if (s == "extends") { out = RelationshipKind::EXTENDS; return true; }
    if (s == "derives") { out = RelationshipKind::DERIVES; return true; }
    if (s == "similar") { out = RelationshipKind::SIMILAR; return true; }
    return false;
}

enum class DocumentStatus {
    QUEUED,
    EXTRACTING,
    CHUNKING,
    EMBEDDING,
    INDEXING,
    DONE,
    FAILED
};

inline std::string document_status_to_string(DocumentStatus s) {
    switch (s) {
        case DocumentStatus::QUEUED: return "queued";
        case DocumentStatus::EXTRACTING: return "extracting";
        case DocumentStatus::CHUNKING: return "chunking";
        case DocumentStatus::EMBEDDING: return "embedding";
        case DocumentStatus::INDEXING: return "indexing";
        case DocumentStatus::DONE: return "done";
        case DocumentStatus::FAILED: return "failed";
    }
    return "queued";
}

inline DocumentStatus string_to_document_status(const std::string& s) {
    if (s == "extracting") return DocumentStatus::EXTRACTING;
    if (s == "chunking") return DocumentStatus::CHUNKING;
    if (s == "embedding") return DocumentStatus::EMBEDDING;
    if (s == "indexing") return DocumentStatus::INDEXING;
    if (s == "done") return DocumentStatus::DONE;
    if (s == "failed") return DocumentStatus::FAILED;
    return DocumentStatus::QUEUED;
}

inline bool is_terminal(DocumentStatus s) {
    return s == DocumentStatus::DONE || s == DocumentStatus::FAILED;
}

// ============ Records ============

// One chunk of ingested text. Content, embedding, keywords and entities never
// change after creation.
struct Memory {
    std::string id;
    std::string owner_id;
    std::string content;
    std::string title;
    std::vector<float> embedding;
    std::vector<std::string> keywords;      // most relevant first
    EntityMap entities;
    int64_t created_at;                     // unix ms
    int64_t access_count;
    int64_t last_accessed_at;               // 0 = never
    bool is_latest;
    MemoryTier tier;
    std::string source_document_id;
    int chunk_index;
    int64_t version;                        // bumped on every is_latest change

    Memory()
        : created_at(0)
        , access_count(0)
        , last_accessed_at(0)
        , is_latest(true)
        , tier(MemoryTier::HOT)
        , chunk_index(0)
        , version(0)
    {}
};

// Directed edge, from = newer memory, to = older memory
struct Relationship {
    std::string id;
    std::string owner_id;
    std::string from_id;
    std::string to_id;
    RelationshipKind kind;
    double confidence;
    double similarity;
    std::string reason;
    int64_t created_at;

    Relationship()
        : kind(RelationshipKind::SIMILAR)
        , confidence(0)
        , similarity(0)
        , created_at(0)
    {}
};

struct Document {
    std::string id;
    std::string owner_id;
    std::string title;
    std::string raw_content;
    DocumentStatus status;
    std::vector<std::string> memory_ids;
    std::string error_message;
    int64_t created_at;
    int64_t updated_at;
    int64_t processed_at;                   // 0 until terminal

    Document()
        : status(DocumentStatus::QUEUED)
        , created_at(0)
        , updated_at(0)
        , processed_at(0)
    {}
};

// ============ Queries and results ============

struct SearchOptions {
    int limit;                                  // <= 0 selects search.default_limit
    bool only_latest;
    std::vector<std::string> keyword_filter;
    bool require_keyword_match;
    double semantic_weight;                     // < 0 selects search.semantic_weight
    std::vector<std::string> entity_types;
    std::vector<RelationshipKind> relationship_kinds;
    int64_t date_from;                          // 0 = unbounded
    int64_t date_to;                            // 0 = unbounded
    double min_similarity;
    bool hot_only;

    SearchOptions()
        : limit(0)
        , only_latest(true)
        , require_keyword_match(false)
        , semantic_weight(-1.0)
        , date_from(0)
        , date_to(0)
        , min_similarity(0.0)
        , hot_only(false)
    {}
};

struct ScoredMemory {
    Memory memory;
    double score;               // final, decay applied
    double similarity;
    double keyword_score;
    double decay;
    std::string explanation;
    std::vector<std::string> related_ids;

    ScoredMemory() : score(0), similarity(0), keyword_score(0), decay(1.0) {}
};

struct Subgraph {
    std::string root_id;
    std::vector<Memory> nodes;
    std::vector<Relationship> edges;
};

struct GraphStats {
    int64_t total_memories;
    int64_t total_relationships;
    std::map<std::string, int64_t> relationship_type_counts;
    int64_t hot;
    int64_t cold;

    GraphStats() : total_memories(0), total_relationships(0), hot(0), cold(0) {}
};

struct GraphExport {
    std::vector<Memory> nodes;
    std::vector<Relationship> edges;
    GraphStats stats;
};

struct TierStats {
    int64_t hot;
    int64_t cold;
    int64_t total;
    double hot_percent;
    double cold_percent;

    TierStats() : hot(0), cold(0), total(0), hot_percent(0), cold_percent(0) {}
};

struct RebalanceReport {
    int64_t promoted;
    int64_t demoted;

    RebalanceReport() : promoted(0), demoted(0) {}
};

struct ClearReport {
    int64_t memories;
    int64_t relationships;
    int64_t documents;

    ClearReport() : memories(0), relationships(0), documents(0) {}
};

// ============ Result wrappers ============

struct MemoryResult {
    bool success;
    ErrorCode code;
    std::string error;
    Memory memory;

    MemoryResult() : success(false), code(ErrorCode::NONE) {}

    static MemoryResult ok(const Memory& m) {
        MemoryResult r;
        r.success = true;
        r.memory = m;
        return r;
    }

    static MemoryResult fail(ErrorCode code, const std::string& err) {
        MemoryResult r;
        r.code = code;
        r.error = err;
        return r;
    }
};

struct MemoryListResult {
    bool success;
    ErrorCode code;
    std::string error;
    std::vector<Memory> memories;

    MemoryListResult() : success(false), code(ErrorCode::NONE) {}

    static MemoryListResult ok(const std::vector<Memory>& m) {
        MemoryListResult r;
        r.success = true;
        r.memories = m;
        return r;
    }

    static MemoryListResult fail(ErrorCode code, const std::string& err) {
        MemoryListResult r;
        r.code = code;
        r.error = err;
        return r;
    }
};

struct DocumentResult {
    bool success;
    ErrorCode code;
    std::string error;
    Document document;

    DocumentResult() : success(false), code(ErrorCode::NONE) {}

    static DocumentResult ok(const Document& d) {
        DocumentResult r;
        r.success = true;
        r.document = d;
        return r;
    }

    static DocumentResult fail(ErrorCode code, const std::string& err) {
        DocumentResult r;
        r.code = code;
        r.error = err;
        return r;
    }
};

struct SearchResult {
    bool success;
    ErrorCode code;
    std::string error;
    std::vector<ScoredMemory> results;

    SearchResult() : success(false), code(ErrorCode::NONE) {}

    static SearchResult ok(const std::vector<ScoredMemory>& results) {
        SearchResult r;
        r.success = true;
        r.results = results;
        return r;
    }

    static SearchResult fail(ErrorCode code, const std::string& err) {
        SearchResult r;
        r.code = code;
        r.error = err;
        return r;
    }
};

struct SubgraphResult {
    bool success;
    ErrorCode code;
    std::string error;
    Subgraph graph;

    SubgraphResult() : success(false), code(ErrorCode::NONE) {}

    static SubgraphResult ok(const Subgraph& g) {
        SubgraphResult r;
        r.success = true;
        r.graph = g;
        return r;
    }

    static SubgraphResult fail(ErrorCode code, const std::string& err) {
        SubgraphResult r;
        r.code = code;
        r.error = err;
        return r;
    }
};

// ============ Configuration ============

struct EmbeddingConfig {
    std::string provider;       // "hashing" | "http"
    int dimensions;
    std::string url;
    std::string model;
    std::string api_key;
    int timeout_ms;
    bool cache;
    int cache_max_entries;

    EmbeddingConfig()
        : provider("hashing")
        , dimensions(384)
        , url("http://localhost:8080")
        , timeout_ms(10000)
        , cache(true)
        , cache_max_entries(10000)
    {}
};

struct ChunkingConfig {
    int max_chars;

    ChunkingConfig() : max_chars(500) {}
};

struct ClassifierConfig {
    double update_threshold;
    double extend_threshold;
    double overlap_threshold;
    double similar_floor;
    double candidate_floor;
    int max_candidates;
    int min_shared_keywords;

    ClassifierConfig()
        : update_threshold(0.70)
        , extend_threshold(0.60)
        , overlap_threshold(0.30)
        , similar_floor(0.30)
        , candidate_floor(0.30)
        , max_candidates(5)
        , min_shared_keywords(2)
    {}
};

struct TieringConfig {
    bool enabled;
    int hot_age_days;
    int promotion_threshold;
    int rebalance_interval_seconds;

    TieringConfig()
        : enabled(true)
        , hot_age_days(30)
        , promotion_threshold(5)
        , rebalance_interval_seconds(3600)
    {}
};

struct SearchConfig {
    double half_life_days;
    double semantic_weight;
    int candidate_multiplier;
    int default_limit;
    int max_limit;

    SearchConfig()
        : half_life_days(90.0)
        , semantic_weight(0.7)
        , candidate_multiplier(5)
        , default_limit(10)
        , max_limit(200)
    {}
};

struct RetryPolicy {
    int max_attempts;
    int initial_backoff_ms;
    int max_backoff_ms;

    RetryPolicy()
        : max_attempts(3)
        , initial_backoff_ms(200)
        , max_backoff_ms(5000)
    {}

    // Delay before retry number `attempt` (1-based), doubling each time
    int64_t backoff_for(int attempt) const {
        int64_t delay = initial_backoff_ms;
        for (int i = 1; i < attempt && delay < max_backoff_ms; ++i) {
            delay *= 2;
        }
        return delay > max_backoff_ms ? max_backoff_ms : delay;
    }
};

class Config;

struct EngineConfig {
    std::string db_path;
    EmbeddingConfig embedding;
    ChunkingConfig chunking;
    ClassifierConfig relationships;
    TieringConfig tiering;
    SearchConfig search;
    RetryPolicy retry;
    int workers;

    EngineConfig() : db_path("engram.db"), workers(4) {}

    static EngineConfig from_config(const Config& config);
};

} // namespace engram

#endif // ENGRAM_MEMORY_TYPES_HPP
