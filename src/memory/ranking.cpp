/*
 * Engram C++11 - Ranked retrieval
 */
#include <engram/memory/ranking.hpp>
#include <engram/memory/store.hpp>
#include <engram/memory/tiering.hpp>
#include <engram/memory/text_analysis.hpp>
#include <engram/providers/embedding.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>

namespace engram {

namespace {

const int TIMELINE_LIMIT = 50;
const size_t MAX_RELATED_IDS = 5;

bool scored_before(const ScoredMemory& a, const ScoredMemory& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.memory.created_at > b.memory.created_at;
}

bool created_before(const ScoredMemory& a, const ScoredMemory& b) {
    return a.memory.created_at < b.memory.created_at;
}

bool has_entity_type(const IndexEntry& e, const std::vector<std::string>& types) {
    for (size_t i = 0; i < types.size(); ++i) {
        EntityMap::const_iterator it = e.entities.find(types[i]);
        if (it != e.entities.end() && !it->second.empty()) return true;
    }
    return false;
}

} // anonymous namespace

double time_decay(double age_days, double half_life_days) {
    if (half_life_days <= 0.0) return 1.0;
    if (age_days < 0.0) age_days = 0.0;
    return std::exp(-age_days / half_life_days);
}

double keyword_match_score(const std::vector<std::string>& filter, const std::vector<std::string>& keywords) {
    return jaccard(filter, keywords);
}

std::string explain_score(double similarity, double keyword_score, bool keyword_filter, bool is_latest) {
    char buf[64];
    std::vector<std::string> parts;

    if (similarity > 0.8) {
        snprintf(buf, sizeof(buf), "High semantic similarity (%.2f)", similarity);
    } else if (similarity > 0.6) {
        snprintf(buf, sizeof(buf), "Good semantic match (%.2f)", similarity);
    } else {
        snprintf(buf, sizeof(buf), "Moderate relevance (%.2f)", similarity);
    }
    parts.push_back(buf);

    if (keyword_filter && keyword_score > 0.0) {
        snprintf(buf, sizeof(buf), "keyword match (%.2f)", keyword_score);
        parts.push_back(buf);
    }
    if (!is_latest) {
        parts.push_back("older version");
    }
    return join(parts, "; ");
}

void sort_by_score(std::vector<ScoredMemory>& results) {
    std::stable_sort(results.begin(), results.end(), scored_before);
}

// ============ RankingEngine ============

RankingEngine::RankingEngine(MemoryStore& store, VectorIndex& index, EmbeddingProvider& embedder,
                             TieringManager& tiering, const SearchConfig& config, ClockFn clock)
    : store_(store)
    , index_(index)
    , embedder_(embedder)
    , tiering_(tiering)
    , config_(config)
    , clock_(clock)
{
    if (!clock_) {
        clock_ = current_timestamp_ms;
    }
}

ScoredMemory RankingEngine::score(const Memory& memory, double similarity,
                                  const SearchOptions& options, int64_t now) const {
    ScoredMemory s;
    s.memory = memory;
    s.similarity = similarity;

    bool keyword_filter = !options.keyword_filter.empty();
    double combined = similarity;
    if (keyword_filter) {
        double w = options.semantic_weight >= 0.0 ? options.semantic_weight : config_.semantic_weight;
        w = clamp(w, 0.0, 1.0);
        s.keyword_score = keyword_match_score(options.keyword_filter, memory.keywords);
        combined = w * similarity + (1.0 - w) * s.keyword_score;
    }

    double age_days = static_cast<double>(now - memory.created_at) / static_cast<double>(MS_PER_DAY);
    s.decay = time_decay(age_days, config_.half_life_days);
    s.score = combined * s.decay;
    s.explanation = explain_score(similarity, s.keyword_score, keyword_filter, memory.is_latest);
    return s;
}

EntryFilter RankingEngine::make_filter(const std::string& owner_id, const SearchOptions& options) {
    std::set<std::string> linked;
    bool by_relationship = !options.relationship_kinds.empty();
    if (by_relationship) {
        std::vector<Relationship> edges = store_.list_relationships(owner_id);
        for (size_t i = 0; i < edges.size(); ++i) {
            if (std::find(options.relationship_kinds.begin(), options.relationship_kinds.end(),
                          edges[i].kind) == options.relationship_kinds.end()) {
                continue;
            }
            linked.insert(edges[i].from_id);
            linked.insert(edges[i].to_id);
        }
    }

    std::vector<std::string> wanted_keywords;
    for (size_t i = 0; i < options.keyword_filter.size(); ++i) {
        wanted_keywords.push_back(to_lower(options.keyword_filter[i]));
    }

    SearchOptions opts = options;
    return [opts, linked, by_relationship, wanted_keywords](const IndexEntry& e) {
        if (opts.only_latest && !e.is_latest.load()) return false;
        if (opts.date_from > 0 && e.created_at < opts.date_from) return false;
        if (opts.date_to > 0 && e.created_at > opts.date_to) return false;
        if (!opts.entity_types.empty() && !has_entity_type(e, opts.entity_types)) return false;
        if (by_relationship && linked.find(e.id) == linked.end()) return false;
        if (opts.require_keyword_match && !wanted_keywords.empty()) {
            bool match = false;
            for (size_t i = 0; i < e.keywords.size() && !match; ++i) {
                match = std::find(wanted_keywords.begin(), wanted_keywords.end(),
                                  to_lower(e.keywords[i])) != wanted_keywords.end();
            }
            if (!match) return false;
        }
        return true;
    };
}

std::vector<std::string> RankingEngine::related_ids(const std::string& memory_id) {
    std::vector<std::string> ids;
    std::vector<Relationship> edges = store_.relationships_for(memory_id);
    for (size_t i = 0; i < edges.size() && ids.size() < MAX_RELATED_IDS; ++i) {
        const std::string& other = edges[i].from_id == memory_id ? edges[i].to_id : edges[i].from_id;
        if (std::find(ids.begin(), ids.end(), other) == ids.end()) {
            ids.push_back(other);
        }
    }
    return ids;
}

SearchResult RankingEngine::search(const std::string& owner_id, const std::string& query,
                                   const SearchOptions& options) {
    if (owner_id.empty()) {
        return SearchResult::fail(ErrorCode::VALIDATION_FAILURE, "owner_id is required");
    }
    if (trim(query).empty()) {
        return SearchResult::fail(ErrorCode::VALIDATION_FAILURE, "query is empty");
    }
    if (options.limit < 0 || options.limit > config_.max_limit) {
        return SearchResult::fail(ErrorCode::VALIDATION_FAILURE,
                                  "limit must be between 1 and " + std::to_string(config_.max_limit));
    }
    int limit = options.limit > 0 ? options.limit : config_.default_limit;

    EmbeddingResult embedded = embedder_.embed(query);
    if (!embedded.success) {
        LOG_ERROR("[Search] Query embedding failed: %s", embedded.error.c_str());
        return SearchResult::fail(embedded.code, "embedding unavailable: " + embedded.error);
    }

    std::vector<ScoredMemory> results;
    OwnerPartitionPtr part = index_.find_partition(owner_id);
    if (!part) {
        return SearchResult::ok(results);
    }

    EntryFilter filter = make_filter(owner_id, options);
    size_t n = static_cast<size_t>(limit) * static_cast<size_t>(config_.candidate_multiplier > 0 ? config_.candidate_multiplier : 1);

    std::vector<VectorHit> hits = part->nearest(embedded.embedding, n, options.min_similarity,
                                                MemoryTier::HOT, filter);
    bool date_filter = options.date_from > 0 || options.date_to > 0;
    if (!options.hot_only && (hits.size() < static_cast<size_t>(limit) || date_filter)) {
        std::vector<VectorHit> cold = part->nearest(embedded.embedding, n, options.min_similarity,
                                                    MemoryTier::COLD, filter);
        hits.insert(hits.end(), cold.begin(), cold.end());
    }

    int64_t now = clock_();
    for (size_t i = 0; i < hits.size(); ++i) {
        Memory m;
        if (!store_.get_memory(hits[i].entry->id, m)) {
            LOG_WARN("[Search] Skipping unreadable memory %s: %s",
                     hits[i].entry->id.c_str(), store_.last_error().c_str());
            continue;
        }
        hits[i].entry->apply_to(m);
        results.push_back(score(m, hits[i].similarity, options, now));
    }

    sort_by_score(results);
    if (results.size() > static_cast<size_t>(limit)) {
        results.resize(static_cast<size_t>(limit));
    }

    for (size_t i = 0; i < results.size(); ++i) {
        Memory& m = results[i].memory;
        tiering_.on_access(m.id);
        IndexEntryPtr entry = index_.find(m.id);
        if (entry) entry->apply_to(m);
        results[i].related_ids = related_ids(m.id);
    }

    LOG_DEBUG("[Search] owner=%s query=\"%.60s\" -> %zu results (%zu candidates)",
              owner_id.c_str(), query.c_str(), results.size(), hits.size());
    return SearchResult::ok(results);
}

SearchResult RankingEngine::timeline(const std::string& owner_id, const std::string& topic) {
    SearchOptions options;
    options.only_latest = false;
    options.limit = TIMELINE_LIMIT < config_.max_limit ? TIMELINE_LIMIT : config_.max_limit;

    SearchResult result = search(owner_id, topic, options);
    if (result.success) {
        std::stable_sort(result.results.begin(), result.results.end(), created_before);
    }
    return result;
}

} // namespace engram
