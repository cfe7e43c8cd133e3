/*
 * Engram C++11 - Ranked retrieval
 *
 *   score = w * similarity + (1 - w) * keyword_score   (keyword filter given)
 *   score = similarity                                 (otherwise)
 *   final = score * exp(-age_days / half_life_days)
 */
#ifndef ENGRAM_MEMORY_RANKING_HPP
#define ENGRAM_MEMORY_RANKING_HPP

#include "types.hpp"
#include "vector_index.hpp"
#include <string>
#include <vector>

namespace engram {

class MemoryStore;
class EmbeddingProvider;
class TieringManager;

double time_decay(double age_days, double half_life_days);

double keyword_match_score(const std::vector<std::string>& filter, const std::vector<std::string>& keywords);

std::string explain_score(double similarity, double keyword_score, bool keyword_filter, bool is_latest);

// Final ordering: score descending, then newest first
void sort_by_score(std::vector<ScoredMemory>& results);

class RankingEngine {
public:
    RankingEngine(MemoryStore& store, VectorIndex& index, EmbeddingProvider& embedder,
                  TieringManager& tiering, const SearchConfig& config, ClockFn clock);

    SearchResult search(const std::string& owner_id, const std::string& query, const SearchOptions& options);

    // Every version of a topic, oldest first
    SearchResult timeline(const std::string& owner_id, const std::string& topic);

    // Scores one candidate at time `now`; fills similarity, keyword score,
    // decay, score and explanation
    ScoredMemory score(const Memory& memory, double similarity, const SearchOptions& options, int64_t now) const;

    const SearchConfig& config() const { return config_; }

private:
    MemoryStore& store_;
    VectorIndex& index_;
    EmbeddingProvider& embedder_;
    TieringManager& tiering_;
    SearchConfig config_;
    ClockFn clock_;

    EntryFilter make_filter(const std::string& owner_id, const SearchOptions& options);
    std::vector<std::string> related_ids(const std::string& memory_id);
};

} // namespace engram

#endif // ENGRAM_MEMORY_RANKING_HPP
