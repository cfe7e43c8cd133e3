/*
 * Engram C++11 - Relationship classifier
 *
 * Links a new memory to its nearest existing memories with typed, directed
 * edges (from = new memory, to = existing memory).
 */
#ifndef ENGRAM_MEMORY_CLASSIFIER_HPP
#define ENGRAM_MEMORY_CLASSIFIER_HPP

#include "types.hpp"
#include "vector_index.hpp"
#include <string>
#include <vector>

namespace engram {

class MemoryStore;

struct ClassificationSignals {
    double similarity;
    double keyword_overlap;
    int shared_keywords;
    bool contradiction;
    bool identical_content;

    ClassificationSignals()
        : similarity(0)
        , keyword_overlap(0)
        , shared_keywords(0)
        , contradiction(false)
        , identical_content(false)
    {}
};

struct RelationshipDecision {
    bool has_edge;
    RelationshipKind kind;
    double confidence;
    std::string reason;

    RelationshipDecision() : has_edge(false), kind(RelationshipKind::SIMILAR), confidence(0) {}
};

// Ordered rules, first match wins:
//   identical content                      -> SIMILAR  (confidence = similarity)
//   sim >= update_threshold, contradiction -> UPDATES  (confidence = similarity)
//   sim >= extend_threshold                -> EXTENDS  (confidence = similarity)
//   overlap >= overlap_threshold and
//   shared >= min_shared_keywords          -> DERIVES  (confidence = overlap)
//   sim >= similar_floor                   -> SIMILAR  (confidence = similarity)
//   otherwise no edge
RelationshipDecision decide_relationship(const ClassificationSignals& signals,
                                         const ClassifierConfig& config);

// Returns the first supersession cue found in text ("now", "no longer", ...),
// or an empty string
std::string find_supersession_cue(const std::string& text);

bool detect_contradiction(const std::string& new_text, const std::string& old_text,
                          const std::vector<std::string>& shared_keywords, bool shares_entity);

bool entities_overlap(const EntityMap& a, const EntityMap& b);

class RelationshipClassifier {
public:
    RelationshipClassifier(MemoryStore& store, VectorIndex& index, const ClassifierConfig& config);

    // Nearest candidates of the same owner, excluding the memory itself and
    // chunks of the same document. Both tiers are searched.
    std::vector<VectorHit> candidates(const Memory& memory) const;

    // Edges for a memory that is not yet in the index. Candidates whose
    // stored row cannot be read are skipped.
    std::vector<Relationship> classify(const Memory& memory);

    ClassificationSignals compute_signals(const Memory& memory, const Memory& candidate,
                                          double similarity) const;

    const ClassifierConfig& config() const { return config_; }

private:
    MemoryStore& store_;
    VectorIndex& index_;
    ClassifierConfig config_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_CLASSIFIER_HPP
