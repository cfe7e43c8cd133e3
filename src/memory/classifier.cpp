#include <engram/memory/classifier.hpp>
#include <engram/memory/store.hpp>
#include <engram/memory/text_analysis.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cstdio>

namespace engram {

namespace {

const char* const SUPERSESSION_CUES[] = {
    "no longer",
    "now",
    "instead",
    "updated",
    "changed",
    "switched",
    "currently",
    "revised",
    "modified",
    "anymore",
    "replaced",
    NULL
};

std::string format_score(double value) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

bool hit_before(const VectorHit& a, const VectorHit& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.entry->created_at > b.entry->created_at;
}

} // anonymous namespace

// ============ Decision policy ============

RelationshipDecision decide_relationship(const ClassificationSignals& s, const ClassifierConfig& config) {
    RelationshipDecision d;

    if (s.identical_content) {
        d.has_edge = true;
        d.kind = RelationshipKind::SIMILAR;
        d.confidence = s.similarity;
        d.reason = "identical content (similarity " + format_score(s.similarity) + ")";
        return d;
    }
    if (s.similarity >= config.update_threshold && s.contradiction) {
        d.has_edge = true;
        d.kind = RelationshipKind::UPDATES;
        d.confidence = s.similarity;
        d.reason = "new information supersedes existing (similarity " + format_score(s.similarity) + ")";
        return d;
    }
    if (s.similarity >= config.extend_threshold) {
        d.has_edge = true;
        d.kind = RelationshipKind::EXTENDS;
        d.confidence = s.similarity;
        d.reason = "additional context for related topic (similarity " + format_score(s.similarity) + ")";
        return d;
    }
    if (s.keyword_overlap >= config.overlap_threshold && s.shared_keywords >= config.min_shared_keywords) {
        d.has_edge = true;
        d.kind = RelationshipKind::DERIVES;
        d.confidence = s.keyword_overlap;
        d.reason = std::to_string(s.shared_keywords) + " shared keywords (overlap " +
                   format_score(s.keyword_overlap) + ")";
        return d;
    }
    if (s.similarity >= config.similar_floor) {
        d.has_edge = true;
        d.kind = RelationshipKind::SIMILAR;
        d.confidence = s.similarity;
        d.reason = "related content (similarity " + format_score(s.similarity) + ")";
        return d;
    }
    return d;
}

// ============ Signals ============

std::string find_supersession_cue(const std::string& text) {
    for (size_t i = 0; SUPERSESSION_CUES[i] != NULL; ++i) {
        if (contains_phrase(text, SUPERSESSION_CUES[i])) {
            return SUPERSESSION_CUES[i];
        }
    }
    return "";
}

bool detect_contradiction(const std::string& new_text, const std::string& old_text,
                          const std::vector<std::string>& shared_keywords, bool shares_entity) {
    if (normalize_text(new_text) == normalize_text(old_text)) {
        return false;
    }

    if (!find_supersession_cue(new_text).empty() && (!shared_keywords.empty() || shares_entity)) {
        return true;
    }

    std::set<std::string> new_numbers = extract_numbers(new_text);
    std::set<std::string> old_numbers = extract_numbers(old_text);
    return !new_numbers.empty() && !old_numbers.empty() && new_numbers != old_numbers;
}

bool entities_overlap(const EntityMap& a, const EntityMap& b) {
    for (EntityMap::const_iterator it = a.begin(); it != a.end(); ++it) {
        EntityMap::const_iterator other = b.find(it->first);
        if (other == b.end()) continue;
        for (std::set<std::string>::const_iterator v = it->second.begin(); v != it->second.end(); ++v) {
            std::string value = to_lower(*v);
            for (std::set<std::string>::const_iterator w = other->second.begin(); w != other->second.end(); ++w) {
                if (to_lower(*w) == value) return true;
            }
        }
    }
    return false;
}

// ============ RelationshipClassifier ============

RelationshipClassifier::RelationshipClassifier(MemoryStore& store, VectorIndex& index,
                                               const ClassifierConfig& config)
    : store_(store)
    , index_(index)
    , config_(config)
{
}

std::vector<VectorHit> RelationshipClassifier::candidates(const Memory& memory) const {
    std::vector<VectorHit> hits;
    OwnerPartitionPtr part = index_.find_partition(memory.owner_id);
    if (!part || config_.max_candidates <= 0) {
        return hits;
    }

    std::string self_id = memory.id;
    std::string document_id = memory.source_document_id;
    EntryFilter filter = [self_id, document_id](const IndexEntry& e) {
        if (e.id == self_id) return false;
        return document_id.empty() || e.document_id != document_id;
    };

    size_t k = static_cast<size_t>(config_.max_candidates);
    hits = part->nearest(memory.embedding, k, config_.candidate_floor, MemoryTier::HOT, filter);
    std::vector<VectorHit> cold = part->nearest(memory.embedding, k, config_.candidate_floor,
                                                MemoryTier::COLD, filter);
    hits.insert(hits.end(), cold.begin(), cold.end());

    std::sort(hits.begin(), hits.end(), hit_before);
    if (hits.size() > k) hits.resize(k);
    return hits;
}

ClassificationSignals RelationshipClassifier::compute_signals(const Memory& memory, const Memory& candidate,
                                                              double similarity) const {
    ClassificationSignals s;
    s.similarity = similarity;
    s.keyword_overlap = jaccard(memory.keywords, candidate.keywords);

    std::vector<std::string> shared = intersection(memory.keywords, candidate.keywords);
    s.shared_keywords = static_cast<int>(shared.size());

    s.identical_content = normalize_text(memory.content) == normalize_text(candidate.content);
    if (!s.identical_content) {
        s.contradiction = detect_contradiction(memory.content, candidate.content, shared,
                                               entities_overlap(memory.entities, candidate.entities));
    }
    return s;
}

std::vector<Relationship> RelationshipClassifier::classify(const Memory& memory) {
    std::vector<Relationship> edges;
    std::vector<VectorHit> hits = candidates(memory);

    LOG_DEBUG("[Classifier] %s: %zu candidates", memory.id.c_str(), hits.size());

    for (size_t i = 0; i < hits.size(); ++i) {
        Memory candidate;
        if (!store_.get_memory(hits[i].entry->id, candidate)) {
            LOG_WARN("[Classifier] Skipping unreadable candidate %s: %s",
                     hits[i].entry->id.c_str(), store_.last_error().c_str());
            continue;
        }

        ClassificationSignals signals = compute_signals(memory, candidate, hits[i].similarity);
        RelationshipDecision decision = decide_relationship(signals, config_);
        if (!decision.has_edge) continue;

        Relationship rel;
        rel.id = generate_uuid();
        rel.owner_id = memory.owner_id;
        rel.from_id = memory.id;
        rel.to_id = candidate.id;
        rel.kind = decision.kind;
        rel.confidence = clamp(decision.confidence, 0.0, 1.0);
        rel.similarity = signals.similarity;
        rel.reason = decision.reason;
        rel.created_at = memory.created_at;
        edges.push_back(rel);

        LOG_DEBUG("[Classifier] %s -[%s %.2f]-> %s", memory.id.c_str(),
                  relationship_kind_to_string(rel.kind).c_str(), rel.confidence, candidate.id.c_str());
    }
    return edges;
}

} // namespace engram
