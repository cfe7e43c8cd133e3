#include <engram/memory/serialization.hpp>
#include <engram/core/utils.hpp>

namespace engram {

Json entities_to_json(const EntityMap& entities) {
    Json obj = Json::object();
    for (EntityMap::const_iterator it = entities.begin(); it != entities.end(); ++it) {
        Json values = Json::array();
        for (std::set<std::string>::const_iterator v = it->second.begin(); v != it->second.end(); ++v) {
            values.push(Json(*v));
        }
        obj.set(it->first, values);
    }
    return obj;
}

EntityMap entities_from_json(const Json& json) {
    EntityMap entities;
    const std::map<std::string, Json>& obj = json.as_object();
    for (std::map<std::string, Json>::const_iterator it = obj.begin(); it != obj.end(); ++it) {
        std::vector<std::string> values = it->second.to_strings();
        if (values.empty()) continue;
        entities[it->first].insert(values.begin(), values.end());
    }
    return entities;
}

Json memory_to_json(const Memory& m, bool include_embedding) {
    Json j = Json::object();
    j.set("id", m.id);
    j.set("owner_id", m.owner_id);
    j.set("content", m.content);
    if (!m.title.empty()) j.set("title", m.title);
    j.set("keywords", Json::from_strings(m.keywords));
    j.set("entities", entities_to_json(m.entities));
    j.set("created_at", m.created_at);
    j.set("created_at_iso", format_timestamp_ms(m.created_at));
    j.set("access_count", m.access_count);
    j.set("last_accessed_at", m.last_accessed_at);
    j.set("is_latest", m.is_latest);
    j.set("tier", memory_tier_to_string(m.tier));
    j.set("source_document_id", m.source_document_id);
    j.set("chunk_index", m.chunk_index);
    j.set("version", m.version);
    if (include_embedding) {
        Json vec = Json::array();
        for (size_t i = 0; i < m.embedding.size(); ++i) {
            vec.push(Json(static_cast<double>(m.embedding[i])));
        }
        j.set("embedding", vec);
    }
    return j;
}

Json relationship_to_json(const Relationship& r) {
    Json j = Json::object();
    j.set("id", r.id);
    j.set("from_id", r.from_id);
    j.set("to_id", r.to_id);
    j.set("kind", relationship_kind_to_string(r.kind));
    j.set("confidence", r.confidence);
    j.set("similarity", r.similarity);
    j.set("reason", r.reason);
    j.set("created_at", r.created_at);
    return j;
}

Json document_to_json(const Document& d, bool include_content) {
    Json j = Json::object();
    j.set("id", d.id);
    j.set("owner_id", d.owner_id);
    j.set("title", d.title);
    j.set("status", document_status_to_string(d.status));
    j.set("memory_ids", Json::from_strings(d.memory_ids));
    j.set("memory_count", d.memory_ids.size());
    if (!d.error_message.empty()) j.set("error", d.error_message);
    j.set("created_at", d.created_at);
    j.set("updated_at", d.updated_at);
    if (d.processed_at > 0) j.set("processed_at", d.processed_at);
    if (include_content) j.set("raw_content", d.raw_content);
    return j;
}

Json scored_memory_to_json(const ScoredMemory& s) {
    Json j = Json::object();
    j.set("memory_id", s.memory.id);
    j.set("content", s.memory.content);
    if (!s.memory.title.empty()) j.set("title", s.memory.title);
    j.set("score", s.score);
    j.set("similarity", s.similarity);
    j.set("keyword_score", s.keyword_score);
    j.set("decay", s.decay);
    j.set("entities", entities_to_json(s.memory.entities));
    j.set("keywords", Json::from_strings(s.memory.keywords));
    j.set("created_at", s.memory.created_at);
    j.set("is_latest", s.memory.is_latest);
    j.set("tier", memory_tier_to_string(s.memory.tier));
    j.set("explanation", s.explanation);
    j.set("related_ids", Json::from_strings(s.related_ids));
    return j;
}

Json subgraph_to_json(const Subgraph& g) {
    Json j = Json::object();
    j.set("root_id", g.root_id);
    Json nodes = Json::array();
    for (size_t i = 0; i < g.nodes.size(); ++i) {
        nodes.push(memory_to_json(g.nodes[i]));
    }
    Json edges = Json::array();
    for (size_t i = 0; i < g.edges.size(); ++i) {
        edges.push(relationship_to_json(g.edges[i]));
    }
    j.set("nodes", nodes);
    j.set("edges", edges);
    return j;
}

Json graph_stats_to_json(const GraphStats& s) {
    Json counts = Json::object();
    for (std::map<std::string, int64_t>::const_iterator it = s.relationship_type_counts.begin();
         it != s.relationship_type_counts.end(); ++it) {
        counts.set(it->first, it->second);
    }
    Json j = Json::object();
    j.set("total_memories", s.total_memories);
    j.set("total_relationships", s.total_relationships);
    j.set("relationship_type_counts", counts);
    j.set("hot", s.hot);
    j.set("cold", s.cold);
    return j;
}

Json graph_export_to_json(const GraphExport& e) {
    Json nodes = Json::array();
    for (size_t i = 0; i < e.nodes.size(); ++i) {
        nodes.push(memory_to_json(e.nodes[i]));
    }
    Json edges = Json::array();
    for (size_t i = 0; i < e.edges.size(); ++i) {
        edges.push(relationship_to_json(e.edges[i]));
    }
    Json j = Json::object();
    j.set("nodes", nodes);
    j.set("edges", edges);
    j.set("stats", graph_stats_to_json(e.stats));
    return j;
}

Json tier_stats_to_json(const TierStats& s) {
    Json j = Json::object();
    j.set("hot", s.hot);
    j.set("cold", s.cold);
    j.set("total", s.total);
    j.set("hot_percent", s.hot_percent);
    j.set("cold_percent", s.cold_percent);
    return j;
}

Json rebalance_report_to_json(const RebalanceReport& r) {
    Json j = Json::object();
    j.set("promoted", r.promoted);
    j.set("demoted", r.demoted);
    return j;
}

Json clear_report_to_json(const ClearReport& r) {
    Json j = Json::object();
    j.set("memories", r.memories);
    j.set("relationships", r.relationships);
    j.set("documents", r.documents);
    return j;
}

} // namespace engram
