/*
 * Engram C++11 - JSON views of the memory graph records
 */
#ifndef ENGRAM_MEMORY_SERIALIZATION_HPP
#define ENGRAM_MEMORY_SERIALIZATION_HPP

#include "types.hpp"
#include <engram/core/json.hpp>

namespace engram {

Json entities_to_json(const EntityMap& entities);
EntityMap entities_from_json(const Json& json);

// Embeddings are omitted unless requested; they dominate the output size
Json memory_to_json(const Memory& m, bool include_embedding = false);
Json relationship_to_json(const Relationship& r);
Json document_to_json(const Document& d, bool include_content = false);
Json scored_memory_to_json(const ScoredMemory& s);
Json subgraph_to_json(const Subgraph& g);
Json graph_stats_to_json(const GraphStats& s);
Json graph_export_to_json(const GraphExport& e);
Json tier_stats_to_json(const TierStats& s);
Json rebalance_report_to_json(const RebalanceReport& r);
Json clear_report_to_json(const ClearReport& r);

} // namespace engram

#endif // ENGRAM_MEMORY_SERIALIZATION_HPP
