/*
 * Engram C++11 - Memory engine
 *
 * Owns the store, the vector index, the providers and the pipeline, and
 * exposes ingestion, retrieval and graph inspection.
 */
#ifndef ENGRAM_MEMORY_ENGINE_HPP
#define ENGRAM_MEMORY_ENGINE_HPP

#include "types.hpp"
#include "store.hpp"
#include "vector_index.hpp"
#include "classifier.hpp"
#include "tiering.hpp"
#include "ranking.hpp"
#include "pipeline.hpp"
#include <engram/core/thread_pool.hpp>
#include <engram/providers/embedding.hpp>
#include <engram/providers/entity_extractor.hpp>
#include <memory>
#include <string>
#include <vector>

namespace engram {

class MemoryEngine {
public:
    // Providers are built from config.embedding; the extractor is the
    // pattern extractor
    explicit MemoryEngine(const EngineConfig& config);

    // Injected collaborators. A NULL clock means wall-clock time.
    MemoryEngine(const EngineConfig& config,
                 std::unique_ptr<EmbeddingProvider> embedder,
                 std::unique_ptr<EntityExtractor> extractor,
                 ClockFn clock);

    ~MemoryEngine();

    // Opens the database, checks the embedding dimensionality, loads the
    // vector index and starts the workers. `start_scheduler` also starts
    // the periodic rebalance thread.
    bool initialize(bool start_scheduler = true);
    void shutdown();
    bool is_initialized() const { return initialized_; }

    std::string last_error() const { return last_error_; }

    // ---- Ingestion ----
    DocumentResult ingest(const std::string& owner_id, const std::string& text,
                          const std::string& title = "");
    // Returns the Queued document; processing continues on the worker pool
    DocumentResult submit(const std::string& owner_id, const std::string& text,
                          const std::string& title = "");
    // Document without its raw content
    DocumentResult get_document_status(const std::string& document_id);
    DocumentResult get_document(const std::string& document_id);
    MemoryListResult get_document_memories(const std::string& document_id);

    // Blocks until every submitted document reached a terminal state
    void wait_idle();

    // ---- Retrieval ----
    SearchResult search(const std::string& owner_id, const std::string& query,
                        const SearchOptions& options = SearchOptions());
    SearchResult timeline(const std::string& owner_id, const std::string& topic);

    // Counts as an access
    MemoryResult get_memory(const std::string& memory_id);

    // Breadth-first walk over edges in both directions. An empty `kinds`
    // follows every edge.
    SubgraphResult get_related(const std::string& memory_id, int max_depth,
                               const std::vector<RelationshipKind>& kinds = std::vector<RelationshipKind>());

    // ---- Graph ----
    bool export_graph(const std::string& owner_id, GraphExport& out);
    bool graph_stats(const std::string& owner_id, GraphStats& out);
    bool clear_all(const std::string& owner_id, ClearReport& out);

    // ---- Tiering ----
    RebalanceReport rebalance();
    TierStats tier_stats(const std::string& owner_id);

    const EngineConfig& config() const { return config_; }
    MemoryStore& store() { return store_; }
    VectorIndex& index() { return index_; }

private:
    EngineConfig config_;
    ClockFn clock_;
    bool initialized_;
    std::string last_error_;

    MemoryStore store_;
    VectorIndex index_;
    std::unique_ptr<EmbeddingProvider> embedder_;
    std::unique_ptr<EntityExtractor> extractor_;
    std::unique_ptr<RelationshipClassifier> classifier_;
    std::unique_ptr<TieringManager> tiering_;
    std::unique_ptr<RankingEngine> ranking_;
    std::unique_ptr<IngestionPipeline> pipeline_;
    std::unique_ptr<RebalanceScheduler> scheduler_;
    std::unique_ptr<ThreadPool> workers_;

    void hydrate();
    // Documents a previous run left mid-pipeline are marked Failed
    void recover_interrupted();
    bool load_memory(const std::string& memory_id, Memory& out);
    DocumentResult not_initialized() const;

    MemoryEngine(const MemoryEngine&);
    MemoryEngine& operator=(const MemoryEngine&);
};

} // namespace engram

#endif // ENGRAM_MEMORY_ENGINE_HPP
