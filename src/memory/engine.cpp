/*
 * Engram C++11 - Memory engine
 */
#include <engram/memory/engine.hpp>
#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <deque>
#include <set>

namespace engram {

namespace {

const size_t MAX_SUBGRAPH_NODES = 200;

bool kind_selected(const std::vector<RelationshipKind>& kinds, RelationshipKind kind) {
    return kinds.empty() || std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

} // anonymous namespace

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_config(const Config& cfg) {
    EngineConfig c;
    c.db_path = cfg.get_string("database.path", c.db_path);
    c.workers = static_cast<int>(cfg.get_int("workers", c.workers));

    EmbeddingConfig& e = c.embedding;
    e.provider = cfg.get_string("embedding.provider", e.provider);
    e.dimensions = static_cast<int>(cfg.get_int("embedding.dimensions", e.dimensions));
    e.url = cfg.get_string("embedding.url", e.url);
    e.model = cfg.get_string("embedding.model", e.model);
    e.api_key = cfg.get_string("embedding.api_key", e.api_key);
    e.timeout_ms = static_cast<int>(cfg.get_int("embedding.timeout_ms", e.timeout_ms));
    e.cache = cfg.get_bool("embedding.cache", e.cache);
    e.cache_max_entries = static_cast<int>(cfg.get_int("embedding.cache_max_entries", e.cache_max_entries));

    c.chunking.max_chars = static_cast<int>(cfg.get_int("chunking.max_chars", c.chunking.max_chars));

    ClassifierConfig& r = c.relationships;
    r.update_threshold = cfg.get_double("relationships.update_threshold", r.update_threshold);
    r.extend_threshold = cfg.get_double("relationships.extend_threshold", r.extend_threshold);
    r.overlap_threshold = cfg.get_double("relationships.overlap_threshold", r.overlap_threshold);
    r.similar_floor = cfg.get_double("relationships.similar_floor", r.similar_floor);
    r.candidate_floor = cfg.get_double("relationships.candidate_floor", r.candidate_floor);
    r.max_candidates = static_cast<int>(cfg.get_int("relationships.max_candidates", r.max_candidates));
    r.min_shared_keywords = static_cast<int>(cfg.get_int("relationships.min_shared_keywords", r.min_shared_keywords));

    TieringConfig& t = c.tiering;
    t.enabled = cfg.get_bool("tiering.enabled", t.enabled);
    t.hot_age_days = static_cast<int>(cfg.get_int("tiering.hot_age_days", t.hot_age_days));
    t.promotion_threshold = static_cast<int>(cfg.get_int("tiering.promotion_threshold", t.promotion_threshold));
    t.rebalance_interval_seconds = static_cast<int>(
        cfg.get_int("tiering.rebalance_interval_seconds", t.rebalance_interval_seconds));

    SearchConfig& s = c.search;
    s.half_life_days = cfg.get_double("search.half_life_days", s.half_life_days);
    s.semantic_weight = cfg.get_double("search.semantic_weight", s.semantic_weight);
    s.candidate_multiplier = static_cast<int>(cfg.get_int("search.candidate_multiplier", s.candidate_multiplier));
    s.default_limit = static_cast<int>(cfg.get_int("search.default_limit", s.default_limit));
    s.max_limit = static_cast<int>(cfg.get_int("search.max_limit", s.max_limit));

    RetryPolicy& p = c.retry;
    p.max_attempts = static_cast<int>(cfg.get_int("retry.max_attempts", p.max_attempts));
    p.initial_backoff_ms = static_cast<int>(cfg.get_int("retry.initial_backoff_ms", p.initial_backoff_ms));
    p.max_backoff_ms = static_cast<int>(cfg.get_int("retry.max_backoff_ms", p.max_backoff_ms));

    return c;
}

// ============================================================================
// Lifecycle
// ============================================================================

MemoryEngine::MemoryEngine(const EngineConfig& config)
    : config_(config)
    , clock_(current_timestamp_ms)
    , initialized_(false)
    , embedder_(create_embedding_provider(config.embedding))
    , extractor_(new PatternEntityExtractor())
{
}

MemoryEngine::MemoryEngine(const EngineConfig& config,
                           std::unique_ptr<EmbeddingProvider> embedder,
                           std::unique_ptr<EntityExtractor> extractor,
                           ClockFn clock)
    : config_(config)
    , clock_(clock ? clock : ClockFn(current_timestamp_ms))
    , initialized_(false)
    , embedder_(std::move(embedder))
    , extractor_(std::move(extractor))
{
}

MemoryEngine::~MemoryEngine() {
    shutdown();
}

bool MemoryEngine::initialize(bool start_scheduler) {
    if (initialized_) {
        return true;
    }
    if (!embedder_) {
        last_error_ = "unknown embedding provider: " + config_.embedding.provider;
        LOG_ERROR("[Engine] %s", last_error_.c_str());
        return false;
    }
    if (!extractor_) {
        last_error_ = "no entity extractor";
        return false;
    }

    if (config_.db_path != ":memory:") {
        std::string dir = dirname(config_.db_path);
        if (!dir.empty() && dir != "." && !path_exists(dir) && !mkdir_p(dir)) {
            last_error_ = "cannot create directory " + dir;
            LOG_ERROR("[Engine] %s", last_error_.c_str());
            return false;
        }
    }

    if (!store_.open(config_.db_path) || !store_.ensure_schema()) {
        last_error_ = store_.last_error();
        LOG_ERROR("[Engine] Failed to open %s: %s", config_.db_path.c_str(), last_error_.c_str());
        store_.close();
        return false;
    }
    if (!store_.check_dimensions(embedder_->dimensions())) {
        last_error_ = store_.last_error();
        LOG_ERROR("[Engine] %s", last_error_.c_str());
        store_.close();
        return false;
    }

    classifier_.reset(new RelationshipClassifier(store_, index_, config_.relationships));
    tiering_.reset(new TieringManager(store_, index_, config_.tiering, clock_));
    ranking_.reset(new RankingEngine(store_, index_, *embedder_, *tiering_, config_.search, clock_));
    pipeline_.reset(new IngestionPipeline(store_, index_, *embedder_, *extractor_, *classifier_,
                                          *tiering_, config_.chunking, config_.retry, clock_));

    hydrate();
    recover_interrupted();

    workers_.reset(new ThreadPool(config_.workers > 0 ? static_cast<size_t>(config_.workers) : 1));
    scheduler_.reset(new RebalanceScheduler(*tiering_, config_.tiering.rebalance_interval_seconds));
    if (start_scheduler && config_.tiering.enabled) {
        scheduler_->start();
    }

    initialized_ = true;
    LOG_INFO("[Engine] Ready: %s, embedding=%s (%d dims), %zu memories indexed",
             config_.db_path.c_str(), embedder_->provider_id().c_str(),
             embedder_->dimensions(), index_.size());
    return true;
}

void MemoryEngine::shutdown() {
    if (!initialized_) {
        return;
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    if (workers_) {
        workers_->shutdown();
    }
    store_.close();
    initialized_ = false;
    LOG_DEBUG("[Engine] Shut down");
}

void MemoryEngine::hydrate() {
    size_t skipped = 0;
    std::vector<Memory> memories = store_.load_all_memories(skipped);

    index_.clear();
    for (size_t i = 0; i < memories.size(); ++i) {
        index_.insert(memories[i]);
    }
    if (skipped > 0) {
        LOG_WARN("[Engine] Skipped %zu unreadable memories while loading", skipped);
    }
    LOG_DEBUG("[Engine] Loaded %zu memories into the index", memories.size());
}

void MemoryEngine::recover_interrupted() {
    std::vector<Document> docs = store_.list_unfinished_documents();
    for (std::vector<Document>::iterator it = docs.begin(); it != docs.end(); ++it) {
        std::string stage = document_status_to_string(it->status);
        it->status = DocumentStatus::FAILED;
        it->error_message = "interrupted while " + stage;
        it->updated_at = clock_();
        it->processed_at = it->updated_at;
        if (store_.update_document(*it) != ErrorCode::NONE) {
            LOG_ERROR("[Engine] Cannot mark %s failed: %s", it->id.c_str(), store_.last_error().c_str());
            continue;
        }
        LOG_WARN("[Engine] Document %s was interrupted while %s; marked failed",
                 it->id.c_str(), stage.c_str());
    }
}

void MemoryEngine::wait_idle() {
    if (workers_) {
        workers_->wait_idle();
    }
}

DocumentResult MemoryEngine::not_initialized() const {
    return DocumentResult::fail(ErrorCode::STORAGE_FAILURE, "engine not initialized");
}

// ============================================================================
// Ingestion
// ============================================================================

DocumentResult MemoryEngine::ingest(const std::string& owner_id, const std::string& text,
                                    const std::string& title) {
    if (!initialized_) return not_initialized();
    return pipeline_->ingest(owner_id, text, title);
}

DocumentResult MemoryEngine::submit(const std::string& owner_id, const std::string& text,
                                    const std::string& title) {
    if (!initialized_) return not_initialized();

    DocumentResult created = pipeline_->create_document(owner_id, text, title);
    if (!created.success) {
        return created;
    }

    IngestionPipeline* pipeline = pipeline_.get();
    Document doc = created.document;
    if (!workers_->enqueue([pipeline, doc]() { pipeline->process(doc); })) {
        LOG_WARN("[Engine] Worker pool stopped; processing %s inline", doc.id.c_str());
        pipeline->process(doc);
    }
    return created;
}

DocumentResult MemoryEngine::get_document(const std::string& document_id) {
    if (!initialized_) return not_initialized();

    Document doc;
    if (!store_.get_document(document_id, doc)) {
        return DocumentResult::fail(ErrorCode::NOT_FOUND, "document not found: " + document_id);
    }
    return DocumentResult::ok(doc);
}

DocumentResult MemoryEngine::get_document_status(const std::string& document_id) {
    DocumentResult result = get_document(document_id);
    if (result.success) {
        result.document.raw_content.clear();
    }
    return result;
}

MemoryListResult MemoryEngine::get_document_memories(const std::string& document_id) {
    if (!initialized_) {
        return MemoryListResult::fail(ErrorCode::STORAGE_FAILURE, "engine not initialized");
    }
    Document doc;
    if (!store_.get_document(document_id, doc)) {
        return MemoryListResult::fail(ErrorCode::NOT_FOUND, "document not found: " + document_id);
    }

    std::vector<Memory> memories = store_.list_document_memories(document_id);
    for (size_t i = 0; i < memories.size(); ++i) {
        IndexEntryPtr entry = index_.find(memories[i].id);
        if (entry) entry->apply_to(memories[i]);
    }
    return MemoryListResult::ok(memories);
}

// ============================================================================
// Retrieval
// ============================================================================

SearchResult MemoryEngine::search(const std::string& owner_id, const std::string& query,
                                  const SearchOptions& options) {
    if (!initialized_) {
        return SearchResult::fail(ErrorCode::STORAGE_FAILURE, "engine not initialized");
    }
    return ranking_->search(owner_id, query, options);
}

SearchResult MemoryEngine::timeline(const std::string& owner_id, const std::string& topic) {
    if (!initialized_) {
        return SearchResult::fail(ErrorCode::STORAGE_FAILURE, "engine not initialized");
    }
    return ranking_->timeline(owner_id, topic);
}

bool MemoryEngine::load_memory(const std::string& memory_id, Memory& out) {
    if (!store_.get_memory(memory_id, out)) {
        return false;
    }
    IndexEntryPtr entry = index_.find(memory_id);
    if (entry) {
        entry->apply_to(out);
    }
    return true;
}

MemoryResult MemoryEngine::get_memory(const std::string& memory_id) {
    if (!initialized_) {
        return MemoryResult::fail(ErrorCode::STORAGE_FAILURE, "engine not initialized");
    }
    Memory m;
    if (!store_.get_memory(memory_id, m)) {
        return MemoryResult::fail(ErrorCode::NOT_FOUND, "memory not found: " + memory_id);
    }
    tiering_->on_access(memory_id);
    IndexEntryPtr entry = index_.find(memory_id);
    if (entry) {
        entry->apply_to(m);
    }
    return MemoryResult::ok(m);
}

SubgraphResult MemoryEngine::get_related(const std::string& memory_id, int max_depth,
                                         const std::vector<RelationshipKind>& kinds) {
    if (!initialized_) {
        return SubgraphResult::fail(ErrorCode::STORAGE_FAILURE, "engine not initialized");
    }
    if (max_depth < 0) {
        return SubgraphResult::fail(ErrorCode::VALIDATION_FAILURE, "max_depth must not be negative");
    }

    Subgraph graph;
    graph.root_id = memory_id;

    Memory root;
    if (!load_memory(memory_id, root)) {
        return SubgraphResult::fail(ErrorCode::NOT_FOUND, "memory not found: " + memory_id);
    }
    graph.nodes.push_back(root);

    std::set<std::string> visited;
    std::set<std::string> seen_edges;
    std::deque<std::pair<std::string, int> > queue;
    visited.insert(memory_id);
    queue.push_back(std::make_pair(memory_id, 0));

    while (!queue.empty()) {
        std::pair<std::string, int> current = queue.front();
        queue.pop_front();
        if (current.second >= max_depth) continue;

        std::vector<Relationship> edges = store_.relationships_for(current.first);
        for (size_t i = 0; i < edges.size(); ++i) {
            const Relationship& rel = edges[i];
            if (!kind_selected(kinds, rel.kind)) continue;
            if (seen_edges.count(rel.id)) continue;

            const std::string& other = rel.from_id == current.first ? rel.to_id : rel.from_id;
            if (!visited.count(other)) {
                if (graph.nodes.size() >= MAX_SUBGRAPH_NODES) continue;

                Memory node;
                if (!load_memory(other, node)) {
                    LOG_WARN("[Engine] Skipping unreadable neighbour %s", other.c_str());
                    continue;
                }
                visited.insert(other);
                graph.nodes.push_back(node);
                queue.push_back(std::make_pair(other, current.second + 1));
            }
            seen_edges.insert(rel.id);
            graph.edges.push_back(rel);
        }
    }
    return SubgraphResult::ok(graph);
}

// ============================================================================
// Graph
// ============================================================================

bool MemoryEngine::graph_stats(const std::string& owner_id, GraphStats& out) {
    if (!initialized_) {
        last_error_ = "engine not initialized";
        return false;
    }
    out = GraphStats();
    out.total_memories = store_.count_memories(owner_id);
    out.relationship_type_counts = store_.relationship_kind_counts(owner_id);
    for (std::map<std::string, int64_t>::const_iterator it = out.relationship_type_counts.begin();
         it != out.relationship_type_counts.end(); ++it) {
        out.total_relationships += it->second;
    }
    TierStats tiers = tiering_->tier_stats(owner_id);
    out.hot = tiers.hot;
    out.cold = tiers.cold;
    return true;
}

bool MemoryEngine::export_graph(const std::string& owner_id, GraphExport& out) {
    if (!graph_stats(owner_id, out.stats)) {
        return false;
    }
    out.nodes = store_.list_memories(owner_id);
    for (size_t i = 0; i < out.nodes.size(); ++i) {
        IndexEntryPtr entry = index_.find(out.nodes[i].id);
        if (entry) entry->apply_to(out.nodes[i]);
    }
    out.edges = store_.list_relationships(owner_id);
    return true;
}

bool MemoryEngine::clear_all(const std::string& owner_id, ClearReport& out) {
    if (!initialized_) {
        last_error_ = "engine not initialized";
        return false;
    }
    if (trim(owner_id).empty()) {
        last_error_ = "owner_id is required";
        return false;
    }

    OwnerPartitionPtr part = index_.partition(owner_id);
    std::lock_guard<std::mutex> write_lock(part->write_mutex());

    out = ClearReport();
    if (!store_.delete_owner(owner_id, out)) {
        last_error_ = store_.last_error();
        LOG_ERROR("[Engine] clear_all(%s) failed: %s", owner_id.c_str(), last_error_.c_str());
        return false;
    }
    index_.drop_owner(owner_id);

    LOG_INFO("[Engine] Cleared %s: %lld memories, %lld relationships, %lld documents",
             owner_id.c_str(), static_cast<long long>(out.memories),
             static_cast<long long>(out.relationships), static_cast<long long>(out.documents));
    return true;
}

// ============================================================================
// Tiering
// ============================================================================

RebalanceReport MemoryEngine::rebalance() {
    if (!initialized_) {
        return RebalanceReport();
    }
    return tiering_->rebalance();
}

TierStats MemoryEngine::tier_stats(const std::string& owner_id) {
    if (!initialized_) {
        return TierStats();
    }
    return tiering_->tier_stats(owner_id);
}

} // namespace engram
