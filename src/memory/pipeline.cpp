/*
 * Engram C++11 - Ingestion pipeline
 */
#include <engram/memory/pipeline.hpp>
#include <engram/memory/store.hpp>
#include <engram/memory/vector_index.hpp>
#include <engram/memory/classifier.hpp>
#include <engram/memory/tiering.hpp>
#include <engram/providers/embedding.hpp>
#include <engram/providers/entity_extractor.hpp>

namespace engram {

IngestionPipeline::IngestionPipeline(MemoryStore& store, VectorIndex& index, EmbeddingProvider& embedder,
                                     EntityExtractor& extractor, RelationshipClassifier& classifier,
                                     TieringManager& tiering, const ChunkingConfig& chunking,
                                     const RetryPolicy& retry, ClockFn clock)
    : store_(store)
    , index_(index)
    , embedder_(embedder)
    , extractor_(extractor)
    , classifier_(classifier)
    , tiering_(tiering)
    , chunker_(chunking)
    , retry_(retry)
    , clock_(clock)
{
    if (!clock_) {
        clock_ = current_timestamp_ms;
    }
}

bool IngestionPipeline::validate(const std::string& owner_id, const std::string& text, std::string& error) {
    if (trim(owner_id).empty()) {
        error = "owner_id is required";
        return false;
    }
    if (trim(text).empty()) {
        error = "text is empty";
        return false;
    }
    return true;
}

// ============================================================================
// Document bookkeeping
// ============================================================================

DocumentResult IngestionPipeline::create_document(const std::string& owner_id, const std::string& text,
                                                  const std::string& title) {
    std::string error;
    if (!validate(owner_id, text, error)) {
        return DocumentResult::fail(ErrorCode::VALIDATION_FAILURE, error);
    }

    Document doc;
    doc.id = generate_uuid();
    doc.owner_id = owner_id;
    doc.title = title;
    doc.raw_content = text;
    doc.status = DocumentStatus::QUEUED;
    doc.created_at = clock_();
    doc.updated_at = doc.created_at;

    if (!store_.insert_document(doc)) {
        return DocumentResult::fail(ErrorCode::STORAGE_FAILURE, store_.last_error());
    }
    LOG_DEBUG("[Ingest] Queued document %s (%zu chars) for %s",
              doc.id.c_str(), text.size(), owner_id.c_str());
    return DocumentResult::ok(doc);
}

ErrorCode IngestionPipeline::set_status(Document& doc, DocumentStatus status) {
    doc.status = status;
    doc.updated_at = clock_();
    if (is_terminal(status)) {
        doc.processed_at = doc.updated_at;
    }
    ErrorCode code = store_.update_document(doc);
    if (code == ErrorCode::NOT_FOUND) {
        LOG_WARN("[Ingest] Document %s was removed; dropping status %s",
                 doc.id.c_str(), document_status_to_string(status).c_str());
    } else if (code != ErrorCode::NONE) {
        LOG_ERROR("[Ingest] Failed to record status %s for %s: %s",
                  document_status_to_string(status).c_str(), doc.id.c_str(), store_.last_error().c_str());
    }
    return code;
}

DocumentResult IngestionPipeline::fail_document(Document& doc, ErrorCode code, const std::string& error) {
    LOG_ERROR("[Ingest] Document %s failed (%s): %s",
              doc.id.c_str(), error_code_to_string(code).c_str(), error.c_str());
    doc.error_message = error;
    set_status(doc, DocumentStatus::FAILED);

    DocumentResult result = DocumentResult::fail(code, error);
    result.document = doc;
    return result;
}

// ============================================================================
// Stages
// ============================================================================

DocumentResult IngestionPipeline::process(Document doc) {
    ErrorCode code = set_status(doc, DocumentStatus::EXTRACTING);
    if (code != ErrorCode::NONE) {
        return fail_document(doc, code, store_.last_error());
    }
    std::string text = trim(TextChunker::normalize_line_endings(doc.raw_content));

    code = set_status(doc, DocumentStatus::CHUNKING);
    if (code != ErrorCode::NONE) {
        return fail_document(doc, code, store_.last_error());
    }
    std::vector<std::string> chunks = chunker_.chunk(text);
    if (chunks.empty()) {
        return fail_document(doc, ErrorCode::VALIDATION_FAILURE, "document has no content");
    }
    LOG_DEBUG("[Ingest] Document %s: %zu chunks", doc.id.c_str(), chunks.size());

    code = set_status(doc, DocumentStatus::EMBEDDING);
    if (code != ErrorCode::NONE) {
        return fail_document(doc, code, store_.last_error());
    }
    std::vector<Memory> prepared;
    prepared.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        Memory m;
        std::string error;
        code = prepare_chunk(doc, chunks[i], static_cast<int>(i), m, error);
        if (code != ErrorCode::NONE) {
            return fail_document(doc, code, error);
        }
        prepared.push_back(m);
    }

    code = set_status(doc, DocumentStatus::INDEXING);
    if (code != ErrorCode::NONE) {
        return fail_document(doc, code, store_.last_error());
    }
    for (size_t i = 0; i < prepared.size(); ++i) {
        std::string error;
        code = commit_chunk(prepared[i], error);
        if (code != ErrorCode::NONE) {
            return fail_document(doc, code, error);
        }
        doc.memory_ids.push_back(prepared[i].id);
        doc.updated_at = clock_();
        code = store_.update_document(doc);
        if (code == ErrorCode::NOT_FOUND) {
            return fail_document(doc, code, store_.last_error());
        } else if (code != ErrorCode::NONE) {
            LOG_WARN("[Ingest] Failed to record progress of %s: %s",
                     doc.id.c_str(), store_.last_error().c_str());
        }
    }

    code = set_status(doc, DocumentStatus::DONE);
    if (code != ErrorCode::NONE) {
        return fail_document(doc, code, store_.last_error());
    }
    LOG_INFO("[Ingest] Document %s done: %zu memories", doc.id.c_str(), doc.memory_ids.size());
    return DocumentResult::ok(doc);
}

DocumentResult IngestionPipeline::ingest(const std::string& owner_id, const std::string& text,
                                         const std::string& title) {
    DocumentResult created = create_document(owner_id, text, title);
    if (!created.success) {
        return created;
    }
    return process(created.document);
}

ErrorCode IngestionPipeline::prepare_chunk(const Document& doc, const std::string& text, int chunk_index,
                                           Memory& out, std::string& error) {
    EmbeddingProvider& embedder = embedder_;
    EmbeddingResult embedded = call_with_retry<EmbeddingResult>(retry_, "embedding", [&embedder, &text]() {
        return embedder.embed(text);
    });
    if (!embedded.success) {
        error = "embedding unavailable: " + embedded.error;
        return embedded.code != ErrorCode::NONE ? embedded.code : ErrorCode::EXTERNAL_FAILURE;
    }
    if (static_cast<int>(embedded.embedding.size()) != embedder_.dimensions()) {
        error = "embedding has " + std::to_string(embedded.embedding.size()) +
                " dimensions, expected " + std::to_string(embedder_.dimensions());
        return ErrorCode::EXTERNAL_FAILURE;
    }

    EntityExtractor& extractor = extractor_;
    ExtractionResult extracted = call_with_retry<ExtractionResult>(retry_, "extraction", [&extractor, &text]() {
        return extractor.extract(text);
    });
    if (!extracted.success) {
        error = "extraction unavailable: " + extracted.error;
        return extracted.code != ErrorCode::NONE ? extracted.code : ErrorCode::EXTERNAL_FAILURE;
    }

    out.id = generate_uuid();
    out.owner_id = doc.owner_id;
    out.content = text;
    out.title = doc.title;
    out.embedding = embedded.embedding;
    out.keywords = extracted.keywords;
    out.entities = extracted.entities;
    out.source_document_id = doc.id;
    out.chunk_index = chunk_index;
    out.is_latest = true;
    out.access_count = 0;
    out.version = 0;
    return ErrorCode::NONE;
}

// ============================================================================
// Commit
// ============================================================================

ErrorCode IngestionPipeline::write_chunk(const Memory& memory, const std::vector<Relationship>& edges,
                                         bool fresh_versions, std::map<std::string, int64_t>& superseded,
                                         std::string& error) {
    superseded.clear();
    StoreTransaction tx(store_);
    if (!tx.active()) {
        error = store_.last_error();
        return ErrorCode::STORAGE_FAILURE;
    }

    // A clear of the owner may have removed the document since it was queued
    Document source;
    if (!store_.get_document(memory.source_document_id, source)) {
        error = "document not found: " + memory.source_document_id;
        return ErrorCode::NOT_FOUND;
    }

    if (!store_.insert_memory(memory)) {
        error = store_.last_error();
        return ErrorCode::STORAGE_FAILURE;
    }

    for (size_t i = 0; i < edges.size(); ++i) {
        const Relationship& rel = edges[i];
        if (!store_.insert_relationship(rel)) {
            error = store_.last_error();
            return ErrorCode::STORAGE_FAILURE;
        }
        if (rel.kind != RelationshipKind::UPDATES) continue;

        int64_t version = 0;
        bool latest = true;
        IndexEntryPtr target = index_.find(rel.to_id);
        if (target && !fresh_versions) {
            version = target->version.load();
            latest = target->is_latest.load();
        } else if (!store_.get_version(rel.to_id, version, latest)) {
            error = store_.last_error();
            return ErrorCode::STORAGE_FAILURE;
        }
        if (!latest) continue;

        ErrorCode code = store_.mark_superseded(rel.to_id, version);
        if (code != ErrorCode::NONE) {
            error = store_.last_error();
            return code;
        }
        superseded[rel.to_id] = version + 1;
    }

    if (!tx.commit()) {
        error = store_.last_error();
        return ErrorCode::STORAGE_FAILURE;
    }
    return ErrorCode::NONE;
}

ErrorCode IngestionPipeline::commit_chunk(Memory& memory, std::string& error) {
    OwnerPartitionPtr part = index_.partition(memory.owner_id);
    std::lock_guard<std::mutex> write_lock(part->write_mutex());

    memory.created_at = clock_();
    memory.tier = tiering_.classify(memory, memory.created_at);

    std::vector<Relationship> edges = classifier_.classify(memory);

    std::map<std::string, int64_t> superseded;
    ErrorCode code = write_chunk(memory, edges, false, superseded, error);
    if (code == ErrorCode::CONCURRENCY_CONFLICT) {
        LOG_WARN("[Ingest] %s; retrying with fresh versions", error.c_str());
        code = write_chunk(memory, edges, true, superseded, error);
    }
    if (code != ErrorCode::NONE) {
        return code;
    }

    for (std::map<std::string, int64_t>::const_iterator it = superseded.begin(); it != superseded.end(); ++it) {
        IndexEntryPtr target = index_.find(it->first);
        if (target) {
            target->version.store(it->second);
            target->is_latest.store(false);
        }
        LOG_DEBUG("[Ingest] %s superseded by %s", it->first.c_str(), memory.id.c_str());
    }
    index_.insert(memory);

    LOG_DEBUG("[Ingest] Committed %s (chunk %d) with %zu relationships",
              memory.id.c_str(), memory.chunk_index, edges.size());
    return ErrorCode::NONE;
}

} // namespace engram
