/*
 * Engram C++11 - Memory SQLite Store Implementation
 */
#include <engram/memory/store.hpp>
#include <engram/memory/serialization.hpp>
#include <engram/core/json.hpp>
#include <engram/core/logger.hpp>
#include <cstdlib>
#include <cstring>

namespace engram {

namespace {

const char* MEMORY_COLUMNS =
    "id, owner_id, content, title, embedding, keywords, entities, created_at, "
    "access_count, last_accessed_at, is_latest, tier, source_document_id, chunk_index, version";

const char* RELATIONSHIP_COLUMNS =
    "id, owner_id, from_id, to_id, kind, confidence, similarity, reason, created_at";

const char* DOCUMENT_COLUMNS =
    "id, owner_id, title, raw_content, status, memory_ids, error_message, "
    "created_at, updated_at, processed_at";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* txt = sqlite3_column_text(stmt, col);
    return txt ? reinterpret_cast<const char*>(txt) : "";
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

// Stored JSON columns are written by this store; a parse failure means a
// damaged row
bool parse_json_column(const std::string& text, Json& out) {
    if (text.empty()) {
        out = Json();
        return true;
    }
    try {
        out = Json::parse(text);
        return true;
    } catch (const std::runtime_error& e) {
        LOG_WARN("[Store] malformed JSON column: %s", e.what());
        return false;
    }
}

} // anonymous namespace

MemoryStore::MemoryStore()
    : db_(nullptr)
    , dimensions_(0)
{
}

MemoryStore::~MemoryStore() {
    close();
}

bool MemoryStore::open(const std::string& db_path) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        close();
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    if (db_path != ":memory:") {
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
    }
    LOG_DEBUG("[Store] opened %s", db_path.c_str());
    return true;
}

void MemoryStore::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool MemoryStore::is_open() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return db_ != nullptr;
}

bool MemoryStore::require_open() {
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    return true;
}

bool MemoryStore::ensure_schema() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT"
        ")"
    )) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id TEXT PRIMARY KEY,"
        "  owner_id TEXT NOT NULL,"
        "  content TEXT NOT NULL,"
        "  title TEXT,"
        "  embedding BLOB NOT NULL,"
        "  keywords TEXT,"
        "  entities TEXT,"
        "  created_at INTEGER NOT NULL,"
        "  access_count INTEGER DEFAULT 0,"
        "  last_accessed_at INTEGER DEFAULT 0,"
        "  is_latest INTEGER DEFAULT 1,"
        "  tier TEXT DEFAULT 'hot',"
        "  source_document_id TEXT,"
        "  chunk_index INTEGER DEFAULT 0,"
        "  version INTEGER DEFAULT 0"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_owner ON memories(owner_id, created_at)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_document ON memories(source_document_id)")) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS relationships ("
        "  id TEXT PRIMARY KEY,"
        "  owner_id TEXT NOT NULL,"
        "  from_id TEXT NOT NULL,"
        "  to_id TEXT NOT NULL,"
        "  kind TEXT NOT NULL,"
        "  confidence REAL,"
        "  similarity REAL,"
        "  reason TEXT,"
        "  created_at INTEGER,"
        "  UNIQUE (from_id, to_id, kind)"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_relationships_from ON relationships(from_id)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_relationships_to ON relationships(to_id)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_relationships_owner ON relationships(owner_id)")) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS documents ("
        "  id TEXT PRIMARY KEY,"
        "  owner_id TEXT NOT NULL,"
        "  title TEXT,"
        "  raw_content TEXT,"
        "  status TEXT NOT NULL,"
        "  memory_ids TEXT,"
        "  error_message TEXT,"
        "  created_at INTEGER,"
        "  updated_at INTEGER,"
        "  processed_at INTEGER"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_documents_owner ON documents(owner_id)")) return false;

    if (get_meta("schema_version").empty()) {
        set_meta("schema_version", "1");
    }
    return true;
}

bool MemoryStore::check_dimensions(int dimensions) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::string stored = get_meta("embedding_dimensions");
    if (stored.empty()) {
        if (!set_meta("embedding_dimensions", std::to_string(dimensions))) return false;
    } else if (std::atoi(stored.c_str()) != dimensions) {
        set_error("database holds " + stored + "-dimensional embeddings, configured for " +
                  std::to_string(dimensions));
        return false;
    }
    dimensions_ = dimensions;
    return true;
}

// ============ Embedding blobs ============

std::string MemoryStore::encode_embedding(const std::vector<float>& embedding) {
    std::string blob;
    blob.resize(embedding.size() * 4);
    for (size_t i = 0; i < embedding.size(); ++i) {
        uint32_t bits;
        std::memcpy(&bits, &embedding[i], sizeof(bits));
        blob[i * 4 + 0] = static_cast<char>(bits & 0xFF);
        blob[i * 4 + 1] = static_cast<char>((bits >> 8) & 0xFF);
        blob[i * 4 + 2] = static_cast<char>((bits >> 16) & 0xFF);
        blob[i * 4 + 3] = static_cast<char>((bits >> 24) & 0xFF);
    }
    return blob;
}

bool MemoryStore::decode_embedding(const void* blob, int bytes, std::vector<float>& out) {
    out.clear();
    if (!blob || bytes <= 0 || bytes % 4 != 0) return false;
    const unsigned char* p = static_cast<const unsigned char*>(blob);
    size_t n = static_cast<size_t>(bytes) / 4;
    out.resize(n);
    for (size_t i = 0; i < n; ++i) {
        uint32_t bits = static_cast<uint32_t>(p[i * 4]) |
                        (static_cast<uint32_t>(p[i * 4 + 1]) << 8) |
                        (static_cast<uint32_t>(p[i * 4 + 2]) << 16) |
                        (static_cast<uint32_t>(p[i * 4 + 3]) << 24);
        std::memcpy(&out[i], &bits, sizeof(bits));
    }
    return true;
}

// ============ Memories ============

bool MemoryStore::insert_memory(const Memory& m) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    std::string sql = std::string("INSERT INTO memories (") + MEMORY_COLUMNS + ") "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    std::string blob = encode_embedding(m.embedding);
    bind_text(stmt, 1, m.id);
    bind_text(stmt, 2, m.owner_id);
    bind_text(stmt, 3, m.content);
    bind_text(stmt, 4, m.title);
    sqlite3_bind_blob(stmt, 5, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    bind_text(stmt, 6, Json::from_strings(m.keywords).dump());
    bind_text(stmt, 7, entities_to_json(m.entities).dump());
    sqlite3_bind_int64(stmt, 8, m.created_at);
    sqlite3_bind_int64(stmt, 9, m.access_count);
    sqlite3_bind_int64(stmt, 10, m.last_accessed_at);
    sqlite3_bind_int(stmt, 11, m.is_latest ? 1 : 0);
    bind_text(stmt, 12, memory_tier_to_string(m.tier));
    bind_text(stmt, 13, m.source_document_id);
    sqlite3_bind_int(stmt, 14, m.chunk_index);
    sqlite3_bind_int64(stmt, 15, m.version);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool MemoryStore::read_memory_row(sqlite3_stmt* stmt, Memory& out) {
    out = Memory();
    out.id = column_text(stmt, 0);
    out.owner_id = column_text(stmt, 1);
    out.content = column_text(stmt, 2);
    out.title = column_text(stmt, 3);

    if (!decode_embedding(sqlite3_column_blob(stmt, 4), sqlite3_column_bytes(stmt, 4), out.embedding) ||
        (dimensions_ > 0 && static_cast<int>(out.embedding.size()) != dimensions_)) {
        set_error("memory " + out.id + " has an undecodable embedding");
        return false;
    }

    Json keywords;
    Json entities;
    if (!parse_json_column(column_text(stmt, 5), keywords) ||
        !parse_json_column(column_text(stmt, 6), entities)) {
        set_error("memory " + out.id + " has malformed keyword or entity data");
        return false;
    }
    out.keywords = keywords.to_strings();
    out.entities = entities_from_json(entities);

    out.created_at = sqlite3_column_int64(stmt, 7);
    out.access_count = sqlite3_column_int64(stmt, 8);
    out.last_accessed_at = sqlite3_column_int64(stmt, 9);
    out.is_latest = sqlite3_column_int(stmt, 10) != 0;
    out.tier = string_to_memory_tier(column_text(stmt, 11));
    out.source_document_id = column_text(stmt, 12);
    out.chunk_index = sqlite3_column_int(stmt, 13);
    out.version = sqlite3_column_int64(stmt, 14);
    return true;
}

bool MemoryStore::get_memory(const std::string& id, Memory& out) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;
    clear_error();

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS + " FROM memories WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, id);

    bool found = false;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        found = read_memory_row(stmt, out);
    } else if (rc != SQLITE_DONE) {
        set_error_from_db();
    }
    sqlite3_finalize(stmt);
    return found;
}

std::vector<Memory> MemoryStore::query_memories(const char* where_sql, const std::string& param) {
    std::vector<Memory> result;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return result;

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS + " FROM memories " + where_sql;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return result;
    }
    bind_text(stmt, 1, param);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Memory m;
        if (read_memory_row(stmt, m)) {
            result.push_back(m);
        } else {
            LOG_WARN("[Store] skipping row: %s", last_error().c_str());
        }
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<Memory> MemoryStore::list_memories(const std::string& owner_id) {
    return query_memories("WHERE owner_id = ? ORDER BY created_at, chunk_index", owner_id);
}

std::vector<Memory> MemoryStore::list_document_memories(const std::string& document_id) {
    return query_memories("WHERE source_document_id = ? ORDER BY chunk_index", document_id);
}

std::vector<Memory> MemoryStore::load_all_memories(size_t& skipped) {
    std::vector<Memory> result;
    skipped = 0;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return result;

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS + " FROM memories ORDER BY created_at";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Memory m;
        if (read_memory_row(stmt, m)) {
            result.push_back(m);
        } else {
            ++skipped;
            LOG_WARN("[Store] skipping row during load: %s", last_error().c_str());
        }
    }
    sqlite3_finalize(stmt);
    return result;
}

bool MemoryStore::update_access(const std::string& id, int64_t access_count, int64_t last_accessed_at) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    // Counters only grow; a slower writer must not roll one back
    const char* sql =
        "UPDATE memories SET access_count = MAX(access_count, ?), "
        "last_accessed_at = MAX(last_accessed_at, ?) WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_int64(stmt, 1, access_count);
    sqlite3_bind_int64(stmt, 2, last_accessed_at);
    bind_text(stmt, 3, id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool MemoryStore::update_tier(const std::string& id, MemoryTier tier) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    const char* sql = "UPDATE memories SET tier = ? WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, memory_tier_to_string(tier));
    bind_text(stmt, 2, id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool MemoryStore::get_version(const std::string& id, int64_t& version, bool& is_latest) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    const char* sql = "SELECT version, is_latest FROM memories WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, id);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int64(stmt, 0);
        is_latest = sqlite3_column_int(stmt, 1) != 0;
        found = true;
    } else {
        set_error("memory not found: " + id);
    }
    sqlite3_finalize(stmt);
    return found;
}

ErrorCode MemoryStore::mark_superseded(const std::string& id, int64_t expected_version) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return ErrorCode::STORAGE_FAILURE;

    const char* sql =
        "UPDATE memories SET is_latest = 0, version = version + 1 "
        "WHERE id = ? AND version = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return ErrorCode::STORAGE_FAILURE;
    }
    bind_text(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, expected_version);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return ErrorCode::STORAGE_FAILURE;
    }
    if (sqlite3_changes(db_) == 0) {
        int64_t current = 0;
        bool latest = false;
        if (!get_version(id, current, latest)) {
            return ErrorCode::NOT_FOUND;
        }
        set_error("version conflict on memory " + id + ": expected " +
                  std::to_string(expected_version) + ", found " + std::to_string(current));
        return ErrorCode::CONCURRENCY_CONFLICT;
    }
    return ErrorCode::NONE;
}

int64_t MemoryStore::count_where(const char* sql, const std::string& param) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return 0;
    }
    bind_text(stmt, 1, param);

    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

int64_t MemoryStore::count_memories(const std::string& owner_id) {
    return count_where("SELECT COUNT(*) FROM memories WHERE owner_id = ?", owner_id);
}

// ============ Relationships ============

bool MemoryStore::insert_relationship(const Relationship& rel) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    std::string sql = std::string("INSERT INTO relationships (") + RELATIONSHIP_COLUMNS + ") "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, rel.id);
    bind_text(stmt, 2, rel.owner_id);
    bind_text(stmt, 3, rel.from_id);
    bind_text(stmt, 4, rel.to_id);
    bind_text(stmt, 5, relationship_kind_to_string(rel.kind));
    sqlite3_bind_double(stmt, 6, rel.confidence);
    sqlite3_bind_double(stmt, 7, rel.similarity);
    bind_text(stmt, 8, rel.reason);
    sqlite3_bind_int64(stmt, 9, rel.created_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool MemoryStore::has_relationship(const std::string& from_id, const std::string& to_id,
                                   RelationshipKind kind) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    const char* sql = "SELECT 1 FROM relationships WHERE from_id = ? AND to_id = ? AND kind = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, from_id);
    bind_text(stmt, 2, to_id);
    bind_text(stmt, 3, relationship_kind_to_string(kind));

    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return exists;
}

void MemoryStore::read_relationship_row(sqlite3_stmt* stmt, Relationship& out) {
    out.id = column_text(stmt, 0);
    out.owner_id = column_text(stmt, 1);
    out.from_id = column_text(stmt, 2);
    out.to_id = column_text(stmt, 3);
    if (!string_to_relationship_kind(column_text(stmt, 4), out.kind)) {
        out.kind = RelationshipKind::SIMILAR;
    }
    out.confidence = sqlite3_column_double(stmt, 5);
    out.similarity = sqlite3_column_double(stmt, 6);
    out.reason = column_text(stmt, 7);
    out.created_at = sqlite3_column_int64(stmt, 8);
}

std::vector<Relationship> MemoryStore::query_relationships(const char* where_sql,
                                                           const std::string& param,
                                                           int bind_count) {
    std::vector<Relationship> result;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return result;

    std::string sql = std::string("SELECT ") + RELATIONSHIP_COLUMNS + " FROM relationships " + where_sql;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return result;
    }
    for (int i = 1; i <= bind_count; ++i) {
        bind_text(stmt, i, param);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Relationship r;
        read_relationship_row(stmt, r);
        result.push_back(r);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<Relationship> MemoryStore::relationships_for(const std::string& memory_id) {
    return query_relationships("WHERE from_id = ? OR to_id = ? ORDER BY created_at", memory_id, 2);
}

std::vector<Relationship> MemoryStore::list_relationships(const std::string& owner_id) {
    return query_relationships("WHERE owner_id = ? ORDER BY created_at", owner_id, 1);
}

std::map<std::string, int64_t> MemoryStore::relationship_kind_counts(const std::string& owner_id) {
    std::map<std::string, int64_t> counts;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return counts;

    const char* sql = "SELECT kind, COUNT(*) FROM relationships WHERE owner_id = ? GROUP BY kind";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return counts;
    }
    bind_text(stmt, 1, owner_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        counts[column_text(stmt, 0)] = sqlite3_column_int64(stmt, 1);
    }
    sqlite3_finalize(stmt);
    return counts;
}

// ============ Documents ============

bool MemoryStore::insert_document(const Document& doc) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    std::string sql = std::string("INSERT INTO documents (") + DOCUMENT_COLUMNS + ") "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, doc.id);
    bind_text(stmt, 2, doc.owner_id);
    bind_text(stmt, 3, doc.title);
    bind_text(stmt, 4, doc.raw_content);
    bind_text(stmt, 5, document_status_to_string(doc.status));
    bind_text(stmt, 6, Json::from_strings(doc.memory_ids).dump());
    bind_text(stmt, 7, doc.error_message);
    sqlite3_bind_int64(stmt, 8, doc.created_at);
    sqlite3_bind_int64(stmt, 9, doc.updated_at);
    sqlite3_bind_int64(stmt, 10, doc.processed_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

ErrorCode MemoryStore::update_document(const Document& doc) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return ErrorCode::STORAGE_FAILURE;

    const char* sql =
        "UPDATE documents SET title = ?, status = ?, memory_ids = ?, error_message = ?, "
        "updated_at = ?, processed_at = ? WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return ErrorCode::STORAGE_FAILURE;
    }
    bind_text(stmt, 1, doc.title);
    bind_text(stmt, 2, document_status_to_string(doc.status));
    bind_text(stmt, 3, Json::from_strings(doc.memory_ids).dump());
    bind_text(stmt, 4, doc.error_message);
    sqlite3_bind_int64(stmt, 5, doc.updated_at);
    sqlite3_bind_int64(stmt, 6, doc.processed_at);
    bind_text(stmt, 7, doc.id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return ErrorCode::STORAGE_FAILURE;
    }
    if (sqlite3_changes(db_) == 0) {
        set_error("document not found: " + doc.id);
        return ErrorCode::NOT_FOUND;
    }
    return ErrorCode::NONE;
}

void MemoryStore::read_document_row(sqlite3_stmt* stmt, Document& out) {
    out = Document();
    out.id = column_text(stmt, 0);
    out.owner_id = column_text(stmt, 1);
    out.title = column_text(stmt, 2);
    out.raw_content = column_text(stmt, 3);
    out.status = string_to_document_status(column_text(stmt, 4));
    Json ids;
    if (parse_json_column(column_text(stmt, 5), ids)) {
        out.memory_ids = ids.to_strings();
    }
    out.error_message = column_text(stmt, 6);
    out.created_at = sqlite3_column_int64(stmt, 7);
    out.updated_at = sqlite3_column_int64(stmt, 8);
    out.processed_at = sqlite3_column_int64(stmt, 9);
}

bool MemoryStore::get_document(const std::string& id, Document& out) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    std::string sql = std::string("SELECT ") + DOCUMENT_COLUMNS + " FROM documents WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, id);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        read_document_row(stmt, out);
        found = true;
    }
    sqlite3_finalize(stmt);
    return found;
}

std::vector<Document> MemoryStore::list_documents(const std::string& owner_id) {
    std::vector<Document> result;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return result;

    std::string sql = std::string("SELECT ") + DOCUMENT_COLUMNS +
                      " FROM documents WHERE owner_id = ? ORDER BY created_at";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return result;
    }
    bind_text(stmt, 1, owner_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Document d;
        read_document_row(stmt, d);
        result.push_back(d);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<Document> MemoryStore::list_unfinished_documents() {
    std::vector<Document> result;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return result;

    std::string sql = std::string("SELECT ") + DOCUMENT_COLUMNS +
                      " FROM documents WHERE status NOT IN ('done', 'failed') ORDER BY created_at";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return result;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Document doc;
        read_document_row(stmt, doc);
        result.push_back(doc);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool MemoryStore::delete_owner(const std::string& owner_id, ClearReport& report) {
    StoreTransaction tx(*this);
    if (!tx.active()) return false;

    report.memories = count_where("SELECT COUNT(*) FROM memories WHERE owner_id = ?", owner_id);
    report.relationships = count_where("SELECT COUNT(*) FROM relationships WHERE owner_id = ?", owner_id);
    report.documents = count_where("SELECT COUNT(*) FROM documents WHERE owner_id = ?", owner_id);

    const char* statements[] = {
        "DELETE FROM relationships WHERE owner_id = ?",
        "DELETE FROM memories WHERE owner_id = ?",
        "DELETE FROM documents WHERE owner_id = ?"
    };
    for (size_t i = 0; i < sizeof(statements) / sizeof(statements[0]); ++i) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, statements[i], -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db();
            return false;
        }
        bind_text(stmt, 1, owner_id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }
    return tx.commit();
}

// ============ Meta ============

bool MemoryStore::set_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!require_open()) return false;

    const char* sql = "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, value);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

std::string MemoryStore::get_meta(const std::string& key, const std::string& default_val) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) return default_val;

    const char* sql = "SELECT value FROM meta WHERE key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) return default_val;
    bind_text(stmt, 1, key);

    std::string result = default_val;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

// ============ Helpers ============

std::string MemoryStore::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    std::map<std::thread::id, std::string>::const_iterator it = errors_.find(std::this_thread::get_id());
    return it != errors_.end() ? it->second : std::string();
}

bool MemoryStore::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        set_error(err_msg ? err_msg : "unknown SQLite error");
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

void MemoryStore::set_error(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        errors_[std::this_thread::get_id()] = error;
    }
    LOG_DEBUG("[Store] %s", error.c_str());
}

void MemoryStore::clear_error() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    errors_.erase(std::this_thread::get_id());
}

void MemoryStore::set_error_from_db() {
    if (db_) {
        set_error(sqlite3_errmsg(db_));
    } else {
        set_error("Database not open");
    }
}

// ============ Transactions ============

StoreTransaction::StoreTransaction(MemoryStore& store)
    : store_(store)
    , lock_(store.mutex_)
    , active_(false)
{
    if (store_.require_open()) {
        active_ = store_.exec("BEGIN IMMEDIATE");
    }
}

StoreTransaction::~StoreTransaction() {
    if (active_) {
        rollback();
    }
}

bool StoreTransaction::commit() {
    if (!active_) return false;
    if (!store_.exec("COMMIT")) {
        rollback();
        return false;
    }
    active_ = false;
    return true;
}

void StoreTransaction::rollback() {
    if (!active_) return;
    active_ = false;
    if (!store_.exec("ROLLBACK")) {
        LOG_ERROR("[Store] rollback failed: %s", store_.last_error().c_str());
    }
}

} // namespace engram
