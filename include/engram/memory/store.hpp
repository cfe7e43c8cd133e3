/*
 * Engram C++11 - Memory SQLite Store
 *
 * Durable storage for memories, relationships and documents. One shared
 * connection serialised by a store mutex held for a single statement or
 * one StoreTransaction.
 */
#ifndef ENGRAM_MEMORY_STORE_HPP
#define ENGRAM_MEMORY_STORE_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <sqlite3.h>

namespace engram {

class MemoryStore {
public:
    MemoryStore();
    ~MemoryStore();

    // ":memory:" opens a private in-memory database
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;

    bool ensure_schema();

    // Records the embedding dimensionality on first use and rejects a
    // database created with a different one
    bool check_dimensions(int dimensions);

    // Memory operations
    bool insert_memory(const Memory& memory);
    bool get_memory(const std::string& id, Memory& out);
    std::vector<Memory> list_memories(const std::string& owner_id);
    std::vector<Memory> list_document_memories(const std::string& document_id);
    // Every decodable row; undecodable rows are counted in `skipped` and logged
    std::vector<Memory> load_all_memories(size_t& skipped);
    bool update_access(const std::string& id, int64_t access_count, int64_t last_accessed_at);
    bool update_tier(const std::string& id, MemoryTier tier);
    bool get_version(const std::string& id, int64_t& version, bool& is_latest);
    // Clears is_latest when the row still has expected_version. NONE on
    // success, CONCURRENCY_CONFLICT on version mismatch.
    ErrorCode mark_superseded(const std::string& id, int64_t expected_version);
    int64_t count_memories(const std::string& owner_id);

    // Relationship operations
    bool insert_relationship(const Relationship& rel);
    bool has_relationship(const std::string& from_id, const std::string& to_id, RelationshipKind kind);
    // Edges touching the memory in either direction
    std::vector<Relationship> relationships_for(const std::string& memory_id);
    std::vector<Relationship> list_relationships(const std::string& owner_id);
    std::map<std::string, int64_t> relationship_kind_counts(const std::string& owner_id);

    // Document operations
    bool insert_document(const Document& doc);
    // Rewrites status, progress and error of an existing row. NOT_FOUND once
    // the document has been deleted; the row is never recreated.
    ErrorCode update_document(const Document& doc);
    bool get_document(const std::string& id, Document& out);
    std::vector<Document> list_documents(const std::string& owner_id);
    // Documents of any owner not yet DONE or FAILED
    std::vector<Document> list_unfinished_documents();

    bool delete_owner(const std::string& owner_id, ClearReport& report);

    bool set_meta(const std::string& key, const std::string& value);
    std::string get_meta(const std::string& key, const std::string& default_val = "");

    // Error of the last failed call made by the calling thread
    std::string last_error() const;

    static std::string encode_embedding(const std::vector<float>& embedding);
    static bool decode_embedding(const void* blob, int bytes, std::vector<float>& out);

private:
    friend class StoreTransaction;

    sqlite3* db_;
    int dimensions_;
    mutable std::recursive_mutex mutex_;
    std::map<std::thread::id, std::string> errors_;
    mutable std::mutex error_mutex_;

    MemoryStore(const MemoryStore&);
    MemoryStore& operator=(const MemoryStore&);

    bool exec(const std::string& sql);
    void set_error(const std::string& error);
    void clear_error();
    void set_error_from_db();
    bool require_open();
    bool read_memory_row(sqlite3_stmt* stmt, Memory& out);
    void read_relationship_row(sqlite3_stmt* stmt, Relationship& out);
    void read_document_row(sqlite3_stmt* stmt, Document& out);
    std::vector<Memory> query_memories(const char* sql, const std::string& param);
    std::vector<Relationship> query_relationships(const char* sql, const std::string& param, int bind_count);
    int64_t count_where(const char* sql, const std::string& param);
};

// Holds the store mutex for its lifetime and wraps the enclosed statements in
// BEGIN IMMEDIATE / COMMIT. Rolls back unless commit() succeeded.
class StoreTransaction {
public:
    explicit StoreTransaction(MemoryStore& store);
    ~StoreTransaction();

    bool active() const { return active_; }
    bool commit();
    void rollback();

private:
    MemoryStore& store_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool active_;

    StoreTransaction(const StoreTransaction&);
    StoreTransaction& operator=(const StoreTransaction&);
};

} // namespace engram

#endif // ENGRAM_MEMORY_STORE_HPP
