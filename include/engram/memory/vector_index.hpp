/*
 * Engram C++11 - In-process vector index
 *
 * Search-visible memories, partitioned by owner. Each partition keeps its
 * Hot and Cold entries in separate maps so a Hot-tier scan never touches
 * Cold entries. Mutable per-memory state (access counters, is_latest, tier,
 * version) lives in atomics on the shared entry; readers never lock it.
 */
#ifndef ENGRAM_MEMORY_VECTOR_INDEX_HPP
#define ENGRAM_MEMORY_VECTOR_INDEX_HPP

#include "types.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace engram {

float vector_norm(const std::vector<float>& v);

// Cosine similarity; 0 when either vector has zero norm or sizes differ
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

struct IndexEntry {
    // Immutable after insertion
    std::string id;
    std::string owner_id;
    std::string document_id;
    std::vector<float> embedding;
    float norm;
    std::vector<std::string> keywords;
    EntityMap entities;
    int64_t created_at;

    std::atomic<int64_t> access_count;
    std::atomic<int64_t> last_accessed_at;
    std::atomic<bool> is_latest;
    std::atomic<int> tier;                  // static_cast<int>(MemoryTier)
    std::atomic<int64_t> version;

    explicit IndexEntry(const Memory& m);

    MemoryTier current_tier() const { return static_cast<MemoryTier>(tier.load()); }

    // Copies the mutable state onto a Memory loaded from storage
    void apply_to(Memory& m) const;

private:
    IndexEntry(const IndexEntry&);
    IndexEntry& operator=(const IndexEntry&);
};

typedef std::shared_ptr<IndexEntry> IndexEntryPtr;

struct VectorHit {
    IndexEntryPtr entry;
    double similarity;

    VectorHit() : similarity(0) {}
    VectorHit(const IndexEntryPtr& e, double s) : entry(e), similarity(s) {}
};

typedef std::function<bool(const IndexEntry&)> EntryFilter;

class OwnerPartition {
public:
    OwnerPartition() {}

    void insert(const IndexEntryPtr& entry);
    IndexEntryPtr find(const std::string& id) const;
    bool erase(const std::string& id);
    size_t size() const;
    size_t count(MemoryTier tier) const;

    // Moves the entry between tier maps. False if unknown or already there.
    bool move_to_tier(const std::string& id, MemoryTier tier);

    // Best `k` entries of one tier by cosine similarity, at or above `floor`,
    // passing `filter` (may be empty). Sorted by similarity descending.
    std::vector<VectorHit> nearest(const std::vector<float>& query, size_t k, double floor,
                                   MemoryTier tier, const EntryFilter& filter) const;

    std::vector<IndexEntryPtr> snapshot() const;

    // Serialises classify+commit of new memories for this owner
    std::mutex& write_mutex() { return write_mutex_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, IndexEntryPtr> hot_;
    std::map<std::string, IndexEntryPtr> cold_;
    std::mutex write_mutex_;

    OwnerPartition(const OwnerPartition&);
    OwnerPartition& operator=(const OwnerPartition&);
};

typedef std::shared_ptr<OwnerPartition> OwnerPartitionPtr;

class VectorIndex {
public:
    VectorIndex();

    // Creates the partition on first use
    OwnerPartitionPtr partition(const std::string& owner_id);
    // NULL when the owner has no partition
    OwnerPartitionPtr find_partition(const std::string& owner_id) const;

    IndexEntryPtr insert(const Memory& m);
    IndexEntryPtr find(const std::string& memory_id) const;
    bool set_tier(const std::string& memory_id, MemoryTier tier);

    void drop_owner(const std::string& owner_id);
    void clear();

    std::vector<std::string> owners() const;
    size_t size() const;

private:
    mutable std::mutex registry_mutex_;
    std::map<std::string, OwnerPartitionPtr> partitions_;
    std::map<std::string, std::string> owner_of_;   // memory id -> owner id
};

} // namespace engram

#endif // ENGRAM_MEMORY_VECTOR_INDEX_HPP
