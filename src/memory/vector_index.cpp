#include <engram/memory/vector_index.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace engram {

float vector_norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        sum += static_cast<double>(v[i]) * v[i];
    }
    return static_cast<float>(std::sqrt(sum));
}

namespace {

double cosine_with_norms(const std::vector<float>& a, float norm_a,
                         const std::vector<float>& b, float norm_b) {
    if (a.size() != b.size() || a.empty() || norm_a <= 0.0f || norm_b <= 0.0f) {
        return 0.0;
    }
    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
    }
    double sim = dot / (static_cast<double>(norm_a) * norm_b);
    if (sim > 1.0) sim = 1.0;
    if (sim < -1.0) sim = -1.0;
    return sim;
}

bool hit_before(const VectorHit& a, const VectorHit& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.entry->created_at > b.entry->created_at;
}

} // anonymous namespace

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    return cosine_with_norms(a, vector_norm(a), b, vector_norm(b));
}

// ============ IndexEntry ============

IndexEntry::IndexEntry(const Memory& m)
    : id(m.id)
    , owner_id(m.owner_id)
    , document_id(m.source_document_id)
    , embedding(m.embedding)
    , norm(vector_norm(m.embedding))
    , keywords(m.keywords)
    , entities(m.entities)
    , created_at(m.created_at)
    , access_count(m.access_count)
    , last_accessed_at(m.last_accessed_at)
    , is_latest(m.is_latest)
    , tier(static_cast<int>(m.tier))
    , version(m.version)
{
}

void IndexEntry::apply_to(Memory& m) const {
    m.access_count = access_count.load();
    m.last_accessed_at = last_accessed_at.load();
    m.is_latest = is_latest.load();
    m.tier = current_tier();
    m.version = version.load();
}

// ============ OwnerPartition ============

void OwnerPartition::insert(const IndexEntryPtr& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    hot_.erase(entry->id);
    cold_.erase(entry->id);
    if (entry->current_tier() == MemoryTier::COLD) {
        cold_[entry->id] = entry;
    } else {
        hot_[entry->id] = entry;
    }
}

IndexEntryPtr OwnerPartition::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, IndexEntryPtr>::const_iterator it = hot_.find(id);
    if (it != hot_.end()) return it->second;
    it = cold_.find(id);
    if (it != cold_.end()) return it->second;
    return IndexEntryPtr();
}

bool OwnerPartition::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return hot_.erase(id) + cold_.erase(id) > 0;
}

size_t OwnerPartition::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hot_.size() + cold_.size();
}

size_t OwnerPartition::count(MemoryTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier == MemoryTier::HOT ? hot_.size() : cold_.size();
}

bool OwnerPartition::move_to_tier(const std::string& id, MemoryTier tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, IndexEntryPtr>& from = tier == MemoryTier::HOT ? cold_ : hot_;
    std::map<std::string, IndexEntryPtr>& to = tier == MemoryTier::HOT ? hot_ : cold_;

    std::map<std::string, IndexEntryPtr>::iterator it = from.find(id);
    if (it == from.end()) return false;

    IndexEntryPtr entry = it->second;
    from.erase(it);
    entry->tier.store(static_cast<int>(tier));
    to[id] = entry;
    return true;
}

std::vector<VectorHit> OwnerPartition::nearest(const std::vector<float>& query, size_t k, double floor,
                                               MemoryTier tier, const EntryFilter& filter) const {
    std::vector<IndexEntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::map<std::string, IndexEntryPtr>& source = tier == MemoryTier::HOT ? hot_ : cold_;
        entries.reserve(source.size());
        for (std::map<std::string, IndexEntryPtr>::const_iterator it = source.begin(); it != source.end(); ++it) {
            entries.push_back(it->second);
        }
    }

    float query_norm = vector_norm(query);
    std::vector<VectorHit> hits;
    for (size_t i = 0; i < entries.size(); ++i) {
        const IndexEntryPtr& e = entries[i];
        if (filter && !filter(*e)) continue;
        double sim = cosine_with_norms(query, query_norm, e->embedding, e->norm);
        if (sim < floor) continue;
        hits.push_back(VectorHit(e, sim));
    }

    if (hits.size() > k) {
        std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k), hits.end(), hit_before);
        hits.resize(k);
    } else {
        std::sort(hits.begin(), hits.end(), hit_before);
    }
    return hits;
}

std::vector<IndexEntryPtr> OwnerPartition::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IndexEntryPtr> out;
    out.reserve(hot_.size() + cold_.size());
    for (std::map<std::string, IndexEntryPtr>::const_iterator it = hot_.begin(); it != hot_.end(); ++it) {
        out.push_back(it->second);
    }
    for (std::map<std::string, IndexEntryPtr>::const_iterator it = cold_.begin(); it != cold_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

// ============ VectorIndex ============

VectorIndex::VectorIndex() {}

OwnerPartitionPtr VectorIndex::partition(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    OwnerPartitionPtr& slot = partitions_[owner_id];
    if (!slot) {
        slot = std::make_shared<OwnerPartition>();
    }
    return slot;
}

OwnerPartitionPtr VectorIndex::find_partition(const std::string& owner_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::map<std::string, OwnerPartitionPtr>::const_iterator it = partitions_.find(owner_id);
    return it != partitions_.end() ? it->second : OwnerPartitionPtr();
}

IndexEntryPtr VectorIndex::insert(const Memory& m) {
    IndexEntryPtr entry = std::make_shared<IndexEntry>(m);
    OwnerPartitionPtr part = partition(m.owner_id);
    part->insert(entry);
    std::lock_guard<std::mutex> lock(registry_mutex_);
    owner_of_[m.id] = m.owner_id;
    return entry;
}

IndexEntryPtr VectorIndex::find(const std::string& memory_id) const {
    OwnerPartitionPtr part;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        std::map<std::string, std::string>::const_iterator owner = owner_of_.find(memory_id);
        if (owner == owner_of_.end()) return IndexEntryPtr();
        std::map<std::string, OwnerPartitionPtr>::const_iterator it = partitions_.find(owner->second);
        if (it == partitions_.end()) return IndexEntryPtr();
        part = it->second;
    }
    return part->find(memory_id);
}

bool VectorIndex::set_tier(const std::string& memory_id, MemoryTier tier) {
    IndexEntryPtr entry = find(memory_id);
    if (!entry) return false;
    OwnerPartitionPtr part = find_partition(entry->owner_id);
    return part && part->move_to_tier(memory_id, tier);
}

void VectorIndex::drop_owner(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::map<std::string, OwnerPartitionPtr>::iterator it = partitions_.find(owner_id);
    if (it == partitions_.end()) return;

    std::vector<IndexEntryPtr> entries = it->second->snapshot();
    for (size_t i = 0; i < entries.size(); ++i) {
        owner_of_.erase(entries[i]->id);
    }
    partitions_.erase(it);
}

void VectorIndex::clear() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    partitions_.clear();
    owner_of_.clear();
}

std::vector<std::string> VectorIndex::owners() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> out;
    for (std::map<std::string, OwnerPartitionPtr>::const_iterator it = partitions_.begin();
         it != partitions_.end(); ++it) {
        out.push_back(it->first);
    }
    return out;
}

size_t VectorIndex::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return owner_of_.size();
}

} // namespace engram
