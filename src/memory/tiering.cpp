/*
 * Engram C++11 - Hot/Cold tiering
 */
#include <engram/memory/tiering.hpp>
#include <engram/memory/store.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <chrono>

namespace engram {

// ============================================================================
// TieringManager
// ============================================================================

TieringManager::TieringManager(MemoryStore& store, VectorIndex& index,
                               const TieringConfig& config, ClockFn clock)
    : store_(store)
    , index_(index)
    , config_(config)
    , clock_(clock)
{
    if (!clock_) {
        clock_ = current_timestamp_ms;
    }
}

MemoryTier TieringManager::classify(int64_t created_at, int64_t access_count, int64_t now) const {
    if (!config_.enabled) {
        return MemoryTier::HOT;
    }
    int64_t hot_window = static_cast<int64_t>(config_.hot_age_days) * MS_PER_DAY;
    if (now - created_at <= hot_window) {
        return MemoryTier::HOT;
    }
    if (access_count >= config_.promotion_threshold) {
        return MemoryTier::HOT;
    }
    return MemoryTier::COLD;
}

MemoryTier TieringManager::classify(const Memory& memory, int64_t now) const {
    return classify(memory.created_at, memory.access_count, now);
}

bool TieringManager::apply_tier(const IndexEntryPtr& entry, MemoryTier tier) {
    OwnerPartitionPtr part = index_.find_partition(entry->owner_id);
    if (!part || !part->move_to_tier(entry->id, tier)) {
        return false;
    }
    if (!store_.update_tier(entry->id, tier)) {
        LOG_WARN("[Tiering] Failed to persist tier of %s: %s",
                 entry->id.c_str(), store_.last_error().c_str());
    }
    return true;
}

bool TieringManager::on_access(const std::string& memory_id) {
    IndexEntryPtr entry = index_.find(memory_id);
    if (!entry) {
        return false;
    }

    int64_t now = clock_();
    int64_t count = ++entry->access_count;

    int64_t previous = entry->last_accessed_at.load();
    while (previous < now && !entry->last_accessed_at.compare_exchange_weak(previous, now)) {
    }

    if (!store_.update_access(memory_id, count, now)) {
        LOG_WARN("[Tiering] Failed to persist access of %s: %s",
                 memory_id.c_str(), store_.last_error().c_str());
    }

    if (entry->current_tier() == MemoryTier::COLD &&
        classify(entry->created_at, count, now) == MemoryTier::HOT) {
        if (apply_tier(entry, MemoryTier::HOT)) {
            LOG_DEBUG("[Tiering] Promoted %s after %lld accesses",
                      memory_id.c_str(), static_cast<long long>(count));
        }
    }
    return true;
}

RebalanceReport TieringManager::rebalance_owner(const std::string& owner_id) {
    RebalanceReport report;
    OwnerPartitionPtr part = index_.find_partition(owner_id);
    if (!part) {
        return report;
    }

    int64_t now = clock_();
    std::vector<IndexEntryPtr> entries = part->snapshot();
    for (size_t i = 0; i < entries.size(); ++i) {
        const IndexEntryPtr& e = entries[i];
        MemoryTier current = e->current_tier();
        MemoryTier wanted = classify(e->created_at, e->access_count.load(), now);
        if (current == wanted) continue;

        if (!apply_tier(e, wanted)) continue;
        if (wanted == MemoryTier::HOT) {
            report.promoted++;
        } else {
            report.demoted++;
        }
    }
    return report;
}

RebalanceReport TieringManager::rebalance() {
    RebalanceReport total;
    std::vector<std::string> owners = index_.owners();
    for (size_t i = 0; i < owners.size(); ++i) {
        RebalanceReport r = rebalance_owner(owners[i]);
        total.promoted += r.promoted;
        total.demoted += r.demoted;
    }
    LOG_INFO("[Tiering] Rebalance: %lld promoted, %lld demoted",
             static_cast<long long>(total.promoted), static_cast<long long>(total.demoted));
    return total;
}

TierStats TieringManager::tier_stats(const std::string& owner_id) const {
    TierStats stats;
    OwnerPartitionPtr part = index_.find_partition(owner_id);
    if (!part) {
        return stats;
    }
    stats.hot = static_cast<int64_t>(part->count(MemoryTier::HOT));
    stats.cold = static_cast<int64_t>(part->count(MemoryTier::COLD));
    stats.total = stats.hot + stats.cold;
    if (stats.total > 0) {
        stats.hot_percent = 100.0 * static_cast<double>(stats.hot) / static_cast<double>(stats.total);
        stats.cold_percent = 100.0 * static_cast<double>(stats.cold) / static_cast<double>(stats.total);
    }
    return stats;
}

// ============================================================================
// RebalanceScheduler
// ============================================================================

RebalanceScheduler::RebalanceScheduler(TieringManager& tiering, int interval_seconds)
    : tiering_(tiering)
    , interval_seconds_(interval_seconds > 0 ? interval_seconds : 3600)
    , running_(false)
    , runs_(0)
{
}

RebalanceScheduler::~RebalanceScheduler() {
    stop();
}

void RebalanceScheduler::start() {
    if (running_.load()) {
        LOG_WARN("[Tiering] Rebalance scheduler already running");
        return;
    }
    running_.store(true);
    thread_ = std::thread(&RebalanceScheduler::loop, this);
    LOG_INFO("[Tiering] Rebalance scheduler started (interval=%ds)", interval_seconds_);
}

void RebalanceScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[Tiering] Rebalance scheduler stopped");
}

void RebalanceScheduler::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (cv_.wait_for(lock, std::chrono::seconds(interval_seconds_),
                         [this]() { return !running_.load(); })) {
            break;
        }

        lock.unlock();
        tiering_.rebalance();
        runs_++;
        lock.lock();
    }
}

} // namespace engram
