/*
 * Engram C++11 - Hot/Cold tiering
 *
 * Tier is index-membership metadata: a Hot memory lives in its owner's hot
 * map and is scanned first by search. Promotion happens on access, demotion
 * only during rebalance().
 */
#ifndef ENGRAM_MEMORY_TIERING_HPP
#define ENGRAM_MEMORY_TIERING_HPP

#include "types.hpp"
#include "vector_index.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace engram {

class MemoryStore;

class TieringManager {
public:
    TieringManager(MemoryStore& store, VectorIndex& index, const TieringConfig& config, ClockFn clock);

    // Hot when younger than hot_age_days or accessed at least
    // promotion_threshold times. Always Hot when tiering is disabled.
    MemoryTier classify(int64_t created_at, int64_t access_count, int64_t now) const;
    MemoryTier classify(const Memory& memory, int64_t now) const;

    // Counts one access and promotes Cold -> Hot when the policy says so.
    // False when the memory is not indexed.
    bool on_access(const std::string& memory_id);

    // Re-evaluates every indexed memory, one tier flag at a time
    RebalanceReport rebalance();
    RebalanceReport rebalance_owner(const std::string& owner_id);

    TierStats tier_stats(const std::string& owner_id) const;

    const TieringConfig& config() const { return config_; }

private:
    MemoryStore& store_;
    VectorIndex& index_;
    TieringConfig config_;
    ClockFn clock_;

    bool apply_tier(const IndexEntryPtr& entry, MemoryTier tier);
};

// Runs TieringManager::rebalance() every interval on a background thread.
// stop() wakes the thread immediately.
class RebalanceScheduler {
public:
    RebalanceScheduler(TieringManager& tiering, int interval_seconds);
    ~RebalanceScheduler();

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    int64_t runs() const { return runs_.load(); }

private:
    TieringManager& tiering_;
    int interval_seconds_;

    std::atomic<bool> running_;
    std::atomic<int64_t> runs_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void loop();

    RebalanceScheduler(const RebalanceScheduler&);
    RebalanceScheduler& operator=(const RebalanceScheduler&);
};

} // namespace engram

#endif // ENGRAM_MEMORY_TIERING_HPP
