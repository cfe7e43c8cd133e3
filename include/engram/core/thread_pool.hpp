/*
 * Engram C++11 - Worker pool for asynchronous ingestion
 */
#ifndef ENGRAM_CORE_THREAD_POOL_HPP
#define ENGRAM_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace engram {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 4);
    ~ThreadPool();

    // Returns false once the pool is shutting down
    bool enqueue(std::function<void()> task);

    size_t size() const { return threads_.size(); }
    size_t pending() const;

    // Blocks until the queue is empty and no task is running
    void wait_idle();

    // Drains queued tasks, then joins the workers
    void shutdown();

private:
    void worker();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()> > tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    size_t active_;
    std::atomic<bool> stop_;
};

} // namespace engram

#endif // ENGRAM_CORE_THREAD_POOL_HPP
