#include <engram/core/thread_pool.hpp>
#include <engram/core/logger.hpp>
#include <stdexcept>

namespace engram {

ThreadPool::ThreadPool(size_t num_threads) : active_(0), stop_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.push_back(std::thread(&ThreadPool::worker, this));
    }
    LOG_DEBUG("[ThreadPool] started with %zu workers", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("[ThreadPool] rejected task, pool is stopped");
            return false;
        }
        tasks_.push(task);
    }
    condition_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }

    condition_.notify_all();

    for (size_t i = 0; i < threads_.size(); ++i) {
        if (threads_[i].joinable()) {
            threads_[i].join();
        }
    }

    LOG_DEBUG("[ThreadPool] shutdown complete");
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = tasks_.front();
            tasks_.pop();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[ThreadPool] task threw exception: %s", e.what());
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

} // namespace engram
