/*
 * mdguard C++17 - Thread Pool Implementation
 */
#include <mdguard/core/thread_pool.hpp>
#include <mdguard/core/logger.hpp>

namespace mdguard {

ThreadPool::ThreadPool(size_t threads) : stopping_(false) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.push_back(std::thread(&ThreadPool::worker_loop, this));
    }
    LOG_DEBUG("[ThreadPool] Started %zu workers", threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable()) {
            workers_[i].join();
        }
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace mdguard
