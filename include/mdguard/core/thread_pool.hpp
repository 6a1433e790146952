/*
 * mdguard C++17 - Thread Pool
 *
 * Fixed set of worker threads draining a FIFO task queue.
 */
#ifndef mdguard_CORE_THREAD_POOL_HPP
#define mdguard_CORE_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace mdguard {

class ThreadPool {
public:
    // Starts `threads` workers (at least one)
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    // Queue `fn`; the future carries its result or exception.
    // Throws std::runtime_error after shutdown().
    template<typename F>
    auto enqueue(F fn) -> std::future<decltype(fn())> {
        typedef decltype(fn()) R;
        std::shared_ptr<std::packaged_task<R()>> task =
            std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            tasks_.push([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    // Tasks queued but not yet started
    size_t pending() const;

    size_t size() const { return workers_.size(); }

    // Finish queued tasks, then join the workers. Safe to call twice.
    void shutdown();

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_;
};

} // namespace mdguard

#endif // mdguard_CORE_THREAD_POOL_HPP
