#include <gtest/gtest.h>
#include <mdguard/core/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mdguard;

// Worker pool used by the transform pipeline

TEST(ThreadPoolTest, FuturesCarryResults) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.size(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.enqueue([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ZeroThreadsStartsOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.enqueue([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    std::future<void> failed = pool.enqueue([]() { throw std::runtime_error("task failed"); });
    EXPECT_THROW(failed.get(), std::runtime_error);
}

TEST(ThreadPoolTest, PendingCountsQueuedTasks) {
    ThreadPool pool(1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::promise<void> started;

    std::future<void> blocker = pool.enqueue([opened, &started]() {
        started.set_value();
        opened.wait();
    });
    started.get_future().wait();

    std::future<void> second = pool.enqueue([]() {});
    std::future<void> third = pool.enqueue([]() {});
    EXPECT_EQ(pool.pending(), 2u);

    gate.set_value();
    blocker.get();
    second.get();
    third.get();
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, ShutdownDrainsQueue) {
    std::atomic<int> done(0);
    ThreadPool pool(2);
    for (int i = 0; i < 20; ++i) {
        pool.enqueue([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done.fetch_add(1);
        });
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 20);
    EXPECT_EQ(pool.size(), 0u);

    // Second call is a no-op
    pool.shutdown();
    EXPECT_THROW(pool.enqueue([]() {}), std::runtime_error);
}
