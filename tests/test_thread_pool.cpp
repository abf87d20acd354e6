/// @file test_thread_pool.cpp

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>

#include "../src/utils/thread_pool.hpp"

TEST(ThreadPool, RejectsZeroThreads) { EXPECT_THROW(concurrency::ThreadPool(0), std::invalid_argument); }

TEST(ThreadPool, DefaultCountIsBounded) {
    const size_t n = concurrency::ThreadPool::default_thread_count();
    EXPECT_GE(n, 5U);
    EXPECT_LE(n, 32U);
}

TEST(ThreadPool, RunsEveryTaskBeforeWaitAllReturns) {
    concurrency::ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4U);

    std::atomic<int> done{0};
    for (int i = 0; i < 100; ++i) {
        pool.enqueue([&done]() { done.fetch_add(1); });
    }
    pool.wait_all();

    EXPECT_EQ(done.load(), 100);
}

TEST(ThreadPool, DestructorDrainsQueuedTasks) {
    auto done = std::make_shared<std::atomic<int>>(0);
    {
        concurrency::ThreadPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.enqueue([done]() { done->fetch_add(1); });
        }
    }
    EXPECT_EQ(done->load(), 10);
}
