// =============================================================================
// Thread Pool Tests
// =============================================================================

#include <gtest/gtest.h>
#include "knowmap/thread_pool.hpp"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace knowmap;

TEST(ThreadPoolTest, SubmitReturnsValue) {
    ThreadPool pool(2);
    auto f = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(f.get(), 5);
    EXPECT_EQ(pool.num_threads(), 2u);
}

TEST(ThreadPoolTest, ParallelForVisitsEveryIndexOnce) {
    ThreadPool pool(4);
    std::vector<int> hits(1000, 0);
    pool.parallel_for(0, hits.size(), [&](size_t i) { hits[i] += 1; });
    for (int h : hits) EXPECT_EQ(h, 1);
}

TEST(ThreadPoolTest, ParallelForRethrowsAfterAllTasks) {
    ThreadPool pool(3);
    std::atomic<int> done{0};
    EXPECT_THROW(pool.parallel_for(0, 50, [&](size_t i) {
        ++done;
        if (i == 7) throw std::runtime_error("task 7");
    }), std::runtime_error);
    EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.num_threads(), 1u);
}

TEST(ThreadPoolTest, EmptyRange) {
    ThreadPool pool(2);
    bool called = false;
    pool.parallel_for(5, 5, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}
