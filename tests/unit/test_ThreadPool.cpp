#include <gtest/gtest.h>

#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace bob::concurrency;

TEST(ThreadPoolTest, RunReturnsTheResult) {
    ThreadPool pool(2);
    auto answer = pool.run([] { return 6 * 7; });
    EXPECT_EQ(answer.get(), 42);
    EXPECT_EQ(pool.workerCount(), 2u);
}

TEST(ThreadPoolTest, ExceptionsReachTheCaller) {
    ThreadPool pool;
    auto failing = pool.run([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    // The worker survives
    EXPECT_EQ(pool.run([] { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, StopDrainsQueuedWork) {
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    {
        ThreadPool pool(1);
        for (int i = 0; i < 16; ++i) futures.push_back(pool.run([&done] { ++done; }));
    }
    EXPECT_EQ(done.load(), 16);
    for (auto& f : futures) EXPECT_NO_THROW(f.get());
}

TEST(ThreadPoolTest, RejectsWorkAfterStop) {
    ThreadPool pool;
    pool.stop();
    EXPECT_THROW(pool.run([] { return 0; }), std::runtime_error);
}

TEST(ThreadPoolTest, StoppingIdleWorkersAlwaysJoins) {
    for (int i = 0; i < 500; ++i) {
        ThreadPool pool(4);
        pool.stop();
        EXPECT_EQ(pool.workerCount(), 0u);
    }
}

TEST(ThreadPoolTest, NeedsAWorker) {
    EXPECT_THROW(ThreadPool{0}, std::invalid_argument);
}
