#include <gtest/gtest.h>
#include "tagattest/sdk/ThreadPool.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>

using namespace tagattest::sdk;

TEST(ThreadPool, EnqueueReturnsResults) {
    ThreadPool pool(2);
    auto sum = pool.enqueue(ThreadPool::Priority::LOW, [](int a, int b) { return a + b; }, 2, 3);
    auto text = pool.enqueue(ThreadPool::Priority::HIGH, []() { return std::string("done"); });
    EXPECT_EQ(sum.get(), 5);
    EXPECT_EQ(text.get(), "done");
    EXPECT_EQ(pool.get_thread_count(), 2u);
}

TEST(ThreadPool, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.get_thread_count(), 1u);
    EXPECT_EQ(pool.enqueue(ThreadPool::Priority::LOW, []() { return 7; }).get(), 7);
}

TEST(ThreadPool, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto failing = pool.enqueue(ThreadPool::Priority::LOW, []() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(pool.enqueue(ThreadPool::Priority::LOW, []() { return 1; }).get(), 1);
}

TEST(ThreadPool, HighPriorityRunsBeforeQueuedLow) {
    ThreadPool pool(1);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::mutex order_mutex;
    std::vector<std::string> order;

    // Occupy the only worker so the next two tasks queue up together
    auto blocker = pool.enqueue(ThreadPool::Priority::LOW, [gate]() { gate.wait(); });
    auto low = pool.enqueue(ThreadPool::Priority::LOW, [&]() {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back("low");
    });
    auto high = pool.enqueue(ThreadPool::Priority::HIGH, [&]() {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back("high");
    });

    release.set_value();
    blocker.get();
    low.get();
    high.get();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "high");
    EXPECT_EQ(order[1], "low");
}

TEST(ThreadPool, ParallelForCoversRangeOnce) {
    ThreadPool pool(4);
    std::vector<int> hits(10000, 0);
    pool.parallel_for(hits.size(), 100, [&hits](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            hits[i] += 1;
        }
    });
    for (size_t i = 0; i < hits.size(); ++i) {
        ASSERT_EQ(hits[i], 1) << "index " << i;
    }
}

TEST(ThreadPool, ParallelForSmallAndEmptyRanges) {
    ThreadPool pool(4);
    std::atomic<size_t> total{0};
    pool.parallel_for(0, 1, [&total](size_t begin, size_t end) { total += end - begin; });
    EXPECT_EQ(total.load(), 0u);

    pool.parallel_for(3, 100, [&total](size_t begin, size_t end) { total += end - begin; });
    EXPECT_EQ(total.load(), 3u);
}

TEST(ThreadPool, ParallelForRethrows) {
    ThreadPool pool(4);
    EXPECT_THROW(pool.parallel_for(4000, 10, [](size_t begin, size_t) {
        if (begin == 0) {
            throw std::runtime_error("chunk failed");
        }
    }), std::runtime_error);
}

TEST(ThreadPool, DestructorDrainsQueue) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 50; ++i) {
            pool.enqueue(ThreadPool::Priority::LOW, [&done]() { ++done; });
        }
    }
    EXPECT_EQ(done.load(), 50);
}
