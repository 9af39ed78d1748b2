#include <gtest/gtest.h>
#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

class WorkerPoolTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");
    }
};

TEST_F(WorkerPoolTest, RunsSubmittedJobs)
{
    WorkerPool pool("test", 2);
    std::atomic<int> count{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i)
    {
        futures.push_back(pool.submit([&count]()
                                      { count.fetch_add(1); }));
    }
    for (auto &f : futures)
    {
        f.get();
    }
    EXPECT_EQ(count.load(), 20);
}

TEST_F(WorkerPoolTest, WaitBlocksUntilIdle)
{
    WorkerPool pool("test", 2);
    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i)
    {
        pool.submit([&done]()
                    {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            done.fetch_add(1); });
    }
    pool.wait();
    EXPECT_EQ(done.load(), 4);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST_F(WorkerPoolTest, ExceptionsReachTheFuture)
{
    WorkerPool pool("test", 1);
    auto future = pool.submit([]()
                              { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The pool keeps working afterwards
    auto next = pool.submit([]() {});
    EXPECT_NO_THROW(next.get());
}

TEST_F(WorkerPoolTest, ConcurrencyIsBounded)
{
    WorkerPool pool("test", 2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 8; ++i)
    {
        pool.submit([&]()
                    {
            int now = running.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            running.fetch_sub(1); });
    }
    pool.wait();
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST_F(WorkerPoolTest, ShutdownDrainsThenRefuses)
{
    WorkerPool pool("test", 1);
    std::atomic<bool> finished{false};
    pool.submit([&finished]()
                {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished.store(true); });

    pool.shutdown();
    EXPECT_TRUE(finished.load());
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}

TEST_F(WorkerPoolTest, InvalidConcurrencyFallsBackToOne)
{
    EXPECT_FALSE(WorkerPool::validateConcurrency(0));
    EXPECT_FALSE(WorkerPool::validateConcurrency(65));
    EXPECT_TRUE(WorkerPool::validateConcurrency(1));

    WorkerPool pool("test", 0);
    EXPECT_EQ(pool.concurrency(), 1);
    EXPECT_EQ(pool.name(), "test");
}
