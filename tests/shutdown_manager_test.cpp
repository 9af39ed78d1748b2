#include <gtest/gtest.h>
#include <thread>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include "core/shutdown_manager.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Reset the ShutdownManager to a clean state before each test
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownUnblocksWait)
{
    auto &mgr = ShutdownManager::getInstance();
    // Don't install signal handlers in tests to avoid conflicts

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    mgr.requestShutdown("unit-test");

    waiter.join();
    ASSERT_TRUE(unblocked.load());
    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), 0);
}

TEST_F(ShutdownManagerTest, SignalNumberAndReasonAreRecorded)
{
    auto &mgr = ShutdownManager::getInstance();
    ASSERT_FALSE(mgr.isShutdownRequested());

    mgr.requestShutdown("test-signal", SIGTERM);

    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), SIGTERM);
    ASSERT_EQ(mgr.getReason(), "test-signal");
}

TEST_F(ShutdownManagerTest, CallbacksRunOnceOnShutdown)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> calls{0};
    mgr.onShutdown([&calls]()
                   { calls.fetch_add(1); });
    mgr.onShutdown([&calls]()
                   { calls.fetch_add(10); });

    mgr.requestShutdown("first");
    mgr.requestShutdown("second");

    EXPECT_EQ(calls.load(), 11);
    EXPECT_EQ(mgr.getReason(), "first");
}

TEST_F(ShutdownManagerTest, LateCallbackRunsImmediately)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("early");

    bool ran = false;
    mgr.onShutdown([&ran]()
                   { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(ShutdownManagerTest, FailingCallbackDoesNotStopOthers)
{
    auto &mgr = ShutdownManager::getInstance();
    bool second_ran = false;
    mgr.onShutdown([]()
                   { throw std::runtime_error("callback failure"); });
    mgr.onShutdown([&second_ran]()
                   { second_ran = true; });

    EXPECT_NO_THROW(mgr.requestShutdown("test"));
    EXPECT_TRUE(second_ran);
}

TEST_F(ShutdownManagerTest, TimedWaitReportsOutcome)
{
    auto &mgr = ShutdownManager::getInstance();
    EXPECT_FALSE(mgr.waitForShutdownFor(std::chrono::milliseconds(20)));

    std::thread requester([&mgr]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        mgr.requestShutdown("timed"); });
    EXPECT_TRUE(mgr.waitForShutdownFor(std::chrono::seconds(5)));
    requester.join();
}

TEST_F(ShutdownManagerTest, ResetDropsPendingCallbacks)
{
    auto &mgr = ShutdownManager::getInstance();
    bool ran = false;
    mgr.onShutdown([&ran]()
                   { ran = true; });

    mgr.reset();
    mgr.requestShutdown("after-reset");

    EXPECT_FALSE(ran);
    EXPECT_TRUE(mgr.isShutdownRequested());
}

TEST_F(ShutdownManagerTest, RemovedCallbackDoesNotRun)
{
    auto &mgr = ShutdownManager::getInstance();
    bool removed_ran = false;
    bool kept_ran = false;
    auto id = mgr.onShutdown([&removed_ran]()
                             { removed_ran = true; });
    mgr.onShutdown([&kept_ran]()
                   { kept_ran = true; });
    EXPECT_NE(id, 0u);

    mgr.removeCallback(id);
    mgr.requestShutdown("after-remove");

    EXPECT_FALSE(removed_ran);
    EXPECT_TRUE(kept_ran);
}

TEST_F(ShutdownManagerTest, RemoveWaitsForRunningCallback)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    auto id = mgr.onShutdown([&]()
                             {
        started.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished.store(true); });

    std::thread requester([&mgr]()
                          { mgr.requestShutdown("slow-callback"); });
    while (!started.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    mgr.removeCallback(id);
    EXPECT_TRUE(finished.load());
    requester.join();
}

TEST_F(ShutdownManagerTest, CallbackMayRemoveItself)
{
    auto &mgr = ShutdownManager::getInstance();
    ShutdownManager::CallbackId id = 0;
    bool ran = false;
    id = mgr.onShutdown([&]()
                        {
        ran = true;
        mgr.removeCallback(id); });

    EXPECT_NO_THROW(mgr.requestShutdown("self-remove"));
    EXPECT_TRUE(ran);
}
