#include <gtest/gtest.h>
#include "core/session_store.hpp"
#include <atomic>
#include <thread>
#include <vector>

namespace
{
    MediaItem makeItem(const std::string &path, std::uint64_t sequence, MediaKind kind = MediaKind::Video)
    {
        MediaItem item;
        item.source_path = path;
        item.kind = kind;
        item.display_name = "clip.mp4";
        item.sequence = sequence;
        return item;
    }
}

TEST(SessionStoreTest, PutThenTakeReturnsItemOnce)
{
    SessionStore store;
    auto result = store.put(1, makeItem("/tmp/a", 10));
    EXPECT_TRUE(result.stored);
    EXPECT_FALSE(result.discarded.has_value());
    EXPECT_TRUE(store.contains(1));

    auto taken = store.take(1);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->source_path, "/tmp/a");
    EXPECT_EQ(taken->sequence, 10u);

    EXPECT_FALSE(store.take(1).has_value());
    EXPECT_FALSE(store.contains(1));
}

TEST(SessionStoreTest, TakeOnEmptyStoreIsAbsent)
{
    SessionStore store;
    EXPECT_FALSE(store.take(42).has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(SessionStoreTest, NewerPutReplacesAndReturnsPrevious)
{
    SessionStore store;
    store.put(1, makeItem("/tmp/old", 5));
    auto result = store.put(1, makeItem("/tmp/new", 6, MediaKind::Animation));

    EXPECT_TRUE(result.stored);
    ASSERT_TRUE(result.discarded.has_value());
    EXPECT_EQ(result.discarded->source_path, "/tmp/old");

    auto peeked = store.peek(1);
    ASSERT_TRUE(peeked.has_value());
    EXPECT_EQ(peeked->source_path, "/tmp/new");
    EXPECT_EQ(peeked->kind, MediaKind::Animation);
    EXPECT_EQ(store.size(), 1u);
}

TEST(SessionStoreTest, OlderPutIsRefused)
{
    SessionStore store;
    store.put(1, makeItem("/tmp/newer", 9));
    auto result = store.put(1, makeItem("/tmp/older", 3));

    EXPECT_FALSE(result.stored);
    ASSERT_TRUE(result.discarded.has_value());
    EXPECT_EQ(result.discarded->source_path, "/tmp/older");
    EXPECT_EQ(store.peek(1)->source_path, "/tmp/newer");
}

TEST(SessionStoreTest, UsersAreIndependent)
{
    SessionStore store;
    store.put(1, makeItem("/tmp/one", 1));
    store.put(2, makeItem("/tmp/two", 2));

    EXPECT_EQ(store.take(1)->source_path, "/tmp/one");
    EXPECT_TRUE(store.contains(2));
    EXPECT_EQ(store.take(2)->source_path, "/tmp/two");
}

TEST(SessionStoreTest, TakeMatchingRequiresSameSequence)
{
    SessionStore store;
    store.put(1, makeItem("/tmp/a", 7));

    EXPECT_FALSE(store.takeMatching(1, 6).has_value());
    EXPECT_TRUE(store.contains(1));

    auto taken = store.takeMatching(1, 7);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->source_path, "/tmp/a");
    EXPECT_FALSE(store.contains(1));
}

TEST(SessionStoreTest, DrainEmptiesStore)
{
    SessionStore store;
    store.put(1, makeItem("/tmp/a", 1));
    store.put(2, makeItem("/tmp/b", 2));
    store.put(3, makeItem("/tmp/c", 3));

    auto drained = store.drain();
    EXPECT_EQ(drained.size(), 3u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.drain().empty());
}

TEST(SessionStoreTest, ConcurrentTakesYieldItemExactlyOnce)
{
    for (int round = 0; round < 50; ++round)
    {
        SessionStore store;
        store.put(1, makeItem("/tmp/race", 1));

        std::atomic<int> winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back([&]()
                                 {
                if (store.take(1))
                {
                    winners.fetch_add(1);
                } });
        }
        for (auto &t : threads)
        {
            t.join();
        }
        ASSERT_EQ(winners.load(), 1);
    }
}

TEST(SessionStoreTest, ConcurrentPutsKeepHighestSequence)
{
    SessionStore store;
    std::vector<std::thread> threads;
    std::atomic<int> refused{0};
    for (std::uint64_t seq = 1; seq <= 16; ++seq)
    {
        threads.emplace_back([&store, &refused, seq]()
                             {
            auto result = store.put(1, makeItem("/tmp/" + std::to_string(seq), seq));
            if (!result.stored)
            {
                refused.fetch_add(1);
            } });
    }
    for (auto &t : threads)
    {
        t.join();
    }
    ASSERT_TRUE(store.peek(1).has_value());
    EXPECT_EQ(store.peek(1)->sequence, 16u);
    EXPECT_EQ(store.size(), 1u);
}

TEST(SessionStoreTest, LateOlderUploadAfterDecisionIsDropped)
{
    SessionStore store;
    store.put(42, makeItem("/tmp/newer", 11));
    auto taken = store.take(42);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->sequence, 11u);

    auto result = store.put(42, makeItem("/tmp/older", 10));
    EXPECT_FALSE(result.stored);
    ASSERT_TRUE(result.discarded.has_value());
    EXPECT_EQ(result.discarded->source_path, "/tmp/older");
    EXPECT_FALSE(store.contains(42));

    EXPECT_TRUE(store.put(42, makeItem("/tmp/next", 12)).stored);
    EXPECT_EQ(store.peek(42)->source_path, "/tmp/next");
}
