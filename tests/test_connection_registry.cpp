#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include <chatrelay/ConnectionRegistry.hpp>

#include "test_support.hpp"

namespace chatrelay
{
    using testing::FakeConnection;

    TEST(ConnectionRegistry, AddIsIdempotent)
    {
        ConnectionRegistry registry;
        auto c = std::make_shared<FakeConnection>(1);

        EXPECT_TRUE(registry.add(c));
        EXPECT_FALSE(registry.add(c));
        EXPECT_EQ(registry.size(), 1u);
        EXPECT_TRUE(registry.contains(1));
    }

    TEST(ConnectionRegistry, RemoveAbsentIsNoop)
    {
        ConnectionRegistry registry;
        EXPECT_FALSE(registry.remove(99));

        auto c = std::make_shared<FakeConnection>(1);
        registry.add(c);
        EXPECT_TRUE(registry.remove(1));
        EXPECT_FALSE(registry.remove(1));
        EXPECT_FALSE(registry.contains(1));
    }

    TEST(ConnectionRegistry, SnapshotIsStableCopy)
    {
        ConnectionRegistry registry;
        auto a = std::make_shared<FakeConnection>(1);
        auto b = std::make_shared<FakeConnection>(2);
        registry.add(a);
        registry.add(b);

        auto snap = registry.snapshot();
        ASSERT_EQ(snap.size(), 2u);

        registry.remove(1);
        registry.add(std::make_shared<FakeConnection>(3));

        EXPECT_EQ(snap.size(), 2u);
        EXPECT_EQ(registry.snapshot().size(), 1u); // 3 was not kept alive by anyone
        EXPECT_FALSE(registry.contains(1));
    }

    TEST(ConnectionRegistry, DestroyedConnectionsDisappear)
    {
        ConnectionRegistry registry;
        {
            auto c = std::make_shared<FakeConnection>(7);
            registry.add(c);
            EXPECT_EQ(registry.size(), 1u);
        }
        EXPECT_EQ(registry.size(), 0u);
        EXPECT_TRUE(registry.snapshot().empty());
    }

    TEST(ConnectionRegistry, ConcurrentAddRemoveSnapshot)
    {
        ConnectionRegistry registry;
        constexpr int perThread = 500;

        std::vector<std::shared_ptr<FakeConnection>> keep;
        for (int i = 0; i < 4 * perThread; ++i)
            keep.push_back(std::make_shared<FakeConnection>(static_cast<ConnectionId>(i + 1)));

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t)
        {
            threads.emplace_back([&, t]()
                                 {
                for (int i = 0; i < perThread; ++i)
                {
                    auto &c = keep[static_cast<std::size_t>(t * perThread + i)];
                    registry.add(c);
                    (void)registry.snapshot();
                    if (i % 2 == 0)
                        registry.remove(c->id());
                } });
        }
        for (auto &th : threads)
            th.join();

        EXPECT_EQ(registry.size(), static_cast<std::size_t>(4 * perThread / 2));
    }

} // namespace chatrelay
