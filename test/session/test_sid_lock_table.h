#pragma once
#include "session/sid_lock_table.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace zsession
{
    TEST(SidLockTableTest, AcquireAndRelease)
    {
        auto table = std::make_shared<SidLockTable>();
        {
            auto guard = table->acquire("sid1");
            EXPECT_TRUE(guard.owns_lock());
            EXPECT_EQ(guard.get_sid(), "sid1");
            EXPECT_TRUE(table->is_locked("sid1"));
            EXPECT_FALSE(table->is_locked("sid2"));
            EXPECT_EQ(table->active_count(), 1u);
        }
        EXPECT_FALSE(table->is_locked("sid1"));
        EXPECT_EQ(table->active_count(), 0u);
    }

    TEST(SidLockTableTest, ReleaseIsIdempotent)
    {
        auto table = std::make_shared<SidLockTable>();
        auto guard = table->acquire("sid1");
        guard.release();
        guard.release();
        EXPECT_FALSE(guard.owns_lock());
        EXPECT_FALSE(table->is_locked("sid1"));
    }

    TEST(SidLockTableTest, MoveTransfersOwnership)
    {
        auto table = std::make_shared<SidLockTable>();
        auto first = table->acquire("sid1");
        SidLockTable::Guard second = std::move(first);
        EXPECT_FALSE(first.owns_lock());
        EXPECT_TRUE(second.owns_lock());
        EXPECT_TRUE(table->is_locked("sid1"));
        second.release();
        EXPECT_FALSE(table->is_locked("sid1"));
    }

    TEST(SidLockTableTest, SecondAcquireWaitsForRelease)
    {
        auto table = std::make_shared<SidLockTable>();
        auto guard = table->acquire("sid1");

        std::atomic<bool> acquired{false};
        std::thread waiter([&]()
        {
            auto second = table->acquire("sid1");
            acquired = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        EXPECT_FALSE(acquired.load());

        guard.release();
        waiter.join();
        EXPECT_TRUE(acquired.load());
        EXPECT_FALSE(table->is_locked("sid1"));
    }

    TEST(SidLockTableTest, DifferentSidsDoNotBlock)
    {
        auto table = std::make_shared<SidLockTable>();
        auto a = table->acquire("a");
        auto b = table->acquire("b");
        EXPECT_EQ(table->active_count(), 2u);
    }
} // namespace zsession
