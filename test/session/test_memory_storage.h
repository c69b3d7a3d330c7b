#pragma once
#include "session/memory_storage.h"
#include "session/session_error.h"
#include "session_test_util.h"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace zsession::zstore
{
    class MemoryStorageTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            storage = std::make_shared<MemoryStorage>(max_age, clock.clock());
        }

        void TearDown() override
        {
            storage->shutdown();
        }

        void commit(const std::string &sid, Values values)
        {
            storage->commit(std::make_shared<Session>(sid, std::move(values)));
        }

        const std::chrono::seconds max_age = std::chrono::minutes(10);
        testing_util::FakeClock clock;
        std::shared_ptr<MemoryStorage> storage;
    };

    TEST_F(MemoryStorageTest, CommitAndFetch)
    {
        commit("sid1", {{"k", "v"}});

        const auto loaded = storage->fetch("sid1");
        ASSERT_NE(loaded, nullptr);
        EXPECT_EQ(loaded->get_session_id(), "sid1");
        EXPECT_EQ(loaded->get_attribute("k"), "v");
    }

    TEST_F(MemoryStorageTest, FetchMissingReturnsNull)
    {
        EXPECT_EQ(storage->fetch("nope"), nullptr);
    }

    TEST_F(MemoryStorageTest, FetchReturnsCopy)
    {
        commit("sid1", {{"k", "v"}});

        const auto first = storage->fetch("sid1");
        ASSERT_NE(first, nullptr);
        first->set_attribute("k", "mutated");
        first->set_attribute("extra", "x");

        const auto second = storage->fetch("sid1");
        ASSERT_NE(second, nullptr);
        EXPECT_EQ(second->get_attribute("k"), "v");
        EXPECT_FALSE(second->get_attribute("extra").has_value());
    }

    TEST_F(MemoryStorageTest, CommitReplacesValues)
    {
        commit("sid1", {{"a", "1"}});
        commit("sid1", {{"b", "2"}});

        const auto loaded = storage->fetch("sid1");
        ASSERT_NE(loaded, nullptr);
        EXPECT_FALSE(loaded->get_attribute("a").has_value());
        EXPECT_EQ(loaded->get_attribute("b"), "2");
    }

    TEST_F(MemoryStorageTest, CommitWithEmptySidIsIgnored)
    {
        commit("", {{"k", "v"}});
        EXPECT_EQ(storage->fetch(""), nullptr);
    }

    TEST_F(MemoryStorageTest, RemoveIsIdempotent)
    {
        commit("sid1", {{"k", "v"}});
        const auto session = std::make_shared<Session>("sid1");

        storage->remove(session);
        EXPECT_EQ(storage->fetch("sid1"), nullptr);
        EXPECT_NO_THROW(storage->remove(session));
    }

    TEST_F(MemoryStorageTest, ExpiredSessionIsAbsentOnFetch)
    {
        commit("sid1", {{"k", "v"}});
        clock.advance(max_age + std::chrono::seconds(1));
        EXPECT_EQ(storage->fetch("sid1"), nullptr);
    }

    TEST_F(MemoryStorageTest, CommitRefreshesLastUsed)
    {
        commit("sid1", {{"k", "v"}});
        clock.advance(max_age - std::chrono::seconds(1));
        commit("sid1", {{"k", "v2"}});
        clock.advance(std::chrono::seconds(2));

        const auto loaded = storage->fetch("sid1");
        ASSERT_NE(loaded, nullptr);
        EXPECT_EQ(loaded->get_attribute("k"), "v2");
    }

    TEST_F(MemoryStorageTest, SweepRemovesOnlyOldSessions)
    {
        commit("old", {{"k", "1"}});
        clock.advance(std::chrono::minutes(3));
        commit("young", {{"k", "2"}});
        clock.advance(max_age - std::chrono::minutes(3) + std::chrono::seconds(1));

        storage->sweep();

        // 回拨时钟后，未被清除的会话会重新可见
        clock.rewind(max_age);
        EXPECT_EQ(storage->fetch("old"), nullptr);
        EXPECT_NE(storage->fetch("young"), nullptr);
    }

    TEST_F(MemoryStorageTest, SweepKeepsSessionExactlyAtMaxAge)
    {
        commit("sid1", {{"k", "v"}});
        clock.advance(max_age);
        storage->sweep();
        EXPECT_NE(storage->fetch("sid1"), nullptr);
    }

    TEST_F(MemoryStorageTest, ConcurrentCallers)
    {
        constexpr int kThreads = 8;
        constexpr int kPerThread = 50;

        std::vector<std::thread> threads;
        threads.reserve(kThreads);
        for (int t = 0; t < kThreads; ++t)
        {
            threads.emplace_back([this, t]()
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    const std::string sid = "sid-" + std::to_string(t) + "-" + std::to_string(i);
                    commit(sid, {{"n", std::to_string(i)}});
                    const auto loaded = storage->fetch(sid);
                    ASSERT_NE(loaded, nullptr);
                    EXPECT_EQ(loaded->get_attribute("n"), std::to_string(i));
                }
                storage->sweep();
            });
        }
        for (auto &th : threads)
        {
            th.join();
        }

        for (int t = 0; t < kThreads; ++t)
        {
            EXPECT_NE(storage->fetch("sid-" + std::to_string(t) + "-0"), nullptr);
        }
    }

    TEST_F(MemoryStorageTest, CallsAfterShutdownFail)
    {
        commit("sid1", {{"k", "v"}});
        storage->shutdown();

        EXPECT_THROW(storage->fetch("sid1"), StorageException);
        EXPECT_THROW(commit("sid1", {{"k", "v"}}), StorageException);
        EXPECT_THROW(storage->remove(std::make_shared<Session>("sid1")), StorageException);
        EXPECT_THROW(storage->sweep(), StorageException);
        EXPECT_NO_THROW(storage->shutdown());
    }

    TEST(MemoryStorageConstructionTest, RejectsShortMaxAge)
    {
        EXPECT_THROW({ MemoryStorage storage(std::chrono::minutes(4)); }, ValidationException);
        EXPECT_THROW({ MemoryStorage storage(std::chrono::seconds(299)); }, ValidationException);

        MemoryStorage storage(std::chrono::minutes(5));
        storage.shutdown();
    }

    TEST(MemoryStorageConstructionTest, FactoryCreatesStorage)
    {
        auto storage = StorageFactory<MemoryStorage, std::chrono::seconds>::create(std::chrono::hours(1));
        ASSERT_NE(storage, nullptr);
        storage->commit(std::make_shared<Session>("sid", Values{{"k", "v"}}));
        EXPECT_NE(storage->fetch("sid"), nullptr);
        storage->shutdown();
    }
} // namespace zsession::zstore
