#pragma once
#include "session/redis_storage.h"
#include "session/session_error.h"
#include <gtest/gtest.h>

namespace zsession::zstore
{
    // 需要本地Redis: 127.0.0.1:6379，连接失败时跳过
    class RedisStorageTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            try
            {
                connection = std::make_shared<zdb::RedisConnection>("127.0.0.1", 6379, "", 0, 2000);
            }
            catch (const zdb::DBException &e)
            {
                GTEST_SKIP() << "Redis not reachable: " << e.what();
            }
            storage = std::make_unique<RedisStorage>(connection, std::chrono::hours(1));
        }

        void TearDown() override
        {
            if (connection)
            {
                for (const auto &key : connection->scan_keys(RedisStorage::kKeyPrefix + "gtest_*"))
                {
                    connection->del(key);
                }
            }
        }

        zdb::RedisConnection::ptr connection;
        std::unique_ptr<RedisStorage> storage;
    };

    TEST_F(RedisStorageTest, CommitAndFetch)
    {
        storage->commit(std::make_shared<Session>("gtest_sid1", Values{{"user", "alice"}}));

        const auto loaded = storage->fetch("gtest_sid1");
        ASSERT_NE(loaded, nullptr);
        EXPECT_EQ(loaded->get_attribute("user"), "alice");

        const auto fields = connection->hgetall("session:gtest_sid1");
        EXPECT_EQ(fields.count("attributes"), 1u);
        EXPECT_EQ(fields.count("last_used"), 1u);
    }

    TEST_F(RedisStorageTest, FetchMissingReturnsNull)
    {
        EXPECT_EQ(storage->fetch("gtest_missing"), nullptr);
    }

    TEST_F(RedisStorageTest, RemoveIsIdempotent)
    {
        const auto session = std::make_shared<Session>("gtest_sid1", Values{{"k", "v"}});
        storage->commit(session);
        storage->remove(session);
        EXPECT_EQ(storage->fetch("gtest_sid1"), nullptr);
        EXPECT_NO_THROW(storage->remove(session));
    }

    TEST_F(RedisStorageTest, SweepRemovesStaleKeys)
    {
        storage->commit(std::make_shared<Session>("gtest_young", Values{{"k", "1"}}));
        connection->hset("session:gtest_stale", {{"attributes", "{}"}, {"last_used", "0"}});
        connection->hset("session:gtest_broken", {{"attributes", "{}"}, {"last_used", "yesterday"}});

        EXPECT_EQ(storage->fetch("gtest_stale"), nullptr);
        storage->sweep();

        EXPECT_TRUE(connection->hgetall("session:gtest_stale").empty());
        EXPECT_TRUE(connection->hgetall("session:gtest_broken").empty());
        EXPECT_NE(storage->fetch("gtest_young"), nullptr);
    }

    TEST_F(RedisStorageTest, ShutdownReleasesConnection)
    {
        storage->shutdown();
        EXPECT_THROW(storage->fetch("gtest_sid1"), StorageException);
    }

    TEST(RedisStorageConstructionTest, RejectsInvalidArguments)
    {
        EXPECT_THROW({ RedisStorage storage(nullptr, std::chrono::hours(1)); }, ValidationException);
    }
} // namespace zsession::zstore
