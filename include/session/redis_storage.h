#pragma once
#include "session_storage.h"
#include "../db/redis_connection.h"

namespace zsession::zstore
{
    // 每个会话一个Hash: session:<sid> {attributes, last_used}，TTL为最大存活时间
    class RedisStorage final : public SessionStorage
    {
    public:
        RedisStorage(zdb::RedisConnection::ptr connection, std::chrono::seconds max_age);

        ~RedisStorage() override = default;

        std::shared_ptr<Session> fetch(const std::string &session_id) override;

        void commit(const std::shared_ptr<Session> &session) override;

        void remove(const std::shared_ptr<Session> &session) override;

        void sweep() override;

        void shutdown() override;

        static const std::string kKeyPrefix;

    private:
        zdb::RedisConnection::ptr connection() const;

        // last_used字段缺失、无法解析或过期
        bool is_stale(const std::unordered_map<std::string, std::string> &fields) const;

    private:
        zdb::RedisConnection::ptr connection_;
        std::chrono::seconds max_age_;
    };
} // namespace zsession::zstore
