#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <sw/redis++/redis++.h>
#include "db_exception.h"

namespace zsession::zdb
{
    class RedisConnection
    {
    public:
        using ptr = std::shared_ptr<RedisConnection>;

        explicit RedisConnection(std::string host, int port = 6379, std::string password = "",
                                 int db = 0, int timeout_ms = 5000);

        ~RedisConnection() = default;

        // 禁止拷贝与赋值
        RedisConnection(const RedisConnection &) = delete;
        RedisConnection &operator=(const RedisConnection &) = delete;

        // 检测连接是否有效
        [[nodiscard]] bool ping() const;

        // 重新连接
        void reconnect();

        // 连接断开时重连
        void ensure_connected();

        // Redis操作接口
        bool del(const std::string &key) const;
        void hset(const std::string &key, const std::unordered_map<std::string, std::string> &fields) const;
        std::unordered_map<std::string, std::string> hgetall(const std::string &key) const;
        void expire(const std::string &key, std::chrono::seconds ttl) const;
        std::vector<std::string> scan_keys(const std::string &pattern, size_t count = 100) const;

    private:
        // 辅助连接并配置
        void connect_helper();

    private:
        std::unique_ptr<sw::redis::Redis> redis_{}; // Redis连接
        std::string host_;
        int port_;
        std::string password_;
        int db_;
        int timeout_ms_;
        mutable std::mutex mutex_;
    };
} // namespace zsession::zdb
