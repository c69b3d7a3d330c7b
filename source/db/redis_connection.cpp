#include "db/redis_connection.h"
#include "log/logger.h"
#include <iterator>

namespace zsession::zdb
{
    RedisConnection::RedisConnection(std::string host, const int port, std::string password,
                                     const int db, const int timeout_ms)
        : host_(std::move(host)), port_(port), password_(std::move(password)),
          db_(db), timeout_ms_(timeout_ms)
    {
        ZSESSION_LOG_INFO("Creating Redis connection to {}:{}/{}", host_, port_, db_);
        std::lock_guard<std::mutex> lock(mutex_);
        connect_helper();
    }

    bool RedisConnection::ping() const
    {
        try
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!redis_)
            {
                return false;
            }
            redis_->ping();
            return true;
        }
        catch (const sw::redis::Error &e)
        {
            ZSESSION_LOG_WARN("Redis ping failed: {}", e.what());
            return false;
        }
    }

    void RedisConnection::reconnect()
    {
        ZSESSION_LOG_INFO("Attempting to reconnect to Redis {}:{}/{}", host_, port_, db_);
        std::lock_guard<std::mutex> lock(mutex_);
        redis_.reset();
        connect_helper();
    }

    void RedisConnection::ensure_connected()
    {
        if (!ping())
        {
            ZSESSION_LOG_WARN("Redis connection lost, attempting to reconnect");
            reconnect();
        }
    }

    void RedisConnection::connect_helper()
    {
        try
        {
            sw::redis::ConnectionOptions opts;
            opts.host = host_;
            opts.port = port_;
            opts.db = db_;
            opts.socket_timeout = std::chrono::milliseconds(timeout_ms_);
            opts.connect_timeout = std::chrono::milliseconds(timeout_ms_);
            if (!password_.empty())
            {
                opts.password = password_;
            }

            sw::redis::ConnectionPoolOptions pool_opts;
            pool_opts.size = 1; // 每个连接对象内部只维护一个连接

            redis_ = std::make_unique<sw::redis::Redis>(opts, pool_opts);
            redis_->ping();
            ZSESSION_LOG_DEBUG("Redis connection established to {}:{}", host_, port_);
        }
        catch (const sw::redis::Error &e)
        {
            ZSESSION_LOG_ERROR("Failed to create Redis connection: {}", e.what());
            redis_.reset();
            throw DBException("Failed to create Redis connection: " + std::string(e.what()));
        }
    }

    bool RedisConnection::del(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            return redis_->del(key) > 0;
        }
        catch (const sw::redis::Error &e)
        {
            ZSESSION_LOG_ERROR("Redis DEL failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    // 一条HSET写入全部字段
    void RedisConnection::hset(const std::string &key,
                               const std::unordered_map<std::string, std::string> &fields) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            redis_->hset(key, fields.begin(), fields.end());
        }
        catch (const sw::redis::Error &e)
        {
            ZSESSION_LOG_ERROR("Redis HSET failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    std::unordered_map<std::string, std::string> RedisConnection::hgetall(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            std::unordered_map<std::string, std::string> result;
            redis_->hgetall(key, std::inserter(result, result.end()));
            return result;
        }
        catch (const sw::redis::Error &e)
        {
            ZSESSION_LOG_ERROR("Redis HGETALL failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    void RedisConnection::expire(const std::string &key, const std::chrono::seconds ttl) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            redis_->expire(key, ttl);
        }
        catch (const sw::redis::Error &e)
        {
            ZSESSION_LOG_ERROR("Redis EXPIRE failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    std::vector<std::string> RedisConnection::scan_keys(const std::string &pattern, const size_t count) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            std::vector<std::string> keys;
            sw::redis::Cursor cursor = 0;
            do
            {
                cursor = redis_->scan(cursor, pattern, static_cast<long long>(count), std::back_inserter(keys));
            } while (cursor != 0);
            return keys;
        }
        catch (const sw::redis::Error &e)
        {
            ZSESSION_LOG_ERROR("Redis SCAN failed for pattern {}: {}", pattern, e.what());
            throw DBException(e.what());
        }
    }
} // namespace zsession::zdb
