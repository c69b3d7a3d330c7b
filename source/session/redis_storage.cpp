#include "session/redis_storage.h"
#include "session/session_error.h"
#include "log/logger.h"

namespace zsession::zstore
{
    const std::string RedisStorage::kKeyPrefix = "session:";

    RedisStorage::RedisStorage(zdb::RedisConnection::ptr connection, const std::chrono::seconds max_age)
        : connection_(std::move(connection)), max_age_(max_age)
    {
        if (!connection_)
        {
            throw ValidationException("redis connection must not be null");
        }
        validate_max_age(max_age_);
        ZSESSION_LOG_INFO("RedisStorage ready, max age {} seconds", max_age_.count());
    }

    std::shared_ptr<Session> RedisStorage::fetch(const std::string &session_id)
    {
        ZSESSION_LOG_DEBUG("Loading session {} from Redis", session_id);

        const auto fields = connection()->hgetall(kKeyPrefix + session_id);
        if (fields.empty())
        {
            ZSESSION_LOG_DEBUG("Session {} not found in Redis", session_id);
            return nullptr;
        }

        const auto attrs_it = fields.find("attributes");
        if (attrs_it == fields.end())
        {
            ZSESSION_LOG_WARN("Incomplete session data for {} in Redis", session_id);
            return nullptr;
        }
        if (is_stale(fields))
        {
            ZSESSION_LOG_DEBUG("Session {} in Redis is stale", session_id);
            return nullptr;
        }

        return std::make_shared<Session>(session_id, Session::parse_attributes_json(attrs_it->second));
    }

    void RedisStorage::commit(const std::shared_ptr<Session> &session)
    {
        const std::string sid = session->get_session_id();
        if (sid.empty())
        {
            return;
        }

        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        const std::string key = kKeyPrefix + sid;

        const auto conn = connection();
        conn->hset(key, {
                       {"attributes", session->get_attributes_json().dump()},
                       {"last_used", std::to_string(now)}
                   });
        conn->expire(key, max_age_);

        ZSESSION_LOG_DEBUG("Session {} stored to Redis with TTL {} seconds", sid, max_age_.count());
    }

    void RedisStorage::remove(const std::shared_ptr<Session> &session)
    {
        const std::string sid = session->get_session_id();
        if (connection()->del(kKeyPrefix + sid))
        {
            ZSESSION_LOG_INFO("Session {} removed from Redis", sid);
        }
    }

    // Redis的TTL已经负责大部分清理，这里处理没有TTL或时间戳损坏的键
    void RedisStorage::sweep()
    {
        const auto conn = connection();
        const std::vector<std::string> keys = conn->scan_keys(kKeyPrefix + "*");

        size_t removed_count = 0;
        size_t failed_count = 0;
        std::string last_error;
        for (const auto &key: keys)
        {
            try
            {
                const auto fields = conn->hgetall(key);
                if (!fields.empty() && is_stale(fields) && conn->del(key))
                {
                    ++removed_count;
                }
            }
            catch (const zdb::DBException &e)
            {
                ZSESSION_LOG_WARN("Failed to check session key {} during cleanup: {}", key, e.what());
                ++failed_count;
                last_error = e.what();
            }
        }

        ZSESSION_LOG_INFO("Redis expired session cleanup completed, removed {} sessions", removed_count);
        if (failed_count > 0)
        {
            throw StorageException("redis cleanup failed for " + std::to_string(failed_count) +
                                   " keys, last error: " + last_error);
        }
    }

    // 连接由调用方提供，这里只放弃引用
    void RedisStorage::shutdown()
    {
        connection_.reset();
        ZSESSION_LOG_INFO("RedisStorage shut down");
    }

    zdb::RedisConnection::ptr RedisStorage::connection() const
    {
        if (!connection_)
        {
            throw StorageException("redis storage has been shut down");
        }
        connection_->ensure_connected();
        return connection_;
    }

    bool RedisStorage::is_stale(const std::unordered_map<std::string, std::string> &fields) const
    {
        const auto it = fields.find("last_used");
        if (it == fields.end())
        {
            return true;
        }
        try
        {
            const TimePoint last_used{std::chrono::milliseconds(std::stoll(it->second))};
            return std::chrono::system_clock::now() - last_used > max_age_;
        }
        catch (const std::logic_error &)
        {
            return true;
        }
    }
} // namespace zsession::zstore
