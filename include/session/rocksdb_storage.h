#pragma once
#include "session_storage.h"
#include <mutex>
#include <rocksdb/db.h>

namespace zsession::zstore
{
    /*
     * 基于RocksDB的嵌入式会话存储，两个键空间:
     *   sessionsLastUsed/<sid> -> 最后使用时间(epoch毫秒)
     *   sessions/<sid>         -> json格式的会话属性
     * 同一会话的两个键总是在同一个WriteBatch中写入或删除。
     */
    class RocksDbStorage final : public SessionStorage
    {
    public:
        RocksDbStorage(std::unique_ptr<rocksdb::DB> db, std::chrono::seconds max_age, Clock clock = nullptr);

        ~RocksDbStorage() override;

        RocksDbStorage(const RocksDbStorage &) = delete;

        RocksDbStorage &operator=(const RocksDbStorage &) = delete;

        // 打开(不存在则创建)path处的数据库
        static std::unique_ptr<rocksdb::DB> open(const std::string &path);

        std::shared_ptr<Session> fetch(const std::string &session_id) override;

        void commit(const std::shared_ptr<Session> &session) override;

        void remove(const std::shared_ptr<Session> &session) override;

        // 删除时间戳无法解析或过期的会话，单条记录出错不影响其余记录
        void sweep() override;

        // 关闭数据库
        void shutdown() override;

        static const std::string kLastUsedPrefix;
        static const std::string kSessionsPrefix;

    private:
        // 调用方需持有mutex_
        rocksdb::DB *database() const;

        static void check(const rocksdb::Status &status, const std::string &what);

        // 解析epoch毫秒，失败返回false
        static bool decode_time(const std::string &raw, TimePoint &out);

    private:
        std::unique_ptr<rocksdb::DB> db_;
        std::chrono::seconds max_age_;
        Clock clock_;
        mutable std::mutex mutex_;
    };
} // namespace zsession::zstore
