#pragma once
#include "session_storage.h"
#include "../db/mysql_connection.h"

namespace zsession::zstore
{
    /*
     * MySQL会话存储，表结构:
     *   sid   char(64)  主键
     *   atime timestamp 每次写入自动更新
     *   data  text      json格式的会话属性
     * 表不存在时在构造函数中创建。
     */
    class MysqlStorage final : public SessionStorage
    {
    public:
        MysqlStorage(zdb::MysqlConnection::ptr connection, std::string table_name, std::chrono::seconds max_age);

        ~MysqlStorage() override = default;

        std::shared_ptr<Session> fetch(const std::string &session_id) override;

        void commit(const std::shared_ptr<Session> &session) override;

        void remove(const std::shared_ptr<Session> &session) override;

        void sweep() override;

        void shutdown() override;

        [[nodiscard]] const std::string &get_table_name() const;

    private:
        // 出错前先确认连接可用
        zdb::MysqlConnection::ptr connection() const;

    private:
        zdb::MysqlConnection::ptr connection_;
        std::string table_name_;
        std::chrono::seconds max_age_;

        // 预先拼好的SQL
        std::string fetch_sql_;
        std::string commit_sql_;
        std::string sweep_sql_;
        std::string remove_sql_;
    };
} // namespace zsession::zstore
