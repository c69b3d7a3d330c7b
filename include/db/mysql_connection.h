#pragma once

#include <memory>
#include <string>
#include <vector>
#include <mutex>
#include <type_traits>
#include <cppconn/connection.h>
#include <cppconn/prepared_statement.h>
#include <cppconn/resultset.h>
#include <mysql_driver.h>
#include "../log/logger.h"
#include "db_exception.h"

namespace zsession::zdb
{
    // 一次性拉取所有查询结果：行列表，每行是 string 列表
    using QueryResult = std::vector<std::vector<std::string>>;

    class MysqlConnection
    {
    public:
        using ptr = std::shared_ptr<MysqlConnection>;

        MysqlConnection(std::string host, std::string user,
                        std::string password, std::string database);

        ~MysqlConnection();

        // 禁止拷贝与赋值
        MysqlConnection(const MysqlConnection &) = delete;

        MysqlConnection &operator=(const MysqlConnection &) = delete;

        // 检测连接是否有效
        [[nodiscard]] bool ping() const;

        // 重新连接
        void reconnect();

        // 连接断开时重连
        void ensure_connected();

        // 执行查询语句
        template<typename ...Args>
        QueryResult execute_query(const std::string &sql, Args &&... args)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            try
            {
                std::unique_ptr<sql::PreparedStatement> stmt(connection_->prepareStatement(sql));
                bind_params(stmt.get(), 1, std::forward<Args>(args)...);

                std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());

                // 元数据由ResultSet管理，不需要释放
                sql::ResultSetMetaData *meta = rs->getMetaData();
                const unsigned int col_count = meta->getColumnCount();

                QueryResult rows;
                while (rs->next())
                {
                    std::vector<std::string> row;
                    row.reserve(col_count);
                    for (unsigned int i = 1; i <= col_count; ++i)
                    {
                        row.emplace_back(rs->getString(i));
                    }
                    rows.emplace_back(std::move(row));
                }
                return rows;
            }
            catch (sql::SQLException &e)
            {
                ZSESSION_LOG_ERROR("execute_query error: {}", e.what());
                throw DBException(e.what());
            }
        }

        // 执行更新语句，返回受影响的行数
        template<typename ...Args>
        int execute_update(const std::string &sql, Args &&... args)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            try
            {
                std::unique_ptr<sql::PreparedStatement> stmt(connection_->prepareStatement(sql));
                bind_params(stmt.get(), 1, std::forward<Args>(args)...);
                return stmt->executeUpdate();
            }
            catch (sql::SQLException &e)
            {
                ZSESSION_LOG_ERROR("execute_update error: {}", e.what());
                throw DBException(e.what());
            }
        }

        // 执行不带参数的DDL语句
        void execute(const std::string &sql);

    private:
        // 辅助连接并配置
        void connect_helper();

        // 清理未完成的事务
        void cleanup();

        // 辅助递归结束函数
        void bind_params(sql::PreparedStatement *, int) {}

        template<typename T, typename ...Args>
        void bind_params(sql::PreparedStatement *statement, int index, T &&value, Args &&... args)
        {
            using Decayed = std::decay_t<T>;
            if constexpr (std::is_same_v<Decayed, std::string> || std::is_same_v<Decayed, const char *>)
            {
                statement->setString(index, std::forward<T>(value));
            }
            else if constexpr (std::is_integral_v<Decayed>)
            {
                statement->setInt64(index, static_cast<int64_t>(value));
            }
            else
            {
                static_assert(std::is_integral_v<Decayed>, "Unsupported parameter type");
            }
            bind_params(statement, index + 1, std::forward<Args>(args)...);
        }

    private:
        std::shared_ptr<sql::Connection> connection_; // 数据库连接
        std::string host_; // 数据库主机
        std::string user_; // 数据库用户名
        std::string password_; // 数据库密码
        std::string database_; // 数据库名
        mutable std::mutex mutex_;
    };
} // namespace zsession::zdb
