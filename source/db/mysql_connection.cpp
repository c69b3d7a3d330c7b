#include "db/mysql_connection.h"
#include "log/logger.h"

namespace zsession::zdb
{
    MysqlConnection::MysqlConnection(std::string host, std::string user,
                                     std::string password, std::string database)
        : host_(std::move(host)), user_(std::move(user)), password_(std::move(password)),
          database_(std::move(database))
    {
        ZSESSION_LOG_INFO("Creating database connection to {}@{}/{}", user_, host_, database_);
        try
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connect_helper();
        }
        catch (const sql::SQLException &e)
        {
            ZSESSION_LOG_ERROR("Failed to create database connection: {}", e.what());
            throw DBException(e.what());
        }
    }

    MysqlConnection::~MysqlConnection()
    {
        cleanup();
        ZSESSION_LOG_INFO("Database connection to {}@{} closed", user_, host_);
    }

    // 检查连接是否可用
    bool MysqlConnection::ping() const
    {
        try
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connection_)
            {
                return false;
            }

            std::unique_ptr<sql::Statement> stmt(connection_->createStatement());
            std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery("SELECT 1"));
            while (rs && rs->next())
            {
                // 消费结果
            }
            return true;
        }
        catch (const sql::SQLException &e)
        {
            ZSESSION_LOG_WARN("Database ping failed: {}", e.what());
            return false;
        }
    }

    // 重连
    void MysqlConnection::reconnect()
    {
        ZSESSION_LOG_INFO("Attempting to reconnect to database {}@{}/{}", user_, host_, database_);
        try
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_.reset();
            connect_helper();
            ZSESSION_LOG_INFO("Database reconnection successful");
        }
        catch (const sql::SQLException &e)
        {
            ZSESSION_LOG_ERROR("Database reconnect failed: {}", e.what());
            throw DBException(e.what());
        }
    }

    void MysqlConnection::ensure_connected()
    {
        if (!ping())
        {
            ZSESSION_LOG_WARN("MySQL connection lost, attempting to reconnect");
            reconnect();
        }
    }

    void MysqlConnection::execute(const std::string &sql)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            std::unique_ptr<sql::Statement> stmt(connection_->createStatement());
            stmt->execute(sql);
        }
        catch (sql::SQLException &e)
        {
            ZSESSION_LOG_ERROR("execute error: {}", e.what());
            throw DBException(e.what());
        }
    }

    // 析构前回滚未提交的事务
    void MysqlConnection::cleanup()
    {
        try
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connection_ && !connection_->isClosed() && !connection_->getAutoCommit())
            {
                ZSESSION_LOG_DEBUG("Rolling back uncommitted transaction");
                connection_->rollback();
                connection_->setAutoCommit(true);
            }
        }
        catch (const sql::SQLException &e)
        {
            ZSESSION_LOG_WARN("Error cleaning up connection: {}", e.what());
        }
    }

    // 辅助连接函数
    void MysqlConnection::connect_helper()
    {
        sql::mysql::MySQL_Driver *driver = sql::mysql::get_mysql_driver_instance();
        connection_.reset(driver->connect(host_, user_, password_));
        if (!connection_)
        {
            ZSESSION_LOG_ERROR("Failed to create database connection object");
            throw DBException("Failed to create database connection");
        }

        connection_->setSchema(database_);
        connection_->setClientOption("OPT_CONNECT_TIMEOUT", "10");

        // utf8mb4 保证会话属性中的多字节字符不被截断
        std::unique_ptr<sql::Statement> stmt(connection_->createStatement());
        stmt->execute("SET NAMES utf8mb4");

        ZSESSION_LOG_DEBUG("Database connection established to {}@{}/{}", user_, host_, database_);
    }
} // namespace zsession::zdb
