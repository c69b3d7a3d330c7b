#include "session/mysql_storage.h"
#include "session/session_error.h"
#include "log/logger.h"

namespace zsession::zstore
{
    MysqlStorage::MysqlStorage(zdb::MysqlConnection::ptr connection, std::string table_name,
                               const std::chrono::seconds max_age)
        : connection_(std::move(connection)), table_name_(std::move(table_name)), max_age_(max_age)
    {
        if (!connection_)
        {
            throw ValidationException("mysql connection must not be null");
        }
        if (table_name_.empty())
        {
            throw ValidationException("can not use empty table name");
        }
        if (table_name_.find('`') != std::string::npos)
        {
            throw ValidationException("invalid table name: " + table_name_);
        }
        validate_max_age(max_age_);

        const std::string table = "`" + table_name_ + "`";
        const std::string seconds = std::to_string(max_age_.count());
        fetch_sql_ = "SELECT data FROM " + table +
                     " WHERE sid = ? AND atime > SUBDATE(NOW(), INTERVAL " + seconds + " SECOND)";
        commit_sql_ = "REPLACE INTO " + table + " (sid, data) VALUES (?, ?)";
        sweep_sql_ = "DELETE FROM " + table + " WHERE atime < SUBDATE(NOW(), INTERVAL " + seconds + " SECOND)";
        remove_sql_ = "DELETE FROM " + table + " WHERE sid = ?";

        connection()->execute("CREATE TABLE IF NOT EXISTS " + table + " ("
                              " `sid` char(64) NOT NULL,"
                              " `atime` timestamp NOT NULL DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP,"
                              " `data` text NOT NULL,"
                              " PRIMARY KEY (`sid`),"
                              " KEY `atime` (`atime`)"
                              " ) DEFAULT CHARSET=utf8mb4");

        ZSESSION_LOG_INFO("MysqlStorage ready on table {}, max age {} seconds", table_name_, max_age_.count());
    }

    std::shared_ptr<Session> MysqlStorage::fetch(const std::string &session_id)
    {
        ZSESSION_LOG_DEBUG("Loading session {} from MySQL", session_id);

        const zdb::QueryResult rows = connection()->execute_query(fetch_sql_, session_id);
        if (rows.empty() || rows.front().empty())
        {
            ZSESSION_LOG_DEBUG("Session {} not found in MySQL", session_id);
            return nullptr;
        }
        return std::make_shared<Session>(session_id, Session::parse_attributes_json(rows.front().front()));
    }

    void MysqlStorage::commit(const std::shared_ptr<Session> &session)
    {
        const std::string sid = session->get_session_id();
        if (sid.empty())
        {
            return;
        }

        const std::string data = session->get_attributes_json().dump();
        connection()->execute_update(commit_sql_, sid, data);
        ZSESSION_LOG_DEBUG("Session {} stored to MySQL", sid);
    }

    void MysqlStorage::remove(const std::shared_ptr<Session> &session)
    {
        const std::string sid = session->get_session_id();
        if (connection()->execute_update(remove_sql_, sid) > 0)
        {
            ZSESSION_LOG_INFO("Session {} removed from MySQL", sid);
        }
    }

    void MysqlStorage::sweep()
    {
        const int removed_count = connection()->execute_update(sweep_sql_);
        ZSESSION_LOG_INFO("MySQL expired session cleanup completed, removed {} sessions", removed_count);
    }

    // 连接由调用方提供，这里只放弃引用
    void MysqlStorage::shutdown()
    {
        connection_.reset();
        ZSESSION_LOG_INFO("MysqlStorage on table {} shut down", table_name_);
    }

    const std::string &MysqlStorage::get_table_name() const
    {
        return table_name_;
    }

    zdb::MysqlConnection::ptr MysqlStorage::connection() const
    {
        if (!connection_)
        {
            throw StorageException("mysql storage has been shut down");
        }
        connection_->ensure_connected();
        return connection_;
    }
} // namespace zsession::zstore
