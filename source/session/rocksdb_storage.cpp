#include "session/rocksdb_storage.h"
#include "session/session_error.h"
#include "log/logger.h"
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

namespace zsession::zstore
{
    const std::string RocksDbStorage::kLastUsedPrefix = "sessionsLastUsed/";
    const std::string RocksDbStorage::kSessionsPrefix = "sessions/";

    RocksDbStorage::RocksDbStorage(std::unique_ptr<rocksdb::DB> db, const std::chrono::seconds max_age, Clock clock)
        : db_(std::move(db)), max_age_(max_age), clock_(std::move(clock))
    {
        validate_max_age(max_age_);
        if (!db_)
        {
            throw ValidationException("rocksdb handle must not be null");
        }
        if (!clock_)
        {
            clock_ = [] { return std::chrono::system_clock::now(); };
        }
        ZSESSION_LOG_INFO("RocksDbStorage ready, max age {} seconds", max_age_.count());
    }

    RocksDbStorage::~RocksDbStorage()
    {
        if (db_)
        {
            const rocksdb::Status status = db_->Close();
            if (!status.ok())
            {
                ZSESSION_LOG_WARN("Closing rocksdb in destructor failed: {}", status.ToString());
            }
        }
    }

    std::unique_ptr<rocksdb::DB> RocksDbStorage::open(const std::string &path)
    {
        rocksdb::Options options;
        options.create_if_missing = true;

        rocksdb::DB *raw_db = nullptr;
        const rocksdb::Status status = rocksdb::DB::Open(options, path, &raw_db);
        if (!status.ok())
        {
            ZSESSION_LOG_ERROR("Failed to open rocksdb at {}: {}", path, status.ToString());
            throw StorageException("failed to open rocksdb at " + path + ": " + status.ToString());
        }
        return std::unique_ptr<rocksdb::DB>(raw_db);
    }

    std::shared_ptr<Session> RocksDbStorage::fetch(const std::string &session_id)
    {
        std::string raw_time;
        std::string raw_values;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rocksdb::DB *db = database();

            rocksdb::Status status = db->Get(rocksdb::ReadOptions(), kLastUsedPrefix + session_id, &raw_time);
            if (status.IsNotFound())
            {
                return nullptr;
            }
            check(status, "read last used time");

            status = db->Get(rocksdb::ReadOptions(), kSessionsPrefix + session_id, &raw_values);
            if (status.IsNotFound())
            {
                return nullptr;
            }
            check(status, "read session values");
        }

        TimePoint last_used;
        if (!decode_time(raw_time, last_used) || clock_() - last_used > max_age_)
        {
            ZSESSION_LOG_DEBUG("Session {} in rocksdb is stale", session_id);
            return nullptr;
        }

        try
        {
            return std::make_shared<Session>(session_id, Session::parse_attributes_json(raw_values));
        }
        catch (const StorageException &e)
        {
            ZSESSION_LOG_ERROR("Session {} in rocksdb has undecodable values: {}", session_id, e.what());
            throw;
        }
    }

    void RocksDbStorage::commit(const std::shared_ptr<Session> &session)
    {
        const std::string sid = session->get_session_id();
        if (sid.empty())
        {
            return;
        }

        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_().time_since_epoch()).count();

        rocksdb::WriteBatch batch;
        batch.Put(kLastUsedPrefix + sid, std::to_string(millis));
        batch.Put(kSessionsPrefix + sid, session->get_attributes_json().dump());

        std::lock_guard<std::mutex> lock(mutex_);
        check(database()->Write(rocksdb::WriteOptions(), &batch), "commit session");
    }

    void RocksDbStorage::remove(const std::shared_ptr<Session> &session)
    {
        const std::string sid = session->get_session_id();

        rocksdb::WriteBatch batch;
        batch.Delete(kLastUsedPrefix + sid);
        batch.Delete(kSessionsPrefix + sid);

        std::lock_guard<std::mutex> lock(mutex_);
        check(database()->Write(rocksdb::WriteOptions(), &batch), "remove session");
    }

    void RocksDbStorage::sweep()
    {
        const TimePoint now = clock_();

        std::lock_guard<std::mutex> lock(mutex_);
        rocksdb::DB *db = database();

        rocksdb::WriteBatch batch;
        size_t removed_count = 0;

        std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(kLastUsedPrefix); it->Valid() && it->key().starts_with(kLastUsedPrefix); it->Next())
        {
            const std::string key = it->key().ToString();
            const std::string sid = key.substr(kLastUsedPrefix.size());

            TimePoint last_used;
            if (!decode_time(it->value().ToString(), last_used) || now - last_used > max_age_)
            {
                batch.Delete(key);
                batch.Delete(kSessionsPrefix + sid);
                ++removed_count;
            }
        }
        check(it->status(), "scan sessions");

        if (removed_count > 0)
        {
            check(db->Write(rocksdb::WriteOptions(), &batch), "sweep sessions");
        }
        ZSESSION_LOG_INFO("RocksDB expired session cleanup completed, removed {} sessions", removed_count);
    }

    void RocksDbStorage::shutdown()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
        {
            return;
        }
        const rocksdb::Status status = db_->Close();
        db_.reset();
        check(status, "close database");
        ZSESSION_LOG_INFO("RocksDbStorage closed");
    }

    rocksdb::DB *RocksDbStorage::database() const
    {
        if (!db_)
        {
            throw StorageException("rocksdb storage has been shut down");
        }
        return db_.get();
    }

    void RocksDbStorage::check(const rocksdb::Status &status, const std::string &what)
    {
        if (!status.ok())
        {
            ZSESSION_LOG_ERROR("rocksdb failed to {}: {}", what, status.ToString());
            throw StorageException("rocksdb failed to " + what + ": " + status.ToString());
        }
    }

    bool RocksDbStorage::decode_time(const std::string &raw, TimePoint &out)
    {
        if (raw.empty())
        {
            return false;
        }
        try
        {
            size_t pos = 0;
            const long long millis = std::stoll(raw, &pos);
            if (pos != raw.size())
            {
                return false;
            }
            out = TimePoint(std::chrono::milliseconds(millis));
            return true;
        }
        catch (const std::logic_error &)
        {
            return false;
        }
    }
} // namespace zsession::zstore
