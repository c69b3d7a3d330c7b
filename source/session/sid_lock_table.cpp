#include "session/sid_lock_table.h"
#include "log/logger.h"

namespace zsession
{
    SidLockTable::Guard::Guard(SidLockTable::ptr table, std::string sid)
        : table_(std::move(table)), sid_(std::move(sid))
    {
    }

    SidLockTable::Guard::~Guard()
    {
        release();
    }

    SidLockTable::Guard::Guard(Guard &&other) noexcept
        : table_(std::move(other.table_)), sid_(std::move(other.sid_))
    {
        other.table_.reset();
        other.sid_.clear();
    }

    SidLockTable::Guard &SidLockTable::Guard::operator=(Guard &&other) noexcept
    {
        if (this != &other)
        {
            release();
            table_ = std::move(other.table_);
            sid_ = std::move(other.sid_);
            other.table_.reset();
            other.sid_.clear();
        }
        return *this;
    }

    void SidLockTable::Guard::release()
    {
        if (table_)
        {
            table_->release(sid_);
            table_.reset();
        }
    }

    bool SidLockTable::Guard::owns_lock() const
    {
        return table_ != nullptr;
    }

    const std::string &SidLockTable::Guard::get_sid() const
    {
        return sid_;
    }

    SidLockTable::Guard SidLockTable::acquire(const std::string &sid)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (active_.count(sid) > 0)
        {
            ZSESSION_LOG_DEBUG("Session {} is in use, waiting for release", sid);
            released_.wait(lock, [this, &sid]() { return active_.count(sid) == 0; });
        }
        active_.insert(sid);
        ZSESSION_LOG_DEBUG("Session {} locked, active locks: {}", sid, active_.size());
        return Guard(shared_from_this(), sid);
    }

    bool SidLockTable::is_locked(const std::string &sid) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.count(sid) > 0;
    }

    size_t SidLockTable::active_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.size();
    }

    void SidLockTable::release(const std::string &sid)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_.erase(sid);
        }
        // 等待者各自检查自己的会话ID
        released_.notify_all();
        ZSESSION_LOG_DEBUG("Session {} released", sid);
    }
} // namespace zsession
