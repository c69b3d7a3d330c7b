#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace zsession
{
    /* 会话ID互斥表：同一时刻每个会话ID最多被一个请求持有 */
    class SidLockTable : public std::enable_shared_from_this<SidLockTable>
    {
    public:
        using ptr = std::shared_ptr<SidLockTable>;

        // 持有一个会话ID的锁，析构或release()时归还
        class Guard
        {
        public:
            Guard() = default;

            Guard(SidLockTable::ptr table, std::string sid);

            ~Guard();

            Guard(const Guard &) = delete;

            Guard &operator=(const Guard &) = delete;

            Guard(Guard &&other) noexcept;

            Guard &operator=(Guard &&other) noexcept;

            // 提前释放，可重复调用
            void release();

            [[nodiscard]] bool owns_lock() const;

            [[nodiscard]] const std::string &get_sid() const;

        private:
            SidLockTable::ptr table_;
            std::string sid_;
        };

        SidLockTable() = default;

        SidLockTable(const SidLockTable &) = delete;

        SidLockTable &operator=(const SidLockTable &) = delete;

        // 阻塞直到该会话ID空闲，然后占用它
        [[nodiscard]] Guard acquire(const std::string &sid);

        [[nodiscard]] bool is_locked(const std::string &sid) const;

        [[nodiscard]] size_t active_count() const;

    private:
        void release(const std::string &sid);

    private:
        mutable std::mutex mutex_; // 只在修改表时持有，不跨越存储调用
        std::condition_variable released_;
        std::unordered_set<std::string> active_; // 正在使用的会话ID
    };
} // namespace zsession
