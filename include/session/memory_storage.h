#pragma once
#include "session_storage.h"
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace zsession::zstore
{
    /*
     * 内存会话存储。
     * 会话表只由内部的服务线程访问：每个外部调用都被包装成带应答promise的请求，
     * 放入对应操作的队列，由服务线程依次执行并应答，因此不需要对会话表加锁。
     * fetch/commit/remove队列深度为10，sweep/shutdown为同步交接。
     */
    class MemoryStorage final : public SessionStorage
    {
    public:
        explicit MemoryStorage(std::chrono::seconds max_age, Clock clock = nullptr);

        ~MemoryStorage() override;

        MemoryStorage(const MemoryStorage &) = delete;

        MemoryStorage &operator=(const MemoryStorage &) = delete;

        // 加载会话
        std::shared_ptr<Session> fetch(const std::string &session_id) override;

        // 存储会话
        void commit(const std::shared_ptr<Session> &session) override;

        // 删除会话
        void remove(const std::shared_ptr<Session> &session) override;

        // 清除过期会话
        void sweep() override;

        // 停止服务线程并丢弃所有会话，重复调用无效果
        void shutdown() override;

        static constexpr size_t kQueueDepth = 10;

    private:
        struct StoredSession
        {
            Values values;
            TimePoint last_used;
        };

        struct FetchRequest
        {
            std::string session_id;
            std::promise<std::shared_ptr<Session>> reply;
        };

        struct CommitRequest
        {
            std::string session_id;
            Values values;
            std::promise<void> reply;
        };

        struct RemoveRequest
        {
            std::string session_id;
            std::promise<void> reply;
        };

        struct SweepRequest
        {
            std::promise<void> reply;
        };

        struct ShutdownRequest
        {
            std::promise<void> reply;
        };

        // 服务线程主循环
        void serve();

        // 放入请求队列，队列满时阻塞，已关闭时抛出StorageException
        template<typename Request>
        void post(std::deque<Request> &queue, size_t capacity, Request request);

        bool has_pending() const;

        // 以下只在服务线程中调用
        std::shared_ptr<Session> do_fetch(const std::string &session_id);

        void do_commit(const std::string &session_id, Values values);

        void do_remove(const std::string &session_id);

        void do_sweep();

    private:
        std::chrono::seconds max_age_;
        Clock clock_;

        std::unordered_map<std::string, StoredSession> sessions_; // 只属于服务线程

        mutable std::mutex mailbox_mutex_;
        std::condition_variable mailbox_cv_; // 服务线程等待新请求
        std::condition_variable space_cv_; // 调用方等待队列空位
        std::deque<FetchRequest> fetch_queue_;
        std::deque<CommitRequest> commit_queue_;
        std::deque<RemoveRequest> remove_queue_;
        std::deque<SweepRequest> sweep_queue_;
        std::deque<ShutdownRequest> shutdown_queue_;
        bool closed_ = false;

        std::thread serve_thread_;
    };
} // namespace zsession::zstore
