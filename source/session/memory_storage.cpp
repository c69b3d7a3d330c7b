#include "session/memory_storage.h"
#include "session/session_error.h"
#include "log/logger.h"
#include <optional>
#include <type_traits>

namespace zsession::zstore
{
    namespace
    {
        // 执行请求并通过promise应答，异常原样交给调用方
        template<typename T, typename F>
        void answer(std::promise<T> &reply, F &&work)
        {
            try
            {
                if constexpr (std::is_void_v<T>)
                {
                    work();
                    reply.set_value();
                }
                else
                {
                    reply.set_value(work());
                }
            }
            catch (const std::exception &)
            {
                reply.set_exception(std::current_exception());
            }
        }

        template<typename Request>
        std::optional<Request> take(std::deque<Request> &queue)
        {
            if (queue.empty())
            {
                return std::nullopt;
            }
            std::optional<Request> request(std::move(queue.front()));
            queue.pop_front();
            return request;
        }
    } // namespace

    MemoryStorage::MemoryStorage(const std::chrono::seconds max_age, Clock clock)
        : max_age_(max_age),
          clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); }))
    {
        validate_max_age(max_age_);
        serve_thread_ = std::thread(&MemoryStorage::serve, this);
        ZSESSION_LOG_INFO("MemoryStorage started, max age {} seconds", max_age_.count());
    }

    MemoryStorage::~MemoryStorage()
    {
        try
        {
            shutdown();
        }
        catch (const std::exception &e)
        {
            ZSESSION_LOG_ERROR("Error shutting down MemoryStorage: {}", e.what());
        }
    }

    template<typename Request>
    void MemoryStorage::post(std::deque<Request> &queue, const size_t capacity, Request request)
    {
        std::unique_lock<std::mutex> lock(mailbox_mutex_);
        // 同步交接的队列同一时刻只有一个待处理请求
        const size_t limit = capacity == 0 ? 1 : capacity;
        space_cv_.wait(lock, [this, &queue, limit]() { return closed_ || queue.size() < limit; });
        if (closed_)
        {
            throw StorageException("memory storage has been shut down");
        }
        queue.push_back(std::move(request));
        lock.unlock();
        mailbox_cv_.notify_one();
    }

    // 加载会话
    std::shared_ptr<Session> MemoryStorage::fetch(const std::string &session_id)
    {
        FetchRequest request;
        request.session_id = session_id;
        auto reply = request.reply.get_future();
        post(fetch_queue_, kQueueDepth, std::move(request));
        return reply.get();
    }

    // 存储会话
    void MemoryStorage::commit(const std::shared_ptr<Session> &session)
    {
        CommitRequest request;
        request.session_id = session->get_session_id();
        if (request.session_id.empty())
        {
            return;
        }
        request.values = session->get_attributes();
        auto reply = request.reply.get_future();
        post(commit_queue_, kQueueDepth, std::move(request));
        reply.get();
    }

    // 删除会话
    void MemoryStorage::remove(const std::shared_ptr<Session> &session)
    {
        RemoveRequest request;
        request.session_id = session->get_session_id();
        auto reply = request.reply.get_future();
        post(remove_queue_, kQueueDepth, std::move(request));
        reply.get();
    }

    // 清除过期会话
    void MemoryStorage::sweep()
    {
        SweepRequest request;
        auto reply = request.reply.get_future();
        post(sweep_queue_, 0, std::move(request));
        reply.get();
    }

    void MemoryStorage::shutdown()
    {
        std::future<void> done;
        {
            std::lock_guard<std::mutex> lock(mailbox_mutex_);
            if (closed_)
            {
                return;
            }
            ShutdownRequest request;
            done = request.reply.get_future();
            shutdown_queue_.push_back(std::move(request));
            // 之后的调用立即失败，已排队的请求仍会被处理
            closed_ = true;
        }
        mailbox_cv_.notify_one();
        space_cv_.notify_all();

        done.get();
        if (serve_thread_.joinable())
        {
            serve_thread_.join();
        }
        ZSESSION_LOG_INFO("MemoryStorage shut down");
    }

    bool MemoryStorage::has_pending() const
    {
        return !fetch_queue_.empty() || !commit_queue_.empty() || !remove_queue_.empty() ||
               !sweep_queue_.empty() || !shutdown_queue_.empty();
    }

    void MemoryStorage::serve()
    {
        ZSESSION_LOG_DEBUG("MemoryStorage serve loop started");
        for (;;)
        {
            std::unique_lock<std::mutex> lock(mailbox_mutex_);
            mailbox_cv_.wait(lock, [this]() { return has_pending(); });

            // 每轮从每个非空队列各取一个请求，shutdown等其他队列排空后才处理
            auto commit_req = take(commit_queue_);
            auto remove_req = take(remove_queue_);
            auto fetch_req = take(fetch_queue_);
            auto sweep_req = take(sweep_queue_);
            std::optional<ShutdownRequest> shutdown_req;
            if (!commit_req && !remove_req && !fetch_req && !sweep_req)
            {
                shutdown_req = take(shutdown_queue_);
            }
            lock.unlock();
            space_cv_.notify_all();

            if (commit_req)
            {
                answer(commit_req->reply, [&]() { do_commit(commit_req->session_id, std::move(commit_req->values)); });
            }
            if (remove_req)
            {
                answer(remove_req->reply, [&]() { do_remove(remove_req->session_id); });
            }
            if (fetch_req)
            {
                answer(fetch_req->reply, [&]() { return do_fetch(fetch_req->session_id); });
            }
            if (sweep_req)
            {
                answer(sweep_req->reply, [&]() { do_sweep(); });
            }
            if (shutdown_req)
            {
                const size_t dropped = sessions_.size();
                sessions_.clear();
                ZSESSION_LOG_DEBUG("MemoryStorage serve loop exiting, dropped {} sessions", dropped);
                shutdown_req->reply.set_value();
                return;
            }
        }
    }

    std::shared_ptr<Session> MemoryStorage::do_fetch(const std::string &session_id)
    {
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            ZSESSION_LOG_DEBUG("Session {} not found in storage", session_id);
            return nullptr;
        }

        if (clock_() - it->second.last_used > max_age_)
        {
            ZSESSION_LOG_WARN("Session {} has expired, removing from storage", session_id);
            sessions_.erase(it);
            return nullptr;
        }

        // 返回副本，调用方修改不影响存储
        return std::make_shared<Session>(session_id, it->second.values);
    }

    void MemoryStorage::do_commit(const std::string &session_id, Values values)
    {
        StoredSession &stored = sessions_[session_id];
        stored.values = std::move(values);
        stored.last_used = clock_();
        ZSESSION_LOG_DEBUG("Session {} stored, total sessions: {}", session_id, sessions_.size());
    }

    void MemoryStorage::do_remove(const std::string &session_id)
    {
        if (sessions_.erase(session_id) > 0)
        {
            ZSESSION_LOG_INFO("Session {} removed, remaining sessions: {}", session_id, sessions_.size());
        }
        else
        {
            ZSESSION_LOG_DEBUG("Session {} not found for removal", session_id);
        }
    }

    void MemoryStorage::do_sweep()
    {
        const TimePoint now = clock_();
        size_t removed_count = 0;

        auto it = sessions_.begin();
        while (it != sessions_.end())
        {
            if (now - it->second.last_used > max_age_)
            {
                it = sessions_.erase(it);
                ++removed_count;
            }
            else
            {
                ++it;
            }
        }

        ZSESSION_LOG_INFO("Expired session cleanup completed: removed {}, remaining {}",
                          removed_count, sessions_.size());
    }
} // namespace zsession::zstore
