#pragma once

#include "session.h"
#include "session_config.h"
#include "session_storage.h"
#include "sid_lock_table.h"
#include "../http/http_request.h"
#include "../http/http_response.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

namespace zsession
{
    class SessionManager
    {
    public:
        using ptr = std::shared_ptr<SessionManager>;
        using GcErrorHandler = std::function<void(const std::exception &)>;

        SessionManager(std::shared_ptr<SessionStorage> storage, SessionConfig config);

        SessionManager(std::shared_ptr<SessionStorage> storage, const std::string &cookie_name);

        ~SessionManager();

        SessionManager(const SessionManager &) = delete;

        SessionManager &operator=(const SessionManager &) = delete;

        // 从请求中恢复会话，没有可用会话时创建新会话；同一会话ID的请求在此排队
        std::shared_ptr<Session> begin_session(const zhttp::HttpRequest &request, zhttp::HttpResponse *response);

        // 设置GC间隔，不能小于5分钟
        void set_gc_interval(std::chrono::seconds delay);

        [[nodiscard]] std::chrono::seconds get_gc_interval() const;

        // 设置是否只发送Secure Cookie
        void set_secure(bool secure);

        [[nodiscard]] bool is_secure() const;

        [[nodiscard]] const std::string &get_cookie_name() const;

        // GC出错时的回调，默认只记录日志
        void set_gc_error_handler(GcErrorHandler handler);

        // 唤醒GC线程立即清理一次
        void trigger_gc();

        // 停止GC线程并关闭存储
        void shutdown();

        [[nodiscard]] SidLockTable::ptr get_lock_table() const;

        // 生成随机会话ID
        static std::string generate_session_id();

    private:
        // GC线程与管理器共享的状态，超时关闭时由GC线程继续持有
        struct GcLoop
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool stop = false;
            bool triggered = false;
            bool delay_changed = false;
            std::chrono::seconds delay;
            std::shared_ptr<SessionStorage> storage;
            GcErrorHandler on_error;
            std::promise<void> stopped;
        };

        static void run_gc(const std::shared_ptr<GcLoop> &gc);

        void ensure_open() const;

    private:
        std::shared_ptr<SessionStorage> session_storage_; // 会话存储
        SidLockTable::ptr locks_; // 会话ID互斥表
        std::string cookie_name_;
        std::atomic<bool> secure_;
        std::chrono::milliseconds shutdown_timeout_;

        std::shared_ptr<GcLoop> gc_;
        std::thread gc_thread_;

        mutable std::mutex mutex_; // 保护closed_
        bool closed_ = false;
    };
} // namespace zsession
