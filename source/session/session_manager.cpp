#include "session/session_manager.h"
#include "session/session_error.h"
#include "log/logger.h"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace zsession
{
    SessionManager::SessionManager(std::shared_ptr<SessionStorage> storage, SessionConfig config)
        : session_storage_(std::move(storage)),
          locks_(std::make_shared<SidLockTable>()),
          cookie_name_(std::move(config.cookie_name)),
          secure_(config.secure),
          shutdown_timeout_(config.shutdown_timeout)
    {
        if (!session_storage_)
        {
            throw ValidationException("session storage must not be null");
        }
        if (cookie_name_.empty())
        {
            throw ValidationException("invalid cookie Name");
        }
        if (config.gc_delay < kMinimumGcDelay)
        {
            throw ValidationException("gc delay duration too short");
        }
        if (shutdown_timeout_.count() <= 0)
        {
            throw ValidationException("shutdown timeout must be positive");
        }

        gc_ = std::make_shared<GcLoop>();
        gc_->delay = config.gc_delay;
        gc_->storage = session_storage_;
        gc_thread_ = std::thread(&SessionManager::run_gc, gc_);

        ZSESSION_LOG_INFO("SessionManager initialized with cookie '{}', gc every {} seconds",
                          cookie_name_, config.gc_delay.count());
    }

    SessionManager::SessionManager(std::shared_ptr<SessionStorage> storage, const std::string &cookie_name)
        : SessionManager(std::move(storage), SessionConfig::default_config(cookie_name))
    {
    }

    SessionManager::~SessionManager()
    {
        bool closed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed = closed_;
        }
        if (!closed)
        {
            try
            {
                shutdown();
            }
            catch (const std::exception &e)
            {
                ZSESSION_LOG_ERROR("Error shutting down session manager: {}", e.what());
            }
        }
    }

    // 从请求中获取或创建会话
    std::shared_ptr<Session> SessionManager::begin_session(const zhttp::HttpRequest &request,
                                                           zhttp::HttpResponse *response)
    {
        ensure_open();

        const std::string sid = request.get_cookie(cookie_name_).value_or("");
        SidLockTable::Guard guard;
        std::shared_ptr<Session> stored;

        if (!sid.empty())
        {
            ZSESSION_LOG_DEBUG("Found session ID in request: {}", sid);

            // 先占用会话ID再访问存储，避免并发请求互相覆盖
            guard = locks_->acquire(sid);
            try
            {
                stored = session_storage_->fetch(sid);
            }
            catch (const std::exception &e)
            {
                ZSESSION_LOG_ERROR("Failed to fetch session {}: {}", sid, e.what());
                throw;
            }
        }

        auto session = std::make_shared<Session>(stored ? sid : std::string(),
                                                 stored ? stored->get_attributes() : Values{});
        session->bind(session_storage_, locks_, std::move(guard), cookie_name_, secure_.load(),
                      &request, response);

        if (stored)
        {
            session->set_cookie();
            ZSESSION_LOG_DEBUG("Existing session {} resumed", sid);
        }
        else
        {
            session->clear();
            ZSESSION_LOG_INFO("New session {} created", session->get_session_id());
        }
        return session;
    }

    void SessionManager::set_gc_interval(const std::chrono::seconds delay)
    {
        if (delay < kMinimumGcDelay)
        {
            throw ValidationException("gc delay duration too short");
        }

        {
            std::lock_guard<std::mutex> lock(gc_->mutex);
            gc_->delay = delay;
            gc_->delay_changed = true;
        }
        gc_->cv.notify_all();
        ZSESSION_LOG_INFO("GC interval set to {} seconds", delay.count());
    }

    std::chrono::seconds SessionManager::get_gc_interval() const
    {
        std::lock_guard<std::mutex> lock(gc_->mutex);
        return gc_->delay;
    }

    void SessionManager::set_secure(const bool secure)
    {
        secure_ = secure;
    }

    bool SessionManager::is_secure() const
    {
        return secure_;
    }

    const std::string &SessionManager::get_cookie_name() const
    {
        return cookie_name_;
    }

    void SessionManager::set_gc_error_handler(GcErrorHandler handler)
    {
        std::lock_guard<std::mutex> lock(gc_->mutex);
        gc_->on_error = std::move(handler);
    }

    void SessionManager::trigger_gc()
    {
        ensure_open();
        {
            std::lock_guard<std::mutex> lock(gc_->mutex);
            gc_->triggered = true;
        }
        gc_->cv.notify_all();
    }

    void SessionManager::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
            {
                throw SessionException("already closed");
            }
            closed_ = true;
        }
        ZSESSION_LOG_INFO("Shutting down session manager");

        std::future<void> stopped = gc_->stopped.get_future();
        {
            std::lock_guard<std::mutex> lock(gc_->mutex);
            gc_->stop = true;
        }
        gc_->cv.notify_all();

        const bool gc_timed_out = stopped.wait_for(shutdown_timeout_) != std::future_status::ready;
        if (!gc_timed_out)
        {
            gc_thread_.join();
        }
        else
        {
            ZSESSION_LOG_ERROR("GC failed to stop within {} ms", shutdown_timeout_.count());
            // 迟到的退出仍然要回收线程，该线程可能晚于main结束，只使用日志器副本
            std::thread([t = std::move(gc_thread_), logger = session_logger]() mutable
            {
                t.join();
                if (logger)
                {
                    logger->warn("GC thread stopped after shutdown timeout");
                }
            }).detach();
        }

        session_storage_->shutdown();

        if (gc_timed_out)
        {
            throw ShutdownTimeoutException("gc failed to shut down");
        }
        ZSESSION_LOG_INFO("Session manager shut down");
    }

    SidLockTable::ptr SessionManager::get_lock_table() const
    {
        return locks_;
    }

    // 32字节随机数，十六进制编码
    std::string SessionManager::generate_session_id()
    {
        unsigned char buf[32];
        if (RAND_bytes(buf, sizeof(buf)) != 1)
        {
            const unsigned long err = ERR_get_error();
            char err_buf[256];
            ERR_error_string_n(err, err_buf, sizeof(err_buf));
            ZSESSION_LOG_ERROR("RAND_bytes failed: {}", err_buf);
            throw SessionException(std::string("failed to generate session id: ") + err_buf);
        }

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (const unsigned char b : buf)
        {
            ss << std::setw(2) << static_cast<int>(b);
        }
        return ss.str();
    }

    void SessionManager::run_gc(const std::shared_ptr<GcLoop> &gc)
    {
        std::unique_lock<std::mutex> lock(gc->mutex);
        while (!gc->stop)
        {
            const auto deadline = std::chrono::steady_clock::now() + gc->delay;
            gc->cv.wait_until(lock, deadline, [&gc]()
            {
                return gc->stop || gc->triggered || gc->delay_changed;
            });

            if (gc->stop)
            {
                break;
            }
            if (gc->delay_changed)
            {
                // 按新间隔重新计时
                gc->delay_changed = false;
                continue;
            }
            gc->triggered = false;

            const auto storage = gc->storage;
            const auto on_error = gc->on_error;
            lock.unlock();
            try
            {
                ZSESSION_LOG_DEBUG("GC sweeping expired sessions");
                storage->sweep();
            }
            catch (const std::exception &e)
            {
                // 出错不退出循环，下个周期继续
                ZSESSION_LOG_ERROR("GC sweep failed: {}", e.what());
                if (on_error)
                {
                    try
                    {
                        on_error(e);
                    }
                    catch (const std::exception &handler_error)
                    {
                        ZSESSION_LOG_ERROR("GC error handler failed: {}", handler_error.what());
                    }
                }
            }
            lock.lock();
        }

        ZSESSION_LOG_DEBUG("GC loop stopped");
        gc->stopped.set_value();
    }

    void SessionManager::ensure_open() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
        {
            throw SessionException("session manager has been shut down");
        }
    }
} // namespace zsession
