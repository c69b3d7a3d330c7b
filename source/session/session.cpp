#include "session/session.h"
#include "session/session_config.h"
#include "session/session_error.h"
#include "session/session_manager.h"
#include "session/session_storage.h"
#include "http/http_request.h"
#include "http/http_response.h"
#include "log/logger.h"

namespace zsession
{
    Session::Session(std::string session_id, Values attributes)
        : session_id_(std::move(session_id)), attributes_(std::move(attributes))
    {
    }

    Session::~Session()
    {
        if (guard_.owns_lock() && !committed_)
        {
            ZSESSION_LOG_WARN("Session {} destroyed without commit, releasing its lock", session_id_);
        }
    }

    // 获取会话ID
    std::string Session::get_session_id() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return session_id_;
    }

    // 设置与提取会话属性
    void Session::set_attribute(const std::string &key, const std::string &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        attributes_[key] = value;
    }

    std::optional<std::string> Session::get_attribute(const std::string &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (const auto it = attributes_.find(key); it != attributes_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    // 移除会话属性
    void Session::remove_attribute(const std::string &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        attributes_.erase(key);
    }

    // 清空会话属性
    void Session::clear_attributes()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        attributes_.clear();
    }

    Values Session::get_attributes() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return attributes_;
    }

    nlohmann::json Session::get_attributes_json() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        nlohmann::json j = nlohmann::json::object();
        for (const auto &attr : attributes_)
        {
            j[attr.first] = attr.second;
        }
        return j;
    }

    Values Session::parse_attributes_json(const std::string &text)
    {
        const nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
        if (!j.is_object())
        {
            throw StorageException("invalid session attributes encoding");
        }

        Values values;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!it.value().is_string())
            {
                throw StorageException("session attribute '" + it.key() + "' is not a string");
            }
            values.emplace(it.key(), it.value().get<std::string>());
        }
        return values;
    }

    void Session::bind(std::shared_ptr<SessionStorage> storage, SidLockTable::ptr locks, SidLockTable::Guard guard,
                       std::string cookie_name, bool secure,
                       const zhttp::HttpRequest *request, zhttp::HttpResponse *response)
    {
        storage_ = std::move(storage);
        locks_ = std::move(locks);
        guard_ = std::move(guard);
        cookie_name_ = std::move(cookie_name);
        secure_ = secure;
        request_ = request;
        response_ = response;
    }

    void Session::ensure_bound() const
    {
        if (!storage_ || !locks_)
        {
            throw SessionException("session is not bound to a session manager");
        }
    }

    void Session::commit()
    {
        ensure_bound();

        std::string sid;
        SidLockTable::Guard guard;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (committed_)
            {
                throw SessionException("session " + session_id_ + " already committed");
            }
            committed_ = true;
            sid = session_id_;
            guard = std::move(guard_);
        }

        // 无论写入是否成功，guard析构时都会释放会话ID
        if (!sid.empty())
        {
            ZSESSION_LOG_DEBUG("Committing session {}", sid);
            storage_->commit(shared_from_this());
        }
    }

    void Session::clear()
    {
        ensure_bound();

        std::string old_sid;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (committed_)
            {
                throw SessionException("session " + session_id_ + " already committed");
            }
            old_sid = session_id_;
        }

        if (!old_sid.empty())
        {
            storage_->remove(shared_from_this());
        }

        std::string new_sid = SessionManager::generate_session_id();
        SidLockTable::Guard new_guard = locks_->acquire(new_sid);
        SidLockTable::Guard old_guard;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            session_id_ = new_sid;
            attributes_.clear();
            old_guard = std::move(guard_);
            guard_ = std::move(new_guard);
        }
        old_guard.release();

        ZSESSION_LOG_INFO("Session {} cleared, new session {}", old_sid.empty() ? "<none>" : old_sid, new_sid);

        set_cookie();
        new_action_token();
    }

    bool Session::is_committed() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return committed_;
    }

    std::string Session::action_token() const
    {
        if (auto token = get_attribute(kActionTokenKey); token && !token->empty())
        {
            return *token;
        }
        return "error";
    }

    std::string Session::new_action_token()
    {
        set_attribute(kActionTokenKey, SessionManager::generate_session_id());
        return action_token();
    }

    bool Session::can_act() const
    {
        if (!request_)
        {
            return false;
        }

        const std::string submitted = request_->get_form_value(kActionTokenKey);
        const auto stored = get_attribute(kActionTokenKey);
        return stored && !stored->empty() && submitted != "error" && submitted == *stored;
    }

    void Session::set_cookie()
    {
        if (!response_)
        {
            return;
        }

        zhttp::Cookie cookie;
        cookie.name = cookie_name_;
        cookie.value = get_session_id();
        cookie.path = "/";
        cookie.max_age = kCookieMaxAge;
        cookie.http_only = true;
        cookie.secure = secure_;
        response_->add_cookie(cookie);

        ZSESSION_LOG_DEBUG("Session cookie '{}' set to {}", cookie_name_, cookie.value);
    }
} // namespace zsession
