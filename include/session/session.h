#pragma once
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "sid_lock_table.h"

namespace zsession
{
    namespace zhttp
    {
        class HttpRequest;
        class HttpResponse;
    }

    class SessionStorage;

    using Values = std::unordered_map<std::string, std::string>;

    /*
     * 一次请求内的会话句柄。
     * 存储后端fetch()返回的Session只携带会话ID和属性副本；
     * 由SessionManager::begin_session()创建的Session还绑定了存储、ID锁和请求/响应，
     * 必须在请求结束时调用且仅调用一次commit()。
     */
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        using ptr = std::shared_ptr<Session>;

        explicit Session(std::string session_id, Values attributes = {});

        ~Session();

        Session(const Session &) = delete;

        Session &operator=(const Session &) = delete;

        // 获取会话ID，clear()后会变化
        std::string get_session_id() const;

        // 设置与提取会话属性
        void set_attribute(const std::string &key, const std::string &value);

        std::optional<std::string> get_attribute(const std::string &key) const;

        // 移除会话属性
        void remove_attribute(const std::string &key);

        // 清空会话属性
        void clear_attributes();

        // 属性副本
        Values get_attributes() const;

        // 获取json格式会话属性
        nlohmann::json get_attributes_json() const;

        // 解析后端保存的json属性，格式错误抛出StorageException
        static Values parse_attributes_json(const std::string &text);

        // 写回存储并释放会话ID锁
        void commit();

        // 删除当前记录，换成新的会话ID和空属性
        void clear();

        [[nodiscard]] bool is_committed() const;

        // 防跨站请求令牌
        std::string action_token() const;

        std::string new_action_token();

        // 请求中的actionToken与会话中的一致时返回true
        bool can_act() const;

    private:
        friend class SessionManager;

        void bind(std::shared_ptr<SessionStorage> storage, SidLockTable::ptr locks, SidLockTable::Guard guard,
                  std::string cookie_name, bool secure,
                  const zhttp::HttpRequest *request, zhttp::HttpResponse *response);

        void ensure_bound() const;

        // 把当前会话ID写入响应Cookie
        void set_cookie();

    private:
        std::string session_id_; // 会话ID
        Values attributes_; // 会话属性
        mutable std::shared_mutex mutex_;

        std::shared_ptr<SessionStorage> storage_; // 所属存储
        SidLockTable::ptr locks_; // 会话ID互斥表
        SidLockTable::Guard guard_; // 当前会话ID的锁
        std::string cookie_name_;
        bool secure_ = false;
        bool committed_ = false;
        const zhttp::HttpRequest *request_ = nullptr;
        zhttp::HttpResponse *response_ = nullptr;
    };
} // namespace zsession
