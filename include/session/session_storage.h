#pragma once
#include <chrono>
#include <functional>
#include "session.h"

namespace zsession
{
    using TimePoint = std::chrono::system_clock::time_point;

    // 可替换的时钟，默认为system_clock::now
    using Clock = std::function<TimePoint()>;

    /*
     * 存储后端接口。除shutdown()外所有操作都必须可以并发调用；
     * shutdown()之后再调用其他操作属于调用方错误。
     */
    class SessionStorage
    {
    public:
        using ptr = std::shared_ptr<SessionStorage>;

        virtual ~SessionStorage() = default;

        // 返回会话属性的副本，未找到或已过期返回nullptr
        virtual std::shared_ptr<Session> fetch(const std::string &session_id) = 0;

        // 保存会话属性并刷新最后使用时间，会话ID为空时什么也不做
        virtual void commit(const std::shared_ptr<Session> &session) = 0;

        // 删除会话，记录不存在时不算错误
        virtual void remove(const std::shared_ptr<Session> &session) = 0;

        // 清除超过最大存活时间的会话
        virtual void sweep() = 0;

        // 释放后端资源
        virtual void shutdown() = 0;
    };

    // 简单工厂模式
    template<typename StorageType, typename... Args>
    class StorageFactory
    {
    public:
        static std::shared_ptr<SessionStorage> create(Args &&... args)
        {
            return std::make_shared<StorageType>(std::forward<Args>(args)...);
        }
    };

    // 后端构造时统一的最大存活时间检查
    void validate_max_age(std::chrono::seconds max_age);
} // namespace zsession
