#pragma once
#include <chrono>
#include <string>
#include <utility>

namespace zsession
{
    // 存储后端允许的最小会话存活时间
    inline constexpr std::chrono::seconds kMinimumMaxAge = std::chrono::minutes(5);

    // GC最小间隔
    inline constexpr std::chrono::seconds kMinimumGcDelay = std::chrono::minutes(5);

    // 会话Cookie有效期: 30天
    inline constexpr std::chrono::seconds kCookieMaxAge = std::chrono::hours(24 * 30);

    // 防跨站请求令牌在会话属性中的键名
    inline const std::string kActionTokenKey = "actionToken";

    struct SessionConfig
    {
        std::string cookie_name = "session_id"; // Cookie名称
        bool secure = false; // 是否只通过HTTPS发送Cookie
        std::chrono::seconds gc_delay = std::chrono::hours(1); // GC间隔
        std::chrono::milliseconds shutdown_timeout = std::chrono::seconds(30); // 等待GC线程退出的时间

        static SessionConfig default_config(std::string cookie_name)
        {
            SessionConfig config;
            config.cookie_name = std::move(cookie_name);
            return config;
        }
    };
} // namespace zsession
