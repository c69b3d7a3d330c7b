#pragma once
#include <chrono>
#include <string>

namespace zsession::zhttp
{
    /* Set-Cookie 响应头中的一条Cookie */
    struct Cookie
    {
        std::string name;
        std::string value;
        std::string path = "/";
        std::chrono::seconds max_age{0}; // 0表示不输出Max-Age
        bool http_only = false;
        bool secure = false;

        // 生成Set-Cookie头的值
        std::string to_string() const;
    };
} // namespace zsession::zhttp
