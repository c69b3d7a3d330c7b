#pragma once

#include "http_cookie.h"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace zsession::zhttp
{
    /* http响应类 */
    class HttpResponse
    {
    public:
        enum class StatusCode
        {
            UnKnown = 0,
            OK = 200,
            BadRequest = 400,
            Forbidden = 403,
            NotFound = 404,
            InternalServerError = 500,
        };
    public:
        HttpResponse() = default;

        ~HttpResponse() = default;

    public:
        // 设置与获取响应状态码
        void set_status_code(StatusCode status_code);

        StatusCode get_status_code() const;

        // 设置与获取响应状态消息
        void set_status_message(const std::string_view &status_message);

        const std::string &get_status_message() const;

        // 设置与获取响应头
        void set_header(const std::string_view &key, const std::string_view &value);

        std::string get_header(const std::string &key) const;

        // 设置与获取响应正文
        void set_body(const std::string_view &body);

        const std::string &get_body() const;

        // 添加Cookie，同名Cookie以最后一次为准
        void add_cookie(const Cookie &cookie);

        std::optional<Cookie> get_cookie(const std::string &name) const;

        const std::vector<Cookie> &get_cookies() const;

        // 序列化为HTTP/1.1报文
        std::string to_string() const;

    private:
        StatusCode status_code_ = StatusCode::UnKnown; // 响应状态码
        std::string status_message_; // 响应状态消息
        std::unordered_map<std::string, std::string> headers_; // 响应头
        std::vector<Cookie> cookies_; // 待写出的Cookie
        std::string body_; // 响应正文
    };

    // 每行之间的分隔符
    inline const std::string delim = "\r\n";
} // namespace zsession::zhttp
