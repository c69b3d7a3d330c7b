#include "http/http_response.h"
#include "log/logger.h"
#include <algorithm>

namespace zsession::zhttp
{
    // 设置与获取响应状态码
    void HttpResponse::set_status_code(const StatusCode status_code)
    {
        status_code_ = status_code;
    }

    HttpResponse::StatusCode HttpResponse::get_status_code() const
    {
        return status_code_;
    }

    // 设置与获取响应状态消息
    void HttpResponse::set_status_message(const std::string_view &status_message)
    {
        status_message_ = std::string(status_message);
    }

    const std::string &HttpResponse::get_status_message() const
    {
        return status_message_;
    }

    // 设置与获取响应头
    void HttpResponse::set_header(const std::string_view &key, const std::string_view &value)
    {
        headers_[std::string(key)] = std::string(value);
    }

    std::string HttpResponse::get_header(const std::string &key) const
    {
        if (const auto it = headers_.find(key); it != headers_.end())
        {
            return it->second;
        }
        return "";
    }

    // 设置与获取响应正文
    void HttpResponse::set_body(const std::string_view &body)
    {
        body_ = std::string(body);
    }

    const std::string &HttpResponse::get_body() const
    {
        return body_;
    }

    void HttpResponse::add_cookie(const Cookie &cookie)
    {
        const auto it = std::find_if(cookies_.begin(), cookies_.end(),
                                     [&cookie](const Cookie &c) { return c.name == cookie.name; });
        if (it != cookies_.end())
        {
            ZSESSION_LOG_DEBUG("Replacing response cookie '{}'", cookie.name);
            *it = cookie;
            return;
        }
        cookies_.push_back(cookie);
    }

    std::optional<Cookie> HttpResponse::get_cookie(const std::string &name) const
    {
        const auto it = std::find_if(cookies_.begin(), cookies_.end(),
                                     [&name](const Cookie &c) { return c.name == name; });
        if (it == cookies_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    const std::vector<Cookie> &HttpResponse::get_cookies() const
    {
        return cookies_;
    }

    std::string HttpResponse::to_string() const
    {
        std::string out = "HTTP/1.1 " + std::to_string(static_cast<int>(status_code_)) + " " + status_message_ + delim;
        for (const auto &[key, value] : headers_)
        {
            out += key + ": " + value + delim;
        }
        for (const auto &cookie : cookies_)
        {
            out += "Set-Cookie: " + cookie.to_string() + delim;
        }
        out += "Content-Length: " + std::to_string(body_.size()) + delim;
        out += delim;
        out += body_;
        return out;
    }
} // namespace zsession::zhttp
