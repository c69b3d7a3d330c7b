#include "http/http_request.h"
#include "log/logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace zsession::zhttp
{
    namespace
    {
        // 去除前后空白
        std::string trim(std::string_view s)
        {
            const auto first = std::find_if(s.begin(), s.end(), [](unsigned char ch)
                                            { return !std::isspace(ch); });
            const auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch)
                                           { return !std::isspace(ch); }).base();
            if (first >= last)
            {
                return "";
            }
            return std::string(first, last);
        }

        bool is_hex(const char ch)
        {
            return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
        }

        int hex_value(const char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            return std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10;
        }
    } // namespace

    // 设置与获取请求方法
    void HttpRequest::set_method(Method method)
    {
        method_ = method;
    }

    HttpRequest::Method HttpRequest::get_method() const
    {
        return method_;
    }

    // 设置与获取请求路径
    void HttpRequest::set_path(const std::string_view &path)
    {
        path_ = url_decode(std::string(path), false);
        ZSESSION_LOG_DEBUG("HTTP request path set to: '{}'", path_);
    }

    const std::string &HttpRequest::get_path() const
    {
        return path_;
    }

    // 设置与获取请求查询参数
    void HttpRequest::set_query_parameters(const std::string_view &str)
    {
        query_parameters_ = parse_urlencoded(str);
        ZSESSION_LOG_DEBUG("Query parameters parsed, total count: {}", query_parameters_.size());
    }

    std::string HttpRequest::get_query_parameters(const std::string &key) const
    {
        if (const auto it = query_parameters_.find(key); it != query_parameters_.end())
        {
            return it->second;
        }
        return "";
    }

    // 设置与获取请求头
    void HttpRequest::set_header(const std::string_view &key, const std::string_view &value)
    {
        std::string trimmed_key = trim(key);
        std::string trimmed_value = trim(value);
        ZSESSION_LOG_DEBUG("HTTP request header set: '{}'", trimmed_key);
        headers_[std::move(trimmed_key)] = std::move(trimmed_value);
    }

    std::string HttpRequest::get_header(const std::string &key) const
    {
        if (const auto it = headers_.find(key); it != headers_.end())
        {
            return it->second;
        }
        return "";
    }

    // 设置与获取请求体
    void HttpRequest::set_content(const std::string_view &content)
    {
        content_ = std::string(content);
        ZSESSION_LOG_DEBUG("HTTP request content set, length: {} bytes", content_.size());
    }

    const std::string &HttpRequest::get_content() const
    {
        return content_;
    }

    std::string HttpRequest::get_form_value(const std::string &key) const
    {
        if (const auto it = query_parameters_.find(key); it != query_parameters_.end())
        {
            return it->second;
        }

        const std::string content_type = get_header("Content-Type");
        if (content_type.rfind("application/x-www-form-urlencoded", 0) != 0)
        {
            return "";
        }

        const auto form = parse_urlencoded(content_);
        if (const auto it = form.find(key); it != form.end())
        {
            return it->second;
        }
        return "";
    }

    // Cookie: a=1; b=2 按名称精确匹配
    std::optional<std::string> HttpRequest::get_cookie(const std::string &name) const
    {
        const std::string header = get_header("Cookie");
        if (header.empty())
        {
            return std::nullopt;
        }

        std::string_view rest(header);
        while (!rest.empty())
        {
            size_t end = rest.find(';');
            std::string_view pair = rest.substr(0, end);
            rest = end == std::string_view::npos ? std::string_view() : rest.substr(end + 1);

            const size_t eq = pair.find('=');
            if (eq == std::string_view::npos)
            {
                continue;
            }
            if (trim(pair.substr(0, eq)) == name)
            {
                std::string value = trim(pair.substr(eq + 1));
                // 去掉可选的双引号
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                {
                    value = value.substr(1, value.size() - 2);
                }
                return value;
            }
        }

        ZSESSION_LOG_DEBUG("Cookie '{}' not present in request", name);
        return std::nullopt;
    }

    std::unordered_map<std::string, std::string> HttpRequest::parse_urlencoded(const std::string_view &str)
    {
        std::unordered_map<std::string, std::string> params;

        size_t start = 0;
        while (start < str.length())
        {
            size_t end = str.find('&', start);
            if (end == std::string_view::npos)
            {
                end = str.length();
            }

            std::string_view param = str.substr(start, end - start);
            if (const size_t equals_pos = param.find('='); equals_pos != std::string_view::npos)
            {
                std::string key(param.substr(0, equals_pos));
                std::string value(param.substr(equals_pos + 1));
                params[url_decode(key, true)] = url_decode(value, true);
            }
            else if (!param.empty())
            {
                params[url_decode(std::string(param), true)] = "";
            }

            start = end + 1;
        }
        return params;
    }

    // '+' 只在查询参数和表单中代表空格，路径中不转换
    std::string HttpRequest::url_decode(const std::string &src, bool plus_to_space)
    {
        std::ostringstream oss;
        for (size_t i = 0; i < src.length(); ++i)
        {
            if (src[i] == '%')
            {
                // 只有紧跟两个十六进制字符时才解码，否则原样输出
                if (i + 2 < src.length() && is_hex(src[i + 1]) && is_hex(src[i + 2]))
                {
                    oss << static_cast<char>(hex_value(src[i + 1]) * 16 + hex_value(src[i + 2]));
                    i += 2;
                }
                else
                {
                    oss << '%';
                }
            }
            else if (src[i] == '+' && plus_to_space)
            {
                oss << ' ';
            }
            else
            {
                oss << src[i];
            }
        }
        return oss.str();
    }
} // namespace zsession::zhttp
