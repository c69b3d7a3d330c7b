#pragma once

#include <map>
#include <optional>
#include <unordered_map>
#include <string>
#include <string_view>

namespace zsession::zhttp
{
    /* 会话层所需的请求视图：请求头、查询参数、表单与Cookie */
    class HttpRequest
    {
    public:
        enum class Method
        {
            Invalid,
            GET,
            POST,
            PUT,
            DELETE,
        };

        HttpRequest() = default;
        ~HttpRequest() = default;
    public:
        // 设置与获取请求方法
        void set_method(Method method);
        Method get_method() const;

        // 设置与获取请求路径
        void set_path(const std::string_view &path);
        const std::string &get_path() const;

        // 设置与获取请求查询参数
        void set_query_parameters(const std::string_view &str);
        std::string get_query_parameters(const std::string &key) const;

        // 设置与获取请求头
        void set_header(const std::string_view &key, const std::string_view &value);
        std::string get_header(const std::string &key) const;

        // 设置与获取请求体
        void set_content(const std::string_view &content);
        const std::string &get_content() const;

        // 先查查询参数，再查urlencoded表单体
        std::string get_form_value(const std::string &key) const;

        // 从Cookie头中提取指定名称的值
        std::optional<std::string> get_cookie(const std::string &name) const;

        static std::string url_decode(const std::string &src, bool plus_to_space);

    private:
        // 解析 key1=value1&key2=value2 格式
        static std::unordered_map<std::string, std::string> parse_urlencoded(const std::string_view &str);

    private:
        Method method_ = Method::Invalid; // 请求方法
        std::string path_; // 请求路径
        std::unordered_map<std::string, std::string> query_parameters_; // 查询参数
        std::map<std::string, std::string> headers_; // 请求头
        std::string content_; // 请求体
    };
} // namespace zsession::zhttp
