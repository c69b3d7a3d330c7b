#pragma once
#include <string>
#include <stdexcept>

namespace zsession
{
    // 会话相关异常的基类
    class SessionException : public std::runtime_error
    {
    public:
        explicit SessionException(const std::string &message) : std::runtime_error(message) {}

        explicit SessionException(const char *message) : std::runtime_error(message) {}
    };

    // 构造参数或配置不合法
    class ValidationException final : public SessionException
    {
    public:
        explicit ValidationException(const std::string &message) : SessionException(message) {}

        explicit ValidationException(const char *message) : SessionException(message) {}
    };

    // 存储后端故障(IO、编码、连接)
    class StorageException : public SessionException
    {
    public:
        explicit StorageException(const std::string &message) : SessionException(message) {}

        explicit StorageException(const char *message) : SessionException(message) {}
    };

    // 关闭时GC线程未能按时退出
    class ShutdownTimeoutException final : public SessionException
    {
    public:
        explicit ShutdownTimeoutException(const std::string &message) : SessionException(message) {}

        explicit ShutdownTimeoutException(const char *message) : SessionException(message) {}
    };
} // namespace zsession
