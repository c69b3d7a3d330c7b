#pragma once
#include <string>
#include "../session/session_error.h"

namespace zsession::zdb
{
    // 数据库驱动抛出的错误统一转换为该异常，属于存储后端故障
    class DBException final : public StorageException
    {
    public:
        explicit DBException(const std::string &message) : StorageException(message) {}

        explicit DBException(const char *message) : StorageException(message) {}
    };
} // namespace zsession::zdb
