#pragma once
#include <zlog/zlog.h>

namespace zsession
{
    inline zlog::Logger::ptr session_logger;

    class Log
    {
    public:
        static void Init(zlog::LogLevel::value limitLevel = zlog::LogLevel::value::DEBUG)
        {
            std::unique_ptr<zlog::GlobalLoggerBuilder> builder(new zlog::GlobalLoggerBuilder());
            builder->buildLoggerName("session_logger");
            builder->buildLoggerLevel(limitLevel);
            builder->buildLoggerFormmater("[%c][%d][%f:%l][%p][%t]  %m%n");
            builder->buildLoggerSink<zlog::StdOutSink>();
            session_logger = builder->build();
        }
    };

    // 日志宏，未初始化日志器时不输出
#define ZSESSION_LOG_DEBUG(fmt, ...) if(zsession::session_logger) zsession::session_logger->debug(fmt, ##__VA_ARGS__)
#define ZSESSION_LOG_INFO(fmt, ...)  if(zsession::session_logger) zsession::session_logger->info(fmt, ##__VA_ARGS__)
#define ZSESSION_LOG_WARN(fmt, ...)  if(zsession::session_logger) zsession::session_logger->warn(fmt, ##__VA_ARGS__)
#define ZSESSION_LOG_ERROR(fmt, ...) if(zsession::session_logger) zsession::session_logger->error(fmt, ##__VA_ARGS__)
#define ZSESSION_LOG_FATAL(fmt, ...) if(zsession::session_logger) zsession::session_logger->fatal(fmt, ##__VA_ARGS__)
} // namespace zsession
