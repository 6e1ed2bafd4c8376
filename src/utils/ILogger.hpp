#pragma once
#include <string>

// 日志级别，按严重程度递增
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL
};

inline std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        default: return "UNKNOWN";
    }
}

// 日志接口：归档、目录、清理与恢复组件都通过它报告跳过的文件和删除操作
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;

    // 低于当前级别的消息被丢弃
    virtual void setLogLevel(LogLevel level) = 0;
    virtual LogLevel getLogLevel() const = 0;

    virtual void log(LogLevel level, const std::string& message) = 0;
};
