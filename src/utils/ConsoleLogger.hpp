#pragma once
#include "ILogger.hpp"
#include <string>

class ConsoleLogger : public ILogger {
private:
    LogLevel level;

public:
    explicit ConsoleLogger(LogLevel minLevel = LogLevel::INFO) : level(minLevel) {}

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel newLevel) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel msgLevel, const std::string& message) override;
};

// 将配置中的级别名称（debug/info/warning/error）转换为LogLevel，未知名称返回INFO
LogLevel parseLogLevel(const std::string& name);
