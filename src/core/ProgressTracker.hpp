#pragma once
#include <string>
#include <cstdint>

class ILogger;

// 按文件数里程碑报告压缩进度：每max(100, 预计总数/50)个文件报告一次
class ProgressTracker {
private:
    uint64_t expectedTotal;
    uint64_t interval;
    uint64_t current;
    ILogger* logger;

public:
    static constexpr uint64_t MIN_INTERVAL = 100;
    static constexpr uint64_t MILESTONES = 50;

    ProgressTracker(uint64_t total, ILogger* log);

    // 更新已处理的文件数，返回本次是否输出了进度
    bool update(uint64_t processed);

    void finish();

    uint64_t getInterval() const { return interval; }
    uint64_t getCurrent() const { return current; }
};
