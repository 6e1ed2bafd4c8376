#pragma once
#include <string>
#include <cstdint>

class BackupCatalog;
class ILogger;

// 一次清理的结果
struct RetentionStats {
    size_t removedCount = 0;
    size_t keptCount = 0;
    uint64_t freedBytes = 0;
    bool indexSaved = true; // 为false时归档已删除但索引文件仍包含其记录
};

// 按保留策略删除归档文件及其目录记录
class RetentionManager {
private:
    BackupCatalog& catalog;
    std::string archiveDirectory;
    ILogger* logger;

    // 删除归档文件；文件不存在视为成功，删除失败返回false
    bool deleteArchive(const std::string& fileName, uint64_t& freedBytes);

    // 删除记录后索引未能写入时记录错误并返回false
    bool checkIndexSaved();

public:
    RetentionManager(BackupCatalog& backupCatalog, const std::string& archiveDir, ILogger* log);

    // 每个目录按时间从新到旧排列，超出maxPerDirectory或早于daysToKeep天的记录被删除（满足其一即可）
    RetentionStats cleanupByAgeAndCount(int daysToKeep, size_t maxPerDirectory);

    // 从最旧的开始删除，直到总大小不超过maxTotalBytes
    RetentionStats cleanupBySize(uint64_t maxTotalBytes);

    // 删除归档目录中未被目录引用的.tar.gz/.zip文件，返回删除数量
    size_t removeOrphanFiles();

    static uint64_t gigabytesToBytes(double gigabytes);
};
