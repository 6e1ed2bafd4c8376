#pragma once
#include <string>
#include <vector>
#include "tasks/BackupTask.hpp"

class BackupCatalog;
class ILogger;

// 创建备份：校验源目录、写入归档、计算摘要并登记到目录
class BackupLifecycleManager {
private:
    BackupCatalog& catalog;
    std::string archiveDirectory;
    std::vector<std::string> defaultPatterns;
    ILogger* logger;

public:
    BackupLifecycleManager(BackupCatalog& backupCatalog, const std::string& archiveDir, ILogger* log,
                           const std::vector<std::string>& patterns = {});

    BackupResult createBackup(const BackupOptions& options);

    std::vector<BackupRecord> listBackups() const;

    const std::vector<std::string>& getDefaultPatterns() const { return defaultPatterns; }
    const std::string& getArchiveDirectory() const { return archiveDirectory; }
};
