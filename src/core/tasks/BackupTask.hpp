#pragma once
#include <string>
#include <vector>
#include "../Types.hpp"
#include "../models/BackupRecord.hpp"
#include "../../utils/ILogger.hpp"

class BackupCatalog;

// 一次备份的参数
struct BackupOptions {
    std::string sourceDirectory;
    std::string backupName;          // 为空时使用"backup_<目录名>"
    std::string format = "tar";
    int compressionLevel = 6;
    std::vector<std::string> exclusions; // 追加在默认排除规则之后
};

enum class BackupStatus {
    SUCCESS,
    SOURCE_NOT_FOUND,
    NOT_A_DIRECTORY,
    UNSUPPORTED_FORMAT,
    INVALID_ARGUMENT,
    ARCHIVE_WRITE_FAILURE,
    CATALOG_WRITE_FAILURE
};

struct BackupResult {
    BackupStatus status = BackupStatus::SUCCESS;
    std::string message;
    BackupRecord record;
    std::string archivePath;

    bool ok() const { return status == BackupStatus::SUCCESS; }
};

std::string toString(BackupStatus status);

class BackupTask {
private:
    BackupOptions options;
    BackupCatalog& catalog;
    std::string archiveDirectory;
    std::vector<std::string> defaultPatterns;
    // 当前任务状态
    TaskStatus status;
    ILogger* logger;

    BackupResult fail(BackupStatus code, const std::string& message);

public:
    BackupTask(const BackupOptions& backupOptions, BackupCatalog& backupCatalog, const std::string& archiveDir,
               const std::vector<std::string>& patterns, ILogger* log);

    // 估算大小、写入归档、计算摘要并登记到目录；任何失败都不会留下记录或部分归档
    BackupResult execute();
    TaskStatus getStatus() const;
};
