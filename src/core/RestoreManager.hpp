#pragma once
#include <string>
#include <vector>
#include <map>
#include "models/BackupRecord.hpp"

class BackupCatalog;
class ILogger;

enum class RestoreError {
    NONE,
    NOT_IN_CATALOG,
    ARCHIVE_MISSING,
    UNRECOGNIZED_FORMAT,
    EXTRACTION_FAILED
};

struct RestoreResult {
    bool success = false;
    RestoreError error = RestoreError::NONE;
    std::string message;
};

std::string toString(RestoreError error);

// 列出、恢复与校验目录中的备份
class RestoreManager {
private:
    BackupCatalog& catalog;
    std::string archiveDirectory;
    ILogger* logger;

public:
    RestoreManager(BackupCatalog& backupCatalog, const std::string& archiveDir, ILogger* log);

    // 按目录分组，组内从新到旧
    std::map<std::string, std::vector<BackupRecord>> listAvailable() const;

    // 供交互选择的全部备份列表，从新到旧
    std::vector<BackupRecord> selectionList() const;

    // 按归档文件名恢复；实际解压到destination的父目录下
    RestoreResult restoreByName(const std::string& fileName, const std::string& destination);

    // 直接恢复指定路径的归档
    bool restoreBackup(const std::string& archivePath, const std::string& destination);

    // 重新计算归档的MD5并与目录中的值比较；没有记录、没有摘要或文件缺失时返回false
    bool verifyIntegrity(const std::string& fileName);
};
