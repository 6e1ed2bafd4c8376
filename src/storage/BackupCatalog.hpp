#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <cstdint>
#include "../core/models/BackupRecord.hpp"

class ILogger;

// 目录统计信息
struct CatalogStatistics {
    size_t totalBackups = 0;
    uint64_t totalSize = 0;
    size_t uniqueDirectories = 0;
    std::string oldestBackup; // 为空表示没有备份
    std::string newestBackup;
};

// 以JSON数组持久化的备份目录，保持插入顺序；每次修改后整体重写文件
class BackupCatalog {
private:
    std::string indexPath;
    std::vector<BackupRecord> records;
    ILogger* logger;
    bool unsaved; // 内存中的记录与索引文件不一致

    bool writeIndex();

public:
    static constexpr const char* UNKNOWN_DIRECTORY = "desconhecido";

    // 构造时立即从indexPath加载
    BackupCatalog(const std::string& path, ILogger* log);

    // 文件不存在时为空目录；内容无法解析时记录警告并重置为空
    void load();

    // 先写临时文件再重命名；失败时记录错误并返回false
    bool save();

    bool add(const BackupRecord& record);

    // 删除记录；找到即返回true，写入失败记录错误并由hasUnsavedChanges()反映
    bool remove(const std::string& fileName);

    // 一次性删除多条记录，只写一次文件；返回删除的数量
    size_t removeMany(const std::set<std::string>& fileNames);

    bool clear();

    // 最近一次写入失败后为true，直到下一次成功写入
    bool hasUnsavedChanges() const { return unsaved; }

    std::vector<BackupRecord> all() const { return records; }
    std::vector<BackupRecord> byDirectory(const std::string& directoryName) const;
    std::map<std::string, std::vector<BackupRecord>> groupedByDirectory() const;

    // 按ISO时间戳字符串排序（稳定排序）
    std::vector<BackupRecord> sortedByDate(bool descending = true) const;

    bool findByHash(const std::string& hashMd5, BackupRecord& result) const;
    bool findByFileName(const std::string& fileName, BackupRecord& result) const;

    uint64_t totalSize() const;
    CatalogStatistics statistics() const;

    size_t size() const { return records.size(); }
    const std::string& getIndexPath() const { return indexPath; }
};
