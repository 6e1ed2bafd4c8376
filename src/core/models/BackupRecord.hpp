#pragma once
#include <string>
#include <cstdint>
#include <json/json.h>

// 目录中一次备份的记录，写入目录后不再修改
struct BackupRecord {
    std::string fileName;        // 归档文件名
    std::string sourceDirectory; // 源目录绝对路径
    std::string directoryName;   // 源目录名
    std::string createdAt;       // ISO-8601时间戳
    uint64_t originalSize;       // 未压缩大小（字节）
    uint64_t backupSize;         // 归档大小（字节）
    double compressionRatio;     // 压缩率（百分比）
    uint64_t totalFiles;
    uint64_t excludedFiles;
    uint64_t excludedDirs;
    std::string directoryType;   // nodejs | python | java | git | generico
    std::string hashMd5;
    bool maxCompression;
    std::string format;          // tar | zip

    BackupRecord():
        originalSize(0), backupSize(0), compressionRatio(0.0),
        totalFiles(0), excludedFiles(0), excludedDirs(0), maxCompression(false) {}

    // 转换为目录文件中的JSON对象（键名与已有的索引文件保持一致）
    Json::Value toJson() const;

    // 从JSON对象读取，缺失或类型不符的字段取默认值
    static BackupRecord fromJson(const Json::Value& value);

    bool operator==(const BackupRecord& other) const;
    bool operator!=(const BackupRecord& other) const { return !(*this == other); }
};
