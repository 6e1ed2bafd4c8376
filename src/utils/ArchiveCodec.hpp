#pragma once
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <filesystem>
#include <cstdint>
#include "../core/Types.hpp"

namespace fs = std::filesystem;

struct archive;
class ILogger;

struct ArchiveWriteFree {
    void operator()(struct archive* handle) const;
};

// 基于libarchive的归档写入器：tar为pax格式加gzip过滤器，zip为deflate（级别0时为store）
class ArchiveWriter {
private:
    std::unique_ptr<struct archive, ArchiveWriteFree> handle;
    ArchiveFormat format;
    std::string outputPath;
    ILogger* logger;
    bool closed;

    void applyCompressionLevel(int level);
    void copyFileData(std::ifstream& inFile, const fs::path& sourcePath, int64_t expectedSize);

public:
    // 无法创建输出文件时抛出ArchiveWriteError
    ArchiveWriter(ArchiveFormat archiveFormat, const std::string& path, int compressionLevel, ILogger* log);
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // 源文件无法读取时抛出FileReadError（只跳过该文件），归档本身写入失败抛出ArchiveWriteError。
    // tar保存符号链接本身，zip保存链接目标的内容
    void addFile(const fs::path& sourcePath, const std::string& archiveName);

    // 写入结尾结构并关闭文件
    void close();
};

// 读取归档
class ArchiveReader {
public:
    // 解压全部条目到destination下，不安全的条目（绝对路径、".."）被跳过；
    // 归档损坏或CRC不符时抛出ArchiveReadError
    static void extractAll(ArchiveFormat format, const std::string& archivePath,
                           const fs::path& destination, ILogger* logger);

    // 列出全部条目名称（不解压）
    static std::vector<std::string> listEntries(ArchiveFormat format, const std::string& archivePath);
};

// 将归档内的条目名解析为目标目录下的路径；绝对路径或包含".."的条目返回false
bool resolveEntryPath(const fs::path& destination, const std::string& entryName, fs::path& result);
