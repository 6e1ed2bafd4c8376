#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <functional>
#include <cstdint>
#include "../core/Types.hpp"

namespace fs = std::filesystem;

class ExclusionFilter;

// 目录遍历中某一层目录的内容
struct DirectoryLevel {
    fs::path directory;
    std::vector<fs::path> subdirectories; // 访问者可以移除其中的项，被移除的目录不会继续深入
    std::vector<fs::path> files;          // 普通文件、符号链接（非目录）及其他特殊文件
};

// 目录大小估算结果
struct DirectorySize {
    uint64_t totalBytes = 0;
    uint64_t fileCount = 0;
};

class FileSystem {
public:
    // 检查文件或目录是否存在
    static bool exists(const std::string& path);

    // 检查路径是否为目录（跟随符号链接）
    static bool isDirectory(const std::string& path);

    // 创建目录（包括父目录）
    static bool createDirectories(const std::string& path);

    // 获取文件大小，失败时返回0
    static uint64_t getFileSize(const std::string& filePath);

    // 删除单个文件
    static bool removeFile(const std::string& path);

    // 路径最后一个组成部分，忽略末尾分隔符
    static std::string baseName(const std::string& path);

    // 将开头的 ~ 展开为 $HOME
    static std::string expandUser(const std::string& path);

    // 自顶向下遍历目录，每层的子目录和文件按名称排序；符号链接目录出现在subdirectories中但不会深入
    static void walk(const fs::path& root, const std::function<void(DirectoryLevel&)>& visitor);

    // 按排除规则计算目录下文件的总大小与数量
    static DirectorySize calculateDirectorySize(const std::string& directory, ExclusionFilter* filter = nullptr);

    // 根据特征文件检测目录类型
    static DirectoryType detectDirectoryType(const std::string& directory);

    // 列出目录（不递归）中以给定后缀结尾的普通文件
    static std::vector<fs::path> listFilesWithSuffixes(const std::string& directory,
                                                      const std::vector<std::string>& suffixes);
};
