#pragma once
#include <stdexcept>
#include <string>

// 所有备份相关异常的基类
class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& message) : std::runtime_error(message) {}
};

class SourceNotFoundError : public BackupError {
public:
    explicit SourceNotFoundError(const std::string& path)
        : BackupError("Source directory not found: " + path) {}
};

class NotADirectoryError : public BackupError {
public:
    explicit NotADirectoryError(const std::string& path)
        : BackupError("Source is not a directory: " + path) {}
};

class UnsupportedFormatError : public BackupError {
public:
    explicit UnsupportedFormatError(const std::string& format)
        : BackupError("Unsupported archive format: " + format) {}
};

// 无法创建或写入归档文件，整个任务中止
class ArchiveWriteError : public BackupError {
public:
    explicit ArchiveWriteError(const std::string& message) : BackupError(message) {}
};

// 归档文件损坏或无法读取
class ArchiveReadError : public BackupError {
public:
    explicit ArchiveReadError(const std::string& message) : BackupError(message) {}
};

// 单个文件读取失败，只跳过该文件
class FileReadError : public BackupError {
public:
    explicit FileReadError(const std::string& message) : BackupError(message) {}
};

class ConfigError : public BackupError {
public:
    explicit ConfigError(const std::string& message) : BackupError(message) {}
};
