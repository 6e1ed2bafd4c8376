#pragma once
#include <string>
#include <cstdint>

enum class TaskStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

// 归档格式
enum class ArchiveFormat {
    TAR,
    ZIP
};

// 完整性校验使用的摘要算法
enum class HashAlgorithm {
    MD5,
    SHA256
};

// 源目录类型（根据特征文件检测）
enum class DirectoryType {
    NODEJS,
    PYTHON,
    JAVA,
    GIT,
    GENERIC
};

// 一次压缩遍历的计数结果
struct CompressionStats {
    uint64_t filesAdded = 0;
    uint64_t filesExcluded = 0;
    uint64_t dirsExcluded = 0;
};

inline std::string toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::RUNNING: return "RUNNING";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::TAR: return "tar";
        case ArchiveFormat::ZIP: return "zip";
        default: return "unknown";
    }
}

inline std::string toString(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5: return "md5";
        case HashAlgorithm::SHA256: return "sha256";
        default: return "unknown";
    }
}

inline std::string toString(DirectoryType type) {
    switch (type) {
        case DirectoryType::NODEJS: return "nodejs";
        case DirectoryType::PYTHON: return "python";
        case DirectoryType::JAVA: return "java";
        case DirectoryType::GIT: return "git";
        case DirectoryType::GENERIC: return "generico";
        default: return "generico";
    }
}

// 格式名称（不区分大小写）解析，未知名称抛出UnsupportedFormatError
ArchiveFormat parseArchiveFormat(const std::string& name);

// 算法名称（不区分大小写）解析，未知名称抛出std::invalid_argument
HashAlgorithm parseHashAlgorithm(const std::string& name);
