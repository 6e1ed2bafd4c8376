#pragma once
#include <string>
#include <memory>
#include <functional>
#include <filesystem>
#include <cstdint>
#include "../core/Types.hpp"

namespace fs = std::filesystem;

class ILogger;
class ExclusionFilter;

// 进度回调，参数为已加入归档的文件数
using ProgressCallback = std::function<void(uint64_t)>;

// 压缩器基类：遍历目录并写入归档，或将归档解压
class Compressor {
protected:
    ILogger* logger;

public:
    static constexpr int DEFAULT_LEVEL = 6;

    explicit Compressor(ILogger* log) : logger(log) {}
    virtual ~Compressor() = default;

    // 归档文件后缀，例如".tar.gz"
    virtual std::string extension() const = 0;
    virtual ArchiveFormat format() const = 0;

    // 深度优先遍历sourceDir，被排除的目录不再深入；条目名称相对于sourceDir的父目录。
    // 单个文件读取失败计入filesExcluded并继续；level超出0-9时抛出std::invalid_argument
    CompressionStats compress(const std::string& sourceDir, const std::string& outputPath,
                              ExclusionFilter& filter, const ProgressCallback& progress = nullptr,
                              int level = DEFAULT_LEVEL);

    // 解压到destinationParent下，归档中的顶层目录名保持不变
    void decompress(const std::string& archivePath, const std::string& destinationParent);
};

class TarCompressor : public Compressor {
public:
    explicit TarCompressor(ILogger* log) : Compressor(log) {}

    std::string extension() const override { return ".tar.gz"; }
    ArchiveFormat format() const override { return ArchiveFormat::TAR; }
};

class ZipCompressor : public Compressor {
public:
    explicit ZipCompressor(ILogger* log) : Compressor(log) {}

    std::string extension() const override { return ".zip"; }
    ArchiveFormat format() const override { return ArchiveFormat::ZIP; }
};

// 按格式名称（"tar"/"zip"，不区分大小写）创建压缩器，未知格式抛出UnsupportedFormatError
std::unique_ptr<Compressor> createCompressor(const std::string& formatName, ILogger* logger);
std::unique_ptr<Compressor> createCompressor(ArchiveFormat format, ILogger* logger);

// 根据文件名后缀判断格式，无法识别时返回false
bool formatFromFileName(const std::string& fileName, ArchiveFormat& format);
