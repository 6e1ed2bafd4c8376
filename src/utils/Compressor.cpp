#include "Compressor.hpp"
#include "FileSystem.hpp"
#include "ILogger.hpp"
#include "ArchiveCodec.hpp"
#include "../core/ExclusionFilter.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <stdexcept>

CompressionStats Compressor::compress(const std::string& sourceDir, const std::string& outputPath,
                                      ExclusionFilter& filter, const ProgressCallback& progress, int level) {
    if (level < 0 || level > 9) {
        throw std::invalid_argument("Compression level must be between 0 and 9, got " + std::to_string(level));
    }

    fs::path source(sourceDir);
    fs::path base = source.parent_path();
    CompressionStats stats;

    ArchiveWriter writer(format(), outputPath, level, logger);

    FileSystem::walk(source, [&](DirectoryLevel& current) {
        // 先剪除被排除的子目录，整棵子树不再计数
        auto& dirs = current.subdirectories;
        size_t before = dirs.size();
        dirs.erase(std::remove_if(dirs.begin(), dirs.end(), [&](const fs::path& dir) {
                       return filter.shouldExclude(dir.filename().string());
                   }),
                   dirs.end());
        stats.dirsExcluded += before - dirs.size();

        for (const auto& file : current.files) {
            if (filter.shouldExclude(file.filename().string())) {
                stats.filesExcluded++;
                continue;
            }
            std::string archiveName = file.lexically_relative(base).generic_string();
            try {
                writer.addFile(file, archiveName);
            } catch (const FileReadError& e) {
                if (logger) {
                    logger->warn("Error adding " + file.filename().string() + ": " + e.what());
                }
                stats.filesExcluded++;
                continue;
            } catch (const fs::filesystem_error& e) {
                if (logger) {
                    logger->warn("Error adding " + file.filename().string() + ": " + e.what());
                }
                stats.filesExcluded++;
                continue;
            }
            stats.filesAdded++;
            if (progress) {
                progress(stats.filesAdded);
            }
        }
    });

    writer.close();
    return stats;
}

void Compressor::decompress(const std::string& archivePath, const std::string& destinationParent) {
    ArchiveReader::extractAll(format(), archivePath, fs::path(destinationParent), logger);
}

std::unique_ptr<Compressor> createCompressor(ArchiveFormat format, ILogger* logger) {
    switch (format) {
        case ArchiveFormat::TAR: return std::make_unique<TarCompressor>(logger);
        case ArchiveFormat::ZIP: return std::make_unique<ZipCompressor>(logger);
    }
    throw UnsupportedFormatError(toString(format));
}

std::unique_ptr<Compressor> createCompressor(const std::string& formatName, ILogger* logger) {
    return createCompressor(parseArchiveFormat(formatName), logger);
}

bool formatFromFileName(const std::string& fileName, ArchiveFormat& format) {
    auto endsWith = [&](const std::string& suffix) {
        return fileName.size() >= suffix.size() &&
               fileName.compare(fileName.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (endsWith(".tar.gz")) {
        format = ArchiveFormat::TAR;
        return true;
    }
    if (endsWith(".zip")) {
        format = ArchiveFormat::ZIP;
        return true;
    }
    return false;
}
