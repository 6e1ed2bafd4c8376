#include "BackupTask.hpp"
#include "../Errors.hpp"
#include "../ExclusionFilter.hpp"
#include "../ProgressTracker.hpp"
#include "../../storage/BackupCatalog.hpp"
#include "../../utils/Compressor.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/Formatters.hpp"
#include "../../utils/IntegrityChecker.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

std::string toString(BackupStatus status) {
    switch (status) {
        case BackupStatus::SUCCESS: return "success";
        case BackupStatus::SOURCE_NOT_FOUND: return "source not found";
        case BackupStatus::NOT_A_DIRECTORY: return "not a directory";
        case BackupStatus::UNSUPPORTED_FORMAT: return "unsupported format";
        case BackupStatus::INVALID_ARGUMENT: return "invalid argument";
        case BackupStatus::ARCHIVE_WRITE_FAILURE: return "archive write failure";
        case BackupStatus::CATALOG_WRITE_FAILURE: return "catalog write failure";
        default: return "unknown";
    }
}

BackupTask::BackupTask(const BackupOptions& backupOptions, BackupCatalog& backupCatalog, const std::string& archiveDir,
                       const std::vector<std::string>& patterns, ILogger* log)
    : options(backupOptions), catalog(backupCatalog), archiveDirectory(archiveDir), defaultPatterns(patterns),
      status(TaskStatus::PENDING), logger(log) {}

BackupResult BackupTask::fail(BackupStatus code, const std::string& message) {
    if (logger) {
        logger->error(message);
    }
    status = TaskStatus::FAILED;
    BackupResult result;
    result.status = code;
    result.message = message;
    return result;
}

BackupResult BackupTask::execute() {
    status = TaskStatus::RUNNING;
    if (logger) {
        logger->info("Starting backup: " + options.sourceDirectory + " -> " + archiveDirectory);
    }

    if (!FileSystem::exists(options.sourceDirectory)) {
        return fail(BackupStatus::SOURCE_NOT_FOUND, SourceNotFoundError(options.sourceDirectory).what());
    }
    if (!FileSystem::isDirectory(options.sourceDirectory)) {
        return fail(BackupStatus::NOT_A_DIRECTORY, NotADirectoryError(options.sourceDirectory).what());
    }
    if (options.compressionLevel < 0 || options.compressionLevel > 9) {
        return fail(BackupStatus::INVALID_ARGUMENT,
                    "Compression level must be between 0 and 9, got " + std::to_string(options.compressionLevel));
    }

    std::unique_ptr<Compressor> compressor;
    try {
        compressor = createCompressor(options.format, logger);
    } catch (const UnsupportedFormatError& e) {
        return fail(BackupStatus::UNSUPPORTED_FORMAT, e.what());
    }

    std::error_code ec;
    fs::path source = fs::canonical(options.sourceDirectory, ec);
    if (ec) {
        source = fs::absolute(options.sourceDirectory).lexically_normal();
    }
    std::string sourceDir = source.string();
    std::string directoryName = FileSystem::baseName(sourceDir);
    DirectoryType directoryType = FileSystem::detectDirectoryType(sourceDir);

    ExclusionFilter filter(defaultPatterns);
    filter.addPatterns(options.exclusions);
    if (logger) {
        logger->debug(filter.getFilterDescription());
    }

    // 第一次遍历只用于估算大小和进度
    DirectorySize estimate = FileSystem::calculateDirectorySize(sourceDir, &filter);
    if (logger) {
        logger->info("Source: " + sourceDir + " (" + toString(directoryType) + ", " +
                     formatNumber(estimate.fileCount) + " files, " +
                     formatBytes(static_cast<double>(estimate.totalBytes)) + ")");
    }

    if (!FileSystem::createDirectories(archiveDirectory)) {
        return fail(BackupStatus::ARCHIVE_WRITE_FAILURE, "Failed to create backup directory: " + archiveDirectory);
    }

    std::string prefix = options.backupName.empty() ? "backup_" + directoryName : options.backupName;
    std::string fileName = prefix + "_" + archiveTimestamp(std::chrono::system_clock::now()) + compressor->extension();
    std::string archivePath = (fs::path(archiveDirectory) / fileName).string();

    auto removePartial = [&]() {
        std::error_code removeError;
        if (fs::remove(archivePath, removeError)) {
            if (logger) {
                logger->warn("Removed partial archive " + archivePath);
            }
        }
    };

    CompressionStats stats;
    ProgressTracker tracker(estimate.fileCount, logger);
    try {
        stats = compressor->compress(sourceDir, archivePath, filter,
                                     [&tracker](uint64_t processed) { tracker.update(processed); },
                                     options.compressionLevel);
    } catch (const BackupError& e) {
        removePartial();
        return fail(BackupStatus::ARCHIVE_WRITE_FAILURE, std::string("Backup failed: ") + e.what());
    } catch (const std::exception& e) {
        removePartial();
        return fail(BackupStatus::ARCHIVE_WRITE_FAILURE, std::string("Backup failed: ") + e.what());
    }
    tracker.finish();

    std::string hash = IntegrityChecker::calculateMD5(archivePath);
    if (hash.empty()) {
        removePartial();
        return fail(BackupStatus::ARCHIVE_WRITE_FAILURE, "Cannot compute hash of " + archivePath);
    }

    BackupRecord record;
    record.fileName = fileName;
    record.sourceDirectory = sourceDir;
    record.directoryName = directoryName;
    record.createdAt = currentIsoTimestamp();
    record.originalSize = estimate.totalBytes;
    record.backupSize = FileSystem::getFileSize(archivePath);
    record.compressionRatio = compressionRatio(record.originalSize, record.backupSize);
    record.totalFiles = stats.filesAdded;
    record.excludedFiles = stats.filesExcluded;
    record.excludedDirs = stats.dirsExcluded;
    record.directoryType = toString(directoryType);
    record.hashMd5 = hash;
    record.maxCompression = options.compressionLevel >= 9;
    record.format = toString(compressor->format());

    BackupResult result;
    result.record = record;
    result.archivePath = archivePath;

    if (!catalog.add(record)) {
        result.status = BackupStatus::CATALOG_WRITE_FAILURE;
        result.message = "Archive created but the backup index could not be written: " + catalog.getIndexPath();
        if (logger) {
            logger->error(result.message);
        }
        status = TaskStatus::FAILED;
        return result;
    }

    if (logger) {
        logger->info("Backup created: " + fileName + " (" + formatNumber(stats.filesAdded) + " files, " +
                     formatBytes(static_cast<double>(record.backupSize)) + ", " +
                     std::to_string(static_cast<int>(record.compressionRatio)) + "% compression)");
    }
    if (stats.filesExcluded > 0 || stats.dirsExcluded > 0) {
        if (logger) {
            logger->info("Excluded " + formatNumber(stats.filesExcluded) + " files and " +
                         formatNumber(stats.dirsExcluded) + " directories");
        }
    }
    status = TaskStatus::COMPLETED;
    result.message = "Backup created: " + fileName;
    return result;
}

TaskStatus BackupTask::getStatus() const {
    return status;
}
