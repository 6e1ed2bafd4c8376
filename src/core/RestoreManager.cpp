#include "RestoreManager.hpp"
#include "tasks/RestoreTask.hpp"
#include "../storage/BackupCatalog.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/IntegrityChecker.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

std::string toString(RestoreError error) {
    switch (error) {
        case RestoreError::NONE: return "none";
        case RestoreError::NOT_IN_CATALOG: return "not found in catalog";
        case RestoreError::ARCHIVE_MISSING: return "archive file missing";
        case RestoreError::UNRECOGNIZED_FORMAT: return "unrecognized archive format";
        case RestoreError::EXTRACTION_FAILED: return "extraction failed";
        default: return "unknown";
    }
}

RestoreManager::RestoreManager(BackupCatalog& backupCatalog, const std::string& archiveDir, ILogger* log)
    : catalog(backupCatalog), archiveDirectory(archiveDir), logger(log) {}

std::map<std::string, std::vector<BackupRecord>> RestoreManager::listAvailable() const {
    auto grouped = catalog.groupedByDirectory();
    for (auto& group : grouped) {
        std::stable_sort(group.second.begin(), group.second.end(),
                         [](const BackupRecord& a, const BackupRecord& b) { return a.createdAt > b.createdAt; });
    }
    return grouped;
}

std::vector<BackupRecord> RestoreManager::selectionList() const {
    return catalog.sortedByDate(true);
}

RestoreResult RestoreManager::restoreByName(const std::string& fileName, const std::string& destination) {
    RestoreResult result;
    BackupRecord record;
    if (!catalog.findByFileName(fileName, record)) {
        result.error = RestoreError::NOT_IN_CATALOG;
        result.message = "Backup not found in index: " + fileName;
        if (logger) {
            logger->error(result.message);
        }
        return result;
    }

    std::string archivePath = (fs::path(archiveDirectory) / fileName).string();
    if (!FileSystem::exists(archivePath)) {
        result.error = RestoreError::ARCHIVE_MISSING;
        result.message = "Backup file not found: " + archivePath;
        if (logger) {
            logger->error(result.message);
        }
        return result;
    }

    // 以文件名后缀而非记录中的formato字段决定格式
    RestoreTask task(archivePath, destination, logger);
    if (!task.execute()) {
        result.error = task.isFormatRecognized() ? RestoreError::EXTRACTION_FAILED : RestoreError::UNRECOGNIZED_FORMAT;
        result.message = task.getErrorMessage();
        return result;
    }

    if (logger) {
        logger->info("Restored " + fileName + " from " + record.directoryName + " (" + record.createdAt + ")");
    }
    result.success = true;
    result.message = "Restored " + fileName;
    return result;
}

bool RestoreManager::restoreBackup(const std::string& archivePath, const std::string& destination) {
    RestoreTask task(archivePath, destination, logger);
    return task.execute();
}

bool RestoreManager::verifyIntegrity(const std::string& fileName) {
    BackupRecord record;
    if (!catalog.findByFileName(fileName, record)) {
        if (logger) {
            logger->error("Backup not found in index: " + fileName);
        }
        return false;
    }
    if (record.hashMd5.empty()) {
        if (logger) {
            logger->warn("No hash recorded for " + fileName + ", cannot verify");
        }
        return false;
    }

    std::string archivePath = (fs::path(archiveDirectory) / fileName).string();
    if (!FileSystem::exists(archivePath)) {
        if (logger) {
            logger->error("Backup file not found: " + archivePath);
        }
        return false;
    }

    if (IntegrityChecker::verifyFile(archivePath, record.hashMd5, "md5")) {
        if (logger) {
            logger->info("Integrity OK: " + fileName);
        }
        return true;
    }
    if (logger) {
        logger->error("Integrity check failed: " + fileName + " (hash mismatch)");
    }
    return false;
}
