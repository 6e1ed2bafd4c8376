#include "RetentionManager.hpp"
#include "BackupCatalog.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/Formatters.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

RetentionManager::RetentionManager(BackupCatalog& backupCatalog, const std::string& archiveDir, ILogger* log)
    : catalog(backupCatalog), archiveDirectory(archiveDir), logger(log) {}

bool RetentionManager::deleteArchive(const std::string& fileName, uint64_t& freedBytes) {
    fs::path archivePath = fs::path(archiveDirectory) / fileName;
    std::error_code ec;
    if (!fs::exists(archivePath, ec)) {
        if (logger) {
            logger->warn("Archive " + fileName + " not found, removing it from the index");
        }
        return true;
    }

    uint64_t size = fs::file_size(archivePath, ec);
    if (ec) {
        size = 0;
    }
    if (!fs::remove(archivePath, ec) || ec) {
        if (logger) {
            logger->error("Error removing " + fileName + ": " + (ec ? ec.message() : std::string("not removed")));
        }
        return false;
    }
    freedBytes += size;
    if (logger) {
        logger->info("Removed " + fileName + " (" + formatBytes(static_cast<double>(size)) + ")");
    }
    return true;
}

bool RetentionManager::checkIndexSaved() {
    if (!catalog.hasUnsavedChanges()) {
        return true;
    }
    if (logger) {
        logger->error("Archives were deleted but the backup index could not be updated: " + catalog.getIndexPath());
    }
    return false;
}

RetentionStats RetentionManager::cleanupByAgeAndCount(int daysToKeep, size_t maxPerDirectory) {
    RetentionStats stats;
    size_t total = catalog.size();
    if (total == 0) {
        if (logger) {
            logger->info("No backups to clean up");
        }
        return stats;
    }

    // 超出system_clock表示范围的保留天数不按时间清理，只按数量限制
    auto now = std::chrono::system_clock::now();
    int64_t dayLimit = (std::chrono::duration_cast<std::chrono::hours>(std::chrono::system_clock::duration::max()) -
                        std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch())).count() / 24;
    bool ageLimited = daysToKeep <= dayLimit && daysToKeep >= -dayLimit;
    std::chrono::system_clock::time_point cutoff;
    if (ageLimited) {
        cutoff = now - std::chrono::hours(24) * static_cast<int64_t>(daysToKeep);
    } else if (logger) {
        logger->warn("Retention of " + std::to_string(daysToKeep) + " days is out of range, age limit ignored");
    }
    std::set<std::string> toRemove;

    for (auto& group : catalog.groupedByDirectory()) {
        auto& backups = group.second;
        std::stable_sort(backups.begin(), backups.end(), [](const BackupRecord& a, const BackupRecord& b) {
            return a.createdAt > b.createdAt;
        });
        if (logger) {
            logger->debug("Processing directory " + group.first + " (" + std::to_string(backups.size()) + " backups)");
        }

        for (size_t i = 0; i < backups.size(); ++i) {
            const BackupRecord& record = backups[i];
            bool remove = false;
            std::string reason;
            if (i >= maxPerDirectory) {
                remove = true;
                reason = "exceeds limit of " + std::to_string(maxPerDirectory) + " per directory";
            } else {
                // 无法解析的时间戳不视为过期
                std::chrono::system_clock::time_point created;
                if (ageLimited && parseIsoTimestamp(record.createdAt, created) && created < cutoff) {
                    remove = true;
                    reason = "older than " + std::to_string(daysToKeep) + " days";
                }
            }
            if (!remove) {
                continue;
            }
            if (!deleteArchive(record.fileName, stats.freedBytes)) {
                continue;
            }
            if (logger) {
                logger->info("Pruned " + record.fileName + ": " + reason);
            }
            toRemove.insert(record.fileName);
        }
    }

    catalog.removeMany(toRemove);
    stats.indexSaved = checkIndexSaved();
    stats.removedCount = toRemove.size();
    stats.keptCount = total - toRemove.size();
    if (logger) {
        logger->info("Cleanup finished: " + std::to_string(stats.removedCount) + " removed, " +
                     std::to_string(stats.keptCount) + " kept, " +
                     formatBytes(static_cast<double>(stats.freedBytes)) + " freed");
    }
    return stats;
}

RetentionStats RetentionManager::cleanupBySize(uint64_t maxTotalBytes) {
    RetentionStats stats;
    uint64_t currentSize = catalog.totalSize();
    if (currentSize <= maxTotalBytes) {
        if (logger) {
            logger->info("Total size " + formatBytes(static_cast<double>(currentSize)) + " is within the limit of " +
                         formatBytes(static_cast<double>(maxTotalBytes)));
        }
        stats.keptCount = catalog.size();
        return stats;
    }

    if (logger) {
        logger->info("Total size " + formatBytes(static_cast<double>(currentSize)) + " exceeds limit " +
                     formatBytes(static_cast<double>(maxTotalBytes)) + ", removing oldest backups");
    }

    std::set<std::string> toRemove;
    for (const auto& record : catalog.sortedByDate(false)) {
        // 以已释放的实际字节数估算剩余总量
        if (currentSize - std::min(currentSize, stats.freedBytes) <= maxTotalBytes) {
            break;
        }
        if (!deleteArchive(record.fileName, stats.freedBytes)) {
            continue;
        }
        toRemove.insert(record.fileName);
    }

    catalog.removeMany(toRemove);
    stats.indexSaved = checkIndexSaved();
    stats.removedCount = toRemove.size();
    stats.keptCount = catalog.size();
    if (logger) {
        logger->info("Freed " + formatBytes(static_cast<double>(stats.freedBytes)));
    }
    return stats;
}

size_t RetentionManager::removeOrphanFiles() {
    if (!FileSystem::isDirectory(archiveDirectory)) {
        if (logger) {
            logger->warn("Backup directory not found: " + archiveDirectory);
        }
        return 0;
    }

    std::set<std::string> indexed;
    for (const auto& record : catalog.all()) {
        indexed.insert(record.fileName);
    }

    size_t removed = 0;
    for (const auto& file : FileSystem::listFilesWithSuffixes(archiveDirectory, {".tar.gz", ".zip"})) {
        std::string name = file.filename().string();
        if (indexed.count(name) > 0) {
            continue;
        }
        std::error_code ec;
        if (fs::remove(file, ec) && !ec) {
            removed++;
            if (logger) {
                logger->info("Removed orphan archive " + name);
            }
        } else if (logger) {
            logger->error("Error removing orphan archive " + name + ": " + ec.message());
        }
    }
    if (logger) {
        logger->info(std::to_string(removed) + " orphan archives removed");
    }
    return removed;
}

uint64_t RetentionManager::gigabytesToBytes(double gigabytes) {
    if (gigabytes <= 0) {
        return 0;
    }
    return static_cast<uint64_t>(gigabytes * 1024.0 * 1024.0 * 1024.0);
}
