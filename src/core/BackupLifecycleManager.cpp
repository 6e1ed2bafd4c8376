#include "BackupLifecycleManager.hpp"
#include "../storage/BackupCatalog.hpp"

BackupLifecycleManager::BackupLifecycleManager(BackupCatalog& backupCatalog, const std::string& archiveDir,
                                               ILogger* log, const std::vector<std::string>& patterns)
    : catalog(backupCatalog), archiveDirectory(archiveDir), defaultPatterns(patterns), logger(log) {}

BackupResult BackupLifecycleManager::createBackup(const BackupOptions& options) {
    BackupTask task(options, catalog, archiveDirectory, defaultPatterns, logger);
    return task.execute();
}

std::vector<BackupRecord> BackupLifecycleManager::listBackups() const {
    return catalog.all();
}
