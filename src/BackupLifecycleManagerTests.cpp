#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "MockLogger.hpp"
#include "core/BackupLifecycleManager.hpp"
#include "storage/BackupCatalog.hpp"
#include "utils/IntegrityChecker.hpp"

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::HasSubstr;

class BackupLifecycleManagerTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "backup_lifecycle_test";
    fs::path sourceDir = testDir / "project";
    fs::path archiveDir = testDir / "archives";
    QuietLogger logger;

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(sourceDir / "sub");
        writeFile(sourceDir / "one.txt", 100);
        writeFile(sourceDir / "two.txt", 200);
        writeFile(sourceDir / "sub" / "three.txt", 300);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    static void writeFile(const fs::path& path, size_t size) {
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'q');
    }

    std::string indexPath() const {
        return (archiveDir / "indice_backups.json").string();
    }
};

TEST_F(BackupLifecycleManagerTest, CreatesArchiveAndRecord) {
    BackupCatalog catalog(indexPath(), &logger);
    BackupLifecycleManager manager(catalog, archiveDir.string(), &logger);

    BackupOptions options;
    options.sourceDirectory = sourceDir.string();
    BackupResult result = manager.createBackup(options);

    ASSERT_TRUE(result.ok()) << result.message;
    const BackupRecord& record = result.record;
    EXPECT_EQ(3u, record.totalFiles);
    EXPECT_EQ(600u, record.originalSize);
    EXPECT_EQ("project", record.directoryName);
    EXPECT_EQ("generico", record.directoryType);
    EXPECT_EQ("tar", record.format);
    EXPECT_FALSE(record.maxCompression);
    EXPECT_EQ(32u, record.hashMd5.size());
    EXPECT_EQ(std::string::npos, record.hashMd5.find_first_not_of("0123456789abcdef"));

    EXPECT_EQ(0u, record.fileName.find("backup_project_"));
    EXPECT_EQ(".tar.gz", record.fileName.substr(record.fileName.size() - 7));
    ASSERT_TRUE(fs::exists(result.archivePath));
    EXPECT_EQ(fs::file_size(result.archivePath), record.backupSize);
    EXPECT_EQ(record.hashMd5, IntegrityChecker::calculateMD5(result.archivePath));

    ASSERT_EQ(1u, catalog.size());
    EXPECT_EQ(record, catalog.all()[0]);
    ASSERT_EQ(1u, manager.listBackups().size());
}

TEST_F(BackupLifecycleManagerTest, CustomNameZipAndExclusions) {
    writeFile(sourceDir / "skip.log", 50);
    fs::create_directories(sourceDir / ".git");
    writeFile(sourceDir / ".git" / "HEAD", 10);

    BackupCatalog catalog(indexPath(), &logger);
    BackupLifecycleManager manager(catalog, archiveDir.string(), &logger, {".git"});

    BackupOptions options;
    options.sourceDirectory = sourceDir.string() + "/";
    options.backupName = "nightly";
    options.format = "ZIP";
    options.compressionLevel = 9;
    options.exclusions = {"*.log"};
    BackupResult result = manager.createBackup(options);

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(0u, result.record.fileName.find("nightly_"));
    EXPECT_EQ(".zip", result.record.fileName.substr(result.record.fileName.size() - 4));
    EXPECT_EQ("zip", result.record.format);
    EXPECT_TRUE(result.record.maxCompression);
    EXPECT_EQ("git", result.record.directoryType);
    EXPECT_EQ(3u, result.record.totalFiles);
    EXPECT_EQ(1u, result.record.excludedFiles);
    EXPECT_EQ(1u, result.record.excludedDirs);
    EXPECT_EQ(600u, result.record.originalSize);
}

TEST_F(BackupLifecycleManagerTest, MissingSourceFails) {
    BackupCatalog catalog(indexPath(), &logger);
    BackupLifecycleManager manager(catalog, archiveDir.string(), &logger);

    BackupOptions options;
    options.sourceDirectory = (testDir / "nowhere").string();
    BackupResult result = manager.createBackup(options);
    EXPECT_EQ(BackupStatus::SOURCE_NOT_FOUND, result.status);
    EXPECT_EQ(0u, catalog.size());
    EXPECT_FALSE(fs::exists(archiveDir));
}

TEST_F(BackupLifecycleManagerTest, FileAsSourceFails) {
    BackupCatalog catalog(indexPath(), &logger);
    BackupLifecycleManager manager(catalog, archiveDir.string(), &logger);

    BackupOptions options;
    options.sourceDirectory = (sourceDir / "one.txt").string();
    EXPECT_EQ(BackupStatus::NOT_A_DIRECTORY, manager.createBackup(options).status);
}

TEST_F(BackupLifecycleManagerTest, UnsupportedFormatAndBadLevelFail) {
    BackupCatalog catalog(indexPath(), &logger);
    BackupLifecycleManager manager(catalog, archiveDir.string(), &logger);

    BackupOptions options;
    options.sourceDirectory = sourceDir.string();
    options.format = "7z";
    EXPECT_EQ(BackupStatus::UNSUPPORTED_FORMAT, manager.createBackup(options).status);

    options.format = "tar";
    options.compressionLevel = 11;
    EXPECT_EQ(BackupStatus::INVALID_ARGUMENT, manager.createBackup(options).status);
    EXPECT_EQ(0u, catalog.size());
}

TEST_F(BackupLifecycleManagerTest, FailuresAreLoggedAsErrors) {
    MockLogger strictLogger;
    EXPECT_CALL(strictLogger, info(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(strictLogger, error(HasSubstr("Source directory not found"))).Times(1);

    BackupCatalog catalog(indexPath(), &strictLogger);
    BackupLifecycleManager manager(catalog, archiveDir.string(), &strictLogger);
    BackupOptions options;
    options.sourceDirectory = (testDir / "nowhere").string();
    manager.createBackup(options);
}

TEST_F(BackupLifecycleManagerTest, UnwritableIndexKeepsArchive) {
    // 索引路径被目录占用，无法重命名覆盖
    fs::create_directories(fs::path(indexPath()) / "occupied");
    BackupCatalog catalog(indexPath(), &logger);
    BackupLifecycleManager manager(catalog, archiveDir.string(), &logger);

    BackupOptions options;
    options.sourceDirectory = sourceDir.string();
    BackupResult result = manager.createBackup(options);
    EXPECT_EQ(BackupStatus::CATALOG_WRITE_FAILURE, result.status);
    EXPECT_TRUE(fs::exists(result.archivePath));
    EXPECT_EQ(0u, catalog.size());
}
