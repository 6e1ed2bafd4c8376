#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include "MockLogger.hpp"
#include "storage/BackupCatalog.hpp"

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::HasSubstr;

namespace {

BackupRecord makeRecord(const std::string& fileName, const std::string& directory,
                        const std::string& createdAt, uint64_t size) {
    BackupRecord record;
    record.fileName = fileName;
    record.sourceDirectory = "/home/user/" + directory;
    record.directoryName = directory;
    record.createdAt = createdAt;
    record.originalSize = size * 2;
    record.backupSize = size;
    record.compressionRatio = 50.0;
    record.totalFiles = 3;
    record.directoryType = "generico";
    record.hashMd5 = "hash-" + fileName;
    record.format = "tar";
    return record;
}

} // namespace

class BackupCatalogTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "backup_catalog_test";
    fs::path indexPath = testDir / "index" / "indice_backups.json";
    QuietLogger logger;

    void SetUp() override {
        fs::remove_all(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    void writeIndex(const std::string& content) {
        fs::create_directories(indexPath.parent_path());
        std::ofstream out(indexPath);
        out << content;
    }
};

TEST_F(BackupCatalogTest, MissingIndexStartsEmpty) {
    BackupCatalog catalog(indexPath.string(), &logger);
    EXPECT_EQ(0u, catalog.size());
    EXPECT_EQ(0u, catalog.totalSize());
    EXPECT_FALSE(fs::exists(indexPath));
}

TEST_F(BackupCatalogTest, RecordsPersistAcrossInstances) {
    BackupRecord first = makeRecord("app_20240101_100000.tar.gz", "app", "2024-01-01T10:00:00", 100);
    BackupRecord second = makeRecord("web_20240102_100000.zip", "web", "2024-01-02T10:00:00.250000", 250);
    second.maxCompression = true;
    second.format = "zip";
    {
        BackupCatalog catalog(indexPath.string(), &logger);
        ASSERT_TRUE(catalog.add(first));
        ASSERT_TRUE(catalog.add(second));
    }
    ASSERT_TRUE(fs::exists(indexPath));
    EXPECT_FALSE(fs::exists(indexPath.string() + ".tmp"));

    BackupCatalog reloaded(indexPath.string(), &logger);
    ASSERT_EQ(2u, reloaded.size());
    EXPECT_EQ(first, reloaded.all()[0]);
    EXPECT_EQ(second, reloaded.all()[1]);
    EXPECT_EQ(350u, reloaded.totalSize());
}

TEST_F(BackupCatalogTest, IndexUsesExpectedJsonKeys) {
    {
        BackupCatalog catalog(indexPath.string(), &logger);
        catalog.add(makeRecord("app_20240101_100000.tar.gz", "app", "2024-01-01T10:00:00", 100));
    }
    std::ifstream in(indexPath);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    for (const char* key : {"arquivo", "diretorio_origem", "nome_diretorio", "data_criacao", "tamanho_original",
                            "tamanho_backup", "taxa_compressao", "total_arquivos", "arquivos_excluidos",
                            "diretorios_excluidos", "tipo_diretorio", "hash_md5", "compressao_maxima", "formato"}) {
        EXPECT_NE(std::string::npos, content.find(std::string("\"") + key + "\"")) << key;
    }
}

TEST_F(BackupCatalogTest, CorruptIndexResetsWithWarning) {
    writeIndex("{ this is not json");
    MockLogger strictLogger;
    EXPECT_CALL(strictLogger, warn(HasSubstr("not valid JSON"))).Times(1);
    EXPECT_CALL(strictLogger, debug(_)).Times(::testing::AnyNumber());

    BackupCatalog catalog(indexPath.string(), &strictLogger);
    EXPECT_EQ(0u, catalog.size());
}

TEST_F(BackupCatalogTest, NonArrayIndexResetsWithWarning) {
    writeIndex("{\"arquivo\": \"x.zip\"}");
    MockLogger strictLogger;
    EXPECT_CALL(strictLogger, warn(HasSubstr("not a JSON array"))).Times(1);

    BackupCatalog catalog(indexPath.string(), &strictLogger);
    EXPECT_EQ(0u, catalog.size());
}

TEST_F(BackupCatalogTest, MissingFieldsTakeDefaults) {
    writeIndex("[{\"arquivo\": \"old.tar.gz\", \"tamanho_backup\": 42.0}]");
    BackupCatalog catalog(indexPath.string(), &logger);
    ASSERT_EQ(1u, catalog.size());
    BackupRecord record = catalog.all()[0];
    EXPECT_EQ("old.tar.gz", record.fileName);
    EXPECT_EQ(42u, record.backupSize);
    EXPECT_EQ("", record.directoryName);
    EXPECT_EQ(0u, record.totalFiles);
    EXPECT_FALSE(record.maxCompression);
}

TEST_F(BackupCatalogTest, GroupingUsesUnknownForMissingName) {
    BackupCatalog catalog(indexPath.string(), &logger);
    catalog.add(makeRecord("a1.tar.gz", "alpha", "2024-01-01T00:00:00", 1));
    catalog.add(makeRecord("b1.tar.gz", "beta", "2024-01-02T00:00:00", 1));
    catalog.add(makeRecord("a2.tar.gz", "alpha", "2024-01-03T00:00:00", 1));
    catalog.add(makeRecord("x1.tar.gz", "", "2024-01-04T00:00:00", 1));

    auto grouped = catalog.groupedByDirectory();
    ASSERT_EQ(3u, grouped.size());
    ASSERT_EQ(2u, grouped["alpha"].size());
    EXPECT_EQ("a1.tar.gz", grouped["alpha"][0].fileName);
    EXPECT_EQ("a2.tar.gz", grouped["alpha"][1].fileName);
    EXPECT_EQ(1u, grouped[BackupCatalog::UNKNOWN_DIRECTORY].size());

    EXPECT_EQ(2u, catalog.byDirectory("alpha").size());
    EXPECT_TRUE(catalog.byDirectory("gamma").empty());
}

TEST_F(BackupCatalogTest, SortedByDateIsStable) {
    BackupCatalog catalog(indexPath.string(), &logger);
    catalog.add(makeRecord("mid.tar.gz", "d", "2024-02-01T00:00:00", 1));
    catalog.add(makeRecord("tie1.tar.gz", "d", "2024-03-01T00:00:00", 1));
    catalog.add(makeRecord("old.tar.gz", "d", "2024-01-01T00:00:00", 1));
    catalog.add(makeRecord("tie2.tar.gz", "d", "2024-03-01T00:00:00", 1));

    auto newest = catalog.sortedByDate();
    ASSERT_EQ(4u, newest.size());
    EXPECT_EQ("tie1.tar.gz", newest[0].fileName);
    EXPECT_EQ("tie2.tar.gz", newest[1].fileName);
    EXPECT_EQ("mid.tar.gz", newest[2].fileName);
    EXPECT_EQ("old.tar.gz", newest[3].fileName);

    auto oldest = catalog.sortedByDate(false);
    EXPECT_EQ("old.tar.gz", oldest[0].fileName);
    EXPECT_EQ("tie1.tar.gz", oldest[2].fileName);
    EXPECT_EQ("tie2.tar.gz", oldest[3].fileName);
}

TEST_F(BackupCatalogTest, StatisticsSummarizeCatalog) {
    BackupCatalog catalog(indexPath.string(), &logger);
    CatalogStatistics empty = catalog.statistics();
    EXPECT_EQ(0u, empty.totalBackups);
    EXPECT_EQ("", empty.oldestBackup);

    catalog.add(makeRecord("a.tar.gz", "alpha", "2024-05-01T00:00:00", 100));
    catalog.add(makeRecord("b.tar.gz", "beta", "2024-01-01T00:00:00", 200));
    catalog.add(makeRecord("c.tar.gz", "alpha", "2024-09-01T00:00:00", 300));

    CatalogStatistics stats = catalog.statistics();
    EXPECT_EQ(3u, stats.totalBackups);
    EXPECT_EQ(600u, stats.totalSize);
    EXPECT_EQ(2u, stats.uniqueDirectories);
    EXPECT_EQ("2024-01-01T00:00:00", stats.oldestBackup);
    EXPECT_EQ("2024-09-01T00:00:00", stats.newestBackup);
}

TEST_F(BackupCatalogTest, LookupsByHashAndFileName) {
    BackupCatalog catalog(indexPath.string(), &logger);
    catalog.add(makeRecord("a.tar.gz", "alpha", "2024-05-01T00:00:00", 100));

    BackupRecord found;
    EXPECT_TRUE(catalog.findByHash("hash-a.tar.gz", found));
    EXPECT_EQ("a.tar.gz", found.fileName);
    EXPECT_FALSE(catalog.findByHash("nope", found));
    EXPECT_TRUE(catalog.findByFileName("a.tar.gz", found));
    EXPECT_FALSE(catalog.findByFileName("b.tar.gz", found));
}

TEST_F(BackupCatalogTest, RemovalIsPersisted) {
    {
        BackupCatalog catalog(indexPath.string(), &logger);
        catalog.add(makeRecord("a.tar.gz", "alpha", "2024-01-01T00:00:00", 1));
        catalog.add(makeRecord("b.tar.gz", "alpha", "2024-01-02T00:00:00", 1));
        catalog.add(makeRecord("c.tar.gz", "alpha", "2024-01-03T00:00:00", 1));
        catalog.add(makeRecord("d.tar.gz", "alpha", "2024-01-04T00:00:00", 1));

        EXPECT_TRUE(catalog.remove("a.tar.gz"));
        EXPECT_FALSE(catalog.remove("a.tar.gz"));
        EXPECT_EQ(2u, catalog.removeMany({"b.tar.gz", "c.tar.gz", "zzz.tar.gz"}));
        EXPECT_EQ(0u, catalog.removeMany({}));
    }
    BackupCatalog reloaded(indexPath.string(), &logger);
    ASSERT_EQ(1u, reloaded.size());
    EXPECT_EQ("d.tar.gz", reloaded.all()[0].fileName);

    EXPECT_TRUE(reloaded.clear());
    BackupCatalog cleared(indexPath.string(), &logger);
    EXPECT_EQ(0u, cleared.size());
}

TEST_F(BackupCatalogTest, FailedRemovalSaveIsFlagged) {
    BackupCatalog catalog(indexPath.string(), &logger);
    ASSERT_TRUE(catalog.add(makeRecord("a.tar.gz", "alpha", "2024-01-01T00:00:00", 1)));
    ASSERT_TRUE(catalog.add(makeRecord("b.tar.gz", "alpha", "2024-01-02T00:00:00", 1)));
    EXPECT_FALSE(catalog.hasUnsavedChanges());

    // 索引路径被目录占用
    fs::remove(indexPath);
    fs::create_directories(indexPath / "occupied");
    EXPECT_TRUE(catalog.remove("a.tar.gz"));
    EXPECT_TRUE(catalog.hasUnsavedChanges());
    EXPECT_EQ(1u, catalog.size());

    fs::remove_all(indexPath);
    EXPECT_EQ(1u, catalog.removeMany({"b.tar.gz"}));
    EXPECT_FALSE(catalog.hasUnsavedChanges());
    BackupCatalog reloaded(indexPath.string(), &logger);
    EXPECT_EQ(0u, reloaded.size());
}
