#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "core/BackupLifecycleManager.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/RestoreManager.hpp"
#include "storage/BackupCatalog.hpp"
#include "storage/RetentionManager.hpp"
#include "utils/ConsoleLogger.hpp"
#include "utils/FileSystem.hpp"
#include "utils/Formatters.hpp"

// 命令行解析得到的操作
enum class Action {
    CREATE,
    LIST,
    STATS,
    CLEANUP,
    CLEANUP_SIZE,
    REMOVE_ORPHANS,
    RESTORE,
    VERIFY,
    HELP
};

struct CommandLineOptions {
    Action action = Action::CREATE;
    std::string configPath = "config.json";
    std::string sourceDir;
    std::string backupName;
    std::string format;
    int level = -1;
    bool maxCompression = false;
    std::vector<std::string> exclusions;
    std::string target;      // --restore / --verify 的归档文件名
    std::string destination; // --to
};

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    virtual void initialize() = 0;

    // 运行界面，返回进程退出码
    virtual int run() = 0;

    virtual void showHelp() = 0;

    virtual void showMessage(const std::string& message) = 0;

    virtual void showError(const std::string& message) = 0;
};

// 控制器类 - 处理业务逻辑，与具体界面实现解耦合
class ApplicationController {
private:
    IUserInterface* ui;  // 使用原始指针避免循环依赖
    ConsoleLogger& logger;
    std::unique_ptr<AppConfig> config;
    std::unique_ptr<BackupCatalog> catalog;

public:
    ApplicationController(IUserInterface* ui, ConsoleLogger& logger)
        : ui(ui), logger(logger) {}

    void setUserInterface(IUserInterface* ui) {
        this->ui = ui;
    }

    int start() {
        if (!ui) {
            return 1;
        }
        ui->initialize();
        return ui->run();
    }

    // 加载配置与备份目录，失败时抛出ConfigError
    void loadConfig(const std::string& path) {
        config = std::make_unique<AppConfig>(path);
        logger.setLogLevel(parseLogLevel(config->logLevel()));
        catalog = std::make_unique<BackupCatalog>(config->indexFile(), &logger);
    }

    AppConfig& getConfig() {
        return *config;
    }

    bool executeBackup(const CommandLineOptions& options) {
        BackupOptions backup;
        backup.sourceDirectory = options.sourceDir.empty() ? config->defaultBackupSource()
                                                           : FileSystem::expandUser(options.sourceDir);
        backup.backupName = options.backupName;
        backup.format = options.format.empty() ? config->defaultFormat() : options.format;
        backup.compressionLevel = options.maxCompression ? 9
                                  : options.level >= 0 ? options.level
                                  : config->defaultCompressionLevel();
        backup.exclusions = options.exclusions;

        BackupLifecycleManager manager(*catalog, config->backupDestination(), &logger,
                                       config->allExclusionPatterns());
        BackupResult result = manager.createBackup(backup);
        if (!result.ok()) {
            ui->showError(result.message);
            return false;
        }

        const BackupRecord& record = result.record;
        std::ostringstream report;
        report << "Backup completed: " << result.archivePath << "\n"
               << "  Files:       " << formatNumber(record.totalFiles) << "\n"
               << "  Excluded:    " << formatNumber(record.excludedFiles) << " files, "
               << formatNumber(record.excludedDirs) << " directories\n"
               << "  Original:    " << formatBytes(static_cast<double>(record.originalSize)) << "\n"
               << "  Compressed:  " << formatBytes(static_cast<double>(record.backupSize)) << "\n"
               << "  Compression: " << std::fixed << std::setprecision(1) << record.compressionRatio << "%\n"
               << "  MD5:         " << record.hashMd5;
        ui->showMessage(report.str());
        return true;
    }

    bool executeList() {
        RestoreManager manager(*catalog, config->backupDestination(), &logger);
        auto grouped = manager.listAvailable();
        if (grouped.empty()) {
            ui->showMessage("No backups found.");
            return true;
        }
        std::ostringstream out;
        for (const auto& group : grouped) {
            out << group.first << " (" << group.second.size() << " backups)\n";
            for (size_t i = 0; i < group.second.size(); ++i) {
                const BackupRecord& record = group.second[i];
                out << (i == 0 ? "  * " : "    ") << record.fileName << "  "
                    << formatDate(record.createdAt) << "  "
                    << formatBytes(static_cast<double>(record.backupSize)) << "  "
                    << std::fixed << std::setprecision(1) << record.compressionRatio << "%\n";
            }
        }
        ui->showMessage(out.str());
        return true;
    }

    bool executeStats() {
        CatalogStatistics stats = catalog->statistics();
        std::ostringstream out;
        out << "Backups:     " << formatNumber(stats.totalBackups) << "\n"
            << "Total size:  " << formatBytes(static_cast<double>(stats.totalSize)) << "\n"
            << "Directories: " << formatNumber(stats.uniqueDirectories);
        if (stats.totalBackups > 0) {
            out << "\nOldest:      " << formatDate(stats.oldestBackup)
                << "\nNewest:      " << formatDate(stats.newestBackup);
        }
        ui->showMessage(out.str());
        return true;
    }

    bool executeCleanup() {
        RetentionManager retention(*catalog, config->backupDestination(), &logger);
        int maxPerDirectory = config->maxBackupsPerDirectory();
        RetentionStats stats = retention.cleanupByAgeAndCount(config->daysToKeep(),
                                                              maxPerDirectory > 0 ? static_cast<size_t>(maxPerDirectory) : 0);
        ui->showMessage("Removed " + std::to_string(stats.removedCount) + " backups, kept " +
                        std::to_string(stats.keptCount) + ", freed " +
                        formatBytes(static_cast<double>(stats.freedBytes)));
        if (!stats.indexSaved) {
            ui->showError("Backup index could not be updated: " + catalog->getIndexPath());
        }
        return stats.indexSaved;
    }

    bool executeCleanupBySize() {
        RetentionManager retention(*catalog, config->backupDestination(), &logger);
        RetentionStats stats = retention.cleanupBySize(RetentionManager::gigabytesToBytes(config->maxTotalSizeGb()));
        ui->showMessage("Removed " + std::to_string(stats.removedCount) + " backups, freed " +
                        formatBytes(static_cast<double>(stats.freedBytes)));
        if (!stats.indexSaved) {
            ui->showError("Backup index could not be updated: " + catalog->getIndexPath());
        }
        return stats.indexSaved;
    }

    bool executeRemoveOrphans() {
        RetentionManager retention(*catalog, config->backupDestination(), &logger);
        size_t removed = retention.removeOrphanFiles();
        ui->showMessage(std::to_string(removed) + " orphan archives removed");
        return true;
    }

    bool executeRestore(const std::string& fileName, const std::string& destination) {
        RestoreManager manager(*catalog, config->backupDestination(), &logger);
        RestoreResult result = manager.restoreByName(fileName, FileSystem::expandUser(destination));
        if (!result.success) {
            ui->showError(result.message);
            return false;
        }
        ui->showMessage(result.message);
        return true;
    }

    bool executeVerify(const std::string& fileName) {
        RestoreManager manager(*catalog, config->backupDestination(), &logger);
        if (!manager.verifyIntegrity(fileName)) {
            ui->showError("Integrity check failed: " + fileName);
            return false;
        }
        ui->showMessage("Integrity OK: " + fileName);
        return true;
    }

    ConsoleLogger& getLogger() {
        return logger;
    }
};

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    ApplicationController& controller;
    int argc;
    char** argv;
    CommandLineOptions options;

    static std::vector<std::string> splitPatterns(const std::string& value) {
        std::vector<std::string> patterns;
        std::stringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ',')) {
            size_t begin = item.find_first_not_of(" \t");
            size_t end = item.find_last_not_of(" \t");
            if (begin != std::string::npos) {
                patterns.push_back(item.substr(begin, end - begin + 1));
            }
        }
        return patterns;
    }

    // 解析命令行参数，出错时输出错误并返回false
    bool parseArguments() {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto needValue = [&](std::string& out) {
                if (i + 1 >= argc) {
                    showError("Missing value for " + arg);
                    return false;
                }
                out = argv[++i];
                return true;
            };

            if (arg == "-h" || arg == "--help") {
                options.action = Action::HELP;
            } else if (arg == "--config") {
                if (!needValue(options.configPath)) return false;
            } else if (arg == "-d" || arg == "--directory") {
                if (!needValue(options.sourceDir)) return false;
            } else if (arg == "--name") {
                if (!needValue(options.backupName)) return false;
            } else if (arg == "--format") {
                if (!needValue(options.format)) return false;
            } else if (arg == "--max-compression") {
                options.maxCompression = true;
            } else if (arg == "--level") {
                std::string value;
                if (!needValue(value)) return false;
                try {
                    size_t consumed = 0;
                    options.level = std::stoi(value, &consumed);
                    if (consumed != value.size()) {
                        throw std::invalid_argument(value);
                    }
                } catch (const std::exception&) {
                    showError("Invalid compression level: " + value);
                    return false;
                }
                if (options.level < 0 || options.level > 9) {
                    showError("Compression level must be between 0 and 9");
                    return false;
                }
            } else if (arg == "--exclude") {
                std::string value;
                if (!needValue(value)) return false;
                for (const auto& pattern : splitPatterns(value)) {
                    options.exclusions.push_back(pattern);
                }
            } else if (arg == "--list") {
                options.action = Action::LIST;
            } else if (arg == "--stats") {
                options.action = Action::STATS;
            } else if (arg == "--cleanup") {
                options.action = Action::CLEANUP;
            } else if (arg == "--cleanup-size") {
                options.action = Action::CLEANUP_SIZE;
            } else if (arg == "--remove-orphans") {
                options.action = Action::REMOVE_ORPHANS;
            } else if (arg == "--restore") {
                options.action = Action::RESTORE;
                if (!needValue(options.target)) return false;
            } else if (arg == "--to") {
                if (!needValue(options.destination)) return false;
            } else if (arg == "--verify") {
                options.action = Action::VERIFY;
                if (!needValue(options.target)) return false;
            } else {
                showError("Unknown option: " + arg);
                return false;
            }
        }

        if (options.action == Action::RESTORE && options.destination.empty()) {
            showError("--restore requires --to <destination>");
            return false;
        }
        return true;
    }

public:
    CommandLineInterface(ApplicationController& controller, int argc, char** argv)
        : controller(controller), argc(argc), argv(argv) {}

    void initialize() override {
        // 命令行界面初始化
    }

    int run() override {
        if (!parseArguments()) {
            return 1;
        }
        if (options.action == Action::HELP) {
            showHelp();
            return 0;
        }

        try {
            controller.loadConfig(options.configPath);
        } catch (const ConfigError& e) {
            showError(e.what());
            return 1;
        }

        bool success = false;
        switch (options.action) {
            case Action::CREATE: success = controller.executeBackup(options); break;
            case Action::LIST: success = controller.executeList(); break;
            case Action::STATS: success = controller.executeStats(); break;
            case Action::CLEANUP: success = controller.executeCleanup(); break;
            case Action::CLEANUP_SIZE: success = controller.executeCleanupBySize(); break;
            case Action::REMOVE_ORPHANS: success = controller.executeRemoveOrphans(); break;
            case Action::RESTORE: success = controller.executeRestore(options.target, options.destination); break;
            case Action::VERIFY: success = controller.executeVerify(options.target); break;
            case Action::HELP: success = true; break;
        }
        return success ? 0 : 1;
    }

    void showHelp() override {
        std::cout << "=== backupkeeper ===\n";
        std::cout << "Usage: backupkeeper [--config PATH] [action] [options]\n\n";
        std::cout << "Actions:\n";
        std::cout << "  (default)              Create a backup\n";
        std::cout << "  --list                 List backups grouped by directory\n";
        std::cout << "  --stats                Show index statistics\n";
        std::cout << "  --cleanup              Remove backups by age and per-directory count\n";
        std::cout << "  --cleanup-size         Remove oldest backups until under the size limit\n";
        std::cout << "  --remove-orphans       Delete archives that are not in the index\n";
        std::cout << "  --restore NAME --to DEST  Restore a backup\n";
        std::cout << "  --verify NAME          Verify the MD5 of a backup\n";
        std::cout << "  -h, --help             Show this help information\n\n";
        std::cout << "Backup options:\n";
        std::cout << "  -d, --directory DIR    Directory to back up (default from config)\n";
        std::cout << "  --name NAME            Custom archive name prefix\n";
        std::cout << "  --format tar|zip       Archive format\n";
        std::cout << "  --level N              Compression level 0-9\n";
        std::cout << "  --max-compression      Use compression level 9\n";
        std::cout << "  --exclude \"a,b\"        Additional exclusion patterns\n\n";
        std::cout << "Examples:\n";
        std::cout << "  backupkeeper -d ~/projects --name projects --format zip\n";
        std::cout << "  backupkeeper --exclude \"*.iso,Downloads,tmp\"\n";
        std::cout << "  backupkeeper --restore backup_docs_20240101_120000.tar.gz --to ~/restore/docs\n";
    }

    void showMessage(const std::string& message) override {
        std::cout << message << std::endl;
    }

    void showError(const std::string& message) override {
        std::cerr << "Error: " << message << std::endl;
    }
};

int main(int argc, char* argv[]) {
    ConsoleLogger logger;

    // 1. First create controller with null interface pointer
    ApplicationController controller(nullptr, logger);

    // 2. Create command line interface and pass controller reference
    CommandLineInterface cli(controller, argc, argv);

    // 3. Set interface to controller
    controller.setUserInterface(&cli);

    return controller.start();
}
