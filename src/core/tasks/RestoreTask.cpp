#include "RestoreTask.hpp"
#include "../Errors.hpp"
#include "../../utils/Compressor.hpp"
#include "../../utils/FileSystem.hpp"
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

RestoreTask::RestoreTask(const std::string& archive, const std::string& destinationPath, ILogger* log)
    : archivePath(archive), destination(destinationPath), status(TaskStatus::PENDING), logger(log),
      formatRecognized(true) {}

bool RestoreTask::execute() {
    if (logger) {
        logger->info("Starting restore: " + archivePath + " -> " + destination);
    }
    status = TaskStatus::RUNNING;

    ArchiveFormat format;
    if (!formatFromFileName(fs::path(archivePath).filename().string(), format)) {
        formatRecognized = false;
        errorMessage = "Unrecognized archive format: " + archivePath;
        if (logger) {
            logger->error(errorMessage);
        }
        status = TaskStatus::FAILED;
        return false;
    }

    // 归档中的条目以原目录名为顶层，因此解压到目标的父目录
    fs::path target(destination);
    if (!target.has_filename()) {
        target = target.parent_path();
    }
    fs::path parent = target.parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    if (!FileSystem::createDirectories(parent.string())) {
        errorMessage = "Failed to create restore directory: " + parent.string();
        if (logger) {
            logger->error(errorMessage);
        }
        status = TaskStatus::FAILED;
        return false;
    }

    try {
        std::unique_ptr<Compressor> compressor = createCompressor(format, logger);
        compressor->decompress(archivePath, parent.string());
    } catch (const BackupError& e) {
        errorMessage = std::string("Restore failed: ") + e.what();
        if (logger) {
            logger->error(errorMessage);
        }
        status = TaskStatus::FAILED;
        return false;
    } catch (const fs::filesystem_error& e) {
        errorMessage = std::string("Restore failed: ") + e.what();
        if (logger) {
            logger->error(errorMessage);
        }
        status = TaskStatus::FAILED;
        return false;
    }

    if (logger) {
        logger->info("Restore completed into " + parent.string());
    }
    status = TaskStatus::COMPLETED;
    return true;
}

TaskStatus RestoreTask::getStatus() const {
    return status;
}
