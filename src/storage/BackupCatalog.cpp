#include "BackupCatalog.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

namespace fs = std::filesystem;

BackupCatalog::BackupCatalog(const std::string& path, ILogger* log)
    : indexPath(path), logger(log), unsaved(false) {
    load();
}

void BackupCatalog::load() {
    records.clear();

    std::error_code ec;
    if (!fs::exists(indexPath, ec)) {
        return;
    }

    std::ifstream inFile(indexPath, std::ios::binary);
    if (!inFile) {
        if (logger) {
            logger->warn("Cannot open backup index " + indexPath + ", starting with an empty catalog");
        }
        return;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, inFile, &root, &errors)) {
        if (logger) {
            logger->warn("Backup index " + indexPath + " is not valid JSON, starting with an empty catalog: " + errors);
        }
        return;
    }
    if (!root.isArray()) {
        if (logger) {
            logger->warn("Backup index " + indexPath + " is not a JSON array, starting with an empty catalog");
        }
        return;
    }

    for (const auto& item : root) {
        records.push_back(BackupRecord::fromJson(item));
    }
    if (logger) {
        logger->debug("Loaded " + std::to_string(records.size()) + " backup records from " + indexPath);
    }
}

bool BackupCatalog::save() {
    unsaved = !writeIndex();
    return !unsaved;
}

bool BackupCatalog::writeIndex() {
    fs::path target(indexPath);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            if (logger) {
                logger->error("Cannot create index directory " + target.parent_path().string() + ": " + ec.message());
            }
            return false;
        }
    }

    Json::Value root(Json::arrayValue);
    for (const auto& record : records) {
        root.append(record.toJson());
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    std::string tempPath = indexPath + ".tmp";
    {
        std::ofstream outFile(tempPath, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            if (logger) {
                logger->error("Cannot write backup index " + tempPath);
            }
            return false;
        }
        writer->write(root, &outFile);
        outFile << "\n";
        outFile.close();
        if (!outFile) {
            if (logger) {
                logger->error("Failed to write backup index " + tempPath);
            }
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        if (logger) {
            logger->error("Cannot replace backup index " + indexPath + ": " + ec.message());
        }
        std::error_code removeError;
        fs::remove(tempPath, removeError);
        return false;
    }
    return true;
}

bool BackupCatalog::add(const BackupRecord& record) {
    records.push_back(record);
    if (!save()) {
        // 写入失败时不保留内存中的记录，内存与文件重新一致
        records.pop_back();
        unsaved = false;
        return false;
    }
    return true;
}

bool BackupCatalog::remove(const std::string& fileName) {
    auto it = std::remove_if(records.begin(), records.end(),
                             [&](const BackupRecord& r) { return r.fileName == fileName; });
    if (it == records.end()) {
        return false;
    }
    records.erase(it, records.end());
    if (!save() && logger) {
        logger->error("Backup index still lists " + fileName + " on disk");
    }
    return true;
}

size_t BackupCatalog::removeMany(const std::set<std::string>& fileNames) {
    size_t before = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const BackupRecord& r) { return fileNames.count(r.fileName) > 0; }),
                  records.end());
    size_t removed = before - records.size();
    if (removed > 0 && !save() && logger) {
        logger->error("Backup index still lists " + std::to_string(removed) + " removed records on disk");
    }
    return removed;
}

bool BackupCatalog::clear() {
    records.clear();
    return save();
}

std::vector<BackupRecord> BackupCatalog::byDirectory(const std::string& directoryName) const {
    std::vector<BackupRecord> result;
    std::copy_if(records.begin(), records.end(), std::back_inserter(result),
                 [&](const BackupRecord& r) { return r.directoryName == directoryName; });
    return result;
}

std::map<std::string, std::vector<BackupRecord>> BackupCatalog::groupedByDirectory() const {
    std::map<std::string, std::vector<BackupRecord>> grouped;
    for (const auto& record : records) {
        const std::string& key = record.directoryName.empty() ? std::string(UNKNOWN_DIRECTORY) : record.directoryName;
        grouped[key].push_back(record);
    }
    return grouped;
}

std::vector<BackupRecord> BackupCatalog::sortedByDate(bool descending) const {
    std::vector<BackupRecord> sorted = records;
    // ISO-8601字符串的字典序即时间顺序
    std::stable_sort(sorted.begin(), sorted.end(), [descending](const BackupRecord& a, const BackupRecord& b) {
        return descending ? a.createdAt > b.createdAt : a.createdAt < b.createdAt;
    });
    return sorted;
}

bool BackupCatalog::findByHash(const std::string& hashMd5, BackupRecord& result) const {
    for (const auto& record : records) {
        if (record.hashMd5 == hashMd5) {
            result = record;
            return true;
        }
    }
    return false;
}

bool BackupCatalog::findByFileName(const std::string& fileName, BackupRecord& result) const {
    for (const auto& record : records) {
        if (record.fileName == fileName) {
            result = record;
            return true;
        }
    }
    return false;
}

uint64_t BackupCatalog::totalSize() const {
    uint64_t total = 0;
    for (const auto& record : records) {
        total += record.backupSize;
    }
    return total;
}

CatalogStatistics BackupCatalog::statistics() const {
    CatalogStatistics stats;
    if (records.empty()) {
        return stats;
    }
    std::vector<BackupRecord> sorted = sortedByDate(false);
    stats.totalBackups = records.size();
    stats.totalSize = totalSize();
    stats.uniqueDirectories = groupedByDirectory().size();
    stats.oldestBackup = sorted.front().createdAt;
    stats.newestBackup = sorted.back().createdAt;
    return stats;
}
