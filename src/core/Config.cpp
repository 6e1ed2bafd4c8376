#include "Config.hpp"
#include "Errors.hpp"
#include "../utils/FileSystem.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {

const Json::Value& nullValue() {
    static const Json::Value value;
    return value;
}

std::string stringOr(const Json::Value& section, const char* key, const std::string& fallback) {
    const Json::Value& value = section[key];
    return value.isString() ? value.asString() : fallback;
}

int intOr(const Json::Value& section, const char* key, int fallback) {
    const Json::Value& value = section[key];
    return value.isInt() ? value.asInt() : fallback;
}

} // namespace

AppConfig::AppConfig(const std::string& path) : configPath(path) {
    load();
}

void AppConfig::load() {
    std::error_code ec;
    if (!fs::exists(configPath, ec)) {
        throw ConfigError("Configuration file not found: " + configPath);
    }
    std::ifstream inFile(configPath, std::ios::binary);
    if (!inFile) {
        throw ConfigError("Cannot open configuration file: " + configPath);
    }

    Json::CharReaderBuilder builder;
    Json::Value parsed;
    std::string errors;
    if (!Json::parseFromStream(builder, inFile, &parsed, &errors)) {
        throw ConfigError("Error parsing " + configPath + ": " + errors);
    }
    if (!parsed.isObject()) {
        throw ConfigError("Configuration root must be a JSON object: " + configPath);
    }
    root = parsed;
}

void AppConfig::save() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    std::ofstream outFile(configPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw ConfigError("Cannot write configuration file: " + configPath);
    }
    writer->write(root, &outFile);
    outFile << "\n";
    if (!outFile) {
        throw ConfigError("Failed to write configuration file: " + configPath);
    }
}

const Json::Value& AppConfig::section(const char* name) const {
    const Json::Value& value = root[name];
    return value.isObject() ? value : nullValue();
}

std::vector<std::string> AppConfig::patternList(const char* key) const {
    std::vector<std::string> patterns;
    const Json::Value& list = section("exclusion_patterns")[key];
    if (!list.isArray()) {
        return patterns;
    }
    for (const auto& item : list) {
        if (item.isString()) {
            patterns.push_back(item.asString());
        }
    }
    return patterns;
}

std::string AppConfig::defaultBackupSource() const {
    return FileSystem::expandUser(stringOr(section("paths"), "default_backup_source", "~"));
}

std::string AppConfig::backupDestination() const {
    return FileSystem::expandUser(stringOr(section("paths"), "backup_destination", "~/.bin/data/backups/archives"));
}

std::string AppConfig::tempDir() const {
    return FileSystem::expandUser(stringOr(section("paths"), "temp_dir", "/tmp/backup-universal"));
}

std::string AppConfig::indexFile() const {
    return (fs::path(backupDestination()) / INDEX_FILE_NAME).string();
}

int AppConfig::maxBackupsPerDirectory() const {
    return intOr(section("retention_policy"), "max_backups_per_directory", 5);
}

int AppConfig::daysToKeep() const {
    return intOr(section("retention_policy"), "days_to_keep", 30);
}

double AppConfig::maxTotalSizeGb() const {
    const Json::Value& value = section("retention_policy")["max_total_size_gb"];
    return value.isNumeric() ? value.asDouble() : 50.0;
}

std::string AppConfig::defaultFormat() const {
    return stringOr(section("compression"), "default_format", "tar");
}

int AppConfig::defaultCompressionLevel() const {
    return intOr(section("compression"), "default_level", 6);
}

std::vector<std::string> AppConfig::defaultExclusionPatterns() const {
    return patternList("default");
}

std::vector<std::string> AppConfig::customExclusionPatterns() const {
    return patternList("custom");
}

std::vector<std::string> AppConfig::allExclusionPatterns() const {
    std::vector<std::string> all = defaultExclusionPatterns();
    std::vector<std::string> custom = customExclusionPatterns();
    all.insert(all.end(), custom.begin(), custom.end());
    return all;
}

bool AppConfig::addCustomPattern(const std::string& pattern) {
    std::vector<std::string> custom = customExclusionPatterns();
    if (std::find(custom.begin(), custom.end(), pattern) != custom.end()) {
        return false;
    }
    if (!root["exclusion_patterns"].isObject()) {
        root["exclusion_patterns"] = Json::Value(Json::objectValue);
    }
    Json::Value& list = root["exclusion_patterns"]["custom"];
    if (!list.isArray()) {
        list = Json::Value(Json::arrayValue);
    }
    list.append(pattern);
    save();
    return true;
}

bool AppConfig::removeCustomPattern(const std::string& pattern) {
    if (!root.isMember("exclusion_patterns") || !root["exclusion_patterns"].isObject()) {
        return false;
    }
    Json::Value& patterns = root["exclusion_patterns"];
    if (!patterns.isMember("custom") || !patterns["custom"].isArray()) {
        return false;
    }
    Json::Value kept(Json::arrayValue);
    bool removed = false;
    for (const auto& item : patterns["custom"]) {
        if (!removed && item.isString() && item.asString() == pattern) {
            removed = true;
            continue;
        }
        kept.append(item);
    }
    if (!removed) {
        return false;
    }
    patterns["custom"] = kept;
    save();
    return true;
}

std::string AppConfig::logLevel() const {
    return stringOr(section("logging"), "level", "info");
}
