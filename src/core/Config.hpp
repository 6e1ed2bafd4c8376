#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <json/json.h>

// JSON配置文件（jsoncpp）；缺失的键使用默认值，路径中的~展开为$HOME
class AppConfig {
private:
    std::string configPath;
    Json::Value root;

    const Json::Value& section(const char* name) const;
    std::vector<std::string> patternList(const char* key) const;

public:
    static constexpr const char* INDEX_FILE_NAME = "indice_backups.json";

    // 文件不存在或不是合法JSON对象时抛出ConfigError
    explicit AppConfig(const std::string& path);

    void load();
    void save() const;

    const std::string& getConfigPath() const { return configPath; }

    // paths
    std::string defaultBackupSource() const;
    std::string backupDestination() const;
    std::string tempDir() const;
    std::string indexFile() const;

    // retention_policy
    int maxBackupsPerDirectory() const;
    int daysToKeep() const;
    double maxTotalSizeGb() const;

    // compression
    std::string defaultFormat() const;
    int defaultCompressionLevel() const;

    // exclusion_patterns
    std::vector<std::string> defaultExclusionPatterns() const;
    std::vector<std::string> customExclusionPatterns() const;
    std::vector<std::string> allExclusionPatterns() const;

    // 修改自定义排除规则并写回配置文件；已存在/不存在时返回false且不写文件
    bool addCustomPattern(const std::string& pattern);
    bool removeCustomPattern(const std::string& pattern);

    // logging
    std::string logLevel() const;
};
