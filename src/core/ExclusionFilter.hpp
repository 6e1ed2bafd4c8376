#pragma once
#include <string>
#include <vector>
#include <unordered_set>

// 基于shell通配符的排除过滤器，只匹配路径的最后一个组成部分（文件名或目录名）
class ExclusionFilter {
private:
    std::vector<std::string> patterns;          // 通配符模式，保持添加顺序
    std::unordered_set<std::string> excludedCache; // 只缓存"应排除"的结果，键为调用方传入的原始字符串

    static std::string finalComponent(const std::string& path);

public:
    ExclusionFilter() = default;
    explicit ExclusionFilter(const std::vector<std::string>& initialPatterns);
    ~ExclusionFilter() = default;

    // 添加模式，空模式和重复模式被忽略；模式集合变化时清空缓存
    void addPattern(const std::string& pattern);
    void addPatterns(const std::vector<std::string>& newPatterns);
    bool removePattern(const std::string& pattern);

    bool shouldExclude(const std::string& path);

    // 原地移除应排除的路径
    void filterPaths(std::vector<std::string>& paths);

    const std::vector<std::string>& getPatterns() const {
        return this->patterns;
    }
    void clearCache() {
        this->excludedCache.clear();
    }
    size_t size() const {
        return this->patterns.size();
    }
    size_t cacheSize() const {
        return this->excludedCache.size();
    }

    std::string getFilterDescription() const;
};
