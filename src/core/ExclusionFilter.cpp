#include "ExclusionFilter.hpp"
#include <algorithm>
#include <fnmatch.h>

ExclusionFilter::ExclusionFilter(const std::vector<std::string>& initialPatterns) {
    addPatterns(initialPatterns);
}

void ExclusionFilter::addPattern(const std::string& pattern) {
    if (pattern.empty()) {
        return;
    }
    if (std::find(patterns.begin(), patterns.end(), pattern) != patterns.end()) {
        return;
    }
    patterns.push_back(pattern);
    excludedCache.clear();
}

void ExclusionFilter::addPatterns(const std::vector<std::string>& newPatterns) {
    for (const auto& pattern : newPatterns) {
        addPattern(pattern);
    }
}

bool ExclusionFilter::removePattern(const std::string& pattern) {
    auto it = std::find(patterns.begin(), patterns.end(), pattern);
    if (it == patterns.end()) {
        return false;
    }
    patterns.erase(it);
    excludedCache.clear();
    return true;
}

std::string ExclusionFilter::finalComponent(const std::string& path) {
    // 去掉末尾的分隔符，"a/b/" 的最后组成部分是 "b"
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return "";
    }
    size_t start = path.find_last_of('/', end);
    std::string name = (start == std::string::npos) ? path.substr(0, end + 1)
                                                     : path.substr(start + 1, end - start);
    if (name == ".") {
        return "";
    }
    return name;
}

bool ExclusionFilter::shouldExclude(const std::string& path) {
    if (excludedCache.count(path) > 0) {
        return true;
    }

    std::string name = finalComponent(path);
    for (const auto& pattern : patterns) {
        // FNM_NOESCAPE: 反斜杠按普通字符处理
        if (fnmatch(pattern.c_str(), name.c_str(), FNM_NOESCAPE) == 0) {
            excludedCache.insert(path);
            return true;
        }
    }
    // 不排除的结果不缓存
    return false;
}

void ExclusionFilter::filterPaths(std::vector<std::string>& paths) {
    paths.erase(std::remove_if(paths.begin(), paths.end(),
                               [this](const std::string& p) { return shouldExclude(p); }),
                paths.end());
}

std::string ExclusionFilter::getFilterDescription() const {
    std::string desc = "Exclusion Filter: Patterns (" + std::to_string(patterns.size()) + "): [";
    for (size_t i = 0; i < patterns.size(); ++i) {
        desc += patterns[i];
        if (i < patterns.size() - 1) {
            desc += ", ";
        }
    }
    desc += "]";
    return desc;
}
