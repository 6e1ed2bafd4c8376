#pragma once
#include <string>
#include <chrono>
#include <cstdint>

// 大小格式化，例如 "45.2 MB"
std::string formatBytes(double bytes);

// 千位分隔，例如 "1,234,567"
std::string formatNumber(uint64_t number);

// 压缩率（百分比）：(original - compressed) / original * 100，原始大小为0时返回0
double compressionRatio(uint64_t originalSize, uint64_t compressedSize);

// 进度百分比字符串，例如 "45.2%"
std::string formatProgress(uint64_t current, uint64_t total);

std::string truncateString(const std::string& text, size_t maxLength = 50, const std::string& suffix = "...");

// ISO-8601本地时间，微秒为0时省略小数部分
std::string toIsoTimestamp(std::chrono::system_clock::time_point timePoint);
std::string currentIsoTimestamp();

// 归档文件名中使用的时间戳 YYYYMMDD_HHMMSS
std::string archiveTimestamp(std::chrono::system_clock::time_point timePoint);

// 解析 YYYY-MM-DD[(T| )HH:MM[:SS[.ffffff]]][Z|(+|-)HH:MM]，无时区时按本地时间解释
bool parseIsoTimestamp(const std::string& text, std::chrono::system_clock::time_point& result);

// 按strftime格式显示ISO时间戳，无法解析时原样返回
std::string formatDate(const std::string& isoTimestamp, const std::string& format = "%d/%m/%Y %H:%M:%S");
