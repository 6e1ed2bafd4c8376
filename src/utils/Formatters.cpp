#include "Formatters.hpp"
#include <cstdio>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string formatBytes(double bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    char buffer[64];
    for (const char* unit : units) {
        if (bytes < 1024.0) {
            std::snprintf(buffer, sizeof(buffer), "%.1f %s", bytes, unit);
            return buffer;
        }
        bytes /= 1024.0;
    }
    std::snprintf(buffer, sizeof(buffer), "%.1f PB", bytes);
    return buffer;
}

std::string formatNumber(uint64_t number) {
    std::string digits = std::to_string(number);
    std::string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), *it);
        ++count;
    }
    return result;
}

double compressionRatio(uint64_t originalSize, uint64_t compressedSize) {
    if (originalSize == 0) {
        return 0.0;
    }
    return (static_cast<double>(originalSize) - static_cast<double>(compressedSize)) /
           static_cast<double>(originalSize) * 100.0;
}

std::string formatProgress(uint64_t current, uint64_t total) {
    if (total == 0) {
        return "0.0%";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%",
                  static_cast<double>(current) / static_cast<double>(total) * 100.0);
    return buffer;
}

std::string truncateString(const std::string& text, size_t maxLength, const std::string& suffix) {
    if (text.size() <= maxLength) {
        return text;
    }
    size_t keep = maxLength > suffix.size() ? maxLength - suffix.size() : 0;
    return text.substr(0, keep) + suffix;
}

std::string toIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(timePoint);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timePoint - seconds).count();
    if (micros < 0) {
        seconds -= std::chrono::seconds(1);
        micros += 1000000;
    }
    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm localTm{};
    localtime_r(&time, &localTm);

    std::ostringstream oss;
    oss << std::put_time(&localTm, "%Y-%m-%dT%H:%M:%S");
    if (micros != 0) {
        oss << '.' << std::setw(6) << std::setfill('0') << micros;
    }
    return oss.str();
}

std::string currentIsoTimestamp() {
    return toIsoTimestamp(std::chrono::system_clock::now());
}

std::string archiveTimestamp(std::chrono::system_clock::time_point timePoint) {
    std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm localTm{};
    localtime_r(&time, &localTm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &localTm);
    return buffer;
}

static bool readDigits(const std::string& text, size_t& pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

static bool expect(const std::string& text, size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

bool parseIsoTimestamp(const std::string& text, std::chrono::system_clock::time_point& result) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    long micros = 0;

    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return false;
    }

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, minute)) {
            return false;
        }
        if (expect(text, pos, ':')) {
            if (!readDigits(text, pos, 2, second)) {
                return false;
            }
            if (expect(text, pos, '.')) {
                // 小数部分最多取6位（微秒）
                size_t digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (digits < 6) {
                        micros = micros * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) {
                    return false;
                }
                for (size_t i = digits; i < 6; ++i) {
                    micros *= 10;
                }
            }
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t epoch;
    if (pos == text.size()) {
        tm.tm_isdst = -1;
        epoch = std::mktime(&tm);
    } else {
        // 带时区的时间戳
        long offsetSeconds = 0;
        if (text[pos] == 'Z' && pos + 1 == text.size()) {
            offsetSeconds = 0;
        } else if (text[pos] == '+' || text[pos] == '-') {
            int sign = (text[pos] == '-') ? -1 : 1;
            ++pos;
            int offHour = 0, offMinute = 0;
            if (!readDigits(text, pos, 2, offHour)) {
                return false;
            }
            expect(text, pos, ':');
            if (!readDigits(text, pos, 2, offMinute) || pos != text.size()) {
                return false;
            }
            offsetSeconds = sign * (offHour * 3600L + offMinute * 60L);
        } else {
            return false;
        }
        epoch = timegm(&tm) - offsetSeconds;
    }
    if (epoch == static_cast<std::time_t>(-1) && year != 1969) {
        return false;
    }

    result = std::chrono::system_clock::from_time_t(epoch) + std::chrono::microseconds(micros);
    return true;
}

std::string formatDate(const std::string& isoTimestamp, const std::string& format) {
    std::chrono::system_clock::time_point timePoint;
    if (!parseIsoTimestamp(isoTimestamp, timePoint)) {
        return isoTimestamp;
    }
    std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm localTm{};
    localtime_r(&time, &localTm);
    std::ostringstream oss;
    oss << std::put_time(&localTm, format.c_str());
    return oss.str();
}
