#pragma once
#include <string>
#include "../core/Types.hpp"

// 文件完整性校验：以固定大小分块流式计算摘要（MD5 / SHA-256）
class IntegrityChecker {
private:
    static std::string toHex(const unsigned char* digest, unsigned int length);

public:
    static constexpr size_t CHUNK_SIZE = 4096;

    // 计算摘要，读取失败时返回空字符串
    static std::string calculateHash(const std::string& filePath, HashAlgorithm algorithm = HashAlgorithm::MD5);
    static std::string calculateHash(const std::string& filePath, const std::string& algorithmName);

    static std::string calculateMD5(const std::string& filePath);
    static std::string calculateSHA256(const std::string& filePath);

    // 重新计算并与期望值比较（不区分大小写）；未知算法名称抛出std::invalid_argument
    static bool verifyFile(const std::string& filePath, const std::string& expectedHash,
                           const std::string& algorithmName = "md5");
};
