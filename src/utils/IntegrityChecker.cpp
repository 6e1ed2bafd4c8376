#include "IntegrityChecker.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <vector>

std::string IntegrityChecker::toHex(const unsigned char* digest, unsigned int length) {
    static const char hexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(hexDigits[digest[i] >> 4]);
        hex.push_back(hexDigits[digest[i] & 0x0f]);
    }
    return hex;
}

std::string IntegrityChecker::calculateHash(const std::string& filePath, HashAlgorithm algorithm) {
    // Linux下目录也能以只读方式打开，需要单独排除
    std::error_code ec;
    if (std::filesystem::is_directory(filePath, ec)) {
        return "";
    }
    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile) {
        return "";
    }

    const EVP_MD* md = (algorithm == HashAlgorithm::SHA256) ? EVP_sha256() : EVP_md5();

    // 创建摘要上下文
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return "";
    }
    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (inFile) {
        inFile.read(buffer.data(), buffer.size());
        std::streamsize bytesRead = inFile.gcount();
        if (bytesRead > 0 && EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(bytesRead)) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }
    }
    // eof以外的失败说明读取中途出错，放弃本次计算
    if (inFile.bad()) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digestLength) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }
    EVP_MD_CTX_free(ctx);
    return toHex(digest, digestLength);
}

std::string IntegrityChecker::calculateHash(const std::string& filePath, const std::string& algorithmName) {
    return calculateHash(filePath, parseHashAlgorithm(algorithmName));
}

std::string IntegrityChecker::calculateMD5(const std::string& filePath) {
    return calculateHash(filePath, HashAlgorithm::MD5);
}

std::string IntegrityChecker::calculateSHA256(const std::string& filePath) {
    return calculateHash(filePath, HashAlgorithm::SHA256);
}

bool IntegrityChecker::verifyFile(const std::string& filePath, const std::string& expectedHash,
                                  const std::string& algorithmName) {
    HashAlgorithm algorithm = parseHashAlgorithm(algorithmName);
    std::string actualHash = calculateHash(filePath, algorithm);
    if (actualHash.empty()) {
        return false;
    }
    if (actualHash.size() != expectedHash.size()) {
        return false;
    }
    return std::equal(actualHash.begin(), actualHash.end(), expectedHash.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}
