#include "Types.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

static std::string toLower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

ArchiveFormat parseArchiveFormat(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "tar") {
        return ArchiveFormat::TAR;
    }
    if (lower == "zip") {
        return ArchiveFormat::ZIP;
    }
    throw UnsupportedFormatError(name);
}

HashAlgorithm parseHashAlgorithm(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "md5") {
        return HashAlgorithm::MD5;
    }
    if (lower == "sha256") {
        return HashAlgorithm::SHA256;
    }
    throw std::invalid_argument("Unsupported hash algorithm: " + name);
}
