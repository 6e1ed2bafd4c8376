#include "FileSystem.hpp"
#include "../core/ExclusionFilter.hpp"
#include <iostream>
#include <algorithm>
#include <cstdlib>

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && status.type() != fs::file_type::not_found;
}

bool FileSystem::isDirectory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && !ec;
}

bool FileSystem::createDirectories(const std::string& path) {
    // 如果目录已存在，直接返回成功
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return true;
    }

    fs::create_directories(path, ec);
    if (ec) {
        std::cerr << "Error: Failed to create directories for " << path << " (" << ec.message() << ")" << std::endl;
        return false;
    }
    return true;
}

uint64_t FileSystem::getFileSize(const std::string& filePath) {
    std::error_code ec;
    uintmax_t size = fs::file_size(filePath, ec);
    if (ec) {
        return 0;
    }
    return static_cast<uint64_t>(size);
}

bool FileSystem::removeFile(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        std::cerr << "Error: Failed to remove " << path << " (" << ec.message() << ")" << std::endl;
        return false;
    }
    return removed;
}

std::string FileSystem::baseName(const std::string& path) {
    fs::path p(path);
    // "a/b/" 的filename()为空，需要先去掉末尾分隔符
    while (!p.empty() && p.filename().empty() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p.filename().string();
}

std::string FileSystem::expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

void FileSystem::walk(const fs::path& root, const std::function<void(DirectoryLevel&)>& visitor) {
    DirectoryLevel level;
    level.directory = root;

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        // 无法打开的目录直接跳过
        std::cerr << "Warning: Cannot read directory " << root << " (" << ec.message() << ")" << std::endl;
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        // is_directory跟随符号链接，指向目录的符号链接也归入子目录
        std::error_code typeEc;
        if (it->is_directory(typeEc)) {
            level.subdirectories.push_back(it->path());
        } else {
            level.files.push_back(it->path());
        }
    }

    auto byName = [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    };
    std::sort(level.subdirectories.begin(), level.subdirectories.end(), byName);
    std::sort(level.files.begin(), level.files.end(), byName);

    visitor(level);

    for (const auto& subdir : level.subdirectories) {
        std::error_code linkEc;
        if (fs::is_symlink(subdir, linkEc)) {
            continue;
        }
        walk(subdir, visitor);
    }
}

DirectorySize FileSystem::calculateDirectorySize(const std::string& directory, ExclusionFilter* filter) {
    DirectorySize result;
    walk(directory, [&](DirectoryLevel& level) {
        if (filter) {
            auto& dirs = level.subdirectories;
            dirs.erase(std::remove_if(dirs.begin(), dirs.end(),
                                      [filter](const fs::path& d) {
                                          return filter->shouldExclude(d.filename().string());
                                      }),
                       dirs.end());
        }

        for (const auto& file : level.files) {
            std::string name = file.filename().string();
            if (filter && filter->shouldExclude(name)) {
                continue;
            }
            std::error_code ec;
            uintmax_t size = fs::file_size(file, ec);
            if (ec) {
                continue;
            }
            result.totalBytes += size;
            result.fileCount++;
        }
    });
    return result;
}

DirectoryType FileSystem::detectDirectoryType(const std::string& directory) {
    fs::path dir(directory);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return DirectoryType::GENERIC;
    }

    if (fs::exists(dir / "package.json", ec)) {
        return DirectoryType::NODEJS;
    }
    if (fs::exists(dir / "requirements.txt", ec) || fs::exists(dir / "setup.py", ec)) {
        return DirectoryType::PYTHON;
    }
    if (fs::exists(dir / "pom.xml", ec)) {
        return DirectoryType::JAVA;
    }
    if (fs::exists(dir / ".git", ec)) {
        return DirectoryType::GIT;
    }
    return DirectoryType::GENERIC;
}

std::vector<fs::path> FileSystem::listFilesWithSuffixes(const std::string& directory,
                                                       const std::vector<std::string>& suffixes) {
    std::vector<fs::path> result;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return result;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) {
            continue;
        }
        std::string name = it->path().filename().string();
        for (const auto& suffix : suffixes) {
            if (name.size() >= suffix.size() &&
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
                result.push_back(it->path());
                break;
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}
