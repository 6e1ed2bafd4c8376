#include "ArchiveCodec.hpp"
#include "ILogger.hpp"
#include "../core/Errors.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace {

struct ArchiveReadFree {
    void operator()(struct archive* handle) const {
        archive_read_free(handle);
    }
};

struct ArchiveEntryFree {
    void operator()(struct archive_entry* entry) const {
        archive_entry_free(entry);
    }
};

using ReadHandle = std::unique_ptr<struct archive, ArchiveReadFree>;
using DiskHandle = std::unique_ptr<struct archive, ArchiveWriteFree>;
using EntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryFree>;

constexpr size_t READ_BLOCK_SIZE = 10240;

std::string errorText(struct archive* handle) {
    const char* message = archive_error_string(handle);
    return message ? message : "unknown error";
}

ReadHandle openForReading(ArchiveFormat format, const std::string& archivePath) {
    ReadHandle reader(archive_read_new());
    if (!reader) {
        throw ArchiveReadError("Cannot allocate archive reader");
    }

    int result;
    if (format == ArchiveFormat::TAR) {
        result = archive_read_support_filter_gzip(reader.get());
        if (result >= ARCHIVE_WARN) {
            result = archive_read_support_format_tar(reader.get());
        }
    } else {
        result = archive_read_support_format_zip(reader.get());
    }
    // ARCHIVE_WARN表示改用外部gzip程序，仍然可用
    if (result < ARCHIVE_WARN) {
        throw ArchiveReadError("Cannot configure archive reader: " + errorText(reader.get()));
    }

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        throw ArchiveReadError("Cannot open archive " + archivePath + ": " + errorText(reader.get()));
    }
    return reader;
}

// 读取下一个条目头，到达结尾返回false
bool nextHeader(struct archive* reader, struct archive_entry** entry, const std::string& archivePath,
                ILogger* logger) {
    int result = archive_read_next_header(reader, entry);
    if (result == ARCHIVE_EOF) {
        return false;
    }
    if (result < ARCHIVE_WARN) {
        throw ArchiveReadError("Corrupted archive " + archivePath + ": " + errorText(reader));
    }
    if (result == ARCHIVE_WARN && logger) {
        logger->warn("Archive warning in " + archivePath + ": " + errorText(reader));
    }
    return true;
}

void copyEntryData(struct archive* reader, struct archive* disk, const std::string& entryName) {
    const void* buffer = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        int result = archive_read_data_block(reader, &buffer, &size, &offset);
        if (result == ARCHIVE_EOF) {
            return;
        }
        // zip的CRC不符在最后一块以ARCHIVE_WARN报告
        if (result != ARCHIVE_OK) {
            throw ArchiveReadError("Corrupted data in entry " + entryName + ": " + errorText(reader));
        }
        if (archive_write_data_block(disk, buffer, size, offset) < ARCHIVE_OK) {
            throw ArchiveReadError("Cannot write entry " + entryName + ": " + errorText(disk));
        }
    }
}

} // namespace

void ArchiveWriteFree::operator()(struct archive* handle) const {
    archive_write_free(handle);
}

ArchiveWriter::ArchiveWriter(ArchiveFormat archiveFormat, const std::string& path, int compressionLevel, ILogger* log)
    : handle(archive_write_new()), format(archiveFormat), outputPath(path), logger(log), closed(false) {
    if (!handle) {
        throw ArchiveWriteError("Cannot allocate archive writer");
    }

    int result;
    if (format == ArchiveFormat::TAR) {
        result = archive_write_add_filter_gzip(handle.get());
        if (result >= ARCHIVE_WARN) {
            result = archive_write_set_format_pax_restricted(handle.get());
        }
    } else {
        result = archive_write_set_format_zip(handle.get());
    }
    if (result < ARCHIVE_WARN) {
        throw ArchiveWriteError("Cannot configure archive " + outputPath + ": " + errorText(handle.get()));
    }

    applyCompressionLevel(compressionLevel);

    if (archive_write_open_filename(handle.get(), outputPath.c_str()) != ARCHIVE_OK) {
        throw ArchiveWriteError("Cannot create archive: " + outputPath + " (" + errorText(handle.get()) + ")");
    }
}

ArchiveWriter::~ArchiveWriter() {
    if (!closed && archive_write_close(handle.get()) != ARCHIVE_OK && logger) {
        logger->warn("Archive not closed cleanly: " + outputPath + " (" + errorText(handle.get()) + ")");
    }
}

void ArchiveWriter::applyCompressionLevel(int level) {
    std::string options;
    if (format == ArchiveFormat::TAR) {
        options = "gzip:compression-level=" + std::to_string(level);
    } else if (level == 0) {
        options = "zip:compression=store";
    } else {
        options = "zip:compression=deflate,zip:compression-level=" + std::to_string(level);
    }

    // 旧版libarchive不认识zip的compression-level，此时使用默认级别
    if (archive_write_set_options(handle.get(), options.c_str()) != ARCHIVE_OK && logger) {
        logger->warn("Compression options '" + options + "' not fully applied: " + errorText(handle.get()));
    }
}

void ArchiveWriter::addFile(const fs::path& sourcePath, const std::string& archiveName) {
    struct stat st;
    // zip跟随符号链接，tar保存链接本身
    int statResult = format == ArchiveFormat::TAR ? lstat(sourcePath.c_str(), &st) : stat(sourcePath.c_str(), &st);
    if (statResult != 0) {
        throw FileReadError("Cannot stat " + sourcePath.string() + " (" + std::strerror(errno) + ")");
    }

    EntryHandle entry(archive_entry_new());
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_set_pathname(entry.get(), archiveName.c_str());

    std::ifstream inFile;
    if (S_ISLNK(st.st_mode)) {
        std::error_code ec;
        fs::path linkTarget = fs::read_symlink(sourcePath, ec);
        if (ec) {
            throw FileReadError("Cannot read symlink " + sourcePath.string() + " (" + ec.message() + ")");
        }
        archive_entry_set_symlink(entry.get(), linkTarget.c_str());
        archive_entry_set_size(entry.get(), 0);
    } else if (S_ISREG(st.st_mode)) {
        inFile.open(sourcePath, std::ios::binary);
        if (!inFile) {
            throw FileReadError("Cannot open " + sourcePath.string() + " (" + std::strerror(errno) + ")");
        }
    } else {
        throw FileReadError("Unsupported file type: " + sourcePath.string());
    }

    int result = archive_write_header(handle.get(), entry.get());
    if (result == ARCHIVE_FATAL) {
        throw ArchiveWriteError("Failed to write archive " + outputPath + ": " + errorText(handle.get()));
    }
    if (result == ARCHIVE_FAILED) {
        // 该条目被拒绝，归档仍可继续写入
        throw FileReadError("Cannot add entry " + archiveName + ": " + errorText(handle.get()));
    }
    if (result == ARCHIVE_WARN && logger) {
        logger->warn("Archive warning for " + archiveName + ": " + errorText(handle.get()));
    }

    if (S_ISREG(st.st_mode)) {
        copyFileData(inFile, sourcePath, static_cast<int64_t>(st.st_size));
    }

    if (archive_write_finish_entry(handle.get()) < ARCHIVE_WARN) {
        throw ArchiveWriteError("Failed to write archive " + outputPath + ": " + errorText(handle.get()));
    }
}

void ArchiveWriter::copyFileData(std::ifstream& inFile, const fs::path& sourcePath, int64_t expectedSize) {
    // 只写入头中记录的大小，文件中途变短时由libarchive补齐
    char buffer[65536];
    int64_t remaining = expectedSize;
    while (remaining > 0 && inFile) {
        size_t toRead = static_cast<size_t>(std::min<int64_t>(sizeof(buffer), remaining));
        inFile.read(buffer, static_cast<std::streamsize>(toRead));
        std::streamsize got = inFile.gcount();
        if (got <= 0) {
            break;
        }
        la_ssize_t written = archive_write_data(handle.get(), buffer, static_cast<size_t>(got));
        if (written < 0) {
            throw ArchiveWriteError("Failed to write archive " + outputPath + ": " + errorText(handle.get()));
        }
        remaining -= got;
    }
    if (remaining > 0 && logger) {
        logger->warn("File shrank while archiving: " + sourcePath.string());
    }
}

void ArchiveWriter::close() {
    if (closed) {
        return;
    }
    closed = true;
    if (archive_write_close(handle.get()) != ARCHIVE_OK) {
        throw ArchiveWriteError("Failed to finalize archive " + outputPath + ": " + errorText(handle.get()));
    }
}

void ArchiveReader::extractAll(ArchiveFormat format, const std::string& archivePath,
                               const fs::path& destination, ILogger* logger) {
    ReadHandle reader = openForReading(format, archivePath);

    // 目标前缀中不能有".."或符号链接，否则会被安全选项拒绝
    std::error_code ec;
    fs::path base = fs::weakly_canonical(fs::absolute(destination), ec);
    if (ec) {
        base = fs::absolute(destination).lexically_normal();
    }

    DiskHandle disk(archive_write_disk_new());
    if (!disk) {
        throw ArchiveReadError("Cannot allocate extraction writer");
    }
    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_UNLINK |
                ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (archive_write_disk_set_options(disk.get(), flags) != ARCHIVE_OK ||
        archive_write_disk_set_standard_lookup(disk.get()) != ARCHIVE_OK) {
        throw ArchiveReadError("Cannot configure extraction: " + errorText(disk.get()));
    }

    struct archive_entry* entry = nullptr;
    while (nextHeader(reader.get(), &entry, archivePath, logger)) {
        const char* rawName = archive_entry_pathname(entry);
        std::string entryName = rawName ? rawName : "";

        // 条目名相对于base重写为完整路径
        fs::path target;
        if (!resolveEntryPath(base, entryName, target)) {
            if (logger) {
                logger->warn("Skipping unsafe archive entry: " + entryName);
            }
            continue;
        }
        archive_entry_set_pathname(entry, target.c_str());

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            fs::path linkTarget;
            if (!resolveEntryPath(base, hardlink, linkTarget)) {
                if (logger) {
                    logger->warn("Skipping unsafe hard link: " + entryName + " -> " + hardlink);
                }
                continue;
            }
            archive_entry_set_hardlink(entry, linkTarget.c_str());
        }

        int result = archive_write_header(disk.get(), entry);
        if (result == ARCHIVE_FATAL) {
            throw ArchiveReadError("Cannot extract " + entryName + ": " + errorText(disk.get()));
        }
        if (result < ARCHIVE_WARN) {
            if (logger) {
                logger->warn("Skipping archive entry " + entryName + ": " + errorText(disk.get()));
            }
            continue;
        }

        if (archive_entry_size(entry) > 0) {
            copyEntryData(reader.get(), disk.get(), entryName);
        }

        // 权限或时间无法恢复时只记录警告
        result = archive_write_finish_entry(disk.get());
        if (result == ARCHIVE_FATAL) {
            throw ArchiveReadError("Cannot finish entry " + entryName + ": " + errorText(disk.get()));
        }
        if (result != ARCHIVE_OK && logger) {
            logger->warn("Cannot restore metadata for " + target.string() + ": " + errorText(disk.get()));
        }
    }
}

std::vector<std::string> ArchiveReader::listEntries(ArchiveFormat format, const std::string& archivePath) {
    ReadHandle reader = openForReading(format, archivePath);
    std::vector<std::string> names;

    struct archive_entry* entry = nullptr;
    while (nextHeader(reader.get(), &entry, archivePath, nullptr)) {
        const char* name = archive_entry_pathname(entry);
        names.push_back(name ? name : "");
        if (archive_read_data_skip(reader.get()) < ARCHIVE_WARN) {
            throw ArchiveReadError("Corrupted archive " + archivePath + ": " + errorText(reader.get()));
        }
    }
    return names;
}

bool resolveEntryPath(const fs::path& destination, const std::string& entryName, fs::path& result) {
    if (entryName.empty()) {
        return false;
    }
    fs::path entry(entryName);
    if (entry.is_absolute() || entry.has_root_name() || entry.has_root_directory()) {
        return false;
    }

    fs::path relative;
    for (const auto& part : entry) {
        std::string component = part.string();
        if (component == "..") {
            return false;
        }
        if (component.empty() || component == ".") {
            continue;
        }
        relative /= part;
    }
    if (relative.empty()) {
        return false;
    }
    result = destination / relative;
    return true;
}
