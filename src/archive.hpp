#pragma once

#include <archive.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

class CancellationToken;

// Custom deleter for libarchive read handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;

enum class CompressionFormat {
    XZ,
    ZSTD,
    UNSUPPORTED
};

// Detects the compression of a stream from its leading bytes.
CompressionFormat sniff_compression(std::string_view magic);
const char* compression_name(CompressionFormat format);

// Read-only file descriptor owned for the lifetime of the object.
class FileHandle {
public:
    // Returns std::nullopt if path does not exist; throws MandumpException on other errors.
    static std::optional<FileHandle> open_existing(const std::filesystem::path& path);

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    ~FileHandle();

    int fd() const { return fd_; }
    const std::filesystem::path& path() const { return path_; }

    // Reads up to n bytes from the start of the file without moving the file offset.
    std::string peek(std::size_t n) const;

private:
    FileHandle(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::filesystem::path path_;
};

enum class EntryType {
    REGULAR,
    SYMLINK,
    DIRECTORY,
    HARDLINK,
    OTHER
};

struct ArchiveEntry {
    std::string pathname;
    EntryType type = EntryType::OTHER;
    std::string link_target;
    std::int64_t size = 0;
};

// Sequential reader over a compressed tar stream. Only the given compression filter is
// enabled, so a stream in any other format fails on the first read.
class TarReader {
public:
    // Reads from an open file. The reader takes ownership of the handle.
    TarReader(FileHandle file, CompressionFormat format, const CancellationToken* token = nullptr);
    // Reads from memory that must outlive the reader.
    TarReader(std::string_view data, CompressionFormat format, const CancellationToken* token = nullptr);

    TarReader(const TarReader&) = delete;
    TarReader& operator=(const TarReader&) = delete;

    // Advances to the next entry, skipping unread data. Returns std::nullopt at the end of
    // the archive.
    std::optional<ArchiveEntry> next();

    // Reads the data of the current entry.
    std::string read_data();
    void copy_data(std::ostream& out);

private:
    void check_cancelled() const;
    std::string last_error() const;
    [[noreturn]] void fail(const std::string& what) const;

    std::optional<FileHandle> file_;
    ArchiveReadHandle archive_;
    std::string name_;
    const CancellationToken* token_;
};
