#include "archive.hpp"
#include "concurrency.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive_entry.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t BLOCK_SIZE = 10240;

constexpr unsigned char XZ_MAGIC[] = {0xFD, '7', 'z', 'X', 'Z', 0x00};
constexpr unsigned char ZSTD_MAGIC[] = {0x28, 0xB5, 0x2F, 0xFD};

template<std::size_t N>
bool has_magic(std::string_view data, const unsigned char (&magic)[N]) {
    if (data.size() < N) return false;
    return std::memcmp(data.data(), magic, N) == 0;
}

// Maps a compression format to the libarchive decoder that handles it.
void enable_decoder(struct archive* a, CompressionFormat format, const std::string& name) {
    int r = ARCHIVE_FATAL;
    switch (format) {
        case CompressionFormat::XZ:
            r = archive_read_support_filter_xz(a);
            break;
        case CompressionFormat::ZSTD:
            r = archive_read_support_filter_zstd(a);
            break;
        case CompressionFormat::UNSUPPORTED:
            throw UnsupportedFormatError(string_format("error.unsupported_compression", name));
    }
    // ARCHIVE_WARN means an external program will be used, which still works.
    if (r < ARCHIVE_WARN) {
        const char* err = archive_error_string(a);
        throw MandumpException(string_format("error.decoder_unavailable", compression_name(format), err ? err : get_string("error.unknown")));
    }
    archive_read_support_format_tar(a);
}

} // anonymous namespace

CompressionFormat sniff_compression(std::string_view magic) {
    if (has_magic(magic, XZ_MAGIC)) return CompressionFormat::XZ;
    if (has_magic(magic, ZSTD_MAGIC)) return CompressionFormat::ZSTD;
    return CompressionFormat::UNSUPPORTED;
}

const char* compression_name(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::XZ: return "xz";
        case CompressionFormat::ZSTD: return "zstd";
        case CompressionFormat::UNSUPPORTED: break;
    }
    return "unsupported";
}

std::optional<FileHandle> FileHandle::open_existing(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) return std::nullopt;
        throw MandumpException(string_format("error.open_file_failed", path.string()) + ": " + strerror(err));
    }
    return FileHandle(fd, path);
}

FileHandle::FileHandle(FileHandle&& other) noexcept : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

FileHandle::~FileHandle() {
    if (fd_ >= 0 && ::close(fd_) != 0) {
        log_warning(string_format("warning.close_failed", path_.string(), strerror(errno)));
    }
}

std::string FileHandle::peek(std::size_t n) const {
    std::string buf(n, '\0');
    ssize_t got = ::pread(fd_, buf.data(), n, 0);
    if (got < 0) {
        throw MandumpException(string_format("error.read_file_failed", path_.string()) + ": " + strerror(errno));
    }
    buf.resize(static_cast<std::size_t>(got));
    return buf;
}

TarReader::TarReader(FileHandle file, CompressionFormat format, const CancellationToken* token)
    : file_(std::move(file)), archive_(archive_read_new()), name_(file_->path().string()), token_(token) {
    if (!archive_) {
        throw MandumpException(get_string("error.archive_alloc_failed"));
    }
    enable_decoder(archive_.get(), format, name_);

    if (archive_read_open_fd(archive_.get(), file_->fd(), BLOCK_SIZE) != ARCHIVE_OK) {
        fail(get_string("error.open_file_failed_short"));
    }
}

TarReader::TarReader(std::string_view data, CompressionFormat format, const CancellationToken* token)
    : archive_(archive_read_new()), name_("<memory>"), token_(token) {
    if (!archive_) {
        throw MandumpException(get_string("error.archive_alloc_failed"));
    }
    enable_decoder(archive_.get(), format, name_);

    if (archive_read_open_memory(archive_.get(), data.data(), data.size()) != ARCHIVE_OK) {
        fail(get_string("error.open_file_failed_short"));
    }
}

void TarReader::check_cancelled() const {
    if (token_) token_->throw_if_cancelled();
}

std::string TarReader::last_error() const {
    const char* err = archive_error_string(archive_.get());
    return err ? err : get_string("error.unknown");
}

void TarReader::fail(const std::string& what) const {
    throw MandumpException(string_format("error.archive_read_failed", name_, what) + ": " + last_error());
}

std::optional<ArchiveEntry> TarReader::next() {
    check_cancelled();

    struct archive_entry* entry = nullptr;
    int r = archive_read_next_header(archive_.get(), &entry);
    if (r == ARCHIVE_EOF) return std::nullopt;
    if (r < ARCHIVE_OK) {
        if (r < ARCHIVE_WARN) {
            fail(get_string("error.fatal_read"));
        }
        log_warning(string_format("warning.archive", name_, last_error()));
    }

    ArchiveEntry out;
    const char* pathname = archive_entry_pathname(entry);
    out.pathname = pathname ? pathname : "";
    out.size = archive_entry_size(entry);

    const char* hardlink = archive_entry_hardlink(entry);
    if (hardlink) {
        out.type = EntryType::HARDLINK;
        out.link_target = hardlink;
        return out;
    }

    switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
            out.type = EntryType::REGULAR;
            break;
        case AE_IFLNK: {
            out.type = EntryType::SYMLINK;
            const char* target = archive_entry_symlink(entry);
            out.link_target = target ? target : "";
            break;
        }
        case AE_IFDIR:
            out.type = EntryType::DIRECTORY;
            break;
        default:
            out.type = EntryType::OTHER;
            break;
    }
    return out;
}

std::string TarReader::read_data() {
    std::string content;
    const void* buff;
    size_t size;
    la_int64_t offset;
    while (true) {
        check_cancelled();
        int r = archive_read_data_block(archive_.get(), &buff, &size, &offset);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(get_string("error.data_block_read"));
            }
            log_warning(string_format("warning.archive", name_, last_error()));
        }
        // Sparse entries report holes through the offset.
        if (static_cast<size_t>(offset) > content.size()) {
            content.resize(static_cast<size_t>(offset), '\0');
        }
        content.append(static_cast<const char*>(buff), size);
    }
    return content;
}

void TarReader::copy_data(std::ostream& out) {
    const void* buff;
    size_t size;
    la_int64_t offset;
    la_int64_t written = 0;
    while (true) {
        check_cancelled();
        int r = archive_read_data_block(archive_.get(), &buff, &size, &offset);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(get_string("error.data_block_read"));
            }
            log_warning(string_format("warning.archive", name_, last_error()));
        }
        for (; written < offset; ++written) {
            out.put('\0');
        }
        out.write(static_cast<const char*>(buff), static_cast<std::streamsize>(size));
        written += static_cast<la_int64_t>(size);
        if (!out) {
            throw MandumpException(string_format("error.write_failed", name_));
        }
    }
}
