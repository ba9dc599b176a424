#pragma once

#include "archive.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <utility>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// One member of a test tarball. A non-empty link_target makes it a symlink.
struct TarMember {
    std::string name;
    std::string content;
    std::string link_target;
    bool directory = false;
};

// Writes members as a pax tarball compressed with format.
void write_tar(const fs::path& path, const std::vector<TarMember>& members, CompressionFormat format);

std::string read_file(const fs::path& path);
void write_file(const fs::path& path, const std::string& content);

// A files.plist listing the given files, directories and links.
std::string files_plist(const std::vector<std::string>& files,
                        const std::vector<std::string>& dirs,
                        const std::vector<std::string>& links = {});

// Minimal index entry of one package.
struct IndexEntry {
    std::string name;
    std::string pkgver;
    std::string architecture = "x86_64";
    std::string sha256;
    std::string short_desc;
};

// An index.plist dictionary keyed by package name.
std::string index_plist(const std::vector<IndexEntry>& entries);

// The same index as a binary property list.
std::string binary_index_plist(const std::vector<IndexEntry>& entries);

// Writes a zstd repodata archive holding the index, as XML or binary.
void write_repodata(const fs::path& path, const std::vector<IndexEntry>& entries, bool binary = false);

// Builds "bplist00" documents. Every add_* returns the object's reference.
class BinaryPlistWriter {
public:
    std::size_t add_string(const std::string& s);
    std::size_t add_utf16(const std::u16string& s);
    std::size_t add_integer(std::int64_t v);
    std::size_t add_real(double v);
    std::size_t add_bool(bool v);
    // Seconds since 2001-01-01T00:00:00Z.
    std::size_t add_date(double seconds);
    std::size_t add_data(const std::string& bytes);
    std::size_t add_array(const std::vector<std::size_t>& refs);
    std::size_t add_dict(const std::vector<std::pair<std::size_t, std::size_t>>& entries);

    // Reference the next added object will get.
    std::size_t next_ref() const { return objects_.size(); }

    std::string finish(std::size_t top) const;

private:
    std::size_t add(std::string encoded);

    std::vector<std::string> objects_;
};
