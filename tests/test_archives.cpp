#include "test_archives.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <bit>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

void check(struct archive* a, int r) {
    if (r < ARCHIVE_WARN) {
        const char* err = archive_error_string(a);
        throw std::runtime_error(err ? err : "libarchive write error");
    }
}

std::string xml_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string plist_document(const std::string& body) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<!DOCTYPE plist PUBLIC \"-//Apple Computer//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
           "<plist version=\"1.0\">\n" + body + "</plist>\n";
}

std::string file_array(const char* key, const std::vector<std::string>& files) {
    std::string out = "<key>" + std::string(key) + "</key>\n<array>\n";
    for (const auto& f : files) {
        out += "<dict><key>file</key><string>" + xml_escape(f) + "</string></dict>\n";
    }
    return out + "</array>\n";
}

std::string big_endian(std::uint64_t value, std::size_t n) {
    std::string out(n, '\0');
    for (std::size_t i = 0; i < n; ++i) {
        out[n - 1 - i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

// Marker byte with the length inline, or followed by an 8-byte integer object.
std::string bplist_marker(std::uint8_t type, std::size_t len) {
    if (len < 15) {
        return std::string(1, static_cast<char>((type << 4) | len));
    }
    return std::string(1, static_cast<char>((type << 4) | 0x0F)) + "\x13" + big_endian(len, 8);
}

} // anonymous namespace

void write_tar(const fs::path& path, const std::vector<TarMember>& members, CompressionFormat format) {
    std::unique_ptr<struct archive, ArchiveWriteDeleter> a(archive_write_new());
    switch (format) {
        case CompressionFormat::XZ: check(a.get(), archive_write_add_filter_xz(a.get())); break;
        case CompressionFormat::ZSTD: check(a.get(), archive_write_add_filter_zstd(a.get())); break;
        case CompressionFormat::UNSUPPORTED: check(a.get(), archive_write_add_filter_none(a.get())); break;
    }
    check(a.get(), archive_write_set_format_pax_restricted(a.get()));
    check(a.get(), archive_write_open_filename(a.get(), path.c_str()));

    for (const auto& m : members) {
        std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), m.name.c_str());
        if (m.directory) {
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), 0755);
        } else if (!m.link_target.empty()) {
            archive_entry_set_filetype(entry.get(), AE_IFLNK);
            archive_entry_set_symlink(entry.get(), m.link_target.c_str());
            archive_entry_set_perm(entry.get(), 0777);
        } else {
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(m.content.size()));
        }
        check(a.get(), archive_write_header(a.get(), entry.get()));
        if (!m.directory && m.link_target.empty() && !m.content.empty()) {
            if (archive_write_data(a.get(), m.content.data(), m.content.size()) < 0) {
                check(a.get(), ARCHIVE_FATAL);
            }
        }
    }
    check(a.get(), archive_write_close(a.get()));
}

std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
}

std::string files_plist(const std::vector<std::string>& files,
                        const std::vector<std::string>& dirs,
                        const std::vector<std::string>& links) {
    std::string body = "<dict>\n";
    if (!dirs.empty()) body += file_array("dirs", dirs);
    if (!files.empty()) body += file_array("files", files);
    if (!links.empty()) body += file_array("links", links);
    body += "</dict>\n";
    return plist_document(body);
}

std::string index_plist(const std::vector<IndexEntry>& entries) {
    std::string body = "<dict>\n";
    for (const auto& e : entries) {
        body += "<key>" + xml_escape(e.name) + "</key>\n<dict>\n";
        body += "<key>architecture</key><string>" + e.architecture + "</string>\n";
        if (!e.sha256.empty()) {
            body += "<key>filename-sha256</key><string>" + e.sha256 + "</string>\n";
        }
        body += "<key>pkgver</key><string>" + xml_escape(e.pkgver) + "</string>\n";
        if (!e.short_desc.empty()) {
            body += "<key>short_desc</key><string>" + xml_escape(e.short_desc) + "</string>\n";
        }
        body += "</dict>\n";
    }
    body += "</dict>\n";
    return plist_document(body);
}

std::string binary_index_plist(const std::vector<IndexEntry>& entries) {
    BinaryPlistWriter w;
    std::vector<std::pair<std::size_t, std::size_t>> root;
    for (const auto& e : entries) {
        std::vector<std::pair<std::size_t, std::size_t>> fields;
        fields.emplace_back(w.add_string("architecture"), w.add_string(e.architecture));
        if (!e.sha256.empty()) {
            fields.emplace_back(w.add_string("filename-sha256"), w.add_string(e.sha256));
        }
        fields.emplace_back(w.add_string("pkgver"), w.add_string(e.pkgver));
        if (!e.short_desc.empty()) {
            fields.emplace_back(w.add_string("short_desc"), w.add_string(e.short_desc));
        }
        const std::size_t key = w.add_string(e.name);
        root.emplace_back(key, w.add_dict(fields));
    }
    return w.finish(w.add_dict(root));
}

void write_repodata(const fs::path& path, const std::vector<IndexEntry>& entries, bool binary) {
    write_tar(path, {
        {"index.plist", binary ? binary_index_plist(entries) : index_plist(entries)},
        {"index-meta.plist", plist_document("<dict/>\n")},
    }, CompressionFormat::ZSTD);
}

std::size_t BinaryPlistWriter::add(std::string encoded) {
    objects_.push_back(std::move(encoded));
    return objects_.size() - 1;
}

std::size_t BinaryPlistWriter::add_string(const std::string& s) {
    return add(bplist_marker(0x5, s.size()) + s);
}

std::size_t BinaryPlistWriter::add_utf16(const std::u16string& s) {
    std::string out = bplist_marker(0x6, s.size());
    for (char16_t c : s) {
        out += big_endian(c, 2);
    }
    return add(std::move(out));
}

std::size_t BinaryPlistWriter::add_integer(std::int64_t v) {
    return add("\x13" + big_endian(static_cast<std::uint64_t>(v), 8));
}

std::size_t BinaryPlistWriter::add_real(double v) {
    return add("\x23" + big_endian(std::bit_cast<std::uint64_t>(v), 8));
}

std::size_t BinaryPlistWriter::add_bool(bool v) {
    return add(std::string(1, v ? '\x09' : '\x08'));
}

std::size_t BinaryPlistWriter::add_date(double seconds) {
    return add("\x33" + big_endian(std::bit_cast<std::uint64_t>(seconds), 8));
}

std::size_t BinaryPlistWriter::add_data(const std::string& bytes) {
    return add(bplist_marker(0x4, bytes.size()) + bytes);
}

std::size_t BinaryPlistWriter::add_array(const std::vector<std::size_t>& refs) {
    std::string out = bplist_marker(0xA, refs.size());
    for (std::size_t ref : refs) {
        out += big_endian(ref, 2);
    }
    return add(std::move(out));
}

std::size_t BinaryPlistWriter::add_dict(const std::vector<std::pair<std::size_t, std::size_t>>& entries) {
    std::string out = bplist_marker(0xD, entries.size());
    for (const auto& entry : entries) {
        out += big_endian(entry.first, 2);
    }
    for (const auto& entry : entries) {
        out += big_endian(entry.second, 2);
    }
    return add(std::move(out));
}

std::string BinaryPlistWriter::finish(std::size_t top) const {
    std::string out = "bplist00";
    std::vector<std::size_t> offsets;
    for (const auto& object : objects_) {
        offsets.push_back(out.size());
        out += object;
    }
    const std::size_t offset_table = out.size();
    for (std::size_t offset : offsets) {
        out += big_endian(offset, 4);
    }
    out += std::string(6, '\0');
    out += static_cast<char>(4); // offset size
    out += static_cast<char>(2); // reference size
    out += big_endian(objects_.size(), 8);
    out += big_endian(top, 8);
    out += big_endian(offset_table, 8);
    return out;
}
