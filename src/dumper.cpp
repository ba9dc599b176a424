#include "dumper.hpp"
#include "archive.hpp"
#include "cache.hpp"
#include "concurrency.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "plist.hpp"
#include "repodata.hpp"
#include "utils.hpp"

#include <fstream>
#include <unordered_set>

namespace {

std::vector<std::string> manifest_paths(const PlistValue& dict, std::string_view key) {
    std::vector<std::string> paths;
    const PlistValue* list = dict.find(key);
    if (!list) return paths;
    for (const auto& item : list->as_array()) {
        paths.push_back(item.string_at("file"));
    }
    return paths;
}

std::string clean_path(const std::string& path) {
    return fs::path(path).lexically_normal().generic_string();
}

bool has_suffix(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // anonymous namespace

PackageManifest PackageManifest::from_plist(const PlistValue& dict) {
    PackageManifest manifest;
    manifest.files = manifest_paths(dict, "files");
    manifest.dirs = manifest_paths(dict, "dirs");
    manifest.links = manifest_paths(dict, "links");
    return manifest;
}

bool PackageManifest::has_man_dirs() const {
    for (const auto& dir : dirs) {
        if (clean_path(dir).starts_with(MAN_DIRS_PREFIX)) return true;
    }
    return false;
}

std::vector<std::string> PackageManifest::man_entries() const {
    std::vector<std::string> entries;
    for (const auto* list : {&files, &links}) {
        for (const auto& file : *list) {
            if (file.starts_with(MAN_DIRS_PREFIX)) {
                entries.push_back("." + file);
            }
        }
    }
    return entries;
}

bool is_skipped_package(const Package& pkg) {
    return has_suffix(pkg.name, "-dbg") || has_suffix(pkg.name, "-32bit");
}

Dumper::Dumper(const Settings& settings, WeightedSemaphore& sema, CacheLedger& ledger)
    : settings_(settings), sema_(sema), ledger_(ledger) {}

void Dumper::record(const ExtractionResult& result) {
    if (result.record) {
        ledger_.record(result.hash, result.files);
    }
}

void Dumper::process_all(const std::vector<fs::path>& repodata_files, const CancellationToken* parent) {
    TaskGroup group(parent);
    for (const auto& file : repodata_files) {
        group.spawn([this, file](const CancellationToken& token) {
            process_repodata(file, token);
        });
    }
    group.wait();
}

void Dumper::process_repodata(const fs::path& file, const CancellationToken& token) {
    log_info(string_format("info.processing_repodata", file.string()));
    ElapsedTimer timer;

    RepoData rd;
    try {
        if (!rd.load_repo(file, "", &token)) {
            log_warning(string_format("warning.file_not_found", file.string()));
            return;
        }
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        log_error(string_format("error.read_repodata_failed", file.string(), e.what()));
        throw;
    }
    log_info(string_format("info.finished_repodata", file.string(), rd.size(), timer.elapsed()));

    // Skipped packages keep whatever an earlier run recorded for them.
    for (const auto& pkg : filter_packages(rd.index(), is_skipped_package)) {
        log_debug(string_format("debug.skipped_package", pkg->pkgver));
        if (const auto* files = ledger_.prior_files(pkg->filename_sha256)) {
            ledger_.record(pkg->filename_sha256, *files);
        }
    }

    const Packages wanted = filter_packages(rd.index(), [](const Package& p) { return !is_skipped_package(p); });
    const fs::path dir = file.parent_path();

    TaskGroup group(&token);
    for (const auto& pkg : wanted) {
        // Noarch packages are listed by every architecture's repodata under the same hash.
        if (!ledger_.claim(pkg->filename_sha256)) {
            log_debug(string_format("debug.package_claimed", pkg->pkgver));
            continue;
        }

        try {
            sema_.acquire(PACKAGE_WEIGHT, group.token());
        } catch (const CancelledError&) {
            break;
        }

        const fs::path pkgfile = dir / pkg->archive_filename();
        try {
            group.spawn([this, pkg, pkgfile](const CancellationToken& task_token) {
                SemaphoreGuard guard(sema_, PACKAGE_WEIGHT);
                try {
                    record(process_package(*pkg, pkgfile, task_token));
                } catch (const CancelledError&) {
                    throw;
                } catch (const std::exception& e) {
                    log_error(string_format("error.package_failed", pkgfile.string(), e.what()));
                    throw;
                }
            });
        } catch (...) {
            sema_.release(PACKAGE_WEIGHT);
            throw;
        }
    }

    group.wait();
    token.throw_if_cancelled();
}

ExtractionResult Dumper::process_package(const Package& pkg, const fs::path& file, const CancellationToken& token) {
    ExtractionResult result;
    result.hash = pkg.filename_sha256;

    if (const auto* files = ledger_.prior_files(pkg.filename_sha256)) {
        log_debug(string_format("debug.package_cached", file.string()));
        result.files = *files;
        return result;
    }

    log_info(string_format("info.processing_file", file.string()));
    ElapsedTimer timer;

    auto handle = FileHandle::open_existing(file);
    if (!handle) {
        log_warning(string_format("warning.file_not_found", file.string()));
        result.record = false;
        return result;
    }

    const CompressionFormat format = sniff_compression(handle->peek(8));
    if (format == CompressionFormat::UNSUPPORTED) {
        throw UnsupportedFormatError(string_format("error.unsupported_compression", file.string()));
    }
    log_debug(string_format("debug.compression", file.string(), compression_name(format)));

    TarReader reader(std::move(*handle), format, &token);

    const auto manifest = read_manifest(reader);
    if (!manifest || manifest->empty() || !manifest->has_man_dirs()) {
        log_info(string_format("info.finished_file", file.string(), result.files.size(), timer.elapsed()));
        return result;
    }

    std::unordered_set<std::string> pending;
    for (auto& entry : manifest->man_entries()) {
        pending.insert(std::move(entry));
    }

    while (!pending.empty()) {
        const auto entry = reader.next();
        if (!entry) break;

        auto it = pending.find(entry->pathname);
        if (it == pending.end()) continue;

        try {
            if (auto written = extract_entry(*entry, reader)) {
                result.files.push_back(std::move(*written));
            }
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            log_error(string_format("error.extract_failed", entry->pathname, e.what()));
            throw;
        }
        pending.erase(it);
    }

    log_info(string_format("info.finished_file", file.string(), result.files.size(), timer.elapsed()));
    return result;
}

std::optional<PackageManifest> Dumper::read_manifest(TarReader& reader) {
    while (const auto entry = reader.next()) {
        if (entry->type != EntryType::REGULAR) continue;
        if (clean_path(entry->pathname) != MANIFEST_FILE) continue;

        return PackageManifest::from_plist(PlistValue::parse(reader.read_data()));
    }
    return std::nullopt;
}

std::optional<std::string> Dumper::extract_entry(const ArchiveEntry& entry, TarReader& reader) {
    if (entry.type != EntryType::REGULAR && entry.type != EntryType::SYMLINK) {
        return std::nullopt;
    }

    const std::string pkgfile = clean_path(entry.pathname);
    if (!pkgfile.starts_with(MAN_PATH_PREFIX)) {
        return std::nullopt;
    }

    const std::string relpath = pkgfile.substr(MAN_PATH_TRIM_PREFIX.size());
    const fs::path dest = validate_path(relpath, settings_.output_dir);
    make_dirs(dest.parent_path(), settings_.dir_mode);

    // Whatever is at dest is replaced, and never followed if it is a symlink.
    std::error_code ec;
    const auto status = fs::symlink_status(dest, ec);
    if (!ec && status.type() != fs::file_type::not_found &&
        (entry.type == EntryType::SYMLINK || status.type() == fs::file_type::symlink)) {
        if (!fs::remove(dest, ec) && ec) {
            throw MandumpException(string_format("error.remove_existing_failed", dest.string(), ec.message()));
        }
    }

    if (entry.type == EntryType::SYMLINK) {
        log_debug(string_format("debug.found_symlink", entry.pathname, entry.link_target));
        fs::create_symlink(entry.link_target, dest, ec);
        if (ec) {
            throw MandumpException(string_format("error.create_symlink_failed", dest.string(), ec.message()));
        }
    } else {
        log_debug(string_format("debug.found_manpage", entry.pathname));
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw MandumpException(string_format("error.create_file_failed", dest.string()));
        }
        reader.copy_data(out);
        out.close();
        if (!out) {
            throw MandumpException(string_format("error.write_failed", dest.string()));
        }
    }

    return relpath;
}

void run_dump(const Settings& settings, std::ostream& cache_out) {
    CacheMap prior;
    if (!settings.cache_file.empty()) {
        prior = load_cache(settings.cache_file).cache;
    }

    WeightedSemaphore sema(settings.open_limit);
    CacheLedger ledger(std::move(prior));
    Dumper dumper(settings, sema, ledger);

    dumper.process_all(settings.repodata_files);

    if (!settings.remove_old_files) {
        ledger.carry_forward();
    }

    const std::size_t removed = ledger.remove_stale_files(settings.output_dir);
    if (removed > 0) {
        log_info(string_format("info.removed_stale", removed));
    }

    save_cache(settings.cache_file, ledger.pending(), cache_out);
}
