#pragma once

#include "config.hpp"
#include "package.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

struct ArchiveEntry;
class CacheLedger;
class CancellationToken;
class PlistValue;
class TarReader;
class WeightedSemaphore;

inline constexpr std::string_view MAN_PATH_PREFIX = "usr/share/man/man";
inline constexpr std::string_view MAN_PATH_TRIM_PREFIX = "usr/share/man/";
inline constexpr std::string_view MAN_DIRS_PREFIX = "/usr/share/man/man";
inline constexpr std::string_view MANIFEST_FILE = "files.plist";

// Semaphore units held by a package worker: the package archive and one output file.
inline constexpr std::int64_t PACKAGE_WEIGHT = 2;

// Files produced (or reused from the cache) for one package.
struct ExtractionResult {
    std::string hash;
    std::vector<std::string> files;
    // False when nothing should be recorded, e.g. the archive does not exist.
    bool record = true;
};

// The parts of a package's files.plist used to find manual pages.
struct PackageManifest {
    std::vector<std::string> files;
    std::vector<std::string> dirs;
    std::vector<std::string> links;

    static PackageManifest from_plist(const PlistValue& dict);

    // A manifest without directories cannot contain manual pages.
    bool empty() const { return dirs.empty(); }
    bool has_man_dirs() const;
    // Archive entry names ("./usr/share/man/...") of manual pages and their links.
    std::vector<std::string> man_entries() const;
};

// Debug and 32-bit compatibility packages never carry pages worth extracting.
bool is_skipped_package(const Package& pkg);

// Extracts manual pages from the package archives of XBPS repositories into the output
// directory, recording the extracted files in a CacheLedger.
class Dumper {
public:
    Dumper(const Settings& settings, WeightedSemaphore& sema, CacheLedger& ledger);

    Dumper(const Dumper&) = delete;
    Dumper& operator=(const Dumper&) = delete;

    // Processes every repodata file concurrently. The first failure cancels the rest and
    // is rethrown.
    void process_all(const std::vector<std::filesystem::path>& repodata_files,
                     const CancellationToken* parent = nullptr);

    // Reads one repodata file and processes each of its packages on its own task. A missing
    // repodata file is logged and ignored.
    void process_repodata(const std::filesystem::path& file, const CancellationToken& token);

    // Extracts the manual pages of one package archive.
    ExtractionResult process_package(const Package& pkg, const std::filesystem::path& file,
                                     const CancellationToken& token);

    void record(const ExtractionResult& result);

private:
    std::optional<PackageManifest> read_manifest(TarReader& reader);
    std::optional<std::string> extract_entry(const ArchiveEntry& entry, TarReader& reader);

    const Settings& settings_;
    WeightedSemaphore& sema_;
    CacheLedger& ledger_;
};

// Runs a complete dump: loads the cache, processes all repodata files, removes stale
// files and saves the cache (to cache_out when no cache file is configured).
void run_dump(const Settings& settings, std::ostream& cache_out);
