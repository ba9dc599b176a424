#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>

inline constexpr int CACHE_VERSION = 1;

// Package content hash -> files extracted from it, relative to the output directory.
using CacheMap = std::map<std::string, std::vector<std::string>>;

struct CacheRecords {
    int version = 0;
    CacheMap cache;
};

// Loads a cache file. A missing file yields an empty cache; a corrupt one throws ConfigError.
// Versions newer than CACHE_VERSION are read as-is.
CacheRecords load_cache(const std::filesystem::path& path);
CacheRecords parse_cache(const std::string& text);

std::string encode_cache(const CacheMap& cache);
// Writes {version, cache} to path with mode 0600, or to out when path is empty.
void save_cache(const std::filesystem::path& path, const CacheMap& cache, std::ostream& out);

// Tracks which output files belong to which package across runs. The prior cache is
// read-only; the pending cache is filled concurrently by package workers.
class CacheLedger {
public:
    explicit CacheLedger(CacheMap prior);

    CacheLedger(const CacheLedger&) = delete;
    CacheLedger& operator=(const CacheLedger&) = delete;

    // Files recorded for hash by the previous run, or nullptr.
    const std::vector<std::string>* prior_files(const std::string& hash) const;

    // Marks hash as taken by a worker. Returns false if another worker already holds it,
    // so each package archive is examined at most once per run.
    bool claim(const std::string& hash);

    // Adds the paths not yet recorded for hash, keeping their first-seen order. An empty
    // call on a hash with nothing recorded stores an explicit empty list, marking the
    // package as processed.
    void record(const std::string& hash, const std::vector<std::string>& paths);

    // Copies prior entries for hashes not seen in this run into the pending cache.
    void carry_forward();

    // Files referenced by the prior cache and not by the pending cache, sorted.
    std::vector<std::string> stale_files() const;

    // Removes stale files below output_dir. Absolute paths and paths with ".." components are
    // skipped. Failures other than a missing file are logged. Returns the number removed.
    std::size_t remove_stale_files(const std::filesystem::path& output_dir) const;

    CacheMap pending() const;
    const CacheMap& prior() const { return prior_; }

private:
    const CacheMap prior_;
    CacheMap pending_;
    std::set<std::string> claimed_;
    mutable std::mutex mtx;
};
