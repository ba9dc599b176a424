#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

inline constexpr std::int64_t DEFAULT_OPEN_LIMIT = 20;
inline constexpr std::int64_t MIN_OPEN_LIMIT = 2;

// Run configuration handed to the dumper and the cache ledger.
struct Settings {
    std::filesystem::path output_dir = ".";
    mode_t dir_mode = 0755;
    std::int64_t open_limit = DEFAULT_OPEN_LIMIT;
    std::filesystem::path cache_file;
    // Drop files of packages that were not part of this run.
    bool remove_old_files = false;
    std::vector<std::filesystem::path> repodata_files;
};

// Soft RLIMIT_NOFILE of the process. Throws MandumpException if it cannot be queried.
std::int64_t get_file_limit();

// Permission bits of dir formatted as three or four octal digits, "755" if dir can't be read.
std::string default_dir_mode_string(const std::filesystem::path& dir);

// Parses an octal permission mode. Throws ConfigError if it is malformed or zero.
mode_t parse_dir_mode(const std::string& text);

// DEFAULT_OPEN_LIMIT, lowered to max_limit when the process may open fewer files.
std::int64_t default_open_limit(std::int64_t max_limit);

// Throws ConfigError unless MIN_OPEN_LIMIT <= limit <= max_limit.
void validate_open_limit(std::int64_t limit, std::int64_t max_limit);
