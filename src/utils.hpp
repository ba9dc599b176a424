#pragma once

#include "exception.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_CYAN = "\033[1;36m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Log functions. All output goes to stderr; stdout may carry the cache document.
void set_log_level(LogLevel level);
LogLevel get_log_level();
LogLevel parse_log_level(const std::string& value);
bool log_enabled(LogLevel level);

void log_debug(std::string_view msg);
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Measures the time spent in a scope, for "finished" log lines.
class ElapsedTimer {
public:
    ElapsedTimer() : start_(std::chrono::steady_clock::now()) {}
    std::string elapsed() const;
private:
    std::chrono::steady_clock::time_point start_;
};

// Filesystem utilities
// Creates path and any missing parents with the given permission bits (subject to umask).
void make_dirs(const fs::path& path, mode_t mode);

// True if path is relative and has no ".." component.
bool is_safe_relative_path(const fs::path& path);

// Joins a relative path onto root, throwing if it is absolute or escapes root.
fs::path validate_path(const fs::path& path, const fs::path& root);
