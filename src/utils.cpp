#include "utils.hpp"

#include "localization.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    std::atomic<LogLevel> current_level{LogLevel::WARN};
    std::mutex log_mutex;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        if (is_stderr_tty) {
            std::cerr << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            std::cerr << prefix << msg << std::endl;
        }
    }
}

void set_log_level(LogLevel level) {
    current_level = level;
}

LogLevel get_log_level() {
    return current_level;
}

LogLevel parse_log_level(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    throw ConfigError(string_format("error.invalid_log_level", value));
}

bool log_enabled(LogLevel level) {
    return level >= current_level.load();
}

void log_debug(std::string_view msg) {
    if (!log_enabled(LogLevel::DEBUG)) return;
    log_internal(get_string("debug.prefix") + " ", COLOR_CYAN, msg);
}

void log_info(std::string_view msg) {
    if (!log_enabled(LogLevel::INFO)) return;
    log_internal(get_string("info.log_prefix") + " ", COLOR_GREEN, msg);
}

void log_warning(std::string_view msg) {
    if (!log_enabled(LogLevel::WARN)) return;
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg);
}

std::string ElapsedTimer::elapsed() const {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
    if (us.count() < 1000) {
        return std::to_string(us.count()) + "us";
    }
    return std::format("{:.3f}ms", static_cast<double>(us.count()) / 1000.0);
}

void make_dirs(const fs::path& path, mode_t mode) {
    if (path.empty()) return;

    fs::path current;
    for (const auto& component : path) {
        current /= component;
        if (component == "/" || component == "." || component.empty()) continue;

        if (::mkdir(current.c_str(), mode) == 0) continue;

        int err = errno;
        if (err != EEXIST) {
            throw MandumpException(string_format("error.create_dir_failed", current.string()) + ": " + strerror(err));
        }
        struct stat st;
        if (::stat(current.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            throw MandumpException(string_format("error.path_not_dir", current.string()));
        }
    }
}

bool is_safe_relative_path(const fs::path& path) {
    if (path.empty() || path.is_absolute()) return false;
    for (const auto& component : path) {
        if (component == "..") return false;
    }
    return true;
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw MandumpException(string_format("error.path_not_relative", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw MandumpException(string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}
