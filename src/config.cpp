#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/resource.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <limits>

namespace fs = std::filesystem;

std::int64_t get_file_limit() {
    struct rlimit rlim;
    if (getrlimit(RLIMIT_NOFILE, &rlim) != 0) {
        throw MandumpException(string_format("error.rlimit_failed", strerror(errno)));
    }
    if (rlim.rlim_cur == RLIM_INFINITY ||
        rlim.rlim_cur > static_cast<rlim_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return static_cast<std::int64_t>(rlim.rlim_cur);
}

std::string default_dir_mode_string(const fs::path& dir) {
    struct stat st;
    if (::stat(dir.c_str(), &st) != 0) {
        return "755";
    }
    return std::format("{:03o}", static_cast<unsigned>(st.st_mode & 0777));
}

mode_t parse_dir_mode(const std::string& text) {
    if (text.empty()) {
        throw ConfigError(string_format("error.invalid_mode", text));
    }

    unsigned long value = 0;
    for (char c : text) {
        if (c < '0' || c > '7') {
            throw ConfigError(string_format("error.invalid_mode", text));
        }
        value = value * 8 + static_cast<unsigned long>(c - '0');
        if (value > 07777) {
            throw ConfigError(string_format("error.invalid_mode", text));
        }
    }
    if (value == 0) {
        throw ConfigError(get_string("error.mode_zero"));
    }
    return static_cast<mode_t>(value);
}

std::int64_t default_open_limit(std::int64_t max_limit) {
    return max_limit < DEFAULT_OPEN_LIMIT ? max_limit : DEFAULT_OPEN_LIMIT;
}

void validate_open_limit(std::int64_t limit, std::int64_t max_limit) {
    if (limit < MIN_OPEN_LIMIT) {
        throw ConfigError(string_format("error.limit_too_small", limit, MIN_OPEN_LIMIT));
    }
    if (limit > max_limit) {
        throw ConfigError(string_format("error.limit_too_large", limit, max_limit));
    }
}
