#include "cache.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <ranges>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr const char* CACHE_KEY = "cache-v1";

} // anonymous namespace

CacheRecords parse_cache(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(string_format("error.cache_parse_failed", e.what()));
    }

    if (!doc.is_object()) {
        throw ConfigError(get_string("error.cache_not_object"));
    }

    CacheRecords records;
    try {
        if (auto it = doc.find("version"); it != doc.end() && !it->is_null()) {
            records.version = it->get<int>();
        }
        if (auto it = doc.find(CACHE_KEY); it != doc.end() && !it->is_null()) {
            records.cache = it->get<CacheMap>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(string_format("error.cache_parse_failed", e.what()));
    }

    switch (records.version) {
        case 0:
        case CACHE_VERSION:
            break;
        default:
            log_debug(string_format("debug.cache_version_passthrough", records.version));
            break;
    }
    return records;
}

CacheRecords load_cache(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            log_warning(string_format("warning.cache_not_found", path.string()));
            return {};
        }
        throw ConfigError(string_format("error.open_file_failed", path.string()));
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    try {
        return parse_cache(text);
    } catch (const ConfigError& e) {
        throw ConfigError(string_format("error.invalid_cache_file", path.string(), e.what()));
    }
}

std::string encode_cache(const CacheMap& cache) {
    nlohmann::json doc;
    doc["version"] = CACHE_VERSION;
    doc[CACHE_KEY] = cache;
    return doc.dump();
}

void save_cache(const fs::path& path, const CacheMap& cache, std::ostream& out) {
    const std::string data = encode_cache(cache);
    if (path.empty()) {
        out << data;
        out.flush();
        return;
    }

    fs::path tmp_path = path.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw MandumpException(string_format("error.create_file_failed", tmp_path.string()));
        }
        file << data;
        if (!file.flush()) {
            throw MandumpException(string_format("error.write_failed", tmp_path.string()));
        }
    }
    std::error_code ec;
    fs::permissions(tmp_path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (!ec) fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw MandumpException(string_format("error.write_failed", path.string()) + ": " + ec.message());
    }
}

CacheLedger::CacheLedger(CacheMap prior) : prior_(std::move(prior)) {}

const std::vector<std::string>* CacheLedger::prior_files(const std::string& hash) const {
    auto it = prior_.find(hash);
    return it != prior_.end() ? &it->second : nullptr;
}

bool CacheLedger::claim(const std::string& hash) {
    std::lock_guard<std::mutex> lock(mtx);
    return claimed_.insert(hash).second;
}

void CacheLedger::record(const std::string& hash, const std::vector<std::string>& paths) {
    std::lock_guard<std::mutex> lock(mtx);
    auto& files = pending_[hash];
    for (const auto& path : paths) {
        if (std::find(files.begin(), files.end(), path) == files.end()) {
            files.push_back(path);
        }
    }
}

void CacheLedger::carry_forward() {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& [hash, files] : prior_) {
        pending_.try_emplace(hash, files);
    }
}

std::vector<std::string> CacheLedger::stale_files() const {
    std::set<std::string> refs;
    for (const auto& files : prior_ | std::views::values) {
        refs.insert(files.begin(), files.end());
    }

    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& files : pending_ | std::views::values) {
        for (const auto& file : files) {
            refs.erase(file);
        }
    }
    return {refs.begin(), refs.end()};
}

std::size_t CacheLedger::remove_stale_files(const fs::path& output_dir) const {
    std::size_t removed = 0;
    for (const auto& file : stale_files()) {
        const fs::path rel(file);
        if (!is_safe_relative_path(rel)) {
            // Guards against a hand-edited cache pointing outside the output tree.
            log_debug(string_format("debug.skip_unsafe_removal", file));
            continue;
        }

        log_debug(string_format("debug.removing_file", file));
        std::error_code ec;
        if (fs::remove(output_dir / rel, ec)) {
            ++removed;
        } else if (ec && ec != std::errc::no_such_file_or_directory) {
            log_error(string_format("error.remove_failed", file, ec.message()));
        }
    }
    return removed;
}

CacheMap CacheLedger::pending() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending_;
}
