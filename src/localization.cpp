#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    // Workers format messages concurrently; only the placeholder table is written after startup.
    std::mutex missing_mutex;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count != -1) {
            return fs::path(std::string(result, count)).parent_path();
        }
        return fs::current_path();
    }
}

void load_strings(const std::string& lang, const fs::path& base_dir) {
    auto file_path = base_dir / (lang + ".txt");
    std::ifstream file(file_path);
    if (!file.is_open()) {
        if (lang != "en") { // Avoid infinite recursion
            load_strings("en", base_dir);
        }
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        if (line.back() == '\r') line.pop_back();
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            translations[line.substr(0, pos)] = line.substr(pos + 1);
        }
    }
}

void init_localization() {
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).find("zh") == 0) {
        lang = "zh";
    }

    fs::path l10n_dir = get_executable_dir() / ".." / "l10n";
    if (!fs::is_directory(l10n_dir)) {
        l10n_dir = MANDUMP_L10N_DIR; // Installed location
    }
    // English first, so keys missing from a translation still read well.
    load_strings("en", l10n_dir);
    if (lang != "en") {
        load_strings(lang, l10n_dir);
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
