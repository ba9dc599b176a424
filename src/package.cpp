#include "package.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "plist.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <regex>
#include <set>

namespace {

// "2020-05-01 12:34 UTC": date, time to the minute and a zone abbreviation.
const std::regex BUILD_DATE_PATTERN(R"(^(\d{4})-(\d{2})-(\d{2}) (\d{2}):(\d{2}) ([A-Za-z]+)$)");

// Converts the index build date to RFC 3339. The zone abbreviation is not resolved; times
// are taken as UTC.
std::string normalize_build_date(const std::string& text) {
    if (text.empty()) return text;

    std::smatch m;
    if (!std::regex_match(text, m, BUILD_DATE_PATTERN)) {
        throw MandumpException(string_format("error.bad_build_date", text));
    }

    const int year = std::stoi(m[1].str());
    const int month = std::stoi(m[2].str());
    const int day = std::stoi(m[3].str());
    const int hour = std::stoi(m[4].str());
    const int minute = std::stoi(m[5].str());
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw MandumpException(string_format("error.bad_build_date", text));
    }

    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:00Z", year, month, day, hour, minute);
}

void put_string(nlohmann::ordered_json& j, const char* key, const std::string& value) {
    if (!value.empty()) j[key] = value;
}

void put_list(nlohmann::ordered_json& j, const char* key, const std::vector<std::string>& value) {
    if (!value.empty()) j[key] = value;
}

void put_int(nlohmann::ordered_json& j, const char* key, std::int64_t value) {
    if (value != 0) j[key] = value;
}

Packages single_filter(const Packages& packages, const FilterFunc& filter) {
    Packages out;
    out.reserve(16);
    for (const auto& p : packages) {
        if (filter(*p)) out.push_back(p);
    }
    return out;
}

Packages split_filter(const Packages& packages, const FilterFunc& filter) {
    std::vector<std::future<std::set<std::size_t>>> subsets;
    for (std::size_t min = 0; min < packages.size(); min += SPLIT_SIZE) {
        const std::size_t max = std::min(min + SPLIT_SIZE, packages.size());
        subsets.push_back(std::async(std::launch::async, [&packages, &filter, min, max]() {
            std::set<std::size_t> matches;
            for (std::size_t i = min; i < max; ++i) {
                if (filter(*packages[i])) matches.insert(i);
            }
            return matches;
        }));
    }

    std::set<std::size_t> index;
    for (auto& subset : subsets) {
        index.merge(subset.get());
    }

    Packages out;
    out.reserve(index.size());
    for (std::size_t i : index) {
        out.push_back(packages[i]);
    }
    return out;
}

} // anonymous namespace

Package Package::from_plist(const PlistValue& dict) {
    Package p;
    p.pkgver = dict.string_at("pkgver");
    p.architecture = dict.string_at("architecture");
    p.build_date = normalize_build_date(dict.string_at("build-date"));
    p.build_options = dict.string_at("build-options");
    p.filename_sha256 = dict.string_at("filename-sha256");
    p.filename_size = dict.integer_at("filename-size");
    p.homepage = dict.string_at("homepage");
    p.installed_size = dict.integer_at("installed_size");
    p.license = dict.string_at("license");
    p.maintainer = dict.string_at("maintainer");
    p.short_desc = dict.string_at("short_desc");
    p.preserve = dict.bool_at("preserve");
    p.source_revisions = dict.string_at("source-revisions");
    p.run_depends = dict.string_list_at("run_depends");
    p.shlib_requires = dict.string_list_at("shlib-requires");
    p.shlib_provides = dict.string_list_at("shlib-provides");
    p.conflicts = dict.string_list_at("conflicts");
    p.reverts = dict.string_list_at("reverts");
    p.replaces = dict.string_list_at("replaces");
    p.conf_files = dict.string_list_at("conf_files");

    if (const PlistValue* alts = dict.find("alternatives")) {
        for (const auto& entry : alts->entries()) {
            std::vector<std::string>& targets = p.alternatives[entry.key];
            for (const auto& item : entry.value.as_array()) {
                targets.push_back(item.as_string());
            }
        }
    }
    return p;
}

nlohmann::ordered_json Package::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    put_string(j, "name", name);
    put_string(j, "version", version);
    put_int(j, "revision", revision);
    put_string(j, "repository", repository);
    put_string(j, "architecture", architecture);
    put_string(j, "build_date", build_date);
    put_string(j, "build_options", build_options);
    put_string(j, "filename_sha256", filename_sha256);
    put_int(j, "filename_size", filename_size);
    put_string(j, "homepage", homepage);
    put_int(j, "installed_size", installed_size);
    put_string(j, "license", license);
    put_string(j, "maintainer", maintainer);
    put_string(j, "short_desc", short_desc);
    if (preserve) j["preserve"] = true;
    put_string(j, "source_revisions", source_revisions);
    put_list(j, "run_depends", run_depends);
    put_list(j, "shlib_requires", shlib_requires);
    put_list(j, "shlib_provides", shlib_provides);
    put_list(j, "conflicts", conflicts);
    put_list(j, "reverts", reverts);
    put_list(j, "replaces", replaces);
    if (!alternatives.empty()) j["alternatives"] = alternatives;
    put_list(j, "conf_files", conf_files);
    return j;
}

std::string Package::compute_etag() const {
    const std::string metadata_hash = sha1_digest(to_json().dump() + "\n");
    return make_etag(hmac_sha1(pkgver, metadata_hash));
}

std::string Package::archive_filename() const {
    return pkgver + "." + architecture + ".xbps";
}

Packages filter_packages(const Packages& packages, const FilterFunc& filter) {
    if (packages.size() < MIN_SPLIT_FILTER) {
        return single_filter(packages, filter);
    }
    return split_filter(packages, filter);
}
