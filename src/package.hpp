#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class PlistValue;

// An XBPS package as described by a repository index.
struct Package {
    std::string pkgver;
    std::string name;
    std::string version;
    int revision = 0;

    std::string repository;
    std::string architecture;
    std::string build_date; // RFC 3339, UTC
    std::string build_options;
    std::string filename_sha256;
    std::int64_t filename_size = 0;
    std::string homepage;
    std::int64_t installed_size = 0;
    std::string license;
    std::string maintainer;
    std::string short_desc;
    bool preserve = false;
    std::string source_revisions;

    std::vector<std::string> run_depends;
    std::vector<std::string> shlib_requires;
    std::vector<std::string> shlib_provides;
    std::vector<std::string> conflicts;
    std::vector<std::string> reverts;
    std::vector<std::string> replaces;
    std::map<std::string, std::vector<std::string>> alternatives;
    std::vector<std::string> conf_files;

    // Position in the sorted index and fingerprint; both maintained by RepoData.
    std::size_t index = 0;
    std::string etag;

    // Decodes the index dictionary of one package. Name, version and revision are left to
    // the caller.
    static Package from_plist(const PlistValue& dict);

    // Serialized metadata. Empty fields, pkgver, index and etag are omitted.
    nlohmann::ordered_json to_json() const;

    // Fingerprint of the record: HMAC-SHA1 keyed by pkgver over the SHA-1 of to_json().
    std::string compute_etag() const;

    // File name of the package archive inside its repository directory.
    std::string archive_filename() const;
};

using Packages = std::vector<std::shared_ptr<const Package>>;

// Returns true if a package matches. Filters must not modify the packages they see.
using FilterFunc = std::function<bool(const Package&)>;

inline constexpr std::size_t MIN_SPLIT_FILTER = 3000;
inline constexpr std::size_t SPLIT_SIZE = 2000;

// Returns the packages matching filter in their original order. Large inputs are split
// into chunks filtered concurrently.
Packages filter_packages(const Packages& packages, const FilterFunc& filter);
