#pragma once

#include "package.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class CancellationToken;
class TarReader;

inline constexpr std::string_view REPO_INDEX_FILE = "index.plist";
inline constexpr std::string_view DEFAULT_REPOSITORY = "current";

// The package index of an XBPS repository. Reading more than one repodata into the same
// object merges them: packages are added or replaced by name, never removed.
class RepoData {
public:
    RepoData() = default;

    // Loads the zstd-compressed repodata archive at path and merges its index. Packages are
    // labelled with repo, or DEFAULT_REPOSITORY if it is empty. Returns false if the file
    // does not exist.
    bool load_repo(const std::filesystem::path& path, const std::string& repo = "",
                   const CancellationToken* token = nullptr);

    // Same as load_repo for an in-memory repodata archive.
    void read_repo(std::string_view data, const std::string& repo = "");

    // Merges an index property list. The receiver is left unchanged if any package in the
    // index cannot be decoded.
    void read_repo_index(std::string_view plist, const std::string& repo = "");

    // All packages, sorted by name. Callers must not hold on to the reference across merges.
    const Packages& index() const { return index_; }
    const std::vector<std::string>& name_index() const { return names_; }
    std::size_t size() const { return index_.size(); }

    // Returns nullptr if no package has this name.
    std::shared_ptr<const Package> package(const std::string& name) const;

    // Fingerprint of the whole index, changes whenever any package changes.
    const std::string& etag() const { return etag_; }

private:
    void read_archive(TarReader& reader, const std::string& repo);
    std::string compute_etag() const;

    std::unordered_map<std::string, std::shared_ptr<Package>> root_;
    std::vector<std::shared_ptr<Package>> entries_;
    Packages index_;
    std::vector<std::string> names_;
    std::string etag_;
};
