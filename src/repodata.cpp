#include "repodata.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "pkgver.hpp"
#include "plist.hpp"

#include <algorithm>

namespace fs = std::filesystem;

bool RepoData::load_repo(const fs::path& path, const std::string& repo, const CancellationToken* token) {
    auto file = FileHandle::open_existing(path);
    if (!file) {
        return false;
    }

    TarReader reader(std::move(*file), CompressionFormat::ZSTD, token);
    read_archive(reader, repo);
    return true;
}

void RepoData::read_repo(std::string_view data, const std::string& repo) {
    TarReader reader(data, CompressionFormat::ZSTD);
    read_archive(reader, repo);
}

void RepoData::read_archive(TarReader& reader, const std::string& repo) {
    while (auto entry = reader.next()) {
        if (entry->pathname == REPO_INDEX_FILE) {
            read_repo_index(reader.read_data(), repo);
            return;
        }
    }
    throw NoIndexError(string_format("error.no_index", std::string(REPO_INDEX_FILE)));
}

void RepoData::read_repo_index(std::string_view plist, const std::string& repo) {
    const PlistValue root = PlistValue::parse(plist);
    if (!root.is_dict()) {
        throw PlistError(get_string("error.index_not_dict"));
    }

    const std::string label = repo.empty() ? std::string(DEFAULT_REPOSITORY) : repo;

    // Decode everything first so a bad entry cannot leave a partial merge behind.
    std::vector<std::shared_ptr<Package>> decoded;
    decoded.reserve(root.entries().size());
    for (const auto& [name, value] : root.entries()) {
        auto p = std::make_shared<Package>(Package::from_plist(value));
        const PkgVer pv = parse_pkgver(p->pkgver);
        p->name = name;
        p->version = pv.version;
        p->revision = pv.revision;
        p->repository = label;
        p->etag = p->compute_etag();
        decoded.push_back(std::move(p));
    }

    for (auto& p : decoded) {
        auto it = root_.find(p->name);
        if (it != root_.end()) {
            p->index = it->second->index;
            entries_[p->index] = p;
            it->second = p;
        } else {
            p->index = entries_.size();
            entries_.push_back(p);
            root_.emplace(p->name, p);
        }
    }

    std::stable_sort(entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
        return a->name < b->name;
    });

    index_.clear();
    names_.clear();
    index_.reserve(entries_.size());
    names_.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        entries_[i]->index = i;
        index_.push_back(entries_[i]);
        names_.push_back(entries_[i]->name);
    }

    etag_ = compute_etag();
}

std::shared_ptr<const Package> RepoData::package(const std::string& name) const {
    auto it = root_.find(name);
    return it != root_.end() ? it->second : nullptr;
}

std::string RepoData::compute_etag() const {
    Sha1Hasher h;
    h.update_int64_le(static_cast<std::int64_t>(entries_.size()));
    for (const auto& p : entries_) {
        h.update_int64_le(static_cast<std::int64_t>(p->pkgver.size() + p->etag.size()));
        h.update(p->pkgver);
        h.update(p->etag);
    }
    return make_etag(h.finish());
}
