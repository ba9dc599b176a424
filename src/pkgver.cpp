#include "pkgver.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <charconv>

namespace {

[[noreturn]] void fail(std::string_view s, const std::string& reason_key) {
    std::string reason = get_string(reason_key);
    throw PkgVerError(std::string(s), reason, string_format("error.pkgver_parse", std::string(s), reason));
}

} // anonymous namespace

PkgVer parse_pkgver(std::string_view s) {
    // Extract and validate revision
    const auto rev_sep = s.rfind('_');
    if (rev_sep == std::string_view::npos || rev_sep == s.size() - 1) {
        fail(s, "pkgver.no_revision");
    }

    const std::string_view rev_str = s.substr(rev_sep + 1);
    int revision = 0;
    auto [ptr, ec] = std::from_chars(rev_str.data(), rev_str.data() + rev_str.size(), revision);
    if (ec != std::errc() || ptr != rev_str.data() + rev_str.size() || revision <= 0) {
        fail(s, "pkgver.bad_revision");
    }

    // Extract and validate version
    const std::string_view head = s.substr(0, rev_sep);
    const auto version_sep = head.rfind('-');
    if (version_sep == std::string_view::npos) {
        fail(s, "pkgver.no_version");
    }

    const std::string_view version = head.substr(version_sep + 1);
    if (version.empty()) {
        fail(s, "pkgver.no_version");
    }
    if (version.find_first_of(":-") != std::string_view::npos) {
        fail(s, "pkgver.malformed_version");
    }

    const std::string_view name = head.substr(0, version_sep);
    if (name.empty()) {
        fail(s, "pkgver.no_name");
    }

    return PkgVer{std::string(name), std::string(version), revision};
}

std::string PkgVer::str() const {
    return name + "-" + version + "_" + std::to_string(revision);
}
