#pragma once

#include <string>
#include <string_view>

// Name, version and revision of a package, as in "<name>-<version>_<revision>".
struct PkgVer {
    std::string name;
    std::string version;
    int revision = 0;

    std::string str() const;
};

// Parses a pkgver string. The revision must be an integer >= 1 and the version may not
// contain '-' or ':'. Throws PkgVerError on malformed input.
PkgVer parse_pkgver(std::string_view s);
