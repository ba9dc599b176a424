#pragma once

#include <stdexcept>
#include <string>

class MandumpException : public std::runtime_error {
public:
    explicit MandumpException(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid command line values or an unreadable cache file. Raised before any work starts.
class ConfigError : public MandumpException {
public:
    using MandumpException::MandumpException;
};

// Thrown by blocking operations once the run has been cancelled by a sibling failure.
class CancelledError : public MandumpException {
public:
    using MandumpException::MandumpException;
};

class PlistError : public MandumpException {
public:
    using MandumpException::MandumpException;
};

class NoIndexError : public MandumpException {
public:
    using MandumpException::MandumpException;
};

class UnsupportedFormatError : public MandumpException {
public:
    using MandumpException::MandumpException;
};

class PkgVerError : public MandumpException {
public:
    PkgVerError(std::string pkgver, std::string reason, const std::string& message)
        : MandumpException(message), pkgver_(std::move(pkgver)), reason_(std::move(reason)) {}

    const std::string& pkgver() const { return pkgver_; }
    const std::string& reason() const { return reason_; }

private:
    std::string pkgver_;
    std::string reason_;
};
