#pragma once

#include <compare>
#include <string>
#include <string_view>

// A package version of the form [epoch:]version[-release].
//
// The version part is compared loosely, component by component: runs of digits
// compare numerically, runs of letters compare lexically, anything else only
// separates components. This approximates pacman's vercmp; it is not a
// reimplementation of it.
class Version {
public:
    Version(unsigned long epoch, std::string version, unsigned long release = 1);

    // Throws FormatError unless `str` is exactly [epoch:]version[-release].
    // A release of "o" is read as 0, as some published packages use it.
    static Version parse(std::string_view str);

    unsigned long epoch() const { return epoch_; }
    const std::string& version() const { return version_; }
    unsigned long release() const { return release_; }

    // Canonical form, always "epoch:version-release".
    std::string to_string() const;
    // "version-release", prefixed with "epoch:" only when the epoch is set.
    std::string display() const;

    int compare(const Version& other) const;

    // Equivalent versions may be spelled differently ("1.0" and "1.00").
    std::weak_ordering operator<=>(const Version& other) const { return compare(other) <=> 0; }
    bool operator==(const Version& other) const { return compare(other) == 0; }

private:
    unsigned long epoch_;
    std::string version_;
    unsigned long release_;
};

int compare_loose(std::string_view a, std::string_view b);

// True if v1 sorts strictly before v2. Both are parsed with Version::parse.
bool version_compare(const std::string& v1_str, const std::string& v2_str);
bool version_satisfies(const std::string& current_version, const std::string& op, const std::string& required_version);
