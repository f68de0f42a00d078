#pragma once

#include "dependency.hpp"
#include "version.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Raw metadata as produced by a source: every key maps to a scalar or a list.
using FieldValue = std::variant<std::string, std::vector<std::string>>;
using FieldMap = std::map<std::string, FieldValue, std::less<>>;

std::string field_to_string(const FieldValue& value);

// Normalized attributes of one package.
//
// Metadata is built from a FieldMap; field-name aliases ("desc", "pkgsite",
// ...) are rewritten to their canonical field once, during construction.
struct PackageMetadata {
    std::string name;
    std::string pkgver;
    std::string pkgrel;
    std::string epoch;
    std::optional<Version> version;

    std::string description;
    std::string url;
    std::string repo;
    std::string category;
    std::string arch;
    std::string base;
    std::string maintainer;
    std::string packager;
    std::string urlpath;
    std::string size;
    std::string isize;
    std::string votes;
    std::string popularity;
    std::string outofdate;
    std::string builddate;
    std::string installdate;
    std::string lastupdate;
    std::string submitted;
    std::string reason;
    std::string filename;

    std::vector<std::string> groups;
    std::vector<std::string> license;
    std::vector<std::string> provides;
    std::vector<std::string> conflicts;
    std::vector<std::string> replaces;
    std::vector<std::string> backup;
    std::vector<std::string> required_by;
    std::vector<std::string> optdepends;
    std::vector<std::string> checkdepends;
    std::vector<std::string> source;
    std::vector<std::string> noextract;
    std::vector<std::string> options;
    std::vector<std::string> keywords;
    std::vector<std::string> md5sums;
    std::vector<std::string> sha1sums;
    std::vector<std::string> sha256sums;
    std::vector<std::string> sha384sums;
    std::vector<std::string> sha512sums;
    std::vector<std::string> b2sums;

    std::vector<Dependency> depends;
    std::vector<Dependency> makedepends;

    // Keys that are not package attributes, kept verbatim.
    FieldMap extra;

    // Builds metadata from `fields`. Unless `lazy`, `name`, `pkgver` and
    // `pkgrel` must be present or derivable from `version`; a lazy record only
    // needs a name. With `strict`, unknown keys are rejected. Throws
    // MetadataError, or FormatError for malformed versions and dependencies.
    static PackageMetadata from_fields(const FieldMap& fields, bool lazy = false, bool strict = false);

    // Alias-aware lookup. Every known attribute yields a value (possibly
    // empty); unknown keys are looked up in `extra`.
    std::optional<FieldValue> get(std::string_view key) const;
    // Alias-aware assignment; unknown keys go to `extra`.
    void set(std::string_view key, const FieldValue& value);

    // The first non-empty checksum list among sha1, sha256, sha384, sha512
    // and md5 sums.
    const std::vector<std::string>& checksums() const;

    static std::string_view canonical_key(std::string_view key);
    static bool is_known_key(std::string_view key);

private:
    void finalize(bool lazy);
};

// A package from some source. A lazy package only carries identifying
// metadata (from a fast listing) pending a full fetch.
class Package {
public:
    explicit Package(PackageMetadata metadata, bool lazy = false);

    static Package from_fields(const FieldMap& fields, bool lazy = false);

    bool lazy() const { return lazy_; }
    const PackageMetadata& metadata() const { return metadata_; }
    PackageMetadata& metadata() { return metadata_; }

    const std::string& name() const { return metadata_.name; }
    const std::optional<Version>& version() const { return metadata_.version; }
    // Dependencies required at run time and at build time.
    std::vector<Dependency> all_depends() const;

    bool installed() const { return installed_version_.has_value(); }
    const std::optional<Version>& installed_version() const { return installed_version_; }
    void set_installed_version(std::optional<Version> version) { installed_version_ = std::move(version); }

    // Package-level attributes first, then the metadata.
    std::optional<FieldValue> get(std::string_view key) const;

    // "name version" or just "name" for a lazy package.
    std::string to_string() const;

    // Packages are the same logical package when their names match.
    bool operator==(const Package& other) const { return name() == other.name(); }

private:
    PackageMetadata metadata_;
    bool lazy_;
    std::optional<Version> installed_version_;
};
