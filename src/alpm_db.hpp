#pragma once

#include "archive.hpp"
#include "package.hpp"
#include "version.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Parses a pacman database file ("desc", "depends", ...): a %KEY% header line
// followed by one value per line up to a blank line. Keys are lower-cased;
// a key with several values maps to a list.
FieldMap parse_desc(std::string_view text);

// Splits a database directory name "name-pkgver-pkgrel" into its name and
// version. std::nullopt if it does not have that shape.
std::optional<std::pair<std::string, Version>> split_entry_name(std::string_view dirname);

struct LocalEntry {
    std::string name;
    Version version;
    std::filesystem::path dir;
};

// Installed packages recorded under <db_path>/local, sorted by name.
std::vector<LocalEntry> list_local_entries(const std::filesystem::path& db_path);
std::optional<LocalEntry> find_local_entry(const std::filesystem::path& db_path, std::string_view name);
std::optional<Version> installed_version(const std::filesystem::path& db_path, std::string_view name);

// Full metadata of an installed package from its desc file.
std::optional<PackageMetadata> read_local_metadata(const std::filesystem::path& db_path, std::string_view name);

// Reads the package records of a sync database tarball one at a time,
// merging the files of each package directory.
class SyncDbReader {
public:
    explicit SyncDbReader(const std::filesystem::path& db_file);

    std::optional<FieldMap> next();

private:
    ArchiveReader reader_;
    std::optional<ArchiveEntry> pending_;
};

// Repositories enabled in pacman.conf, in file order.
std::vector<std::string> enabled_repositories(const std::filesystem::path& pacman_conf);
