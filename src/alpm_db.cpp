#include "alpm_db.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <sstream>

namespace {

void store_field(FieldMap& fields, const std::string& key, std::vector<std::string> values) {
    if (key.empty() || values.empty()) return;
    if (values.size() == 1) {
        fields[key] = std::move(values.front());
    } else {
        fields[key] = std::move(values);
    }
}

std::string entry_dir(const std::string& path) {
    const auto slash = path.find('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

}

FieldMap parse_desc(std::string_view text) {
    FieldMap fields;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string key;
    std::vector<std::string> values;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.size() > 2 && line.front() == '%' && line.back() == '%') {
            store_field(fields, key, std::move(values));
            key = to_lower(std::string_view(line).substr(1, line.size() - 2));
            values.clear();
        } else if (line.empty()) {
            store_field(fields, key, std::move(values));
            key.clear();
            values.clear();
        } else if (!key.empty()) {
            values.push_back(line);
        }
    }
    store_field(fields, key, std::move(values));
    return fields;
}

std::optional<std::pair<std::string, Version>> split_entry_name(std::string_view dirname) {
    const auto rel_dash = dirname.rfind('-');
    if (rel_dash == std::string_view::npos || rel_dash == 0) return std::nullopt;
    const auto ver_dash = dirname.rfind('-', rel_dash - 1);
    if (ver_dash == std::string_view::npos || ver_dash == 0) return std::nullopt;
    try {
        return std::make_pair(std::string(dirname.substr(0, ver_dash)), Version::parse(dirname.substr(ver_dash + 1)));
    } catch (const FormatError&) {
        return std::nullopt;
    }
}

std::vector<LocalEntry> list_local_entries(const fs::path& db_path) {
    std::vector<LocalEntry> entries;
    const auto local = db_path / "local";
    if (!fs::is_directory(local)) return entries;
    for (const auto& dir : fs::directory_iterator(local)) {
        if (!dir.is_directory()) continue;
        if (auto parsed = split_entry_name(dir.path().filename().string())) {
            entries.push_back({std::move(parsed->first), std::move(parsed->second), dir.path()});
        }
    }
    std::ranges::sort(entries, {}, &LocalEntry::name);
    return entries;
}

std::optional<LocalEntry> find_local_entry(const fs::path& db_path, std::string_view name) {
    for (auto& entry : list_local_entries(db_path)) {
        if (entry.name == name) return entry;
    }
    return std::nullopt;
}

std::optional<Version> installed_version(const fs::path& db_path, std::string_view name) {
    if (auto entry = find_local_entry(db_path, name)) return entry->version;
    return std::nullopt;
}

std::optional<PackageMetadata> read_local_metadata(const fs::path& db_path, std::string_view name) {
    auto entry = find_local_entry(db_path, name);
    if (!entry || !fs::is_regular_file(entry->dir / "desc")) return std::nullopt;
    return PackageMetadata::from_fields(parse_desc(read_file(entry->dir / "desc")));
}

SyncDbReader::SyncDbReader(const fs::path& db_file) : reader_(db_file) {}

std::optional<FieldMap> SyncDbReader::next() {
    if (!pending_) pending_ = reader_.next();
    if (!pending_) return std::nullopt;

    const auto dir = entry_dir(pending_->path);
    FieldMap fields;
    while (pending_ && entry_dir(pending_->path) == dir) {
        for (auto& [key, value] : parse_desc(pending_->content)) {
            fields.insert_or_assign(key, std::move(value));
        }
        pending_ = reader_.next();
    }
    return fields;
}

std::vector<std::string> enabled_repositories(const fs::path& pacman_conf) {
    std::vector<std::string> repos;
    for (auto& name : ConfigStore::parse(read_file(pacman_conf)).section_names()) {
        if (name != "options") repos.push_back(std::move(name));
    }
    return repos;
}
