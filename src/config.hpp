#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

#ifndef BOREALIS_CONF_FILE
#define BOREALIS_CONF_FILE "/etc/borealis.conf"
#endif

inline const fs::path SYSTEM_CONFIG_FILE = BOREALIS_CONF_FILE;

// Ordered key/value defaults contributed by one consumer of the config.
using ConfigDefaults = std::vector<std::pair<std::string, std::string>>;

// One [section] of an INI file. Keys keep their file order.
class ConfigSection {
public:
    std::optional<std::string> get(std::string_view key) const;
    std::string get_or(std::string_view key, std::string_view fallback) const;
    // "true"/"yes"/"on"/"1" and their negations. Throws BorealisException on
    // anything else.
    bool get_bool(std::string_view key, bool fallback) const;
    int get_int(std::string_view key, int fallback) const;
    // Comma or whitespace separated values.
    std::vector<std::string> get_list(std::string_view key) const;

    bool contains(std::string_view key) const;
    void set(const std::string& key, const std::string& value);

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

// INI-style configuration merged from one or more files. `#` and `;` start
// comment lines; keys without '=' are stored with an empty value so that
// pacman.conf can be read with the same parser.
class ConfigStore {
public:
    static ConfigStore parse(std::string_view text);

    // Reads every existing file of `candidates`, later files overriding earlier
    // ones. Throws NoConfigFoundError if none of them exists.
    static ConfigStore load(const std::vector<fs::path>& candidates);

    // Adds each default whose key is missing. Returns true if anything was
    // added.
    bool add_defaults(const std::string& section, const ConfigDefaults& defaults);

    bool has_section(std::string_view name) const;
    // An empty section if `name` is absent.
    const ConfigSection& section(std::string_view name) const;
    // Creates the section if needed.
    ConfigSection& edit_section(const std::string& name);
    std::vector<std::string> section_names() const;

    const std::vector<fs::path>& sources() const { return sources_; }

    // Merges `other` on top of this store.
    void merge(const ConfigStore& other);

    std::string dump() const;
    void write(const fs::path& path) const;

private:
    std::vector<std::pair<std::string, ConfigSection>> sections_;
    std::vector<fs::path> sources_;
};

// System file, then the user's ~/.config/borealis/borealis.conf.
std::vector<fs::path> default_config_locations();

// Settings of the frontend itself, from the [borealis] section.
struct FrontendConfig {
    static constexpr std::string_view SECTION = "borealis";

    std::vector<std::string> backend_order;
    fs::path alpm_db_path;
    std::string output_fmt;
    // output_fmt_<action> overrides, keyed by lower-case action name.
    std::map<std::string, std::string> action_fmt;
    std::string output_fmt_installed;
    std::string output_fmt_installed_same;
    std::string output_fmt_installed_new;
    std::string output_fmt_installed_old;
    int output_desc_wrap = 80;
    int output_desc_indent = 10;

    static const ConfigDefaults& defaults();
    static FrontendConfig from_section(const ConfigSection& section);

    // The template for `action` ("query", "search", ...).
    const std::string& format_for(std::string_view action) const;
};
