#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

std::optional<std::string> ConfigSection::get(std::string_view key) const {
    for (const auto& [k, v] : entries_) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::string ConfigSection::get_or(std::string_view key, std::string_view fallback) const {
    if (auto value = get(key)) return *value;
    return std::string(fallback);
}

bool ConfigSection::get_bool(std::string_view key, bool fallback) const {
    auto value = get(key);
    if (!value) return fallback;
    const auto v = to_lower(*value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw BorealisException(string_format("error.config_invalid_bool", std::string(key), *value));
}

int ConfigSection::get_int(std::string_view key, int fallback) const {
    auto value = get(key);
    if (!value) return fallback;
    try {
        size_t pos = 0;
        int n = std::stoi(*value, &pos);
        if (pos != value->size()) throw std::invalid_argument(*value);
        return n;
    } catch (const std::logic_error&) {
        throw BorealisException(string_format("error.config_invalid_int", std::string(key), *value));
    }
}

std::vector<std::string> ConfigSection::get_list(std::string_view key) const {
    std::vector<std::string> out;
    auto value = get(key);
    if (!value) return out;
    for (auto& part : split(replace_all(*value, ",", " "), ' ')) {
        out.push_back(std::move(part));
    }
    return out;
}

bool ConfigSection::contains(std::string_view key) const {
    return get(key).has_value();
}

void ConfigSection::set(const std::string& key, const std::string& value) {
    for (auto& [k, v] : entries_) {
        if (k == key) {
            v = value;
            return;
        }
    }
    entries_.emplace_back(key, value);
}

ConfigStore ConfigStore::parse(std::string_view text) {
    ConfigStore store;
    std::string current;
    std::istringstream in{std::string(text)};
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        const auto line = trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        if (line.front() == '[') {
            if (line.back() != ']') {
                throw BorealisException(string_format("error.config_syntax", line_no, line));
            }
            current = trim(std::string_view(line).substr(1, line.size() - 2));
            store.edit_section(current);
            continue;
        }
        const auto eq = line.find('=');
        std::string key = trim(std::string_view(line).substr(0, eq));
        std::string value = eq == std::string::npos ? "" : trim(std::string_view(line).substr(eq + 1));
        if (key.empty()) {
            throw BorealisException(string_format("error.config_syntax", line_no, line));
        }
        store.edit_section(current).set(key, value);
    }
    return store;
}

ConfigStore ConfigStore::load(const std::vector<fs::path>& candidates) {
    ConfigStore store;
    for (const auto& path : candidates) {
        if (!fs::is_regular_file(path)) continue;
        store.merge(parse(read_file(path)));
        store.sources_.push_back(path);
    }
    if (store.sources_.empty()) {
        std::vector<std::string> names;
        for (const auto& path : candidates) names.push_back(path.string());
        throw NoConfigFoundError(string_format("error.no_config_found", join(names, ", ")));
    }
    return store;
}

bool ConfigStore::add_defaults(const std::string& name, const ConfigDefaults& defaults) {
    bool added = false;
    auto& target = edit_section(name);
    for (const auto& [key, value] : defaults) {
        if (!target.contains(key)) {
            target.set(key, value);
            added = true;
        }
    }
    return added;
}

bool ConfigStore::has_section(std::string_view name) const {
    return std::ranges::any_of(sections_, [&](const auto& s) { return s.first == name; });
}

const ConfigSection& ConfigStore::section(std::string_view name) const {
    static const ConfigSection empty;
    for (const auto& [n, s] : sections_) {
        if (n == name) return s;
    }
    return empty;
}

ConfigSection& ConfigStore::edit_section(const std::string& name) {
    for (auto& [n, s] : sections_) {
        if (n == name) return s;
    }
    return sections_.emplace_back(name, ConfigSection{}).second;
}

std::vector<std::string> ConfigStore::section_names() const {
    std::vector<std::string> names;
    for (const auto& [n, s] : sections_) {
        if (!n.empty()) names.push_back(n);
    }
    return names;
}

void ConfigStore::merge(const ConfigStore& other) {
    for (const auto& [name, sec] : other.sections_) {
        auto& target = edit_section(name);
        for (const auto& [key, value] : sec.entries()) {
            target.set(key, value);
        }
    }
}

std::string ConfigStore::dump() const {
    std::string out;
    for (const auto& [name, sec] : sections_) {
        if (name.empty() && sec.entries().empty()) continue;
        if (!out.empty()) out += "\n";
        if (!name.empty()) out += "[" + name + "]\n";
        for (const auto& [key, value] : sec.entries()) {
            out += value.empty() ? key + " =\n" : key + " = " + value + "\n";
        }
    }
    return out;
}

void ConfigStore::write(const fs::path& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw BorealisException(string_format("error.create_file_failed", path.string()));
    }
    out << dump();
    if (!out) {
        throw BorealisException(string_format("error.write_file_failed", path.string()));
    }
}

std::vector<fs::path> default_config_locations() {
    std::vector<fs::path> locations = {SYSTEM_CONFIG_FILE};
    if (const char* home = std::getenv("HOME")) {
        locations.push_back(fs::path(home) / ".config" / "borealis" / "borealis.conf");
    }
    return locations;
}

const ConfigDefaults& FrontendConfig::defaults() {
    static const ConfigDefaults values = {
        {"backend_order", "pacman, aur"},
        {"alpm_db_path", "/var/lib/pacman"},
        {"output_fmt", "{index:>4}› %M{repo}/%W{name} %G{version}\\n%N{description}"},
        {"output_fmt_query", "%W{name} %G{version}"},
        {"output_fmt_installed", "{fmt_lines[0]} {installed_diff}\\n{fmt_lines[1]}"},
        {"output_fmt_installed_same", ""},
        {"output_fmt_installed_new", "%G↑"},
        {"output_fmt_installed_old", "%R↓"},
        {"output_desc_wrap", "80"},
        {"output_desc_indent", "10"},
    };
    return values;
}

FrontendConfig FrontendConfig::from_section(const ConfigSection& section) {
    FrontendConfig config;
    config.backend_order = section.get_list("backend_order");
    config.alpm_db_path = expand_path(section.get_or("alpm_db_path", "/var/lib/pacman"));
    config.output_fmt = section.get_or("output_fmt", "");
    for (const auto& [key, value] : section.entries()) {
        static constexpr std::string_view prefix = "output_fmt_";
        if (key.starts_with(prefix) && !key.starts_with("output_fmt_installed")) {
            config.action_fmt[key.substr(prefix.size())] = value;
        }
    }
    config.output_fmt_installed = section.get_or("output_fmt_installed", "");
    config.output_fmt_installed_same = section.get_or("output_fmt_installed_same", "");
    config.output_fmt_installed_new = section.get_or("output_fmt_installed_new", "");
    config.output_fmt_installed_old = section.get_or("output_fmt_installed_old", "");
    config.output_desc_wrap = section.get_int("output_desc_wrap", 80);
    config.output_desc_indent = section.get_int("output_desc_indent", 10);
    return config;
}

const std::string& FrontendConfig::format_for(std::string_view action) const {
    if (auto it = action_fmt.find(std::string(action)); it != action_fmt.end()) {
        return it->second;
    }
    return output_fmt;
}
