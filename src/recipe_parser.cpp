#include "recipe_parser.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <array>
#include <cctype>
#include <sstream>

namespace {

// Shell state that changes merely because a file was sourced.
constexpr std::array<std::string_view, 12> SHELL_VARIABLES = {
    "_", "PIPESTATUS", "LINENO", "RANDOM", "SRANDOM", "SECONDS",
    "EPOCHSECONDS", "EPOCHREALTIME", "OPTIND", "FUNCNAME", "COLUMNS", "LINES",
};

bool is_shell_variable(std::string_view name) {
    if (name.starts_with("BASH")) return true;
    for (auto v : SHELL_VARIABLES) {
        if (v == name) return true;
    }
    return false;
}

bool is_identifier(std::string_view name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) return false;
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_') return false;
    }
    return true;
}

// 'text' with '\'' escapes; returns the end position after the closing quote.
std::string read_single_quoted(std::string_view s, size_t& pos) {
    std::string out;
    ++pos;
    while (pos < s.size() && s[pos] != '\'') out += s[pos++];
    ++pos;
    return out;
}

std::string read_ansi_c_quoted(std::string_view s, size_t& pos) {
    std::string out;
    pos += 2;
    while (pos < s.size() && s[pos] != '\'') {
        char c = s[pos++];
        if (c != '\\' || pos >= s.size()) {
            out += c;
            continue;
        }
        char e = s[pos++];
        switch (e) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'a': out += '\a'; break;
        case 'b': out += '\b'; break;
        case 'e': case 'E': out += '\033'; break;
        default: out += e; break;
        }
    }
    ++pos;
    return out;
}

std::string read_double_quoted(std::string_view s, size_t& pos) {
    std::string out;
    ++pos;
    while (pos < s.size() && s[pos] != '"') {
        char c = s[pos++];
        if (c == '\\' && pos < s.size() && std::string_view("\"\\$`").find(s[pos]) != std::string_view::npos) {
            c = s[pos++];
        }
        out += c;
    }
    ++pos;
    return out;
}

// One word of a `set` value: any sequence of quoted and bare segments.
std::string read_word(std::string_view s, size_t& pos) {
    std::string out;
    while (pos < s.size() && !std::isspace(static_cast<unsigned char>(s[pos])) && s[pos] != ')') {
        if (s.substr(pos).starts_with("$'")) {
            out += read_ansi_c_quoted(s, pos);
        } else if (s[pos] == '\'') {
            out += read_single_quoted(s, pos);
        } else if (s[pos] == '"') {
            out += read_double_quoted(s, pos);
        } else if (s[pos] == '\\' && pos + 1 < s.size()) {
            out += s[pos + 1];
            pos += 2;
        } else {
            out += s[pos++];
        }
    }
    return out;
}

std::vector<std::string> read_array(std::string_view s) {
    std::vector<std::string> items;
    size_t pos = 1;
    while (pos < s.size()) {
        while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos >= s.size() || s[pos] == ')') break;
        if (s[pos] == '[') {
            const auto close = s.find("]=", pos);
            if (close == std::string_view::npos) break;
            pos = close + 2;
        }
        items.push_back(read_word(s, pos));
    }
    return items;
}

}

std::map<std::string, std::string, std::less<>> parse_set_output(std::string_view output) {
    std::map<std::string, std::string, std::less<>> vars;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        // Function definitions follow the variables; nothing after them is needed.
        if (trim(line).ends_with(" ()")) break;
        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string name = line.substr(0, eq);
        if (!is_identifier(name)) continue;
        vars[name] = line.substr(eq + 1);
    }
    return vars;
}

FieldValue decode_bash_value(std::string_view raw) {
    if (raw.starts_with("(") && raw.ends_with(")")) {
        return read_array(raw);
    }
    size_t pos = 0;
    return read_word(raw, pos);
}

FieldMap parse_recipe(CommandRunner& runner, const fs::path& pkgbuild,
                      const RecipeParserOptions& options, const FieldMap& overrides) {
    if (!fs::is_regular_file(pkgbuild)) {
        throw BorealisException(string_format("error.open_file_failed", pkgbuild.string()));
    }

    ProcessOptions process_options;
    process_options.cwd = pkgbuild.parent_path();
    process_options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options.timeout);

    auto run_bash = [&](std::vector<std::string> argv) {
        if (options.use_fakeroot) {
            const std::vector<std::string> prefix = {"fakeroot", "--"};
            argv.insert(argv.begin(), prefix.begin(), prefix.end());
        }
        auto result = runner.run(argv, process_options);
        if (result.timed_out) {
            throw BorealisException(string_format("error.recipe_timeout", pkgbuild.string(), options.timeout.count()));
        }
        if (!result.ok()) {
            throw BorealisException(string_format("error.recipe_failed", pkgbuild.string(), trim(result.err)));
        }
        return parse_set_output(result.out);
    };

    const auto baseline = run_bash({"bash", "-c", "set"});
    const auto script = (fs::path(".") / pkgbuild.filename()).string();
    const auto sourced = run_bash({"bash", "-c", ". \"$1\" >/dev/null; set", "bash", script});

    FieldMap fields;
    for (const auto& [name, value] : sourced) {
        if (is_shell_variable(name)) continue;
        if (auto it = baseline.find(name); it != baseline.end() && it->second == value) continue;
        fields[name] = decode_bash_value(value);
    }

    // pkgname of a split package is an array; the first entry names the base.
    if (auto it = fields.find("pkgname"); it != fields.end()) {
        if (const auto* list = std::get_if<std::vector<std::string>>(&it->second); list && !list->empty()) {
            it->second = list->front();
        }
    }

    for (const auto& [key, value] : overrides) {
        fields[key] = value;
    }
    return fields;
}
