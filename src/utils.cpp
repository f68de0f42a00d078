#include "utils.hpp"

#include "localization.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void check_ttys() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_ttys();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix") + " ", COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

bool stdout_is_tty() {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_ttys();
    return is_stdout_tty;
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw BorealisException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw BorealisException(string_format("error.path_not_dir", path.string()));
    }
}

// Expands a leading "~" and any $VAR / ${VAR} references from the environment.
fs::path expand_path(std::string_view path) {
    std::string result;
    size_t i = 0;
    if (path.starts_with("~")) {
        const char* home = std::getenv("HOME");
        result = home ? home : "";
        i = 1;
    }
    while (i < path.size()) {
        if (path[i] != '$') {
            result += path[i++];
            continue;
        }
        size_t start = i + 1;
        bool braced = start < path.size() && path[start] == '{';
        if (braced) ++start;
        size_t end = start;
        while (end < path.size() && (std::isalnum(static_cast<unsigned char>(path[end])) || path[end] == '_')) {
            ++end;
        }
        if (end == start) {
            result += path[i++];
            continue;
        }
        std::string var(path.substr(start, end - start));
        if (const char* value = std::getenv(var.c_str())) {
            result += value;
        }
        i = end;
        if (braced && i < path.size() && path[i] == '}') ++i;
    }
    return fs::path(result);
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    fs::path normalized = path.lexically_normal();
    if (normalized.is_absolute()) {
        normalized = normalized.relative_path();
    }
    for (const auto& component : normalized) {
        if (component == "..") {
            throw BorealisException(string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw BorealisException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split(std::string_view s, char delim, bool skip_empty) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(delim, start);
        if (pos == std::string_view::npos) pos = s.size();
        std::string part = trim(s.substr(start, pos - start));
        if (!part.empty() || !skip_empty) parts.push_back(std::move(part));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string replace_all(std::string s, std::string_view from, std::string_view to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string wrap_text(std::string_view text, size_t width, std::string_view indent) {
    std::istringstream words{std::string(text)};
    std::string word;
    std::string out;
    std::string line(indent);
    bool line_has_word = false;
    while (words >> word) {
        if (line_has_word && line.size() + 1 + word.size() > width) {
            out += line + "\n";
            line = std::string(indent);
            line_has_word = false;
        }
        if (line_has_word) line += ' ';
        line += word;
        line_has_word = true;
    }
    if (line_has_word) out += line;
    return out;
}
