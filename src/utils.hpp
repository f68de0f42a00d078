#pragma once

#include "exception.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

bool stdout_is_tty();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
fs::path expand_path(std::string_view path);
fs::path validate_path(const fs::path& path, const fs::path& root);
std::string read_file(const fs::path& path);

// String utilities
std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
std::vector<std::string> split(std::string_view s, char delim, bool skip_empty = true);
std::string join(const std::vector<std::string>& parts, std::string_view sep);
std::string replace_all(std::string s, std::string_view from, std::string_view to);
bool icontains(std::string_view haystack, std::string_view needle);
std::string wrap_text(std::string_view text, size_t width, std::string_view indent);
