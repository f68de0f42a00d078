#pragma once

#include <filesystem>
#include <string>

// Calculates the SHA256 hash of a file as lowercase hex.
// Throws BorealisException if the file cannot be read.
std::string calculate_sha256(const std::filesystem::path& file_path);
