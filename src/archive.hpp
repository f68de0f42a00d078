#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct archive;

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const;
};

// Extracts every entry of `archive_path` below `output_dir`, refusing entries
// that would escape it. Returns the number of entries written.
long long extract_archive(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir);

struct ArchiveEntry {
    std::string path;
    std::string content;
};

// Reads the regular files of an archive one at a time.
class ArchiveReader {
public:
    explicit ArchiveReader(const std::filesystem::path& archive_path);
    ~ArchiveReader();
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    // The next regular file, or std::nullopt at the end of the archive.
    std::optional<ArchiveEntry> next();

private:
    std::filesystem::path path_;
    std::unique_ptr<struct archive, ArchiveReadDeleter> handle_;
};
