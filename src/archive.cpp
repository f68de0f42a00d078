#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

namespace {

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archive_error(struct archive* a, const std::string& fallback_key) {
    const char* err = archive_error_string(a);
    return err ? err : get_string(fallback_key);
}

}

void ArchiveReadDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_read_close(a);
        archive_read_free(a);
    }
}

ArchiveReader::ArchiveReader(const fs::path& archive_path)
    : path_(archive_path), handle_(archive_read_new()) {
    if (!handle_) {
        throw BorealisException(string_format("error.open_file_failed", archive_path.string()));
    }
    archive_read_support_filter_all(handle_.get());
    archive_read_support_format_all(handle_.get());

    if (archive_read_open_filename(handle_.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw BorealisException(string_format("error.open_file_failed", archive_path.string()) + ": " +
                                archive_error(handle_.get(), "error.unknown"));
    }
}

ArchiveReader::~ArchiveReader() = default;

std::optional<ArchiveEntry> ArchiveReader::next() {
    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(handle_.get(), &entry);
        if (r == ARCHIVE_EOF) return std::nullopt;
        if (r < ARCHIVE_WARN) {
            throw BorealisException(string_format("error.extract_failed", path_.string()) + ": " +
                                    archive_error(handle_.get(), "error.fatal_read"));
        }
        if (r == ARCHIVE_WARN) {
            log_warning(archive_error(handle_.get(), "error.unknown"));
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(handle_.get());
            continue;
        }

        ArchiveEntry out;
        out.path = archive_entry_pathname(entry);
        if (out.path.starts_with("./")) out.path = out.path.substr(2);

        char buffer[8192];
        la_ssize_t n;
        while ((n = archive_read_data(handle_.get(), buffer, sizeof(buffer))) > 0) {
            out.content.append(buffer, static_cast<size_t>(n));
        }
        if (n < 0) {
            throw BorealisException(string_format("error.extract_failed", path_.string()) + ": " +
                                    archive_error(handle_.get(), "error.data_block_read"));
        }
        return out;
    }
}

long long extract_archive(const fs::path& archive_path, const fs::path& output_dir) {
    std::unique_ptr<struct archive, ArchiveReadDeleter> a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK
    );

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw BorealisException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                archive_error(a.get(), "error.unknown"));
    }

    struct archive_entry* entry;
    long long count = 0;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw BorealisException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                        archive_error(a.get(), "error.fatal_read"));
            }
            log_warning(archive_error(a.get(), "error.unknown"));
        }

        const char* current_path = archive_entry_pathname(entry);
        if (!current_path) continue;

        fs::path dest_path;
        try {
            dest_path = validate_path(current_path, output_dir);
        } catch (const BorealisException&) {
            throw BorealisException(string_format("error.malicious_path_in_archive", std::string(current_path)));
        }
        archive_entry_set_pathname(entry, dest_path.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            try {
                fs::path link_dest = validate_path(hardlink, output_dir);
                archive_entry_set_hardlink(entry, link_dest.c_str());
            } catch (const BorealisException& e) {
                log_warning(e.what());
                archive_entry_set_hardlink(entry, nullptr);
            }
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw BorealisException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                        archive_error(ext.get(), "error.fatal_write"));
            }
            log_warning(archive_error(ext.get(), "error.unknown"));
        } else {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        throw BorealisException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                                archive_error(a.get(), "error.data_block_read"));
                    }
                    log_warning(archive_error(a.get(), "error.unknown"));
                    break;
                }
                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    throw BorealisException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                            archive_error(ext.get(), "error.data_block_write"));
                }
            }
            archive_write_finish_entry(ext.get());
        }
        ++count;
    }
    return count;
}
