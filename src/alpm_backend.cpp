#include "alpm_backend.hpp"
#include "alpm_db.hpp"
#include "dispatcher.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <map>
#include <regex>

const ConfigDefaults& AlpmConfig::defaults() {
    static const ConfigDefaults values = {
        {"pacman_conf", "/etc/pacman.conf"},
    };
    return values;
}

AlpmConfig AlpmConfig::from_section(const ConfigSection& section) {
    AlpmConfig config;
    config.pacman_conf = expand_path(section.get_or("pacman_conf", config.pacman_conf.string()));
    return config;
}

AlpmBackend::AlpmBackend(Dispatcher& dispatcher, AlpmConfig config)
    : Backend(dispatcher, "alpm"), config_(std::move(config)) {}

std::unique_ptr<Backend> AlpmBackend::create(Dispatcher& dispatcher, const ConfigSection& section) {
    return std::make_unique<AlpmBackend>(dispatcher, AlpmConfig::from_section(section));
}

fs::path AlpmBackend::db_path() const {
    return dispatcher().config().alpm_db_path;
}

void AlpmBackend::initialize() {
    if (!fs::is_directory(db_path())) {
        throw BorealisException(string_format("error.path_not_dir", db_path().string()));
    }
    if (fs::is_regular_file(config_.pacman_conf)) {
        repos_ = enabled_repositories(config_.pacman_conf);
    } else {
        log_warning(string_format("warning.pacman_conf_missing", config_.pacman_conf.string()));
    }
}

OperationResult<PackageStream> AlpmBackend::query(const std::optional<std::string>& name) {
    if (name) {
        auto entry = find_local_entry(db_path(), *name);
        if (!entry) {
            return OperationResult<PackageStream>::defer(string_format("info.package_not_found", *name));
        }
        Package pkg(PackageMetadata::from_fields(parse_desc(read_file(entry->dir / "desc"))));
        pkg.set_installed_version(entry->version);
        return OperationResult<PackageStream>::success(PackageStream::from_vector({std::move(pkg)}));
    }

    auto entries = std::make_shared<std::vector<LocalEntry>>(list_local_entries(db_path()));
    auto pos = std::make_shared<size_t>(0);
    return OperationResult<PackageStream>::success(PackageStream([entries, pos]() -> std::optional<Package> {
        if (*pos >= entries->size()) return std::nullopt;
        const auto& entry = (*entries)[(*pos)++];
        PackageMetadata metadata;
        metadata.name = entry.name;
        metadata.version = entry.version;
        Package pkg(std::move(metadata), true);
        pkg.set_installed_version(entry.version);
        return pkg;
    }));
}

OperationResult<PackageStream> AlpmBackend::search(const std::vector<std::string>& terms) {
    std::vector<std::regex> patterns;
    try {
        for (const auto& term : terms) {
            patterns.emplace_back(term, std::regex::ECMAScript | std::regex::icase);
        }
    } catch (const std::regex_error& e) {
        return OperationResult<PackageStream>::fail(string_format("error.invalid_regex", std::string(e.what())));
    }

    auto matches = [patterns = std::move(patterns)](const Package& pkg) {
        for (const auto& pattern : patterns) {
            if (!std::regex_search(pkg.name(), pattern) && !std::regex_search(pkg.metadata().description, pattern)) {
                return false;
            }
        }
        return true;
    };

    // One reader per repository, opened when the previous one is exhausted.
    struct State {
        std::vector<fs::path> files;
        std::vector<std::string> repos;
        size_t index = 0;
        std::unique_ptr<SyncDbReader> reader;
        std::map<std::string, Version, std::less<>> installed;
    };
    auto state = std::make_shared<State>();
    for (auto& entry : list_local_entries(db_path())) {
        state->installed.emplace(std::move(entry.name), std::move(entry.version));
    }
    for (const auto& repo : repos_) {
        auto file = db_path() / "sync" / (repo + ".db");
        if (!fs::is_regular_file(file)) {
            log_warning(string_format("warning.sync_db_missing", file.string()));
            continue;
        }
        state->files.push_back(file);
        state->repos.push_back(repo);
    }
    if (state->files.empty()) {
        return OperationResult<PackageStream>::defer(get_string("info.no_sync_databases"));
    }

    PackageStream all([state]() -> std::optional<Package> {
        while (state->index < state->files.size()) {
            if (!state->reader) {
                state->reader = std::make_unique<SyncDbReader>(state->files[state->index]);
            }
            if (auto fields = state->reader->next()) {
                (*fields)["repo"] = state->repos[state->index];
                Package pkg = Package::from_fields(*fields);
                if (auto it = state->installed.find(pkg.name()); it != state->installed.end()) {
                    pkg.set_installed_version(it->second);
                }
                return pkg;
            }
            state->reader.reset();
            ++state->index;
        }
        return std::nullopt;
    });
    return OperationResult<PackageStream>::success(std::move(all).filter(matches));
}
