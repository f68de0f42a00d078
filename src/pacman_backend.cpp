#include "pacman_backend.hpp"
#include "alpm_db.hpp"
#include "dispatcher.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <cctype>
#include <iostream>
#include <memory>
#include <regex>
#include <sstream>

namespace {

const std::regex SEARCH_HEADER_RE(R"(^([^/\s]+)/(\S+) (\S+)(?: \(([^)]*)\))?(?: \[([^\]]*)\])?\s*$)");

}

const ConfigDefaults& PacmanConfig::defaults() {
    static const ConfigDefaults values = {
        {"verify_target_before_sync", "true"},
        {"parse_output", "true"},
        {"pacman_binary", "/usr/bin/pacman"},
        {"parse_desc_on_query", "false"},
    };
    return values;
}

PacmanConfig PacmanConfig::from_section(const ConfigSection& section) {
    PacmanConfig config;
    config.verify_target_before_sync = section.get_bool("verify_target_before_sync", config.verify_target_before_sync);
    config.parse_output = section.get_bool("parse_output", config.parse_output);
    config.pacman_binary = section.get_or("pacman_binary", config.pacman_binary);
    config.parse_desc_on_query = section.get_bool("parse_desc_on_query", config.parse_desc_on_query);
    return config;
}

std::vector<Package> parse_query_output(std::string_view output) {
    std::vector<Package> packages;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        auto parts = split(line, ' ');
        if (parts.size() < 2) continue;
        try {
            Package pkg = Package::from_fields({{"name", parts[0]}, {"version", parts[1]}}, true);
            pkg.set_installed_version(pkg.version());
            packages.push_back(std::move(pkg));
        } catch (const BorealisException& e) {
            log_warning(string_format("warning.skipping_result", std::string(e.what())));
        }
    }
    return packages;
}

std::vector<Package> parse_search_output(std::string_view output) {
    std::vector<Package> packages;
    std::optional<FieldMap> current;
    std::optional<std::string> installed;
    std::vector<std::string> description;

    // A record that does not parse is skipped; the rest of the output stands.
    auto flush = [&]() {
        if (!current) return;
        (*current)["description"] = join(description, " ");
        try {
            Package pkg = Package::from_fields(*current);
            if (installed) pkg.set_installed_version(Version::parse(*installed));
            packages.push_back(std::move(pkg));
        } catch (const BorealisException& e) {
            log_warning(string_format("warning.skipping_result", std::string(e.what())));
        }
        current.reset();
        installed.reset();
        description.clear();
    };

    std::istringstream in{std::string(output)};
    std::string line;
    std::smatch m;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (std::isspace(static_cast<unsigned char>(line.front()))) {
            if (current) description.push_back(trim(line));
            continue;
        }
        flush();
        if (!std::regex_match(line, m, SEARCH_HEADER_RE)) {
            log_warning(string_format("warning.unparsed_line", line));
            continue;
        }
        current = FieldMap{{"repo", m[1].str()}, {"name", m[2].str()}, {"version", m[3].str()}};
        if (m[4].matched) (*current)["groups"] = split(m[4].str(), ' ');
        if (m[5].matched) {
            const auto flag = m[5].str();
            if (flag == "installed") {
                installed = m[3].str();
            } else if (flag.starts_with("installed: ")) {
                installed = trim(std::string_view(flag).substr(11));
            }
        }
    }
    flush();
    return packages;
}

PacmanBackend::PacmanBackend(Dispatcher& dispatcher, PacmanConfig config)
    : Backend(dispatcher, "pacman"), config_(std::move(config)) {}

std::unique_ptr<Backend> PacmanBackend::create(Dispatcher& dispatcher, const ConfigSection& section) {
    return std::make_unique<PacmanBackend>(dispatcher, PacmanConfig::from_section(section));
}

std::vector<std::string> PacmanBackend::command(std::initializer_list<std::string> args, bool passthrough) const {
    std::vector<std::string> argv = {config_.pacman_binary};
    argv.insert(argv.end(), args.begin(), args.end());
    if (passthrough) {
        const auto& extra = dispatcher().passthrough_args();
        argv.insert(argv.end(), extra.begin(), extra.end());
    }
    return argv;
}

OperationResult<PackageStream> PacmanBackend::query(const std::optional<std::string>& name) {
    auto argv = command({"-Q"}, false);
    if (name) argv.push_back(*name);

    auto result = dispatcher().command_runner().run(argv);
    if (!result.ok()) {
        if (name) {
            return OperationResult<PackageStream>::defer(string_format("info.package_not_found", *name));
        }
        return OperationResult<PackageStream>::fail(trim(result.err));
    }

    auto packages = std::make_shared<std::vector<Package>>(parse_query_output(result.out));
    if (!config_.parse_desc_on_query) {
        return OperationResult<PackageStream>::success(PackageStream::from_vector(std::move(*packages)));
    }

    // Full metadata is read from the local database only as packages are pulled.
    auto pos = std::make_shared<size_t>(0);
    auto db_path = dispatcher().config().alpm_db_path;
    return OperationResult<PackageStream>::success(PackageStream([packages, pos, db_path]() -> std::optional<Package> {
        if (*pos >= packages->size()) return std::nullopt;
        Package& lazy = (*packages)[(*pos)++];
        auto metadata = read_local_metadata(db_path, lazy.name());
        if (!metadata) return std::move(lazy);
        Package full(std::move(*metadata));
        full.set_installed_version(lazy.installed_version());
        return full;
    }));
}

OperationResult<PackageStream> PacmanBackend::search(const std::vector<std::string>& terms) {
    auto argv = command({"-Ss"}, true);
    argv.insert(argv.end(), terms.begin(), terms.end());

    if (!config_.parse_output) {
        ProcessOptions options;
        options.capture_stdout = false;
        options.capture_stderr = false;
        auto result = dispatcher().command_runner().run(argv, options);
        if (!result.ok()) {
            return OperationResult<PackageStream>::defer(get_string("info.no_matches"));
        }
        return OperationResult<PackageStream>::success(PackageStream());
    }

    auto result = dispatcher().command_runner().run(argv);
    if (!result.ok()) {
        return OperationResult<PackageStream>::defer(get_string("info.no_matches"));
    }
    return OperationResult<PackageStream>::success(PackageStream::from_vector(parse_search_output(result.out)));
}

OperationResult<Done> PacmanBackend::transaction(const std::string& flag, const std::optional<std::string>& name) {
    auto argv = command({flag}, true);
    if (name) argv.push_back(*name);

    ProcessOptions options;
    options.capture_stdout = false;
    auto result = dispatcher().command_runner().run(elevate(argv), options);
    if (result.ok()) {
        std::cerr << result.err;
        return OperationResult<Done>::success(Done{});
    }
    if (result.err.find("target not found") != std::string::npos) {
        return OperationResult<Done>::defer(trim(result.err));
    }
    return OperationResult<Done>::fail(string_format("error.pacman_failed", result.exit_code, trim(result.err)));
}

OperationResult<Done> PacmanBackend::sync(const std::string& name) {
    if (config_.verify_target_before_sync) {
        auto check = dispatcher().command_runner().run(command({"-Si", name}, false));
        if (!check.ok()) {
            return OperationResult<Done>::defer(string_format("info.package_not_found", name));
        }
    }
    return transaction("-S", name);
}

OperationResult<Done> PacmanBackend::remove(const std::string& name) {
    return transaction("-R", name);
}

OperationResult<Done> PacmanBackend::upgrade() {
    return transaction("-Su", std::nullopt);
}
