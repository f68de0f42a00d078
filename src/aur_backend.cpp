#include "aur_backend.hpp"
#include "alpm_db.hpp"
#include "archive.hpp"
#include "dispatcher.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "output.hpp"
#include "pacman_backend.hpp"
#include "process.hpp"
#include "recipe_parser.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>

const std::vector<std::string>& aur_categories() {
    static const std::vector<std::string> categories = {
        "none", "daemons", "devel", "editors", "emulators", "games", "gnome",
        "i18n", "kde", "lib", "modules", "multimedia", "network", "office",
        "science", "system", "x11", "xfce", "kernels",
    };
    return categories;
}

FieldMap sanitize_rpc_result(const nlohmann::json& result) {
    FieldMap fields;
    for (const auto& [raw_key, value] : result.items()) {
        std::string key = to_lower(raw_key);
        if (value.is_null()) continue;
        if (key == "categoryid") {
            if (!value.is_number_integer()) continue;
            const auto id = value.get<long long>();
            const auto& categories = aur_categories();
            if (id >= 1 && static_cast<size_t>(id) <= categories.size()) {
                fields["category"] = categories[static_cast<size_t>(id - 1)];
            }
            continue;
        }
        if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            fields[key] = std::move(items);
        } else if (value.is_string()) {
            fields[key] = value.get<std::string>();
        } else {
            fields[key] = value.dump();
        }
    }
    return fields;
}

const ConfigDefaults& AurConfig::defaults() {
    static const ConfigDefaults values = {
        {"base_url", "https://aur.archlinux.org/"},
        {"rpc_url", "https://aur.archlinux.org/rpc/?v=5&type={type}&arg={arg}"},
        {"staging_area", "$HOME/Build/"},
        {"prefix_output_fmt", "aur"},
        {"pacman_binary", "/usr/bin/pacman"},
        {"makepkg_binary", "/usr/bin/makepkg"},
        {"makepkg_flags", "-si"},
        {"recipe_timeout", "5"},
        {"use_fakeroot", "true"},
    };
    return values;
}

AurConfig AurConfig::from_section(const ConfigSection& section) {
    AurConfig config;
    config.base_url = section.get_or("base_url", config.base_url);
    config.rpc_url = section.get_or("rpc_url", config.rpc_url);
    config.staging_area = expand_path(section.get_or("staging_area", "$HOME/Build/"));
    config.prefix_output_fmt = section.get_or("prefix_output_fmt", config.prefix_output_fmt);
    config.pacman_binary = section.get_or("pacman_binary", config.pacman_binary);
    config.makepkg_binary = section.get_or("makepkg_binary", config.makepkg_binary);
    if (section.contains("makepkg_flags")) {
        config.makepkg_flags = split(*section.get("makepkg_flags"), ' ');
    }
    config.recipe_timeout = std::chrono::seconds(section.get_int("recipe_timeout", 5));
    config.use_fakeroot = section.get_bool("use_fakeroot", config.use_fakeroot);
    return config;
}

AurBackend::AurBackend(Dispatcher& dispatcher, AurConfig config)
    : Backend(dispatcher, "aur"), config_(std::move(config)) {}

std::unique_ptr<Backend> AurBackend::create(Dispatcher& dispatcher, const ConfigSection& section) {
    return std::make_unique<AurBackend>(dispatcher, AurConfig::from_section(section));
}

void AurBackend::initialize() {
    if (!fs::exists(config_.staging_area)) {
        log_info(string_format("info.creating_staging_area", config_.staging_area.string()));
    }
    ensure_dir_exists(config_.staging_area);
}

nlohmann::json AurBackend::rpc(const std::string& type, const std::string& arg) {
    const auto url = replace_all(replace_all(config_.rpc_url, "{type}", url_encode(type)), "{arg}", url_encode(arg));
    const auto body = dispatcher().http_client().fetch(url);
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw BorealisException(string_format("error.rpc_invalid_response", url, std::string(e.what())));
    }
    if (!data.is_object() || !data.contains("type")) {
        throw BorealisException(string_format("error.rpc_invalid_response", url, get_string("error.unknown")));
    }
    return data;
}

Package AurBackend::to_package(const nlohmann::json& result) const {
    Package pkg = Package::from_fields(sanitize_rpc_result(result));
    RenderContext context;
    context.package = &pkg;
    pkg.metadata().repo = render_template(config_.prefix_output_fmt, context, false);
    return pkg;
}

std::optional<Package> AurBackend::info(const std::string& name) {
    const auto data = rpc("info", name);
    const auto type = data.value("type", "");
    if ((type != "info" && type != "multiinfo") || !data.contains("results")) return std::nullopt;

    const auto& results = data.at("results");
    const nlohmann::json* match = nullptr;
    if (results.is_array()) {
        for (const auto& result : results) {
            if (result.value("Name", "") == name) match = &result;
        }
    } else if (results.is_object()) {
        match = &results;
    }
    if (!match) return std::nullopt;

    Package pkg = to_package(*match);
    pkg.set_installed_version(installed_version(dispatcher().config().alpm_db_path, pkg.name()));
    return pkg;
}

OperationResult<PackageStream> AurBackend::query(const std::optional<std::string>& name) {
    if (!name) {
        return OperationResult<PackageStream>::defer(get_string("info.aur_query_needs_name"));
    }
    auto pkg = info(*name);
    if (!pkg) {
        return OperationResult<PackageStream>::defer(string_format("info.package_not_found", *name));
    }
    return OperationResult<PackageStream>::success(PackageStream::from_vector({std::move(*pkg)}));
}

OperationResult<PackageStream> AurBackend::search(const std::vector<std::string>& terms) {
    const auto data = rpc("search", join(terms, " "));
    if (data.value("type", "") != "search") {
        return OperationResult<PackageStream>::defer(data.value("error", get_string("info.no_matches")));
    }

    std::map<std::string, Version, std::less<>> installed;
    for (auto& entry : list_local_entries(dispatcher().config().alpm_db_path)) {
        installed.emplace(std::move(entry.name), std::move(entry.version));
    }

    std::vector<Package> packages;
    for (const auto& result : data.value("results", nlohmann::json::array())) {
        try {
            Package pkg = to_package(result);
            const bool matches = std::ranges::all_of(terms, [&](const std::string& term) {
                return icontains(pkg.name(), term) || icontains(pkg.metadata().description, term);
            });
            if (!matches) continue;
            if (auto it = installed.find(pkg.name()); it != installed.end()) {
                pkg.set_installed_version(it->second);
            }
            packages.push_back(std::move(pkg));
        } catch (const BorealisException& e) {
            log_warning(string_format("warning.skipping_result", std::string(e.what())));
        }
    }
    return OperationResult<PackageStream>::success(PackageStream::from_vector(std::move(packages)));
}

fs::path AurBackend::prepare_sources(const Package& package) {
    const auto& meta = package.metadata();
    if (meta.urlpath.empty()) {
        throw BorealisException(string_format("error.no_snapshot_url", package.name()));
    }
    const auto package_dir = config_.staging_area / package.name();
    ensure_dir_exists(package_dir);

    const auto snapshot = package_dir / fs::path(meta.urlpath).filename();
    const auto partial = fs::path(snapshot.string() + ".part");
    dispatcher().http_client().download(join_url(config_.base_url, meta.urlpath), partial);

    const auto srcdir = package_dir / (meta.base.empty() ? package.name() : meta.base);
    const bool unchanged = fs::exists(snapshot) && fs::is_directory(srcdir) &&
                           calculate_sha256(snapshot) == calculate_sha256(partial);
    fs::rename(partial, snapshot);
    if (unchanged) {
        log_info(string_format("info.snapshot_unchanged", package.name()));
    } else {
        log_info(string_format("info.extracting_snapshot", snapshot.filename().string()));
        extract_archive(snapshot, package_dir);
    }
    if (!fs::is_regular_file(srcdir / "PKGBUILD")) {
        throw BorealisException(string_format("error.no_pkgbuild", srcdir.string()));
    }
    return srcdir;
}

OperationResult<std::vector<Dependency>> AurBackend::unmet_dependencies(const Package& package) {
    std::vector<Dependency> unmet;
    const auto deps = package.all_depends();
    if (deps.empty()) return OperationResult<std::vector<Dependency>>::success(unmet);

    std::vector<std::string> argv = {config_.pacman_binary, "-T"};
    for (const auto& dep : deps) argv.push_back(dep.to_string());

    // pacman -T exits 127 and prints the unmet ones when some are missing.
    auto result = dispatcher().command_runner().run(argv);
    if (result.exit_code != 0 && result.exit_code != 127) {
        return OperationResult<std::vector<Dependency>>::fail(
            string_format("error.pacman_failed", result.exit_code, trim(result.err)));
    }
    std::istringstream in(result.out);
    std::string line;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) unmet.push_back(Dependency::parse(trim(line)));
    }
    return OperationResult<std::vector<Dependency>>::success(std::move(unmet));
}

OperationResult<Done> AurBackend::sync(const std::string& name) {
    if (std::ranges::find(in_progress_, name) != in_progress_.end()) {
        std::vector<std::string> chain = in_progress_;
        chain.push_back(name);
        return OperationResult<Done>::fail(string_format("error.dependency_cycle", join(chain, " -> ")));
    }

    auto found = info(name);
    if (!found) {
        return OperationResult<Done>::defer(string_format("info.package_not_found", name));
    }
    Package package = std::move(*found);

    in_progress_.push_back(name);
    struct PopGuard {
        std::vector<std::string>& stack;
        ~PopGuard() { stack.pop_back(); }
    } guard{in_progress_};

    const auto srcdir = prepare_sources(package);

    if (package.all_depends().empty()) {
        RecipeParserOptions options;
        options.use_fakeroot = config_.use_fakeroot;
        options.timeout = config_.recipe_timeout;
        auto fields = parse_recipe(dispatcher().command_runner(), srcdir / "PKGBUILD", options,
                                   {{"pkgname", package.name()}});
        auto installed = package.installed_version();
        package = Package(PackageMetadata::from_fields(fields));
        package.set_installed_version(installed);
    }

    auto unmet = unmet_dependencies(package);
    if (!unmet.ok()) return unmet.forward<Done>();
    for (const auto& dep : unmet.value()) {
        log_info(string_format("info.resolving_dependency", dep.to_string()));
        const auto report = dispatcher().dispatch(Capability::Sync, {dep.name()});
        if (report.succeeded == 0) {
            return OperationResult<Done>::fail(string_format("error.unresolved_dependency", dep.to_string(), name));
        }
    }

    std::vector<std::string> argv = {config_.makepkg_binary};
    argv.insert(argv.end(), config_.makepkg_flags.begin(), config_.makepkg_flags.end());
    ProcessOptions options;
    options.cwd = srcdir;
    options.capture_stdout = false;
    auto result = dispatcher().command_runner().run(argv, options);
    std::cerr << result.err;
    if (result.ok()) {
        return OperationResult<Done>::success(Done{});
    }
    if (result.err.find("target not found") != std::string::npos) {
        return OperationResult<Done>::defer(trim(result.err));
    }
    return OperationResult<Done>::fail(string_format("error.makepkg_failed", name, result.exit_code));
}

OperationResult<Done> AurBackend::upgrade() {
    auto result = dispatcher().command_runner().run({config_.pacman_binary, "-Qm"});
    // pacman -Qm exits 1 when there are no foreign packages.
    if (!result.ok() && !trim(result.err).empty()) {
        return OperationResult<Done>::fail(string_format("error.pacman_failed", result.exit_code, trim(result.err)));
    }

    std::vector<std::string> failed;
    size_t upgraded = 0;
    for (const auto& local : parse_query_output(result.out)) {
        auto remote = info(local.name());
        if (!remote || !remote->version() || !local.version()) continue;
        if (!(*local.version() < *remote->version())) continue;

        log_info(string_format("info.upgrading", local.name(), local.version()->display(), remote->version()->display()));
        auto synced = sync(local.name());
        if (synced.ok()) {
            ++upgraded;
        } else {
            log_warning(synced.deferred() ? synced.reason() : synced.error());
            failed.push_back(local.name());
        }
    }

    if (!failed.empty()) {
        return OperationResult<Done>::fail(string_format("error.upgrade_failed", join(failed, ", ")));
    }
    if (upgraded == 0) {
        log_info(get_string("info.aur_up_to_date"));
    }
    return OperationResult<Done>::success(Done{});
}
