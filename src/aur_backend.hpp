#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct AurConfig {
    std::string base_url = "https://aur.archlinux.org/";
    // {type} and {arg} are replaced; the argument is percent-encoded.
    std::string rpc_url = "https://aur.archlinux.org/rpc/?v=5&type={type}&arg={arg}";
    std::filesystem::path staging_area;
    // Template for the repo column of AUR packages, e.g. "aur" or "aur:{category}".
    std::string prefix_output_fmt = "aur";
    std::string pacman_binary = "/usr/bin/pacman";
    std::string makepkg_binary = "/usr/bin/makepkg";
    std::vector<std::string> makepkg_flags = {"-si"};
    std::chrono::seconds recipe_timeout{5};
    bool use_fakeroot = true;

    static const ConfigDefaults& defaults();
    static AurConfig from_section(const ConfigSection& section);
};

// The Arch User Repository, through its RPC interface. Packages are built
// from source in the staging area with makepkg.
class AurBackend : public Backend {
public:
    static constexpr CapabilitySet CAPABILITIES =
        CapabilitySet::all() ^ (Capability::SearchRegex | Capability::SearchEcmaRegex | Capability::Remove | Capability::Query);

    AurBackend(Dispatcher& dispatcher, AurConfig config);

    static std::unique_ptr<Backend> create(Dispatcher& dispatcher, const ConfigSection& section);

    CapabilitySet capabilities() const override { return CAPABILITIES; }

    // Creates the staging area.
    void initialize() override;

    // Not advertised; sync and upgrade use it to look packages up.
    OperationResult<PackageStream> query(const std::optional<std::string>& name) override;
    OperationResult<PackageStream> search(const std::vector<std::string>& terms) override;
    OperationResult<Done> sync(const std::string& name) override;
    OperationResult<Done> upgrade() override;

private:
    nlohmann::json rpc(const std::string& type, const std::string& arg);
    std::optional<Package> info(const std::string& name);
    Package to_package(const nlohmann::json& result) const;

    // Fetches the snapshot of `package` and returns its source directory.
    std::filesystem::path prepare_sources(const Package& package);
    // Dependencies of `package` that `pacman -T` reports as unmet.
    OperationResult<std::vector<Dependency>> unmet_dependencies(const Package& package);

    AurConfig config_;
    // Packages being synced, outermost first.
    std::vector<std::string> in_progress_;
};

// The AUR's historical category ids, 1-based.
const std::vector<std::string>& aur_categories();

// Maps one RPC result object to package fields: lower-cased keys, category
// ids resolved to names, numbers rendered as text.
FieldMap sanitize_rpc_result(const nlohmann::json& result);
