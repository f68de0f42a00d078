#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct AlpmConfig {
    std::filesystem::path pacman_conf = "/etc/pacman.conf";

    static const ConfigDefaults& defaults();
    static AlpmConfig from_section(const ConfigSection& section);
};

// Read-only access to pacman's on-disk databases, without running pacman.
class AlpmBackend : public Backend {
public:
    static constexpr CapabilitySet CAPABILITIES =
        CapabilitySet::all() ^ (Capability::SearchRegex | Capability::Sync | Capability::Remove | Capability::Upgrade);

    AlpmBackend(Dispatcher& dispatcher, AlpmConfig config);

    static std::unique_ptr<Backend> create(Dispatcher& dispatcher, const ConfigSection& section);

    CapabilitySet capabilities() const override { return CAPABILITIES; }

    // Fails when the database directory does not exist.
    void initialize() override;

    OperationResult<PackageStream> query(const std::optional<std::string>& name) override;
    OperationResult<PackageStream> search(const std::vector<std::string>& terms) override;

private:
    std::filesystem::path db_path() const;

    AlpmConfig config_;
    std::vector<std::string> repos_;
};
