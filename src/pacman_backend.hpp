#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct PacmanConfig {
    bool verify_target_before_sync = true;
    // When false, pacman's search output goes straight to the terminal.
    bool parse_output = true;
    std::string pacman_binary = "/usr/bin/pacman";
    bool parse_desc_on_query = false;

    static const ConfigDefaults& defaults();
    static PacmanConfig from_section(const ConfigSection& section);
};

// Proxy over the pacman binary.
class PacmanBackend : public Backend {
public:
    static constexpr CapabilitySet CAPABILITIES = CapabilitySet::all() ^ Capability::SearchEcmaRegex;

    PacmanBackend(Dispatcher& dispatcher, PacmanConfig config);

    static std::unique_ptr<Backend> create(Dispatcher& dispatcher, const ConfigSection& section);

    CapabilitySet capabilities() const override { return CAPABILITIES; }

    OperationResult<PackageStream> query(const std::optional<std::string>& name) override;
    OperationResult<PackageStream> search(const std::vector<std::string>& terms) override;
    OperationResult<Done> sync(const std::string& name) override;
    OperationResult<Done> remove(const std::string& name) override;
    OperationResult<Done> upgrade() override;

private:
    std::vector<std::string> command(std::initializer_list<std::string> args, bool passthrough) const;
    // Runs an elevated pacman transaction. "target not found" defers.
    OperationResult<Done> transaction(const std::string& flag, const std::optional<std::string>& name);

    PacmanConfig config_;
};

// Parses `pacman -Q` output ("name version" per line) into lazy packages.
std::vector<Package> parse_query_output(std::string_view output);

// Parses `pacman -Ss` output: a "repo/name version [(groups)] [[installed]]"
// line followed by indented description lines.
std::vector<Package> parse_search_output(std::string_view output);
