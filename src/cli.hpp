#pragma once

#include "capability.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

class Dispatcher;

struct CommandLine {
    std::optional<Capability> action;
    std::vector<std::string> targets;
    // Options borealis does not know, handed to pacman unchanged.
    std::vector<std::string> passthrough;
    std::optional<std::filesystem::path> config_file;
    bool help = false;
    bool default_config = false;
};

// Parses `borealis <operation> [options] [package(s)]`. Throws UsageError for
// a missing, duplicated or malformed operation and for missing targets, and
// lets cxxopts exceptions through for malformed option values.
CommandLine parse_command_line(int argc, const char* const argv[]);

// The switch selecting `action` on the command line ("-Q", "-Ss", ...).
std::string action_switch(Capability action);

std::string usage_text(const std::string& program);
// Loaded backends and the switches each of them supports.
std::string backend_help(const Dispatcher& dispatcher);
