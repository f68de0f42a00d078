#include "cli.hpp"
#include "dispatcher.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

namespace {

cxxopts::Options make_options(const std::string& program) {
    cxxopts::Options options(program, get_string("info.usage_summary"));
    options.allow_unrecognised_options();
    options.custom_help(get_string("info.usage_custom_help"));
    options.positional_help(get_string("info.usage_positional_help"));

    options.add_options()
        ("S,sync", get_string("info.sync_desc"))
        ("s,search", get_string("info.search_desc"))
        ("u,sysupgrade", get_string("info.sysupgrade_desc"))
        ("Q,query", get_string("info.query_desc"))
        ("R,remove", get_string("info.remove_desc"))
        ("h,help", get_string("info.help_desc"))
        ("default-config", get_string("info.default_config_desc"))
        ("c,config", get_string("info.config_desc"), cxxopts::value<std::string>())
        ("targets", "", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"targets"});
    return options;
}

}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    auto options = make_options(argc > 0 ? argv[0] : "borealis");
    auto result = options.parse(argc, argv);

    CommandLine cmd;
    cmd.help = result.count("help") > 0;
    cmd.default_config = result.count("default-config") > 0;
    if (result.count("config")) {
        cmd.config_file = expand_path(result["config"].as<std::string>());
    }
    if (result.count("targets")) {
        cmd.targets = result["targets"].as<std::vector<std::string>>();
    }
    cmd.passthrough = result.unmatched();

    const bool sync = result.count("sync") > 0;
    const bool search = result.count("search") > 0;
    const bool upgrade = result.count("sysupgrade") > 0;
    const int operations = static_cast<int>(sync) + static_cast<int>(result.count("query") > 0) +
                           static_cast<int>(result.count("remove") > 0);

    if (operations > 1) {
        throw UsageError(get_string("error.multiple_operations"));
    }
    if ((search || upgrade) && (!sync || (search && upgrade))) {
        throw UsageError(get_string("error.invalid_option"));
    }

    if (sync) {
        cmd.action = search ? Capability::Search : upgrade ? Capability::Upgrade : Capability::Sync;
    } else if (result.count("query")) {
        cmd.action = Capability::Query;
    } else if (result.count("remove")) {
        cmd.action = Capability::Remove;
    }

    if (cmd.help || cmd.default_config) {
        return cmd;
    }
    if (!cmd.action) {
        throw UsageError(get_string("error.no_operation"));
    }
    const bool needs_targets = *cmd.action == Capability::Sync || *cmd.action == Capability::Search ||
                               *cmd.action == Capability::Remove;
    if (needs_targets && cmd.targets.empty()) {
        throw UsageError(get_string("error.no_targets"));
    }
    return cmd;
}

std::string action_switch(Capability action) {
    switch (action) {
    case Capability::Query: return "-Q";
    case Capability::Remove: return "-R";
    case Capability::Sync: return "-S";
    case Capability::Search: return "-Ss";
    case Capability::Upgrade: return "-Su";
    default:
        throw UsageError(string_format("error.unknown_capability", capability_name(action)));
    }
}

std::string usage_text(const std::string& program) {
    return make_options(program).help();
}

std::string backend_help(const Dispatcher& dispatcher) {
    std::string out = get_string("info.backends_heading") + "\n";
    for (const auto& backend : dispatcher.backends()) {
        std::vector<std::string> switches;
        for (Capability action : ACTIONS) {
            if (backend->capabilities().test(action)) switches.push_back(action_switch(action));
        }
        out += "  " + backend->name() + ": " + join(switches, " ") + "\n";
    }
    return out;
}
