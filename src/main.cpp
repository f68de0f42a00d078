#include "backend_registry.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <unistd.h>

namespace {

const char* interrupted_message = "interrupted\n";

void handle_sigint(int) {
    // Only async-signal-safe calls here.
    ssize_t ignored = write(STDERR_FILENO, "\n", 1);
    ignored = write(STDERR_FILENO, interrupted_message, strlen(interrupted_message));
    (void)ignored;
    _exit(0);
}

void add_all_defaults(ConfigStore& store) {
    store.add_defaults(std::string(FrontendConfig::SECTION), FrontendConfig::defaults());
    for (const auto& entry : backend_registry()) {
        store.add_defaults(std::string(entry.name), entry.defaults());
    }
}

// Adds missing defaults to the first config file read, so users can see and
// edit every setting.
void complete_config_file(const fs::path& path) {
    try {
        auto file = ConfigStore::parse(read_file(path));
        bool added = file.add_defaults(std::string(FrontendConfig::SECTION), FrontendConfig::defaults());
        for (const auto& entry : backend_registry()) {
            added = file.add_defaults(std::string(entry.name), entry.defaults()) || added;
        }
        if (added) {
            file.write(path);
            log_info(string_format("info.config_updated", path.string()));
        }
    } catch (const BorealisException& e) {
        log_warning(string_format("warning.config_write_failed", path.string(), std::string(e.what())));
    }
}

ConfigStore load_config(const CommandLine& cmd) {
    const auto locations = cmd.config_file ? std::vector<fs::path>{*cmd.config_file} : default_config_locations();
    ConfigStore store = ConfigStore::load(locations);
    complete_config_file(store.sources().front());
    add_all_defaults(store);
    return store;
}

}

int main(int argc, char* argv[]) {
    try {
        init_localization();
        std::signal(SIGINT, handle_sigint);
        CurlGlobalInitializer curl_init;

        const CommandLine cmd = parse_command_line(argc, argv);

        if (cmd.default_config) {
            ConfigStore defaults;
            add_all_defaults(defaults);
            std::cout << defaults.dump();
            return 0;
        }

        std::optional<ConfigStore> store;
        try {
            store = load_config(cmd);
        } catch (const NoConfigFoundError& e) {
            if (!cmd.help) {
                log_error(e.what());
                log_info(get_string("info.generate_config_hint"));
                return 1;
            }
        }

        SystemCommandRunner runner;
        CurlHttpClient http;
        const auto frontend = FrontendConfig::from_section(store ? store->section(FrontendConfig::SECTION) : ConfigSection());
        Dispatcher dispatcher(frontend, runner, http);
        dispatcher.set_passthrough_args(cmd.passthrough);

        if (cmd.help) {
            std::cout << usage_text(argv[0]);
            if (store) {
                dispatcher.load_backends(*store);
                std::cout << "\n" << backend_help(dispatcher);
            }
            return 0;
        }

        dispatcher.load_backends(*store);
        const auto report = dispatcher.dispatch(*cmd.action, cmd.targets);
        return report.exit_code();

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", std::string(e.what())));
        return 1;
    } catch (const UsageError& e) {
        log_error(e.what());
        return 1;
    } catch (const FormatError& e) {
        log_error(string_format("error.format_error", std::string(e.what())));
        return 1;
    } catch (const BorealisException& e) {
        log_error(string_format("error.borealis_error", std::string(e.what())));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", std::string(e.what())));
        return 1;
    }
}
