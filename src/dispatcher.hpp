#pragma once

#include "backend.hpp"
#include "capability.hpp"
#include "config.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

class CommandRunner;
class HttpClient;

struct DispatchReport {
    enum class Status {
        Ok,
        NoResults,
    };

    Status status = Status::NoResults;
    size_t succeeded = 0;
    // Items no backend could handle.
    size_t exhausted = 0;
    size_t failed = 0;
    // Packages rendered by the QUERY and SEARCH post hooks.
    size_t rendered = 0;

    int exit_code() const { return failed > 0 ? 1 : 0; }
};

// Routes actions across the ordered backend chain.
//
// SEARCH and UPGRADE aggregate: every capable backend is consulted. QUERY,
// SYNC and REMOVE are routed: an item stops at the first backend that
// succeeds, and a deferring backend hands the item to the next one. A failed
// item is reported and not retried.
class Dispatcher {
public:
    Dispatcher(FrontendConfig config, CommandRunner& runner, HttpClient& http, std::ostream& out = std::cout);
    ~Dispatcher();
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Creates the backends named in backend_order from the registry, each
    // configured from its own section. Backends whose initialization throws
    // are dropped with an error. Throws BorealisException when no backend
    // remains.
    void load_backends(const ConfigStore& config);

    // Initializes and appends `backend`. Returns false, after logging, if
    // initialization threw.
    bool add_backend(std::unique_ptr<Backend> backend);

    const std::vector<std::unique_ptr<Backend>>& backends() const { return backends_; }

    // Runs `action` for `names` and renders the results. Re-entrant: a
    // backend may dispatch further actions while handling one.
    DispatchReport dispatch(Capability action, const std::vector<std::string>& names);

    // Depth of nested dispatch calls; 0 when idle.
    size_t depth() const { return action_stack_.size(); }
    bool dispatching(Capability action) const;

    // Arguments from the command line meant for pacman.
    const std::vector<std::string>& passthrough_args() const { return passthrough_args_; }
    void set_passthrough_args(std::vector<std::string> args) { passthrough_args_ = std::move(args); }

    const FrontendConfig& config() const { return config_; }
    CommandRunner& command_runner() { return runner_; }
    HttpClient& http_client() { return http_; }

private:
    struct Item {
        std::vector<std::string> targets;
        bool succeeded = false;
        bool failed = false;
    };

    std::vector<Item> make_items(Capability action, const std::vector<std::string>& names) const;
    void run_post_hook(Capability action, PackageStream results, DispatchReport& report);

    FrontendConfig config_;
    CommandRunner& runner_;
    HttpClient& http_;
    std::ostream& out_;
    std::vector<std::unique_ptr<Backend>> backends_;
    std::vector<Capability> action_stack_;
    std::vector<std::string> passthrough_args_;
};
