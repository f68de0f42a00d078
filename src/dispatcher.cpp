#include "dispatcher.hpp"
#include "backend_registry.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "output.hpp"
#include "utils.hpp"

#include <algorithm>
#include <memory>

namespace {

// Boundary errors escaping a backend count as a failure of that backend.
// Usage errors stay terminal.
OperationResult<PackageStream> invoke(const BoundOperation& method, const std::vector<std::string>& targets) {
    try {
        return method(targets);
    } catch (const UsageError&) {
        throw;
    } catch (const BorealisException& e) {
        return OperationResult<PackageStream>::fail(e.what());
    } catch (const fs::filesystem_error& e) {
        return OperationResult<PackageStream>::fail(e.what());
    }
}

// Ends the stream of `backend` at its first error, which counts as a failure
// of that backend. The stream must be drained before `failed` goes away.
PackageStream guard_stream(PackageStream stream, std::string backend, size_t& failed) {
    auto source = std::make_shared<PackageStream>(std::move(stream));
    return PackageStream([source, backend = std::move(backend), &failed]() -> std::optional<Package> {
        std::string error;
        try {
            return source->next();
        } catch (const UsageError&) {
            throw;
        } catch (const BorealisException& e) {
            error = e.what();
        } catch (const fs::filesystem_error& e) {
            error = e.what();
        }
        log_error(string_format("error.backend_failed", backend, error));
        ++failed;
        *source = PackageStream();
        return std::nullopt;
    });
}

bool is_aggregating(Capability action) {
    return action == Capability::Search || action == Capability::Upgrade;
}

// Pops the action stack on every exit path of dispatch().
class ActionScope {
public:
    ActionScope(std::vector<Capability>& stack, Capability action) : stack_(stack) { stack_.push_back(action); }
    ~ActionScope() { stack_.pop_back(); }
    ActionScope(const ActionScope&) = delete;
    ActionScope& operator=(const ActionScope&) = delete;

private:
    std::vector<Capability>& stack_;
};

}

Dispatcher::Dispatcher(FrontendConfig config, CommandRunner& runner, HttpClient& http, std::ostream& out)
    : config_(std::move(config)), runner_(runner), http_(http), out_(out) {}

Dispatcher::~Dispatcher() = default;

void Dispatcher::load_backends(const ConfigStore& config) {
    for (const auto& name : config_.backend_order) {
        const auto* entry = find_backend_entry(name);
        if (!entry) {
            log_error(string_format("error.unknown_backend", name));
            continue;
        }
        try {
            add_backend(entry->create(*this, config.section(name)));
        } catch (const BorealisException& e) {
            log_error(string_format("error.backend_init_failed", name, std::string(e.what())));
        }
    }
    if (backends_.empty()) {
        throw BorealisException(get_string("error.no_backends"));
    }
}

bool Dispatcher::add_backend(std::unique_ptr<Backend> backend) {
    try {
        backend->initialize();
    } catch (const std::exception& e) {
        log_error(string_format("error.backend_init_failed", backend->name(), std::string(e.what())));
        return false;
    }
    backends_.push_back(std::move(backend));
    return true;
}

bool Dispatcher::dispatching(Capability action) const {
    return std::ranges::find(action_stack_, action) != action_stack_.end();
}

std::vector<Dispatcher::Item> Dispatcher::make_items(Capability action, const std::vector<std::string>& names) const {
    std::vector<Item> items;
    switch (action) {
    case Capability::Search:
        items.push_back({names});
        break;
    case Capability::Upgrade:
        items.push_back({});
        break;
    case Capability::Query:
        if (names.empty()) {
            items.push_back({});
            break;
        }
        [[fallthrough]];
    default:
        for (const auto& name : names) items.push_back({{name}});
        break;
    }
    return items;
}

DispatchReport Dispatcher::dispatch(Capability action, const std::vector<std::string>& names) {
    ActionScope scope(action_stack_, action);
    const auto& action_name = capability_name(action);

    DispatchReport report;
    auto items = make_items(action, names);
    PackageStream results;

    for (const auto& backend : backends_) {
        auto method = backend->get_method(action);
        if (!method) {
            log_warning(string_format("warning.backend_unsupported", backend->name(), action_name));
            continue;
        }
        for (auto& item : items) {
            if (item.failed) continue;
            if (item.succeeded && !is_aggregating(action)) continue;

            auto result = invoke(*method, item.targets);
            if (result.ok()) {
                item.succeeded = true;
                results = PackageStream::concat(std::move(results),
                                                guard_stream(std::move(result.value()), backend->name(), report.failed));
            } else if (result.failed()) {
                item.failed = true;
                ++report.failed;
                log_error(string_format("error.backend_failed", backend->name(), result.error()));
            }
        }
    }

    for (const auto& item : items) {
        if (item.succeeded) {
            ++report.succeeded;
        } else if (!item.failed) {
            ++report.exhausted;
            if (!item.targets.empty() && action != Capability::Search) {
                log_info(string_format("info.target_not_handled", item.targets.front()));
            }
        }
    }

    run_post_hook(action, std::move(results), report);

    if (report.status == DispatchReport::Status::NoResults && action_stack_.size() == 1) {
        log_info(get_string("info.no_results"));
    }
    return report;
}

void Dispatcher::run_post_hook(Capability action, PackageStream results, DispatchReport& report) {
    switch (action) {
    case Capability::Query:
    case Capability::Search: {
        PackagePrinter printer(config_, action, out_, &out_ == &std::cout && stdout_is_tty());
        while (auto pkg = results.next()) {
            printer.print(*pkg, ++report.rendered);
        }
        if (report.rendered > 0) report.status = DispatchReport::Status::Ok;
        break;
    }
    case Capability::Sync:
    case Capability::Remove:
    case Capability::Upgrade:
        if (report.succeeded > 0) report.status = DispatchReport::Status::Ok;
        break;
    default:
        break;
    }
}
