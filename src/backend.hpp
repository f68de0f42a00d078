#pragma once

#include "capability.hpp"
#include "operation_result.hpp"
#include "package_stream.hpp"

#include <optional>
#include <string>
#include <vector>

class Backend;
class Dispatcher;

// A backend operation selected for one action. Calling it forwards the
// dispatcher's targets to the matching virtual operation of the backend.
class BoundOperation {
public:
    BoundOperation(Backend& backend, Capability action) : backend_(&backend), action_(action) {}

    Backend& backend() const { return *backend_; }
    Capability action() const { return action_; }

    // SEARCH receives every target as one term list, QUERY at most one name,
    // SYNC and REMOVE exactly one, UPGRADE none. Side-effect actions succeed
    // with an empty stream.
    OperationResult<PackageStream> operator()(const std::vector<std::string>& targets) const;

private:
    Backend* backend_;
    Capability action_;
};

// A source of packages. Concrete backends declare which actions and search
// modifiers they support through capabilities() and override the matching
// operations; every other operation fails.
class Backend {
public:
    Backend(Dispatcher& dispatcher, std::string name);
    virtual ~Backend() = default;
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    const std::string& name() const { return name_; }

    virtual CapabilitySet capabilities() const = 0;

    // Runs once after construction. Throwing drops the backend.
    virtual void initialize() {}

    // std::nullopt when `action` is not an action or not supported.
    std::optional<BoundOperation> get_method(Capability action);

    virtual OperationResult<PackageStream> query(const std::optional<std::string>& name);
    virtual OperationResult<PackageStream> search(const std::vector<std::string>& terms);
    virtual OperationResult<Done> sync(const std::string& name);
    virtual OperationResult<Done> remove(const std::string& name);
    virtual OperationResult<Done> upgrade();

protected:
    Dispatcher& dispatcher() { return dispatcher_; }
    const Dispatcher& dispatcher() const { return dispatcher_; }

    OperationResult<Done> unsupported(Capability action) const;

private:
    Dispatcher& dispatcher_;
    std::string name_;
};
