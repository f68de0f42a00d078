#include "backend.hpp"
#include "localization.hpp"

namespace {

OperationResult<PackageStream> as_stream_result(const OperationResult<Done>& result) {
    if (result.ok()) return OperationResult<PackageStream>::success(PackageStream());
    return result.forward<PackageStream>();
}

}

OperationResult<PackageStream> BoundOperation::operator()(const std::vector<std::string>& targets) const {
    switch (action_) {
    case Capability::Query:
        return backend_->query(targets.empty() ? std::nullopt : std::optional<std::string>(targets.front()));
    case Capability::Search:
        return backend_->search(targets);
    case Capability::Sync:
        if (targets.empty()) break;
        return as_stream_result(backend_->sync(targets.front()));
    case Capability::Remove:
        if (targets.empty()) break;
        return as_stream_result(backend_->remove(targets.front()));
    case Capability::Upgrade:
        return as_stream_result(backend_->upgrade());
    default:
        break;
    }
    return OperationResult<PackageStream>::fail(
        string_format("error.no_target_for_action", capability_name(action_)));
}

Backend::Backend(Dispatcher& dispatcher, std::string name)
    : dispatcher_(dispatcher), name_(std::move(name)) {}

std::optional<BoundOperation> Backend::get_method(Capability action) {
    if (!is_action(action) || !capabilities().test(action)) {
        return std::nullopt;
    }
    return BoundOperation(*this, action);
}

OperationResult<Done> Backend::unsupported(Capability action) const {
    return OperationResult<Done>::fail(string_format("error.backend_unsupported", name_, capability_name(action)));
}

OperationResult<PackageStream> Backend::query(const std::optional<std::string>&) {
    return unsupported(Capability::Query).forward<PackageStream>();
}

OperationResult<PackageStream> Backend::search(const std::vector<std::string>&) {
    return unsupported(Capability::Search).forward<PackageStream>();
}

OperationResult<Done> Backend::sync(const std::string&) {
    return unsupported(Capability::Sync);
}

OperationResult<Done> Backend::remove(const std::string&) {
    return unsupported(Capability::Remove);
}

OperationResult<Done> Backend::upgrade() {
    return unsupported(Capability::Upgrade);
}
