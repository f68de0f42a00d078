#pragma once

#include "package.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

// A lazily produced, single-pass sequence of packages.
//
// The producer is called on demand and returns std::nullopt once exhausted;
// nothing is computed until the consumer pulls.
class PackageStream {
public:
    using Producer = std::function<std::optional<Package>()>;

    PackageStream() = default;
    explicit PackageStream(Producer producer) : producer_(std::move(producer)) {}

    static PackageStream from_vector(std::vector<Package> packages) {
        auto items = std::make_shared<std::vector<Package>>(std::move(packages));
        auto pos = std::make_shared<size_t>(0);
        return PackageStream([items, pos]() -> std::optional<Package> {
            if (*pos >= items->size()) return std::nullopt;
            return std::move((*items)[(*pos)++]);
        });
    }

    // Yields every package of `first`, then every package of `second`.
    static PackageStream concat(PackageStream first, PackageStream second) {
        auto a = std::make_shared<PackageStream>(std::move(first));
        auto b = std::make_shared<PackageStream>(std::move(second));
        return PackageStream([a, b]() -> std::optional<Package> {
            if (auto pkg = a->next()) return pkg;
            return b->next();
        });
    }

    // Keeps the packages for which `pred` holds.
    PackageStream filter(std::function<bool(const Package&)> pred) && {
        auto source = std::make_shared<PackageStream>(std::move(*this));
        return PackageStream([source, pred = std::move(pred)]() -> std::optional<Package> {
            while (auto pkg = source->next()) {
                if (pred(*pkg)) return pkg;
            }
            return std::nullopt;
        });
    }

    std::optional<Package> next() {
        if (!producer_) return std::nullopt;
        auto pkg = producer_();
        if (!pkg) producer_ = nullptr;
        return pkg;
    }

    std::vector<Package> collect() {
        std::vector<Package> out;
        while (auto pkg = next()) out.push_back(std::move(*pkg));
        return out;
    }

private:
    Producer producer_;
};
