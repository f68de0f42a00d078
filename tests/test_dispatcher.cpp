#include <gtest/gtest.h>
#include "../src/backend_registry.hpp"
#include "../src/dispatcher.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "test_helpers.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <sstream>

namespace {

enum class Outcome {
    Succeed,
    Defer,
    Fail,
    Throw,
    ThrowUsage,
};

// Backend whose answers are scripted per target.
class ScriptedBackend : public Backend {
public:
    ScriptedBackend(Dispatcher& dispatcher, std::string name, CapabilitySet capabilities)
        : Backend(dispatcher, std::move(name)), capabilities_(capabilities) {}

    CapabilitySet capabilities() const override { return capabilities_; }

    void initialize() override {
        if (fail_initialize) throw BorealisException("database missing");
    }

    OperationResult<PackageStream> query(const std::optional<std::string>& name) override {
        queries.push_back(name);
        if (!name) return OperationResult<PackageStream>::success(PackageStream::from_vector(packages));
        for (const auto& pkg : packages) {
            if (pkg.name() == *name) return OperationResult<PackageStream>::success(PackageStream::from_vector({pkg}));
        }
        return OperationResult<PackageStream>::defer("not here");
    }

    OperationResult<PackageStream> search(const std::vector<std::string>& terms) override {
        searches.push_back(terms);
        if (!broken_stream) return OperationResult<PackageStream>::success(PackageStream::from_vector(packages));
        // Yields the first package, then fails on the next pull.
        auto pulls = std::make_shared<size_t>(0);
        auto first = packages.empty() ? std::nullopt : std::optional<Package>(packages.front());
        return OperationResult<PackageStream>::success(PackageStream([pulls, first]() -> std::optional<Package> {
            if ((*pulls)++ == 0 && first) return first;
            throw FormatError("bad record in " + std::to_string(*pulls));
        }));
    }

    OperationResult<Done> sync(const std::string& name) override {
        syncs.push_back(name);
        if (on_sync) on_sync(name);
        return outcome_for(name);
    }

    OperationResult<Done> remove(const std::string& name) override {
        removes.push_back(name);
        return outcome_for(name);
    }

    OperationResult<Done> upgrade() override {
        ++upgrades;
        return outcome_for("");
    }

    Dispatcher& owner() { return dispatcher(); }

    std::map<std::string, Outcome> outcomes;
    std::vector<Package> packages;
    bool fail_initialize = false;
    bool broken_stream = false;
    std::function<void(const std::string&)> on_sync;

    std::vector<std::optional<std::string>> queries;
    std::vector<std::vector<std::string>> searches;
    std::vector<std::string> syncs;
    std::vector<std::string> removes;
    int upgrades = 0;

private:
    OperationResult<Done> outcome_for(const std::string& name) {
        const auto it = outcomes.find(name);
        const auto outcome = it == outcomes.end() ? Outcome::Defer : it->second;
        switch (outcome) {
        case Outcome::Succeed: return OperationResult<Done>::success(Done{});
        case Outcome::Fail: return OperationResult<Done>::fail("broken " + name);
        case Outcome::Throw: throw BorealisException("exploded " + name);
        case Outcome::ThrowUsage: throw UsageError("misused " + name);
        case Outcome::Defer: break;
        }
        return OperationResult<Done>::defer("not mine");
    }

    CapabilitySet capabilities_;
};

Package make_package(const std::string& name, const std::string& repo) {
    return Package::from_fields({{"name", name}, {"version", "1.0-1"}, {"repo", repo}});
}

}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
        dispatcher = std::make_unique<Dispatcher>(
            frontend_config({{"output_fmt", "{repo}/{name}"}, {"output_fmt_query", "{name} {version}"}}),
            runner, http, out);
    }

    ScriptedBackend& add(const std::string& name, CapabilitySet capabilities = CapabilitySet::all()) {
        auto backend = std::make_unique<ScriptedBackend>(*dispatcher, name, capabilities);
        auto& ref = *backend;
        EXPECT_TRUE(dispatcher->add_backend(std::move(backend)));
        return ref;
    }

    FakeCommandRunner runner;
    FakeHttpClient http;
    std::ostringstream out;
    std::unique_ptr<Dispatcher> dispatcher;
};

TEST_F(DispatcherTest, DeferredItemMovesToNextBackend) {
    auto& first = add("first");
    auto& second = add("second");
    second.outcomes["foo"] = Outcome::Succeed;

    const auto report = dispatcher->dispatch(Capability::Sync, {"foo"});
    EXPECT_EQ(first.syncs, std::vector<std::string>{"foo"});
    EXPECT_EQ(second.syncs, std::vector<std::string>{"foo"});
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.status, DispatchReport::Status::Ok);
    EXPECT_EQ(report.exit_code(), 0);
}

TEST_F(DispatcherTest, RoutingStopsAtFirstSuccess) {
    auto& first = add("first");
    auto& second = add("second");
    first.outcomes["foo"] = Outcome::Succeed;

    dispatcher->dispatch(Capability::Sync, {"foo"});
    EXPECT_EQ(first.syncs.size(), 1u);
    EXPECT_TRUE(second.syncs.empty());
}

TEST_F(DispatcherTest, ItemsAreRoutedIndependently) {
    auto& first = add("first");
    auto& second = add("second");
    first.outcomes["foo"] = Outcome::Succeed;
    second.outcomes["bar"] = Outcome::Succeed;

    const auto report = dispatcher->dispatch(Capability::Remove, {"foo", "bar"});
    EXPECT_EQ(first.removes, (std::vector<std::string>{"foo", "bar"}));
    EXPECT_EQ(second.removes, std::vector<std::string>{"bar"});
    EXPECT_EQ(report.succeeded, 2u);
}

TEST_F(DispatcherTest, EveryBackendDeferringExhaustsTheItem) {
    add("first");
    add("second");

    const auto report = dispatcher->dispatch(Capability::Sync, {"ghost"});
    EXPECT_EQ(report.exhausted, 1u);
    EXPECT_EQ(report.succeeded, 0u);
    EXPECT_EQ(report.status, DispatchReport::Status::NoResults);
    EXPECT_EQ(report.exit_code(), 0);
}

TEST_F(DispatcherTest, FailureIsNotRetried) {
    auto& first = add("first");
    auto& second = add("second");
    first.outcomes["foo"] = Outcome::Fail;
    second.outcomes["foo"] = Outcome::Succeed;
    second.outcomes["bar"] = Outcome::Succeed;

    const auto report = dispatcher->dispatch(Capability::Sync, {"foo", "bar"});
    EXPECT_EQ(second.syncs, std::vector<std::string>{"bar"});
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.exit_code(), 1);
}

TEST_F(DispatcherTest, EscapingErrorCountsAsFailure) {
    auto& first = add("first");
    auto& second = add("second");
    first.outcomes["foo"] = Outcome::Throw;

    const auto report = dispatcher->dispatch(Capability::Sync, {"foo"});
    EXPECT_TRUE(second.syncs.empty());
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(dispatcher->depth(), 0u);
}

TEST_F(DispatcherTest, UsageErrorIsTerminal) {
    auto& first = add("first");
    first.outcomes["foo"] = Outcome::ThrowUsage;
    EXPECT_THROW(dispatcher->dispatch(Capability::Sync, {"foo"}), UsageError);
    EXPECT_EQ(dispatcher->depth(), 0u);
}

TEST_F(DispatcherTest, UnsupportedBackendIsSkipped) {
    auto& first = add("first", CapabilitySet::all() ^ Capability::Sync);
    auto& second = add("second");
    second.outcomes["foo"] = Outcome::Succeed;

    const auto report = dispatcher->dispatch(Capability::Sync, {"foo"});
    EXPECT_TRUE(first.syncs.empty());
    EXPECT_EQ(report.succeeded, 1u);
}

TEST_F(DispatcherTest, SkippedBackendWarnsAndRoutingContinues) {
    auto& first = add("first");
    auto& second = add("second", CapabilitySet::all() ^ Capability::Sync);
    auto& third = add("third");
    third.outcomes["foo"] = Outcome::Succeed;

    testing::internal::CaptureStderr();
    const auto report = dispatcher->dispatch(Capability::Sync, {"foo"});
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(first.syncs, std::vector<std::string>{"foo"});
    EXPECT_TRUE(second.syncs.empty());
    EXPECT_EQ(third.syncs, std::vector<std::string>{"foo"});
    EXPECT_NE(errors.find("backend second does not support SYNC"), std::string::npos);
    EXPECT_EQ(errors.find("first"), std::string::npos);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.exhausted, 0u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_EQ(report.exit_code(), 0);
}

TEST_F(DispatcherTest, StreamErrorFailsOnlyThatBackend) {
    auto& first = add("first");
    auto& second = add("second");
    first.packages = {make_package("alpha", "core"), make_package("broken", "core")};
    first.broken_stream = true;
    second.packages = {make_package("beta", "aur")};

    testing::internal::CaptureStderr();
    DispatchReport report;
    EXPECT_NO_THROW(report = dispatcher->dispatch(Capability::Search, {"a"}));
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(out.str(), "core/alpha\naur/beta\n");
    EXPECT_NE(errors.find("first: bad record"), std::string::npos);
    EXPECT_EQ(report.rendered, 2u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_EQ(dispatcher->depth(), 0u);
}

TEST_F(DispatcherTest, SearchAggregatesInBackendOrder) {
    auto& first = add("first");
    auto& second = add("second");
    first.packages = {make_package("alpha", "core")};
    second.packages = {make_package("beta", "aur"), make_package("gamma", "aur")};

    const auto report = dispatcher->dispatch(Capability::Search, {"a", "b"});
    ASSERT_EQ(first.searches.size(), 1u);
    ASSERT_EQ(second.searches.size(), 1u);
    EXPECT_EQ(first.searches[0], (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(out.str(), "core/alpha\naur/beta\naur/gamma\n");
    EXPECT_EQ(report.rendered, 3u);
    EXPECT_EQ(report.status, DispatchReport::Status::Ok);
}

TEST_F(DispatcherTest, SearchWithoutMatchesReportsNoResults) {
    add("first");
    const auto report = dispatcher->dispatch(Capability::Search, {"nothing"});
    EXPECT_EQ(report.status, DispatchReport::Status::NoResults);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DispatcherTest, QueryWithoutNamesListsEverything) {
    auto& first = add("first");
    auto& second = add("second");
    first.packages = {make_package("alpha", "core"), make_package("beta", "extra")};

    const auto report = dispatcher->dispatch(Capability::Query, {});
    ASSERT_EQ(first.queries.size(), 1u);
    EXPECT_FALSE(first.queries[0].has_value());
    EXPECT_TRUE(second.queries.empty());
    EXPECT_EQ(out.str(), "alpha 1.0-1\nbeta 1.0-1\n");
    EXPECT_EQ(report.rendered, 2u);
}

TEST_F(DispatcherTest, NamedQueryUsesTheFirstBackendThatKnowsIt) {
    auto& first = add("first");
    auto& second = add("second");
    second.packages = {make_package("beta", "extra")};

    dispatcher->dispatch(Capability::Query, {"beta"});
    EXPECT_EQ(first.queries.size(), 1u);
    EXPECT_EQ(second.queries.size(), 1u);
    EXPECT_EQ(out.str(), "beta 1.0-1\n");
}

TEST_F(DispatcherTest, UpgradeRunsOnEveryBackend) {
    auto& first = add("first");
    auto& second = add("second");
    first.outcomes[""] = Outcome::Succeed;
    second.outcomes[""] = Outcome::Succeed;

    const auto report = dispatcher->dispatch(Capability::Upgrade, {});
    EXPECT_EQ(first.upgrades, 1);
    EXPECT_EQ(second.upgrades, 1);
    EXPECT_EQ(report.status, DispatchReport::Status::Ok);
}

TEST_F(DispatcherTest, FailedInitializationDropsTheBackend) {
    auto backend = std::make_unique<ScriptedBackend>(*dispatcher, "broken", CapabilitySet::all());
    backend->fail_initialize = true;
    EXPECT_FALSE(dispatcher->add_backend(std::move(backend)));
    EXPECT_TRUE(dispatcher->backends().empty());
}

TEST_F(DispatcherTest, BackendsMayDispatchWhileDispatching) {
    auto& first = add("first");
    first.outcomes["app"] = Outcome::Succeed;
    first.outcomes["lib"] = Outcome::Succeed;
    size_t nested_depth = 0;
    DispatchReport nested;
    first.on_sync = [&](const std::string& name) {
        if (name != "app") return;
        EXPECT_TRUE(first.owner().dispatching(Capability::Sync));
        nested = first.owner().dispatch(Capability::Sync, {"lib"});
        nested_depth = first.owner().depth();
    };

    const auto report = dispatcher->dispatch(Capability::Sync, {"app"});
    EXPECT_EQ(first.syncs, (std::vector<std::string>{"app", "lib"}));
    EXPECT_EQ(nested.succeeded, 1u);
    EXPECT_EQ(nested_depth, 1u);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(dispatcher->depth(), 0u);
}

TEST_F(DispatcherTest, LoadingWithoutUsableBackendsThrows) {
    Dispatcher empty(frontend_config({{"backend_order", "nonexistent"}}), runner, http, out);
    EXPECT_THROW(empty.load_backends(ConfigStore()), BorealisException);
}

TEST_F(DispatcherTest, LoadsRegisteredBackendsInOrder) {
    Dispatcher configured(frontend_config({{"backend_order", "pacman, bogus, alpm"},
                                           {"alpm_db_path", "/nonexistent/borealis-db"}}),
                          runner, http, out);
    configured.load_backends(ConfigStore());
    ASSERT_EQ(configured.backends().size(), 1u);
    EXPECT_EQ(configured.backends()[0]->name(), "pacman");
    EXPECT_NE(find_backend_entry("aur"), nullptr);
    EXPECT_EQ(find_backend_entry("bogus"), nullptr);
}
