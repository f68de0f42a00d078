#include <gtest/gtest.h>
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/package.hpp"

#include <string>
#include <vector>

namespace {

std::string text(const std::optional<FieldValue>& value) {
    return value ? field_to_string(*value) : "<absent>";
}

FieldMap complete_fields() {
    return {
        {"name", "borealis-git"},
        {"pkgver", "0.3.r12"},
        {"pkgrel", "2"},
        {"desc", "A frontend"},
        {"depends", std::vector<std::string>{"glibc", "curl>=8.0"}},
        {"makedepends", "cmake"},
    };
}

}

class PackageTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }
};

TEST_F(PackageTest, AliasesResolveToCanonicalFields) {
    const auto metadata = PackageMetadata::from_fields({
        {"pkgname", "foo"},
        {"version", "1.0-1"},
        {"pkgdesc", "described"},
        {"pkgsite", "https://example.org"},
        {"repository", "extra"},
        {"csize", "1024"},
        {"packagebase", "foo-base"},
        {"numvotes", "12"},
        {"firstsubmitted", "100"},
        {"lastmodified", "200"},
        {"requiredby", std::vector<std::string>{"bar", "baz"}},
    });
    EXPECT_EQ(metadata.name, "foo");
    EXPECT_EQ(metadata.description, "described");
    EXPECT_EQ(metadata.url, "https://example.org");
    EXPECT_EQ(metadata.repo, "extra");
    EXPECT_EQ(metadata.size, "1024");
    EXPECT_EQ(metadata.base, "foo-base");
    EXPECT_EQ(metadata.votes, "12");
    EXPECT_EQ(metadata.submitted, "100");
    EXPECT_EQ(metadata.lastupdate, "200");
    EXPECT_EQ(metadata.required_by, (std::vector<std::string>{"bar", "baz"}));
    EXPECT_TRUE(metadata.extra.empty());
}

TEST_F(PackageTest, GetAcceptsAliases) {
    const auto metadata = PackageMetadata::from_fields(complete_fields());
    EXPECT_EQ(text(metadata.get("description")), "A frontend");
    EXPECT_EQ(text(metadata.get("desc")), "A frontend");
    EXPECT_EQ(text(metadata.get("pkgdesc")), "A frontend");
}

TEST_F(PackageTest, MissingKnownFieldIsEmptyNotAnError) {
    const auto metadata = PackageMetadata::from_fields({{"name", "foo"}, {"version", "1.0"}});
    EXPECT_EQ(text(metadata.get("desc")), "");
    EXPECT_EQ(text(metadata.get("description")), "");
    EXPECT_EQ(text(metadata.get("site")), "");
}

TEST_F(PackageTest, UnknownKeysGoToExtra) {
    const auto metadata = PackageMetadata::from_fields({{"name", "foo"}, {"version", "1.0"}, {"pgpsig", "abc"}});
    EXPECT_EQ(text(metadata.get("pgpsig")), "abc");
    EXPECT_EQ(text(metadata.get("nonexistent")), "<absent>");
}

TEST_F(PackageTest, StrictRejectsUnknownKeys) {
    EXPECT_THROW(PackageMetadata::from_fields({{"name", "foo"}, {"version", "1.0"}, {"pgpsig", "abc"}}, false, true),
                 MetadataError);
    EXPECT_NO_THROW(PackageMetadata::from_fields({{"name", "foo"}, {"version", "1.0"}, {"desc", "ok"}}, false, true));
}

TEST_F(PackageTest, RequiredFields) {
    EXPECT_THROW(PackageMetadata::from_fields({{"pkgver", "1.0"}, {"pkgrel", "1"}}), MetadataError);
    EXPECT_THROW(PackageMetadata::from_fields({{"name", "foo"}, {"pkgver", "1.0"}}), MetadataError);
    EXPECT_THROW(PackageMetadata::from_fields({{"name", "foo"}, {"pkgrel", "1"}}), MetadataError);
    EXPECT_NO_THROW(PackageMetadata::from_fields({{"name", "foo"}, {"pkgver", "1.0"}, {"pkgrel", "1"}}));
}

TEST_F(PackageTest, LazyOnlyNeedsName) {
    const auto metadata = PackageMetadata::from_fields({{"name", "foo"}}, true);
    EXPECT_EQ(metadata.name, "foo");
    EXPECT_FALSE(metadata.version.has_value());
    EXPECT_THROW(PackageMetadata::from_fields({{"desc", "nameless"}}, true), MetadataError);
}

TEST_F(PackageTest, VersionDerivedFromParts) {
    const auto metadata = PackageMetadata::from_fields({{"name", "foo"}, {"epoch", "2"}, {"pkgver", "1.5"}, {"pkgrel", "3"}});
    ASSERT_TRUE(metadata.version.has_value());
    EXPECT_EQ(*metadata.version, Version(2, "1.5", 3));
    EXPECT_EQ(text(metadata.get("version")), "2:1.5-3");
}

TEST_F(PackageTest, PartsDerivedFromVersion) {
    const auto metadata = PackageMetadata::from_fields({{"name", "foo"}, {"version", "1:0.9-4"}});
    EXPECT_EQ(metadata.pkgver, "0.9");
    EXPECT_EQ(metadata.pkgrel, "4");
    EXPECT_EQ(metadata.epoch, "1");
}

TEST_F(PackageTest, MalformedVersionIsFormatError) {
    EXPECT_THROW(PackageMetadata::from_fields({{"name", "foo"}, {"version", "1.0-x"}}), FormatError);
}

TEST_F(PackageTest, DependenciesAreParsed) {
    const auto metadata = PackageMetadata::from_fields(complete_fields());
    ASSERT_EQ(metadata.depends.size(), 2u);
    EXPECT_EQ(metadata.depends[0], Dependency("glibc"));
    EXPECT_EQ(metadata.depends[1].name(), "curl");
    EXPECT_TRUE(metadata.depends[1].constrained());
    ASSERT_EQ(metadata.makedepends.size(), 1u);
    EXPECT_EQ(metadata.makedepends[0].name(), "cmake");
    EXPECT_EQ(text(metadata.get("depends")), "glibc curl>=8.0");
}

TEST_F(PackageTest, ChecksumsPreferenceOrder) {
    auto metadata = PackageMetadata::from_fields({{"name", "foo"}, {"version", "1.0"}, {"md5sums", "m"}, {"sha512sums", "s5"}});
    EXPECT_EQ(metadata.checksums(), std::vector<std::string>{"s5"});
    metadata.set("sha256sums", std::vector<std::string>{"a", "b"});
    EXPECT_EQ(metadata.checksums(), (std::vector<std::string>{"a", "b"}));
    metadata.set("sha1sums", "s1");
    EXPECT_EQ(metadata.checksums(), std::vector<std::string>{"s1"});

    const auto only_md5 = PackageMetadata::from_fields({{"name", "foo"}, {"version", "1.0"}, {"md5sums", "m"}});
    EXPECT_EQ(only_md5.checksums(), std::vector<std::string>{"m"});
}

TEST_F(PackageTest, PackagesEqualByName) {
    const auto a = Package::from_fields({{"name", "foo"}, {"version", "1.0"}});
    const auto b = Package::from_fields({{"name", "foo"}, {"version", "2.0"}});
    const auto c = Package::from_fields({{"name", "bar"}, {"version", "1.0"}});
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST_F(PackageTest, InstalledVersion) {
    auto pkg = Package::from_fields({{"name", "foo"}, {"version", "2.0"}});
    EXPECT_FALSE(pkg.installed());
    EXPECT_EQ(text(pkg.get("installed_version")), "");
    pkg.set_installed_version(Version::parse("1.0-1"));
    EXPECT_TRUE(pkg.installed());
    EXPECT_EQ(text(pkg.get("installed_version")), "1.0-1");
    EXPECT_EQ(text(pkg.get("name")), "foo");
}

TEST_F(PackageTest, ToString) {
    EXPECT_EQ(Package::from_fields({{"name", "foo"}, {"version", "1:2.0-1"}}).to_string(), "foo 1:2.0-1");
    EXPECT_EQ(Package::from_fields({{"name", "foo"}}, true).to_string(), "foo");
}

TEST_F(PackageTest, AllDependsCombinesRuntimeAndBuild) {
    const auto pkg = Package(PackageMetadata::from_fields(complete_fields()));
    const auto deps = pkg.all_depends();
    ASSERT_EQ(deps.size(), 3u);
    EXPECT_EQ(deps[2].name(), "cmake");
}
