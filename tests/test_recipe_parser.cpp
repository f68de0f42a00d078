#include <gtest/gtest.h>
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/recipe_parser.hpp"
#include "test_helpers.hpp"

namespace {

const char* SPLIT_PKGBUILD = R"(# Maintainer: Someone <someone@example.org>
_realname=Demo
pkgname=('demo' 'demo-docs')
pkgver=1.2.3
pkgrel=2
pkgdesc="It's a \"demo\" package"
arch=('x86_64')
license=('MIT')
depends=('glibc' 'zlib>=1.2')
makedepends=(cmake)
source=("https://example.org/$_realname-$pkgver.tar.gz")
sha256sums=('SKIP')
echo "sourcing prints noise"

build() {
    cmake -B build
}

package_demo() {
    make install
}
)";

RecipeParserOptions without_fakeroot() {
    RecipeParserOptions options;
    options.use_fakeroot = false;
    return options;
}

}

class RecipeParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    TempDir dir{"recipe"};
    SystemCommandRunner runner;
};

TEST_F(RecipeParserTest, ParsesSetOutput) {
    const auto vars = parse_set_output(
        "BASH=/bin/bash\n"
        "pkgver=1.0\n"
        "1bad=x\n"
        "not an assignment\n"
        "build () \n"
        "{ \n"
        "    late=ignored\n"
        "}\n");
    EXPECT_EQ(vars.size(), 2u);
    EXPECT_EQ(vars.at("pkgver"), "1.0");
    EXPECT_EQ(vars.count("late"), 0u);
}

TEST_F(RecipeParserTest, DecodesBashQuoting) {
    EXPECT_EQ(std::get<std::string>(decode_bash_value("plain")), "plain");
    EXPECT_EQ(std::get<std::string>(decode_bash_value("'it'\\''s'")), "it's");
    EXPECT_EQ(std::get<std::string>(decode_bash_value("$'one\\ntwo'")), "one\ntwo");
    EXPECT_EQ(std::get<std::string>(decode_bash_value("\"say \\\"hi\\\"\"")), "say \"hi\"");
    EXPECT_EQ(std::get<std::vector<std::string>>(decode_bash_value("([0]=\"a b\" [1]=\"c\")")),
              (std::vector<std::string>{"a b", "c"}));
    EXPECT_TRUE(std::get<std::vector<std::string>>(decode_bash_value("()")).empty());
}

TEST_F(RecipeParserTest, EvaluatesRecipeWithBash) {
    write_text(dir / "PKGBUILD", SPLIT_PKGBUILD);
    const auto fields = parse_recipe(runner, dir / "PKGBUILD", without_fakeroot());

    EXPECT_EQ(std::get<std::string>(fields.at("pkgname")), "demo");
    EXPECT_EQ(std::get<std::string>(fields.at("pkgver")), "1.2.3");
    EXPECT_EQ(std::get<std::string>(fields.at("pkgdesc")), "It's a \"demo\" package");
    EXPECT_EQ(std::get<std::string>(fields.at("_realname")), "Demo");
    EXPECT_EQ(field_to_string(fields.at("source")), "https://example.org/Demo-1.2.3.tar.gz");
    EXPECT_EQ(field_to_string(fields.at("depends")), "glibc zlib>=1.2");
    EXPECT_EQ(fields.count("_"), 0u);
    EXPECT_EQ(fields.count("BASH_VERSION"), 0u);
    EXPECT_EQ(fields.count("PWD"), 0u);

    const auto metadata = PackageMetadata::from_fields(fields);
    EXPECT_EQ(metadata.version, Version::parse("1.2.3-2"));
    ASSERT_EQ(metadata.depends.size(), 2u);
    EXPECT_EQ(metadata.depends[1].name(), "zlib");
}

TEST_F(RecipeParserTest, OverridesWin) {
    write_text(dir / "PKGBUILD", SPLIT_PKGBUILD);
    const auto fields = parse_recipe(runner, dir / "PKGBUILD", without_fakeroot(), {{"pkgname", "demo-docs"}});
    EXPECT_EQ(std::get<std::string>(fields.at("pkgname")), "demo-docs");
}

TEST_F(RecipeParserTest, FailingRecipeThrows) {
    write_text(dir / "PKGBUILD", "pkgname=broken\nexit 3\n");
    EXPECT_THROW(parse_recipe(runner, dir / "PKGBUILD", without_fakeroot()), BorealisException);
    EXPECT_THROW(parse_recipe(runner, dir / "missing" / "PKGBUILD", without_fakeroot()), BorealisException);
}

TEST_F(RecipeParserTest, SlowRecipeTimesOut) {
    write_text(dir / "PKGBUILD", "pkgname=slow\nsleep 30\n");
    auto options = without_fakeroot();
    options.timeout = std::chrono::seconds(1);
    EXPECT_THROW(parse_recipe(runner, dir / "PKGBUILD", options), BorealisException);
}

TEST_F(RecipeParserTest, FakerootWrapsBothInvocations) {
    FakeCommandRunner fake;
    fake.on("set bash ./PKGBUILD", make_result(0, "pkgname=demo\npkgver=1\npkgrel=1\n"));
    write_text(dir / "PKGBUILD", "pkgname=demo\n");

    const auto fields = parse_recipe(fake, dir / "PKGBUILD", RecipeParserOptions{});
    EXPECT_EQ(fields.size(), 3u);
    ASSERT_EQ(fake.calls.size(), 2u);
    for (const auto& call : fake.calls) {
        EXPECT_EQ(call.argv.front(), "fakeroot");
        EXPECT_EQ(call.options.cwd, dir.path());
        EXPECT_TRUE(call.options.timeout.has_value());
    }
}
