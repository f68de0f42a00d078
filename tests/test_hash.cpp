#include <gtest/gtest.h>
#include "../src/archive.hpp"
#include "../src/downloader.hpp"
#include "../src/exception.hpp"
#include "../src/hash.hpp"
#include "../src/localization.hpp"
#include "test_helpers.hpp"

#include <algorithm>

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    TempDir dir{"hash"};
};

TEST_F(HashTest, Sha256OfKnownContent) {
    write_text(dir / "abc.txt", "abc");
    EXPECT_EQ(calculate_sha256(dir / "abc.txt"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    write_text(dir / "empty.txt", "");
    EXPECT_EQ(calculate_sha256(dir / "empty.txt"), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, Sha256OfMissingFileThrows) {
    EXPECT_THROW(calculate_sha256(dir / "missing"), BorealisException);
}

TEST_F(HashTest, ExtractsArchives) {
    write_text(dir / "src" / "pkg" / "PKGBUILD", "pkgname=pkg\n");
    write_text(dir / "src" / "pkg" / "patches" / "fix.patch", "--- a\n+++ b\n");
    make_tarball(dir / "src", dir / "pkg.tar.gz", "pkg");

    const auto count = extract_archive(dir / "pkg.tar.gz", dir / "out");
    EXPECT_GE(count, 4);
    EXPECT_EQ(read_file(dir / "out" / "pkg" / "PKGBUILD"), "pkgname=pkg\n");
    EXPECT_TRUE(fs::is_regular_file(dir / "out" / "pkg" / "patches" / "fix.patch"));
}

TEST_F(HashTest, ArchiveReaderYieldsRegularFiles) {
    write_text(dir / "src" / "a" / "desc", "%NAME%\na\n");
    write_text(dir / "src" / "b" / "desc", "%NAME%\nb\n");
    make_tarball(dir / "src", dir / "db.tar.gz");

    ArchiveReader reader(dir / "db.tar.gz");
    std::vector<std::string> paths;
    while (auto entry = reader.next()) {
        EXPECT_FALSE(entry->path.starts_with("./"));
        paths.push_back(entry->path);
    }
    std::ranges::sort(paths);
    EXPECT_EQ(paths, (std::vector<std::string>{"a/desc", "b/desc"}));
}

TEST_F(HashTest, UnreadableArchiveThrows) {
    EXPECT_THROW(ArchiveReader(dir / "missing.tar.gz"), BorealisException);
    EXPECT_THROW(extract_archive(dir / "missing.tar.gz", dir / "out"), BorealisException);
}

TEST_F(HashTest, PathsCannotEscapeTheRoot) {
    EXPECT_EQ(validate_path("pkg/PKGBUILD", "/tmp/root"), fs::path("/tmp/root/pkg/PKGBUILD"));
    EXPECT_EQ(validate_path("/etc/passwd", "/tmp/root"), fs::path("/tmp/root/etc/passwd"));
    EXPECT_THROW(validate_path("../../etc/passwd", "/tmp/root"), BorealisException);
}

TEST_F(HashTest, UrlHelpers) {
    EXPECT_EQ(url_encode("shell prompt"), "shell%20prompt");
    EXPECT_EQ(url_encode("c++&x=1"), "c%2B%2B%26x%3D1");
    EXPECT_EQ(url_encode("a-b_c.d~"), "a-b_c.d~");
    EXPECT_EQ(join_url("https://aur.archlinux.org/", "/cgit/aur.git/snapshot/x.tar.gz"),
              "https://aur.archlinux.org/cgit/aur.git/snapshot/x.tar.gz");
    EXPECT_EQ(join_url("https://aur.archlinux.org", "cgit/x"), "https://aur.archlinux.org/cgit/x");
    EXPECT_EQ(join_url("https://aur.archlinux.org/", "https://mirror.example/x"), "https://mirror.example/x");
}

TEST_F(HashTest, CurlClientReadsLocalUrls) {
    CurlGlobalInitializer curl;
    write_text(dir / "body.json", R"({"type":"search"})");
    CurlHttpClient client(1);
    const auto url = "file://" + (dir / "body.json").string();

    EXPECT_EQ(client.fetch(url), R"({"type":"search"})");
    client.download(url, dir / "copy.json");
    EXPECT_EQ(calculate_sha256(dir / "copy.json"), calculate_sha256(dir / "body.json"));

    EXPECT_THROW(client.fetch("file://" + (dir / "missing").string()), BorealisException);
    EXPECT_THROW(client.download("file://" + (dir / "missing").string(), dir / "missing.out"), BorealisException);
    EXPECT_FALSE(fs::exists(dir / "missing.out"));
}
