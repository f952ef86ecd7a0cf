#include "sshdeck/MockTransport.hpp"
#include <catch2/catch.hpp>

namespace sshdeck::test {

TEST_CASE("mock filesystem path normalization", "[mockfs]") {
    CHECK(MockFileSystem::normalize("") == "/");
    CHECK(MockFileSystem::normalize("a//b/") == "/a/b");
    CHECK(MockFileSystem::normalize("/a/./b/../c") == "/a/c");
    CHECK(MockFileSystem::normalize("/..") == "/");
}

TEST_CASE("mock filesystem lists direct children only", "[mockfs]") {
    MockFileSystem fs;
    fs.addFile("/a/x", "1");
    fs.addFile("/a/sub/deep", "22");
    fs.addFile("/a b", "sibling");
    fs.addDir("/ab");

    std::vector<FileInfo> out;
    Error err;
    REQUIRE(fs.list("/a", out, err));
    REQUIRE(out.size() == 2);
    CHECK(out[0].name == "sub");
    CHECK(out[0].is_dir);
    CHECK(out[1].name == "x");
    CHECK(out[1].size == 1);

    REQUIRE(fs.list("/", out, err));
    REQUIRE(out.size() == 3);
    CHECK(out[0].name == "a");
    CHECK(out[1].name == "a b");
    CHECK(out[2].name == "ab");

    CHECK_FALSE(fs.list("/a/x", out, err));
    CHECK(err.kind == ErrorKind::RemoteIOError);
    err.clear();
    CHECK_FALSE(fs.list("/missing", out, err));
    CHECK(err.kind == ErrorKind::RemoteIOError);
}

TEST_CASE("mock filesystem stat leaves error clear for missing paths", "[mockfs]") {
    MockFileSystem fs;
    fs.addFile("/f", "abc", 0600);
    FileInfo fi;
    Error err;
    REQUIRE(fs.stat("/f", fi, err));
    CHECK(fi.size == 3);
    CHECK((fi.mode & 07777) == 0600);
    CHECK_FALSE(fs.stat("/nope", fi, err));
    CHECK(err.ok());
}

TEST_CASE("mock filesystem directory operations", "[mockfs]") {
    MockFileSystem fs;
    Error err;

    REQUIRE(fs.mkdir("/d", 0700, err));
    CHECK(fs.isDir("/d"));
    CHECK(*fs.mode("/d") == 0700);
    CHECK_FALSE(fs.mkdir("/d", 0755, err));
    CHECK(err.kind == ErrorKind::RemoteIOError);
    err.clear();
    CHECK_FALSE(fs.mkdir("/no/such/parent", 0755, err));

    fs.addFile("/d/f", "x");
    err.clear();
    CHECK_FALSE(fs.removeDir("/d", err));
    CHECK(err.kind == ErrorKind::RemoteIOError);
    err.clear();
    CHECK_FALSE(fs.removeFile("/d", err));
    REQUIRE(fs.removeFile("/d/f", err));
    REQUIRE(fs.removeDir("/d", err));
    CHECK_FALSE(fs.exists("/d"));
}

TEST_CASE("mock filesystem rename moves subtrees", "[mockfs]") {
    MockFileSystem fs;
    fs.addFile("/src/one", "1");
    fs.addFile("/src/nested/two", "2");
    fs.addFile("/other", "o");
    Error err;

    REQUIRE(fs.rename("/src", "/dst", false, err));
    CHECK_FALSE(fs.exists("/src"));
    CHECK(*fs.content("/dst/one") == "1");
    CHECK(*fs.content("/dst/nested/two") == "2");

    CHECK_FALSE(fs.rename("/other", "/dst/one", false, err));
    CHECK(err.kind == ErrorKind::RemoteIOError);
    err.clear();
    REQUIRE(fs.rename("/other", "/dst/one", true, err));
    CHECK(*fs.content("/dst/one") == "o");

    CHECK_FALSE(fs.rename("/dst", "/dst/nested/inner", false, err));
}

TEST_CASE("mock filesystem read-only prefixes", "[mockfs]") {
    MockFileSystem fs;
    fs.addFile("/etc/passwd", "root");
    fs.setReadOnly("/etc");
    Error err;

    CHECK_FALSE(fs.removeFile("/etc/passwd", err));
    CHECK(err.kind == ErrorKind::PermissionDenied);
    err.clear();
    CHECK_FALSE(fs.chmod("/etc/passwd", 0777, err));
    CHECK(err.kind == ErrorKind::PermissionDenied);
    err.clear();
    CHECK_FALSE(fs.open("/etc/new", true, err));
    CHECK(err.kind == ErrorKind::PermissionDenied);
    err.clear();
    // Only the prefix itself and paths below it
    CHECK(fs.mkdir("/etcetera", 0755, err));
}

TEST_CASE("mock filesystem byte access", "[mockfs]") {
    MockFileSystem fs;
    fs.addDir("/up");
    Error err;
    REQUIRE(fs.open("/up/f", true, err));
    REQUIRE(fs.write("/up/f", 0, "hello", 5, err));
    REQUIRE(fs.write("/up/f", 5, " world", 6, err));

    std::string out;
    REQUIRE(fs.read("/up/f", 6, 100, out, err));
    CHECK(out == "world");
    REQUIRE(fs.read("/up/f", 50, 10, out, err));
    CHECK(out.empty());

    REQUIRE(fs.open("/up/f", false, err));
    CHECK(*fs.content("/up/f") == "hello world");
    REQUIRE(fs.open("/up/f", true, err));
    CHECK(fs.content("/up/f")->empty());
}

TEST_CASE("mock filesystem chunk hook", "[mockfs]") {
    MockFileSystem fs;
    std::vector<std::uint64_t> seen;
    fs.setChunkHook([&](const std::string& path, std::uint64_t done) {
        CHECK(path == "/x");
        seen.push_back(done);
    });
    fs.chunkDone("x", 10);
    fs.chunkDone("/x/", 20);
    CHECK(seen == std::vector<std::uint64_t>{10, 20});
}

}
