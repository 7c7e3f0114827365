#include <catch2/catch.hpp>
#include <strata/glob.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace strata;

static fs::path make_temp_dir() {
    static int counter = 0;
    auto p = fs::path("/tmp/strata_test_glob_" + std::to_string(getpid())
                      + "_" + std::to_string(counter++));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static void touch(const fs::path& p) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p);
    f << "x";
}

// ---- Literal matching ----

TEST_CASE("glob literal exact match", "[glob]") {
    REQUIRE(glob_match("usr/bin/hello", "usr/bin/hello"));
    REQUIRE_FALSE(glob_match("usr/bin/hello", "usr/bin/hola"));
    REQUIRE_FALSE(glob_match("Hello", "hello"));
}

TEST_CASE("glob ignores ./ segments and doubled slashes", "[glob]") {
    REQUIRE(glob_match("./usr/bin", "usr/bin"));
    REQUIRE(glob_match("usr//bin", "usr/bin"));
}

// ---- Wildcards ----

TEST_CASE("glob star stays within a segment", "[glob]") {
    REQUIRE(glob_match("usr/bin/*", "usr/bin/hello"));
    REQUIRE_FALSE(glob_match("usr/bin/*", "usr/bin/sub/hello"));
    REQUIRE(glob_match("lib*.so", "libfoo.so"));
    REQUIRE_FALSE(glob_match("lib*.so", "libfoo.so.1"));
}

TEST_CASE("glob question mark single char", "[glob]") {
    REQUIRE(glob_match("file?.txt", "file1.txt"));
    REQUIRE_FALSE(glob_match("file?.txt", "file12.txt"));
}

TEST_CASE("glob doublestar spans segments", "[glob]") {
    REQUIRE(glob_match("**/*.pc", "usr/lib/pkgconfig/foo.pc"));
    REQUIRE(glob_match("**/foo.pc", "foo.pc"));
    REQUIRE(glob_match("usr/**/hello", "usr/hello"));
    REQUIRE(glob_match("usr/**/hello", "usr/a/b/hello"));
    REQUIRE(glob_match("usr/**", "usr/a/b/c"));
}

TEST_CASE("glob character classes", "[glob]") {
    REQUIRE(glob_match("[abc].h", "a.h"));
    REQUIRE_FALSE(glob_match("[abc].h", "d.h"));
    REQUIRE(glob_match("[a-z].h", "m.h"));
    REQUIRE_FALSE(glob_match("[a-z].h", "M.h"));
    REQUIRE(glob_match("[!0-9].h", "a.h"));
    REQUIRE_FALSE(glob_match("[!0-9].h", "5.h"));
}

TEST_CASE("glob_has_magic", "[glob]") {
    REQUIRE(glob_has_magic("*.so"));
    REQUIRE(glob_has_magic("lib?"));
    REQUIRE(glob_has_magic("[ab]"));
    REQUIRE_FALSE(glob_has_magic("usr/bin/hello"));
}

// ---- Filesystem ----

TEST_CASE("glob_expand matches files and directories", "[glob]") {
    auto root = make_temp_dir();
    touch(root / "usr/bin/hello");
    touch(root / "usr/bin/world");
    touch(root / "usr/share/doc/README");

    auto res = glob_expand("usr/*", root);
    REQUIRE(res.is_ok());
    REQUIRE(res.value() == std::vector<std::string>{"usr/bin", "usr/share"});

    auto bins = glob_expand("usr/bin/*", root);
    REQUIRE(bins.is_ok());
    REQUIRE(bins.value() == std::vector<std::string>{"usr/bin/hello", "usr/bin/world"});

    fs::remove_all(root);
}

TEST_CASE("glob_expand literal pattern checks existence", "[glob]") {
    auto root = make_temp_dir();
    touch(root / "etc/conf");

    auto hit = glob_expand("etc/conf", root);
    REQUIRE(hit.is_ok());
    REQUIRE(hit.value() == std::vector<std::string>{"etc/conf"});

    auto miss = glob_expand("etc/missing", root);
    REQUIRE(miss.is_ok());
    REQUIRE(miss.value().empty());

    fs::remove_all(root);
}

TEST_CASE("glob_expand includes symlinks", "[glob]") {
    auto root = make_temp_dir();
    touch(root / "lib/libfoo.so.1");
    fs::create_symlink("libfoo.so.1", root / "lib/libfoo.so");

    auto res = glob_expand("lib/*.so*", root);
    REQUIRE(res.is_ok());
    REQUIRE(res.value().size() == 2);

    fs::remove_all(root);
}

TEST_CASE("glob_expand missing root is an IO error", "[glob]") {
    auto res = glob_expand("*", "/tmp/strata_no_such_dir_for_glob");
    REQUIRE(res.is_err());
    REQUIRE(res.error().code == StrataError::IO);
}
