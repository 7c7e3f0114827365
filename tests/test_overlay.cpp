#include <catch2/catch.hpp>
#include <strata/overlay.hpp>
#include <strata/fsutil.hpp>
#include <strata/hash.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace strata;

static fs::path make_temp_dir() {
    static int counter = 0;
    auto p = fs::temp_directory_path() /
        ("strata_test_overlay_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static std::string read_file(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE("whiteout names", "[overlay]") {
    REQUIRE(is_whiteout(".wh.foo"));
    REQUIRE(is_whiteout(kOpaqueMarker));
    REQUIRE_FALSE(is_whiteout("foo"));
    REQUIRE_FALSE(is_whiteout(".whatever"));
}

TEST_CASE("apply honours whiteouts and opaque directories", "[overlay]") {
    auto tmp = make_temp_dir();
    auto target = tmp / "target";
    auto layer = tmp / "layer";
    REQUIRE(write_file(target / "a", "a").is_ok());
    REQUIRE(write_file(target / "d/x", "x").is_ok());
    REQUIRE(write_file(target / "d/y", "y").is_ok());
    REQUIRE(write_file(target / "o/old1", "1").is_ok());
    REQUIRE(write_file(target / "o/sub/old2", "2").is_ok());

    REQUIRE(write_file(layer / ".wh.a", "").is_ok());
    REQUIRE(write_file(layer / "d/.wh.x", "").is_ok());
    REQUIRE(write_file(layer / "o/.wh..wh..opq", "").is_ok());
    REQUIRE(write_file(layer / "o/new", "new").is_ok());
    REQUIRE(write_file(layer / "n", "n").is_ok());

    REQUIRE(OverlayManager::apply(layer, target).is_ok());

    REQUIRE_FALSE(fs::exists(target / "a"));
    REQUIRE_FALSE(fs::exists(target / "d/x"));
    REQUIRE(read_file(target / "d/y") == "y");
    REQUIRE_FALSE(fs::exists(target / "o/old1"));
    REQUIRE_FALSE(fs::exists(target / "o/sub"));
    REQUIRE(read_file(target / "o/new") == "new");
    REQUIRE(read_file(target / "n") == "n");
    REQUIRE_FALSE(fs::exists(target / ".wh.a"));
    REQUIRE_FALSE(fs::exists(target / "o/.wh..wh..opq"));
    fs::remove_all(tmp);
}

TEST_CASE("capture records changes and removals", "[overlay]") {
    auto tmp = make_temp_dir();
    auto lower = tmp / "lower";
    auto upper = tmp / "upper";
    auto layer = tmp / "layer";
    REQUIRE(write_file(lower / "keep", "same").is_ok());
    REQUIRE(write_file(lower / "edit", "before").is_ok());
    REQUIRE(write_file(lower / "gone", "x").is_ok());
    REQUIRE(write_file(lower / "tree/a", "a").is_ok());
    REQUIRE(write_file(lower / "tree/b", "b").is_ok());
    REQUIRE(copy_tree(lower, upper).is_ok());

    REQUIRE(write_file(upper / "edit", "after").is_ok());
    REQUIRE(write_file(upper / "added/file", "+").is_ok());
    fs::remove(upper / "gone");
    fs::remove_all(upper / "tree");

    OverlayManager overlay(ProjectDirs(tmp / "work"), "");
    REQUIRE(overlay.capture(lower, upper, layer).is_ok());

    REQUIRE_FALSE(fs::exists(layer / "keep"));
    REQUIRE(read_file(layer / "edit") == "after");
    REQUIRE(read_file(layer / "added/file") == "+");
    REQUIRE(fs::exists(layer / ".wh.gone"));
    REQUIRE(fs::exists(layer / ".wh.tree"));
    REQUIRE_FALSE(fs::exists(layer / "tree"));

    // Replaying the layer over the lower tree reproduces the upper tree
    auto replay = tmp / "replay";
    REQUIRE(copy_tree(lower, replay).is_ok());
    REQUIRE(OverlayManager::apply(layer, replay).is_ok());
    REQUIRE(hash_tree(replay).value() == hash_tree(upper).value());
    fs::remove_all(tmp);
}

TEST_CASE("materialize stacks layers over the base", "[overlay]") {
    auto tmp = make_temp_dir();
    auto base = tmp / "base";
    REQUIRE(write_file(base / "etc/os-release", "base").is_ok());
    REQUIRE(write_file(base / "etc/motd", "hello").is_ok());

    auto l1 = tmp / "l1";
    REQUIRE(write_file(l1 / "etc/motd", "layer one").is_ok());
    REQUIRE(write_file(l1 / "usr/bin/one", "1").is_ok());
    auto l2 = tmp / "l2";
    REQUIRE(write_file(l2 / "usr/bin/.wh.one", "").is_ok());
    REQUIRE(write_file(l2 / "usr/bin/two", "2").is_ok());

    OverlayManager overlay(ProjectDirs(tmp / "work"), base);
    auto view = overlay.view_root("app") / "view";
    REQUIRE(view == tmp / "work" / "overlay" / "app" / "view");
    REQUIRE(overlay.materialize({l1, l2}, view).is_ok());

    REQUIRE(read_file(view / "etc/os-release") == "base");
    REQUIRE(read_file(view / "etc/motd") == "layer one");
    REQUIRE_FALSE(fs::exists(view / "usr/bin/one"));
    REQUIRE(read_file(view / "usr/bin/two") == "2");
    REQUIRE(read_file(base / "etc/motd") == "hello");
    fs::remove_all(tmp);
}

TEST_CASE("base identity", "[overlay]") {
    auto tmp = make_temp_dir();
    OverlayManager none(ProjectDirs(tmp / "work"), "");
    REQUIRE(none.base_identity().value() == "none");

    REQUIRE(write_file(tmp / "base/f", "1").is_ok());
    OverlayManager with_base(ProjectDirs(tmp / "work"), tmp / "base");
    auto first = with_base.base_identity();
    REQUIRE(first.is_ok());
    REQUIRE(first.value().rfind("base:", 0) == 0);
    REQUIRE(write_file(tmp / "base/f", "2").is_ok());
    REQUIRE(with_base.base_identity().value() != first.value());

    OverlayManager missing(ProjectDirs(tmp / "work"), tmp / "nope");
    REQUIRE(missing.base_identity().error().code == StrataError::NotFound);
    fs::remove_all(tmp);
}
