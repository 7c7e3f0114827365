#include <catch2/catch.hpp>
#include <strata/hash.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace strata;

static fs::path make_temp_dir() {
    static int counter = 0;
    auto p = fs::temp_directory_path() /
        ("strata_test_hash_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    fs::create_directories(p);
    return p;
}

static void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary);
    f << content;
}

TEST_CASE("Sha256 empty string", "[hash]") {
    REQUIRE(Sha256::hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Sha256 'abc' (NIST vector)", "[hash]") {
    REQUIRE(Sha256::hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Sha256 448-bit message (NIST vector)", "[hash]") {
    REQUIRE(Sha256::hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("Sha256 one million 'a'", "[hash]") {
    Sha256 ctx;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) ctx.update(chunk);
    REQUIRE(Sha256::to_hex(ctx.finalize()) ==
            "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("Sha256 byte-at-a-time matches one-shot", "[hash]") {
    std::string msg = "the quick brown fox jumps over the lazy dog, repeatedly, "
                      "until the message spans more than one block";
    Sha256 ctx;
    for (char c : msg) {
        auto b = static_cast<uint8_t>(c);
        ctx.update(&b, 1);
    }
    REQUIRE(Sha256::to_hex(ctx.finalize()) == Sha256::hex(msg));
}

TEST_CASE("Hasher keeps field boundaries", "[hash]") {
    auto a = Hasher().field("x", std::string("ab")).field("y", std::string("c")).hex();
    auto b = Hasher().field("x", std::string("a")).field("y", std::string("bc")).hex();
    REQUIRE(a != b);

    auto l1 = Hasher().field("l", std::vector<std::string>{"a", "b"}).hex();
    auto l2 = Hasher().field("l", std::vector<std::string>{"ab"}).hex();
    REQUIRE(l1 != l2);
}

TEST_CASE("Hasher distinguishes value kinds", "[hash]") {
    auto s = Hasher().field("v", std::string("1")).hex();
    auto i = Hasher().field("v", int64_t(1)).hex();
    auto t = Hasher().field("v", true).hex();
    REQUIRE(s != i);
    REQUIRE(i != t);
    REQUIRE(Hasher().field("v", int64_t(1)).hex() == i);
}

TEST_CASE("hash_file", "[hash]") {
    auto dir = make_temp_dir();
    write_file(dir / "f", "abc");
    auto r = hash_file(dir / "f");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == Sha256::hex("abc"));
    REQUIRE(hash_file(dir / "missing").is_err());
    fs::remove_all(dir);
}

TEST_CASE("hash_tree is stable and content sensitive", "[hash]") {
    auto dir = make_temp_dir();
    write_file(dir / "a.txt", "one");
    write_file(dir / "sub" / "b.txt", "two");

    auto first = hash_tree(dir);
    REQUIRE(first.is_ok());
    REQUIRE(hash_tree(dir).value() == first.value());

    write_file(dir / "sub" / "b.txt", "three");
    REQUIRE(hash_tree(dir).value() != first.value());

    write_file(dir / "sub" / "b.txt", "two");
    REQUIRE(hash_tree(dir).value() == first.value());

    fs::rename(dir / "a.txt", dir / "c.txt");
    REQUIRE(hash_tree(dir).value() != first.value());
    fs::remove_all(dir);
}

TEST_CASE("hash_tree skips excluded paths and .git", "[hash]") {
    auto dir = make_temp_dir();
    write_file(dir / "src.c", "int main;");
    auto base = hash_tree(dir, {dir / "work"}).value();

    write_file(dir / "work" / "junk", "x");
    write_file(dir / ".git" / "HEAD", "ref: main");
    REQUIRE(hash_tree(dir, {dir / "work"}).value() == base);
    REQUIRE(hash_tree(dir).value() != base);
    fs::remove_all(dir);
}

TEST_CASE("hash_tree on missing directory", "[hash]") {
    auto r = hash_tree("/nonexistent/strata/tree");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::NotFound);
}
