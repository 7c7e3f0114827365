#include <catch2/catch.hpp>
#include <strata/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace strata::log;

// Capture log output through a temporary stream
static std::string capture_log(std::function<void()> fn) {
    FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    FILE* saved = get_stream();
    set_stream(tmp);
    set_color_enabled(false);

    fn();

    set_stream(saved == stderr ? nullptr : saved);
    std::rewind(tmp);
    std::string output;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level l : {Trace, Debug, Info, Warn, Error}) {
        set_level(l);
        REQUIRE(get_level() == l);
    }
    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts level names", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("debug").value() == Debug);
    REQUIRE(parse_level("info").value() == Info);
    REQUIRE(parse_level("warn").value() == Warn);
    REQUIRE(parse_level("warning").value() == Warn);
    REQUIRE(parse_level("error").value() == Error);

    auto bad = parse_level("loud");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == strata::StrataError::Config);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    auto output = capture_log([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    auto output = capture_log([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("warn: this is a warning") != std::string::npos);
    REQUIRE(output.find("error: this is an error") != std::string::npos);
    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    auto output = capture_log([] {
        info("Staging %s (%d files)", "libfoo", 42);
    });
    REQUIRE(output == "info: Staging libfoo (42 files)\n");
}

TEST_CASE("Colored prefix when enabled", "[log]") {
    set_level(Info);
    FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_stream(tmp);
    set_color_enabled(true);
    info("hello");
    set_stream(nullptr);
    set_color_enabled(false);

    std::rewind(tmp);
    char buf[128] = {0};
    size_t n = std::fread(buf, 1, sizeof(buf) - 1, tmp);
    std::fclose(tmp);
    std::string output(buf, n);
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);
}
