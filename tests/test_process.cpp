#include <catch2/catch.hpp>
#include <strata/process.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace strata;

TEST_CASE("run_command captures output and exit code", "[process]") {
    auto r = run_command({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stdout_str == "out\n");
    REQUIRE(r.value().stderr_str == "err\n");
}

TEST_CASE("run_command honours working_dir", "[process]") {
    CommandOptions opts;
    opts.working_dir = "/";
    auto r = run_command({"pwd"}, opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "/\n");
}

TEST_CASE("run_command reports missing programs as exit 127", "[process]") {
    auto r = run_command({"strata-no-such-program-xyz"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command rejects empty args", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::InvalidArg);
}

TEST_CASE("run_command times out", "[process]") {
    CommandOptions opts;
    opts.timeout_seconds = 1;
    auto r = run_command({"sleep", "10"}, opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("run_command stops on cancellation", "[process]") {
    CancelToken token;
    CommandOptions opts;
    opts.cancel = &token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = run_command({"sleep", "10"}, opts);
    canceller.join();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Cancelled);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("run_command appends to a log file", "[process]") {
    auto log = fs::temp_directory_path() /
        ("strata_test_process_" + std::to_string(getpid()) + "_0.log");
    fs::remove(log);
    CommandOptions opts;
    opts.log_file = log;
    REQUIRE(run_command({"/bin/sh", "-c", "echo first"}, opts).is_ok());
    REQUIRE(run_command({"/bin/sh", "-c", "echo second"}, opts).is_ok());

    std::ifstream in(log);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "first\nsecond\n");
    fs::remove(log);
}

TEST_CASE("CancelToken reset", "[process]") {
    CancelToken token;
    REQUIRE_FALSE(token.is_cancelled());
    token.cancel();
    REQUIRE(token.is_cancelled());
    token.reset();
    REQUIRE_FALSE(token.is_cancelled());
}
