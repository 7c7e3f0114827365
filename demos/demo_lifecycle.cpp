// demo_lifecycle.cpp
//
// Runs a two-part project through the lifecycle in a scratch directory and
// prints what the planner decided at each stage.  Run it with:
//
//     ./demo_lifecycle                 # scratch project under /tmp
//     ./demo_lifecycle <project-dir>   # reads <project-dir>/strata.toml
//
// The second plan is empty; touching the library source makes the next
// plan rebuild it and the app that depends on it.

#include <strata/config.hpp>
#include <strata/fsutil.hpp>
#include <strata/lifecycle.hpp>
#include <strata/log.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace strata;

// ---------------------------------------------------------------------------
// Project setup
// ---------------------------------------------------------------------------

Result<ProjectInfo> load_project(const fs::path& dir) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = Config::load(global_path);
        STRATA_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> project;
    if (fs::exists(dir / "strata.toml")) {
        auto p = Config::load((dir / "strata.toml").string());
        STRATA_TRY(p);
        project = std::move(p).value();
    }

    Config cfg = Config::effective(global, project);
    cfg.apply_logging();
    ProjectInfo info = cfg.project_info(dir);
    if (!cfg.work_dir) info.work_dir = dir / "work";
    return Result<ProjectInfo>::ok(std::move(info));
}

// libgreet is a local directory copied with the dump plugin; greet is built
// by a script that needs the staged library.
std::vector<Part> demo_parts() {
    Part lib;
    lib.name = "libgreet";
    lib.plugin = "dump";
    lib.source.location = "libgreet";
    lib.organize = {{"greet.h", "usr/include/"}, {"greet.txt", "usr/share/greet/"}};

    Part app;
    app.name = "greet";
    app.plugin = "nil";
    app.after = {"libgreet"};
    app.overrides[Step::Build] = StepOverride{
        "mkdir -p \"$STRATA_PART_INSTALL/usr/bin\"\n"
        "{ echo '#!/bin/sh'; echo \"cat /usr/share/greet/greet.txt\"; } "
            "> \"$STRATA_PART_INSTALL/usr/bin/greet\"\n"
        "chmod 755 \"$STRATA_PART_INSTALL/usr/bin/greet\"\n"
        "test -f \"$STRATA_STAGE/usr/include/greet.h\"\n",
        OverrideMode::Replace};
    app.prime_files = {"usr/bin"};

    return {lib, app};
}

Status write_sources(const fs::path& dir) {
    STRATA_TRY(write_file(dir / "libgreet" / "greet.h", "void greet(void);\n"));
    STRATA_TRY(write_file(dir / "libgreet" / "greet.txt", "hello from strata\n"));
    return ok_status();
}

// ---------------------------------------------------------------------------
// Plan / execute
// ---------------------------------------------------------------------------

void print_plan(const std::string& title, const std::vector<Action>& actions) {
    std::cout << title << ": " << actions.size() << " action(s)\n";
    for (const auto& a : actions) {
        std::cout << "  " << a.str();
        if (!a.message.empty()) std::cout << "  [" << a.message << "]";
        std::cout << "\n";
    }
}

Status run_to_prime(LifecycleManager& mgr, const std::string& title) {
    auto actions = mgr.plan(Step::Prime);
    STRATA_TRY(actions);
    print_plan(title, actions.value());

    auto report = mgr.execute(actions.value());
    std::cout << "  -> " << report.count(ActionStatus::Succeeded) << " succeeded, "
              << report.count(ActionStatus::Failed) << " failed\n";
    return report.status();
}

Status run_demo(const fs::path& dir) {
    STRATA_TRY(write_sources(dir));

    auto info = load_project(dir);
    STRATA_TRY(info);
    log::info("project %s, work dir %s", dir.c_str(), info.value().work_dir.c_str());

    auto mgr = LifecycleManager::create(demo_parts(), info.value());
    if (mgr.is_err()) return std::move(mgr).error();
    LifecycleManager& lifecycle = *mgr.value();

    STRATA_TRY(run_to_prime(lifecycle, "first run"));
    STRATA_TRY(run_to_prime(lifecycle, "second run"));

    STRATA_TRY(write_file(dir / "libgreet" / "greet.txt", "hello again\n"));
    auto why = lifecycle.explain("libgreet", Step::Pull);
    STRATA_TRY(why);
    if (why.value()) std::cout << "dirty: " << why.value()->summary() << "\n";
    STRATA_TRY(run_to_prime(lifecycle, "after edit"));

    auto prime = lifecycle.get_state("greet", Step::Prime);
    STRATA_TRY(prime);
    if (prime.value()) {
        std::cout << "primed by greet:\n";
        for (const auto& f : prime.value()->files) std::cout << "  " << f << "\n";
    }
    std::cout << "prime tree: " << lifecycle.dirs().prime.string() << "\n";
    return ok_status();
}

int main(int argc, char** argv) {
    fs::path dir = argc > 1
        ? fs::absolute(argv[1])
        : fs::temp_directory_path() / ("strata_demo_" + std::to_string(getpid()));

    auto st = run_demo(dir);
    if (st.is_err()) {
        std::cerr << "\n" << st.error().format() << "\n";
        return 1;
    }
    return 0;
}
