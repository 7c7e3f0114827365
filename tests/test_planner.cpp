#include <catch2/catch.hpp>
#include <strata/planner.hpp>
#include <strata/fsutil.hpp>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace strata;

namespace {

fs::path make_temp_dir() {
    static int counter = 0;
    auto p = fs::temp_directory_path() /
        ("strata_test_planner_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

Part make_part(const std::string& name, std::vector<std::string> after = {},
               std::vector<std::string> params = {}) {
    Part p;
    p.name = name;
    p.plugin = "make";
    p.after = std::move(after);
    if (!params.empty()) p.properties["make-parameters"] = params;
    return p;
}

// A planner over a temporary state store. Parts can be swapped to model
// an edited project; the recorded state survives.
struct Project {
    fs::path root;
    ProjectInfo info;
    StateStore store;
    SourceRegistry sources = SourceRegistry::with_builtins();
    std::unique_ptr<OverlayManager> overlay;
    std::unique_ptr<PartGraph> graph;
    std::unique_ptr<ActionPlanner> planner;

    explicit Project(std::vector<Part> parts, bool layered = false) : root(make_temp_dir()) {
        info.project_dir = root;
        info.work_dir = root / "work";
        info.target_arch = "amd64";
        info.layered = layered;
        overlay = std::make_unique<OverlayManager>(ProjectDirs(info.work_dir), fs::path());
        REQUIRE(store.open((root / "state.db").string()).is_ok());
        set_parts(std::move(parts));
    }
    ~Project() {
        store.close();
        fs::remove_all(root);
    }

    void set_parts(std::vector<Part> parts) {
        planner.reset();
        auto g = PartGraph::build(std::move(parts), PluginRegistry::with_builtins());
        REQUIRE(g.is_ok());
        graph = std::make_unique<PartGraph>(std::move(g).value());
        planner = std::make_unique<ActionPlanner>(*graph, store, info, sources, *overlay);
    }

    std::vector<Action> plan(Step target, const std::vector<std::string>& names = {},
                             bool rerun = false) {
        auto r = planner->plan(target, names, rerun);
        REQUIRE(r.is_ok());
        return std::move(r).value();
    }

    // Record every action as executed, the way the executor does
    void complete(const std::vector<Action>& actions) {
        for (const auto& a : actions) {
            auto in = planner->fingerprint_inputs(a.part_name, a.step,
                                                  planner->stored_fingerprints());
            REQUIRE(in.is_ok());
            StepState st;
            st.part = a.part_name;
            st.step = a.step;
            st.fingerprint = StateStore::fingerprint_inputs(in.value());
            st.properties = in.value().properties;
            st.options = in.value().options;
            st.source_identity = in.value().source_identity;
            st.upstream = in.value().upstream;
            REQUIRE(store.put(st).is_ok());
        }
    }
};

std::vector<std::string> describe(const std::vector<Action>& actions) {
    std::vector<std::string> out;
    for (const auto& a : actions) out.push_back(a.key().str());
    return out;
}

const Action* find_action(const std::vector<Action>& actions, const std::string& part,
                          Step step) {
    for (const auto& a : actions) {
        if (a.part_name == part && a.step == step) return &a;
    }
    return nullptr;
}

} // namespace

// ---------------------------------------------------------------------------
// Planning from scratch
// ---------------------------------------------------------------------------

TEST_CASE("fresh project plans every step of every part", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib")});
    auto actions = p.plan(Step::Prime);
    REQUIRE(describe(actions) == std::vector<std::string>{
        "lib:pull", "lib:build", "lib:stage", "lib:prime",
        "app:pull", "app:build", "app:stage", "app:prime"});
    for (const auto& a : actions) REQUIRE(a.type == ActionType::Run);
    REQUIRE(find_action(actions, "lib", Step::Pull)->reason == ActionReason::NeverRun);
    REQUIRE(find_action(actions, "app", Step::Pull)->reason == ActionReason::NeverRun);
    REQUIRE(find_action(actions, "lib", Step::Build)->reason == ActionReason::DownstreamInvalidated);
    REQUIRE(find_action(actions, "app", Step::Build)->reason == ActionReason::DependencyChanged);
    REQUIRE(find_action(actions, "app", Step::Build)->message == "'lib:stage' changed");
}

TEST_CASE("planned order respects every upstream key", "[planner]") {
    Project p({
        make_part("d", {"b", "c"}),
        make_part("b", {"a"}),
        make_part("c", {"a"}),
        make_part("a"),
    });
    auto actions = p.plan(Step::Prime);
    std::set<std::string> done;
    for (const auto& a : actions) {
        for (const auto& up : p.planner->upstream_keys(a.part_name, a.step)) {
            REQUIRE(done.count(up.str()) == 1);
        }
        done.insert(a.key().str());
    }
    REQUIRE(done.size() == 16);
}

TEST_CASE("planning after execution is empty", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib", {}, {"V=1"})});
    p.complete(p.plan(Step::Prime));
    REQUIRE(p.plan(Step::Prime).empty());
    REQUIRE(p.plan(Step::Build, {"app"}).empty());
}

TEST_CASE("lower targets stop early", "[planner]") {
    Project p({make_part("a")});
    REQUIRE(describe(p.plan(Step::Build)) ==
            std::vector<std::string>{"a:pull", "a:build"});
    REQUIRE(describe(p.plan(Step::Pull)) == std::vector<std::string>{"a:pull"});
}

TEST_CASE("dependencies are staged before a dependent builds", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib"), make_part("other")});
    auto actions = p.plan(Step::Build, {"app"});
    REQUIRE(describe(actions) == std::vector<std::string>{
        "lib:pull", "lib:build", "lib:stage", "app:pull", "app:build"});
    REQUIRE(find_action(actions, "lib", Step::Pull)->message == "required to build 'app'");
    REQUIRE(find_action(actions, "app", Step::Pull)->message.empty());
}

TEST_CASE("priming a dependent primes its dependencies", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib")});
    auto actions = p.plan(Step::Prime, {"app"});
    REQUIRE(find_action(actions, "lib", Step::Prime) != nullptr);
}

TEST_CASE("plan rejects unknown parts and overlay without layers", "[planner]") {
    Project p({make_part("a")});
    auto unknown = p.planner->plan(Step::Build, {"ghost"});
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.error().code == StrataError::NotFound);

    auto overlay = p.planner->plan(Step::Overlay);
    REQUIRE(overlay.is_err());
    REQUIRE(overlay.error().code == StrataError::InvalidArg);
}

// ---------------------------------------------------------------------------
// Change detection
// ---------------------------------------------------------------------------

TEST_CASE("property change reruns the part and its dependents", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib", {}, {"V=1"}), make_part("other")});
    p.complete(p.plan(Step::Prime));

    p.set_parts({make_part("app", {"lib"}), make_part("lib", {}, {"V=2"}), make_part("other")});
    auto actions = p.plan(Step::Prime);
    REQUIRE(describe(actions) == std::vector<std::string>{
        "lib:build", "lib:stage", "lib:prime", "app:build", "app:stage", "app:prime"});

    const Action* build = find_action(actions, "lib", Step::Build);
    REQUIRE(build->reason == ActionReason::PropertiesChanged);
    REQUIRE(build->message.find("make-parameters") != std::string::npos);
    REQUIRE(find_action(actions, "lib", Step::Stage)->reason == ActionReason::DownstreamInvalidated);
    REQUIRE(find_action(actions, "app", Step::Build)->reason == ActionReason::DependencyChanged);
    REQUIRE(find_action(actions, "app", Step::Build)->message == "'lib:stage' changed");
    REQUIRE(find_action(actions, "app", Step::Pull) == nullptr);

    // Changing the property back restores the recorded fingerprints
    p.set_parts({make_part("app", {"lib"}), make_part("lib", {}, {"V=1"}), make_part("other")});
    REQUIRE(p.plan(Step::Prime).empty());
}

TEST_CASE("stage fileset change skips the build", "[planner]") {
    Project p({make_part("a")});
    p.complete(p.plan(Step::Prime));

    auto edited = make_part("a");
    edited.stage_files = {"usr"};
    p.set_parts({edited});
    auto actions = p.plan(Step::Prime);
    REQUIRE(describe(actions) == std::vector<std::string>{"a:stage", "a:prime"});
    REQUIRE(actions[0].reason == ActionReason::PropertiesChanged);
}

TEST_CASE("target architecture change rebuilds", "[planner]") {
    Project p({make_part("a")});
    p.complete(p.plan(Step::Prime));
    p.info.target_arch = "arm64";
    auto actions = p.plan(Step::Prime);
    REQUIRE(describe(actions) == std::vector<std::string>{"a:build", "a:stage", "a:prime"});
    REQUIRE(actions[0].message.find("strata.target-arch") != std::string::npos);
}

TEST_CASE("permission rules only affect prime", "[planner]") {
    Project p({make_part("a")});
    p.complete(p.plan(Step::Prime));
    p.info.permissions = {PermissionRule{"bin/*", 0755}};
    REQUIRE(describe(p.plan(Step::Prime)) == std::vector<std::string>{"a:prime"});
}

TEST_CASE("missing upstream state invalidates consumers", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib")});
    p.complete(p.plan(Step::Prime));
    REQUIRE(p.store.invalidate("lib", Step::Build).is_ok());

    auto actions = p.plan(Step::Prime);
    REQUIRE(describe(actions) == std::vector<std::string>{
        "lib:build", "lib:stage", "lib:prime", "app:build", "app:stage", "app:prime"});
    REQUIRE(actions[0].reason == ActionReason::NeverRun);
}

// ---------------------------------------------------------------------------
// Rerun
// ---------------------------------------------------------------------------

TEST_CASE("rerun forces the target step of named parts", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib")});
    p.complete(p.plan(Step::Prime));

    auto actions = p.plan(Step::Build, {"lib"}, true);
    REQUIRE(describe(actions) == std::vector<std::string>{"lib:build"});
    REQUIRE(actions[0].type == ActionType::Rerun);
    REQUIRE(actions[0].reason == ActionReason::Forced);
    REQUIRE(actions[0].str() == "rebuild lib (forced: rerun requested)");

    // Consumers of the forced step follow when the target is later
    auto to_prime = p.plan(Step::Prime, {"app"}, true);
    REQUIRE(describe(to_prime) == std::vector<std::string>{"app:prime"});
}

// ---------------------------------------------------------------------------
// Invalidation and explain
// ---------------------------------------------------------------------------

TEST_CASE("invalidation closure follows consumers", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib"), make_part("other")});
    std::vector<std::string> keys;
    for (const auto& k : p.planner->invalidation_closure("lib", Step::Build)) {
        keys.push_back(k.str());
    }
    REQUIRE(keys == std::vector<std::string>{
        "lib:build", "lib:stage", "lib:prime", "app:build", "app:stage", "app:prime"});
    REQUIRE(p.planner->invalidation_closure("app", Step::Prime).size() == 1);
}

TEST_CASE("consumers and upstream keys are inverse", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib")}, true);
    for (const auto& part : p.graph->topological_order()) {
        for (Step step : all_steps(true)) {
            StepKey key{part, step};
            for (const auto& c : p.planner->consumers(key)) {
                auto ups = p.planner->upstream_keys(c.part, c.step);
                REQUIRE(std::find(ups.begin(), ups.end(), key) != ups.end());
            }
        }
    }
}

TEST_CASE("explain reports why a step is dirty", "[planner]") {
    Project p({make_part("app", {"lib"}), make_part("lib", {}, {"V=1"})});

    auto never = p.planner->explain("lib", Step::Pull);
    REQUIRE(never.is_ok());
    REQUIRE(never.value()->reason == ActionReason::NeverRun);
    REQUIRE(never.value()->summary() == "lib:pull: never run");

    p.complete(p.plan(Step::Prime));
    REQUIRE_FALSE(p.planner->explain("lib", Step::Build).value().has_value());

    p.set_parts({make_part("app", {"lib"}), make_part("lib", {}, {"V=2"})});
    auto changed = p.planner->explain("lib", Step::Build).value();
    REQUIRE(changed.has_value());
    REQUIRE(changed->reason == ActionReason::PropertiesChanged);
    REQUIRE(changed->changed_properties == std::vector<std::string>{"make-parameters"});
    REQUIRE(changed->summary() == "lib:build: property 'make-parameters' changed");

    REQUIRE(p.store.invalidate("lib", Step::Stage).is_ok());
    auto downstream = p.planner->explain("lib", Step::Prime).value();
    REQUIRE(downstream->reason == ActionReason::DownstreamInvalidated);
    REQUIRE(downstream->invalidated_by == StepKey{"lib", Step::Stage});

    auto dependent = p.planner->explain("app", Step::Build).value();
    REQUIRE(dependent->reason == ActionReason::DependencyChanged);
    REQUIRE(dependent->changed_dependencies == std::vector<std::string>{"lib:stage"});

    auto missing = p.planner->explain("lib", Step::Stage).value();
    REQUIRE(missing->reason == ActionReason::NeverRun);
    REQUIRE_FALSE(missing->invalidated_by.has_value());

    REQUIRE(p.planner->explain("ghost", Step::Pull).error().code == StrataError::NotFound);
}

// ---------------------------------------------------------------------------
// Layered builds
// ---------------------------------------------------------------------------

TEST_CASE("layered plans chain overlays through the layer stack", "[planner]") {
    Project p({make_part("base"), make_part("tools"), make_part("app")}, true);
    auto actions = p.plan(Step::Overlay, {"app"});
    REQUIRE(describe(actions) == std::vector<std::string>{
        "base:pull", "base:overlay", "tools:pull", "tools:overlay",
        "app:pull", "app:overlay"});
    REQUIRE(find_action(actions, "tools", Step::Pull)->message == "required to overlay 'app'");
    REQUIRE(find_action(actions, "tools", Step::Overlay)->reason == ActionReason::DependencyChanged);
}

TEST_CASE("changing a lower layer invalidates the layers above", "[planner]") {
    Project p({make_part("base"), make_part("app")}, true);
    p.complete(p.plan(Step::Prime));
    REQUIRE(p.plan(Step::Prime).empty());

    auto edited = make_part("base");
    edited.overlay_files = {"etc"};
    p.set_parts({edited, make_part("app")});
    auto actions = p.plan(Step::Prime);
    REQUIRE(find_action(actions, "base", Step::Overlay)->reason == ActionReason::PropertiesChanged);
    REQUIRE(find_action(actions, "app", Step::Overlay)->reason == ActionReason::DependencyChanged);
    REQUIRE(find_action(actions, "app", Step::Build) != nullptr);
    REQUIRE(find_action(actions, "base", Step::Pull) == nullptr);
}

// ---------------------------------------------------------------------------
// Incremental updates
// ---------------------------------------------------------------------------

TEST_CASE("a changed local source is updated in place", "[planner]") {
    auto lib = make_part("lib");
    lib.source.location = "lib";
    Project p({lib, make_part("app", {"lib"})});
    REQUIRE(write_file(p.root / "lib" / "a.c", "int a;").is_ok());
    p.complete(p.plan(Step::Prime));

    REQUIRE(write_file(p.root / "lib" / "a.c", "int a = 1;").is_ok());
    auto actions = p.plan(Step::Prime);
    REQUIRE(describe(actions) == std::vector<std::string>{
        "lib:pull", "lib:build", "lib:stage", "lib:prime",
        "app:build", "app:stage", "app:prime"});

    const Action* pull = find_action(actions, "lib", Step::Pull);
    REQUIRE(pull->type == ActionType::Update);
    REQUIRE(pull->message.find("source changed") != std::string::npos);
    REQUIRE(find_action(actions, "lib", Step::Build)->type == ActionType::Update);
    REQUIRE(find_action(actions, "lib", Step::Build)->str().rfind("update build lib", 0) == 0);
    REQUIRE(find_action(actions, "lib", Step::Stage)->type == ActionType::Run);
    REQUIRE(find_action(actions, "app", Step::Build)->type == ActionType::Run);
}

TEST_CASE("an updated source with new properties builds from scratch", "[planner]") {
    auto lib = make_part("lib", {}, {"V=1"});
    lib.source.location = "lib";
    Project p({lib});
    REQUIRE(write_file(p.root / "lib" / "a.c", "int a;").is_ok());
    p.complete(p.plan(Step::Prime));

    REQUIRE(write_file(p.root / "lib" / "a.c", "int a = 1;").is_ok());
    auto edited = make_part("lib", {}, {"V=2"});
    edited.source.location = "lib";
    p.set_parts({edited});
    auto actions = p.plan(Step::Prime);
    REQUIRE(find_action(actions, "lib", Step::Pull)->type == ActionType::Update);
    REQUIRE(find_action(actions, "lib", Step::Build)->type == ActionType::Run);
}

TEST_CASE("sources with a pull override are pulled again", "[planner]") {
    auto lib = make_part("lib");
    lib.source.location = "lib";
    lib.overrides[Step::Pull] = StepOverride{"true\n", OverrideMode::Append};
    Project p({lib});
    REQUIRE(write_file(p.root / "lib" / "a.c", "int a;").is_ok());
    p.complete(p.plan(Step::Prime));

    REQUIRE(write_file(p.root / "lib" / "a.c", "int a = 1;").is_ok());
    auto actions = p.plan(Step::Prime);
    REQUIRE(find_action(actions, "lib", Step::Pull)->type == ActionType::Run);
    REQUIRE(find_action(actions, "lib", Step::Build)->type == ActionType::Run);
}

TEST_CASE("action and reason names", "[planner]") {
    REQUIRE(std::string(action_type_name(ActionType::Rerun)) == "rerun");
    REQUIRE(std::string(action_type_name(ActionType::Update)) == "update");
    REQUIRE(std::string(action_reason_name(ActionReason::DownstreamInvalidated)) ==
            "downstream-invalidated");
    Action a;
    a.part_name = "lib";
    a.step = Step::Stage;
    REQUIRE(a.str() == "stage lib (never-run)");
}
