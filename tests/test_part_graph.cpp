#include <catch2/catch.hpp>
#include <strata/part_graph.hpp>

using namespace strata;

static Part nil_part(const std::string& name, std::vector<std::string> after = {}) {
    Part p;
    p.name = name;
    p.plugin = "nil";
    p.after = std::move(after);
    return p;
}

TEST_CASE("topological order puts dependencies first", "[part_graph]") {
    auto g = PartGraph::build({
        nil_part("app", {"lib", "tools"}),
        nil_part("lib", {"base"}),
        nil_part("tools"),
        nil_part("base"),
    }, PluginRegistry::with_builtins());
    REQUIRE(g.is_ok());
    const auto& order = g.value().topological_order();
    REQUIRE(order.size() == 4);
    auto pos = [&](const std::string& n) { return g.value().rank(n); };
    REQUIRE(pos("base") < pos("lib"));
    REQUIRE(pos("lib") < pos("app"));
    REQUIRE(pos("tools") < pos("app"));
    REQUIRE(order[pos("app")] == "app");
}

TEST_CASE("independent parts keep declaration order", "[part_graph]") {
    auto g = PartGraph::build({nil_part("c"), nil_part("a"), nil_part("b")},
                              PluginRegistry::with_builtins());
    REQUIRE(g.value().topological_order() == std::vector<std::string>{"c", "a", "b"});
    REQUIRE(*g.value().layer_below("a") == "c");
    REQUIRE(*g.value().layer_above("a") == "b");
    REQUIRE_FALSE(g.value().layer_below("c").has_value());
    REQUIRE_FALSE(g.value().layer_above("b").has_value());
}

TEST_CASE("dependency queries", "[part_graph]") {
    auto g = PartGraph::build({
        nil_part("base"),
        nil_part("lib", {"base"}),
        nil_part("app", {"lib"}),
        nil_part("other"),
    }, PluginRegistry::with_builtins()).value();

    REQUIRE(g.dependencies_of("app") == std::vector<std::string>{"lib"});
    REQUIRE(g.dependencies_of("app", true) == std::vector<std::string>{"base", "lib"});
    REQUIRE(g.dependents_of("base") == std::vector<std::string>{"lib"});
    REQUIRE(g.dependents_of("base", true) == std::vector<std::string>{"lib", "app"});
    REQUIRE(g.dependents_of("other").empty());

    auto closure = g.closure({"app"});
    REQUIRE(closure.is_ok());
    REQUIRE(closure.value() == std::vector<std::string>{"base", "lib", "app"});
    REQUIRE(g.closure({"nope"}).error().code == StrataError::NotFound);
}

TEST_CASE("cycles are rejected naming the parts", "[part_graph]") {
    auto g = PartGraph::build({
        nil_part("a", {"b"}),
        nil_part("b", {"a"}),
    }, PluginRegistry::with_builtins());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == StrataError::Cycle);
    REQUIRE(g.error().message.find("a") != std::string::npos);
    REQUIRE(g.error().message.find("b") != std::string::npos);
}

TEST_CASE("self dependency is a cycle", "[part_graph]") {
    auto g = PartGraph::build({nil_part("a", {"a"})}, PluginRegistry::with_builtins());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == StrataError::Cycle);
}

TEST_CASE("unknown dependency", "[part_graph]") {
    auto g = PartGraph::build({nil_part("a", {"ghost"})}, PluginRegistry::with_builtins());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == StrataError::UnknownDependency);
    REQUIRE(g.error().message.find("ghost") != std::string::npos);
    REQUIRE(g.error().part == "a");
}

TEST_CASE("duplicate and invalid names", "[part_graph]") {
    auto dup = PartGraph::build({nil_part("a"), nil_part("a")}, PluginRegistry::with_builtins());
    REQUIRE(dup.error().code == StrataError::Duplicate);

    auto bad = PartGraph::build({nil_part("a/b")}, PluginRegistry::with_builtins());
    REQUIRE(bad.error().code == StrataError::InvalidArg);
}

TEST_CASE("unknown plugin", "[part_graph]") {
    Part p = nil_part("a");
    p.plugin = "scons";
    auto g = PartGraph::build({p}, PluginRegistry::with_builtins());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == StrataError::UnknownPlugin);
    REQUIRE(g.error().part == "a");
}

TEST_CASE("property errors are reported for every offending part", "[part_graph]") {
    Part a = nil_part("a");
    a.properties["bogus"] = std::string("x");
    Part b;
    b.name = "b";
    b.plugin = "make";
    b.properties["make-parameters"] = std::string("not a list");
    Part c;
    c.name = "c";
    c.plugin = "dump";

    auto g = PartGraph::build({a, b, c}, PluginRegistry::with_builtins());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == StrataError::PropertyValidation);
    const auto& msg = g.error().message;
    REQUIRE(msg.find("3 parts") != std::string::npos);
    REQUIRE(msg.find("part 'a'") != std::string::npos);
    REQUIRE(msg.find("part 'b'") != std::string::npos);
    REQUIRE(msg.find("requires a source") != std::string::npos);
}

TEST_CASE("find and plugin lookups", "[part_graph]") {
    auto g = PartGraph::build({nil_part("a")}, PluginRegistry::with_builtins()).value();
    REQUIRE(g.size() == 1);
    REQUIRE(g.has("a"));
    REQUIRE(g.find("b") == nullptr);
    REQUIRE(g.find("a")->name == "a");
    REQUIRE(g.plugin("a") != nullptr);
}
