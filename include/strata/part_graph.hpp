#pragma once

#include <strata/graph.hpp>
#include <strata/part.hpp>
#include <strata/plugin.hpp>
#include <strata/result.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

// Validated set of parts with their dependency edges and resolved plugins.
// Immutable once built.
class PartGraph {
public:
    // Validates names, dependencies, acyclicity, plugins and plugin
    // properties. Nothing on disk is touched.
    static Result<PartGraph> build(std::vector<Part> parts, const PluginRegistry& plugins);

    // Dependencies before dependents; ties keep declaration order
    const std::vector<std::string>& topological_order() const { return order_; }

    size_t size() const { return parts_.size(); }
    bool has(const std::string& name) const { return index_.count(name) > 0; }

    // nullptr when the part does not exist
    const Part* find(const std::string& name) const;
    const Part& part(const std::string& name) const;
    const PluginHandle& plugin(const std::string& name) const;

    // Results are in topological order
    std::vector<std::string> dependencies_of(const std::string& name,
                                             bool transitive = false) const;
    std::vector<std::string> dependents_of(const std::string& name,
                                           bool transitive = false) const;

    // The named parts plus everything they transitively depend on.
    // Fails with NotFound on an unknown name.
    Result<std::vector<std::string>> closure(const std::vector<std::string>& names) const;

    // Neighbours in the overlay layer stack (topological order)
    std::optional<std::string> layer_below(const std::string& name) const;
    std::optional<std::string> layer_above(const std::string& name) const;

    // Position in topological_order()
    size_t rank(const std::string& name) const;

private:
    std::vector<std::string> names_sorted(std::vector<size_t> ids) const;

    Graph<std::string> graph_;
    std::vector<Part> parts_;
    std::vector<PluginHandle> plugins_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::string> order_;
    std::vector<size_t> rank_;
};

} // namespace strata
