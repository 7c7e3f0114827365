#include <strata/part_graph.hpp>
#include <strata/log.hpp>
#include <algorithm>

namespace strata {

Result<PartGraph> PartGraph::build(std::vector<Part> parts, const PluginRegistry& plugins) {
    PartGraph g;

    for (auto& p : parts) {
        auto valid = validate_part_name(p.name);
        if (valid.is_err()) return std::move(valid).error();
        if (g.index_.count(p.name)) {
            return StrataError{StrataError::Duplicate,
                "part '" + p.name + "' is defined more than once"};
        }
        g.index_[p.name] = g.graph_.add_node(p.name);
        g.parts_.push_back(std::move(p));
    }

    // Edges point from a dependency to its dependent
    for (size_t i = 0; i < g.parts_.size(); ++i) {
        const auto& p = g.parts_[i];
        for (const auto& dep : p.after) {
            auto it = g.index_.find(dep);
            if (it == g.index_.end()) {
                StrataError err{StrataError::UnknownDependency,
                    "part '" + p.name + "' depends on unknown part '" + dep + "'",
                    "check the 'after' list of '" + p.name + "'"};
                err.part = p.name;
                return err;
            }
            if (!g.graph_.has_edge(it->second, i)) {
                g.graph_.add_edge(it->second, i);
            }
        }
    }

    auto sorted = g.graph_.topological_sort();
    if (sorted.is_err()) {
        auto cycle = g.graph_.find_cycle();
        std::string path;
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0) path += " -> ";
            path += g.graph_.node(cycle[i]);
        }
        return StrataError{StrataError::Cycle,
            "dependency cycle detected: " + path,
            "remove one of the 'after' entries on this cycle"};
    }
    g.rank_.assign(g.parts_.size(), 0);
    for (size_t pos = 0; pos < sorted.value().size(); ++pos) {
        size_t id = sorted.value()[pos];
        g.rank_[id] = pos;
        g.order_.push_back(g.parts_[id].name);
    }

    // Resolve plugins, then validate every part's properties so all
    // offending parts are reported together
    std::string problems;
    size_t bad_parts = 0;
    for (const auto& p : g.parts_) {
        auto plugin = plugins.resolve(p.plugin_name());
        if (plugin.is_err()) {
            auto err = std::move(plugin).error();
            err.part = p.name;
            return err;
        }
        auto check = plugin.value()->validate_properties(p.properties);
        std::string reason;
        if (check.is_err()) {
            reason = check.error().message;
        } else if (plugin.value()->requires_source() && p.source.empty()) {
            reason = "plugin '" + p.plugin_name() + "' requires a source";
        }
        if (!reason.empty()) {
            if (!problems.empty()) problems += "; ";
            problems += "part '" + p.name + "': " + reason;
            ++bad_parts;
        }
        g.plugins_.push_back(std::move(plugin).value());
    }
    if (bad_parts > 0) {
        return StrataError{StrataError::PropertyValidation,
            "invalid properties in " + std::to_string(bad_parts)
            + (bad_parts == 1 ? " part: " : " parts: ") + problems};
    }

    log::debug("part graph: %zu parts", g.parts_.size());
    return Result<PartGraph>::ok(std::move(g));
}

const Part* PartGraph::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &parts_[it->second];
}

const Part& PartGraph::part(const std::string& name) const {
    return parts_[index_.at(name)];
}

const PluginHandle& PartGraph::plugin(const std::string& name) const {
    return plugins_[index_.at(name)];
}

size_t PartGraph::rank(const std::string& name) const {
    return rank_[index_.at(name)];
}

std::vector<std::string> PartGraph::names_sorted(std::vector<size_t> ids) const {
    std::sort(ids.begin(), ids.end(),
              [this](size_t a, size_t b) { return rank_[a] < rank_[b]; });
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (size_t id : ids) out.push_back(parts_[id].name);
    return out;
}

std::vector<std::string> PartGraph::dependencies_of(const std::string& name,
                                                    bool transitive) const {
    size_t id = index_.at(name);
    if (transitive) return names_sorted(graph_.reachable(id, true));
    return names_sorted(graph_.predecessors(id));
}

std::vector<std::string> PartGraph::dependents_of(const std::string& name,
                                                  bool transitive) const {
    size_t id = index_.at(name);
    if (transitive) return names_sorted(graph_.reachable(id, false));
    return names_sorted(graph_.successors(id));
}

Result<std::vector<std::string>> PartGraph::closure(
    const std::vector<std::string>& names) const
{
    std::vector<bool> in(parts_.size(), false);
    for (const auto& n : names) {
        auto it = index_.find(n);
        if (it == index_.end()) {
            return StrataError{StrataError::NotFound, "unknown part '" + n + "'"};
        }
        in[it->second] = true;
        for (size_t dep : graph_.reachable(it->second, true)) in[dep] = true;
    }
    std::vector<size_t> ids;
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i]) ids.push_back(i);
    }
    return Result<std::vector<std::string>>::ok(names_sorted(std::move(ids)));
}

std::optional<std::string> PartGraph::layer_below(const std::string& name) const {
    size_t r = rank(name);
    if (r == 0) return std::nullopt;
    return order_[r - 1];
}

std::optional<std::string> PartGraph::layer_above(const std::string& name) const {
    size_t r = rank(name);
    if (r + 1 >= order_.size()) return std::nullopt;
    return order_[r + 1];
}

} // namespace strata
