#pragma once

#include <strata/result.hpp>
#include <algorithm>
#include <functional>
#include <queue>
#include <vector>

namespace strata {

// ---------------------------------------------------------------------------
// Graph<NodeData> - directed graph over dense node ids
// ---------------------------------------------------------------------------

template<typename NodeData>
class Graph {
public:
    using NodeId = size_t;

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        radj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to) {
        adj_[from].push_back(to);
        radj_[to].push_back(from);
    }

    bool has_edge(NodeId from, NodeId to) const {
        return std::find(adj_[from].begin(), adj_[from].end(), to) != adj_[from].end();
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<NodeId>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    // Kahn's algorithm. Among ready nodes the lowest id goes first, so the
    // order is a pure function of insertion order. Fails with Cycle.
    Result<std::vector<NodeId>> topological_sort() const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n, 0);
        for (size_t i = 0; i < n; ++i) in_deg[i] = radj_[i].size();

        std::priority_queue<NodeId, std::vector<NodeId>, std::greater<NodeId>> ready;
        for (size_t i = 0; i < n; ++i) {
            if (in_deg[i] == 0) ready.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!ready.empty()) {
            NodeId u = ready.top();
            ready.pop();
            order.push_back(u);
            for (NodeId v : adj_[u]) {
                if (--in_deg[v] == 0) ready.push(v);
            }
        }

        if (order.size() != n) {
            return StrataError{StrataError::Cycle, "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // One cycle as a closed walk (first node repeated at the end), or empty
    std::vector<NodeId> find_cycle() const {
        enum Color { White, Grey, Black };
        std::vector<Color> color(nodes_.size(), White);
        std::vector<NodeId> stack;

        std::function<bool(NodeId)> visit = [&](NodeId u) {
            color[u] = Grey;
            stack.push_back(u);
            for (NodeId v : adj_[u]) {
                if (color[v] == Grey) {
                    auto it = std::find(stack.begin(), stack.end(), v);
                    std::vector<NodeId> cycle(it, stack.end());
                    cycle.push_back(v);
                    stack.swap(cycle);
                    return true;
                }
                if (color[v] == White && visit(v)) return true;
            }
            stack.pop_back();
            color[u] = Black;
            return false;
        };

        for (NodeId i = 0; i < nodes_.size(); ++i) {
            if (color[i] == White && visit(i)) return stack;
        }
        return {};
    }

    // Nodes reachable from `start` (excluding it), following successor
    // edges, or predecessor edges when `reverse` is set
    std::vector<NodeId> reachable(NodeId start, bool reverse = false) const {
        const auto& edges = reverse ? radj_ : adj_;
        std::vector<bool> seen(nodes_.size(), false);
        std::vector<NodeId> out;
        std::vector<NodeId> work{start};
        seen[start] = true;
        while (!work.empty()) {
            NodeId u = work.back();
            work.pop_back();
            for (NodeId v : edges[u]) {
                if (!seen[v]) {
                    seen[v] = true;
                    out.push_back(v);
                    work.push_back(v);
                }
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<NodeId>> adj_;
    std::vector<std::vector<NodeId>> radj_;
};

} // namespace strata
