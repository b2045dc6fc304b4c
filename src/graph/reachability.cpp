#include "graph/reachability.hpp"
#include <algorithm>
#include <queue>
#include <set>

namespace onto {

std::vector<ReachabilityRecord> reachability_order(const ClassGraph& graph, const std::string& root) {
    std::vector<ReachabilityRecord> order;

    auto root_id = graph.find_node(root);
    if (!root_id.has_value() || graph.is_literal_sink(root_id.value())) {
        return order;
    }

    std::set<NodeId> seen;
    std::queue<std::pair<NodeId, int>> frontier;
    frontier.push({root_id.value(), 0});

    while (!frontier.empty()) {
        auto [current, depth] = frontier.front();
        frontier.pop();

        if (!seen.insert(current).second) {
            continue;
        }
        order.push_back({graph.node(current).iri, depth});

        for (EdgeId e : graph.node(current).outgoing) {
            NodeId next = graph.edge(e).target;
            if (!graph.is_literal_sink(next) && seen.count(next) == 0) {
                frontier.push({next, depth + 1});
            }
        }
    }

    std::reverse(order.begin(), order.end());
    return order;
}

std::string resolve_class_iri(const std::string& hint, const std::string& class_namespace) {
    if (hint.size() >= 2 && hint.front() == '<' && hint.back() == '>') {
        return hint;
    }
    return "<" + class_namespace + hint + ">";
}

} // namespace onto
