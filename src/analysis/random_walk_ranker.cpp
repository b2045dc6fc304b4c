#include "analysis/random_walk_ranker.hpp"
#include <vector>

namespace onto {

// ==========================================
// RankTables Implementation
// ==========================================

double RankTables::rank_of(const std::string& class_iri) const {
    auto it = page_rank.find(class_iri);
    return it != page_rank.end() ? it->second : 0.0;
}

std::map<std::string, double> RankTables::edge_rank_for(const std::string& class_iri) const {
    auto it = edge_rank.find(class_iri);
    if (it == edge_rank.end()) {
        return {};
    }
    return it->second;
}

// ==========================================
// RandomWalkRanker Implementation
// ==========================================

RandomWalkRanker::RandomWalkRanker(RankerConfig config) : config_(config) {}

RankTables RandomWalkRanker::rank(
    const ClassGraph& graph,
    WalkDirection direction,
    const std::map<std::string, double>& node_weights,
    RandomSource& random
) const {
    RankTables tables;
    for (const auto& iri : graph.class_iris()) {
        tables.page_rank[iri] = 0.0;
    }

    // Candidate starting classes
    std::vector<NodeId> starts;
    std::vector<double> start_weights;
    for (const auto& [iri, weight] : node_weights) {
        auto id = graph.find_node(iri);
        if (!id.has_value() || graph.is_literal_sink(id.value()) || weight <= 0.0) {
            continue;
        }
        starts.push_back(id.value());
        start_weights.push_back(weight);
    }
    if (starts.empty()) {
        return tables;
    }

    const bool forward = direction == WalkDirection::Forward;

    std::vector<double> visits(graph.num_nodes(), 0.0);
    std::map<NodeId, std::map<std::string, double>> traversals;
    double total_visits = 0.0;
    double total_traversals = 0.0;

    std::vector<double> step_weights;
    for (size_t walk = 0; walk < config_.walks; ++walk) {
        auto pick = weighted_choice(start_weights, random);
        NodeId current = starts[pick.value()];
        visits[current] += 1.0;
        total_visits += 1.0;

        for (int step = 0; step < config_.max_steps; ++step) {
            const ClassNode& node = graph.node(current);
            const std::vector<EdgeId>& candidates = forward ? node.outgoing : node.incoming;
            if (candidates.empty()) {
                break;
            }

            step_weights.clear();
            for (EdgeId e : candidates) {
                const ClassEdge& edge = graph.edge(e);
                step_weights.push_back(forward ? edge.forward_probability.value_or(0.0)
                                               : edge.backward_probability.value_or(0.0));
            }
            auto chosen = weighted_choice(step_weights, random);
            if (!chosen.has_value()) {
                break;
            }

            const ClassEdge& edge = graph.edge(candidates[chosen.value()]);
            traversals[current][edge.predicate] += 1.0;
            total_traversals += 1.0;

            NodeId next = forward ? edge.target : edge.source;
            if (graph.is_literal_sink(next)) {
                visits[current] += edge.forward_probability.value_or(0.0);
                break;
            }
            visits[next] += 1.0;
            current = next;
        }
    }

    for (NodeId id = 0; id < graph.num_nodes(); ++id) {
        if (graph.is_literal_sink(id)) continue;
        tables.page_rank[graph.node(id).iri] = visits[id] / total_visits;
    }

    if (total_traversals > 0.0) {
        for (const auto& [node_id, by_predicate] : traversals) {
            auto& row = tables.edge_rank[graph.node(node_id).iri];
            for (const auto& [predicate, count] : by_predicate) {
                row[predicate] = count / total_traversals;
            }
        }
    }

    return tables;
}

} // namespace onto
