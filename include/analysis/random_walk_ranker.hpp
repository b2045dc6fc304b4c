#pragma once

#include "analysis/random_source.hpp"
#include "graph/class_graph.hpp"
#include <map>
#include <string>

namespace onto {

enum class WalkDirection {
    Forward,    // follow outgoing edges by forward probability
    Backward    // follow incoming edges by backward probability
};

/**
 * @brief Monte-Carlo visitation shares
 *
 * page_rank: class -> share of walks visiting it (plus mass absorbed by
 * the Literal sink on its way out). edge_rank: class -> predicate -> share
 * of all edge traversals that left the class through that predicate.
 */
struct RankTables {
    std::map<std::string, double> page_rank;
    std::map<std::string, std::map<std::string, double>> edge_rank;

    double rank_of(const std::string& class_iri) const;

    // Empty map when the class was never left through an edge
    std::map<std::string, double> edge_rank_for(const std::string& class_iri) const;
};

struct RankerConfig {
    size_t walks = 10000;                   // Independent walks per ranking
    int max_steps = 10;                     // Steps per walk
};

/**
 * @brief Simplified PageRank estimated by simulation
 *
 * Each walk starts at a class drawn in proportion to node_weights (classes
 * with zero or no weight never start a walk) and takes up to max_steps
 * steps, choosing an edge in proportion to its directional probability.
 * A walk stops at a class with no edge in the walk direction, or when it
 * steps into the Literal sink, in which case the edge's forward
 * probability is credited to the class being left.
 *
 * Page ranks are normalized by the number of walks, edge ranks by the
 * number of edge traversals. Requires assign_edge_probabilities() to have
 * run on the graph.
 */
class RandomWalkRanker {
public:
    explicit RandomWalkRanker(RankerConfig config = {});

    RankTables rank(
        const ClassGraph& graph,
        WalkDirection direction,
        const std::map<std::string, double>& node_weights,
        RandomSource& random
    ) const;

    const RankerConfig& config() const { return config_; }

private:
    RankerConfig config_;
};

} // namespace onto
