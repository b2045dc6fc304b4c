#pragma once

#include "graph/class_graph.hpp"
#include <string>
#include <vector>

namespace onto {

struct ReachabilityRecord {
    std::string class_iri;
    int depth = 0;                          // Shortest BFS distance from the root
};

/**
 * @brief Classes reachable from root along outgoing edges, deepest-discovered first
 *
 * Breadth-first from root; the Literal sink is never entered and every
 * class is recorded at its first-seen depth. The result is the discovery
 * order reversed, so pruning decisions flow from the leaves toward the
 * root. Returns an empty vector if root is not a class of the graph.
 */
std::vector<ReachabilityRecord> reachability_order(const ClassGraph& graph, const std::string& root);

/**
 * @brief Resolve a root hint to a class IRI
 *
 * "Book" with namespace "http://schema.org/" becomes "<http://schema.org/Book>";
 * a hint already in "<...>" form is returned unchanged.
 */
std::string resolve_class_iri(const std::string& hint, const std::string& class_namespace);

} // namespace onto
