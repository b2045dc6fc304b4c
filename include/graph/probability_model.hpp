#pragma once

#include "graph/class_graph.hpp"

namespace onto {

/**
 * @brief Assign normalized directional probabilities to every edge
 *
 * For each node, an outgoing edge's forward probability is its count over
 * the summed counts of the node's outgoing edges; backward probabilities
 * are the same over incoming edges. A direction whose counts sum to zero
 * is left unset.
 */
void assign_edge_probabilities(ClassGraph& graph);

} // namespace onto
