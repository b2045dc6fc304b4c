#include "graph/probability_model.hpp"

namespace onto {

void assign_edge_probabilities(ClassGraph& graph) {
    for (NodeId n = 0; n < graph.num_nodes(); ++n) {
        const ClassNode& node = graph.node(n);

        double out_sum = 0.0;
        for (EdgeId e : node.outgoing) {
            out_sum += graph.edge(e).count;
        }
        for (EdgeId e : node.outgoing) {
            ClassEdge& edge = graph.edge(e);
            if (out_sum > 0.0) {
                edge.forward_probability = edge.count / out_sum;
            } else {
                edge.forward_probability.reset();
            }
        }

        double in_sum = 0.0;
        for (EdgeId e : node.incoming) {
            in_sum += graph.edge(e).count;
        }
        for (EdgeId e : node.incoming) {
            ClassEdge& edge = graph.edge(e);
            if (in_sum > 0.0) {
                edge.backward_probability = edge.count / in_sum;
            } else {
                edge.backward_probability.reset();
            }
        }
    }
}

} // namespace onto
