#ifndef CLASS_GRAPH_HPP
#define CLASS_GRAPH_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace onto {

using NodeId = size_t;
using EdgeId = size_t;

/**
 * @brief A class in the derived class-relation graph
 *
 * Nodes live in the graph's arena and are addressed by NodeId. Adjacency
 * is stored as edge handles so probabilities can be updated in place.
 */
struct ClassNode {
    std::string iri;                                   // Class IRI in N-Triples form, or the sink label
    std::vector<EdgeId> outgoing;                      // Edges leaving this class
    std::vector<EdgeId> incoming;                      // Edges arriving at this class
};

/**
 * @brief A predicate linking instances of one class to another
 */
struct ClassEdge {
    NodeId source = 0;
    NodeId target = 0;
    std::string predicate;                             // Predicate IRI in N-Triples form
    double count = 0.0;                                // Number of (subject, object) uses

    // Set by assign_edge_probabilities(); unset until then
    std::optional<double> forward_probability;
    std::optional<double> backward_probability;

    nlohmann::json to_json() const;
};

/**
 * @brief Directed multigraph of classes plus one "Literal" sink
 *
 * Key properties:
 * - Arena storage: nodes and edges are addressed by integer handles
 * - The Literal sink always exists (NodeId 0) and never has outgoing edges
 * - Shrinking produces a new snapshot (without_classes), so handles held
 *   against an older snapshot stay valid for that snapshot
 */
class ClassGraph {
public:
    static constexpr const char* kLiteralSink = "Literal";

    ClassGraph();

    // ==========================================
    // Node and Edge Management
    // ==========================================

    /**
     * @brief Add a class node, or return the existing handle
     */
    NodeId add_class(const std::string& iri);

    /**
     * @brief Add (or accumulate into) the edge source --predicate--> target
     * @return Handle of the edge
     *
     * Missing endpoint classes are created. Throws std::invalid_argument if
     * the source is the Literal sink.
     */
    EdgeId add_edge(const std::string& source, const std::string& predicate,
                    const std::string& target, double count);

    std::optional<NodeId> find_node(const std::string& iri) const;
    bool has_class(const std::string& iri) const;

    const ClassNode& node(NodeId id) const { return nodes_.at(id); }
    const ClassEdge& edge(EdgeId id) const { return edges_.at(id); }
    ClassEdge& edge(EdgeId id) { return edges_.at(id); }

    const std::vector<ClassNode>& nodes() const { return nodes_; }
    const std::vector<ClassEdge>& edges() const { return edges_; }

    NodeId literal_sink() const { return 0; }
    bool is_literal_sink(NodeId id) const { return id == 0; }

    /**
     * @brief All class IRIs, excluding the Literal sink, in insertion order
     */
    std::vector<std::string> class_iris() const;

    /**
     * @brief Copy of this graph without the given classes and their edges
     *
     * Directional probabilities are not carried over.
     */
    ClassGraph without_classes(const std::set<std::string>& removed) const;

    // ==========================================
    // Utility Methods
    // ==========================================

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }

    // Number of class nodes (the sink is not counted)
    size_t num_classes() const { return nodes_.size() - 1; }

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;
    void export_to_json(const std::string& filename) const;

    /**
     * @brief Export to Graphviz DOT format for visualization
     *
     * Edges are labelled with the predicate and, when computed, the
     * forward probability.
     */
    void export_to_dot(const std::string& filename) const;

    static ClassGraph from_json(const nlohmann::json& j);
    static ClassGraph load_from_json(const std::string& filename);

private:
    std::vector<ClassNode> nodes_;
    std::vector<ClassEdge> edges_;
    std::map<std::string, NodeId> node_index_;         // iri -> handle
    std::map<std::pair<NodeId, std::pair<std::string, NodeId>>, EdgeId> edge_index_;
};

} // namespace onto

#endif // CLASS_GRAPH_HPP
