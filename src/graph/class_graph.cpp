#include "graph/class_graph.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace onto {

namespace {

// DOT identifiers may not contain raw quotes
std::string dot_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"') out += "\\\"";
        else out += c;
    }
    return out;
}

// "<http://schema.org/Book>" -> "Book"
std::string short_label(const std::string& iri) {
    std::string label = iri;
    if (label.size() >= 2 && label.front() == '<' && label.back() == '>') {
        label = label.substr(1, label.size() - 2);
    }
    auto pos = label.find_last_of("/#");
    if (pos != std::string::npos && pos + 1 < label.size()) {
        label = label.substr(pos + 1);
    }
    return label;
}

} // anonymous namespace

// ==========================================
// ClassEdge Implementation
// ==========================================

nlohmann::json ClassEdge::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    j["predicate"] = predicate;
    j["count"] = count;
    if (forward_probability.has_value()) {
        j["forward_probability"] = forward_probability.value();
    }
    if (backward_probability.has_value()) {
        j["backward_probability"] = backward_probability.value();
    }
    return j;
}

// ==========================================
// ClassGraph Implementation
// ==========================================

ClassGraph::ClassGraph() {
    add_class(kLiteralSink);
}

NodeId ClassGraph::add_class(const std::string& iri) {
    auto it = node_index_.find(iri);
    if (it != node_index_.end()) {
        return it->second;
    }

    NodeId id = nodes_.size();
    ClassNode node;
    node.iri = iri;
    nodes_.push_back(std::move(node));
    node_index_[iri] = id;
    return id;
}

EdgeId ClassGraph::add_edge(const std::string& source, const std::string& predicate,
                            const std::string& target, double count) {
    if (source == kLiteralSink) {
        throw std::invalid_argument("The Literal sink cannot have outgoing edges");
    }

    NodeId src = add_class(source);
    NodeId tgt = add_class(target);

    auto key = std::make_pair(src, std::make_pair(predicate, tgt));
    auto existing = edge_index_.find(key);
    if (existing != edge_index_.end()) {
        edges_[existing->second].count += count;
        return existing->second;
    }

    EdgeId id = edges_.size();
    ClassEdge edge;
    edge.source = src;
    edge.target = tgt;
    edge.predicate = predicate;
    edge.count = count;
    edges_.push_back(std::move(edge));

    nodes_[src].outgoing.push_back(id);
    nodes_[tgt].incoming.push_back(id);
    edge_index_[key] = id;
    return id;
}

std::optional<NodeId> ClassGraph::find_node(const std::string& iri) const {
    auto it = node_index_.find(iri);
    if (it == node_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ClassGraph::has_class(const std::string& iri) const {
    return iri != kLiteralSink && node_index_.count(iri) > 0;
}

std::vector<std::string> ClassGraph::class_iris() const {
    std::vector<std::string> result;
    result.reserve(nodes_.size());
    for (NodeId id = 1; id < nodes_.size(); ++id) {
        result.push_back(nodes_[id].iri);
    }
    return result;
}

ClassGraph ClassGraph::without_classes(const std::set<std::string>& removed) const {
    ClassGraph shrunk;

    for (NodeId id = 1; id < nodes_.size(); ++id) {
        if (removed.count(nodes_[id].iri) == 0) {
            shrunk.add_class(nodes_[id].iri);
        }
    }

    for (const auto& e : edges_) {
        const std::string& src = nodes_[e.source].iri;
        const std::string& tgt = nodes_[e.target].iri;
        if (removed.count(src) > 0 || removed.count(tgt) > 0) {
            continue;
        }
        shrunk.add_edge(src, e.predicate, tgt, e.count);
    }

    return shrunk;
}

// ==========================================
// Export/Import Methods
// ==========================================

nlohmann::json ClassGraph::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes_) {
        nodes_json.push_back(node.iri);
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges_) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    j["metadata"] = {
        {"num_classes", num_classes()},
        {"num_edges", edges_.size()}
    };

    return j;
}

void ClassGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

void ClassGraph::export_to_dot(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << "digraph ClassGraph {\n";
    file << "  rankdir=LR;\n";
    file << "  node [shape=ellipse, style=filled, color=lightblue];\n\n";

    for (NodeId id = 0; id < nodes_.size(); ++id) {
        file << "  n" << id << " [label=\"" << dot_escape(short_label(nodes_[id].iri)) << "\"";
        if (is_literal_sink(id)) {
            file << ", shape=box, color=lightgray";
        }
        file << "];\n";
    }

    file << "\n";

    for (const auto& edge : edges_) {
        std::stringstream label;
        label << short_label(edge.predicate);
        if (edge.forward_probability.has_value()) {
            label << " (" << std::fixed << std::setprecision(2)
                  << edge.forward_probability.value() << ")";
        }
        file << "  n" << edge.source << " -> n" << edge.target
             << " [label=\"" << dot_escape(label.str()) << "\"];\n";
    }

    file << "}\n";
    file.close();
}

ClassGraph ClassGraph::from_json(const nlohmann::json& j) {
    ClassGraph graph;

    std::vector<std::string> names;
    if (j.contains("nodes")) {
        names = j["nodes"].get<std::vector<std::string>>();
        for (const auto& name : names) {
            graph.add_class(name);
        }
    }

    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            size_t src = edge_json.at("source").get<size_t>();
            size_t tgt = edge_json.at("target").get<size_t>();
            if (src >= names.size() || tgt >= names.size()) {
                throw std::runtime_error("Edge refers to an unknown node index");
            }
            EdgeId id = graph.add_edge(names[src], edge_json.at("predicate").get<std::string>(),
                                       names[tgt], edge_json.value("count", 0.0));
            if (edge_json.contains("forward_probability")) {
                graph.edge(id).forward_probability = edge_json["forward_probability"].get<double>();
            }
            if (edge_json.contains("backward_probability")) {
                graph.edge(id).backward_probability = edge_json["backward_probability"].get<double>();
            }
        }
    }

    return graph;
}

ClassGraph ClassGraph::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    file.close();

    return from_json(j);
}

} // namespace onto
