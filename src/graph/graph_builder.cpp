#include "graph/graph_builder.hpp"
#include "store/sparql_queries.hpp"
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace onto {

// ==========================================
// RelationSet Implementation
// ==========================================

ClassGraph RelationSet::materialize() const {
    ClassGraph graph;
    for (const auto& cls : classes) {
        graph.add_class(cls);
    }
    for (const auto& rel : relations) {
        graph.add_edge(rel.source, rel.predicate, rel.target, rel.count);
    }
    return graph;
}

json RelationSet::to_json() const {
    json j;
    j["classes"] = classes;

    json rows = json::array();
    for (const auto& rel : relations) {
        rows.push_back(json::array({rel.source, rel.predicate, rel.target, rel.count}));
    }
    j["relations"] = rows;
    return j;
}

RelationSet RelationSet::from_json(const json& j) {
    RelationSet set;
    set.classes = j.at("classes").get<std::vector<std::string>>();
    for (const auto& row : j.at("relations")) {
        RelationRecord rel;
        rel.source = row.at(0).get<std::string>();
        rel.predicate = row.at(1).get<std::string>();
        rel.target = row.at(2).get<std::string>();
        rel.count = row.at(3).get<double>();
        set.relations.push_back(std::move(rel));
    }
    return set;
}

// ==========================================
// GraphBuilder Implementation
// ==========================================

GraphBuilder::GraphBuilder(Store& store, KeyValueCache& cache, GraphBuilderConfig config)
    : store_(store), cache_(cache), config_(std::move(config)) {}

ClassGraph GraphBuilder::build() {
    size_t version = store_.history_version();

    if (auto cached = load_cached(version)) {
        if (config_.verbose) {
            std::cout << "Class graph loaded from cache (version " << version << ")\n";
        }
        return cached->materialize();
    }

    RelationSet relations = query_relations();
    cache_.put(relations_cache_key(config_.dataset_name), version, relations.to_json().dump());

    if (config_.verbose) {
        std::cout << "Class graph built: " << relations.classes.size() << " classes, "
                  << relations.relations.size() << " relations\n";
    }
    return relations.materialize();
}

RelationSet GraphBuilder::query_relations() {
    RelationSet result;

    std::set<std::string> seen;
    for (const auto& row : store_.query(sparql::distinct_classes())) {
        auto it = row.find("class");
        // Blank-node or literal "classes" carry no structure worth ranking
        if (it == row.end() || !it->second.is_iri()) continue;
        std::string cls = it->second.to_sparql();
        if (seen.insert(cls).second) {
            result.classes.push_back(cls);
        }
    }

    for (const auto& cls : result.classes) {
        for (const auto& row : store_.query(sparql::class_relations(cls))) {
            std::string predicate = binding_text(row, "p");
            if (predicate.empty() || predicate == sparql::kTypePredicate) continue;

            RelationRecord rel;
            rel.source = cls;
            rel.predicate = predicate;

            auto otype = row.find("otype");
            if (otype != row.end() && otype->second.is_iri()) {
                rel.target = otype->second.to_sparql();
            } else {
                rel.target = ClassGraph::kLiteralSink;
            }
            rel.count = binding_number(row, "count");
            result.relations.push_back(std::move(rel));
        }
    }

    return result;
}

std::optional<RelationSet> GraphBuilder::load_cached(size_t version) const {
    std::string key = relations_cache_key(config_.dataset_name);
    try {
        auto entry = cache_.get(key);
        if (!entry.has_value() || entry->version != version) {
            return std::nullopt;
        }
        return RelationSet::from_json(json::parse(entry->bytes));
    } catch (const CacheCorrupt& e) {
        if (config_.verbose) {
            std::cerr << e.what() << "; rebuilding class graph\n";
        }
    } catch (const json::exception& e) {
        if (config_.verbose) {
            std::cerr << "Cache corrupt: " << key << ": " << e.what() << "; rebuilding class graph\n";
        }
    }
    return std::nullopt;
}

} // namespace onto
