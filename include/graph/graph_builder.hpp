#pragma once

#include "cache/analysis_cache.hpp"
#include "graph/class_graph.hpp"
#include "store/store.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace onto {

/**
 * @brief One row of the class adjacency list: source --predicate--> target, count
 *
 * target is ClassGraph::kLiteralSink when the objects carry no class.
 */
struct RelationRecord {
    std::string source;
    std::string predicate;
    std::string target;
    double count = 0.0;
};

/**
 * @brief Everything needed to materialize a ClassGraph; this is what gets cached
 */
struct RelationSet {
    std::vector<std::string> classes;
    std::vector<RelationRecord> relations;

    ClassGraph materialize() const;

    nlohmann::json to_json() const;
    static RelationSet from_json(const nlohmann::json& j);
};

struct GraphBuilderConfig {
    std::string dataset_name;
    bool verbose = false;
};

/**
 * @brief Derives the class-relation graph from the live store
 *
 * The adjacency list is cached under the dataset's name, stamped with the
 * store's mutation version; a stale or unreadable entry is recomputed.
 */
class GraphBuilder {
public:
    GraphBuilder(Store& store, KeyValueCache& cache, GraphBuilderConfig config);

    /**
     * @brief Build the class graph, from cache when the version matches
     * @throws QueryFailed if the store cannot list classes or relations
     */
    ClassGraph build();

    /**
     * @brief Query the store for classes and their outgoing relations
     */
    RelationSet query_relations();

private:
    Store& store_;
    KeyValueCache& cache_;
    GraphBuilderConfig config_;

    std::optional<RelationSet> load_cached(size_t version) const;
};

} // namespace onto
