#pragma once

#include "store/sparql_queries.hpp"
#include "store/store.hpp"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace onto {

struct MutatorConfig {
    std::string additional_type_predicate = sparql::kAdditionalTypePredicate;
    size_t max_type_resolution_passes = 100;
    bool verbose = false;
};

/**
 * @brief One duplicate-type rewrite: entities typed with both, keep primary
 */
struct TypeDemotion {
    std::string primary;
    std::string demoted;
};

/**
 * @brief Applies analysis decisions to the store
 *
 * Each mutation writes a plain description line to the audit log, runs the
 * update and then records the update text as a fenced sparql block.
 *
 * Updates are not transactional: if one fails, the updates before it stay
 * applied and the QueryFailed propagates.
 */
class Mutator {
public:
    Mutator(Store& store, MutatorConfig config = {});

    /**
     * @brief Remove every class of all_classes that is not in keep_set
     * @return Classes removed
     */
    std::vector<std::string> apply_keep_set(const std::vector<std::string>& all_classes,
                                            const std::set<std::string>& keep_set);

    /**
     * @brief Delete the given predicates from instances of class_iri
     */
    void drop_predicates(const std::string& class_iri, const std::vector<std::string>& predicates);

    /**
     * @brief Demote lower-scored types until no entity has two types
     *
     * For each conflicting pair the higher class score stays the primary
     * type; on equal scores the lexicographically smaller IRI wins. Classes
     * without a score count as 0. Stops once a pass finds no conflict, or
     * after max_type_resolution_passes passes.
     *
     * @return Every demotion performed, in order
     */
    std::vector<TypeDemotion> resolve_duplicate_types(const std::map<std::string, double>& class_scores);

    /**
     * @brief Which of two conflicting classes stays primary
     */
    static TypeDemotion choose_primary(const std::string& a, const std::string& b,
                                       const std::map<std::string, double>& class_scores);

private:
    Store& store_;
    MutatorConfig config_;

    void execute(const std::string& description, const std::string& update_text);
};

} // namespace onto
