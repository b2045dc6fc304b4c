#pragma once

#include "analysis/predicate_stats.hpp"
#include "cache/analysis_cache.hpp"
#include "store/store.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace onto {

struct PredicateAnalyzerConfig {
    std::string dataset_name;
    size_t worker_threads = 4;
    bool verbose = false;
};

/**
 * @brief Per-class predicate statistics, computed in parallel and cached
 *
 * For every non-type predicate of a class: frequency, uniqueness, entropy
 * and co-occurrence quality, then the edge rank from the structural
 * analysis. Pure identifier predicates (uniqueness 1) are discarded and
 * entropy / quality are min-max scaled across the remaining predicates.
 *
 * Results are cached per (dataset, class) and stamped with the store's
 * mutation version; any other version is recomputed.
 */
class PredicateAnalyzer {
public:
    PredicateAnalyzer(Store& store, KeyValueCache& cache, PredicateAnalyzerConfig config);

    /**
     * @brief Statistics for class_iri, or nullopt if no informative predicate remains
     * @param edge_rank predicate -> edge rank of class_iri (absent = 0)
     * @throws QueryFailed
     */
    std::optional<std::vector<PredicateStats>> analyze(
        const std::string& class_iri,
        const std::map<std::string, double>& edge_rank
    );

    /**
     * @brief Raw (unscaled, unfiltered) statistics of one predicate
     */
    PredicateStats predicate_stats(const std::string& class_iri,
                                   const std::string& predicate,
                                   double instance_count,
                                   size_t total_predicates);

private:
    Store& store_;
    KeyValueCache& cache_;
    PredicateAnalyzerConfig config_;

    std::vector<PredicateStats> compute(const std::string& class_iri);
    std::optional<std::vector<PredicateStats>> load_cached(const std::string& class_iri, size_t version) const;
};

} // namespace onto
