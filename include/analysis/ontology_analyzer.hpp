#pragma once

#include "analysis/iterative_pruner.hpp"
#include "analysis/predicate_analyzer.hpp"
#include "analysis/random_source.hpp"
#include "analysis/random_walk_ranker.hpp"
#include "analysis/score_fusion.hpp"
#include "cache/analysis_cache.hpp"
#include "classifier/classifier.hpp"
#include "config/analyzer_config.hpp"
#include "graph/class_graph.hpp"
#include "graph/reachability.hpp"
#include "mutation/mutator.hpp"
#include "store/store.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace onto {

// ============================================================================
// Errors
// ============================================================================

enum class AnalysisPhase {
    GraphBuild,
    Ranking,
    PredicateAnalysis,
    Mutation
};

std::string phase_name(AnalysisPhase phase);

/**
 * @brief An analysis run failed; carries the phase that failed
 *
 * The store keeps whatever state the last successful update left it in.
 */
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(AnalysisPhase phase, const std::string& message)
        : std::runtime_error("Analysis failed during " + phase_name(phase) + ": " + message),
          phase_(phase) {}

    AnalysisPhase phase() const { return phase_; }

private:
    AnalysisPhase phase_;
};

// ============================================================================
// Reports
// ============================================================================

/**
 * @brief Outcome of graph build, reachability and iterative pruning
 */
struct StructureReport {
    std::string root;                               // Resolved root class IRI
    ClassGraph graph;                               // Full derived class graph
    std::vector<ReachabilityRecord> order;          // Reachable classes, deepest first
    std::set<std::string> keep_set;
    std::map<std::string, double> class_scores;
    std::vector<ClassRoundRecord> records;          // Sorted for reporting
    RankTables final_forward;

    nlohmann::json to_json() const;
};

/**
 * @brief Predicate statistics and keep/drop decisions for one kept class
 *
 * stats is nullopt when no informative predicate remains; that is a valid
 * result, not an error.
 */
struct ClassPredicateReport {
    std::string class_iri;
    std::optional<std::vector<PredicateStats>> stats;
    std::vector<PredicateDecision> decisions;

    std::vector<std::string> dropped_predicates() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Statistics from an analysis run
 */
struct AnalysisStatistics {
    size_t total_classes = 0;
    size_t reachable_classes = 0;
    size_t kept_classes = 0;
    size_t classes_analyzed = 0;
    size_t classes_without_analysis = 0;
    size_t predicates_scored = 0;
    size_t predicates_dropped = 0;

    double total_time_seconds = 0.0;
    double graph_building_time_seconds = 0.0;
    double ranking_time_seconds = 0.0;
    double predicate_time_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

struct AnalysisReport {
    StructureReport structure;
    std::vector<ClassPredicateReport> classes;
    AnalysisStatistics statistics;

    nlohmann::json to_json() const;
    void save_to_json(const std::string& filename) const;
};

/**
 * @brief What apply() changed in the store
 */
struct MutationSummary {
    std::vector<std::string> removed_classes;
    std::map<std::string, std::vector<std::string>> dropped_predicates;
    std::vector<TypeDemotion> demotions;

    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Ontology Analyzer
// ============================================================================

/**
 * @brief End-to-end ontology structure analysis
 *
 * Class graph -> reachability order -> iterative pruning -> per-class
 * predicate analysis -> score fusion and decisions -> mutations.
 *
 * Store and classifier failures surface as AnalysisError naming the phase.
 */
class OntologyAnalyzer {
public:
    OntologyAnalyzer(Store& store,
                     KeyValueCache& cache,
                     const Classifier& classifier,
                     RandomSource& random,
                     const AnalyzerConfig& config);

    void set_progress_callback(ProgressCallback callback);

    /**
     * @brief Build (or load from cache) the class graph only
     */
    ClassGraph build_graph();

    StructureReport analyze_structure();

    ClassPredicateReport analyze_predicates(const std::string& class_iri,
                                            const StructureReport& structure);

    /**
     * @brief Structure analysis plus predicate analysis of every kept class
     */
    AnalysisReport run();

    /**
     * @brief Remove dropped classes and predicates, then resolve duplicate types
     */
    MutationSummary apply(const AnalysisReport& report);

    std::vector<TypeDemotion> resolve_types(const StructureReport& structure);

    const AnalyzerConfig& get_config() const { return config_; }
    const AnalysisStatistics& get_statistics() const { return stats_; }

private:
    Store& store_;
    KeyValueCache& cache_;
    const Classifier& classifier_;
    RandomSource& random_;
    AnalyzerConfig config_;

    RandomWalkRanker ranker_;
    PredicateAnalyzer predicate_analyzer_;
    AnalysisStatistics stats_;
    ProgressCallback progress_callback_;

    std::map<std::string, double> count_entities(const std::vector<ReachabilityRecord>& order);
    MutatorConfig mutator_config() const;
    void report_progress(const std::string& stage, int current, int total, const std::string& message);
};

} // namespace onto
