#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace onto {

/**
 * @brief Statistics of one predicate over the instances of one class
 */
struct PredicateStats {
    std::string predicate;
    double frequency = 0.0;                 // Share of instances using the predicate
    double uniqueness = 0.0;                // distinct objects / total uses
    double entropy = 0.0;                   // Base-2 entropy of object values (min-max scaled)
    double quality = 0.0;                   // Co-occurrence quality (min-max scaled)
    double edge_rank = 0.0;
    double score = 0.0;                     // Softmax share on a 0-100 scale
    double classifier_confidence = 0.0;
    std::optional<double> score_ratio;      // Next lower score / this score

    nlohmann::json to_json() const;
    static PredicateStats from_json(const nlohmann::json& j);
};

nlohmann::json stats_to_json(const std::vector<PredicateStats>& stats);
std::vector<PredicateStats> stats_from_json(const nlohmann::json& j);

/**
 * @brief Shannon entropy (base 2) of a partition given by group sizes
 *
 * Empty groups contribute nothing; an empty or all-zero input has entropy 0.
 */
double shannon_entropy(const std::vector<size_t>& group_sizes);

/**
 * @brief Min-max scale values to [0, 1]; a constant column becomes all zeros
 */
void normalize_column(std::vector<double>& values);

/**
 * @brief Min-max scale one member across a set of predicate statistics
 *
 * e.g. normalize_column(stats, &PredicateStats::entropy)
 */
void normalize_column(std::vector<PredicateStats>& stats, double PredicateStats::*column);

/**
 * @brief Sum over subjects of total_predicates / predicates on that subject
 *
 * subject_predicate_counts holds, per subject using the predicate, how many
 * distinct predicates it carries (the predicate itself included). Zero
 * counts are skipped.
 */
double co_occurrence_quality(size_t total_predicates,
                             const std::vector<size_t>& subject_predicate_counts);

} // namespace onto
