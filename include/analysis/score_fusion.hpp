#pragma once

#include "analysis/predicate_stats.hpp"
#include "classifier/classifier.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace onto {

/**
 * @brief Fill score, score_ratio and classifier_confidence, then sort
 *
 * raw = sqrt(frequency) * quality * ln(1 + edge_rank) * entropy * uniqueness.
 * Predicates with raw == 0 score 0; the others get exp(raw * N) divided by
 * (sum of those terms / 100), N being the number of predicates. The result
 * is sorted by score, highest first.
 *
 * @throws ClassifierUnavailable if the classifier cannot score
 */
void compute_scores(std::vector<PredicateStats>& stats, const Classifier& classifier);

struct DecisionConfig {
    double score_budget = 60.0;
    double classifier_threshold = 0.5;
};

struct PredicateDecision {
    std::string predicate;
    bool keep = false;
    bool classifier_keep = false;
    bool score_keep = false;
    std::optional<double> hybrid;           // Only set when the two signals disagreed

    nlohmann::json to_json() const;
};

/**
 * @brief Keep/drop decision per predicate
 *
 * The classifier decides (confidence > threshold). Predicates are also
 * score-kept while a budget, starting at score_budget and reduced by each
 * predicate's score in descending order, is still positive. A predicate the
 * classifier drops but the score keeps is kept iff
 * confidence + confidence * score / mean(score-kept scores) >= threshold.
 *
 * Expects stats in compute_scores() order. Decisions are returned in the
 * same order.
 */
std::vector<PredicateDecision> decide(const std::vector<PredicateStats>& stats,
                                      const DecisionConfig& config = {});

} // namespace onto
