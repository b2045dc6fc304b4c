#include "analysis/predicate_stats.hpp"
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace onto {

json PredicateStats::to_json() const {
    json j;
    j["predicate"] = predicate;
    j["frequency"] = frequency;
    j["uniqueness"] = uniqueness;
    j["entropy"] = entropy;
    j["quality"] = quality;
    j["edge_rank"] = edge_rank;
    j["score"] = score;
    j["classifier_confidence"] = classifier_confidence;
    if (score_ratio.has_value()) {
        j["score_ratio"] = score_ratio.value();
    }
    return j;
}

PredicateStats PredicateStats::from_json(const json& j) {
    PredicateStats s;
    s.predicate = j.at("predicate").get<std::string>();
    s.frequency = j.at("frequency").get<double>();
    s.uniqueness = j.at("uniqueness").get<double>();
    s.entropy = j.at("entropy").get<double>();
    s.quality = j.at("quality").get<double>();
    s.edge_rank = j.value("edge_rank", 0.0);
    s.score = j.value("score", 0.0);
    s.classifier_confidence = j.value("classifier_confidence", 0.0);
    if (j.contains("score_ratio")) {
        s.score_ratio = j["score_ratio"].get<double>();
    }
    return s;
}

json stats_to_json(const std::vector<PredicateStats>& stats) {
    json arr = json::array();
    for (const auto& s : stats) {
        arr.push_back(s.to_json());
    }
    return arr;
}

std::vector<PredicateStats> stats_from_json(const json& j) {
    std::vector<PredicateStats> stats;
    for (const auto& sj : j) {
        stats.push_back(PredicateStats::from_json(sj));
    }
    return stats;
}

double shannon_entropy(const std::vector<size_t>& group_sizes) {
    double total = 0.0;
    for (size_t n : group_sizes) total += static_cast<double>(n);
    if (total <= 0.0) {
        return 0.0;
    }

    double entropy = 0.0;
    for (size_t n : group_sizes) {
        if (n == 0) continue;
        double p = static_cast<double>(n) / total;
        entropy -= p * std::log2(p);
    }
    // -0.0 for a single group
    return entropy == 0.0 ? 0.0 : entropy;
}

void normalize_column(std::vector<double>& values) {
    if (values.empty()) return;

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double min_val = *min_it;
    double max_val = *max_it;

    if (std::abs(max_val - min_val) < 1e-12) {
        std::fill(values.begin(), values.end(), 0.0);
        return;
    }
    for (double& v : values) {
        v = (v - min_val) / (max_val - min_val);
    }
}

void normalize_column(std::vector<PredicateStats>& stats, double PredicateStats::*column) {
    std::vector<double> values;
    values.reserve(stats.size());
    for (const auto& s : stats) {
        values.push_back(s.*column);
    }
    normalize_column(values);
    for (size_t i = 0; i < stats.size(); ++i) {
        stats[i].*column = values[i];
    }
}

double co_occurrence_quality(size_t total_predicates,
                             const std::vector<size_t>& subject_predicate_counts) {
    double quality = 0.0;
    for (size_t count : subject_predicate_counts) {
        if (count == 0) continue;
        quality += static_cast<double>(total_predicates) / static_cast<double>(count);
    }
    return quality;
}

} // namespace onto
