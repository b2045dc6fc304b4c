#include "analysis/score_fusion.hpp"
#include <algorithm>
#include <cmath>

namespace onto {

void compute_scores(std::vector<PredicateStats>& stats, const Classifier& classifier) {
    const double temperature = static_cast<double>(stats.size());

    std::vector<double> raw(stats.size(), 0.0);
    double max_raw = 0.0;
    bool any_nonzero = false;
    for (size_t i = 0; i < stats.size(); ++i) {
        PredicateStats& s = stats[i];
        double r_scaled = std::log(1.0 + s.edge_rank);
        double structural = std::sqrt(s.frequency) * s.quality * r_scaled;
        double data_based = s.entropy * s.uniqueness;
        raw[i] = structural * data_based;

        if (raw[i] != 0.0 && (!any_nonzero || raw[i] > max_raw)) {
            max_raw = raw[i];
            any_nonzero = true;
        }

        s.classifier_confidence = classifier.score(
            {s.frequency, s.uniqueness, s.entropy, s.quality, s.edge_rank});
    }

    // Exponents are shifted by the largest raw score so exp() stays in (0, 1]
    double denominator = 0.0;
    for (size_t i = 0; i < stats.size(); ++i) {
        if (raw[i] != 0.0) {
            stats[i].score = std::exp((raw[i] - max_raw) * temperature);
            denominator += stats[i].score;
        } else {
            stats[i].score = 0.0;
        }
    }

    for (auto& s : stats) {
        if (s.score == 0.0) continue;
        s.score /= denominator / 100.0;
    }

    std::stable_sort(stats.begin(), stats.end(), [](const PredicateStats& a, const PredicateStats& b) {
        return a.score > b.score;
    });

    for (size_t i = 0; i < stats.size(); ++i) {
        stats[i].score_ratio.reset();
        if (i + 1 < stats.size() && stats[i].score > 0.0) {
            stats[i].score_ratio = stats[i + 1].score / stats[i].score;
        }
    }
}

nlohmann::json PredicateDecision::to_json() const {
    nlohmann::json j;
    j["predicate"] = predicate;
    j["keep"] = keep;
    j["classifier_keep"] = classifier_keep;
    j["score_keep"] = score_keep;
    if (hybrid.has_value()) {
        j["hybrid"] = hybrid.value();
    }
    return j;
}

std::vector<PredicateDecision> decide(const std::vector<PredicateStats>& stats,
                                      const DecisionConfig& config) {
    std::vector<PredicateDecision> decisions(stats.size());

    double budget = config.score_budget;
    double kept_sum = 0.0;
    size_t kept_count = 0;
    for (size_t i = 0; i < stats.size(); ++i) {
        decisions[i].predicate = stats[i].predicate;
        decisions[i].classifier_keep = stats[i].classifier_confidence > config.classifier_threshold;

        // Zero-score predicates never enter the ranking
        if (stats[i].score <= 0.0 || budget <= 0.0) continue;
        decisions[i].score_keep = true;
        kept_sum += stats[i].score;
        ++kept_count;
        budget -= stats[i].score;
    }

    const double mean_kept = kept_count > 0 ? kept_sum / static_cast<double>(kept_count) : 0.0;

    for (size_t i = 0; i < stats.size(); ++i) {
        PredicateDecision& d = decisions[i];
        if (!d.classifier_keep && d.score_keep) {
            double conf = stats[i].classifier_confidence;
            d.hybrid = conf + conf * stats[i].score / mean_kept;
            d.keep = d.hybrid.value() >= config.classifier_threshold;
        } else {
            d.keep = d.classifier_keep;
        }
    }

    return decisions;
}

} // namespace onto
