#include "analysis/iterative_pruner.hpp"
#include "graph/probability_model.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace onto {

nlohmann::json ClassRoundRecord::to_json() const {
    nlohmann::json j;
    j["class"] = class_iri;
    j["entity_count"] = entity_count;
    j["depth_score"] = depth_score;
    j["forward_rank"] = forward_rank;
    j["backward_rank"] = backward_rank;
    j["round"] = round;
    j["kept"] = kept;
    j["score"] = score;
    j["weight"] = weight;
    return j;
}

void sort_for_report(std::vector<ClassRoundRecord>& records) {
    std::sort(records.begin(), records.end(), [](const ClassRoundRecord& a, const ClassRoundRecord& b) {
        if (a.round != b.round) return a.round > b.round;
        if (a.score != b.score) return a.score > b.score;
        return a.class_iri < b.class_iri;
    });
}

IterativePruner::IterativePruner(const RandomWalkRanker& ranker, PrunerConfig config)
    : ranker_(ranker), config_(config) {}

PruneResult IterativePruner::prune(
    const ClassGraph& graph,
    std::vector<ReachabilityRecord> order,
    std::map<std::string, double> entity_counts,
    RandomSource& random
) const {
    PruneResult result;
    std::map<std::string, ClassRoundRecord> latest;

    ClassGraph current = graph;
    const int levels = config_.levels;

    for (int round = 0; round < levels; ++round) {
        if (round_cb_) round_cb_(round, levels);

        assign_edge_probabilities(current);
        RankTables forward = ranker_.rank(current, WalkDirection::Forward, entity_counts, random);
        RankTables backward = ranker_.rank(current, WalkDirection::Backward, entity_counts, random);

        double total_entities = 0.0;
        for (const auto& rec : order) {
            auto it = entity_counts.find(rec.class_iri);
            if (it != entity_counts.end()) total_entities += it->second;
        }

        std::vector<ClassRoundRecord> round_records;
        round_records.reserve(order.size());
        for (const auto& rec : order) {
            ClassRoundRecord r;
            r.class_iri = rec.class_iri;
            auto it = entity_counts.find(rec.class_iri);
            r.entity_count = it != entity_counts.end() ? it->second : 0.0;
            r.depth_score = 1.0 / (1.0 + rec.depth);
            r.forward_rank = forward.rank_of(rec.class_iri);
            r.backward_rank = backward.rank_of(rec.class_iri);
            r.round = round;

            double share = total_entities > 0.0 ? r.entity_count / total_entities : 0.0;
            r.score = std::sqrt(std::sqrt(share)) * std::sqrt(r.depth_score) *
                      (3.0 * r.forward_rank + r.backward_rank);
            round_records.push_back(std::move(r));
        }

        double exp_sum = 0.0;
        for (const auto& r : round_records) {
            exp_sum += std::exp(r.score);
        }
        for (auto& r : round_records) {
            r.weight = std::exp(r.score) / exp_sum;
        }

        std::vector<size_t> ranked(round_records.size());
        std::iota(ranked.begin(), ranked.end(), 0);
        std::sort(ranked.begin(), ranked.end(), [&](size_t a, size_t b) {
            if (round_records[a].weight != round_records[b].weight) {
                return round_records[a].weight > round_records[b].weight;
            }
            return round_records[a].class_iri < round_records[b].class_iri;
        });

        const double threshold = static_cast<double>(round + 1) / (levels + 1);
        double cumulative = 0.0;
        std::set<std::string> removed;
        for (size_t idx : ranked) {
            ClassRoundRecord& r = round_records[idx];
            if (cumulative > threshold) {
                r.kept = false;
                removed.insert(r.class_iri);
            } else {
                r.kept = true;
                cumulative += r.weight;
            }
        }

        for (const auto& r : round_records) {
            latest[r.class_iri] = r;
        }

        if (config_.verbose) {
            std::cout << "  Round " << (round + 1) << "/" << levels << ": kept "
                      << (round_records.size() - removed.size()) << " of "
                      << round_records.size() << " classes (threshold "
                      << threshold << ")\n";
        }

        current = current.without_classes(removed);
        order.erase(std::remove_if(order.begin(), order.end(), [&](const ReachabilityRecord& rec) {
            return removed.count(rec.class_iri) > 0;
        }), order.end());
        for (const auto& cls : removed) {
            entity_counts.erase(cls);
        }

        result.final_forward = std::move(forward);
    }

    for (const auto& rec : order) {
        result.keep_set.insert(rec.class_iri);
    }
    for (const auto& [cls, rec] : latest) {
        result.class_scores[cls] = rec.score;
        result.records.push_back(rec);
    }
    sort_for_report(result.records);
    result.graph = std::move(current);

    return result;
}

} // namespace onto
