#pragma once

#include "analysis/random_source.hpp"
#include "analysis/random_walk_ranker.hpp"
#include "graph/class_graph.hpp"
#include "graph/reachability.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace onto {

/**
 * @brief State of one class in one pruning round
 *
 * Overwritten each round the class takes part in; a class removed early
 * keeps its last (not kept) record.
 */
struct ClassRoundRecord {
    std::string class_iri;
    double entity_count = 0.0;
    double depth_score = 0.0;               // 1 / (1 + depth)
    double forward_rank = 0.0;
    double backward_rank = 0.0;
    int round = 0;
    bool kept = false;
    double score = 0.0;                     // Composite structural score
    double weight = 0.0;                    // exp(score) share within the round

    nlohmann::json to_json() const;
};

struct PrunerConfig {
    int levels = 3;                         // Number of shrinking rounds
    bool verbose = false;
};

struct PruneResult {
    std::set<std::string> keep_set;
    std::map<std::string, double> class_scores;     // Last recorded score per class
    std::vector<ClassRoundRecord> records;          // Sorted with sort_for_report()
    RankTables final_forward;                       // Forward ranks of the last round
    ClassGraph graph;                               // Graph restricted to the keep-set
};

// Called at the start of each round with (round, levels)
using RoundCallback = std::function<void(int round, int levels)>;

/**
 * @brief Multi-round graph shrinking driven by structural scores
 *
 * Each round recomputes edge probabilities on the current snapshot, ranks
 * classes forward and backward, scores every remaining class of the order
 * as sqrt(sqrt(count / total)) * sqrt(depth_score) * (3 * forward + backward),
 * and keeps classes (highest softmax weight first) until the cumulative
 * weight exceeds (round + 1) / (levels + 1). The rest are dropped from the
 * next snapshot.
 */
class IterativePruner {
public:
    IterativePruner(const RandomWalkRanker& ranker, PrunerConfig config = {});

    void set_round_callback(RoundCallback cb) { round_cb_ = std::move(cb); }

    PruneResult prune(
        const ClassGraph& graph,
        std::vector<ReachabilityRecord> order,
        std::map<std::string, double> entity_counts,
        RandomSource& random
    ) const;

private:
    const RandomWalkRanker& ranker_;
    PrunerConfig config_;
    RoundCallback round_cb_;
};

/**
 * @brief Order records for reporting
 *
 * Later-surviving round first, then score descending, then IRI.
 */
void sort_for_report(std::vector<ClassRoundRecord>& records);

} // namespace onto
