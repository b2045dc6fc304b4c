#include "analysis/ontology_analyzer.hpp"
#include "graph/graph_builder.hpp"
#include "store/sparql_queries.hpp"
#include <chrono>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace onto {

namespace {

// Runs fn, rethrowing any failure as an AnalysisError for phase
template <typename Fn>
auto in_phase(AnalysisPhase phase, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const AnalysisError&) {
        throw;
    } catch (const std::exception& e) {
        throw AnalysisError(phase, e.what());
    }
}

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();
}

} // namespace

std::string phase_name(AnalysisPhase phase) {
    switch (phase) {
        case AnalysisPhase::GraphBuild: return "graph_build";
        case AnalysisPhase::Ranking: return "ranking";
        case AnalysisPhase::PredicateAnalysis: return "predicate_analysis";
        case AnalysisPhase::Mutation: return "mutation";
    }
    return "unknown";
}

// ============================================================================
// Reports
// ============================================================================

json StructureReport::to_json() const {
    json j;
    j["root"] = root;
    j["num_classes"] = graph.num_classes();
    j["num_edges"] = graph.num_edges();
    j["reachable_classes"] = order.size();
    j["keep_set"] = keep_set;
    j["class_scores"] = class_scores;

    json rounds = json::array();
    for (const auto& rec : records) {
        rounds.push_back(rec.to_json());
    }
    j["rounds"] = rounds;
    j["edge_rank"] = final_forward.edge_rank;
    return j;
}

std::vector<std::string> ClassPredicateReport::dropped_predicates() const {
    std::vector<std::string> dropped;
    for (const auto& d : decisions) {
        if (!d.keep) dropped.push_back(d.predicate);
    }
    return dropped;
}

json ClassPredicateReport::to_json() const {
    json j;
    j["class"] = class_iri;
    if (!stats.has_value()) {
        j["stats"] = nullptr;
        j["decisions"] = json::array();
        return j;
    }
    j["stats"] = stats_to_json(stats.value());

    json arr = json::array();
    for (const auto& d : decisions) {
        arr.push_back(d.to_json());
    }
    j["decisions"] = arr;
    return j;
}

void AnalysisStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Ontology Analysis Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Structure:\n";
    std::cout << "  Classes: " << total_classes << "\n";
    std::cout << "  Reachable from root: " << reachable_classes << "\n";
    std::cout << "  Kept after pruning: " << kept_classes << "\n\n";

    std::cout << "Predicates:\n";
    std::cout << "  Classes analyzed: " << classes_analyzed << "\n";
    std::cout << "  Classes without informative predicates: " << classes_without_analysis << "\n";
    std::cout << "  Predicates scored: " << predicates_scored << "\n";
    std::cout << "  Predicates marked for removal: " << predicates_dropped << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Graph building: " << graph_building_time_seconds << " seconds\n";
    std::cout << "  Ranking: " << ranking_time_seconds << " seconds\n";
    std::cout << "  Predicate analysis: " << predicate_time_seconds << " seconds\n";

    std::cout << std::string(70, '=') << "\n";
}

json AnalysisStatistics::to_json() const {
    json j;

    j["total_classes"] = total_classes;
    j["reachable_classes"] = reachable_classes;
    j["kept_classes"] = kept_classes;

    j["classes_analyzed"] = classes_analyzed;
    j["classes_without_analysis"] = classes_without_analysis;
    j["predicates_scored"] = predicates_scored;
    j["predicates_dropped"] = predicates_dropped;

    j["total_time_seconds"] = total_time_seconds;
    j["graph_building_time_seconds"] = graph_building_time_seconds;
    j["ranking_time_seconds"] = ranking_time_seconds;
    j["predicate_time_seconds"] = predicate_time_seconds;

    return j;
}

json AnalysisReport::to_json() const {
    json j;
    j["structure"] = structure.to_json();

    json arr = json::array();
    for (const auto& c : classes) {
        arr.push_back(c.to_json());
    }
    j["classes"] = arr;
    j["statistics"] = statistics.to_json();
    return j;
}

void AnalysisReport::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

json MutationSummary::to_json() const {
    json j;
    j["removed_classes"] = removed_classes;
    j["dropped_predicates"] = dropped_predicates;

    json arr = json::array();
    for (const auto& d : demotions) {
        arr.push_back({{"primary", d.primary}, {"demoted", d.demoted}});
    }
    j["demotions"] = arr;
    return j;
}

// ============================================================================
// OntologyAnalyzer Implementation
// ============================================================================

OntologyAnalyzer::OntologyAnalyzer(Store& store,
                                   KeyValueCache& cache,
                                   const Classifier& classifier,
                                   RandomSource& random,
                                   const AnalyzerConfig& config)
    : store_(store),
      cache_(cache),
      classifier_(classifier),
      random_(random),
      config_(config),
      ranker_(RankerConfig{config.walk_count, config.walk_length}),
      predicate_analyzer_(store, cache, PredicateAnalyzerConfig{config.dataset_name,
                                                                config.worker_threads,
                                                                config.verbose}) {}

void OntologyAnalyzer::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void OntologyAnalyzer::report_progress(const std::string& stage, int current, int total,
                                       const std::string& message) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
    if (config_.verbose) {
        std::cout << "[" << stage << " " << current << "/" << total << "] " << message << "\n";
    }
}

MutatorConfig OntologyAnalyzer::mutator_config() const {
    MutatorConfig mc;
    mc.additional_type_predicate = config_.additional_type_predicate;
    mc.max_type_resolution_passes = config_.max_type_resolution_passes;
    mc.verbose = config_.verbose;
    return mc;
}

ClassGraph OntologyAnalyzer::build_graph() {
    return in_phase(AnalysisPhase::GraphBuild, [&] {
        GraphBuilder builder(store_, cache_, GraphBuilderConfig{config_.dataset_name, config_.verbose});
        return builder.build();
    });
}

std::map<std::string, double> OntologyAnalyzer::count_entities(const std::vector<ReachabilityRecord>& order) {
    std::map<std::string, double> counts;
    for (const auto& rec : order) {
        double count = 0.0;
        for (const auto& row : store_.query(sparql::class_instance_count(rec.class_iri))) {
            count = binding_number(row, "count");
        }
        counts[rec.class_iri] = count;
    }
    return counts;
}

StructureReport OntologyAnalyzer::analyze_structure() {
    StructureReport report;

    auto graph_start = std::chrono::high_resolution_clock::now();
    report_progress("graph_build", 0, 1, "Building class graph");

    report.graph = build_graph();
    report.root = resolve_class_iri(config_.root_class, config_.class_namespace);
    if (!report.graph.has_class(report.root)) {
        throw AnalysisError(AnalysisPhase::GraphBuild,
                            "root class " + report.root + " is not in the class graph");
    }
    report.order = reachability_order(report.graph, report.root);

    stats_.graph_building_time_seconds += seconds_since(graph_start);
    stats_.total_classes = report.graph.num_classes();
    stats_.reachable_classes = report.order.size();
    report_progress("graph_build", 1, 1, std::to_string(report.order.size()) + " classes reachable from " + report.root);

    auto rank_start = std::chrono::high_resolution_clock::now();
    PruneResult pruned = in_phase(AnalysisPhase::Ranking, [&] {
        std::map<std::string, double> counts = count_entities(report.order);

        IterativePruner pruner(ranker_, PrunerConfig{config_.prune_levels, config_.verbose});
        pruner.set_round_callback([this](int round, int levels) {
            report_progress("ranking", round + 1, levels, "Pruning round");
        });
        return pruner.prune(report.graph, report.order, std::move(counts), random_);
    });
    stats_.ranking_time_seconds += seconds_since(rank_start);

    report.keep_set = std::move(pruned.keep_set);
    report.class_scores = std::move(pruned.class_scores);
    report.records = std::move(pruned.records);
    report.final_forward = std::move(pruned.final_forward);
    stats_.kept_classes = report.keep_set.size();

    return report;
}

ClassPredicateReport OntologyAnalyzer::analyze_predicates(const std::string& class_iri,
                                                          const StructureReport& structure) {
    ClassPredicateReport report;
    report.class_iri = class_iri;

    auto start = std::chrono::high_resolution_clock::now();
    in_phase(AnalysisPhase::PredicateAnalysis, [&] {
        report.stats = predicate_analyzer_.analyze(class_iri, structure.final_forward.edge_rank_for(class_iri));
        if (!report.stats.has_value()) {
            return;
        }
        compute_scores(report.stats.value(), classifier_);
        report.decisions = decide(report.stats.value(),
                                  DecisionConfig{config_.score_budget, config_.classifier_threshold});
    });
    stats_.predicate_time_seconds += seconds_since(start);

    if (report.stats.has_value()) {
        stats_.classes_analyzed++;
        stats_.predicates_scored += report.stats->size();
        stats_.predicates_dropped += report.dropped_predicates().size();
    } else {
        stats_.classes_without_analysis++;
        if (config_.verbose) {
            std::cout << "No analysis available for " << class_iri << "\n";
        }
    }

    return report;
}

AnalysisReport OntologyAnalyzer::run() {
    stats_ = AnalysisStatistics();
    auto start = std::chrono::high_resolution_clock::now();

    AnalysisReport report;
    report.structure = analyze_structure();

    int total = static_cast<int>(report.structure.keep_set.size());
    int current = 0;
    for (const auto& cls : report.structure.keep_set) {
        report_progress("predicate_analysis", ++current, total, cls);
        report.classes.push_back(analyze_predicates(cls, report.structure));
    }

    stats_.total_time_seconds += seconds_since(start);
    report.statistics = stats_;
    return report;
}

MutationSummary OntologyAnalyzer::apply(const AnalysisReport& report) {
    MutationSummary summary;
    Mutator mutator(store_, mutator_config());

    in_phase(AnalysisPhase::Mutation, [&] {
        report_progress("mutation", 1, 3, "Removing pruned classes");
        summary.removed_classes = mutator.apply_keep_set(report.structure.graph.class_iris(),
                                                         report.structure.keep_set);

        report_progress("mutation", 2, 3, "Removing dropped predicates");
        for (const auto& cls : report.classes) {
            std::vector<std::string> dropped = cls.dropped_predicates();
            if (dropped.empty()) continue;
            mutator.drop_predicates(cls.class_iri, dropped);
            summary.dropped_predicates[cls.class_iri] = std::move(dropped);
        }

        report_progress("mutation", 3, 3, "Resolving duplicate types");
        summary.demotions = mutator.resolve_duplicate_types(report.structure.class_scores);
    });

    return summary;
}

std::vector<TypeDemotion> OntologyAnalyzer::resolve_types(const StructureReport& structure) {
    Mutator mutator(store_, mutator_config());
    return in_phase(AnalysisPhase::Mutation, [&] {
        return mutator.resolve_duplicate_types(structure.class_scores);
    });
}

} // namespace onto
