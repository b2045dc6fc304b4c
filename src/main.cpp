#include "cli/cli.hpp"
#include "analysis/ontology_analyzer.hpp"
#include "cache/analysis_cache.hpp"
#include "classifier/classifier.hpp"
#include "config/analyzer_config.hpp"
#include "graph/probability_model.hpp"
#include "store/history_log.hpp"
#include "store/sparql_http_store.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>

namespace fs = std::filesystem;

using namespace onto;

// ============== Helper Functions ==============

// Commands that never reach predicate scoring run without a model
class UnloadedClassifier : public Classifier {
public:
    double score(const FeatureVector&) const override {
        throw ClassifierUnavailable("no model loaded for this command");
    }
};

// Config file (or fallback chain) plus command-line overrides, validated
AnalyzerConfig load_config(const Options& args) {
    AnalyzerConfig config = load_config_with_fallback(args.get("config").text);

    if (args.has("root")) {
        config.root_class = args.get("root").text;
    }
    if (args.has("seed")) {
        config.random_seed = args.get("seed").as_uint64();
    }
    if (args.has("verbose")) {
        config.verbose = true;
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    return config;
}

std::unique_ptr<SparqlHttpStore> open_store(const AnalyzerConfig& config) {
    SparqlEndpointConfig endpoint;
    endpoint.query_url = config.query_url;
    endpoint.update_url = config.update_url;
    endpoint.history_path = config.history_path;
    endpoint.timeout_seconds = config.request_timeout_seconds;
    endpoint.verbose = config.verbose;
    return std::make_unique<SparqlHttpStore>(endpoint);
}

std::unique_ptr<KeyValueCache> open_cache(const AnalyzerConfig& config, bool no_cache) {
    if (no_cache) {
        return std::make_unique<MemoryCache>();
    }
    return std::make_unique<FileCache>(config.cache_directory);
}

void ensure_parent_directory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

void print_progress(const std::string& stage, int current, int total, const std::string& message) {
    std::cout << "  [" << stage << "] " << current << "/" << total << "  " << message << "\n";
}

// ============== ontoscope graph ==============
int cmd_graph(const Options& args) {
    AnalyzerConfig config = load_config(args);
    std::string output_path = args.get("output", "class_graph.json").text;

    auto store = open_store(config);
    auto cache = open_cache(config, args.has("no-cache"));
    auto random = make_random_source(config.random_seed);

    UnloadedClassifier no_classifier;

    OntologyAnalyzer analyzer(*store, *cache, no_classifier, *random, config);

    std::cout << "Building class graph for dataset: " << config.dataset_name << "\n";
    ClassGraph graph = analyzer.build_graph();
    assign_edge_probabilities(graph);

    std::cout << "  Classes: " << graph.num_classes() << "\n";
    std::cout << "  Relations: " << graph.num_edges() << "\n";

    ensure_parent_directory(output_path);
    graph.export_to_json(output_path);
    std::cout << "Saved class graph to: " << output_path << "\n";

    if (args.has("dot")) {
        std::string dot_path = args.get("dot").text;
        ensure_parent_directory(dot_path);
        graph.export_to_dot(dot_path);
        std::cout << "Saved DOT rendering to: " << dot_path << "\n";
    }

    return 0;
}

// ============== ontoscope analyze ==============
int cmd_analyze(const Options& args) {
    AnalyzerConfig config = load_config(args);
    std::string output_path = args.get("output", "analysis_report.json").text;

    auto store = open_store(config);
    auto cache = open_cache(config, args.has("no-cache"));
    auto random = make_random_source(config.random_seed);

    std::cout << "Loading classifier from: " << config.model_path << "\n";
    std::unique_ptr<Classifier> classifier = load_classifier(config.model_path);

    OntologyAnalyzer analyzer(*store, *cache, *classifier, *random, config);
    analyzer.set_progress_callback(print_progress);

    std::cout << "Analyzing dataset " << config.dataset_name << " from root "
              << resolve_class_iri(config.root_class, config.class_namespace) << "\n";
    AnalysisReport report = analyzer.run();

    ensure_parent_directory(output_path);
    report.save_to_json(output_path);
    std::cout << "Saved analysis report to: " << output_path << "\n";

    if (args.has("dot")) {
        std::string dot_path = args.get("dot").text;
        ensure_parent_directory(dot_path);
        ClassGraph kept = report.structure.graph.without_classes([&] {
            std::set<std::string> removed;
            for (const auto& cls : report.structure.graph.class_iris()) {
                if (report.structure.keep_set.count(cls) == 0) removed.insert(cls);
            }
            return removed;
        }());
        assign_edge_probabilities(kept);
        kept.export_to_dot(dot_path);
        std::cout << "Saved DOT rendering of kept classes to: " << dot_path << "\n";
    }

    report.statistics.print_summary();

    if (args.has("apply")) {
        std::cout << "\nApplying decisions to the dataset...\n";
        MutationSummary summary = analyzer.apply(report);
        std::cout << "  Classes removed: " << summary.removed_classes.size() << "\n";
        std::cout << "  Classes with dropped predicates: " << summary.dropped_predicates.size() << "\n";
        std::cout << "  Type demotions: " << summary.demotions.size() << "\n";
        std::cout << "  History version: " << store->history_version() << "\n";
    }

    return 0;
}

// ============== ontoscope resolve-types ==============
int cmd_resolve_types(const Options& args) {
    AnalyzerConfig config = load_config(args);

    auto store = open_store(config);
    auto cache = open_cache(config, args.has("no-cache"));
    auto random = make_random_source(config.random_seed);

    UnloadedClassifier no_classifier;

    OntologyAnalyzer analyzer(*store, *cache, no_classifier, *random, config);
    analyzer.set_progress_callback(print_progress);

    StructureReport structure = analyzer.analyze_structure();
    std::vector<TypeDemotion> demotions = analyzer.resolve_types(structure);

    std::cout << "\nType demotions: " << demotions.size() << "\n";
    for (const auto& d : demotions) {
        std::cout << "  " << d.demoted << " -> additional type (primary " << d.primary << ")\n";
    }
    return 0;
}

// ============== ontoscope history ==============
int cmd_history(const Options& args) {
    AnalyzerConfig config = load_config(args);

    HistoryLog log(config.history_path);
    std::cout << "# " << log.path() << " (version " << log.line_count() << ")\n";
    std::cout << log.read_all();
    return 0;
}

int main(int argc, char** argv) {
    CommandLine cli("ontoscope", "1.0.0");

    // ontoscope graph
    cli.add({
        "graph",
        "Build the class-relation graph and export it",
        {
            {"config", "c", "Path to config file (optional)", "", false},
            {"output", "o", "Output path for the class graph JSON", "class_graph.json", false},
            {"dot", "d", "Also write a Graphviz DOT rendering to this path", "", false},
            {"no-cache", "n", "Do not read or write the on-disk cache", "", true},
            {"verbose", "V", "Verbose logging", "", true}
        },
        cmd_graph
    });

    // ontoscope analyze
    cli.add({
        "analyze",
        "Rank classes, score predicates and optionally apply the decisions",
        {
            {"config", "c", "Path to config file (optional)", "", false},
            {"root", "r", "Root class name or <iri>", "", false},
            {"output", "o", "Output path for the analysis report", "analysis_report.json", false},
            {"dot", "d", "Write a DOT rendering of the kept classes to this path", "", false},
            {"seed", "s", "Random seed for reproducible ranking", "", false},
            {"apply", "a", "Apply removals and type resolution to the dataset", "", true},
            {"no-cache", "n", "Do not read or write the on-disk cache", "", true},
            {"verbose", "V", "Verbose logging", "", true}
        },
        cmd_analyze
    });

    // ontoscope resolve-types
    cli.add({
        "resolve-types",
        "Demote competing types of multiply-typed entities",
        {
            {"config", "c", "Path to config file (optional)", "", false},
            {"root", "r", "Root class name or <iri>", "", false},
            {"seed", "s", "Random seed for reproducible ranking", "", false},
            {"no-cache", "n", "Do not read or write the on-disk cache", "", true},
            {"verbose", "V", "Verbose logging", "", true}
        },
        cmd_resolve_types
    });

    // ontoscope history
    cli.add({
        "history",
        "Print the mutation audit log",
        {
            {"config", "c", "Path to config file (optional)", "", false}
        },
        cmd_history
    });

    return cli.run(argc, argv);
}
