#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace onto {

// ============================================================================
// Analyzer Configuration
// ============================================================================

/**
 * @brief Configuration for an analysis run
 */
struct AnalyzerConfig {
    // Dataset / store
    std::string dataset_name = "default";           ///< Cache namespace for this dataset
    std::string query_url = "http://localhost:7878/query";
    std::string update_url = "http://localhost:7878/update";
    std::string history_path = "history/default.log";  ///< Mutation audit log
    int request_timeout_seconds = 60;

    // Cache / model
    std::string cache_directory = "cache";
    std::string model_path = "ml/model.onnx";       ///< Classifier artifact (.onnx or .json)

    // Structure analysis
    std::string root_class = "Book";                ///< Hint or full <iri>
    std::string class_namespace = "http://schema.org/";
    size_t walk_count = 10000;
    int walk_length = 10;
    int prune_levels = 3;
    std::optional<uint64_t> random_seed;            ///< Unset = nondeterministic

    // Predicate analysis
    size_t worker_threads = 4;
    double score_budget = 60.0;
    double classifier_threshold = 0.5;

    // Mutation
    std::string additional_type_predicate = "<http://schema.org/additionalType>";
    size_t max_type_resolution_passes = 100;

    bool verbose = false;

    /**
     * @brief Load configuration from JSON file; absent keys keep their defaults
     */
    static AnalyzerConfig from_json_file(const std::string& path);

    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults with ONTO_* environment variables applied
     */
    static AnalyzerConfig from_environment();

    /**
     * @brief Overlay ONTO_* environment variables on base
     */
    static AnalyzerConfig from_environment(AnalyzerConfig base);

    bool validate(std::string& error_message) const;
};

/**
 * @brief Load configuration from file with fallback to environment
 *
 * Tries config_path (which must load if given), then .ontoscope.json in the
 * working directory and up to two parents. Environment variables are
 * applied on top of whatever was found.
 */
AnalyzerConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace onto
