#include "config/analyzer_config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace onto {

AnalyzerConfig AnalyzerConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    AnalyzerConfig config;
    try {
        config.dataset_name = j.value("dataset_name", config.dataset_name);
        config.query_url = j.value("query_url", config.query_url);
        config.update_url = j.value("update_url", config.update_url);
        config.history_path = j.value("history_path", config.history_path);
        config.request_timeout_seconds = j.value("request_timeout_seconds", config.request_timeout_seconds);

        config.cache_directory = j.value("cache_directory", config.cache_directory);
        config.model_path = j.value("model_path", config.model_path);

        config.root_class = j.value("root_class", config.root_class);
        config.class_namespace = j.value("class_namespace", config.class_namespace);
        config.walk_count = j.value("walk_count", config.walk_count);
        config.walk_length = j.value("walk_length", config.walk_length);
        config.prune_levels = j.value("prune_levels", config.prune_levels);
        if (j.contains("random_seed") && !j["random_seed"].is_null()) {
            config.random_seed = j["random_seed"].get<uint64_t>();
        }

        config.worker_threads = j.value("worker_threads", config.worker_threads);
        config.score_budget = j.value("score_budget", config.score_budget);
        config.classifier_threshold = j.value("classifier_threshold", config.classifier_threshold);

        config.additional_type_predicate = j.value("additional_type_predicate", config.additional_type_predicate);
        config.max_type_resolution_passes = j.value("max_type_resolution_passes", config.max_type_resolution_passes);

        config.verbose = j.value("verbose", config.verbose);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    return config;
}

void AnalyzerConfig::to_json_file(const std::string& path) const {
    json j;

    j["dataset_name"] = dataset_name;
    j["query_url"] = query_url;
    j["update_url"] = update_url;
    j["history_path"] = history_path;
    j["request_timeout_seconds"] = request_timeout_seconds;

    j["cache_directory"] = cache_directory;
    j["model_path"] = model_path;

    j["root_class"] = root_class;
    j["class_namespace"] = class_namespace;
    j["walk_count"] = walk_count;
    j["walk_length"] = walk_length;
    j["prune_levels"] = prune_levels;
    if (random_seed.has_value()) {
        j["random_seed"] = random_seed.value();
    } else {
        j["random_seed"] = nullptr;
    }

    j["worker_threads"] = worker_threads;
    j["score_budget"] = score_budget;
    j["classifier_threshold"] = classifier_threshold;

    j["additional_type_predicate"] = additional_type_predicate;
    j["max_type_resolution_passes"] = max_type_resolution_passes;

    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << j.dump(2);
}

AnalyzerConfig AnalyzerConfig::from_environment() {
    return from_environment(AnalyzerConfig());
}

AnalyzerConfig AnalyzerConfig::from_environment(AnalyzerConfig base) {
    AnalyzerConfig config = std::move(base);

    const char* dataset = std::getenv("ONTO_DATASET");
    if (dataset) config.dataset_name = dataset;

    const char* query_url = std::getenv("ONTO_QUERY_URL");
    if (query_url) config.query_url = query_url;

    const char* update_url = std::getenv("ONTO_UPDATE_URL");
    if (update_url) config.update_url = update_url;

    const char* cache_dir = std::getenv("ONTO_CACHE_DIR");
    if (cache_dir) config.cache_directory = cache_dir;

    const char* model_path = std::getenv("ONTO_MODEL_PATH");
    if (model_path) config.model_path = model_path;

    const char* history_path = std::getenv("ONTO_HISTORY_PATH");
    if (history_path) config.history_path = history_path;

    return config;
}

bool AnalyzerConfig::validate(std::string& error_message) const {
    if (dataset_name.empty()) {
        error_message = "Dataset name is required";
        return false;
    }

    if (query_url.empty() || update_url.empty()) {
        error_message = "Query and update endpoints are required";
        return false;
    }

    if (history_path.empty()) {
        error_message = "History path is required";
        return false;
    }

    if (root_class.empty()) {
        error_message = "Root class is required";
        return false;
    }

    if (walk_count == 0 || walk_length <= 0) {
        error_message = "Walk count and walk length must be positive";
        return false;
    }

    if (prune_levels <= 0) {
        error_message = "Prune levels must be positive";
        return false;
    }

    if (worker_threads == 0) {
        error_message = "At least one worker thread is required";
        return false;
    }

    if (classifier_threshold < 0.0 || classifier_threshold > 1.0) {
        error_message = "Classifier threshold must be between 0.0 and 1.0";
        return false;
    }

    if (request_timeout_seconds <= 0) {
        error_message = "Request timeout must be positive";
        return false;
    }

    return true;
}

AnalyzerConfig load_config_with_fallback(const std::string& config_path) {
    if (!config_path.empty()) {
        return AnalyzerConfig::from_environment(AnalyzerConfig::from_json_file(config_path));
    }

    std::vector<std::string> paths_to_try = {
        ".ontoscope.json",
        "../.ontoscope.json",
        "../../.ontoscope.json"
    };

    for (const auto& path : paths_to_try) {
        if (!std::filesystem::exists(path)) continue;
        try {
            return AnalyzerConfig::from_environment(AnalyzerConfig::from_json_file(path));
        } catch (const std::runtime_error& e) {
            std::cerr << "Warning: skipping " << path << ": " << e.what() << "\n";
        }
    }

    return AnalyzerConfig::from_environment();
}

} // namespace onto
