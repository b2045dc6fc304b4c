#include "analysis/predicate_analyzer.hpp"
#include "store/sparql_queries.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>

using json = nlohmann::json;

namespace onto {

PredicateAnalyzer::PredicateAnalyzer(Store& store, KeyValueCache& cache, PredicateAnalyzerConfig config)
    : store_(store), cache_(cache), config_(std::move(config)) {
    if (config_.worker_threads == 0) {
        config_.worker_threads = 1;
    }
}

std::optional<std::vector<PredicateStats>> PredicateAnalyzer::analyze(
    const std::string& class_iri,
    const std::map<std::string, double>& edge_rank
) {
    size_t version = store_.history_version();

    std::vector<PredicateStats> stats;
    if (auto cached = load_cached(class_iri, version)) {
        if (config_.verbose) {
            std::cout << "Predicate statistics for " << class_iri << " loaded from cache\n";
        }
        stats = std::move(cached.value());
    } else {
        stats = compute(class_iri);
        cache_.put(predicate_cache_key(config_.dataset_name, class_iri), version,
                   stats_to_json(stats).dump());
    }

    if (stats.empty()) {
        return std::nullopt;
    }

    // Edge ranks come from the current structural run, not from the cache
    for (auto& s : stats) {
        auto it = edge_rank.find(s.predicate);
        s.edge_rank = it != edge_rank.end() ? it->second : 0.0;
    }
    return stats;
}

std::vector<PredicateStats> PredicateAnalyzer::compute(const std::string& class_iri) {
    double instance_count = 0.0;
    for (const auto& row : store_.query(sparql::class_instance_count(class_iri))) {
        instance_count = binding_number(row, "count");
    }

    std::vector<std::string> predicates;
    for (const auto& row : store_.query(sparql::class_predicates(class_iri))) {
        std::string p = binding_text(row, "p");
        if (p.empty() || p == sparql::kTypePredicate) continue;
        predicates.push_back(p);
    }

    const size_t num_predicates = predicates.size();
    std::vector<PredicateStats> stats;
    if (num_predicates == 0) {
        return stats;
    }

    if (config_.verbose) {
        std::cout << "Analyzing " << num_predicates << " predicates of " << class_iri
                  << " (" << instance_count << " instances)\n";
    }

    size_t num_threads = std::min(config_.worker_threads, num_predicates);
    size_t chunk_size = (num_predicates + num_threads - 1) / num_threads;
    std::vector<std::future<std::vector<PredicateStats>>> futures;

    auto process_chunk = [&](size_t start_idx, size_t end_idx) {
        std::vector<PredicateStats> chunk;
        for (size_t i = start_idx; i < end_idx; ++i) {
            chunk.push_back(predicate_stats(class_iri, predicates[i], instance_count, num_predicates));
        }
        return chunk;
    };

    for (size_t i = 0; i < num_predicates; i += chunk_size) {
        size_t end_idx = std::min(i + chunk_size, num_predicates);
        futures.push_back(std::async(std::launch::async, process_chunk, i, end_idx));
    }

    // Chunks are collected in submission order, so the result order is stable
    for (auto& f : futures) {
        auto chunk_result = f.get();
        stats.insert(stats.end(), std::make_move_iterator(chunk_result.begin()),
                     std::make_move_iterator(chunk_result.end()));
    }

    stats.erase(std::remove_if(stats.begin(), stats.end(), [](const PredicateStats& s) {
        return std::abs(s.uniqueness - 1.0) < 1e-9;
    }), stats.end());

    normalize_column(stats, &PredicateStats::entropy);
    normalize_column(stats, &PredicateStats::quality);

    return stats;
}

PredicateStats PredicateAnalyzer::predicate_stats(const std::string& class_iri,
                                                  const std::string& predicate,
                                                  double instance_count,
                                                  size_t total_predicates) {
    PredicateStats s;
    s.predicate = predicate;

    for (const auto& row : store_.query(sparql::predicate_usage(class_iri, predicate))) {
        double subjects = binding_number(row, "subjects");
        double distinct = binding_number(row, "distinct");
        double total = binding_number(row, "total");
        s.frequency = instance_count > 0.0 ? subjects / instance_count : 0.0;
        s.uniqueness = total > 0.0 ? distinct / total : 0.0;
    }

    std::vector<size_t> groups;
    for (const auto& row : store_.query(sparql::predicate_value_groups(class_iri, predicate))) {
        groups.push_back(static_cast<size_t>(binding_number(row, "count")));
    }
    s.entropy = shannon_entropy(groups);

    std::vector<size_t> profiles;
    for (const auto& row : store_.query(sparql::predicate_subject_profiles(class_iri, predicate))) {
        profiles.push_back(static_cast<size_t>(binding_number(row, "predicates")));
    }
    s.quality = co_occurrence_quality(total_predicates, profiles);

    return s;
}

std::optional<std::vector<PredicateStats>> PredicateAnalyzer::load_cached(
    const std::string& class_iri, size_t version) const {
    std::string key = predicate_cache_key(config_.dataset_name, class_iri);
    try {
        auto entry = cache_.get(key);
        if (!entry.has_value() || entry->version != version) {
            return std::nullopt;
        }
        return stats_from_json(json::parse(entry->bytes));
    } catch (const CacheCorrupt& e) {
        if (config_.verbose) {
            std::cerr << e.what() << "; recomputing " << class_iri << "\n";
        }
    } catch (const json::exception& e) {
        if (config_.verbose) {
            std::cerr << "Cache corrupt: " << key << ": " << e.what() << "; recomputing " << class_iri << "\n";
        }
    }
    return std::nullopt;
}

} // namespace onto
