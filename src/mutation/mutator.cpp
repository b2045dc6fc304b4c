#include "mutation/mutator.hpp"
#include <iostream>

namespace onto {

Mutator::Mutator(Store& store, MutatorConfig config)
    : store_(store), config_(std::move(config)) {}

void Mutator::execute(const std::string& description, const std::string& update_text) {
    if (config_.verbose) {
        std::cout << description << "\n";
    }
    store_.write_history(description);
    store_.update(update_text);
    store_.write_history(sparql::history_block(update_text));
}

std::vector<std::string> Mutator::apply_keep_set(const std::vector<std::string>& all_classes,
                                                 const std::set<std::string>& keep_set) {
    std::vector<std::string> removed;
    for (const auto& cls : all_classes) {
        if (keep_set.count(cls) > 0) continue;
        execute("Removing class " + cls, sparql::remove_class(cls));
        removed.push_back(cls);
    }
    return removed;
}

void Mutator::drop_predicates(const std::string& class_iri, const std::vector<std::string>& predicates) {
    for (const auto& p : predicates) {
        execute("Removing predicate " + p + " from " + class_iri,
                sparql::remove_predicate(class_iri, p));
    }
}

TypeDemotion Mutator::choose_primary(const std::string& a, const std::string& b,
                                     const std::map<std::string, double>& class_scores) {
    auto score_of = [&](const std::string& cls) {
        auto it = class_scores.find(cls);
        return it != class_scores.end() ? it->second : 0.0;
    };

    double sa = score_of(a);
    double sb = score_of(b);
    if (sa > sb || (sa == sb && a < b)) {
        return {a, b};
    }
    return {b, a};
}

std::vector<TypeDemotion> Mutator::resolve_duplicate_types(const std::map<std::string, double>& class_scores) {
    std::vector<TypeDemotion> demotions;

    for (size_t pass = 0; pass < config_.max_type_resolution_passes; ++pass) {
        QueryRows pairs = store_.query(sparql::duplicate_type_pairs());
        if (pairs.empty()) {
            return demotions;
        }

        for (const auto& row : pairs) {
            std::string a = binding_text(row, "a");
            std::string b = binding_text(row, "b");
            if (a.empty() || b.empty() || a == b) continue;

            TypeDemotion d = choose_primary(a, b, class_scores);
            execute("Demoting " + d.demoted + " to additional type where " + d.primary + " is asserted",
                    sparql::demote_type(d.primary, d.demoted, config_.additional_type_predicate));
            demotions.push_back(std::move(d));
        }
    }

    std::cerr << "Warning: duplicate types remain after "
              << config_.max_type_resolution_passes << " resolution passes\n";
    return demotions;
}

} // namespace onto
