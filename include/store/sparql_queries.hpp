#pragma once

#include <string>

namespace onto {
namespace sparql {

// All class and predicate arguments are IRIs in N-Triples form ("<...>").

constexpr const char* kTypePredicate = "<http://www.w3.org/1999/02/22-rdf-syntax-ns#type>";
constexpr const char* kAdditionalTypePredicate = "<http://schema.org/additionalType>";

// ---- Class graph ----

// ?class
std::string distinct_classes();

// ?p ?otype ?count; ?otype unbound when the object carries no type
std::string class_relations(const std::string& class_iri);

// ?count
std::string class_instance_count(const std::string& class_iri);

// ---- Predicate statistics ----

// ?p
std::string class_predicates(const std::string& class_iri);

// ?subjects ?distinct ?total
std::string predicate_usage(const std::string& class_iri, const std::string& predicate);

// ?o ?count
std::string predicate_value_groups(const std::string& class_iri, const std::string& predicate);

// ?s ?predicates (distinct predicates on each subject other than rdf:type and this one).
// Subjects carrying nothing else produce no row.
std::string predicate_subject_profiles(const std::string& class_iri, const std::string& predicate);

// ---- Mutations ----

// ?a ?b with STR(?a) < STR(?b), both asserted as types of one entity
std::string duplicate_type_pairs();

std::string demote_type(const std::string& primary_class,
                        const std::string& demoted_class,
                        const std::string& additional_type_predicate = kAdditionalTypePredicate);

// Removes entities typed only with class_iri, then the remaining type assertions
std::string remove_class(const std::string& class_iri);

std::string remove_predicate(const std::string& class_iri, const std::string& predicate);

/**
 * @brief Wrap an update in the fenced block format used by the audit log
 */
std::string history_block(const std::string& update_text);

} // namespace sparql
} // namespace onto
