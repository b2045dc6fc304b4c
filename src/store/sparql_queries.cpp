#include "store/sparql_queries.hpp"
#include <sstream>

namespace onto {
namespace sparql {

std::string distinct_classes() {
    return "SELECT DISTINCT ?class WHERE { ?s a ?class . }";
}

std::string class_relations(const std::string& class_iri) {
    std::stringstream q;
    q << "SELECT ?p ?otype (COUNT(*) AS ?count) WHERE {\n"
      << "    ?s a " << class_iri << " .\n"
      << "    ?s ?p ?o .\n"
      << "    FILTER(?p != " << kTypePredicate << ")\n"
      << "    OPTIONAL { ?o a ?otype . }\n"
      << "}\n"
      << "GROUP BY ?p ?otype";
    return q.str();
}

std::string class_instance_count(const std::string& class_iri) {
    return "SELECT (COUNT(DISTINCT ?s) AS ?count) WHERE { ?s a " + class_iri + " . }";
}

std::string class_predicates(const std::string& class_iri) {
    std::stringstream q;
    q << "SELECT DISTINCT ?p WHERE {\n"
      << "    ?s a " << class_iri << " .\n"
      << "    ?s ?p ?o .\n"
      << "    FILTER(?p != " << kTypePredicate << ")\n"
      << "}";
    return q.str();
}

std::string predicate_usage(const std::string& class_iri, const std::string& predicate) {
    std::stringstream q;
    q << "SELECT (COUNT(DISTINCT ?s) AS ?subjects) (COUNT(DISTINCT ?o) AS ?distinct) "
      << "(COUNT(*) AS ?total) WHERE {\n"
      << "    ?s a " << class_iri << " .\n"
      << "    ?s " << predicate << " ?o .\n"
      << "}";
    return q.str();
}

std::string predicate_value_groups(const std::string& class_iri, const std::string& predicate) {
    std::stringstream q;
    q << "SELECT ?o (COUNT(*) AS ?count) WHERE {\n"
      << "    ?s a " << class_iri << " .\n"
      << "    ?s " << predicate << " ?o .\n"
      << "}\n"
      << "GROUP BY ?o";
    return q.str();
}

std::string predicate_subject_profiles(const std::string& class_iri, const std::string& predicate) {
    std::stringstream q;
    q << "SELECT ?s (COUNT(DISTINCT ?q) AS ?predicates) WHERE {\n"
      << "    ?s a " << class_iri << " .\n"
      << "    ?s " << predicate << " ?o .\n"
      << "    ?s ?q ?x .\n"
      << "    FILTER(?q != " << kTypePredicate << " && ?q != " << predicate << ")\n"
      << "}\n"
      << "GROUP BY ?s";
    return q.str();
}

std::string duplicate_type_pairs() {
    return "SELECT DISTINCT ?a ?b WHERE {\n"
           "    ?e a ?a .\n"
           "    ?e a ?b .\n"
           "    FILTER(STR(?a) < STR(?b))\n"
           "}";
}

std::string demote_type(const std::string& primary_class,
                        const std::string& demoted_class,
                        const std::string& additional_type_predicate) {
    std::stringstream q;
    q << "DELETE { ?e a " << demoted_class << " . }\n"
      << "INSERT { ?e " << additional_type_predicate << " " << demoted_class << " . }\n"
      << "WHERE  { ?e a " << primary_class << " . ?e a " << demoted_class << " . }";
    return q.str();
}

std::string remove_class(const std::string& class_iri) {
    std::stringstream q;
    q << "DELETE { ?s ?p ?o . }\n"
      << "WHERE  {\n"
      << "    ?s a " << class_iri << " .\n"
      << "    ?s ?p ?o .\n"
      << "    FILTER NOT EXISTS { ?s a ?other . FILTER(?other != " << class_iri << ") }\n"
      << "};\n"
      << "DELETE WHERE { ?s a " << class_iri << " . }";
    return q.str();
}

std::string remove_predicate(const std::string& class_iri, const std::string& predicate) {
    std::stringstream q;
    q << "DELETE { ?s " << predicate << " ?o . }\n"
      << "WHERE  { ?s a " << class_iri << " . ?s " << predicate << " ?o . }";
    return q.str();
}

std::string history_block(const std::string& update_text) {
    return "```sparql\n" + update_text + "\n```";
}

} // namespace sparql
} // namespace onto
