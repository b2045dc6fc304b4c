#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace onto {

/**
 * @brief A single RDF term bound to a query variable
 *
 * IRIs are held without angle brackets; to_sparql() renders the
 * N-Triples form used throughout the analyzer (e.g. "<http://schema.org/Book>").
 */
struct RdfTerm {
    enum class Kind {
        Iri,
        Literal,
        BlankNode
    };

    Kind kind = Kind::Literal;
    std::string value;                      ///< IRI, lexical form or blank node label
    std::string datatype;                   ///< Literal datatype IRI (may be empty)
    std::string language;                   ///< Literal language tag (may be empty)

    static RdfTerm iri(const std::string& iri_value);
    static RdfTerm literal(const std::string& lexical, const std::string& datatype = "");
    static RdfTerm integer(long long number);
    static RdfTerm blank(const std::string& label);

    bool is_iri() const { return kind == Kind::Iri; }
    bool is_literal() const { return kind == Kind::Literal; }
    bool is_blank() const { return kind == Kind::BlankNode; }

    /**
     * @brief Render the term in N-Triples / SPARQL syntax
     */
    std::string to_sparql() const;

    /**
     * @brief Parse the lexical form as a number (literals only)
     */
    std::optional<double> as_number() const;

    bool operator==(const RdfTerm& other) const {
        return kind == other.kind && value == other.value &&
               datatype == other.datatype && language == other.language;
    }

    /**
     * @brief Decode one binding of the W3C SPARQL JSON results format
     */
    static RdfTerm from_sparql_json(const nlohmann::json& j);
};

using QueryRow = std::map<std::string, RdfTerm>;
using QueryRows = std::vector<QueryRow>;

// Returns the N-Triples form of a bound variable, or "" when unbound
std::string binding_text(const QueryRow& row, const std::string& var);

// Returns a bound numeric literal, or 0 when unbound or not numeric
double binding_number(const QueryRow& row, const std::string& var);

} // namespace onto
