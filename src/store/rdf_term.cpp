#include "store/rdf_term.hpp"
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace onto {

namespace {

const char* kXsdInteger = "http://www.w3.org/2001/XMLSchema#integer";

std::string escape_literal(const std::string& lexical) {
    std::string out;
    out.reserve(lexical.size());
    for (char c : lexical) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    return out;
}

} // anonymous namespace

RdfTerm RdfTerm::iri(const std::string& iri_value) {
    RdfTerm term;
    term.kind = Kind::Iri;
    // Accept both "<http://...>" and "http://..."
    if (iri_value.size() >= 2 && iri_value.front() == '<' && iri_value.back() == '>') {
        term.value = iri_value.substr(1, iri_value.size() - 2);
    } else {
        term.value = iri_value;
    }
    return term;
}

RdfTerm RdfTerm::literal(const std::string& lexical, const std::string& datatype) {
    RdfTerm term;
    term.kind = Kind::Literal;
    term.value = lexical;
    term.datatype = datatype;
    return term;
}

RdfTerm RdfTerm::integer(long long number) {
    return literal(std::to_string(number), kXsdInteger);
}

RdfTerm RdfTerm::blank(const std::string& label) {
    RdfTerm term;
    term.kind = Kind::BlankNode;
    term.value = label;
    return term;
}

std::string RdfTerm::to_sparql() const {
    switch (kind) {
        case Kind::Iri:
            return "<" + value + ">";
        case Kind::BlankNode:
            return "_:" + value;
        case Kind::Literal: {
            std::string out = "\"" + escape_literal(value) + "\"";
            if (!language.empty()) {
                out += "@" + language;
            } else if (!datatype.empty()) {
                out += "^^<" + datatype + ">";
            }
            return out;
        }
    }
    return value;
}

std::optional<double> RdfTerm::as_number() const {
    if (kind != Kind::Literal || value.empty()) {
        return std::nullopt;
    }
    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return parsed;
}

RdfTerm RdfTerm::from_sparql_json(const nlohmann::json& j) {
    const std::string type = j.at("type").get<std::string>();
    const std::string value = j.at("value").get<std::string>();

    if (type == "uri") {
        return iri(value);
    }
    if (type == "bnode") {
        return blank(value);
    }
    if (type == "literal" || type == "typed-literal") {
        RdfTerm term = literal(value, j.value("datatype", ""));
        term.language = j.value("xml:lang", "");
        return term;
    }
    throw std::invalid_argument("Unknown SPARQL term type: " + type);
}

std::string binding_text(const QueryRow& row, const std::string& var) {
    auto it = row.find(var);
    return it != row.end() ? it->second.to_sparql() : "";
}

double binding_number(const QueryRow& row, const std::string& var) {
    auto it = row.find(var);
    if (it == row.end()) return 0.0;
    return it->second.as_number().value_or(0.0);
}

} // namespace onto
