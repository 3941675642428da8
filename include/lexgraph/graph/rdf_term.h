#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>

namespace lexgraph::graph {

namespace vocab {
inline constexpr std::string_view kRdf = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view kRdfs = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr std::string_view kOwl = "http://www.w3.org/2002/07/owl#";
inline constexpr std::string_view kXsd = "http://www.w3.org/2001/XMLSchema#";
inline constexpr std::string_view kXmlNs = "http://www.w3.org/XML/1998/namespace";

inline std::string rdfType() {
    return std::string(kRdf) + "type";
}
inline std::string xsdDate() {
    return std::string(kXsd) + "date";
}
inline std::string xsdInteger() {
    return std::string(kXsd) + "integer";
}
} // namespace vocab

/**
 * @brief RDF node: an IRI or a literal with optional language tag or datatype
 */
struct RdfTerm {
    enum class Kind { Iri, Literal };

    Kind kind = Kind::Literal;
    std::string value;
    std::string language;
    std::string datatype;

    static RdfTerm iri(std::string value) {
        RdfTerm t;
        t.kind = Kind::Iri;
        t.value = std::move(value);
        return t;
    }

    static RdfTerm literal(std::string value, std::string language = {},
                           std::string datatype = {}) {
        RdfTerm t;
        t.kind = Kind::Literal;
        t.value = std::move(value);
        t.language = std::move(language);
        t.datatype = std::move(datatype);
        return t;
    }

    bool isIri() const { return kind == Kind::Iri; }
    bool isLiteral() const { return kind == Kind::Literal; }

    // Value as returned to query callers: the IRI, or the literal's lexical form
    const std::string& display() const { return value; }

    bool operator==(const RdfTerm& other) const {
        return kind == other.kind && value == other.value && language == other.language &&
               datatype == other.datatype;
    }
    bool operator!=(const RdfTerm& other) const { return !(*this == other); }
    bool operator<(const RdfTerm& other) const {
        return std::tie(kind, value, language, datatype) <
               std::tie(other.kind, other.value, other.language, other.datatype);
    }
};

struct Triple {
    RdfTerm subject;
    RdfTerm predicate;
    RdfTerm object;

    bool operator==(const Triple& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }
    bool operator<(const Triple& other) const {
        return std::tie(subject, predicate, object) <
               std::tie(other.subject, other.predicate, other.object);
    }
};

struct RdfTermHash {
    std::size_t operator()(const RdfTerm& t) const {
        std::size_t h = std::hash<std::string>{}(t.value);
        h ^= std::hash<std::string>{}(t.language) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(t.datatype) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h ^ static_cast<std::size_t>(t.kind);
    }
};

struct TripleHash {
    std::size_t operator()(const Triple& t) const {
        RdfTermHash h;
        std::size_t seed = h(t.subject);
        seed ^= h(t.predicate) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= h(t.object) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

// N-Triples-like rendering for logs and diagnostics
std::string toString(const RdfTerm& term);
std::string toString(const Triple& triple);

} // namespace lexgraph::graph
