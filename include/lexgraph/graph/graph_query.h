#pragma once

#include <lexgraph/core/types.h>
#include <lexgraph/graph/triple_store.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexgraph::graph {

// One solution: every projected variable is present, unbound ones map to nullopt
using QueryRow = std::map<std::string, std::optional<std::string>>;

struct QueryResult {
    std::vector<std::string> variables; // projection order
    std::vector<QueryRow> rows;
};

// prefix name (without ':') -> namespace IRI
using PrefixMap = std::map<std::string, std::string>;

/**
 * @brief Parsed SELECT query over a TripleStore.
 *
 * Supported subset:
 *   PREFIX p: <iri>
 *   SELECT [DISTINCT] ?v ... | *  [WHERE] { ... }  [ORDER BY [ASC|DESC](?v) ...]
 *   [LIMIT n] [OFFSET n]
 * Group bodies hold triple patterns (with ';', ',' and 'a'), nested groups,
 * OPTIONAL { }, { } UNION { }, and FILTER over CONTAINS, STRSTARTS, STRENDS,
 * REGEX (flag "i"), LCASE, UCASE, STR, LANG, STRLEN, BOUND, comparisons, &&, || and !.
 * FILTERs apply to the whole group they appear in.
 */
class GraphQuery {
public:
    /**
     * @brief Parse query text
     * @param prefixes Prefixes available without a PREFIX declaration
     * @return QueryFailed with the position of the offending token
     */
    static Result<GraphQuery> parse(std::string_view text, const PrefixMap& prefixes = {});

    Result<QueryResult> execute(const TripleStore& store) const;

    const std::vector<std::string>& variables() const;

private:
    struct Impl;
    explicit GraphQuery(std::shared_ptr<const Impl> impl) : impl_(std::move(impl)) {}

    std::shared_ptr<const Impl> impl_;
};

// SPARQL string-literal escaping of untrusted text ('\\' and '"')
std::string escapeQueryString(std::string_view text);

// Escape regex metacharacters so text matches literally inside REGEX()
std::string escapeRegex(std::string_view text);

} // namespace lexgraph::graph
