#pragma once

#include <lexgraph/graph/rdf_term.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lexgraph::graph {

/**
 * @brief In-memory triple set.
 *
 * Duplicate triples are ignored. Iteration follows insertion order, which keeps query
 * results and the serialized file stable across runs. Pointers returned by match() are
 * invalidated by any mutation.
 */
class TripleStore {
public:
    // Returns false if the triple was already present
    bool add(Triple triple);

    bool contains(const Triple& triple) const;

    /**
     * @brief Triples matching the given positions; nullopt is a wildcard
     */
    std::vector<const Triple*> match(const std::optional<RdfTerm>& subject,
                                     const std::optional<RdfTerm>& predicate,
                                     const std::optional<RdfTerm>& object) const;

    // Remove every triple satisfying pred; returns the number removed
    std::size_t removeIf(const std::function<bool(const Triple&)>& pred);

    const std::vector<Triple>& triples() const { return triples_; }
    std::size_t size() const { return triples_.size(); }
    bool empty() const { return triples_.empty(); }
    void clear();

private:
    using Index = std::unordered_map<RdfTerm, std::vector<std::size_t>, RdfTermHash>;

    void rebuildIndexes();

    std::vector<Triple> triples_;
    std::unordered_set<Triple, TripleHash> set_;
    Index bySubject_;
    Index byPredicate_;
    Index byObject_;
};

} // namespace lexgraph::graph
