#include <lexgraph/graph/triple_store.h>

namespace lexgraph::graph {

std::string toString(const RdfTerm& term) {
    if (term.isIri()) {
        return "<" + term.value + ">";
    }
    std::string out = "\"" + term.value + "\"";
    if (!term.language.empty()) {
        out += "@" + term.language;
    } else if (!term.datatype.empty()) {
        out += "^^<" + term.datatype + ">";
    }
    return out;
}

std::string toString(const Triple& triple) {
    return toString(triple.subject) + " " + toString(triple.predicate) + " " +
           toString(triple.object) + " .";
}

bool TripleStore::add(Triple triple) {
    if (!set_.insert(triple).second) {
        return false;
    }
    const std::size_t idx = triples_.size();
    bySubject_[triple.subject].push_back(idx);
    byPredicate_[triple.predicate].push_back(idx);
    byObject_[triple.object].push_back(idx);
    triples_.push_back(std::move(triple));
    return true;
}

bool TripleStore::contains(const Triple& triple) const {
    return set_.find(triple) != set_.end();
}

std::vector<const Triple*> TripleStore::match(const std::optional<RdfTerm>& subject,
                                              const std::optional<RdfTerm>& predicate,
                                              const std::optional<RdfTerm>& object) const {
    std::vector<const Triple*> out;

    // Pick the narrowest bound index as the candidate list
    const std::vector<std::size_t>* candidates = nullptr;
    auto narrow = [&candidates](const Index& index, const std::optional<RdfTerm>& key) -> bool {
        if (!key) {
            return true;
        }
        auto it = index.find(*key);
        if (it == index.end()) {
            return false;
        }
        if (!candidates || it->second.size() < candidates->size()) {
            candidates = &it->second;
        }
        return true;
    };
    if (!narrow(bySubject_, subject) || !narrow(byPredicate_, predicate) ||
        !narrow(byObject_, object)) {
        return out;
    }

    auto accept = [&](const Triple& t) {
        return (!subject || t.subject == *subject) && (!predicate || t.predicate == *predicate) &&
               (!object || t.object == *object);
    };

    if (candidates) {
        out.reserve(candidates->size());
        for (std::size_t idx : *candidates) {
            if (accept(triples_[idx])) {
                out.push_back(&triples_[idx]);
            }
        }
    } else {
        out.reserve(triples_.size());
        for (const auto& t : triples_) {
            out.push_back(&t);
        }
    }
    return out;
}

std::size_t TripleStore::removeIf(const std::function<bool(const Triple&)>& pred) {
    std::vector<Triple> kept;
    kept.reserve(triples_.size());
    std::size_t removed = 0;
    for (auto& t : triples_) {
        if (pred(t)) {
            set_.erase(t);
            ++removed;
        } else {
            kept.push_back(std::move(t));
        }
    }
    triples_ = std::move(kept);
    if (removed > 0) {
        rebuildIndexes();
    }
    return removed;
}

void TripleStore::clear() {
    triples_.clear();
    set_.clear();
    bySubject_.clear();
    byPredicate_.clear();
    byObject_.clear();
}

void TripleStore::rebuildIndexes() {
    bySubject_.clear();
    byPredicate_.clear();
    byObject_.clear();
    for (std::size_t i = 0; i < triples_.size(); ++i) {
        bySubject_[triples_[i].subject].push_back(i);
        byPredicate_[triples_[i].predicate].push_back(i);
        byObject_[triples_[i].object].push_back(i);
    }
}

} // namespace lexgraph::graph
