#pragma once

#include <lexgraph/config/lexgraph_config.h>
#include <lexgraph/core/types.h>
#include <lexgraph/graph/graph_query.h>
#include <lexgraph/graph/rdf_xml_io.h>
#include <lexgraph/graph/triple_store.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexgraph::graph {

// Local names of the legal vocabulary, resolved against the configured namespace
namespace law {
inline constexpr const char* kLaw = "Law";
inline constexpr const char* kChapter = "Chapter";
inline constexpr const char* kArticle = "Article";
inline constexpr const char* kTerm = "Term";

inline constexpr const char* kHasTitle = "hasTitle";
inline constexpr const char* kHasDate = "hasDate";
inline constexpr const char* kHasNumber = "hasNumber";
inline constexpr const char* kHasText = "hasText";
inline constexpr const char* kHasPage = "hasPage";
inline constexpr const char* kContainsChapter = "containsChapter";
inline constexpr const char* kContainsArticle = "containsArticle";
inline constexpr const char* kBelongsToLaw = "belongsToLaw";
inline constexpr const char* kReferences = "references";
inline constexpr const char* kReferencesLaw = "referencesLaw";
inline constexpr const char* kDefinesTerm = "definesTerm";
inline constexpr const char* kUsesTerm = "usesTerm";
inline constexpr const char* kHasSynonym = "hasSynonym";
} // namespace law

// Identifier derivation. Identical inputs always yield identical identifiers.
std::string makeLawId(const std::filesystem::path& sourcePath);
std::string chapterId(const std::string& lawId, const std::string& number);
std::string articleId(const std::string& lawId, const std::string& number);
// Lower-cased, trimmed, internal whitespace runs collapsed to '_'
std::string normalizeTermText(std::string_view text);
std::string termIdFor(std::string_view termText);

struct StoredArticle {
    std::string iri;
    std::string number;
    std::string text;
    std::optional<int> page;
    std::optional<std::string> lawIri;
};

struct StoredLaw {
    std::string iri;
    std::string title;
    std::optional<std::string> date;
};

/**
 * @brief Legal knowledge graph over a TripleStore, persisted as RDF/XML.
 *
 * Entity handles are IRIs in the configured namespace. All add operations are additive:
 * re-adding the same facts is a no-op, stale facts stay until clearDocument(). The backing
 * file is rewritten wholesale by save(); a single writer is assumed.
 */
class KnowledgeStore {
public:
    KnowledgeStore(config::OntologyConfig ontology, std::size_t searchLimit = 50);

    /**
     * @brief Create a store and load the configured graph file if it exists.
     *
     * A malformed file is repaired through a sanitized copy.
     * @return MalformedPersistedGraph if the repaired copy cannot be parsed either
     */
    static Result<std::unique_ptr<KnowledgeStore>> open(const config::OntologyConfig& ontology,
                                                        std::size_t searchLimit = 50);

    std::string addLaw(const std::string& lawId, const std::string& title,
                       const std::string& date = {});
    std::string addChapter(const std::string& chapterId, const std::string& lawIri,
                           const std::string& number, const std::string& title = {});
    // chapterIri and lawIri may be empty
    std::string addArticle(const std::string& articleId, const std::string& chapterIri,
                           const std::string& number, const std::string& text = {},
                           const std::string& lawIri = {}, std::optional<int> page = {});
    std::string addTerm(const std::string& termId, const std::string& termText);
    // Either target may be empty
    void addReference(const std::string& fromArticle, const std::string& toArticle,
                      const std::string& toLaw = {});
    void addSynonym(const std::string& term, const std::string& synonym);
    void linkTermToArticle(const std::string& articleIri, const std::string& termIri,
                           bool isDefinition = false);

    // Writes to the configured file when path is not given
    Result<void> save(const std::optional<std::filesystem::path>& path = std::nullopt) const;

    /**
     * @brief Run a SELECT query; the law, rdf, rdfs, owl and xsd prefixes are predeclared
     * @return One row per solution, every selected variable present
     */
    Result<std::vector<QueryRow>> query(std::string_view pattern) const;

    /**
     * @brief Articles defining or using a matching term, else articles whose text contains
     * the query, else (multi-word queries only) whose text matches it with any whitespace
     * between words. Row keys: article, article_number, article_text, law, law_title.
     */
    Result<std::vector<QueryRow>> searchArticlesByTerm(std::string_view termText) const;

    Result<std::optional<std::string>> getArticleByNumber(const std::string& lawId,
                                                          const std::string& number) const;
    Result<std::vector<std::string>> getReferencedArticles(const std::string& articleIri) const;

    // NotFound if the article does not exist
    Result<StoredArticle> getArticle(const std::string& articleId) const;

    Result<std::vector<StoredLaw>> listLaws() const;

    // Number of subjects typed with the given vocabulary class, e.g. "Article"
    std::size_t countByType(const std::string& typeName) const;

    /**
     * @brief Remove the law, its chapters and articles, and every edge touching them.
     * Terms are shared between documents and are kept.
     * @return Number of triples removed
     */
    std::size_t clearDocument(const std::string& lawId);

    std::string iri(std::string_view localName) const;
    const TripleStore& graph() const { return store_; }
    const PrefixMap& prefixes() const { return prefixes_; }
    const config::OntologyConfig& ontology() const { return ontology_; }
    const std::optional<RdfXmlLoadReport>& loadReport() const { return loadReport_; }

private:
    void addTriple(const std::string& subject, const char* predicate, RdfTerm object);
    RdfTerm vocabTerm(const char* localName) const { return RdfTerm::iri(iri(localName)); }
    Result<std::vector<QueryRow>> runSearchTier(std::string_view label, const std::string& pattern,
                                                std::string_view termText) const;

    config::OntologyConfig ontology_;
    std::size_t searchLimit_;
    PrefixMap prefixes_;
    TripleStore store_;
    std::optional<RdfXmlLoadReport> loadReport_;
};

} // namespace lexgraph::graph
