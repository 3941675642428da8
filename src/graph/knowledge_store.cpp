#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>
#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/graph/knowledge_store.h>

namespace lexgraph::graph {

namespace {

constexpr const char* kArticleProjection = "?article ?article_number ?article_text ?law ?law_title";
constexpr const char* kArticleOptionals = R"(
    OPTIONAL { ?article law:belongsToLaw ?law . }
    OPTIONAL { ?law law:hasTitle ?law_title . })";

// Literal text must survive the XML round trip
std::string cleanLiteral(std::string_view text) {
    std::string stripped;
    stripped.reserve(text.size());
    for (char c : text) {
        auto b = static_cast<unsigned char>(c);
        if (b >= 0x20 || b == '\t' || b == '\n' || b == '\r') {
            stripped.push_back(c);
        }
    }
    return common::sanitizeUtf8(stripped);
}

bool hasWhitespace(std::string_view text) {
    return std::any_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

// Lower-cased regex that tolerates any whitespace run between words
std::string whitespaceTolerantRegex(std::string_view termText) {
    const std::string escaped = escapeRegex(common::lowerUtf8(common::trimCopy(termText)));
    std::string out;
    out.reserve(escaped.size() + 8);
    for (char c : escaped) {
        if (c == ' ') {
            out += "\\s+";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::string makeLawId(const std::filesystem::path& sourcePath) {
    std::string id = sourcePath.stem().string();
    std::replace(id.begin(), id.end(), ' ', '_');
    std::replace(id.begin(), id.end(), '-', '_');
    return id;
}

std::string chapterId(const std::string& lawId, const std::string& number) {
    return lawId + "_chapter_" + number;
}

std::string articleId(const std::string& lawId, const std::string& number) {
    return lawId + "_article_" + number;
}

std::string normalizeTermText(std::string_view text) {
    std::string collapsed = common::collapseWhitespace(common::trimCopy(common::lowerUtf8(text)));
    std::replace(collapsed.begin(), collapsed.end(), ' ', '_');
    return collapsed;
}

std::string termIdFor(std::string_view termText) {
    return "term_" + normalizeTermText(termText);
}

KnowledgeStore::KnowledgeStore(config::OntologyConfig ontology, std::size_t searchLimit)
    : ontology_(std::move(ontology)), searchLimit_(searchLimit) {
    prefixes_ = {
        {"law", ontology_.ns},
        {"rdf", std::string(vocab::kRdf)},
        {"rdfs", std::string(vocab::kRdfs)},
        {"owl", std::string(vocab::kOwl)},
        {"xsd", std::string(vocab::kXsd)},
    };
}

Result<std::unique_ptr<KnowledgeStore>> KnowledgeStore::open(const config::OntologyConfig& ontology,
                                                             std::size_t searchLimit) {
    auto store = std::make_unique<KnowledgeStore>(ontology, searchLimit);

    std::error_code ec;
    if (!std::filesystem::exists(ontology.file, ec)) {
        spdlog::info("Graph file {} not found, starting with an empty graph", ontology.file.string());
        return store;
    }

    auto loaded = loadRdfXmlFile(ontology.file, store->store_);
    if (!loaded) {
        spdlog::error("Failed to load graph file {}: {}", ontology.file.string(),
                      loaded.error().message);
        return loaded.error();
    }
    spdlog::info("Graph loaded from {} ({} triples)", loaded.value().loadedFrom.string(),
                 loaded.value().tripleCount);
    store->loadReport_ = loaded.value();
    return store;
}

std::string KnowledgeStore::iri(std::string_view localName) const {
    return ontology_.ns + std::string(localName);
}

void KnowledgeStore::addTriple(const std::string& subject, const char* predicate, RdfTerm object) {
    store_.add({RdfTerm::iri(subject), vocabTerm(predicate), std::move(object)});
}

std::string KnowledgeStore::addLaw(const std::string& lawId, const std::string& title,
                                   const std::string& date) {
    std::string lawIri = iri(lawId);
    store_.add({RdfTerm::iri(lawIri), RdfTerm::iri(vocab::rdfType()), vocabTerm(law::kLaw)});
    addTriple(lawIri, law::kHasTitle, RdfTerm::literal(cleanLiteral(title), "ru"));
    if (!date.empty()) {
        addTriple(lawIri, law::kHasDate, RdfTerm::literal(cleanLiteral(date), {}, vocab::xsdDate()));
    }
    return lawIri;
}

std::string KnowledgeStore::addChapter(const std::string& chapterId, const std::string& lawIri,
                                       const std::string& number, const std::string& title) {
    std::string chapterIri = iri(chapterId);
    store_.add({RdfTerm::iri(chapterIri), RdfTerm::iri(vocab::rdfType()), vocabTerm(law::kChapter)});
    addTriple(chapterIri, law::kHasNumber, RdfTerm::literal(cleanLiteral(number)));
    if (!title.empty()) {
        addTriple(chapterIri, law::kHasTitle, RdfTerm::literal(cleanLiteral(title), "ru"));
    }
    addTriple(lawIri, law::kContainsChapter, RdfTerm::iri(chapterIri));
    return chapterIri;
}

std::string KnowledgeStore::addArticle(const std::string& articleId, const std::string& chapterIri,
                                       const std::string& number, const std::string& text,
                                       const std::string& lawIri, std::optional<int> page) {
    std::string articleIri = iri(articleId);
    store_.add({RdfTerm::iri(articleIri), RdfTerm::iri(vocab::rdfType()), vocabTerm(law::kArticle)});
    addTriple(articleIri, law::kHasNumber, RdfTerm::literal(cleanLiteral(number)));
    if (!text.empty()) {
        addTriple(articleIri, law::kHasText, RdfTerm::literal(cleanLiteral(text), "ru"));
    }
    if (page) {
        addTriple(articleIri, law::kHasPage,
                  RdfTerm::literal(std::to_string(*page), {}, vocab::xsdInteger()));
    }
    if (!chapterIri.empty()) {
        addTriple(chapterIri, law::kContainsArticle, RdfTerm::iri(articleIri));
    }
    if (!lawIri.empty()) {
        addTriple(articleIri, law::kBelongsToLaw, RdfTerm::iri(lawIri));
    }
    return articleIri;
}

std::string KnowledgeStore::addTerm(const std::string& termId, const std::string& termText) {
    std::string termIri = iri(termId);
    store_.add({RdfTerm::iri(termIri), RdfTerm::iri(vocab::rdfType()), vocabTerm(law::kTerm)});
    addTriple(termIri, law::kHasTitle, RdfTerm::literal(cleanLiteral(termText), "ru"));
    return termIri;
}

void KnowledgeStore::addReference(const std::string& fromArticle, const std::string& toArticle,
                                  const std::string& toLaw) {
    if (!toArticle.empty()) {
        addTriple(fromArticle, law::kReferences, RdfTerm::iri(toArticle));
    }
    if (!toLaw.empty()) {
        addTriple(fromArticle, law::kReferencesLaw, RdfTerm::iri(toLaw));
    }
}

void KnowledgeStore::addSynonym(const std::string& term, const std::string& synonym) {
    addTriple(term, law::kHasSynonym, RdfTerm::iri(synonym));
}

void KnowledgeStore::linkTermToArticle(const std::string& articleIri, const std::string& termIri,
                                       bool isDefinition) {
    addTriple(articleIri, isDefinition ? law::kDefinesTerm : law::kUsesTerm, RdfTerm::iri(termIri));
}

Result<void> KnowledgeStore::save(const std::optional<std::filesystem::path>& path) const {
    const auto target = path.value_or(ontology_.file);
    auto written = writeRdfXmlFile(store_, target, prefixes_);
    if (!written) {
        spdlog::error("Failed to save graph to {}: {}", target.string(), written.error().message);
        return written;
    }
    spdlog::info("Graph saved to {} ({} triples)", target.string(), store_.size());
    return Result<void>();
}

Result<std::vector<QueryRow>> KnowledgeStore::query(std::string_view pattern) const {
    auto fail = [&](const Error& err) -> Error {
        spdlog::error("Query failed: {}", err.message);
        spdlog::error("Query: {}", pattern);
        return Error{ErrorCode::QueryFailed,
                     fmt::format("{}\nQuery: {}", err.message, pattern)};
    };

    auto parsed = GraphQuery::parse(pattern, prefixes_);
    if (!parsed) {
        return fail(parsed.error());
    }
    auto executed = parsed.value().execute(store_);
    if (!executed) {
        return fail(executed.error());
    }
    return std::move(executed.value().rows);
}

Result<std::vector<QueryRow>> KnowledgeStore::runSearchTier(std::string_view label,
                                                            const std::string& pattern,
                                                            std::string_view termText) const {
    auto rows = query(pattern);
    if (rows) {
        spdlog::info("Search by {} for '{}': {} results", label, termText, rows.value().size());
    }
    return rows;
}

Result<std::vector<QueryRow>>
KnowledgeStore::searchArticlesByTerm(std::string_view termText) const {
    const std::string escaped = escapeQueryString(termText);

    const std::string byTerm = fmt::format(R"(
SELECT {0} WHERE {{
    ?term a law:Term ;
          law:hasTitle ?term_title .
    FILTER(CONTAINS(LCASE(?term_title), LCASE("{1}")))
    {{ ?article law:definesTerm ?term . }} UNION {{ ?article law:usesTerm ?term . }}
    ?article law:hasNumber ?article_number .
    OPTIONAL {{ ?article law:hasText ?article_text . }}{2}
}})",
                                           kArticleProjection, escaped, kArticleOptionals);
    auto rows = runSearchTier("terms", byTerm, termText);
    if (!rows || !rows.value().empty()) {
        return rows;
    }

    const std::string byText = fmt::format(R"(
SELECT {0} WHERE {{
    ?article a law:Article ;
             law:hasNumber ?article_number ;
             law:hasText ?article_text .
    FILTER(CONTAINS(LCASE(?article_text), LCASE("{1}"))){2}
}}
LIMIT {3})",
                                           kArticleProjection, escaped, kArticleOptionals,
                                           searchLimit_);
    rows = runSearchTier("article text", byText, termText);
    if (!rows || !rows.value().empty() || !hasWhitespace(termText)) {
        return rows;
    }

    const std::string byRegex = fmt::format(R"(
SELECT {0} WHERE {{
    ?article a law:Article ;
             law:hasNumber ?article_number ;
             law:hasText ?article_text .
    FILTER(REGEX(LCASE(STR(?article_text)), "{1}")){2}
}}
LIMIT {3})",
                                            kArticleProjection,
                                            escapeQueryString(whitespaceTolerantRegex(termText)),
                                            kArticleOptionals, searchLimit_);
    return runSearchTier("article text pattern", byRegex, termText);
}

Result<std::optional<std::string>>
KnowledgeStore::getArticleByNumber(const std::string& lawId, const std::string& number) const {
    const std::string pattern = fmt::format(R"(
SELECT ?article WHERE {{
    ?article a law:Article ;
             law:hasNumber "{0}" ;
             law:belongsToLaw <{1}> .
}})",
                                            escapeQueryString(number), iri(lawId));
    auto rows = query(pattern);
    if (!rows) {
        return rows.error();
    }
    if (rows.value().empty()) {
        return std::optional<std::string>{};
    }
    return rows.value().front().at("article");
}

Result<std::vector<std::string>>
KnowledgeStore::getReferencedArticles(const std::string& articleIri) const {
    const std::string pattern =
        fmt::format("SELECT ?ref_article WHERE {{ <{}> law:references ?ref_article . }}", articleIri);
    auto rows = query(pattern);
    if (!rows) {
        return rows.error();
    }
    std::vector<std::string> out;
    for (const auto& row : rows.value()) {
        const auto& value = row.at("ref_article");
        if (value) {
            out.push_back(*value);
        }
    }
    return out;
}

Result<StoredArticle> KnowledgeStore::getArticle(const std::string& articleId) const {
    const RdfTerm subject = RdfTerm::iri(iri(articleId));
    if (!store_.contains({subject, RdfTerm::iri(vocab::rdfType()), vocabTerm(law::kArticle)})) {
        return Error{ErrorCode::NotFound, "Article not found: " + articleId};
    }

    StoredArticle article;
    article.iri = subject.value;
    auto first = [&](const char* predicate) -> const RdfTerm* {
        auto matches = store_.match(subject, vocabTerm(predicate), std::nullopt);
        return matches.empty() ? nullptr : &matches.front()->object;
    };
    if (const auto* number = first(law::kHasNumber)) {
        article.number = number->value;
    }
    if (const auto* text = first(law::kHasText)) {
        article.text = text->value;
    }
    if (const auto* page = first(law::kHasPage)) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(page->value.data(), page->value.data() + page->value.size(),
                                         value);
        if (ec == std::errc()) {
            article.page = value;
        } else {
            spdlog::warn("Article {} has a non-numeric page '{}'", articleId, page->value);
        }
    }
    if (const auto* lawTerm = first(law::kBelongsToLaw)) {
        article.lawIri = lawTerm->value;
    }
    return article;
}

Result<std::vector<StoredLaw>> KnowledgeStore::listLaws() const {
    auto rows = query(R"(
SELECT ?law ?title ?date WHERE {
    ?law a law:Law .
    OPTIONAL { ?law law:hasTitle ?title . }
    OPTIONAL { ?law law:hasDate ?date . }
}
ORDER BY ?law)");
    if (!rows) {
        return rows.error();
    }
    std::vector<StoredLaw> laws;
    for (const auto& row : rows.value()) {
        const auto& lawIri = row.at("law");
        if (!laws.empty() && lawIri && laws.back().iri == *lawIri) {
            continue; // several titles for one law
        }
        StoredLaw entry;
        entry.iri = lawIri.value_or("");
        entry.title = row.at("title").value_or("");
        entry.date = row.at("date");
        laws.push_back(std::move(entry));
    }
    return laws;
}

std::size_t KnowledgeStore::countByType(const std::string& typeName) const {
    return store_.match(std::nullopt, RdfTerm::iri(vocab::rdfType()), vocabTerm(typeName.c_str()))
        .size();
}

std::size_t KnowledgeStore::clearDocument(const std::string& lawId) {
    const RdfTerm lawTerm = RdfTerm::iri(iri(lawId));
    std::set<RdfTerm> members{lawTerm};

    for (const auto* t : store_.match(lawTerm, vocabTerm(law::kContainsChapter), std::nullopt)) {
        members.insert(t->object);
        for (const auto* a : store_.match(t->object, vocabTerm(law::kContainsArticle), std::nullopt)) {
            members.insert(a->object);
        }
    }
    for (const auto* t : store_.match(std::nullopt, vocabTerm(law::kBelongsToLaw), lawTerm)) {
        members.insert(t->subject);
    }

    const std::size_t removed = store_.removeIf([&members](const Triple& t) {
        return members.count(t.subject) > 0 || (t.object.isIri() && members.count(t.object) > 0);
    });
    spdlog::info("Cleared {} triples of law {}", removed, lawId);
    return removed;
}

} // namespace lexgraph::graph
