#include <spdlog/spdlog.h>
#include <cctype>
#include <unordered_set>
#include <lexgraph/ingest/ingestion_orchestrator.h>

namespace lexgraph::ingest {

std::string DocumentScopedReferenceLinking::firstArticleNumber(std::string_view text) {
    auto isDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    std::size_t start = 0;
    while (start < text.size() && !isDigit(text[start])) {
        ++start;
    }
    if (start == text.size()) {
        return {};
    }
    std::size_t end = start;
    while (end < text.size() && isDigit(text[end])) {
        ++end;
    }
    if (end + 1 < text.size() && text[end] == '.' && isDigit(text[end + 1])) {
        end += 1;
        while (end < text.size() && isDigit(text[end])) {
            ++end;
        }
    }
    return std::string(text.substr(start, end - start));
}

std::size_t
DocumentScopedReferenceLinking::link(graph::KnowledgeStore& store,
                                     const std::vector<nlp::ReferenceMatch>& references,
                                     const std::map<std::string, std::string>& articleIris) const {
    std::size_t edges = 0;
    for (const auto& ref : references) {
        auto number = firstArticleNumber(ref.text);
        if (number.empty()) {
            continue;
        }
        auto target = articleIris.find(number);
        if (target == articleIris.end()) {
            spdlog::debug("Reference '{} {}' points outside the document", ref.phrase, ref.text);
            continue;
        }
        for (const auto& [_, from] : articleIris) {
            store.addReference(from, target->second);
            ++edges;
        }
    }
    return edges;
}

IngestionOrchestrator::IngestionOrchestrator(const parsing::StructuralParser& parser,
                                             const nlp::LinguisticAnalyzer& analyzer,
                                             graph::KnowledgeStore& store,
                                             config::IngestConfig config)
    : parser_(parser), analyzer_(analyzer), store_(store), config_(config) {}

Result<IngestionSummary> IngestionOrchestrator::ingest(const std::filesystem::path& path,
                                                       const IngestOptions& options) {
    spdlog::info("Ingesting document: {}", path.string());

    auto parsed = parser_.parse(path);
    if (!parsed) {
        spdlog::error("Failed to parse {}: {}", path.string(), parsed.error().message);
        return parsed.error();
    }

    auto summary = ingestParsed(graph::makeLawId(path), parsed.value(), options);
    if (summary) {
        spdlog::info("Document {} ingested as {}: {} articles, {} chapters, {} terms",
                     path.string(), summary.value().lawId, summary.value().articleCount,
                     summary.value().chapterCount, summary.value().termCount);
    }
    return summary;
}

Result<IngestionSummary> IngestionOrchestrator::ingestParsed(const std::string& lawId,
                                                             const parsing::ParsedDocument& document,
                                                             const IngestOptions& options) {
    if (lawId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Law identifier must not be empty"};
    }
    if (options.replaceExisting) {
        store_.clearDocument(lawId);
    }

    IngestionSummary summary;
    summary.lawId = lawId;
    summary.lawIri = store_.addLaw(lawId, document.title);

    // Chapter ids derive from numbers, so a repeated number resolves to the same chapter
    std::vector<std::string> chapterIris;
    std::unordered_set<std::string> seenChapters;
    for (const auto& chapter : document.chapters) {
        auto iri = store_.addChapter(graph::chapterId(lawId, chapter.number), summary.lawIri,
                                     chapter.number, chapter.title);
        if (seenChapters.insert(iri).second) {
            chapterIris.push_back(std::move(iri));
        }
    }
    summary.chapterCount = chapterIris.size();

    std::map<std::string, std::string> articleIris; // number -> IRI
    std::map<std::string, std::string> articleTexts; // number -> first text seen
    for (const auto& article : document.articles) {
        auto iri = store_.addArticle(graph::articleId(lawId, article.number),
                                     chapterAssignment_.chapterFor(chapterIris), article.number,
                                     article.text, summary.lawIri, article.page);
        articleIris[article.number] = std::move(iri);
        articleTexts.emplace(article.number, article.text);
    }
    summary.articleCount = articleIris.size();

    summary.entities = analyzer_.extractEntities(document.fullText);
    summary.references = analyzer_.extractReferences(document.fullText);
    summary.keyTerms = analyzer_.findKeyTerms(document.fullText, config_.graphKeyTerms);

    std::vector<std::pair<std::string, std::string>> termIris; // term text -> IRI
    for (const auto& keyTerm : summary.keyTerms) {
        termIris.emplace_back(keyTerm.term,
                              store_.addTerm(graph::termIdFor(keyTerm.term), keyTerm.term));
    }
    summary.termCount = termIris.size();

    for (const auto& [number, articleIri] : articleIris) {
        const auto lemmas = analyzer_.lemmatize(articleTexts[number]);
        const std::unordered_set<std::string> lemmaSet(lemmas.begin(), lemmas.end());
        for (const auto& [termText, termIri] : termIris) {
            if (lemmaSet.count(termText) > 0) {
                store_.linkTermToArticle(articleIri, termIri);
                ++summary.termLinks;
            }
        }
    }
    spdlog::debug("Linked {} terms to articles of {}", summary.termLinks, lawId);

    summary.referenceEdges = referenceLinking_.link(store_, summary.references, articleIris);
    spdlog::debug("Added {} reference edges for {}", summary.referenceEdges, lawId);

    if (options.save) {
        auto saved = store_.save();
        if (!saved) {
            return saved.error();
        }
    }
    return summary;
}

} // namespace lexgraph::ingest
