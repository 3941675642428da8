#pragma once

#include <lexgraph/config/lexgraph_config.h>
#include <lexgraph/core/types.h>
#include <lexgraph/graph/knowledge_store.h>
#include <lexgraph/nlp/linguistic_analyzer.h>
#include <lexgraph/parsing/document_parser.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace lexgraph::ingest {

struct IngestionSummary {
    std::string lawId;
    std::string lawIri;
    std::size_t articleCount = 0;
    std::size_t chapterCount = 0;
    std::size_t termCount = 0;
    std::size_t referenceEdges = 0;
    std::size_t termLinks = 0;
    nlp::EntitySet entities;
    std::vector<nlp::ReferenceMatch> references;
    std::vector<nlp::KeyTerm> keyTerms;
};

struct IngestOptions {
    // Remove the law's previous triples before adding new ones; additive otherwise
    bool replaceExisting = false;
    // Persist the graph after a successful ingestion
    bool save = true;
};

/**
 * @brief Chapter for an article: every article goes to the chapter added last.
 *
 * Approximation; containment by source order is not checked.
 */
struct LastChapterAssignment {
    // Empty when the document has no chapters
    std::string chapterFor(const std::vector<std::string>& chapterIris) const {
        return chapterIris.empty() ? std::string() : chapterIris.back();
    }
};

/**
 * @brief Reference edges from a document's cross-reference phrases.
 *
 * The first number in a reference span names the target. If that article exists in the
 * same document, every article of the document gets an edge to it. Spans are not
 * attributed to the article they occur in.
 */
struct DocumentScopedReferenceLinking {
    // First "\d+(\.\d+)?" in text, empty if none
    static std::string firstArticleNumber(std::string_view text);

    std::size_t link(graph::KnowledgeStore& store,
                     const std::vector<nlp::ReferenceMatch>& references,
                     const std::map<std::string, std::string>& articleIris) const;
};

/**
 * @brief Parse a document, analyze it and add its structure and language features to
 * the knowledge graph.
 *
 * Not transactional: on failure the in-memory graph may hold part of the document and
 * nothing is saved.
 */
class IngestionOrchestrator {
public:
    IngestionOrchestrator(const parsing::StructuralParser& parser,
                          const nlp::LinguisticAnalyzer& analyzer, graph::KnowledgeStore& store,
                          config::IngestConfig config = {});

    Result<IngestionSummary> ingest(const std::filesystem::path& path,
                                    const IngestOptions& options = {});

    /**
     * @brief Ingest an already parsed document under the given law id
     */
    Result<IngestionSummary> ingestParsed(const std::string& lawId,
                                          const parsing::ParsedDocument& document,
                                          const IngestOptions& options = {});

private:
    const parsing::StructuralParser& parser_;
    const nlp::LinguisticAnalyzer& analyzer_;
    graph::KnowledgeStore& store_;
    config::IngestConfig config_;
    LastChapterAssignment chapterAssignment_;
    DocumentScopedReferenceLinking referenceLinking_;
};

} // namespace lexgraph::ingest
