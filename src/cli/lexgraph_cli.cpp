#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <iostream>
#include <lexgraph/cli/lexgraph_cli.h>
#include <lexgraph/ingest/ingestion_orchestrator.h>
#include <lexgraph/locator/page_locator.h>
#include <lexgraph/nlp/linguistic_analyzer.h>
#include <lexgraph/parsing/document_parser.h>
#include <lexgraph/parsing/source_reader.h>

namespace lexgraph::cli {

using json = nlohmann::json;

namespace {

json rowsToJson(const std::vector<graph::QueryRow>& rows) {
    json out = json::array();
    for (const auto& row : rows) {
        json item = json::object();
        for (const auto& [key, value] : row) {
            item[key] = value ? json(*value) : json(nullptr);
        }
        out.push_back(std::move(item));
    }
    return out;
}

json summaryToJson(const ingest::IngestionSummary& summary) {
    json references = json::array();
    for (const auto& ref : summary.references) {
        references.push_back({{"type", ref.tag},
                              {"phrase", ref.phrase},
                              {"text", ref.text},
                              {"position", ref.position}});
    }
    json keyTerms = json::array();
    for (const auto& term : summary.keyTerms) {
        keyTerms.push_back({{"term", term.term}, {"frequency", term.count}});
    }
    return {{"law_id", summary.lawId},
            {"law_uri", summary.lawIri},
            {"articles_count", summary.articleCount},
            {"chapters_count", summary.chapterCount},
            {"terms_count", summary.termCount},
            {"reference_edges", summary.referenceEdges},
            {"term_links", summary.termLinks},
            {"entities",
             {{"laws", summary.entities.laws},
              {"articles", summary.entities.articles},
              {"dates", summary.entities.dates},
              {"terms", summary.entities.terms}}},
            {"references", references},
            {"key_terms", keyTerms}};
}

} // namespace

LexGraphCli::LexGraphCli() {
    app_ = std::make_unique<CLI::App>("Legal document knowledge graph", "lexgraph");
    app_->require_subcommand(1);

    app_->add_option("-c,--config", configPath_, "Path to config.toml");
    app_->add_option("--ontology", ontologyFile_, "Graph file (overrides configuration)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");

    auto* ingestCmd = app_->add_subcommand("ingest", "Parse documents and add them to the graph");
    ingestCmd->add_option("files", inputFiles_, "Documents (.xml, .html, .txt, .pdf)")
        ->required()
        ->check(CLI::ExistingFile);
    ingestCmd->add_flag("--replace", replaceExisting_,
                        "Remove the document's previous triples before adding");
    ingestCmd->callback([this]() { pending_ = [this]() { return runIngest(); }; });

    auto* searchCmd = app_->add_subcommand("search", "Find articles by term");
    searchCmd->add_option("term", searchTerm_, "Term or phrase")->required();
    searchCmd->callback([this]() { pending_ = [this]() { return runSearch(); }; });

    auto* queryCmd = app_->add_subcommand("query", "Run a graph query");
    queryCmd->add_option("pattern", queryText_, "Query text, or @file to read it from a file")
        ->required();
    queryCmd->callback([this]() { pending_ = [this]() { return runQuery(); }; });

    auto* pagesCmd = app_->add_subcommand("pages", "Locate article pages in a PDF");
    pagesCmd->add_option("pdf", pdfPath_, "PDF document")->required()->check(CLI::ExistingFile);
    pagesCmd->add_option("articles", articleNumbers_, "Article numbers")->required();
    pagesCmd->callback([this]() { pending_ = [this]() { return runPages(); }; });

    auto* lawsCmd = app_->add_subcommand("laws", "List ingested laws");
    lawsCmd->callback([this]() { pending_ = [this]() { return runLaws(); }; });
}

LexGraphCli::~LexGraphCli() = default;

int LexGraphCli::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    auto init = initialize();
    if (!init) {
        std::cerr << "Error: " << init.error().message << "\n";
        return 1;
    }

    auto result = pending_();
    if (!result) {
        std::cerr << "Error (" << errorToString(result.error().code)
                  << "): " << result.error().message << "\n";
        return 1;
    }
    return 0;
}

Result<void> LexGraphCli::initialize() {
    auto cfg = config::loadDefaultConfig(configPath_);
    if (!cfg) {
        return cfg.error();
    }
    config_ = std::move(cfg).value();
    if (!ontologyFile_.empty()) {
        config_.ontology.file = ontologyFile_;
    }

    auto level = spdlog::level::from_str(config_.logLevel);
    spdlog::set_level(verbose_ ? spdlog::level::debug : level);
    return Result<void>();
}

Result<void> LexGraphCli::openStore() {
    auto store = graph::KnowledgeStore::open(config_.ontology, config_.ingest.searchLimit);
    if (!store) {
        return store.error();
    }
    store_ = std::move(store).value();
    return Result<void>();
}

Result<void> LexGraphCli::runIngest() {
    if (auto opened = openStore(); !opened) {
        return opened;
    }

    parsing::StructuralParser parser;
    auto analyzer = nlp::makeLinguisticAnalyzer(config_.nlp);
    ingest::IngestionOrchestrator orchestrator(parser, analyzer, *store_, config_.ingest);

    ingest::IngestOptions options;
    options.replaceExisting = replaceExisting_;

    json summaries = json::array();
    for (const auto& file : inputFiles_) {
        auto summary = orchestrator.ingest(file, options);
        if (!summary) {
            return summary.error();
        }
        summaries.push_back(summaryToJson(summary.value()));
    }
    std::cout << summaries.dump(2) << std::endl;
    return Result<void>();
}

Result<void> LexGraphCli::runSearch() {
    if (auto opened = openStore(); !opened) {
        return opened;
    }

    auto rows = store_->searchArticlesByTerm(searchTerm_);
    if (!rows) {
        return rows.error();
    }
    std::cout << json{{"query", searchTerm_}, {"results", rowsToJson(rows.value())}}.dump(2)
              << std::endl;
    return Result<void>();
}

Result<void> LexGraphCli::runQuery() {
    std::string pattern = queryText_;
    if (!pattern.empty() && pattern.front() == '@') {
        auto content = parsing::readSourceFile(pattern.substr(1));
        if (!content) {
            return content.error();
        }
        pattern = std::move(content).value();
    }

    if (auto opened = openStore(); !opened) {
        return opened;
    }

    auto rows = store_->query(pattern);
    if (!rows) {
        return rows.error();
    }
    std::cout << rowsToJson(rows.value()).dump(2) << std::endl;
    return Result<void>();
}

Result<void> LexGraphCli::runPages() {
    locator::PageIndexCache cache;
    locator::PageLocator pageLocator(cache);

    auto pages = pageLocator.locate(pdfPath_, articleNumbers_);
    if (!pages) {
        return pages.error();
    }

    json out = json::object();
    for (const auto& number : articleNumbers_) {
        auto it = pages.value().find(number);
        out[number] = it == pages.value().end() ? json(nullptr) : json(it->second);
    }
    std::cout << out.dump(2) << std::endl;
    return Result<void>();
}

Result<void> LexGraphCli::runLaws() {
    if (auto opened = openStore(); !opened) {
        return opened;
    }

    auto laws = store_->listLaws();
    if (!laws) {
        return laws.error();
    }
    json out = json::array();
    for (const auto& law : laws.value()) {
        out.push_back({{"law", law.iri},
                       {"title", law.title},
                       {"date", law.date ? json(*law.date) : json(nullptr)}});
    }
    std::cout << out.dump(2) << std::endl;
    return Result<void>();
}

} // namespace lexgraph::cli
