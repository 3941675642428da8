#include <gtest/gtest.h>
#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/ingest/ingestion_orchestrator.h>

#include "support/temp_dir_scope.hpp"

using namespace lexgraph;
using namespace lexgraph::ingest;
using lexgraph::test_support::TempDirScope;

namespace {

const std::string kNs = "http://law.test/#";

// Rule-based pipeline whose analysis fails for any text containing the marker
class SelectiveFailurePipeline : public nlp::ILinguisticPipeline {
public:
    explicit SelectiveFailurePipeline(std::string marker) : marker_(std::move(marker)) {}

    std::vector<std::string> tokenize(std::string_view text) const override {
        return inner_.tokenize(text);
    }
    Result<std::vector<nlp::PipelineToken>> analyze(std::string_view text) const override {
        if (text.find(marker_) != std::string_view::npos) {
            return Error{ErrorCode::InternalError, "tagger failed on input"};
        }
        return inner_.analyze(text);
    }
    std::string name() const override { return "SelectiveFailurePipeline"; }

private:
    std::string marker_;
    nlp::RuleBasedPipeline inner_;
};

// Knows one irregular form, has no reading for "неустойки"
class PatchyMorphAnalyzer : public nlp::IMorphAnalyzer {
public:
    Result<std::string> normalForm(std::string_view word) const override {
        auto lower = common::lowerUtf8(word);
        if (lower == "неустойки") {
            return Error{ErrorCode::NotFound, "no reading for " + lower};
        }
        if (lower == "договора") {
            return std::string("договор");
        }
        return lower;
    }
    std::string name() const override { return "PatchyMorphAnalyzer"; }
};

parsing::ParsedDocument leaseDocument(const std::string& first, const std::string& second) {
    parsing::ParsedDocument doc;
    doc.title = "Аренда";
    doc.chapters = {{"1", "Общие", "Общие положения"}};
    doc.articles = {{"1", first, std::nullopt}, {"2", second, std::nullopt}};
    doc.fullText = first + " " + second;
    return doc;
}

class IngestionOrchestratorTest : public ::testing::Test {
protected:
    IngestionOrchestratorTest()
        : dir_(TempDirScope::unique_under("lexgraph_ingest")),
          analyzer_(nlp::AnalyzerOptions{}, nullptr, nullptr) {
        config::OntologyConfig ontology;
        ontology.file = dir_.path() / "graph" / "ontology.owl";
        ontology.ns = kNs;
        store_ = std::make_unique<graph::KnowledgeStore>(ontology);
        orchestrator_ = std::make_unique<IngestionOrchestrator>(parser_, analyzer_, *store_);
    }

    std::size_t countRows(const std::string& pattern) {
        auto rows = store_->query(pattern);
        EXPECT_TRUE(rows) << rows.error().message;
        return rows ? rows.value().size() : 0;
    }

    TempDirScope dir_;
    parsing::StructuralParser parser_;
    nlp::LinguisticAnalyzer analyzer_;
    std::unique_ptr<graph::KnowledgeStore> store_;
    std::unique_ptr<IngestionOrchestrator> orchestrator_;
};

} // namespace

TEST(DocumentScopedReferenceLinkingTest, FirstArticleNumber) {
    EXPECT_EQ(DocumentScopedReferenceLinking::firstArticleNumber("статьи 12.1 кодекса"), "12.1");
    EXPECT_EQ(DocumentScopedReferenceLinking::firstArticleNumber("пункта 3."), "3");
    EXPECT_EQ(DocumentScopedReferenceLinking::firstArticleNumber("статьи 4 и 5"), "4");
    EXPECT_EQ(DocumentScopedReferenceLinking::firstArticleNumber("закона"), "");
}

TEST(LastChapterAssignmentTest, PicksTheLastChapter) {
    LastChapterAssignment assignment;
    EXPECT_EQ(assignment.chapterFor({}), "");
    EXPECT_EQ(assignment.chapterFor({"c1", "c2"}), "c2");
}

TEST_F(IngestionOrchestratorTest, PlainTextDocumentEndToEnd) {
    auto path = dir_.write("civil code-1.txt", "Статья 1. Текст один. Статья 2. Текст два.");
    auto summary = orchestrator_->ingest(path);
    ASSERT_TRUE(summary) << summary.error().message;

    EXPECT_EQ(summary.value().lawId, "civil_code_1");
    EXPECT_EQ(summary.value().lawIri, kNs + "civil_code_1");
    EXPECT_EQ(summary.value().articleCount, 2u);
    EXPECT_EQ(summary.value().chapterCount, 0u);

    auto first = store_->getArticle("civil_code_1_article_1");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().text, "Текст один.");
    EXPECT_EQ(first.value().lawIri, kNs + "civil_code_1");
    auto second = store_->getArticle("civil_code_1_article_2");
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().text, "Текст два.");

    auto laws = store_->listLaws();
    ASSERT_TRUE(laws);
    ASSERT_EQ(laws.value().size(), 1u);
    EXPECT_EQ(laws.value()[0].title, "civil code-1");

    // saved by default
    ASSERT_TRUE(std::filesystem::exists(store_->ontology().file));
    auto reopened = graph::KnowledgeStore::open(store_->ontology());
    ASSERT_TRUE(reopened);
    EXPECT_EQ(reopened.value()->countByType("Article"), 2u);
}

TEST_F(IngestionOrchestratorTest, ArticlesGoToTheLastChapter) {
    auto path = dir_.write("law.txt", "Глава 1. Общие\nСтатья 1. Раз.\nГлава 2. Особые\nСтатья 2. Два.");
    auto summary = orchestrator_->ingest(path, {false, false});
    ASSERT_TRUE(summary) << summary.error().message;
    EXPECT_EQ(summary.value().chapterCount, 2u);

    EXPECT_EQ(countRows("SELECT ?a WHERE { law:law_chapter_2 law:containsArticle ?a }"), 2u);
    EXPECT_EQ(countRows("SELECT ?a WHERE { law:law_chapter_1 law:containsArticle ?a }"), 0u);
    EXPECT_EQ(countRows("SELECT ?c WHERE { law:law law:containsChapter ?c }"), 2u);
    EXPECT_FALSE(std::filesystem::exists(store_->ontology().file));
}

TEST_F(IngestionOrchestratorTest, ReferencesLinkEveryArticleToTheTarget) {
    auto path = dir_.write("refs.txt", "Статья 1. Согласно статье 2, стороны действуют. "
                                       "Статья 2. Текст. В силу статьи 55, ничего.");
    auto summary = orchestrator_->ingest(path, {false, false});
    ASSERT_TRUE(summary) << summary.error().message;

    ASSERT_EQ(summary.value().references.size(), 2u);
    EXPECT_EQ(summary.value().referenceEdges, 2u);

    auto target = kNs + "refs_article_2";
    auto fromFirst = store_->getReferencedArticles(kNs + "refs_article_1");
    ASSERT_TRUE(fromFirst);
    EXPECT_EQ(fromFirst.value(), (std::vector<std::string>{target}));
    auto fromSecond = store_->getReferencedArticles(target);
    ASSERT_TRUE(fromSecond);
    EXPECT_EQ(fromSecond.value(), (std::vector<std::string>{target}));
}

TEST_F(IngestionOrchestratorTest, KeyTermsAreLinkedToArticlesUsingThem) {
    auto path = dir_.write("terms.txt", "Статья 1. Договор договор. Статья 2. Прочее.");
    auto summary = orchestrator_->ingest(path, {false, false});
    ASSERT_TRUE(summary) << summary.error().message;

    EXPECT_EQ(summary.value().termCount, 3u);
    EXPECT_EQ(summary.value().termLinks, 2u);
    EXPECT_EQ(store_->countByType("Term"), 3u);
    auto users = store_->query("SELECT ?a WHERE { ?a law:usesTerm law:term_договор }");
    ASSERT_TRUE(users);
    ASSERT_EQ(users.value().size(), 1u);
    EXPECT_EQ(users.value()[0].at("a"), kNs + "terms_article_1");
    EXPECT_EQ(countRows("SELECT ?a WHERE { ?a law:usesTerm law:term_прочее }"), 1u);

    auto rows = store_->searchArticlesByTerm("договор");
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0].at("article_number"), "1");
}

TEST_F(IngestionOrchestratorTest, DuplicateArticleNumbersCollapse) {
    parsing::ParsedDocument doc;
    doc.title = "Дубли";
    doc.articles = {{"1", "первый", 2}, {"1", "повтор", std::nullopt}};
    doc.fullText = "первый повтор";
    auto summary = orchestrator_->ingestParsed("dup", doc, {false, false});
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().articleCount, 1u);
    EXPECT_EQ(store_->countByType("Article"), 1u);
    EXPECT_EQ(store_->getArticle("dup_article_1").value().page, 2);
}

TEST_F(IngestionOrchestratorTest, ReplaceExistingDropsStaleArticles) {
    auto path = dir_.write("law.txt", "Статья 1. А. Статья 2. Б.");
    ASSERT_TRUE(orchestrator_->ingest(path, {false, false}));
    EXPECT_EQ(store_->countByType("Article"), 2u);

    dir_.write("law.txt", "Статья 1. В.");
    ASSERT_TRUE(orchestrator_->ingest(path, {false, false}));
    EXPECT_EQ(store_->countByType("Article"), 2u);

    ASSERT_TRUE(orchestrator_->ingest(path, {true, false}));
    EXPECT_EQ(store_->countByType("Article"), 1u);
    EXPECT_EQ(store_->getArticle("law_article_1").value().text, "В.");
}

TEST_F(IngestionOrchestratorTest, UnsupportedFormatAddsNothing) {
    auto path = dir_.write("contract.docx", "Статья 1. Текст.");
    auto summary = orchestrator_->ingest(path);
    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, ErrorCode::UnsupportedFormat);
    EXPECT_TRUE(store_->graph().empty());
    EXPECT_FALSE(std::filesystem::exists(store_->ontology().file));
}

TEST_F(IngestionOrchestratorTest, EmptyLawIdIsRejected) {
    auto summary = orchestrator_->ingestParsed("", parsing::ParsedDocument{});
    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, ErrorCode::InvalidArgument);
}

TEST_F(IngestionOrchestratorTest, FailedAnalysisOfOneItemDoesNotStopIngestion) {
    nlp::LinguisticAnalyzer analyzer(nlp::AnalyzerOptions{},
                                     std::make_shared<SelectiveFailurePipeline>("Неустойки"),
                                     nullptr);
    IngestionOrchestrator orchestrator(parser_, analyzer, *store_);

    auto doc = leaseDocument("Договор договор подписан.", "Неустойки неустойки взыскиваются.");
    auto summary = orchestrator.ingestParsed("lease", doc, {false, false});
    ASSERT_TRUE(summary) << summary.error().message;

    // structure is complete
    EXPECT_EQ(summary.value().articleCount, 2u);
    EXPECT_EQ(summary.value().chapterCount, 1u);
    EXPECT_EQ(store_->countByType("Article"), 2u);
    EXPECT_EQ(store_->countByType("Chapter"), 1u);
    EXPECT_EQ(countRows("SELECT ?a WHERE { law:lease_chapter_1 law:containsArticle ?a }"), 2u);

    // candidate terms come from the failing analysis and degrade to nothing
    EXPECT_TRUE(summary.value().entities.terms.empty());
    EXPECT_EQ(store_->countByType("Term"), summary.value().termCount);

    const auto& keyTerms = summary.value().keyTerms;
    ASSERT_EQ(keyTerms.size(), 4u);
    EXPECT_EQ(keyTerms[0].term, "договор");
    EXPECT_EQ(keyTerms[1].term, "неустойки");

    // the first article is analyzed normally, the second falls back to plain tokens
    EXPECT_EQ(countRows("SELECT ?a WHERE { ?a law:usesTerm law:term_договор }"), 1u);
    auto users = store_->query("SELECT ?a WHERE { ?a law:usesTerm law:term_неустойки }");
    ASSERT_TRUE(users);
    ASSERT_EQ(users.value().size(), 1u);
    EXPECT_EQ(users.value()[0].at("a"), kNs + "lease_article_2");
    EXPECT_EQ(summary.value().termLinks, 4u);
}

TEST_F(IngestionOrchestratorTest, UnknownWordFormKeepsItsSurfaceForm) {
    nlp::LinguisticAnalyzer analyzer(nlp::AnalyzerOptions{}, nullptr,
                                     std::make_shared<PatchyMorphAnalyzer>());
    IngestionOrchestrator orchestrator(parser_, analyzer, *store_);

    auto doc = leaseDocument("Договора договора.", "Неустойки неустойки.");
    auto summary = orchestrator.ingestParsed("lease", doc, {false, false});
    ASSERT_TRUE(summary) << summary.error().message;

    ASSERT_EQ(summary.value().keyTerms.size(), 2u);
    EXPECT_EQ(summary.value().keyTerms[0].term, "договор");
    EXPECT_EQ(summary.value().keyTerms[0].count, 2u);
    EXPECT_EQ(summary.value().keyTerms[1].term, "неустойки");
    EXPECT_EQ(summary.value().keyTerms[1].count, 2u);
    EXPECT_EQ(store_->countByType("Term"), 2u);

    EXPECT_EQ(countRows("SELECT ?a WHERE { law:lease_article_1 law:usesTerm ?a }"), 1u);
    EXPECT_EQ(countRows("SELECT ?a WHERE { law:lease_article_2 law:usesTerm ?a }"), 1u);
}
