#include <gtest/gtest.h>
#include <lexgraph/graph/knowledge_store.h>

#include <fstream>
#include <iterator>

#include "support/temp_dir_scope.hpp"

using namespace lexgraph;
using namespace lexgraph::graph;
using lexgraph::test_support::TempDirScope;

namespace {

const std::string kNs = "http://law.test/#";

class KnowledgeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ontology_.file = dir_.path() / "ontology.owl";
        ontology_.ns = kNs;
        store_ = std::make_unique<KnowledgeStore>(ontology_);
    }

    // law_1 with two articles, the first defining "договор"
    void populate() {
        lawIri_ = store_->addLaw("law_1", "Гражданский кодекс", "2020-01-01");
        auto chapter = store_->addChapter("law_1_chapter_1", lawIri_, "1", "Общие положения");
        a1_ = store_->addArticle("law_1_article_1", chapter, "1",
                                 "Договор заключается в письменной форме.", lawIri_, 3);
        a2_ = store_->addArticle("law_1_article_2", chapter, "2",
                                 "Сторона обязана исполнить\n   обязательство.", lawIri_);
        auto term = store_->addTerm("term_договор", "Договор");
        store_->linkTermToArticle(a1_, term, true);
        store_->addReference(a2_, a1_);
    }

    TempDirScope dir_ = TempDirScope::unique_under("lexgraph_store");
    config::OntologyConfig ontology_;
    std::unique_ptr<KnowledgeStore> store_;
    std::string lawIri_;
    std::string a1_;
    std::string a2_;
};

} // namespace

TEST(KnowledgeStoreIdsTest, IdentifiersAreDeterministic) {
    EXPECT_EQ(makeLawId("/docs/civil code-2020.txt"), "civil_code_2020");
    EXPECT_EQ(chapterId("law_1", "2"), "law_1_chapter_2");
    EXPECT_EQ(articleId("law_1", "12.1"), "law_1_article_12.1");
    EXPECT_EQ(termIdFor("  Правовой   Акт "), "term_правовой_акт");
    EXPECT_EQ(termIdFor("правовой акт"), termIdFor("ПРАВОВОЙ АКТ"));
}

TEST_F(KnowledgeStoreTest, AddedArticleIsQueryableByNumber) {
    auto lawIri = store_->addLaw("law_1", "Закон");
    store_->addArticle("law_1_article_1", "", "1", "Текст", lawIri);

    auto rows = store_->query(
        R"(SELECT ?text WHERE { ?a a law:Article ; law:hasNumber "1" ; law:hasText ?text . })");
    ASSERT_TRUE(rows) << rows.error().message;
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0].at("text"), "Текст");
}

TEST_F(KnowledgeStoreTest, AddsAreIdempotent) {
    populate();
    const auto size = store_->graph().size();
    populate();
    EXPECT_EQ(store_->graph().size(), size);
    EXPECT_EQ(store_->countByType("Article"), 2u);
    EXPECT_EQ(store_->countByType("Chapter"), 1u);
    EXPECT_EQ(store_->countByType("Term"), 1u);
}

TEST_F(KnowledgeStoreTest, LiteralsAreCleaned) {
    store_->addArticle("law_1_article_9", "", "9", "a\x01" "b\x7f\xFF");
    auto article = store_->getArticle("law_1_article_9");
    ASSERT_TRUE(article);
    EXPECT_EQ(article.value().text, "ab\x7f\xEF\xBF\xBD");
}

TEST_F(KnowledgeStoreTest, SearchFindsArticlesThroughTerms) {
    populate();
    auto rows = store_->searchArticlesByTerm("ДОГОВОР");
    ASSERT_TRUE(rows) << rows.error().message;
    ASSERT_EQ(rows.value().size(), 1u);
    const auto& row = rows.value()[0];
    EXPECT_EQ(row.at("article"), a1_);
    EXPECT_EQ(row.at("article_number"), "1");
    EXPECT_EQ(row.at("article_text"), "Договор заключается в письменной форме.");
    EXPECT_EQ(row.at("law"), lawIri_);
    EXPECT_EQ(row.at("law_title"), "Гражданский кодекс");
}

TEST_F(KnowledgeStoreTest, SearchFallsBackToArticleText) {
    populate();
    auto rows = store_->searchArticlesByTerm("письменной форме");
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0].at("article"), a1_);
}

TEST_F(KnowledgeStoreTest, MultiWordSearchToleratesWhitespaceRuns) {
    populate();
    auto rows = store_->searchArticlesByTerm("Исполнить обязательство");
    ASSERT_TRUE(rows) << rows.error().message;
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0].at("article"), a2_);

    auto none = store_->searchArticlesByTerm("отсутствует");
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}

TEST_F(KnowledgeStoreTest, SearchTreatsQueryTextLiterally) {
    populate();
    auto rows = store_->searchArticlesByTerm(R"(форме" . } #)");
    ASSERT_TRUE(rows) << rows.error().message;
    EXPECT_TRUE(rows.value().empty());

    auto regexChars = store_->searchArticlesByTerm("форме (.*)");
    ASSERT_TRUE(regexChars) << regexChars.error().message;
    EXPECT_TRUE(regexChars.value().empty());
}

TEST_F(KnowledgeStoreTest, SearchTextTierIsLimited) {
    KnowledgeStore limited(ontology_, 2);
    for (int i = 0; i < 5; ++i) {
        limited.addArticle("law_x_article_" + std::to_string(i), "", std::to_string(i),
                           "общий текст");
    }
    auto rows = limited.searchArticlesByTerm("общий");
    ASSERT_TRUE(rows);
    EXPECT_EQ(rows.value().size(), 2u);
}

TEST_F(KnowledgeStoreTest, ArticleLookups) {
    populate();
    auto byNumber = store_->getArticleByNumber("law_1", "2");
    ASSERT_TRUE(byNumber);
    EXPECT_EQ(byNumber.value(), a2_);

    auto missing = store_->getArticleByNumber("law_1", "99");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing.value().has_value());

    auto refs = store_->getReferencedArticles(a2_);
    ASSERT_TRUE(refs);
    EXPECT_EQ(refs.value(), (std::vector<std::string>{a1_}));

    auto article = store_->getArticle("law_1_article_1");
    ASSERT_TRUE(article);
    EXPECT_EQ(article.value().number, "1");
    EXPECT_EQ(article.value().page, 3);
    EXPECT_EQ(article.value().lawIri, lawIri_);

    auto absent = store_->getArticle("law_1_article_99");
    ASSERT_FALSE(absent);
    EXPECT_EQ(absent.error().code, ErrorCode::NotFound);
}

TEST_F(KnowledgeStoreTest, ListLawsIsOrderedByIri) {
    store_->addLaw("law_b", "Второй");
    store_->addLaw("law_a", "Первый", "2001-02-03");
    auto laws = store_->listLaws();
    ASSERT_TRUE(laws);
    ASSERT_EQ(laws.value().size(), 2u);
    EXPECT_EQ(laws.value()[0].iri, kNs + "law_a");
    EXPECT_EQ(laws.value()[0].title, "Первый");
    EXPECT_EQ(laws.value()[0].date, "2001-02-03");
    EXPECT_FALSE(laws.value()[1].date.has_value());
}

TEST_F(KnowledgeStoreTest, ClearDocumentKeepsOtherLawsAndTerms) {
    populate();
    auto otherLaw = store_->addLaw("law_2", "Другой закон");
    auto other = store_->addArticle("law_2_article_1", "", "1", "Договор", otherLaw);
    store_->addReference(other, a1_);

    auto removed = store_->clearDocument("law_1");
    EXPECT_GT(removed, 0u);
    EXPECT_EQ(store_->countByType("Article"), 1u);
    EXPECT_EQ(store_->countByType("Chapter"), 0u);
    EXPECT_EQ(store_->countByType("Term"), 1u);
    EXPECT_TRUE(store_->getArticle("law_2_article_1"));
    // edges into the cleared law are gone as well
    auto refs = store_->getReferencedArticles(other);
    ASSERT_TRUE(refs);
    EXPECT_TRUE(refs.value().empty());
}

TEST_F(KnowledgeStoreTest, QueryErrorsCarryTheQueryText) {
    auto rows = store_->query("SELECT ?a WHERE { ?a law:hasNumber }");
    ASSERT_FALSE(rows);
    EXPECT_EQ(rows.error().code, ErrorCode::QueryFailed);
    EXPECT_NE(rows.error().message.find("Query: SELECT ?a"), std::string::npos);
}

TEST_F(KnowledgeStoreTest, RegexEvaluationErrorsCarryTheQueryText) {
    populate();
    const std::string text =
        R"(SELECT ?a WHERE { ?a law:hasText ?t . FILTER(REGEX(?t, "[статья")) })";
    auto rows = store_->query(text);
    ASSERT_FALSE(rows);
    EXPECT_EQ(rows.error().code, ErrorCode::QueryFailed);
    EXPECT_NE(rows.error().message.find("Query: " + text), std::string::npos);
}

TEST_F(KnowledgeStoreTest, SaveAndReopen) {
    populate();
    ASSERT_TRUE(store_->save());
    ASSERT_TRUE(std::filesystem::exists(ontology_.file));

    auto reopened = KnowledgeStore::open(ontology_);
    ASSERT_TRUE(reopened) << reopened.error().message;
    auto& store = *reopened.value();
    ASSERT_TRUE(store.loadReport().has_value());
    EXPECT_FALSE(store.loadReport()->sanitized);
    EXPECT_EQ(store.graph().size(), store_->graph().size());
    EXPECT_EQ(store.getArticle("law_1_article_1").value().page, 3);

    auto rows = store.searchArticlesByTerm("договор");
    ASSERT_TRUE(rows);
    EXPECT_EQ(rows.value().size(), 1u);
}

TEST_F(KnowledgeStoreTest, OpenWithoutFileStartsEmpty) {
    auto opened = KnowledgeStore::open(ontology_);
    ASSERT_TRUE(opened);
    EXPECT_TRUE(opened.value()->graph().empty());
    EXPECT_FALSE(opened.value()->loadReport().has_value());
}

TEST_F(KnowledgeStoreTest, OpenRepairsCorruptFile) {
    populate();
    ASSERT_TRUE(store_->save());
    std::string content;
    {
        std::ifstream in(ontology_.file, std::ios::binary);
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    auto pos = content.find("Гражданский");
    ASSERT_NE(pos, std::string::npos);
    content.insert(pos, std::string(1, '\0') + "&");
    dir_.write("ontology.owl", content);

    auto opened = KnowledgeStore::open(ontology_);
    ASSERT_TRUE(opened) << opened.error().message;
    ASSERT_TRUE(opened.value()->loadReport().has_value());
    EXPECT_TRUE(opened.value()->loadReport()->sanitized);
    EXPECT_EQ(opened.value()->countByType("Article"), 2u);
}
