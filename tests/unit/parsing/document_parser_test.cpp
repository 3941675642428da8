#include <gtest/gtest.h>
#include <lexgraph/parsing/document_parser.h>
#include <lexgraph/parsing/markup_document_parser.h>
#include <lexgraph/parsing/paginated_document_parser.h>
#include <lexgraph/parsing/plain_text_parser.h>

#include "support/fake_page_source.h"
#include "support/temp_dir_scope.hpp"

using namespace lexgraph;
using namespace lexgraph::parsing;
using lexgraph::test_support::FakePageSource;
using lexgraph::test_support::TempDirScope;

namespace {

constexpr const char* kMarkup = R"(<!DOCTYPE html>
<html><head><title> Закон о тестах </title></head>
<body>
  <div class="Chapter main" number="1"><h2>Общие положения</h2>
    <div class="article-body" id="1">Текст &amp; первой статьи</div>
    <article number="2">Вторая статья</article>
  </div>
</body></html>)";

PageSourceOpener fakeOpener(std::vector<std::string> pages) {
    return [pages](const std::filesystem::path&) -> Result<std::unique_ptr<IPageSource>> {
        return std::unique_ptr<IPageSource>(std::make_unique<FakePageSource>(pages));
    };
}

} // namespace

TEST(MarkupDocumentParserTest, FindsElementsByTagAndClass) {
    auto doc = MarkupDocumentParser::parseMarkup(kMarkup, "fallback");
    EXPECT_EQ(doc.title, "Закон о тестах");
    ASSERT_EQ(doc.chapters.size(), 1u);
    EXPECT_EQ(doc.chapters[0].number, "1");
    EXPECT_EQ(doc.chapters[0].title, "Общие положения");
    ASSERT_EQ(doc.articles.size(), 2u);
    EXPECT_EQ(doc.articles[0].number, "1");
    EXPECT_EQ(doc.articles[0].text, "Текст & первой статьи");
    EXPECT_EQ(doc.articles[1].number, "2");
    EXPECT_EQ(doc.articles[1].text, "Вторая статья");
    EXPECT_NE(doc.fullText.find("Вторая статья"), std::string::npos);
}

TEST(MarkupDocumentParserTest, FallsBackToGivenTitle) {
    auto doc = MarkupDocumentParser::parseMarkup("<body><p>нет структуры</p></body>", "law_12");
    EXPECT_EQ(doc.title, "law_12");
    EXPECT_TRUE(doc.chapters.empty());
    EXPECT_TRUE(doc.articles.empty());
}

TEST(PlainTextParserTest, TitleIsFileStem) {
    TempDirScope dir = TempDirScope::unique_under("lexgraph_plain");
    auto path = dir.write("civil code.txt", "Статья 1. Текст один. Статья 2. Текст два.");
    PlainTextParser parser;
    auto doc = parser.parse(path);
    ASSERT_TRUE(doc) << doc.error().message;
    EXPECT_EQ(doc.value().title, "civil code");
    EXPECT_EQ(doc.value().articles.size(), 2u);
    EXPECT_EQ(doc.value().pageCount, 0u);
}

TEST(PlainTextParserTest, EmptyFileIsAValidEmptyDocument) {
    TempDirScope dir = TempDirScope::unique_under("lexgraph_plain");
    auto path = dir.write("empty.txt", "");
    PlainTextParser parser;
    auto doc = parser.parse(path);
    ASSERT_TRUE(doc);
    EXPECT_TRUE(doc.value().articles.empty());
    EXPECT_TRUE(doc.value().chapters.empty());
}

TEST(PaginatedDocumentParserTest, AttachesFirstHeaderPage) {
    PaginatedDocumentParser parser(fakeOpener(test_support::tenPageDocument()));
    auto doc = parser.parse("/virtual/law.pdf");
    ASSERT_TRUE(doc) << doc.error().message;
    EXPECT_EQ(doc.value().pageCount, 10u);
    EXPECT_EQ(doc.value().title, "law");
    ASSERT_EQ(doc.value().articles.size(), 3u);
    EXPECT_EQ(doc.value().articles[0].number, "1");
    EXPECT_EQ(doc.value().articles[0].page, 1);
    EXPECT_EQ(doc.value().articles[1].number, "5");
    EXPECT_EQ(doc.value().articles[1].page, 3);
    EXPECT_EQ(doc.value().articles[2].number, "9");
    EXPECT_EQ(doc.value().articles[2].page, 8);
}

TEST(PaginatedDocumentParserTest, PagesAreJoinedWithNewline) {
    auto doc = PaginatedDocumentParser::parsePages({"первая", "вторая"}, "t");
    EXPECT_EQ(doc.fullText, "первая\nвторая");
    EXPECT_TRUE(doc.articles.empty());
}

TEST(PaginatedDocumentParserTest, UnreadablePageLeavesAGap) {
    PaginatedDocumentParser parser(
        [](const std::filesystem::path&) -> Result<std::unique_ptr<IPageSource>> {
            auto source = std::make_unique<FakePageSource>(test_support::tenPageDocument());
            source->failOnPage(2);
            return std::unique_ptr<IPageSource>(std::move(source));
        });
    auto doc = parser.parse("/virtual/law.pdf");
    ASSERT_TRUE(doc);
    ASSERT_EQ(doc.value().articles.size(), 2u);
    EXPECT_EQ(doc.value().articles[1].number, "9");
}

TEST(PaginatedDocumentParserTest, MissingBackendFailsAtCallTime) {
    PaginatedDocumentParser parser(nullptr);
    auto doc = parser.parse("/virtual/law.pdf");
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, ErrorCode::DependencyUnavailable);
}

#ifndef LEXGRAPH_HAVE_QPDF
TEST(PaginatedDocumentParserTest, BuildWithoutPdfBackendReportsUnavailable) {
    EXPECT_FALSE(pdfSupportAvailable());
    auto opened = openPdfPageSource("/virtual/law.pdf");
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code, ErrorCode::DependencyUnavailable);
}
#endif

TEST(StructuralParserTest, DispatchesByExtensionOnly) {
    StructuralParser parser;
    EXPECT_TRUE(parser.isSupported("XML"));
    EXPECT_TRUE(parser.isSupported(".txt"));
    EXPECT_EQ(parser.supportedExtensions(), (std::vector<std::string>{"html", "pdf", "txt", "xml"}));

    TempDirScope dir = TempDirScope::unique_under("lexgraph_dispatch");
    // Markup content in a .txt file is parsed as plain text
    auto path = dir.write("markup.TXT", "<article number=\"1\">Статья 3. тело</article>");
    auto doc = parser.parse(path);
    ASSERT_TRUE(doc);
    ASSERT_EQ(doc.value().articles.size(), 1u);
    EXPECT_EQ(doc.value().articles[0].number, "3");
}

TEST(StructuralParserTest, UnknownExtensionNamesTheExtension) {
    StructuralParser parser;
    auto doc = parser.parse("/tmp/contract.docx");
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, ErrorCode::UnsupportedFormat);
    EXPECT_NE(doc.error().message.find("docx"), std::string::npos);

    auto none = parser.parse("/tmp/README");
    ASSERT_FALSE(none);
    EXPECT_NE(none.error().message.find("<none>"), std::string::npos);
}

TEST(StructuralParserTest, RegisteredParserReplacesBuiltin) {
    StructuralParser parser;
    parser.registerParser({"pdf"}, []() {
        return std::make_unique<PaginatedDocumentParser>(fakeOpener({"Статья 7. x"}));
    });
    auto doc = parser.parse("/virtual/any.PDF");
    ASSERT_TRUE(doc);
    ASSERT_EQ(doc.value().articles.size(), 1u);
    EXPECT_EQ(doc.value().articles[0].page, 1);
}
