#include <gtest/gtest.h>
#include <lexgraph/parsing/structure_patterns.h>

using namespace lexgraph::parsing;

TEST(StructurePatternsTest, ExtractsTwoArticlesFromOneLine) {
    auto articles = extractArticles("Статья 1. Текст один. Статья 2. Текст два.");
    ASSERT_EQ(articles.size(), 2u);
    EXPECT_EQ(articles[0].number, "1");
    EXPECT_EQ(articles[0].text, "Текст один.");
    EXPECT_EQ(articles[1].number, "2");
    EXPECT_EQ(articles[1].text, "Текст два.");
}

TEST(StructurePatternsTest, YieldsOneRecordPerHeaderInSourceOrder) {
    std::string text = "Преамбула закона.\n";
    const std::vector<std::string> numbers = {"3", "1", "12.1", "40", "7"};
    for (const auto& n : numbers) {
        text += "Статья " + n + ". Содержание статьи " + n + ".\n";
    }
    auto articles = extractArticles(text);
    ASSERT_EQ(articles.size(), numbers.size());
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        EXPECT_EQ(articles[i].number, numbers[i]);
        EXPECT_EQ(articles[i].text, "Содержание статьи " + numbers[i] + ".");
    }
}

TEST(StructurePatternsTest, HeadersAreCaseInsensitiveInBothLanguages) {
    auto articles = extractArticles("ARTICLE 4 General\nстатья 5 Особые");
    ASSERT_EQ(articles.size(), 2u);
    EXPECT_EQ(articles[0].number, "4");
    EXPECT_EQ(articles[0].text, "General");
    EXPECT_EQ(articles[1].number, "5");
    EXPECT_EQ(articles[1].text, "Особые");
}

TEST(StructurePatternsTest, TextWithoutHeadersHasNoStructure) {
    EXPECT_TRUE(extractArticles("").empty());
    EXPECT_TRUE(extractArticles("Просто текст без заголовков").empty());
    EXPECT_TRUE(extractChapters("Статья 1. Нет глав").empty());
}

TEST(StructurePatternsTest, ChaptersRunToTheNextChapterAndTruncateTitle) {
    std::string longBody(150, 'x');
    auto chapters = extractChapters("Глава 1. Общие положения\nСтатья 1. Текст\nГлава 2 - " +
                                    longBody);
    ASSERT_EQ(chapters.size(), 2u);
    EXPECT_EQ(chapters[0].number, "1");
    EXPECT_EQ(chapters[0].text, "Общие положения\nСтатья 1. Текст");
    EXPECT_EQ(chapters[0].title, chapters[0].text);
    EXPECT_EQ(chapters[1].number, "2");
    EXPECT_EQ(chapters[1].title.size(), kChapterTitleMaxChars);
    EXPECT_EQ(chapters[1].text, longBody);
}

TEST(StructurePatternsTest, LineAnchoredHeadersSkipInBodyCitations) {
    auto numbers = findLineAnchoredArticleHeaders(
        "Статья 10. Начало\nв соответствии со статья 55 кодекса\n   Article 11 text\n");
    ASSERT_EQ(numbers.size(), 2u);
    EXPECT_EQ(numbers[0], "10");
    EXPECT_EQ(numbers[1], "11");
}

TEST(StructurePatternsTest, PageMapKeepsFirstOccurrence) {
    auto pageMap = buildArticlePageMap({"Статья 1. a\n", "", "Статья 2. b\nСтатья 1. again\n"});
    ASSERT_EQ(pageMap.size(), 2u);
    EXPECT_EQ(pageMap.at("1"), 1);
    EXPECT_EQ(pageMap.at("2"), 3);
}
