#include <gtest/gtest.h>
#include <lexgraph/nlp/linguistic_pipeline.h>
#include <lexgraph/nlp/morph_analyzer.h>

#include "support/temp_dir_scope.hpp"

using namespace lexgraph;
using namespace lexgraph::nlp;
using lexgraph::test_support::TempDirScope;

TEST(LexiconMorphAnalyzerTest, LoadsTabSeparatedLexicon) {
    TempDirScope dir = TempDirScope::unique_under("lexgraph_lexicon");
    auto path = dir.write("lexicon.tsv", "# surface\tlemma\tpos\n"
                                         "статьи\tстатья\tNOUN\n"
                                         "статьи\tстатьей\n"
                                         "Законы\tзакон\r\n"
                                         "\n"
                                         "broken line without tab\n");
    auto loaded = LexiconMorphAnalyzer::load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto& morph = *loaded.value();
    EXPECT_EQ(morph.size(), 2u);

    auto lemma = morph.normalForm("СТАТЬИ");
    ASSERT_TRUE(lemma);
    EXPECT_EQ(lemma.value(), "статья");
    EXPECT_EQ(morph.partOfSpeech("статьи"), PartOfSpeech::Noun);

    auto law = morph.normalForm("законы");
    ASSERT_TRUE(law);
    EXPECT_EQ(law.value(), "закон");
    EXPECT_FALSE(morph.partOfSpeech("законы").has_value());
}

TEST(LexiconMorphAnalyzerTest, FirstReadingWins) {
    LexiconMorphAnalyzer morph;
    EXPECT_TRUE(morph.addEntry("стали", "сталь", PartOfSpeech::Noun));
    EXPECT_FALSE(morph.addEntry("стали", "стать", PartOfSpeech::Verb));
    EXPECT_EQ(morph.normalForm("стали").value(), "сталь");
}

TEST(LexiconMorphAnalyzerTest, UnknownWordIsNotFound) {
    LexiconMorphAnalyzer morph;
    auto lemma = morph.normalForm("неизвестное");
    ASSERT_FALSE(lemma);
    EXPECT_EQ(lemma.error().code, ErrorCode::NotFound);
}

TEST(LexiconMorphAnalyzerTest, MissingLexiconFile) {
    auto loaded = LexiconMorphAnalyzer::load("/nonexistent/lexicon.tsv");
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::FileNotFound);
}

TEST(PartOfSpeechTest, ParsesCommonTagSets) {
    EXPECT_EQ(parsePartOfSpeech("PROPN"), PartOfSpeech::Noun);
    EXPECT_EQ(parsePartOfSpeech(" infn "), PartOfSpeech::Verb);
    EXPECT_EQ(parsePartOfSpeech("ADJF"), PartOfSpeech::Adjective);
    EXPECT_FALSE(parsePartOfSpeech("PREP").has_value());
    EXPECT_STREQ(partOfSpeechName(PartOfSpeech::Numeral), "NUM");
}

TEST(RuleBasedPipelineTest, AnalyzeKeepsPunctuationAndCasing) {
    RuleBasedPipeline pipeline;
    auto tokens = pipeline.analyze("Суд принял Решение.");
    ASSERT_TRUE(tokens);
    ASSERT_EQ(tokens.value().size(), 4u);
    EXPECT_EQ(tokens.value()[0].text, "Суд");
    EXPECT_TRUE(tokens.value()[0].isTitle);
    EXPECT_FALSE(tokens.value()[1].isTitle);
    EXPECT_EQ(tokens.value()[2].lemma, "решение");
    EXPECT_EQ(tokens.value()[2].pos, PartOfSpeech::Noun);
    EXPECT_EQ(tokens.value()[3].pos, PartOfSpeech::Punctuation);
}

TEST(RuleBasedPipelineTest, UsesAnalyzerLemmaAndPos) {
    auto morph = std::make_shared<LexiconMorphAnalyzer>();
    morph->addEntry("исполняет", "исполнять", PartOfSpeech::Verb);
    RuleBasedPipeline pipeline(morph);
    auto tokens = pipeline.analyze("Исполняет");
    ASSERT_TRUE(tokens);
    ASSERT_EQ(tokens.value().size(), 1u);
    EXPECT_EQ(tokens.value()[0].lemma, "исполнять");
    EXPECT_EQ(tokens.value()[0].pos, PartOfSpeech::Verb);
}

TEST(RuleBasedPipelineTest, SuffixGuesses) {
    EXPECT_EQ(RuleBasedPipeline::guessPartOfSpeech(L"2024"), PartOfSpeech::Numeral);
    EXPECT_EQ(RuleBasedPipeline::guessPartOfSpeech(L"ответственность"), PartOfSpeech::Noun);
    EXPECT_EQ(RuleBasedPipeline::guessPartOfSpeech(L"правовой"), PartOfSpeech::Adjective);
    EXPECT_EQ(RuleBasedPipeline::guessPartOfSpeech(L"исполнять"), PartOfSpeech::Verb);
    EXPECT_EQ(RuleBasedPipeline::guessPartOfSpeech(L"the"), PartOfSpeech::Other);
}

TEST(RuleBasedPipelineTest, TitleCase) {
    EXPECT_TRUE(RuleBasedPipeline::isTitleCase(L"Закон"));
    EXPECT_TRUE(RuleBasedPipeline::isTitleCase(L"Court"));
    EXPECT_FALSE(RuleBasedPipeline::isTitleCase(L"ЗАКОН"));
    EXPECT_FALSE(RuleBasedPipeline::isTitleCase(L"закон"));
    EXPECT_FALSE(RuleBasedPipeline::isTitleCase(L"123"));
}
