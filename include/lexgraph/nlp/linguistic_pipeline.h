#pragma once

#include <lexgraph/core/types.h>
#include <lexgraph/nlp/morph_analyzer.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lexgraph::nlp {

struct PipelineToken {
    std::string text;  // surface form, original case
    std::string lemma; // lower-cased
    PartOfSpeech pos = PartOfSpeech::Other;
    bool isTitle = false;
    std::size_t position = 0; // byte offset
};

/**
 * @brief Heavy linguistic pipeline (tokens with lemma, POS and casing)
 *
 * Cost grows with input size; callers bound the input before handing it over.
 */
class ILinguisticPipeline {
public:
    virtual ~ILinguisticPipeline() = default;

    // Surface tokens only, words and punctuation, original case
    virtual std::vector<std::string> tokenize(std::string_view text) const = 0;

    virtual Result<std::vector<PipelineToken>> analyze(std::string_view text) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Rule-based pipeline: word/punctuation segmentation, lemmas from an optional
 * morphological analyzer (lower-cased surface otherwise) and a suffix-driven POS guess
 * for Russian and English.
 */
class RuleBasedPipeline : public ILinguisticPipeline {
public:
    explicit RuleBasedPipeline(std::shared_ptr<const IMorphAnalyzer> morph = nullptr);

    std::vector<std::string> tokenize(std::string_view text) const override;
    Result<std::vector<PipelineToken>> analyze(std::string_view text) const override;
    std::string name() const override { return "RuleBasedPipeline"; }

    // Suffix heuristic applied to a lower-cased word when no analyzer reading has a POS
    static PartOfSpeech guessPartOfSpeech(std::wstring_view lowerWord);

    // First cased character upper, remaining cased characters lower
    static bool isTitleCase(std::wstring_view word);

private:
    struct Segment {
        std::size_t position;
        std::size_t length;
        bool word;
    };

    static std::vector<Segment> segment(std::string_view text);

    std::shared_ptr<const IMorphAnalyzer> morph_;
};

} // namespace lexgraph::nlp
