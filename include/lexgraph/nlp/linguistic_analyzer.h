#pragma once

#include <lexgraph/config/lexgraph_config.h>
#include <lexgraph/nlp/linguistic_pipeline.h>
#include <lexgraph/nlp/morph_analyzer.h>
#include <lexgraph/nlp/token_stream.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lexgraph::nlp {

/**
 * @brief Size-safety thresholds, in characters (code points)
 */
struct AnalyzerOptions {
    // Inputs above this never reach the heavy pipeline; samples for it are cut to this size
    std::size_t pipelineSafeMaxChars = 400'000;
    // Key-term counting looks at no more than this many leading characters
    std::size_t keyTermsMaxChars = 1'500'000;
    // Result size of findKeyTerms when the caller gives none
    std::size_t keyTermsTopN = 10;
    bool enablePosTagging = true;
};

struct EntitySet {
    std::vector<std::string> laws;     // law citations and code abbreviations
    std::vector<std::string> articles; // cited article/point numbers
    std::vector<std::string> dates;    // D.M.YYYY, deduplicated, first-seen order
    std::vector<std::string> terms;    // capitalized nouns, deduplicated
};

// Connective that introduced a cross-reference
enum class ReferenceKind { Accordance, According, Virtue, Basis };

// Stable tag stored for a reference kind
const char* referenceKindTag(ReferenceKind kind);

struct ReferenceMatch {
    ReferenceKind kind;
    std::string tag;
    std::string phrase;    // connective as written in the source
    std::string text;      // referenced span, trimmed
    std::size_t position;  // character offset of the connective
};

struct KeyTerm {
    std::string term;
    std::size_t count;
};

/**
 * @brief Tokens, lemmas, entities, references and key terms of legal text.
 *
 * Every operation stays bounded on arbitrarily large input: the pipeline only ever sees
 * text within pipelineSafeMaxChars, everything else goes through the TokenStream path.
 * Capabilities are fixed at construction; either may be null.
 */
class LinguisticAnalyzer {
public:
    LinguisticAnalyzer(AnalyzerOptions options, std::shared_ptr<const ILinguisticPipeline> pipeline,
                       std::shared_ptr<const IMorphAnalyzer> morph);

    // Lazy lower-cased word stream; text must outlive the stream
    TokenStream tokenStream(std::string_view text) const { return TokenStream(text); }

    std::vector<std::string> tokenize(std::string_view text) const;

    std::vector<std::string> lemmatize(std::string_view text) const;

    EntitySet extractEntities(std::string_view text) const;

    /**
     * @brief Cross-reference phrases, grouped by connective in a fixed order and in source
     * order within a group. The span runs to the first '.', ',' or ';' on the same line.
     */
    std::vector<ReferenceMatch> extractReferences(std::string_view text) const;

    /**
     * @brief Most frequent content words, ties in first-seen order
     */
    std::vector<KeyTerm> findKeyTerms(std::string_view text, std::size_t topN) const;
    std::vector<KeyTerm> findKeyTerms(std::string_view text) const {
        return findKeyTerms(text, options_.keyTermsTopN);
    }

    bool hasPipeline() const { return pipeline_ != nullptr; }
    bool hasMorphAnalyzer() const { return morph_ != nullptr; }
    const AnalyzerOptions& options() const { return options_; }

    static bool isStopWord(std::string_view word);

private:
    std::vector<std::string> extractTerms(std::string_view text) const;

    AnalyzerOptions options_;
    std::shared_ptr<const ILinguisticPipeline> pipeline_;
    std::shared_ptr<const IMorphAnalyzer> morph_;
};

/**
 * @brief Build an analyzer from configuration.
 *
 * A lexicon that cannot be loaded is logged and the analyzer runs without morphology.
 */
LinguisticAnalyzer makeLinguisticAnalyzer(const config::NlpConfig& config);

} // namespace lexgraph::nlp
