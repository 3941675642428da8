#pragma once

#include <lexgraph/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lexgraph::nlp {

// Coarse part of speech shared by the pipeline and the morphological analyzer
enum class PartOfSpeech { Noun, Verb, Adjective, Numeral, Punctuation, Other };

const char* partOfSpeechName(PartOfSpeech pos);
std::optional<PartOfSpeech> parsePartOfSpeech(std::string_view name);

/**
 * @brief Morphological analyzer: normal form of a single word form
 */
class IMorphAnalyzer {
public:
    virtual ~IMorphAnalyzer() = default;

    /**
     * @brief Normal form of the first (best) reading of a word
     * @return NotFound when the word has no reading; callers degrade that token only
     */
    virtual Result<std::string> normalForm(std::string_view word) const = 0;

    // Part of speech of the first reading, when the analyzer knows it
    virtual std::optional<PartOfSpeech> partOfSpeech(std::string_view word) const {
        (void)word;
        return std::nullopt;
    }

    virtual std::string name() const = 0;
};

/**
 * @brief Dictionary-backed analyzer.
 *
 * Lexicon format: one `surface<TAB>lemma[<TAB>POS]` entry per line, '#' starts a comment.
 * Lookups are case-insensitive; the first entry for a surface form is its best reading.
 */
class LexiconMorphAnalyzer : public IMorphAnalyzer {
public:
    LexiconMorphAnalyzer() = default;

    static Result<std::unique_ptr<LexiconMorphAnalyzer>> load(const std::filesystem::path& path);

    // Returns false when the surface form already has a reading
    bool addEntry(std::string_view surface, std::string_view lemma,
                  std::optional<PartOfSpeech> pos = std::nullopt);

    Result<std::string> normalForm(std::string_view word) const override;
    std::optional<PartOfSpeech> partOfSpeech(std::string_view word) const override;
    std::string name() const override { return "LexiconMorphAnalyzer"; }

    std::size_t size() const { return entries_.size(); }

private:
    struct Reading {
        std::string lemma;
        std::optional<PartOfSpeech> pos;
    };

    std::unordered_map<std::string, Reading> entries_;
};

} // namespace lexgraph::nlp
