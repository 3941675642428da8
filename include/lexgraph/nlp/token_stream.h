#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lexgraph::nlp {

/**
 * @brief Word token produced by the lightweight tokenizer
 */
struct WordToken {
    std::string text;      // lower-cased
    std::size_t position;  // byte offset in the source
    std::size_t length;    // byte length in the source
};

/**
 * @brief Lazy word-boundary tokenizer.
 *
 * Yields maximal runs of word characters (letters, digits, underscore; Latin and
 * Cyrillic), lower-cased. Only the current token is materialized, so the stream can walk a
 * multi-megabyte text without building anything proportional to it. The viewed text must
 * outlive the stream.
 */
class TokenStream {
public:
    explicit TokenStream(std::string_view text) : text_(text) {}

    /**
     * @brief Advance to the next token
     * @return false at end of input
     */
    bool next(WordToken& token);

    void reset() { pos_ = 0; }

    // Drain the remaining tokens into a vector of lower-cased strings
    std::vector<std::string> collect();

private:
    std::string_view text_;
    std::size_t pos_ = 0;
};

} // namespace lexgraph::nlp
