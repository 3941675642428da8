#pragma once

#include <lexgraph/core/types.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lexgraph::parsing {

struct ChapterRecord {
    std::string number; // may be non-numeric or composite
    std::string title;
    std::string text;
};

struct ArticleRecord {
    std::string number; // may carry a sub-decimal, e.g. "12.1"
    std::string text;
    std::optional<int> page; // 1-based, paginated sources only
};

/**
 * @brief Normalized structure of one source document
 */
struct ParsedDocument {
    std::string title;
    std::vector<ChapterRecord> chapters; // source order
    std::vector<ArticleRecord> articles; // source order
    std::string fullText;
    std::size_t pageCount = 0; // 0 for non-paginated sources
};

/**
 * @brief Format-specific structural parser
 */
class IDocumentParser {
public:
    virtual ~IDocumentParser() = default;

    /**
     * @brief Parse a document from disk
     * @param path Path to the document
     * @return Parsed structure; an empty structure is a valid result
     */
    virtual Result<ParsedDocument> parse(const std::filesystem::path& path) = 0;

    /**
     * @brief Extensions handled by this parser, without the leading dot
     */
    virtual std::vector<std::string> supportedExtensions() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Dispatches a document to the parser registered for its extension.
 *
 * The format is selected by extension only; content is never inspected.
 */
class StructuralParser {
public:
    using ParserCreator = std::function<std::unique_ptr<IDocumentParser>()>;

    /**
     * @brief Create a dispatcher with the built-in xml/html/txt/pdf parsers
     */
    StructuralParser();

    /**
     * @brief Parse a document, failing with UnsupportedFormat for unknown extensions
     */
    Result<ParsedDocument> parse(const std::filesystem::path& path) const;

    /**
     * @brief Register (or replace) the parser for a set of extensions
     */
    void registerParser(const std::vector<std::string>& extensions, ParserCreator creator);

    bool isSupported(const std::string& extension) const;

    std::vector<std::string> supportedExtensions() const;

    // Lower-cased extension without the leading dot
    static std::string normalizeExtension(const std::filesystem::path& path);

private:
    std::unordered_map<std::string, ParserCreator> parsers_;
};

} // namespace lexgraph::parsing
