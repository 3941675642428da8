#pragma once

#include <lexgraph/parsing/document_parser.h>
#include <lexgraph/parsing/markup_tree.h>

#include <string_view>

namespace lexgraph::parsing {

/**
 * @brief Structural parser for XML/HTML legal documents
 *
 * Chapters and articles are located by tag name (chapter/глава, article/статья) or by a
 * case-insensitive class-name match against the same vocabulary, since source markup is
 * authored inconsistently.
 */
class MarkupDocumentParser : public IDocumentParser {
public:
    MarkupDocumentParser() = default;
    ~MarkupDocumentParser() override = default;

    Result<ParsedDocument> parse(const std::filesystem::path& path) override;

    std::vector<std::string> supportedExtensions() const override { return {"xml", "html"}; }

    std::string name() const override { return "MarkupDocumentParser"; }

    /**
     * @brief Parse markup already in memory
     * @param fallbackTitle Used when the document has no title element
     */
    static ParsedDocument parseMarkup(std::string_view markup, const std::string& fallbackTitle);

    static bool isChapterElement(const MarkupNode& node);
    static bool isArticleElement(const MarkupNode& node);
};

} // namespace lexgraph::parsing
