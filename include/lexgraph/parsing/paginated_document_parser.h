#pragma once

#include <lexgraph/parsing/document_parser.h>
#include <lexgraph/parsing/page_source.h>

namespace lexgraph::parsing {

/**
 * @brief Structural parser for paginated sources (PDF)
 *
 * Pages are joined with '\n' into the full text and articles are recovered with the
 * plain-text pattern. Each page is then scanned on its own for line-anchored article
 * headers, and the first page of every article number is attached to its record.
 */
class PaginatedDocumentParser : public IDocumentParser {
public:
    explicit PaginatedDocumentParser(PageSourceOpener opener = openPdfPageSource);
    ~PaginatedDocumentParser() override = default;

    Result<ParsedDocument> parse(const std::filesystem::path& path) override;

    std::vector<std::string> supportedExtensions() const override { return {"pdf"}; }

    std::string name() const override { return "PaginatedDocumentParser"; }

    /**
     * @brief Build the document from already extracted page texts
     */
    static ParsedDocument parsePages(const std::vector<std::string>& pageTexts,
                                     const std::string& title);

private:
    PageSourceOpener opener_;
};

} // namespace lexgraph::parsing
