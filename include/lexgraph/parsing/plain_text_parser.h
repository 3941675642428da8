#pragma once

#include <lexgraph/parsing/document_parser.h>

#include <string_view>

namespace lexgraph::parsing {

/**
 * @brief Structural parser for plain text: structure is recovered purely by header patterns
 */
class PlainTextParser : public IDocumentParser {
public:
    PlainTextParser() = default;
    ~PlainTextParser() override = default;

    Result<ParsedDocument> parse(const std::filesystem::path& path) override;

    std::vector<std::string> supportedExtensions() const override { return {"txt"}; }

    std::string name() const override { return "PlainTextParser"; }

    static ParsedDocument parseText(std::string_view text, const std::string& title);
};

} // namespace lexgraph::parsing
