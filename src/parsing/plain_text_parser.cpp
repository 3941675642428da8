#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/parsing/plain_text_parser.h>
#include <lexgraph/parsing/source_reader.h>
#include <lexgraph/parsing/structure_patterns.h>

#include <spdlog/spdlog.h>

namespace lexgraph::parsing {

Result<ParsedDocument> PlainTextParser::parse(const std::filesystem::path& path) {
    auto content = readSourceFile(path);
    if (!content) {
        return content.error();
    }
    // Extracted text is frequently not clean UTF-8
    std::string text = common::sanitizeUtf8(content.value());
    auto doc = parseText(text, path.stem().string());
    spdlog::debug("Plain text {}: {} chapters, {} articles", path.string(), doc.chapters.size(),
                  doc.articles.size());
    return doc;
}

ParsedDocument PlainTextParser::parseText(std::string_view text, const std::string& title) {
    ParsedDocument doc;
    doc.title = title;
    doc.chapters = extractChapters(text);
    doc.articles = extractArticles(text);
    doc.fullText = std::string(text);
    return doc;
}

} // namespace lexgraph::parsing
