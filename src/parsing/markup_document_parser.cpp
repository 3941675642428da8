#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/parsing/markup_document_parser.h>
#include <lexgraph/parsing/source_reader.h>

#include <spdlog/spdlog.h>

namespace lexgraph::parsing {

namespace {

bool classMatches(const MarkupNode& node, std::string_view a, std::string_view b) {
    const std::string* cls = node.attribute("class");
    if (!cls || cls->empty()) {
        return false;
    }
    std::string lower = common::lowerUtf8(*cls);
    return lower.find(a) != std::string::npos || lower.find(b) != std::string::npos;
}

std::string elementNumber(const MarkupNode& node) {
    if (const auto* number = node.attribute("number"); number && !number->empty()) {
        return *number;
    }
    if (const auto* id = node.attribute("id")) {
        return *id;
    }
    return {};
}

} // namespace

bool MarkupDocumentParser::isChapterElement(const MarkupNode& node) {
    return node.name == "chapter" || node.name == "глава" ||
           classMatches(node, "chapter", "глава");
}

bool MarkupDocumentParser::isArticleElement(const MarkupNode& node) {
    return node.name == "article" || node.name == "статья" ||
           classMatches(node, "article", "статья");
}

Result<ParsedDocument> MarkupDocumentParser::parse(const std::filesystem::path& path) {
    auto content = readSourceFile(path);
    if (!content) {
        return content.error();
    }
    spdlog::debug("Parsing markup document {} ({} bytes)", path.string(), content.value().size());
    return parseMarkup(content.value(), path.stem().string());
}

ParsedDocument MarkupDocumentParser::parseMarkup(std::string_view markup,
                                                 const std::string& fallbackTitle) {
    ParsedDocument doc;
    auto tree = MarkupTree::parse(markup);
    const auto& root = tree.root();

    const auto* titleNode =
        root.findFirst([](const MarkupNode& n) { return n.name == "title"; });
    std::string title =
        titleNode ? common::trimCopy(common::collapseWhitespace(titleNode->textContent())) : "";
    doc.title = title.empty() ? fallbackTitle : title;

    for (const auto* node : root.findAll(isChapterElement)) {
        ChapterRecord chapter;
        chapter.number = elementNumber(*node);
        const auto* heading = node->findFirst([](const MarkupNode& n) {
            return n.name == "title" || n.name == "h2" || n.name == "h3";
        });
        if (heading) {
            chapter.title = common::trimCopy(heading->textContent());
        }
        chapter.text = common::trimCopy(node->textContent());
        doc.chapters.push_back(std::move(chapter));
    }

    for (const auto* node : root.findAll(isArticleElement)) {
        ArticleRecord article;
        article.number = elementNumber(*node);
        article.text = common::trimCopy(node->textContent());
        doc.articles.push_back(std::move(article));
    }

    doc.fullText = root.textContent();
    return doc;
}

} // namespace lexgraph::parsing
