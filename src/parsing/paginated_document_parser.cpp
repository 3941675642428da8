#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/parsing/paginated_document_parser.h>
#include <lexgraph/parsing/structure_patterns.h>

#include <spdlog/spdlog.h>

namespace lexgraph::parsing {

PaginatedDocumentParser::PaginatedDocumentParser(PageSourceOpener opener)
    : opener_(std::move(opener)) {}

Result<ParsedDocument> PaginatedDocumentParser::parse(const std::filesystem::path& path) {
    if (!opener_) {
        return Error{ErrorCode::DependencyUnavailable, "No page source configured for " +
                                                           path.string()};
    }
    auto opened = opener_(path);
    if (!opened) {
        return opened.error();
    }
    auto source = std::move(opened).value();

    auto count = source->pageCount();
    if (!count) {
        return count.error();
    }

    std::vector<std::string> pageTexts;
    pageTexts.reserve(count.value());
    for (std::size_t i = 0; i < count.value(); ++i) {
        auto text = source->pageText(i);
        if (!text) {
            // One unreadable page leaves a gap rather than failing the document
            spdlog::warn("Failed to extract text from page {} of {}: {}", i + 1, path.string(),
                         text.error().message);
            pageTexts.emplace_back();
            continue;
        }
        pageTexts.push_back(common::sanitizeUtf8(text.value()));
    }

    auto doc = parsePages(pageTexts, path.stem().string());
    spdlog::info("Parsed {}: {} pages, {} articles", path.filename().string(), doc.pageCount,
                 doc.articles.size());
    return doc;
}

ParsedDocument PaginatedDocumentParser::parsePages(const std::vector<std::string>& pageTexts,
                                                   const std::string& title) {
    ParsedDocument doc;
    doc.title = title;
    doc.pageCount = pageTexts.size();

    std::size_t total = 0;
    for (const auto& t : pageTexts) {
        total += t.size() + 1;
    }
    doc.fullText.reserve(total);
    for (std::size_t i = 0; i < pageTexts.size(); ++i) {
        if (i > 0) {
            doc.fullText.push_back('\n');
        }
        doc.fullText += pageTexts[i];
    }

    doc.articles = extractArticles(doc.fullText);

    auto pageMap = buildArticlePageMap(pageTexts);
    for (auto& article : doc.articles) {
        if (article.number.empty()) {
            continue;
        }
        auto it = pageMap.find(article.number);
        if (it != pageMap.end()) {
            article.page = it->second;
        }
    }
    return doc;
}

} // namespace lexgraph::parsing
