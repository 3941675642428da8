#pragma once

#include <lexgraph/parsing/document_parser.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace lexgraph::parsing {

// Chapter titles recovered from plain text are cut to this many characters.
inline constexpr std::size_t kChapterTitleMaxChars = 100;

/**
 * Recover articles from plain text. A header is "Статья N" / "Article N" (N optionally
 * decimal, case-insensitive); the body runs from after the header (an optional '.' and
 * whitespace skipped) to the next article header or the end of text, trimmed.
 * Matches are greedy and non-overlapping, in source order.
 */
std::vector<ArticleRecord> extractArticles(std::string_view text);

/**
 * Recover chapters from plain text ("Глава N" / "Chapter N"). The captured text runs to the
 * next chapter header only; article headers do not end a chapter. The title is the trimmed
 * capture cut to kChapterTitleMaxChars.
 */
std::vector<ChapterRecord> extractChapters(std::string_view text);

/**
 * Article numbers whose header starts a line of the page (leading whitespace allowed).
 * In-body citations such as "per article 55" are not headers and are skipped.
 */
std::vector<std::string> findLineAnchoredArticleHeaders(std::string_view pageText);

/**
 * Map article number -> 1-based page of the first line-anchored header occurrence.
 */
std::map<std::string, int> buildArticlePageMap(const std::vector<std::string>& pageTexts);

} // namespace lexgraph::parsing
