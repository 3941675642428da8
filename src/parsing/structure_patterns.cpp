#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/parsing/structure_patterns.h>

#include <algorithm>
#include <array>

namespace lexgraph::parsing {

// Header recovery is done with plain string scanning rather than std::regex: the inputs can
// be several megabytes of extracted PDF text and lazy ".*?" bodies overflow the stack.

namespace {

using common::isSpaceChar;
using common::isWordChar;

constexpr std::array<std::wstring_view, 2> kArticleKeywords = {L"статья", L"article"};
constexpr std::array<std::wstring_view, 2> kChapterKeywords = {L"глава", L"chapter"};

struct HeaderMatch {
    std::size_t start = 0;
    std::size_t end = 0;
    std::wstring number;
};

bool isDigit(wchar_t ch) {
    return ch >= L'0' && ch <= L'9';
}

std::size_t skipDigits(const std::wstring& s, std::size_t pos) {
    while (pos < s.size() && isDigit(s[pos])) {
        ++pos;
    }
    return pos;
}

std::size_t skipSpaces(const std::wstring& s, std::size_t pos) {
    while (pos < s.size() && isSpaceChar(s[pos])) {
        ++pos;
    }
    return pos;
}

// keyword \s+ \d+ (\.\d+)?  at pos. With requireBoundary the number must be followed by a
// non-word character, falling back to the integer part when the decimal part is not.
bool matchNumberedHeader(const std::wstring& folded, std::size_t pos, std::size_t keywordLen,
                         bool allowDecimal, bool requireBoundary, HeaderMatch& out) {
    std::size_t p = pos + keywordLen;
    std::size_t afterSpace = skipSpaces(folded, p);
    if (afterSpace == p) {
        return false;
    }
    std::size_t numStart = afterSpace;
    std::size_t intEnd = skipDigits(folded, numStart);
    if (intEnd == numStart) {
        return false;
    }

    auto boundaryOk = [&](std::size_t at) {
        return !requireBoundary || at >= folded.size() || !isWordChar(folded[at]);
    };

    std::size_t numEnd = intEnd;
    if (allowDecimal && intEnd + 1 < folded.size() && folded[intEnd] == L'.' &&
        isDigit(folded[intEnd + 1])) {
        std::size_t decEnd = skipDigits(folded, intEnd + 1);
        if (boundaryOk(decEnd)) {
            numEnd = decEnd;
        } else if (!boundaryOk(intEnd)) {
            return false;
        }
    } else if (!boundaryOk(intEnd)) {
        return false;
    }

    out.start = pos;
    out.end = numEnd;
    out.number = folded.substr(numStart, numEnd - numStart);
    return true;
}

template <std::size_t N>
bool findNextHeader(const std::wstring& folded, std::size_t from,
                    const std::array<std::wstring_view, N>& keywords, bool allowDecimal,
                    HeaderMatch& out) {
    while (from < folded.size()) {
        std::size_t best = std::wstring::npos;
        std::size_t bestLen = 0;
        for (const auto& kw : keywords) {
            std::size_t hit = folded.find(kw, from);
            if (hit < best) {
                best = hit;
                bestLen = kw.size();
            }
        }
        if (best == std::wstring::npos) {
            return false;
        }
        if (matchNumberedHeader(folded, best, bestLen, allowDecimal, false, out)) {
            return true;
        }
        from = best + 1;
    }
    return false;
}

std::wstring trimWide(std::wstring_view s) {
    std::size_t start = 0;
    std::size_t end = s.size();
    while (start < end && isSpaceChar(s[start])) {
        ++start;
    }
    while (end > start && isSpaceChar(s[end - 1])) {
        --end;
    }
    return std::wstring(s.substr(start, end - start));
}

} // namespace

std::vector<ArticleRecord> extractArticles(std::string_view text) {
    std::vector<ArticleRecord> articles;
    if (text.empty()) {
        return articles;
    }

    const std::wstring original = common::toWide(text);
    const std::wstring folded = common::foldCase(original);

    HeaderMatch current;
    if (!findNextHeader(folded, 0, kArticleKeywords, true, current)) {
        return articles;
    }

    while (true) {
        std::size_t bodyStart = current.end;
        if (bodyStart < folded.size() && folded[bodyStart] == L'.') {
            ++bodyStart;
        }
        bodyStart = skipSpaces(folded, bodyStart);

        HeaderMatch next;
        bool hasNext = findNextHeader(folded, bodyStart, kArticleKeywords, true, next);
        std::size_t bodyEnd = hasNext ? next.start : folded.size();
        if (bodyEnd < bodyStart) {
            bodyEnd = bodyStart;
        }

        ArticleRecord record;
        record.number = common::toUtf8(current.number);
        record.text = common::toUtf8(
            trimWide(std::wstring_view(original).substr(bodyStart, bodyEnd - bodyStart)));
        articles.push_back(std::move(record));

        if (!hasNext) {
            break;
        }
        current = std::move(next);
    }
    return articles;
}

std::vector<ChapterRecord> extractChapters(std::string_view text) {
    std::vector<ChapterRecord> chapters;
    if (text.empty()) {
        return chapters;
    }

    const std::wstring original = common::toWide(text);
    const std::wstring folded = common::foldCase(original);

    HeaderMatch current;
    if (!findNextHeader(folded, 0, kChapterKeywords, false, current)) {
        return chapters;
    }

    while (true) {
        // \s*[.\-]?\s*
        std::size_t bodyStart = skipSpaces(folded, current.end);
        if (bodyStart < folded.size() && (folded[bodyStart] == L'.' || folded[bodyStart] == L'-')) {
            ++bodyStart;
        }
        bodyStart = skipSpaces(folded, bodyStart);

        HeaderMatch next;
        bool hasNext = findNextHeader(folded, bodyStart, kChapterKeywords, false, next);
        std::size_t bodyEnd = hasNext ? next.start : folded.size();
        if (bodyEnd < bodyStart) {
            bodyEnd = bodyStart;
        }

        std::wstring captured =
            trimWide(std::wstring_view(original).substr(bodyStart, bodyEnd - bodyStart));

        ChapterRecord record;
        record.number = common::toUtf8(current.number);
        record.title = common::toUtf8(std::wstring_view(captured).substr(
            0, std::min(captured.size(), kChapterTitleMaxChars)));
        record.text = common::toUtf8(captured);
        chapters.push_back(std::move(record));

        if (!hasNext) {
            break;
        }
        current = std::move(next);
    }
    return chapters;
}

std::vector<std::string> findLineAnchoredArticleHeaders(std::string_view pageText) {
    std::vector<std::string> numbers;
    if (pageText.empty()) {
        return numbers;
    }

    const std::wstring folded = common::foldCase(common::toWide(pageText));

    std::size_t lineStart = 0;
    std::size_t lastHeader = std::wstring::npos;
    while (lineStart <= folded.size()) {
        std::size_t p = skipSpaces(folded, lineStart);
        for (const auto& kw : kArticleKeywords) {
            if (folded.compare(p, kw.size(), kw) != 0) {
                continue;
            }
            HeaderMatch m;
            // blank lines let "^\s*" reach the same header from several line starts
            if (matchNumberedHeader(folded, p, kw.size(), true, true, m) && m.start != lastHeader) {
                numbers.push_back(common::toUtf8(m.number));
                lastHeader = m.start;
            }
            break;
        }

        std::size_t nl = folded.find(L'\n', lineStart);
        if (nl == std::wstring::npos) {
            break;
        }
        lineStart = nl + 1;
    }
    return numbers;
}

std::map<std::string, int> buildArticlePageMap(const std::vector<std::string>& pageTexts) {
    std::map<std::string, int> pageMap;
    int pageNo = 0;
    for (const auto& text : pageTexts) {
        ++pageNo;
        if (text.empty()) {
            continue;
        }
        for (auto& number : findLineAnchoredArticleHeaders(text)) {
            // first occurrence is the page where the article starts
            pageMap.emplace(std::move(number), pageNo);
        }
    }
    return pageMap;
}

} // namespace lexgraph::parsing
