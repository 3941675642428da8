#include <lexgraph/common/utf8_utils.h>

#include <cctype>
#include <cstdint>

namespace lexgraph::common {

namespace {

// Decodes one code point starting at i. Returns the number of bytes consumed, or 0 for an
// invalid sequence.
std::size_t decodeOne(const unsigned char* data, std::size_t i, std::size_t n, char32_t& out) {
    unsigned char c = data[i];
    if (c < 0x80) {
        out = c;
        return 1;
    }
    if (c >= 0xC2 && c <= 0xDF && i + 1 < n) {
        unsigned char c1 = data[i + 1];
        if ((c1 & 0xC0) == 0x80) {
            out = (static_cast<char32_t>(c & 0x1F) << 6) | (c1 & 0x3F);
            return 2;
        }
        return 0;
    }
    if (c >= 0xE0 && c <= 0xEF && i + 2 < n) {
        unsigned char c1 = data[i + 1];
        unsigned char c2 = data[i + 2];
        if ((c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80) {
            char32_t cp = (static_cast<char32_t>(c & 0x0F) << 12) |
                          (static_cast<char32_t>(c1 & 0x3F) << 6) | (c2 & 0x3F);
            // Overlong forms and UTF-16 surrogates are invalid
            if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return 0;
            }
            out = cp;
            return 3;
        }
        return 0;
    }
    if (c >= 0xF0 && c <= 0xF4 && i + 3 < n) {
        unsigned char c1 = data[i + 1];
        unsigned char c2 = data[i + 2];
        unsigned char c3 = data[i + 3];
        if ((c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80 && (c3 & 0xC0) == 0x80) {
            char32_t cp = (static_cast<char32_t>(c & 0x07) << 18) |
                          (static_cast<char32_t>(c1 & 0x3F) << 12) |
                          (static_cast<char32_t>(c2 & 0x3F) << 6) | (c3 & 0x3F);
            if (cp < 0x10000 || cp > 0x10FFFF) {
                return 0;
            }
            out = cp;
            return 4;
        }
        return 0;
    }
    return 0;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const std::size_t n = input.size();
    std::size_t i = 0;
    while (i < n) {
        char32_t cp = 0;
        std::size_t len = decodeOne(data, i, n, cp);
        if (len == 0) {
            out.append(kReplacementChar);
            ++i;
            continue;
        }
        out.append(input.data() + i, len);
        i += len;
    }
    return out;
}

bool isValidUtf8(std::string_view input) {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const std::size_t n = input.size();
    std::size_t i = 0;
    while (i < n) {
        char32_t cp = 0;
        std::size_t len = decodeOne(data, i, n, cp);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

std::size_t decodeCodepoint(std::string_view utf8, std::size_t pos, char32_t& out) {
    std::size_t len =
        decodeOne(reinterpret_cast<const unsigned char*>(utf8.data()), pos, utf8.size(), out);
    if (len == 0) {
        out = 0xFFFD;
        return 1;
    }
    return len;
}

std::wstring toWide(std::string_view utf8) {
    std::wstring out;
    out.reserve(utf8.size());
    const auto* data = reinterpret_cast<const unsigned char*>(utf8.data());
    const std::size_t n = utf8.size();
    std::size_t i = 0;
    while (i < n) {
        char32_t cp = 0;
        std::size_t len = decodeOne(data, i, n, cp);
        if (len == 0) {
            out.push_back(static_cast<wchar_t>(0xFFFD));
            ++i;
            continue;
        }
        out.push_back(static_cast<wchar_t>(cp));
        i += len;
    }
    return out;
}

std::string toUtf8(std::wstring_view wide) {
    std::string out;
    out.reserve(wide.size() * 2);
    for (wchar_t ch : wide) {
        appendUtf8(out, static_cast<char32_t>(ch));
    }
    return out;
}

std::string toUtf8(wchar_t ch) {
    std::string out;
    appendUtf8(out, static_cast<char32_t>(ch));
    return out;
}

wchar_t foldChar(wchar_t ch) {
    if (ch >= L'A' && ch <= L'Z') {
        return ch + 32;
    }
    if (ch < 0x80) {
        return ch;
    }
    if (ch >= 0xC0 && ch <= 0xDE && ch != 0xD7) {
        return ch + 0x20;
    }
    if (ch >= 0x410 && ch <= 0x42F) {
        return ch + 0x20;
    }
    if (ch >= 0x400 && ch <= 0x40F) {
        return ch + 0x50;
    }
    return ch;
}

wchar_t upperChar(wchar_t ch) {
    if (ch >= L'a' && ch <= L'z') {
        return ch - 32;
    }
    if (ch < 0x80) {
        return ch;
    }
    if (ch >= 0xE0 && ch <= 0xFE && ch != 0xF7) {
        return ch - 0x20;
    }
    if (ch >= 0x430 && ch <= 0x44F) {
        return ch - 0x20;
    }
    if (ch >= 0x450 && ch <= 0x45F) {
        return ch - 0x50;
    }
    return ch;
}

std::wstring foldCase(std::wstring_view text) {
    std::wstring out(text);
    for (auto& ch : out) {
        ch = foldChar(ch);
    }
    return out;
}

std::string lowerUtf8(std::string_view text) {
    return toUtf8(foldCase(toWide(text)));
}

std::string upperUtf8(std::string_view text) {
    std::wstring wide = toWide(text);
    for (auto& ch : wide) {
        ch = upperChar(ch);
    }
    return toUtf8(wide);
}

bool isLetter(wchar_t ch) {
    if (ch < 0x80) {
        return std::isalpha(static_cast<unsigned char>(ch)) != 0;
    }
    if (ch >= 0xC0 && ch <= 0x24F) {
        return ch != 0xD7 && ch != 0xF7;
    }
    // Greek, Cyrillic and Cyrillic supplement
    if ((ch >= 0x370 && ch <= 0x3FF) || (ch >= 0x400 && ch <= 0x52F)) {
        return true;
    }
    return false;
}

bool isUpperLetter(wchar_t ch) {
    return isLetter(ch) && foldChar(ch) != ch;
}

bool isWordChar(wchar_t ch) {
    if (ch == L'_') {
        return true;
    }
    if (ch >= L'0' && ch <= L'9') {
        return true;
    }
    return isLetter(ch);
}

bool isSpaceChar(wchar_t ch) {
    return ch == L' ' || ch == L'\t' || ch == L'\n' || ch == L'\r' || ch == L'\f' ||
           ch == L'\v' || ch == 0xA0;
}

std::size_t codepointLength(std::string_view utf8) {
    std::size_t count = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string trimCopy(std::string_view input) {
    std::size_t start = 0;
    std::size_t end = input.size();
    while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

std::string collapseWhitespace(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    bool inSpace = false;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            if (!inSpace) {
                out.push_back(' ');
                inSpace = true;
            }
        } else {
            out.push_back(static_cast<char>(c));
            inSpace = false;
        }
    }
    return out;
}

} // namespace lexgraph::common
