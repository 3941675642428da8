#pragma once

#include <string>
#include <string_view>

namespace lexgraph::common {

// Replacement used for invalid byte sequences (U+FFFD).
inline constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// Replace invalid UTF-8 byte sequences with U+FFFD (lossy decode).
std::string sanitizeUtf8(std::string_view input);

// True if the buffer is valid UTF-8.
bool isValidUtf8(std::string_view input);

// Decode the code point at pos. Returns the bytes consumed (at least 1); an invalid
// sequence yields U+FFFD and consumes one byte.
std::size_t decodeCodepoint(std::string_view utf8, std::size_t pos, char32_t& out);

// UTF-8 <-> wide conversion. Invalid sequences decode to U+FFFD.
std::wstring toWide(std::string_view utf8);
std::string toUtf8(std::wstring_view wide);
std::string toUtf8(wchar_t ch);

// Simple case mapping for ASCII, Latin-1 and Cyrillic. Length preserving, so offsets
// into the folded string are valid offsets into the original.
wchar_t foldChar(wchar_t ch);
wchar_t upperChar(wchar_t ch);
std::wstring foldCase(std::wstring_view text);
std::string lowerUtf8(std::string_view text);
std::string upperUtf8(std::string_view text);

// Token character class: letters, digits and underscore.
bool isWordChar(wchar_t ch);
bool isLetter(wchar_t ch);
bool isUpperLetter(wchar_t ch);
bool isSpaceChar(wchar_t ch);

// Number of code points in a UTF-8 string.
std::size_t codepointLength(std::string_view utf8);

// Trim and whitespace helpers (ASCII whitespace only)
std::string trimCopy(std::string_view input);
std::string collapseWhitespace(std::string_view input);

} // namespace lexgraph::common
