#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/nlp/linguistic_pipeline.h>

#include <algorithm>
#include <array>

namespace lexgraph::nlp {

namespace {

bool endsWith(std::wstring_view word, std::wstring_view suffix) {
    return word.size() > suffix.size() &&
           word.compare(word.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <std::size_t N>
bool endsWithAny(std::wstring_view word, const std::array<std::wstring_view, N>& suffixes) {
    return std::any_of(suffixes.begin(), suffixes.end(),
                       [&](std::wstring_view s) { return endsWith(word, s); });
}

// Checked in this order: nominal derivational suffixes win over inflectional endings
constexpr std::array<std::wstring_view, 20> kNounSuffixes = {
    L"ние",  L"тие",  L"ость", L"есть", L"ство", L"тель", L"ция",  L"изм",  L"ник",  L"щик",
    L"tion", L"sion", L"ment", L"ness", L"ship", L"hood", L"ance", L"ence", L"ity",  L"ism"};

constexpr std::array<std::wstring_view, 16> kAdjectiveEndings = {
    L"ый", L"ий", L"ой", L"ая", L"яя", L"ое", L"ее", L"ые",
    L"ых", L"ого", L"его", L"ful", L"ous", L"ive", L"able", L"ible"};

constexpr std::array<std::wstring_view, 10> kVerbEndings = {
    L"ть", L"ться", L"ется", L"ится", L"ает", L"яет", L"ует", L"ing", L"ize", L"ate"};

constexpr std::array<std::wstring_view, 16> kFunctionWords = {
    L"the", L"and", L"for", L"with", L"from", L"that", L"this", L"are",
    L"что", L"это", L"как", L"или", L"при", L"для", L"под", L"над"};

} // namespace

RuleBasedPipeline::RuleBasedPipeline(std::shared_ptr<const IMorphAnalyzer> morph)
    : morph_(std::move(morph)) {}

std::vector<RuleBasedPipeline::Segment> RuleBasedPipeline::segment(std::string_view text) {
    std::vector<Segment> segments;
    std::size_t pos = 0;
    const std::size_t n = text.size();
    while (pos < n) {
        char32_t cp = 0;
        std::size_t len = common::decodeCodepoint(text, pos, cp);
        auto ch = static_cast<wchar_t>(cp);
        if (common::isSpaceChar(ch)) {
            pos += len;
            continue;
        }
        if (!common::isWordChar(ch)) {
            segments.push_back({pos, len, false});
            pos += len;
            continue;
        }
        std::size_t start = pos;
        while (pos < n) {
            len = common::decodeCodepoint(text, pos, cp);
            if (!common::isWordChar(static_cast<wchar_t>(cp))) {
                break;
            }
            pos += len;
        }
        segments.push_back({start, pos - start, true});
    }
    return segments;
}

std::vector<std::string> RuleBasedPipeline::tokenize(std::string_view text) const {
    std::vector<std::string> tokens;
    for (const auto& seg : segment(text)) {
        tokens.emplace_back(text.substr(seg.position, seg.length));
    }
    return tokens;
}

Result<std::vector<PipelineToken>> RuleBasedPipeline::analyze(std::string_view text) const {
    std::vector<PipelineToken> tokens;
    for (const auto& seg : segment(text)) {
        PipelineToken token;
        token.text = std::string(text.substr(seg.position, seg.length));
        token.position = seg.position;

        if (!seg.word) {
            token.lemma = token.text;
            token.pos = PartOfSpeech::Punctuation;
            tokens.push_back(std::move(token));
            continue;
        }

        const std::wstring wide = common::toWide(token.text);
        const std::wstring lower = common::foldCase(wide);
        token.isTitle = isTitleCase(wide);

        std::optional<PartOfSpeech> pos;
        if (morph_) {
            auto lemma = morph_->normalForm(token.text);
            if (lemma) {
                token.lemma = lemma.value();
                pos = morph_->partOfSpeech(token.text);
            }
        }
        if (token.lemma.empty()) {
            token.lemma = common::toUtf8(lower);
        }
        token.pos = pos ? *pos : guessPartOfSpeech(lower);
        tokens.push_back(std::move(token));
    }
    return tokens;
}

PartOfSpeech RuleBasedPipeline::guessPartOfSpeech(std::wstring_view lowerWord) {
    if (lowerWord.empty()) {
        return PartOfSpeech::Other;
    }
    if (std::all_of(lowerWord.begin(), lowerWord.end(),
                    [](wchar_t c) { return c >= L'0' && c <= L'9'; })) {
        return PartOfSpeech::Numeral;
    }
    if (!std::any_of(lowerWord.begin(), lowerWord.end(), common::isLetter)) {
        return PartOfSpeech::Other;
    }
    if (lowerWord.size() <= 2 ||
        std::find(kFunctionWords.begin(), kFunctionWords.end(), lowerWord) !=
            kFunctionWords.end()) {
        return PartOfSpeech::Other;
    }
    if (endsWithAny(lowerWord, kNounSuffixes)) {
        return PartOfSpeech::Noun;
    }
    if (endsWithAny(lowerWord, kAdjectiveEndings)) {
        return PartOfSpeech::Adjective;
    }
    if (endsWithAny(lowerWord, kVerbEndings)) {
        return PartOfSpeech::Verb;
    }
    return PartOfSpeech::Noun;
}

bool RuleBasedPipeline::isTitleCase(std::wstring_view word) {
    bool seenCased = false;
    for (wchar_t ch : word) {
        bool upper = common::isUpperLetter(ch);
        bool lower = common::isLetter(ch) && common::upperChar(ch) != ch;
        if (!upper && !lower) {
            continue;
        }
        if (!seenCased) {
            if (!upper) {
                return false;
            }
            seenCased = true;
        } else if (upper) {
            return false;
        }
    }
    return seenCased;
}

} // namespace lexgraph::nlp
