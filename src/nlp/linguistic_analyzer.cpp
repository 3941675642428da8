#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <regex>
#include <unordered_map>
#include <unordered_set>
#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/nlp/linguistic_analyzer.h>

namespace lexgraph::nlp {

namespace {

// Leading part of text holding at most maxChars code points
std::string_view prefixChars(std::string_view text, std::size_t maxChars) {
    if (text.size() <= maxChars) {
        return text;
    }
    std::size_t pos = 0;
    std::size_t chars = 0;
    while (pos < text.size() && chars < maxChars) {
        char32_t cp = 0;
        pos += common::decodeCodepoint(text, pos, cp);
        ++chars;
    }
    return text.substr(0, pos);
}

bool exceedsChars(std::string_view text, std::size_t maxChars) {
    return prefixChars(text, maxChars).size() < text.size();
}

struct EntityPattern {
    std::wregex regex;
    int group;
};

// Patterns run on case-folded text, so they are written in lower case
const std::vector<EntityPattern>& lawPatterns() {
    static const std::vector<EntityPattern> patterns = {
        {std::wregex(LR"((?:федеральный\s+)?закон\s+(?:от\s+)?(?:\d+\.\d+\.\d+)?\s*№\s*(\d+[-фз]*))"), 0},
        {std::wregex(LR"((?:гк|ук|тк|нк)\s+рф)"), 0},
        {std::wregex(LR"(конституция\s+рф)"), 0},
        {std::wregex(LR"((?:federal\s+)?law\s+(?:of\s+)?(?:\d+\.\d+\.\d+)?\s*(?:№|no\.)\s*(\d+[-a-z]*))"), 0},
    };
    return patterns;
}

const std::vector<EntityPattern>& articlePatterns() {
    static const std::vector<EntityPattern> patterns = {
        {std::wregex(LR"(статья\s+(\d+(?:\.\d+)?))"), 1},
        {std::wregex(LR"(ст\.\s*(\d+(?:\.\d+)?))"), 1},
        {std::wregex(LR"(пункт\s+(\d+))"), 1},
        {std::wregex(LR"(article\s+(\d+(?:\.\d+)?))"), 1},
        {std::wregex(LR"(art\.\s*(\d+(?:\.\d+)?))"), 1},
        {std::wregex(LR"(point\s+(\d+))"), 1},
    };
    return patterns;
}

const std::wregex& datePattern() {
    static const std::wregex pattern(LR"(\d{1,2}\.\d{1,2}\.\d{4})");
    return pattern;
}

void collectMatches(const std::wstring& folded, const std::wstring& original,
                    const EntityPattern& pattern, std::vector<std::string>& out) {
    for (std::wsregex_iterator it(folded.begin(), folded.end(), pattern.regex), end; it != end;
         ++it) {
        const auto& m = *it;
        if (!m[pattern.group].matched) {
            continue;
        }
        auto pos = static_cast<std::size_t>(m.position(pattern.group));
        auto len = static_cast<std::size_t>(m.length(pattern.group));
        out.push_back(common::toUtf8(std::wstring_view(original).substr(pos, len)));
    }
}

struct ConnectivePattern {
    ReferenceKind kind;
    std::vector<std::wstring_view> words;
};

const std::vector<ConnectivePattern>& connectivePatterns() {
    static const std::vector<ConnectivePattern> patterns = {
        {ReferenceKind::Accordance, {L"в", L"соответствии", L"с"}},
        {ReferenceKind::Accordance, {L"in", L"accordance", L"with"}},
        {ReferenceKind::According, {L"согласно"}},
        {ReferenceKind::According, {L"according", L"to"}},
        {ReferenceKind::Virtue, {L"в", L"силу"}},
        {ReferenceKind::Virtue, {L"by", L"virtue", L"of"}},
        {ReferenceKind::Basis, {L"на", L"основании"}},
        {ReferenceKind::Basis, {L"on", L"the", L"basis", L"of"}},
    };
    return patterns;
}

std::size_t skipSpaces(std::wstring_view text, std::size_t pos) {
    while (pos < text.size() && common::isSpaceChar(text[pos])) {
        ++pos;
    }
    return pos;
}

// Connective words separated by whitespace, starting exactly at pos. Returns the end of the
// last word.
std::optional<std::size_t> matchConnective(std::wstring_view text, std::size_t pos,
                                           const ConnectivePattern& pattern) {
    for (std::size_t w = 0; w < pattern.words.size(); ++w) {
        if (w > 0) {
            std::size_t after = skipSpaces(text, pos);
            if (after == pos) {
                return std::nullopt;
            }
            pos = after;
        }
        const auto& word = pattern.words[w];
        if (text.compare(pos, word.size(), word) != 0) {
            return std::nullopt;
        }
        pos += word.size();
    }
    return pos;
}

struct SpanMatch {
    std::size_t spanEnd;
    std::size_t matchEnd;
};

// Shortest non-empty span from start, within one line, closed by '.', ',', ';' or the end of
// the text (a single trailing newline allowed).
std::optional<SpanMatch> matchSpan(std::wstring_view text, std::size_t start) {
    const std::size_t n = text.size();
    if (start >= n || text[start] == L'\n') {
        return std::nullopt;
    }
    for (std::size_t k = start + 1;; ++k) {
        if (k == n) {
            return SpanMatch{k, k};
        }
        wchar_t c = text[k];
        if (c == L'.' || c == L',' || c == L';') {
            return SpanMatch{k, k + 1};
        }
        if (c == L'\n') {
            if (k == n - 1) {
                return SpanMatch{k, k};
            }
            return std::nullopt;
        }
    }
}

std::wstring_view trimWide(std::wstring_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && common::isSpaceChar(s[b])) {
        ++b;
    }
    while (e > b && common::isSpaceChar(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words = {
        "и", "в", "на", "с", "по", "для", "от", "к", "из", "о", "а", "как", "что", "это"};
    return words;
}

bool isCountable(std::string_view word) {
    return common::codepointLength(word) > 3 && !LinguisticAnalyzer::isStopWord(word);
}

} // namespace

const char* referenceKindTag(ReferenceKind kind) {
    switch (kind) {
        case ReferenceKind::Accordance: return "соответствие";
        case ReferenceKind::According: return "согласно";
        case ReferenceKind::Virtue: return "сила";
        case ReferenceKind::Basis: return "основание";
    }
    return "";
}

LinguisticAnalyzer::LinguisticAnalyzer(AnalyzerOptions options,
                                       std::shared_ptr<const ILinguisticPipeline> pipeline,
                                       std::shared_ptr<const IMorphAnalyzer> morph)
    : options_(options), pipeline_(std::move(pipeline)), morph_(std::move(morph)) {}

bool LinguisticAnalyzer::isStopWord(std::string_view word) {
    return stopWords().count(std::string(word)) > 0;
}

std::vector<std::string> LinguisticAnalyzer::tokenize(std::string_view text) const {
    if (text.empty()) {
        return {};
    }
    if (!pipeline_ || exceedsChars(text, options_.pipelineSafeMaxChars)) {
        if (pipeline_) {
            spdlog::debug("Input of {} bytes exceeds the pipeline limit, using word tokenizer",
                          text.size());
        }
        return TokenStream(text).collect();
    }
    return pipeline_->tokenize(text);
}

std::vector<std::string> LinguisticAnalyzer::lemmatize(std::string_view text) const {
    if (text.empty()) {
        return {};
    }
    if (morph_) {
        auto tokens = tokenize(text);
        std::vector<std::string> lemmas;
        lemmas.reserve(tokens.size());
        for (const auto& token : tokens) {
            auto lemma = morph_->normalForm(token);
            lemmas.push_back(lemma ? lemma.value() : common::lowerUtf8(token));
        }
        return lemmas;
    }
    if (pipeline_) {
        auto sample = prefixChars(text, options_.pipelineSafeMaxChars);
        auto analyzed = pipeline_->analyze(sample);
        if (analyzed) {
            std::vector<std::string> lemmas;
            lemmas.reserve(analyzed.value().size());
            for (auto& token : analyzed.value()) {
                lemmas.push_back(std::move(token.lemma));
            }
            return lemmas;
        }
        spdlog::warn("Pipeline lemmatization failed, returning tokens: {}",
                     analyzed.error().message);
    }
    return TokenStream(text).collect();
}

EntitySet LinguisticAnalyzer::extractEntities(std::string_view text) const {
    EntitySet entities;
    if (text.empty()) {
        return entities;
    }

    const std::wstring original = common::toWide(text);
    const std::wstring folded = common::foldCase(original);

    for (const auto& pattern : lawPatterns()) {
        collectMatches(folded, original, pattern, entities.laws);
    }
    for (const auto& pattern : articlePatterns()) {
        collectMatches(folded, original, pattern, entities.articles);
    }

    std::vector<std::string> dates;
    collectMatches(folded, original, {datePattern(), 0}, dates);
    std::unordered_set<std::string> seen;
    for (auto& date : dates) {
        if (seen.insert(date).second) {
            entities.dates.push_back(std::move(date));
        }
    }

    if (pipeline_ && options_.enablePosTagging) {
        entities.terms = extractTerms(text);
    }
    return entities;
}

std::vector<std::string> LinguisticAnalyzer::extractTerms(std::string_view text) const {
    auto sample = prefixChars(text, options_.pipelineSafeMaxChars);
    std::vector<std::string> terms;
    try {
        auto analyzed = pipeline_->analyze(sample);
        if (!analyzed) {
            spdlog::warn("Term extraction skipped: {}", analyzed.error().message);
            return {};
        }
        std::unordered_set<std::string> seen;
        for (const auto& token : analyzed.value()) {
            if (token.pos == PartOfSpeech::Noun && token.isTitle && seen.insert(token.text).second) {
                terms.push_back(token.text);
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Term extraction failed: {}", e.what());
        return {};
    }
    return terms;
}

std::vector<ReferenceMatch> LinguisticAnalyzer::extractReferences(std::string_view text) const {
    std::vector<ReferenceMatch> references;
    if (text.empty()) {
        return references;
    }

    const std::wstring original = common::toWide(text);
    const std::wstring folded = common::foldCase(original);
    const std::wstring_view view(folded);

    for (const auto& pattern : connectivePatterns()) {
        const auto& first = pattern.words.front();
        std::size_t from = 0;
        while (from < view.size()) {
            std::size_t start = view.find(first, from);
            if (start == std::wstring_view::npos) {
                break;
            }
            auto wordsEnd = matchConnective(view, start, pattern);
            std::optional<SpanMatch> span;
            std::size_t spanStart = 0;
            if (wordsEnd) {
                std::size_t wsEnd = skipSpaces(view, *wordsEnd);
                // Greedy whitespace first, then give characters back to the span
                for (std::size_t s = wsEnd; s > *wordsEnd; --s) {
                    span = matchSpan(view, s);
                    if (span) {
                        spanStart = s;
                        break;
                    }
                }
            }
            if (!span) {
                from = start + 1;
                continue;
            }

            std::wstring_view originalView(original);
            ReferenceMatch ref;
            ref.kind = pattern.kind;
            ref.tag = referenceKindTag(pattern.kind);
            ref.phrase = common::toUtf8(trimWide(originalView.substr(start, spanStart - start)));
            ref.text =
                common::toUtf8(trimWide(originalView.substr(spanStart, span->spanEnd - spanStart)));
            ref.position = start;
            references.push_back(std::move(ref));
            from = span->matchEnd;
        }
    }
    return references;
}

std::vector<KeyTerm> LinguisticAnalyzer::findKeyTerms(std::string_view text,
                                                      std::size_t topN) const {
    if (text.empty()) {
        return {};
    }

    auto sample = prefixChars(text, options_.keyTermsMaxChars);
    if (sample.size() < text.size()) {
        spdlog::info("Key terms: counting the first {} characters of {} bytes",
                     options_.keyTermsMaxChars, text.size());
    }

    std::vector<KeyTerm> counts;
    std::unordered_map<std::string, std::size_t> index;
    TokenStream stream(sample);
    WordToken token;
    while (stream.next(token)) {
        if (!isCountable(token.text)) {
            continue;
        }
        std::string term = token.text;
        if (morph_) {
            auto lemma = morph_->normalForm(token.text);
            if (lemma) {
                term = lemma.value();
            }
            if (!isCountable(term)) {
                continue;
            }
        }
        auto [it, inserted] = index.try_emplace(term, counts.size());
        if (inserted) {
            counts.push_back({std::move(term), 1});
        } else {
            ++counts[it->second].count;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const KeyTerm& a, const KeyTerm& b) { return a.count > b.count; });
    if (counts.size() > topN) {
        counts.resize(topN);
    }
    return counts;
}

LinguisticAnalyzer makeLinguisticAnalyzer(const config::NlpConfig& config) {
    AnalyzerOptions options;
    options.pipelineSafeMaxChars = config.pipelineSafeMaxChars;
    options.keyTermsMaxChars = config.keyTermsMaxChars;
    options.keyTermsTopN = config.keyTermsTopN;
    options.enablePosTagging = config.enablePosTagging;

    std::shared_ptr<const IMorphAnalyzer> morph;
    if (!config.lexiconPath.empty()) {
        auto loaded = LexiconMorphAnalyzer::load(config.lexiconPath);
        if (loaded) {
            morph = std::shared_ptr<const IMorphAnalyzer>(std::move(loaded).value());
        } else {
            spdlog::warn("Morphological analyzer unavailable: {}", loaded.error().message);
        }
    }

    std::shared_ptr<const ILinguisticPipeline> pipeline;
    if (config.enablePipeline) {
        pipeline = std::make_shared<RuleBasedPipeline>(morph);
    }

    spdlog::debug("Linguistic analyzer: pipeline={}, morphology={}",
                  pipeline ? pipeline->name() : std::string("none"),
                  morph ? morph->name() : std::string("none"));
    return LinguisticAnalyzer(options, std::move(pipeline), std::move(morph));
}

} // namespace lexgraph::nlp
