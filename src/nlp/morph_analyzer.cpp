#include <spdlog/spdlog.h>
#include <fstream>
#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/nlp/morph_analyzer.h>

namespace lexgraph::nlp {

const char* partOfSpeechName(PartOfSpeech pos) {
    switch (pos) {
        case PartOfSpeech::Noun: return "NOUN";
        case PartOfSpeech::Verb: return "VERB";
        case PartOfSpeech::Adjective: return "ADJ";
        case PartOfSpeech::Numeral: return "NUM";
        case PartOfSpeech::Punctuation: return "PUNCT";
        case PartOfSpeech::Other: return "X";
    }
    return "X";
}

std::optional<PartOfSpeech> parsePartOfSpeech(std::string_view name) {
    const std::string upper = common::upperUtf8(common::trimCopy(name));
    if (upper == "NOUN" || upper == "PROPN") {
        return PartOfSpeech::Noun;
    }
    if (upper == "VERB" || upper == "INFN") {
        return PartOfSpeech::Verb;
    }
    if (upper == "ADJ" || upper == "ADJF" || upper == "ADJS") {
        return PartOfSpeech::Adjective;
    }
    if (upper == "NUM" || upper == "NUMR") {
        return PartOfSpeech::Numeral;
    }
    if (upper == "PUNCT") {
        return PartOfSpeech::Punctuation;
    }
    if (upper == "X" || upper == "OTHER") {
        return PartOfSpeech::Other;
    }
    return std::nullopt;
}

Result<std::unique_ptr<LexiconMorphAnalyzer>>
LexiconMorphAnalyzer::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open lexicon: " + path.string()};
    }

    auto analyzer = std::make_unique<LexiconMorphAnalyzer>();
    std::string line;
    std::size_t lineNo = 0;
    std::size_t skipped = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto tab1 = line.find('\t');
        if (tab1 == std::string::npos) {
            ++skipped;
            spdlog::debug("Lexicon {}:{}: missing lemma column", path.string(), lineNo);
            continue;
        }
        auto tab2 = line.find('\t', tab1 + 1);
        std::string_view view(line);
        auto surface = view.substr(0, tab1);
        auto lemma = tab2 == std::string::npos ? view.substr(tab1 + 1)
                                               : view.substr(tab1 + 1, tab2 - tab1 - 1);
        std::optional<PartOfSpeech> pos;
        if (tab2 != std::string::npos) {
            pos = parsePartOfSpeech(view.substr(tab2 + 1));
        }
        if (common::trimCopy(surface).empty() || common::trimCopy(lemma).empty()) {
            ++skipped;
            continue;
        }
        analyzer->addEntry(surface, lemma, pos);
    }

    if (skipped > 0) {
        spdlog::warn("Lexicon {}: skipped {} malformed lines", path.string(), skipped);
    }
    spdlog::info("Loaded lexicon {} ({} entries)", path.string(), analyzer->size());
    return analyzer;
}

bool LexiconMorphAnalyzer::addEntry(std::string_view surface, std::string_view lemma,
                                    std::optional<PartOfSpeech> pos) {
    auto key = common::lowerUtf8(common::trimCopy(surface));
    auto [it, inserted] =
        entries_.try_emplace(std::move(key), Reading{common::lowerUtf8(common::trimCopy(lemma)), pos});
    (void)it;
    return inserted;
}

Result<std::string> LexiconMorphAnalyzer::normalForm(std::string_view word) const {
    auto it = entries_.find(common::lowerUtf8(word));
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound, "No reading for '" + std::string(word) + "'"};
    }
    return it->second.lemma;
}

std::optional<PartOfSpeech> LexiconMorphAnalyzer::partOfSpeech(std::string_view word) const {
    auto it = entries_.find(common::lowerUtf8(word));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.pos;
}

} // namespace lexgraph::nlp
