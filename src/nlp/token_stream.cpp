#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/nlp/token_stream.h>

namespace lexgraph::nlp {

bool TokenStream::next(WordToken& token) {
    const std::size_t n = text_.size();

    // Skip to the first word character
    while (pos_ < n) {
        char32_t cp = 0;
        std::size_t len = common::decodeCodepoint(text_, pos_, cp);
        if (common::isWordChar(static_cast<wchar_t>(cp))) {
            break;
        }
        pos_ += len;
    }
    if (pos_ >= n) {
        return false;
    }

    token.text.clear();
    token.position = pos_;
    while (pos_ < n) {
        char32_t cp = 0;
        std::size_t len = common::decodeCodepoint(text_, pos_, cp);
        auto ch = static_cast<wchar_t>(cp);
        if (!common::isWordChar(ch)) {
            break;
        }
        token.text += common::toUtf8(common::foldChar(ch));
        pos_ += len;
    }
    token.length = pos_ - token.position;
    return true;
}

std::vector<std::string> TokenStream::collect() {
    std::vector<std::string> out;
    WordToken token;
    while (next(token)) {
        out.push_back(std::move(token.text));
    }
    return out;
}

} // namespace lexgraph::nlp
