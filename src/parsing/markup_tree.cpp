#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/parsing/markup_tree.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>
#include <vector>

namespace lexgraph::parsing {

namespace {

constexpr std::array<std::string_view, 14> kVoidElements = {
    "area", "base", "br",   "col",   "embed",  "hr",    "img",
    "input", "link", "meta", "param", "source", "track", "wbr"};

// Helper for case-insensitive find
size_t find_caseless(std::string_view haystack, std::string_view needle, size_t offset = 0) {
    if (offset > haystack.size()) {
        return std::string_view::npos;
    }
    auto it = std::search(
        haystack.begin() + offset, haystack.end(), needle.begin(), needle.end(),
        [](unsigned char c1, unsigned char c2) { return std::tolower(c1) == std::tolower(c2); });
    if (it == haystack.end()) {
        return std::string_view::npos;
    }
    return static_cast<size_t>(std::distance(haystack.begin(), it));
}

bool isNameStart(unsigned char c) {
    // ASCII letters or any non-ASCII lead byte (Cyrillic tag names occur in the wild)
    return std::isalpha(c) || c >= 0x80;
}

bool isNameEnd(char c) {
    return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

void collectText(const MarkupNode& node, std::string& out) {
    std::vector<const MarkupNode*> stack{&node};
    while (!stack.empty()) {
        const MarkupNode* n = stack.back();
        stack.pop_back();
        if (n->kind == MarkupNode::Kind::Text) {
            out += n->text;
            continue;
        }
        for (auto it = n->children.rbegin(); it != n->children.rend(); ++it) {
            stack.push_back(it->get());
        }
    }
}

// Pre-order walk over descendant elements; stops when visit returns false
template <typename Visit> void walkElements(const MarkupNode& node, Visit&& visit) {
    std::vector<const MarkupNode*> stack;
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
        stack.push_back(it->get());
    }
    while (!stack.empty()) {
        const MarkupNode* n = stack.back();
        stack.pop_back();
        if (n->kind != MarkupNode::Kind::Element) {
            continue;
        }
        if (!visit(*n)) {
            return;
        }
        for (auto it = n->children.rbegin(); it != n->children.rend(); ++it) {
            stack.push_back(it->get());
        }
    }
}

void collectAll(const MarkupNode& node, const std::function<bool(const MarkupNode&)>& pred,
                std::vector<const MarkupNode*>& out) {
    walkElements(node, [&](const MarkupNode& n) {
        if (pred(n)) {
            out.push_back(&n);
        }
        return true;
    });
}

const MarkupNode* findFirstIn(const MarkupNode& node,
                              const std::function<bool(const MarkupNode&)>& pred) {
    const MarkupNode* found = nullptr;
    walkElements(node, [&](const MarkupNode& n) {
        if (pred(n)) {
            found = &n;
            return false;
        }
        return true;
    });
    return found;
}

bool isOneOf(std::string_view name, const std::vector<std::string_view>& names) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// HTML implied end tags: opening `name` closes an open element from `closes`, provided
// no element from `scope` lies between it and the insertion point.
struct ImpliedEnd {
    std::vector<std::string_view> openers;
    std::vector<std::string_view> closes;
    std::vector<std::string_view> scope;
};

const std::array<ImpliedEnd, 6>& impliedEndRules() {
    static const std::array<ImpliedEnd, 6> rules = {{
        {{"li"}, {"li"}, {"ul", "ol", "menu"}},
        {{"dt", "dd"}, {"dt", "dd"}, {"dl"}},
        {{"tr"}, {"tr"}, {"table", "thead", "tbody", "tfoot"}},
        {{"td", "th"}, {"td", "th"}, {"tr", "table"}},
        {{"option"}, {"option"}, {"select", "datalist", "optgroup"}},
        {{"p", "div", "h1", "h2", "h3", "h4", "h5", "h6", "ul", "ol", "dl", "table", "pre",
          "blockquote", "li", "dt", "dd", "section", "article", "form", "hr"},
         {"p"},
         {"table", "td", "th", "caption", "button", "object", "template", "html"}},
    }};
    return rules;
}

class TreeBuilder {
public:
    TreeBuilder(std::string_view src, MarkupNode& root) : src_(src), current_(&root) {}

    void run() {
        size_t pos = 0;
        size_t textStart = 0;
        while (pos < src_.size()) {
            if (src_[pos] != '<') {
                ++pos;
                continue;
            }
            size_t next = handleMarkup(pos, textStart);
            if (next == pos) {
                // Not markup, a literal '<'
                ++pos;
                continue;
            }
            pos = next;
            textStart = next;
        }
        flushText(textStart, src_.size());
    }

private:
    // Returns the position after the construct, or pos if src_[pos] is a literal '<'.
    size_t handleMarkup(size_t pos, size_t textStart) {
        if (src_.compare(pos, 4, "<!--") == 0) {
            flushText(textStart, pos);
            size_t end = src_.find("-->", pos + 4);
            return end == std::string_view::npos ? src_.size() : end + 3;
        }
        if (pos + 1 < src_.size() && (src_[pos + 1] == '!' || src_[pos + 1] == '?')) {
            flushText(textStart, pos);
            if (src_.compare(pos, 9, "<![CDATA[") == 0) {
                size_t end = src_.find("]]>", pos + 9);
                size_t stop = end == std::string_view::npos ? src_.size() : end;
                appendText(std::string(src_.substr(pos + 9, stop - pos - 9)));
                return end == std::string_view::npos ? src_.size() : end + 3;
            }
            size_t end = src_.find('>', pos + 2);
            return end == std::string_view::npos ? src_.size() : end + 1;
        }
        if (pos + 1 < src_.size() && src_[pos + 1] == '/') {
            if (pos + 2 >= src_.size() ||
                !isNameStart(static_cast<unsigned char>(src_[pos + 2]))) {
                return pos;
            }
            flushText(textStart, pos);
            return handleEndTag(pos);
        }
        if (pos + 1 < src_.size() && isNameStart(static_cast<unsigned char>(src_[pos + 1]))) {
            flushText(textStart, pos);
            return handleStartTag(pos);
        }
        return pos;
    }

    size_t handleEndTag(size_t pos) {
        size_t nameStart = pos + 2;
        size_t nameEnd = nameStart;
        while (nameEnd < src_.size() && !isNameEnd(src_[nameEnd])) {
            ++nameEnd;
        }
        std::string name = common::lowerUtf8(src_.substr(nameStart, nameEnd - nameStart));
        size_t gt = src_.find('>', nameEnd);
        size_t next = gt == std::string_view::npos ? src_.size() : gt + 1;

        // Close up to the nearest open element with this name; stray end tags are dropped
        if (isOpen(name)) {
            for (MarkupNode* n = current_; n && n->parent; n = n->parent) {
                if (n->name == name) {
                    closeThrough(n);
                    break;
                }
            }
        }
        return next;
    }

    size_t handleStartTag(size_t pos) {
        size_t p = pos + 1;
        size_t nameEnd = p;
        while (nameEnd < src_.size() && !isNameEnd(src_[nameEnd])) {
            ++nameEnd;
        }

        auto node = std::make_unique<MarkupNode>();
        node->kind = MarkupNode::Kind::Element;
        node->name = common::lowerUtf8(src_.substr(p, nameEnd - p));

        bool selfClosing = false;
        p = nameEnd;
        while (p < src_.size()) {
            while (p < src_.size() && std::isspace(static_cast<unsigned char>(src_[p]))) {
                ++p;
            }
            if (p >= src_.size()) {
                break;
            }
            if (src_[p] == '>') {
                ++p;
                break;
            }
            if (src_[p] == '/') {
                selfClosing = true;
                ++p;
                continue;
            }
            p = parseAttribute(p, *node);
        }

        closeImpliedElements(node->name);
        node->parent = current_;
        MarkupNode* raw = node.get();
        current_->children.push_back(std::move(node));

        bool isVoid = std::find(kVoidElements.begin(), kVoidElements.end(), raw->name) !=
                      kVoidElements.end();
        if (raw->name == "script" || raw->name == "style") {
            // Raw text element: body is skipped entirely
            std::string closing = "</" + raw->name;
            size_t end = find_caseless(src_, closing, p);
            if (end == std::string_view::npos) {
                return src_.size();
            }
            size_t gt = src_.find('>', end);
            return gt == std::string_view::npos ? src_.size() : gt + 1;
        }
        if (!selfClosing && !isVoid) {
            current_ = raw;
            ++openCounts_[raw->name];
        }
        return p;
    }

    void closeImpliedElements(const std::string& name) {
        for (const auto& rule : impliedEndRules()) {
            if (!isOneOf(name, rule.openers)) {
                continue;
            }
            bool anyOpen = std::any_of(rule.closes.begin(), rule.closes.end(),
                                       [this](std::string_view c) { return isOpen(c); });
            if (!anyOpen) {
                continue;
            }
            for (MarkupNode* n = current_; n && n->parent; n = n->parent) {
                if (isOneOf(n->name, rule.closes)) {
                    closeThrough(n);
                    break;
                }
                if (isOneOf(n->name, rule.scope)) {
                    break;
                }
            }
        }
    }

    bool isOpen(std::string_view name) const {
        auto it = openCounts_.find(std::string(name));
        return it != openCounts_.end() && it->second > 0;
    }

    // Pops open elements up to and including target
    void closeThrough(MarkupNode* target) {
        while (current_ != target->parent) {
            --openCounts_[current_->name];
            current_ = current_->parent;
        }
    }

    size_t parseAttribute(size_t p, MarkupNode& node) {
        size_t nameStart = p;
        while (p < src_.size() && src_[p] != '=' && src_[p] != '>' && src_[p] != '/' &&
               !std::isspace(static_cast<unsigned char>(src_[p]))) {
            ++p;
        }
        std::string name = common::lowerUtf8(src_.substr(nameStart, p - nameStart));
        while (p < src_.size() && std::isspace(static_cast<unsigned char>(src_[p]))) {
            ++p;
        }
        std::string value;
        if (p < src_.size() && src_[p] == '=') {
            ++p;
            while (p < src_.size() && std::isspace(static_cast<unsigned char>(src_[p]))) {
                ++p;
            }
            if (p < src_.size() && (src_[p] == '"' || src_[p] == '\'')) {
                char quote = src_[p];
                size_t end = src_.find(quote, p + 1);
                if (end == std::string_view::npos) {
                    end = src_.size();
                }
                value = MarkupTree::decodeEntities(src_.substr(p + 1, end - p - 1));
                p = end < src_.size() ? end + 1 : end;
            } else {
                size_t start = p;
                while (p < src_.size() && src_[p] != '>' &&
                       !std::isspace(static_cast<unsigned char>(src_[p]))) {
                    ++p;
                }
                value = MarkupTree::decodeEntities(src_.substr(start, p - start));
            }
        }
        if (!name.empty()) {
            node.attributes.emplace_back(std::move(name), std::move(value));
        } else if (p < src_.size() && src_[p] != '>') {
            ++p; // skip junk such as a stray quote
        }
        return p;
    }

    void flushText(size_t start, size_t end) {
        if (end <= start) {
            return;
        }
        appendText(MarkupTree::decodeEntities(src_.substr(start, end - start)));
    }

    void appendText(std::string text) {
        if (text.empty()) {
            return;
        }
        if (!current_->children.empty() &&
            current_->children.back()->kind == MarkupNode::Kind::Text) {
            current_->children.back()->text += text;
            return;
        }
        auto node = std::make_unique<MarkupNode>();
        node->kind = MarkupNode::Kind::Text;
        node->text = std::move(text);
        node->parent = current_;
        current_->children.push_back(std::move(node));
    }

    std::string_view src_;
    MarkupNode* current_;
    std::unordered_map<std::string, size_t> openCounts_;
};

} // namespace

MarkupNode::~MarkupNode() {
    // Tear down iteratively; degenerate markup can nest arbitrarily deep
    std::vector<std::unique_ptr<MarkupNode>> pending = std::move(children);
    while (!pending.empty()) {
        std::unique_ptr<MarkupNode> node = std::move(pending.back());
        pending.pop_back();
        for (auto& child : node->children) {
            pending.push_back(std::move(child));
        }
        node->children.clear();
    }
}

const std::string* MarkupNode::attribute(std::string_view attrName) const {
    for (const auto& [k, v] : attributes) {
        if (k == attrName) {
            return &v;
        }
    }
    return nullptr;
}

std::string MarkupNode::textContent() const {
    std::string out;
    collectText(*this, out);
    return out;
}

const MarkupNode*
MarkupNode::findFirst(const std::function<bool(const MarkupNode&)>& pred) const {
    return findFirstIn(*this, pred);
}

std::vector<const MarkupNode*>
MarkupNode::findAll(const std::function<bool(const MarkupNode&)>& pred) const {
    std::vector<const MarkupNode*> out;
    collectAll(*this, pred, out);
    return out;
}

MarkupTree::MarkupTree() : root_(std::make_unique<MarkupNode>()) {}

MarkupTree MarkupTree::parse(std::string_view markup) {
    MarkupTree tree;
    TreeBuilder builder(markup, *tree.root_);
    builder.run();
    return tree;
}

std::string MarkupTree::decodeEntities(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    // Common HTML entities
    static const std::vector<std::pair<std::string_view, std::string_view>> entities = {
        {"&amp;", "&"},      {"&lt;", "<"},     {"&gt;", ">"},       {"&quot;", "\""},
        {"&apos;", "'"},     {"&nbsp;", " "},   {"&ndash;", "–"},    {"&mdash;", "—"},
        {"&laquo;", "«"},    {"&raquo;", "»"},  {"&sect;", "§"},     {"&copy;", "©"},
        {"&hellip;", "..."}, {"&bull;", "•"},   {"&ldquo;", "\""},   {"&rdquo;", "\""},
        {"&lsquo;", "'"},    {"&rsquo;", "'"},  {"&numero;", "№"}};

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            result += text[pos];
            pos++;
            continue;
        }

        bool decoded = false;
        for (const auto& [entity, replacement] : entities) {
            if (text.compare(pos, entity.length(), entity) == 0) {
                result += replacement;
                pos += entity.length();
                decoded = true;
                break;
            }
        }
        if (decoded) {
            continue;
        }

        // Numeric entities &#123; and &#x1A;
        if (pos + 2 < text.size() && text[pos + 1] == '#') {
            bool hex = text[pos + 2] == 'x' || text[pos + 2] == 'X';
            size_t digitsStart = pos + (hex ? 3 : 2);
            size_t end = text.find(';', digitsStart);
            if (end != std::string_view::npos && end > digitsStart && end - pos < 12) {
                unsigned long code = 0;
                bool ok = true;
                for (size_t i = digitsStart; i < end && ok; ++i) {
                    unsigned char c = static_cast<unsigned char>(text[i]);
                    if (hex && std::isxdigit(c)) {
                        code = code * 16 + static_cast<unsigned long>(
                                               std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10);
                    } else if (!hex && std::isdigit(c)) {
                        code = code * 10 + (c - '0');
                    } else {
                        ok = false;
                    }
                }
                if (ok && code > 0 && code <= 0x10FFFF) {
                    result += common::toUtf8(static_cast<wchar_t>(code));
                    pos = end + 1;
                    continue;
                }
            }
        }

        // Not a recognized entity, keep the '&'
        result += text[pos];
        pos++;
    }

    return result;
}

} // namespace lexgraph::parsing
