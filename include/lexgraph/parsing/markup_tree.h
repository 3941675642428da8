#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lexgraph::parsing {

/**
 * @brief Node of a tolerant markup tree (element or text)
 */
struct MarkupNode {
    enum class Kind { Element, Text };

    Kind kind = Kind::Element;
    std::string name; // lower-cased tag name; empty for text and the root
    std::vector<std::pair<std::string, std::string>> attributes; // lower-cased names
    std::string text;                                            // text nodes only
    std::vector<std::unique_ptr<MarkupNode>> children;
    MarkupNode* parent = nullptr;

    MarkupNode() = default;
    MarkupNode(const MarkupNode&) = delete;
    MarkupNode& operator=(const MarkupNode&) = delete;
    ~MarkupNode();

    const std::string* attribute(std::string_view attrName) const;

    /**
     * @brief Concatenation of all descendant text, without separators
     */
    std::string textContent() const;

    /**
     * @brief First descendant element (document order) accepted by the predicate
     */
    const MarkupNode* findFirst(const std::function<bool(const MarkupNode&)>& pred) const;

    /**
     * @brief All descendant elements accepted by the predicate, in document order
     */
    std::vector<const MarkupNode*>
    findAll(const std::function<bool(const MarkupNode&)>& pred) const;
};

/**
 * @brief Builds a tree from inconsistently authored HTML/XML.
 *
 * Never fails: unclosed elements are closed at end of input (or where HTML implies the
 * end tag, e.g. a new `<p>` or `<li>`), stray end tags are dropped,
 * comments/doctypes/processing instructions are skipped and script/style bodies are not
 * part of the text. Entities are decoded in text and attribute values.
 */
class MarkupTree {
public:
    static MarkupTree parse(std::string_view markup);

    const MarkupNode& root() const { return *root_; }

    static std::string decodeEntities(std::string_view text);

private:
    MarkupTree();

    std::unique_ptr<MarkupNode> root_;
};

} // namespace lexgraph::parsing
