#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <regex>
#include <set>
#include <stdexcept>
#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/graph/graph_query.h>

namespace lexgraph::graph {

namespace {

class QueryParseException : public std::runtime_error {
public:
    QueryParseException(const std::string& message, std::size_t position)
        : std::runtime_error(message), position_(position) {}

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

class QueryEvalException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string upperAscii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool isNameByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c >= 0x80;
}

bool isVariableByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

// ---------------------------------------------------------------------------
// Lexer
// ---------------------------------------------------------------------------

enum class TokenKind { Iri, PrefixedName, Variable, String, Number, LangTag, Word, Punct, End };

struct QueryToken {
    TokenKind kind;
    std::string text;
    std::size_t position;
};

class QueryLexer {
public:
    explicit QueryLexer(std::string_view text) : text_(text) {}

    std::vector<QueryToken> tokenize() {
        std::vector<QueryToken> tokens;
        while (true) {
            skipSpaceAndComments();
            if (pos_ >= text_.size()) {
                tokens.push_back({TokenKind::End, "", pos_});
                return tokens;
            }
            tokens.push_back(nextToken());
        }
    }

private:
    char peek(std::size_t ahead) const {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    void skipSpaceAndComments() {
        while (pos_ < text_.size()) {
            auto c = static_cast<unsigned char>(text_[pos_]);
            if (std::isspace(c)) {
                ++pos_;
            } else if (c == '#') {
                while (pos_ < text_.size() && text_[pos_] != '\n') {
                    ++pos_;
                }
            } else {
                break;
            }
        }
    }

    QueryToken nextToken() {
        const std::size_t start = pos_;
        const char c = text_[pos_];

        if (c == '<') {
            if (peek(1) != '=') {
                if (auto iri = tryIri()) {
                    return {TokenKind::Iri, *iri, start};
                }
                ++pos_;
                return {TokenKind::Punct, "<", start};
            }
            pos_ += 2;
            return {TokenKind::Punct, "<=", start};
        }
        if (c == '?' || c == '$') {
            ++pos_;
            std::size_t b = pos_;
            while (pos_ < text_.size() && isVariableByte(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
            if (pos_ == b) {
                throw QueryParseException("Empty variable name", start);
            }
            return {TokenKind::Variable, std::string(text_.substr(b, pos_ - b)), start};
        }
        if (c == '"' || c == '\'') {
            return {TokenKind::String, readString(c), start};
        }
        if (c == '@') {
            ++pos_;
            std::size_t b = pos_;
            while (pos_ < text_.size() &&
                   (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '-')) {
                ++pos_;
            }
            if (pos_ == b) {
                throw QueryParseException("Empty language tag", start);
            }
            return {TokenKind::LangTag, std::string(text_.substr(b, pos_ - b)), start};
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
            if (peek(0) == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
                ++pos_;
                while (pos_ < text_.size() &&
                       std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                    ++pos_;
                }
            }
            return {TokenKind::Number, std::string(text_.substr(start, pos_ - start)), start};
        }

        static const std::array<std::string_view, 6> twoChar = {"^^", "&&", "||", "!=", ">=", "<="};
        for (auto op : twoChar) {
            if (text_.substr(pos_, 2) == op) {
                pos_ += 2;
                return {TokenKind::Punct, std::string(op), start};
            }
        }
        if (std::string_view("{}().;,*=<>!").find(c) != std::string_view::npos) {
            ++pos_;
            return {TokenKind::Punct, std::string(1, c), start};
        }
        if (isNameByte(static_cast<unsigned char>(c)) || c == ':') {
            return readName(start);
        }
        throw QueryParseException(std::string("Unexpected character '") + c + "'", start);
    }

    std::optional<std::string> tryIri() {
        std::size_t end = pos_ + 1;
        while (end < text_.size()) {
            char ch = text_[end];
            if (ch == '>') {
                std::string iri(text_.substr(pos_ + 1, end - pos_ - 1));
                pos_ = end + 1;
                return iri;
            }
            if (std::isspace(static_cast<unsigned char>(ch)) || ch == '<' || ch == '"') {
                return std::nullopt;
            }
            ++end;
        }
        return std::nullopt;
    }

    std::string readString(char quote) {
        const std::size_t start = pos_;
        ++pos_;
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                throw QueryParseException("Unterminated string literal", start);
            }
            char ch = text_[pos_++];
            if (ch == quote) {
                return out;
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= text_.size()) {
                throw QueryParseException("Unterminated escape sequence", pos_);
            }
            char esc = text_[pos_++];
            switch (esc) {
                case 't': out.push_back('\t'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case '"': out.push_back('"'); break;
                case '\'': out.push_back('\''); break;
                case '\\': out.push_back('\\'); break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) {
                        throw QueryParseException("Truncated \\u escape", pos_);
                    }
                    auto hex = std::string(text_.substr(pos_, 4));
                    pos_ += 4;
                    try {
                        out += common::toUtf8(static_cast<wchar_t>(std::stoul(hex, nullptr, 16)));
                    } catch (const std::exception&) {
                        throw QueryParseException("Invalid \\u escape", pos_ - 4);
                    }
                    break;
                }
                default:
                    throw QueryParseException(std::string("Invalid escape '\\") + esc + "'",
                                              pos_ - 2);
            }
        }
    }

    QueryToken readName(std::size_t start) {
        while (pos_ < text_.size() && isNameByte(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (peek(0) != ':') {
            return {TokenKind::Word, std::string(text_.substr(start, pos_ - start)), start};
        }
        ++pos_;
        while (pos_ < text_.size()) {
            auto ch = static_cast<unsigned char>(text_[pos_]);
            if (isNameByte(ch) || ch == ':') {
                ++pos_;
            } else if (ch == '.' && isNameByte(static_cast<unsigned char>(peek(1)))) {
                ++pos_;
            } else {
                break;
            }
        }
        return {TokenKind::PrefixedName, std::string(text_.substr(start, pos_ - start)), start};
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

// ---------------------------------------------------------------------------
// AST
// ---------------------------------------------------------------------------

struct Value {
    enum class Kind { Error, Term, Boolean, Number };

    Kind kind = Kind::Error;
    RdfTerm term;
    bool boolean = false;
    double number = 0.0;

    static Value error() { return Value{}; }
    static Value ofTerm(RdfTerm t) {
        Value v;
        v.kind = Kind::Term;
        v.term = std::move(t);
        return v;
    }
    static Value ofBool(bool b) {
        Value v;
        v.kind = Kind::Boolean;
        v.boolean = b;
        return v;
    }
    static Value ofNumber(double n) {
        Value v;
        v.kind = Kind::Number;
        v.number = n;
        return v;
    }
};

struct TermPattern {
    bool isVariable = false;
    std::string variable;
    RdfTerm term;
};

struct TriplePattern {
    TermPattern subject;
    TermPattern predicate;
    TermPattern object;
};

struct Expr {
    enum class Kind { Variable, Constant, Not, And, Or, Compare, Call };

    Kind kind = Kind::Constant;
    std::string name; // variable, operator or upper-cased function name
    Value constant;
    std::vector<Expr> args;
};

struct GroupPattern;

struct PatternElement {
    enum class Kind { Triple, Optional, Union, Group, Filter };

    Kind kind = Kind::Triple;
    TriplePattern triple;
    std::vector<GroupPattern> groups;
    Expr filter;
};

struct GroupPattern {
    std::vector<PatternElement> elements;
};

struct OrderKey {
    std::string variable;
    bool descending = false;
};

struct ParsedQuery {
    std::vector<std::string> variables;
    bool selectAll = false;
    bool distinct = false;
    std::vector<std::string> patternVariables; // first-appearance order, for SELECT *
    GroupPattern where;
    std::vector<OrderKey> order;
    std::optional<std::size_t> limit;
    std::size_t offset = 0;
};

// name -> {min args, max args}
const std::map<std::string, std::pair<std::size_t, std::size_t>>& functionArity() {
    static const std::map<std::string, std::pair<std::size_t, std::size_t>> arity = {
        {"BOUND", {1, 1}},     {"STR", {1, 1}},       {"LCASE", {1, 1}},
        {"UCASE", {1, 1}},     {"LANG", {1, 1}},      {"STRLEN", {1, 1}},
        {"CONTAINS", {2, 2}},  {"STRSTARTS", {2, 2}}, {"STRENDS", {2, 2}},
        {"REGEX", {2, 3}},
    };
    return arity;
}

bool isNumericDatatype(const std::string& datatype) {
    static const std::set<std::string> numeric = {
        std::string(vocab::kXsd) + "integer", std::string(vocab::kXsd) + "int",
        std::string(vocab::kXsd) + "long",    std::string(vocab::kXsd) + "decimal",
        std::string(vocab::kXsd) + "double",  std::string(vocab::kXsd) + "float"};
    return numeric.count(datatype) > 0;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

class QueryParser {
public:
    QueryParser(std::vector<QueryToken> tokens, PrefixMap prefixes)
        : tokens_(std::move(tokens)), prefixes_(std::move(prefixes)) {}

    ParsedQuery parseQuery() {
        ParsedQuery query;
        while (isKeyword("PREFIX")) {
            advance();
            const auto& name = current();
            if (name.kind != TokenKind::PrefixedName || name.text.back() != ':') {
                throwError("Expected prefix name");
            }
            std::string prefix = name.text.substr(0, name.text.size() - 1);
            advance();
            if (current().kind != TokenKind::Iri) {
                throwError("Expected IRI for prefix '" + prefix + "'");
            }
            prefixes_[prefix] = current().text;
            advance();
        }

        expectKeyword("SELECT");
        if (isKeyword("DISTINCT") || isKeyword("REDUCED")) {
            query.distinct = isKeyword("DISTINCT");
            advance();
        }
        if (isPunct("*")) {
            query.selectAll = true;
            advance();
        } else {
            while (current().kind == TokenKind::Variable) {
                query.variables.push_back(current().text);
                advance();
            }
            if (query.variables.empty()) {
                throwError("Expected projection variables or '*'");
            }
        }

        if (isKeyword("WHERE")) {
            advance();
        }
        query.where = parseGroup();

        while (current().kind != TokenKind::End) {
            if (isKeyword("ORDER")) {
                advance();
                expectKeyword("BY");
                parseOrderKeys(query.order);
            } else if (isKeyword("LIMIT")) {
                advance();
                query.limit = parseCount();
            } else if (isKeyword("OFFSET")) {
                advance();
                query.offset = parseCount();
            } else {
                throwError("Unexpected token '" + current().text + "'");
            }
        }

        query.patternVariables = std::move(seenVariables_);
        if (query.selectAll) {
            query.variables = query.patternVariables;
        }
        return query;
    }

private:
    const QueryToken& current() const { return tokens_[std::min(index_, tokens_.size() - 1)]; }

    void advance() {
        if (index_ < tokens_.size() - 1) {
            ++index_;
        }
    }

    bool isPunct(std::string_view p) const {
        return current().kind == TokenKind::Punct && current().text == p;
    }

    bool isKeyword(std::string_view keyword) const {
        return current().kind == TokenKind::Word && upperAscii(current().text) == keyword;
    }

    void expectPunct(std::string_view p) {
        if (!isPunct(p)) {
            throwError("Expected '" + std::string(p) + "'");
        }
        advance();
    }

    void expectKeyword(std::string_view keyword) {
        if (!isKeyword(keyword)) {
            throwError("Expected " + std::string(keyword));
        }
        advance();
    }

    [[noreturn]] void throwError(const std::string& message) const {
        throw QueryParseException(message, current().position);
    }

    std::size_t parseCount() {
        if (current().kind != TokenKind::Number ||
            current().text.find('.') != std::string::npos) {
            throwError("Expected a non-negative integer");
        }
        std::size_t value = std::stoul(current().text);
        advance();
        return value;
    }

    void parseOrderKeys(std::vector<OrderKey>& keys) {
        while (true) {
            OrderKey key;
            if (isKeyword("ASC") || isKeyword("DESC")) {
                key.descending = isKeyword("DESC");
                advance();
                expectPunct("(");
                if (current().kind != TokenKind::Variable) {
                    throwError("Expected variable in ORDER BY");
                }
                key.variable = current().text;
                advance();
                expectPunct(")");
            } else if (current().kind == TokenKind::Variable) {
                key.variable = current().text;
                advance();
            } else {
                break;
            }
            keys.push_back(std::move(key));
        }
        if (keys.empty()) {
            throwError("Expected ORDER BY key");
        }
    }

    GroupPattern parseGroup() {
        expectPunct("{");
        GroupPattern group;
        while (!isPunct("}")) {
            if (current().kind == TokenKind::End) {
                throwError("Unterminated group pattern");
            }
            if (isPunct(".")) {
                advance();
                continue;
            }
            PatternElement element;
            if (isKeyword("OPTIONAL")) {
                advance();
                element.kind = PatternElement::Kind::Optional;
                element.groups.push_back(parseGroup());
            } else if (isKeyword("FILTER")) {
                advance();
                element.kind = PatternElement::Kind::Filter;
                element.filter = parseConstraint();
            } else if (isPunct("{")) {
                element.groups.push_back(parseGroup());
                element.kind = PatternElement::Kind::Group;
                while (isKeyword("UNION")) {
                    advance();
                    element.kind = PatternElement::Kind::Union;
                    element.groups.push_back(parseGroup());
                }
            } else {
                parseTriplesSameSubject(group);
                continue;
            }
            group.elements.push_back(std::move(element));
        }
        advance();
        return group;
    }

    void parseTriplesSameSubject(GroupPattern& group) {
        TermPattern subject = parseTerm();
        while (true) {
            TermPattern predicate = parseVerb();
            while (true) {
                PatternElement element;
                element.kind = PatternElement::Kind::Triple;
                element.triple = {subject, predicate, parseTerm()};
                group.elements.push_back(std::move(element));
                if (!isPunct(",")) {
                    break;
                }
                advance();
            }
            if (!isPunct(";")) {
                break;
            }
            while (isPunct(";")) {
                advance();
            }
            if (isPunct(".") || isPunct("}")) {
                break;
            }
        }
        if (isPunct(".")) {
            advance();
        }
    }

    TermPattern parseVerb() {
        if (current().kind == TokenKind::Word && current().text == "a") {
            advance();
            TermPattern tp;
            tp.term = RdfTerm::iri(vocab::rdfType());
            return tp;
        }
        return parseTerm();
    }

    std::string resolvePrefixed(const std::string& pname) const {
        auto colon = pname.find(':');
        auto prefix = pname.substr(0, colon);
        auto it = prefixes_.find(prefix);
        if (it == prefixes_.end()) {
            throwError("Unknown prefix '" + prefix + "'");
        }
        return it->second + pname.substr(colon + 1);
    }

    TermPattern parseTerm() {
        TermPattern tp;
        const auto& tok = current();
        switch (tok.kind) {
            case TokenKind::Variable:
                tp.isVariable = true;
                tp.variable = tok.text;
                noteVariable(tok.text);
                advance();
                return tp;
            case TokenKind::Iri:
                tp.term = RdfTerm::iri(tok.text);
                advance();
                return tp;
            case TokenKind::PrefixedName:
                tp.term = RdfTerm::iri(resolvePrefixed(tok.text));
                advance();
                return tp;
            case TokenKind::String:
            case TokenKind::Number:
                tp.term = parseLiteral();
                return tp;
            case TokenKind::Word:
                if (tok.text == "true" || tok.text == "false") {
                    tp.term = parseLiteral();
                    return tp;
                }
                break;
            default:
                break;
        }
        throwError("Expected term, found '" + tok.text + "'");
    }

    RdfTerm parseLiteral() {
        const auto tok = current();
        advance();
        if (tok.kind == TokenKind::Number) {
            bool decimal = tok.text.find('.') != std::string::npos;
            return RdfTerm::literal(tok.text, {},
                                    std::string(vocab::kXsd) + (decimal ? "decimal" : "integer"));
        }
        if (tok.kind == TokenKind::Word) {
            return RdfTerm::literal(tok.text, {}, std::string(vocab::kXsd) + "boolean");
        }
        if (current().kind == TokenKind::LangTag) {
            auto lang = current().text;
            advance();
            return RdfTerm::literal(tok.text, lang);
        }
        if (isPunct("^^")) {
            advance();
            std::string datatype;
            if (current().kind == TokenKind::Iri) {
                datatype = current().text;
            } else if (current().kind == TokenKind::PrefixedName) {
                datatype = resolvePrefixed(current().text);
            } else {
                throwError("Expected datatype IRI");
            }
            advance();
            return RdfTerm::literal(tok.text, {}, datatype);
        }
        return RdfTerm::literal(tok.text);
    }

    void noteVariable(const std::string& name) {
        if (std::find(seenVariables_.begin(), seenVariables_.end(), name) ==
            seenVariables_.end()) {
            seenVariables_.push_back(name);
        }
    }

    Expr parseConstraint() {
        if (isPunct("(")) {
            advance();
            Expr e = parseOr();
            expectPunct(")");
            return e;
        }
        if (current().kind == TokenKind::Word) {
            return parseCall();
        }
        throwError("Expected FILTER constraint");
    }

    Expr parseOr() {
        Expr left = parseAnd();
        while (isPunct("||")) {
            advance();
            Expr node;
            node.kind = Expr::Kind::Or;
            node.args.push_back(std::move(left));
            node.args.push_back(parseAnd());
            left = std::move(node);
        }
        return left;
    }

    Expr parseAnd() {
        Expr left = parseRelational();
        while (isPunct("&&")) {
            advance();
            Expr node;
            node.kind = Expr::Kind::And;
            node.args.push_back(std::move(left));
            node.args.push_back(parseRelational());
            left = std::move(node);
        }
        return left;
    }

    Expr parseRelational() {
        Expr left = parseUnary();
        for (std::string_view op : {"=", "!=", "<", ">", "<=", ">="}) {
            if (isPunct(op)) {
                advance();
                Expr node;
                node.kind = Expr::Kind::Compare;
                node.name = std::string(op);
                node.args.push_back(std::move(left));
                node.args.push_back(parseUnary());
                return node;
            }
        }
        return left;
    }

    Expr parseUnary() {
        if (isPunct("!")) {
            advance();
            Expr node;
            node.kind = Expr::Kind::Not;
            node.args.push_back(parseUnary());
            return node;
        }
        return parsePrimary();
    }

    Expr parsePrimary() {
        if (isPunct("(")) {
            advance();
            Expr e = parseOr();
            expectPunct(")");
            return e;
        }
        const auto& tok = current();
        Expr e;
        if (tok.kind == TokenKind::Variable) {
            e.kind = Expr::Kind::Variable;
            e.name = tok.text;
            advance();
            return e;
        }
        if (tok.kind == TokenKind::Word && tok.text != "true" && tok.text != "false") {
            return parseCall();
        }
        e.kind = Expr::Kind::Constant;
        if (tok.kind == TokenKind::Number) {
            e.constant = Value::ofNumber(std::stod(tok.text));
            advance();
            return e;
        }
        if (tok.kind == TokenKind::Word) {
            e.constant = Value::ofBool(tok.text == "true");
            advance();
            return e;
        }
        e.constant = Value::ofTerm(parseTerm().term);
        return e;
    }

    Expr parseCall() {
        Expr call;
        call.kind = Expr::Kind::Call;
        call.name = upperAscii(current().text);
        auto it = functionArity().find(call.name);
        if (it == functionArity().end()) {
            throwError("Unsupported function '" + current().text + "'");
        }
        advance();
        expectPunct("(");
        if (!isPunct(")")) {
            call.args.push_back(parseOr());
            while (isPunct(",")) {
                advance();
                call.args.push_back(parseOr());
            }
        }
        expectPunct(")");
        const auto [minArgs, maxArgs] = it->second;
        if (call.args.size() < minArgs || call.args.size() > maxArgs) {
            throwError(call.name + " takes " + std::to_string(minArgs) +
                       (minArgs == maxArgs ? "" : "-" + std::to_string(maxArgs)) + " arguments");
        }
        if (call.name == "BOUND" && call.args[0].kind != Expr::Kind::Variable) {
            throwError("BOUND expects a variable");
        }
        return call;
    }

    std::vector<QueryToken> tokens_;
    std::size_t index_ = 0;
    PrefixMap prefixes_;
    std::vector<std::string> seenVariables_;
};

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

using Binding = std::map<std::string, RdfTerm>;
using Solutions = std::vector<Binding>;

std::optional<double> numericValue(const Value& v) {
    if (v.kind == Value::Kind::Number) {
        return v.number;
    }
    if (v.kind == Value::Kind::Term && v.term.isLiteral() && isNumericDatatype(v.term.datatype)) {
        try {
            return std::stod(v.term.value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> effectiveBoolean(const Value& v) {
    switch (v.kind) {
        case Value::Kind::Error:
            return std::nullopt;
        case Value::Kind::Boolean:
            return v.boolean;
        case Value::Kind::Number:
            return v.number != 0.0;
        case Value::Kind::Term:
            if (v.term.isIri()) {
                return std::nullopt;
            }
            if (v.term.datatype == std::string(vocab::kXsd) + "boolean") {
                return v.term.value == "true" || v.term.value == "1";
            }
            if (auto n = numericValue(v)) {
                return *n != 0.0;
            }
            return !v.term.value.empty();
    }
    return std::nullopt;
}

// Folds letters for case-insensitive matching; escape sequences are kept verbatim
std::wstring foldPattern(const std::wstring& pattern) {
    std::wstring out;
    out.reserve(pattern.size());
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == L'\\' && i + 1 < pattern.size()) {
            out.push_back(pattern[i]);
            out.push_back(pattern[++i]);
            continue;
        }
        out.push_back(common::foldChar(pattern[i]));
    }
    return out;
}

class Evaluator {
public:
    explicit Evaluator(const TripleStore& store) : store_(store) {}

    Solutions evalGroup(const GroupPattern& group, Solutions solutions) {
        std::vector<const Expr*> filters;
        for (const auto& element : group.elements) {
            switch (element.kind) {
                case PatternElement::Kind::Triple:
                    solutions = joinTriple(element.triple, solutions);
                    break;
                case PatternElement::Kind::Optional: {
                    Solutions out;
                    for (const auto& sol : solutions) {
                        auto extended = evalGroup(element.groups.front(), Solutions{sol});
                        if (extended.empty()) {
                            out.push_back(sol);
                        } else {
                            std::move(extended.begin(), extended.end(), std::back_inserter(out));
                        }
                    }
                    solutions = std::move(out);
                    break;
                }
                case PatternElement::Kind::Union: {
                    Solutions out;
                    for (const auto& branch : element.groups) {
                        auto part = evalGroup(branch, solutions);
                        std::move(part.begin(), part.end(), std::back_inserter(out));
                    }
                    solutions = std::move(out);
                    break;
                }
                case PatternElement::Kind::Group:
                    solutions = evalGroup(element.groups.front(), std::move(solutions));
                    break;
                case PatternElement::Kind::Filter:
                    filters.push_back(&element.filter);
                    break;
            }
            if (solutions.empty()) {
                return solutions;
            }
        }

        if (!filters.empty()) {
            solutions.erase(std::remove_if(solutions.begin(), solutions.end(),
                                           [&](const Binding& b) {
                                               for (const auto* f : filters) {
                                                   auto ebv = effectiveBoolean(eval(*f, b));
                                                   if (!ebv || !*ebv) {
                                                       return true;
                                                   }
                                               }
                                               return false;
                                           }),
                            solutions.end());
        }
        return solutions;
    }

private:
    static std::optional<RdfTerm> resolve(const TermPattern& tp, const Binding& b) {
        if (!tp.isVariable) {
            return tp.term;
        }
        auto it = b.find(tp.variable);
        if (it != b.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    Solutions joinTriple(const TriplePattern& pattern, const Solutions& input) {
        Solutions out;
        for (const auto& sol : input) {
            auto matches = store_.match(resolve(pattern.subject, sol),
                                        resolve(pattern.predicate, sol),
                                        resolve(pattern.object, sol));
            for (const Triple* t : matches) {
                Binding next = sol;
                bool consistent = true;
                auto bind = [&](const TermPattern& tp, const RdfTerm& value) {
                    if (!tp.isVariable) {
                        return;
                    }
                    auto [it, inserted] = next.emplace(tp.variable, value);
                    if (!inserted && it->second != value) {
                        consistent = false;
                    }
                };
                bind(pattern.subject, t->subject);
                bind(pattern.predicate, t->predicate);
                bind(pattern.object, t->object);
                if (consistent) {
                    out.push_back(std::move(next));
                }
            }
        }
        return out;
    }

    static const RdfTerm* literalArg(const Value& v) {
        if (v.kind == Value::Kind::Term && v.term.isLiteral()) {
            return &v.term;
        }
        return nullptr;
    }

    Value eval(const Expr& e, const Binding& b) {
        switch (e.kind) {
            case Expr::Kind::Variable: {
                auto it = b.find(e.name);
                return it == b.end() ? Value::error() : Value::ofTerm(it->second);
            }
            case Expr::Kind::Constant:
                return e.constant;
            case Expr::Kind::Not: {
                auto v = effectiveBoolean(eval(e.args[0], b));
                return v ? Value::ofBool(!*v) : Value::error();
            }
            case Expr::Kind::And: {
                auto l = effectiveBoolean(eval(e.args[0], b));
                auto r = effectiveBoolean(eval(e.args[1], b));
                if ((l && !*l) || (r && !*r)) {
                    return Value::ofBool(false);
                }
                return (l && r) ? Value::ofBool(true) : Value::error();
            }
            case Expr::Kind::Or: {
                auto l = effectiveBoolean(eval(e.args[0], b));
                auto r = effectiveBoolean(eval(e.args[1], b));
                if ((l && *l) || (r && *r)) {
                    return Value::ofBool(true);
                }
                return (l && r) ? Value::ofBool(false) : Value::error();
            }
            case Expr::Kind::Compare:
                return compare(e.name, eval(e.args[0], b), eval(e.args[1], b));
            case Expr::Kind::Call:
                return call(e, b);
        }
        return Value::error();
    }

    static Value compare(const std::string& op, const Value& l, const Value& r) {
        if (l.kind == Value::Kind::Error || r.kind == Value::Kind::Error) {
            return Value::error();
        }
        int cmp = 0;
        auto ln = numericValue(l);
        auto rn = numericValue(r);
        if (ln && rn) {
            cmp = *ln < *rn ? -1 : (*ln > *rn ? 1 : 0);
        } else if (l.kind == Value::Kind::Boolean || r.kind == Value::Kind::Boolean) {
            auto lb = effectiveBoolean(l);
            auto rb = effectiveBoolean(r);
            if (!lb || !rb || (op != "=" && op != "!=")) {
                return Value::error();
            }
            cmp = *lb == *rb ? 0 : 1;
        } else if (l.kind == Value::Kind::Term && r.kind == Value::Kind::Term) {
            if (op == "=" || op == "!=") {
                bool equal = l.term.kind == r.term.kind && l.term.value == r.term.value &&
                             l.term.language == r.term.language;
                return Value::ofBool((op == "=") == equal);
            }
            cmp = l.term.value.compare(r.term.value);
        } else {
            return Value::error();
        }

        if (op == "=") return Value::ofBool(cmp == 0);
        if (op == "!=") return Value::ofBool(cmp != 0);
        if (op == "<") return Value::ofBool(cmp < 0);
        if (op == ">") return Value::ofBool(cmp > 0);
        if (op == "<=") return Value::ofBool(cmp <= 0);
        return Value::ofBool(cmp >= 0);
    }

    Value call(const Expr& e, const Binding& b) {
        const std::string& fn = e.name;
        if (fn == "BOUND") {
            return Value::ofBool(b.find(e.args[0].name) != b.end());
        }

        std::vector<Value> args;
        args.reserve(e.args.size());
        for (const auto& a : e.args) {
            args.push_back(eval(a, b));
        }

        if (fn == "STR") {
            const auto& v = args[0];
            switch (v.kind) {
                case Value::Kind::Term: return Value::ofTerm(RdfTerm::literal(v.term.value));
                case Value::Kind::Boolean:
                    return Value::ofTerm(RdfTerm::literal(v.boolean ? "true" : "false"));
                case Value::Kind::Number: {
                    auto text = fmt::format("{}", v.number);
                    return Value::ofTerm(RdfTerm::literal(text));
                }
                case Value::Kind::Error: return Value::error();
            }
        }

        const RdfTerm* first = literalArg(args[0]);
        if (!first) {
            return Value::error();
        }
        if (fn == "LCASE") {
            return Value::ofTerm(RdfTerm::literal(common::lowerUtf8(first->value), first->language));
        }
        if (fn == "UCASE") {
            return Value::ofTerm(RdfTerm::literal(common::upperUtf8(first->value), first->language));
        }
        if (fn == "LANG") {
            return Value::ofTerm(RdfTerm::literal(first->language));
        }
        if (fn == "STRLEN") {
            return Value::ofNumber(static_cast<double>(common::codepointLength(first->value)));
        }

        const RdfTerm* second = literalArg(args[1]);
        if (!second) {
            return Value::error();
        }
        if (fn == "CONTAINS") {
            return Value::ofBool(first->value.find(second->value) != std::string::npos);
        }
        if (fn == "STRSTARTS") {
            return Value::ofBool(first->value.compare(0, second->value.size(), second->value) == 0);
        }
        if (fn == "STRENDS") {
            const auto& s = first->value;
            const auto& suffix = second->value;
            return Value::ofBool(s.size() >= suffix.size() &&
                                 s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
        }
        if (fn == "REGEX") {
            bool icase = false;
            if (args.size() == 3) {
                const RdfTerm* flags = literalArg(args[2]);
                if (!flags) {
                    return Value::error();
                }
                icase = flags->value.find('i') != std::string::npos;
            }
            const auto& re = regexFor(second->value, icase);
            std::wstring text = common::toWide(first->value);
            if (icase) {
                text = common::foldCase(text);
            }
            return Value::ofBool(std::regex_search(text, re));
        }
        throw QueryEvalException("Unsupported function " + fn);
    }

    const std::wregex& regexFor(const std::string& pattern, bool icase) {
        auto key = std::make_pair(pattern, icase);
        auto it = regexCache_.find(key);
        if (it != regexCache_.end()) {
            return it->second;
        }
        std::wstring wide = common::toWide(pattern);
        if (icase) {
            wide = foldPattern(wide);
        }
        try {
            return regexCache_.emplace(key, std::wregex(wide)).first->second;
        } catch (const std::regex_error& e) {
            throw QueryEvalException("Invalid regular expression '" + pattern + "': " + e.what());
        }
    }

    const TripleStore& store_;
    std::map<std::pair<std::string, bool>, std::wregex> regexCache_;
};

int compareForOrder(const Binding& a, const Binding& b, const OrderKey& key) {
    auto ia = a.find(key.variable);
    auto ib = b.find(key.variable);
    bool hasA = ia != a.end();
    bool hasB = ib != b.end();
    if (!hasA || !hasB) {
        return static_cast<int>(hasA) - static_cast<int>(hasB);
    }
    auto na = numericValue(Value::ofTerm(ia->second));
    auto nb = numericValue(Value::ofTerm(ib->second));
    if (na && nb) {
        return *na < *nb ? -1 : (*na > *nb ? 1 : 0);
    }
    int cmp = ia->second.value.compare(ib->second.value);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

} // namespace

struct GraphQuery::Impl {
    ParsedQuery query;
};

Result<GraphQuery> GraphQuery::parse(std::string_view text, const PrefixMap& prefixes) {
    if (common::trimCopy(text).empty()) {
        return Error{ErrorCode::QueryFailed, "Empty query"};
    }
    try {
        QueryLexer lexer(text);
        QueryParser parser(lexer.tokenize(), prefixes);
        auto impl = std::make_shared<Impl>();
        impl->query = parser.parseQuery();
        return GraphQuery(std::move(impl));
    } catch (const QueryParseException& e) {
        return Error{ErrorCode::QueryFailed, "Query parse error: " + std::string(e.what()) +
                                                 " at position " + std::to_string(e.position())};
    } catch (const std::exception& e) {
        return Error{ErrorCode::QueryFailed, "Query parse error: " + std::string(e.what())};
    }
}

const std::vector<std::string>& GraphQuery::variables() const {
    return impl_->query.variables;
}

Result<QueryResult> GraphQuery::execute(const TripleStore& store) const {
    const auto& q = impl_->query;
    try {
        Evaluator evaluator(store);
        Solutions solutions = evaluator.evalGroup(q.where, Solutions{Binding{}});

        if (!q.order.empty()) {
            std::stable_sort(solutions.begin(), solutions.end(),
                             [&q](const Binding& a, const Binding& b) {
                                 for (const auto& key : q.order) {
                                     int cmp = compareForOrder(a, b, key);
                                     if (cmp != 0) {
                                         return key.descending ? cmp > 0 : cmp < 0;
                                     }
                                 }
                                 return false;
                             });
        }

        QueryResult result;
        result.variables = q.variables;
        std::set<QueryRow> seen;
        std::size_t skipped = 0;
        for (const auto& sol : solutions) {
            QueryRow row;
            for (const auto& var : q.variables) {
                auto it = sol.find(var);
                row[var] = it == sol.end() ? std::nullopt
                                           : std::optional<std::string>(it->second.display());
            }
            if (q.distinct && !seen.insert(row).second) {
                continue;
            }
            if (skipped < q.offset) {
                ++skipped;
                continue;
            }
            if (q.limit && result.rows.size() >= *q.limit) {
                break;
            }
            result.rows.push_back(std::move(row));
        }
        return result;
    } catch (const QueryEvalException& e) {
        return Error{ErrorCode::QueryFailed, "Query evaluation error: " + std::string(e.what())};
    } catch (const std::regex_error& e) {
        return Error{ErrorCode::QueryFailed,
                     "Query evaluation error: regular expression failed: " + std::string(e.what())};
    } catch (const std::exception& e) {
        return Error{ErrorCode::QueryFailed, "Query evaluation error: " + std::string(e.what())};
    }
}

std::string escapeQueryString(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string escapeRegex(std::string_view text) {
    static constexpr std::string_view special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace lexgraph::graph
