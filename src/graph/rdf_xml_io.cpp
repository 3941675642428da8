#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/graph/rdf_xml_io.h>
#include <lexgraph/parsing/source_reader.h>

#include <pugixml.hpp>

namespace lexgraph::graph {

namespace {

class RdfXmlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string rdf(std::string_view local) {
    return std::string(vocab::kRdf) + std::string(local);
}

// Length of a recognized XML entity starting at '&', or 0
std::size_t entityLength(std::string_view text, std::size_t amp) {
    auto rest = text.substr(amp + 1);
    for (std::string_view named : {"amp;", "lt;", "gt;", "quot;", "apos;"}) {
        if (rest.substr(0, named.size()) == named) {
            return named.size() + 1;
        }
    }
    if (rest.empty() || rest[0] != '#') {
        return 0;
    }
    std::size_t i = 1;
    bool hex = i < rest.size() && rest[i] == 'x';
    if (hex) {
        ++i;
    }
    std::size_t digitsStart = i;
    while (i < rest.size() &&
           (hex ? std::isxdigit(static_cast<unsigned char>(rest[i]))
                : std::isdigit(static_cast<unsigned char>(rest[i])))) {
        ++i;
    }
    if (i == digitsStart || i >= rest.size() || rest[i] != ';') {
        return 0;
    }
    return i + 2;
}

bool isDisallowedControl(unsigned char c) {
    return c < 0x20 && c != '\t' && c != '\n' && c != '\r';
}

Result<void> checkRawInput(std::string_view content) {
    for (std::size_t i = 0; i < content.size(); ++i) {
        auto c = static_cast<unsigned char>(content[i]);
        if (isDisallowedControl(c)) {
            return Error{ErrorCode::MalformedPersistedGraph,
                         fmt::format("illegal control byte 0x{:02x} at offset {}", c, i)};
        }
        if (c == '&' && entityLength(content, i) == 0) {
            return Error{ErrorCode::MalformedPersistedGraph,
                         fmt::format("unescaped '&' at offset {}", i)};
        }
    }
    if (!common::isValidUtf8(content)) {
        return Error{ErrorCode::MalformedPersistedGraph, "invalid UTF-8"};
    }
    return Result<void>();
}

bool isNcNameStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isNcNameChar(unsigned char c) {
    return isNcNameStart(c) || std::isdigit(c) || c == '-' || c == '.';
}

bool isNcName(std::string_view s) {
    if (s.empty() || !isNcNameStart(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    for (char c : s) {
        if (!isNcNameChar(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Reader
// ---------------------------------------------------------------------------

using NamespaceScope = std::map<std::string, std::string>;

class RdfXmlReader {
public:
    explicit RdfXmlReader(TripleStore& store) : store_(store) {}

    void readDocument(const pugi::xml_document& doc) {
        auto root = doc.document_element();
        if (!root) {
            throw RdfXmlError("document has no root element");
        }
        NamespaceScope scope = extendScope({}, root);
        if (expand(scope, root.name()) != rdf("RDF")) {
            // A lone node element is accepted as the whole graph
            readNode(root, {}, "");
            return;
        }
        std::string lang = root.attribute("xml:lang").value();
        for (auto child : root.children()) {
            if (child.type() == pugi::node_element) {
                readNode(child, scope, lang);
            }
        }
    }

private:
    static NamespaceScope extendScope(const NamespaceScope& parent, const pugi::xml_node& node) {
        NamespaceScope scope = parent;
        for (auto attr : node.attributes()) {
            std::string_view name = attr.name();
            if (name == "xmlns") {
                scope[""] = attr.value();
            } else if (name.substr(0, 6) == "xmlns:") {
                scope[std::string(name.substr(6))] = attr.value();
            }
        }
        return scope;
    }

    static std::string expand(const NamespaceScope& scope, std::string_view qname) {
        auto colon = qname.find(':');
        std::string prefix = colon == std::string_view::npos ? "" : std::string(qname.substr(0, colon));
        std::string_view local = colon == std::string_view::npos ? qname : qname.substr(colon + 1);
        if (prefix == "xml") {
            return std::string(vocab::kXmlNs) + "#" + std::string(local);
        }
        auto it = scope.find(prefix);
        if (it == scope.end()) {
            throw RdfXmlError("undeclared namespace prefix in '" + std::string(qname) + "'");
        }
        return it->second + std::string(local);
    }

    static bool isSyntaxAttribute(std::string_view name) {
        return name == "xmlns" || name.substr(0, 6) == "xmlns:" || name.substr(0, 4) == "xml:";
    }

    std::string xmlLang(const pugi::xml_node& node, const std::string& inherited) const {
        auto attr = node.attribute("xml:lang");
        return attr ? std::string(attr.value()) : inherited;
    }

    RdfTerm readNode(const pugi::xml_node& node, const NamespaceScope& parentScope,
                     const std::string& inheritedLang) {
        NamespaceScope scope = extendScope(parentScope, node);
        const std::string lang = xmlLang(node, inheritedLang);

        RdfTerm subject;
        std::vector<pugi::xml_attribute> properties;
        bool haveSubject = false;
        for (auto attr : node.attributes()) {
            std::string_view name = attr.name();
            if (isSyntaxAttribute(name)) {
                continue;
            }
            std::string expanded = expand(scope, name);
            if (expanded == rdf("about")) {
                subject = RdfTerm::iri(attr.value());
                haveSubject = true;
            } else if (expanded == rdf("nodeID")) {
                subject = RdfTerm::iri(std::string("_:") + attr.value());
                haveSubject = true;
            } else if (expanded == rdf("ID")) {
                subject = RdfTerm::iri(std::string("#") + attr.value());
                haveSubject = true;
            } else {
                properties.push_back(attr);
            }
        }
        if (!haveSubject) {
            subject = RdfTerm::iri("_:b" + std::to_string(++blankCounter_));
        }

        const std::string nodeType = expand(scope, node.name());
        if (nodeType != rdf("Description")) {
            store_.add({subject, RdfTerm::iri(vocab::rdfType()), RdfTerm::iri(nodeType)});
        }
        for (const auto& attr : properties) {
            auto predicate = expand(scope, attr.name());
            if (predicate == rdf("type")) {
                store_.add({subject, RdfTerm::iri(predicate), RdfTerm::iri(attr.value())});
            } else {
                store_.add({subject, RdfTerm::iri(predicate), RdfTerm::literal(attr.value(), lang)});
            }
        }

        for (auto child : node.children()) {
            if (child.type() == pugi::node_element) {
                readProperty(child, subject, scope, lang);
            }
        }
        return subject;
    }

    void readProperty(const pugi::xml_node& node, const RdfTerm& subject,
                      const NamespaceScope& parentScope, const std::string& inheritedLang) {
        NamespaceScope scope = extendScope(parentScope, node);
        const std::string lang = xmlLang(node, inheritedLang);
        RdfTerm predicate = RdfTerm::iri(expand(scope, node.name()));

        std::string datatype;
        std::string parseType;
        for (auto attr : node.attributes()) {
            std::string_view name = attr.name();
            if (isSyntaxAttribute(name)) {
                continue;
            }
            std::string expanded = expand(scope, name);
            if (expanded == rdf("resource")) {
                store_.add({subject, predicate, RdfTerm::iri(attr.value())});
                return;
            }
            if (expanded == rdf("nodeID")) {
                store_.add({subject, predicate, RdfTerm::iri(std::string("_:") + attr.value())});
                return;
            }
            if (expanded == rdf("datatype")) {
                datatype = attr.value();
            } else if (expanded == rdf("parseType")) {
                parseType = attr.value();
            }
        }

        if (parseType == "Resource") {
            RdfTerm blank = RdfTerm::iri("_:b" + std::to_string(++blankCounter_));
            store_.add({subject, predicate, blank});
            for (auto child : node.children()) {
                if (child.type() == pugi::node_element) {
                    readProperty(child, blank, scope, lang);
                }
            }
            return;
        }
        if (!parseType.empty() && parseType != "Literal") {
            throw RdfXmlError("unsupported rdf:parseType '" + parseType + "'");
        }

        std::string text;
        for (auto child : node.children()) {
            if (child.type() == pugi::node_element && parseType.empty()) {
                RdfTerm object = readNode(child, scope, lang);
                store_.add({subject, predicate, object});
                return;
            }
            if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
                text += child.value();
            }
        }
        if (!datatype.empty()) {
            store_.add({subject, predicate, RdfTerm::literal(std::move(text), {}, datatype)});
        } else {
            store_.add({subject, predicate, RdfTerm::literal(std::move(text), lang)});
        }
    }

    TripleStore& store_;
    std::size_t blankCounter_ = 0;
};

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

class QNameTable {
public:
    explicit QNameTable(const PrefixMap& prefixes) {
        for (const auto& [prefix, ns] : prefixes) {
            byNamespace_.emplace(ns, prefix);
            declared_.emplace_back(prefix, ns);
        }
        if (byNamespace_.find(std::string(vocab::kRdf)) == byNamespace_.end()) {
            byNamespace_.emplace(std::string(vocab::kRdf), "rdf");
            declared_.emplace_back("rdf", std::string(vocab::kRdf));
        }
    }

    Result<std::string> qname(const std::string& iri) {
        auto split = iri.find_last_of("#/");
        if (split == std::string::npos || split + 1 >= iri.size()) {
            return Error{ErrorCode::InvalidData, "Cannot split predicate IRI: " + iri};
        }
        std::string ns = iri.substr(0, split + 1);
        std::string local = iri.substr(split + 1);
        if (!isNcName(local)) {
            return Error{ErrorCode::InvalidData, "Predicate local name is not an XML name: " + iri};
        }
        auto it = byNamespace_.find(ns);
        if (it == byNamespace_.end()) {
            std::string prefix = "ns" + std::to_string(++generated_);
            it = byNamespace_.emplace(ns, prefix).first;
            declared_.emplace_back(prefix, ns);
        }
        return it->second + ":" + local;
    }

    const std::vector<std::pair<std::string, std::string>>& declared() const { return declared_; }

private:
    std::unordered_map<std::string, std::string> byNamespace_;
    std::vector<std::pair<std::string, std::string>> declared_;
    int generated_ = 0;
};

void setReference(pugi::xml_node& node, const RdfTerm& term, const char* attrName) {
    if (term.value.rfind("_:", 0) == 0) {
        node.append_attribute("rdf:nodeID").set_value(term.value.substr(2).c_str());
    } else {
        node.append_attribute(attrName).set_value(term.value.c_str());
    }
}

} // namespace

Result<std::string> serializeRdfXml(const TripleStore& store, const PrefixMap& prefixes) {
    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version").set_value("1.0");
    decl.append_attribute("encoding").set_value("utf-8");
    auto root = doc.append_child("rdf:RDF");

    QNameTable names(prefixes);
    std::unordered_map<RdfTerm, pugi::xml_node, RdfTermHash> descriptions;

    for (const auto& triple : store.triples()) {
        if (!triple.subject.isIri() || !triple.predicate.isIri()) {
            return Error{ErrorCode::InvalidData, "Cannot serialize triple: " + toString(triple)};
        }
        auto qname = names.qname(triple.predicate.value);
        if (!qname) {
            return qname.error();
        }

        auto it = descriptions.find(triple.subject);
        if (it == descriptions.end()) {
            auto desc = root.append_child("rdf:Description");
            setReference(desc, triple.subject, "rdf:about");
            it = descriptions.emplace(triple.subject, desc).first;
        }

        auto prop = it->second.append_child(qname.value().c_str());
        const auto& object = triple.object;
        if (object.isIri()) {
            setReference(prop, object, "rdf:resource");
            continue;
        }
        if (!object.language.empty()) {
            prop.append_attribute("xml:lang").set_value(object.language.c_str());
        } else if (!object.datatype.empty()) {
            prop.append_attribute("rdf:datatype").set_value(object.datatype.c_str());
        }
        if (!object.value.empty()) {
            prop.append_child(pugi::node_pcdata).set_value(object.value.c_str());
        }
    }

    for (const auto& [prefix, ns] : names.declared()) {
        root.prepend_attribute(("xmlns:" + prefix).c_str()).set_value(ns.c_str());
    }

    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

Result<void> writeRdfXmlFile(const TripleStore& store, const std::filesystem::path& path,
                             const PrefixMap& prefixes) {
    auto xml = serializeRdfXml(store, prefixes);
    if (!xml) {
        return xml.error();
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError, "Cannot create directory for " + path.string() +
                                                 ": " + ec.message()};
        }
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error{ErrorCode::IOError, "Cannot open for writing: " + path.string()};
    }
    file.write(xml.value().data(), static_cast<std::streamsize>(xml.value().size()));
    if (!file) {
        return Error{ErrorCode::IOError, "Failed to write " + path.string()};
    }
    return Result<void>();
}

Result<TripleStore> parseRdfXml(std::string_view content) {
    auto check = checkRawInput(content);
    if (!check) {
        return check.error();
    }

    pugi::xml_document doc;
    auto parsed = doc.load_buffer(content.data(), content.size(), pugi::parse_default,
                                  pugi::encoding_utf8);
    if (!parsed) {
        return Error{ErrorCode::MalformedPersistedGraph,
                     fmt::format("{} at offset {}", parsed.description(), parsed.offset)};
    }

    TripleStore store;
    try {
        RdfXmlReader reader(store);
        reader.readDocument(doc);
    } catch (const RdfXmlError& e) {
        return Error{ErrorCode::MalformedPersistedGraph, e.what()};
    }
    return store;
}

std::string sanitizeRdfXml(std::string_view raw) {
    std::string stripped;
    stripped.reserve(raw.size());
    for (char c : raw) {
        if (!isDisallowedControl(static_cast<unsigned char>(c))) {
            stripped.push_back(c);
        }
    }

    const std::string decoded = common::sanitizeUtf8(stripped);

    std::string out;
    out.reserve(decoded.size() + 16);
    for (std::size_t i = 0; i < decoded.size(); ++i) {
        if (decoded[i] == '&' && entityLength(decoded, i) == 0) {
            out += "&amp;";
        } else {
            out.push_back(decoded[i]);
        }
    }
    return out;
}

std::filesystem::path sanitizedCopyPath(const std::filesystem::path& path) {
    auto name = path.stem().string() + ".sanitized" + path.extension().string();
    return path.parent_path() / name;
}

Result<RdfXmlLoadReport> loadRdfXmlFile(const std::filesystem::path& path, TripleStore& store) {
    auto raw = parsing::readSourceFile(path);
    if (!raw) {
        return raw.error();
    }

    RdfXmlLoadReport report;
    auto parsed = parseRdfXml(raw.value());
    if (parsed) {
        report.loadedFrom = path;
        report.tripleCount = parsed.value().size();
        store = std::move(parsed).value();
        return report;
    }

    const auto sanitizedPath = sanitizedCopyPath(path);
    spdlog::warn("Failed to parse graph file {} ({}); retrying with sanitized copy {}",
                 path.string(), parsed.error().message, sanitizedPath.string());

    const std::string sanitized = sanitizeRdfXml(raw.value());
    {
        std::ofstream file(sanitizedPath, std::ios::binary | std::ios::trunc);
        file.write(sanitized.data(), static_cast<std::streamsize>(sanitized.size()));
        if (!file) {
            return Error{ErrorCode::IOError,
                         "Cannot write sanitized graph copy: " + sanitizedPath.string()};
        }
    }

    auto retried = parseRdfXml(sanitized);
    if (!retried) {
        return Error{ErrorCode::MalformedPersistedGraph,
                     "Graph file " + path.string() + " is malformed and could not be repaired: " +
                         retried.error().message};
    }

    report.loadedFrom = sanitizedPath;
    report.sanitized = true;
    report.tripleCount = retried.value().size();
    store = std::move(retried).value();
    spdlog::info("Loaded graph from sanitized file {} ({} triples)", sanitizedPath.string(),
                 report.tripleCount);
    return report;
}

} // namespace lexgraph::graph
