#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <lexgraph/parsing/document_parser.h>
#include <lexgraph/parsing/markup_document_parser.h>
#include <lexgraph/parsing/paginated_document_parser.h>
#include <lexgraph/parsing/plain_text_parser.h>

namespace lexgraph::parsing {

namespace {

std::string lowerExtension(std::string ext) {
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

StructuralParser::StructuralParser() {
    registerParser({"xml", "html"}, []() { return std::make_unique<MarkupDocumentParser>(); });
    registerParser({"txt"}, []() { return std::make_unique<PlainTextParser>(); });
    registerParser({"pdf"}, []() { return std::make_unique<PaginatedDocumentParser>(); });

    if (spdlog::should_log(spdlog::level::debug)) {
        std::string extList;
        for (const auto& e : supportedExtensions()) {
            if (!extList.empty())
                extList += ", ";
            extList += e;
        }
        spdlog::debug("StructuralParser extensions: {}", extList);
    }
}

std::string StructuralParser::normalizeExtension(const std::filesystem::path& path) {
    return lowerExtension(path.extension().string());
}

Result<ParsedDocument> StructuralParser::parse(const std::filesystem::path& path) const {
    const std::string ext = normalizeExtension(path);
    auto it = parsers_.find(ext);
    if (it == parsers_.end()) {
        return Error{ErrorCode::UnsupportedFormat,
                     "Unsupported document format '" + (ext.empty() ? std::string("<none>") : ext) +
                         "': " + path.string()};
    }

    auto parser = it->second();
    if (!parser) {
        return Error{ErrorCode::InternalError, "Parser factory returned null for '" + ext + "'"};
    }
    spdlog::debug("Parsing {} with {}", path.string(), parser->name());
    return parser->parse(path);
}

void StructuralParser::registerParser(const std::vector<std::string>& extensions,
                                      ParserCreator creator) {
    for (const auto& ext : extensions) {
        parsers_[lowerExtension(ext)] = creator;
    }
}

bool StructuralParser::isSupported(const std::string& extension) const {
    return parsers_.find(lowerExtension(extension)) != parsers_.end();
}

std::vector<std::string> StructuralParser::supportedExtensions() const {
    std::vector<std::string> extensions;
    extensions.reserve(parsers_.size());
    for (const auto& [ext, _] : parsers_) {
        extensions.push_back(ext);
    }
    std::sort(extensions.begin(), extensions.end());
    return extensions;
}

} // namespace lexgraph::parsing
