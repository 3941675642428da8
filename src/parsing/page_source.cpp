#include <lexgraph/parsing/page_source.h>

namespace lexgraph::parsing {

#ifdef LEXGRAPH_HAVE_QPDF
// Defined in qpdf_page_source.cpp
Result<std::unique_ptr<IPageSource>> openQpdfPageSource(const std::filesystem::path& path);
#endif

bool pdfSupportAvailable() {
#ifdef LEXGRAPH_HAVE_QPDF
    return true;
#else
    return false;
#endif
}

Result<std::unique_ptr<IPageSource>> openPdfPageSource(const std::filesystem::path& path) {
#ifdef LEXGRAPH_HAVE_QPDF
    return openQpdfPageSource(path);
#else
    return Error{ErrorCode::DependencyUnavailable,
                 "PDF support is not available (built without QPDF): " + path.string()};
#endif
}

} // namespace lexgraph::parsing
