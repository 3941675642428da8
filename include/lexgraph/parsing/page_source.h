#pragma once

#include <lexgraph/core/types.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace lexgraph::parsing {

/**
 * @brief Paginated source whose text is extracted one page at a time
 */
class IPageSource {
public:
    virtual ~IPageSource() = default;

    virtual Result<std::size_t> pageCount() = 0;

    /**
     * @brief Extracted text of one page
     * @param index 0-based page index
     */
    virtual Result<std::string> pageText(std::size_t index) = 0;
};

using PageSourceOpener =
    std::function<Result<std::unique_ptr<IPageSource>>(const std::filesystem::path&)>;

/**
 * @brief Whether PDF page extraction was compiled in
 */
bool pdfSupportAvailable();

/**
 * @brief Open a PDF for per-page extraction
 *
 * Fails with DependencyUnavailable when the build has no PDF backend. The check happens
 * here, at call time, never when the library is loaded.
 */
Result<std::unique_ptr<IPageSource>> openPdfPageSource(const std::filesystem::path& path);

} // namespace lexgraph::parsing
