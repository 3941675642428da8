#pragma once

#include <lexgraph/core/types.h>
#include <lexgraph/parsing/page_source.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lexgraph::locator {

/**
 * @brief Identity of a paginated source plus a fingerprint of its content version
 */
struct PageSourceKey {
    std::string identity;
    std::string fingerprint;

    bool operator==(const PageSourceKey& other) const {
        return identity == other.identity && fingerprint == other.fingerprint;
    }
    bool operator<(const PageSourceKey& other) const {
        return identity < other.identity ||
               (identity == other.identity && fingerprint < other.fingerprint);
    }
};

/**
 * @brief Resumable scan state for one source.
 *
 * scannedPages only grows; pageMap entries are never replaced (first page wins).
 */
struct PageIndexEntry {
    std::map<std::string, int> pageMap; // article number -> 1-based page
    std::size_t scannedPages = 0;
    std::optional<std::size_t> totalPages;
    bool complete = false;
};

/**
 * @brief Process-lifetime page index cache.
 *
 * No eviction. Each key has its own mutex; a Lease holds it for the duration of one scan,
 * so there is a single writer per key while different sources scan concurrently.
 */
class PageIndexCache {
public:
    class Lease {
    public:
        PageIndexEntry& entry() { return *entry_; }

    private:
        friend class PageIndexCache;
        Lease(std::mutex& m, PageIndexEntry& e) : lock_(m), entry_(&e) {}

        std::unique_lock<std::mutex> lock_;
        PageIndexEntry* entry_;
    };

    PageIndexCache() = default;
    PageIndexCache(const PageIndexCache&) = delete;
    PageIndexCache& operator=(const PageIndexCache&) = delete;

    // Exclusive access to the entry for key, created empty on first use
    Lease lease(const PageSourceKey& key);

    // Copy of the entry, if the key has been seen
    std::optional<PageIndexEntry> snapshot(const PageSourceKey& key) const;

    std::size_t size() const;

private:
    struct Slot {
        std::mutex mutex;
        PageIndexEntry entry;
    };

    mutable std::mutex slotsMutex_;
    std::map<PageSourceKey, std::unique_ptr<Slot>> slots_;
};

/**
 * @brief Maps article numbers to the page where their header first appears, scanning
 * pages lazily and resuming where the previous call stopped.
 */
class PageLocator {
public:
    explicit PageLocator(PageIndexCache& cache,
                         parsing::PageSourceOpener opener = parsing::openPdfPageSource);

    /**
     * @brief Locate article numbers in an open source
     * @param needed Article numbers to resolve; empty returns the current map unchanged
     * @return The accumulated page map for the source (may hold more than was asked)
     */
    Result<std::map<std::string, int>> locate(const PageSourceKey& key,
                                              parsing::IPageSource& source,
                                              const std::vector<std::string>& needed);

    /**
     * @brief Locate article numbers in a file; the file is opened only if a scan is needed
     */
    Result<std::map<std::string, int>> locate(const std::filesystem::path& path,
                                              const std::vector<std::string>& needed);

    // identity = absolute path, fingerprint = last write time and size
    static Result<PageSourceKey> keyForFile(const std::filesystem::path& path);

private:
    using SourceProvider = std::function<Result<parsing::IPageSource*>()>;

    Result<std::map<std::string, int>> scan(const PageSourceKey& key, const SourceProvider& provider,
                                            const std::vector<std::string>& needed);

    PageIndexCache& cache_;
    parsing::PageSourceOpener opener_;
};

} // namespace lexgraph::locator
