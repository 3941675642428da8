#include <spdlog/spdlog.h>
#include <set>
#include <system_error>
#include <lexgraph/common/utf8_utils.h>
#include <lexgraph/locator/page_locator.h>
#include <lexgraph/parsing/structure_patterns.h>

namespace lexgraph::locator {

PageIndexCache::Lease PageIndexCache::lease(const PageSourceKey& key) {
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(slotsMutex_);
        auto& ptr = slots_[key];
        if (!ptr) {
            ptr = std::make_unique<Slot>();
        }
        slot = ptr.get();
    }
    return Lease(slot->mutex, slot->entry);
}

std::optional<PageIndexEntry> PageIndexCache::snapshot(const PageSourceKey& key) const {
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(slotsMutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            return std::nullopt;
        }
        slot = it->second.get();
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->entry;
}

std::size_t PageIndexCache::size() const {
    std::lock_guard<std::mutex> lock(slotsMutex_);
    return slots_.size();
}

PageLocator::PageLocator(PageIndexCache& cache, parsing::PageSourceOpener opener)
    : cache_(cache), opener_(std::move(opener)) {}

Result<PageSourceKey> PageLocator::keyForFile(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot resolve path " + path.string() + ": " +
                                             ec.message()};
    }
    auto mtime = std::filesystem::last_write_time(absolute, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound, "Cannot stat " + absolute.string() + ": " +
                                                  ec.message()};
    }
    auto size = std::filesystem::file_size(absolute, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot stat " + absolute.string() + ": " + ec.message()};
    }
    PageSourceKey key;
    key.identity = absolute.lexically_normal().string();
    key.fingerprint = std::to_string(mtime.time_since_epoch().count()) + ":" + std::to_string(size);
    return key;
}

Result<std::map<std::string, int>> PageLocator::locate(const PageSourceKey& key,
                                                       parsing::IPageSource& source,
                                                       const std::vector<std::string>& needed) {
    return scan(
        key, [&source]() -> Result<parsing::IPageSource*> { return &source; }, needed);
}

Result<std::map<std::string, int>> PageLocator::locate(const std::filesystem::path& path,
                                                       const std::vector<std::string>& needed) {
    auto key = keyForFile(path);
    if (!key) {
        return key.error();
    }

    std::unique_ptr<parsing::IPageSource> opened;
    auto provider = [&]() -> Result<parsing::IPageSource*> {
        if (!opened) {
            if (!opener_) {
                return Error{ErrorCode::DependencyUnavailable,
                             "No page source configured for " + path.string()};
            }
            auto result = opener_(path);
            if (!result) {
                return result.error();
            }
            opened = std::move(result).value();
        }
        return opened.get();
    };
    return scan(key.value(), provider, needed);
}

Result<std::map<std::string, int>> PageLocator::scan(const PageSourceKey& key,
                                                     const SourceProvider& provider,
                                                     const std::vector<std::string>& needed) {
    auto lease = cache_.lease(key);
    auto& entry = lease.entry();

    if (needed.empty()) {
        return entry.pageMap;
    }

    std::set<std::string> remaining;
    for (const auto& number : needed) {
        if (entry.pageMap.find(number) == entry.pageMap.end()) {
            remaining.insert(number);
        }
    }
    if (remaining.empty() || entry.complete) {
        return entry.pageMap;
    }

    auto source = provider();
    if (!source) {
        return source.error();
    }

    if (!entry.totalPages) {
        auto count = source.value()->pageCount();
        if (!count) {
            return count.error();
        }
        entry.totalPages = count.value();
    }
    const std::size_t total = *entry.totalPages;

    spdlog::debug("PageLocator {}: resuming at page {} of {} for {} numbers", key.identity,
                  entry.scannedPages + 1, total, remaining.size());

    for (std::size_t page = entry.scannedPages; page < total; ++page) {
        auto text = source.value()->pageText(page);
        if (!text) {
            spdlog::warn("PageLocator {}: page {} failed: {}", key.identity, page + 1,
                         text.error().message);
            return text.error();
        }
        for (const auto& number :
             parsing::findLineAnchoredArticleHeaders(common::sanitizeUtf8(text.value()))) {
            entry.pageMap.emplace(number, static_cast<int>(page + 1));
            remaining.erase(number);
        }
        entry.scannedPages = page + 1;
        if (remaining.empty()) {
            break;
        }
    }

    if (entry.scannedPages >= total) {
        entry.complete = true;
    }
    spdlog::debug("PageLocator {}: {} of {} pages scanned, {} numbers mapped{}", key.identity,
                  entry.scannedPages, total, entry.pageMap.size(),
                  entry.complete ? " (complete)" : "");
    return entry.pageMap;
}

} // namespace lexgraph::locator
