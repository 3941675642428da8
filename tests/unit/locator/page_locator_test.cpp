#include <gtest/gtest.h>
#include <lexgraph/locator/page_locator.h>

#include <thread>

#include "support/fake_page_source.h"
#include "support/temp_dir_scope.hpp"

using namespace lexgraph;
using namespace lexgraph::locator;
using lexgraph::test_support::FakePageSource;
using lexgraph::test_support::TempDirScope;

class PageLocatorTest : public ::testing::Test {
protected:
    PageIndexCache cache_;
    PageLocator locator_{cache_, nullptr};
    FakePageSource source_{test_support::tenPageDocument()};
    PageSourceKey key_{"/virtual/law.pdf", "v1"};
};

TEST_F(PageLocatorTest, StopsAsSoonAsNumbersAreFound) {
    auto pages = locator_.locate(key_, source_, {"5"});
    ASSERT_TRUE(pages) << pages.error().message;
    EXPECT_EQ(pages.value().at("5"), 3);
    EXPECT_EQ(pages.value().at("1"), 1);
    EXPECT_EQ(source_.reads(), (std::vector<std::size_t>{0, 1, 2}));

    auto entry = cache_.snapshot(key_);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->scannedPages, 3u);
    EXPECT_FALSE(entry->complete);
}

TEST_F(PageLocatorTest, ResumesWhereThePreviousScanStopped) {
    ASSERT_TRUE(locator_.locate(key_, source_, {"5"}));
    source_.clearReads();

    auto pages = locator_.locate(key_, source_, {"9"});
    ASSERT_TRUE(pages);
    EXPECT_EQ(pages.value().at("9"), 8);
    ASSERT_FALSE(source_.reads().empty());
    EXPECT_EQ(source_.reads().front(), 3u);
    EXPECT_EQ(cache_.snapshot(key_)->scannedPages, 8u);
    // in-body mentions are not headers
    EXPECT_EQ(pages.value().count("55"), 0u);
}

TEST_F(PageLocatorTest, KnownNumbersNeedNoReads) {
    ASSERT_TRUE(locator_.locate(key_, source_, {"5"}));
    source_.clearReads();

    auto pages = locator_.locate(key_, source_, {"1", "5"});
    ASSERT_TRUE(pages);
    EXPECT_TRUE(source_.reads().empty());

    auto unchanged = locator_.locate(key_, source_, {});
    ASSERT_TRUE(unchanged);
    EXPECT_EQ(unchanged.value(), pages.value());
}

TEST_F(PageLocatorTest, CompleteIndexAnswersMissesWithoutReading) {
    auto pages = locator_.locate(key_, source_, {"42"});
    ASSERT_TRUE(pages);
    EXPECT_EQ(pages.value().count("42"), 0u);
    EXPECT_EQ(pages.value().size(), 3u);
    auto entry = cache_.snapshot(key_);
    EXPECT_TRUE(entry->complete);
    EXPECT_EQ(entry->scannedPages, 10u);
    EXPECT_EQ(entry->totalPages, 10u);

    source_.clearReads();
    auto again = locator_.locate(key_, source_, {"77"});
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().size(), 3u);
    EXPECT_TRUE(source_.reads().empty());
}

TEST_F(PageLocatorTest, PageFailureIsReportedAndScanResumesLater) {
    source_.failOnPage(1);
    auto failed = locator_.locate(key_, source_, {"9"});
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(cache_.snapshot(key_)->scannedPages, 1u);

    source_.failOnPage(100);
    source_.clearReads();
    auto pages = locator_.locate(key_, source_, {"9"});
    ASSERT_TRUE(pages);
    EXPECT_EQ(source_.reads().front(), 1u);
    EXPECT_EQ(pages.value().at("9"), 8);
}

TEST_F(PageLocatorTest, DistinctFingerprintsAreIndexedSeparately) {
    ASSERT_TRUE(locator_.locate(key_, source_, {"5"}));
    PageSourceKey changed{key_.identity, "v2"};
    FakePageSource other({"Статья 5. новая редакция"});
    auto pages = locator_.locate(changed, other, {"5"});
    ASSERT_TRUE(pages);
    EXPECT_EQ(pages.value().at("5"), 1);
    EXPECT_EQ(cache_.size(), 2u);
}

TEST_F(PageLocatorTest, ConcurrentScansOfDifferentSources) {
    FakePageSource second(test_support::tenPageDocument());
    PageSourceKey otherKey{"/virtual/other.pdf", "v1"};
    Result<std::map<std::string, int>> first = Error{ErrorCode::Unknown, "not run"};
    Result<std::map<std::string, int>> other = Error{ErrorCode::Unknown, "not run"};

    std::thread a([&] { first = locator_.locate(key_, source_, {"9"}); });
    std::thread b([&] { other = locator_.locate(otherKey, second, {"9"}); });
    a.join();
    b.join();

    ASSERT_TRUE(first);
    ASSERT_TRUE(other);
    EXPECT_EQ(first.value(), other.value());
}

TEST(PageLocatorFileTest, OpensTheFileOnlyWhenAScanIsNeeded) {
    TempDirScope dir = TempDirScope::unique_under("lexgraph_locator");
    auto path = dir.write("law.pdf", "%PDF-1.4 placeholder");

    int opens = 0;
    PageIndexCache cache;
    PageLocator locator(cache, [&opens](const std::filesystem::path&)
                                   -> Result<std::unique_ptr<parsing::IPageSource>> {
        ++opens;
        return std::unique_ptr<parsing::IPageSource>(
            std::make_unique<FakePageSource>(test_support::tenPageDocument()));
    });

    auto pages = locator.locate(path, {"5"});
    ASSERT_TRUE(pages) << pages.error().message;
    EXPECT_EQ(pages.value().at("5"), 3);
    EXPECT_EQ(opens, 1);

    ASSERT_TRUE(locator.locate(path, {"1", "5"}));
    EXPECT_EQ(opens, 1);
}

TEST(PageLocatorFileTest, MissingFile) {
    PageIndexCache cache;
    PageLocator locator(cache, nullptr);
    auto pages = locator.locate(std::filesystem::path("/nonexistent/law.pdf"), {"1"});
    ASSERT_FALSE(pages);
    EXPECT_EQ(pages.error().code, ErrorCode::FileNotFound);
}
