#include <gtest/gtest.h>
#include <tankobon/offline/metadata_cache.hpp>

#include <chrono>

using namespace tankobon::offline;
using namespace std::chrono_literals;

namespace {

struct FakeSteadyClock {
    std::chrono::steady_clock::time_point now{};
    SteadyNow fn() {
        return [this] { return now; };
    }
};

CatalogManga manga(const std::string& id) {
    CatalogManga m;
    m.id = id;
    m.title = "Title " + id;
    return m;
}

} // namespace

TEST(TtlCacheTest, EvictsExactlyTheOldestInsertedEntryAtCapacity) {
    FakeSteadyClock clock;
    TtlCache<int> cache(MetadataCacheConfig{3, 5min}, clock.fn());

    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    // Reads do not refresh eviction order.
    ASSERT_TRUE(cache.get("a").has_value());

    cache.set("d", 4);
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.get("b").value(), 2);
    EXPECT_EQ(cache.get("c").value(), 3);
    EXPECT_EQ(cache.get("d").value(), 4);
}

TEST(TtlCacheTest, OverwritingExistingKeyAtCapacityDoesNotEvict) {
    FakeSteadyClock clock;
    TtlCache<int> cache(MetadataCacheConfig{2, 5min}, clock.fn());

    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("a", 10);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get("a").value(), 10);
    EXPECT_EQ(cache.get("b").value(), 2);
}

TEST(TtlCacheTest, ExpiredEntryIsRemovedOnRead) {
    FakeSteadyClock clock;
    TtlCache<int> cache(MetadataCacheConfig{10, 5min}, clock.fn());

    cache.set("a", 1);
    clock.now += 5min;
    EXPECT_TRUE(cache.get("a").has_value()) << "exactly at TTL is still fresh";

    clock.now += 1ms;
    EXPECT_EQ(cache.size(), 1u) << "expiry is lazy";
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(MetadataCacheTest, MangaAndChapterPagesAreIndependent) {
    FakeSteadyClock clock;
    MetadataCache cache(MetadataCacheConfig{1, 5min}, clock.fn());

    cache.setManga("ext", "m1", manga("m1"));
    CatalogChapterPages pages;
    pages.chapterId = "c1";
    pages.mangaId = "m1";
    pages.pages.push_back(CatalogPage{0, "https://img/0.jpg", std::nullopt, std::nullopt});
    cache.setChapterPages("ext", "m1", "c1", pages);

    auto stats = cache.stats();
    EXPECT_EQ(stats.mangaEntries, 1u);
    EXPECT_EQ(stats.chapterPagesEntries, 1u);

    auto cachedManga = cache.getManga("ext", "m1");
    ASSERT_TRUE(cachedManga.has_value());
    EXPECT_EQ(cachedManga->title, "Title m1");

    auto cachedPages = cache.getChapterPages("ext", "m1", "c1");
    ASSERT_TRUE(cachedPages.has_value());
    ASSERT_EQ(cachedPages->pages.size(), 1u);
    EXPECT_EQ(cachedPages->pages[0].url, "https://img/0.jpg");

    EXPECT_FALSE(cache.getManga("other-ext", "m1").has_value());
}

TEST(MetadataCacheTest, CompositeKeys) {
    EXPECT_EQ(MetadataCache::mangaKey("ext", "m"), "ext:m");
    EXPECT_EQ(MetadataCache::chapterPagesKey("ext", "m", "c"), "ext:m:c");
}

TEST(MetadataCacheTest, ClearAndInvalidate) {
    MetadataCache cache;
    cache.setManga("ext", "m1", manga("m1"));
    cache.setManga("ext", "m2", manga("m2"));
    cache.invalidateManga("ext", "m1");
    EXPECT_FALSE(cache.getManga("ext", "m1").has_value());
    EXPECT_TRUE(cache.getManga("ext", "m2").has_value());
    cache.clear();
    EXPECT_EQ(cache.stats().mangaEntries, 0u);
}
