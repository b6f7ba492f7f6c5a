#include <gtest/gtest.h>
#include <prettifier/render_cache.hpp>

namespace {

RenderedContent content_of(const std::string& text) {
    RenderedContent c;
    c.lines.push_back(StyledLine::plain(text));
    return c;
}

}  // namespace

TEST(RenderCacheTest, MissThenHitUpdatesStats) {
    RenderCache cache(4);
    EXPECT_EQ(cache.get(1, 80), nullptr);

    cache.put(1, 80, "json", content_of("one"));
    const RenderedContent* hit = cache.get(1, 80);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->lines.front().text(), "one");

    CacheStats s = cache.stats();
    EXPECT_EQ(s.entries, 1u);
    EXPECT_EQ(s.capacity, 4u);
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);
}

TEST(RenderCacheTest, WidthIsPartOfTheKey) {
    RenderCache cache(4);
    cache.put(7, 80, "json", content_of("narrow"));

    EXPECT_EQ(cache.get(7, 120), nullptr);
    cache.put(7, 120, "json", content_of("wide"));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get(7, 80)->lines.front().text(), "narrow");
    EXPECT_EQ(cache.get(7, 120)->lines.front().text(), "wide");
}

TEST(RenderCacheTest, EvictsLeastRecentlyUsed) {
    RenderCache cache(2);
    cache.put(1, 80, "a", content_of("1"));
    cache.put(2, 80, "a", content_of("2"));

    // Touch 1 so 2 becomes the eviction candidate.
    ASSERT_NE(cache.get(1, 80), nullptr);
    cache.put(3, 80, "a", content_of("3"));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains(1, 80));
    EXPECT_FALSE(cache.contains(2, 80));
    EXPECT_TRUE(cache.contains(3, 80));
}

TEST(RenderCacheTest, ReplacingKeyDoesNotEvict) {
    RenderCache cache(2);
    cache.put(1, 80, "a", content_of("old"));
    cache.put(2, 80, "a", content_of("2"));
    cache.put(1, 80, "a", content_of("new"));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get(1, 80)->lines.front().text(), "new");

    // The replace counted as a use; 2 goes first.
    cache.put(3, 80, "a", content_of("3"));
    EXPECT_TRUE(cache.contains(1, 80));
    EXPECT_FALSE(cache.contains(2, 80));
}

TEST(RenderCacheTest, InvalidateDropsAllWidths) {
    RenderCache cache(8);
    cache.put(5, 80, "a", content_of("x"));
    cache.put(5, 100, "a", content_of("y"));
    cache.put(6, 80, "a", content_of("z"));

    cache.invalidate(5);
    EXPECT_FALSE(cache.contains(5, 80));
    EXPECT_FALSE(cache.contains(5, 100));
    EXPECT_TRUE(cache.contains(6, 80));

    // Evicting after invalidate must not touch the dropped LRU slots.
    for (uint64_t fp = 10; fp < 20; fp++) cache.put(fp, 80, "a", content_of("n"));
    EXPECT_EQ(cache.size(), 8u);
}

TEST(RenderCacheTest, ClearEmptiesEntries) {
    RenderCache cache(3);
    cache.put(1, 80, "a", content_of("1"));
    cache.put(2, 80, "a", content_of("2"));
    cache.clear();

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.get(1, 80), nullptr);
}

TEST(RenderCacheTest, ClearResetsStats) {
    RenderCache cache(3);
    cache.put(1, 80, "a", content_of("1"));
    ASSERT_NE(cache.get(1, 80), nullptr);
    EXPECT_EQ(cache.get(2, 80), nullptr);

    cache.clear();
    CacheStats s = cache.stats();
    EXPECT_EQ(s.entries, 0u);
    EXPECT_EQ(s.hits, 0u);
    EXPECT_EQ(s.misses, 0u);
}

TEST(RenderCacheTest, FormatMismatchIsAMiss) {
    RenderCache cache(4);
    cache.put(9, 80, "json", content_of("as json"));

    EXPECT_EQ(cache.get(9, 80, "diff"), nullptr);
    const RenderedContent* hit = cache.get(9, 80, "json");
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->lines.front().text(), "as json");

    CacheStats s = cache.stats();
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);

    // Storing the other format's rendering replaces the entry.
    cache.put(9, 80, "diff", content_of("as diff"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get(9, 80, "json"), nullptr);
    EXPECT_EQ(cache.get(9, 80, "diff")->lines.front().text(), "as diff");
}

TEST(RenderCacheTest, ZeroCapacityHoldsOne) {
    RenderCache cache(0);
    EXPECT_EQ(cache.capacity(), 1u);
    cache.put(1, 80, "a", content_of("1"));
    cache.put(2, 80, "a", content_of("2"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains(2, 80));
}
