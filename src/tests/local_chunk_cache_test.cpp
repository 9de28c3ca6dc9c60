#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include "tessera/cache/local_chunk_cache.hpp"
#include "test_utils.hpp"

using namespace tessera::cache;
using tessera::test::bytes_of;

class LocalChunkCacheTest : public ::testing::Test {
protected:
    tessera::test::TempDir dir;
    std::unique_ptr<LocalChunkCache> cache;

    void SetUp() override {
        tessera::test::quiet_logging();
        cache = std::make_unique<LocalChunkCache>(dir / "cache.db", 100);
    }

    static CachedContentInfo info(const std::string& id, uint32_t chunks) {
        CachedContentInfo i;
        i.content_id = id;
        i.session_id = "room";
        i.content_type = "application/octet-stream";
        i.name = id + ".bin";
        i.total_chunks = chunks;
        i.total_size = chunks * 10;
        i.iv = std::vector<uint8_t>(16, 0x01);
        return i;
    }

    static bool contains(const std::vector<std::string>& ids, const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }
};

TEST_F(LocalChunkCacheTest, StoresChunksInAnyOrder) {
    const auto meta = info("a", 3);
    cache->put(meta, 2, bytes_of("2222222222"));
    cache->put(meta, 0, bytes_of("0000000000"));

    EXPECT_FALSE(cache->has_all("a"));
    EXPECT_EQ(cache->missing("a"), std::vector<uint32_t>{1});

    cache->put(meta, 1, bytes_of("1111111111"));
    EXPECT_TRUE(cache->has_all("a"));
    EXPECT_TRUE(cache->missing("a").empty());

    auto chunks = cache->read_all("a");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[2].data, bytes_of("2222222222"));

    auto stored = cache->info("a");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name, "a.bin");
    EXPECT_EQ(stored->total_chunks, 3u);
    EXPECT_EQ(stored->iv, meta.iv);
}

TEST_F(LocalChunkCacheTest, CachedChunksAreImmutable) {
    const auto meta = info("a", 1);
    cache->put(meta, 0, bytes_of("first-----"));
    cache->put(meta, 0, bytes_of("second----"));
    EXPECT_EQ(*cache->get("a", 0), bytes_of("first-----"));
}

TEST_F(LocalChunkCacheTest, UnknownContentHasNothingMissing) {
    EXPECT_FALSE(cache->get("nope", 0).has_value());
    EXPECT_FALSE(cache->has_all("nope"));
    EXPECT_TRUE(cache->missing("nope").empty());
    EXPECT_FALSE(cache->info("nope").has_value());
}

TEST_F(LocalChunkCacheTest, RegisteredContentListsAllIndicesMissing) {
    cache->register_content(info("b", 3));
    EXPECT_EQ(cache->missing("b"), (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_TRUE(contains(cache->content_ids(), "b"));
}

TEST_F(LocalChunkCacheTest, EvictsLeastRecentlyUsed) {
    cache->put(info("old", 4), 0, std::vector<uint8_t>(40, 1));
    cache->put(info("mid", 4), 0, std::vector<uint8_t>(40, 2));

    // Reading "old" makes "mid" the least recently used
    ASSERT_TRUE(cache->get("old", 0).has_value());

    auto evicted = cache->put(info("new", 4), 0, std::vector<uint8_t>(40, 3));
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "mid");
    EXPECT_LE(cache->size_bytes(), cache->max_bytes());
    EXPECT_TRUE(cache->get("old", 0).has_value());
    EXPECT_FALSE(cache->info("mid").has_value());
}

TEST_F(LocalChunkCacheTest, ProtectedContentSurvivesEviction) {
    cache->protect("old");
    cache->put(info("old", 4), 0, std::vector<uint8_t>(40, 1));
    cache->put(info("mid", 4), 0, std::vector<uint8_t>(40, 2));
    auto evicted = cache->put(info("new", 4), 0, std::vector<uint8_t>(40, 3));

    EXPECT_FALSE(contains(evicted, "old"));
    EXPECT_TRUE(contains(evicted, "mid"));
    EXPECT_TRUE(cache->is_protected("old"));
    EXPECT_TRUE(cache->get("old", 0).has_value());

    cache->unprotect("old");
    EXPECT_FALSE(cache->is_protected("old"));
}

TEST_F(LocalChunkCacheTest, RemoveAndClear) {
    cache->put(info("a", 1), 0, bytes_of("aaaaaaaaaa"));
    cache->put(info("b", 1), 0, bytes_of("bbbbbbbbbb"));

    EXPECT_TRUE(cache->remove("a"));
    EXPECT_FALSE(cache->remove("a"));
    EXPECT_FALSE(cache->get("a", 0).has_value());

    cache->clear();
    EXPECT_TRUE(cache->content_ids().empty());
    EXPECT_EQ(cache->size_bytes(), 0u);
}

TEST_F(LocalChunkCacheTest, PersistsAcrossReopen) {
    cache->put(info("keep", 1), 0, bytes_of("persisted!"));
    cache.reset();

    cache = std::make_unique<LocalChunkCache>(dir / "cache.db", 100);
    EXPECT_TRUE(cache->has_all("keep"));
    EXPECT_EQ(*cache->get("keep", 0), bytes_of("persisted!"));
}
