#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "sage_core/embeddings/embedding_cache.hpp"

namespace sage_core {

TEST(EmbeddingCacheTest, MissReturnsNullopt) {
  EmbeddingCache cache(4);
  EXPECT_FALSE(cache.get("missing").has_value());
}

TEST(EmbeddingCacheTest, ReturnsStoredEmbedding) {
  EmbeddingCache cache(4);
  cache.put("hello", {0.1f, 0.2f});
  auto hit = cache.get("hello");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, (std::vector<float>{0.1f, 0.2f}));
  EXPECT_EQ(cache.size(), 1u);
}

TEST(EmbeddingCacheTest, KeysAreExactText) {
  EmbeddingCache cache(4);
  cache.put("hello", {1.0f});
  EXPECT_FALSE(cache.get("Hello").has_value());
  EXPECT_FALSE(cache.get("hello ").has_value());
}

TEST(EmbeddingCacheTest, PutReplacesExistingEntry) {
  EmbeddingCache cache(4);
  cache.put("a", {1.0f});
  cache.put("a", {2.0f});
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(*cache.get("a"), std::vector<float>{2.0f});
}

TEST(EmbeddingCacheTest, EvictsLeastRecentlyUsed) {
  EmbeddingCache cache(2);
  cache.put("a", {1.0f});
  cache.put("b", {2.0f});
  // Touch "a" so "b" becomes the eviction candidate
  ASSERT_TRUE(cache.get("a").has_value());
  cache.put("c", {3.0f});

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_TRUE(cache.get("a").has_value());
  EXPECT_FALSE(cache.get("b").has_value());
  EXPECT_TRUE(cache.get("c").has_value());
}

TEST(EmbeddingCacheTest, ZeroCapacityNeverEvicts) {
  EmbeddingCache cache(0);
  for (int i = 0; i < 100; ++i) {
    cache.put("text" + std::to_string(i), {static_cast<float>(i)});
  }
  EXPECT_EQ(cache.size(), 100u);
  EXPECT_TRUE(cache.get("text0").has_value());
}

TEST(EmbeddingCacheTest, ClearEmptiesTheCache) {
  EmbeddingCache cache(4);
  cache.put("a", {1.0f});
  cache.put("b", {2.0f});
  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.get("a").has_value());
}

TEST(EmbeddingCacheTest, ConcurrentAccessKeepsSizeBounded) {
  EmbeddingCache cache(16);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 200; ++i) {
        const std::string key = "k" + std::to_string((t * 7 + i) % 40);
        cache.put(key, {static_cast<float>(i)});
        cache.get(key);
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_LE(cache.size(), 16u);
}

}  // namespace sage_core
