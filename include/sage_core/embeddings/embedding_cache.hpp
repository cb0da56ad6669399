#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sage_core {

/**
 * @class EmbeddingCache
 * @brief Thread-safe LRU map from exact text to its embedding.
 *
 * A capacity of zero disables eviction. Lookups refresh recency; inserting a new key
 * into a full cache evicts the least recently used entry.
 */
class EmbeddingCache {
 public:
  explicit EmbeddingCache(std::size_t capacity = 10000) : capacity_(capacity) {}

  EmbeddingCache(const EmbeddingCache&) = delete;
  EmbeddingCache& operator=(const EmbeddingCache&) = delete;

  std::optional<std::vector<float>> get(const std::string& text);
  void put(const std::string& text, const std::vector<float>& embedding);
  void clear();

  std::size_t size() const;
  std::size_t capacity() const {
    return capacity_;
  }

 private:
  struct Entry {
    std::vector<float> embedding;
    std::list<std::string>::iterator recency_it;
  };

  std::size_t capacity_;
  std::list<std::string> recency_;  // front is most recently used
  std::unordered_map<std::string, Entry> entries_;
  mutable std::mutex mutex_;
};

}  // namespace sage_core
