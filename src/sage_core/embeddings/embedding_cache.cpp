#include "sage_core/embeddings/embedding_cache.hpp"

namespace sage_core {

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(text);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  recency_.splice(recency_.begin(), recency_, it->second.recency_it);
  return it->second.embedding;
}

void EmbeddingCache::put(const std::string& text, const std::vector<float>& embedding) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(text);
  if (it != entries_.end()) {
    it->second.embedding = embedding;
    recency_.splice(recency_.begin(), recency_, it->second.recency_it);
    return;
  }

  if (capacity_ > 0 && entries_.size() >= capacity_) {
    entries_.erase(recency_.back());
    recency_.pop_back();
  }
  recency_.push_front(text);
  entries_.emplace(text, Entry{embedding, recency_.begin()});
}

void EmbeddingCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  recency_.clear();
}

std::size_t EmbeddingCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace sage_core
