#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sage_core/embeddings/embedding_backend.hpp"
#include "sage_core/embeddings/embedding_cache.hpp"

namespace sage_core {

struct EmbeddingModelInfo {
  std::string name;
  bool initialized = false;
};

class EmbeddingService {
 public:
  static constexpr std::size_t DEFAULT_BATCH_SIZE = 50;

  EmbeddingService(std::shared_ptr<EmbeddingBackend> backend,
                   std::shared_ptr<EmbeddingCache> cache,
                   std::size_t batch_size = DEFAULT_BATCH_SIZE);

  EmbeddingService(const EmbeddingService &) = delete;
  EmbeddingService &operator=(const EmbeddingService &) = delete;

  // Loads the backend exactly once; concurrent callers wait for the same load.
  void initialize();

  // One unit-length vector per input, in input order.
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts);

  std::vector<float> embed_query(const std::string &text);

  void clear_cache();

  EmbeddingModelInfo model_info() const;

 private:
  std::vector<float> compute(const std::string &text);

  std::shared_ptr<EmbeddingBackend> backend_;
  std::shared_ptr<EmbeddingCache> cache_;
  std::size_t batch_size_;
  // Held for the whole load so concurrent first callers wait for one load
  std::mutex init_mtx_;
  std::atomic<bool> initialized_{false};
};

}  // namespace sage_core
