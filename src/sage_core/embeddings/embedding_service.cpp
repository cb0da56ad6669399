#include "sage_core/embeddings/embedding_service.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <iostream>
#include <utility>

#include "sage_core/errors.hpp"

namespace sage_core {

namespace {

// Scale to unit length so inner product equals cosine similarity
void normalize(std::vector<float> &vector) {
  double sum = 0.0;
  for (float value : vector) {
    sum += static_cast<double>(value) * value;
  }
  const double norm = std::sqrt(sum);
  if (!std::isfinite(norm) || norm == 0.0) {
    throw EmbeddingError("Embedding backend returned a degenerate vector (norm " +
                         std::to_string(norm) + ")");
  }
  for (float &value : vector) {
    value = static_cast<float>(value / norm);
  }
}

}  // namespace

EmbeddingService::EmbeddingService(std::shared_ptr<EmbeddingBackend> backend,
                                   std::shared_ptr<EmbeddingCache> cache,
                                   std::size_t batch_size)
    : backend_(std::move(backend)),
      cache_(cache ? std::move(cache) : std::make_shared<EmbeddingCache>()),
      batch_size_(batch_size == 0 ? DEFAULT_BATCH_SIZE : batch_size) {
  if (!backend_) {
    throw EmbeddingError("EmbeddingService requires an embedding backend");
  }
}

void EmbeddingService::initialize() {
  if (initialized_.load()) {
    return;
  }
  std::lock_guard<std::mutex> lock(init_mtx_);
  if (initialized_.load()) {
    return;
  }

  // A failed load leaves the service uninitialized, so the next call retries
  try {
    std::cout << "Initializing embedding model: " << backend_->model_name() << std::endl;
    backend_->load();
  } catch (const EmbeddingError &) {
    throw;
  } catch (const std::exception &e) {
    throw EmbeddingError("Embedding model initialization failed: " + std::string(e.what()));
  }
  initialized_.store(true);
  std::cout << "Embedding model initialized successfully" << std::endl;
}

std::vector<float> EmbeddingService::compute(const std::string &text) {
  std::vector<float> embedding = backend_->embed(text);
  if (embedding.empty()) {
    throw EmbeddingError("Embedding backend returned an empty vector");
  }
  normalize(embedding);
  return embedding;
}

std::vector<std::vector<float>> EmbeddingService::embed_batch(
    const std::vector<std::string> &texts) {
  initialize();

  std::vector<std::vector<float>> embeddings(texts.size());
  if (texts.empty()) {
    return embeddings;
  }

  const auto start_time = std::chrono::steady_clock::now();
  std::size_t computed = 0;
  std::cout << "Generating embeddings for " << texts.size() << " texts (batched)" << std::endl;

  for (std::size_t batch_start = 0; batch_start < texts.size(); batch_start += batch_size_) {
    const std::size_t batch_end = std::min(batch_start + batch_size_, texts.size());

    std::vector<std::pair<std::size_t, std::future<std::vector<float>>>> pending;
    for (std::size_t i = batch_start; i < batch_end; ++i) {
      if (auto cached = cache_->get(texts[i])) {
        embeddings[i] = std::move(*cached);
        continue;
      }
      const std::string &text = texts[i];
      pending.emplace_back(i, std::async(std::launch::async, [this, &text] { return compute(text); }));
    }

    // Join every task of the batch before reporting a failure
    std::exception_ptr first_error;
    for (auto &[index, future] : pending) {
      try {
        embeddings[index] = future.get();
        cache_->put(texts[index], embeddings[index]);
        ++computed;
      } catch (const std::exception &) {
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }

    if (first_error) {
      try {
        std::rethrow_exception(first_error);
      } catch (const EmbeddingError &) {
        throw;
      } catch (const std::exception &e) {
        throw EmbeddingError("Failed to generate embeddings: " + std::string(e.what()));
      }
    }

    if (batch_end % 100 == 0) {
      std::cout << "Processed " << batch_end << "/" << texts.size() << " embeddings" << std::endl;
    }
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start_time)
                           .count();
  std::cout << "Embedding generation completed in " << elapsed << "ms (" << texts.size()
            << " texts, " << computed << " computed)" << std::endl;
  return embeddings;
}

std::vector<float> EmbeddingService::embed_query(const std::string &text) {
  initialize();

  if (auto cached = cache_->get(text)) {
    return *cached;
  }
  try {
    std::vector<float> embedding = compute(text);
    cache_->put(text, embedding);
    return embedding;
  } catch (const EmbeddingError &) {
    throw;
  } catch (const std::exception &e) {
    throw EmbeddingError("Failed to generate query embedding: " + std::string(e.what()));
  }
}

void EmbeddingService::clear_cache() {
  cache_->clear();
  std::cout << "Embedding cache cleared" << std::endl;
}

EmbeddingModelInfo EmbeddingService::model_info() const {
  return {backend_->model_name(), initialized_.load()};
}

}  // namespace sage_core
