#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sage_core/store/vector_store.hpp"
#include "sage_core/types/search.hpp"

namespace sage_core {

enum class RetrievalMode { SingleShot, Streaming };

inline std::string to_string(RetrievalMode mode) {
  return mode == RetrievalMode::SingleShot ? "single-shot" : "streaming";
}

// One step of the fallback policy: keep hits scoring at least `threshold` out of
// the nearest `limit * oversample` neighbours.
struct RetrievalTier {
  double threshold = 0.0;
  int oversample = 1;
};

/**
 * @class Retriever
 * @brief Similarity search with threshold relaxation.
 *
 * Tiers are tried in order and the first tier with at least one hit wins. Results
 * are sorted by score, highest first, with ties left in store order, and never
 * exceed the requested limit. An empty result means every tier came back empty.
 */
class Retriever {
 public:
  Retriever(std::shared_ptr<VectorStore> store, double default_threshold);

  std::vector<SearchResult> search(const std::string &collection,
                                   const std::vector<float> &query_vector,
                                   int limit,
                                   std::optional<double> requested_threshold,
                                   RetrievalMode mode) const;

  // Runs exactly one tier
  std::vector<SearchResult> search_tier(const std::string &collection,
                                        const std::vector<float> &query_vector,
                                        int limit,
                                        const RetrievalTier &tier) const;

  static std::vector<RetrievalTier> tiers_for(RetrievalMode mode,
                                              std::optional<double> requested_threshold,
                                              double default_threshold);

  double default_threshold() const {
    return default_threshold_;
  }

 private:
  std::shared_ptr<VectorStore> store_;
  double default_threshold_;
};

}  // namespace sage_core
