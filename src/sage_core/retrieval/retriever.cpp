#include "sage_core/retrieval/retriever.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "sage_core/errors.hpp"

namespace sage_core {

namespace {
constexpr double kSingleShotCeiling = 0.2;
constexpr double kSingleShotFallback = 0.1;
constexpr double kStreamingDefault = 0.1;
constexpr double kStreamingFallback = 0.05;

int candidate_count(int limit, int oversample) {
  const int64_t wanted = static_cast<int64_t>(limit) * oversample;
  return static_cast<int>(std::min<int64_t>(wanted, std::numeric_limits<int>::max()));
}
}  // namespace

Retriever::Retriever(std::shared_ptr<VectorStore> store, double default_threshold)
    : store_(std::move(store)), default_threshold_(default_threshold) {
  if (!store_) {
    throw std::invalid_argument("Retriever requires a vector store");
  }
}

std::vector<RetrievalTier> Retriever::tiers_for(RetrievalMode mode,
                                                std::optional<double> requested_threshold,
                                                double default_threshold) {
  if (mode == RetrievalMode::SingleShot) {
    double first = std::min(default_threshold, kSingleShotCeiling);
    if (requested_threshold) {
      first = std::min(first, *requested_threshold);
    }
    return {{first, 2}, {kSingleShotFallback, 1}};
  }
  return {{requested_threshold.value_or(kStreamingDefault), 5},
          {kStreamingFallback, 10},
          {0.0, 1}};
}

std::vector<SearchResult> Retriever::search(const std::string &collection,
                                            const std::vector<float> &query_vector,
                                            int limit,
                                            std::optional<double> requested_threshold,
                                            RetrievalMode mode) const {
  if (limit <= 0) {
    throw ValidationError("Result limit must be positive");
  }

  const auto tiers = tiers_for(mode, requested_threshold, default_threshold_);
  for (size_t i = 0; i < tiers.size(); ++i) {
    auto results = search_tier(collection, query_vector, limit, tiers[i]);
    std::cout << "Retrieval (" << to_string(mode) << ") tier " << i + 1 << " in '" << collection
              << "': " << results.size() << " results with threshold " << tiers[i].threshold
              << std::endl;
    if (!results.empty()) {
      return results;
    }
  }
  return {};
}

std::vector<SearchResult> Retriever::search_tier(const std::string &collection,
                                                 const std::vector<float> &query_vector,
                                                 int limit,
                                                 const RetrievalTier &tier) const {
  QueryResult hits;
  try {
    hits = store_->query(collection, query_vector, candidate_count(limit, tier.oversample));
  } catch (const RetrievalError &) {
    throw;
  } catch (const std::exception &e) {
    throw RetrievalError("Vector store query failed: " + std::string(e.what()));
  }

  if (hits.documents.size() != hits.size() || hits.metadatas.size() != hits.size() ||
      hits.distances.size() != hits.size()) {
    throw RetrievalError("Vector store returned a malformed result for '" + collection + "'");
  }

  std::vector<SearchResult> results;
  for (size_t i = 0; i < hits.size(); ++i) {
    // Distances are cosine distances; float error can push the score just past 1
    const double score = std::min(1.0, 1.0 - hits.distances[i]);
    if (score < tier.threshold) {
      continue;
    }
    results.push_back({hits.documents[i], score, hits.metadatas[i]});
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const SearchResult &a, const SearchResult &b) { return a.score > b.score; });
  if (results.size() > static_cast<size_t>(limit)) {
    results.resize(limit);
  }
  return results;
}

}  // namespace sage_core
