#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sage_core/errors.hpp"
#include "sage_core/types/chunk.hpp"

namespace sage_core {

class VectorStoreError : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
};

// Nearest neighbours of one query vector, nearest first. distances are cosine
// distances (1 - cosine similarity).
struct QueryResult {
  std::vector<std::string> ids;
  std::vector<std::string> documents;
  std::vector<ChunkMetadata> metadatas;
  std::vector<double> distances;

  size_t size() const {
    return ids.size();
  }
  bool empty() const {
    return ids.empty();
  }
};

struct StoredEntries {
  std::vector<std::string> ids;
  std::vector<ChunkMetadata> metadatas;
};

/**
 * @class VectorStore
 * @brief Named collections of chunk vectors with nearest-neighbour lookup.
 *
 * Collections are created lazily by upsert(). Querying a collection that does not
 * exist is not an error and yields an empty result.
 */
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  virtual void ensure_collection(const std::string &name) = 0;

  // Inserts or replaces chunks by id. All five sequences must have the same length.
  virtual void upsert(const std::string &collection,
                      const std::vector<std::string> &ids,
                      const std::vector<std::vector<float>> &vectors,
                      const std::vector<std::string> &documents,
                      const std::vector<ChunkMetadata> &metadatas) = 0;

  virtual QueryResult query(const std::string &collection,
                            const std::vector<float> &vector,
                            int top_k) = 0;

  // Returns the number of chunks actually removed
  virtual size_t remove(const std::string &collection, const std::vector<std::string> &ids) = 0;

  virtual std::vector<std::string> list_collections() = 0;

  virtual size_t stats(const std::string &collection) = 0;

  // Returns false when no collection had that name
  virtual bool delete_collection(const std::string &name) = 0;

  virtual StoredEntries entries(const std::string &collection) = 0;
};

// Collection names are 1 to 63 characters of [A-Za-z0-9_.-]
void validate_collection_name(const std::string &name);

}  // namespace sage_core
