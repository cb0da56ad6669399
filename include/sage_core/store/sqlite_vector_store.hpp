#pragma once

#include <faiss/IndexHNSW.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sage_core/db/database_manager.hpp"
#include "sage_core/store/vector_store.hpp"

namespace sage_core {

/**
 * @class SqliteVectorStore
 * @brief VectorStore persisted in SQLite and searched through an in-memory FAISS index.
 *
 * Every collection gets its own HNSW inner-product index, built from the chunks
 * table the first time the collection is queried. Writes to a collection drop its
 * cached index so the next query rebuilds it, and an index built concurrently with
 * a write is never cached. Vectors are L2-normalized before indexing, which makes
 * the reported distance the cosine distance.
 */
class SqliteVectorStore : public VectorStore {
 public:
  static constexpr int HNSW_M_PARAM = 32;
  static constexpr int HNSW_EF_CONSTRUCTION_PARAM = 80;
  static constexpr int HNSW_EF_SEARCH_MIN = 64;

  explicit SqliteVectorStore(DatabaseManager &db_manager);
  ~SqliteVectorStore() override = default;

  SqliteVectorStore(const SqliteVectorStore &) = delete;
  SqliteVectorStore &operator=(const SqliteVectorStore &) = delete;

  void ensure_collection(const std::string &name) override;

  void upsert(const std::string &collection,
              const std::vector<std::string> &ids,
              const std::vector<std::vector<float>> &vectors,
              const std::vector<std::string> &documents,
              const std::vector<ChunkMetadata> &metadatas) override;

  QueryResult query(const std::string &collection,
                    const std::vector<float> &vector,
                    int top_k) override;

  size_t remove(const std::string &collection, const std::vector<std::string> &ids) override;

  std::vector<std::string> list_collections() override;

  size_t stats(const std::string &collection) override;

  bool delete_collection(const std::string &name) override;

  StoredEntries entries(const std::string &collection) override;

 private:
  struct CollectionRow {
    int64_t id = 0;
    int dimension = 0;
  };

  struct CollectionIndex {
    std::unique_ptr<faiss::IndexIDMap> index;
    int dimension = 0;
  };

  std::optional<CollectionRow> find_collection(sqlite::database &db, const std::string &name);
  CollectionRow get_or_create_collection(sqlite::database &db, const std::string &name);

  std::shared_ptr<const CollectionIndex> get_index(const std::string &name,
                                                   const CollectionRow &row,
                                                   uint64_t generation);
  std::shared_ptr<const CollectionIndex> build_index(const CollectionRow &row);

  void invalidate(const std::string &name);
  uint64_t current_generation(const std::string &name);
  uint64_t generation_locked(const std::string &name) const;

  static faiss::IndexIDMap *create_base_index(int dimension);
  static std::vector<char> vector_to_blob(const std::vector<float> &vector);
  static std::string ids_to_comma_string(const std::vector<int64_t> &ids);

  DatabaseManager &db_manager_;

  std::mutex cache_mtx_;
  std::optional<std::vector<std::string>> collection_names_;
  uint64_t names_generation_ = 0;
  std::unordered_map<std::string, std::shared_ptr<const CollectionIndex>> indexes_;
  // Bumped by every write to a collection; a cache fill only lands if it is unchanged
  std::unordered_map<std::string, uint64_t> generations_;
};

}  // namespace sage_core
