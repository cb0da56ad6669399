#include "sage_core/store/sqlite_vector_store.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>

#include "sage_core/db/pooled_connection.hpp"
#include "sage_core/db/sqlite_error_utils.hpp"
#include "sage_core/db/transaction.hpp"
#include "sage_core/services/compression_service.hpp"

namespace sage_core {

namespace {

int64_t now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ChunkMetadata parse_metadata(const std::string &text, const std::string &chunk_id) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    std::cerr << "Warning: Chunk " << chunk_id << " has unreadable metadata" << std::endl;
    return {};
  }
  return j.get<ChunkMetadata>();
}

std::string read_content(const std::vector<char> &blob) {
  if (CompressionService::is_compressed(blob)) {
    return CompressionService::decompress(blob);
  }
  return std::string(blob.begin(), blob.end());
}

}  // namespace

SqliteVectorStore::SqliteVectorStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::optional<SqliteVectorStore::CollectionRow> SqliteVectorStore::find_collection(
    sqlite::database &db, const std::string &name) {
  std::optional<CollectionRow> row;
  db << "SELECT id, dimension FROM collections WHERE name = ?" << name >>
      [&](int64_t id, int dimension) { row = CollectionRow{id, dimension}; };
  return row;
}

SqliteVectorStore::CollectionRow SqliteVectorStore::get_or_create_collection(
    sqlite::database &db, const std::string &name) {
  if (auto row = find_collection(db, name)) {
    return *row;
  }
  db << "INSERT INTO collections (name, dimension, created_at) VALUES (?, 0, ?)" << name
     << now_seconds();
  return CollectionRow{static_cast<int64_t>(db.last_insert_rowid()), 0};
}

void SqliteVectorStore::ensure_collection(const std::string &name) {
  validate_collection_name(name);
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR IGNORE INTO collections (name, dimension, created_at) VALUES (?, 0, ?)"
          << name << now_seconds();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("ensure_collection", e));
  }
  invalidate(name);
}

void SqliteVectorStore::upsert(const std::string &collection,
                               const std::vector<std::string> &ids,
                               const std::vector<std::vector<float>> &vectors,
                               const std::vector<std::string> &documents,
                               const std::vector<ChunkMetadata> &metadatas) {
  validate_collection_name(collection);
  if (ids.size() != vectors.size() || ids.size() != documents.size() ||
      ids.size() != metadatas.size()) {
    throw VectorStoreError("Upsert into '" + collection +
                           "' received sequences of different lengths");
  }
  if (ids.empty()) {
    return;
  }

  const size_t dimension = vectors.front().size();
  if (dimension == 0) {
    throw VectorStoreError("Cannot store empty vectors in '" + collection + "'");
  }
  for (const auto &vector : vectors) {
    if (vector.size() != dimension) {
      throw VectorStoreError("Vectors for '" + collection + "' have inconsistent dimensions");
    }
  }
  for (const auto &document : documents) {
    if (document.empty()) {
      throw VectorStoreError("Cannot store an empty chunk in '" + collection + "'");
    }
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    CollectionRow row = get_or_create_collection(*conn, collection);
    if (row.dimension == 0) {
      *conn << "UPDATE collections SET dimension = ? WHERE id = ?" << static_cast<int>(dimension)
            << row.id;
    } else if (static_cast<size_t>(row.dimension) != dimension) {
      throw VectorStoreError("Vector dimension mismatch for collection '" + collection +
                             "'. Expected " + std::to_string(row.dimension) + ", got " +
                             std::to_string(dimension));
    }

    auto statement = *conn << R"(
        INSERT INTO chunks (collection_id, chunk_id, content, metadata, vector_blob)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(collection_id, chunk_id) DO UPDATE SET
            content = excluded.content,
            metadata = excluded.metadata,
            vector_blob = excluded.vector_blob
      )";
    for (size_t i = 0; i < ids.size(); ++i) {
      statement << row.id << ids[i] << CompressionService::compress(documents[i])
                << nlohmann::json(metadatas[i]).dump() << vector_to_blob(vectors[i]);
      statement++;
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("upsert", e));
  }

  invalidate(collection);
}

QueryResult SqliteVectorStore::query(const std::string &collection,
                                     const std::vector<float> &vector,
                                     int top_k) {
  if (vector.empty()) {
    throw VectorStoreError("Query vector is empty");
  }
  if (top_k <= 0) {
    return {};
  }

  const uint64_t generation = current_generation(collection);
  std::optional<CollectionRow> row;
  try {
    PooledConnection conn(db_manager_);
    row = find_collection(*conn, collection);
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("query", e));
  }
  if (!row) {
    return {};
  }
  if (row->dimension != 0 && static_cast<size_t>(row->dimension) != vector.size()) {
    throw VectorStoreError("Query vector dimension mismatch for collection '" + collection +
                           "'. Expected " + std::to_string(row->dimension) + ", got " +
                           std::to_string(vector.size()));
  }

  auto index = get_index(collection, *row, generation);
  if (!index || index->index->ntotal == 0) {
    return {};
  }

  const int k = std::min<int64_t>(top_k, index->index->ntotal);
  std::vector<float> query_vector = vector;
  faiss::fvec_renorm_L2(query_vector.size(), 1, query_vector.data());

  std::vector<float> similarities(k);
  std::vector<faiss::idx_t> labels(k);
  faiss::SearchParametersHNSW params;
  params.efSearch = std::max(k, HNSW_EF_SEARCH_MIN);
  index->index->search(1, query_vector.data(), k, similarities.data(), labels.data(), &params);

  std::vector<int64_t> row_ids;
  row_ids.reserve(k);
  for (int i = 0; i < k; ++i) {
    if (labels[i] != -1) {
      row_ids.push_back(labels[i]);
    }
  }
  if (row_ids.empty()) {
    return {};
  }

  struct StoredChunk {
    std::string chunk_id;
    std::string content;
    ChunkMetadata metadata;
  };
  std::unordered_map<int64_t, StoredChunk> by_row_id;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, chunk_id, content, metadata FROM chunks WHERE id IN (" +
                 ids_to_comma_string(row_ids) + ")" >>
        [&](int64_t id, std::string chunk_id, std::vector<char> content, std::string metadata) {
          StoredChunk chunk;
          chunk.metadata = parse_metadata(metadata, chunk_id);
          chunk.content = read_content(content);
          chunk.chunk_id = std::move(chunk_id);
          by_row_id.emplace(id, std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("query", e));
  } catch (const CompressionError &e) {
    throw VectorStoreError(std::string("query failed: ") + e.what());
  }

  // Keep FAISS order, nearest first
  QueryResult result;
  for (int i = 0; i < k; ++i) {
    auto it = by_row_id.find(labels[i]);
    if (labels[i] == -1 || it == by_row_id.end()) {
      continue;
    }
    result.ids.push_back(it->second.chunk_id);
    result.documents.push_back(std::move(it->second.content));
    result.metadatas.push_back(std::move(it->second.metadata));
    result.distances.push_back(1.0 - static_cast<double>(similarities[i]));
    by_row_id.erase(it);
  }
  return result;
}

size_t SqliteVectorStore::remove(const std::string &collection, const std::vector<std::string> &ids) {
  if (ids.empty()) {
    return 0;
  }

  size_t removed = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    auto row = find_collection(*conn, collection);
    if (!row) {
      return 0;
    }
    for (const auto &id : ids) {
      *conn << "DELETE FROM chunks WHERE collection_id = ? AND chunk_id = ?" << row->id << id;
      removed += static_cast<size_t>(conn->rows_modified());
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("remove", e));
  }

  invalidate(collection);
  return removed;
}

std::vector<std::string> SqliteVectorStore::list_collections() {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(cache_mtx_);
    if (collection_names_) {
      return *collection_names_;
    }
    generation = names_generation_;
  }

  std::vector<std::string> names;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT name FROM collections ORDER BY name" >>
        [&](std::string name) { names.push_back(std::move(name)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("list_collections", e));
  }

  std::lock_guard<std::mutex> lock(cache_mtx_);
  if (names_generation_ == generation) {
    collection_names_ = names;
  }
  return names;
}

size_t SqliteVectorStore::stats(const std::string &collection) {
  int64_t count = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(c.id) FROM chunks c JOIN collections k ON c.collection_id = k.id "
             "WHERE k.name = ?"
          << collection >>
        count;
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("stats", e));
  }
  return static_cast<size_t>(count);
}

bool SqliteVectorStore::delete_collection(const std::string &name) {
  bool deleted = false;
  try {
    PooledConnection conn(db_manager_);
    // chunks go with it through ON DELETE CASCADE
    *conn << "DELETE FROM collections WHERE name = ?" << name;
    deleted = conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("delete_collection", e));
  }

  invalidate(name);
  return deleted;
}

StoredEntries SqliteVectorStore::entries(const std::string &collection) {
  StoredEntries result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.chunk_id, c.metadata FROM chunks c JOIN collections k "
             "ON c.collection_id = k.id WHERE k.name = ? ORDER BY c.id"
          << collection >>
        [&](std::string chunk_id, std::string metadata) {
          result.metadatas.push_back(parse_metadata(metadata, chunk_id));
          result.ids.push_back(std::move(chunk_id));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("entries", e));
  }
  return result;
}

std::shared_ptr<const SqliteVectorStore::CollectionIndex> SqliteVectorStore::get_index(
    const std::string &name, const CollectionRow &row, uint64_t generation) {
  {
    std::lock_guard<std::mutex> lock(cache_mtx_);
    auto it = indexes_.find(name);
    if (it != indexes_.end()) {
      return it->second;
    }
  }

  // Built outside the lock. A write that lands meanwhile bumps the generation, and the
  // index is then only used for this query, never cached.
  auto index = build_index(row);

  std::lock_guard<std::mutex> lock(cache_mtx_);
  if (generation_locked(name) == generation) {
    indexes_[name] = index;
  }
  return index;
}

uint64_t SqliteVectorStore::current_generation(const std::string &name) {
  std::lock_guard<std::mutex> lock(cache_mtx_);
  return generation_locked(name);
}

uint64_t SqliteVectorStore::generation_locked(const std::string &name) const {
  auto it = generations_.find(name);
  return it == generations_.end() ? 0 : it->second;
}

std::shared_ptr<const SqliteVectorStore::CollectionIndex> SqliteVectorStore::build_index(
    const CollectionRow &row) {
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  int dimension = row.dimension;

  try {
    // Scope the connection strictly to the DB fetch
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, vector_blob FROM chunks WHERE collection_id = ? ORDER BY id" << row.id >>
        [&](int64_t id, std::vector<char> vector_blob) {
          if (vector_blob.size() == static_cast<size_t>(dimension) * sizeof(float)) {
            faiss_ids.push_back(id);
            const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
            all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + dimension);
          } else {
            std::cerr << "Warning: Skipping chunk row " << id
                      << " during index build due to mismatched vector dimension. Expected "
                      << dimension * sizeof(float) << " bytes, got " << vector_blob.size()
                      << " bytes." << std::endl;
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("build_index", e));
  }

  auto result = std::make_shared<CollectionIndex>();
  result->dimension = dimension;
  if (dimension <= 0) {
    return result;
  }

  result->index.reset(create_base_index(dimension));
  if (!faiss_ids.empty()) {
    faiss::fvec_renorm_L2(dimension, faiss_ids.size(), all_vectors_flat.data());
    result->index->add_with_ids(faiss_ids.size(), all_vectors_flat.data(), faiss_ids.data());
  }
  std::cout << "Built vector index for collection " << row.id << " with " << faiss_ids.size()
            << " chunks" << std::endl;
  return result;
}

void SqliteVectorStore::invalidate(const std::string &name) {
  std::lock_guard<std::mutex> lock(cache_mtx_);
  indexes_.erase(name);
  ++generations_[name];
  collection_names_.reset();
  ++names_generation_;
}

faiss::IndexIDMap *SqliteVectorStore::create_base_index(int dimension) {
  auto base_index =
      new faiss::IndexHNSWFlat(dimension, HNSW_M_PARAM, faiss::METRIC_INNER_PRODUCT);
  base_index->hnsw.efConstruction = HNSW_EF_CONSTRUCTION_PARAM;
  // Wrap with IDMap to enable add_with_ids; the map owns the HNSW index
  auto id_map = new faiss::IndexIDMap(base_index);
  id_map->own_fields = true;
  return id_map;
}

std::vector<char> SqliteVectorStore::vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::string SqliteVectorStore::ids_to_comma_string(const std::vector<int64_t> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace sage_core
