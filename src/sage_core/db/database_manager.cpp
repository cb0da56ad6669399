#include "sage_core/db/database_manager.hpp"

#include <stdexcept>

namespace sage_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema(db_path);

  // 2. Create the connection pool for request handlers to share
  pool_ = std::make_shared<ConnectionPool>(db_path.string(), pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return is_initialized_;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!is_initialized_) {
      throw std::runtime_error("DatabaseManager has not been initialized.");
    }
    pool = pool_;
  }
  // Waiting happens outside the manager lock so returns are never blocked
  return pool->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!is_initialized_) {
      return;
    }
    pool = pool_;
  }
  pool->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS collections (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          name TEXT UNIQUE NOT NULL,
          dimension INTEGER NOT NULL,
          created_at INTEGER NOT NULL
      )
    )";

  // chunk content is zstd compressed, metadata is a JSON object
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          collection_id INTEGER NOT NULL,
          chunk_id TEXT NOT NULL,
          content BLOB NOT NULL,
          metadata TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          FOREIGN KEY (collection_id) REFERENCES collections(id) ON DELETE CASCADE,
          UNIQUE (collection_id, chunk_id)
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_collection
      ON chunks(collection_id)
    )";
}

}  // namespace sage_core
