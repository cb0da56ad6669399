#include "sage_core/db/connection_pool.hpp"

#include <stdexcept>

namespace sage_core {

namespace {

// Every pooled connection enforces cascades and waits out short write locks
std::unique_ptr<sqlite::database> open_connection(const std::string& db_path) {
  auto db = std::make_unique<sqlite::database>(db_path);
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA synchronous = NORMAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

}  // namespace

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size) : db_path_(db_path) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be positive, got " +
                                std::to_string(pool_size));
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_connection(db_path_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });
  if (shutting_down_) {
    throw std::runtime_error("Connection pool for " + db_path_ + " is shut down");
  }

  auto conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!conn) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    // After shutdown the connection is simply closed here
    if (shutting_down_) {
      return;
    }
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(pool_);
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

}  // namespace sage_core
