#pragma once

#include "sage_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace sage_core {

class DatabaseManager {
 public:
  // Singleton access
  static DatabaseManager& get_instance();

  // Must be called once at application startup. Repeated calls are ignored
  // until shutdown() has run.
  void initialize(const std::filesystem::path& db_path, int pool_size);

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const;

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const std::filesystem::path& db_path);

  std::shared_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
  mutable std::mutex mtx_;
};

}  // namespace sage_core
