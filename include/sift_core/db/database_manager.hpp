#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "sift_core/db/connection_pool.hpp"

namespace sift_core {

// Process-wide owner of the task database: schema bootstrap plus the pool
// every repository borrows from.
class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // Must be called once at application startup. Creates the parent
  // directory and the schema when absent, then fills the pool. A second call
  // while initialized is a no-op.
  void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

  // Idempotent: creates missing tables and indexes, never drops or rewrites
  // existing ones. Safe to run from several processes against one file.
  void ensure_schema();

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const {
    return is_initialized_;
  }
  const std::filesystem::path& db_path() const {
    return db_path_;
  }

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  static void setup_schema(const ConnectionOptions& options);

  std::unique_ptr<ConnectionPool> pool_;
  std::filesystem::path db_path_;
  ConnectionOptions options_;
  bool is_initialized_ = false;
};

}  // namespace sift_core
