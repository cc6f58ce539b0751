#include "sift_core/db/database_manager.hpp"

#include <stdexcept>

#include "sift_core/db/transaction.hpp"

namespace sift_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  ConnectionOptions options;
  options.db_path = db_path.string();
  options.db_key = db_key;

  // Schema first, on a private connection, so pooled connections never see a
  // half-created schema
  setup_schema(options);
  pool_ = std::make_unique<ConnectionPool>(options, pool_size);

  db_path_ = db_path;
  options_ = options;
  is_initialized_ = true;
}

void DatabaseManager::ensure_schema() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  setup_schema(options_);
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const ConnectionOptions& options) {
  auto db = open_connection(options);
  Transaction tx(*db, Transaction::Mode::Immediate);

  *db << R"(
      CREATE TABLE IF NOT EXISTS tasks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          name TEXT NOT NULL,
          priority INTEGER NOT NULL,
          due_date TEXT NOT NULL,
          created_at TEXT NOT NULL,
          email_context TEXT,
          embedding BLOB
      )
    )";

  // Serves get_recent_tasks and the recency order of text search
  *db << R"(
      CREATE INDEX IF NOT EXISTS idx_tasks_created_at
      ON tasks(created_at, id)
    )";

  // Records the embedding dimension and model the stored vectors were written with
  *db << R"(
      CREATE TABLE IF NOT EXISTS store_meta (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";

  tx.commit();
}

}  // namespace sift_core
