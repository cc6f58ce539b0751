#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "sift_core/db/connection_pool.hpp"

#include <stdexcept>

namespace sift_core {

std::unique_ptr<sqlite::database> open_connection(const ConnectionOptions& options) {
  auto db = std::make_unique<sqlite::database>(options.db_path);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Failed to get native database handle for " + options.db_path);
  }

  if (!options.db_key.empty() &&
      sqlite3_key(handle, options.db_key.c_str(), static_cast<int>(options.db_key.length())) !=
          SQLITE_OK) {
    throw std::runtime_error("Failed to key database: " + std::string(sqlite3_errmsg(handle)));
  }

  // The first read decrypts page 1, so a wrong key fails here
  *db << "SELECT count(*) FROM sqlite_master;";

  sqlite3_busy_timeout(handle, options.busy_timeout_ms);
  *db << "PRAGMA foreign_keys = ON;";
  // WAL lets readers in other processes proceed while one process writes
  *db << "PRAGMA journal_mode = WAL;";
  return db;
}

ConnectionPool::ConnectionPool(const ConnectionOptions& options, int pool_size)
    : options_(options) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    idle_.push(open_connection(options_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !idle_.empty(); });
  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  auto conn = std::move(idle_.front());
  idle_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!conn) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_) {
      return;  // conn closes here
    }
    idle_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(idle_);
  }
  cv_.notify_all();
}

size_t ConnectionPool::idle_count() {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace sift_core
