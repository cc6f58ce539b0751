#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace sift_core {

struct ConnectionOptions {
  std::string db_path;
  // SQLCipher passphrase. Empty leaves the file unencrypted.
  std::string db_key;
  // How long a statement waits on a lock held by another process before
  // reporting SQLITE_BUSY.
  int busy_timeout_ms = 5000;
};

// Opens a connection, applies the key and the pragmas every connection needs.
// Throws std::runtime_error (or sqlite::sqlite_exception) on failure, in
// particular when the key does not open the file.
std::unique_ptr<sqlite::database> open_connection(const ConnectionOptions& options);

// Fixed-size set of open connections handed out one at a time.
class ConnectionPool {
 public:
  ConnectionPool(const ConnectionOptions& options, int pool_size);

  // Blocks until a connection is free. Throws once the pool is shut down.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);

  // Closes idle connections and wakes every waiter. Connections still
  // borrowed are closed when they come back.
  void shutdown();

  size_t idle_count();

 private:
  ConnectionOptions options_;
  bool shutting_down_ = false;
  std::queue<std::unique_ptr<sqlite::database>> idle_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace sift_core
