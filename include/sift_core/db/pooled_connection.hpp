#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "sift_core/db/database_manager.hpp"
#include "sift_core/errors.hpp"

namespace sift_core {

// Borrows one connection for one logical unit of work and hands it back on
// destruction. A connection is never shared between two guards. Failing to
// borrow (store shut down or never opened) is reported as TaskStoreError.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager) : manager_(manager) {
    try {
      conn_ = manager_.get_connection();
    } catch (const std::runtime_error& e) {
      throw TaskStoreError(std::string("acquire connection failed: ") + e.what(),
                           DbErrorKind::CantOpen);
    }
  }

  ~PooledConnection() {
    manager_.return_connection(std::move(conn_));
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database* operator->() const {
    return conn_.get();
  }
  sqlite::database& operator*() const {
    return *conn_;
  }

 private:
  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace sift_core
