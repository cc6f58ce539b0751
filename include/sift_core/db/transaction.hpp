#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace sift_core {

// Scoped BEGIN/COMMIT on one borrowed connection. Leaving the scope without
// commit() rolls the work back.
class Transaction {
 public:
  enum class Mode {
    Deferred,
    // Takes the write lock up front so two writers queue on busy_timeout
    // instead of failing on lock upgrade.
    Immediate
  };

  Transaction(sqlite::database& db, Mode mode) : db_(db) {
    db_ << (mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace sift_core
