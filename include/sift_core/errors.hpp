#pragma once

#include <sqlite_modern_cpp.h>

#include <exception>
#include <string>

namespace sift_core {

// Coarse class of a storage failure, derived from the SQLite primary code.
enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  Full,
  // A wrong SQLCipher key surfaces as "file is not a database"
  NotADatabase,
  Schema,
  Generic
};

inline DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_NOTADB:
      return DbErrorKind::NotADatabase;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline std::string kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::Full: return "full";
    case DbErrorKind::NotADatabase: return "notadb";
    case DbErrorKind::Schema: return "schema";
    default: return "generic";
  }
}

// Raised when the backing store cannot complete an operation. Never swallowed
// by the store: an add that throws has not persisted anything.
class TaskStoreError : public std::exception {
 public:
  explicit TaskStoreError(const std::string &message, DbErrorKind kind = DbErrorKind::Generic)
      : message_(message), kind_(kind) {}

  // "<operation> failed: (<kind>) <sqlite message> [code=.., xcode=..]"
  TaskStoreError(const std::string &operation, const sqlite::sqlite_exception &e)
      : kind_(classify_sqlite_code(e.get_code())) {
    message_ = operation + " failed: (" + kind_to_string(kind_) + ") " + e.errstr() +
               " [code=" + std::to_string(e.get_code()) +
               ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  }

  const char *what() const noexcept override {
    return message_.c_str();
  }

  DbErrorKind kind() const noexcept {
    return kind_;
  }

  // Busy/locked failures may succeed when the caller tries again later.
  bool is_transient() const noexcept {
    return kind_ == DbErrorKind::BusyOrLocked;
  }

 private:
  std::string message_;
  DbErrorKind kind_;
};

// The store was opened with an embedding model whose vectors do not have the
// dimension of the vectors already stored (or of the index). Fatal: callers
// must not degrade to text search on this error.
class DimensionMismatchError : public TaskStoreError {
 public:
  DimensionMismatchError(size_t expected, size_t actual, const std::string &context)
      : TaskStoreError(context + ": vector dimension mismatch. Expected " +
                       std::to_string(expected) + ", got " + std::to_string(actual) + ".",
                       DbErrorKind::Schema),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const noexcept {
    return expected_;
  }
  size_t actual() const noexcept {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

}  // namespace sift_core
