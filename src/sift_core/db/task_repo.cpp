#include "sift_core/db/task_repo.hpp"

#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "sift_core/db/pooled_connection.hpp"
#include "sift_core/db/transaction.hpp"

namespace sift_core {

namespace {

// Column list shared by every read that builds a TaskRecord without its vector
constexpr const char *kTaskColumns =
    "id, name, priority, due_date, created_at, email_context";

TaskRecord make_record(long long id, std::string name, int priority, std::string due_date,
                       std::string created_at, std::optional<std::string> email_context) {
  TaskRecord record;
  record.id = id;
  record.name = std::move(name);
  record.priority = priority;
  record.due_date = std::move(due_date);
  record.created_at = std::move(created_at);
  record.email_context = std::move(email_context);
  return record;
}

}  // namespace

TaskRepo::TaskRepo(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::string TaskRepo::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                std::chrono::seconds(1);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
     << std::setfill('0') << micros.count() << 'Z';
  return ss.str();
}

std::string TaskRepo::now_timestamp() {
  return time_point_to_string(std::chrono::system_clock::now());
}

std::string TaskRepo::escape_like(const std::string &query) {
  std::string escaped;
  escaped.reserve(query.size());
  for (char c : query) {
    if (c == '%' || c == '_' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

std::vector<char> TaskRepo::vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> TaskRepo::blob_to_vector(const std::vector<char> &blob) {
  if (blob.size() % sizeof(float) != 0) {
    throw TaskStoreError("Corrupt embedding blob of " + std::to_string(blob.size()) + " bytes",
                         DbErrorKind::Schema);
  }
  std::vector<float> vector(blob.size() / sizeof(float));
  if (!vector.empty()) {
    std::memcpy(vector.data(), blob.data(), blob.size());
  }
  return vector;
}

long long TaskRepo::insert_task(const TaskCandidate &candidate,
                                const std::optional<std::string> &email_context,
                                const std::string &created_at,
                                const std::vector<float> &embedding,
                                const std::string &embedding_model) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);

    if (!embedding.empty()) {
      *conn << "INSERT INTO tasks (name, priority, due_date, created_at, email_context, "
               "embedding) VALUES (?, ?, ?, ?, ?, ?)"
            << candidate.name << candidate.priority << candidate.due_date << created_at
            << email_context << vector_to_blob(embedding);
    } else {
      *conn << "INSERT INTO tasks (name, priority, due_date, created_at, email_context) "
               "VALUES (?, ?, ?, ?, ?)"
            << candidate.name << candidate.priority << candidate.due_date << created_at
            << email_context;
    }
    long long id = conn->last_insert_rowid();

    if (!embedding.empty()) {
      // First writer wins; later rows must match what is recorded here
      *conn << "INSERT OR IGNORE INTO store_meta (key, value) VALUES (?, ?)"
            << std::string(META_EMBEDDING_DIMENSION) << std::to_string(embedding.size());
      if (!embedding_model.empty()) {
        *conn << "INSERT OR IGNORE INTO store_meta (key, value) VALUES (?, ?)"
              << std::string(META_EMBEDDING_MODEL) << embedding_model;
      }
    }

    tx.commit();
    return id;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("insert_task", e);
  }
}

std::optional<TaskRecord> TaskRepo::get_task(long long id) {
  try {
    std::optional<TaskRecord> result;
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kTaskColumns + ", embedding FROM tasks WHERE id = ?"
          << id >>
        [&](long long id, std::string name, int priority, std::string due_date,
            std::string created_at, std::optional<std::string> email_context,
            std::optional<std::vector<char>> embedding_blob) {
          TaskRecord record = make_record(id, std::move(name), priority, std::move(due_date),
                                          std::move(created_at), std::move(email_context));
          if (embedding_blob) {
            record.embedding = blob_to_vector(*embedding_blob);
          }
          result = std::move(record);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("get_task", e);
  }
}

std::vector<TaskRecord> TaskRepo::get_tasks(const std::vector<long long> &ids) {
  std::vector<TaskRecord> tasks;
  if (ids.empty()) {
    return tasks;
  }

  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id IN (" +
                 int_vector_to_comma_string(ids) + ")" >>
        [&](long long id, std::string name, int priority, std::string due_date,
            std::string created_at, std::optional<std::string> email_context) {
          tasks.push_back(make_record(id, std::move(name), priority, std::move(due_date),
                                      std::move(created_at), std::move(email_context)));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("get_tasks", e);
  }
  return tasks;
}

std::vector<TaskRecord> TaskRepo::get_recent_tasks(int limit) {
  std::vector<TaskRecord> tasks;
  if (limit <= 0) {
    return tasks;
  }

  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kTaskColumns +
                 " FROM tasks ORDER BY created_at DESC, id DESC LIMIT ?"
          << limit >>
        [&](long long id, std::string name, int priority, std::string due_date,
            std::string created_at, std::optional<std::string> email_context) {
          tasks.push_back(make_record(id, std::move(name), priority, std::move(due_date),
                                      std::move(created_at), std::move(email_context)));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("get_recent_tasks", e);
  }
  return tasks;
}

std::vector<TaskRecord> TaskRepo::search_tasks_by_name(const std::string &query, int limit) {
  std::vector<TaskRecord> tasks;
  if (limit <= 0) {
    return tasks;
  }

  try {
    PooledConnection conn(db_manager_);
    std::string pattern = "%" + escape_like(query) + "%";
    *conn << std::string("SELECT ") + kTaskColumns +
                 " FROM tasks WHERE name LIKE ? ESCAPE '\\' "
                 "ORDER BY created_at DESC, id DESC LIMIT ?"
          << pattern << limit >>
        [&](long long id, std::string name, int priority, std::string due_date,
            std::string created_at, std::optional<std::string> email_context) {
          tasks.push_back(make_record(id, std::move(name), priority, std::move(due_date),
                                      std::move(created_at), std::move(email_context)));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("search_tasks_by_name", e);
  }
  return tasks;
}

bool TaskRepo::delete_task(long long id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM tasks WHERE id = ?" << id;
    return sqlite3_changes(conn->connection().get()) > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("delete_task", e);
  }
}

long long TaskRepo::count_tasks() {
  try {
    long long count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM tasks" >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("count_tasks", e);
  }
}

std::vector<StoredEmbedding> TaskRepo::load_embeddings() {
  std::vector<StoredEmbedding> embeddings;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, embedding FROM tasks WHERE embedding IS NOT NULL ORDER BY id" >>
        [&](long long id, std::vector<char> blob) {
          embeddings.push_back({id, blob_to_vector(blob)});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("load_embeddings", e);
  }
  return embeddings;
}

std::optional<std::string> TaskRepo::get_meta(const std::string &key) {
  try {
    std::optional<std::string> value;
    PooledConnection conn(db_manager_);
    *conn << "SELECT value FROM store_meta WHERE key = ?" << key >>
        [&](std::string v) { value = std::move(v); };
    return value;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskStoreError("get_meta", e);
  }
}

std::string TaskRepo::int_vector_to_comma_string(const std::vector<long long> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace sift_core
