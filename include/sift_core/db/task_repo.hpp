#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/db/database_manager.hpp"
#include "sift_core/errors.hpp"
#include "sift_core/types/task.hpp"

namespace sift_core {

// A vector as read back from the tasks table, before it is checked against
// the dimension the index expects.
struct StoredEmbedding {
  long long task_id;
  std::vector<float> vector;
};

// SQL access to the tasks table. Every method borrows its own pooled
// connection and reports failures as TaskStoreError.
class TaskRepo {
 public:
  static constexpr const char *META_EMBEDDING_DIMENSION = "embedding_dimension";
  static constexpr const char *META_EMBEDDING_MODEL = "embedding_model";

  explicit TaskRepo(DatabaseManager &db_manager);

  // Inserts the row (and, when an embedding is given, records its dimension
  // and model in store_meta if not recorded yet) in one transaction.
  // @returns the new row id
  long long insert_task(const TaskCandidate &candidate,
                        const std::optional<std::string> &email_context,
                        const std::string &created_at,
                        const std::vector<float> &embedding = {},
                        const std::string &embedding_model = "");

  std::optional<TaskRecord> get_task(long long id);

  // Rows for the given ids, in no particular order. Missing ids are skipped.
  std::vector<TaskRecord> get_tasks(const std::vector<long long> &ids);

  std::vector<TaskRecord> get_recent_tasks(int limit);

  // Literal, ASCII case-insensitive substring match on name, newest first.
  std::vector<TaskRecord> search_tasks_by_name(const std::string &query, int limit);

  // @returns whether a row existed
  bool delete_task(long long id);

  long long count_tasks();

  std::vector<StoredEmbedding> load_embeddings();

  std::optional<std::string> get_meta(const std::string &key);

  // Current UTC time as YYYY-MM-DDTHH:MM:SS.ffffffZ. Lexicographic order of
  // these strings is chronological order.
  static std::string now_timestamp();
  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);

  // Escapes LIKE wildcards so the pattern matches the query literally.
  static std::string escape_like(const std::string &query);

  static std::vector<char> vector_to_blob(const std::vector<float> &vector);
  static std::vector<float> blob_to_vector(const std::vector<char> &blob);

 private:
  DatabaseManager &db_manager_;

  static std::string int_vector_to_comma_string(const std::vector<long long> &ids);
};

}  // namespace sift_core
