#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/db/database_manager.hpp"
#include "sift_core/db/task_repo.hpp"
#include "sift_core/embedding/embedding_provider.hpp"
#include "sift_core/search/similarity_strategy.hpp"
#include "sift_core/search/vector_index.hpp"

namespace sift_core {

// Durable task collection with semantic near-duplicate lookup.
//
// With a configured embedding provider the store embeds every added task,
// keeps the vectors in an in-memory index rebuilt from the database at
// construction, and answers find_similar_tasks by cosine distance. Without one
// it answers by substring match. Either way persistence failures propagate as
// TaskStoreError and embedding failures never block a write.
class TaskStore {
 public:
  static constexpr int DEFAULT_SIMILAR_LIMIT = 5;
  static constexpr int DEFAULT_RECENT_LIMIT = 10;

  // The database manager must already be initialized.
  TaskStore(DatabaseManager &db_manager, std::shared_ptr<EmbeddingProvider> embedding_provider);

  // Disable copy constructor and assignment
  TaskStore(const TaskStore &) = delete;
  TaskStore &operator=(const TaskStore &) = delete;

  // Persists the candidate with a store-assigned id and created_at. Throws
  // std::invalid_argument for an empty name, DimensionMismatchError when the
  // provider's vectors do not fit this store, TaskStoreError when the row
  // cannot be written.
  TaskRecord add_task(const TaskCandidate &candidate,
                      const std::optional<std::string> &email_context = std::nullopt);

  std::vector<TaskRecord> find_similar_tasks(const std::string &query,
                                             int limit = DEFAULT_SIMILAR_LIMIT);

  // Newest first, ties broken by higher id. No similarity scoring.
  std::vector<TaskRecord> get_recent_tasks(int limit = DEFAULT_RECENT_LIMIT);

  std::optional<TaskRecord> get_task(long long id);

  // Removes the row and its index entry. @returns whether a row existed
  bool delete_task(long long id);

  // Tasks carry no status, so completing a task deletes it.
  bool complete_task(long long id);

  long long count_tasks();

  // Reloads every stored vector into a fresh index. Vectors whose dimension
  // differs from the provider's mark the index incompatible.
  void rebuild_index();

  bool semantic_search_enabled() const {
    return vector_index_ != nullptr;
  }
  std::string strategy_name() const;

 private:
  std::shared_ptr<TaskRepo> task_repo_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<VectorIndex> vector_index_;  // null in text-only mode
  std::unique_ptr<SimilarityStrategy> similarity_strategy_;

  std::vector<float> try_embed(const std::string &text);
};

}  // namespace sift_core
