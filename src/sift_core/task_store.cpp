#include "sift_core/task_store.hpp"

#include <iostream>
#include <stdexcept>

#include "sift_core/errors.hpp"
#include "sift_core/search/text_search_strategy.hpp"
#include "sift_core/search/vector_search_strategy.hpp"

namespace sift_core {

TaskStore::TaskStore(DatabaseManager &db_manager,
                     std::shared_ptr<EmbeddingProvider> embedding_provider)
    : task_repo_(std::make_shared<TaskRepo>(db_manager)),
      embedding_provider_(embedding_provider ? std::move(embedding_provider)
                                             : std::make_shared<NullEmbeddingProvider>()) {
  if (embedding_provider_->is_configured()) {
    vector_index_ = std::make_shared<VectorIndex>(embedding_provider_->dimension());
    similarity_strategy_ = std::make_unique<VectorSearchStrategy>(
        task_repo_, embedding_provider_, vector_index_,
        std::make_unique<TextSearchStrategy>(task_repo_));
    rebuild_index();
  } else {
    similarity_strategy_ = std::make_unique<TextSearchStrategy>(task_repo_);
  }
}

std::string TaskStore::strategy_name() const {
  return similarity_strategy_->name();
}

void TaskStore::rebuild_index() {
  if (!vector_index_) {
    return;
  }
  vector_index_->clear();

  const size_t expected = static_cast<size_t>(vector_index_->dimension());

  // The recorded dimension catches a model change even before any row is read
  auto recorded = task_repo_->get_meta(TaskRepo::META_EMBEDDING_DIMENSION);
  if (recorded) {
    size_t recorded_dimension = 0;
    try {
      recorded_dimension = static_cast<size_t>(std::stoul(*recorded));
    } catch (const std::exception &) {
      throw TaskStoreError("Corrupt embedding_dimension in store_meta: " + *recorded,
                           DbErrorKind::Schema);
    }
    if (recorded_dimension != expected) {
      vector_index_->mark_incompatible(recorded_dimension);
    }
  }

  size_t loaded = 0;
  for (const auto &stored : task_repo_->load_embeddings()) {
    if (stored.vector.size() != expected) {
      vector_index_->mark_incompatible(stored.vector.size());
      continue;
    }
    if (!vector_index_->incompatible_dimension()) {
      vector_index_->add(stored.task_id, stored.vector);
      ++loaded;
    }
  }

  if (auto stale = vector_index_->incompatible_dimension()) {
    std::cerr << "Warning: task store holds " << *stale << "-dimension embeddings but the "
              << "provider produces " << expected << "; similarity queries will fail" << std::endl;
  } else if (loaded > 0) {
    std::cout << "Loaded " << loaded << " task embeddings into the vector index" << std::endl;
  }
}

std::vector<float> TaskStore::try_embed(const std::string &text) {
  EmbeddingResult result = embedding_provider_->embed(text);
  switch (result.status) {
    case EmbeddingStatus::Ok:
      if (result.vector.size() != static_cast<size_t>(vector_index_->dimension())) {
        throw DimensionMismatchError(static_cast<size_t>(vector_index_->dimension()),
                                     result.vector.size(), "add_task");
      }
      return std::move(result.vector);
    case EmbeddingStatus::TransientFailure:
      std::cerr << "Warning: error generating embedding, storing task without one: "
                << result.error_message << std::endl;
      return {};
    case EmbeddingStatus::Unavailable:
    default:
      return {};
  }
}

TaskRecord TaskStore::add_task(const TaskCandidate &candidate,
                               const std::optional<std::string> &email_context) {
  if (candidate.name.empty()) {
    throw std::invalid_argument("Task name cannot be empty");
  }

  std::vector<float> embedding;
  if (vector_index_) {
    vector_index_->ensure_compatible();
    // No store state is held while the provider call is in flight
    embedding = try_embed(embedding_text(candidate.name, email_context));
  }

  std::string created_at = TaskRepo::now_timestamp();
  long long id = task_repo_->insert_task(candidate, email_context, created_at, embedding,
                                         embedding.empty() ? "" : embedding_provider_->model_name());

  if (!embedding.empty()) {
    vector_index_->add(id, embedding);
  }

  TaskRecord record;
  record.id = id;
  record.name = candidate.name;
  record.priority = candidate.priority;
  record.due_date = candidate.due_date;
  record.created_at = created_at;
  record.email_context = email_context;
  record.embedding = std::move(embedding);
  return record;
}

std::vector<TaskRecord> TaskStore::find_similar_tasks(const std::string &query, int limit) {
  return similarity_strategy_->find_similar(query, limit);
}

std::vector<TaskRecord> TaskStore::get_recent_tasks(int limit) {
  return task_repo_->get_recent_tasks(limit);
}

std::optional<TaskRecord> TaskStore::get_task(long long id) {
  return task_repo_->get_task(id);
}

bool TaskStore::delete_task(long long id) {
  bool deleted = task_repo_->delete_task(id);
  if (deleted && vector_index_) {
    vector_index_->remove(id);
  }
  return deleted;
}

bool TaskStore::complete_task(long long id) {
  return delete_task(id);
}

long long TaskStore::count_tasks() {
  return task_repo_->count_tasks();
}

}  // namespace sift_core
