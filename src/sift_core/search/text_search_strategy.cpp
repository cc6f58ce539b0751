#include "sift_core/search/text_search_strategy.hpp"

namespace sift_core {

TextSearchStrategy::TextSearchStrategy(std::shared_ptr<TaskRepo> task_repo)
    : task_repo_(std::move(task_repo)) {}

std::vector<TaskRecord> TextSearchStrategy::find_similar(const std::string &query, int limit) {
  std::vector<TaskRecord> results = task_repo_->search_tasks_by_name(query, limit);
  for (auto &record : results) {
    record.similarity_distance.reset();
  }
  return results;
}

}  // namespace sift_core
