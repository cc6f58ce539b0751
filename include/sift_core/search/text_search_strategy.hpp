#pragma once

#include <memory>

#include "sift_core/db/task_repo.hpp"
#include "sift_core/search/similarity_strategy.hpp"

namespace sift_core {

// Substring match on task names, newest first. Results carry no
// similarity_distance. Matching is ASCII case-insensitive (SQLite LIKE).
class TextSearchStrategy : public SimilarityStrategy {
 public:
  explicit TextSearchStrategy(std::shared_ptr<TaskRepo> task_repo);

  std::vector<TaskRecord> find_similar(const std::string &query, int limit) override;
  std::string name() const override {
    return "text";
  }

 private:
  std::shared_ptr<TaskRepo> task_repo_;
};

}  // namespace sift_core
