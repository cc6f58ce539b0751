#pragma once

#include <string>
#include <vector>

#include "sift_core/types/task.hpp"

namespace sift_core {

// How the task store answers find_similar. Chosen once, when the store is
// constructed, from whether an embedding provider is configured.
class SimilarityStrategy {
 public:
  virtual ~SimilarityStrategy() = default;

  // Closest (or, for text search, most recent) first, at most `limit` records.
  virtual std::vector<TaskRecord> find_similar(const std::string &query, int limit) = 0;

  virtual std::string name() const = 0;
};

}  // namespace sift_core
