#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sift_core {

// Priority convention used by task producers. The store accepts any integer.
enum class TaskPriority { High = 1, Medium = 2, Low = 3 };

// Renders 1/2/3 as HIGH/MEDIUM/LOW and anything else as UNKNOWN.
std::string priority_to_string(int priority);

// A task as produced by an extraction collaborator, before the store has seen it.
struct TaskCandidate {
  std::string name;
  int priority = static_cast<int>(TaskPriority::Medium);
  std::string due_date;  // YYYY-MM-DD, opaque to the store
};

struct TaskRecord {
  std::optional<long long> id;
  std::string name;
  int priority = static_cast<int>(TaskPriority::Medium);
  std::string due_date;
  std::string created_at;
  std::optional<std::string> email_context;
  // Empty when the embedding provider did not produce a vector.
  std::vector<float> embedding;
  // Only set on results of a vector similarity search.
  std::optional<float> similarity_distance;

  bool has_embedding() const {
    return !embedding.empty();
  }
};

// Text handed to the embedding provider for a task: the name, enriched with
// the originating context when one is present.
std::string embedding_text(const std::string& name, const std::optional<std::string>& context);

}  // namespace sift_core
