#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sift_core/types/task.hpp"

namespace sift_services {

class TaskBatchError : public std::exception {
 public:
  explicit TaskBatchError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct PendingTask {
  sift_core::TaskCandidate candidate;
  std::optional<std::string> email_context;
};

// Tasks handed over by an extraction collaborator, in the shape
// {"tasks": [{"name", "priority", "due_date", "email_context"?}], "summary"}.
struct TaskBatch {
  std::vector<PendingTask> tasks;
  std::string summary;

  // Missing priority defaults to 2 (medium); missing due_date defaults to
  // `default_due_date`. Entries without a non-empty name are rejected.
  static TaskBatch from_json(const nlohmann::json &json, const std::string &default_due_date);
  static TaskBatch from_file(const std::string &filename, const std::string &default_due_date);
};

// Today's UTC date as YYYY-MM-DD.
std::string today_iso_date();

}  // namespace sift_services
