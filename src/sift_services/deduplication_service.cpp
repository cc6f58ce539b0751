#include "sift_services/deduplication_service.hpp"

#include <stdexcept>

namespace sift_services {

DeduplicationService::DeduplicationService(std::shared_ptr<sift_core::TaskStore> task_store,
                                           float duplicate_threshold)
    : task_store_(std::move(task_store)), duplicate_threshold_(duplicate_threshold) {
  if (!task_store_) {
    throw std::invalid_argument("DeduplicationService requires a task store");
  }
  if (!(duplicate_threshold_ > 0.0f && duplicate_threshold_ <= 2.0f)) {
    throw std::invalid_argument("Duplicate threshold must be in (0, 2]");
  }
}

bool DeduplicationService::is_duplicate(const sift_core::TaskRecord &nearest) const {
  return nearest.similarity_distance.has_value() &&
         *nearest.similarity_distance < duplicate_threshold_;
}

std::optional<sift_core::TaskRecord> DeduplicationService::find_duplicate(
    const sift_core::TaskCandidate &candidate) {
  auto nearest = task_store_->find_similar_tasks(candidate.name, 1);
  if (!nearest.empty() && is_duplicate(nearest.front())) {
    return nearest.front();
  }
  return std::nullopt;
}

IngestionOutcome DeduplicationService::ingest(const sift_core::TaskCandidate &candidate,
                                              const std::optional<std::string> &email_context) {
  IngestionOutcome outcome;
  if (auto duplicate = find_duplicate(candidate)) {
    outcome.skipped = SkippedTask{candidate, std::move(*duplicate)};
    return outcome;
  }
  outcome.record = task_store_->add_task(candidate, email_context);
  outcome.added = true;
  return outcome;
}

IngestionReport DeduplicationService::ingest_batch(const std::vector<PendingTask> &tasks) {
  IngestionReport report;
  for (const auto &pending : tasks) {
    IngestionOutcome outcome = ingest(pending.candidate, pending.email_context);
    if (outcome.added) {
      report.added.push_back(std::move(*outcome.record));
    } else {
      report.skipped.push_back(std::move(*outcome.skipped));
    }
  }
  return report;
}

}  // namespace sift_services
