#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/task_store.hpp"
#include "sift_services/task_batch.hpp"

namespace sift_services {

struct SkippedTask {
  sift_core::TaskCandidate candidate;
  sift_core::TaskRecord duplicate_of;  // carries the measured distance
};

struct IngestionOutcome {
  bool added = false;
  // The stored record when added, otherwise unset
  std::optional<sift_core::TaskRecord> record;
  std::optional<SkippedTask> skipped;
};

struct IngestionReport {
  std::vector<sift_core::TaskRecord> added;
  std::vector<SkippedTask> skipped;
};

// Ingestion-time duplicate suppression. Before a candidate is stored, its name
// is looked up with find_similar_tasks(name, 1); the candidate is dropped only
// when the nearest task carries a measured distance below the threshold. Text
// fallback results carry no distance and therefore never suppress anything.
class DeduplicationService {
 public:
  // Cosine distance below which two task names count as the same task. Tuned
  // for text-embedding-3-small; other models may want another value.
  static constexpr float DEFAULT_DUPLICATE_THRESHOLD = 0.1f;

  explicit DeduplicationService(std::shared_ptr<sift_core::TaskStore> task_store,
                                float duplicate_threshold = DEFAULT_DUPLICATE_THRESHOLD);

  std::optional<sift_core::TaskRecord> find_duplicate(const sift_core::TaskCandidate &candidate);

  IngestionOutcome ingest(const sift_core::TaskCandidate &candidate,
                          const std::optional<std::string> &email_context = std::nullopt);

  // Tasks are ingested in order, so a later entry is checked against those
  // added earlier in the same batch.
  IngestionReport ingest_batch(const std::vector<PendingTask> &tasks);

  bool is_duplicate(const sift_core::TaskRecord &nearest) const;

  float duplicate_threshold() const {
    return duplicate_threshold_;
  }

 private:
  std::shared_ptr<sift_core::TaskStore> task_store_;
  float duplicate_threshold_;
};

}  // namespace sift_services
