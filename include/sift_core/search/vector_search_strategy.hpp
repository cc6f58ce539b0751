#pragma once

#include <memory>

#include "sift_core/db/task_repo.hpp"
#include "sift_core/embedding/embedding_provider.hpp"
#include "sift_core/search/similarity_strategy.hpp"
#include "sift_core/search/vector_index.hpp"

namespace sift_core {

// Embeds the query and searches the vector index. When the provider cannot
// produce a vector for this query, or the index fails, the call is answered by
// the fallback strategy instead. A dimension mismatch is never degraded: it
// propagates as DimensionMismatchError.
class VectorSearchStrategy : public SimilarityStrategy {
 public:
  VectorSearchStrategy(std::shared_ptr<TaskRepo> task_repo,
                       std::shared_ptr<EmbeddingProvider> embedding_provider,
                       std::shared_ptr<VectorIndex> vector_index,
                       std::unique_ptr<SimilarityStrategy> fallback);

  std::vector<TaskRecord> find_similar(const std::string &query, int limit) override;
  std::string name() const override {
    return "vector";
  }

 private:
  std::vector<TaskRecord> hydrate(const std::vector<VectorHit> &hits);

  std::shared_ptr<TaskRepo> task_repo_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::unique_ptr<SimilarityStrategy> fallback_;
};

}  // namespace sift_core
