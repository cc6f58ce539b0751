#include "sift_core/search/vector_search_strategy.hpp"

#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "sift_core/errors.hpp"

namespace sift_core {

VectorSearchStrategy::VectorSearchStrategy(std::shared_ptr<TaskRepo> task_repo,
                                           std::shared_ptr<EmbeddingProvider> embedding_provider,
                                           std::shared_ptr<VectorIndex> vector_index,
                                           std::unique_ptr<SimilarityStrategy> fallback)
    : task_repo_(std::move(task_repo)),
      embedding_provider_(std::move(embedding_provider)),
      vector_index_(std::move(vector_index)),
      fallback_(std::move(fallback)) {
  if (!fallback_) {
    throw std::invalid_argument("VectorSearchStrategy requires a fallback strategy");
  }
}

std::vector<TaskRecord> VectorSearchStrategy::find_similar(const std::string &query, int limit) {
  if (limit <= 0) {
    return {};
  }

  // Surface an incompatible store before anything can fall back
  vector_index_->ensure_compatible();

  EmbeddingResult embedding = embedding_provider_->embed(query);
  if (!embedding.ok()) {
    if (embedding.status == EmbeddingStatus::TransientFailure) {
      std::cerr << "Warning: query embedding failed, using text search: "
                << embedding.error_message << std::endl;
    }
    return fallback_->find_similar(query, limit);
  }

  std::vector<VectorHit> hits;
  try {
    hits = vector_index_->top_k(embedding.vector, limit);
  } catch (const DimensionMismatchError &) {
    throw;
  } catch (const std::exception &e) {
    std::cerr << "Warning: vector search failed, using text search: " << e.what() << std::endl;
    return fallback_->find_similar(query, limit);
  }

  return hydrate(hits);
}

std::vector<TaskRecord> VectorSearchStrategy::hydrate(const std::vector<VectorHit> &hits) {
  if (hits.empty()) {
    return {};
  }

  std::vector<long long> ids;
  ids.reserve(hits.size());
  for (const auto &hit : hits) {
    ids.push_back(hit.id);
  }

  std::unordered_map<long long, TaskRecord> id_to_record;
  for (auto &record : task_repo_->get_tasks(ids)) {
    long long id = *record.id;
    id_to_record.emplace(id, std::move(record));
  }

  // Assemble results in the same order as the hits
  std::vector<TaskRecord> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    auto it = id_to_record.find(hit.id);
    if (it == id_to_record.end()) {
      std::cerr << "Warning: vector index returned task " << hit.id
                << " but no corresponding row exists" << std::endl;
      continue;
    }
    TaskRecord record = std::move(it->second);
    record.similarity_distance = hit.distance;
    results.push_back(std::move(record));
  }
  return results;
}

}  // namespace sift_core
