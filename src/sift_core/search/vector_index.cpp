#include "sift_core/search/vector_index.hpp"

#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "sift_core/errors.hpp"

namespace sift_core {

VectorIndex::VectorIndex(int dimension) : dimension_(dimension) {
  if (dimension_ <= 0) {
    throw std::invalid_argument("Vector index dimension must be greater than 0");
  }
  auto base_index = new faiss::IndexFlatIP(dimension_);
  index_ = std::make_unique<faiss::IndexIDMap>(base_index);
  // The id map deletes the flat index with itself
  index_->own_fields = true;
}

void VectorIndex::add(long long id, const std::vector<float> &vector) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_compatible_locked();
  check_dimension(vector.size(), "VectorIndex::add");
  std::vector<float> unit = normalized(vector);
  faiss::idx_t faiss_id = static_cast<faiss::idx_t>(id);
  index_->add_with_ids(1, unit.data(), &faiss_id);
}

bool VectorIndex::remove(long long id) {
  std::lock_guard<std::mutex> lock(mutex_);
  faiss::idx_t faiss_id = static_cast<faiss::idx_t>(id);
  faiss::IDSelectorBatch selector(1, &faiss_id);
  return index_->remove_ids(selector) > 0;
}

std::vector<VectorHit> VectorIndex::top_k(const std::vector<float> &query, int k) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_compatible_locked();
  check_dimension(query.size(), "VectorIndex::top_k");

  int actual_k = std::min(k, static_cast<int>(index_->ntotal));
  if (actual_k <= 0) {
    return {};
  }

  std::vector<float> unit = normalized(query);
  std::vector<float> similarities(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  index_->search(1, unit.data(), actual_k, similarities.data(), labels.data());

  std::vector<VectorHit> hits;
  hits.reserve(actual_k);
  for (int i = 0; i < actual_k; ++i) {
    if (labels[i] == -1) {
      continue;
    }
    // Rounding can push the similarity of identical vectors just past 1
    float distance = std::clamp(1.0f - similarities[i], 0.0f, 2.0f);
    hits.push_back({static_cast<long long>(labels[i]), distance});
  }
  // FAISS returns best-first already; keep ties stable and explicit
  std::stable_sort(hits.begin(), hits.end(), [](const VectorHit &a, const VectorHit &b) {
    return a.distance < b.distance;
  });
  return hits;
}

void VectorIndex::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  index_->reset();
  incompatible_dimension_.reset();
}

size_t VectorIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(index_->ntotal);
}

void VectorIndex::mark_incompatible(size_t stored_dimension) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!incompatible_dimension_) {
    incompatible_dimension_ = stored_dimension;
  }
}

std::optional<size_t> VectorIndex::incompatible_dimension() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return incompatible_dimension_;
}

void VectorIndex::ensure_compatible() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_compatible_locked();
}

void VectorIndex::ensure_compatible_locked() const {
  if (incompatible_dimension_) {
    throw DimensionMismatchError(*incompatible_dimension_, static_cast<size_t>(dimension_),
                                 "Task store holds embeddings from another model");
  }
}

void VectorIndex::check_dimension(size_t actual, const char *operation) const {
  if (actual != static_cast<size_t>(dimension_)) {
    throw DimensionMismatchError(static_cast<size_t>(dimension_), actual, operation);
  }
}

std::vector<float> VectorIndex::normalized(const std::vector<float> &vector) const {
  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  norm = std::sqrt(norm);
  std::vector<float> unit(vector);
  // A zero vector has no direction; it stays zero and scores distance 1
  if (norm > 0.0) {
    for (float &v : unit) {
      v = static_cast<float>(v / norm);
    }
  }
  return unit;
}

}  // namespace sift_core
