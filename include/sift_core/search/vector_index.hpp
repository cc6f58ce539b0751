#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sift_core {

struct VectorHit {
  long long id;
  float distance;  // cosine distance, 0 = same direction, 2 = opposite
};

// In-memory nearest-neighbour index over task embeddings.
//
// Vectors are L2-normalised on the way in and searched with an exact
// inner-product index, so the inner product is the cosine similarity and the
// reported distance is 1 - similarity. A flat index supports remove_ids, which
// keeps the index free of entries for deleted rows without a rebuild.
//
// Thread-safe: every operation takes the index mutex.
class VectorIndex {
 public:
  explicit VectorIndex(int dimension);
  ~VectorIndex() = default;

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Throws DimensionMismatchError when the vector has the wrong size.
  void add(long long id, const std::vector<float> &vector);

  // @returns whether an entry was removed
  bool remove(long long id);

  // Closest first. An empty index yields an empty list. Throws
  // DimensionMismatchError on a wrong-size query or when the index was marked
  // incompatible with the stored vectors.
  std::vector<VectorHit> top_k(const std::vector<float> &query, int k) const;

  void clear();
  size_t size() const;
  int dimension() const {
    return dimension_;
  }

  // Records that the backing store holds vectors of another dimension. From
  // then on searches and inserts fail loudly instead of returning partial
  // results.
  void mark_incompatible(size_t stored_dimension);
  std::optional<size_t> incompatible_dimension() const;

  // Throws DimensionMismatchError if mark_incompatible was called.
  void ensure_compatible() const;

 private:
  std::vector<float> normalized(const std::vector<float> &vector) const;
  void check_dimension(size_t actual, const char *operation) const;
  void ensure_compatible_locked() const;

  const int dimension_;
  std::unique_ptr<faiss::IndexIDMap> index_;
  std::optional<size_t> incompatible_dimension_;
  mutable std::mutex mutex_;
};

}  // namespace sift_core
