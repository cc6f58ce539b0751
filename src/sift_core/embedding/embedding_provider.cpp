#include "sift_core/embedding/embedding_provider.hpp"

namespace sift_core {

std::string to_string(EmbeddingStatus status) {
  switch (status) {
    case EmbeddingStatus::Ok:
      return "OK";
    case EmbeddingStatus::Unavailable:
      return "UNAVAILABLE";
    case EmbeddingStatus::TransientFailure:
      return "TRANSIENT_FAILURE";
    default:
      return "UNKNOWN";
  }
}

}  // namespace sift_core
