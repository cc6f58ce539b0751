#pragma once

#include <string>
#include <vector>

namespace sift_core {

enum class EmbeddingStatus {
  Ok,
  // No credential or model configured. Expected, not an error.
  Unavailable,
  // Configured, but this call failed (network, API or response error).
  TransientFailure
};

std::string to_string(EmbeddingStatus status);

struct EmbeddingResult {
  EmbeddingStatus status = EmbeddingStatus::Unavailable;
  std::vector<float> vector;
  std::string error_message;

  bool ok() const {
    return status == EmbeddingStatus::Ok;
  }

  static EmbeddingResult success(std::vector<float> vector) {
    return {EmbeddingStatus::Ok, std::move(vector), ""};
  }
  static EmbeddingResult unavailable() {
    return {EmbeddingStatus::Unavailable, {}, ""};
  }
  static EmbeddingResult transient_failure(const std::string &message) {
    return {EmbeddingStatus::TransientFailure, {}, message};
  }
};

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Turns text into a fixed-length vector. Implementations never retry and never
// throw from embed(): failures come back as a status so the store can degrade.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual EmbeddingResult embed(const std::string &text) = 0;

  // False when no credential/model is set; such a provider only ever returns
  // Unavailable and the store runs on text search.
  virtual bool is_configured() const = 0;

  // Fixed at construction for the lifetime of the provider.
  virtual int dimension() const = 0;

  virtual std::string model_name() const = 0;
};

// Always Unavailable. Used when embeddings are disabled or no key is set.
class NullEmbeddingProvider : public EmbeddingProvider {
 public:
  explicit NullEmbeddingProvider(int dimension = 1536) : dimension_(dimension) {}

  EmbeddingResult embed(const std::string & /*text*/) override {
    return EmbeddingResult::unavailable();
  }
  bool is_configured() const override {
    return false;
  }
  int dimension() const override {
    return dimension_;
  }
  std::string model_name() const override {
    return "";
  }

 private:
  int dimension_;
};

}  // namespace sift_core
