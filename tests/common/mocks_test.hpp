#pragma once

#include <gmock/gmock.h>

#include <atomic>
#include <cctype>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "sift_core/embedding/embedding_provider.hpp"

namespace sift_tests {

/**
 * Mock class for EmbeddingProvider to use in tests
 */
class MockEmbeddingProvider : public sift_core::EmbeddingProvider {
 public:
  explicit MockEmbeddingProvider(int dimension = 8) {
    ON_CALL(*this, is_configured()).WillByDefault(testing::Return(true));
    ON_CALL(*this, dimension()).WillByDefault(testing::Return(dimension));
    ON_CALL(*this, model_name()).WillByDefault(testing::Return("mock-embed"));
    ON_CALL(*this, embed(testing::_))
        .WillByDefault(testing::Return(sift_core::EmbeddingResult::unavailable()));
  }

  MOCK_METHOD(sift_core::EmbeddingResult, embed, (const std::string& text), (override));
  MOCK_METHOD(bool, is_configured, (), (const, override));
  MOCK_METHOD(int, dimension, (), (const, override));
  MOCK_METHOD(std::string, model_name, (), (const, override));
};

/**
 * Deterministic provider: each lowercase word adds weight to one hashed
 * bucket, so texts sharing words point in similar directions. Exact texts can
 * be pinned to a chosen vector.
 */
class FakeEmbeddingProvider : public sift_core::EmbeddingProvider {
 public:
  enum class Mode { Ok, Unavailable, Transient };

  explicit FakeEmbeddingProvider(int dimension = 16, std::string model = "fake-embed")
      : dimension_(dimension), model_(std::move(model)) {}

  sift_core::EmbeddingResult embed(const std::string& text) override {
    ++calls_;
    std::lock_guard<std::mutex> lock(mutex_);
    switch (mode_) {
      case Mode::Unavailable:
        return sift_core::EmbeddingResult::unavailable();
      case Mode::Transient:
        return sift_core::EmbeddingResult::transient_failure("fake provider offline");
      case Mode::Ok:
        break;
    }
    auto it = overrides_.find(text);
    if (it != overrides_.end()) {
      return sift_core::EmbeddingResult::success(it->second);
    }
    return sift_core::EmbeddingResult::success(bag_of_words(text));
  }

  bool is_configured() const override {
    return true;
  }
  int dimension() const override {
    return dimension_;
  }
  std::string model_name() const override {
    return model_;
  }

  void set_mode(Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
  }

  void set_override(const std::string& text, std::vector<float> vector) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[text] = std::move(vector);
  }

  int calls() const {
    return calls_.load();
  }

 private:
  std::vector<float> bag_of_words(const std::string& text) const {
    std::vector<float> vector(dimension_, 0.0f);
    std::stringstream ss(text);
    std::string word;
    std::hash<std::string> hasher;
    while (ss >> word) {
      for (auto& c : word) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      vector[hasher(word) % dimension_] += 1.0f;
    }
    return vector;
  }

  int dimension_;
  std::string model_;
  Mode mode_ = Mode::Ok;
  std::map<std::string, std::vector<float>> overrides_;
  std::atomic<int> calls_{0};
  mutable std::mutex mutex_;
};

namespace MockUtilities {

// Unit vector along `axis`, optionally tilted towards `tilt_axis` by `tilt`.
inline std::vector<float> axis_vector(int dimension, int axis, int tilt_axis = -1,
                                      float tilt = 0.0f) {
  std::vector<float> vector(dimension, 0.0f);
  vector[axis] = 1.0f;
  if (tilt_axis >= 0) {
    vector[tilt_axis] = tilt;
  }
  return vector;
}

}  // namespace MockUtilities

}  // namespace sift_tests
