#pragma once

#include <string>
#include <vector>

#include "sift_core/embedding/embedding_provider.hpp"

namespace sift_core {

// Embeddings from a local Ollama server. The server being down is not a
// configuration problem: each call then reports TransientFailure.
class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr const char *DEFAULT_MODEL = "mxbai-embed-large";
  static constexpr int DEFAULT_DIMENSION = 1024;

  OllamaEmbeddingProvider(const std::string &ollama_url,
                          const std::string &embedding_model,
                          int dimension,
                          int timeout_seconds = 30);
  ~OllamaEmbeddingProvider() override = default;

  // Disable copy constructor and assignment
  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  EmbeddingResult embed(const std::string &text) override;
  bool is_configured() const override;
  int dimension() const override {
    return dimension_;
  }
  std::string model_name() const override {
    return embedding_model_;
  }

  virtual bool is_server_available();

  // Pulls the first embedding out of an /api/embed response body.
  // Throws EmbeddingError when the shape is unexpected.
  static std::vector<float> parse_embedding_response(const std::string &json_body);

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  int dimension_;

  void setup_server_connection(int timeout_seconds);
};

}  // namespace sift_core
