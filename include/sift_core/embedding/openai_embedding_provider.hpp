#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sift_core/embedding/embedding_provider.hpp"

namespace sift_core {

// Embeddings from an OpenAI-compatible /embeddings endpoint over libcurl.
// Without an API key the provider is unconfigured and embed() returns
// Unavailable without touching the network.
class OpenAIEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr const char *DEFAULT_BASE_URL = "https://api.openai.com/v1";
  static constexpr const char *DEFAULT_MODEL = "text-embedding-3-small";
  static constexpr int DEFAULT_DIMENSION = 1536;

  OpenAIEmbeddingProvider(const std::string &api_key,
                          const std::string &base_url = DEFAULT_BASE_URL,
                          const std::string &embedding_model = DEFAULT_MODEL,
                          int dimension = DEFAULT_DIMENSION,
                          int timeout_seconds = 30);

  OpenAIEmbeddingProvider(const OpenAIEmbeddingProvider &) = delete;
  OpenAIEmbeddingProvider &operator=(const OpenAIEmbeddingProvider &) = delete;

  EmbeddingResult embed(const std::string &text) override;
  bool is_configured() const override {
    return !api_key_.empty() && !embedding_model_.empty();
  }
  int dimension() const override {
    return dimension_;
  }
  std::string model_name() const override {
    return embedding_model_;
  }

  nlohmann::json build_request(const std::string &text) const;

  // Extracts data[0].embedding. Throws EmbeddingError on an error payload or
  // an unexpected shape.
  static std::vector<float> parse_embedding_response(const std::string &json_body);

 private:
  std::string api_key_;
  std::string base_url_;
  std::string embedding_model_;
  int dimension_;
  long timeout_seconds_;

  // Performs the POST; throws EmbeddingError on transport or HTTP failure.
  std::string post_json(const std::string &url, const std::string &body) const;
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace sift_core
