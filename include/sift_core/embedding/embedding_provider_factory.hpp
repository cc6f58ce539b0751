#pragma once

#include <memory>
#include <string>

#include "sift_core/embedding/embedding_provider.hpp"

namespace sift_core {

struct EmbeddingSettings {
  // "", "openai", "ollama", "deepseek" or "none". Empty picks OpenAI when a
  // key is present and disables embeddings otherwise.
  std::string provider;
  std::string openai_api_key;
  std::string openai_base_url = "https://api.openai.com/v1";
  std::string embedding_model = "text-embedding-3-small";
  int embedding_dimension = 1536;
  std::string ollama_url = "http://localhost:11434";
  int timeout_seconds = 30;
};

// Picks the provider for the settings. DeepSeek has no embedding model, so it
// borrows OpenAI when an OpenAI key exists. Never returns null: missing
// credentials yield a NullEmbeddingProvider. Throws std::invalid_argument on
// an unknown provider name.
std::shared_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingSettings &settings);

}  // namespace sift_core
