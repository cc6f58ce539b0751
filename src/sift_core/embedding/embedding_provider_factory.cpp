#include "sift_core/embedding/embedding_provider_factory.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "sift_core/embedding/ollama_embedding_provider.hpp"
#include "sift_core/embedding/openai_embedding_provider.hpp"

namespace sift_core {

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::shared_ptr<EmbeddingProvider> make_openai(const EmbeddingSettings &settings) {
  return std::make_shared<OpenAIEmbeddingProvider>(
      settings.openai_api_key, settings.openai_base_url, settings.embedding_model,
      settings.embedding_dimension, settings.timeout_seconds);
}

}  // namespace

std::shared_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingSettings &settings) {
  const std::string provider = to_lower(settings.provider);
  const bool has_openai_key = !settings.openai_api_key.empty();

  if (provider == "none") {
    std::cout << "Embeddings disabled; duplicate detection uses text matching" << std::endl;
    return std::make_shared<NullEmbeddingProvider>(settings.embedding_dimension);
  }

  if (provider == "ollama") {
    auto ollama = std::make_shared<OllamaEmbeddingProvider>(
        settings.ollama_url, settings.embedding_model, settings.embedding_dimension,
        settings.timeout_seconds);
    if (!ollama->is_server_available()) {
      std::cerr << "Warning: Ollama server is not reachable at " << settings.ollama_url
                << "; similarity queries will fall back to text matching until it is" << std::endl;
    }
    std::cout << "Using Ollama for embeddings (" << settings.embedding_model << ")" << std::endl;
    return ollama;
  }

  if (provider == "openai" || (provider.empty() && has_openai_key)) {
    if (!has_openai_key) {
      std::cerr << "Warning: OpenAI embeddings selected but no API key is set; "
                   "duplicate detection will use text matching"
                << std::endl;
      return std::make_shared<NullEmbeddingProvider>(settings.embedding_dimension);
    }
    std::cout << "Using OpenAI for embeddings (" << settings.embedding_model << ")" << std::endl;
    return make_openai(settings);
  }

  if (provider == "deepseek") {
    if (has_openai_key) {
      std::cerr << "Warning: DeepSeek has no embedding models, falling back to OpenAI for "
                   "embeddings"
                << std::endl;
      return make_openai(settings);
    }
    std::cerr << "Warning: DeepSeek has no embedding models and no OpenAI key is set; "
                 "duplicate detection will use text matching"
              << std::endl;
    return std::make_shared<NullEmbeddingProvider>(settings.embedding_dimension);
  }

  if (provider.empty()) {
    return std::make_shared<NullEmbeddingProvider>(settings.embedding_dimension);
  }

  throw std::invalid_argument("Unknown embedding provider: " + settings.provider);
}

}  // namespace sift_core
