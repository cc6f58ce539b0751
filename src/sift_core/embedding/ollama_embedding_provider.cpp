#include "sift_core/embedding/ollama_embedding_provider.hpp"

#include <nlohmann/json.hpp>

#include <exception>

#include "ollama.hpp"

namespace sift_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string &ollama_url,
                                                 const std::string &embedding_model,
                                                 int dimension,
                                                 int timeout_seconds)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  setup_server_connection(timeout_seconds);
}

void OllamaEmbeddingProvider::setup_server_connection(int timeout_seconds) {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds);
  ollama::setWriteTimeout(timeout_seconds);
}

bool OllamaEmbeddingProvider::is_configured() const {
  return !ollama_url_.empty() && !embedding_model_.empty();
}

EmbeddingResult OllamaEmbeddingProvider::embed(const std::string &text) {
  if (!is_configured()) {
    return EmbeddingResult::unavailable();
  }
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    return EmbeddingResult::success(parse_embedding_response(response.as_json_string()));
  } catch (const ollama::exception &e) {
    return EmbeddingResult::transient_failure("Ollama embedding failed: " + std::string(e.what()));
  } catch (const EmbeddingError &e) {
    return EmbeddingResult::transient_failure(e.what());
  } catch (const nlohmann::json::exception &e) {
    // ollama-hpp serializes the prompt itself and rejects invalid UTF-8
    return EmbeddingResult::transient_failure("Failed to encode Ollama request: " +
                                              std::string(e.what()));
  } catch (const std::exception &e) {
    return EmbeddingResult::transient_failure("Ollama embedding failed: " + std::string(e.what()));
  }
}

std::vector<float> OllamaEmbeddingProvider::parse_embedding_response(const std::string &json_body) {
  nlohmann::json json_response;
  try {
    json_response = nlohmann::json::parse(json_body);
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Invalid JSON in embedding response: " + std::string(e.what()));
  }

  if (!json_response.contains("embeddings")) {
    throw EmbeddingError("Response does not contain embedding field");
  }

  // Handle different embedding response formats
  const auto &embeddings = json_response["embeddings"];
  if (!embeddings.is_array() || embeddings.empty()) {
    throw EmbeddingError("Embeddings field is not a non-empty array");
  }
  try {
    if (embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      return embeddings[0].get<std::vector<float>>();
    }
    // Single array of floats
    return embeddings.get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Embeddings field is not numeric: " + std::string(e.what()));
  }
}

bool OllamaEmbeddingProvider::is_server_available() {
  try {
    return ollama::is_running();
  } catch (const ollama::exception &e) {
    return false;
  }
}

}  // namespace sift_core
