#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "sift_core/embedding/embedding_provider_factory.hpp"
#include "sift_core/embedding/ollama_embedding_provider.hpp"
#include "sift_core/embedding/openai_embedding_provider.hpp"

namespace sift_cli {

class Config {
 public:
  std::string database_path;
  std::string database_key;
  int pool_size;

  std::string embedding_provider;
  std::string openai_api_key;
  std::string openai_base_url;
  std::string embedding_model;
  int embedding_dimension;
  std::string ollama_url;
  int embedding_timeout_seconds;

  float duplicate_threshold;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.database_path = json_config.value("database_path", std::string("./data/tasks.db"));
    config.database_key = json_config.value("database_key", std::string(""));
    config.embedding_provider = to_lower(json_config.value("embedding_provider", std::string("")));
    config.openai_api_key = json_config.value("openai_api_key", std::string(""));
    config.openai_base_url = json_config.value("openai_base_url", std::string("https://api.openai.com/v1"));
    config.embedding_model = json_config.value("embedding_model", std::string(""));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));

    // Handle numbers with default and basic type safety
    config.pool_size = int_or_default(json_config, "pool_size", 2);
    config.embedding_dimension = int_or_default(json_config, "embedding_dimension", 0);
    config.embedding_timeout_seconds = int_or_default(json_config, "embedding_timeout_seconds", 30);
    try {
      config.duplicate_threshold = json_config.value("duplicate_threshold", 0.1f);
    } catch (const std::exception&) {
      config.duplicate_threshold = 0.1f;
    }

    config.apply_model_defaults();
    config.validate();
    return config;
  }

  // Environment variables win over the file, under the names the task
  // extraction tooling already uses.
  void apply_environment() {
    override_from_env("DATABASE_PATH", database_path);
    override_from_env("SIFT_DB_KEY", database_key);
    override_from_env("EMBEDDING_PROVIDER", embedding_provider);
    override_from_env("OPENAI_API_KEY", openai_api_key);
    override_from_env("OPENAI_BASE_URL", openai_base_url);
    if (override_from_env("EMBEDDING_MODEL", embedding_model)) {
      model_defaulted_ = false;
    }
    override_from_env("OLLAMA_URL", ollama_url);
    embedding_provider = to_lower(embedding_provider);
    apply_model_defaults();
    validate();
  }

  sift_core::EmbeddingSettings embedding_settings() const {
    sift_core::EmbeddingSettings settings;
    settings.provider = embedding_provider;
    settings.openai_api_key = openai_api_key;
    settings.openai_base_url = openai_base_url;
    settings.embedding_model = embedding_model;
    settings.embedding_dimension = embedding_dimension;
    settings.ollama_url = ollama_url;
    settings.timeout_seconds = embedding_timeout_seconds;
    return settings;
  }

 private:
  // Set while the model or dimension came from the provider default, so a
  // provider chosen later through the environment picks its own default.
  bool model_defaulted_ = false;
  bool dimension_defaulted_ = false;

  void apply_model_defaults() {
    const bool ollama = embedding_provider == "ollama";
    if (embedding_model.empty() || model_defaulted_) {
      embedding_model = ollama ? sift_core::OllamaEmbeddingProvider::DEFAULT_MODEL
                               : sift_core::OpenAIEmbeddingProvider::DEFAULT_MODEL;
      model_defaulted_ = true;
    }
    if (embedding_dimension == 0 || dimension_defaulted_) {
      embedding_dimension = ollama ? sift_core::OllamaEmbeddingProvider::DEFAULT_DIMENSION
                                   : sift_core::OpenAIEmbeddingProvider::DEFAULT_DIMENSION;
      dimension_defaulted_ = true;
    }
  }

  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<int>();
      }
    } catch (const std::exception&) {
      // Fallback to default if wrong type provided
    }
    return fallback;
  }

  static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
  }

  static bool override_from_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
      target = value;
      return true;
    }
    return false;
  }

  void validate() const {
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_timeout_seconds <= 0) {
      throw std::runtime_error("embedding_timeout_seconds must be greater than 0");
    }
    if (!(duplicate_threshold > 0.0f && duplicate_threshold <= 2.0f)) {
      throw std::runtime_error("duplicate_threshold must be in (0, 2]");
    }
    if (embedding_provider != "" && embedding_provider != "openai" && embedding_provider != "ollama" &&
        embedding_provider != "deepseek" && embedding_provider != "none") {
      throw std::runtime_error("embedding_provider must be one of openai, ollama, deepseek, none");
    }
    if (embedding_provider == "ollama" && (ollama_url.empty() || embedding_model.empty())) {
      throw std::runtime_error("ollama_url and embedding_model are required for the ollama provider");
    }
  }
};

}  // namespace sift_cli
