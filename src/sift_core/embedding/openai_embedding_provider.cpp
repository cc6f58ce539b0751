#include "sift_core/embedding/openai_embedding_provider.hpp"

#include <curl/curl.h>

#include <memory>

namespace sift_core {

namespace {

struct CurlHandleDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlHeadersDeleter {
  void operator()(curl_slist *headers) const {
    curl_slist_free_all(headers);
  }
};

}  // namespace

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(const std::string &api_key,
                                                 const std::string &base_url,
                                                 const std::string &embedding_model,
                                                 int dimension,
                                                 int timeout_seconds)
    : api_key_(api_key),
      base_url_(base_url),
      embedding_model_(embedding_model),
      dimension_(dimension),
      timeout_seconds_(timeout_seconds) {
  // Tolerate a trailing slash in the configured base URL
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

nlohmann::json OpenAIEmbeddingProvider::build_request(const std::string &text) const {
  nlohmann::json request = {{"model", embedding_model_}, {"input", text}};
  // Only the text-embedding-3 family accepts a requested output size
  if (embedding_model_.rfind("text-embedding-3", 0) == 0) {
    request["dimensions"] = dimension_;
  }
  return request;
}

EmbeddingResult OpenAIEmbeddingProvider::embed(const std::string &text) {
  if (!is_configured()) {
    return EmbeddingResult::unavailable();
  }
  try {
    // Task text often comes from mail bodies that are not valid UTF-8
    std::string request_body =
        build_request(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::string body = post_json(base_url_ + "/embeddings", request_body);
    return EmbeddingResult::success(parse_embedding_response(body));
  } catch (const EmbeddingError &e) {
    return EmbeddingResult::transient_failure(e.what());
  } catch (const nlohmann::json::exception &e) {
    return EmbeddingResult::transient_failure("Failed to encode embedding request: " +
                                              std::string(e.what()));
  }
}

std::vector<float> OpenAIEmbeddingProvider::parse_embedding_response(const std::string &json_body) {
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(json_body);
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Invalid JSON in embedding response: " + std::string(e.what()));
  }

  if (response.contains("error")) {
    const auto &error = response["error"];
    std::string message = error.is_object() ? error.value("message", std::string("unknown error"))
                                            : error.dump();
    throw EmbeddingError("Embedding API error: " + message);
  }

  if (!response.contains("data") || !response["data"].is_array() || response["data"].empty()) {
    throw EmbeddingError("Response does not contain a data array");
  }
  const auto &first = response["data"][0];
  if (!first.contains("embedding") || !first["embedding"].is_array()) {
    throw EmbeddingError("Response data does not contain an embedding array");
  }
  try {
    return first["embedding"].get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Embedding array is not numeric: " + std::string(e.what()));
  }
}

size_t OpenAIEmbeddingProvider::write_callback(void *contents, size_t size, size_t nmemb,
                                               std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string OpenAIEmbeddingProvider::post_json(const std::string &url,
                                               const std::string &body) const {
  // One handle per call keeps concurrent add/find_similar calls independent
  std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
  if (!curl) {
    throw EmbeddingError("Failed to initialize CURL");
  }

  curl_slist *raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  std::string auth_header = "Authorization: Bearer " + api_key_;
  raw_headers = curl_slist_append(raw_headers, auth_header.c_str());
  std::unique_ptr<curl_slist, CurlHeadersDeleter> headers(raw_headers);

  std::string response_buffer;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw EmbeddingError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    std::string detail;
    try {
      parse_embedding_response(response_buffer);
    } catch (const EmbeddingError &e) {
      detail = std::string(": ") + e.what();
    }
    throw EmbeddingError("HTTP request failed with status code " + std::to_string(http_code) +
                         detail);
  }

  return response_buffer;
}

}  // namespace sift_core
