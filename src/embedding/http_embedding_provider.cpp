#include "sqlrag/embedding/http_embedding_provider.h"

#include "sqlrag/core/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace sqlrag::embedding {

std::string validate_embedding_config(const EmbeddingConfig& config) {
  if (config.dimension == 0) {
    return "embedding dimension must be greater than 0";
  }
  if (config.kind == EmbeddingProviderKind::kHttp) {
    if (config.base_url.empty()) {
      return "--embedding-url is required with --embedding http";
    }
    if (config.model.empty()) {
      return "--embedding-model must not be empty";
    }
    if (config.batch_size == 0) {
      return "embedding batch size must be greater than 0";
    }
    if (config.timeout_ms <= 0) {
      return "embedding timeout must be positive";
    }
  }
  return "";
}

HttpEmbeddingProvider::HttpEmbeddingProvider(net::IHttpClient& http, EmbeddingConfig config)
    : http_(http), config_(std::move(config)) {
  if (const auto problem = validate_embedding_config(config_); !problem.empty()) {
    throw std::invalid_argument("HttpEmbeddingProvider: " + problem);
  }
}

vector::Vector HttpEmbeddingProvider::embed_text(std::string_view text) const {
  auto vectors = request_chunk({std::string(text)});
  return std::move(vectors.front());
}

std::vector<vector::Vector> HttpEmbeddingProvider::embed_batch(
    const std::vector<std::string>& texts) const {
  std::vector<vector::Vector> out;
  out.reserve(texts.size());
  for (std::size_t start = 0; start < texts.size(); start += config_.batch_size) {
    const std::size_t end = std::min(texts.size(), start + config_.batch_size);
    const std::vector<std::string> chunk(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));
    auto vectors = request_chunk(chunk);
    out.insert(out.end(), std::make_move_iterator(vectors.begin()),
               std::make_move_iterator(vectors.end()));
  }
  return out;
}

std::vector<vector::Vector> HttpEmbeddingProvider::request_chunk(
    const std::vector<std::string>& texts) const {
  nlohmann::json body;
  body["model"] = config_.model;
  body["input"] = texts;

  net::HttpPostRequest request;
  request.url = net::join_url(config_.base_url, "embeddings");
  request.json_body = body.dump();
  request.timeout_ms = config_.timeout_ms;
  if (!config_.api_key.empty()) {
    request.headers.emplace_back("Authorization", "Bearer " + config_.api_key);
  }

  net::HttpResponse response;
  try {
    response = http_.post_json(request);
  } catch (const core::TransportError& e) {
    throw core::EmbeddingError(std::string("embedding service unavailable: ") + e.what());
  }
  if (response.status < 200 || response.status >= 300) {
    throw core::EmbeddingError("embedding service returned HTTP " +
                               std::to_string(response.status));
  }

  const auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (parsed.is_discarded() || !parsed.contains("data") || !parsed.at("data").is_array()) {
    throw core::EmbeddingError("embedding response is missing a data array");
  }

  const auto& data = parsed.at("data");
  if (data.size() != texts.size()) {
    throw core::EmbeddingError("embedding response has " + std::to_string(data.size()) +
                               " vectors for " + std::to_string(texts.size()) + " inputs");
  }

  std::vector<vector::Vector> out(texts.size());
  for (std::size_t pos = 0; pos < data.size(); ++pos) {
    const auto& item = data.at(pos);
    // Servers may reorder items; "index" is authoritative when present.
    const bool has_index = item.contains("index") && item.at("index").is_number_unsigned();
    const std::size_t slot = has_index ? item.at("index").get<std::size_t>() : pos;
    if (slot >= out.size() || !item.contains("embedding") || !item.at("embedding").is_array()) {
      throw core::EmbeddingError("embedding response item " + std::to_string(pos) +
                                 " is malformed");
    }
    vector::Vector v;
    try {
      v = item.at("embedding").get<vector::Vector>();
    } catch (const nlohmann::json::exception& e) {
      throw core::EmbeddingError(std::string("embedding values are not numeric: ") + e.what());
    }
    if (v.size() != config_.dimension) {
      throw core::EmbeddingError("embedding dimension " + std::to_string(v.size()) +
                                 " does not match configured " +
                                 std::to_string(config_.dimension));
    }
    if (!vector::l2_normalize(v)) {
      throw core::EmbeddingError("embedding service returned a zero vector");
    }
    out[slot] = std::move(v);
  }

  for (const auto& v : out) {
    if (v.empty()) {
      throw core::EmbeddingError("embedding response repeats an index");
    }
  }
  return out;
}

std::unique_ptr<IEmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config,
                                                            net::IHttpClient& http) {
  switch (config.kind) {
    case EmbeddingProviderKind::kStub:
      return std::make_unique<DeterministicStubEmbeddingProvider>(config.dimension);
    case EmbeddingProviderKind::kHttp:
      return std::make_unique<HttpEmbeddingProvider>(http, config);
  }
  return std::make_unique<DeterministicStubEmbeddingProvider>(config.dimension);
}

}  // namespace sqlrag::embedding
