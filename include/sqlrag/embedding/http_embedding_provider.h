#pragma once

#include "sqlrag/embedding/embedding_config.h"
#include "sqlrag/embedding/embedding_provider.h"
#include "sqlrag/net/http_client.h"

#include <memory>

namespace sqlrag::embedding {

// HttpEmbeddingProvider calls POST {base_url}/embeddings with {"model", "input": [...]}.
// Responses are re-normalized client-side, so servers that return raw vectors still
// satisfy the unit-norm contract. Every failure (transport, non-2xx status, malformed
// body, wrong dimension) is reported as core::EmbeddingError.
class HttpEmbeddingProvider final : public IEmbeddingProvider {
 public:
  // http must outlive the provider.
  HttpEmbeddingProvider(net::IHttpClient& http, EmbeddingConfig config);

  [[nodiscard]] vector::Vector embed_text(std::string_view text) const override;
  [[nodiscard]] std::vector<vector::Vector> embed_batch(
      const std::vector<std::string>& texts) const override;
  [[nodiscard]] std::size_t dimension() const override { return config_.dimension; }
  [[nodiscard]] std::string provider_id() const override { return "http:" + config_.model; }

 private:
  [[nodiscard]] std::vector<vector::Vector> request_chunk(
      const std::vector<std::string>& texts) const;

  net::IHttpClient& http_;
  EmbeddingConfig config_;
};

// Builds the provider selected by config.kind. http is only used for kHttp and must
// outlive the returned provider.
[[nodiscard]] std::unique_ptr<IEmbeddingProvider> make_embedding_provider(
    const EmbeddingConfig& config, net::IHttpClient& http);

}  // namespace sqlrag::embedding
