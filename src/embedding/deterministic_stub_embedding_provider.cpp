#include "sqlrag/core/normalization.h"
#include "sqlrag/embedding/embedding_provider.h"

#include <cstdint>
#include <map>
#include <stdexcept>

namespace sqlrag::embedding {

namespace {

// FNV-1a 64-bit over the token bytes; identical on every platform.
std::size_t token_bucket(const std::string_view token, const std::size_t buckets) {
  std::uint64_t hash = 14695981039346656037ull;
  for (const char ch : token) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= 1099511628211ull;
  }
  return static_cast<std::size_t>(hash % buckets);
}

}  // namespace

std::vector<vector::Vector> IEmbeddingProvider::embed_batch(
    const std::vector<std::string>& texts) const {
  std::vector<vector::Vector> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(embed_text(text));
  }
  return out;
}

DeterministicStubEmbeddingProvider::DeterministicStubEmbeddingProvider(std::size_t dim)
    : dimension_(dim) {
  if (dim == 0) {
    throw std::invalid_argument("DeterministicStubEmbeddingProvider: dimension must be > 0");
  }
}

vector::Vector DeterministicStubEmbeddingProvider::embed_text(std::string_view text) const {
  vector::Vector embedding(dimension_, 0.0f);

  const auto tokens = core::tokenize_text(text);

  // Sorted counts keep accumulation order (and therefore float rounding) stable.
  std::map<std::string, int> token_counts;
  for (const auto& token : tokens) {
    ++token_counts[token];
  }

  for (const auto& [token, count] : token_counts) {
    const std::size_t idx = token_bucket(token, dimension_);
    const std::size_t idx_prev = (idx + dimension_ - 1) % dimension_;
    const std::size_t idx_next = (idx + 1) % dimension_;

    embedding[idx] += static_cast<float>(count);
    embedding[idx_prev] += static_cast<float>(count) * 0.3f;
    embedding[idx_next] += static_cast<float>(count) * 0.3f;
  }

  if (!vector::l2_normalize(embedding)) {
    // No tokens: a fixed unit vector keeps the unit-norm contract.
    embedding[0] = 1.0f;
  }
  return embedding;
}

}  // namespace sqlrag::embedding
