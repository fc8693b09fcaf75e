#pragma once

#include "sqlrag/vector/vector_math.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrag::embedding {

// IEmbeddingProvider maps text to a fixed-dimension, unit-norm vector so that the
// inner product of two embeddings is their cosine similarity.
//
// Contract:
// - every returned vector has exactly dimension() elements and L2 norm 1
// - embed_batch(texts)[i] equals embed_text(texts[i]) within float tolerance
// - failures throw core::EmbeddingError; providers do not retry internally
class IEmbeddingProvider {
 public:
  virtual ~IEmbeddingProvider() = default;

  [[nodiscard]] virtual vector::Vector embed_text(std::string_view text) const = 0;

  // Default implementation embeds one text at a time, preserving order.
  [[nodiscard]] virtual std::vector<vector::Vector> embed_batch(
      const std::vector<std::string>& texts) const;

  [[nodiscard]] virtual std::size_t dimension() const = 0;

  // Short identifier recorded in knowledge-base audit payloads.
  [[nodiscard]] virtual std::string provider_id() const = 0;
};

// DeterministicStubEmbeddingProvider hashes tokens into buckets (with neighbour
// smoothing) and normalizes the histogram. Same text, same vector; texts sharing
// tokens score higher than unrelated ones. Offline-safe and used by tests and the
// "stub" embedding mode.
class DeterministicStubEmbeddingProvider final : public IEmbeddingProvider {
 public:
  // Throws std::invalid_argument when dim == 0.
  explicit DeterministicStubEmbeddingProvider(std::size_t dim = 128);

  [[nodiscard]] vector::Vector embed_text(std::string_view text) const override;
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }
  [[nodiscard]] std::string provider_id() const override { return "deterministic-stub"; }

 private:
  std::size_t dimension_;
};

}  // namespace sqlrag::embedding
