#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sqlrag::embedding {

// Vocabulary for the --embedding flag.
enum class EmbeddingProviderKind : std::uint8_t {
  kStub,  // "stub": DeterministicStubEmbeddingProvider, offline
  kHttp,  // "http": OpenAI-compatible /embeddings endpoint
};

[[nodiscard]] inline std::optional<EmbeddingProviderKind> parse_embedding_provider_kind(
    const std::string& s) {
  if (s == "stub") {
    return EmbeddingProviderKind::kStub;
  }
  if (s == "http") {
    return EmbeddingProviderKind::kHttp;
  }
  return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(const EmbeddingProviderKind kind) {
  switch (kind) {
    case EmbeddingProviderKind::kStub:
      return "stub";
    case EmbeddingProviderKind::kHttp:
      return "http";
  }
  return "unknown";
}

struct EmbeddingConfig {
  EmbeddingProviderKind kind{EmbeddingProviderKind::kStub};  // NOLINT(readability-identifier-naming)
  std::size_t dimension{128};                                // NOLINT(readability-identifier-naming)
  std::string base_url{"http://localhost:8000/v1"};          // NOLINT(readability-identifier-naming)
  std::string api_key;                                       // NOLINT(readability-identifier-naming)
  std::string model{"text-embedding-3-small"};               // NOLINT(readability-identifier-naming)
  long timeout_ms{30000};                                    // NOLINT(readability-identifier-naming)
  std::size_t batch_size{64};                                // NOLINT(readability-identifier-naming)
};

// Returns "" when the config is usable, otherwise a human-readable reason.
[[nodiscard]] std::string validate_embedding_config(const EmbeddingConfig& config);

}  // namespace sqlrag::embedding
