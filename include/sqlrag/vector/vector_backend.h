#pragma once

// VectorBackend: vocabulary for the --vector-backend flag.
//
// Valid values: "flat", "faiss".
// "faiss" is a request, not a requirement: probe_backend() resolves it to the flat
// reference backend when this binary was built without FAISS. Both backends have
// identical search semantics, so the fallback is silent apart from the probe result.

#include "sqlrag/vector/search_backend.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlrag::vector {

enum class VectorBackend : uint8_t {
  kFlat,   // "flat"  contiguous inner-product scan (reference, always available)
  kFaiss,  // "faiss" faiss::IndexFlatIP (only when built with SQLRAG_HAVE_FAISS)
};

// Returns std::nullopt for unrecognised values (including empty). Case-sensitive.
[[nodiscard]] inline std::optional<VectorBackend> parse_vector_backend(const std::string& s) {
  if (s == "flat") {
    return VectorBackend::kFlat;
  }
  if (s == "faiss") {
    return VectorBackend::kFaiss;
  }
  return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(VectorBackend b) {
  switch (b) {
    case VectorBackend::kFlat:
      return "flat";
    case VectorBackend::kFaiss:
      return "faiss";
  }
  return "unknown";
}

// True when the backend is compiled into this binary.
[[nodiscard]] bool backend_available(VectorBackend backend);

struct BackendProbe {
  VectorBackend requested{VectorBackend::kFlat};  // NOLINT(readability-identifier-naming)
  VectorBackend selected{VectorBackend::kFlat};   // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool fell_back() const { return requested != selected; }
};

// Resolves a requested backend to one that is available. Never throws.
[[nodiscard]] BackendProbe probe_backend(VectorBackend requested);

// Constructs the backend named by an already-probed selection.
[[nodiscard]] std::unique_ptr<ISearchBackend> make_search_backend(VectorBackend selected,
                                                                  std::size_t dimension);

}  // namespace sqlrag::vector
