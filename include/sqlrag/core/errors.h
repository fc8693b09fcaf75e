#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlrag::core {

// Exceptions thrown across collaborator boundaries. Every class derives from
// std::runtime_error so a top-level handler can always report what().
//
// Propagation policy:
//   EmbeddingError        retrieval degrades to "no augmentation"; ingestion call aborts
//   IndexError            fatal to the single index call
//   PersistenceError      surfaced to the save/load caller
//   SchemaError           soft error inside the workflow
//   LlmResponseError      stage error inside the workflow
//   LlmUnavailableError   the only error that escapes WorkflowEngine::run
//   TransportError        raw HTTP transport failure, translated by the HTTP clients

class EmbeddingError : public std::runtime_error {
 public:
  explicit EmbeddingError(const std::string& what) : std::runtime_error(what) {}
};

enum class IndexErrorKind {
  kDuplicateId,
  kDimensionMismatch,
  kLengthMismatch,
  kInvalidMetadata,
};

[[nodiscard]] inline std::string_view to_string(IndexErrorKind kind) {
  switch (kind) {
    case IndexErrorKind::kDuplicateId:
      return "duplicate_id";
    case IndexErrorKind::kDimensionMismatch:
      return "dimension_mismatch";
    case IndexErrorKind::kLengthMismatch:
      return "length_mismatch";
    case IndexErrorKind::kInvalidMetadata:
      return "invalid_metadata";
  }
  return "unknown";
}

class IndexError : public std::runtime_error {
 public:
  IndexError(IndexErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] IndexErrorKind kind() const noexcept { return kind_; }

 private:
  IndexErrorKind kind_;
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

class SchemaError : public std::runtime_error {
 public:
  explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

class LlmUnavailableError : public std::runtime_error {
 public:
  explicit LlmUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

class LlmResponseError : public std::runtime_error {
 public:
  explicit LlmResponseError(const std::string& what) : std::runtime_error(what) {}
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace sqlrag::core
