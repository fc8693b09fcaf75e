#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrag::domain {

// One result row; std::nullopt is SQL NULL.
using ResultRow = std::vector<std::optional<std::string>>;

// ExecutionResult is the success half of an execution outcome.
// rows holds at most the executor's row cap; row_count is the full count and
// truncated is set when rows.size() < row_count.
struct ExecutionResult {
  std::vector<std::string> columns;  // NOLINT(readability-identifier-naming)
  std::vector<ResultRow> rows;       // NOLINT(readability-identifier-naming)
  std::size_t row_count{0};          // NOLINT(readability-identifier-naming)
  bool truncated{false};             // NOLINT(readability-identifier-naming)
  int affected_count{0};             // NOLINT(readability-identifier-naming)
};

enum class ExecutionErrorKind {
  kTimeout,
  kDatabaseError,
  kOther,
};

[[nodiscard]] inline std::string_view to_string(const ExecutionErrorKind kind) {
  switch (kind) {
    case ExecutionErrorKind::kTimeout:
      return "timeout";
    case ExecutionErrorKind::kDatabaseError:
      return "database_error";
    case ExecutionErrorKind::kOther:
      return "other";
  }
  return "other";
}

struct ExecutionError {
  ExecutionErrorKind kind{ExecutionErrorKind::kOther};  // NOLINT(readability-identifier-naming)
  std::string message;                                  // NOLINT(readability-identifier-naming)
};

}  // namespace sqlrag::domain
