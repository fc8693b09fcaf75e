#pragma once

#include "sqlrag/core/result.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace sqlrag::domain {

// Complexity is a coarse difficulty label for a SQL example. The numeric rank drives
// complexity-aware re-ranking (distance between ranks is the mismatch).
enum class Complexity : std::uint8_t {
  kSimple,
  kMedium,
  kComplex,
};

[[nodiscard]] std::optional<Complexity> parse_complexity(std::string_view s);
[[nodiscard]] std::string_view to_string(Complexity c);
[[nodiscard]] int complexity_rank(Complexity c);

// Example is one (natural-language query, SQL) pair in the knowledge base.
// id is assigned by the vector index on insertion; fields are immutable once stored.
struct Example {
  std::string id;                             // NOLINT(readability-identifier-naming)
  std::string natural_query;                  // NOLINT(readability-identifier-naming)
  std::string sql;                            // NOLINT(readability-identifier-naming)
  std::set<std::string> tables;               // NOLINT(readability-identifier-naming)
  Complexity complexity{Complexity::kMedium};  // NOLINT(readability-identifier-naming)
  std::set<std::string> tags;                 // NOLINT(readability-identifier-naming)
};

// JSON form: {"natural_query", "sql", "tables": [...], "complexity", "tags": [...]}.
// "id" is written only when non-empty.
[[nodiscard]] nlohmann::json example_to_json(const Example& example);

// Parses the JSON form. natural_query and sql must be non-empty strings and tables an
// array of strings (it may be empty: learned examples can lack schema context).
// complexity defaults to medium when absent or unrecognised, tags default to empty.
[[nodiscard]] core::Result<Example, core::ParseError> example_from_json(const nlohmann::json& j);

}  // namespace sqlrag::domain
