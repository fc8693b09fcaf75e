#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sqlrag::schema {

struct ColumnInfo {
  std::string name;                          // NOLINT(readability-identifier-naming)
  std::string type;                          // NOLINT(readability-identifier-naming)
  bool nullable{true};                       // NOLINT(readability-identifier-naming)
  std::string key;                           // NOLINT(readability-identifier-naming) "PRI" or ""
  std::optional<std::string> default_value;  // NOLINT(readability-identifier-naming)
};

struct TableSchema {
  std::string name;                 // NOLINT(readability-identifier-naming)
  std::string comment;              // NOLINT(readability-identifier-naming)
  std::vector<ColumnInfo> columns;  // NOLINT(readability-identifier-naming)
};

// ISchemaProvider introspects the target database.
// Both operations throw core::SchemaError on failure.
class ISchemaProvider {
 public:
  virtual ~ISchemaProvider() = default;

  // User tables in a stable order.
  [[nodiscard]] virtual std::vector<std::string> list_tables() = 0;
  [[nodiscard]] virtual TableSchema describe_table(const std::string& table) = 0;
};

// Renders tables as the schema block used by prompts:
//   ## Table: name
//   Comment: ...            (only when non-empty)
//   Columns:
//     - col: TYPE [PRIMARY KEY] (nullable)
// with a blank line after each table.
[[nodiscard]] std::string render_schema(const std::vector<TableSchema>& tables);

// Describes and renders the first max_tables tables of provider.
// Throws core::SchemaError.
[[nodiscard]] std::string render_database_schema(ISchemaProvider& provider,
                                                 std::size_t max_tables);

}  // namespace sqlrag::schema
