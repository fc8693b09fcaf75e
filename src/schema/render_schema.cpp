#include "sqlrag/schema/schema_provider.h"

#include <sstream>

namespace sqlrag::schema {

std::string render_schema(const std::vector<TableSchema>& tables) {
  std::ostringstream out;
  for (const auto& table : tables) {
    out << "## Table: " << table.name << "\n";
    if (!table.comment.empty()) {
      out << "Comment: " << table.comment << "\n";
    }
    out << "Columns:\n";
    for (const auto& column : table.columns) {
      out << "  - " << column.name << ": " << column.type;
      if (column.key == "PRI") {
        out << " [PRIMARY KEY]";
      }
      if (column.nullable) {
        out << " (nullable)";
      }
      out << "\n";
    }
    out << "\n";
  }
  return out.str();
}

std::string render_database_schema(ISchemaProvider& provider, const std::size_t max_tables) {
  std::vector<TableSchema> tables;
  for (const auto& name : provider.list_tables()) {
    if (tables.size() >= max_tables) {
      break;
    }
    tables.push_back(provider.describe_table(name));
  }
  return render_schema(tables);
}

}  // namespace sqlrag::schema
