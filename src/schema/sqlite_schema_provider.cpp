#include "sqlrag/schema/sqlite_schema_provider.h"

#include "sqlrag/core/errors.h"

#include <sqlite3.h>

namespace sqlrag::schema {

using storage::sqlite::column_text;
using storage::sqlite::OpenMode;
using storage::sqlite::PreparedStatement;
using storage::sqlite::SqliteDb;

SqliteSchemaProvider::SqliteSchemaProvider(const std::string& path) {
  auto opened = SqliteDb::open(path, OpenMode::kReadOnly);
  if (!opened.has_value()) {
    throw core::SchemaError(opened.error());
  }
  db_ = opened.value();
}

std::vector<std::string> SqliteSchemaProvider::list_tables() {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT name FROM sqlite_master"
                         " WHERE type = 'table' AND name NOT LIKE 'sqlite_%'"
                         " ORDER BY name");
  if (!stmt.is_valid()) {
    throw core::SchemaError("cannot list tables: " + stmt.error());
  }

  std::vector<std::string> tables;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    tables.push_back(column_text(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    throw core::SchemaError(std::string("cannot list tables: ") +
                            sqlite3_errmsg(db_->connection()));
  }
  return tables;
}

TableSchema SqliteSchemaProvider::describe_table(const std::string& table) {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT name, type, \"notnull\", dflt_value, pk"
                         "  FROM pragma_table_info(?) ORDER BY cid");
  if (!stmt.is_valid()) {
    throw core::SchemaError("cannot describe '" + table + "': " + stmt.error());
  }
  sqlite3_bind_text(stmt.get(), 1, table.c_str(), -1, SQLITE_TRANSIENT);

  TableSchema schema{.name = table, .comment = "", .columns = {}};
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    ColumnInfo column;
    column.name = column_text(stmt.get(), 0);
    column.type = column_text(stmt.get(), 1);
    column.nullable = sqlite3_column_int(stmt.get(), 2) == 0;
    if (sqlite3_column_type(stmt.get(), 3) != SQLITE_NULL) {
      column.default_value = column_text(stmt.get(), 3);
    }
    column.key = sqlite3_column_int(stmt.get(), 4) > 0 ? "PRI" : "";
    schema.columns.push_back(std::move(column));
  }
  if (rc != SQLITE_DONE) {
    throw core::SchemaError("cannot describe '" + table +
                            "': " + sqlite3_errmsg(db_->connection()));
  }
  if (schema.columns.empty()) {
    throw core::SchemaError("unknown table '" + table + "'");
  }
  return schema;
}

}  // namespace sqlrag::schema
