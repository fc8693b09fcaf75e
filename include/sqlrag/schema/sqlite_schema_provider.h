#pragma once

#include "sqlrag/schema/schema_provider.h"
#include "sqlrag/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace sqlrag::schema {

// SqliteSchemaProvider reads sqlite_master and pragma_table_info of a database
// opened read-only. Internal sqlite_* tables are hidden.
class SqliteSchemaProvider final : public ISchemaProvider {
 public:
  // Throws core::SchemaError when the database cannot be opened.
  explicit SqliteSchemaProvider(const std::string& path);

  [[nodiscard]] std::vector<std::string> list_tables() override;
  [[nodiscard]] TableSchema describe_table(const std::string& table) override;

 private:
  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  std::mutex mutex_;
};

}  // namespace sqlrag::schema
