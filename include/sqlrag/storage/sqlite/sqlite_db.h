#pragma once

#include "sqlrag/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace sqlrag::storage::sqlite {

enum class OpenMode {
  kReadWriteCreate,  // audit database: created on first use
  kReadOnly,         // target database: introspection and query execution only
};

// SqliteDb owns one SQLite connection.
// - RAII: connection managed via unique_ptr with custom deleter
// - Explicit error handling via Result<T,E>
// - One connection per instance; not shared between threads
class SqliteDb {
 public:
  // Opens the database at path. ":memory:" creates a private in-memory database.
  // kReadOnly fails if the file does not exist.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path, OpenMode mode = OpenMode::kReadWriteCreate);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Current schema version (0 if none applied).
  [[nodiscard]] int get_schema_version() const;

  // Applies schema v1 (schema_version + audit_events) if not already applied.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }
  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  SqliteDb(sqlite3* db, std::string path);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  std::string path_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// Reads a TEXT column, mapping SQL NULL to "".
[[nodiscard]] std::string column_text(sqlite3_stmt* stmt, int col);

}  // namespace sqlrag::storage::sqlite
