#pragma once

#include "sqlrag/core/result.h"
#include "sqlrag/domain/execution.h"
#include "sqlrag/storage/sqlite/sqlite_db.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace sqlrag::execution {

using ExecutionOutcome = core::Result<domain::ExecutionResult, domain::ExecutionError>;

// ISqlExecutor runs one statement against the target database.
// Failures are values: kTimeout when the deadline expires, kDatabaseError for engine
// errors, kOther for statements rejected before execution.
class ISqlExecutor {
 public:
  virtual ~ISqlExecutor() = default;

  [[nodiscard]] virtual ExecutionOutcome execute(const std::string& sql,
                                                 std::chrono::milliseconds timeout) = 0;
};

struct ExecutorConfig {
  std::size_t max_rows{100};  // NOLINT(readability-identifier-naming)
};

// SqliteSqlExecutor opens the target database read-only and accepts a single
// SELECT (or WITH ... SELECT) statement. All rows are counted; the first max_rows are
// kept. cancel() interrupts an execution in flight from another thread.
class SqliteSqlExecutor final : public ISqlExecutor {
 public:
  // Throws std::runtime_error when the database cannot be opened.
  explicit SqliteSqlExecutor(const std::string& path, ExecutorConfig config = {});

  [[nodiscard]] ExecutionOutcome execute(const std::string& sql,
                                         std::chrono::milliseconds timeout) override;

  void cancel() { cancelled_.store(true); }

 private:
  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  ExecutorConfig config_;
  std::mutex mutex_;
  std::atomic<bool> cancelled_{false};
};

// Markdown table of the first max_display rows; "No data returned." when empty.
// NULL cells print as NULL; cells longer than 50 characters are cut to 47 plus "...".
[[nodiscard]] std::string format_result_table(const domain::ExecutionResult& result,
                                              std::size_t max_display = 10);

// The user-facing answer for a successful query: SQL block, row count and table.
[[nodiscard]] std::string format_query_response(const std::string& sql,
                                                const domain::ExecutionResult& result,
                                                std::size_t max_display = 10);

}  // namespace sqlrag::execution
