#include "sqlrag/execution/sql_executor.h"

#include "sqlrag/core/normalization.h"

#include <sqlite3.h>

#include <stdexcept>

namespace sqlrag::execution {

using domain::ExecutionError;
using domain::ExecutionErrorKind;
using storage::sqlite::OpenMode;
using storage::sqlite::SqliteDb;

namespace {

constexpr int kProgressInterval = 1000;  // VM instructions between deadline checks

struct ProgressState {
  std::chrono::steady_clock::time_point deadline;
  const std::atomic<bool>* cancelled{nullptr};
  bool timed_out{false};
};

int on_progress(void* ctx) {
  auto* state = static_cast<ProgressState*>(ctx);
  if (state->cancelled->load()) {
    return 1;
  }
  if (std::chrono::steady_clock::now() >= state->deadline) {
    state->timed_out = true;
    return 1;
  }
  return 0;
}

// Unregisters the progress handler when the execution scope ends.
class ProgressGuard {
 public:
  ProgressGuard(sqlite3* db, ProgressState* state) : db_(db) {
    sqlite3_progress_handler(db_, kProgressInterval, &on_progress, state);
  }
  ~ProgressGuard() { sqlite3_progress_handler(db_, 0, nullptr, nullptr); }

  ProgressGuard(const ProgressGuard&) = delete;
  ProgressGuard& operator=(const ProgressGuard&) = delete;

 private:
  sqlite3* db_;
};

ExecutionOutcome reject(std::string message) {
  return ExecutionOutcome::err(
      ExecutionError{.kind = ExecutionErrorKind::kOther, .message = std::move(message)});
}

}  // namespace

SqliteSqlExecutor::SqliteSqlExecutor(const std::string& path, ExecutorConfig config)
    : config_(config) {
  auto opened = SqliteDb::open(path, OpenMode::kReadOnly);
  if (!opened.has_value()) {
    throw std::runtime_error(opened.error());
  }
  db_ = opened.value();
}

ExecutionOutcome SqliteSqlExecutor::execute(const std::string& sql,
                                            const std::chrono::milliseconds timeout) {
  if (core::trim(sql).empty()) {
    return reject("No SQL to execute");
  }
  if (!core::starts_with_keyword_ci(sql, "SELECT") && !core::starts_with_keyword_ci(sql, "WITH")) {
    return reject("Only SELECT queries are supported");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_.store(false);
  sqlite3* conn = db_->connection();

  sqlite3_stmt* raw = nullptr;
  const char* tail = nullptr;
  if (sqlite3_prepare_v2(conn, sql.c_str(), -1, &raw, &tail) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return ExecutionOutcome::err(
        ExecutionError{.kind = ExecutionErrorKind::kDatabaseError, .message = sqlite3_errmsg(conn)});
  }
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt(raw, &sqlite3_finalize);

  if (tail != nullptr) {
    const std::string rest = core::trim(tail);
    if (!rest.empty() && rest != ";") {
      return reject("Only a single statement is supported");
    }
  }
  if (stmt == nullptr) {
    return reject("No SQL to execute");
  }
  if (sqlite3_stmt_readonly(stmt.get()) == 0) {
    return reject("Only SELECT queries are supported");
  }

  ProgressState progress{.deadline = std::chrono::steady_clock::now() + timeout,
                         .cancelled = &cancelled_,
                         .timed_out = false};
  ProgressGuard guard(conn, &progress);

  domain::ExecutionResult result;
  const int column_count = sqlite3_column_count(stmt.get());
  for (int c = 0; c < column_count; ++c) {
    const char* name = sqlite3_column_name(stmt.get(), c);
    result.columns.emplace_back(name != nullptr ? name : "");
  }

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    ++result.row_count;
    if (result.rows.size() >= config_.max_rows) {
      continue;
    }
    domain::ResultRow row;
    row.reserve(static_cast<std::size_t>(column_count));
    for (int c = 0; c < column_count; ++c) {
      if (sqlite3_column_type(stmt.get(), c) == SQLITE_NULL) {
        row.emplace_back(std::nullopt);
      } else {
        row.emplace_back(storage::sqlite::column_text(stmt.get(), c));
      }
    }
    result.rows.push_back(std::move(row));
  }

  if (rc == SQLITE_INTERRUPT) {
    if (progress.timed_out) {
      return ExecutionOutcome::err(
          ExecutionError{.kind = ExecutionErrorKind::kTimeout, .message = "Query timeout"});
    }
    return reject("Query cancelled");
  }
  if (rc != SQLITE_DONE) {
    return ExecutionOutcome::err(
        ExecutionError{.kind = ExecutionErrorKind::kDatabaseError, .message = sqlite3_errmsg(conn)});
  }

  result.truncated = result.rows.size() < result.row_count;
  return ExecutionOutcome::ok(std::move(result));
}

}  // namespace sqlrag::execution
