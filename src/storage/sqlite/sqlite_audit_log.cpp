#include "sqlrag/storage/sqlite/sqlite_audit_log.h"

#include "sqlrag/core/errors.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <iostream>

namespace sqlrag::storage::sqlite {

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {
  if (!db_) {
    throw core::PersistenceError("SqliteAuditLog: database handle is null");
  }
  auto schema = db_->ensure_schema_v1();
  if (!schema.has_value()) {
    throw core::PersistenceError(schema.error());
  }
}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int idx = next_index(event.trace_id);

  const nlohmann::json refs_json = event.refs;
  const std::string refs = refs_json.dump();

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    std::cerr << "audit: cannot prepare insert: " << stmt.error() << "\n";
    return;
  }

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    std::cerr << "audit: failed to append " << event.event_type << " for trace "
              << event.trace_id << ": " << sqlite3_errmsg(db_->connection()) << "\n";
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string sql = trace_id.empty()
                              ? "SELECT event_id, trace_id, event_type, payload, created_at,"
                                "       refs_json"
                                "  FROM audit_events ORDER BY rowid"
                              : "SELECT event_id, trace_id, event_type, payload, created_at,"
                                "       refs_json"
                                "  FROM audit_events WHERE trace_id = ? ORDER BY idx";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    std::cerr << "audit: cannot prepare query: " << stmt.error() << "\n";
    return {};
  }
  if (!trace_id.empty()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = column_text(stmt.get(), 0);
    event.trace_id = column_text(stmt.get(), 1);
    event.event_type = column_text(stmt.get(), 2);
    event.payload = column_text(stmt.get(), 3);
    event.created_at = column_text(stmt.get(), 4);

    const auto refs_json = nlohmann::json::parse(column_text(stmt.get(), 5), nullptr, false);
    if (refs_json.is_array()) {
      for (const auto& ref : refs_json) {
        if (ref.is_string()) {
          event.refs.push_back(ref.get<std::string>());
        }
      }
    }

    result.push_back(std::move(event));
  }

  return result;
}

int SqliteAuditLog::next_index(const std::string& trace_id) {
  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second++;
  }

  // New trace in this process: continue after whatever a previous run stored.
  const char* idx_sql = "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?";
  PreparedStatement idx_stmt(db_->connection(), idx_sql);
  int max_idx = -1;
  if (idx_stmt.is_valid()) {
    sqlite3_bind_text(idx_stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(idx_stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(idx_stmt.get(), 0) != SQLITE_NULL) {
      max_idx = sqlite3_column_int(idx_stmt.get(), 0);
    }
  }
  const int idx = max_idx + 1;
  trace_indices_[trace_id] = idx + 1;
  return idx;
}

}  // namespace sqlrag::storage::sqlite
