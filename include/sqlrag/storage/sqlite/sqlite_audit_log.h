#pragma once

#include "sqlrag/storage/audit_log.h"
#include "sqlrag/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace sqlrag::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Maintains append-only log with deterministic per-trace ordering via the idx column.
// Thread-safe: the idx counter and the insert run under one mutex.
class SqliteAuditLog final : public IAuditLog {
 public:
  // Applies schema v1 to db. Throws core::PersistenceError if that fails.
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;

  // Caller holds mutex_.
  int next_index(const std::string& trace_id);
};

}  // namespace sqlrag::storage::sqlite
