#pragma once

#include "sqlrag/domain/chat.h"
#include "sqlrag/domain/execution.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrag::domain {

enum class Intent {
  kTextToSql,
  kSqlToText,
  kDebug,
  kChat,
};

[[nodiscard]] std::optional<Intent> parse_intent(std::string_view s);
[[nodiscard]] std::string_view to_string(Intent intent);

// Pipeline stages. kDone and kFailed are terminal.
enum class WorkflowStage {
  kIntent,
  kChat,
  kSchema,
  kGenerate,
  kExecute,
  kDone,
  kFailed,
};

[[nodiscard]] std::string_view to_string(WorkflowStage stage);
[[nodiscard]] bool is_terminal(WorkflowStage stage);

// can_transition encodes the stage graph:
//   INTENT   -> CHAT | SCHEMA | FAILED
//   CHAT     -> DONE
//   SCHEMA   -> GENERATE
//   GENERATE -> EXECUTE | FAILED
//   EXECUTE  -> DONE | GENERATE (repair) | FAILED
// Terminal stages have no outgoing edges.
[[nodiscard]] bool can_transition(WorkflowStage from, WorkflowStage to);

// RepairContext carries the failing attempt into the next generation pass.
struct RepairContext {
  std::string failed_sql;  // NOLINT(readability-identifier-naming)
  ExecutionError error;    // NOLINT(readability-identifier-naming)
};

// WorkflowState is created per request, mutated by each stage and discarded once a
// terminal stage is reached. It is never persisted.
// Invariant: 0 <= retry_count <= max_retries.
struct WorkflowState {
  std::string trace_id;                             // NOLINT(readability-identifier-naming)
  std::vector<ChatTurn> messages;                   // NOLINT(readability-identifier-naming)
  std::optional<Intent> intent;                     // NOLINT(readability-identifier-naming)
  double intent_confidence{0.0};                    // NOLINT(readability-identifier-naming)
  std::string user_query;                           // NOLINT(readability-identifier-naming)
  std::string schema_info;                          // NOLINT(readability-identifier-naming)
  std::vector<std::string> relevant_tables;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> schema_error;          // NOLINT(readability-identifier-naming)
  std::string generated_sql;                        // NOLINT(readability-identifier-naming)
  std::optional<std::string> sql_explanation;       // NOLINT(readability-identifier-naming)
  std::optional<ExecutionResult> execution_result;  // NOLINT(readability-identifier-naming)
  std::optional<ExecutionError> execution_error;    // NOLINT(readability-identifier-naming)
  std::optional<RepairContext> repair;              // NOLINT(readability-identifier-naming)
  int retry_count{0};                               // NOLINT(readability-identifier-naming)
  int max_retries{3};                               // NOLINT(readability-identifier-naming)
  std::string current_agent;                        // NOLINT(readability-identifier-naming)
  std::optional<std::string> error;                 // NOLINT(readability-identifier-naming)
  WorkflowStage stage{WorkflowStage::kIntent};      // NOLINT(readability-identifier-naming)
};

}  // namespace sqlrag::domain
