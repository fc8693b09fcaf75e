#include "sqlrag/domain/workflow_state.h"

namespace sqlrag::domain {

std::optional<Intent> parse_intent(const std::string_view s) {
  if (s == "text_to_sql") {
    return Intent::kTextToSql;
  }
  if (s == "sql_to_text") {
    return Intent::kSqlToText;
  }
  if (s == "debug") {
    return Intent::kDebug;
  }
  if (s == "chat") {
    return Intent::kChat;
  }
  return std::nullopt;
}

std::string_view to_string(const Intent intent) {
  switch (intent) {
    case Intent::kTextToSql:
      return "text_to_sql";
    case Intent::kSqlToText:
      return "sql_to_text";
    case Intent::kDebug:
      return "debug";
    case Intent::kChat:
      return "chat";
  }
  return "chat";
}

std::string_view to_string(const WorkflowStage stage) {
  switch (stage) {
    case WorkflowStage::kIntent:
      return "INTENT";
    case WorkflowStage::kChat:
      return "CHAT";
    case WorkflowStage::kSchema:
      return "SCHEMA";
    case WorkflowStage::kGenerate:
      return "GENERATE";
    case WorkflowStage::kExecute:
      return "EXECUTE";
    case WorkflowStage::kDone:
      return "DONE";
    case WorkflowStage::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

bool is_terminal(const WorkflowStage stage) {
  return stage == WorkflowStage::kDone || stage == WorkflowStage::kFailed;
}

bool can_transition(const WorkflowStage from, const WorkflowStage to) {
  switch (from) {
    case WorkflowStage::kIntent:
      return to == WorkflowStage::kChat || to == WorkflowStage::kSchema ||
             to == WorkflowStage::kFailed;
    case WorkflowStage::kChat:
      return to == WorkflowStage::kDone;
    case WorkflowStage::kSchema:
      return to == WorkflowStage::kGenerate;
    case WorkflowStage::kGenerate:
      return to == WorkflowStage::kExecute || to == WorkflowStage::kFailed;
    case WorkflowStage::kExecute:
      return to == WorkflowStage::kDone || to == WorkflowStage::kGenerate ||
             to == WorkflowStage::kFailed;
    case WorkflowStage::kDone:
    case WorkflowStage::kFailed:
      return false;
  }
  return false;
}

}  // namespace sqlrag::domain
