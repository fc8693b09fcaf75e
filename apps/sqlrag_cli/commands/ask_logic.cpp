#include "ask_logic.h"

#include "sqlrag/core/errors.h"

#include <iostream>

namespace {

void print_audit_trail(sqlrag::storage::IAuditLog& audit_log, const std::string& trace_id) {
  std::cout << "\n--- Audit Trail (trace_id=" << trace_id << ") ---\n";
  for (const auto& event : audit_log.query(trace_id)) {
    std::cout << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
  }
}

}  // namespace

int execute_ask(sqlrag::core::Services& services, sqlrag::core::IIdGenerator& id_gen,
                sqlrag::core::IClock& clock, const sqlrag::workflow::WorkflowConfig& config,
                const sqlrag::workflow::WorkflowRequest& request, const bool print_trace) {
  sqlrag::workflow::WorkflowEngine engine(services, id_gen, clock, config);

  sqlrag::workflow::WorkflowResult result;
  try {
    result = engine.run(request);
  } catch (const sqlrag::core::LlmUnavailableError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  if (!result.response.empty()) {
    std::cout << result.response << "\n";
  }
  if (result.schema_error.has_value()) {
    std::cerr << "Warning: " << result.schema_error.value() << "\n";
  }
  if (result.error.has_value()) {
    std::cerr << "Error: " << result.error.value() << "\n";
  }

  std::cout << "\nintent=" << (result.intent ? sqlrag::domain::to_string(*result.intent) : "none")
            << " confidence=" << result.intent_confidence << " retries=" << result.retry_count
            << " stage=" << sqlrag::domain::to_string(result.stage)
            << " learned=" << (result.feedback_recorded ? "yes" : "no") << "\n";

  if (print_trace) {
    print_audit_trail(services.audit_log, result.trace_id);
  }

  return result.stage == sqlrag::domain::WorkflowStage::kDone ? 0 : 1;
}
