#pragma once

#include "sqlrag/core/clock.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/core/services.h"
#include "sqlrag/domain/workflow_state.h"
#include "sqlrag/workflow/intent_classifier.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sqlrag::workflow {

struct WorkflowConfig {
  int max_retries{3};                                      // NOLINT(readability-identifier-naming)
  std::size_t retrieval_k{3};                              // NOLINT(readability-identifier-naming)
  std::chrono::milliseconds execution_timeout{30000};      // NOLINT(readability-identifier-naming)
  std::size_t schema_table_limit{20};                      // NOLINT(readability-identifier-naming)
  std::size_t schema_fallback_limit{10};                   // NOLINT(readability-identifier-naming)
  std::size_t display_rows{10};                            // NOLINT(readability-identifier-naming)
  bool enable_feedback{true};                              // NOLINT(readability-identifier-naming)
  std::string sql_dialect{"SQLite"};                       // NOLINT(readability-identifier-naming)
  IntentClassifierConfig classifier;                       // NOLINT(readability-identifier-naming)
};

struct WorkflowRequest {
  std::string user_input;                // NOLINT(readability-identifier-naming)
  std::optional<int> max_retries;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;   // NOLINT(readability-identifier-naming)
};

struct WorkflowResult {
  std::string trace_id;                                     // NOLINT(readability-identifier-naming)
  std::optional<domain::Intent> intent;                     // NOLINT(readability-identifier-naming)
  double intent_confidence{0.0};                            // NOLINT(readability-identifier-naming)
  std::string sql;                                          // NOLINT(readability-identifier-naming)
  std::optional<std::string> explanation;                   // NOLINT(readability-identifier-naming)
  std::optional<domain::ExecutionResult> execution_result;  // NOLINT(readability-identifier-naming)
  std::optional<domain::ExecutionError> execution_error;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> schema_error;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> error;                         // NOLINT(readability-identifier-naming)
  int retry_count{0};                                       // NOLINT(readability-identifier-naming)
  std::vector<std::string> tables_used;                     // NOLINT(readability-identifier-naming)
  domain::WorkflowStage stage{domain::WorkflowStage::kFailed};  // NOLINT(readability-identifier-naming)
  std::string response;                                     // NOLINT(readability-identifier-naming)
  bool feedback_recorded{false};                            // NOLINT(readability-identifier-naming)
};

// WorkflowEngine drives one request through
//   INTENT -> CHAT -> DONE
//   INTENT -> SCHEMA -> GENERATE -> EXECUTE -> DONE
// with EXECUTE -> GENERATE repair passes bounded by max_retries and FAILED as the
// other terminal stage.
//
// Only core::LlmUnavailableError escapes run(); every other failure ends up in the
// result. Audit events are appended under the request's trace id.
class WorkflowEngine {
 public:
  WorkflowEngine(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
                 WorkflowConfig config = {});

  [[nodiscard]] WorkflowResult run(const WorkflowRequest& request);

  [[nodiscard]] const WorkflowConfig& config() const { return config_; }

 private:
  domain::WorkflowStage run_intent(domain::WorkflowState& state);
  domain::WorkflowStage run_chat(domain::WorkflowState& state);
  domain::WorkflowStage run_schema(domain::WorkflowState& state);
  domain::WorkflowStage run_generate(domain::WorkflowState& state);
  domain::WorkflowStage run_execute(domain::WorkflowState& state);

  // Retrieval-augmented block for text_to_sql; "" when nothing usable was found.
  std::string retrieve_examples(const domain::WorkflowState& state,
                                std::vector<std::string>& example_ids);

  void emit(const std::string& trace_id, const std::string& event_type,
            const nlohmann::json& payload, std::vector<std::string> refs = {});

  core::Services& services_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  WorkflowConfig config_;
  IntentClassifier classifier_;
  // Assistant text of the terminal stage, copied into WorkflowResult::response.
  std::string response_;
  bool feedback_recorded_{false};
};

}  // namespace sqlrag::workflow
