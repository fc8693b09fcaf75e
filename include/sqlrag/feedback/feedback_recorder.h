#pragma once

#include "sqlrag/core/clock.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/domain/example.h"
#include "sqlrag/domain/workflow_state.h"
#include "sqlrag/retrieval/example_store.h"
#include "sqlrag/storage/audit_log.h"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string_view>

namespace sqlrag::feedback {

// Rubric over the upper-cased SQL text:
//   +1 JOIN, +1 GROUP BY, +1 HAVING,
//   +2 SUBQUERY or a SELECT after the first FROM,
//   +1 more than one JOIN, +2 UNION.
// Total <= 1 simple, <= 3 medium, otherwise complex.
[[nodiscard]] domain::Complexity estimate_complexity(std::string_view sql);

struct FeedbackConfig {
  // Knowledge-base directory re-persisted after every captured example.
  std::optional<std::filesystem::path> kb_dir;  // NOLINT(readability-identifier-naming)
  // JSON array file that learned examples are appended to.
  std::optional<std::filesystem::path>
      learned_examples_path;  // NOLINT(readability-identifier-naming)
};

// FeedbackRecorder turns successful requests into learned examples.
// It never throws: failures are reported on stderr and as a FeedbackFailed audit
// event, and capture_success returns false. Captures are serialized internally.
class FeedbackRecorder {
 public:
  FeedbackRecorder(retrieval::ExampleStore& store, storage::IAuditLog& audit_log,
                   core::IIdGenerator& id_gen, core::IClock& clock, FeedbackConfig config = {});

  FeedbackRecorder(const FeedbackRecorder&) = delete;
  FeedbackRecorder& operator=(const FeedbackRecorder&) = delete;

  // Returns true when a new example was stored. Requires an execution result and
  // non-empty user_query and generated_sql; otherwise returns false with no effect.
  // A SQL text already in the store is skipped and returns false.
  bool capture_success(const domain::WorkflowState& state);

  [[nodiscard]] const FeedbackConfig& config() const { return config_; }

 private:
  void emit(const std::string& trace_id, const std::string& event_type,
            const nlohmann::json& payload, std::vector<std::string> refs = {});

  retrieval::ExampleStore& store_;
  storage::IAuditLog& audit_log_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  FeedbackConfig config_;
  std::mutex mutex_;
};

}  // namespace sqlrag::feedback
