#include "sqlrag/feedback/feedback_recorder.h"

#include "sqlrag/core/normalization.h"
#include "sqlrag/ingest/example_loader.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace sqlrag::feedback {

namespace {

std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
  std::size_t count = 0;
  for (std::size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

domain::Complexity estimate_complexity(const std::string_view sql) {
  const std::string upper = core::normalize_ascii_upper(sql);

  int score = 0;
  const std::size_t joins = count_occurrences(upper, "JOIN");
  if (joins > 0) {
    score += 1;
  }
  if (upper.find("GROUP BY") != std::string::npos) {
    score += 1;
  }
  if (upper.find("HAVING") != std::string::npos) {
    score += 1;
  }
  const std::size_t from = upper.find("FROM");
  const bool nested_select =
      from != std::string::npos && upper.find("SELECT", from) != std::string::npos;
  if (nested_select || upper.find("SUBQUERY") != std::string::npos) {
    score += 2;
  }
  if (joins > 1) {
    score += 1;
  }
  if (upper.find("UNION") != std::string::npos) {
    score += 2;
  }

  if (score <= 1) {
    return domain::Complexity::kSimple;
  }
  if (score <= 3) {
    return domain::Complexity::kMedium;
  }
  return domain::Complexity::kComplex;
}

FeedbackRecorder::FeedbackRecorder(retrieval::ExampleStore& store, storage::IAuditLog& audit_log,
                                   core::IIdGenerator& id_gen, core::IClock& clock,
                                   FeedbackConfig config)
    : store_(store),
      audit_log_(audit_log),
      id_gen_(id_gen),
      clock_(clock),
      config_(std::move(config)) {}

bool FeedbackRecorder::capture_success(const domain::WorkflowState& state) {
  if (!state.execution_result.has_value() || state.execution_error.has_value() ||
      state.user_query.empty() || state.generated_sql.empty()) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  domain::Example example{
      .id = "",
      .natural_query = state.user_query,
      .sql = state.generated_sql,
      .tables = std::set<std::string>(state.relevant_tables.begin(), state.relevant_tables.end()),
      .complexity = estimate_complexity(state.generated_sql),
      .tags = {"learned"},
  };

  try {
    const auto ids = store_.add({example});
    if (ids.empty()) {
      emit(state.trace_id, "FeedbackSkipped", {{"reason", "duplicate_sql"}});
      return false;
    }

    if (config_.kb_dir.has_value()) {
      store_.save(*config_.kb_dir);
    }
    if (config_.learned_examples_path.has_value()) {
      ingest::save_examples_to_file({example}, *config_.learned_examples_path);
    }

    emit(state.trace_id, "FeedbackCaptured",
         {{"example_id", ids.front()},
          {"complexity", std::string(domain::to_string(example.complexity))},
          {"tables", example.tables}},
         {ids.front()});
    return true;
  } catch (const std::exception& e) {
    std::cerr << "feedback: failed to capture example for trace " << state.trace_id << ": "
              << e.what() << "\n";
    emit(state.trace_id, "FeedbackFailed", {{"error", e.what()}});
    return false;
  }
}

void FeedbackRecorder::emit(const std::string& trace_id, const std::string& event_type,
                            const nlohmann::json& payload, std::vector<std::string> refs) {
  audit_log_.append({id_gen_.next("evt"), trace_id, event_type, payload.dump(),
                     clock_.now_iso8601(), std::move(refs)});
}

}  // namespace sqlrag::feedback
