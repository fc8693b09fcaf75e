#include "sqlrag/workflow/workflow_engine.h"

#include "sqlrag/core/errors.h"
#include "sqlrag/core/normalization.h"
#include "sqlrag/core/version.h"
#include "sqlrag/llm/response_text.h"
#include "sqlrag/workflow/prompts.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace sqlrag::workflow {

using domain::ChatRole;
using domain::Intent;
using domain::WorkflowStage;
using domain::WorkflowState;

namespace {

void add_message(WorkflowState& state, ChatRole role, std::string content) {
  state.messages.push_back(domain::ChatTurn{.role = role, .content = std::move(content)});
}

}  // namespace

WorkflowEngine::WorkflowEngine(core::Services& services, core::IIdGenerator& id_gen,
                               core::IClock& clock, WorkflowConfig config)
    : services_(services),
      id_gen_(id_gen),
      clock_(clock),
      config_(std::move(config)),
      classifier_(services.llm, config_.classifier) {}

// ─────────────────────────────────────────────────────────────────────────────
// Driver
// ─────────────────────────────────────────────────────────────────────────────

WorkflowResult WorkflowEngine::run(const WorkflowRequest& request) {
  WorkflowState state;
  state.trace_id = request.trace_id.value_or(id_gen_.next("trace"));
  state.max_retries = std::max(0, request.max_retries.value_or(config_.max_retries));
  state.user_query = core::trim(request.user_input);
  state.stage = WorkflowStage::kIntent;
  response_.clear();
  feedback_recorded_ = false;

  emit(state.trace_id, "WorkflowStarted",
       {{"user_query", state.user_query},
        {"max_retries", state.max_retries},
        {"version", core::kBuildVersion}});

  try {
    while (!domain::is_terminal(state.stage)) {
      WorkflowStage next = WorkflowStage::kFailed;
      switch (state.stage) {
        case WorkflowStage::kIntent:
          next = run_intent(state);
          break;
        case WorkflowStage::kChat:
          next = run_chat(state);
          break;
        case WorkflowStage::kSchema:
          next = run_schema(state);
          break;
        case WorkflowStage::kGenerate:
          next = run_generate(state);
          break;
        case WorkflowStage::kExecute:
          next = run_execute(state);
          break;
        case WorkflowStage::kDone:
        case WorkflowStage::kFailed:
          break;
      }
      if (!domain::can_transition(state.stage, next)) {
        throw std::logic_error("workflow: illegal transition " +
                               std::string(domain::to_string(state.stage)) + " -> " +
                               std::string(domain::to_string(next)));
      }
      state.stage = next;
    }
  } catch (const core::LlmUnavailableError& e) {
    emit(state.trace_id, "WorkflowFailed",
         {{"stage", std::string(domain::to_string(state.stage))},
          {"error", e.what()},
          {"fatal", true}});
    throw;
  }

  if (state.stage == WorkflowStage::kDone) {
    const bool sql_intent = state.intent == Intent::kTextToSql || state.intent == Intent::kDebug;
    if (config_.enable_feedback && sql_intent && state.execution_result.has_value()) {
      feedback_recorded_ = services_.feedback.capture_success(state);
    }
    emit(state.trace_id, "WorkflowCompleted",
         {{"intent", state.intent ? std::string(domain::to_string(*state.intent)) : ""},
          {"retry_count", state.retry_count},
          {"feedback_recorded", feedback_recorded_}});
  } else {
    emit(state.trace_id, "WorkflowFailed",
         {{"error", state.error.value_or("")}, {"retry_count", state.retry_count}});
  }

  WorkflowResult result;
  result.trace_id = state.trace_id;
  result.intent = state.intent;
  result.intent_confidence = state.intent_confidence;
  result.sql = state.generated_sql;
  result.explanation = state.sql_explanation;
  result.execution_result = state.execution_result;
  result.execution_error = state.execution_error;
  result.schema_error = state.schema_error;
  result.error = state.error;
  result.retry_count = state.retry_count;
  result.tables_used = state.relevant_tables;
  result.stage = state.stage;
  result.response = response_;
  result.feedback_recorded = feedback_recorded_;
  return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// INTENT
// ─────────────────────────────────────────────────────────────────────────────

WorkflowStage WorkflowEngine::run_intent(WorkflowState& state) {
  state.current_agent = "intent_classifier";
  if (state.user_query.empty()) {
    state.error = "No user input found";
    return WorkflowStage::kFailed;
  }
  add_message(state, ChatRole::kUser, state.user_query);

  const IntentDecision decision = classifier_.classify(state.user_query);
  state.intent = decision.intent;
  state.intent_confidence = decision.confidence;

  emit(state.trace_id, "IntentClassified",
       {{"intent", std::string(domain::to_string(decision.intent))},
        {"confidence", decision.confidence},
        {"fast_path", decision.fast_path},
        {"reasoning", decision.reasoning}});

  return decision.intent == Intent::kChat ? WorkflowStage::kChat : WorkflowStage::kSchema;
}

// ─────────────────────────────────────────────────────────────────────────────
// CHAT
// ─────────────────────────────────────────────────────────────────────────────

WorkflowStage WorkflowEngine::run_chat(WorkflowState& state) {
  state.current_agent = "chat_handler";
  try {
    response_ = services_.llm.complete(
        {{ChatRole::kSystem, kChatSystemPrompt}, {ChatRole::kUser, state.user_query}});
  } catch (const core::LlmResponseError& e) {
    state.error = e.what();
    response_ = std::string("Sorry, I encountered an error: ") + e.what();
  }
  add_message(state, ChatRole::kAssistant, response_);
  return WorkflowStage::kDone;
}

// ─────────────────────────────────────────────────────────────────────────────
// SCHEMA
// ─────────────────────────────────────────────────────────────────────────────

WorkflowStage WorkflowEngine::run_schema(WorkflowState& state) {
  state.current_agent = "schema_retriever";
  state.relevant_tables.clear();
  state.schema_info.clear();

  try {
    const std::vector<std::string> all_tables = services_.schema.list_tables();
    if (all_tables.empty()) {
      throw core::SchemaError("target database has no tables");
    }

    std::map<std::string, schema::TableSchema> described;
    const auto describe = [&](const std::string& table) -> const schema::TableSchema& {
      auto it = described.find(table);
      if (it == described.end()) {
        it = described.emplace(table, services_.schema.describe_table(table)).first;
      }
      return it->second;
    };

    std::vector<schema::TableSchema> brief;
    const std::size_t brief_count = std::min(all_tables.size(), config_.schema_table_limit);
    for (std::size_t i = 0; i < brief_count; ++i) {
      brief.push_back(describe(all_tables[i]));
    }

    std::string answer;
    try {
      answer = services_.llm.complete(
          {{ChatRole::kUser, schema_selector_prompt(schema::render_schema(brief), state.user_query)}});
    } catch (const core::LlmResponseError& e) {
      std::cerr << "workflow: table selection failed, using default tables: " << e.what() << "\n";
    }

    const std::set<std::string> known(all_tables.begin(), all_tables.end());
    std::set<std::string> seen;
    for (const auto& name : core::split_trimmed(answer, ',')) {
      if (known.count(name) > 0 && seen.insert(name).second) {
        state.relevant_tables.push_back(name);
      }
    }
    if (state.relevant_tables.empty()) {
      const std::size_t fallback = std::min(all_tables.size(), config_.schema_fallback_limit);
      state.relevant_tables.assign(all_tables.begin(),
                                   all_tables.begin() + static_cast<std::ptrdiff_t>(fallback));
    }

    std::vector<schema::TableSchema> chosen;
    chosen.reserve(state.relevant_tables.size());
    for (const auto& table : state.relevant_tables) {
      chosen.push_back(describe(table));
    }
    state.schema_info = schema::render_schema(chosen);

    add_message(state, ChatRole::kAssistant,
                "[Schema] relevant tables: " + core::join(state.relevant_tables, ", "));
    emit(state.trace_id, "SchemaResolved", {{"tables", state.relevant_tables}});
  } catch (const core::SchemaError& e) {
    state.relevant_tables.clear();
    state.schema_info.clear();
    state.schema_error = std::string("Schema retrieval failed: ") + e.what();
    emit(state.trace_id, "SchemaDegraded", {{"error", *state.schema_error}});
  }

  return WorkflowStage::kGenerate;
}

// ─────────────────────────────────────────────────────────────────────────────
// GENERATE
// ─────────────────────────────────────────────────────────────────────────────

std::string WorkflowEngine::retrieve_examples(const WorkflowState& state,
                                              std::vector<std::string>& example_ids) {
  retrieval::RetrievalQuery query;
  query.text = state.user_query;
  query.k = config_.retrieval_k;
  if (!state.relevant_tables.empty()) {
    query.relevant_tables =
        std::set<std::string>(state.relevant_tables.begin(), state.relevant_tables.end());
  }

  try {
    const auto results = services_.examples.retrieve(query);
    for (const auto& r : results) {
      example_ids.push_back(r.example.id);
    }
    return retrieval::format_examples_for_prompt(results);
  } catch (const core::EmbeddingError& e) {
    std::cerr << "workflow: retrieval unavailable, generating without examples: " << e.what()
              << "\n";
    emit(state.trace_id, "RetrievalDegraded", {{"error", e.what()}});
    return "";
  }
}

WorkflowStage WorkflowEngine::run_generate(WorkflowState& state) {
  state.current_agent = "sql_generator";

  std::string mode;
  std::vector<std::string> example_ids;
  try {
    if (state.intent == Intent::kSqlToText) {
      mode = "explain";
      const std::string sql =
          llm::extract_sql_for_explanation(state.user_query).value_or(state.user_query);
      const std::string answer = services_.llm.complete(
          {{ChatRole::kUser, sql_to_text_prompt(state.schema_info, sql)}});
      state.generated_sql = sql;
      state.sql_explanation = core::trim(answer);
      if (state.sql_explanation->empty()) {
        state.error = "SQL explanation failed: empty response";
        return WorkflowStage::kFailed;
      }
    } else {
      std::string prompt;
      if (state.repair.has_value()) {
        mode = "repair";
        prompt = debug_sql_prompt(state.schema_info, state.repair->failed_sql,
                                  state.repair->error.message);
        state.repair.reset();
      } else if (state.intent == Intent::kDebug) {
        mode = "debug";
        const std::string sql =
            llm::extract_sql_for_explanation(state.user_query).value_or(state.user_query);
        prompt = debug_sql_prompt(state.schema_info, sql, state.user_query);
      } else {
        mode = "retrieval";
        const std::string examples = retrieve_examples(state, example_ids);
        prompt = text_to_sql_prompt(config_.sql_dialect, state.schema_info, examples,
                                    state.user_query);
      }

      state.generated_sql = llm::clean_sql(services_.llm.complete({{ChatRole::kUser, prompt}}));
      if (state.generated_sql.empty()) {
        state.error = "SQL generation failed: empty response";
        return WorkflowStage::kFailed;
      }
    }
  } catch (const core::LlmResponseError& e) {
    state.error = std::string("SQL generation failed: ") + e.what();
    return WorkflowStage::kFailed;
  }

  emit(state.trace_id, "SqlGenerated",
       {{"mode", mode}, {"sql", state.generated_sql}, {"attempt", state.retry_count + 1}},
       example_ids);
  return WorkflowStage::kExecute;
}

// ─────────────────────────────────────────────────────────────────────────────
// EXECUTE
// ─────────────────────────────────────────────────────────────────────────────

WorkflowStage WorkflowEngine::run_execute(WorkflowState& state) {
  state.current_agent = "sql_executor";

  if (state.intent == Intent::kSqlToText) {
    response_ = "**SQL Explanation:**\n\n" + state.sql_explanation.value_or("");
    add_message(state, ChatRole::kAssistant, response_);
    return WorkflowStage::kDone;
  }

  auto outcome = services_.executor.execute(state.generated_sql, config_.execution_timeout);
  if (outcome.has_value()) {
    state.execution_error.reset();
    state.execution_result = std::move(outcome.value());
    response_ = execution::format_query_response(state.generated_sql, *state.execution_result,
                                                 config_.display_rows);
    add_message(state, ChatRole::kAssistant, response_);
    emit(state.trace_id, "ExecutionSucceeded",
         {{"row_count", state.execution_result->row_count},
          {"truncated", state.execution_result->truncated},
          {"attempt", state.retry_count + 1}});
    return WorkflowStage::kDone;
  }

  const domain::ExecutionError failure = outcome.error();
  emit(state.trace_id, "ExecutionFailed",
       {{"kind", std::string(domain::to_string(failure.kind))},
        {"message", failure.message},
        {"attempt", state.retry_count + 1}});

  if (state.retry_count < state.max_retries) {
    ++state.retry_count;
    state.repair = domain::RepairContext{.failed_sql = state.generated_sql, .error = failure};
    state.execution_error.reset();
    emit(state.trace_id, "RepairScheduled",
         {{"retry_count", state.retry_count}, {"max_retries", state.max_retries}});
    return WorkflowStage::kGenerate;
  }

  state.execution_error = failure;
  state.error = "SQL execution failed after " + std::to_string(state.retry_count + 1) +
                " attempts (" + std::to_string(state.retry_count) + " repairs): " + failure.message;
  response_ = "**SQL Execution Failed:**\n```sql\n" + state.generated_sql +
              "\n```\n\n**Error:** " + failure.message + "\n\nGave up after " +
              std::to_string(state.retry_count + 1) + " attempts (" +
              std::to_string(state.retry_count) + " repairs).";
  add_message(state, ChatRole::kAssistant, response_);
  return WorkflowStage::kFailed;
}

void WorkflowEngine::emit(const std::string& trace_id, const std::string& event_type,
                          const nlohmann::json& payload, std::vector<std::string> refs) {
  services_.audit_log.append({id_gen_.next("evt"), trace_id, event_type, payload.dump(),
                              clock_.now_iso8601(), std::move(refs)});
}

}  // namespace sqlrag::workflow
