#include "sqlrag/core/clock.h"
#include "sqlrag/core/errors.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/core/services.h"
#include "sqlrag/embedding/embedding_provider.h"
#include "sqlrag/feedback/feedback_recorder.h"
#include "sqlrag/ingest/example_loader.h"
#include "sqlrag/retrieval/example_store.h"
#include "sqlrag/storage/audit_log.h"
#include "sqlrag/vector/vector_index.h"
#include "sqlrag/workflow/workflow_engine.h"

#include "support/fakes.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace sqlrag;
using domain::ExecutionErrorKind;
using domain::Intent;
using domain::WorkflowStage;

namespace {

std::vector<schema::TableSchema> shop_tables() {
  return {
      schema::TableSchema{.name = "users",
                          .comment = "",
                          .columns = {{.name = "id", .type = "INTEGER", .nullable = false, .key = "PRI"},
                                      {.name = "username", .type = "TEXT", .nullable = false}}},
      schema::TableSchema{.name = "products",
                          .comment = "catalogue",
                          .columns = {{.name = "id", .type = "INTEGER", .nullable = false, .key = "PRI"},
                                      {.name = "name", .type = "TEXT"},
                                      {.name = "price", .type = "REAL"}}},
  };
}

struct EngineFixture {
  embedding::DeterministicStubEmbeddingProvider embedder{64};
  vector::VectorIndex index{64};
  retrieval::ExampleStore store{embedder, index};
  storage::InMemoryAuditLog audit_log;
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  feedback::FeedbackRecorder feedback{store, audit_log, id_gen, clock};
  testing::ScriptedLlmClient llm;
  testing::StaticSchemaProvider schema{shop_tables()};
  testing::ScriptedSqlExecutor executor;
  core::Services services{llm, schema, executor, store, feedback, audit_log};

  workflow::WorkflowResult run(const std::string& input, workflow::WorkflowConfig config = {}) {
    workflow::WorkflowEngine engine(services, id_gen, clock, config);
    return engine.run({.user_input = input, .max_retries = std::nullopt, .trace_id = "trace-t"});
  }
};

}  // namespace

TEST_CASE("Greeting goes straight to chat", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("Hello! Ask me anything about your data.");

  const auto result = f.run("hello");

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK(result.intent == std::optional{Intent::kChat});
  CHECK(result.intent_confidence == 0.9);
  CHECK(result.response == "Hello! Ask me anything about your data.");
  CHECK(f.llm.call_count() == 1);
  CHECK(f.executor.executed().empty());
  CHECK_FALSE(result.feedback_recorded);
}

TEST_CASE("Text-to-SQL happy path learns the query", "[workflow][engine]") {
  EngineFixture f;
  REQUIRE(f.store.add(ingest::base_examples()).size() == 10);

  f.llm.push("products");
  f.llm.push("```sql\nSELECT * FROM products\n```");

  const auto result = f.run("list all products");

  REQUIRE(result.stage == WorkflowStage::kDone);
  CHECK(result.intent == std::optional{Intent::kTextToSql});
  CHECK(result.sql == "SELECT * FROM products");
  CHECK(result.tables_used == std::vector<std::string>{"products"});
  CHECK(result.retry_count == 0);
  CHECK_FALSE(result.error.has_value());
  REQUIRE(result.execution_result.has_value());
  CHECK(result.execution_result->row_count == 1);
  CHECK(result.response.find("widget") != std::string::npos);

  // Selector sees the schema, generator sees the retrieved examples.
  REQUIRE(f.llm.call_count() == 2);
  CHECK(f.llm.prompt(0).find("## Table: products") != std::string::npos);
  CHECK(f.llm.prompt(1).find("## Similar SQL Examples") != std::string::npos);
  CHECK(f.llm.prompt(1).find("list all products") != std::string::npos);

  CHECK(result.feedback_recorded);
  CHECK(f.store.count() == 11);
  CHECK(f.store.contains_sql("SELECT * FROM products"));

  for (const char* type : {"WorkflowStarted", "IntentClassified", "SchemaResolved",
                           "SqlGenerated", "ExecutionSucceeded", "FeedbackCaptured",
                           "WorkflowCompleted"}) {
    INFO(type);
    CHECK(testing::count_events(f.audit_log, "trace-t", type) == 1);
  }
}

TEST_CASE("Failed executions are repaired", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("products");
  f.llm.push("SELECT nme FROM products");
  f.llm.push("SELECT nam FROM products");
  f.llm.push("SELECT name FROM products");
  f.executor.push_failure(ExecutionErrorKind::kDatabaseError, "no such column: nme");
  f.executor.push_failure(ExecutionErrorKind::kDatabaseError, "no such column: nam");

  const auto result = f.run("list all products");

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK(result.retry_count == 2);
  CHECK(result.sql == "SELECT name FROM products");
  CHECK_FALSE(result.execution_error.has_value());
  CHECK(f.executor.executed().size() == 3);

  // The repair prompt carries the failing SQL and its error.
  CHECK(f.llm.prompt(2).find("SELECT nme FROM products") != std::string::npos);
  CHECK(f.llm.prompt(2).find("no such column: nme") != std::string::npos);
  CHECK(testing::count_events(f.audit_log, "trace-t", "RepairScheduled") == 2);
}

TEST_CASE("Repair prompts reuse the failure instead of retrieving again", "[workflow][engine]") {
  EngineFixture f;
  REQUIRE(f.store.add(ingest::base_examples()).size() == 10);
  f.llm.push("products");
  f.llm.push("SELECT nme FROM products");
  f.llm.push("SELECT name FROM products");
  f.executor.push_failure(ExecutionErrorKind::kDatabaseError, "no such column: nme");

  const auto result = f.run("list all products");

  REQUIRE(result.stage == WorkflowStage::kDone);
  CHECK(result.retry_count == 1);
  REQUIRE(f.llm.call_count() == 3);
  CHECK(f.llm.prompt(1).find("## Similar SQL Examples") != std::string::npos);

  const std::string repair_prompt = f.llm.prompt(2);
  CHECK(repair_prompt.find("SELECT nme FROM products") != std::string::npos);
  CHECK(repair_prompt.find("no such column: nme") != std::string::npos);
  CHECK(repair_prompt.find("## Similar SQL Examples") == std::string::npos);

  std::vector<storage::AuditEvent> generated;
  for (const auto& event : f.audit_log.query("trace-t")) {
    if (event.event_type == "SqlGenerated") {
      generated.push_back(event);
    }
  }
  REQUIRE(generated.size() == 2);
  CHECK(nlohmann::json::parse(generated[0].payload).at("mode") == "retrieval");
  CHECK_FALSE(generated[0].refs.empty());
  CHECK(nlohmann::json::parse(generated[1].payload).at("mode") == "repair");
  CHECK(generated[1].refs.empty());
}

TEST_CASE("Repairs stop at max_retries", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("products");
  for (int i = 0; i < 4; ++i) {
    f.llm.push("SELECT broken FROM products");
    f.executor.push_failure(ExecutionErrorKind::kDatabaseError, "no such column: broken");
  }

  const auto result = f.run("list all products");

  CHECK(result.stage == WorkflowStage::kFailed);
  CHECK(result.retry_count == 3);
  CHECK(f.executor.executed().size() == 4);
  REQUIRE(result.execution_error.has_value());
  CHECK(result.execution_error->message == "no such column: broken");
  REQUIRE(result.error.has_value());
  CHECK(*result.error ==
        "SQL execution failed after 4 attempts (3 repairs): no such column: broken");
  CHECK(result.response.find("**SQL Execution Failed:**") == 0);
  CHECK(result.response.find("no such column: broken") != std::string::npos);
  CHECK(result.response.find("Gave up after 4 attempts (3 repairs).") != std::string::npos);
  CHECK(testing::count_events(f.audit_log, "trace-t", "RepairScheduled") == 3);
  CHECK(testing::count_events(f.audit_log, "trace-t", "WorkflowFailed") == 1);
  CHECK_FALSE(result.feedback_recorded);
  CHECK(f.store.count() == 0);
}

TEST_CASE("max_retries zero fails on the first error", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("products");
  f.llm.push("SELECT broken FROM products");
  f.executor.push_failure(ExecutionErrorKind::kTimeout, "query timed out");

  workflow::WorkflowEngine engine(f.services, f.id_gen, f.clock);
  const auto result =
      engine.run({.user_input = "list all products", .max_retries = 0, .trace_id = "trace-z"});

  CHECK(result.stage == WorkflowStage::kFailed);
  CHECK(result.retry_count == 0);
  CHECK(f.executor.executed().size() == 1);
  CHECK(result.execution_error->kind == ExecutionErrorKind::kTimeout);
}

TEST_CASE("Schema failures do not stop generation", "[workflow][engine]") {
  EngineFixture f;
  f.schema.fail();
  f.llm.push("SELECT * FROM products");

  const auto result = f.run("list all products");

  CHECK(result.stage == WorkflowStage::kDone);
  REQUIRE(result.schema_error.has_value());
  CHECK(result.schema_error->find("database is locked") != std::string::npos);
  CHECK(result.tables_used.empty());
  CHECK(f.llm.call_count() == 1);
  CHECK(testing::count_events(f.audit_log, "trace-t", "SchemaDegraded") == 1);
}

TEST_CASE("Unknown table names fall back to the first tables", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("inventory, warehouses");
  f.llm.push("SELECT * FROM products");

  const auto result = f.run("list all products");

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK(result.tables_used == std::vector<std::string>{"users", "products"});
}

TEST_CASE("An unreachable LLM escapes run", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push_failure(testing::ScriptedLlmClient::Failure::kUnavailable);

  workflow::WorkflowEngine engine(f.services, f.id_gen, f.clock);
  CHECK_THROWS_AS(
      engine.run({.user_input = "list all products", .max_retries = std::nullopt, .trace_id = "trace-u"}),
      core::LlmUnavailableError);
  CHECK(testing::count_events(f.audit_log, "trace-u", "WorkflowFailed") == 1);
  CHECK(testing::count_events(f.audit_log, "trace-u", "WorkflowCompleted") == 0);
}

TEST_CASE("Unusable classifier output falls back to chat", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("I think this is small talk");
  f.llm.push("Sure, here is something interesting.");

  const auto result = f.run("tell me something interesting");

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK(result.intent == std::optional{Intent::kChat});
  CHECK(result.intent_confidence == 0.5);
  CHECK(f.llm.call_count() == 2);
}

TEST_CASE("Empty input fails without calling the model", "[workflow][engine]") {
  EngineFixture f;

  const auto result = f.run("   ");

  CHECK(result.stage == WorkflowStage::kFailed);
  CHECK(result.error == std::optional<std::string>{"No user input found"});
  CHECK(f.llm.call_count() == 0);
}

TEST_CASE("Retrieval failures degrade to generation without examples", "[workflow][engine]") {
  embedding::DeterministicStubEmbeddingProvider embedder(64);
  vector::VectorIndex index(64);
  {
    retrieval::ExampleStore seeding(embedder, index);
    REQUIRE(seeding.add(ingest::base_examples()).size() == 10);
  }

  testing::FailingEmbeddingProvider broken(64);
  retrieval::ExampleStore store(broken, index);
  storage::InMemoryAuditLog audit_log;
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  feedback::FeedbackRecorder feedback(store, audit_log, id_gen, clock);
  testing::ScriptedLlmClient llm;
  testing::StaticSchemaProvider schema(shop_tables());
  testing::ScriptedSqlExecutor executor;
  core::Services services(llm, schema, executor, store, feedback, audit_log);

  llm.push("products");
  llm.push("SELECT * FROM products");

  workflow::WorkflowEngine engine(services, id_gen, clock);
  const auto result =
      engine.run({.user_input = "list all products", .max_retries = std::nullopt, .trace_id = "trace-r"});

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK(llm.prompt(1).find("## Similar SQL Examples") == std::string::npos);
  CHECK(testing::count_events(audit_log, "trace-r", "RetrievalDegraded") == 1);
  // Capturing needs an embedding too; the run still succeeds.
  CHECK_FALSE(result.feedback_recorded);
  CHECK(testing::count_events(audit_log, "trace-r", "FeedbackFailed") == 1);
}

TEST_CASE("SQL explanations skip execution", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("users");
  f.llm.push("Returns every column of every user.");

  const auto result = f.run("explain SELECT * FROM users");

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK(result.intent == std::optional{Intent::kSqlToText});
  CHECK(result.sql == "SELECT * FROM users");
  CHECK(result.explanation == std::optional<std::string>{"Returns every column of every user."});
  CHECK(result.response.find("**SQL Explanation:**") == 0);
  CHECK(f.executor.executed().empty());
  CHECK_FALSE(result.feedback_recorded);
}

TEST_CASE("Generation errors end the run", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("products");
  f.llm.push_failure(testing::ScriptedLlmClient::Failure::kResponse);

  const auto result = f.run("list all products");

  CHECK(result.stage == WorkflowStage::kFailed);
  REQUIRE(result.error.has_value());
  CHECK(result.error->rfind("SQL generation failed: ", 0) == 0);
  CHECK(f.executor.executed().empty());
}

TEST_CASE("Feedback can be disabled", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("products");
  f.llm.push("SELECT * FROM products");

  workflow::WorkflowConfig config;
  config.enable_feedback = false;
  const auto result = f.run("list all products", config);

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK_FALSE(result.feedback_recorded);
  CHECK(f.store.count() == 0);
}

TEST_CASE("Debug requests send the user's SQL to the model", "[workflow][engine]") {
  EngineFixture f;
  f.llm.push("users");
  f.llm.push("SELECT * FROM users");

  const auto result = f.run("this fails: SELECT * FROM user");

  CHECK(result.stage == WorkflowStage::kDone);
  CHECK(result.intent == std::optional{Intent::kDebug});
  CHECK(f.llm.prompt(1).find("SELECT * FROM user") != std::string::npos);
  CHECK(f.executor.executed() == std::vector<std::string>{"SELECT * FROM users"});
  CHECK(result.feedback_recorded);
}
