#include "ask.h"

#include "sqlrag/app/knowledge_base.h"
#include "sqlrag/core/clock.h"
#include "sqlrag/core/errors.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/core/normalization.h"
#include "sqlrag/core/services.h"
#include "sqlrag/core/version.h"
#include "sqlrag/execution/sql_executor.h"
#include "sqlrag/llm/llm_client.h"
#include "sqlrag/net/http_client.h"
#include "sqlrag/schema/sqlite_schema_provider.h"
#include "sqlrag/storage/audit_log.h"
#include "sqlrag/storage/sqlite/sqlite_audit_log.h"
#include "sqlrag/storage/sqlite/sqlite_db.h"

#include "ask_logic.h"
#include "cli_config.h"
#include "shared/arg_parser.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct AskCliConfig {
  sqlrag::cli::ModelOptions model;
  std::optional<std::string> target_db;
  std::optional<std::string> audit_db;
  std::optional<int> max_retries;
  long timeout_ms{30000};
  std::size_t k{3};
  bool trace{false};
  bool feedback{true};
  bool args_valid{true};
};

}  // namespace

int cmd_ask(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<sqlrag::apps::Option<AskCliConfig>> options = {
      {"--target-db", true, "SQLite database to query (opened read-only)",
       [](AskCliConfig& c, const std::string& v) {
         c.target_db = v;
         return true;
       }},
      {"--audit-db", true, "SQLite file for the audit trail (default: in memory)",
       [](AskCliConfig& c, const std::string& v) {
         c.audit_db = v;
         return true;
       }},
      {"--max-retries", true, "Repair attempts after a failed execution (default 3)",
       [](AskCliConfig& c, const std::string& v) {
         auto n = sqlrag::cli::parse_long(v, 0, 10);
         if (!n.has_value()) {
           std::cerr << "Invalid --max-retries: " << v << " (expected 0..10)\n";
           c.args_valid = false;
           return false;
         }
         c.max_retries = static_cast<int>(n.value());
         return true;
       }},
      {"--timeout-ms", true, "Query execution timeout in milliseconds (default 30000)",
       [](AskCliConfig& c, const std::string& v) {
         auto n = sqlrag::cli::parse_long(v, 1, 3600000);
         if (!n.has_value()) {
           std::cerr << "Invalid --timeout-ms: " << v << " (expected a positive integer)\n";
           c.args_valid = false;
           return false;
         }
         c.timeout_ms = n.value();
         return true;
       }},
      {"--k", true, "Examples retrieved for the generation prompt (default 3)",
       [](AskCliConfig& c, const std::string& v) {
         auto n = sqlrag::cli::parse_long(v, 0, 50);
         if (!n.has_value()) {
           std::cerr << "Invalid --k: " << v << " (expected 0..50)\n";
           c.args_valid = false;
           return false;
         }
         c.k = static_cast<std::size_t>(n.value());
         return true;
       }},
      {"--trace", false, "Print the audit trail after the answer",
       [](AskCliConfig& c, const std::string&) {
         c.trace = true;
         return true;
       }},
      {"--no-feedback", false, "Do not learn from successful answers",
       [](AskCliConfig& c, const std::string&) {
         c.feedback = false;
         return true;
       }},
  };
  auto shared = sqlrag::cli::model_options<AskCliConfig>();
  options.insert(options.end(), shared.begin(), shared.end());

  std::vector<std::string> words;
  auto config = sqlrag::apps::parse_options(argc, argv, options, 2, AskCliConfig{}, &words);
  if (!config.args_valid || !config.model.args_valid) {
    return 1;
  }

  const std::string question = sqlrag::core::join(words, " ");
  if (question.empty() || !config.target_db.has_value()) {
    std::cerr << "Usage: sqlrag_cli ask <question...> --target-db <path> [options]\n";
    sqlrag::apps::print_options(std::cerr, options);
    return 1;
  }

  sqlrag::cli::apply_env_keys(config.model);
  if (const auto problem = sqlrag::cli::validate_model_options(config.model, true);
      !problem.empty()) {
    std::cerr << "Error: " << problem << "\n";
    return 1;
  }

  std::unique_ptr<sqlrag::storage::IAuditLog> audit_log;
  if (config.audit_db.has_value()) {
    auto db_result = sqlrag::storage::sqlite::SqliteDb::open(config.audit_db.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open audit database: " << db_result.error() << "\n";
      return 1;
    }
    try {
      audit_log = std::make_unique<sqlrag::storage::sqlite::SqliteAuditLog>(db_result.value());
    } catch (const sqlrag::core::PersistenceError& e) {
      std::cerr << "Failed to initialize audit schema: " << e.what() << "\n";
      return 1;
    }
  } else {
    audit_log = std::make_unique<sqlrag::storage::InMemoryAuditLog>();
  }

  if (!config.model.kb_dir.has_value()) {
    std::cerr << "Warning: no --kb given; examples are not loaded and nothing learned is kept\n";
  }

  sqlrag::net::CurlHttpClient http;
  sqlrag::core::SystemIdGenerator id_gen;
  sqlrag::core::SystemClock clock;

  try {
    sqlrag::llm::HttpLlmClient llm(http, config.model.llm);
    sqlrag::app::KnowledgeBase kb(sqlrag::cli::make_kb_config(config.model), http, *audit_log,
                                  id_gen, clock);
    sqlrag::schema::SqliteSchemaProvider schema(config.target_db.value());
    sqlrag::execution::SqliteSqlExecutor executor(config.target_db.value());

    sqlrag::core::Services services{llm,      schema,          executor,
                                    kb.store(), kb.feedback(), *audit_log};

    sqlrag::workflow::WorkflowConfig workflow_config;
    workflow_config.execution_timeout = std::chrono::milliseconds(config.timeout_ms);
    workflow_config.retrieval_k = config.k;
    workflow_config.enable_feedback = config.feedback;

    std::cerr << "sqlrag v" << sqlrag::core::kBuildVersion << " target=" << *config.target_db
              << " kb=" << config.model.kb_dir.value_or("(memory)")
              << " examples=" << kb.store().count()
              << " embedding=" << kb.embedder().provider_id() << "\n";

    sqlrag::workflow::WorkflowRequest request{
        .user_input = question, .max_retries = config.max_retries, .trace_id = std::nullopt};
    return execute_ask(services, id_gen, clock, workflow_config, request, config.trace);
  } catch (const sqlrag::core::IndexError& e) {
    std::cerr << "Error: knowledge base is incompatible: " << e.what() << "\n";
    return 1;
  } catch (const sqlrag::core::SchemaError& e) {
    std::cerr << "Error: cannot open target database: " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
