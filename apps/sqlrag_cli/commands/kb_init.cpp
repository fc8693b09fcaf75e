#include "kb_init.h"

#include "sqlrag/app/knowledge_base.h"
#include "sqlrag/core/clock.h"
#include "sqlrag/core/errors.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/ingest/example_generator.h"
#include "sqlrag/llm/llm_client.h"
#include "sqlrag/net/http_client.h"
#include "sqlrag/schema/sqlite_schema_provider.h"
#include "sqlrag/storage/audit_log.h"

#include "cli_config.h"
#include "kb_init_logic.h"
#include "shared/arg_parser.h"
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kGenerationSchemaTables = 20;

struct KbInitCliConfig {
  sqlrag::cli::ModelOptions model;
  std::vector<std::string> example_paths;
  bool include_base{true};
  std::size_t generate_count{0};
  std::optional<std::string> target_db;
  std::optional<std::string> generated_file;
  bool args_valid{true};
};

}  // namespace

int cmd_kb_init(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<sqlrag::apps::Option<KbInitCliConfig>> options = {
      {"--examples", true, "JSON example file or directory (repeatable)",
       [](KbInitCliConfig& c, const std::string& v) {
         c.example_paths.push_back(v);
         return true;
       }},
      {"--no-base", false, "Skip the built-in base examples",
       [](KbInitCliConfig& c, const std::string&) {
         c.include_base = false;
         return true;
       }},
      {"--generate", true, "Ask the LLM for N examples over --target-db's schema",
       [](KbInitCliConfig& c, const std::string& v) {
         auto n = sqlrag::cli::parse_long(v, 0, 500);
         if (!n.has_value()) {
           std::cerr << "Invalid --generate: " << v << " (expected 0..500)\n";
           c.args_valid = false;
           return false;
         }
         c.generate_count = static_cast<std::size_t>(n.value());
         return true;
       }},
      {"--target-db", true, "SQLite database whose schema drives generation",
       [](KbInitCliConfig& c, const std::string& v) {
         c.target_db = v;
         return true;
       }},
      {"--generated-file", true, "JSON file generated examples are merged into",
       [](KbInitCliConfig& c, const std::string& v) {
         c.generated_file = v;
         return true;
       }},
  };
  auto shared = sqlrag::cli::model_options<KbInitCliConfig>();
  options.insert(options.end(), shared.begin(), shared.end());

  auto config = sqlrag::apps::parse_options(argc, argv, options, 2);
  if (!config.args_valid || !config.model.args_valid) {
    return 1;
  }
  if (!config.model.kb_dir.has_value()) {
    std::cerr << "Error: --kb <dir> is required\n";
    return 1;
  }
  const bool generating = config.generate_count > 0;
  if (generating && !config.target_db.has_value()) {
    std::cerr << "Error: --generate requires --target-db <path>\n";
    return 1;
  }

  sqlrag::cli::apply_env_keys(config.model);
  if (const auto problem = sqlrag::cli::validate_model_options(config.model, generating);
      !problem.empty()) {
    std::cerr << "Error: " << problem << "\n";
    return 1;
  }

  sqlrag::net::CurlHttpClient http;
  sqlrag::storage::InMemoryAuditLog audit_log;
  sqlrag::core::SystemIdGenerator id_gen;
  sqlrag::core::SystemClock clock;

  sqlrag::app::KbInitRequest request;
  request.include_base = config.include_base;
  for (const auto& p : config.example_paths) {
    request.example_paths.emplace_back(p);
  }
  request.generate_count = config.generate_count;
  if (config.generated_file.has_value()) {
    request.generated_examples_path = *config.generated_file;
  }

  try {
    sqlrag::app::KnowledgeBase kb(sqlrag::cli::make_kb_config(config.model), http, audit_log,
                                  id_gen, clock);

    std::unique_ptr<sqlrag::llm::HttpLlmClient> llm;
    std::unique_ptr<sqlrag::ingest::ExampleGenerator> generator;
    if (generating) {
      sqlrag::schema::SqliteSchemaProvider schema(config.target_db.value());
      request.schema_text = sqlrag::schema::render_database_schema(schema, kGenerationSchemaTables);
      llm = std::make_unique<sqlrag::llm::HttpLlmClient>(http, config.model.llm);
      generator = std::make_unique<sqlrag::ingest::ExampleGenerator>(*llm);
    }

    std::cout << "Starting kb-init: kb=" << *config.model.kb_dir
              << " existing=" << kb.store().count()
              << " embedding=" << kb.embedder().provider_id() << "\n";

    return execute_kb_init(request, kb, generator.get(), audit_log, id_gen, clock);
  } catch (const sqlrag::core::IndexError& e) {
    std::cerr << "Error: knowledge base is incompatible: " << e.what() << "\n";
    return 1;
  } catch (const sqlrag::core::SchemaError& e) {
    std::cerr << "Error: cannot read target schema: " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
