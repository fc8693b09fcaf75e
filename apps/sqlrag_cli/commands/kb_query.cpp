#include "kb_query.h"

#include "sqlrag/app/knowledge_base.h"
#include "sqlrag/core/clock.h"
#include "sqlrag/core/errors.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/core/normalization.h"
#include "sqlrag/net/http_client.h"
#include "sqlrag/storage/audit_log.h"

#include "cli_config.h"
#include "kb_query_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct KbQueryCliConfig {
  sqlrag::cli::ModelOptions model;
  std::optional<std::set<std::string>> tables;
  std::size_t k{3};
  std::optional<sqlrag::domain::Complexity> complexity;
  bool args_valid{true};
};

std::vector<sqlrag::apps::Option<KbQueryCliConfig>> search_options() {
  std::vector<sqlrag::apps::Option<KbQueryCliConfig>> options = {
      {"--tables", true, "Comma-separated table filter",
       [](KbQueryCliConfig& c, const std::string& v) {
         const auto parts = sqlrag::core::split_trimmed(v, ',');
         c.tables = std::set<std::string>(parts.begin(), parts.end());
         return true;
       }},
      {"--k", true, "Number of results (default 3)",
       [](KbQueryCliConfig& c, const std::string& v) {
         auto n = sqlrag::cli::parse_long(v, 1, 100);
         if (!n.has_value()) {
           std::cerr << "Invalid --k: " << v << " (expected 1..100)\n";
           c.args_valid = false;
           return false;
         }
         c.k = static_cast<std::size_t>(n.value());
         return true;
       }},
      {"--complexity", true, "Complexity hint (simple|medium|complex)",
       [](KbQueryCliConfig& c, const std::string& v) {
         auto hint = sqlrag::domain::parse_complexity(v);
         if (!hint.has_value()) {
           std::cerr << "Invalid --complexity: " << v << " (valid: simple, medium, complex)\n";
           c.args_valid = false;
           return false;
         }
         c.complexity = hint;
         return true;
       }},
  };
  auto shared = sqlrag::cli::model_options<KbQueryCliConfig>();
  options.insert(options.end(), shared.begin(), shared.end());
  return options;
}

// Shared setup: parse, validate and hand an opened knowledge base to fn.
template <typename Fn>
int with_knowledge_base(KbQueryCliConfig& config, Fn&& fn) {
  if (!config.args_valid || !config.model.args_valid) {
    return 1;
  }
  if (!config.model.kb_dir.has_value()) {
    std::cerr << "Error: --kb <dir> is required\n";
    return 1;
  }
  sqlrag::cli::apply_env_keys(config.model);
  if (const auto problem = sqlrag::cli::validate_model_options(config.model, false);
      !problem.empty()) {
    std::cerr << "Error: " << problem << "\n";
    return 1;
  }

  sqlrag::net::CurlHttpClient http;
  sqlrag::storage::InMemoryAuditLog audit_log;
  sqlrag::core::SystemIdGenerator id_gen;
  sqlrag::core::SystemClock clock;
  try {
    sqlrag::app::KnowledgeBase kb(sqlrag::cli::make_kb_config(config.model), http, audit_log,
                                  id_gen, clock);
    return fn(kb);
  } catch (const sqlrag::core::IndexError& e) {
    std::cerr << "Error: knowledge base is incompatible: " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int cmd_kb_status(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = sqlrag::cli::model_options<KbQueryCliConfig>();
  auto config = sqlrag::apps::parse_options(argc, argv, options, 2);
  return with_knowledge_base(config, [](sqlrag::app::KnowledgeBase& kb) {
    return execute_kb_status(kb.store(), kb.index());
  });
}

int cmd_kb_search(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = search_options();
  std::vector<std::string> words;
  auto config = sqlrag::apps::parse_options(argc, argv, options, 2, KbQueryCliConfig{}, &words);

  const std::string text = sqlrag::core::join(words, " ");
  if (text.empty()) {
    std::cerr << "Usage: sqlrag_cli kb-search <text...> --kb <dir> [options]\n";
    sqlrag::apps::print_options(std::cerr, options);
    return 1;
  }

  sqlrag::retrieval::RetrievalQuery query;
  query.text = text;
  query.relevant_tables = config.tables;
  query.k = config.k;
  query.complexity_hint = config.complexity;

  return with_knowledge_base(config, [&query](sqlrag::app::KnowledgeBase& kb) {
    return execute_kb_search(kb.store(), query);
  });
}
