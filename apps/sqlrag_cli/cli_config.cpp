#include "cli_config.h"

#include <cerrno>
#include <cstdlib>

namespace sqlrag::cli {

std::optional<long> parse_long(const std::string& s, const long min_value, const long max_value) {
  if (s.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const long value = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0' || value < min_value || value > max_value) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(s.c_str(), &end);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

void apply_env_keys(ModelOptions& options) {
  if (options.llm.api_key.empty()) {
    if (const char* key = std::getenv("SQLRAG_LLM_API_KEY"); key != nullptr) {
      options.llm.api_key = key;
    }
  }
  if (options.embedding.api_key.empty()) {
    if (const char* key = std::getenv("SQLRAG_EMBEDDING_API_KEY"); key != nullptr) {
      options.embedding.api_key = key;
    }
  }
}

std::string validate_model_options(const ModelOptions& options, const bool needs_llm) {
  if (auto problem = embedding::validate_embedding_config(options.embedding); !problem.empty()) {
    return problem;
  }
  if (needs_llm) {
    if (auto problem = llm::validate_llm_config(options.llm); !problem.empty()) {
      return problem;
    }
  }
  return "";
}

app::KnowledgeBaseConfig make_kb_config(const ModelOptions& options) {
  app::KnowledgeBaseConfig config;
  if (options.kb_dir.has_value()) {
    config.directory = *options.kb_dir;
  }
  config.embedding = options.embedding;
  config.backend = options.backend;
  if (options.learned_path.has_value()) {
    config.learned_examples_path = *options.learned_path;
  }
  return config;
}

}  // namespace sqlrag::cli
