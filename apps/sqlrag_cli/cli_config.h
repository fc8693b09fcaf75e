#pragma once

#include "sqlrag/app/knowledge_base.h"
#include "sqlrag/embedding/embedding_config.h"
#include "sqlrag/llm/llm_client.h"
#include "sqlrag/vector/vector_backend.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace sqlrag::cli {

// Flags shared by every subcommand that talks to a model or a knowledge base.
struct ModelOptions {
  llm::LlmConfig llm;                                           // NOLINT(readability-identifier-naming)
  embedding::EmbeddingConfig embedding;                         // NOLINT(readability-identifier-naming)
  std::optional<std::string> kb_dir;                            // NOLINT(readability-identifier-naming)
  vector::VectorBackend backend{vector::VectorBackend::kFlat};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> learned_path;                      // NOLINT(readability-identifier-naming)
  bool args_valid{true};                                        // NOLINT(readability-identifier-naming)
};

// Strict decimal parse: the whole string must be a number within [min_value, max_value].
[[nodiscard]] std::optional<long> parse_long(const std::string& s, long min_value,
                                             long max_value);
[[nodiscard]] std::optional<double> parse_double(const std::string& s);

// Fills empty API keys from SQLRAG_LLM_API_KEY / SQLRAG_EMBEDDING_API_KEY.
void apply_env_keys(ModelOptions& options);

// Returns "" when usable. needs_llm adds the LLM checks.
[[nodiscard]] std::string validate_model_options(const ModelOptions& options, bool needs_llm);

[[nodiscard]] app::KnowledgeBaseConfig make_kb_config(const ModelOptions& options);

// Option table for ModelOptions, for any Config with a `ModelOptions model` member.
template <typename Config>
std::vector<apps::Option<Config>> model_options() {
  const auto invalid = [](Config& c, const std::string& flag, const std::string& value,
                          const std::string& expected) {
    std::cerr << "Invalid " << flag << ": " << value << " (" << expected << ")\n";
    c.model.args_valid = false;
    return false;
  };

  return {
      {"--kb", true, "Knowledge-base directory (index.bin + metadata.json)",
       [](Config& c, const std::string& v) {
         c.model.kb_dir = v;
         return true;
       }},
      {"--vector-backend", true, "Vector search backend (flat|faiss)",
       [invalid](Config& c, const std::string& v) {
         auto backend = vector::parse_vector_backend(v);
         if (!backend.has_value()) {
           return invalid(c, "--vector-backend", v, "valid: flat, faiss");
         }
         c.model.backend = backend.value();
         return true;
       }},
      {"--learned-file", true, "JSON file that learned examples are appended to",
       [](Config& c, const std::string& v) {
         c.model.learned_path = v;
         return true;
       }},
      {"--embedding", true, "Embedding provider (stub|http)",
       [invalid](Config& c, const std::string& v) {
         auto kind = embedding::parse_embedding_provider_kind(v);
         if (!kind.has_value()) {
           return invalid(c, "--embedding", v, "valid: stub, http");
         }
         c.model.embedding.kind = kind.value();
         return true;
       }},
      {"--embedding-url", true, "Base URL of an OpenAI-compatible embeddings API",
       [](Config& c, const std::string& v) {
         c.model.embedding.base_url = v;
         return true;
       }},
      {"--embedding-model", true, "Embedding model name",
       [](Config& c, const std::string& v) {
         c.model.embedding.model = v;
         return true;
       }},
      {"--embedding-key", true, "Embedding API key (default: $SQLRAG_EMBEDDING_API_KEY)",
       [](Config& c, const std::string& v) {
         c.model.embedding.api_key = v;
         return true;
       }},
      {"--embedding-dim", true, "Embedding dimension",
       [invalid](Config& c, const std::string& v) {
         auto dim = parse_long(v, 1, 65536);
         if (!dim.has_value()) {
           return invalid(c, "--embedding-dim", v, "expected 1..65536");
         }
         c.model.embedding.dimension = static_cast<std::size_t>(dim.value());
         return true;
       }},
      {"--llm-url", true, "Base URL of an OpenAI-compatible chat completions API",
       [](Config& c, const std::string& v) {
         c.model.llm.base_url = v;
         return true;
       }},
      {"--llm-model", true, "Chat model name",
       [](Config& c, const std::string& v) {
         c.model.llm.model = v;
         return true;
       }},
      {"--llm-key", true, "LLM API key (default: $SQLRAG_LLM_API_KEY)",
       [](Config& c, const std::string& v) {
         c.model.llm.api_key = v;
         return true;
       }},
      {"--temperature", true, "Sampling temperature",
       [invalid](Config& c, const std::string& v) {
         auto t = parse_double(v);
         if (!t.has_value()) {
           return invalid(c, "--temperature", v, "expected a number");
         }
         c.model.llm.temperature = t.value();
         return true;
       }},
      {"--max-tokens", true, "Maximum completion tokens",
       [invalid](Config& c, const std::string& v) {
         auto n = parse_long(v, 1, 1000000);
         if (!n.has_value()) {
           return invalid(c, "--max-tokens", v, "expected a positive integer");
         }
         c.model.llm.max_tokens = static_cast<int>(n.value());
         return true;
       }},
      {"--llm-timeout-ms", true, "LLM request timeout in milliseconds",
       [invalid](Config& c, const std::string& v) {
         auto n = parse_long(v, 1, 3600000);
         if (!n.has_value()) {
           return invalid(c, "--llm-timeout-ms", v, "expected a positive integer");
         }
         c.model.llm.timeout_ms = n.value();
         return true;
       }},
  };
}

}  // namespace sqlrag::cli
